#pragma once

#include <optional>
#include <string>
#include <vector>

namespace kinema::json
{

// Minimal helpers for the engine's own JSON documents. Keys are looked up
// among the members of the outermost object in the given text only, so a
// nested object never shadows a top-level key.

std::string escape(const std::string& s);

std::optional<std::string> read_string(const std::string& json, const std::string& key);
std::optional<double>      read_number(const std::string& json, const std::string& key);
std::optional<bool>        read_bool(const std::string& json, const std::string& key);

bool has_key(const std::string& json, const std::string& key);

// Text of the object value stored under key, braces included.
std::optional<std::string> read_object(const std::string& json, const std::string& key);

// Top-level objects of the array stored under key. nullopt if the key or the
// array is missing or unterminated.
std::optional<std::vector<std::string>> read_object_array(const std::string& json,
                                                          const std::string& key);

// Shortest text that reads back as the same double.
std::string format_number(double value);

}   // namespace kinema::json
