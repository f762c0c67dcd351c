#pragma once

#include <cstddef>
#include <kinema/logger.hpp>
#include <string>

namespace kinema
{

// Engine-wide settings, persisted as JSON (~/.config/kinema/engine.json).
struct EngineConfig
{
    double   frame_rate      = 30.0;
    int      canvas_width    = 1920;
    int      canvas_height   = 1080;
    size_t   history_limit   = 100;   // Undo depth; oldest entries drop first
    bool     seek_on_execute = true;  // Move the playhead after execute/undo
    LogLevel log_level       = LogLevel::Info;

    // Empty when every field is in range, otherwise the first problem found.
    std::string check() const;

    std::string serialize() const;

    // Rejects future versions and out-of-range values. On failure the config
    // is left unchanged and false is returned.
    bool deserialize(const std::string& json);

    // Returns true on success. Parent directories are created as needed.
    bool save(const std::string& path) const;
    bool load(const std::string& path);

    static std::string default_path();

    bool operator==(const EngineConfig&) const = default;
};

}   // namespace kinema
