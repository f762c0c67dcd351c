#pragma once

#include <kinema/animation.hpp>
#include <kinema/properties.hpp>
#include <string>

namespace kinema
{

// Persisted form of a clip's animation:
//   {"keyframes": [{"framePosition": 0, "properties": {"x": 0, ...}}],
//    "isEnabled": true, "easing": "linear"}
// Property keys are the wire names of the kind's properties. "easing" is
// omitted when unset.
std::string serialize_animation(const AnimationConfig& config);

// Parses the persisted form for a clip of the given kind. Throws
// ValidationError on malformed JSON, properties missing for the kind, invalid
// values, negative, oversized or duplicate positions. Keyframes come back
// sorted.
AnimationConfig deserialize_animation(const std::string& json, MediaKind kind);

}   // namespace kinema
