#include "animation_serializer.hpp"

#include <algorithm>
#include <cmath>
#include <kinema/errors.hpp>
#include <kinema/logger.hpp>
#include <limits>
#include <sstream>

#include "io/json_util.hpp"

namespace kinema
{

// ─── Writing ─────────────────────────────────────────────────────────────────

std::string serialize_animation(const AnimationConfig& config)
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"keyframes\": [";
    for (size_t i = 0; i < config.keyframes.size(); ++i)
    {
        const Keyframe& kf = config.keyframes[i];
        os << (i == 0 ? "\n" : ",\n");
        os << "    {\"framePosition\": " << kf.frame_position << ", \"properties\": {";

        const auto& ids = properties_for(kind_of(kf.properties));
        for (size_t p = 0; p < ids.size(); ++p)
        {
            double value = get_property(kf.properties, ids[p]).value_or(0.0);
            os << (p == 0 ? "" : ", ") << "\"" << property_name(ids[p])
               << "\": " << json::format_number(value);
        }
        os << "}}";
    }
    os << (config.keyframes.empty() ? "],\n" : "\n  ],\n");
    os << "  \"isEnabled\": " << (config.is_enabled ? "true" : "false");
    if (config.easing)
        os << ",\n  \"easing\": \"" << json::escape(*config.easing) << "\"";
    os << "\n}\n";
    return os.str();
}

// ─── Reading ─────────────────────────────────────────────────────────────────

namespace
{

AnimatableProperties parse_properties(const std::string& obj, MediaKind kind, size_t index)
{
    AnimatableProperties props = default_properties(kind);
    for (PropertyId id : properties_for(kind))
    {
        auto value = json::read_number(obj, property_name(id));
        if (!value)
        {
            throw ValidationError("keyframe " + std::to_string(index) + ": missing property "
                                  + property_name(id) + " for " + media_kind_name(kind));
        }
        std::string reason = check_property_value(id, *value);
        if (!reason.empty())
            throw ValidationError("keyframe " + std::to_string(index) + ": " + reason);
        set_property(props, id, *value);
    }
    return props;
}

}   // anonymous namespace

AnimationConfig deserialize_animation(const std::string& json_text, MediaKind kind)
{
    if (json_text.find('{') == std::string::npos)
        throw ValidationError("animation JSON is empty");

    auto objects = json::read_object_array(json_text, "keyframes");
    if (!objects)
        throw ValidationError("animation JSON has no valid \"keyframes\" array");

    auto enabled = json::read_bool(json_text, "isEnabled");
    if (!enabled)
        throw ValidationError("animation JSON has no boolean \"isEnabled\"");

    AnimationConfig config;
    config.is_enabled = *enabled;
    if (json::has_key(json_text, "easing"))
    {
        auto easing = json::read_string(json_text, "easing");
        if (!easing)
            throw ValidationError("\"easing\" must be a string");
        config.easing = *easing;
    }

    config.keyframes.reserve(objects->size());
    for (size_t i = 0; i < objects->size(); ++i)
    {
        const std::string& obj = (*objects)[i];

        auto position = json::read_number(obj, "framePosition");
        if (!position || *position < 0.0 || std::floor(*position) != *position)
        {
            throw ValidationError("keyframe " + std::to_string(i)
                                  + ": framePosition must be a non-negative integer");
        }
        // 2^63 is exactly representable; anything at or above it overflows Frame.
        if (*position >= static_cast<double>(std::numeric_limits<Frame>::max()))
        {
            throw ValidationError("keyframe " + std::to_string(i)
                                  + ": framePosition is too large");
        }

        auto props = json::read_object(obj, "properties");
        if (!props)
            throw ValidationError("keyframe " + std::to_string(i) + ": missing properties");

        config.keyframes.push_back(Keyframe{.frame_position = static_cast<Frame>(*position),
                                            .properties     = parse_properties(*props, kind, i)});
    }

    std::stable_sort(config.keyframes.begin(),
                     config.keyframes.end(),
                     [](const Keyframe& a, const Keyframe& b)
                     { return a.frame_position < b.frame_position; });
    for (size_t i = 1; i < config.keyframes.size(); ++i)
    {
        if (config.keyframes[i].frame_position == config.keyframes[i - 1].frame_position)
        {
            throw ValidationError("duplicate keyframe at frame "
                                  + std::to_string(config.keyframes[i].frame_position));
        }
    }

    KINEMA_LOG_DEBUG("kinema.io",
                     "Read {} keyframe(s) for a {} clip",
                     config.keyframes.size(),
                     media_kind_name(kind));
    return config;
}

}   // namespace kinema
