#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace kinema
{

// Media kind of a clip. Selects which animatable property set the clip exposes.
enum class MediaKind : uint8_t
{
    Video,
    Image,
    Audio,
    Text,
};

// Every property the engine can animate. Not every kind exposes every id.
enum class PropertyId : uint8_t
{
    X,
    Y,
    Width,
    Height,
    Rotation,
    Opacity,
    ZIndex,
    Volume,
};

// ─── Per-kind property sets ──────────────────────────────────────────────────
// x/y are the clip centre in project space (origin at canvas centre, +y down).
// rotation is in degrees, opacity in [0, 1].

struct VisualProperties
{
    double x        = 0.0;
    double y        = 0.0;
    double width    = 0.0;
    double height   = 0.0;
    double rotation = 0.0;
    double opacity  = 1.0;
    double z_index  = 0.0;

    bool operator==(const VisualProperties&) const = default;
};

struct VideoProperties : VisualProperties
{
    double volume = 1.0;

    bool operator==(const VideoProperties&) const = default;
};

struct ImageProperties : VisualProperties
{
    bool operator==(const ImageProperties&) const = default;
};

struct TextProperties : VisualProperties
{
    bool operator==(const TextProperties&) const = default;
};

struct AudioProperties
{
    double volume  = 1.0;
    double z_index = 0.0;

    bool operator==(const AudioProperties&) const = default;
};

// Tagged union keyed by media kind. Alternative order matches MediaKind.
using AnimatableProperties =
    std::variant<VideoProperties, ImageProperties, AudioProperties, TextProperties>;

// ─── Queries ─────────────────────────────────────────────────────────────────

const char* media_kind_name(MediaKind kind);

// Stable wire name ("x", "zIndex", ...). Used by the serializer and logs.
const char* property_name(PropertyId id);

std::optional<PropertyId> property_from_name(std::string_view name);

MediaKind kind_of(const AnimatableProperties& props);

// Default-valued property set for a kind.
AnimatableProperties default_properties(MediaKind kind);

// Properties exposed by a kind, in wire order.
const std::vector<PropertyId>& properties_for(MediaKind kind);

bool kind_supports(MediaKind kind, PropertyId id);

// Read a property. Returns nullopt if the set's kind does not expose it.
std::optional<double> get_property(const AnimatableProperties& props, PropertyId id);

// Write a property. Returns false (and leaves props untouched) if the set's
// kind does not expose it.
bool set_property(AnimatableProperties& props, PropertyId id, double value);

// Value domain check for a single property. Returns an empty string when the
// value is acceptable, otherwise a short reason.
std::string check_property_value(PropertyId id, double value);

// Checks every value of a set. Returns an empty string when all are valid.
std::string check_properties(const AnimatableProperties& props);

}   // namespace kinema
