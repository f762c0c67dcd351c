#include <cmath>
#include <kinema/properties.hpp>
#include <type_traits>

namespace kinema
{

const char* media_kind_name(MediaKind kind)
{
    switch (kind)
    {
        case MediaKind::Video:
            return "video";
        case MediaKind::Image:
            return "image";
        case MediaKind::Audio:
            return "audio";
        case MediaKind::Text:
            return "text";
    }
    return "unknown";
}

const char* property_name(PropertyId id)
{
    switch (id)
    {
        case PropertyId::X:
            return "x";
        case PropertyId::Y:
            return "y";
        case PropertyId::Width:
            return "width";
        case PropertyId::Height:
            return "height";
        case PropertyId::Rotation:
            return "rotation";
        case PropertyId::Opacity:
            return "opacity";
        case PropertyId::ZIndex:
            return "zIndex";
        case PropertyId::Volume:
            return "volume";
    }
    return "unknown";
}

std::optional<PropertyId> property_from_name(std::string_view name)
{
    static constexpr PropertyId all[] = {PropertyId::X,
                                         PropertyId::Y,
                                         PropertyId::Width,
                                         PropertyId::Height,
                                         PropertyId::Rotation,
                                         PropertyId::Opacity,
                                         PropertyId::ZIndex,
                                         PropertyId::Volume};
    for (PropertyId id : all)
    {
        if (name == property_name(id))
            return id;
    }
    return std::nullopt;
}

MediaKind kind_of(const AnimatableProperties& props)
{
    return std::visit(
        [](const auto& p) -> MediaKind
        {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, VideoProperties>)
                return MediaKind::Video;
            else if constexpr (std::is_same_v<T, ImageProperties>)
                return MediaKind::Image;
            else if constexpr (std::is_same_v<T, AudioProperties>)
                return MediaKind::Audio;
            else
                return MediaKind::Text;
        },
        props);
}

AnimatableProperties default_properties(MediaKind kind)
{
    switch (kind)
    {
        case MediaKind::Video:
            return VideoProperties{};
        case MediaKind::Image:
            return ImageProperties{};
        case MediaKind::Audio:
            return AudioProperties{};
        case MediaKind::Text:
            return TextProperties{};
    }
    return VideoProperties{};
}

const std::vector<PropertyId>& properties_for(MediaKind kind)
{
    static const std::vector<PropertyId> visual = {PropertyId::X,
                                                   PropertyId::Y,
                                                   PropertyId::Width,
                                                   PropertyId::Height,
                                                   PropertyId::Rotation,
                                                   PropertyId::Opacity,
                                                   PropertyId::ZIndex};
    static const std::vector<PropertyId> video  = {PropertyId::X,
                                                   PropertyId::Y,
                                                   PropertyId::Width,
                                                   PropertyId::Height,
                                                   PropertyId::Rotation,
                                                   PropertyId::Opacity,
                                                   PropertyId::ZIndex,
                                                   PropertyId::Volume};
    static const std::vector<PropertyId> audio  = {PropertyId::Volume, PropertyId::ZIndex};

    switch (kind)
    {
        case MediaKind::Video:
            return video;
        case MediaKind::Audio:
            return audio;
        case MediaKind::Image:
        case MediaKind::Text:
            break;
    }
    return visual;
}

bool kind_supports(MediaKind kind, PropertyId id)
{
    for (PropertyId p : properties_for(kind))
    {
        if (p == id)
            return true;
    }
    return false;
}

// ─── Field access ────────────────────────────────────────────────────────────

namespace
{

double* visual_field(VisualProperties& v, PropertyId id)
{
    switch (id)
    {
        case PropertyId::X:
            return &v.x;
        case PropertyId::Y:
            return &v.y;
        case PropertyId::Width:
            return &v.width;
        case PropertyId::Height:
            return &v.height;
        case PropertyId::Rotation:
            return &v.rotation;
        case PropertyId::Opacity:
            return &v.opacity;
        case PropertyId::ZIndex:
            return &v.z_index;
        case PropertyId::Volume:
            break;
    }
    return nullptr;
}

template <typename Props>
double* field_of(Props& p, PropertyId id)
{
    using T = std::remove_const_t<Props>;
    if constexpr (std::is_same_v<T, AudioProperties>)
    {
        if (id == PropertyId::Volume)
            return &p.volume;
        if (id == PropertyId::ZIndex)
            return &p.z_index;
        return nullptr;
    }
    else if constexpr (std::is_same_v<T, VideoProperties>)
    {
        if (id == PropertyId::Volume)
            return &p.volume;
        return visual_field(p, id);
    }
    else
    {
        return visual_field(p, id);
    }
}

}   // anonymous namespace

std::optional<double> get_property(const AnimatableProperties& props, PropertyId id)
{
    // Copy so the shared accessor can hand out mutable pointers.
    AnimatableProperties copy = props;
    return std::visit(
        [id](auto& p) -> std::optional<double>
        {
            if (double* f = field_of(p, id))
                return *f;
            return std::nullopt;
        },
        copy);
}

bool set_property(AnimatableProperties& props, PropertyId id, double value)
{
    return std::visit(
        [id, value](auto& p)
        {
            double* f = field_of(p, id);
            if (!f)
                return false;
            *f = value;
            return true;
        },
        props);
}

// ─── Validation ──────────────────────────────────────────────────────────────

std::string check_property_value(PropertyId id, double value)
{
    if (!std::isfinite(value))
        return std::string(property_name(id)) + " must be finite";

    switch (id)
    {
        case PropertyId::Width:
        case PropertyId::Height:
            if (value <= 0.0)
                return std::string(property_name(id)) + " must be positive";
            break;
        case PropertyId::Opacity:
            if (value < 0.0 || value > 1.0)
                return "opacity must be within [0, 1]";
            break;
        case PropertyId::Volume:
            if (value < 0.0)
                return "volume must not be negative";
            break;
        case PropertyId::X:
        case PropertyId::Y:
        case PropertyId::Rotation:
        case PropertyId::ZIndex:
            break;
    }
    return {};
}

std::string check_properties(const AnimatableProperties& props)
{
    for (PropertyId id : properties_for(kind_of(props)))
    {
        auto value = get_property(props, id);
        if (!value)
            return std::string("missing ") + property_name(id);
        std::string reason = check_property_value(id, *value);
        if (!reason.empty())
            return reason;
    }
    return {};
}

}   // namespace kinema
