#include "animation_converter.hpp"

#include <cstdio>
#include <kinema/logger.hpp>
#include <type_traits>

#include "core/frame_position.hpp"

namespace kinema
{

// ─── RendererKeyframe ────────────────────────────────────────────────────────

std::string RendererKeyframe::key() const
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.6f%%", offset_percent);
    return buf;
}

std::optional<double> RendererKeyframe::value(std::string_view name) const
{
    for (const auto& [k, v] : values)
    {
        if (k == name)
            return v;
    }
    return std::nullopt;
}

// ─── Property conversion ─────────────────────────────────────────────────────

namespace
{

void append_position(RendererValues& out, const VisualProperties& v, CanvasSize canvas)
{
    Point2 top_left = project_to_renderer({v.x, v.y}, v.width, v.height, canvas);
    out.emplace_back("x", top_left.x);
    out.emplace_back("y", top_left.y);
}

void append_visual(RendererValues& out, const VisualProperties& v, CanvasSize canvas)
{
    append_position(out, v, canvas);
    out.emplace_back("w", v.width);
    out.emplace_back("h", v.height);
    out.emplace_back("angle", degrees_to_radians(v.rotation));
    out.emplace_back("opacity", v.opacity);
}

}   // anonymous namespace

RendererValues to_renderer_values(const AnimatableProperties& props, CanvasSize canvas)
{
    RendererValues out;
    std::visit(
        [&](const auto& p)
        {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, AudioProperties>)
            {
                out.emplace_back("volume", p.volume);
            }
            else
            {
                append_visual(out, p, canvas);
                if constexpr (std::is_same_v<T, VideoProperties>)
                    out.emplace_back("volume", p.volume);
            }
        },
        props);
    return out;
}

RendererValues renderer_writes_for(const AnimatableProperties& props,
                                   PropertyId                  property,
                                   CanvasSize                  canvas)
{
    RendererValues out;
    std::visit(
        [&](const auto& p)
        {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, AudioProperties>)
            {
                if (property == PropertyId::Volume)
                    out.emplace_back("volume", p.volume);
                else if (property == PropertyId::ZIndex)
                    out.emplace_back("zIndex", p.z_index);
            }
            else
            {
                switch (property)
                {
                    case PropertyId::X:
                    case PropertyId::Y:
                        append_position(out, p, canvas);
                        break;
                    case PropertyId::Width:
                    case PropertyId::Height:
                        out.emplace_back("w", p.width);
                        out.emplace_back("h", p.height);
                        append_position(out, p, canvas);
                        break;
                    case PropertyId::Rotation:
                        out.emplace_back("angle", degrees_to_radians(p.rotation));
                        break;
                    case PropertyId::Opacity:
                        out.emplace_back("opacity", p.opacity);
                        break;
                    case PropertyId::ZIndex:
                        out.emplace_back("zIndex", p.z_index);
                        break;
                    case PropertyId::Volume:
                        if constexpr (std::is_same_v<T, VideoProperties>)
                            out.emplace_back("volume", p.volume);
                        break;
                }
            }
        },
        props);
    return out;
}

RendererValues renderer_writes_for_baseline(const AnimatableProperties& props, CanvasSize canvas)
{
    RendererValues out = to_renderer_values(props, canvas);
    std::visit([&](const auto& p) { out.emplace_back("zIndex", p.z_index); }, props);
    return out;
}

// ─── Animation description ───────────────────────────────────────────────────

AnimationDescription to_animation_description(const Clip& clip, double frame_rate, CanvasSize canvas)
{
    AnimationDescription desc;
    if (!clip.animation || !clip.animation->is_enabled || clip.animation->keyframes.empty())
        return desc;

    const Frame duration = clip.range.duration();
    if (duration <= 0)
    {
        KINEMA_LOG_WARN("kinema.sync", "Clip {} has no duration; animation not described", clip.id);
        return desc;
    }

    desc.keyframes.reserve(clip.animation->keyframes.size());
    for (const auto& kf : clip.animation->keyframes)
    {
        const double percent = static_cast<double>(kf.frame_position)
                               / static_cast<double>(duration) * 100.0;
        if (percent < 0.0 || percent > 100.0)
        {
            KINEMA_LOG_WARN("kinema.sync",
                            "Clip {}: keyframe at {} lies outside the clip; skipped",
                            clip.id,
                            kf.frame_position);
            continue;
        }

        RendererKeyframe rk;
        rk.offset_percent = percent;
        rk.values         = to_renderer_values(kf.properties, canvas);
        desc.keyframes.push_back(std::move(rk));
    }

    if (desc.keyframes.empty())
        return AnimationDescription{};

    desc.duration_us     = frames_to_microseconds(duration, frame_rate);
    desc.iteration_count = 1;
    desc.easing          = clip.animation->easing;
    return desc;
}

}   // namespace kinema
