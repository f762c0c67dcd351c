#include "keyframe_store.hpp"

#include <algorithm>
#include <kinema/logger.hpp>
#include <sstream>

#include "core/frame_position.hpp"

namespace kinema
{

namespace
{

void sort_keyframes(std::vector<Keyframe>& keyframes)
{
    std::sort(keyframes.begin(),
              keyframes.end(),
              [](const Keyframe& a, const Keyframe& b)
              { return a.frame_position < b.frame_position; });
}

}   // anonymous namespace

void initialize_animation(Clip& clip)
{
    if (clip.animation)
        return;

    clip.animation = AnimationConfig{.keyframes = {}, .is_enabled = false, .easing = "linear"};
    KINEMA_LOG_DEBUG("kinema.store", "Initialized animation for clip {}", clip.id);
}

void insert_keyframe(Clip& clip, Frame relative_frame, const AnimatableProperties& properties)
{
    initialize_animation(clip);
    auto& keyframes = clip.animation->keyframes;

    for (auto& existing : keyframes)
    {
        if (existing.frame_position == relative_frame)
        {
            existing.properties = properties;
            KINEMA_LOG_DEBUG("kinema.store",
                             "Replaced keyframe at {} on clip {}",
                             relative_frame,
                             clip.id);
            return;
        }
    }

    keyframes.push_back(Keyframe{.frame_position = relative_frame, .properties = properties});
    sort_keyframes(keyframes);
    KINEMA_LOG_DEBUG("kinema.store",
                     "Inserted keyframe at {} on clip {} ({} total)",
                     relative_frame,
                     clip.id,
                     keyframes.size());
}

bool remove_keyframe_at(Clip& clip, Frame absolute_frame)
{
    if (!clip.animation)
        return false;

    const Frame relative = to_relative(absolute_frame, clip.range.timeline_start);
    auto&       keyframes = clip.animation->keyframes;
    auto        it        = std::find_if(keyframes.begin(),
                               keyframes.end(),
                               [relative](const Keyframe& kf)
                               { return kf.frame_position == relative; });
    if (it == keyframes.end())
        return false;

    keyframes.erase(it);
    KINEMA_LOG_DEBUG("kinema.store", "Removed keyframe at {} on clip {}", relative, clip.id);
    return true;
}

void clear_keyframes(Clip& clip)
{
    if (!clip.animation)
        return;

    clip.animation->keyframes.clear();
    clip.animation->is_enabled = false;
}

void enable_animation(Clip& clip)
{
    initialize_animation(clip);
    clip.animation->is_enabled = true;
}

void disable_animation(Clip& clip)
{
    clear_keyframes(clip);
}

Keyframe* find_keyframe_at(Clip& clip, Frame absolute_frame)
{
    const Clip& view = clip;
    return const_cast<Keyframe*>(find_keyframe_at(view, absolute_frame));
}

const Keyframe* find_keyframe_at(const Clip& clip, Frame absolute_frame)
{
    if (!clip.animation)
        return nullptr;

    const Frame relative = to_relative(absolute_frame, clip.range.timeline_start);
    for (const auto& kf : clip.animation->keyframes)
    {
        if (kf.frame_position == relative)
            return &kf;
    }
    return nullptr;
}

Keyframe capture_keyframe(const Clip& clip, Frame absolute_frame)
{
    return Keyframe{.frame_position = to_relative(absolute_frame, clip.range.timeline_start),
                    .properties     = clip.baseline};
}

// ─── Navigation ──────────────────────────────────────────────────────────────

std::optional<Frame> previous_keyframe_frame(const Clip& clip, Frame absolute_frame)
{
    if (!clip.animation)
        return std::nullopt;

    const Frame          relative = to_relative(absolute_frame, clip.range.timeline_start);
    std::optional<Frame> result;
    for (const auto& kf : clip.animation->keyframes)
    {
        if (kf.frame_position >= relative)
            break;
        result = to_absolute(kf.frame_position, clip.range.timeline_start);
    }
    return result;
}

std::optional<Frame> next_keyframe_frame(const Clip& clip, Frame absolute_frame)
{
    if (!clip.animation)
        return std::nullopt;

    // Before the clip start every keyframe, including the one at 0, is ahead.
    const Frame start = clip.range.timeline_start;
    for (const auto& kf : clip.animation->keyframes)
    {
        const Frame abs = to_absolute(kf.frame_position, start);
        if (abs > absolute_frame)
            return abs;
    }
    return std::nullopt;
}

std::vector<Frame> keyframe_frames(const Clip& clip)
{
    std::vector<Frame> frames;
    if (!clip.animation)
        return frames;

    frames.reserve(clip.animation->keyframes.size());
    for (const auto& kf : clip.animation->keyframes)
        frames.push_back(to_absolute(kf.frame_position, clip.range.timeline_start));
    return frames;
}

size_t keyframe_count(const Clip& clip)
{
    return clip.animation ? clip.animation->keyframes.size() : 0;
}

bool has_animation(const Clip& clip)
{
    return clip.animation && clip.animation->is_enabled && !clip.animation->keyframes.empty();
}

// ─── Diagnostics ─────────────────────────────────────────────────────────────

std::vector<std::string> validate_keyframes(const Clip& clip)
{
    std::vector<std::string> issues;
    if (!clip.animation)
        return issues;

    const Frame duration  = clip.range.duration();
    const auto& keyframes = clip.animation->keyframes;
    for (size_t i = 0; i < keyframes.size(); ++i)
    {
        const Keyframe& kf = keyframes[i];
        std::string     at = "keyframe " + std::to_string(i) + " (frame "
                         + std::to_string(kf.frame_position) + "): ";

        if (kf.frame_position < 0 || kf.frame_position > duration)
            issues.push_back(at + "position outside [0, " + std::to_string(duration) + "]");

        if (i > 0)
        {
            if (keyframes[i - 1].frame_position == kf.frame_position)
                issues.push_back(at + "duplicate position");
            else if (keyframes[i - 1].frame_position > kf.frame_position)
                issues.push_back(at + "out of order");
        }

        if (kind_of(kf.properties) != clip.kind)
        {
            issues.push_back(at + "properties are " + media_kind_name(kind_of(kf.properties))
                             + ", clip is " + media_kind_name(clip.kind));
            continue;
        }

        std::string reason = check_properties(kf.properties);
        if (!reason.empty())
            issues.push_back(at + reason);
    }

    for (const auto& issue : issues)
        KINEMA_LOG_WARN("kinema.store", "Clip {}: {}", clip.id, issue);
    return issues;
}

std::string describe_keyframes(const Clip& clip)
{
    std::ostringstream os;
    os << "clip " << clip.id << " [" << clip.range.timeline_start << ", "
       << clip.range.timeline_end << "] " << media_kind_name(clip.kind);

    if (!clip.animation)
    {
        os << ": no animation";
    }
    else
    {
        const auto& config = *clip.animation;
        os << ": " << (config.is_enabled ? "enabled" : "disabled") << ", easing "
           << config.easing.value_or("none") << ", " << config.keyframes.size() << " keyframe(s)";
        for (const auto& kf : config.keyframes)
        {
            os << "\n  @" << kf.frame_position << " (abs "
               << to_absolute(kf.frame_position, clip.range.timeline_start) << ")";
            for (PropertyId id : properties_for(kind_of(kf.properties)))
            {
                if (auto v = get_property(kf.properties, id))
                    os << ' ' << property_name(id) << '=' << *v;
            }
        }
    }

    std::string text = os.str();
    KINEMA_LOG_DEBUG("kinema.store", "{}", text);
    return text;
}

}   // namespace kinema
