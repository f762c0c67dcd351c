#pragma once

#include <kinema/fwd.hpp>
#include <kinema/properties.hpp>
#include <optional>
#include <string>
#include <vector>

namespace kinema
{

// Span a clip occupies on the timeline, in absolute frames.
struct TimeRange
{
    Frame timeline_start = 0;
    Frame timeline_end   = 0;

    Frame duration() const { return timeline_end - timeline_start; }

    bool operator==(const TimeRange&) const = default;
};

// A point in a clip's local timeline carrying a full property snapshot.
struct Keyframe
{
    Frame                frame_position = 0;   // Relative to clip start
    AnimatableProperties properties;

    bool operator==(const Keyframe&) const = default;
};

// Per-clip animation state. Keyframes are always sorted by frame_position and
// hold at most one entry per position.
struct AnimationConfig
{
    std::vector<Keyframe>      keyframes;
    bool                       is_enabled = false;
    std::optional<std::string> easing;

    bool operator==(const AnimationConfig&) const = default;
};

// Engine view of a timeline clip. The clip owns its baseline values and its
// animation config; the host owns the clip.
struct Clip
{
    ClipId                         id;
    MediaKind                      kind = MediaKind::Video;
    TimeRange                      range;
    AnimatableProperties           baseline;
    std::optional<AnimationConfig> animation;
};

// Interaction state of the keyframe button for a clip at a given frame.
enum class KeyframeState : uint8_t
{
    None,               // No config, disabled, or zero keyframes
    OnKeyframe,         // A keyframe sits exactly on the current frame
    BetweenKeyframes,   // Animated, but no keyframe on the current frame
};

struct KeyframeUIState
{
    bool has_animation  = false;
    bool is_on_keyframe = false;
};

// Deep copy of everything a keyframe command may touch.
struct KeyframeSnapshot
{
    std::optional<AnimationConfig> animation;
    AnimatableProperties           baseline;

    bool operator==(const KeyframeSnapshot&) const = default;
};

const char* keyframe_state_name(KeyframeState state);

}   // namespace kinema
