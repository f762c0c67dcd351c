#pragma once

#include <kinema/animation.hpp>
#include <kinema/fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace kinema
{

// Per-clip keyframe storage. Every function operates on the clip's own
// AnimationConfig and never throws. Frame matching is exact.

// Creates an empty, disabled config with "linear" easing if the clip has none.
void initialize_animation(Clip& clip);

// Inserts at a clip-relative frame. An existing keyframe at exactly that
// frame is replaced. Keyframes stay sorted ascending.
void insert_keyframe(Clip& clip, Frame relative_frame, const AnimatableProperties& properties);

// Removes the keyframe at the absolute frame. Returns false if none matched.
bool remove_keyframe_at(Clip& clip, Frame absolute_frame);

// Empties keyframes and disables animation. A clip without a config keeps none.
void clear_keyframes(Clip& clip);

void enable_animation(Clip& clip);
void disable_animation(Clip& clip);   // Also empties keyframes

Keyframe*       find_keyframe_at(Clip& clip, Frame absolute_frame);
const Keyframe* find_keyframe_at(const Clip& clip, Frame absolute_frame);

// Keyframe built from the clip's current baseline at the given absolute frame.
Keyframe capture_keyframe(const Clip& clip, Frame absolute_frame);

// ─── Navigation ──────────────────────────────────────────────────────────────

std::optional<Frame> previous_keyframe_frame(const Clip& clip, Frame absolute_frame);
std::optional<Frame> next_keyframe_frame(const Clip& clip, Frame absolute_frame);

// Absolute frames of every keyframe, ascending.
std::vector<Frame> keyframe_frames(const Clip& clip);

size_t keyframe_count(const Clip& clip);

// Enabled and holding at least one keyframe.
bool has_animation(const Clip& clip);

// ─── Diagnostics ─────────────────────────────────────────────────────────────

// Returns one message per violated invariant. Empty means consistent.
std::vector<std::string> validate_keyframes(const Clip& clip);

// Human readable dump. Also written to the log at debug level.
std::string describe_keyframes(const Clip& clip);

}   // namespace kinema
