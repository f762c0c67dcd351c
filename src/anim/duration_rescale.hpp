#pragma once

#include <cstddef>
#include <kinema/animation.hpp>
#include <kinema/fwd.hpp>

namespace kinema
{

struct RescaleResult
{
    size_t repositioned = 0;   // Keyframes whose position changed
    size_t dropped      = 0;   // Keyframes collapsed onto a later one

    bool changed() const { return repositioned > 0 || dropped > 0; }
};

// Proportionally repositions keyframes after the clip duration changed from
// old_duration to new_duration frames, clamping into [0, new_duration]. A
// change of at most one frame does not reposition, but keyframes past
// new_duration are still clamped onto it. A non-positive duration leaves the
// config untouched. Keyframes that land on the same frame keep only the later
// one. Enable state is not touched.
RescaleResult rescale_keyframes(AnimationConfig& config, Frame old_duration, Frame new_duration);

}   // namespace kinema
