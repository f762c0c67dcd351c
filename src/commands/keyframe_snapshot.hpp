#pragma once

#include <kinema/animation.hpp>

namespace kinema
{

// Deep copy of the clip's animation config and baseline.
KeyframeSnapshot capture_snapshot(const Clip& clip);

// Puts the clip back exactly as captured. The clip's range is not part of the
// snapshot.
void restore_snapshot(Clip& clip, const KeyframeSnapshot& snapshot);

}   // namespace kinema
