#include "keyframe_snapshot.hpp"

namespace kinema
{

KeyframeSnapshot capture_snapshot(const Clip& clip)
{
    return KeyframeSnapshot{.animation = clip.animation, .baseline = clip.baseline};
}

void restore_snapshot(Clip& clip, const KeyframeSnapshot& snapshot)
{
    clip.animation = snapshot.animation;
    clip.baseline  = snapshot.baseline;
}

}   // namespace kinema
