#include "duration_rescale.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <kinema/logger.hpp>

namespace kinema
{

RescaleResult rescale_keyframes(AnimationConfig& config, Frame old_duration, Frame new_duration)
{
    RescaleResult result;

    if (old_duration <= 0 || new_duration <= 0)
    {
        KINEMA_LOG_DEBUG("kinema.rescale",
                         "Skipping rescale with non-positive duration ({} -> {})",
                         old_duration,
                         new_duration);
        return result;
    }
    // A change of one frame keeps positions and only clamps the tail.
    const bool proportional = std::llabs(old_duration - new_duration) > 1;
    if (!proportional
        && (config.keyframes.empty() || config.keyframes.back().frame_position <= new_duration))
        return result;

    const double ratio =
        proportional ? static_cast<double>(new_duration) / static_cast<double>(old_duration) : 1.0;

    std::vector<Keyframe> kept;
    kept.reserve(config.keyframes.size());
    for (auto& kf : config.keyframes)
    {
        Frame position = static_cast<Frame>(std::llround(static_cast<double>(kf.frame_position) * ratio));
        position       = std::clamp<Frame>(position, 0, new_duration);

        if (position != kf.frame_position)
            ++result.repositioned;
        kf.frame_position = position;

        // Input is sorted, so a collision can only be with the last kept entry.
        if (!kept.empty() && kept.back().frame_position == position)
        {
            kept.back() = std::move(kf);
            ++result.dropped;
            continue;
        }
        kept.push_back(std::move(kf));
    }

    std::stable_sort(kept.begin(),
                     kept.end(),
                     [](const Keyframe& a, const Keyframe& b)
                     { return a.frame_position < b.frame_position; });
    config.keyframes = std::move(kept);

    KINEMA_LOG_INFO("kinema.rescale",
                    "Rescaled keyframes {} -> {} frames: {} repositioned, {} dropped",
                    old_duration,
                    new_duration,
                    result.repositioned,
                    result.dropped);
    return result;
}

}   // namespace kinema
