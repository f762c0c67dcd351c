#include "frame_position.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace kinema
{

Frame to_relative(Frame absolute_frame, Frame clip_start)
{
    return std::max<Frame>(0, absolute_frame - clip_start);
}

Frame to_absolute(Frame relative_frame, Frame clip_start)
{
    return clip_start + relative_frame;
}

bool contains_frame(const TimeRange& range, Frame absolute_frame)
{
    return absolute_frame >= range.timeline_start && absolute_frame <= range.timeline_end;
}

int64_t frames_to_microseconds(Frame frames, double frame_rate)
{
    if (frame_rate <= 0.0)
        return 0;
    return static_cast<int64_t>(std::floor(static_cast<double>(frames) / frame_rate * 1e6));
}

Frame microseconds_to_frames(int64_t microseconds, double frame_rate)
{
    if (frame_rate <= 0.0)
        return 0;
    return static_cast<Frame>(std::llround(static_cast<double>(microseconds) / 1e6 * frame_rate));
}

std::string frames_to_timecode(Frame frames, double frame_rate)
{
    const bool negative = frames < 0;
    if (negative)
        frames = -frames;

    const int64_t fps = std::max<int64_t>(1, std::llround(frame_rate));
    const int64_t total_seconds = frames / fps;
    const int64_t ff            = frames % fps;
    const int64_t hh            = total_seconds / 3600;
    const int64_t mm            = (total_seconds % 3600) / 60;
    const int64_t ss            = total_seconds % 60;

    char buf[40];
    std::snprintf(buf,
                  sizeof(buf),
                  "%s%02lld:%02lld:%02lld.%02lld",
                  negative ? "-" : "",
                  static_cast<long long>(hh),
                  static_cast<long long>(mm),
                  static_cast<long long>(ss),
                  static_cast<long long>(ff));
    return buf;
}

}   // namespace kinema
