#pragma once

#include <cstdint>
#include <kinema/animation.hpp>
#include <kinema/fwd.hpp>
#include <string>

namespace kinema
{

// Clip-relative frame for an absolute timeline frame. Frames before the clip
// start clamp to 0.
Frame to_relative(Frame absolute_frame, Frame clip_start);

Frame to_absolute(Frame relative_frame, Frame clip_start);

// Inclusive [timeline_start, timeline_end] check. The end frame is accepted.
bool contains_frame(const TimeRange& range, Frame absolute_frame);

// floor(frames / fps * 1e6)
int64_t frames_to_microseconds(Frame frames, double frame_rate);

// round(us / 1e6 * fps)
Frame microseconds_to_frames(int64_t microseconds, double frame_rate);

// "HH:MM:SS.FF"
std::string frames_to_timecode(Frame frames, double frame_rate);

}   // namespace kinema
