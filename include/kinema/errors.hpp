#pragma once

#include <kinema/fwd.hpp>
#include <stdexcept>
#include <string>

namespace kinema
{

// Base of every exception the engine throws.
class Error : public std::runtime_error
{
   public:
    using std::runtime_error::runtime_error;
};

// Referenced clip does not exist. Raised when a command is constructed.
class NotFoundError : public Error
{
   public:
    explicit NotFoundError(const ClipId& clip_id)
        : Error("Clip not found: " + clip_id), clip_id_(clip_id)
    {
    }

    const ClipId& clip_id() const { return clip_id_; }

   private:
    ClipId clip_id_;
};

// Target frame lies outside the clip's [start, end] span. Nothing was mutated.
class OutOfRangeError : public Error
{
   public:
    OutOfRangeError(Frame frame, Frame range_start, Frame range_end)
        : Error("Frame " + std::to_string(frame) + " is outside clip range ["
                + std::to_string(range_start) + ", " + std::to_string(range_end) + "]"),
          frame_(frame),
          range_start_(range_start),
          range_end_(range_end)
    {
    }

    Frame frame() const { return frame_; }
    Frame range_start() const { return range_start_; }
    Frame range_end() const { return range_end_; }

   private:
    Frame frame_;
    Frame range_start_;
    Frame range_end_;
};

// The renderer rejected a push or property write after the in-memory mutation
// was applied. The model is ahead of the renderer.
class SyncError : public Error
{
   public:
    using Error::Error;
};

// Keyframe properties or a property value are not valid for the clip's kind.
class ValidationError : public Error
{
   public:
    using Error::Error;
};

// Another command is already running against the same clip.
class BusyError : public Error
{
   public:
    explicit BusyError(const ClipId& clip_id)
        : Error("A command is already active on clip " + clip_id), clip_id_(clip_id)
    {
    }

    const ClipId& clip_id() const { return clip_id_; }

   private:
    ClipId clip_id_;
};

}   // namespace kinema
