#pragma once

#include <kinema/animation.hpp>
#include <kinema/command.hpp>
#include <kinema/config.hpp>
#include <kinema/properties.hpp>
#include <optional>
#include <string>

#include "anim/keyframe_state.hpp"

namespace kinema
{

class PropertyBridge;
class ClipGuard;

// Collaborators shared by every keyframe command. playhead and guard are
// optional.
struct CommandContext
{
    ClipProvider&       clips;
    PropertyBridge&     bridge;
    NotificationSink&   notifier;
    const EngineConfig& config;
    PlayheadController* playhead = nullptr;
    ClipGuard*          guard    = nullptr;
};

// Snapshot transaction around one clip.
//
// The constructor resolves the clip (NotFoundError if missing) and captures
// its animation config and baseline. execute() checks the target frame, then
// applies the mutation, pushes to the renderer and applies immediate values in
// that order. undo() restores the snapshot verbatim and resyncs the renderer.
class KeyframeCommand : public Command
{
   public:
    void execute() override;
    void undo() override;

    const ClipId&           clip_id() const override { return clip_id_; }
    const KeyframeSnapshot& snapshot() const { return snapshot_; }

   protected:
    KeyframeCommand(const CommandContext& ctx, ClipId clip_id);

    // Mutation, push and immediate writes. Runs after the range check.
    virtual void apply(Clip& clip) = 0;

    // Restores state captured at construction.
    virtual void restore(Clip& clip);

    // Frame the command edits. Drives the range check and the default seeks.
    virtual std::optional<Frame> target_frame() const { return std::nullopt; }

    virtual std::optional<Frame> seek_after_execute(const Clip&) const { return target_frame(); }
    virtual std::optional<Frame> seek_after_undo(const Clip&) const { return target_frame(); }

    Clip&       resolve_clip();
    std::string timecode(Frame frame) const;

    CommandContext   ctx_;
    ClipId           clip_id_;
    KeyframeSnapshot snapshot_;

   private:
    void seek(std::optional<Frame> frame);
};

// ─── Commands ────────────────────────────────────────────────────────────────

// Keyframe button: create, remove, or remove-last-and-disable.
class ToggleKeyframeCommand : public KeyframeCommand
{
   public:
    ToggleKeyframeCommand(const CommandContext& ctx, ClipId clip_id, Frame frame);

    std::string description() const override;

    // Set once execute() has run.
    std::optional<ToggleAction> last_action() const { return last_action_; }

   protected:
    void                 apply(Clip& clip) override;
    std::optional<Frame> target_frame() const override { return frame_; }

   private:
    Frame                       frame_;
    std::optional<ToggleAction> last_action_;
};

// Property edit routed through the keyframe state at the frame.
class UpdatePropertyCommand : public KeyframeCommand
{
   public:
    UpdatePropertyCommand(const CommandContext& ctx,
                          ClipId                clip_id,
                          Frame                 frame,
                          PropertyId            property,
                          double                value);

    std::string description() const override;

    std::optional<PropertyChangeResult> last_result() const { return last_result_; }

   protected:
    void                 apply(Clip& clip) override;
    std::optional<Frame> target_frame() const override { return frame_; }

   private:
    Frame                               frame_;
    PropertyId                          property_;
    double                              value_;
    std::optional<PropertyChangeResult> last_result_;
};

// Keyframe from the live baseline at the frame. Replaces one already there.
class CreateKeyframeCommand : public KeyframeCommand
{
   public:
    CreateKeyframeCommand(const CommandContext& ctx, ClipId clip_id, Frame frame);

    std::string description() const override;

   protected:
    void                 apply(Clip& clip) override;
    std::optional<Frame> target_frame() const override { return frame_; }

   private:
    Frame frame_;
};

// Removes the keyframe at the frame; disables animation when none remain.
class DeleteKeyframeCommand : public KeyframeCommand
{
   public:
    DeleteKeyframeCommand(const CommandContext& ctx, ClipId clip_id, Frame frame);

    std::string description() const override;

   protected:
    void                 apply(Clip& clip) override;
    std::optional<Frame> target_frame() const override { return frame_; }

   private:
    Frame frame_;
};

// Empties the clip's keyframes and disables animation. Execute seeks to the
// clip start, undo to the first restored keyframe.
class ClearAllKeyframesCommand : public KeyframeCommand
{
   public:
    ClearAllKeyframesCommand(const CommandContext& ctx, ClipId clip_id);

    std::string description() const override;

   protected:
    void                 apply(Clip& clip) override;
    std::optional<Frame> seek_after_execute(const Clip& clip) const override;
    std::optional<Frame> seek_after_undo(const Clip& clip) const override;
};

// Overwrites the whole property set of the keyframe at the frame (creating it
// if absent) and makes it the live baseline.
class UpdateKeyframeCommand : public KeyframeCommand
{
   public:
    UpdateKeyframeCommand(const CommandContext& ctx,
                          ClipId                clip_id,
                          Frame                 frame,
                          AnimatableProperties  properties);

    std::string description() const override;

   protected:
    void                 apply(Clip& clip) override;
    std::optional<Frame> target_frame() const override { return frame_; }

   private:
    Frame                frame_;
    AnimatableProperties properties_;
};

// Moves the clip to a new timeline range and rescales its keyframes to the
// new duration. Animation is disabled if no keyframe survives.
class RescaleKeyframesCommand : public KeyframeCommand
{
   public:
    RescaleKeyframesCommand(const CommandContext& ctx, ClipId clip_id, TimeRange new_range);

    std::string description() const override;

   protected:
    void apply(Clip& clip) override;
    void restore(Clip& clip) override;

   private:
    TimeRange old_range_;
    TimeRange new_range_;
};

// Swaps in a whole animation config, e.g. one read back from disk.
class ReplaceAnimationCommand : public KeyframeCommand
{
   public:
    ReplaceAnimationCommand(const CommandContext& ctx, ClipId clip_id, AnimationConfig animation);

    std::string description() const override;

   protected:
    void apply(Clip& clip) override;

   private:
    AnimationConfig animation_;
};

}   // namespace kinema
