#include "keyframe_commands.hpp"

#include <kinema/collaborators.hpp>
#include <kinema/errors.hpp>
#include <kinema/logger.hpp>

#include "anim/duration_rescale.hpp"
#include "anim/keyframe_store.hpp"
#include "commands/keyframe_snapshot.hpp"
#include "core/frame_position.hpp"
#include "history/clip_guard.hpp"
#include "sync/property_bridge.hpp"

namespace kinema
{

// ─── KeyframeCommand ─────────────────────────────────────────────────────────

KeyframeCommand::KeyframeCommand(const CommandContext& ctx, ClipId clip_id)
    : ctx_(ctx), clip_id_(std::move(clip_id))
{
    snapshot_ = capture_snapshot(resolve_clip());
}

Clip& KeyframeCommand::resolve_clip()
{
    Clip* clip = ctx_.clips.find_clip(clip_id_);
    if (!clip)
        throw NotFoundError(clip_id_);
    return *clip;
}

std::string KeyframeCommand::timecode(Frame frame) const
{
    return frames_to_timecode(frame, ctx_.config.frame_rate);
}

void KeyframeCommand::execute()
{
    ClipGuard::Lease lease;
    if (ctx_.guard)
        lease = ctx_.guard->acquire(clip_id_);

    Clip& clip = resolve_clip();
    if (auto frame = target_frame())
        require_frame_in_range(clip, *frame, ctx_.notifier);

    apply(clip);
    seek(seek_after_execute(clip));
    KINEMA_LOG_DEBUG("kinema.command", "Executed: {}", description());
}

void KeyframeCommand::undo()
{
    ClipGuard::Lease lease;
    if (ctx_.guard)
        lease = ctx_.guard->acquire(clip_id_);

    Clip& clip = resolve_clip();
    restore(clip);
    ctx_.bridge.resync(clip);
    seek(seek_after_undo(clip));
    KINEMA_LOG_DEBUG("kinema.command", "Undone: {}", description());
}

void KeyframeCommand::restore(Clip& clip)
{
    restore_snapshot(clip, snapshot_);
}

void KeyframeCommand::seek(std::optional<Frame> frame)
{
    if (!frame || !ctx_.playhead || !ctx_.config.seek_on_execute)
        return;
    ctx_.playhead->seek_to(*frame);
}

// ─── ToggleKeyframeCommand ───────────────────────────────────────────────────

ToggleKeyframeCommand::ToggleKeyframeCommand(const CommandContext& ctx, ClipId clip_id, Frame frame)
    : KeyframeCommand(ctx, std::move(clip_id)), frame_(frame)
{
}

std::string ToggleKeyframeCommand::description() const
{
    return "Toggle keyframe at " + timecode(frame_);
}

void ToggleKeyframeCommand::apply(Clip& clip)
{
    last_action_ = toggle_keyframe(clip, frame_);
    ctx_.bridge.push_animation(clip);
}

// ─── UpdatePropertyCommand ───────────────────────────────────────────────────

UpdatePropertyCommand::UpdatePropertyCommand(const CommandContext& ctx,
                                             ClipId                clip_id,
                                             Frame                 frame,
                                             PropertyId            property,
                                             double                value)
    : KeyframeCommand(ctx, std::move(clip_id)), frame_(frame), property_(property), value_(value)
{
}

std::string UpdatePropertyCommand::description() const
{
    return std::string("Set ") + property_name(property_) + " at " + timecode(frame_);
}

void UpdatePropertyCommand::apply(Clip& clip)
{
    require_valid_property(clip, property_, value_);
    last_result_ = apply_property_change(clip, frame_, property_, value_);
    ctx_.bridge.push_animation(clip);
    ctx_.bridge.apply_property(clip, property_);
}

// ─── CreateKeyframeCommand ───────────────────────────────────────────────────

CreateKeyframeCommand::CreateKeyframeCommand(const CommandContext& ctx, ClipId clip_id, Frame frame)
    : KeyframeCommand(ctx, std::move(clip_id)), frame_(frame)
{
}

std::string CreateKeyframeCommand::description() const
{
    return "Create keyframe at " + timecode(frame_);
}

void CreateKeyframeCommand::apply(Clip& clip)
{
    if (!has_animation(clip))
    {
        clear_keyframes(clip);
        enable_animation(clip);
    }
    Keyframe kf = capture_keyframe(clip, frame_);
    insert_keyframe(clip, kf.frame_position, kf.properties);
    ctx_.bridge.push_animation(clip);
}

// ─── DeleteKeyframeCommand ───────────────────────────────────────────────────

DeleteKeyframeCommand::DeleteKeyframeCommand(const CommandContext& ctx, ClipId clip_id, Frame frame)
    : KeyframeCommand(ctx, std::move(clip_id)), frame_(frame)
{
}

std::string DeleteKeyframeCommand::description() const
{
    return "Delete keyframe at " + timecode(frame_);
}

void DeleteKeyframeCommand::apply(Clip& clip)
{
    if (!remove_keyframe_at(clip, frame_))
        KINEMA_LOG_DEBUG("kinema.command", "No keyframe at {} on clip {}", frame_, clip.id);

    if (keyframe_count(clip) == 0)
        disable_animation(clip);
    ctx_.bridge.push_animation(clip);
}

// ─── ClearAllKeyframesCommand ────────────────────────────────────────────────

ClearAllKeyframesCommand::ClearAllKeyframesCommand(const CommandContext& ctx, ClipId clip_id)
    : KeyframeCommand(ctx, std::move(clip_id))
{
}

std::string ClearAllKeyframesCommand::description() const
{
    return "Clear all keyframes";
}

void ClearAllKeyframesCommand::apply(Clip& clip)
{
    clear_keyframes(clip);
    ctx_.bridge.push_animation(clip);
}

std::optional<Frame> ClearAllKeyframesCommand::seek_after_execute(const Clip& clip) const
{
    return clip.range.timeline_start;
}

std::optional<Frame> ClearAllKeyframesCommand::seek_after_undo(const Clip& clip) const
{
    if (!snapshot_.animation || snapshot_.animation->keyframes.empty())
        return std::nullopt;
    return to_absolute(snapshot_.animation->keyframes.front().frame_position,
                       clip.range.timeline_start);
}

// ─── UpdateKeyframeCommand ───────────────────────────────────────────────────

UpdateKeyframeCommand::UpdateKeyframeCommand(const CommandContext& ctx,
                                             ClipId                clip_id,
                                             Frame                 frame,
                                             AnimatableProperties  properties)
    : KeyframeCommand(ctx, std::move(clip_id)), frame_(frame), properties_(std::move(properties))
{
}

std::string UpdateKeyframeCommand::description() const
{
    return "Update keyframe at " + timecode(frame_);
}

void UpdateKeyframeCommand::apply(Clip& clip)
{
    require_valid_properties(clip, properties_);

    if (!has_animation(clip))
    {
        clear_keyframes(clip);
        enable_animation(clip);
    }
    insert_keyframe(clip, to_relative(frame_, clip.range.timeline_start), properties_);
    clip.baseline = properties_;

    ctx_.bridge.push_animation(clip);
    ctx_.bridge.apply_baseline(clip);
}

// ─── RescaleKeyframesCommand ─────────────────────────────────────────────────

RescaleKeyframesCommand::RescaleKeyframesCommand(const CommandContext& ctx,
                                                 ClipId                clip_id,
                                                 TimeRange             new_range)
    : KeyframeCommand(ctx, std::move(clip_id)), new_range_(new_range)
{
    if (new_range_.duration() <= 0)
    {
        throw ValidationError("Clip range [" + std::to_string(new_range_.timeline_start) + ", "
                              + std::to_string(new_range_.timeline_end) + "] is empty");
    }
    old_range_ = resolve_clip().range;
}

std::string RescaleKeyframesCommand::description() const
{
    return "Rescale keyframes to " + timecode(new_range_.duration());
}

void RescaleKeyframesCommand::apply(Clip& clip)
{
    const Frame old_duration = clip.range.duration();
    clip.range               = new_range_;

    if (clip.animation)
    {
        rescale_keyframes(*clip.animation, old_duration, new_range_.duration());
        if (clip.animation->keyframes.empty())
            disable_animation(clip);
    }
    ctx_.bridge.push_animation(clip);
}

void RescaleKeyframesCommand::restore(Clip& clip)
{
    KeyframeCommand::restore(clip);
    clip.range = old_range_;
}

// ─── ReplaceAnimationCommand ─────────────────────────────────────────────────

ReplaceAnimationCommand::ReplaceAnimationCommand(const CommandContext& ctx,
                                                 ClipId                clip_id,
                                                 AnimationConfig       animation)
    : KeyframeCommand(ctx, std::move(clip_id)), animation_(std::move(animation))
{
}

std::string ReplaceAnimationCommand::description() const
{
    return "Load animation";
}

void ReplaceAnimationCommand::apply(Clip& clip)
{
    const Frame duration = clip.range.duration();
    for (const auto& kf : animation_.keyframes)
    {
        require_valid_properties(clip, kf.properties);
        if (kf.frame_position < 0 || kf.frame_position > duration)
        {
            throw ValidationError("Keyframe at " + std::to_string(kf.frame_position)
                                  + " lies outside the clip duration "
                                  + std::to_string(duration));
        }
    }

    clip.animation = animation_;
    ctx_.bridge.push_animation(clip);
}

}   // namespace kinema
