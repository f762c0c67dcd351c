#include <kinema/engine.hpp>
#include <kinema/errors.hpp>
#include <kinema/logger.hpp>

#include "anim/keyframe_state.hpp"
#include "anim/keyframe_store.hpp"
#include "commands/keyframe_commands.hpp"
#include "history/clip_guard.hpp"
#include "history/command_history.hpp"
#include "io/animation_serializer.hpp"
#include "sync/property_bridge.hpp"

namespace kinema
{

KeyframeEngine::KeyframeEngine(ClipProvider&       clips,
                               Renderer&           renderer,
                               const EngineConfig& config,
                               NotificationSink*   notifier,
                               PlayheadController* playhead)
    : clips_(clips), config_(config), notifier_(notifier)
{
    std::string problem = config_.check();
    if (!problem.empty())
        throw ValidationError("Invalid engine config: " + problem);

    if (!notifier_)
    {
        fallback_notifier_ = std::make_unique<LogNotificationSink>();
        notifier_          = fallback_notifier_.get();
    }

    Logger::instance().set_level(config_.log_level);

    bridge_  = std::make_unique<PropertyBridge>(renderer, clips_, config_);
    guard_   = std::make_unique<ClipGuard>();
    history_ = std::make_unique<CommandHistory>(notifier_, config_.history_limit);
    context_ = std::make_unique<CommandContext>(CommandContext{.clips    = clips_,
                                                               .bridge   = *bridge_,
                                                               .notifier = *notifier_,
                                                               .config   = config_,
                                                               .playhead = playhead,
                                                               .guard    = guard_.get()});

    KINEMA_LOG_INFO("kinema.engine",
                    "Engine ready: {} fps, canvas {}x{}, history {}",
                    config_.frame_rate,
                    config_.canvas_width,
                    config_.canvas_height,
                    config_.history_limit);
}

// History holds commands referring to the context; drop it first.
KeyframeEngine::~KeyframeEngine()
{
    history_.reset();
    context_.reset();
}

const Clip& KeyframeEngine::clip(const ClipId& clip_id) const
{
    const Clip* c = static_cast<const ClipProvider&>(clips_).find_clip(clip_id);
    if (!c)
        throw NotFoundError(clip_id);
    return *c;
}

// ─── Queries ─────────────────────────────────────────────────────────────────

KeyframeState KeyframeEngine::state_at(const ClipId& clip_id, Frame absolute_frame) const
{
    return keyframe_state_at(clip(clip_id), absolute_frame);
}

KeyframeUIState KeyframeEngine::ui_state_at(const ClipId& clip_id, Frame absolute_frame) const
{
    return keyframe_ui_state_at(clip(clip_id), absolute_frame);
}

std::optional<Frame> KeyframeEngine::previous_keyframe(const ClipId& clip_id, Frame absolute_frame) const
{
    return previous_keyframe_frame(clip(clip_id), absolute_frame);
}

std::optional<Frame> KeyframeEngine::next_keyframe(const ClipId& clip_id, Frame absolute_frame) const
{
    return next_keyframe_frame(clip(clip_id), absolute_frame);
}

std::vector<Frame> KeyframeEngine::keyframe_frames(const ClipId& clip_id) const
{
    return kinema::keyframe_frames(clip(clip_id));
}

bool KeyframeEngine::has_animation(const ClipId& clip_id) const
{
    return kinema::has_animation(clip(clip_id));
}

std::vector<std::string> KeyframeEngine::validate(const ClipId& clip_id) const
{
    return validate_keyframes(clip(clip_id));
}

std::string KeyframeEngine::describe(const ClipId& clip_id) const
{
    return describe_keyframes(clip(clip_id));
}

// ─── Edits ───────────────────────────────────────────────────────────────────

KeyframeState KeyframeEngine::toggle_keyframe(const ClipId& clip_id, Frame absolute_frame)
{
    history_->execute(std::make_unique<ToggleKeyframeCommand>(*context_, clip_id, absolute_frame));
    return state_at(clip_id, absolute_frame);
}

void KeyframeEngine::update_property(const ClipId& clip_id,
                                    Frame         absolute_frame,
                                    PropertyId    property,
                                    double        value)
{
    history_->execute(std::make_unique<UpdatePropertyCommand>(*context_,
                                                              clip_id,
                                                              absolute_frame,
                                                              property,
                                                              value));
}

void KeyframeEngine::create_keyframe(const ClipId& clip_id, Frame absolute_frame)
{
    history_->execute(std::make_unique<CreateKeyframeCommand>(*context_, clip_id, absolute_frame));
}

void KeyframeEngine::delete_keyframe(const ClipId& clip_id, Frame absolute_frame)
{
    history_->execute(std::make_unique<DeleteKeyframeCommand>(*context_, clip_id, absolute_frame));
}

void KeyframeEngine::clear_keyframes(const ClipId& clip_id)
{
    history_->execute(std::make_unique<ClearAllKeyframesCommand>(*context_, clip_id));
}

void KeyframeEngine::update_keyframe(const ClipId&               clip_id,
                                     Frame                       absolute_frame,
                                     const AnimatableProperties& properties)
{
    history_->execute(
        std::make_unique<UpdateKeyframeCommand>(*context_, clip_id, absolute_frame, properties));
}

void KeyframeEngine::rescale(const ClipId& clip_id, const TimeRange& new_range)
{
    history_->execute(std::make_unique<RescaleKeyframesCommand>(*context_, clip_id, new_range));
}

void KeyframeEngine::execute(CommandPtr command)
{
    history_->execute(std::move(command));
}

// ─── History ─────────────────────────────────────────────────────────────────

bool KeyframeEngine::undo()
{
    return history_->undo();
}

bool KeyframeEngine::redo()
{
    return history_->redo();
}

bool KeyframeEngine::can_undo() const
{
    return history_->can_undo();
}

bool KeyframeEngine::can_redo() const
{
    return history_->can_redo();
}

std::string KeyframeEngine::undo_description() const
{
    return history_->undo_description();
}

std::string KeyframeEngine::redo_description() const
{
    return history_->redo_description();
}

void KeyframeEngine::begin_group(const std::string& description)
{
    history_->begin_group(description);
}

void KeyframeEngine::end_group()
{
    history_->end_group();
}

// ─── Renderer sync ───────────────────────────────────────────────────────────

void KeyframeEngine::attach(const ClipId& clip_id)
{
    const Clip& c = clip(clip_id);
    bridge_->attach(c.id);
}

void KeyframeEngine::detach(const ClipId& clip_id)
{
    bridge_->detach(clip_id);
}

void KeyframeEngine::resync(const ClipId& clip_id)
{
    bridge_->resync(clip(clip_id));
}

// ─── Persistence ─────────────────────────────────────────────────────────────

std::string KeyframeEngine::export_animation(const ClipId& clip_id) const
{
    const Clip& c = clip(clip_id);
    if (!c.animation)
        return {};
    return serialize_animation(*c.animation);
}

void KeyframeEngine::import_animation(const ClipId& clip_id, const std::string& json)
{
    AnimationConfig config = deserialize_animation(json, clip(clip_id).kind);
    history_->execute(
        std::make_unique<ReplaceAnimationCommand>(*context_, clip_id, std::move(config)));
}

}   // namespace kinema
