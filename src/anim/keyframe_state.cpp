#include "keyframe_state.hpp"

#include <kinema/collaborators.hpp>
#include <kinema/errors.hpp>
#include <kinema/logger.hpp>

#include "anim/keyframe_store.hpp"
#include "core/frame_position.hpp"

namespace kinema
{

const char* keyframe_state_name(KeyframeState state)
{
    switch (state)
    {
        case KeyframeState::None:
            return "none";
        case KeyframeState::OnKeyframe:
            return "on-keyframe";
        case KeyframeState::BetweenKeyframes:
            return "between-keyframes";
    }
    return "unknown";
}

const char* toggle_action_name(ToggleAction action)
{
    switch (action)
    {
        case ToggleAction::Created:
            return "created";
        case ToggleAction::Removed:
            return "removed";
        case ToggleAction::RemovedLast:
            return "removed-last";
    }
    return "unknown";
}

const char* property_change_result_name(PropertyChangeResult result)
{
    switch (result)
    {
        case PropertyChangeResult::NoAnimation:
            return "no-animation";
        case PropertyChangeResult::UpdatedKeyframe:
            return "updated-keyframe";
        case PropertyChangeResult::CreatedKeyframe:
            return "created-keyframe";
    }
    return "unknown";
}

KeyframeState keyframe_state_at(const Clip& clip, Frame absolute_frame)
{
    if (!has_animation(clip))
        return KeyframeState::None;
    if (find_keyframe_at(clip, absolute_frame))
        return KeyframeState::OnKeyframe;
    return KeyframeState::BetweenKeyframes;
}

KeyframeUIState keyframe_ui_state_at(const Clip& clip, Frame absolute_frame)
{
    KeyframeState state = keyframe_state_at(clip, absolute_frame);
    return KeyframeUIState{.has_animation  = state != KeyframeState::None,
                           .is_on_keyframe = state == KeyframeState::OnKeyframe};
}

// ─── Preconditions ───────────────────────────────────────────────────────────

void require_frame_in_range(const Clip& clip, Frame absolute_frame, NotificationSink& notifier)
{
    if (contains_frame(clip.range, absolute_frame))
        return;

    OutOfRangeError error(absolute_frame, clip.range.timeline_start, clip.range.timeline_end);
    KINEMA_LOG_WARN("kinema.state", "Clip {}: {}", clip.id, error.what());
    notifier.warn("Frame out of range",
                  "The playhead must be inside the clip to edit keyframes.");
    throw error;
}

void require_valid_property(const Clip& clip, PropertyId property, double value)
{
    if (!kind_supports(clip.kind, property))
    {
        throw ValidationError(std::string(media_kind_name(clip.kind))
                              + " clips do not expose property " + property_name(property));
    }

    std::string reason = check_property_value(property, value);
    if (!reason.empty())
        throw ValidationError(reason);
}

void require_valid_properties(const Clip& clip, const AnimatableProperties& properties)
{
    if (kind_of(properties) != clip.kind)
    {
        throw ValidationError(std::string("Expected ") + media_kind_name(clip.kind)
                              + " properties, got " + media_kind_name(kind_of(properties)));
    }

    std::string reason = check_properties(properties);
    if (!reason.empty())
        throw ValidationError(reason);
}

// ─── Transitions ─────────────────────────────────────────────────────────────

ToggleAction toggle_keyframe(Clip& clip, Frame absolute_frame)
{
    KeyframeState state = keyframe_state_at(clip, absolute_frame);
    ToggleAction  action;

    switch (state)
    {
        case KeyframeState::None:
        {
            // A disabled config may still carry stale keyframes; start clean.
            clear_keyframes(clip);
            enable_animation(clip);
            Keyframe kf = capture_keyframe(clip, absolute_frame);
            insert_keyframe(clip, kf.frame_position, kf.properties);
            action = ToggleAction::Created;
            break;
        }
        case KeyframeState::OnKeyframe:
            remove_keyframe_at(clip, absolute_frame);
            if (clip.animation->keyframes.empty())
            {
                disable_animation(clip);
                action = ToggleAction::RemovedLast;
            }
            else
            {
                action = ToggleAction::Removed;
            }
            break;
        case KeyframeState::BetweenKeyframes:
        {
            Keyframe kf = capture_keyframe(clip, absolute_frame);
            insert_keyframe(clip, kf.frame_position, kf.properties);
            action = ToggleAction::Created;
            break;
        }
    }

    KINEMA_LOG_INFO("kinema.state",
                    "Toggle on clip {} at frame {}: {} -> {}",
                    clip.id,
                    absolute_frame,
                    keyframe_state_name(state),
                    toggle_action_name(action));
    return action;
}

PropertyChangeResult apply_property_change(Clip&      clip,
                                           Frame      absolute_frame,
                                           PropertyId property,
                                           double     value)
{
    KeyframeState        state = keyframe_state_at(clip, absolute_frame);
    PropertyChangeResult result;

    switch (state)
    {
        case KeyframeState::None:
            set_property(clip.baseline, property, value);
            result = PropertyChangeResult::NoAnimation;
            break;
        case KeyframeState::OnKeyframe:
            set_property(find_keyframe_at(clip, absolute_frame)->properties, property, value);
            set_property(clip.baseline, property, value);
            result = PropertyChangeResult::UpdatedKeyframe;
            break;
        case KeyframeState::BetweenKeyframes:
        {
            Keyframe kf = capture_keyframe(clip, absolute_frame);
            set_property(kf.properties, property, value);
            insert_keyframe(clip, kf.frame_position, kf.properties);
            set_property(clip.baseline, property, value);
            result = PropertyChangeResult::CreatedKeyframe;
            break;
        }
    }

    KINEMA_LOG_DEBUG("kinema.state",
                     "Property {}={} on clip {} at frame {}: {}",
                     property_name(property),
                     value,
                     clip.id,
                     absolute_frame,
                     property_change_result_name(result));
    return result;
}

}   // namespace kinema
