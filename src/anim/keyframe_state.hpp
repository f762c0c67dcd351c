#pragma once

#include <kinema/animation.hpp>
#include <kinema/fwd.hpp>
#include <kinema/properties.hpp>

namespace kinema
{

// What toggle_keyframe() did.
enum class ToggleAction : uint8_t
{
    Created,       // Keyframe inserted at the frame
    Removed,       // Keyframe removed, others remain
    RemovedLast,   // Last keyframe removed, animation disabled
};

// What apply_property_change() did besides writing the baseline.
enum class PropertyChangeResult : uint8_t
{
    NoAnimation,       // Baseline only
    UpdatedKeyframe,   // Existing keyframe at the frame overwritten
    CreatedKeyframe,   // New keyframe captured with the new value
};

const char* toggle_action_name(ToggleAction action);
const char* property_change_result_name(PropertyChangeResult result);

// State is derived from the config and the frame on every call.
KeyframeState   keyframe_state_at(const Clip& clip, Frame absolute_frame);
KeyframeUIState keyframe_ui_state_at(const Clip& clip, Frame absolute_frame);

// Throws OutOfRangeError after warning the sink when the frame lies outside
// the clip's inclusive span.
void require_frame_in_range(const Clip& clip, Frame absolute_frame, NotificationSink& notifier);

// Throws ValidationError if the clip's kind does not expose the property or
// the value is outside its domain.
void require_valid_property(const Clip& clip, PropertyId property, double value);

// Throws ValidationError if the set does not match the clip's kind or holds
// an invalid value.
void require_valid_properties(const Clip& clip, const AnimatableProperties& properties);

// The following assume the checks above already passed and never throw.

ToggleAction toggle_keyframe(Clip& clip, Frame absolute_frame);

PropertyChangeResult apply_property_change(Clip&      clip,
                                           Frame      absolute_frame,
                                           PropertyId property,
                                           double     value);

}   // namespace kinema
