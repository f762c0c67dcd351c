#pragma once

#include <cstdint>
#include <string>

namespace kinema
{

// Discrete timeline position. Absolute frames are measured from the start of
// the project timeline, relative frames from the start of a clip.
using Frame = int64_t;

// Clips are identified by the host's string ids.
using ClipId = std::string;

// Renderer listener handle returned by Renderer::on_props_change().
using SubscriptionId = uint64_t;

inline constexpr SubscriptionId INVALID_SUBSCRIPTION_ID = 0;

struct Clip;
struct TimeRange;
struct Keyframe;
struct AnimationConfig;
struct KeyframeSnapshot;
struct EngineConfig;

struct VisualProperties;
struct VideoProperties;
struct ImageProperties;
struct TextProperties;
struct AudioProperties;

struct AnimationDescription;
struct RendererKeyframe;
struct RendererPropsChange;

class ClipProvider;
class ClipRegistry;
class Renderer;
class PlayheadController;
class NotificationSink;

class PropertyBridge;
class Command;
class BatchCommand;
class CommandHistory;
class ClipGuard;
class KeyframeEngine;

}   // namespace kinema
