#pragma once

#include <functional>
#include <future>
#include <kinema/animation.hpp>
#include <kinema/fwd.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kinema
{

// ─── Renderer-native data ────────────────────────────────────────────────────
// Renderer units: x/y are the sprite's top-left corner in canvas pixels,
// angle is in radians, time is in microseconds.

// One renderer keyframe. offset_percent is the position within the clip
// duration, 0..100.
struct RendererKeyframe
{
    double                                      offset_percent = 0.0;
    std::vector<std::pair<std::string, double>> values;   // "x", "y", "w", "h", "angle", ...

    // Key in the renderer's keyframe map, e.g. "25.000000%".
    std::string key() const;

    // Value by renderer-native name, nullopt if absent.
    std::optional<double> value(std::string_view name) const;
};

// Animation description pushed to the renderer. An empty keyframe list with a
// zero duration clears the renderer-side animation.
struct AnimationDescription
{
    std::vector<RendererKeyframe> keyframes;
    int64_t                       duration_us     = 0;
    int                           iteration_count = 1;
    std::optional<std::string>    easing;

    bool empty() const { return keyframes.empty(); }
};

// Rectangle edit reported by the renderer. Unset fields did not change.
struct RendererRect
{
    std::optional<double> x;
    std::optional<double> y;
    std::optional<double> w;
    std::optional<double> h;
    std::optional<double> angle;
};

// Property edit originating inside the renderer (e.g. an interactive handle drag).
struct RendererPropsChange
{
    std::optional<RendererRect> rect;
    std::optional<double>       opacity;
    std::optional<double>       z_index;
    std::optional<double>       volume;
};

using PropsChangeCallback = std::function<void(const RendererPropsChange&)>;

// ─── Collaborator interfaces ─────────────────────────────────────────────────

// Resolves clip ids. Returned pointers stay valid until the host removes the clip.
class ClipProvider
{
   public:
    virtual ~ClipProvider() = default;

    virtual Clip*       find_clip(const ClipId& id)       = 0;
    virtual const Clip* find_clip(const ClipId& id) const = 0;
};

// Visual compositing subsystem.
class Renderer
{
   public:
    virtual ~Renderer() = default;

    // Replace the clip's renderer-side animation. Completes asynchronously;
    // failures are delivered through the future.
    virtual std::future<void> push_animation(const Clip& clip, const AnimationDescription& desc) = 0;

    // Immediate write of one renderer-native property ("x", "w", "angle", ...).
    virtual void set_property(const Clip& clip, std::string_view name, double value) = 0;

    // Register for property edits that originate inside the renderer.
    virtual SubscriptionId on_props_change(const ClipId& clip_id, PropsChangeCallback callback) = 0;
    virtual void           remove_props_listener(SubscriptionId id)                             = 0;
};

class PlayheadController
{
   public:
    virtual ~PlayheadController() = default;

    virtual void seek_to(Frame absolute_frame) = 0;
};

// User-facing notifications, decoupled from the exceptions UI code sees.
class NotificationSink
{
   public:
    virtual ~NotificationSink() = default;

    virtual void warn(const std::string& title, const std::string& message)  = 0;
    virtual void error(const std::string& title, const std::string& message) = 0;
};

// Forwards notifications to the logger. Used when the host provides no sink.
class LogNotificationSink : public NotificationSink
{
   public:
    void warn(const std::string& title, const std::string& message) override;
    void error(const std::string& title, const std::string& message) override;
};

}   // namespace kinema
