#pragma once

#include <functional>
#include <kinema/collaborators.hpp>
#include <kinema/config.hpp>
#include <kinema/fwd.hpp>
#include <kinema/properties.hpp>
#include <unordered_map>
#include <unordered_set>

#include "sync/coordinate_transform.hpp"

namespace kinema
{

// Keeps the renderer in step with the engine's clips.
//
// Outbound writes go through push_animation() and apply_*(). Any renderer
// failure surfaces as SyncError. Inbound edits reported by the renderer for
// attached clips are converted to project units and written to the clip
// baseline only; keyframes are never touched by inbound traffic. Reports that
// arrive while the bridge is writing to the same clip are echoes and ignored.
class PropertyBridge
{
   public:
    PropertyBridge(Renderer& renderer, ClipProvider& clips, const EngineConfig& config);
    ~PropertyBridge();

    PropertyBridge(const PropertyBridge&)            = delete;
    PropertyBridge& operator=(const PropertyBridge&) = delete;

    // ─── Outbound ────────────────────────────────────────────────────────

    // Converts the clip's animation and waits for the renderer to accept it.
    void push_animation(const Clip& clip);

    // Immediate renderer write for one changed baseline property.
    void apply_property(const Clip& clip, PropertyId property);

    // Immediate renderer write of every baseline property.
    void apply_baseline(const Clip& clip);

    // push_animation() followed by apply_baseline().
    void resync(const Clip& clip);

    // ─── Inbound ─────────────────────────────────────────────────────────

    // Subscribes to renderer edits for the clip. Attaching twice is a no-op.
    void attach(const ClipId& clip_id);
    void detach(const ClipId& clip_id);
    void detach_all();

    bool   is_attached(const ClipId& clip_id) const;
    size_t attached_count() const { return subscriptions_.size(); }

    // Fired after an inbound edit changed a clip baseline.
    using BaselineCallback = std::function<void(const Clip&)>;
    void set_on_baseline_changed(BaselineCallback cb) { on_baseline_changed_ = std::move(cb); }

    CanvasSize canvas() const;

   private:
    class ApplyingScope;

    void handle_props_change(const ClipId& clip_id, const RendererPropsChange& change);
    void write(const Clip& clip, const std::vector<std::pair<std::string, double>>& values);

    Renderer&           renderer_;
    ClipProvider&       clips_;
    const EngineConfig& config_;

    std::unordered_map<ClipId, SubscriptionId> subscriptions_;
    std::unordered_set<ClipId>                 applying_;
    BaselineCallback                           on_baseline_changed_;
};

}   // namespace kinema
