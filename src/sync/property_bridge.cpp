#include "property_bridge.hpp"

#include <cmath>
#include <kinema/animation.hpp>
#include <kinema/errors.hpp>
#include <kinema/logger.hpp>
#include <type_traits>

#include "sync/animation_converter.hpp"

namespace kinema
{

// Marks a clip as being written by the bridge for the scope's lifetime.
class PropertyBridge::ApplyingScope
{
   public:
    ApplyingScope(PropertyBridge& bridge, const ClipId& clip_id)
        : bridge_(bridge), clip_id_(clip_id), owner_(bridge.applying_.insert(clip_id).second)
    {
    }

    ~ApplyingScope()
    {
        if (owner_)
            bridge_.applying_.erase(clip_id_);
    }

    ApplyingScope(const ApplyingScope&)            = delete;
    ApplyingScope& operator=(const ApplyingScope&) = delete;

   private:
    PropertyBridge& bridge_;
    ClipId          clip_id_;
    bool            owner_;
};

PropertyBridge::PropertyBridge(Renderer& renderer, ClipProvider& clips, const EngineConfig& config)
    : renderer_(renderer), clips_(clips), config_(config)
{
}

PropertyBridge::~PropertyBridge()
{
    try
    {
        detach_all();
    }
    catch (const std::exception& e)
    {
        KINEMA_LOG_ERROR("kinema.sync", "Failed to detach renderer listeners: {}", e.what());
    }
}

CanvasSize PropertyBridge::canvas() const
{
    return CanvasSize{static_cast<double>(config_.canvas_width),
                      static_cast<double>(config_.canvas_height)};
}

// ─── Outbound ────────────────────────────────────────────────────────────────

void PropertyBridge::push_animation(const Clip& clip)
{
    AnimationDescription desc = to_animation_description(clip, config_.frame_rate, canvas());
    KINEMA_LOG_DEBUG("kinema.sync",
                     "Pushing {} keyframe(s) for clip {} ({} us)",
                     desc.keyframes.size(),
                     clip.id,
                     desc.duration_us);

    ApplyingScope scope(*this, clip.id);
    try
    {
        std::future<void> done = renderer_.push_animation(clip, desc);
        if (!done.valid())
            throw SyncError("Renderer returned no completion for clip " + clip.id);
        done.get();
    }
    catch (const SyncError& e)
    {
        KINEMA_LOG_ERROR("kinema.sync", "{}", e.what());
        throw;
    }
    catch (const std::exception& e)
    {
        KINEMA_LOG_ERROR("kinema.sync", "Animation push failed for clip {}: {}", clip.id, e.what());
        throw SyncError("Animation push failed for clip " + clip.id + ": " + e.what());
    }
}

void PropertyBridge::write(const Clip& clip, const std::vector<std::pair<std::string, double>>& values)
{
    ApplyingScope scope(*this, clip.id);
    for (const auto& [name, value] : values)
    {
        try
        {
            renderer_.set_property(clip, name, value);
        }
        catch (const std::exception& e)
        {
            KINEMA_LOG_ERROR("kinema.sync",
                             "Setting {} on clip {} failed: {}",
                             name,
                             clip.id,
                             e.what());
            throw SyncError("Setting " + name + " on clip " + clip.id + " failed: " + e.what());
        }
    }
}

void PropertyBridge::apply_property(const Clip& clip, PropertyId property)
{
    write(clip, renderer_writes_for(clip.baseline, property, canvas()));
}

void PropertyBridge::apply_baseline(const Clip& clip)
{
    write(clip, renderer_writes_for_baseline(clip.baseline, canvas()));
}

void PropertyBridge::resync(const Clip& clip)
{
    push_animation(clip);
    apply_baseline(clip);
}

// ─── Inbound ─────────────────────────────────────────────────────────────────

void PropertyBridge::attach(const ClipId& clip_id)
{
    if (subscriptions_.contains(clip_id))
        return;

    SubscriptionId id = renderer_.on_props_change(
        clip_id,
        [this, clip_id](const RendererPropsChange& change) { handle_props_change(clip_id, change); });
    subscriptions_.emplace(clip_id, id);
    KINEMA_LOG_DEBUG("kinema.sync", "Attached clip {} (subscription {})", clip_id, id);
}

void PropertyBridge::detach(const ClipId& clip_id)
{
    auto it = subscriptions_.find(clip_id);
    if (it == subscriptions_.end())
        return;

    SubscriptionId id = it->second;
    subscriptions_.erase(it);
    renderer_.remove_props_listener(id);
    KINEMA_LOG_DEBUG("kinema.sync", "Detached clip {}", clip_id);
}

void PropertyBridge::detach_all()
{
    auto subscriptions = std::move(subscriptions_);
    subscriptions_.clear();
    for (const auto& [clip_id, id] : subscriptions)
        renderer_.remove_props_listener(id);
}

bool PropertyBridge::is_attached(const ClipId& clip_id) const
{
    return subscriptions_.contains(clip_id);
}

namespace
{

// Writes value if the baseline's kind exposes the property and the value is
// in its domain. Returns true when the baseline changed.
bool absorb(Clip& clip, PropertyId id, double value)
{
    std::string reason = check_property_value(id, value);
    if (!reason.empty())
    {
        KINEMA_LOG_WARN("kinema.sync", "Ignoring renderer edit on clip {}: {}", clip.id, reason);
        return false;
    }
    auto current = get_property(clip.baseline, id);
    if (!current || *current == value)
        return false;
    return set_property(clip.baseline, id, value);
}

}   // anonymous namespace

void PropertyBridge::handle_props_change(const ClipId& clip_id, const RendererPropsChange& change)
{
    if (applying_.contains(clip_id))
    {
        KINEMA_LOG_TRACE("kinema.sync", "Ignoring echo for clip {}", clip_id);
        return;
    }

    Clip* clip = clips_.find_clip(clip_id);
    if (!clip)
    {
        KINEMA_LOG_WARN("kinema.sync", "Renderer edit for unknown clip {}", clip_id);
        return;
    }

    bool changed = false;

    if (change.rect)
    {
        const RendererRect& rect = *change.rect;
        std::visit(
            [&](auto& p)
            {
                using T = std::decay_t<decltype(p)>;
                if constexpr (!std::is_same_v<T, AudioProperties>)
                {
                    // Top-left the renderer currently has, before any size change.
                    Point2 top_left =
                        project_to_renderer({p.x, p.y}, p.width, p.height, canvas());
                    if (rect.x)
                        top_left.x = *rect.x;
                    if (rect.y)
                        top_left.y = *rect.y;
                    double w = rect.w.value_or(p.width);
                    double h = rect.h.value_or(p.height);

                    if (rect.w)
                        changed |= absorb(*clip, PropertyId::Width, w);
                    if (rect.h)
                        changed |= absorb(*clip, PropertyId::Height, h);

                    if (rect.x || rect.y || rect.w || rect.h)
                    {
                        Point2 centre = renderer_to_project(top_left, w, h, canvas());
                        changed |= absorb(*clip, PropertyId::X, std::round(centre.x));
                        changed |= absorb(*clip, PropertyId::Y, std::round(centre.y));
                    }
                    if (rect.angle)
                        changed |= absorb(*clip, PropertyId::Rotation, radians_to_degrees(*rect.angle));
                }
            },
            clip->baseline);
    }

    if (change.opacity)
        changed |= absorb(*clip, PropertyId::Opacity, *change.opacity);
    if (change.z_index)
        changed |= absorb(*clip, PropertyId::ZIndex, *change.z_index);
    if (change.volume)
        changed |= absorb(*clip, PropertyId::Volume, *change.volume);

    if (!changed)
        return;

    KINEMA_LOG_DEBUG("kinema.sync", "Absorbed renderer edit into baseline of clip {}", clip_id);
    if (on_baseline_changed_)
        on_baseline_changed_(*clip);
}

}   // namespace kinema
