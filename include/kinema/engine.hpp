#pragma once

#include <kinema/animation.hpp>
#include <kinema/collaborators.hpp>
#include <kinema/command.hpp>
#include <kinema/config.hpp>
#include <kinema/fwd.hpp>
#include <kinema/properties.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kinema
{

struct CommandContext;

// Host-facing entry point. Wires clips, renderer, playhead and notifications
// to the keyframe store, the sync bridge and the command history.
//
// Every mutating call runs as a command through the history and can be
// undone. Clip lookups throw NotFoundError; frame-targeted edits outside the
// clip throw OutOfRangeError after a warning; renderer failures throw
// SyncError. Failed commands never enter the history.
class KeyframeEngine
{
   public:
    // notifier and playhead are optional. Without a notifier, warnings and
    // errors go to the log.
    KeyframeEngine(ClipProvider&       clips,
                   Renderer&           renderer,
                   const EngineConfig& config   = {},
                   NotificationSink*   notifier = nullptr,
                   PlayheadController* playhead = nullptr);
    ~KeyframeEngine();

    KeyframeEngine(const KeyframeEngine&)            = delete;
    KeyframeEngine& operator=(const KeyframeEngine&) = delete;

    const EngineConfig& config() const { return config_; }

    // ─── Queries ─────────────────────────────────────────────────────────

    KeyframeState   state_at(const ClipId& clip_id, Frame absolute_frame) const;
    KeyframeUIState ui_state_at(const ClipId& clip_id, Frame absolute_frame) const;

    std::optional<Frame> previous_keyframe(const ClipId& clip_id, Frame absolute_frame) const;
    std::optional<Frame> next_keyframe(const ClipId& clip_id, Frame absolute_frame) const;
    std::vector<Frame>   keyframe_frames(const ClipId& clip_id) const;
    bool                 has_animation(const ClipId& clip_id) const;

    std::vector<std::string> validate(const ClipId& clip_id) const;
    std::string              describe(const ClipId& clip_id) const;

    // ─── Edits ───────────────────────────────────────────────────────────

    // Returns the state at the frame afterwards.
    KeyframeState toggle_keyframe(const ClipId& clip_id, Frame absolute_frame);

    void update_property(const ClipId& clip_id, Frame absolute_frame, PropertyId property, double value);
    void create_keyframe(const ClipId& clip_id, Frame absolute_frame);
    void delete_keyframe(const ClipId& clip_id, Frame absolute_frame);
    void clear_keyframes(const ClipId& clip_id);
    void update_keyframe(const ClipId& clip_id, Frame absolute_frame, const AnimatableProperties& properties);

    // Host trimmed or retimed the clip.
    void rescale(const ClipId& clip_id, const TimeRange& new_range);

    // Runs a host-built command through the history.
    void execute(CommandPtr command);

    // ─── History ─────────────────────────────────────────────────────────

    bool undo();
    bool redo();
    bool can_undo() const;
    bool can_redo() const;

    std::string undo_description() const;
    std::string redo_description() const;

    void begin_group(const std::string& description);
    void end_group();

    CommandHistory& history() { return *history_; }

    // ─── Renderer sync ───────────────────────────────────────────────────

    // Start/stop absorbing renderer-side edits into the clip baseline.
    void attach(const ClipId& clip_id);
    void detach(const ClipId& clip_id);

    // Pushes the animation and every baseline value again.
    void resync(const ClipId& clip_id);

    PropertyBridge& bridge() { return *bridge_; }

    // ─── Persistence ─────────────────────────────────────────────────────

    // Empty string when the clip has no animation config.
    std::string export_animation(const ClipId& clip_id) const;

    // Replaces the clip's animation with the parsed config and pushes it as
    // an undoable command. Throws ValidationError when the data does not fit
    // the clip.
    void import_animation(const ClipId& clip_id, const std::string& json);

   private:
    const Clip& clip(const ClipId& clip_id) const;

    ClipProvider&                     clips_;
    EngineConfig                      config_;
    std::unique_ptr<NotificationSink> fallback_notifier_;
    NotificationSink*                 notifier_;
    std::unique_ptr<PropertyBridge>   bridge_;
    std::unique_ptr<ClipGuard>        guard_;
    std::unique_ptr<CommandHistory>   history_;
    std::unique_ptr<CommandContext>   context_;
};

}   // namespace kinema
