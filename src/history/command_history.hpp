#pragma once

#include <cstddef>
#include <functional>
#include <kinema/command.hpp>
#include <mutex>
#include <string>
#include <vector>

namespace kinema
{

class NotificationSink;

// Undo/redo stacks of executed commands.
// Thread-safe: the stacks are guarded by a mutex; commands run outside it.
// Capped at history_limit entries, dropping the oldest first.
class CommandHistory
{
   public:
    static constexpr size_t DEFAULT_LIMIT = 100;

    explicit CommandHistory(NotificationSink* notifier = nullptr, size_t limit = DEFAULT_LIMIT);
    ~CommandHistory() = default;

    CommandHistory(const CommandHistory&)            = delete;
    CommandHistory& operator=(const CommandHistory&) = delete;

    // Executes the command and records it. Clears the redo stack. A command
    // that throws is reported and re-thrown and never enters history.
    void execute(CommandPtr command);

    // Returns false if there is nothing to undo/redo. A failing undo or redo
    // is reported and re-thrown; the entry stays on its stack.
    bool undo();
    bool redo();

    bool can_undo() const;
    bool can_redo() const;

    std::string undo_description() const;
    std::string redo_description() const;

    size_t undo_count() const;
    size_t redo_count() const;

    void clear();

    // Commands executed between begin_group/end_group are recorded as a
    // single entry.
    void begin_group(const std::string& description);
    void end_group();
    bool in_group() const;

    size_t history_limit() const;
    void   set_history_limit(size_t limit);

    using ChangeCallback = std::function<void()>;
    void set_on_change(ChangeCallback cb) { on_change_ = std::move(cb); }

   private:
    void push(CommandPtr command);
    void trim();
    void report_failure(const std::string& action, const std::string& what, const char* reason);
    void notify_change();

    mutable std::mutex      mutex_;
    std::vector<CommandPtr> undo_stack_;
    std::vector<CommandPtr> redo_stack_;
    size_t                  limit_;
    NotificationSink*       notifier_;

    bool                    grouping_ = false;
    std::string             group_description_;
    std::vector<CommandPtr> group_commands_;

    ChangeCallback on_change_;
};

}   // namespace kinema
