#include "command_history.hpp"

#include <kinema/collaborators.hpp>
#include <kinema/logger.hpp>

#include "commands/batch_command.hpp"

namespace kinema
{

CommandHistory::CommandHistory(NotificationSink* notifier, size_t limit)
    : limit_(limit == 0 ? 1 : limit), notifier_(notifier)
{
}

// ─── Execute ─────────────────────────────────────────────────────────────────

void CommandHistory::execute(CommandPtr command)
{
    if (!command)
        return;

    const std::string desc = command->description();
    try
    {
        command->execute();
    }
    catch (const std::exception& e)
    {
        report_failure("execute", desc, e.what());
        throw;
    }

    push(std::move(command));
    KINEMA_LOG_INFO("kinema.history", "Executed: {}", desc);
    notify_change();
}

void CommandHistory::push(CommandPtr command)
{
    std::lock_guard lock(mutex_);

    if (grouping_)
    {
        group_commands_.push_back(std::move(command));
        return;
    }

    redo_stack_.clear();
    undo_stack_.push_back(std::move(command));
    trim();
}

void CommandHistory::trim()
{
    while (undo_stack_.size() > limit_)
        undo_stack_.erase(undo_stack_.begin());
}

// ─── Undo / Redo ─────────────────────────────────────────────────────────────

bool CommandHistory::undo()
{
    CommandPtr command;
    {
        std::lock_guard lock(mutex_);
        if (undo_stack_.empty())
            return false;
        command = std::move(undo_stack_.back());
        undo_stack_.pop_back();
    }

    // Run outside the lock; renderer callbacks may query the history.
    try
    {
        command->undo();
    }
    catch (const std::exception& e)
    {
        report_failure("undo", command->description(), e.what());
        std::lock_guard lock(mutex_);
        undo_stack_.push_back(std::move(command));
        throw;
    }

    KINEMA_LOG_INFO("kinema.history", "Undone: {}", command->description());
    {
        std::lock_guard lock(mutex_);
        redo_stack_.push_back(std::move(command));
    }
    notify_change();
    return true;
}

bool CommandHistory::redo()
{
    CommandPtr command;
    {
        std::lock_guard lock(mutex_);
        if (redo_stack_.empty())
            return false;
        command = std::move(redo_stack_.back());
        redo_stack_.pop_back();
    }

    try
    {
        command->execute();
    }
    catch (const std::exception& e)
    {
        // execute() may have mutated before failing, so replaying this entry
        // or any later one would apply on top of the wrong state.
        report_failure("redo", command->description(), e.what());
        std::lock_guard lock(mutex_);
        redo_stack_.clear();
        throw;
    }

    KINEMA_LOG_INFO("kinema.history", "Redone: {}", command->description());
    {
        std::lock_guard lock(mutex_);
        undo_stack_.push_back(std::move(command));
        trim();
    }
    notify_change();
    return true;
}

// ─── Queries ─────────────────────────────────────────────────────────────────

bool CommandHistory::can_undo() const
{
    std::lock_guard lock(mutex_);
    return !undo_stack_.empty();
}

bool CommandHistory::can_redo() const
{
    std::lock_guard lock(mutex_);
    return !redo_stack_.empty();
}

std::string CommandHistory::undo_description() const
{
    std::lock_guard lock(mutex_);
    return undo_stack_.empty() ? "" : undo_stack_.back()->description();
}

std::string CommandHistory::redo_description() const
{
    std::lock_guard lock(mutex_);
    return redo_stack_.empty() ? "" : redo_stack_.back()->description();
}

size_t CommandHistory::undo_count() const
{
    std::lock_guard lock(mutex_);
    return undo_stack_.size();
}

size_t CommandHistory::redo_count() const
{
    std::lock_guard lock(mutex_);
    return redo_stack_.size();
}

void CommandHistory::clear()
{
    {
        std::lock_guard lock(mutex_);
        undo_stack_.clear();
        redo_stack_.clear();
        grouping_ = false;
        group_commands_.clear();
    }
    notify_change();
}

size_t CommandHistory::history_limit() const
{
    std::lock_guard lock(mutex_);
    return limit_;
}

void CommandHistory::set_history_limit(size_t limit)
{
    std::lock_guard lock(mutex_);
    limit_ = limit == 0 ? 1 : limit;
    trim();
}

// ─── Grouping ────────────────────────────────────────────────────────────────

void CommandHistory::begin_group(const std::string& description)
{
    std::lock_guard lock(mutex_);
    grouping_          = true;
    group_description_ = description;
    group_commands_.clear();
}

void CommandHistory::end_group()
{
    {
        std::lock_guard lock(mutex_);
        if (!grouping_)
            return;
        grouping_ = false;

        if (group_commands_.empty())
            return;

        auto batch = std::make_unique<BatchCommand>(std::move(group_description_),
                                                    std::move(group_commands_));
        group_commands_.clear();

        redo_stack_.clear();
        undo_stack_.push_back(std::move(batch));
        trim();
    }
    notify_change();
}

bool CommandHistory::in_group() const
{
    std::lock_guard lock(mutex_);
    return grouping_;
}

// ─── Reporting ───────────────────────────────────────────────────────────────

void CommandHistory::report_failure(const std::string& action,
                                    const std::string& what,
                                    const char*        reason)
{
    KINEMA_LOG_ERROR("kinema.history", "Failed to {} '{}': {}", action, what, reason);
    if (notifier_)
        notifier_->error("Could not " + action + " \"" + what + "\"", reason);
}

void CommandHistory::notify_change()
{
    if (on_change_)
        on_change_();
}

}   // namespace kinema
