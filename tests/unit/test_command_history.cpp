#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

#include "commands/batch_command.hpp"
#include "history/command_history.hpp"
#include "util/fake_collaborators.hpp"

using namespace kinema;
using kinema::test::FakeNotifier;

// Commands here add to / subtract from a shared counter so ordering and
// reversal are easy to observe.

namespace
{

class AddCommand : public Command
{
   public:
    AddCommand(int& target, int amount, ClipId clip_id = "clip")
        : target_(target), amount_(amount), clip_id_(std::move(clip_id))
    {
    }

    void execute() override
    {
        if (fail_execute)
            throw std::runtime_error("execute failed");
        target_ += amount_;
    }

    void undo() override
    {
        if (fail_undo)
            throw std::runtime_error("undo failed");
        target_ -= amount_;
    }

    std::string   description() const override { return "Add " + std::to_string(amount_); }
    const ClipId& clip_id() const override { return clip_id_; }

    bool fail_execute = false;
    bool fail_undo    = false;

   private:
    int&   target_;
    int    amount_;
    ClipId clip_id_;
};

std::unique_ptr<AddCommand> add(int& target, int amount, ClipId clip_id = "clip")
{
    return std::make_unique<AddCommand>(target, amount, std::move(clip_id));
}

}   // anonymous namespace

// ─── Basic execute / undo / redo ─────────────────────────────────────────────

TEST(CommandHistory, InitialState)
{
    CommandHistory history;
    EXPECT_FALSE(history.can_undo());
    EXPECT_FALSE(history.can_redo());
    EXPECT_EQ(history.undo_count(), 0u);
    EXPECT_EQ(history.undo_description(), "");
    EXPECT_EQ(history.history_limit(), CommandHistory::DEFAULT_LIMIT);
}

TEST(CommandHistory, ExecuteUndoRedo)
{
    int            value = 0;
    CommandHistory history;

    history.execute(add(value, 5));
    history.execute(add(value, 3));
    EXPECT_EQ(value, 8);
    EXPECT_EQ(history.undo_description(), "Add 3");

    EXPECT_TRUE(history.undo());
    EXPECT_EQ(value, 5);
    EXPECT_EQ(history.redo_description(), "Add 3");

    EXPECT_TRUE(history.undo());
    EXPECT_EQ(value, 0);
    EXPECT_FALSE(history.undo());

    EXPECT_TRUE(history.redo());
    EXPECT_TRUE(history.redo());
    EXPECT_EQ(value, 8);
    EXPECT_FALSE(history.redo());
}

TEST(CommandHistory, NewCommandClearsRedo)
{
    int            value = 0;
    CommandHistory history;
    history.execute(add(value, 1));
    history.undo();
    EXPECT_TRUE(history.can_redo());

    history.execute(add(value, 2));
    EXPECT_FALSE(history.can_redo());
    EXPECT_EQ(value, 2);
}

TEST(CommandHistory, NullCommandIsIgnored)
{
    CommandHistory history;
    history.execute(nullptr);
    EXPECT_FALSE(history.can_undo());
}

// ─── Limit ───────────────────────────────────────────────────────────────────

TEST(CommandHistory, LimitDropsOldest)
{
    int            value = 0;
    CommandHistory history(nullptr, 3);
    for (int i = 1; i <= 5; ++i)
        history.execute(add(value, i));

    EXPECT_EQ(history.undo_count(), 3u);
    while (history.undo())
    {
    }
    EXPECT_EQ(value, 1 + 2);   // 3, 4, 5 undone; 1 and 2 fell off
}

TEST(CommandHistory, ShrinkingLimitTrims)
{
    int            value = 0;
    CommandHistory history;
    for (int i = 0; i < 10; ++i)
        history.execute(add(value, 1));

    history.set_history_limit(4);
    EXPECT_EQ(history.undo_count(), 4u);

    history.set_history_limit(0);
    EXPECT_EQ(history.history_limit(), 1u);
    EXPECT_EQ(history.undo_count(), 1u);
}

// ─── Failures ────────────────────────────────────────────────────────────────

TEST(CommandHistory, FailedExecuteIsReportedAndNotRecorded)
{
    int            value = 0;
    FakeNotifier   notifier;
    CommandHistory history(&notifier);

    auto cmd          = add(value, 4);
    cmd->fail_execute = true;
    EXPECT_THROW(history.execute(std::move(cmd)), std::runtime_error);

    EXPECT_FALSE(history.can_undo());
    ASSERT_EQ(notifier.errors.size(), 1u);
    EXPECT_EQ(notifier.errors[0].message, "execute failed");
}

TEST(CommandHistory, FailedUndoKeepsEntry)
{
    int            value = 0;
    FakeNotifier   notifier;
    CommandHistory history(&notifier);

    auto  cmd = add(value, 4);
    auto* raw = cmd.get();
    history.execute(std::move(cmd));

    raw->fail_undo = true;
    EXPECT_THROW(history.undo(), std::runtime_error);
    EXPECT_TRUE(history.can_undo());
    EXPECT_FALSE(history.can_redo());
    EXPECT_EQ(notifier.errors.size(), 1u);

    raw->fail_undo = false;
    EXPECT_TRUE(history.undo());
    EXPECT_EQ(value, 0);
}

TEST(CommandHistory, FailedRedoDropsRemainingRedoChain)
{
    int            value = 0;
    FakeNotifier   notifier;
    CommandHistory history(&notifier);

    auto  first = add(value, 4);
    auto* raw   = first.get();
    history.execute(std::move(first));
    history.execute(add(value, 10));
    history.undo();
    history.undo();
    ASSERT_EQ(history.redo_count(), 2u);

    raw->fail_execute = true;
    EXPECT_THROW(history.redo(), std::runtime_error);
    EXPECT_FALSE(history.can_redo());
    EXPECT_FALSE(history.can_undo());
    EXPECT_EQ(notifier.errors.size(), 1u);
    EXPECT_FALSE(history.redo());
    EXPECT_EQ(value, 0);
}

// ─── Grouping ────────────────────────────────────────────────────────────────

TEST(CommandHistory, GroupIsOneEntry)
{
    int            value = 0;
    CommandHistory history;

    history.begin_group("Nudge");
    EXPECT_TRUE(history.in_group());
    history.execute(add(value, 1));
    history.execute(add(value, 2));
    history.execute(add(value, 3));
    EXPECT_FALSE(history.can_undo());
    history.end_group();

    EXPECT_FALSE(history.in_group());
    EXPECT_EQ(history.undo_count(), 1u);
    EXPECT_EQ(history.undo_description(), "Nudge");
    EXPECT_EQ(value, 6);

    history.undo();
    EXPECT_EQ(value, 0);
    history.redo();
    EXPECT_EQ(value, 6);
}

TEST(CommandHistory, EmptyGroupRecordsNothing)
{
    CommandHistory history;
    history.begin_group("Nothing");
    history.end_group();
    EXPECT_FALSE(history.can_undo());

    history.end_group();   // unmatched end is harmless
    EXPECT_FALSE(history.in_group());
}

TEST(CommandHistory, ChangeCallback)
{
    int            value   = 0;
    int            changes = 0;
    CommandHistory history;
    history.set_on_change([&] { ++changes; });

    history.execute(add(value, 1));
    history.undo();
    history.redo();
    history.clear();
    EXPECT_EQ(changes, 4);
    EXPECT_FALSE(history.can_undo());
}

// ─── BatchCommand ────────────────────────────────────────────────────────────

TEST(BatchCommand, ExecutesInOrderUndoesInReverse)
{
    std::vector<std::string> log;

    class Logged : public Command
    {
       public:
        Logged(std::vector<std::string>& log, std::string name) : log_(log), name_(std::move(name)) {}
        void          execute() override { log_.push_back("do " + name_); }
        void          undo() override { log_.push_back("undo " + name_); }
        std::string   description() const override { return name_; }
        const ClipId& clip_id() const override { return id_; }

       private:
        std::vector<std::string>& log_;
        std::string               name_;
        ClipId                    id_ = "c";
    };

    BatchCommand batch("pair");
    batch.add(std::make_unique<Logged>(log, "a"));
    batch.add(std::make_unique<Logged>(log, "b"));
    batch.add(nullptr);
    EXPECT_EQ(batch.size(), 2u);

    batch.execute();
    batch.undo();
    EXPECT_EQ(log, (std::vector<std::string>{"do a", "do b", "undo b", "undo a"}));
}

TEST(BatchCommand, FailureRollsBackExecutedChildren)
{
    int value = 0;

    std::vector<CommandPtr> children;
    children.push_back(add(value, 1));
    children.push_back(add(value, 10));
    auto failing          = add(value, 100);
    failing->fail_execute = true;
    children.push_back(std::move(failing));

    BatchCommand batch("three", std::move(children));
    EXPECT_THROW(batch.execute(), std::runtime_error);
    EXPECT_EQ(value, 0);
}

TEST(BatchCommand, ClipIdIsCommonOrEmpty)
{
    int          value = 0;
    BatchCommand same("same");
    same.add(add(value, 1, "a"));
    same.add(add(value, 1, "a"));
    EXPECT_EQ(same.clip_id(), "a");

    BatchCommand mixed("mixed");
    mixed.add(add(value, 1, "a"));
    mixed.add(add(value, 1, "b"));
    EXPECT_TRUE(mixed.clip_id().empty());

    EXPECT_TRUE(BatchCommand("empty").clip_id().empty());
}
