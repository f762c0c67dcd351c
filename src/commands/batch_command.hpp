#pragma once

#include <kinema/command.hpp>
#include <string>
#include <vector>

namespace kinema
{

// Runs child commands as one unit: execute in order, undo in reverse. If a
// child fails during execute, the children already executed are undone
// before the error propagates.
class BatchCommand : public Command
{
   public:
    explicit BatchCommand(std::string description);
    BatchCommand(std::string description, std::vector<CommandPtr> children);

    void add(CommandPtr child);

    void execute() override;
    void undo() override;

    std::string   description() const override { return description_; }
    const ClipId& clip_id() const override;

    size_t size() const { return children_.size(); }
    bool   empty() const { return children_.empty(); }

   private:
    std::string             description_;
    std::vector<CommandPtr> children_;
};

}   // namespace kinema
