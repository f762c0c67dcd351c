#pragma once

#include <kinema/fwd.hpp>
#include <memory>
#include <string>

namespace kinema
{

// A reversible mutation. execute() may be called again after undo() to redo
// and must reproduce the same end state from its stored parameters.
class Command
{
   public:
    virtual ~Command() = default;

    virtual void execute() = 0;
    virtual void undo()    = 0;

    virtual std::string description() const = 0;

    // Clip the command targets. Empty for commands spanning several clips.
    virtual const ClipId& clip_id() const = 0;
};

using CommandPtr = std::unique_ptr<Command>;

}   // namespace kinema
