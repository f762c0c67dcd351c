#include "batch_command.hpp"

#include <kinema/logger.hpp>

namespace kinema
{

BatchCommand::BatchCommand(std::string description) : description_(std::move(description)) {}

BatchCommand::BatchCommand(std::string description, std::vector<CommandPtr> children)
    : description_(std::move(description)), children_(std::move(children))
{
}

void BatchCommand::add(CommandPtr child)
{
    if (child)
        children_.push_back(std::move(child));
}

const ClipId& BatchCommand::clip_id() const
{
    static const ClipId none;
    if (children_.empty())
        return none;

    // A batch targets one clip only when every child does.
    const ClipId& first = children_.front()->clip_id();
    for (const auto& child : children_)
    {
        if (child->clip_id() != first)
            return none;
    }
    return first;
}

void BatchCommand::execute()
{
    size_t done = 0;
    try
    {
        for (; done < children_.size(); ++done)
            children_[done]->execute();
    }
    catch (const std::exception& e)
    {
        KINEMA_LOG_WARN("kinema.command",
                        "Batch '{}' failed at step {} of {}: {}; rolling back",
                        description_,
                        done + 1,
                        children_.size(),
                        e.what());
        while (done > 0)
        {
            --done;
            try
            {
                children_[done]->undo();
            }
            catch (const std::exception& rollback_error)
            {
                KINEMA_LOG_ERROR("kinema.command",
                                 "Rollback of '{}' failed: {}",
                                 children_[done]->description(),
                                 rollback_error.what());
            }
        }
        throw;
    }
}

void BatchCommand::undo()
{
    for (auto it = children_.rbegin(); it != children_.rend(); ++it)
        (*it)->undo();
}

}   // namespace kinema
