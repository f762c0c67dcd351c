#include "clip_guard.hpp"

#include <kinema/errors.hpp>
#include <kinema/logger.hpp>

namespace kinema
{

// ─── Lease ───────────────────────────────────────────────────────────────────

ClipGuard::Lease::Lease(ClipGuard* guard, ClipId clip_id)
    : guard_(guard), clip_id_(std::move(clip_id))
{
}

ClipGuard::Lease::~Lease()
{
    release();
}

ClipGuard::Lease::Lease(Lease&& other) noexcept
    : guard_(other.guard_), clip_id_(std::move(other.clip_id_))
{
    other.guard_ = nullptr;
}

ClipGuard::Lease& ClipGuard::Lease::operator=(Lease&& other) noexcept
{
    if (this != &other)
    {
        release();
        guard_       = other.guard_;
        clip_id_     = std::move(other.clip_id_);
        other.guard_ = nullptr;
    }
    return *this;
}

void ClipGuard::Lease::release()
{
    if (!guard_)
        return;
    guard_->release(clip_id_);
    guard_ = nullptr;
}

// ─── Guard ───────────────────────────────────────────────────────────────────

ClipGuard::Lease ClipGuard::acquire(const ClipId& clip_id)
{
    {
        std::lock_guard lock(mutex_);
        if (!active_.insert(clip_id).second)
        {
            KINEMA_LOG_WARN("kinema.command", "Rejected command: clip {} is busy", clip_id);
            throw BusyError(clip_id);
        }
    }
    return Lease(this, clip_id);
}

bool ClipGuard::is_active(const ClipId& clip_id) const
{
    std::lock_guard lock(mutex_);
    return active_.contains(clip_id);
}

size_t ClipGuard::active_count() const
{
    std::lock_guard lock(mutex_);
    return active_.size();
}

void ClipGuard::release(const ClipId& clip_id)
{
    std::lock_guard lock(mutex_);
    active_.erase(clip_id);
}

}   // namespace kinema
