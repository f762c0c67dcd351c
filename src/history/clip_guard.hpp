#pragma once

#include <kinema/fwd.hpp>
#include <mutex>
#include <unordered_set>

namespace kinema
{

// Allows at most one active command per clip. A second acquire for a clip
// that is already held throws BusyError.
// Thread-safe: acquire/release may be called from any thread.
class ClipGuard
{
   public:
    // Releases the clip when destroyed.
    class Lease
    {
       public:
        Lease() = default;
        Lease(ClipGuard* guard, ClipId clip_id);
        ~Lease();

        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;

        Lease(const Lease&)            = delete;
        Lease& operator=(const Lease&) = delete;

        bool held() const { return guard_ != nullptr; }
        void release();

       private:
        ClipGuard* guard_ = nullptr;
        ClipId     clip_id_;
    };

    ClipGuard() = default;

    ClipGuard(const ClipGuard&)            = delete;
    ClipGuard& operator=(const ClipGuard&) = delete;

    Lease acquire(const ClipId& clip_id);

    bool   is_active(const ClipId& clip_id) const;
    size_t active_count() const;

   private:
    void release(const ClipId& clip_id);

    mutable std::mutex         mutex_;
    std::unordered_set<ClipId> active_;
};

}   // namespace kinema
