#pragma once

#include <kinema/animation.hpp>
#include <kinema/collaborators.hpp>
#include <memory>
#include <unordered_map>
#include <vector>

namespace kinema
{

// In-memory ClipProvider. Clips are heap-allocated so pointers handed out by
// find_clip() survive later insertions.
class ClipRegistry : public ClipProvider
{
   public:
    ClipRegistry() = default;

    ClipRegistry(const ClipRegistry&)            = delete;
    ClipRegistry& operator=(const ClipRegistry&) = delete;

    // Adds or replaces a clip. Returns the stored clip.
    Clip& add(Clip clip);

    // Returns false if no clip had that id.
    bool remove(const ClipId& id);

    Clip*       find_clip(const ClipId& id) override;
    const Clip* find_clip(const ClipId& id) const override;

    size_t              size() const { return clips_.size(); }
    std::vector<ClipId> ids() const;
    void                clear() { clips_.clear(); }

   private:
    std::unordered_map<ClipId, std::unique_ptr<Clip>> clips_;
};

}   // namespace kinema
