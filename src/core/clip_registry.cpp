#include <kinema/clip_registry.hpp>

#include <algorithm>

namespace kinema
{

Clip& ClipRegistry::add(Clip clip)
{
    auto& slot = clips_[clip.id];
    if (slot)
        *slot = std::move(clip);
    else
        slot = std::make_unique<Clip>(std::move(clip));
    return *slot;
}

bool ClipRegistry::remove(const ClipId& id)
{
    return clips_.erase(id) > 0;
}

Clip* ClipRegistry::find_clip(const ClipId& id)
{
    auto it = clips_.find(id);
    return it != clips_.end() ? it->second.get() : nullptr;
}

const Clip* ClipRegistry::find_clip(const ClipId& id) const
{
    auto it = clips_.find(id);
    return it != clips_.end() ? it->second.get() : nullptr;
}

std::vector<ClipId> ClipRegistry::ids() const
{
    std::vector<ClipId> out;
    out.reserve(clips_.size());
    for (const auto& [id, clip] : clips_)
        out.push_back(id);
    std::sort(out.begin(), out.end());
    return out;
}

}   // namespace kinema
