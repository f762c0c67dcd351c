#pragma once

#include <kinema/animation.hpp>
#include <kinema/collaborators.hpp>
#include <string>
#include <utility>
#include <vector>

#include "sync/coordinate_transform.hpp"

namespace kinema
{

using RendererValues = std::vector<std::pair<std::string, double>>;

// Renderer-native values for a full property set. zIndex is not animated by
// the renderer and is left out.
RendererValues to_renderer_values(const AnimatableProperties& props, CanvasSize canvas);

// Immediate writes needed after one property changed. Position and size
// changes rewrite the top-left corner so the centre stays fixed.
RendererValues renderer_writes_for(const AnimatableProperties& props,
                                   PropertyId                  property,
                                   CanvasSize                  canvas);

// Every immediate write for a full baseline, including zIndex.
RendererValues renderer_writes_for_baseline(const AnimatableProperties& props, CanvasSize canvas);

// Description of the clip's animation. Absent or disabled configs and clips
// with no duration yield an empty description.
AnimationDescription to_animation_description(const Clip& clip,
                                              double      frame_rate,
                                              CanvasSize  canvas);

}   // namespace kinema
