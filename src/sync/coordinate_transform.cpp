#include "coordinate_transform.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace kinema
{

Point2 project_to_renderer(Point2 centre, double sprite_width, double sprite_height, CanvasSize canvas)
{
    return Point2{centre.x + canvas.width / 2.0 - sprite_width / 2.0,
                  centre.y + canvas.height / 2.0 - sprite_height / 2.0};
}

Point2 renderer_to_project(Point2 top_left, double sprite_width, double sprite_height, CanvasSize canvas)
{
    return Point2{top_left.x + sprite_width / 2.0 - canvas.width / 2.0,
                  top_left.y + sprite_height / 2.0 - canvas.height / 2.0};
}

double normalize_degrees(double degrees)
{
    if (!std::isfinite(degrees))
        return 0.0;

    double wrapped = std::fmod(degrees, 360.0);
    if (wrapped > 180.0)
        wrapped -= 360.0;
    else if (wrapped < -180.0)
        wrapped += 360.0;
    return wrapped;
}

double degrees_to_radians(double degrees)
{
    return normalize_degrees(degrees) * std::numbers::pi / 180.0;
}

double radians_to_degrees(double radians)
{
    return std::clamp(radians * 180.0 / std::numbers::pi, -180.0, 180.0);
}

}   // namespace kinema
