#pragma once

namespace kinema
{

struct CanvasSize
{
    double width  = 1920.0;
    double height = 1080.0;
};

struct Point2
{
    double x = 0.0;
    double y = 0.0;
};

// Project space: clip centre, origin at the canvas centre.
// Renderer space: sprite top-left corner, origin at the canvas top-left.

Point2 project_to_renderer(Point2 centre, double sprite_width, double sprite_height, CanvasSize canvas);
Point2 renderer_to_project(Point2 top_left, double sprite_width, double sprite_height, CanvasSize canvas);

// Wraps into [-180, 180].
double normalize_degrees(double degrees);

// Normalizes first, so the renderer never sees more than half a turn.
double degrees_to_radians(double degrees);

// Result clamped to [-180, 180].
double radians_to_degrees(double radians);

}   // namespace kinema
