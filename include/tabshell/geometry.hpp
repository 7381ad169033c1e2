#pragma once

namespace tabshell
{

// Screen-space point, in the host's pixel coordinates.
struct Point
{
    double x = 0.0;
    double y = 0.0;
};

// Screen-space rectangle (top-left origin).
struct Rect
{
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    // Edges are inclusive on both sides, matching how the host reports
    // a window's outer frame.
    bool contains(const Point& p) const
    {
        // Edges in double: a window parked at the int limits must not overflow.
        const double right  = static_cast<double>(x) + w;
        const double bottom = static_cast<double>(y) + h;
        return p.x >= x && p.x <= right && p.y >= y && p.y <= bottom;
    }

    bool empty() const { return w <= 0 || h <= 0; }
};

inline bool operator==(const Rect& a, const Rect& b)
{
    return a.x == b.x && a.y == b.y && a.w == b.w && a.h == b.h;
}

}   // namespace tabshell
