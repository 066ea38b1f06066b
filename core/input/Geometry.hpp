#pragma once

namespace ct {

// Simple 2D point
struct Point {
    float x;
    float y;
};

struct Rect {
    float x{0.f};
    float y{0.f};
    float width{0.f};
    float height{0.f};

    bool contains(const Point &p) const {
        return p.x >= x && p.x < x + width && p.y >= y && p.y < y + height;
    }

    Point center() const { return {x + width / 2.f, y + height / 2.f}; }
};

enum class Orientation { Horizontal, Vertical };

} // namespace ct
