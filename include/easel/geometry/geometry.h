#pragma once
#include <cstdint>

namespace easel::geometry {

struct Point {
    float x = 0, y = 0;

    Point operator+(Point o) const { return {x + o.x, y + o.y}; }
    Point operator-(Point o) const { return {x - o.x, y - o.y}; }
    Point operator*(float s) const { return {x * s, y * s}; }
    bool operator==(const Point&) const = default;

    float dot(Point o) const { return x * o.x + y * o.y; }
    float cross(Point o) const { return x * o.y - y * o.x; }
    float length() const;
    bool is_finite() const;
};

struct Size {
    float width = 0, height = 0;
    bool operator==(const Size&) const = default;
};

struct IntPoint {
    int x = 0, y = 0;
    bool operator==(const IntPoint&) const = default;
};

struct IntSize {
    int width = 0, height = 0;
    bool operator==(const IntSize&) const = default;
};

struct IntRect {
    int x = 0, y = 0, width = 0, height = 0;
    bool operator==(const IntRect&) const = default;
};

// Axis-aligned float rectangle. Only reachable through from_xywh / from_ltrb,
// which reject non-finite values and negative sizes.
class Rect {
public:
    static Rect from_xywh(float x, float y, float width, float height);
    static Rect from_ltrb(float left, float top, float right, float bottom);

    float x() const { return x_; }
    float y() const { return y_; }
    float width() const { return width_; }
    float height() const { return height_; }
    float left() const { return x_; }
    float top() const { return y_; }
    float right() const { return x_ + width_; }
    float bottom() const { return y_ + height_; }
    bool is_empty() const { return width_ <= 0 || height_ <= 0; }

    bool contains(float px, float py) const {
        return px >= x_ && px < x_ + width_ && py >= y_ && py < y_ + height_;
    }

    bool operator==(const Rect&) const = default;

private:
    Rect(float x, float y, float width, float height)
        : x_(x), y_(y), width_(width), height_(height) {}

    float x_ = 0, y_ = 0, width_ = 0, height_ = 0;
};

} // namespace easel::geometry
