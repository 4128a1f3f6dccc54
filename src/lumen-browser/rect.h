#ifndef LUMEN_BROWSER_RECT_H
#define LUMEN_BROWSER_RECT_H

// Bounds of a surface in window client coordinates. Width and height are
// never negative: the constructor clamps them to zero.
struct Rect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    Rect() = default;
    Rect(int x_in, int y_in, int width_in, int height_in)
        : x(x_in),
          y(y_in),
          width(width_in < 0 ? 0 : width_in),
          height(height_in < 0 ? 0 : height_in) {}

    bool empty() const { return width == 0 || height == 0; }

    bool operator==(const Rect &other) const
    {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
    bool operator!=(const Rect &other) const { return !(*this == other); }
};

#endif // LUMEN_BROWSER_RECT_H
