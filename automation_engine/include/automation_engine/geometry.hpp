#pragma once

namespace automation_engine
{

/// Default node size used when a node has neither an explicit nor a measured size.
constexpr double kDefaultNodeWidth = 280.0;
constexpr double kDefaultNodeHeight = 140.0;

struct Point
{
  double x{0.0};
  double y{0.0};
};

/// Axis-aligned rectangle in canvas units, origin at the top-left corner.
struct Rect
{
  double x{0.0};
  double y{0.0};
  double width{0.0};
  double height{0.0};

  double right() const { return x + width; }
  double bottom() const { return y + height; }
};

/**
 * @brief Open-interval overlap test: rectangles that only share an edge do not overlap.
 */
bool rectsOverlap(const Rect & a, const Rect & b);

Point boxCenter(const Rect & box);

/// Euclidean distance between the centers of two boxes.
double centerDistance(const Rect & a, const Rect & b);

}  // namespace automation_engine
