#include <automation_engine/geometry.hpp>

#include <cmath>

namespace automation_engine
{

bool rectsOverlap(const Rect & a, const Rect & b)
{
  return a.x < b.right() && a.right() > b.x &&
         a.y < b.bottom() && a.bottom() > b.y;
}

Point boxCenter(const Rect & box)
{
  return Point{box.x + box.width / 2.0, box.y + box.height / 2.0};
}

double centerDistance(const Rect & a, const Rect & b)
{
  const auto ca = boxCenter(a);
  const auto cb = boxCenter(b);
  const double dx = ca.x - cb.x;
  const double dy = ca.y - cb.y;
  return std::sqrt(dx * dx + dy * dy);
}

}  // namespace automation_engine
