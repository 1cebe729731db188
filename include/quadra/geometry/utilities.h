#ifndef QUADRA_GEOMETRY_UTILITIES_H_
#define QUADRA_GEOMETRY_UTILITIES_H_

#include <algorithm>
#include <cmath>

#include <Eigen/Core>

namespace quadra {
namespace geometry {

constexpr double PI = 3.141592653589793238462643383279502884;
constexpr double TWO_PI = 2.0 * PI;
constexpr double HALF_PI = 0.5 * PI;

inline double toRadians(double degrees)
{
  return degrees * PI / 180.0;
}

inline double toDegrees(double radians)
{
  return radians * 180.0 / PI;
}

// z component of the 3D cross product (v, 0) x (w, 0)
inline double cross2d(const Eigen::Vector2d& v, const Eigen::Vector2d& w)
{
  return v.x() * w.y() - v.y() * w.x();
}

// Unsigned angle in [0, pi]. atan2 keeps precision near 0 and pi where acos does not.
inline double computeAngle(const Eigen::Vector2d& v, const Eigen::Vector2d& w)
{
  return std::atan2(std::abs(cross2d(v, w)), v.dot(w));
}

// Angle between two undirected lines in [0, pi/2]: parallel and anti-parallel both give 0.
inline double computeLineAngle(const Eigen::Vector2d& v, const Eigen::Vector2d& w)
{
  const double angle = computeAngle(v, w);
  return std::min(angle, PI - angle);
}

inline double computeDistance(const Eigen::Vector2d& v, const Eigen::Vector2d& w)
{
  return (v - w).norm();
}

inline bool equalsEpsilon(double a, double b, double epsilon)
{
  return std::abs(a - b) <= epsilon;
}

// > 0 when c lies to the left of a->b, < 0 to the right, 0 when collinear
inline double orientation(const Eigen::Vector2d& a, const Eigen::Vector2d& b, const Eigen::Vector2d& c)
{
  return cross2d(b - a, c - a);
}

// p is known to be collinear with [a, b]
inline bool onSegment(const Eigen::Vector2d& a, const Eigen::Vector2d& b, const Eigen::Vector2d& p)
{
  return p.x() >= std::min(a.x(), b.x()) && p.x() <= std::max(a.x(), b.x()) && p.y() >= std::min(a.y(), b.y()) &&
         p.y() <= std::max(a.y(), b.y());
}

/* @brief Closed segment intersection test
 *
 * Touching end points and collinear overlaps count as an intersection.
 */
inline bool segmentsIntersect(const Eigen::Vector2d& p1, const Eigen::Vector2d& p2, const Eigen::Vector2d& q1,
                              const Eigen::Vector2d& q2)
{
  const double d1 = orientation(q1, q2, p1);
  const double d2 = orientation(q1, q2, p2);
  const double d3 = orientation(p1, p2, q1);
  const double d4 = orientation(p1, p2, q2);

  if (((d1 > 0 && d2 < 0) || (d1 < 0 && d2 > 0)) && ((d3 > 0 && d4 < 0) || (d3 < 0 && d4 > 0)))
    return true;

  if (d1 == 0 && onSegment(q1, q2, p1))
    return true;
  if (d2 == 0 && onSegment(q1, q2, p2))
    return true;
  if (d3 == 0 && onSegment(p1, p2, q1))
    return true;
  if (d4 == 0 && onSegment(p1, p2, q2))
    return true;

  return false;
}

inline double distanceToSegment(const Eigen::Vector2d& p, const Eigen::Vector2d& a, const Eigen::Vector2d& b)
{
  const Eigen::Vector2d ab = b - a;
  const double squared_length = ab.squaredNorm();
  if (squared_length == 0.0)
    return (p - a).norm();

  const double t = std::clamp((p - a).dot(ab) / squared_length, 0.0, 1.0);
  return (p - (a + t * ab)).norm();
}

/* @brief Segments closer than tolerance without intersecting
 *
 * For two segments that do not cross, the closest pair of points always
 * involves an end point, so checking the four end points is enough.
 */
inline bool segmentsTouch(const Eigen::Vector2d& p1, const Eigen::Vector2d& p2, const Eigen::Vector2d& q1,
                          const Eigen::Vector2d& q2, double tolerance)
{
  return distanceToSegment(p1, q1, q2) <= tolerance || distanceToSegment(p2, q1, q2) <= tolerance ||
         distanceToSegment(q1, p1, p2) <= tolerance || distanceToSegment(q2, p1, p2) <= tolerance;
}

}  // namespace geometry
}  // namespace quadra

#endif  // QUADRA_GEOMETRY_UTILITIES_H_
