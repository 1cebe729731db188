#ifndef QUADRA_GEOMETRY_QUADRILATERAL_H_
#define QUADRA_GEOMETRY_QUADRILATERAL_H_

#include <array>
#include <iostream>
#include <string>

#include <Eigen/Core>

#include <quadra/geometry/vertex.h>
#include <quadra/tolerance.h>

namespace quadra {
namespace geometry {

enum class Degeneracy
{
  None,
  CollapsedSide,  // a side no longer than the length tolerance
  Crossed,        // two non-adjacent sides intersect or touch within the length tolerance
  ZeroArea,       // enclosed area thinner than the length tolerance
};

struct Vertex
{
  VertexLabel label = VertexLabel::A;
  Eigen::Vector2d position = Eigen::Vector2d::Zero();
  double angle = 0.0;  // interior angle in [0, 2pi)
};

struct Side
{
  SideLabel label = SideLabel::AB;
  Eigen::Vector2d direction = Eigen::Vector2d::Zero();  // end - start
  double length = 0.0;
  SideLabel opposite = SideLabel::CD;
};

/**
 * @brief Geometry snapshot of four positions, consumed once by the detectors
 */
struct QuadrilateralGeometry
{
  std::array<Vertex, 4> vertices;
  std::array<Side, 4> sides;

  double signed_area = 0.0;  // > 0 for counter-clockwise winding
  double area = 0.0;
  double perimeter = 0.0;
  double angle_sum = 0.0;

  Degeneracy degeneracy = Degeneracy::None;

  const Vertex& vertex(VertexLabel v) const
  {
    return vertices[index(v)];
  }

  const Side& side(SideLabel s) const
  {
    return sides[index(s)];
  }

  bool isDegenerate() const
  {
    return degeneracy != Degeneracy::None;
  }
};

/**
 * @brief Rejects positions no classification can be defined for
 *
 * Throws std::invalid_argument when a coordinate is not finite or when two
 * positions are identical (fewer than four distinct vertices).
 */
void validatePositions(const Positions& positions);

/**
 * @brief Turn direction at a vertex, (v - prev) x (next - v)
 *
 * Positive for a left (counter-clockwise) turn.
 */
double computeTurn(const Positions& positions, VertexLabel v);

// Shoelace formula
double computeSignedArea(const Positions& positions);

/**
 * @brief Interior angle at each vertex
 *
 * The unsigned angle between the two edges leaving a vertex is reflected to
 * 2pi - angle when the turn at that vertex opposes the polygon orientation. A zero
 * signed area is treated as counter-clockwise.
 */
std::array<double, 4> computeInteriorAngles(const Positions& positions);

// AB x CD or BC x DA
bool hasCrossedSides(const Positions& positions);

// AB and CD, or BC and DA, closer than tolerance
bool hasTouchingSides(const Positions& positions, double tolerance);

/**
 * @brief Derive lengths, angles, area and degeneracy from four positions
 *
 * Only policy.length is used. Degeneracy is checked in order: sides that
 * intersect, a collapsed side, zero area, then sides within policy.length of
 * each other, which also count as crossed.
 */
QuadrilateralGeometry computeGeometry(const Positions& positions, const TolerancePolicy& policy);

std::string degeneracyToString(Degeneracy d);

std::ostream& operator<<(std::ostream& os, Degeneracy d);
std::ostream& operator<<(std::ostream& os, const QuadrilateralGeometry& geometry);

}  // namespace geometry
}  // namespace quadra

#endif  // QUADRA_GEOMETRY_QUADRILATERAL_H_
