#ifndef QUADRA_SHAPE_DETECTORS_H_
#define QUADRA_SHAPE_DETECTORS_H_

#include <iostream>
#include <vector>

#include <quadra/geometry/quadrilateral.h>
#include <quadra/shape/property.h>
#include <quadra/tolerance.h>

namespace quadra {
namespace shape {

/**
 * @brief Outcome of one tolerance-aware comparison
 *
 * holds == (deviation <= epsilon). The deviation is reported for diagnostics only
 * and never feeds back into the classification.
 */
struct Detection
{
  bool holds = false;
  double deviation = 0.0;
  double epsilon = 0.0;
};

struct PropertyDetection
{
  ShapeProperty property;
  Detection detection;
};

enum class Convexity
{
  Convex,   // every interior angle below 180deg, one turning direction
  Concave,  // exactly one reflex angle
  Flat,     // at least one angle within tolerance of 180deg
  Other,    // crossed or degenerate
};

/// Opposite sides, parallel or anti-parallel
Detection detectParallel(const geometry::QuadrilateralGeometry& geometry, geometry::SideLabel side,
                         geometry::SideLabel other, const TolerancePolicy& policy);

Detection detectEqualLength(const geometry::QuadrilateralGeometry& geometry, geometry::SideLabel side,
                            geometry::SideLabel other, const TolerancePolicy& policy);

Detection detectEqualAngle(const geometry::QuadrilateralGeometry& geometry, geometry::VertexLabel vertex,
                           geometry::VertexLabel other, const TolerancePolicy& policy);

Detection detectRightAngle(const geometry::QuadrilateralGeometry& geometry, geometry::VertexLabel vertex,
                           const TolerancePolicy& policy);

Detection detectFlatAngle(const geometry::QuadrilateralGeometry& geometry, geometry::VertexLabel vertex,
                          const TolerancePolicy& policy);

Convexity detectConvexity(const geometry::QuadrilateralGeometry& geometry, const TolerancePolicy& policy);

/**
 * @brief Every fact about one configuration, with the detection behind each
 */
struct ShapeProperties
{
  PropertySet facts;
  std::vector<PropertyDetection> detections;

  bool has(ShapeProperty p) const
  {
    return facts.contains(p);
  }

  // nullptr for aggregates and for skipped detectors
  const PropertyDetection* find(ShapeProperty p) const;

  std::vector<geometry::SidePair> parallelSidePairs() const;
  std::vector<geometry::SidePair> equalOppositeSidePairs() const;
  std::vector<geometry::SidePair> equalAdjacentSidePairs() const;
  std::vector<geometry::VertexPair> equalOppositeVertexPairs() const;
  std::vector<geometry::VertexPair> equalAdjacentVertexPairs() const;
  std::vector<geometry::VertexLabel> rightAngleVertices() const;
  std::vector<geometry::VertexLabel> flatAngleVertices() const;
};

/**
 * @brief Run every detector once and derive the aggregate facts
 *
 * Crossed and degenerate geometries short-circuit: the returned facts hold only
 * Crossed or Degenerate and no detection is recorded.
 */
ShapeProperties evaluateProperties(const geometry::QuadrilateralGeometry& geometry, const TolerancePolicy& policy);

std::ostream& operator<<(std::ostream& os, Convexity c);
std::ostream& operator<<(std::ostream& os, const ShapeProperties& properties);

}  // namespace shape
}  // namespace quadra

#endif  // QUADRA_SHAPE_DETECTORS_H_
