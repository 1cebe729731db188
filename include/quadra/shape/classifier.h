#ifndef QUADRA_SHAPE_CLASSIFIER_H_
#define QUADRA_SHAPE_CLASSIFIER_H_

#include <iostream>

#include <quadra/geometry/quadrilateral.h>
#include <quadra/graph/shape_hierarchy.h>
#include <quadra/shape/detectors.h>
#include <quadra/shape/shape_name.h>
#include <quadra/tolerance.h>

namespace quadra {
namespace shape {

struct ClassificationResult
{
  ShapeName name = ShapeName::Degenerate;
  ShapeProperties properties;
  geometry::QuadrilateralGeometry geometry;
};

/**
 * @brief Most specific hierarchy shape matching a fixed set of facts
 *
 * Facts holding Crossed or Degenerate resolve to the sentinel of the same name. A
 * root that does not match resolves to Degenerate. Throws graph::HierarchyDefect
 * when a matching definition is neither the result nor one of its ancestors.
 */
ShapeName resolveShapeName(const PropertySet& facts, const graph::ShapeHierarchy& hierarchy);

/**
 * @brief Classify four positions, given in A, B, C, D winding order
 *
 * Pure function of its arguments. Throws std::invalid_argument for non-finite or
 * coincident positions.
 */
ClassificationResult classify(const geometry::Positions& positions, const TolerancePolicy& policy);
ClassificationResult classify(const geometry::Positions& positions, const TolerancePolicy& policy,
                              const graph::ShapeHierarchy& hierarchy);

ShapeName classifyShapeName(const geometry::Positions& positions, const TolerancePolicy& policy);

std::ostream& operator<<(std::ostream& os, const ClassificationResult& result);

}  // namespace shape
}  // namespace quadra

#endif  // QUADRA_SHAPE_CLASSIFIER_H_
