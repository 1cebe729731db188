#include <quadra/shape/classifier.h>

#include <sstream>

namespace quadra {
namespace shape {

namespace {

ShapeName descend(const PropertySet& facts, const graph::ShapeHierarchy& hierarchy)
{
  ShapeName current = hierarchy.root();

  bool descended = true;
  while (descended)
  {
    descended = false;
    for (ShapeName child : hierarchy.children(current))
    {
      if (hierarchy.matches(child, facts))
      {
        current = child;
        descended = true;
        break;
      }
    }
  }
  return current;
}

void checkConsistency(const PropertySet& facts, const graph::ShapeHierarchy& hierarchy, ShapeName result)
{
  for (ShapeName name : hierarchy.names())
  {
    if (name == result || !hierarchy.matches(name, facts))
      continue;
    if (!hierarchy.isAncestor(name, result))
    {
      std::ostringstream ss;
      ss << "Shape definitions '" << result << "' and '" << name << "' both match facts " << facts;
      throw graph::HierarchyDefect(ss.str());
    }
  }
}

}  // namespace

ShapeName resolveShapeName(const PropertySet& facts, const graph::ShapeHierarchy& hierarchy)
{
  if (facts.contains(ShapeProperty::Crossed))
    return ShapeName::Crossed;
  if (facts.contains(ShapeProperty::Degenerate))
    return ShapeName::Degenerate;

  if (!hierarchy.matches(hierarchy.root(), facts))
    return ShapeName::Degenerate;

  const ShapeName result = descend(facts, hierarchy);
  checkConsistency(facts, hierarchy, result);
  return result;
}

ClassificationResult classify(const geometry::Positions& positions, const TolerancePolicy& policy,
                              const graph::ShapeHierarchy& hierarchy)
{
  ClassificationResult result;
  result.geometry = geometry::computeGeometry(positions, policy);
  result.properties = evaluateProperties(result.geometry, policy);
  result.name = resolveShapeName(result.properties.facts, hierarchy);
  return result;
}

ClassificationResult classify(const geometry::Positions& positions, const TolerancePolicy& policy)
{
  return classify(positions, policy, graph::defaultShapeHierarchy());
}

ShapeName classifyShapeName(const geometry::Positions& positions, const TolerancePolicy& policy)
{
  return classify(positions, policy).name;
}

std::ostream& operator<<(std::ostream& os, const ClassificationResult& result)
{
  os << "shape: " << result.name << "\n";
  os << result.geometry << "\n";
  os << result.properties;
  return os;
}

}  // namespace shape
}  // namespace quadra
