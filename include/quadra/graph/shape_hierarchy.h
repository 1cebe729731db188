#ifndef QUADRA_GRAPH_SHAPE_HIERARCHY_H_
#define QUADRA_GRAPH_SHAPE_HIERARCHY_H_

#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/graph/adjacency_list.hpp>

#include <quadra/shape/property.h>
#include <quadra/shape/shape_name.h>

namespace quadra {
namespace graph {

/**
 * @brief One named shape family
 *
 * required lists only the facts added on top of the parents. excluded facts must be
 * absent for the shape to match, and are inherited by every descendant.
 */
struct ShapeDefinition
{
  shape::ShapeName name = shape::ShapeName::Quadrilateral;
  shape::PropertySet required;
  shape::PropertySet excluded;
  std::vector<shape::ShapeName> parents;
};

/// Two unrelated shape definitions matched the same facts.
class HierarchyDefect : public std::logic_error
{
public:
  explicit HierarchyDefect(const std::string& what) : std::logic_error(what)
  {
  }
};

/**
 * @brief Immutable DAG of shape definitions, edges from parent to child
 *
 * Children are kept in declaration order, which is the sibling priority used when
 * descending. Construction throws std::invalid_argument when:
 *   - a name is declared twice or is a sentinel (crossed, degenerate)
 *   - there is not exactly one root
 *   - a parent is not declared
 *   - the graph has a cycle
 *   - a child does not require strictly more than one of its parents
 *   - a definition requires and excludes the same fact
 */
class ShapeHierarchy
{
public:
  struct Node
  {
    ShapeDefinition definition;
    shape::PropertySet effective_required;
    shape::PropertySet effective_excluded;
    std::vector<shape::ShapeName> ancestors;  // breadth-first, nearest first
  };

  using G = boost::adjacency_list<boost::vecS, boost::vecS, boost::bidirectionalS, Node>;
  using V = G::vertex_descriptor;

  explicit ShapeHierarchy(std::vector<ShapeDefinition> definitions);

  shape::ShapeName root() const;
  bool contains(shape::ShapeName name) const;
  std::size_t size() const;

  // Declaration order
  std::vector<shape::ShapeName> names() const;

  const ShapeDefinition& definition(shape::ShapeName name) const;
  std::vector<shape::ShapeName> parents(shape::ShapeName name) const;

  // Priority order
  std::vector<shape::ShapeName> children(shape::ShapeName name) const;

  // Breadth-first, nearest first, without duplicates. Computed at construction.
  const std::vector<shape::ShapeName>& ancestors(shape::ShapeName name) const;
  bool isAncestor(shape::ShapeName ancestor, shape::ShapeName descendant) const;

  const shape::PropertySet& effectiveRequirements(shape::ShapeName name) const;
  const shape::PropertySet& effectiveExclusions(shape::ShapeName name) const;

  // Effective requirements all hold and no effective exclusion does
  bool matches(shape::ShapeName name, const shape::PropertySet& facts) const;

  void writeDOT(std::ostream& os) const;
  bool saveToDOTFile(const std::string& path) const;

private:
  V vertexOf(shape::ShapeName name) const;

  G g;
  V root_vertex;
  std::map<shape::ShapeName, V> vertex_map;
};

/// Definitions of the quadrilateral family, see shape_hierarchy.cpp for the tree
std::vector<ShapeDefinition> defaultShapeDefinitions();

/// Shared instance built once from defaultShapeDefinitions()
const ShapeHierarchy& defaultShapeHierarchy();

}  // namespace graph
}  // namespace quadra

#endif  // QUADRA_GRAPH_SHAPE_HIERARCHY_H_
