#include <quadra/graph/shape_hierarchy.h>

#include <boost/graph/breadth_first_search.hpp>
#include <boost/graph/reverse_graph.hpp>
#include <boost/graph/topological_sort.hpp>
#include <boost/range/iterator_range.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <set>
#include <sstream>

namespace quadra {
namespace graph {

using shape::PropertySet;
using shape::ShapeName;
using shape::ShapeProperty;

namespace {

struct AncestorRecorder : boost::default_bfs_visitor
{
  AncestorRecorder(ShapeHierarchy::V start, const ShapeHierarchy::G& g, std::vector<ShapeName>& found)
    : start(start), g(&g), found(&found)
  {
  }

  template <class Graph>
  void discover_vertex(ShapeHierarchy::V v, const Graph&)
  {
    if (v != start)
      found->push_back((*g)[v].definition.name);
  }

private:
  ShapeHierarchy::V start;
  const ShapeHierarchy::G* g;
  std::vector<ShapeName>* found;
};

std::string toString(const PropertySet& set)
{
  std::ostringstream ss;
  ss << set;
  return ss.str();
}

}  // namespace

ShapeHierarchy::ShapeHierarchy(std::vector<ShapeDefinition> definitions)
{
  if (definitions.empty())
    throw std::invalid_argument("ShapeHierarchy: no shape definitions");

  for (ShapeDefinition& def : definitions)
  {
    const std::string name = shape::shapeNameToString(def.name);

    if (shape::isSentinel(def.name))
      throw std::invalid_argument("ShapeHierarchy: '" + name + "' is not a hierarchy shape");
    if (vertex_map.count(def.name))
      throw std::invalid_argument("ShapeHierarchy: '" + name + "' declared twice");
    if (def.required.intersects(def.excluded))
      throw std::invalid_argument("ShapeHierarchy: '" + name + "' requires and excludes " +
                                  toString(def.required & def.excluded));

    std::set<ShapeName> unique_parents(def.parents.begin(), def.parents.end());
    if (unique_parents.size() != def.parents.size())
      throw std::invalid_argument("ShapeHierarchy: '" + name + "' lists a parent twice");

    V v = boost::add_vertex(Node{ std::move(def), {}, {}, {} }, g);
    vertex_map[g[v].definition.name] = v;
  }

  std::vector<V> roots;
  for (V v : boost::make_iterator_range(boost::vertices(g)))
  {
    if (g[v].definition.parents.empty())
      roots.push_back(v);
  }
  if (roots.size() != 1)
    throw std::invalid_argument("ShapeHierarchy: expected exactly one root, found " + std::to_string(roots.size()));
  root_vertex = roots.front();

  // vertices are walked in declaration order so children keep their priority
  for (V v : boost::make_iterator_range(boost::vertices(g)))
  {
    for (ShapeName parent : g[v].definition.parents)
    {
      auto it = vertex_map.find(parent);
      if (it == vertex_map.end())
        throw std::invalid_argument("ShapeHierarchy: parent '" + shape::shapeNameToString(parent) + "' of '" +
                                    shape::shapeNameToString(g[v].definition.name) + "' is not declared");
      boost::add_edge(it->second, v, g);
    }
  }

  std::vector<V> order;
  try
  {
    boost::topological_sort(g, std::back_inserter(order));
  }
  catch (const boost::not_a_dag&)
  {
    throw std::invalid_argument("ShapeHierarchy: shape definitions contain a cycle");
  }

  // topological_sort yields children before parents
  for (auto it = order.rbegin(); it != order.rend(); ++it)
  {
    Node& node = g[*it];
    node.effective_required = node.definition.required;
    node.effective_excluded = node.definition.excluded;

    for (auto e : boost::make_iterator_range(boost::in_edges(*it, g)))
    {
      const Node& parent = g[boost::source(e, g)];
      node.effective_required.insert(parent.effective_required);
      node.effective_excluded.insert(parent.effective_excluded);
    }

    const std::string name = shape::shapeNameToString(node.definition.name);
    for (auto e : boost::make_iterator_range(boost::in_edges(*it, g)))
    {
      const Node& parent = g[boost::source(e, g)];
      if (!node.effective_required.containsAll(parent.effective_required) ||
          node.effective_required == parent.effective_required)
        throw std::invalid_argument("ShapeHierarchy: '" + name + "' does not refine its parent '" +
                                    shape::shapeNameToString(parent.definition.name) + "'");
    }

    if (node.effective_required.intersects(node.effective_excluded))
      throw std::invalid_argument("ShapeHierarchy: '" + name + "' can never match, it requires and excludes " +
                                  toString(node.effective_required & node.effective_excluded));
  }

  // classification asks for ancestors on every call, walk the graph only once
  auto reversed = boost::make_reverse_graph(g);
  for (V v : boost::make_iterator_range(boost::vertices(g)))
  {
    std::vector<ShapeName> found;
    AncestorRecorder vis(v, g, found);
    boost::breadth_first_search(reversed, v, boost::visitor(vis));
    g[v].ancestors = std::move(found);
  }
}

ShapeHierarchy::V ShapeHierarchy::vertexOf(ShapeName name) const
{
  auto it = vertex_map.find(name);
  if (it == vertex_map.end())
    throw std::invalid_argument("ShapeHierarchy: unknown shape '" + shape::shapeNameToString(name) + "'");
  return it->second;
}

ShapeName ShapeHierarchy::root() const
{
  return g[root_vertex].definition.name;
}

bool ShapeHierarchy::contains(ShapeName name) const
{
  return vertex_map.count(name) > 0;
}

std::size_t ShapeHierarchy::size() const
{
  return boost::num_vertices(g);
}

std::vector<ShapeName> ShapeHierarchy::names() const
{
  std::vector<ShapeName> out;
  for (V v : boost::make_iterator_range(boost::vertices(g)))
    out.push_back(g[v].definition.name);
  return out;
}

const ShapeDefinition& ShapeHierarchy::definition(ShapeName name) const
{
  return g[vertexOf(name)].definition;
}

std::vector<ShapeName> ShapeHierarchy::parents(ShapeName name) const
{
  std::vector<ShapeName> out;
  for (auto e : boost::make_iterator_range(boost::in_edges(vertexOf(name), g)))
    out.push_back(g[boost::source(e, g)].definition.name);
  return out;
}

std::vector<ShapeName> ShapeHierarchy::children(ShapeName name) const
{
  std::vector<ShapeName> out;
  for (auto e : boost::make_iterator_range(boost::out_edges(vertexOf(name), g)))
    out.push_back(g[boost::target(e, g)].definition.name);
  return out;
}

const std::vector<ShapeName>& ShapeHierarchy::ancestors(ShapeName name) const
{
  return g[vertexOf(name)].ancestors;
}

bool ShapeHierarchy::isAncestor(ShapeName ancestor, ShapeName descendant) const
{
  if (!contains(ancestor))
    throw std::invalid_argument("ShapeHierarchy: unknown shape '" + shape::shapeNameToString(ancestor) + "'");
  const std::vector<ShapeName>& up = ancestors(descendant);
  return std::find(up.begin(), up.end(), ancestor) != up.end();
}

const PropertySet& ShapeHierarchy::effectiveRequirements(ShapeName name) const
{
  return g[vertexOf(name)].effective_required;
}

const PropertySet& ShapeHierarchy::effectiveExclusions(ShapeName name) const
{
  return g[vertexOf(name)].effective_excluded;
}

bool ShapeHierarchy::matches(ShapeName name, const PropertySet& facts) const
{
  const Node& node = g[vertexOf(name)];
  return facts.containsAll(node.effective_required) && !facts.intersects(node.effective_excluded);
}

void ShapeHierarchy::writeDOT(std::ostream& os) const
{
  os << "digraph D {\n"
     << "  rankdir=TB\n"
     << "  edge[style=\"bold\"]\n"
     << "  node[shape=\"box\"]\n";

  for (V v : boost::make_iterator_range(boost::vertices(g)))
  {
    const ShapeDefinition& def = g[v].definition;
    os << "  " << def.name << " [label=\"" << def.name;
    if (!def.required.empty())
      os << "\\n+" << def.required;
    if (!def.excluded.empty())
      os << "\\n-" << def.excluded;
    os << "\"]\n";
  }

  for (auto e : boost::make_iterator_range(boost::edges(g)))
  {
    V u = boost::source(e, g), v = boost::target(e, g);
    os << "  " << g[u].definition.name << " -> " << g[v].definition.name << "\n";
  }
  os << "}\n";
}

bool ShapeHierarchy::saveToDOTFile(const std::string& path) const
{
  std::ofstream dot_file(path);
  if (!dot_file)
  {
    std::cerr << "ERROR: cannot open DOT file for writing: " << path << std::endl;
    return false;
  }
  writeDOT(dot_file);
  return true;
}

// clang-format off
/*
  quadrilateral               {Simple, AngleSumFullTurn}
  |-- triangle                +HasFlatAngle
  |-- convex_quadrilateral    +Convex
  |   |-- trapezoid           +AnyParallelPair
  |   |   |-- parallelogram   +BothParallelPairs
  |   |   |   |-- rectangle   +AllAnglesRight
  |   |   |   |-- rhombus     +AllSidesEqual
  |   |   |   `-- square      (rectangle and rhombus)
  |   |   `-- isosceles_trapezoid  +IsoscelesTrapezoidSymmetry -BothParallelPairs
  |   `-- kite                +KiteSymmetry -AnyParallelPair
  `-- concave_quadrilateral   +Concave
      `-- dart                +KiteSymmetry
*/
// clang-format on
std::vector<ShapeDefinition> defaultShapeDefinitions()
{
  using N = ShapeName;
  using P = ShapeProperty;

  return {
    { N::Quadrilateral, { P::Simple, P::AngleSumFullTurn }, {}, {} },
    { N::Triangle, { P::HasFlatAngle }, {}, { N::Quadrilateral } },
    { N::ConvexQuadrilateral, { P::Convex }, {}, { N::Quadrilateral } },
    { N::ConcaveQuadrilateral, { P::Concave }, {}, { N::Quadrilateral } },
    { N::Trapezoid, { P::AnyParallelPair }, {}, { N::ConvexQuadrilateral } },
    { N::Kite, { P::KiteSymmetry }, { P::AnyParallelPair }, { N::ConvexQuadrilateral } },
    { N::Dart, { P::KiteSymmetry }, {}, { N::ConcaveQuadrilateral } },
    { N::Parallelogram, { P::BothParallelPairs }, {}, { N::Trapezoid } },
    { N::IsoscelesTrapezoid, { P::IsoscelesTrapezoidSymmetry }, { P::BothParallelPairs }, { N::Trapezoid } },
    { N::Rectangle, { P::AllAnglesRight }, {}, { N::Parallelogram } },
    { N::Rhombus, { P::AllSidesEqual }, {}, { N::Parallelogram } },
    { N::Square, {}, {}, { N::Rectangle, N::Rhombus } },
  };
}

const ShapeHierarchy& defaultShapeHierarchy()
{
  static const ShapeHierarchy hierarchy(defaultShapeDefinitions());
  return hierarchy;
}

}  // namespace graph
}  // namespace quadra
