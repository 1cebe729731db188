#include <quadra/shape/detectors.h>
#include <quadra/geometry/utilities.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace quadra {
namespace shape {

using geometry::QuadrilateralGeometry;
using geometry::SideLabel;
using geometry::VertexLabel;

namespace {

Detection compare(double deviation, double epsilon)
{
  Detection d;
  d.deviation = deviation;
  d.epsilon = epsilon;
  d.holds = deviation <= epsilon;
  return d;
}

}  // namespace

Detection detectParallel(const QuadrilateralGeometry& geometry, SideLabel side, SideLabel other,
                         const TolerancePolicy& policy)
{
  if (side == other)
    throw std::invalid_argument("detectParallel: side " + geometry::sideLabelToString(side) +
                                " compared with itself");

  const double deviation = geometry::computeLineAngle(geometry.side(side).direction, geometry.side(other).direction);
  return compare(deviation, policy.parallel);
}

Detection detectEqualLength(const QuadrilateralGeometry& geometry, SideLabel side, SideLabel other,
                            const TolerancePolicy& policy)
{
  return compare(std::abs(geometry.side(side).length - geometry.side(other).length), policy.length);
}

Detection detectEqualAngle(const QuadrilateralGeometry& geometry, VertexLabel vertex, VertexLabel other,
                           const TolerancePolicy& policy)
{
  return compare(std::abs(geometry.vertex(vertex).angle - geometry.vertex(other).angle), policy.inter_angle);
}

Detection detectRightAngle(const QuadrilateralGeometry& geometry, VertexLabel vertex, const TolerancePolicy& policy)
{
  return compare(std::abs(geometry.vertex(vertex).angle - geometry::HALF_PI), policy.right_angle);
}

Detection detectFlatAngle(const QuadrilateralGeometry& geometry, VertexLabel vertex, const TolerancePolicy& policy)
{
  return compare(std::abs(geometry.vertex(vertex).angle - geometry::PI), policy.flat_angle);
}

Convexity detectConvexity(const QuadrilateralGeometry& geometry, const TolerancePolicy& policy)
{
  if (geometry.isDegenerate())
    return Convexity::Other;

  geometry::Positions positions;
  for (const geometry::Vertex& v : geometry.vertices)
    positions[geometry::index(v.label)] = v.position;

  int reflex = 0;
  int left_turns = 0;
  int right_turns = 0;
  for (VertexLabel v : geometry::VERTEX_LABELS)
  {
    // flat wins over both convex and reflex so the three outcomes never overlap
    if (detectFlatAngle(geometry, v, policy).holds)
      return Convexity::Flat;

    if (geometry.vertex(v).angle > geometry::PI)
      ++reflex;

    const double turn = geometry::computeTurn(positions, v);
    if (turn > 0.0)
      ++left_turns;
    else if (turn < 0.0)
      ++right_turns;
  }

  if (reflex == 0 && (left_turns == 4 || right_turns == 4))
    return Convexity::Convex;
  if (reflex == 1)
    return Convexity::Concave;
  return Convexity::Other;
}

const PropertyDetection* ShapeProperties::find(ShapeProperty p) const
{
  auto it = std::find_if(detections.begin(), detections.end(),
                         [p](const PropertyDetection& d) { return d.property == p; });
  return it == detections.end() ? nullptr : &(*it);
}

std::vector<geometry::SidePair> ShapeProperties::parallelSidePairs() const
{
  std::vector<geometry::SidePair> pairs;
  if (has(ShapeProperty::ParallelABCD))
    pairs.emplace_back(SideLabel::AB, SideLabel::CD);
  if (has(ShapeProperty::ParallelBCDA))
    pairs.emplace_back(SideLabel::BC, SideLabel::DA);
  return pairs;
}

std::vector<geometry::SidePair> ShapeProperties::equalOppositeSidePairs() const
{
  std::vector<geometry::SidePair> pairs;
  if (has(ShapeProperty::EqualLengthABCD))
    pairs.emplace_back(SideLabel::AB, SideLabel::CD);
  if (has(ShapeProperty::EqualLengthBCDA))
    pairs.emplace_back(SideLabel::BC, SideLabel::DA);
  return pairs;
}

std::vector<geometry::SidePair> ShapeProperties::equalAdjacentSidePairs() const
{
  std::vector<geometry::SidePair> pairs;
  for (SideLabel s : geometry::SIDE_LABELS)
  {
    const SideLabel next = geometry::adjacentSides(s)[1];
    if (has(equalLengthProperty(s, next)))
      pairs.emplace_back(s, next);
  }
  return pairs;
}

std::vector<geometry::VertexPair> ShapeProperties::equalOppositeVertexPairs() const
{
  std::vector<geometry::VertexPair> pairs;
  if (has(ShapeProperty::EqualAngleAC))
    pairs.emplace_back(VertexLabel::A, VertexLabel::C);
  if (has(ShapeProperty::EqualAngleBD))
    pairs.emplace_back(VertexLabel::B, VertexLabel::D);
  return pairs;
}

std::vector<geometry::VertexPair> ShapeProperties::equalAdjacentVertexPairs() const
{
  std::vector<geometry::VertexPair> pairs;
  for (VertexLabel v : geometry::VERTEX_LABELS)
  {
    const VertexLabel next = geometry::nextVertex(v);
    if (has(equalAngleProperty(v, next)))
      pairs.emplace_back(v, next);
  }
  return pairs;
}

std::vector<VertexLabel> ShapeProperties::rightAngleVertices() const
{
  std::vector<VertexLabel> out;
  for (VertexLabel v : geometry::VERTEX_LABELS)
  {
    if (has(rightAngleProperty(v)))
      out.push_back(v);
  }
  return out;
}

std::vector<VertexLabel> ShapeProperties::flatAngleVertices() const
{
  std::vector<VertexLabel> out;
  for (VertexLabel v : geometry::VERTEX_LABELS)
  {
    if (has(flatAngleProperty(v)))
      out.push_back(v);
  }
  return out;
}

ShapeProperties evaluateProperties(const QuadrilateralGeometry& geometry, const TolerancePolicy& policy)
{
  ShapeProperties out;

  if (geometry.degeneracy == geometry::Degeneracy::Crossed)
  {
    out.facts.insert(ShapeProperty::Crossed);
    return out;
  }
  if (geometry.isDegenerate())
  {
    out.facts.insert(ShapeProperty::Degenerate);
    return out;
  }

  out.facts.insert(ShapeProperty::Simple);

  auto record = [&out](ShapeProperty p, const Detection& d) {
    out.detections.push_back(PropertyDetection{ p, d });
    out.facts.set(p, d.holds);
  };

  // opposite sides
  for (SideLabel s : { SideLabel::AB, SideLabel::BC })
  {
    const SideLabel o = geometry::oppositeSide(s);
    record(parallelProperty(s), detectParallel(geometry, s, o, policy));
    record(equalLengthProperty(s, o), detectEqualLength(geometry, s, o, policy));
  }

  // adjacent sides
  for (SideLabel s : geometry::SIDE_LABELS)
  {
    const SideLabel next = geometry::adjacentSides(s)[1];
    record(equalLengthProperty(s, next), detectEqualLength(geometry, s, next, policy));
  }

  // adjacent vertices
  for (VertexLabel v : geometry::VERTEX_LABELS)
  {
    const VertexLabel next = geometry::nextVertex(v);
    record(equalAngleProperty(v, next), detectEqualAngle(geometry, v, next, policy));
  }

  // opposite vertices
  for (VertexLabel v : { VertexLabel::A, VertexLabel::B })
    record(equalAngleProperty(v, geometry::oppositeVertex(v)),
           detectEqualAngle(geometry, v, geometry::oppositeVertex(v), policy));

  for (VertexLabel v : geometry::VERTEX_LABELS)
  {
    record(rightAngleProperty(v), detectRightAngle(geometry, v, policy));
    record(flatAngleProperty(v), detectFlatAngle(geometry, v, policy));
  }

  record(ShapeProperty::AngleSumFullTurn,
         compare(std::abs(geometry.angle_sum - geometry::TWO_PI), policy.inter_angle));

  // aggregates
  PropertySet& f = out.facts;
  using P = ShapeProperty;

  const Convexity convexity = detectConvexity(geometry, policy);
  f.set(P::Convex, convexity == Convexity::Convex);
  f.set(P::Concave, convexity == Convexity::Concave);
  f.set(P::HasFlatAngle, f.contains(P::FlatAngleA) || f.contains(P::FlatAngleB) || f.contains(P::FlatAngleC) ||
                             f.contains(P::FlatAngleD));

  f.set(P::AnyParallelPair, f.contains(P::ParallelABCD) || f.contains(P::ParallelBCDA));
  f.set(P::BothParallelPairs, f.contains(P::ParallelABCD) && f.contains(P::ParallelBCDA));

  f.set(P::AllSidesEqual, f.containsAll({ P::EqualLengthABBC, P::EqualLengthBCCD, P::EqualLengthCDDA }));
  f.set(P::AllAnglesRight, f.containsAll({ P::RightAngleA, P::RightAngleB, P::RightAngleC, P::RightAngleD }));

  f.set(P::KiteSymmetry, f.containsAll({ P::EqualLengthABBC, P::EqualLengthCDDA }) ||
                             f.containsAll({ P::EqualLengthBCCD, P::EqualLengthDAAB }));

  // legs equal and one pair of base angles equal, for either pair of bases
  const bool iso_ab_cd = f.containsAll({ P::ParallelABCD, P::EqualLengthBCDA }) &&
                         (f.contains(P::EqualAngleAB) || f.contains(P::EqualAngleCD));
  const bool iso_bc_da = f.containsAll({ P::ParallelBCDA, P::EqualLengthABCD }) &&
                         (f.contains(P::EqualAngleBC) || f.contains(P::EqualAngleDA));
  f.set(P::IsoscelesTrapezoidSymmetry, iso_ab_cd || iso_bc_da);

  return out;
}

std::ostream& operator<<(std::ostream& os, Convexity c)
{
  switch (c)
  {
    case Convexity::Convex:
      return os << "Convex";
    case Convexity::Concave:
      return os << "Concave";
    case Convexity::Flat:
      return os << "Flat";
    case Convexity::Other:
      return os << "Other";
  }
  return os << "Unknown";
}

std::ostream& operator<<(std::ostream& os, const ShapeProperties& properties)
{
  os << "facts: " << properties.facts << "\n";
  for (const PropertyDetection& d : properties.detections)
  {
    os << "  " << d.property << (d.detection.holds ? " holds" : " fails") << " deviation=" << d.detection.deviation
       << " epsilon=" << d.detection.epsilon << "\n";
  }
  return os;
}

}  // namespace shape
}  // namespace quadra
