#include <quadra/geometry/quadrilateral.h>
#include <quadra/geometry/utilities.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace quadra {
namespace geometry {

void validatePositions(const Positions& positions)
{
  for (VertexLabel v : VERTEX_LABELS)
  {
    const Eigen::Vector2d& p = positions[index(v)];
    if (!std::isfinite(p.x()) || !std::isfinite(p.y()))
      throw std::invalid_argument("Vertex " + vertexLabelToString(v) + " has a non-finite coordinate");
  }

  for (std::size_t i = 0; i < positions.size(); ++i)
  {
    for (std::size_t j = i + 1; j < positions.size(); ++j)
    {
      if (positions[i] == positions[j])
        throw std::invalid_argument("Vertices " + vertexLabelToString(VERTEX_LABELS[i]) + " and " +
                                    vertexLabelToString(VERTEX_LABELS[j]) + " share the same position");
    }
  }
}

double computeTurn(const Positions& positions, VertexLabel v)
{
  const Eigen::Vector2d& prev = positions[index(previousVertex(v))];
  const Eigen::Vector2d& cur = positions[index(v)];
  const Eigen::Vector2d& next = positions[index(nextVertex(v))];
  return cross2d(cur - prev, next - cur);
}

double computeSignedArea(const Positions& positions)
{
  double sum = 0.0;
  for (SideLabel s : SIDE_LABELS)
  {
    const auto ends = sideVertices(s);
    sum += cross2d(positions[index(ends[0])], positions[index(ends[1])]);
  }
  return 0.5 * sum;
}

std::array<double, 4> computeInteriorAngles(const Positions& positions)
{
  const double orientation_sign = computeSignedArea(positions) < 0.0 ? -1.0 : 1.0;

  std::array<double, 4> angles{};
  for (VertexLabel v : VERTEX_LABELS)
  {
    const Eigen::Vector2d& cur = positions[index(v)];
    const Eigen::Vector2d to_prev = positions[index(previousVertex(v))] - cur;
    const Eigen::Vector2d to_next = positions[index(nextVertex(v))] - cur;

    const double angle = computeAngle(to_prev, to_next);
    const double turn = computeTurn(positions, v) * orientation_sign;

    angles[index(v)] = turn < 0.0 ? TWO_PI - angle : angle;
  }
  return angles;
}

bool hasCrossedSides(const Positions& positions)
{
  const auto& a = positions[index(VertexLabel::A)];
  const auto& b = positions[index(VertexLabel::B)];
  const auto& c = positions[index(VertexLabel::C)];
  const auto& d = positions[index(VertexLabel::D)];

  return segmentsIntersect(a, b, c, d) || segmentsIntersect(b, c, d, a);
}

bool hasTouchingSides(const Positions& positions, double tolerance)
{
  const auto& a = positions[index(VertexLabel::A)];
  const auto& b = positions[index(VertexLabel::B)];
  const auto& c = positions[index(VertexLabel::C)];
  const auto& d = positions[index(VertexLabel::D)];

  return segmentsTouch(a, b, c, d, tolerance) || segmentsTouch(b, c, d, a, tolerance);
}

QuadrilateralGeometry computeGeometry(const Positions& positions, const TolerancePolicy& policy)
{
  validatePositions(positions);

  QuadrilateralGeometry geometry;

  const std::array<double, 4> angles = computeInteriorAngles(positions);
  for (VertexLabel v : VERTEX_LABELS)
  {
    Vertex& vertex = geometry.vertices[index(v)];
    vertex.label = v;
    vertex.position = positions[index(v)];
    vertex.angle = angles[index(v)];
    geometry.angle_sum += vertex.angle;
  }

  double longest_side = 0.0;
  for (SideLabel s : SIDE_LABELS)
  {
    const auto ends = sideVertices(s);

    Side& side = geometry.sides[index(s)];
    side.label = s;
    side.opposite = oppositeSide(s);
    side.direction = positions[index(ends[1])] - positions[index(ends[0])];
    side.length = side.direction.norm();

    geometry.perimeter += side.length;
    longest_side = std::max(longest_side, side.length);
  }

  geometry.signed_area = computeSignedArea(positions);
  geometry.area = std::abs(geometry.signed_area);

  const bool collapsed =
      std::any_of(geometry.sides.begin(), geometry.sides.end(), [&](const Side& s) { return s.length <= policy.length; });

  // An intersection wins over everything else, touching within tolerance is
  // only checked once no side or area is below the tolerance
  if (hasCrossedSides(positions))
    geometry.degeneracy = Degeneracy::Crossed;
  else if (collapsed)
    geometry.degeneracy = Degeneracy::CollapsedSide;
  else if (geometry.area <= 0.5 * policy.length * longest_side)
    geometry.degeneracy = Degeneracy::ZeroArea;
  else if (hasTouchingSides(positions, policy.length))
    geometry.degeneracy = Degeneracy::Crossed;

  return geometry;
}

std::string degeneracyToString(Degeneracy d)
{
  switch (d)
  {
    case Degeneracy::None:
      return "None";
    case Degeneracy::CollapsedSide:
      return "CollapsedSide";
    case Degeneracy::Crossed:
      return "Crossed";
    case Degeneracy::ZeroArea:
      return "ZeroArea";
  }
  return "Unknown";
}

std::ostream& operator<<(std::ostream& os, Degeneracy d)
{
  return os << degeneracyToString(d);
}

std::ostream& operator<<(std::ostream& os, const QuadrilateralGeometry& geometry)
{
  os << "QuadrilateralGeometry:\n";
  for (const Vertex& v : geometry.vertices)
  {
    os << "  " << v.label << " [" << v.position.x() << ", " << v.position.y() << "] angle=" << toDegrees(v.angle)
       << "deg\n";
  }
  for (const Side& s : geometry.sides)
    os << "  " << s.label << " length=" << s.length << "\n";

  os << "  area=" << geometry.area << " perimeter=" << geometry.perimeter
     << " angle_sum=" << toDegrees(geometry.angle_sum) << "deg degeneracy=" << geometry.degeneracy;
  return os;
}

}  // namespace geometry
}  // namespace quadra
