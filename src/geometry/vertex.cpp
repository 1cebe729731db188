#include <quadra/geometry/vertex.h>

#include <stdexcept>

namespace quadra {
namespace geometry {

VertexLabel oppositeVertex(VertexLabel v)
{
  return VERTEX_LABELS[(index(v) + 2) % 4];
}

VertexLabel previousVertex(VertexLabel v)
{
  return VERTEX_LABELS[(index(v) + 3) % 4];
}

VertexLabel nextVertex(VertexLabel v)
{
  return VERTEX_LABELS[(index(v) + 1) % 4];
}

std::array<VertexLabel, 2> adjacentVertices(VertexLabel v)
{
  return { previousVertex(v), nextVertex(v) };
}

SideLabel oppositeSide(SideLabel s)
{
  return SIDE_LABELS[(index(s) + 2) % 4];
}

std::array<SideLabel, 2> adjacentSides(SideLabel s)
{
  return { SIDE_LABELS[(index(s) + 3) % 4], SIDE_LABELS[(index(s) + 1) % 4] };
}

std::array<VertexLabel, 2> sideVertices(SideLabel s)
{
  // side i starts at vertex i
  return { VERTEX_LABELS[index(s)], VERTEX_LABELS[(index(s) + 1) % 4] };
}

std::array<SideLabel, 2> sidesAtVertex(VertexLabel v)
{
  return { SIDE_LABELS[(index(v) + 3) % 4], SIDE_LABELS[index(v)] };
}

bool areAdjacent(VertexLabel a, VertexLabel b)
{
  return a != b && oppositeVertex(a) != b;
}

bool areAdjacent(SideLabel a, SideLabel b)
{
  return a != b && oppositeSide(a) != b;
}

std::string vertexLabelToString(VertexLabel v)
{
  switch (v)
  {
    case VertexLabel::A:
      return "A";
    case VertexLabel::B:
      return "B";
    case VertexLabel::C:
      return "C";
    case VertexLabel::D:
      return "D";
  }
  throw std::invalid_argument("Unknown VertexLabel: " + std::to_string(static_cast<int>(v)));
}

std::string sideLabelToString(SideLabel s)
{
  switch (s)
  {
    case SideLabel::AB:
      return "AB";
    case SideLabel::BC:
      return "BC";
    case SideLabel::CD:
      return "CD";
    case SideLabel::DA:
      return "DA";
  }
  throw std::invalid_argument("Unknown SideLabel: " + std::to_string(static_cast<int>(s)));
}

std::ostream& operator<<(std::ostream& os, VertexLabel v)
{
  return os << vertexLabelToString(v);
}

std::ostream& operator<<(std::ostream& os, SideLabel s)
{
  return os << sideLabelToString(s);
}

}  // namespace geometry
}  // namespace quadra
