#ifndef QUADRA_GEOMETRY_VERTEX_H_
#define QUADRA_GEOMETRY_VERTEX_H_

#include <array>
#include <iostream>
#include <string>
#include <utility>

#include <Eigen/Core>

namespace quadra {
namespace geometry {

// Fixed winding order A -> B -> C -> D
enum class VertexLabel
{
  A = 0,
  B,
  C,
  D,
};

// Side XY connects vertex X to vertex Y
enum class SideLabel
{
  AB = 0,
  BC,
  CD,
  DA,
};

using Positions = std::array<Eigen::Vector2d, 4>;

using VertexPair = std::pair<VertexLabel, VertexLabel>;
using SidePair = std::pair<SideLabel, SideLabel>;

constexpr std::array<VertexLabel, 4> VERTEX_LABELS = { VertexLabel::A, VertexLabel::B, VertexLabel::C,
                                                       VertexLabel::D };
constexpr std::array<SideLabel, 4> SIDE_LABELS = { SideLabel::AB, SideLabel::BC, SideLabel::CD, SideLabel::DA };

inline std::size_t index(VertexLabel v)
{
  return static_cast<std::size_t>(v);
}

inline std::size_t index(SideLabel s)
{
  return static_cast<std::size_t>(s);
}

// clang-format off
/*
        D ------ CD ------ C
        |                  |
        DA                 BC
        |                  |
        A ------ AB ------ B

| Vertex | Opposite | Previous | Next |     | Side | Opposite | Start | End |
|--------|----------|----------|------|     |------|----------|-------|-----|
| A      | C        | D        | B    |     | AB   | CD       | A     | B   |
| B      | D        | A        | C    |     | BC   | DA       | B     | C   |
| C      | A        | B        | D    |     | CD   | AB       | C     | D   |
| D      | B        | C        | A    |     | DA   | BC       | D     | A   |
*/
// clang-format on

VertexLabel oppositeVertex(VertexLabel v);
VertexLabel previousVertex(VertexLabel v);
VertexLabel nextVertex(VertexLabel v);

// {previous, next}
std::array<VertexLabel, 2> adjacentVertices(VertexLabel v);

SideLabel oppositeSide(SideLabel s);

// {previous, next} in winding order
std::array<SideLabel, 2> adjacentSides(SideLabel s);

// {start, end}
std::array<VertexLabel, 2> sideVertices(SideLabel s);

// {incoming, outgoing}
std::array<SideLabel, 2> sidesAtVertex(VertexLabel v);

bool areAdjacent(VertexLabel a, VertexLabel b);
bool areAdjacent(SideLabel a, SideLabel b);

std::string vertexLabelToString(VertexLabel v);
std::string sideLabelToString(SideLabel s);

std::ostream& operator<<(std::ostream& os, VertexLabel v);
std::ostream& operator<<(std::ostream& os, SideLabel s);

}  // namespace geometry
}  // namespace quadra

#endif  // QUADRA_GEOMETRY_VERTEX_H_
