#ifndef QUADRA_SHAPE_SHAPE_NAME_H_
#define QUADRA_SHAPE_SHAPE_NAME_H_

#include <array>
#include <iostream>
#include <string>

namespace quadra {
namespace shape {

enum class ShapeName
{
  // hierarchy
  Quadrilateral,  // general simple quadrilateral, root of the hierarchy
  ConvexQuadrilateral,
  ConcaveQuadrilateral,
  Triangle,  // one flat vertex
  Trapezoid,
  IsoscelesTrapezoid,
  Parallelogram,
  Rectangle,
  Rhombus,
  Square,
  Kite,
  Dart,

  // sentinels, never part of the hierarchy
  Crossed,
  Degenerate,
};

constexpr std::size_t SHAPE_NAME_COUNT = 14;

constexpr std::array<ShapeName, SHAPE_NAME_COUNT> SHAPE_NAMES = {
  ShapeName::Quadrilateral, ShapeName::ConvexQuadrilateral,
  ShapeName::ConcaveQuadrilateral, ShapeName::Triangle,
  ShapeName::Trapezoid, ShapeName::IsoscelesTrapezoid,
  ShapeName::Parallelogram, ShapeName::Rectangle,
  ShapeName::Rhombus, ShapeName::Square,
  ShapeName::Kite, ShapeName::Dart,
  ShapeName::Crossed, ShapeName::Degenerate,
};

bool isSentinel(ShapeName name);

// snake_case, e.g. "isosceles_trapezoid"
std::string shapeNameToString(ShapeName name);
ShapeName shapeNameFromString(const std::string& str);

std::ostream& operator<<(std::ostream& os, ShapeName name);

}  // namespace shape
}  // namespace quadra

#endif  // QUADRA_SHAPE_SHAPE_NAME_H_
