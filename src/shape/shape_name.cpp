#include <quadra/shape/shape_name.h>

#include <stdexcept>

namespace quadra {
namespace shape {

bool isSentinel(ShapeName name)
{
  return name == ShapeName::Crossed || name == ShapeName::Degenerate;
}

std::string shapeNameToString(ShapeName name)
{
  switch (name)
  {
    case ShapeName::Quadrilateral:
      return "quadrilateral";
    case ShapeName::ConvexQuadrilateral:
      return "convex_quadrilateral";
    case ShapeName::ConcaveQuadrilateral:
      return "concave_quadrilateral";
    case ShapeName::Triangle:
      return "triangle";
    case ShapeName::Trapezoid:
      return "trapezoid";
    case ShapeName::IsoscelesTrapezoid:
      return "isosceles_trapezoid";
    case ShapeName::Parallelogram:
      return "parallelogram";
    case ShapeName::Rectangle:
      return "rectangle";
    case ShapeName::Rhombus:
      return "rhombus";
    case ShapeName::Square:
      return "square";
    case ShapeName::Kite:
      return "kite";
    case ShapeName::Dart:
      return "dart";
    case ShapeName::Crossed:
      return "crossed";
    case ShapeName::Degenerate:
      return "degenerate";
  }
  throw std::invalid_argument("Unknown ShapeName: " + std::to_string(static_cast<int>(name)));
}

ShapeName shapeNameFromString(const std::string& str)
{
  for (ShapeName name : SHAPE_NAMES)
  {
    if (shapeNameToString(name) == str)
      return name;
  }
  throw std::runtime_error("Unknown ShapeName: " + str);
}

std::ostream& operator<<(std::ostream& os, ShapeName name)
{
  return os << shapeNameToString(name);
}

}  // namespace shape
}  // namespace quadra
