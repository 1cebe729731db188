#ifndef QUADRA_SHAPE_PROPERTY_H_
#define QUADRA_SHAPE_PROPERTY_H_

#include <bitset>
#include <initializer_list>
#include <iostream>
#include <string>
#include <vector>

#include <quadra/geometry/vertex.h>

namespace quadra {
namespace shape {

/**
 * @brief Boolean facts about one configuration
 *
 * Pair facts name both operands, e.g. ParallelABCD is "AB || CD" and EqualAngleAB is
 * "angle A ~ angle B".
 */
enum class ShapeProperty
{
  // opposite sides
  ParallelABCD = 0,
  ParallelBCDA,
  EqualLengthABCD,
  EqualLengthBCDA,

  // adjacent sides
  EqualLengthABBC,
  EqualLengthBCCD,
  EqualLengthCDDA,
  EqualLengthDAAB,

  // adjacent vertices
  EqualAngleAB,
  EqualAngleBC,
  EqualAngleCD,
  EqualAngleDA,

  // opposite vertices
  EqualAngleAC,
  EqualAngleBD,

  RightAngleA,
  RightAngleB,
  RightAngleC,
  RightAngleD,

  FlatAngleA,
  FlatAngleB,
  FlatAngleC,
  FlatAngleD,

  // aggregates
  Simple,
  Crossed,
  Degenerate,
  AngleSumFullTurn,
  Convex,
  Concave,
  HasFlatAngle,
  AnyParallelPair,
  BothParallelPairs,
  AllSidesEqual,
  AllAnglesRight,
  KiteSymmetry,
  IsoscelesTrapezoidSymmetry,
};

constexpr std::size_t PROPERTY_COUNT = static_cast<std::size_t>(ShapeProperty::IsoscelesTrapezoidSymmetry) + 1;

class PropertySet
{
public:
  PropertySet() = default;
  PropertySet(std::initializer_list<ShapeProperty> properties);

  void insert(ShapeProperty p);
  void insert(const PropertySet& other);
  void erase(ShapeProperty p);
  void set(ShapeProperty p, bool holds);

  bool contains(ShapeProperty p) const;
  bool containsAll(const PropertySet& other) const;
  bool intersects(const PropertySet& other) const;

  bool empty() const;
  std::size_t size() const;

  std::vector<ShapeProperty> toVector() const;

  PropertySet operator|(const PropertySet& other) const;
  PropertySet operator&(const PropertySet& other) const;
  bool operator==(const PropertySet& other) const;
  bool operator!=(const PropertySet& other) const;

private:
  std::bitset<PROPERTY_COUNT> bits_;
};

// Mapping from a detector's operands to the fact it establishes. Throws
// std::invalid_argument for a pair that has no fact (e.g. AB || BC).
ShapeProperty parallelProperty(geometry::SideLabel side);
ShapeProperty equalLengthProperty(geometry::SideLabel a, geometry::SideLabel b);
ShapeProperty equalAngleProperty(geometry::VertexLabel a, geometry::VertexLabel b);
ShapeProperty rightAngleProperty(geometry::VertexLabel v);
ShapeProperty flatAngleProperty(geometry::VertexLabel v);

std::string shapePropertyToString(ShapeProperty p);
ShapeProperty shapePropertyFromString(const std::string& str);

std::ostream& operator<<(std::ostream& os, ShapeProperty p);
std::ostream& operator<<(std::ostream& os, const PropertySet& set);

}  // namespace shape
}  // namespace quadra

#endif  // QUADRA_SHAPE_PROPERTY_H_
