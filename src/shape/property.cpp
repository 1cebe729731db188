#include <quadra/shape/property.h>

#include <stdexcept>

namespace quadra {
namespace shape {

using geometry::SideLabel;
using geometry::VertexLabel;

PropertySet::PropertySet(std::initializer_list<ShapeProperty> properties)
{
  for (ShapeProperty p : properties)
    insert(p);
}

void PropertySet::insert(ShapeProperty p)
{
  bits_.set(static_cast<std::size_t>(p));
}

void PropertySet::insert(const PropertySet& other)
{
  bits_ |= other.bits_;
}

void PropertySet::erase(ShapeProperty p)
{
  bits_.reset(static_cast<std::size_t>(p));
}

void PropertySet::set(ShapeProperty p, bool holds)
{
  bits_.set(static_cast<std::size_t>(p), holds);
}

bool PropertySet::contains(ShapeProperty p) const
{
  return bits_.test(static_cast<std::size_t>(p));
}

bool PropertySet::containsAll(const PropertySet& other) const
{
  return (bits_ & other.bits_) == other.bits_;
}

bool PropertySet::intersects(const PropertySet& other) const
{
  return (bits_ & other.bits_).any();
}

bool PropertySet::empty() const
{
  return bits_.none();
}

std::size_t PropertySet::size() const
{
  return bits_.count();
}

std::vector<ShapeProperty> PropertySet::toVector() const
{
  std::vector<ShapeProperty> out;
  for (std::size_t i = 0; i < PROPERTY_COUNT; ++i)
  {
    if (bits_.test(i))
      out.push_back(static_cast<ShapeProperty>(i));
  }
  return out;
}

PropertySet PropertySet::operator|(const PropertySet& other) const
{
  PropertySet out(*this);
  out.bits_ |= other.bits_;
  return out;
}

PropertySet PropertySet::operator&(const PropertySet& other) const
{
  PropertySet out(*this);
  out.bits_ &= other.bits_;
  return out;
}

bool PropertySet::operator==(const PropertySet& other) const
{
  return bits_ == other.bits_;
}

bool PropertySet::operator!=(const PropertySet& other) const
{
  return bits_ != other.bits_;
}

ShapeProperty parallelProperty(SideLabel side)
{
  switch (side)
  {
    case SideLabel::AB:
    case SideLabel::CD:
      return ShapeProperty::ParallelABCD;
    case SideLabel::BC:
    case SideLabel::DA:
      return ShapeProperty::ParallelBCDA;
  }
  throw std::invalid_argument("Unknown SideLabel: " + std::to_string(static_cast<int>(side)));
}

ShapeProperty equalLengthProperty(SideLabel a, SideLabel b)
{
  if (a == b)
    throw std::invalid_argument("equalLengthProperty: side " + geometry::sideLabelToString(a) +
                                " compared with itself");

  // order-independent: key on the lower index, wrapping DA -> AB
  const std::size_t ia = geometry::index(a);
  const std::size_t ib = geometry::index(b);

  if (geometry::oppositeSide(a) == b)
    return (ia % 2 == 0) ? ShapeProperty::EqualLengthABCD : ShapeProperty::EqualLengthBCDA;

  const std::size_t first = ((ia + 1) % 4 == ib) ? ia : ib;
  switch (first)
  {
    case 0:
      return ShapeProperty::EqualLengthABBC;
    case 1:
      return ShapeProperty::EqualLengthBCCD;
    case 2:
      return ShapeProperty::EqualLengthCDDA;
    default:
      return ShapeProperty::EqualLengthDAAB;
  }
}

ShapeProperty equalAngleProperty(VertexLabel a, VertexLabel b)
{
  if (a == b)
    throw std::invalid_argument("equalAngleProperty: vertex " + geometry::vertexLabelToString(a) +
                                " compared with itself");

  const std::size_t ia = geometry::index(a);
  const std::size_t ib = geometry::index(b);

  if (geometry::oppositeVertex(a) == b)
    return (ia % 2 == 0) ? ShapeProperty::EqualAngleAC : ShapeProperty::EqualAngleBD;

  const std::size_t first = ((ia + 1) % 4 == ib) ? ia : ib;
  switch (first)
  {
    case 0:
      return ShapeProperty::EqualAngleAB;
    case 1:
      return ShapeProperty::EqualAngleBC;
    case 2:
      return ShapeProperty::EqualAngleCD;
    default:
      return ShapeProperty::EqualAngleDA;
  }
}

ShapeProperty rightAngleProperty(VertexLabel v)
{
  return static_cast<ShapeProperty>(static_cast<std::size_t>(ShapeProperty::RightAngleA) + geometry::index(v));
}

ShapeProperty flatAngleProperty(VertexLabel v)
{
  return static_cast<ShapeProperty>(static_cast<std::size_t>(ShapeProperty::FlatAngleA) + geometry::index(v));
}

std::string shapePropertyToString(ShapeProperty p)
{
  switch (p)
  {
    case ShapeProperty::ParallelABCD:
      return "ParallelABCD";
    case ShapeProperty::ParallelBCDA:
      return "ParallelBCDA";
    case ShapeProperty::EqualLengthABCD:
      return "EqualLengthABCD";
    case ShapeProperty::EqualLengthBCDA:
      return "EqualLengthBCDA";
    case ShapeProperty::EqualLengthABBC:
      return "EqualLengthABBC";
    case ShapeProperty::EqualLengthBCCD:
      return "EqualLengthBCCD";
    case ShapeProperty::EqualLengthCDDA:
      return "EqualLengthCDDA";
    case ShapeProperty::EqualLengthDAAB:
      return "EqualLengthDAAB";
    case ShapeProperty::EqualAngleAB:
      return "EqualAngleAB";
    case ShapeProperty::EqualAngleBC:
      return "EqualAngleBC";
    case ShapeProperty::EqualAngleCD:
      return "EqualAngleCD";
    case ShapeProperty::EqualAngleDA:
      return "EqualAngleDA";
    case ShapeProperty::EqualAngleAC:
      return "EqualAngleAC";
    case ShapeProperty::EqualAngleBD:
      return "EqualAngleBD";
    case ShapeProperty::RightAngleA:
      return "RightAngleA";
    case ShapeProperty::RightAngleB:
      return "RightAngleB";
    case ShapeProperty::RightAngleC:
      return "RightAngleC";
    case ShapeProperty::RightAngleD:
      return "RightAngleD";
    case ShapeProperty::FlatAngleA:
      return "FlatAngleA";
    case ShapeProperty::FlatAngleB:
      return "FlatAngleB";
    case ShapeProperty::FlatAngleC:
      return "FlatAngleC";
    case ShapeProperty::FlatAngleD:
      return "FlatAngleD";
    case ShapeProperty::Simple:
      return "Simple";
    case ShapeProperty::Crossed:
      return "Crossed";
    case ShapeProperty::Degenerate:
      return "Degenerate";
    case ShapeProperty::AngleSumFullTurn:
      return "AngleSumFullTurn";
    case ShapeProperty::Convex:
      return "Convex";
    case ShapeProperty::Concave:
      return "Concave";
    case ShapeProperty::HasFlatAngle:
      return "HasFlatAngle";
    case ShapeProperty::AnyParallelPair:
      return "AnyParallelPair";
    case ShapeProperty::BothParallelPairs:
      return "BothParallelPairs";
    case ShapeProperty::AllSidesEqual:
      return "AllSidesEqual";
    case ShapeProperty::AllAnglesRight:
      return "AllAnglesRight";
    case ShapeProperty::KiteSymmetry:
      return "KiteSymmetry";
    case ShapeProperty::IsoscelesTrapezoidSymmetry:
      return "IsoscelesTrapezoidSymmetry";
  }
  throw std::invalid_argument("Unknown ShapeProperty: " + std::to_string(static_cast<int>(p)));
}

ShapeProperty shapePropertyFromString(const std::string& str)
{
  for (std::size_t i = 0; i < PROPERTY_COUNT; ++i)
  {
    const auto p = static_cast<ShapeProperty>(i);
    if (shapePropertyToString(p) == str)
      return p;
  }
  throw std::runtime_error("Unknown ShapeProperty: " + str);
}

std::ostream& operator<<(std::ostream& os, ShapeProperty p)
{
  return os << shapePropertyToString(p);
}

std::ostream& operator<<(std::ostream& os, const PropertySet& set)
{
  os << "{";
  bool first = true;
  for (ShapeProperty p : set.toVector())
  {
    if (!first)
      os << ", ";
    os << p;
    first = false;
  }
  os << "}";
  return os;
}

}  // namespace shape
}  // namespace quadra
