#include <quadra/geometry/quadrilateral.h>
#include <quadra/geometry/utilities.h>
#include <quadra/geometry/vertex.h>

#include <gtest/gtest.h>

#include <limits>

using namespace quadra;
using namespace quadra::geometry;

namespace {

Positions makePositions(double ax, double ay, double bx, double by, double cx, double cy, double dx, double dy)
{
  return { Eigen::Vector2d(ax, ay), Eigen::Vector2d(bx, by), Eigen::Vector2d(cx, cy), Eigen::Vector2d(dx, dy) };
}

TolerancePolicy precisePolicy()
{
  return computeTolerancePolicy(ToleranceConfig());
}

}  // namespace

TEST(VertexLabel, Relations)
{
  EXPECT_EQ(VertexLabel::C, oppositeVertex(VertexLabel::A));
  EXPECT_EQ(VertexLabel::D, oppositeVertex(VertexLabel::B));
  EXPECT_EQ(VertexLabel::D, previousVertex(VertexLabel::A));
  EXPECT_EQ(VertexLabel::A, nextVertex(VertexLabel::D));

  auto adjacent = adjacentVertices(VertexLabel::B);
  EXPECT_EQ(VertexLabel::A, adjacent[0]);
  EXPECT_EQ(VertexLabel::C, adjacent[1]);

  EXPECT_TRUE(areAdjacent(VertexLabel::A, VertexLabel::B));
  EXPECT_TRUE(areAdjacent(VertexLabel::D, VertexLabel::A));
  EXPECT_FALSE(areAdjacent(VertexLabel::A, VertexLabel::C));
  EXPECT_FALSE(areAdjacent(VertexLabel::B, VertexLabel::B));
}

TEST(SideLabel, Relations)
{
  EXPECT_EQ(SideLabel::CD, oppositeSide(SideLabel::AB));
  EXPECT_EQ(SideLabel::BC, oppositeSide(SideLabel::DA));

  auto adjacent = adjacentSides(SideLabel::AB);
  EXPECT_EQ(SideLabel::DA, adjacent[0]);
  EXPECT_EQ(SideLabel::BC, adjacent[1]);

  auto ends = sideVertices(SideLabel::DA);
  EXPECT_EQ(VertexLabel::D, ends[0]);
  EXPECT_EQ(VertexLabel::A, ends[1]);

  auto sides = sidesAtVertex(VertexLabel::A);
  EXPECT_EQ(SideLabel::DA, sides[0]);
  EXPECT_EQ(SideLabel::AB, sides[1]);

  EXPECT_TRUE(areAdjacent(SideLabel::CD, SideLabel::DA));
  EXPECT_FALSE(areAdjacent(SideLabel::BC, SideLabel::DA));

  EXPECT_EQ("CD", sideLabelToString(SideLabel::CD));
  EXPECT_EQ("B", vertexLabelToString(VertexLabel::B));
}

TEST(Utilities, LineAngleFoldsAntiParallel)
{
  EXPECT_NEAR(0.0, computeLineAngle(Eigen::Vector2d(1, 0), Eigen::Vector2d(-3, 0)), 1e-15);
  EXPECT_NEAR(HALF_PI, computeLineAngle(Eigen::Vector2d(1, 0), Eigen::Vector2d(0, 2)), 1e-15);
  EXPECT_NEAR(PI / 4, computeLineAngle(Eigen::Vector2d(1, 0), Eigen::Vector2d(-1, 1)), 1e-15);
}

TEST(Utilities, SegmentsIntersectIsClosed)
{
  // proper crossing
  EXPECT_TRUE(segmentsIntersect(Eigen::Vector2d(0, 0), Eigen::Vector2d(1, 1), Eigen::Vector2d(1, 0),
                                Eigen::Vector2d(0, 1)));
  // end point touching
  EXPECT_TRUE(segmentsIntersect(Eigen::Vector2d(0, 0), Eigen::Vector2d(2, 0), Eigen::Vector2d(1, 0),
                                Eigen::Vector2d(1, 1)));
  // collinear overlap
  EXPECT_TRUE(segmentsIntersect(Eigen::Vector2d(0, 0), Eigen::Vector2d(2, 0), Eigen::Vector2d(1, 0),
                                Eigen::Vector2d(3, 0)));
  // collinear, disjoint
  EXPECT_FALSE(segmentsIntersect(Eigen::Vector2d(0, 0), Eigen::Vector2d(1, 0), Eigen::Vector2d(2, 0),
                                 Eigen::Vector2d(3, 0)));
  EXPECT_FALSE(segmentsIntersect(Eigen::Vector2d(0, 0), Eigen::Vector2d(1, 0), Eigen::Vector2d(0, 1),
                                 Eigen::Vector2d(1, 1)));
}

TEST(Quadrilateral, UnitSquare)
{
  auto geometry = computeGeometry(makePositions(0, 0, 1, 0, 1, 1, 0, 1), precisePolicy());

  EXPECT_EQ(Degeneracy::None, geometry.degeneracy);
  EXPECT_FALSE(geometry.isDegenerate());
  EXPECT_DOUBLE_EQ(1.0, geometry.signed_area);
  EXPECT_DOUBLE_EQ(1.0, geometry.area);
  EXPECT_DOUBLE_EQ(4.0, geometry.perimeter);
  EXPECT_NEAR(TWO_PI, geometry.angle_sum, 1e-12);

  for (VertexLabel v : VERTEX_LABELS)
  {
    EXPECT_EQ(v, geometry.vertex(v).label);
    EXPECT_NEAR(HALF_PI, geometry.vertex(v).angle, 1e-12);
  }
  for (SideLabel s : SIDE_LABELS)
  {
    EXPECT_EQ(s, geometry.side(s).label);
    EXPECT_EQ(oppositeSide(s), geometry.side(s).opposite);
    EXPECT_DOUBLE_EQ(1.0, geometry.side(s).length);
  }

  EXPECT_TRUE(geometry.side(SideLabel::CD).direction.isApprox(Eigen::Vector2d(-1, 0)));
}

TEST(Quadrilateral, ClockwiseWindingKeepsInteriorAngles)
{
  // same square traversed clockwise
  auto geometry = computeGeometry(makePositions(0, 0, 0, 1, 1, 1, 1, 0), precisePolicy());

  EXPECT_EQ(Degeneracy::None, geometry.degeneracy);
  EXPECT_DOUBLE_EQ(-1.0, geometry.signed_area);
  EXPECT_DOUBLE_EQ(1.0, geometry.area);
  for (VertexLabel v : VERTEX_LABELS)
    EXPECT_NEAR(HALF_PI, geometry.vertex(v).angle, 1e-12);
}

TEST(Quadrilateral, ReflexAngle)
{
  auto geometry = computeGeometry(makePositions(0, 2, -1, 0, 0, 1, 1, 0), precisePolicy());

  EXPECT_EQ(Degeneracy::None, geometry.degeneracy);
  EXPECT_NEAR(toRadians(270.0), geometry.vertex(VertexLabel::C).angle, 1e-12);
  EXPECT_NEAR(TWO_PI, geometry.angle_sum, 1e-12);
  EXPECT_DOUBLE_EQ(1.0, geometry.area);
}

TEST(Quadrilateral, ReflexAngleClockwise)
{
  // the dart above mirrored, which reverses the winding
  auto geometry = computeGeometry(makePositions(0, 2, 1, 0, 0, 1, -1, 0), precisePolicy());

  EXPECT_EQ(Degeneracy::None, geometry.degeneracy);
  EXPECT_LT(geometry.signed_area, 0.0);
  EXPECT_NEAR(toRadians(270.0), geometry.vertex(VertexLabel::C).angle, 1e-12);
  EXPECT_NEAR(TWO_PI, geometry.angle_sum, 1e-12);
}

TEST(Quadrilateral, CollinearVertexIsFlat)
{
  auto geometry = computeGeometry(makePositions(0, 0, 1, 0, 2, 0, 1, 1), precisePolicy());

  EXPECT_EQ(Degeneracy::None, geometry.degeneracy);
  EXPECT_NEAR(PI, geometry.vertex(VertexLabel::B).angle, 1e-12);
  EXPECT_NEAR(toRadians(45.0), geometry.vertex(VertexLabel::A).angle, 1e-12);
  EXPECT_NEAR(toRadians(90.0), geometry.vertex(VertexLabel::D).angle, 1e-12);
  EXPECT_NEAR(TWO_PI, geometry.angle_sum, 1e-12);
}

TEST(Quadrilateral, CollapsedSide)
{
  auto geometry = computeGeometry(makePositions(0, 0, 1e-3, 0, 1, 1, 0, 1), precisePolicy());
  EXPECT_EQ(Degeneracy::CollapsedSide, geometry.degeneracy);
  EXPECT_TRUE(geometry.isDegenerate());
}

TEST(Quadrilateral, CrossingIsCheckedBeforeCollapsedSide)
{
  // bow-tie whose BC is shorter than the length tolerance, AB still crosses CD
  Positions positions = makePositions(0, 0, 1, 0.51, 1, 0.49, 0, 1);
  ASSERT_TRUE(hasCrossedSides(positions));

  auto geometry = computeGeometry(positions, precisePolicy());
  EXPECT_LE(geometry.side(SideLabel::BC).length, precisePolicy().length);
  EXPECT_EQ(Degeneracy::Crossed, geometry.degeneracy);

  // AB collapses onto a point of CD
  geometry = computeGeometry(makePositions(0.5, 0, 0.51, 0, 1, 0, 0, 0), precisePolicy());
  EXPECT_EQ(Degeneracy::Crossed, geometry.degeneracy);
}

TEST(Quadrilateral, Crossed)
{
  auto geometry = computeGeometry(makePositions(0, 0, 1, 1, 1, 0, 0, 1), precisePolicy());
  EXPECT_EQ(Degeneracy::Crossed, geometry.degeneracy);

  EXPECT_TRUE(hasCrossedSides(makePositions(0, 0, 1, 0, 0, 1, 1, 1)));
  EXPECT_FALSE(hasCrossedSides(makePositions(0, 0, 1, 0, 1, 1, 0, 1)));
}

TEST(Quadrilateral, TouchingCountsAsCrossed)
{
  // D lies on AB
  auto geometry = computeGeometry(makePositions(0, 0, 2, 0, 2, 1, 1, 0), precisePolicy());
  EXPECT_EQ(Degeneracy::Crossed, geometry.degeneracy);
}

TEST(Quadrilateral, ZeroArea)
{
  // thin diamond, area 0.01 against a threshold of about 0.0156
  auto geometry = computeGeometry(makePositions(0, 0, 1, -0.005, 2, 0, 1, 0.005), precisePolicy());
  EXPECT_EQ(Degeneracy::ZeroArea, geometry.degeneracy);
  EXPECT_NEAR(0.01, geometry.area, 1e-12);
}

TEST(Utilities, DistanceToSegment)
{
  const Eigen::Vector2d a(0, 0);
  const Eigen::Vector2d b(2, 0);

  EXPECT_DOUBLE_EQ(0.5, distanceToSegment(Eigen::Vector2d(1, 0.5), a, b));
  EXPECT_DOUBLE_EQ(1.0, distanceToSegment(Eigen::Vector2d(3, 0), a, b));
  EXPECT_DOUBLE_EQ(0.0, distanceToSegment(Eigen::Vector2d(1, 0), a, b));
  EXPECT_DOUBLE_EQ(5.0, distanceToSegment(Eigen::Vector2d(3, 4), a, a));

  EXPECT_TRUE(segmentsTouch(a, b, Eigen::Vector2d(1, 0.02), Eigen::Vector2d(1, 1), 0.03125));
  EXPECT_FALSE(segmentsTouch(a, b, Eigen::Vector2d(1, 0.05), Eigen::Vector2d(1, 1), 0.03125));
}

TEST(Quadrilateral, TouchingWithinToleranceCountsAsCrossed)
{
  TolerancePolicy policy = precisePolicy();

  // reflex vertex D hovering 0.02 above AB, no exact intersection
  Positions near = makePositions(0, 0, 2, 0, 1, 1, 1, 0.02);
  ASSERT_FALSE(hasCrossedSides(near));
  EXPECT_TRUE(hasTouchingSides(near, policy.length));
  EXPECT_EQ(Degeneracy::Crossed, computeGeometry(near, policy).degeneracy);

  // farther than the length tolerance stays a simple concave shape
  Positions far = makePositions(0, 0, 2, 0, 1, 1, 1, 0.05);
  EXPECT_FALSE(hasTouchingSides(far, policy.length));
  EXPECT_EQ(Degeneracy::None, computeGeometry(far, policy).degeneracy);

  // a noisy device widens the touching band
  TolerancePolicy device = computeTolerancePolicy(ToleranceConfig(), InputPrecision::NoisyDevice);
  EXPECT_EQ(Degeneracy::Crossed, computeGeometry(far, device).degeneracy);
}

TEST(Quadrilateral, InvalidPositions)
{
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();

  EXPECT_THROW(computeGeometry(makePositions(0, 0, 1, 0, nan, 1, 0, 1), precisePolicy()), std::invalid_argument);
  EXPECT_THROW(computeGeometry(makePositions(0, 0, 1, 0, 1, inf, 0, 1), precisePolicy()), std::invalid_argument);
  EXPECT_THROW(computeGeometry(makePositions(0, 0, 1, 0, 1, 1, 0, 0), precisePolicy()), std::invalid_argument);
  EXPECT_THROW(validatePositions(makePositions(1, 1, 1, 1, 1, 1, 1, 1)), std::invalid_argument);
  EXPECT_NO_THROW(validatePositions(makePositions(0, 0, 1, 0, 1, 1, 0, 1)));
}

TEST(Quadrilateral, Turn)
{
  auto positions = makePositions(0, 0, 4, 0, 1, 1, 0, 3);
  EXPECT_GT(computeTurn(positions, VertexLabel::A), 0.0);
  EXPECT_GT(computeTurn(positions, VertexLabel::B), 0.0);
  EXPECT_LT(computeTurn(positions, VertexLabel::C), 0.0);
  EXPECT_GT(computeTurn(positions, VertexLabel::D), 0.0);
  EXPECT_DOUBLE_EQ(3.5, computeSignedArea(positions));
}

int main(int argc, char** argv)
{
  testing::InitGoogleTest(&argc, argv);

  return RUN_ALL_TESTS();
}
