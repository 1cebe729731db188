#include <quadra/xml/tolerance_parser.h>

#include <gtest/gtest.h>

#include <cmath>
#include <fstream>

using namespace quadra;
using namespace quadra::xml;

TEST(ToleranceParser, LoadFromText)
{
  std::string xml = R"(
<Quadra>
  <Tolerance step_size="1/16" reference_length="2*1" safety_ratio="1/4" device_scale="2+2" precision="device"/>
</Quadra>
)";

  ToleranceConfig config;
  ToleranceConfigParser parser;
  ASSERT_TRUE(parser.loadFromText(xml, config));

  EXPECT_DOUBLE_EQ(0.0625, config.step_size);
  EXPECT_DOUBLE_EQ(2.0, config.reference_length);
  EXPECT_DOUBLE_EQ(0.25, config.safety_ratio);
  EXPECT_DOUBLE_EQ(4.0, config.device_scale);
  EXPECT_EQ(InputPrecision::NoisyDevice, config.precision);

  TolerancePolicy policy = computeTolerancePolicy(config);
  EXPECT_DOUBLE_EQ(4.0 * 0.25 * 0.0625, policy.length);
  EXPECT_NEAR(4.0 * 0.25 * std::atan(0.0625 / 2.0), policy.right_angle, 1e-15);
}

TEST(ToleranceParser, DefaultsWhenAttributesAreOmitted)
{
  ToleranceConfig config;
  config.step_size = 1.0;

  ToleranceConfigParser parser;
  ASSERT_TRUE(parser.loadFromText("<Quadra><Tolerance/></Quadra>", config));

  ToleranceConfig defaults;
  EXPECT_DOUBLE_EQ(defaults.step_size, config.step_size);
  EXPECT_DOUBLE_EQ(defaults.reference_length, config.reference_length);
  EXPECT_DOUBLE_EQ(defaults.safety_ratio, config.safety_ratio);
  EXPECT_DOUBLE_EQ(defaults.device_scale, config.device_scale);
  EXPECT_EQ(InputPrecision::Precise, config.precision);
}

TEST(ToleranceParser, MalformedDocuments)
{
  ToleranceConfig config;
  ToleranceConfigParser parser;

  EXPECT_FALSE(parser.loadFromText("<Quadra><Tolerance>", config));
  EXPECT_THROW(parser.loadFromText("<Quadra/>", config), std::runtime_error);
  EXPECT_THROW(parser.loadFromText("<Shapes><Tolerance/></Shapes>", config), std::runtime_error);
}

TEST(ToleranceParser, InvalidValues)
{
  ToleranceConfig config;
  ToleranceConfigParser parser;

  EXPECT_THROW(parser.loadFromText(R"(<Quadra><Tolerance precision="noisy"/></Quadra>)", config),
               std::runtime_error);
  EXPECT_THROW(parser.loadFromText(R"(<Quadra><Tolerance step_size="1/"/></Quadra>)", config), std::runtime_error);

  // parse fine, out of range
  EXPECT_THROW(parser.loadFromText(R"(<Quadra><Tolerance safety_ratio="1"/></Quadra>)", config),
               std::invalid_argument);
  EXPECT_THROW(parser.loadFromText(R"(<Quadra><Tolerance step_size="-1/16"/></Quadra>)", config),
               std::invalid_argument);
  EXPECT_THROW(parser.loadFromText(R"(<Quadra><Tolerance device_scale="1/2"/></Quadra>)", config),
               std::invalid_argument);
  EXPECT_THROW(parser.loadFromText(R"(<Quadra><Tolerance reference_length="inf"/></Quadra>)", config),
               std::invalid_argument);
}

TEST(ToleranceParser, ParseElement)
{
  EXPECT_THROW(parseToleranceConfig(nullptr), std::runtime_error);

  tinyxml2::XMLDocument doc;
  ASSERT_EQ(tinyxml2::XML_SUCCESS, doc.Parse(R"(<Tolerance step_size="1/8" precision="precise"/>)"));

  ToleranceConfig config = parseToleranceConfig(doc.RootElement());
  EXPECT_DOUBLE_EQ(0.125, config.step_size);
  EXPECT_EQ(InputPrecision::Precise, config.precision);
}

TEST(ToleranceParser, LoadFromFile)
{
  ToleranceConfig config;
  ToleranceConfigParser parser;
  EXPECT_FALSE(parser.loadFromFile("/nonexistent-dir/quadra.xml", config));

  const std::string path = testing::TempDir() + "quadra_tolerance.xml";
  {
    std::ofstream file(path);
    file << "<Quadra>\n  <Tolerance step_size=\"1/32\" precision=\"device\"/>\n</Quadra>\n";
  }

  ASSERT_TRUE(parser.loadFromFile(path, config));
  EXPECT_DOUBLE_EQ(0.03125, config.step_size);
  EXPECT_EQ(InputPrecision::NoisyDevice, config.precision);
}

int main(int argc, char** argv)
{
  testing::InitGoogleTest(&argc, argv);

  return RUN_ALL_TESTS();
}
