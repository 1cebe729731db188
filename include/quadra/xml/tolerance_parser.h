#ifndef QUADRA_XML_TOLERANCE_PARSER_H_
#define QUADRA_XML_TOLERANCE_PARSER_H_

#include <memory>
#include <string>

#include <tinyxml2.h>

#include <quadra/tolerance.h>

namespace quadra {
namespace xml {

/**
 * @brief Read a <Tolerance> element
 *
 * Every attribute is optional and falls back to the ToleranceConfig default.
 * Numeric attributes accept expressions ("1/16", "2*pi/180"). Throws
 * std::runtime_error on a bad expression or an unknown precision and
 * std::invalid_argument when the resulting config is out of range.
 */
ToleranceConfig parseToleranceConfig(const tinyxml2::XMLElement* tolerance);

/**
 * @brief Loads a tolerance configuration from a <Quadra> document.
 *
 * <Quadra>
 *   <Tolerance step_size="1/16" reference_length="1" safety_ratio="0.5"
 *              device_scale="4" precision="precise"/>
 * </Quadra>
 */
class ToleranceConfigParser
{
public:
  ToleranceConfigParser();
  ~ToleranceConfigParser();

  /// Reports an unreadable file on std::cerr and returns false.
  bool loadFromFile(const std::string& filename, ToleranceConfig& config);

  /// Reports malformed XML on std::cerr and returns false.
  bool loadFromText(const std::string& text, ToleranceConfig& config);

private:
  bool load(const tinyxml2::XMLDocument* doc, ToleranceConfig& config);

  std::unique_ptr<tinyxml2::XMLDocument> doc;
};

}  // namespace xml
}  // namespace quadra

#endif  // QUADRA_XML_TOLERANCE_PARSER_H_
