#include <quadra/xml/tolerance_parser.h>
#include <quadra/xml/expression_parser.h>

#include <iostream>
#include <stdexcept>

namespace quadra {
namespace xml {

ToleranceConfig parseToleranceConfig(const tinyxml2::XMLElement* tolerance)
{
  if (!tolerance)
    throw std::runtime_error("Missing <Tolerance> element");

  ToleranceConfig config;
  config.step_size = evalNumberAttribute(tolerance, "step_size", config.step_size);
  config.reference_length = evalNumberAttribute(tolerance, "reference_length", config.reference_length);
  config.safety_ratio = evalNumberAttribute(tolerance, "safety_ratio", config.safety_ratio);
  config.device_scale = evalNumberAttribute(tolerance, "device_scale", config.device_scale);

  std::string precision;
  if (tryEvalTextAttribute(tolerance, "precision", &precision))
  {
    try
    {
      config.precision = inputPrecisionFromString(precision);
    }
    catch (const std::runtime_error& e)
    {
      throw std::runtime_error(std::string(e.what()) + " in attribute 'precision' at line " +
                               std::to_string(tolerance->GetLineNum()));
    }
  }

  validateToleranceConfig(config);
  return config;
}

ToleranceConfigParser::ToleranceConfigParser()
{
}

ToleranceConfigParser::~ToleranceConfigParser()
{
}

bool ToleranceConfigParser::loadFromFile(const std::string& filename, ToleranceConfig& config)
{
  doc = std::make_unique<tinyxml2::XMLDocument>();
  if (doc->LoadFile(filename.c_str()) != tinyxml2::XML_SUCCESS)
  {
    std::cerr << "ERROR: cannot load XML file: " << filename << std::endl;
    return false;
  }
  return load(doc.get(), config);
}

bool ToleranceConfigParser::loadFromText(const std::string& text, ToleranceConfig& config)
{
  doc = std::make_unique<tinyxml2::XMLDocument>();
  if (doc->Parse(text.c_str()) != tinyxml2::XML_SUCCESS)
  {
    std::cerr << "ERROR: cannot parse XML text: " << doc->ErrorStr() << std::endl;
    return false;
  }
  return load(doc.get(), config);
}

bool ToleranceConfigParser::load(const tinyxml2::XMLDocument* doc, ToleranceConfig& config)
{
  const tinyxml2::XMLElement* root = doc->RootElement();
  if (!root || std::string(root->Name()) != "Quadra")
    throw std::runtime_error("Expected <Quadra> root element");

  const tinyxml2::XMLElement* tolerance = root->FirstChildElement("Tolerance");
  if (!tolerance)
    throw std::runtime_error("Missing <Tolerance> element in <Quadra> at line " + std::to_string(root->GetLineNum()));

  if (tolerance->NextSiblingElement("Tolerance"))
    std::cerr << "WARNING: more than one <Tolerance> element, using the one at line " << tolerance->GetLineNum()
              << std::endl;

  config = parseToleranceConfig(tolerance);
  return true;
}

}  // namespace xml
}  // namespace quadra
