#ifndef QUADRA_XML_EXPRESSION_PARSER_H_
#define QUADRA_XML_EXPRESSION_PARSER_H_

#include <tinyxml2.h>
#include <string>

namespace quadra {
namespace xml {

/**
 * @brief Evaluate an arithmetic expression such as "1/16" or "sind(30) * 2"
 *
 * Besides the muParser builtins, defines pi, tau, radian and degree trig
 * (sind, cosd, tand, asind, acosd, atan2d). Throws std::runtime_error on a
 * syntax error.
 */
double evalBareMath(const char* expr);

/// Numbers
double evalNumberAttribute(const tinyxml2::XMLElement* elem, const char* attr, double fallback);
double evalNumberAttributeRequired(const tinyxml2::XMLElement* elem, const char* attr);
bool tryEvalNumberAttribute(const tinyxml2::XMLElement* elem, const char* attr, double* out);

/// Text
std::string evalTextAttribute(const tinyxml2::XMLElement* elem, const char* attr, const std::string& fallback);
std::string evalTextAttributeRequired(const tinyxml2::XMLElement* elem, const char* attr);
bool tryEvalTextAttribute(const tinyxml2::XMLElement* elem, const char* attr, std::string* out);

/// Bool
bool evalBoolAttribute(const tinyxml2::XMLElement* elem, const char* attr, bool fallback);

}  // namespace xml
}  // namespace quadra

#endif  // QUADRA_XML_EXPRESSION_PARSER_H_
