#include <quadra/xml/expression_parser.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

#include "muParser.h"

namespace quadra {
namespace xml {

namespace {

using Real = mu::value_type;

constexpr long double kPiL = 3.141592653589793238462643383279502884L;
constexpr long double kDeg2RadL = kPiL / 180.0L;
constexpr long double kRad2DegL = 180.0L / kPiL;

Real wrap_sind(Real x)
{
  return static_cast<Real>(std::sin((long double)x * kDeg2RadL));
}
Real wrap_cosd(Real x)
{
  return static_cast<Real>(std::cos((long double)x * kDeg2RadL));
}
Real wrap_tand(Real x)
{
  return static_cast<Real>(std::tan((long double)x * kDeg2RadL));
}
Real wrap_asind(Real x)
{
  return static_cast<Real>(std::asin((long double)x) * kRad2DegL);
}
Real wrap_acosd(Real x)
{
  return static_cast<Real>(std::acos((long double)x) * kRad2DegL);
}
Real wrap_atan2(Real y, Real x)
{
  return static_cast<Real>(std::atan2((long double)y, (long double)x));
}
Real wrap_atan2d(Real y, Real x)
{
  return static_cast<Real>(std::atan2((long double)y, (long double)x) * kRad2DegL);
}

void register_math_symbols(mu::Parser& parser)
{
  parser.DefineConst("pi", static_cast<Real>(kPiL));
  parser.DefineConst("tau", static_cast<Real>(2.0L * kPiL));
  parser.DefineConst("inf", std::numeric_limits<Real>::infinity());

  parser.DefineFun("atan2", mu::fun_type2(&wrap_atan2));

  // degree trig
  parser.DefineFun("sind", mu::fun_type1(&wrap_sind));
  parser.DefineFun("cosd", mu::fun_type1(&wrap_cosd));
  parser.DefineFun("tand", mu::fun_type1(&wrap_tand));
  parser.DefineFun("asind", mu::fun_type1(&wrap_asind));
  parser.DefineFun("acosd", mu::fun_type1(&wrap_acosd));
  parser.DefineFun("atan2d", mu::fun_type2(&wrap_atan2d));
}

mu::Parser& get_math_parser()
{
  // One parser per thread, initialized once
  thread_local mu::Parser parser = [] {
    mu::Parser p;
    register_math_symbols(p);
    return p;
  }();
  return parser;
}

std::string describe(const tinyxml2::XMLElement* elem, const char* attr)
{
  return std::string("attribute '") + attr + "' on <" + (elem ? elem->Name() : "?") + "> at line " +
         std::to_string(elem ? elem->GetLineNum() : 0);
}

double evalAttributeExpr(const tinyxml2::XMLElement* elem, const char* attr, const char* expr)
{
  try
  {
    return evalBareMath(expr);
  }
  catch (const std::runtime_error& e)
  {
    throw std::runtime_error(std::string(e.what()) + " in " + describe(elem, attr));
  }
}

}  // namespace

double evalBareMath(const char* expr)
{
  if (!expr)
    throw std::runtime_error("Expression string is null.");

  try
  {
    mu::Parser& parser = get_math_parser();  // reuse per-thread instance
    parser.SetExpr(expr);
    return parser.Eval();
  }
  catch (mu::Parser::exception_type& e)
  {
    throw std::runtime_error(std::string("Error parsing expression: ") + e.GetMsg());
  }
}

double evalNumberAttributeRequired(const tinyxml2::XMLElement* elem, const char* attr)
{
  const char* expr = elem ? elem->Attribute(attr) : nullptr;
  if (!expr)
    throw std::runtime_error("Missing required " + describe(elem, attr));
  return evalAttributeExpr(elem, attr, expr);
}

double evalNumberAttribute(const tinyxml2::XMLElement* elem, const char* attr, double fallback)
{
  const char* expr = elem ? elem->Attribute(attr) : nullptr;
  if (!expr)
    return fallback;
  return evalAttributeExpr(elem, attr, expr);
}

bool tryEvalNumberAttribute(const tinyxml2::XMLElement* elem, const char* attr, double* out)
{
  if (!elem || !attr || !out)
    return false;
  const char* expr = elem->Attribute(attr);
  if (!expr)
    return false;
  *out = evalAttributeExpr(elem, attr, expr);
  return true;
}

std::string evalTextAttributeRequired(const tinyxml2::XMLElement* elem, const char* attr)
{
  const char* raw = elem ? elem->Attribute(attr) : nullptr;
  if (!raw)
    throw std::runtime_error("Missing required " + describe(elem, attr));
  return raw;
}

std::string evalTextAttribute(const tinyxml2::XMLElement* elem, const char* attr, const std::string& fallback)
{
  const char* raw = elem ? elem->Attribute(attr) : nullptr;
  return raw ? std::string(raw) : fallback;
}

bool tryEvalTextAttribute(const tinyxml2::XMLElement* elem, const char* attr, std::string* out)
{
  if (!elem || !attr || !out)
    return false;
  const char* raw = elem->Attribute(attr);
  if (!raw)
    return false;
  *out = raw;
  return true;
}

bool evalBoolAttribute(const tinyxml2::XMLElement* elem, const char* attr, bool fallback)
{
  std::string s;
  if (!tryEvalTextAttribute(elem, attr, &s))
    return fallback;
  if (s == "true")
    return true;
  if (s == "false")
    return false;
  throw std::runtime_error("Expected 'true' or 'false' for " + describe(elem, attr));
}

}  // namespace xml
}  // namespace quadra
