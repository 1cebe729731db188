#include <quadra/tolerance.h>

#include <cmath>
#include <stdexcept>

namespace quadra {

namespace {

void requireFinite(double value, const char* field)
{
  if (!std::isfinite(value))
    throw std::invalid_argument(std::string("ToleranceConfig: '") + field + "' must be finite");
}

}  // namespace

void validateToleranceConfig(const ToleranceConfig& config)
{
  requireFinite(config.step_size, "step_size");
  requireFinite(config.reference_length, "reference_length");
  requireFinite(config.safety_ratio, "safety_ratio");
  requireFinite(config.device_scale, "device_scale");

  if (config.step_size <= 0.0)
    throw std::invalid_argument("ToleranceConfig: 'step_size' must be > 0, got " + std::to_string(config.step_size));
  if (config.reference_length <= 0.0)
    throw std::invalid_argument("ToleranceConfig: 'reference_length' must be > 0, got " +
                                std::to_string(config.reference_length));

  // ratio >= 1 would let two positions one step apart compare equal
  if (config.safety_ratio <= 0.0 || config.safety_ratio >= 1.0)
    throw std::invalid_argument("ToleranceConfig: 'safety_ratio' must be in (0, 1), got " +
                                std::to_string(config.safety_ratio));
  if (config.device_scale < 1.0)
    throw std::invalid_argument("ToleranceConfig: 'device_scale' must be >= 1, got " +
                                std::to_string(config.device_scale));
}

TolerancePolicy computeTolerancePolicy(const ToleranceConfig& config)
{
  validateToleranceConfig(config);

  // Angle subtended by one step at the end of a reference side
  const double angular_step = std::atan(config.step_size / config.reference_length);

  TolerancePolicy policy;
  policy.length = config.safety_ratio * config.step_size;
  policy.right_angle = config.safety_ratio * angular_step;
  policy.flat_angle = policy.right_angle;

  // Pairwise comparisons stay below one angular step as well: a side tilted by a
  // single step is never parallel to its opposite side
  policy.inter_angle = policy.right_angle;
  policy.parallel = policy.right_angle;

  if (config.precision == InputPrecision::NoisyDevice)
  {
    policy.length *= config.device_scale;
    policy.right_angle *= config.device_scale;
    policy.flat_angle *= config.device_scale;
    policy.inter_angle *= config.device_scale;
    policy.parallel *= config.device_scale;
  }

  return policy;
}

TolerancePolicy computeTolerancePolicy(const ToleranceConfig& config, InputPrecision precision)
{
  ToleranceConfig copy = config;
  copy.precision = precision;
  return computeTolerancePolicy(copy);
}

InputPrecision inputPrecisionFromString(const std::string& str)
{
  if (str == "precise")
    return InputPrecision::Precise;
  if (str == "device")
    return InputPrecision::NoisyDevice;
  throw std::runtime_error("Unknown InputPrecision: " + str);
}

std::string inputPrecisionToString(InputPrecision precision)
{
  switch (precision)
  {
    case InputPrecision::Precise:
      return "precise";
    case InputPrecision::NoisyDevice:
      return "device";
  }
  return "unknown";
}

std::ostream& operator<<(std::ostream& os, InputPrecision precision)
{
  return os << inputPrecisionToString(precision);
}

std::ostream& operator<<(std::ostream& os, const ToleranceConfig& config)
{
  os << "ToleranceConfig{step_size=" << config.step_size << ", reference_length=" << config.reference_length
     << ", safety_ratio=" << config.safety_ratio << ", device_scale=" << config.device_scale
     << ", precision=" << config.precision << "}";
  return os;
}

std::ostream& operator<<(std::ostream& os, const TolerancePolicy& policy)
{
  os << "TolerancePolicy{length=" << policy.length << ", inter_angle=" << policy.inter_angle
     << ", right_angle=" << policy.right_angle << ", flat_angle=" << policy.flat_angle
     << ", parallel=" << policy.parallel << "}";
  return os;
}

}  // namespace quadra
