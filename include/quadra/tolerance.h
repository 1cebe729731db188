#ifndef QUADRA_TOLERANCE_H_
#define QUADRA_TOLERANCE_H_

#include <iostream>
#include <string>

namespace quadra {

enum class InputPrecision
{
  Precise,      // pointer / keyboard
  NoisyDevice,  // tangible external device
};

/**
 * @brief Input characteristics the tolerance intervals are derived from
 */
struct ToleranceConfig
{
  double step_size = 0.0625;      // smallest position increment of the input source
  double reference_length = 1.0;  // side length over which one step subtends the angular step
  double safety_ratio = 0.5;      // fraction of one step still judged "equal", in (0, 1)
  double device_scale = 4.0;      // widening multiplier for NoisyDevice, >= 1
  InputPrecision precision = InputPrecision::Precise;
};

/**
 * @brief Epsilons used by every detector of a single classification call
 *
 * All angles in radians, lengths in position units.
 */
struct TolerancePolicy
{
  double length = 0.0;       // |len1 - len2|
  double inter_angle = 0.0;  // |angle1 - angle2|
  double right_angle = 0.0;  // |angle - pi/2|
  double flat_angle = 0.0;   // |angle - pi|
  double parallel = 0.0;     // angle between two lines
};

// Throws std::invalid_argument on a non-finite or out of range field.
void validateToleranceConfig(const ToleranceConfig& config);

TolerancePolicy computeTolerancePolicy(const ToleranceConfig& config);

// Same config with only the precision class swapped
TolerancePolicy computeTolerancePolicy(const ToleranceConfig& config, InputPrecision precision);

InputPrecision inputPrecisionFromString(const std::string& str);
std::string inputPrecisionToString(InputPrecision precision);

std::ostream& operator<<(std::ostream& os, InputPrecision precision);
std::ostream& operator<<(std::ostream& os, const ToleranceConfig& config);
std::ostream& operator<<(std::ostream& os, const TolerancePolicy& policy);

}  // namespace quadra

#endif  // QUADRA_TOLERANCE_H_
