/**
 * @file constants.hpp
 * @brief Engine-wide constants.
 * @author oafield developers
 */
#pragma once

#include <cstddef>
#include <limits>

namespace oafield::core::constants {

// Cubic scattered interpolation needs at least this many samples.
constexpr std::size_t kMinValidSamples = 4;

constexpr double kDefaultPaddingFraction = 0.05;
// Applied on each side of an axis whose sample span is zero.
constexpr double kMinAbsolutePaddingDeg = 0.01;

constexpr std::size_t kDefaultGridResolution = 200;

constexpr double kLatMinDeg = -90.0;
constexpr double kLatMaxDeg = 90.0;
constexpr double kLonMinDeg = -180.0;
constexpr double kLonMaxDeg = 180.0;

// Marker stored in a Field for nodes without an estimate.
constexpr double kNoEstimate = std::numeric_limits<double>::quiet_NaN();

}  // namespace oafield::core::constants
