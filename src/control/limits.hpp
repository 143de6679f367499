#pragma once

/**
 * @brief Mechanical limits of the press servo
 *
 * A standard hobby servo covers 0 to 180 degrees over a 0.5 ms to 2.5 ms
 * pulse. Rest and press angles must both lie inside this range.
 */
struct ServoLimits {
  int min_deg{0};    ///< Minimum reachable angle in degrees
  int max_deg{180};  ///< Maximum reachable angle in degrees

  /**
   * @brief Clamp an angle to [min_deg, max_deg]
   */
  int clamp(int deg) const {
    if (deg < min_deg) return min_deg;
    if (deg > max_deg) return max_deg;
    return deg;
  }

  bool contains(int deg) const {
    return deg >= min_deg && deg <= max_deg;
  }
};
