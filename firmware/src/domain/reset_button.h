#pragma once

#include <cstdint>

namespace tbolt {
namespace domain {

/**
 * Long-press detector sampled at a fixed period. Each pressed sample counts
 * up, each released sample counts down, so short glitches decay instead of
 * accumulating. Fires once when the count passes kHoldSamples.
 */
class ResetButton {
 public:
  static constexpr uint8_t kHoldSamples = 7;  ///< About 2 s at a 250 ms sample period.

  /** Returns true on the sample that completes a long press. */
  bool sample(bool pressed);
  uint8_t count() const;

 private:
  uint8_t count_ = 0;
};

} // namespace domain
} // namespace tbolt
