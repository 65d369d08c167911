#include "domain/reset_button.h"

namespace tbolt {
namespace domain {

constexpr uint8_t ResetButton::kHoldSamples;

bool ResetButton::sample(bool pressed) {
  if (pressed) {
    ++count_;
  } else if (count_ > 0) {
    --count_;
  }
  if (count_ > kHoldSamples) {
    count_ = 0;
    return true;
  }
  return false;
}

uint8_t ResetButton::count() const {
  return count_;
}

} // namespace domain
} // namespace tbolt
