#include "tbolt/hal/mocks/mock_indicator_outputs.h"

namespace tbolt {

void MockIndicatorOutputs::set_indicators(bool disciplined, bool connected) {
  disciplined_ = disciplined;
  connected_ = connected;
  ++write_count_;
}

bool MockIndicatorOutputs::disciplined() const {
  return disciplined_;
}

bool MockIndicatorOutputs::connected() const {
  return connected_;
}

size_t MockIndicatorOutputs::write_count() const {
  return write_count_;
}

} // namespace tbolt
