#pragma once

#include <cstddef>

#include "tbolt/hal/interfaces.h"

namespace tbolt {

class MockIndicatorOutputs : public IIndicatorOutputs {
 public:
  void set_indicators(bool disciplined, bool connected) override;

  bool disciplined() const;
  bool connected() const;
  size_t write_count() const;

 private:
  bool disciplined_ = false;
  bool connected_ = false;
  size_t write_count_ = 0;
};

} // namespace tbolt
