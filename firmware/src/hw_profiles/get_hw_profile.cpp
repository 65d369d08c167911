#include "hw_profile.h"

namespace tbolt {

extern const HwProfile kDevkitEsp32Profile;
extern const HwProfile kDevkitEsp32s3Profile;

const HwProfile& get_hw_profile() {
#if defined(HW_PROFILE_DEVKIT_ESP32)
  return kDevkitEsp32Profile;
#elif defined(HW_PROFILE_DEVKIT_ESP32S3)
  return kDevkitEsp32s3Profile;
#else
#error "Select HW profile via build define (HW_PROFILE_DEVKIT_ESP32 or HW_PROFILE_DEVKIT_ESP32S3)"
#endif
}

} // namespace tbolt
