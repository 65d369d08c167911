#include "hw_profile.h"

namespace tbolt {

extern const HwProfile kDevkitEsp32s3Profile = {
    "devkit_esp32s3",
    Pins{
        18,  // tsip_rx: UART1 RX via MAX3232
        -1,  // tsip_tx: not wired
        4,   // led_disciplined
        5,   // led_connected
        0,   // reset_button: BOOT
    },
    Caps{
        1,     // tsip_uart
        true,  // has_reset_button
    },
};

} // namespace tbolt
