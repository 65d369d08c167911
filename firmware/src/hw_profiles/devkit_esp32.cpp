#include "hw_profile.h"

namespace tbolt {

extern const HwProfile kDevkitEsp32Profile = {
    "devkit_esp32",
    Pins{
        16,  // tsip_rx: UART2 RX via MAX3232
        17,  // tsip_tx
        25,  // led_disciplined
        26,  // led_connected
        0,   // reset_button: BOOT
    },
    Caps{
        2,     // tsip_uart
        true,  // has_reset_button
    },
};

} // namespace tbolt
