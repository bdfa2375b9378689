#include "InterruptController.hpp"

InterruptController::InterruptController() {
    Reset();
}

void InterruptController::Reset() {
    // Post-boot IF has VBlank latched
    interrupt_flag = VBLANK;
    interrupt_enable = 0;
}

int8_t InterruptController::GetHighestPriorityInterrupt() const {
    uint8_t pending = GetPendingInterrupts();

    if (!pending) return -1;

    // Bit 0 = highest priority
    for (int8_t i = 0; i < 5; i++) {
        if (pending & (1 << i)) {
            return i;
        }
    }

    return -1;
}

uint16_t InterruptController::Acknowledge(uint8_t index) {
    interrupt_flag &= static_cast<uint8_t>(~(1 << index));
    return GetInterruptVector(index);
}
