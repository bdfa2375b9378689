#include "DMA.hpp"

DMA::DMA() {
    Reset();
}

void DMA::Reset() {
    source_page = 0xFF;
    byte_index = 0;
    cycle_counter = 0;
    active = false;
    starting = false;
    restarting = false;
}

uint8_t DMA::Step(uint8_t cycles) {
    if (!active) return 0;

    cycle_counter += cycles;
    uint8_t due = 0;

    while (cycle_counter >= CYCLES_PER_BYTE) {
        cycle_counter -= CYCLES_PER_BYTE;
        if (starting) {
            starting = false;
            restarting = false;
            continue;
        }
        if (byte_index + due < BYTES_TO_TRANSFER) {
            due++;
        }
    }

    return due;
}

void DMA::WriteRegister(uint8_t value) {
    // A write during a transfer restarts it from the new page
    restarting = IsBlockingOAM();
    source_page = value;
    byte_index = 0;
    cycle_counter = 0;
    active = true;
    starting = true;
}

void DMA::AcknowledgeTransfer() {
    byte_index++;
    if (byte_index >= BYTES_TO_TRANSFER) {
        active = false;
        restarting = false;
        byte_index = 0;
    }
}
