#pragma once

#include <cstdint>

/**
 * DMA - OAM DMA Transfer Controller
 *
 * Hardware Behavior:
 * - Writing $FF46 starts a copy of 160 bytes from (value << 8) into OAM
 * - One M-cycle of start-up, then one byte per M-cycle (4 T-cycles)
 * - While bytes are moving, the CPU cannot see OAM
 * - Does NOT know about CPU - the Emulator performs the reads/writes it asks for
 */
class DMA {
public:
    DMA();

    void Reset();

    // Advance by T-cycles. Returns how many bytes are due to be copied
    // during this step; the caller copies them via GetSourceAddress /
    // GetOAMIndex / AcknowledgeTransfer.
    uint8_t Step(uint8_t cycles);

    // === Register Interface ($FF46) ===
    uint8_t ReadRegister() const { return source_page; }
    void WriteRegister(uint8_t value);

    bool IsActive() const { return active; }
    // A restart keeps OAM hidden through its own start-up cycle
    bool IsBlockingOAM() const { return active && (!starting || restarting); }

    uint16_t GetSourceAddress() const {
        return (static_cast<uint16_t>(source_page) << 8) | byte_index;
    }
    uint8_t GetOAMIndex() const { return byte_index; }
    void AcknowledgeTransfer();

    static constexpr uint8_t BYTES_TO_TRANSFER = 160;

private:
    uint8_t source_page;
    uint8_t byte_index;
    uint8_t cycle_counter;
    bool active;
    bool starting;          // Start-up M-cycle, OAM still visible
    bool restarting;        // Started over a transfer that was already copying

    static constexpr uint8_t CYCLES_PER_BYTE = 4;
};
