#include "Emulator.hpp"

#include "cpu/CPU.hpp"
#include "cpu/InterruptController.hpp"
#include "timer/Timer.hpp"
#include "serial/Serial.hpp"
#include "memory/Bus.hpp"
#include "memory/Memory.hpp"
#include "memory/DMA.hpp"
#include "cartridge/Cartridge.hpp"

namespace {

// One frame = 154 scanlines * 456 dots
constexpr uint32_t FRAME_CYCLES = 70224;

// Move a latched peripheral request into IF
template <typename Device>
void ForwardRequest(Device& device, InterruptController& interrupts, uint8_t bit) {
    if (device.IsInterruptRequested()) {
        interrupts.RequestInterrupt(bit);
        device.ClearInterrupt();
    }
}

bool IsTimerRegister(uint16_t addr) { return addr >= 0xFF04 && addr <= 0xFF07; }
bool IsSerialRegister(uint16_t addr) { return addr == 0xFF01 || addr == 0xFF02; }

// $FF40-$FF4B minus $FF46 (DMA)
bool IsLCDRegister(uint16_t addr) {
    return addr >= 0xFF40 && addr <= 0xFF4B && addr != 0xFF46;
}

}  // namespace

Emulator::Emulator(const EmulatorOptions& options)
    : options(options)
    , cpu(std::make_unique<CPU>())
    , ppu(std::make_unique<PPU>())
    , timer(std::make_unique<Timer>())
    , joypad(std::make_unique<Joypad>())
    , serial(std::make_unique<Serial>())
    , bus(std::make_unique<Bus>())
    , memory(std::make_unique<Memory>())
    , dma(std::make_unique<DMA>())
    , cartridge(std::make_unique<Cartridge>())
    , interrupts(std::make_unique<InterruptController>())
    , total_cycles(0)
{
    WireComponents();
    Reset();
}

Emulator::~Emulator() = default;

/**
 * Board wiring
 *
 * The bus only decodes addresses; every region is a pair of callbacks
 * into the chip that owns it. The CPU in turn sees nothing but the bus
 * and the clock line back into TickComponents().
 */
void Emulator::WireComponents() {
    Cartridge& cart = *cartridge;
    PPU& video = *ppu;
    Memory& ram = *memory;

    bus->ConnectCartridge(
        [&cart](uint16_t addr) { return cart.Read(addr); },
        [&cart](uint16_t addr, uint8_t value) { cart.Write(addr, value); }
    );
    bus->ConnectVRAM(
        [&video](uint16_t addr) { return video.ReadVRAM(addr); },
        [&video](uint16_t addr, uint8_t value) { video.WriteVRAM(addr, value); }
    );
    bus->ConnectOAM(
        [&video](uint16_t addr) { return video.ReadOAM(addr); },
        [&video](uint16_t addr, uint8_t value) { video.WriteOAM(addr, value); }
    );
    bus->ConnectWRAM(
        [&ram](uint16_t addr) { return ram.ReadWRAM(addr); },
        [&ram](uint16_t addr, uint8_t value) { ram.WriteWRAM(addr, value); }
    );
    bus->ConnectHRAM(
        [&ram](uint16_t addr) { return ram.ReadHRAM(addr); },
        [&ram](uint16_t addr, uint8_t value) { ram.WriteHRAM(addr, value); }
    );
    bus->ConnectIO(
        [this](uint16_t addr) { return ReadIO(addr); },
        [this](uint16_t addr, uint8_t value) { WriteIO(addr, value); }
    );
    bus->ConnectIE(
        [this](uint16_t) { return interrupts->ReadIE(); },
        [this](uint16_t, uint8_t value) { interrupts->WriteIE(value); }
    );

    // OAM belongs to the DMA engine while a transfer is copying
    bus->ConnectDMA([this]() { return dma->IsBlockingOAM(); });

    cpu->ConnectBus(
        [this](uint16_t addr) { return bus->Read(addr); },
        [this](uint16_t addr, uint8_t value) { bus->Write(addr, value); },
        [this](uint8_t cycles) { TickComponents(cycles); }
    );
    cpu->ConnectInterrupts(interrupts.get());
}

/**
 * I/O page decoder ($FF00-$FF7F)
 *
 * Only the DMG registers of the modelled chips are decoded. Sound
 * ($FF10-$FF3F) and every other hole read as $FF and drop writes.
 */
uint8_t Emulator::ReadIO(uint16_t addr) const {
    if (addr == 0xFF00) return joypad->ReadRegister();
    if (IsSerialRegister(addr)) return serial->ReadRegister(addr);
    if (IsTimerRegister(addr)) return timer->ReadRegister(addr);
    if (addr == 0xFF0F) return interrupts->ReadIF();
    if (addr == 0xFF46) return dma->ReadRegister();
    if (IsLCDRegister(addr)) return ppu->ReadRegister(addr);
    return 0xFF;
}

void Emulator::WriteIO(uint16_t addr, uint8_t value) {
    if (addr == 0xFF00) {
        joypad->WriteRegister(value);
    } else if (IsSerialRegister(addr)) {
        serial->WriteRegister(addr, value);
    } else if (IsTimerRegister(addr)) {
        timer->WriteRegister(addr, value);
    } else if (addr == 0xFF0F) {
        interrupts->WriteIF(value);
    } else if (addr == 0xFF46) {
        dma->WriteRegister(value);
    } else if (IsLCDRegister(addr)) {
        ppu->WriteRegister(addr, value);
    }

    // A select or enable bit can raise a request on the spot
    UpdateInterrupts();
}

// === Cartridge and Power ===

bool Emulator::LoadROM(const std::string& path) {
    if (!cartridge->LoadROM(path)) {
        return false;
    }
    Reset();
    return true;
}

bool Emulator::LoadROMData(std::vector<uint8_t> data) {
    if (!cartridge->LoadROMData(std::move(data))) {
        return false;
    }
    Reset();
    return true;
}

const std::string& Emulator::GetLoadError() const {
    return cartridge->GetLoadError();
}

void Emulator::Reset() {
    // Straight to the post-boot state, no boot ROM is executed
    cpu->Reset();
    ppu->Reset();
    timer->Reset();
    joypad->Reset();
    serial->Reset();
    memory->Reset();
    dma->Reset();
    interrupts->Reset();

    ppu->SetStrictAccess(options.strict_vram_access);
    cpu->SetTraceEnabled(options.trace);

    total_cycles = 0;
}

// === Clock ===

/**
 * Execute one CPU step (instruction, interrupt dispatch or idle slot).
 *
 * Peripherals are advanced from inside the CPU's bus accesses, so when
 * this returns they are exactly the returned number of T-cycles ahead.
 */
uint8_t Emulator::Step() {
    uint8_t cycles = cpu->Step();
    total_cycles += cycles;
    return cycles;
}

void Emulator::StepCycles(uint32_t cycles) {
    uint64_t target = total_cycles + cycles;
    while (total_cycles < target) {
        Step();
    }
}

void Emulator::RunFrame() {
    ppu->ClearFrameComplete();

    // Bounded so a program that switched the LCD off still returns
    uint32_t elapsed = 0;
    while (!ppu->IsFrameComplete() && elapsed < FRAME_CYCLES) {
        elapsed += Step();
    }
}

// Called once per CPU M-cycle (or per idle slot) with the elapsed T-cycles
void Emulator::TickComponents(uint8_t cycles) {
    ProcessDMA(cycles);
    ppu->Step(cycles);
    timer->Step(cycles);
    serial->Step(cycles);
    UpdateInterrupts();
}

void Emulator::UpdateInterrupts() {
    InterruptController& irq = *interrupts;

    // The PPU drives two separate lines
    if (ppu->IsVBlankInterruptRequested()) {
        irq.RequestInterrupt(InterruptController::VBLANK);
        ppu->ClearVBlankInterrupt();
    }
    if (ppu->IsStatInterruptRequested()) {
        irq.RequestInterrupt(InterruptController::STAT);
        ppu->ClearStatInterrupt();
    }

    ForwardRequest(*timer, irq, InterruptController::TIMER);
    ForwardRequest(*serial, irq, InterruptController::SERIAL);
    ForwardRequest(*joypad, irq, InterruptController::JOYPAD);
}

/**
 * OAM DMA data path: the controller only counts, the board moves the
 * bytes. Source reads use the DMA view of the bus, which is not subject
 * to the OAM block.
 */
void Emulator::ProcessDMA(uint8_t cycles) {
    if (!dma->IsActive()) return;

    uint8_t due = dma->Step(cycles);
    while (due > 0 && dma->IsActive()) {
        ppu->DMAWriteOAM(dma->GetOAMIndex(), bus->DMARead(dma->GetSourceAddress()));
        dma->AcknowledgeTransfer();
        due--;
    }
}

// === Outputs ===

const PPU::Framebuffer& Emulator::GetFramebuffer() const {
    return ppu->GetFramebuffer();
}

bool Emulator::IsFrameComplete() const {
    return ppu->IsFrameComplete();
}

void Emulator::ClearFrameComplete() {
    ppu->ClearFrameComplete();
}

void Emulator::SetButton(Joypad::Button button, bool pressed) {
    joypad->SetButton(button, pressed);
    UpdateInterrupts();
}

const std::string& Emulator::GetSerialOutput() const {
    return serial->GetOutput();
}

// === Debug ===

uint16_t Emulator::GetPC() const { return cpu->GetPC(); }
uint16_t Emulator::GetSP() const { return cpu->GetSP(); }
uint16_t Emulator::GetAF() const { return cpu->GetAF(); }
uint16_t Emulator::GetBC() const { return cpu->GetBC(); }
uint16_t Emulator::GetDE() const { return cpu->GetDE(); }
uint16_t Emulator::GetHL() const { return cpu->GetHL(); }
uint8_t Emulator::GetPPUMode() const { return ppu->GetMode(); }
uint8_t Emulator::GetLY() const { return ppu->GetLY(); }

std::string Emulator::DumpCPUState() const {
    return cpu->DumpState();
}

std::string Emulator::GetCartridgeInfo() const {
    return cartridge->GetDetailedInfo();
}

uint8_t Emulator::DebugRead(uint16_t addr) const {
    return bus->Read(addr);
}

void Emulator::DebugWrite(uint16_t addr, uint8_t value) {
    bus->Write(addr, value);
}
