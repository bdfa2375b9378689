#include "Memory.hpp"

Memory::Memory() {
    Reset();
}

void Memory::Reset() {
    wram.fill(0);
    hram.fill(0);
}
