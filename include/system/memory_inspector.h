#pragma once

#include <cstdint>
#include <functional>

namespace wcache {

struct MemoryInfo {
    uint64_t total_ram_bytes{0};
    uint64_t total_swap_bytes{0};

    uint64_t totalBytes() const { return total_ram_bytes + total_swap_bytes; }
    uint64_t totalMb() const { return totalBytes() / (1024ull * 1024ull); }
};

// Injected so tests can pin the budget.
using MemoryProvider = std::function<MemoryInfo()>;

// Physical memory and swap of the host. Zeroes on platforms or failures where
// the figures cannot be read.
MemoryInfo sampleSystemMemory();

// (ram + swap) * ratio, in MiB.
uint64_t memoryBudgetMb(const MemoryInfo& info, double ratio);

}  // namespace wcache
