#include "system/memory_inspector.h"

#if defined(_WIN32)
#include <windows.h>
#elif defined(__APPLE__)
#include <sys/sysctl.h>
#include <sys/types.h>
#elif defined(__linux__)
#include <sys/sysinfo.h>
#endif

namespace wcache {

MemoryInfo sampleSystemMemory() {
    MemoryInfo info;
#if defined(_WIN32)
    MEMORYSTATUSEX status;
    status.dwLength = sizeof(status);
    if (!GlobalMemoryStatusEx(&status)) {
        return info;
    }
    info.total_ram_bytes = static_cast<uint64_t>(status.ullTotalPhys);
    // ullTotalPageFile is the commit limit: physical memory plus page files.
    const uint64_t commit = static_cast<uint64_t>(status.ullTotalPageFile);
    info.total_swap_bytes = commit > info.total_ram_bytes ? commit - info.total_ram_bytes : 0;
#elif defined(__APPLE__)
    uint64_t memsize = 0;
    size_t len = sizeof(memsize);
    if (sysctlbyname("hw.memsize", &memsize, &len, nullptr, 0) == 0) {
        info.total_ram_bytes = memsize;
    }
    xsw_usage swap{};
    len = sizeof(swap);
    if (sysctlbyname("vm.swapusage", &swap, &len, nullptr, 0) == 0) {
        info.total_swap_bytes = static_cast<uint64_t>(swap.xsu_total);
    }
#elif defined(__linux__)
    struct sysinfo si;
    if (sysinfo(&si) != 0) {
        return info;
    }
    info.total_ram_bytes = static_cast<uint64_t>(si.totalram) * static_cast<uint64_t>(si.mem_unit);
    info.total_swap_bytes = static_cast<uint64_t>(si.totalswap) * static_cast<uint64_t>(si.mem_unit);
#endif
    return info;
}

uint64_t memoryBudgetMb(const MemoryInfo& info, double ratio) {
    if (ratio <= 0.0) return 0;
    return static_cast<uint64_t>(static_cast<double>(info.totalMb()) * ratio);
}

}  // namespace wcache
