#include "cpu_utils.hpp"

#include <string.h>

#include <fstream>

namespace hwtrace {

namespace {

const char* PT_PMU_TYPE_PATH = "/sys/bus/event_source/devices/intel_pt/type";
const uint32_t CPUID_EBX_INTEL_PT = 1 << 25;

struct cpuid_regs {
    uint32_t eax;
    uint32_t ebx;
    uint32_t ecx;
    uint32_t edx;
};

cpuid_regs cpuid(uint32_t leaf, uint32_t subleaf) {
    cpuid_regs regs = {};
#if defined(__x86_64__) || defined(__i386__)
    __asm__ __volatile__("cpuid"
                         : "=a"(regs.eax), "=b"(regs.ebx), "=c"(regs.ecx), "=d"(regs.edx)
                         : "a"(leaf), "c"(subleaf));
#else
    (void) leaf;
    (void) subleaf;
#endif
    return regs;
}

bool vendor_is_intel(const cpuid_regs& leaf0) {
    char vendor[12];
    ::memcpy(vendor, &leaf0.ebx, 4);
    ::memcpy(vendor + 4, &leaf0.edx, 4);
    ::memcpy(vendor + 8, &leaf0.ecx, 4);
    return ::memcmp(vendor, "GenuineIntel", sizeof(vendor)) == 0;
}

}

cpu_id read_cpu_id() {
    cpu_id result = {};

    auto leaf0 = cpuid(0, 0);
    result.intel = vendor_is_intel(leaf0);
    if (leaf0.eax < 1) {
        return result;
    }

    auto eax = cpuid(1, 0).eax;
    result.stepping = eax & 0xf;
    result.model = (eax >> 4) & 0xf;
    result.family = (eax >> 8) & 0xf;
    if (result.family == 0xf) {
        result.family += (eax >> 20) & 0xff;
    }
    if (result.family == 0x6 || result.family >= 0xf) {
        result.model += ((eax >> 16) & 0xf) << 4;
    }
    return result;
}

bool cpu_has_pt() {
    auto leaf0 = cpuid(0, 0);
    if (!vendor_is_intel(leaf0) || leaf0.eax < 7) {
        return false;
    }
    return (cpuid(7, 0).ebx & CPUID_EBX_INTEL_PT) != 0;
}

bool read_pt_pmu_type(uint32_t& type) {
    std::ifstream pt_id_fl(PT_PMU_TYPE_PATH);
    if (!pt_id_fl) {
        return false;
    }
    pt_id_fl >> type;
    return !pt_id_fl.fail();
}

bool pt_supported() {
    uint32_t type;
    return cpu_has_pt() && read_pt_pmu_type(type);
}

} // namespace hwtrace
