#pragma once

#include <stdint.h>

namespace hwtrace {

struct cpu_id {
    bool intel;
    uint16_t family;
    uint8_t model;
    uint8_t stepping;
};

// Identifies the running CPU, for selecting decoder errata.
cpu_id read_cpu_id();

// CPUID.(EAX=07H,ECX=0):EBX[bit 25].
bool cpu_has_pt();

// Reads the dynamic perf PMU type of intel_pt from sysfs.
bool read_pt_pmu_type(uint32_t& type);

// The CPU and the kernel can both do Intel PT.
bool pt_supported();

} // namespace hwtrace
