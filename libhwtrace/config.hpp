#pragma once

#include <stddef.h>

#include "error.hpp"

namespace hwtrace {

enum backend_kind {
    BACKEND_AUTOMATIC,
    BACKEND_PERF_PT,
    BACKEND_DUMMY,
    BACKEND_UNKNOWN
};

const char* backend_name(backend_kind backend);
bool parse_backend(const char* str, backend_kind& backend);

/*
 * Tuning shared by a tracer and every thread tracer it hands out.
 *
 * Page counts are in units of the system page size and must be powers of
 * two: the kernel rejects anything else for both perf rings.
 */
struct config {
    // Upper bound on either ring, 4 GiB with 4 KiB pages.
    static const size_t MAX_RING_PAGES = 1 << 20;

    config();

    backend_kind backend;
    size_t data_pages;          // perf data ring size, excluding the header page.
    size_t aux_pages;           // AUX ring size, which bounds one trace.
    bool exclusive_threads;     // Refuse to trace a thread twice at once.
    bool debug;

    // Defaults, overridden by HWTRACE_* environment variables.
    static config from_env();

    error validate() const;
};

} // namespace hwtrace
