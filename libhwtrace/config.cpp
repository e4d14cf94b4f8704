#include "config.hpp"

#include <ctype.h>
#include <errno.h>
#include <stdlib.h>
#include <string.h>

#include <sstream>

namespace hwtrace {

namespace {

const size_t DEFAULT_DATA_PAGES = 64;
const size_t DEFAULT_AUX_PAGES = 1024;

bool is_power_of_two(size_t n) {
    return n != 0 && (n & (n - 1)) == 0;
}

// Reads a page count, leaving 0 for validate() to report when `str` isn't a
// plain decimal number that fits.
size_t parse_pages(const char* str) {
    while (::isspace(static_cast<unsigned char>(*str))) {
        ++str;
    }
    if (!::isdigit(static_cast<unsigned char>(*str))) {
        return 0;
    }

    char* end = nullptr;
    errno = 0;
    unsigned long pages = ::strtoul(str, &end, 10);
    if (errno == ERANGE || *end != 0) {
        return 0;
    }
    return pages;
}

bool parse_flag(const char* str) {
    return ::strcmp(str, "0") != 0 && ::strcmp(str, "false") != 0 && ::strcmp(str, "no") != 0;
}

}

const char* backend_name(backend_kind backend) {
    switch (backend) {
    case BACKEND_AUTOMATIC:
        return "auto";
    case BACKEND_PERF_PT:
        return "perf_pt";
    case BACKEND_DUMMY:
        return "dummy";
    case BACKEND_UNKNOWN:
        break;
    }
    return "unknown";
}

bool parse_backend(const char* str, backend_kind& backend) {
    if (::strcmp(str, "auto") == 0) {
        backend = BACKEND_AUTOMATIC;
    } else if (::strcmp(str, "perf_pt") == 0) {
        backend = BACKEND_PERF_PT;
    } else if (::strcmp(str, "dummy") == 0) {
        backend = BACKEND_DUMMY;
    } else {
        return false;
    }
    return true;
}

const size_t config::MAX_RING_PAGES;

config::config():
    backend(BACKEND_AUTOMATIC),
    data_pages(DEFAULT_DATA_PAGES),
    aux_pages(DEFAULT_AUX_PAGES),
    exclusive_threads(true),
    debug(false) {}

config config::from_env() {
    config result;

    auto backend_str = std::getenv("HWTRACE_BACKEND");
    auto data_pages_str = std::getenv("HWTRACE_DATA_PAGES");
    auto aux_pages_str = std::getenv("HWTRACE_AUX_PAGES");
    auto exclusive_str = std::getenv("HWTRACE_EXCLUSIVE");
    auto debug_str = std::getenv("HWTRACE_DEBUG");

    if (backend_str && !parse_backend(backend_str, result.backend)) {
        // Left for validate() to report.
        result.backend = BACKEND_UNKNOWN;
    }
    if (data_pages_str) {
        result.data_pages = parse_pages(data_pages_str);
    }
    if (aux_pages_str) {
        result.aux_pages = parse_pages(aux_pages_str);
    }
    if (exclusive_str) {
        result.exclusive_threads = parse_flag(exclusive_str);
    }
    if (debug_str) {
        result.debug = parse_flag(debug_str);
    }

    return result;
}

error config::validate() const {
    if (backend == BACKEND_UNKNOWN) {
        return error::backend_configuration("unknown backend");
    }
    if (data_pages > MAX_RING_PAGES || aux_pages > MAX_RING_PAGES) {
        std::ostringstream detail;
        detail << "ring sizes are limited to " << MAX_RING_PAGES << " pages, got data "
               << data_pages << " and aux " << aux_pages;
        return error::backend_configuration(detail.str());
    }
    if (!is_power_of_two(data_pages)) {
        std::ostringstream detail;
        detail << "data ring size must be a power of two pages, got " << data_pages;
        return error::backend_configuration(detail.str());
    }
    if (!is_power_of_two(aux_pages)) {
        std::ostringstream detail;
        detail << "aux ring size must be a power of two pages, got " << aux_pages;
        return error::backend_configuration(detail.str());
    }
    return error();
}

} // namespace hwtrace
