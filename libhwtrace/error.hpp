#pragma once

#include <string>

#include <sys/types.h>

#include "tracer_state.hpp"

namespace hwtrace {

enum error_kind {
    ERR_NONE,
    ERR_TRACER_STATE,
    ERR_NO_HARDWARE_SUPPORT,
    ERR_PERMISSION_DENIED,
    ERR_BACKEND_CONFIGURATION,
    ERR_THREAD_ALREADY_TRACED,
    ERR_IO,
    ERR_BUFFER_OVERFLOW,
    ERR_DECODE,
    ERR_FATAL
};

const char* error_kind_name(error_kind kind);

/*
 * Status value returned by every fallible operation.
 *
 * A default-constructed error is a success. Backend failures (errno values,
 * libipt status codes) are folded into one of the kinds above before they
 * reach the caller.
 */
class error {
public:
    error(): m_kind(ERR_NONE), m_state(TRACER_STOPPED) {}

    error(error_kind kind, const std::string& detail):
        m_kind(kind), m_state(TRACER_STOPPED), m_detail(detail) {}

    static error tracer_state_error(tracer_state state);
    static error no_hardware_support(const std::string& detail);
    static error permission_denied(const std::string& detail);
    static error backend_configuration(const std::string& detail);
    static error thread_already_traced(pid_t tid);
    static error io(const std::string& detail);
    static error buffer_overflow(const std::string& detail);
    static error decode(const std::string& detail);
    static error fatal(const std::string& detail);

    // Maps an errno value from the kernel trace source to an error kind.
    static error from_errno(int err, const std::string& what);

    bool ok() const {
        return m_kind == ERR_NONE;
    }

    error_kind kind() const {
        return m_kind;
    }

    // Only meaningful for ERR_TRACER_STATE.
    tracer_state state() const {
        return m_state;
    }

    const std::string& detail() const {
        return m_detail;
    }

    // The caller may keep going: retry the call, or keep pulling blocks.
    bool recoverable() const;

    // A block sequence ends right after yielding this error.
    bool terminal() const;

    std::string message() const;

private:
    error_kind m_kind;
    tracer_state m_state;
    std::string m_detail;
};

} // namespace hwtrace
