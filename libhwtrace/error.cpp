#include "error.hpp"

#include <string.h>
#include <errno.h>

#include <sstream>

namespace hwtrace {

const char* tracer_state_name(tracer_state state) {
    switch (state) {
    case TRACER_STARTED:
        return "started";
    case TRACER_STOPPED:
        return "stopped";
    }
    return "unknown";
}

const char* error_kind_name(error_kind kind) {
    switch (kind) {
    case ERR_NONE:                  return "none";
    case ERR_TRACER_STATE:          return "tracer state";
    case ERR_NO_HARDWARE_SUPPORT:   return "no hardware support";
    case ERR_PERMISSION_DENIED:     return "permission denied";
    case ERR_BACKEND_CONFIGURATION: return "backend configuration";
    case ERR_THREAD_ALREADY_TRACED: return "thread already traced";
    case ERR_IO:                    return "i/o";
    case ERR_BUFFER_OVERFLOW:       return "buffer overflow";
    case ERR_DECODE:                return "decode";
    case ERR_FATAL:                 return "fatal";
    }
    return "unknown";
}

error error::tracer_state_error(tracer_state state) {
    error result(ERR_TRACER_STATE, std::string("tracer is already ") + tracer_state_name(state));
    result.m_state = state;
    return result;
}

error error::no_hardware_support(const std::string& detail) {
    return error(ERR_NO_HARDWARE_SUPPORT, detail);
}

error error::permission_denied(const std::string& detail) {
    return error(ERR_PERMISSION_DENIED, detail);
}

error error::backend_configuration(const std::string& detail) {
    return error(ERR_BACKEND_CONFIGURATION, detail);
}

error error::thread_already_traced(pid_t tid) {
    std::ostringstream detail;
    detail << "thread " << tid << " is already being traced";
    return error(ERR_THREAD_ALREADY_TRACED, detail.str());
}

error error::io(const std::string& detail) {
    return error(ERR_IO, detail);
}

error error::buffer_overflow(const std::string& detail) {
    return error(ERR_BUFFER_OVERFLOW, detail);
}

error error::decode(const std::string& detail) {
    return error(ERR_DECODE, detail);
}

error error::fatal(const std::string& detail) {
    return error(ERR_FATAL, detail);
}

error error::from_errno(int err, const std::string& what) {
    std::string detail = what + ": " + ::strerror(err);
    switch (err) {
    case EACCES:
    case EPERM:
        return permission_denied(detail);
    case ENOENT:
    case ENODEV:
    case EOPNOTSUPP:
        return no_hardware_support(detail);
    default:
        return backend_configuration(detail);
    }
}

bool error::recoverable() const {
    switch (m_kind) {
    case ERR_TRACER_STATE:
    case ERR_BUFFER_OVERFLOW:
    case ERR_DECODE:
        return true;
    default:
        return false;
    }
}

bool error::terminal() const {
    return m_kind == ERR_FATAL;
}

std::string error::message() const {
    if (ok()) {
        return "ok";
    }
    std::string result = error_kind_name(m_kind);
    if (!m_detail.empty()) {
        result += ": ";
        result += m_detail;
    }
    return result;
}

} // namespace hwtrace
