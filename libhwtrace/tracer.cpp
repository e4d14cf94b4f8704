#include "tracer.hpp"

#include <iostream>

#include "cpu_utils.hpp"
#include "dummy.hpp"
#include "log.hpp"
#include "pt_collect.hpp"
#include "thread_registry.hpp"

namespace hwtrace {

thread_tracer::thread_tracer(bool exclusive):
    m_state(TRACER_STOPPED), m_exclusive(exclusive), m_tid(0) {}

thread_tracer::~thread_tracer() {
    if (m_state == TRACER_STARTED && m_exclusive) {
        thread_registry::instance().release(m_tid);
    }
}

error thread_tracer::start_tracing() {
    if (m_state == TRACER_STARTED) {
        return error::tracer_state_error(TRACER_STARTED);
    }

    pid_t tid = current_tid();
    if (m_exclusive) {
        error err = thread_registry::instance().acquire(tid);
        if (!err.ok()) {
            return err;
        }
    }

    error err = do_start();
    if (!err.ok()) {
        if (m_exclusive) {
            thread_registry::instance().release(tid);
        }
        HWT_DEBUG(std::cerr << "hwtrace: start failed on thread " << tid << ": " << err.message() << std::endl);
        return err;
    }

    m_tid = tid;
    m_state = TRACER_STARTED;
    return error();
}

error thread_tracer::stop_tracing(std::unique_ptr<trace>& out) {
    if (m_state == TRACER_STOPPED) {
        return error::tracer_state_error(TRACER_STOPPED);
    }

    error err = do_stop(out);

    // The backend has let go of the kernel side either way.
    m_state = TRACER_STOPPED;
    if (m_exclusive) {
        thread_registry::instance().release(m_tid);
    }

    if (!err.ok()) {
        out.reset();
        HWT_DEBUG(std::cerr << "hwtrace: stop failed on thread " << m_tid << ": " << err.message() << std::endl);
    }
    return err;
}

error create_tracer(const config& cfg, std::unique_ptr<tracer>& out) {
    error err = cfg.validate();
    if (!err.ok()) {
        return err;
    }
    set_debug_enabled(cfg.debug);

    switch (cfg.backend) {
    case BACKEND_PERF_PT:
        if (!pt_supported()) {
            return error::no_hardware_support("Intel PT is not available on this machine");
        }
        out.reset(new pt_tracer(cfg));
        break;
    case BACKEND_DUMMY:
        out.reset(new dummy_tracer(cfg));
        break;
    case BACKEND_AUTOMATIC:
        if (pt_supported()) {
            out.reset(new pt_tracer(cfg));
        } else {
            out.reset(new dummy_tracer(cfg));
        }
        break;
    case BACKEND_UNKNOWN:
        return error::backend_configuration("unknown backend");
    }

    HWT_DEBUG(std::cerr << "hwtrace: selected backend " << out->name() << std::endl);
    return error();
}

} // namespace hwtrace
