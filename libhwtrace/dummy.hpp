#pragma once

#include "config.hpp"
#include "trace.hpp"
#include "tracer.hpp"

namespace hwtrace {

// A trace with nothing in it, from a backend that records nothing.
class dummy_trace : public trace {
public:
    std::unique_ptr<block_iterator> iter_blocks() const override;
    size_t capacity() const override;
    bool overflowed() const override;
    error to_file(FILE* file) const override;
};

// Goes through the state machine without touching any hardware.
class dummy_thread_tracer : public thread_tracer {
public:
    explicit dummy_thread_tracer(const config& cfg);

protected:
    error do_start() override;
    error do_stop(std::unique_ptr<trace>& out) override;
};

class dummy_tracer : public tracer {
public:
    explicit dummy_tracer(const config& cfg): m_config(cfg) {}

    std::unique_ptr<thread_tracer> make_thread_tracer() const override;

    const char* name() const override {
        return "dummy";
    }

private:
    config m_config;
};

} // namespace hwtrace
