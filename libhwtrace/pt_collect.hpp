#pragma once

#include <stddef.h>
#include <stdint.h>

#include <vector>

#include "config.hpp"
#include "trace.hpp"
#include "tracer.hpp"

namespace hwtrace {

/*
 * Intel PT collection through perf_event_open(2).
 *
 * Each start opens an intel_pt event for the calling thread, maps its data
 * and AUX rings and enables it. Stop disables the event, copies the AUX ring
 * into a buffer owned by the returned trace and tears everything down.
 *
 * The AUX ring is mapped writable, so the kernel runs it in non-overwrite
 * mode: once it is full, collection stops, the newest data is lost and the
 * trace reports overflowed().
 */
class pt_thread_tracer : public thread_tracer {
public:
    explicit pt_thread_tracer(const config& cfg);
    ~pt_thread_tracer();

protected:
    error do_start() override;
    error do_stop(std::unique_ptr<trace>& out) override;

private:
    error open_perf_pt();
    error allocate_memory_for_perf_data();
    void drain_aux(std::vector<uint8_t>& out);
    bool process_perf_records();
    void release();

    size_t m_data_pages;
    size_t m_aux_pages;

    int m_perf_fd;

    void* m_perf_data_ptr;
    size_t m_perf_data_sz;

    void* m_aux_data_ptr;
    size_t m_aux_data_sz;
};

class pt_tracer : public tracer {
public:
    explicit pt_tracer(const config& cfg): m_config(cfg) {}

    std::unique_ptr<thread_tracer> make_thread_tracer() const override;

    const char* name() const override {
        return "perf_pt";
    }

private:
    config m_config;
};

} // namespace hwtrace
