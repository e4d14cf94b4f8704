#include "pt_collect.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>

#include <errno.h>
#include <string.h>
#include <time.h>

#include <sys/types.h>
#include <linux/perf_event.h>
#include <sys/mman.h>
#include <sys/syscall.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include "cpu_utils.hpp"
#include "image_map.hpp"
#include "log.hpp"
#include "pt_trace.hpp"
#include "thread_registry.hpp"

namespace hwtrace {

namespace {

// intel_pt PMU format bit "branch": trace control flow only, no timing packets.
const __u64 PT_CONFIG_BRANCH_EN = 1ULL << 13;

// perf_event_open() reports EBUSY while another PT user holds the hardware.
const time_t PERF_OPEN_TIMEOUT_SEC = 3;

struct perf_record_aux_sample {
    struct perf_event_header header;
    __u64    aux_offset;
    __u64    aux_size;
    __u64    flags;
    // ...
    // More variable-sized data follows, but we don't use it.
};

template <typename T>
T load_atomically(T* ptr) {
    return std::atomic_load<T>((std::atomic<T>*)ptr);
}

template <typename T>
void store_atomically(T* ptr, T value) {
    std::atomic_store((std::atomic<T>*)ptr, value);
}

// Copies `len` bytes starting at absolute position `pos` out of a ring.
void copy_from_ring(const char* ring, __u64 ring_sz, __u64 pos, void* dst, size_t len) {
    __u64 idx = pos % ring_sz;
    size_t first = std::min<__u64>(len, ring_sz - idx);
    ::memcpy(dst, ring + idx, first);
    if (first < len) {
        ::memcpy((char*)dst + first, ring, len - first);
    }
}

}

pt_thread_tracer::pt_thread_tracer(const config& cfg):
    thread_tracer(cfg.exclusive_threads),
    m_data_pages(cfg.data_pages),
    m_aux_pages(cfg.aux_pages),
    m_perf_fd(-1),
    m_perf_data_ptr(nullptr),
    m_perf_data_sz(0),
    m_aux_data_ptr(nullptr),
    m_aux_data_sz(0) {}

pt_thread_tracer::~pt_thread_tracer() {
    if (m_perf_fd >= 0) {
        HWT_DEBUG(std::cerr << "hwtrace: tracer destroyed while started, discarding trace" << std::endl);
        ::ioctl(m_perf_fd, PERF_EVENT_IOC_DISABLE, 0);
    }
    release();
}

error pt_thread_tracer::open_perf_pt() {
    struct perf_event_attr attr = {};

    attr.size = sizeof(attr);
    if (!read_pt_pmu_type(attr.type)) {
        return error::no_hardware_support("no intel_pt PMU in /sys/bus/event_source/devices");
    }

    attr.exclude_kernel = 1;
    attr.exclude_hv = 1;
    attr.disabled = 1;
    attr.config = PT_CONFIG_BRANCH_EN;

    pid_t target_tid = current_tid();
    for (auto end_time = ::time(nullptr) + PERF_OPEN_TIMEOUT_SEC;;) {
        int fd = ::syscall(SYS_perf_event_open, &attr, target_tid, -1, -1, PERF_FLAG_FD_CLOEXEC);
        if (fd >= 0) {
            m_perf_fd = fd;
            HWT_DEBUG(std::cerr << "hwtrace: opened intel_pt event fd " << fd << " for thread " << target_tid << std::endl);
            return error();
        }

        int err = errno;
        if (err != EBUSY || ::time(nullptr) >= end_time) {
            return error::from_errno(err, "perf_event_open(intel_pt)");
        }
        ::usleep(1000);
    }
}

error pt_thread_tracer::allocate_memory_for_perf_data() {
    size_t page_sz = ::getpagesize();

    m_perf_data_sz = (1 + m_data_pages) * page_sz;
    void* data_ptr = ::mmap(nullptr, m_perf_data_sz, PROT_READ | PROT_WRITE, MAP_SHARED, m_perf_fd, 0);
    if (data_ptr == MAP_FAILED) {
        return error::from_errno(errno, "can't map perf data ring");
    }
    m_perf_data_ptr = data_ptr;

    struct perf_event_mmap_page* header = (struct perf_event_mmap_page*)m_perf_data_ptr;
    header->aux_offset = header->data_offset + header->data_size;
    header->aux_size = m_aux_pages * page_sz;

    m_aux_data_sz = header->aux_size;
    void* aux_ptr = ::mmap(nullptr, m_aux_data_sz, PROT_READ | PROT_WRITE, MAP_SHARED, m_perf_fd, header->aux_offset);
    if (aux_ptr == MAP_FAILED) {
        return error::from_errno(errno, "can't map perf aux ring");
    }
    m_aux_data_ptr = aux_ptr;

    return error();
}

error pt_thread_tracer::do_start() {
    error err = open_perf_pt();
    if (!err.ok()) {
        return err;
    }

    err = allocate_memory_for_perf_data();
    if (!err.ok()) {
        release();
        return err;
    }

    if (::ioctl(m_perf_fd, PERF_EVENT_IOC_ENABLE, 0) < 0) {
        err = error::from_errno(errno, "can't enable intel_pt event");
        release();
        return err;
    }

    return error();
}

error pt_thread_tracer::do_stop(std::unique_ptr<trace>& out) {
    if (::ioctl(m_perf_fd, PERF_EVENT_IOC_DISABLE, 0) < 0) {
        error err = error::from_errno(errno, "can't disable intel_pt event");
        release();
        return err;
    }

    std::vector<uint8_t> buf;
    drain_aux(buf);
    bool overflowed = process_perf_records();
    release();

    HWT_DEBUG(std::cerr << "hwtrace: drained " << buf.size() << " trace bytes"
                        << (overflowed ? " (overflowed)" : "") << std::endl);

    std::shared_ptr<const image_map> image;
    error err = image_map::capture_self(image);
    if (!err.ok()) {
        return err;
    }

    out.reset(new pt_trace(std::move(buf), image, overflowed));
    return error();
}

void pt_thread_tracer::drain_aux(std::vector<uint8_t>& out) {
    struct perf_event_mmap_page* header = (struct perf_event_mmap_page*)m_perf_data_ptr;

    auto head = load_atomically(&header->aux_head);
    auto tail = load_atomically(&header->aux_tail);
    __u64 aux_sz = header->aux_size;

    if (head - tail > aux_sz) {
        // Only the last aux_sz bytes are still in the ring.
        tail = head - aux_sz;
    }

    out.resize(head - tail);
    if (!out.empty()) {
        copy_from_ring((const char*)m_aux_data_ptr, aux_sz, tail, out.data(), out.size());
    }

    store_atomically(&header->aux_tail, head);
}

// Returns true if any record says trace data was lost.
bool pt_thread_tracer::process_perf_records() {
    struct perf_event_mmap_page* header = (struct perf_event_mmap_page*)m_perf_data_ptr;

    auto head = load_atomically(&header->data_head);
    auto tail = load_atomically(&header->data_tail);

    const char* perf_data_ptr = (const char*)header + header->data_offset;
    __u64 data_sz = header->data_size;

    bool lost = false;
    while (tail < head) {
        struct perf_event_header event_header;
        copy_from_ring(perf_data_ptr, data_sz, tail, &event_header, sizeof(event_header));
        if (event_header.size == 0) {
            break;
        }

        switch (event_header.type) {
        case PERF_RECORD_AUX:
        {
            perf_record_aux_sample aux_event = {};
            copy_from_ring(perf_data_ptr, data_sz, tail, &aux_event,
                           std::min<size_t>(sizeof(aux_event), event_header.size));
            if (aux_event.flags & PERF_AUX_FLAG_TRUNCATED) {
                lost = true;
            }
            break;
        }
        case PERF_RECORD_LOST:
        case PERF_RECORD_LOST_SAMPLES:
            lost = true;
            break;
        }

        tail += event_header.size;
    }

    store_atomically(&header->data_tail, head);
    return lost;
}

void pt_thread_tracer::release() {
    if (m_aux_data_ptr) {
        ::munmap(m_aux_data_ptr, m_aux_data_sz);
        m_aux_data_ptr = nullptr;
    }
    if (m_perf_data_ptr) {
        ::munmap(m_perf_data_ptr, m_perf_data_sz);
        m_perf_data_ptr = nullptr;
    }
    if (m_perf_fd >= 0) {
        ::close(m_perf_fd);
        m_perf_fd = -1;
    }
}

std::unique_ptr<thread_tracer> pt_tracer::make_thread_tracer() const {
    return std::unique_ptr<thread_tracer>(new pt_thread_tracer(m_config));
}

} // namespace hwtrace
