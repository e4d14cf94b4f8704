#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>

#include <iostream>
#include <memory>
#include <string>

#include "config.hpp"
#include "trace.hpp"
#include "tracer.hpp"

namespace {

const size_t BLOCKS_TO_PRINT = 16;

__attribute__((noinline))
uint64_t work_loop(uint64_t iters) {
    uint64_t res = 0;
    for (uint64_t i = 0; i < iters; ++i) {
        struct timespec now;
        ::clock_gettime(CLOCK_MONOTONIC, &now);
        res += now.tv_nsec;
    }
    return res;
}

void print_usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [iterations] [dump-file]" << std::endl;
    std::cerr << "       " << argv0 << " --decode <dump-file>" << std::endl;
}

int report_blocks(const hwtrace::trace& trace) {
    size_t n_blocks = 0;
    size_t n_errors = 0;

    auto blocks = trace.iter_blocks();
    hwtrace::block_result item;
    while (blocks->next(item)) {
        if (item.ok()) {
            if (n_blocks < BLOCKS_TO_PRINT) {
                std::cout << "\t0x" << std::hex << item.value().first_instr()
                          << " - 0x" << item.value().last_instr() << std::dec << "\n";
            }
            ++n_blocks;
        } else {
            std::cout << "\terror: " << item.err().message() << "\n";
            ++n_errors;
        }
    }

    std::cout << "Capacity: " << trace.capacity() << " bytes"
              << (trace.overflowed() ? " (overflowed)" : "") << std::endl;
    std::cout << "Blocks: " << n_blocks << ", errors: " << n_errors << std::endl;
    return n_errors == 0 ? 0 : 3;
}

int decode_file(const char* path) {
    std::unique_ptr<hwtrace::trace> trace;
    auto err = hwtrace::load_trace_file(path, trace);
    if (!err.ok()) {
        std::cerr << "can't load trace: " << err.message() << std::endl;
        return 1;
    }
    return report_blocks(*trace);
}

}

int main(int argc, char** argv) {
    if (argc >= 2 && ::strcmp(argv[1], "--decode") == 0) {
        if (argc != 3) {
            print_usage(argv[0]);
            return 1;
        }
        return decode_file(argv[2]);
    }
    if (argc > 3) {
        print_usage(argv[0]);
        return 1;
    }

    uint64_t iters = 500;
    if (argc >= 2) {
        iters = ::atol(argv[1]);
    }
    const char* dump_path = argc >= 3 ? argv[2] : nullptr;

    auto cfg = hwtrace::config::from_env();

    std::cout << "Tracer start args:" << std::endl;
    std::cout << "\tBACKEND: " << hwtrace::backend_name(cfg.backend) << std::endl;
    std::cout << "\tDATA_PAGES: " << cfg.data_pages << std::endl;
    std::cout << "\tAUX_PAGES: " << cfg.aux_pages << std::endl;
    std::cout << "\tITERATIONS: " << iters << std::endl;

    std::unique_ptr<hwtrace::tracer> tracer;
    auto err = hwtrace::create_tracer(cfg, tracer);
    if (!err.ok()) {
        std::cerr << "can't create tracer: " << err.message() << std::endl;
        return 1;
    }
    std::cout << "Backend: " << tracer->name() << std::endl;

    auto thread_tracer = tracer->make_thread_tracer();
    err = thread_tracer->start_tracing();
    if (!err.ok()) {
        std::cerr << "can't start tracing: " << err.message() << std::endl;
        return 2;
    }

    auto res = work_loop(iters);

    std::unique_ptr<hwtrace::trace> trace;
    err = thread_tracer->stop_tracing(trace);
    if (!err.ok()) {
        std::cerr << "can't stop tracing: " << err.message() << std::endl;
        return 2;
    }
    std::cout << "Traced loop with result: " << res << std::endl;

    if (dump_path) {
        FILE* dump = ::fopen(dump_path, "wb");
        if (!dump) {
            std::cerr << "can't open " << dump_path << std::endl;
            return 1;
        }
        err = trace->to_file(dump);
        ::fclose(dump);
        if (!err.ok()) {
            std::cerr << "can't dump trace: " << err.message() << std::endl;
            return 1;
        }
    }

    return report_blocks(*trace);
}
