#include <doctest/doctest.h>

#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include "pt_decoder.hpp"
#include "pt_trace.hpp"
#include "test_helpers.hpp"

using namespace hwtrace;
using namespace hwtrace::test_helpers;

namespace {

const uint8_t PSB[] = {
    0x02, 0x82, 0x02, 0x82, 0x02, 0x82, 0x02, 0x82,
    0x02, 0x82, 0x02, 0x82, 0x02, 0x82, 0x02, 0x82
};

void append_garbage(std::vector<uint8_t>& buf, size_t len) {
    buf.insert(buf.end(), len, 0xff);
}

// A PSB whose header holds an extended opcode libipt doesn't know.
void append_corrupt_psb(std::vector<uint8_t>& buf) {
    buf.insert(buf.end(), std::begin(PSB), std::end(PSB));
    buf.push_back(0x02);
    buf.push_back(0x02);
    buf.insert(buf.end(), 16, 0x00);
}

std::unique_ptr<trace> make_trace(std::vector<uint8_t> buf) {
    return std::unique_ptr<trace>(new pt_trace(std::move(buf), std::shared_ptr<const image_map>(), false));
}

/*
 * A tiny hand assembled x86-64 program, served to the decoder through the
 * vDSO reader. It runs:
 *
 *   0x1000: mov %rax, %rbx
 *   0x1003: call 0x1010
 *   0x1010: xor %eax, %eax
 *   0x1012: ret                 (to 0x1008)
 *   0x1008: test %eax, %eax
 *   0x100a: je 0x1018           (taken)
 *   0x1018: syscall             (tracing stops, user space only)
 */
const uint64_t CODE_BASE = 0x1000;
const uint8_t CODE[] = {
    0x48, 0x89, 0xc3,                       // 0x1000
    0xe8, 0x08, 0x00, 0x00, 0x00,           // 0x1003
    0x85, 0xc0,                             // 0x1008
    0x74, 0x0c,                             // 0x100a
    0xcc, 0xcc, 0xcc, 0xcc,                 // 0x100c
    0x31, 0xc0,                             // 0x1010
    0xc3,                                   // 0x1012
    0xcc, 0xcc, 0xcc, 0xcc, 0xcc,           // 0x1013
    0x0f, 0x05,                             // 0x1018
    0xcc, 0xcc, 0xcc, 0xcc, 0xcc, 0xcc,     // 0x101a
    0xcc, 0xcc, 0xcc, 0xcc, 0xcc, 0xcc,
    0xcc, 0xcc, 0xcc, 0xcc, 0xcc, 0xcc,
    0xcc, 0xcc, 0xcc, 0xcc
};

// Nowhere near CODE.
const uint64_t UNMAPPED_IP = 0x5000;

// The blocks the decoder must rebuild from one run of CODE.
std::vector<block> code_blocks() {
    std::vector<block> result;
    result.push_back(block(0x1000, 0x1003));
    result.push_back(block(0x1010, 0x1012));
    result.push_back(block(0x1008, 0x100a));
    result.push_back(block(0x1018, 0x1018));
    return result;
}

std::unique_ptr<trace> make_code_trace(std::vector<uint8_t> buf) {
    std::shared_ptr<image_map> image(new image_map());
    image->set_vdso(CODE_BASE, CODE, sizeof(CODE));
    return std::unique_ptr<trace>(new pt_trace(std::move(buf), image, false));
}

// Packet opcodes.
const uint8_t OPC_PAD = 0x00;
const uint8_t OPC_TIP_PGD = 0x01;
const uint8_t OPC_TIP_PGE = 0x11;
const uint8_t OPC_FUP = 0x1d;
const uint8_t OPC_MODE = 0x99;
const uint8_t MODE_EXEC_64BIT = 0x01;
// Short TNT with two taken branches: stop bit, 1, 1, then the 0 opcode bit.
const uint8_t TNT_TAKEN_TAKEN = 0x0e;
const uint8_t PSBEND[] = { 0x02, 0x23 };
const uint8_t OVF[] = { 0x02, 0xf3 };
const uint8_t STOP[] = { 0x02, 0x83 };

// PSB and an empty PSB+ header, started on a qword boundary.
void append_psb_header(std::vector<uint8_t>& buf) {
    while (buf.size() % 8 != 0) {
        buf.push_back(OPC_PAD);
    }
    buf.insert(buf.end(), std::begin(PSB), std::end(PSB));
    buf.insert(buf.end(), std::begin(PSBEND), std::end(PSBEND));
}

// An IP packet whose payload is the low 48 bits of `ip`, sign extended.
void append_ip_packet(std::vector<uint8_t>& buf, uint8_t opcode, uint64_t ip) {
    buf.push_back(static_cast<uint8_t>((3 << 5) | opcode));
    for (int i = 0; i < 6; ++i) {
        buf.push_back(static_cast<uint8_t>(ip >> (8 * i)));
    }
}

// Tracing switched on at `ip` in 64-bit mode.
void append_enable(std::vector<uint8_t>& buf, uint64_t ip) {
    buf.push_back(OPC_MODE);
    buf.push_back(MODE_EXEC_64BIT);
    append_ip_packet(buf, OPC_TIP_PGE, ip);
}

// The packets for one complete run of CODE.
void append_code_run(std::vector<uint8_t>& buf) {
    append_psb_header(buf);
    append_enable(buf, CODE_BASE);
    // The ret is compressed, so it takes a TNT bit like the je.
    buf.push_back(TNT_TAKEN_TAKEN);
    // The syscall leaves the traced address space: no IP.
    buf.push_back(OPC_TIP_PGD);
}

std::vector<error> errors_in(const std::vector<block_result>& items) {
    std::vector<error> result;
    for (auto& item : items) {
        if (!item.ok()) {
            result.push_back(item.err());
        }
    }
    return result;
}

}

TEST_CASE("find_first_psb locates the synchronization point") {
    std::vector<uint8_t> buf;
    CHECK(find_first_psb(buf) == 0);

    append_garbage(buf, 5);
    CHECK(find_first_psb(buf) == 5);

    append_corrupt_psb(buf);
    CHECK(find_first_psb(buf) == 5);
}

TEST_CASE("an empty trace has no blocks") {
    auto trace = make_trace(std::vector<uint8_t>());
    CHECK(trace->capacity() == 0);
    CHECK(collect(*trace).empty());
}

TEST_CASE("a buffer without any PSB yields one recoverable error") {
    std::vector<uint8_t> buf;
    append_garbage(buf, 64);
    auto trace = make_trace(buf);
    CHECK(trace->capacity() == 64);

    auto items = collect(*trace);
    REQUIRE(items.size() == 1);
    CHECK(items[0].err().kind() == ERR_DECODE);
    CHECK(items[0].err().recoverable());
    CHECK(items[0].err().detail() == "64 bytes precede the first synchronization point");
}

TEST_CASE("a corrupt PSB+ header is fatal") {
    std::vector<uint8_t> buf;
    append_corrupt_psb(buf);
    auto trace = make_trace(buf);

    auto blocks = trace->iter_blocks();
    block_result item;
    REQUIRE(blocks->next(item));
    CHECK(item.err().kind() == ERR_FATAL);
    CHECK(item.err().terminal());

    // Nothing follows a fatal error, however often we ask.
    CHECK_FALSE(blocks->next(item));
    CHECK_FALSE(blocks->next(item));
}

TEST_CASE("a corrupt prefix is reported before decoding continues") {
    std::vector<uint8_t> buf;
    append_garbage(buf, 7);
    append_corrupt_psb(buf);
    auto trace = make_trace(buf);

    auto items = collect(*trace);
    REQUIRE(items.size() == 2);
    CHECK(items[0].err().kind() == ERR_DECODE);
    CHECK(items[1].err().kind() == ERR_FATAL);
}

TEST_CASE("iterating twice gives the same sequence") {
    std::vector<uint8_t> buf;
    append_garbage(buf, 7);
    append_corrupt_psb(buf);
    auto trace = make_trace(buf);

    auto first = trace->iter_blocks();
    auto second = trace->iter_blocks();
    block_result item1, item2;
    while (true) {
        bool more1 = first->next(item1);
        bool more2 = second->next(item2);
        REQUIRE(more1 == more2);
        if (!more1) {
            break;
        }
        CHECK(item1.err().kind() == item2.err().kind());
        CHECK(item1.err().detail() == item2.err().detail());
    }
}

TEST_CASE("iterators outlive their trace") {
    std::vector<uint8_t> buf;
    append_garbage(buf, 3);
    auto trace = make_trace(buf);
    auto blocks = trace->iter_blocks();
    trace.reset();

    block_result item;
    REQUIRE(blocks->next(item));
    CHECK(item.err().kind() == ERR_DECODE);
    CHECK_FALSE(blocks->next(item));
}

TEST_CASE("a dumped trace loads back byte for byte") {
    std::vector<uint8_t> buf;
    append_garbage(buf, 9);
    append_corrupt_psb(buf);
    pt_trace original(std::vector<uint8_t>(buf), std::shared_ptr<const image_map>(), false);

    char path[] = "/tmp/hwtrace-dump-XXXXXX";
    int fd = ::mkstemp(path);
    REQUIRE(fd >= 0);
    FILE* dump = ::fdopen(fd, "wb");
    REQUIRE(dump != nullptr);
    CHECK(original.to_file(dump).ok());
    ::fclose(dump);

    std::unique_ptr<trace> loaded;
    auto err = load_trace_file(path, loaded);
    ::unlink(path);
    REQUIRE_MESSAGE(err.ok(), err.message());

    auto loaded_pt = dynamic_cast<pt_trace*>(loaded.get());
    REQUIRE(loaded_pt != nullptr);
    CHECK(loaded_pt->bytes() == buf);
    CHECK(loaded->capacity() == original.capacity());
    CHECK_FALSE(loaded->overflowed());
}

TEST_CASE("loading a missing dump is an i/o error") {
    std::unique_ptr<trace> loaded;
    auto err = load_trace_file("/nonexistent/hwtrace.dump", loaded);
    CHECK(err.kind() == ERR_IO);
    CHECK_FALSE(loaded);
}

TEST_CASE("blocks are rebuilt from a known program") {
    std::vector<uint8_t> buf;
    append_code_run(buf);
    auto trace = make_code_trace(buf);

    auto items = collect(*trace);
    CHECK(errors_in(items).empty());
    CHECK(ok_blocks(items) == code_blocks());
    check_expected_blocks(*trace, code_blocks());
}

TEST_CASE("a decode error is skipped up to the next PSB") {
    std::vector<uint8_t> buf;
    append_psb_header(buf);
    append_enable(buf, UNMAPPED_IP);
    buf.push_back(TNT_TAKEN_TAKEN);
    append_code_run(buf);
    auto trace = make_code_trace(buf);

    auto items = collect(*trace);
    REQUIRE(items.size() == 5);
    CHECK(items[0].err().kind() == ERR_DECODE);
    CHECK(items[0].err().recoverable());

    std::vector<block_result> rest(items.begin() + 1, items.end());
    CHECK(errors_in(rest).empty());
    CHECK(ok_blocks(rest) == code_blocks());
}

TEST_CASE("a corrupt PSB+ after the first one is recoverable") {
    std::vector<uint8_t> buf;
    append_psb_header(buf);
    append_enable(buf, UNMAPPED_IP);
    buf.push_back(TNT_TAKEN_TAKEN);
    while (buf.size() % 8 != 0) {
        buf.push_back(OPC_PAD);
    }
    append_corrupt_psb(buf);
    append_code_run(buf);
    auto trace = make_code_trace(buf);

    auto items = collect(*trace);
    auto errors = errors_in(items);
    REQUIRE_FALSE(errors.empty());
    CHECK_FALSE(items[0].ok());

    bool resync_failed = false;
    for (auto& err : errors) {
        CHECK_MESSAGE(err.recoverable(), err.message());
        CHECK_FALSE(err.terminal());
        if (err.detail().find("can't resynchronize") != std::string::npos) {
            resync_failed = true;
        }
    }
    CHECK(resync_failed);

    // Everything after the bad PSB+ is still decoded.
    CHECK(ok_blocks(items) == code_blocks());
}

TEST_CASE("an overflow is reported before decoding resumes") {
    std::vector<uint8_t> buf;
    append_psb_header(buf);
    append_enable(buf, CODE_BASE);
    buf.insert(buf.end(), std::begin(OVF), std::end(OVF));
    append_ip_packet(buf, OPC_FUP, CODE_BASE);
    buf.push_back(TNT_TAKEN_TAKEN);
    append_code_run(buf);
    auto trace = make_code_trace(buf);

    auto items = collect(*trace);
    REQUIRE(items.size() == 5);
    CHECK(items[0].err().kind() == ERR_BUFFER_OVERFLOW);
    CHECK(items[0].err().recoverable());

    std::vector<block_result> rest(items.begin() + 1, items.end());
    CHECK(errors_in(rest).empty());
    CHECK(ok_blocks(rest) == code_blocks());
}

TEST_CASE("an unexpected event is reported and decoding carries on") {
    std::vector<uint8_t> buf;
    append_code_run(buf);
    // We never ask for trace stop regions, so this event is unexpected.
    buf.insert(buf.end(), std::begin(STOP), std::end(STOP));
    append_code_run(buf);
    auto trace = make_code_trace(buf);

    auto items = collect(*trace);
    auto errors = errors_in(items);
    REQUIRE(errors.size() == 1);
    CHECK(errors[0].kind() == ERR_DECODE);
    CHECK(errors[0].detail().find("unexpected event") != std::string::npos);

    // One run either side of the error.
    auto expected = code_blocks();
    auto second = code_blocks();
    expected.insert(expected.end(), second.begin(), second.end());
    CHECK(ok_blocks(items) == expected);

    REQUIRE(items.size() == 9);
    CHECK_FALSE(items[4].ok());
}
