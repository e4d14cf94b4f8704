#include <doctest/doctest.h>

#include <stdint.h>
#include <sys/auxv.h>

#include <memory>

#include "image_map.hpp"
#include "test_helpers.hpp"

using namespace hwtrace;

TEST_CASE("the current process image covers our own code") {
    std::shared_ptr<const image_map> image;
    auto err = image_map::capture_self(image);
    REQUIRE_MESSAGE(err.ok(), err.message());
    REQUIRE(image);
    REQUIRE_FALSE(image->segments().empty());

    auto addr = reinterpret_cast<uint64_t>(&test_helpers::work_loop);
    bool found = false;
    for (auto& segment : image->segments()) {
        CHECK_FALSE(segment.filename.empty());
        if (addr >= segment.vaddr && addr < segment.vaddr + segment.size) {
            found = true;
        }
    }
    CHECK(found);
}

TEST_CASE("the vdso is copied into the image") {
    if (::getauxval(AT_SYSINFO_EHDR) == 0) {
        MESSAGE("no vdso in this process, skipping");
        return;
    }

    std::shared_ptr<const image_map> image;
    REQUIRE(image_map::capture_self(image).ok());
    REQUIRE_FALSE(image->vdso().empty());

    uint8_t byte = 0;
    CHECK(image->read_vdso(image->vdso_vaddr(), &byte, 1) == 1);
    CHECK(byte == image->vdso()[0]);
    CHECK(byte == *reinterpret_cast<const uint8_t*>(image->vdso_vaddr()));

    uint8_t tail[8];
    uint64_t last = image->vdso_vaddr() + image->vdso().size() - 1;
    CHECK(image->read_vdso(last, tail, sizeof(tail)) == 1);
    CHECK(image->read_vdso(last + 1, tail, sizeof(tail)) == 0);
    CHECK(image->read_vdso(image->vdso_vaddr() - 1, tail, sizeof(tail)) == 0);
}
