#include "image_map.hpp"

#include <elf.h>
#include <errno.h>
#include <limits.h>
#include <link.h>
#include <string.h>
#include <sys/auxv.h>
#include <unistd.h>

#include <algorithm>
#include <iostream>

#include "log.hpp"

namespace hwtrace {

namespace {

const char* VDSO_NAME = "linux-vdso.so.1";

struct load_self_image_args {
    image_map* image;
    std::string exe_filename;
    uint64_t vdso_base;
};

bool is_vdso(const struct dl_phdr_info* info, uint64_t vdso_base) {
    if (::strcmp(info->dlpi_name, VDSO_NAME) == 0) {
        return true;
    }
    return vdso_base != 0 && info->dlpi_addr == vdso_base;
}

int load_self_image_cb(struct dl_phdr_info* info, size_t size, void* data) {
    (void) size;
    auto args = static_cast<load_self_image_args*>(data);

    bool vdso = is_vdso(info, args->vdso_base);
    const char* filename = info->dlpi_name;
    if (!vdso && !*filename) {
        // On Linux, an empty name means that it is the executable itself.
        filename = args->exe_filename.c_str();
    }

    for (ElfW(Half) i = 0; i < info->dlpi_phnum; ++i) {
        const ElfW(Phdr)& phdr = info->dlpi_phdr[i];
        if (phdr.p_type != PT_LOAD || !(phdr.p_flags & PF_X)) {
            continue;
        }

        uint64_t vaddr = info->dlpi_addr + phdr.p_vaddr;
        if (vdso) {
            args->image->set_vdso(vaddr, reinterpret_cast<const uint8_t*>(vaddr), phdr.p_filesz);
            continue;
        }

        image_segment segment;
        segment.filename = filename;
        segment.offset = phdr.p_offset;
        segment.size = phdr.p_filesz;
        segment.vaddr = vaddr;
        args->image->add_segment(segment);
    }

    return 0;
}

}

void image_map::set_vdso(uint64_t vaddr, const uint8_t* code, size_t len) {
    m_vdso_vaddr = vaddr;
    m_vdso.assign(code, code + len);
}

size_t image_map::read_vdso(uint64_t vaddr, uint8_t* buffer, size_t size) const {
    if (vaddr < m_vdso_vaddr || vaddr >= m_vdso_vaddr + m_vdso.size()) {
        return 0;
    }
    size_t offset = vaddr - m_vdso_vaddr;
    size_t len = std::min(size, m_vdso.size() - offset);
    ::memcpy(buffer, m_vdso.data() + offset, len);
    return len;
}

error image_map::capture_self(std::shared_ptr<const image_map>& out) {
    char exe_path[PATH_MAX];
    ssize_t len = ::readlink("/proc/self/exe", exe_path, sizeof(exe_path) - 1);
    if (len < 0) {
        return error::from_errno(errno, "can't resolve /proc/self/exe");
    }
    exe_path[len] = 0;

    std::shared_ptr<image_map> image(new image_map());
    load_self_image_args args;
    args.image = image.get();
    args.exe_filename = exe_path;
    args.vdso_base = ::getauxval(AT_SYSINFO_EHDR);

    ::dl_iterate_phdr(load_self_image_cb, &args);

    HWT_DEBUG(std::cerr << "hwtrace: captured " << image->segments().size()
                        << " code segments, vdso " << image->vdso().size() << " bytes" << std::endl);

    out = image;
    return error();
}

} // namespace hwtrace
