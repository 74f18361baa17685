#include "hoard/core/atomic_file.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

#if defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <unistd.h>
#endif

namespace hoard::core {

namespace {

void fsync_path(const std::filesystem::path& p) {
#if defined(__linux__) || defined(__APPLE__)
    int fd = ::open(p.string().c_str(), O_RDONLY);
    if (fd >= 0) {
        (void)::fsync(fd);
        (void)::close(fd);
    }
#else
    (void)p;
#endif
}

} // anonymous namespace

auto write_file_atomic(const std::filesystem::path& dst, std::string_view contents)
    -> std::expected<void, error> {
    const auto tmp = std::filesystem::path(dst.string() + ".tmp");
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.good()) {
            return fail(error_code::io_failed, "cannot open " + tmp.string(), "core.atomic_file");
        }
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        out.flush();
        if (!out.good()) {
            std::error_code rec;
            (void)std::filesystem::remove(tmp, rec);
            return fail(error_code::io_failed, "short write to " + tmp.string(), "core.atomic_file");
        }
    }
    fsync_path(tmp);

    std::error_code ec;
    std::filesystem::rename(tmp, dst, ec);
    if (ec) {
        std::error_code rec;
        (void)std::filesystem::remove(tmp, rec);
        return fail(error_code::io_failed, "rename to " + dst.string() + " failed: " + ec.message(),
                    "core.atomic_file");
    }
    if (dst.has_parent_path()) fsync_path(dst.parent_path());
    return {};
}

auto read_file(const std::filesystem::path& src) -> std::expected<std::string, error> {
    std::error_code ec;
    if (!std::filesystem::exists(src, ec)) {
        return fail(error_code::not_found, src.string() + " does not exist", "core.atomic_file");
    }
    std::ifstream in(src, std::ios::binary);
    if (!in.good()) {
        return fail(error_code::io_failed, "cannot open " + src.string(), "core.atomic_file");
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace hoard::core
