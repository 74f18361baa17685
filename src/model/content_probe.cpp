#include "hoard/model/content_probe.hpp"

#include <array>
#include <cstdint>
#include <initializer_list>
#include <fstream>
#include <string>
#include <system_error>

namespace hoard::model {

namespace {

constexpr std::size_t kHeader = 16;

bool starts_with(const std::array<unsigned char, kHeader>& h, std::size_t got,
                 std::initializer_list<unsigned char> sig, std::size_t offset = 0) {
    if (got < offset + sig.size()) return false;
    std::size_t i = offset;
    for (unsigned char c : sig) {
        if (h[i++] != c) return false;
    }
    return true;
}

auto invalid(const std::filesystem::path& file, const char* why) -> std::unexpected<core::error> {
    return core::fail(core::error_code::item_invalid, file.string() + ": " + why, "model.probe");
}

} // anonymous namespace

auto MagicBytesProbe::probe(const std::filesystem::path& file)
    -> std::expected<void, core::error> {
    std::error_code ec;
    const auto size = std::filesystem::file_size(file, ec);
    if (ec) return invalid(file, "not readable");
    if (size < 8) return invalid(file, "too small to be an image");

    std::ifstream in(file, std::ios::binary);
    if (!in) return invalid(file, "cannot open");

    std::array<unsigned char, kHeader> h{};
    in.read(reinterpret_cast<char*>(h.data()), static_cast<std::streamsize>(h.size()));
    const auto got = static_cast<std::size_t>(in.gcount());

    if (starts_with(h, got, {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A})) return {};
    if (starts_with(h, got, {'G', 'I', 'F', '8'})) return {};
    if (starts_with(h, got, {'B', 'M'})) return {};
    if (starts_with(h, got, {'I', 'I', 0x2A, 0x00}) || starts_with(h, got, {'M', 'M', 0x00, 0x2A})) return {};
    if (starts_with(h, got, {'R', 'I', 'F', 'F'}) && starts_with(h, got, {'W', 'E', 'B', 'P'}, 8)) return {};

    if (starts_with(h, got, {0xFF, 0xD8, 0xFF})) {
        // Truncated JPEGs lose the trailing EOI marker
        std::array<unsigned char, 2> tail{};
        in.clear();
        in.seekg(-2, std::ios::end);
        in.read(reinterpret_cast<char*>(tail.data()), 2);
        if (in.gcount() == 2 && tail[0] == 0xFF && tail[1] == 0xD9) return {};
        return invalid(file, "truncated JPEG");
    }
    return invalid(file, "unrecognized image signature");
}

} // namespace hoard::model
