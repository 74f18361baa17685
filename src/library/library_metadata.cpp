#include "hoard/library/library_metadata.hpp"

#include <ctime>
#include <initializer_list>
#include <iomanip>
#include <sstream>

#include "hoard/core/atomic_file.hpp"

namespace hoard::library {

namespace {

constexpr const char* kHeader = "hoard-library v1";
constexpr const char* kFormat = "%Y-%m-%d %H:%M:%S";

} // anonymous namespace

auto LibraryMetadata::load(const std::filesystem::path& file) -> std::expected<LibraryMetadata, core::error> {
    auto text = core::read_file(file);
    if (!text) return std::unexpected(text.error());

    std::istringstream in(*text);
    std::string line;
    if (!std::getline(in, line) || line != kHeader) {
        return core::fail(core::error_code::data_integrity, "bad header in " + file.string(), "library.meta");
    }
    LibraryMetadata meta;
    meta.type.clear();
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            return core::fail(core::error_code::data_integrity, "malformed line '" + line + "'", "library.meta");
        }
        const auto key = line.substr(0, eq);
        auto value = line.substr(eq + 1);
        if (key == "uuid") meta.uuid = std::move(value);
        else if (key == "name") meta.name = std::move(value);
        else if (key == "type") meta.type = std::move(value);
        else if (key == "last_scanned") meta.last_scanned = std::move(value);
    }
    if (meta.uuid.empty()) {
        return core::fail(core::error_code::data_integrity, "missing uuid in " + file.string(), "library.meta");
    }
    return meta;
}

auto LibraryMetadata::save(const std::filesystem::path& file) const -> std::expected<void, core::error> {
    for (const auto* field : {&uuid, &name, &type, &last_scanned}) {
        if (field->find('\n') != std::string::npos) {
            return core::fail(core::error_code::invalid_argument, "metadata values must be single-line",
                              "library.meta");
        }
    }
    std::ostringstream out;
    out << kHeader << '\n'
        << "uuid=" << uuid << '\n'
        << "name=" << name << '\n'
        << "type=" << type << '\n'
        << "last_scanned=" << last_scanned << '\n';
    return core::write_file_atomic(file, out.str());
}

auto format_timestamp(std::chrono::system_clock::time_point tp) -> std::string {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, kFormat);
    return out.str();
}

auto parse_timestamp(const std::string& text) -> std::optional<std::chrono::system_clock::time_point> {
    std::tm tm{};
    std::istringstream in(text);
    in >> std::get_time(&tm, kFormat);
    if (in.fail()) return std::nullopt;
    tm.tm_isdst = -1;
    const std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return std::chrono::system_clock::from_time_t(t);
}

} // namespace hoard::library
