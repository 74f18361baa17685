#include "hoard/library/scan_profile.hpp"

#include <sstream>

#include "hoard/core/atomic_file.hpp"

namespace hoard::library {

namespace {

constexpr const char* kHeader = "hoard-scan-profile v1";

} // anonymous namespace

auto ScanProfile::load(const std::filesystem::path& file) -> std::expected<ScanProfile, core::error> {
    ScanProfile profile;
    auto text = core::read_file(file);
    if (!text) {
        if (text.error().code == core::error_code::not_found) return profile;
        return std::unexpected(text.error());
    }
    std::istringstream in(*text);
    std::string line;
    if (!std::getline(in, line) || line != kHeader) {
        return core::fail(core::error_code::data_integrity, "bad header in " + file.string(), "library.profile");
    }
    std::size_t lineno = 1;
    while (std::getline(in, line)) {
        ++lineno;
        if (line.empty()) continue;
        const auto tab = line.find('\t');
        if (tab == std::string::npos || tab == 0 || tab + 1 == line.size()) {
            return core::fail(core::error_code::data_integrity,
                              file.string() + ":" + std::to_string(lineno) + ": malformed entry",
                              "library.profile");
        }
        profile.entries_.emplace(line.substr(tab + 1), line.substr(0, tab));
    }
    return profile;
}

auto ScanProfile::save(const std::filesystem::path& file) const -> std::expected<void, core::error> {
    std::ostringstream out;
    out << kHeader << '\n';
    for (const auto& [path, uuid] : entries_) {
        if (path.find('\n') != std::string::npos) {
            return core::fail(core::error_code::invalid_argument, "path contains a newline: " + path,
                              "library.profile");
        }
        out << uuid << '\t' << path << '\n';
    }
    return core::write_file_atomic(file, out.str());
}

auto ScanProfile::uuid_of(const std::string& rel_path) const -> std::optional<std::string> {
    auto it = entries_.find(rel_path);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

} // namespace hoard::library
