#include "hoard/retrieval/corpus.hpp"

#include <sstream>
#include <system_error>

#include "hoard/core/atomic_file.hpp"
#include "hoard/core/log.hpp"

namespace hoard::retrieval {

namespace {

std::vector<std::string> split_documents(const std::string& text) {
    std::vector<std::string> docs;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue;
        docs.push_back(std::move(line));
    }
    return docs;
}

bool valid_corpus_id(const std::string& id) {
    if (id.empty() || id == "." || id == "..") return false;
    return id.find_first_of("/\\") == std::string::npos;
}

} // anonymous namespace

auto TextCorpus::load(const std::filesystem::path& file) -> std::expected<TextCorpus, core::error> {
    auto text = core::read_file(file);
    if (!text) return std::unexpected(text.error());
    return TextCorpus(split_documents(*text));
}

auto TextCorpus::import_file(const std::filesystem::path& raw_source, const std::filesystem::path& dest)
    -> std::expected<TextCorpus, core::error> {
    auto text = core::read_file(raw_source);
    if (!text) return std::unexpected(text.error());
    auto docs = split_documents(*text);

    std::string normalized;
    for (const auto& d : docs) {
        normalized += d;
        normalized += '\n';
    }
    std::error_code ec;
    if (dest.has_parent_path()) std::filesystem::create_directories(dest.parent_path(), ec);
    if (ec) {
        return core::fail(core::error_code::io_failed, "cannot create " + dest.parent_path().string(),
                          "retrieval.corpus");
    }
    if (auto w = core::write_file_atomic(dest, normalized); !w) return std::unexpected(w.error());
    core::log_info("corpus", "imported " + std::to_string(docs.size()) + " documents into " + dest.string());
    return TextCorpus(std::move(docs));
}

auto TextCorpus::document(std::size_t row) const -> std::optional<std::string> {
    if (row >= documents_.size()) return std::nullopt;
    return documents_[row];
}

auto text_corpus_resolver(std::filesystem::path corpus_dir) -> CorpusResolver {
    return [dir = std::move(corpus_dir)](const std::string& corpus_id,
                                         const std::optional<std::filesystem::path>& raw_source)
               -> std::expected<std::shared_ptr<Corpus>, core::error> {
        if (!valid_corpus_id(corpus_id)) {
            return core::fail(core::error_code::invalid_argument, "invalid corpus id '" + corpus_id + "'",
                              "retrieval.corpus");
        }
        const auto file = dir / (corpus_id + ".corpus");
        auto corpus = raw_source ? TextCorpus::import_file(*raw_source, file) : TextCorpus::load(file);
        if (!corpus) return std::unexpected(corpus.error());
        return std::make_shared<TextCorpus>(std::move(*corpus));
    };
}

} // namespace hoard::retrieval
