#pragma once

/** \file corpus.hpp
 *  \brief Ordered document collections addressed by row number.
 */

#include <cstddef>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "hoard/error.hpp"

namespace hoard::retrieval {

/** \brief Read-only documents; row numbers are 0-based and stable. */
class Corpus {
public:
    virtual ~Corpus() = default;

    [[nodiscard]] virtual auto size() const -> std::size_t = 0;

    /** \brief Content of row \p row, nullopt when out of range. */
    [[nodiscard]] virtual auto document(std::size_t row) const -> std::optional<std::string> = 0;
};

/** \brief One document per non-empty line of a UTF-8 text file. */
class TextCorpus final : public Corpus {
public:
    explicit TextCorpus(std::vector<std::string> documents) : documents_(std::move(documents)) {}

    /** \brief Read \p file; trailing CR and blank lines are dropped. */
    static auto load(const std::filesystem::path& file) -> std::expected<TextCorpus, core::error>;

    /** \brief Read \p raw_source and store the documents at \p dest (atomic replace). */
    static auto import_file(const std::filesystem::path& raw_source, const std::filesystem::path& dest)
        -> std::expected<TextCorpus, core::error>;

    [[nodiscard]] auto size() const -> std::size_t override { return documents_.size(); }
    [[nodiscard]] auto document(std::size_t row) const -> std::optional<std::string> override;

private:
    std::vector<std::string> documents_;
};

/** \brief Opens the corpus named \p corpus_id, importing \p raw_source first when given. */
using CorpusResolver = std::function<std::expected<std::shared_ptr<Corpus>, core::error>(
    const std::string& corpus_id, const std::optional<std::filesystem::path>& raw_source)>;

/** \brief Resolver for TextCorpus files stored as `<corpus_dir>/<corpus_id>.corpus`. */
auto text_corpus_resolver(std::filesystem::path corpus_dir) -> CorpusResolver;

} // namespace hoard::retrieval
