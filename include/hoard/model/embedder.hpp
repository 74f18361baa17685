#pragma once

/** \file embedder.hpp
 *  \brief Injected embedding capability.
 *
 * Production adapters (model runtimes, HTTP inference servers) live outside the
 * library; tests use deterministic doubles. An embedder must return vectors of
 * one fixed dimension for the lifetime of a library.
 */

#include <expected>
#include <filesystem>
#include <string_view>
#include <vector>

#include "hoard/error.hpp"

namespace hoard::model {

using Embedding = std::vector<float>;

class Embedder {
public:
    virtual ~Embedder() = default;

    /** \brief Embed the content of a file.
     *
     * Return item_invalid when the content cannot be interpreted (the scan
     * skips the item); any other error aborts the scan.
     */
    virtual auto embed_file(const std::filesystem::path& file)
        -> std::expected<Embedding, core::error> = 0;

    /** \brief Embed free text into the same space (cross-modal search, documents). */
    virtual auto embed_text(std::string_view text)
        -> std::expected<Embedding, core::error> = 0;
};

} // namespace hoard::model
