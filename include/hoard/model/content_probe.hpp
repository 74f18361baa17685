#pragma once

/** \file content_probe.hpp
 *  \brief Cheap per-item validation run before embedding.
 */

#include <expected>
#include <filesystem>

#include "hoard/error.hpp"

namespace hoard::model {

class ContentProbe {
public:
    virtual ~ContentProbe() = default;

    /** \brief Ok when the file is a well-formed instance of the expected type;
     *  item_invalid otherwise. */
    virtual auto probe(const std::filesystem::path& file)
        -> std::expected<void, core::error> = 0;
};

/** \brief Image probe based on file signatures.
 *
 * Accepts PNG, JPEG, GIF, BMP, WebP and TIFF headers and rejects empty or
 * truncated files. A JPEG must also end with the EOI marker, which catches the
 * common case of an interrupted copy.
 */
class MagicBytesProbe final : public ContentProbe {
public:
    auto probe(const std::filesystem::path& file)
        -> std::expected<void, core::error> override;
};

} // namespace hoard::model
