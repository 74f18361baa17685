#pragma once

/** \file ranker.hpp
 *  \brief Injected (query, candidate) relevance scoring, e.g. a cross-encoder.
 */

#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "hoard/error.hpp"

namespace hoard::model {

class Ranker {
public:
    virtual ~Ranker() = default;

    /** \brief Relevance of one candidate to the query; higher is more relevant. */
    virtual auto score(std::string_view query, std::string_view candidate)
        -> std::expected<float, core::error> = 0;

    /** \brief Score every candidate against the query; output[i] belongs to candidates[i].
     *
     * The default scores pair by pair; batched model runtimes override it.
     */
    virtual auto score_batch(std::string_view query, const std::vector<std::string>& candidates)
        -> std::expected<std::vector<float>, core::error> {
        std::vector<float> out;
        out.reserve(candidates.size());
        for (const auto& c : candidates) {
            auto s = score(query, c);
            if (!s) return std::unexpected(s.error());
            out.push_back(*s);
        }
        return out;
    }
};

} // namespace hoard::model
