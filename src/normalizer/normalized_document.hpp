#ifndef PHIGUARD_NORMALIZER_NORMALIZED_DOCUMENT_HPP
#define PHIGUARD_NORMALIZER_NORMALIZED_DOCUMENT_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "../model/entity.hpp"

/**
 * @file normalized_document.hpp
 * @brief The canonical working copy of an input text plus its map back to the original.
 *
 * DESIGN:
 *   - original  : the caller's text, never modified.
 *   - canonical : what detectors run against.
 *   - charMap   : one entry per canonical BYTE, holding the byte offset in original of
 *                 the character that byte came from. Non-decreasing; every entry points
 *                 at the first byte of a UTF-8 character in original.
 *
 *   project(a, b) turns a canonical span into an original span. The end is extended to
 *   the end of the original character at charMap[b-1], so a projected span never cuts
 *   a multi-byte character in half (for ASCII this is charMap[b-1] + 1).
 *
 * USAGE:
 *   @code
 *   auto doc = normalizer.normalize(text);
 *   auto span = doc.project(candidate.start, candidate.end);
 *   auto projected = doc.projectCandidate(candidate);   // text filled from original
 *   @endcode
 */

namespace phiguard {
namespace normalizer {

using Span = std::pair<std::size_t, std::size_t>;

/**
 * @brief Compound tokens found in canonical text that callers should not split.
 */
struct ContainerSpans
{
    std::vector<Span> urls;
    std::vector<Span> filenames;
};

/**
 * @brief Number of bytes in the UTF-8 sequence introduced by lead byte c.
 *        Stray continuation or invalid bytes count as one.
 */
inline std::size_t utf8SequenceLength(unsigned char c)
{
    if (c < 0x80) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1;
}

class NormalizedDocument
{
public:
    /**
     * @throw std::invalid_argument if the map does not match the canonical text.
     */
    NormalizedDocument(std::string original, std::string canonical, std::vector<std::size_t> charMap)
        : original_(std::move(original))
        , canonical_(std::move(canonical))
        , charMap_(std::move(charMap))
    {
        if (charMap_.size() != canonical_.size()) {
            throw std::invalid_argument("NormalizedDocument: char map length "
                                        + std::to_string(charMap_.size())
                                        + " != canonical length "
                                        + std::to_string(canonical_.size()));
        }
        for (std::size_t idx : charMap_) {
            if (idx >= original_.size()) {
                throw std::invalid_argument("NormalizedDocument: char map entry out of range");
            }
        }
    }

    const std::string &original() const { return original_; }
    const std::string &canonical() const { return canonical_; }
    const std::vector<std::size_t> &charMap() const { return charMap_; }

    /**
     * @brief Map a canonical span [a, b) to original coordinates.
     *        a past the end yields the empty span at original().size().
     */
    Span project(std::size_t a, std::size_t b) const
    {
        const std::size_t n = charMap_.size();
        if (a >= n) {
            return {original_.size(), original_.size()};
        }
        if (b > n) {
            b = n;
        }
        std::size_t origStart = charMap_[a];
        if (b <= a) {
            return {origStart, origStart};
        }
        std::size_t last = charMap_[b - 1];
        std::size_t origEnd = last + utf8SequenceLength(static_cast<unsigned char>(original_[last]));
        if (origEnd > original_.size()) {
            origEnd = original_.size();
        }
        if (origEnd < origStart) {
            origEnd = origStart;
        }
        return {origStart, origEnd};
    }

    /**
     * @brief Project a detector candidate and fill its text from the original.
     */
    model::CandidateEntity projectCandidate(const model::CandidateEntity &c) const
    {
        model::CandidateEntity out = c;
        Span span = project(c.start, c.end);
        out.start = span.first;
        out.end = span.second;
        out.text = original_.substr(span.first, span.second - span.first);
        return out;
    }

private:
    std::string original_;
    std::string canonical_;
    std::vector<std::size_t> charMap_;
};

} // namespace normalizer
} // namespace phiguard

#endif // PHIGUARD_NORMALIZER_NORMALIZED_DOCUMENT_HPP
