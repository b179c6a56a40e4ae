#ifndef PHIGUARD_NORMALIZER_TEXT_NORMALIZER_HPP
#define PHIGUARD_NORMALIZER_TEXT_NORMALIZER_HPP

#include <cstddef>
#include <string>
#include <vector>
#include "normalized_document.hpp"

/**
 * @file text_normalizer.hpp
 * @brief Builds the canonical working copy of a document that detectors run against.
 *
 * REQUIREMENTS:
 *   - Links against ICU (icuuc) for NFKC and general-category lookups.
 *
 * STAGES (each rewrites canonical text and char map together):
 *   1. NFKC per ICU normalization segment.
 *   2. Typographic confusables to ASCII; OCR 0/1/l/5/8 folding inside header tokens only.
 *   3. Drop Cc / Cf / Cs characters except '\n' and '\t'.
 *   4. Collapse 3+ blanks; collapse blanks around . - / between two digits.
 *   5. Join words hyphenated across a line break.
 *   6. Repair l / I / O inside numeric dates when the result is a plausible date.
 *
 * Deleted characters leave no map entry. Replacement text of the same byte length keeps
 * 1:1 provenance; anything else is anchored to the first original character it replaced.
 * An NFKC segment that changed is the exception: its final byte points at the last
 * character of the segment, so "e" + U+0301 projects back over both code points.
 *
 * USAGE:
 *   @code
 *   phiguard::normalizer::TextNormalizer normalizer;
 *   auto doc = normalizer.normalize("D0B: 12 / 05 / 198O");
 *   // doc.canonical() == "DOB: 12/05/1980"
 *   @endcode
 */

namespace phiguard {
namespace normalizer {

/**
 * @brief Canonical text plus its provenance while stages run.
 */
struct MappedText
{
    std::string text;
    std::vector<std::size_t> map;
};

/**
 * @brief Replace [start, end) of a MappedText with replacement.
 */
struct TextEdit
{
    std::size_t start = 0;
    std::size_t end = 0;
    std::string replacement;
};

/**
 * @brief Apply sorted, non-overlapping edits in one pass.
 * @throw std::invalid_argument if edits overlap or run past the end.
 */
void applyEdits(MappedText &mt, const std::vector<TextEdit> &edits);

class TextNormalizer
{
public:
    /// Upper bound on de-hyphenation passes over one document.
    static constexpr int kMaxDehyphenationPasses = 4;

    TextNormalizer() = default;

    /**
     * @brief Run every stage over original. Invalid UTF-8 bytes become U+FFFD anchored
     *        to the offending byte.
     * @throw std::runtime_error only if ICU cannot load its NFKC data.
     */
    NormalizedDocument normalize(const std::string &original) const;

    /**
     * @brief URLs and document filenames in canonical text. Informational only.
     */
    ContainerSpans findContainerSpans(const std::string &canonical) const;

private:
    MappedText foldUnicode(const std::string &original) const;
    void foldHeaderTokens(MappedText &mt) const;
    void collapseWhitespace(MappedText &mt) const;
    void collapsePaddedSeparators(MappedText &mt) const;
    void dehyphenate(MappedText &mt) const;
    void repairOcrDates(MappedText &mt) const;
};

} // namespace normalizer
} // namespace phiguard

#endif // PHIGUARD_NORMALIZER_TEXT_NORMALIZER_HPP
