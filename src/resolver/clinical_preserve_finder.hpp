#ifndef PHIGUARD_RESOLVER_CLINICAL_PRESERVE_FINDER_HPP
#define PHIGUARD_RESOLVER_CLINICAL_PRESERVE_FINDER_HPP

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>
#include <vector>
#include "../model/entity.hpp"
#include "../util/logger.hpp"
#include "../util/pattern_scan.hpp"

/**
 * @file clinical_preserve_finder.hpp
 * @brief Finds clinical measurements and whitelisted phrases that must survive de-identification.
 *
 * Vital signs ("BP 120/80", "HR 72"), lab results ("A1c 7.2%", "K 4.1"), doses ("500 mg"),
 * common clinical abbreviations and configured phrases are returned as preserve spans for
 * ConflictResolver. A detector that flags "120/80" as a date loses to the BP match here.
 *
 * USAGE:
 *   @code
 *   phiguard::resolver::ClinicalPreserveFinder finder({"Progress Note", "metformin"});
 *   auto preserve = finder.find(doc.original());
 *   auto entities = resolver.resolve(candidates, preserve, doc.original());
 *   @endcode
 */

namespace phiguard {
namespace resolver {

class ClinicalPreserveFinder
{
public:
    ClinicalPreserveFinder() = default;

    /**
     * @param phrases Extra literal phrases to preserve, matched case-insensitively on word
     *        boundaries.
     */
    explicit ClinicalPreserveFinder(const std::vector<std::string> &phrases)
    {
        for (const auto &p : phrases) {
            addPhrase(p);
        }
    }

    void addPhrase(const std::string &phrase)
    {
        if (phrase.empty()) {
            return;
        }
        phrases_.emplace_back(phrase);
        // \b only makes sense next to a word character
        const std::string lead = isWordChar(phrase.front()) ? "\\b" : "";
        const std::string tail = isWordChar(phrase.back()) ? "\\b" : "";
        phraseRegexes_.push_back(util::compilePattern(lead + re2::RE2::QuoteMeta(phrase) + tail, true));
    }

    const std::vector<std::string> &phrases() const { return phrases_; }

    /**
     * @brief Preserve spans over text, sorted by start. May overlap each other.
     */
    std::vector<model::CandidateEntity> find(const std::string &text) const
    {
        std::vector<model::CandidateEntity> spans;
        for (const auto &re : builtinPatterns()) {
            collect(text, *re, spans);
        }
        for (const auto &re : phraseRegexes_) {
            collect(text, *re, spans);
        }
        std::sort(spans.begin(), spans.end(),
                  [](const model::CandidateEntity &a, const model::CandidateEntity &b) {
                      return a.start < b.start || (a.start == b.start && a.end > b.end);
                  });
        util::logger::debug("ClinicalPreserveFinder: " + std::to_string(spans.size()) + " preserve span(s)");
        return spans;
    }

private:
    using PatternPtr = std::shared_ptr<re2::RE2>;

    static const std::vector<PatternPtr> &builtinPatterns()
    {
        static const std::vector<PatternPtr> kPatterns = [] {
            const char *sources[] = {
                // vitals
                "\\bBP\\s+\\d{2,3}/\\d{2,3}\\b",
                "\\bHR\\s+\\d{2,3}\\b",
                "\\bRR\\s+\\d{1,2}\\b",
                "\\bT\\s+\\d{2}\\.\\d\\b",
                "\\bTemp\\s+\\d{2}\\.\\d\\b",
                "\\bO2\\s+\\d{1,3}%",
                "\\bSpO2\\s+\\d{1,3}%",
                "\\bWT\\s+\\d{1,3}\\.\\d\\b",
                "\\bHT\\s+\\d{1,3}\\b",
                "\\bBMI\\s+\\d{1,2}\\.\\d\\b",
                // labs
                "\\bA1c\\s+\\d{1,2}\\.\\d%",
                "\\bHbA1c\\s+\\d{1,2}\\.\\d%",
                "\\bLDL\\s+\\d{1,3}\\b",
                "\\bHDL\\s+\\d{1,3}\\b",
                "\\bTSH\\s+\\d{1,2}\\.\\d{1,3}\\b",
                "\\bWBC\\s+\\d{1,2}\\.\\d\\b",
                "\\bHGB\\s+\\d{1,2}\\.\\d\\b",
                "\\bHCT\\s+\\d{1,2}\\.\\d\\b",
                "\\bPLT\\s+\\d{1,3}\\b",
                "\\bCR\\s+\\d{1,2}\\.\\d{1,2}\\b",
                "\\bBUN\\s+\\d{1,2}\\b",
                "\\bNA\\s+\\d{3}\\b",
                "\\bK\\s+\\d{1,2}\\.\\d\\b",
                "\\bGLU\\s+\\d{1,3}\\b",
                // doses
                "\\b\\d{1,4}(?:\\.\\d+)?\\s*(?:mg|mcg|ml|mmol|mEq|IU|mIU|units?|tablets?|capsules?)\\b",
                // abbreviations
                "\\b(?:NSTEMI|STEMI|CABG|CHF|COPD|HTN|CAD|AFib)\\b",
            };
            std::vector<PatternPtr> out;
            for (const char *src : sources) {
                out.push_back(util::compilePattern(src, true));
            }
            return out;
        }();
        return kPatterns;
    }

    static void collect(const std::string &text, const re2::RE2 &re,
                        std::vector<model::CandidateEntity> &out)
    {
        util::forEachMatch(re, text, [&](const std::vector<re2::StringPiece> &m) {
            if (m[0].empty()) {
                return;
            }
            const std::size_t start = util::offsetOf(text, m[0]);
            model::CandidateEntity span(start, start + m[0].size(), model::Category::ClinicalPreserve,
                                        1.0, model::DetectorSource::ClinicalPreserve);
            span.text = std::string(m[0].data(), m[0].size());
            out.push_back(std::move(span));
        });
    }

    static bool isWordChar(char ch)
    {
        return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
    }

    std::vector<std::string> phrases_;
    std::vector<PatternPtr> phraseRegexes_;
};

} // namespace resolver
} // namespace phiguard

#endif // PHIGUARD_RESOLVER_CLINICAL_PRESERVE_FINDER_HPP
