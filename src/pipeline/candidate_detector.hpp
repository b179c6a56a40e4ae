#ifndef PHIGUARD_PIPELINE_CANDIDATE_DETECTOR_HPP
#define PHIGUARD_PIPELINE_CANDIDATE_DETECTOR_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "../model/entity.hpp"
#include "../util/pattern_scan.hpp"

/**
 * @file candidate_detector.hpp
 * @brief Interface for anything that proposes identifier spans over canonical text.
 *
 * Detectors report spans in canonical coordinates; the pipeline projects them back to the
 * original. A detector that returns wantsMaskedInput() == true sees the canonical text with
 * the spans found by earlier detectors overwritten by '#', byte for byte, so it can focus
 * on what is left.
 */

namespace phiguard {
namespace pipeline {

class CandidateDetector
{
public:
    virtual ~CandidateDetector() = default;

    virtual std::string name() const = 0;

    virtual std::vector<model::CandidateEntity> detect(const std::string &canonical) const = 0;

    virtual bool wantsMaskedInput() const { return false; }
};

/**
 * @brief Regular-expression detector. Capture group 1, when present, is the reported span.
 *
 * USAGE:
 *   @code
 *   auto rules = std::make_shared<RegexDetector>("rules");
 *   rules->addPattern("\\b\\d{3}-\\d{2}-\\d{4}\\b", Category::Ssn, 0.95);
 *   deidentifier.addDetector(rules);
 *   @endcode
 */
class RegexDetector : public CandidateDetector
{
public:
    explicit RegexDetector(std::string name,
                           model::DetectorSource source = model::DetectorSource::Rule,
                           bool masked = false)
        : name_(std::move(name))
        , source_(source)
        , masked_(masked)
    {
    }

    /**
     * Patterns use RE2 syntax (no backreferences or lookaround).
     * @throw std::invalid_argument if RE2 rejects the pattern.
     */
    void addPattern(const std::string &pattern, model::Category category, double confidence,
                    bool ignoreCase = false)
    {
        patterns_.push_back({util::compilePattern(pattern, ignoreCase), category, confidence});
    }

    /**
     * @brief Detector preloaded with common structured identifiers
     *        (SSN, phone, fax, email, URL, IPv4, MRN, numeric dates, ZIP).
     */
    static std::shared_ptr<RegexDetector> withDefaultPatterns()
    {
        using model::Category;
        auto d = std::make_shared<RegexDetector>("default-patterns");
        d->addPattern("\\b\\d{3}-\\d{2}-\\d{4}\\b", Category::Ssn, 0.95);
        d->addPattern("\\bfax\\s*:?\\s*(\\(?\\d{3}\\)?[-. ]?\\d{3}[-.]\\d{4})\\b", Category::FaxNumber, 0.9, true);
        d->addPattern("(?:^|[^\\d])(\\(?\\d{3}\\)?[-. ]?\\d{3}[-.]\\d{4})\\b", Category::PhoneNumber, 0.85);
        d->addPattern("\\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\\.[A-Za-z]{2,}\\b", Category::EmailAddress, 0.95);
        d->addPattern("\\bhttps?://[^\\s]+", Category::Url, 0.95, true);
        d->addPattern("\\b(?:\\d{1,3}\\.){3}\\d{1,3}\\b", Category::IpAddress, 0.8);
        d->addPattern("\\bMRN\\s*:?\\s*([A-Z0-9-]{5,})\\b", Category::Mrn, 0.9, true);
        d->addPattern("\\b\\d{1,2}/\\d{1,2}/\\d{2,4}\\b", Category::Date, 0.9);
        d->addPattern("\\b\\d{4}-\\d{2}-\\d{2}\\b", Category::Date, 0.9);
        d->addPattern("\\b\\d{5}(?:-\\d{4})?\\b", Category::Zip, 0.5);
        return d;
    }

    std::string name() const override { return name_; }

    bool wantsMaskedInput() const override { return masked_; }

    std::vector<model::CandidateEntity> detect(const std::string &canonical) const override
    {
        std::vector<model::CandidateEntity> out;
        for (const auto &p : patterns_) {
            util::forEachMatch(*p.re, canonical, [&](const std::vector<re2::StringPiece> &m) {
                const std::size_t group = (m.size() > 1 && m[1].data() != nullptr) ? 1 : 0;
                if (!m[group].empty()) {
                    const std::size_t start = util::offsetOf(canonical, m[group]);
                    out.emplace_back(start, start + m[group].size(), p.category, p.confidence, source_);
                }
            });
        }
        return out;
    }

private:
    struct Pattern
    {
        std::shared_ptr<re2::RE2> re;
        model::Category category;
        double confidence;
    };

    std::string name_;
    model::DetectorSource source_;
    bool masked_;
    std::vector<Pattern> patterns_;
};

} // namespace pipeline
} // namespace phiguard

#endif // PHIGUARD_PIPELINE_CANDIDATE_DETECTOR_HPP
