#ifndef PHIGUARD_MODEL_ENTITY_HPP
#define PHIGUARD_MODEL_ENTITY_HPP

#include <cmath>
#include <cstddef>
#include <string>
#include "category.hpp"

/**
 * @file entity.hpp
 * @brief Span records that flow through the pipeline.
 *
 *   CandidateEntity  - produced by a detector, canonical coordinates until projected.
 *   ResolvedEntity   - chosen by the resolver, original coordinates, non-overlapping.
 *   AuditRecord      - what survives a transform; carries no identifier text.
 *
 * Offsets are UTF-8 byte offsets, end-exclusive.
 */

namespace phiguard {
namespace model {

struct CandidateEntity
{
    std::size_t start = 0;
    std::size_t end = 0;
    Category category = Category::Unknown;
    double confidence = 0.0;
    DetectorSource source = DetectorSource::Unknown;
    std::string text;   ///< populated after projection

    CandidateEntity() = default;
    CandidateEntity(std::size_t s, std::size_t e, Category c, double conf,
                    DetectorSource src = DetectorSource::Rule)
        : start(s), end(e), category(c), confidence(conf), source(src)
    {
    }

    std::size_t length() const { return end > start ? end - start : 0; }
};

struct ResolvedEntity
{
    std::size_t start = 0;
    std::size_t end = 0;
    Category category = Category::Unknown;
    double confidence = 0.0;
    double weightedConfidence = 0.0;
    DetectorSource source = DetectorSource::Unknown;
    std::string text;

    std::size_t length() const { return end - start; }
};

/**
 * @brief What the transformation engine did with a resolved entity.
 */
enum class ActionTaken {
    Redacted,
    Hashed,
    Pseudonymized,
    Generalized,
    DateShifted,
    Preserved,      ///< header / clinical term guard left it untouched
    PassedThrough   ///< too short to hash, or an unparseable date
};

inline const char *actionTakenName(ActionTaken a)
{
    switch (a) {
    case ActionTaken::Redacted:      return "redacted";
    case ActionTaken::Hashed:        return "hashed";
    case ActionTaken::Pseudonymized: return "pseudonymized";
    case ActionTaken::Generalized:   return "generalized";
    case ActionTaken::DateShifted:   return "date_shifted";
    case ActionTaken::Preserved:     return "preserved";
    case ActionTaken::PassedThrough: return "passed_through";
    }
    return "unknown";
}

struct AuditRecord
{
    std::size_t start = 0;
    std::size_t end = 0;
    Category category = Category::Unknown;
    double confidence = 0.0;    ///< rounded to 3 decimals
    DetectorSource source = DetectorSource::Unknown;
    ActionTaken action = ActionTaken::Redacted;
};

inline double roundConfidence(double c)
{
    return std::round(c * 1000.0) / 1000.0;
}

inline bool overlaps(std::size_t aStart, std::size_t aEnd, std::size_t bStart, std::size_t bEnd)
{
    return aStart < bEnd && bStart < aEnd;
}

} // namespace model
} // namespace phiguard

#endif // PHIGUARD_MODEL_ENTITY_HPP
