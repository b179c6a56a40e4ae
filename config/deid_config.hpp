#ifndef PHIGUARD_CONFIG_DEID_CONFIG_HPP
#define PHIGUARD_CONFIG_DEID_CONFIG_HPP

#include <cstddef>
#include <string>
#include <vector>
#include "../src/resolver/source_weights.hpp"
#include "../src/transform/rulebook.hpp"

/**
 * @file deid_config.hpp
 * @brief Settings for one de-identification pipeline.
 *
 * USAGE:
 *   - Populate by hand or through util/config_parser.hpp.
 *   - Hand it to pipeline::Deidentifier or transform::TransformationEngine.
 */

namespace phiguard {
namespace config {

/**
 * @brief Abbreviations and dosing words that are never transformed.
 */
inline std::vector<std::string> defaultClinicalTerms()
{
    return {
        "NSTEMI", "STEMI", "T2DM", "HTN", "CABG", "GLP-1", "RA", "mg",
        "BID", "TID", "QID", "PRN", "PO", "IV", "IM", "SC", "SQ",
        "weekly", "daily", "morning", "dizziness", "Occasional"
    };
}

/**
 * @struct DeidConfig
 * @brief Holds everything the transformation stage needs plus resolver tuning:
 *   - salt: HMAC key for pseudonyms and subject date offsets.
 *   - dateShiftDays: shift used when a call has no subject.
 *   - rulebook: per-category action and pseudonym templates.
 *   - code lengths and the minimum length an identifier must have to be hashed.
 *   - clinical terms and header phrases that are never transformed.
 *   - source weights and fragment merging for the resolver.
 */
struct DeidConfig
{
    /**
     * @brief Defaults: empty salt (the engine substitutes a loud fallback), 30 day
     *        default shift, redact everything, 12 / 8 character codes, minimum
     *        transform length 3.
     */
    DeidConfig()
        : salt(""),
          dateShiftDays(30),
          rulebook(transform::Action::Redact),
          hashCodeLength(12),
          pseudonymCodeLength(8),
          minTransformLength(3),
          clinicalTerms(defaultClinicalTerms()),
          mergeFragments(true),
          workerThreads(0)
    {
    }

    /// HMAC key. Empty or a placeholder value triggers the non-production fallback.
    std::string salt;

    /// Days to shift dates by when no subject id is supplied.
    int dateShiftDays;

    transform::RuleBook rulebook;

    std::size_t hashCodeLength;
    std::size_t pseudonymCodeLength;

    /// Identifiers shorter than this (after trimming) pass through hashing untouched.
    std::size_t minTransformLength;

    std::vector<std::string> clinicalTerms;

    /// Extra phrases guarded like section headers and preserved by the resolver.
    std::vector<std::string> headerPhrases;

    resolver::SourceWeights sourceWeights;

    bool mergeFragments;

    /// Worker threads for batch processing; zero means hardware concurrency.
    std::size_t workerThreads;
};

} // namespace config
} // namespace phiguard

#endif // PHIGUARD_CONFIG_DEID_CONFIG_HPP
