#ifndef PHIGUARD_RESOLVER_CONFLICT_RESOLVER_HPP
#define PHIGUARD_RESOLVER_CONFLICT_RESOLVER_HPP

#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include "../model/entity.hpp"
#include "source_weights.hpp"

/**
 * @file conflict_resolver.hpp
 * @brief Merges candidate spans from several detectors into one non-overlapping entity set.
 *
 * DESIGN:
 *   0.  Drop malformed candidates (empty or out-of-bounds span, Unknown category).
 *   0b. Optionally merge adjacent DATE / MRN / NAME fragments.
 *   A.  Drop anything intersecting a preserve span.
 *   B.  Order by (start asc, length desc, priority asc, confidence desc).
 *   C.  Reject a candidate contained in an accepted one unless its priority is strictly better.
 *   D.  Greedy pass over survivors ranked by (priority, weighted confidence, length);
 *       a survivor is kept only if it overlaps nothing already kept.
 *   E.  weighted confidence = raw confidence * SourceWeights(source, category).
 *
 *   The result is sorted by start and no two entities overlap.
 *   Malformed input never throws; it is logged at debug level and dropped.
 *
 * USAGE:
 *   @code
 *   phiguard::resolver::ConflictResolver resolver;
 *   auto entities = resolver.resolve(projectedCandidates, preserveSpans, doc.original());
 *   @endcode
 */

namespace phiguard {
namespace resolver {

struct ResolverOptions
{
    bool mergeFragments = true;
    SourceWeights weights;

    std::size_t maxDateGap = 5;
    std::size_t maxMrnGap = 5;
    std::size_t maxNameGap = 3;
};

class ConflictResolver
{
public:
    explicit ConflictResolver(ResolverOptions options = ResolverOptions())
        : options_(std::move(options))
    {
    }

    /**
     * @brief Resolve candidates against the document they were projected onto.
     *        Fragment merging inspects the text between fragments, so it only runs here.
     * @param candidates Candidates in original coordinates.
     * @param preserve Spans that must never be transformed.
     * @param document The original text.
     */
    std::vector<model::ResolvedEntity> resolve(const std::vector<model::CandidateEntity> &candidates,
                                               const std::vector<model::CandidateEntity> &preserve,
                                               const std::string &document) const;

    /**
     * @brief Resolve when only the document length is known. No fragment merging.
     */
    std::vector<model::ResolvedEntity> resolve(const std::vector<model::CandidateEntity> &candidates,
                                               const std::vector<model::CandidateEntity> &preserve,
                                               std::size_t documentLength) const;

    /**
     * @brief Merge adjacent same-category fragments (dates split at separators, MRNs split
     *        by a short gap, names split by whitespace or initials).
     */
    std::vector<model::CandidateEntity> mergeFragments(std::vector<model::CandidateEntity> candidates,
                                                       const std::string &document) const;

    const ResolverOptions &options() const { return options_; }

private:
    std::vector<model::ResolvedEntity> resolveImpl(const std::vector<model::CandidateEntity> &candidates,
                                                   const std::vector<model::CandidateEntity> &preserve,
                                                   std::size_t documentLength,
                                                   const std::string *document) const;

    bool canMerge(const model::CandidateEntity &left,
                  const model::CandidateEntity &right,
                  const std::string &document) const;

    ResolverOptions options_;
};

} // namespace resolver
} // namespace phiguard

#endif // PHIGUARD_RESOLVER_CONFLICT_RESOLVER_HPP
