#ifndef PHIGUARD_PIPELINE_DEIDENTIFIER_HPP
#define PHIGUARD_PIPELINE_DEIDENTIFIER_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "../../config/deid_config.hpp"
#include "../model/entity.hpp"
#include "../normalizer/text_normalizer.hpp"
#include "../resolver/clinical_preserve_finder.hpp"
#include "../resolver/conflict_resolver.hpp"
#include "../transform/transformation_engine.hpp"
#include "../util/thread_pool.hpp"
#include "candidate_detector.hpp"

/**
 * @file deidentifier.hpp
 * @brief End-to-end pipeline: normalize, detect, project, preserve, resolve, transform.
 *
 * DESIGN:
 *   - Detectors run in registration order over the canonical text.
 *   - Their candidates are projected to original coordinates, clinical measurements and
 *     configured phrases are added as preserve spans, and the resolver picks the final set.
 *   - A detector that throws is logged and skipped; the others still run.
 *   - deidentifyBatch() fans documents out over a lazily created ThreadPool. Subject
 *     contexts are shared through the SubjectRegistry, so one subject spread over many
 *     documents still gets one pseudonym per identifier and one date shift.
 *   - Register detectors before the first deidentify call.
 *
 * USAGE:
 *   @code
 *   phiguard::config::DeidConfig cfg;
 *   cfg.salt = "site-secret";
 *   phiguard::pipeline::Deidentifier deid(cfg);
 *   deid.addDetector(RegexDetector::withDefaultPatterns());
 *   auto result = deid.deidentify("SSN 123-45-6789", std::string("p1"));
 *   @endcode
 */

namespace phiguard {
namespace pipeline {

struct DeidentificationResult
{
    std::string text;
    std::vector<model::AuditRecord> audit;
    normalizer::ContainerSpans containers;   ///< canonical coordinates
};

struct BatchDocument
{
    std::string text;
    std::optional<std::string> subjectId;
};

class Deidentifier
{
public:
    explicit Deidentifier(const config::DeidConfig &config = config::DeidConfig(),
                          std::shared_ptr<transform::SubjectRegistry> registry =
                              std::make_shared<transform::SubjectRegistry>());

    Deidentifier(const Deidentifier&) = delete;
    Deidentifier& operator=(const Deidentifier&) = delete;

    /**
     * @throw std::invalid_argument if detector is null.
     */
    void addDetector(std::shared_ptr<CandidateDetector> detector);

    std::size_t detectorCount() const { return detectors_.size(); }

    /**
     * @brief Run the registered detectors and de-identify text.
     */
    DeidentificationResult deidentify(const std::string &text,
                                      const std::optional<std::string> &subjectId = std::nullopt) const;

    /**
     * @brief De-identify with candidates produced by the caller.
     * @param canonicalCandidates Spans over normalize(text).canonical().
     * @param preserve Extra preserve spans in original coordinates.
     */
    DeidentificationResult deidentify(const std::string &text,
                                      const std::vector<model::CandidateEntity> &canonicalCandidates,
                                      const std::vector<model::CandidateEntity> &preserve,
                                      const std::optional<std::string> &subjectId = std::nullopt) const;

    /**
     * @brief De-identify independent documents concurrently. Results keep input order.
     *        The first exception raised by any document is rethrown.
     */
    std::vector<DeidentificationResult> deidentifyBatch(const std::vector<BatchDocument> &documents) const;

    const normalizer::TextNormalizer &normalizer() const { return normalizer_; }
    const resolver::ConflictResolver &resolver() const { return resolver_; }
    const transform::TransformationEngine &engine() const { return engine_; }
    transform::SubjectRegistry &registry() const { return *registry_; }

private:
    std::vector<model::CandidateEntity> runDetectors(const normalizer::NormalizedDocument &doc) const;

    DeidentificationResult finish(const normalizer::NormalizedDocument &doc,
                                  const std::vector<model::CandidateEntity> &canonicalCandidates,
                                  const std::vector<model::CandidateEntity> &preserve,
                                  const std::optional<std::string> &subjectId) const;

    util::ThreadPool &pool() const;

    std::shared_ptr<transform::SubjectRegistry> registry_;
    normalizer::TextNormalizer normalizer_;
    resolver::ClinicalPreserveFinder preserveFinder_;
    resolver::ConflictResolver resolver_;
    transform::TransformationEngine engine_;
    std::vector<std::shared_ptr<CandidateDetector>> detectors_;
    std::size_t workerThreads_;

    mutable std::mutex poolMutex_;
    mutable std::unique_ptr<util::ThreadPool> pool_;
};

} // namespace pipeline
} // namespace phiguard

#endif // PHIGUARD_PIPELINE_DEIDENTIFIER_HPP
