#include "pipeline/deidentifier.hpp"
#include "util/logger.hpp"

#include <future>
#include <stdexcept>

namespace phiguard {
namespace pipeline {

using model::CandidateEntity;

namespace {

resolver::ResolverOptions resolverOptions(const config::DeidConfig &config)
{
    resolver::ResolverOptions options;
    options.mergeFragments = config.mergeFragments;
    options.weights = config.sourceWeights;
    return options;
}

void maskSpans(std::string &masked, const std::vector<CandidateEntity> &spans)
{
    for (const auto &c : spans) {
        if (c.start >= c.end || c.end > masked.size()) {
            continue;
        }
        for (std::size_t i = c.start; i < c.end; ++i) {
            masked[i] = '#';
        }
    }
}

} // namespace

Deidentifier::Deidentifier(const config::DeidConfig &config,
                           std::shared_ptr<transform::SubjectRegistry> registry)
    : registry_(std::move(registry))
    , preserveFinder_(config.headerPhrases)
    , resolver_(resolverOptions(config))
    , engine_(config, registry_)
    , workerThreads_(config.workerThreads)
{
}

void Deidentifier::addDetector(std::shared_ptr<CandidateDetector> detector)
{
    if (!detector) {
        throw std::invalid_argument("Deidentifier: detector must not be null");
    }
    util::logger::info("Deidentifier: registered detector '" + detector->name() + "'");
    detectors_.push_back(std::move(detector));
}

std::vector<CandidateEntity> Deidentifier::runDetectors(const normalizer::NormalizedDocument &doc) const
{
    std::vector<CandidateEntity> all;
    std::string masked = doc.canonical();

    for (const auto &detector : detectors_) {
        std::vector<CandidateEntity> found;
        try {
            found = detector->detect(detector->wantsMaskedInput() ? masked : doc.canonical());
        }
        catch (const std::exception &ex) {
            util::logger::error("Deidentifier: detector '" + detector->name() + "' failed: " + ex.what());
            continue;
        }
        maskSpans(masked, found);
        util::logger::debug("Deidentifier: detector '" + detector->name() + "' proposed "
                            + std::to_string(found.size()) + " candidate(s)");
        all.insert(all.end(), found.begin(), found.end());
    }
    return all;
}

DeidentificationResult Deidentifier::deidentify(const std::string &text,
                                                const std::optional<std::string> &subjectId) const
{
    const normalizer::NormalizedDocument doc = normalizer_.normalize(text);
    return finish(doc, runDetectors(doc), {}, subjectId);
}

DeidentificationResult Deidentifier::deidentify(const std::string &text,
                                                const std::vector<CandidateEntity> &canonicalCandidates,
                                                const std::vector<CandidateEntity> &preserve,
                                                const std::optional<std::string> &subjectId) const
{
    const normalizer::NormalizedDocument doc = normalizer_.normalize(text);
    return finish(doc, canonicalCandidates, preserve, subjectId);
}

DeidentificationResult Deidentifier::finish(const normalizer::NormalizedDocument &doc,
                                            const std::vector<CandidateEntity> &canonicalCandidates,
                                            const std::vector<CandidateEntity> &preserve,
                                            const std::optional<std::string> &subjectId) const
{
    const std::size_t canonicalLength = doc.canonical().size();
    std::vector<CandidateEntity> projected;
    projected.reserve(canonicalCandidates.size());
    for (const auto &c : canonicalCandidates) {
        // projection clamps, so out-of-range spans are rejected before it
        if (c.start >= c.end || c.end > canonicalLength) {
            util::logger::debug("Deidentifier: dropped candidate outside canonical text at "
                                + std::to_string(c.start));
            continue;
        }
        projected.push_back(doc.projectCandidate(c));
    }

    std::vector<CandidateEntity> preserveSpans = preserveFinder_.find(doc.original());
    preserveSpans.insert(preserveSpans.end(), preserve.begin(), preserve.end());

    const std::vector<model::ResolvedEntity> entities =
        resolver_.resolve(projected, preserveSpans, doc.original());

    transform::TransformResult transformed = engine_.transform(doc.original(), entities, subjectId);

    DeidentificationResult result;
    result.text = std::move(transformed.text);
    result.audit = std::move(transformed.audit);
    result.containers = normalizer_.findContainerSpans(doc.canonical());
    util::logger::info("Deidentifier: " + std::to_string(result.audit.size()) + " identifier(s) handled in "
                       + std::to_string(doc.original().size()) + " bytes");
    return result;
}

util::ThreadPool &Deidentifier::pool() const
{
    std::lock_guard<std::mutex> lock(poolMutex_);
    if (!pool_) {
        pool_ = std::make_unique<util::ThreadPool>(workerThreads_);
    }
    return *pool_;
}

std::vector<DeidentificationResult> Deidentifier::deidentifyBatch(const std::vector<BatchDocument> &documents) const
{
    util::ThreadPool &workers = pool();

    std::vector<std::future<DeidentificationResult>> futures;
    futures.reserve(documents.size());
    for (const auto &doc : documents) {
        futures.push_back(workers.submit([this, &doc] {
            return deidentify(doc.text, doc.subjectId);
        }));
    }

    std::vector<DeidentificationResult> results;
    results.reserve(documents.size());
    for (auto &f : futures) {
        // wait for everything before rethrowing so no task outlives documents
        f.wait();
    }
    for (auto &f : futures) {
        results.push_back(f.get());
    }
    return results;
}

} // namespace pipeline
} // namespace phiguard
