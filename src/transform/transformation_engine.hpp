#ifndef PHIGUARD_TRANSFORM_TRANSFORMATION_ENGINE_HPP
#define PHIGUARD_TRANSFORM_TRANSFORMATION_ENGINE_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "../../config/deid_config.hpp"
#include "../model/entity.hpp"
#include "date_shifter.hpp"
#include "pseudonymizer.hpp"
#include "rulebook.hpp"
#include "subject_context.hpp"

/**
 * @file transformation_engine.hpp
 * @brief Rewrites resolved identifier spans according to the rulebook.
 *
 * DESIGN:
 *   - Entities are applied right-to-left on a copy of the original, so no offset
 *     bookkeeping is needed. Bytes outside the applied spans are copied unchanged.
 *   - EMAIL and URL entities, and any entity whose text contains '@', are widened to the
 *     surrounding whitespace-delimited token (minus trailing sentence punctuation) so a
 *     transform never strands half an address. Entities inside a widened span are
 *     absorbed by it.
 *   - Section headers, configured header phrases, clinical terms and doses are left as-is
 *     and audited as Preserved.
 *   - Actions:
 *       Redact     -> [REDACTED:<CATEGORY>]
 *       Hash       -> template rendered with a hashCodeLength-character HMAC code
 *       Pseudonym  -> template rendered with a pseudonymCodeLength-character HMAC code
 *       Generalize -> NNNXX for ZIPs, AGE_OVER_89, year for dates, else [GENERALIZED:<CATEGORY>]
 *       DateShift  -> DateShifter; unparseable dates pass through
 *   - An empty or placeholder salt is replaced by kFallbackSalt with a WARN at construction.
 *
 * USAGE:
 *   @code
 *   phiguard::config::DeidConfig cfg;
 *   cfg.salt = "site-secret";
 *   cfg.rulebook.setAction(Category::Date, Action::DateShift);
 *   phiguard::transform::TransformationEngine engine(cfg);
 *   auto result = engine.transform(text, entities, std::string("p1"));
 *   @endcode
 */

namespace phiguard {
namespace transform {

struct TransformResult
{
    std::string text;
    std::vector<model::AuditRecord> audit;   ///< sorted by start
};

class TransformationEngine
{
public:
    static constexpr const char *kFallbackSalt = "HIPAA_DEFAULT_SALT_NOT_FOR_PRODUCTION_USE";

    explicit TransformationEngine(const config::DeidConfig &config,
                                  std::shared_ptr<SubjectRegistry> registry = std::make_shared<SubjectRegistry>());

    /**
     * @brief Transform with the registry's context for subjectId (anonymous if absent).
     */
    TransformResult transform(const std::string &original,
                              const std::vector<model::ResolvedEntity> &entities,
                              const std::optional<std::string> &subjectId = std::nullopt) const;

    /**
     * @brief Transform with an explicit context.
     */
    TransformResult transform(const std::string &original,
                              const std::vector<model::ResolvedEntity> &entities,
                              SubjectContext &context) const;

    /**
     * @return The salt to use and whether it is the fallback.
     */
    static std::pair<std::string, bool> resolveSalt(const std::string &configured);

    /**
     * @brief Widen a partial span of an atomic identifier to the whole identifier.
     *
     * Growth follows the category's character class: the email address class, URL
     * characters back to an http(s) scheme, date digits and separators, or
     * [A-Za-z0-9-] for identifiers. It never leaves [minStart, maxEnd). Separators and
     * wrapping punctuation picked up outside the original span are trimmed again.
     * Non-atomic categories are returned unchanged.
     */
    static std::pair<std::size_t, std::size_t> expandToken(const std::string &original,
                                                           std::size_t start, std::size_t end,
                                                           model::Category category,
                                                           std::size_t minStart = 0,
                                                           std::size_t maxEnd = std::string::npos);

    bool isProtectedHeader(const std::string &text) const;
    bool isClinicalTerm(const std::string &text) const;

    std::string generalize(model::Category category, const std::string &text,
                           SubjectContext &context) const;

    bool usingFallbackSalt() const { return fallbackSalt_; }
    const RuleBook &rules() const { return rules_; }
    const DateShifter &dateShifter() const { return dateShifter_; }
    SubjectRegistry &registry() const { return *registry_; }

private:
    struct Outcome
    {
        std::string replacement;
        model::ActionTaken action;
    };

    Outcome apply(const model::ResolvedEntity &entity, const std::string &spanText,
                  SubjectContext &context) const;

    RuleBook rules_;
    std::string salt_;
    bool fallbackSalt_;
    std::size_t minTransformLength_;
    std::vector<std::string> clinicalTerms_;
    std::vector<std::string> headerPhrases_;
    Pseudonymizer pseudonymizer_;
    DateShifter dateShifter_;
    std::shared_ptr<SubjectRegistry> registry_;
};

} // namespace transform
} // namespace phiguard

#endif // PHIGUARD_TRANSFORM_TRANSFORMATION_ENGINE_HPP
