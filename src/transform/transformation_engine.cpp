#include "transform/transformation_engine.hpp"
#include "util/logger.hpp"
#include "util/pattern_scan.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>
#include <unordered_set>

namespace phiguard {
namespace transform {

using model::ActionTaken;
using model::AuditRecord;
using model::Category;
using model::ResolvedEntity;

namespace {

const char *const kPlaceholderSalts[] = {
    "DEFAULT_SALT_REPLACE_IN_PRODUCTION",
    "DEFAULT_SALT_CHANGE_IN_PRODUCTION",
};

bool isSpace(char ch)
{
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

std::string trim(const std::string &s)
{
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && isSpace(s[b])) ++b;
    while (e > b && isSpace(s[e - 1])) --e;
    return s.substr(b, e - b);
}

std::string lower(const std::string &s)
{
    std::string out(s);
    for (char &ch : out) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return out;
}

bool isTrailingPunct(char ch)
{
    static const std::string kChars = ".,;:!?)]}>\"'";
    return kChars.find(ch) != std::string::npos;
}

bool isLeadingPunct(char ch)
{
    static const std::string kChars = "(<[\"'";
    return kChars.find(ch) != std::string::npos;
}

const std::unordered_set<std::string> &commonHeaders()
{
    static const std::unordered_set<std::string> kHeaders = {
        "outpatient progress note", "progress note", "discharge summary", "after visit summary",
        "emergency department", "triage note", "radiology report", "operative note",
        "home health nursing", "patient portal", "referral letter", "chief complaint",
        "history of present illness", "hpi", "past medical history", "pmh", "medications",
        "allergies", "physical exam", "assessment", "plan", "follow-up", "vitals", "labs",
        "impression", "findings", "assessment/plan", "assessment and plan", "review of systems",
        "social history", "family history"
    };
    return kHeaders;
}

const std::vector<std::string> &containedHeaderPhrases()
{
    static const std::vector<std::string> kPhrases = {
        "Progress Note", "Visit Summary", "Discharge Summary", "Triage Note", "Radiology Report",
        "Operative Note", "Referral Letter", "Medical Center", "Chief Complaint",
        "Assessment/Plan", "Follow-up"
    };
    return kPhrases;
}

std::string redactionLabel(Category c)
{
    return std::string("[REDACTED:") + model::categoryName(c) + "]";
}

std::string generalizationLabel(Category c)
{
    return std::string("[GENERALIZED:") + model::categoryName(c) + "]";
}

bool isAsciiDigit(char ch)
{
    return ch >= '0' && ch <= '9';
}

bool isAsciiAlnum(char ch)
{
    return std::isalnum(static_cast<unsigned char>(ch)) != 0;
}

// [a-zA-Z0-9._%+-] plus '@' so a span starting at or ending before the '@' still grows
bool isEmailChar(char ch)
{
    return isAsciiAlnum(ch) || ch == '.' || ch == '_' || ch == '%' || ch == '+' || ch == '-' || ch == '@';
}

bool isUrlChar(char ch)
{
    return !isSpace(ch) && ch != '<' && ch != '>' && ch != '"';
}

bool isDateChar(char ch)
{
    return isAsciiDigit(ch) || ch == '/' || ch == '-' || ch == '.';
}

bool isIdentifierChar(char ch)
{
    return isAsciiAlnum(ch) || ch == '-';
}

bool isSeparator(char ch)
{
    return ch == '/' || ch == '-' || ch == '.' || ch == ':';
}

// Email and URL spans swallow anything they touch; other atomic spans stop at their neighbours.
bool absorbsNeighbours(Category c, const std::string &text)
{
    return c == Category::EmailAddress || c == Category::Url || text.find('@') != std::string::npos;
}

// Start of the last http:// or https:// scheme in [from, start], or start when there is none.
std::size_t urlSchemeStart(const std::string &original, std::size_t from, std::size_t start)
{
    const std::string region = lower(original.substr(from, start - from + 8));
    for (std::size_t p = region.rfind("http", start - from); p != std::string::npos;
         p = p == 0 ? std::string::npos : region.rfind("http", p - 1)) {
        if (region.compare(p, 7, "http://") == 0 || region.compare(p, 8, "https://") == 0) {
            return from + p;
        }
    }
    return start;
}

struct Planned
{
    std::size_t start;
    std::size_t end;
    const ResolvedEntity *entity;
};

} // namespace

TransformationEngine::TransformationEngine(const config::DeidConfig &config,
                                           std::shared_ptr<SubjectRegistry> registry)
    : rules_(config.rulebook)
    , salt_(resolveSalt(config.salt).first)
    , fallbackSalt_(resolveSalt(config.salt).second)
    , minTransformLength_(config.minTransformLength)
    , clinicalTerms_(config.clinicalTerms)
    , headerPhrases_(config.headerPhrases)
    , pseudonymizer_(salt_, config.hashCodeLength, config.pseudonymCodeLength)
    , dateShifter_(salt_, config.dateShiftDays)
    , registry_(std::move(registry))
{
    if (!registry_) {
        throw std::invalid_argument("TransformationEngine: subject registry must not be null");
    }
    if (fallbackSalt_) {
        util::logger::warn("TransformationEngine: no production salt configured; using "
                           + std::string(kFallbackSalt)
                           + ". Pseudonyms are NOT secure. Set 'salt' before processing real data.");
    }
    for (auto &term : clinicalTerms_) {
        term = lower(trim(term));
    }
    for (auto &phrase : headerPhrases_) {
        phrase = lower(trim(phrase));
    }
}

std::pair<std::string, bool> TransformationEngine::resolveSalt(const std::string &configured)
{
    const std::string trimmed = trim(configured);
    if (trimmed.empty()) {
        return {kFallbackSalt, true};
    }
    for (const char *placeholder : kPlaceholderSalts) {
        if (trimmed == placeholder) {
            return {kFallbackSalt, true};
        }
    }
    return {configured, false};
}

std::pair<std::size_t, std::size_t> TransformationEngine::expandToken(const std::string &original,
                                                                      std::size_t start, std::size_t end,
                                                                      Category category,
                                                                      std::size_t minStart, std::size_t maxEnd)
{
    maxEnd = std::min(maxEnd, original.size());
    minStart = std::min(minStart, start);
    const std::string text = original.substr(start, end - start);

    bool (*member)(char) = nullptr;
    bool (*trailing)(char) = isSeparator;
    if (category == Category::Url || (category != Category::EmailAddress
                                      && text.find("://") != std::string::npos)) {
        member = isUrlChar;
        trailing = isTrailingPunct;
    } else if (category == Category::EmailAddress || text.find('@') != std::string::npos) {
        member = isEmailChar;
        trailing = isTrailingPunct;
    } else if (category == Category::Date) {
        member = isDateChar;
    } else if (category == Category::IpAddress) {
        // IPv4 only; a colon would pull in a glued "IP:" label
        member = [](char ch) { return isAsciiDigit(ch) || ch == '.'; };
    } else if (category == Category::Ssn) {
        member = [](char ch) { return isAsciiDigit(ch) || ch == '-'; };
    } else if (model::isAtomic(category)) {
        member = isIdentifierChar;
    } else {
        return {start, end};
    }

    std::size_t s = start;
    std::size_t e = end;
    if (member == isUrlChar) {
        std::size_t tokenStart = start;
        while (tokenStart > minStart && isUrlChar(original[tokenStart - 1])) {
            --tokenStart;
        }
        s = urlSchemeStart(original, tokenStart, start);
    } else {
        while (s > minStart && member(original[s - 1])) {
            --s;
        }
    }
    while (e < maxEnd && member(original[e])) {
        ++e;
    }

    while (e > end && trailing(original[e - 1])) {
        --e;
    }
    while (s < start && (isLeadingPunct(original[s]) || isSeparator(original[s]))) {
        ++s;
    }
    return {s, e};
}

bool TransformationEngine::isProtectedHeader(const std::string &text) const
{
    const std::string trimmed = trim(text);
    if (trimmed.empty()) {
        return false;
    }
    const std::string key = lower(trimmed);
    if (commonHeaders().count(key) > 0) {
        return true;
    }
    if (std::find(headerPhrases_.begin(), headerPhrases_.end(), key) != headerPhrases_.end()) {
        return true;
    }
    for (const auto &phrase : containedHeaderPhrases()) {
        if (trimmed.find(phrase) != std::string::npos) {
            return true;
        }
    }
    static const std::shared_ptr<re2::RE2> kSectionHeader = util::compilePattern("[A-Z][a-zA-Z\\s/]+:");
    return re2::RE2::FullMatch(trimmed, *kSectionHeader);
}

bool TransformationEngine::isClinicalTerm(const std::string &text) const
{
    const std::string key = lower(trim(text));
    if (key.empty()) {
        return false;
    }
    if (std::find(clinicalTerms_.begin(), clinicalTerms_.end(), key) != clinicalTerms_.end()) {
        return true;
    }
    static const std::shared_ptr<re2::RE2> kDose = util::compilePattern("\\d+\\.?\\d*\\s*mg");
    return re2::RE2::PartialMatch(text, *kDose);
}

std::string TransformationEngine::generalize(Category category, const std::string &text,
                                             SubjectContext &context) const
{
    static const std::shared_ptr<re2::RE2> kZip = util::compilePattern("(\\d{5})(?:-?\\d{4})?");
    const std::string trimmed = trim(text);
    std::string zip5;
    if ((category == Category::Zip || category == Category::Location)
        && re2::RE2::FullMatch(trimmed, *kZip, &zip5)) {
        return zip5.substr(0, 3) + "XX";
    }

    switch (category) {
    case Category::Zip:
        return pseudonymizer_.transform(category, text, Action::Pseudonym, rules_, context);
    case Category::AgeOver89:
        return "AGE_OVER_89";
    case Category::Date: {
        std::optional<int64_t> year = DateShifter::extractYear(text);
        if (year) {
            return std::to_string(*year);
        }
        return generalizationLabel(category);
    }
    default:
        return generalizationLabel(category);
    }
}

TransformationEngine::Outcome TransformationEngine::apply(const ResolvedEntity &entity,
                                                          const std::string &spanText,
                                                          SubjectContext &context) const
{
    if (isProtectedHeader(spanText) || isClinicalTerm(spanText)) {
        return {spanText, ActionTaken::Preserved};
    }

    const Action action = rules_.action(entity.category);
    switch (action) {
    case Action::Redact:
        return {redactionLabel(entity.category), ActionTaken::Redacted};
    case Action::Hash:
    case Action::Pseudonym:
        if (trim(spanText).size() < minTransformLength_) {
            return {spanText, ActionTaken::PassedThrough};
        }
        return {pseudonymizer_.transform(entity.category, spanText, action, rules_, context),
                action == Action::Hash ? ActionTaken::Hashed : ActionTaken::Pseudonymized};
    case Action::Generalize:
        return {generalize(entity.category, spanText, context), ActionTaken::Generalized};
    case Action::DateShift: {
        std::optional<std::string> shifted = dateShifter_.tryShift(spanText, context);
        if (!shifted) {
            return {spanText, ActionTaken::PassedThrough};
        }
        return {*shifted, ActionTaken::DateShifted};
    }
    }
    return {redactionLabel(entity.category), ActionTaken::Redacted};
}

TransformResult TransformationEngine::transform(const std::string &original,
                                                const std::vector<ResolvedEntity> &entities,
                                                const std::optional<std::string> &subjectId) const
{
    std::shared_ptr<SubjectContext> context = registry_->acquire(subjectId);
    return transform(original, entities, *context);
}

TransformResult TransformationEngine::transform(const std::string &original,
                                                const std::vector<ResolvedEntity> &entities,
                                                SubjectContext &context) const
{
    std::vector<const ResolvedEntity*> ordered;
    ordered.reserve(entities.size());
    for (const auto &e : entities) {
        if (e.start < e.end && e.end <= original.size()) {
            ordered.push_back(&e);
        } else {
            util::logger::debug("TransformationEngine: skipped out-of-range entity at "
                                + std::to_string(e.start));
        }
    }
    std::sort(ordered.begin(), ordered.end(), [](const ResolvedEntity *a, const ResolvedEntity *b) {
        return a->start < b->start;
    });

    std::vector<Planned> plan;
    plan.reserve(ordered.size());
    std::size_t widenedCount = 0;
    auto clashes = [&plan](std::size_t start, std::size_t end, const ResolvedEntity *e) {
        return std::any_of(plan.begin(), plan.end(), [&](const Planned &p) {
            return p.entity == e || model::overlaps(p.start, p.end, start, end);
        });
    };

    // email and URL spans first; everything they touch is absorbed
    for (const ResolvedEntity *e : ordered) {
        if (!absorbsNeighbours(e->category, original.substr(e->start, e->end - e->start))) {
            continue;
        }
        auto span = expandToken(original, e->start, e->end, e->category);
        if (!clashes(span.first, span.second, e)) {
            plan.push_back({span.first, span.second, e});
            widenedCount += (span.first != e->start || span.second != e->end) ? 1 : 0;
        }
    }
    // other atomic identifiers grow to the whole identifier, stopping at neighbouring entities
    for (std::size_t i = 0; i < ordered.size(); ++i) {
        const ResolvedEntity *e = ordered[i];
        if (!model::isAtomic(e->category) || clashes(e->start, e->end, e)) {
            continue;
        }
        const std::size_t minStart = i > 0 ? std::min(ordered[i - 1]->end, e->start) : 0;
        const std::size_t maxEnd = i + 1 < ordered.size() ? std::max(ordered[i + 1]->start, e->end)
                                                          : original.size();
        auto span = expandToken(original, e->start, e->end, e->category, minStart, maxEnd);
        if (clashes(span.first, span.second, e)) {
            span = {e->start, e->end};
        }
        plan.push_back({span.first, span.second, e});
        widenedCount += (span.first != e->start || span.second != e->end) ? 1 : 0;
    }
    for (const ResolvedEntity *e : ordered) {
        if (!clashes(e->start, e->end, e)) {
            plan.push_back({e->start, e->end, e});
        }
    }

    std::sort(plan.begin(), plan.end(), [](const Planned &a, const Planned &b) {
        return a.start > b.start;
    });

    TransformResult result;
    result.text = original;
    result.audit.reserve(plan.size());
    for (const Planned &p : plan) {
        const std::string spanText = original.substr(p.start, p.end - p.start);
        Outcome outcome = apply(*p.entity, spanText, context);
        if (outcome.action != ActionTaken::Preserved && outcome.action != ActionTaken::PassedThrough) {
            result.text.replace(p.start, p.end - p.start, outcome.replacement);
        }

        AuditRecord record;
        record.start = p.start;
        record.end = p.end;
        record.category = p.entity->category;
        record.confidence = model::roundConfidence(p.entity->confidence);
        record.source = p.entity->source;
        record.action = outcome.action;
        result.audit.push_back(record);
    }

    std::sort(result.audit.begin(), result.audit.end(), [](const AuditRecord &a, const AuditRecord &b) {
        return a.start < b.start;
    });

    util::logger::debug("TransformationEngine: applied " + std::to_string(plan.size()) + " of "
                        + std::to_string(entities.size()) + " entities ("
                        + std::to_string(widenedCount) + " widened)");
    return result;
}

} // namespace transform
} // namespace phiguard
