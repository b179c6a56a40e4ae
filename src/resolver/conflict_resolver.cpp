#include "resolver/conflict_resolver.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cmath>
#include <tuple>

namespace phiguard {
namespace resolver {

using model::CandidateEntity;
using model::Category;
using model::ResolvedEntity;

namespace {

// NaN or out-of-range confidence would break the orderings used below
bool isValid(const CandidateEntity &c, std::size_t documentLength)
{
    return c.start < c.end && c.end <= documentLength && c.category != Category::Unknown
        && std::isfinite(c.confidence) && c.confidence >= 0.0 && c.confidence <= 1.0;
}

bool gapIsDateSeparator(const std::string &gap)
{
    // stripped gap must be empty or a single separator
    std::string core;
    for (char ch : gap) {
        if (ch != ' ' && ch != '\t' && ch != '\n' && ch != '\r') {
            core.push_back(ch);
        }
    }
    return core.empty() || core == "/" || core == "-" || core == ".";
}

bool gapIsNameSeparator(const std::string &gap)
{
    return std::all_of(gap.begin(), gap.end(), [](char ch) {
        return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '.';
    });
}

struct Scored
{
    ResolvedEntity entity;
    int priority;
};

} // namespace

bool ConflictResolver::canMerge(const CandidateEntity &left,
                                const CandidateEntity &right,
                                const std::string &document) const
{
    if (left.category != right.category || right.start < left.end) {
        return false;
    }
    const std::size_t gapLen = right.start - left.end;
    const std::string gap = document.substr(left.end, gapLen);
    switch (left.category) {
    case Category::Date:
        return gapLen <= options_.maxDateGap && gapIsDateSeparator(gap);
    case Category::Mrn:
        return gapLen <= options_.maxMrnGap;
    case Category::Name:
        return gapLen <= options_.maxNameGap && gapIsNameSeparator(gap);
    default:
        return false;
    }
}

std::vector<CandidateEntity> ConflictResolver::mergeFragments(std::vector<CandidateEntity> candidates,
                                                              const std::string &document) const
{
    std::vector<CandidateEntity> out;
    std::vector<CandidateEntity> mergeable;
    out.reserve(candidates.size());
    for (auto &c : candidates) {
        if (c.category == Category::Date || c.category == Category::Mrn || c.category == Category::Name) {
            mergeable.push_back(std::move(c));
        } else {
            out.push_back(std::move(c));
        }
    }

    std::stable_sort(mergeable.begin(), mergeable.end(),
                     [](const CandidateEntity &a, const CandidateEntity &b) {
                         return std::tie(a.category, a.start, a.end) < std::tie(b.category, b.start, b.end);
                     });

    std::size_t merges = 0;
    std::size_t i = 0;
    while (i < mergeable.size()) {
        CandidateEntity current = mergeable[i];
        std::size_t j = i + 1;
        while (j < mergeable.size() && canMerge(current, mergeable[j], document)) {
            const CandidateEntity &next = mergeable[j];
            if (next.confidence > current.confidence) {
                current.confidence = next.confidence;
                current.source = next.source;
            }
            current.end = next.end;
            ++merges;
            ++j;
        }
        if (j > i + 1) {
            current.text = document.substr(current.start, current.end - current.start);
        }
        out.push_back(std::move(current));
        i = j;
    }

    if (merges > 0) {
        util::logger::debug("ConflictResolver: merged " + std::to_string(merges) + " fragment(s)");
    }
    return out;
}

std::vector<ResolvedEntity> ConflictResolver::resolve(const std::vector<CandidateEntity> &candidates,
                                                      const std::vector<CandidateEntity> &preserve,
                                                      const std::string &document) const
{
    return resolveImpl(candidates, preserve, document.size(), &document);
}

std::vector<ResolvedEntity> ConflictResolver::resolve(const std::vector<CandidateEntity> &candidates,
                                                      const std::vector<CandidateEntity> &preserve,
                                                      std::size_t documentLength) const
{
    return resolveImpl(candidates, preserve, documentLength, nullptr);
}

std::vector<ResolvedEntity> ConflictResolver::resolveImpl(const std::vector<CandidateEntity> &candidates,
                                                          const std::vector<CandidateEntity> &preserve,
                                                          std::size_t documentLength,
                                                          const std::string *document) const
{
    // Step 0: validation
    std::vector<CandidateEntity> working;
    working.reserve(candidates.size());
    std::size_t malformed = 0;
    for (const auto &c : candidates) {
        if (isValid(c, documentLength)) {
            working.push_back(c);
        } else {
            ++malformed;
        }
    }
    if (malformed > 0) {
        util::logger::debug("ConflictResolver: dropped " + std::to_string(malformed)
                            + " malformed candidate(s)");
    }

    if (options_.mergeFragments && document != nullptr) {
        working = mergeFragments(std::move(working), *document);
    }

    // Step A: preserve spans always win
    std::vector<CandidateEntity> kept;
    kept.reserve(working.size());
    for (auto &c : working) {
        bool hit = false;
        for (const auto &p : preserve) {
            if (p.start < p.end && model::overlaps(c.start, c.end, p.start, p.end)) {
                hit = true;
                break;
            }
        }
        if (!hit) {
            kept.push_back(std::move(c));
        }
    }

    // Step B: deterministic ordering
    std::stable_sort(kept.begin(), kept.end(), [](const CandidateEntity &a, const CandidateEntity &b) {
        if (a.start != b.start) return a.start < b.start;
        if (a.length() != b.length()) return a.length() > b.length();
        const int pa = model::categoryPriority(a.category);
        const int pb = model::categoryPriority(b.category);
        if (pa != pb) return pa < pb;
        return a.confidence > b.confidence;
    });

    // Step C: containment
    std::vector<const CandidateEntity*> accepted;
    accepted.reserve(kept.size());
    for (const auto &c : kept) {
        bool rejected = false;
        for (const CandidateEntity *a : accepted) {
            if (a->start <= c.start && c.end <= a->end
                && model::categoryPriority(c.category) >= model::categoryPriority(a->category)) {
                rejected = true;
                break;
            }
        }
        if (!rejected) {
            accepted.push_back(&c);
        }
    }

    // Step E feeds Step D
    std::vector<Scored> scored;
    scored.reserve(accepted.size());
    for (const CandidateEntity *c : accepted) {
        Scored s;
        s.entity.start = c->start;
        s.entity.end = c->end;
        s.entity.category = c->category;
        s.entity.confidence = c->confidence;
        s.entity.weightedConfidence = c->confidence * options_.weights.weight(c->source, c->category);
        s.entity.source = c->source;
        if (!c->text.empty()) {
            s.entity.text = c->text;
        } else if (document != nullptr) {
            s.entity.text = document->substr(c->start, c->end - c->start);
        }
        s.priority = model::categoryPriority(c->category);
        scored.push_back(std::move(s));
    }

    // Step D: strongest first, keep whatever does not collide
    std::stable_sort(scored.begin(), scored.end(), [](const Scored &a, const Scored &b) {
        if (a.priority != b.priority) return a.priority < b.priority;
        if (a.entity.weightedConfidence != b.entity.weightedConfidence) {
            return a.entity.weightedConfidence > b.entity.weightedConfidence;
        }
        if (a.entity.length() != b.entity.length()) return a.entity.length() > b.entity.length();
        return a.entity.start < b.entity.start;
    });

    std::vector<ResolvedEntity> result;
    result.reserve(scored.size());
    for (auto &s : scored) {
        bool clash = std::any_of(result.begin(), result.end(), [&](const ResolvedEntity &r) {
            return model::overlaps(r.start, r.end, s.entity.start, s.entity.end);
        });
        if (!clash) {
            result.push_back(std::move(s.entity));
        }
    }

    std::sort(result.begin(), result.end(), [](const ResolvedEntity &a, const ResolvedEntity &b) {
        return a.start < b.start;
    });

    util::logger::debug("ConflictResolver: " + std::to_string(candidates.size()) + " candidate(s) -> "
                        + std::to_string(result.size()) + " entit(ies)");
    return result;
}

} // namespace resolver
} // namespace phiguard
