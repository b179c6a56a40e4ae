#ifndef PHIGUARD_TRANSFORM_PSEUDONYMIZER_HPP
#define PHIGUARD_TRANSFORM_PSEUDONYMIZER_HPP

#include <algorithm>
#include <cctype>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "../model/category.hpp"
#include "../util/hashing.hpp"
#include "rulebook.hpp"
#include "subject_context.hpp"

/**
 * @file pseudonymizer.hpp
 * @brief Salted, memoized hash and pseudonym rendering.
 *
 * cacheKey = [subject ":"] CATEGORY ":" normalized-text
 *
 * Text is lower-cased with whitespace collapsed. Names additionally lose punctuation,
 * "Last, First" is rotated, only the first and last tokens of longer names are kept,
 * and the tokens are sorted, so "Smith, John", "John Smith" and "JOHN  SMITH" all
 * share one key.
 */

namespace phiguard {
namespace transform {

inline std::string normalizeIdentifierText(const std::string &text)
{
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (unsigned char ch : text) {
        if (std::isspace(ch)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(static_cast<char>(std::tolower(ch)));
    }
    return out;
}

inline std::string normalizeNameText(const std::string &text)
{
    std::string rotated = text;
    const auto comma = text.find(',');
    if (comma != std::string::npos) {
        rotated = text.substr(comma + 1) + " " + text.substr(0, comma);
    }

    std::string cleaned;
    cleaned.reserve(rotated.size());
    for (unsigned char ch : rotated) {
        if (std::isalnum(ch) || ch >= 0x80) {
            cleaned.push_back(static_cast<char>(std::tolower(ch)));
        } else {
            cleaned.push_back(' ');
        }
    }

    std::vector<std::string> tokens;
    std::istringstream iss(cleaned);
    std::string tok;
    while (iss >> tok) {
        tokens.push_back(tok);
    }
    if (tokens.size() > 2) {
        tokens = {tokens.front(), tokens.back()};
    }
    std::sort(tokens.begin(), tokens.end());

    std::string out;
    for (const auto &t : tokens) {
        if (!out.empty()) {
            out.push_back(' ');
        }
        out += t;
    }
    return out;
}

inline std::string pseudonymCacheKey(model::Category category,
                                     const std::string &text,
                                     const std::optional<std::string> &subjectId)
{
    std::string normalized = model::isNameLike(category) ? normalizeNameText(text)
                                                         : normalizeIdentifierText(text);
    if (normalized.empty()) {
        // punctuation-only names keep their plain form
        normalized = normalizeIdentifierText(text);
    }
    std::string key;
    if (subjectId && !subjectId->empty()) {
        key = *subjectId + ":";
    }
    key += model::categoryName(category);
    key += ":";
    key += normalized;
    return key;
}

class Pseudonymizer
{
public:
    Pseudonymizer(std::string salt, std::size_t hashCodeLength, std::size_t pseudonymCodeLength)
        : salt_(std::move(salt))
        , hashCodeLength_(hashCodeLength)
        , pseudonymCodeLength_(pseudonymCodeLength)
    {
    }

    /**
     * @brief Render the hash or pseudonym for text, memoized in context.
     * @throw std::invalid_argument if text is empty.
     */
    std::string transform(model::Category category,
                          const std::string &text,
                          Action action,
                          const RuleBook &rules,
                          SubjectContext &context) const
    {
        if (text.empty()) {
            throw std::invalid_argument("Pseudonymizer: empty identifier text for "
                                        + std::string(model::categoryName(category)));
        }
        const std::string key = pseudonymCacheKey(category, text, context.subjectId());
        const std::size_t length = action == Action::Hash ? hashCodeLength_ : pseudonymCodeLength_;
        // hash and pseudonym renderings of the same text must not share a cache slot
        const std::string slot = std::string(actionName(action)) + "|" + key;
        return context.pseudonym(slot, [&] {
            const std::string code = util::hashing::hmacCode(salt_, key, length);
            return RuleBook::render(rules.templateFor(category), code, category);
        });
    }

    const std::string &salt() const { return salt_; }

private:
    std::string salt_;
    std::size_t hashCodeLength_;
    std::size_t pseudonymCodeLength_;
};

} // namespace transform
} // namespace phiguard

#endif // PHIGUARD_TRANSFORM_PSEUDONYMIZER_HPP
