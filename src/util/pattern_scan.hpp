#ifndef PHIGUARD_UTIL_PATTERN_SCAN_HPP
#define PHIGUARD_UTIL_PATTERN_SCAN_HPP

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <re2/re2.h>

/**
 * @file pattern_scan.hpp
 * @brief RE2 helpers for scanning whole documents.
 *
 * Document text is untrusted and unbounded, so every pattern that runs over it goes
 * through RE2, whose matching time is linear in the input and uses no recursion.
 *
 * USAGE:
 *   auto re = util::compilePattern("\\bMRN\\s*\\d+", true);
 *   util::forEachMatch(*re, text, [&](const std::vector<re2::StringPiece> &groups) {
 *       std::size_t start = util::offsetOf(text, groups[0]);
 *   });
 */

namespace phiguard {
namespace util {

/**
 * @brief Compile a pattern, throwing std::invalid_argument when RE2 rejects it.
 */
inline std::shared_ptr<re2::RE2> compilePattern(const std::string &pattern, bool ignoreCase = false)
{
    re2::RE2::Options options;
    options.set_case_sensitive(!ignoreCase);
    options.set_log_errors(false);
    auto re = std::make_shared<re2::RE2>(pattern, options);
    if (!re->ok()) {
        throw std::invalid_argument("Invalid pattern '" + pattern + "': " + re->error());
    }
    return re;
}

inline std::size_t offsetOf(const std::string &text, const re2::StringPiece &piece)
{
    return static_cast<std::size_t>(piece.data() - text.data());
}

/**
 * @brief Call fn(groups) for each non-overlapping match, left to right.
 *
 * groups[0] is the whole match. A group that did not take part has a null data().
 */
template<typename Fn>
void forEachMatch(const re2::RE2 &re, const std::string &text, Fn &&fn)
{
    const int groupCount = 1 + re.NumberOfCapturingGroups();
    std::vector<re2::StringPiece> groups(static_cast<std::size_t>(groupCount));
    std::size_t pos = 0;
    while (pos <= text.size() &&
           re.Match(text, pos, text.size(), re2::RE2::UNANCHORED, groups.data(), groupCount)) {
        fn(groups);
        const std::size_t matchEnd = offsetOf(text, groups[0]) + groups[0].size();
        pos = groups[0].empty() ? matchEnd + 1 : matchEnd;
    }
}

} // namespace util
} // namespace phiguard

#endif // PHIGUARD_UTIL_PATTERN_SCAN_HPP
