#ifndef PHIGUARD_TRANSFORM_DATE_SHIFTER_HPP
#define PHIGUARD_TRANSFORM_DATE_SHIFTER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "../util/civil_date.hpp"
#include "subject_context.hpp"

/**
 * @file date_shifter.hpp
 * @brief Subject-consistent date shifting that keeps the original textual format.
 *
 * DESIGN:
 *   - Formats are tried in order (strftime-style directives %Y %y %m %d %B %b %H %M %S).
 *     Month-first numeric formats come before day-first ones; the first format whose
 *     fields form a real calendar date wins.
 *   - shiftDays(subject) = 30 + (HMAC-SHA256(salt, subject + "date_shift") mod 61),
 *     giving [30, 90]. Calls without a subject use the configured default.
 *   - Rendering reuses the matched format and the original field widths, month-name
 *     capitalisation and surrounding whitespace. Time-of-day fields are copied verbatim.
 *   - When no format matches, a loose "number sep number sep number" reading with a
 *     four-digit year field is tried ("1958 3 12"); its fields are shifted in place.
 *   - Anything else is returned unchanged.
 *
 * USAGE:
 *   @code
 *   DateShifter shifter(salt, 30);
 *   auto ctx = registry.acquire(std::string("p1"));
 *   std::string shifted = shifter.shift("01/15/1980", *ctx);
 *   @endcode
 */

namespace phiguard {
namespace transform {

struct ParsedDate
{
    enum class NameCase { Title, Upper, Lower };

    util::CivilDate date;
    std::string format;
    std::size_t monthWidth = 2;
    std::size_t dayWidth = 2;
    NameCase nameCase = NameCase::Title;
    std::string hour;
    std::string minute;
    std::string second;
    std::string leading;
    std::string trailing;
};

class DateShifter
{
public:
    static constexpr int kMinShiftDays = 30;
    static constexpr int kShiftDaysRange = 61;

    DateShifter(std::string salt, int defaultShiftDays);

    /// Formats tried by parse(), in order.
    static const std::vector<std::string> &formats();

    /**
     * @brief Match text against formats(). Surrounding whitespace is kept aside.
     */
    static std::optional<ParsedDate> parse(const std::string &text);

    /**
     * @brief Render parsed moved by days, in its original format.
     */
    static std::string render(const ParsedDate &parsed, int64_t days);

    /**
     * @brief Four-digit year of a date, falling back to a loose
     *        "number separator number separator number" scan for a 4-digit field.
     */
    static std::optional<int64_t> extractYear(const std::string &text);

    /// Uncached shift for a subject id; nullopt or empty uses the default.
    int computeShiftDays(const std::optional<std::string> &subjectId) const;

    /// Shift for the context's subject, computed once per context.
    int shiftDays(SubjectContext &context) const;

    /**
     * @brief Shifted text, or nullopt if text is not a recognised date.
     *        Successful results are memoized in context.
     */
    std::optional<std::string> tryShift(const std::string &text, SubjectContext &context) const;

    /// tryShift(), returning text unchanged when it cannot be parsed.
    std::string shift(const std::string &text, SubjectContext &context) const;

    int defaultShiftDays() const { return defaultShiftDays_; }

private:
    std::string salt_;
    int defaultShiftDays_;
};

} // namespace transform
} // namespace phiguard

#endif // PHIGUARD_TRANSFORM_DATE_SHIFTER_HPP
