#include "transform/date_shifter.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"

#include <array>
#include <cctype>
#include <regex>
#include <utility>

namespace phiguard {
namespace transform {

namespace {

const std::array<const char*, 12> kMonthNames = {{
    "january", "february", "march", "april", "may", "june",
    "july", "august", "september", "october", "november", "december"
}};

const std::array<const char*, 12> kMonthAbbrevs = {{
    "jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec"
}};

bool isDigit(char ch)
{
    return ch >= '0' && ch <= '9';
}

bool isAlpha(char ch)
{
    return std::isalpha(static_cast<unsigned char>(ch)) != 0;
}

bool readDigits(const std::string &s, std::size_t &si, std::size_t minLen, std::size_t maxLen,
                std::string &digits)
{
    digits.clear();
    while (si < s.size() && digits.size() < maxLen && isDigit(s[si])) {
        digits.push_back(s[si]);
        ++si;
    }
    return digits.size() >= minLen;
}

ParsedDate::NameCase detectCase(const std::string &word)
{
    bool anyUpper = false;
    bool anyLower = false;
    for (std::size_t i = 0; i < word.size(); ++i) {
        const unsigned char ch = static_cast<unsigned char>(word[i]);
        if (std::isupper(ch)) {
            anyUpper = true;
        } else if (std::islower(ch)) {
            anyLower = true;
        }
    }
    if (anyUpper && !anyLower && word.size() > 1) return ParsedDate::NameCase::Upper;
    if (anyLower && !std::isupper(static_cast<unsigned char>(word[0]))) return ParsedDate::NameCase::Lower;
    return ParsedDate::NameCase::Title;
}

std::string applyCase(const char *lowerName, ParsedDate::NameCase style)
{
    std::string out(lowerName);
    for (std::size_t i = 0; i < out.size(); ++i) {
        const unsigned char ch = static_cast<unsigned char>(out[i]);
        if (style == ParsedDate::NameCase::Upper || (style == ParsedDate::NameCase::Title && i == 0)) {
            out[i] = static_cast<char>(std::toupper(ch));
        }
    }
    return out;
}

bool readMonthName(const std::string &s, std::size_t &si, bool full, unsigned &month,
                   ParsedDate::NameCase &style)
{
    const auto &table = full ? kMonthNames : kMonthAbbrevs;
    for (std::size_t m = 0; m < table.size(); ++m) {
        const std::string name(table[m]);
        if (si + name.size() > s.size()) {
            continue;
        }
        bool same = true;
        for (std::size_t k = 0; k < name.size(); ++k) {
            if (std::tolower(static_cast<unsigned char>(s[si + k])) != name[k]) {
                same = false;
                break;
            }
        }
        if (!same) {
            continue;
        }
        const std::size_t after = si + name.size();
        if (after < s.size() && isAlpha(s[after])) {
            continue;
        }
        style = detectCase(s.substr(si, name.size()));
        month = static_cast<unsigned>(m + 1);
        si = after;
        return true;
    }
    return false;
}

std::string zeroPad(int64_t value, std::size_t width)
{
    std::string digits = std::to_string(value);
    if (digits.size() < width) {
        digits.insert(0, width - digits.size(), '0');
    }
    return digits;
}

bool matchFormat(const std::string &fmt, const std::string &s, ParsedDate &out)
{
    std::size_t fi = 0;
    std::size_t si = 0;
    int64_t year = -1;
    unsigned month = 0;
    unsigned day = 0;
    std::string digits;

    while (fi < fmt.size()) {
        const char f = fmt[fi];
        if (f != '%') {
            if (si >= s.size() || s[si] != f) {
                return false;
            }
            ++fi;
            ++si;
            continue;
        }
        if (fi + 1 >= fmt.size()) {
            return false;
        }
        const char directive = fmt[fi + 1];
        fi += 2;
        // no separator before the next field means a fixed two-digit width
        const bool packed = fi < fmt.size() && fmt[fi] == '%';
        const std::size_t minWidth = packed ? 2 : 1;

        switch (directive) {
        case 'Y':
            if (!readDigits(s, si, 4, 4, digits)) return false;
            year = std::stoll(digits);
            break;
        case 'y': {
            if (!readDigits(s, si, 2, 2, digits)) return false;
            const int yy = std::stoi(digits);
            year = yy >= 69 ? 1900 + yy : 2000 + yy;
            break;
        }
        case 'm':
            if (!readDigits(s, si, minWidth, 2, digits)) return false;
            month = static_cast<unsigned>(std::stoi(digits));
            out.monthWidth = digits.size();
            break;
        case 'd':
            if (!readDigits(s, si, minWidth, 2, digits)) return false;
            day = static_cast<unsigned>(std::stoi(digits));
            out.dayWidth = digits.size();
            break;
        case 'H':
            if (!readDigits(s, si, minWidth, 2, digits) || std::stoi(digits) > 23) return false;
            out.hour = digits;
            break;
        case 'M':
            if (!readDigits(s, si, 2, 2, digits) || std::stoi(digits) > 59) return false;
            out.minute = digits;
            break;
        case 'S':
            if (!readDigits(s, si, 2, 2, digits) || std::stoi(digits) > 60) return false;
            out.second = digits;
            break;
        case 'B':
            if (!readMonthName(s, si, true, month, out.nameCase)) return false;
            break;
        case 'b':
            if (!readMonthName(s, si, false, month, out.nameCase)) return false;
            break;
        default:
            return false;
        }
    }
    if (si != s.size() || year < 0 || !util::isValidDate(year, month, day)) {
        return false;
    }
    out.date.year = year;
    out.date.month = month;
    out.date.day = day;
    out.format = fmt;
    return true;
}

bool isBlank(char ch)
{
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
}

const std::regex &loosePattern()
{
    static const std::regex kLoose("(\\d{1,4})[-/\\s](\\d{1,2})[-/\\s](\\d{1,4})");
    return kLoose;
}

/**
 * "number sep number sep number" with a four-digit year in any position. The field after
 * the year is the month and the one after that the day, swapped when the month is over 12.
 */
struct LooseDate
{
    std::smatch match;
    int yearField = -1;
    int monthField = -1;
    int dayField = -1;
    util::CivilDate date;
};

std::optional<LooseDate> parseLoose(const std::string &text)
{
    LooseDate loose;
    if (!std::regex_search(text, loose.match, loosePattern())) {
        return std::nullopt;
    }
    for (int i = 0; i < 3; ++i) {
        if (loose.match.length(i + 1) != 4) {
            continue;
        }
        int monthField = (i + 1) % 3;
        int dayField = (i + 2) % 3;
        unsigned month = static_cast<unsigned>(std::stoul(loose.match.str(monthField + 1)));
        unsigned day = static_cast<unsigned>(std::stoul(loose.match.str(dayField + 1)));
        if (month > 12) {
            std::swap(month, day);
            std::swap(monthField, dayField);
        }
        const int64_t year = std::stoll(loose.match.str(i + 1));
        if (util::isValidDate(year, month, day)) {
            loose.yearField = i;
            loose.monthField = monthField;
            loose.dayField = dayField;
            loose.date.year = year;
            loose.date.month = month;
            loose.date.day = day;
            return loose;
        }
    }
    return std::nullopt;
}

// Fields are written back in place; separators, widths and surrounding text are kept.
std::string renderLoose(const std::string &text, const LooseDate &loose, int64_t days)
{
    const util::CivilDate d = util::addDays(loose.date, days);
    std::string fields[3];
    fields[loose.yearField] = zeroPad(d.year, 4);
    fields[loose.monthField] = zeroPad(d.month, static_cast<std::size_t>(loose.match.length(loose.monthField + 1)));
    fields[loose.dayField] = zeroPad(d.day, static_cast<std::size_t>(loose.match.length(loose.dayField + 1)));

    const auto &m = loose.match;
    const std::size_t start = static_cast<std::size_t>(m.position(0));
    std::string out = text.substr(0, start);
    out += fields[0];
    out += text.substr(static_cast<std::size_t>(m.position(1) + m.length(1)), 1);
    out += fields[1];
    out += text.substr(static_cast<std::size_t>(m.position(2) + m.length(2)), 1);
    out += fields[2];
    out += text.substr(start + static_cast<std::size_t>(m.length(0)));
    return out;
}

} // namespace

DateShifter::DateShifter(std::string salt, int defaultShiftDays)
    : salt_(std::move(salt))
    , defaultShiftDays_(defaultShiftDays)
{
}

const std::vector<std::string> &DateShifter::formats()
{
    static const std::vector<std::string> kFormats = {
        "%Y-%m-%d",
        "%m/%d/%Y",
        "%m/%d/%y",
        "%B %d, %Y",
        "%b %d, %Y",
        "%B %d %Y",
        "%b %d %Y",
        "%m-%d-%Y",
        "%m-%d-%y",
        "%d/%m/%Y",
        "%d/%m/%y",
        "%d-%m-%Y",
        "%d-%m-%y",
        "%d %B %Y",
        "%d %b %Y",
        "%Y/%m/%d",
        "%m.%d.%Y",
        "%d.%m.%Y",
        "%Y%m%d",
        "%Y-%m-%d %H:%M:%S",
        "%Y-%m-%d %H:%M",
        "%Y-%m-%dT%H:%M:%S",
        "%m/%d/%Y %H:%M:%S",
        "%m/%d/%Y %H:%M",
        "%d/%m/%Y %H:%M:%S",
        "%d/%m/%Y %H:%M",
    };
    return kFormats;
}

std::optional<ParsedDate> DateShifter::parse(const std::string &text)
{
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && isBlank(text[begin])) {
        ++begin;
    }
    while (end > begin && isBlank(text[end - 1])) {
        --end;
    }
    if (begin == end) {
        return std::nullopt;
    }
    const std::string core = text.substr(begin, end - begin);

    for (const auto &fmt : formats()) {
        ParsedDate parsed;
        if (matchFormat(fmt, core, parsed)) {
            parsed.leading = text.substr(0, begin);
            parsed.trailing = text.substr(end);
            return parsed;
        }
    }
    return std::nullopt;
}

std::string DateShifter::render(const ParsedDate &parsed, int64_t days)
{
    const util::CivilDate d = util::addDays(parsed.date, days);
    const std::string &fmt = parsed.format;

    std::string out = parsed.leading;
    for (std::size_t fi = 0; fi < fmt.size(); ++fi) {
        if (fmt[fi] != '%' || fi + 1 >= fmt.size()) {
            out.push_back(fmt[fi]);
            continue;
        }
        switch (fmt[++fi]) {
        case 'Y': out += zeroPad(d.year, 4); break;
        case 'y': out += zeroPad(((d.year % 100) + 100) % 100, 2); break;
        case 'm': out += zeroPad(d.month, parsed.monthWidth); break;
        case 'd': out += zeroPad(d.day, parsed.dayWidth); break;
        case 'B': out += applyCase(kMonthNames[d.month - 1], parsed.nameCase); break;
        case 'b': out += applyCase(kMonthAbbrevs[d.month - 1], parsed.nameCase); break;
        case 'H': out += parsed.hour; break;
        case 'M': out += parsed.minute; break;
        case 'S': out += parsed.second; break;
        default:
            out.push_back('%');
            out.push_back(fmt[fi]);
            break;
        }
    }
    out += parsed.trailing;
    return out;
}

std::optional<int64_t> DateShifter::extractYear(const std::string &text)
{
    if (auto parsed = parse(text)) {
        return parsed->date.year;
    }

    std::smatch m;
    if (std::regex_search(text, m, loosePattern())) {
        if (m.length(1) == 4) {
            return std::stoll(m.str(1));
        }
        if (m.length(3) == 4) {
            return std::stoll(m.str(3));
        }
    }

    static const std::regex kBareYear("\\b(1[89]\\d{2}|2[01]\\d{2})\\b");
    if (std::regex_search(text, m, kBareYear)) {
        return std::stoll(m.str(1));
    }
    return std::nullopt;
}

int DateShifter::computeShiftDays(const std::optional<std::string> &subjectId) const
{
    if (!subjectId || subjectId->empty()) {
        return defaultShiftDays_;
    }
    const util::hashing::Digest digest = util::hashing::hmacSha256(salt_, *subjectId + "date_shift");
    return kMinShiftDays + static_cast<int>(util::hashing::leadingWord(digest) % kShiftDaysRange);
}

int DateShifter::shiftDays(SubjectContext &context) const
{
    return context.dateShiftDays([&] { return computeShiftDays(context.subjectId()); });
}

std::optional<std::string> DateShifter::tryShift(const std::string &text, SubjectContext &context) const
{
    std::optional<ParsedDate> parsed = parse(text);
    std::optional<LooseDate> loose;
    if (!parsed) {
        loose = parseLoose(text);
    }
    if (!parsed && !loose) {
        util::logger::debug("DateShifter: no known format matched a " + std::to_string(text.size())
                            + "-byte date, left unchanged");
        return std::nullopt;
    }
    // resolved before entering the date cache so the callback never re-locks the context
    const int days = shiftDays(context);
    if (parsed) {
        return context.shiftedDate(text, [&] { return render(*parsed, days); });
    }
    return context.shiftedDate(text, [&] { return renderLoose(text, *loose, days); });
}

std::string DateShifter::shift(const std::string &text, SubjectContext &context) const
{
    std::optional<std::string> shifted = tryShift(text, context);
    return shifted ? *shifted : text;
}

} // namespace transform
} // namespace phiguard
