#include "normalizer/text_normalizer.hpp"
#include "util/logger.hpp"
#include "util/pattern_scan.hpp"

#include <cstdint>
#include <memory>
#include <regex>
#include <stdexcept>
#include <unordered_set>

#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf16.h>
#include <unicode/utf8.h>

namespace phiguard {
namespace normalizer {

namespace {

struct CodePoint
{
    UChar32 cp;
    std::size_t offset;   // byte offset of the code point in the original
};

const icu::Normalizer2 *nfkcInstance()
{
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2 *nfkc = icu::Normalizer2::getNFKCInstance(status);
    if (U_FAILURE(status) || nfkc == nullptr) {
        throw std::runtime_error(std::string("TextNormalizer: NFKC data unavailable: ")
                                 + u_errorName(status));
    }
    return nfkc;
}

std::vector<CodePoint> decodeUtf8(const std::string &s)
{
    std::vector<CodePoint> out;
    out.reserve(s.size());
    const uint8_t *p = reinterpret_cast<const uint8_t*>(s.data());
    const int32_t len = static_cast<int32_t>(s.size());
    int32_t i = 0;
    while (i < len) {
        const int32_t at = i;
        UChar32 c = 0;
        U8_NEXT(p, i, len, c);
        if (c < 0) {
            c = 0xFFFD;
        }
        out.push_back({c, static_cast<std::size_t>(at)});
    }
    return out;
}

UChar32 foldConfusable(UChar32 c)
{
    switch (c) {
    case 0x2018: case 0x2019: case 0x201A: case 0x201B: case 0x2032:
        return '\'';
    case 0x201C: case 0x201D: case 0x201E: case 0x201F: case 0x2033:
        return '"';
    case 0x2010: case 0x2011: case 0x2012: case 0x2013: case 0x2014: case 0x2015:
    case 0x2212: case 0xFE58: case 0xFE63:
        return '-';
    case 0x00A0: case 0x2007: case 0x202F: case 0x3000:
        return ' ';
    case 0x2028: case 0x2029:
        return '\n';
    case 0x2044: case 0x2215:
        return '/';
    default:
        return c;
    }
}

bool isDroppable(UChar32 c)
{
    if (c == '\n' || c == '\t') {
        return false;
    }
    const int8_t type = u_charType(c);
    return type == U_CONTROL_CHAR || type == U_FORMAT_CHAR || type == U_SURROGATE;
}

void emit(MappedText &mt, UChar32 c, std::size_t anchor)
{
    c = foldConfusable(c);
    if (isDroppable(c)) {
        return;
    }
    uint8_t buf[U8_MAX_LENGTH];
    int32_t n = 0;
    U8_APPEND_UNSAFE(buf, n, c);
    mt.text.append(reinterpret_cast<const char*>(buf), static_cast<std::size_t>(n));
    mt.map.insert(mt.map.end(), static_cast<std::size_t>(n), anchor);
}

const std::unordered_set<std::string> &headerWords()
{
    static const std::unordered_set<std::string> kWords = {
        "DOB", "MRN", "SSN", "ACCT", "ACCOUNT", "HICN", "PLAN", "PATIENT",
        "NAME", "PHONE", "FAX", "EMAIL", "DATE", "MEMBER", "POLICY"
    };
    return kWords;
}

bool isBlank(char ch)
{
    return ch == ' ' || ch == '\t';
}

bool isAsciiDigit(char ch)
{
    return ch >= '0' && ch <= '9';
}

bool isAsciiAlpha(char ch)
{
    return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z');
}

std::size_t skipBlanks(const std::string &text, std::size_t pos)
{
    while (pos < text.size() && isBlank(text[pos])) {
        ++pos;
    }
    return pos;
}

bool isAsciiAlnum(char ch)
{
    return (ch >= '0' && ch <= '9') || (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z');
}

/**
 * Fold an OCR-damaged all-caps token. Returns an empty string when the token is
 * not a header word after folding.
 */
std::string foldHeaderToken(const std::string &token)
{
    std::string folded;
    folded.reserve(token.size());
    int letters = 0;
    bool changed = false;
    for (char ch : token) {
        if (ch >= 'A' && ch <= 'Z') {
            folded.push_back(ch);
            ++letters;
            continue;
        }
        char repl = 0;
        switch (ch) {
        case '0': repl = 'O'; break;
        case '1': repl = 'I'; break;
        case 'l': repl = 'I'; break;
        case '5': repl = 'S'; break;
        case '8': repl = 'B'; break;
        default:  return std::string();
        }
        folded.push_back(repl);
        changed = true;
    }
    if (!changed || letters < 2 || headerWords().count(folded) == 0) {
        return std::string();
    }
    return folded;
}

bool hasDigit(const std::string &s)
{
    for (char ch : s) {
        if (ch >= '0' && ch <= '9') {
            return true;
        }
    }
    return false;
}

std::string repairDigits(std::string s)
{
    for (char &ch : s) {
        if (ch == 'l' || ch == 'I') {
            ch = '1';
        } else if (ch == 'O') {
            ch = '0';
        }
    }
    return s;
}

bool plausibleDate(int a, int b, const std::string &year)
{
    if (year.size() == 4) {
        int y = std::stoi(year);
        if (y < 1800 || y > 2199) {
            return false;
        }
    }
    const bool monthFirst = a >= 1 && a <= 12 && b >= 1 && b <= 31;
    const bool dayFirst = b >= 1 && b <= 12 && a >= 1 && a <= 31;
    return monthFirst || dayFirst;
}

} // namespace

void applyEdits(MappedText &mt, const std::vector<TextEdit> &edits)
{
    if (edits.empty()) {
        return;
    }
    MappedText out;
    out.text.reserve(mt.text.size());
    out.map.reserve(mt.map.size());

    std::size_t cursor = 0;
    for (const auto &e : edits) {
        if (e.start < cursor || e.end < e.start || e.end > mt.text.size()) {
            throw std::invalid_argument("applyEdits: overlapping or out-of-range edit at "
                                        + std::to_string(e.start));
        }
        out.text.append(mt.text, cursor, e.start - cursor);
        out.map.insert(out.map.end(), mt.map.begin() + cursor, mt.map.begin() + e.start);

        const std::size_t width = e.end - e.start;
        if (e.replacement.size() == width) {
            out.text += e.replacement;
            out.map.insert(out.map.end(), mt.map.begin() + e.start, mt.map.begin() + e.end);
        } else if (!e.replacement.empty()) {
            std::size_t anchor = 0;
            if (e.start < mt.map.size()) {
                anchor = mt.map[e.start];
            } else if (!mt.map.empty()) {
                anchor = mt.map.back();
            } else {
                throw std::invalid_argument("applyEdits: insertion into empty text");
            }
            out.text += e.replacement;
            out.map.insert(out.map.end(), e.replacement.size(), anchor);
        }
        cursor = e.end;
    }
    out.text.append(mt.text, cursor, std::string::npos);
    out.map.insert(out.map.end(), mt.map.begin() + cursor, mt.map.end());
    mt = std::move(out);
}

NormalizedDocument TextNormalizer::normalize(const std::string &original) const
{
    MappedText mt = foldUnicode(original);
    foldHeaderTokens(mt);
    collapseWhitespace(mt);
    collapsePaddedSeparators(mt);
    dehyphenate(mt);
    repairOcrDates(mt);

    util::logger::debug("TextNormalizer: normalized " + std::to_string(original.size())
                        + " bytes to " + std::to_string(mt.text.size()));
    return NormalizedDocument(original, std::move(mt.text), std::move(mt.map));
}

MappedText TextNormalizer::foldUnicode(const std::string &original) const
{
    const icu::Normalizer2 *nfkc = nfkcInstance();
    const std::vector<CodePoint> cps = decodeUtf8(original);

    MappedText mt;
    mt.text.reserve(original.size());
    mt.map.reserve(original.size());

    std::size_t i = 0;
    while (i < cps.size()) {
        std::size_t j = i + 1;
        while (j < cps.size() && !nfkc->hasBoundaryBefore(cps[j].cp)) {
            ++j;
        }

        if (j - i == 1 && cps[i].cp < 0x80) {
            emit(mt, cps[i].cp, cps[i].offset);
            i = j;
            continue;
        }

        icu::UnicodeString segment;
        for (std::size_t k = i; k < j; ++k) {
            segment.append(cps[k].cp);
        }

        UErrorCode status = U_ZERO_ERROR;
        const UBool already = nfkc->isNormalized(segment, status);
        if (U_SUCCESS(status) && already) {
            for (std::size_t k = i; k < j; ++k) {
                emit(mt, cps[k].cp, cps[k].offset);
            }
            i = j;
            continue;
        }

        status = U_ZERO_ERROR;
        icu::UnicodeString folded = nfkc->normalize(segment, status);
        if (U_FAILURE(status)) {
            util::logger::warn(std::string("TextNormalizer: NFKC failed at offset ")
                               + std::to_string(cps[i].offset) + ": " + u_errorName(status));
            for (std::size_t k = i; k < j; ++k) {
                emit(mt, cps[k].cp, cps[k].offset);
            }
            i = j;
            continue;
        }

        const std::size_t anchor = cps[i].offset;
        const std::size_t before = mt.map.size();
        for (int32_t k = 0; k < folded.length();) {
            UChar32 c = folded.char32At(k);
            k += U16_LENGTH(c);
            emit(mt, c, anchor);
        }
        // last byte points at the segment's last character so projections cover all of it
        if (mt.map.size() > before) {
            mt.map.back() = cps[j - 1].offset;
        }
        i = j;
    }
    return mt;
}

void TextNormalizer::foldHeaderTokens(MappedText &mt) const
{
    std::string &text = mt.text;
    std::size_t i = 0;
    while (i < text.size()) {
        if (!isAsciiAlnum(text[i])) {
            ++i;
            continue;
        }
        std::size_t j = i;
        while (j < text.size() && isAsciiAlnum(text[j])) {
            ++j;
        }
        const std::size_t len = j - i;
        if (len >= 3 && len <= 7) {
            std::string folded = foldHeaderToken(text.substr(i, len));
            if (!folded.empty()) {
                // same length, so the map stays 1:1
                text.replace(i, len, folded);
            }
        }
        i = j;
    }
}

void TextNormalizer::collapseWhitespace(MappedText &mt) const
{
    const std::string &text = mt.text;
    std::vector<TextEdit> edits;
    std::size_t i = 0;
    while (i < text.size()) {
        if (!isBlank(text[i])) {
            ++i;
            continue;
        }
        std::size_t j = skipBlanks(text, i);
        if (j - i >= 3) {
            edits.push_back({i, j, " "});
        }
        i = j;
    }
    applyEdits(mt, edits);
}

// "12 / 05 / 1980" -> "12/05/1980"; at least one side of the separator must be padded
void TextNormalizer::collapsePaddedSeparators(MappedText &mt) const
{
    const std::string &text = mt.text;
    std::vector<TextEdit> edits;
    std::size_t i = 0;
    while (i < text.size()) {
        if (!isAsciiDigit(text[i])) {
            ++i;
            continue;
        }
        const std::size_t sep = skipBlanks(text, i + 1);
        if (sep >= text.size() || (text[sep] != '.' && text[sep] != '/' && text[sep] != '-')) {
            ++i;
            continue;
        }
        const std::size_t next = skipBlanks(text, sep + 1);
        if (next >= text.size() || !isAsciiDigit(text[next])) {
            ++i;
            continue;
        }
        if (sep > i + 1 || next > sep + 1) {
            edits.push_back({i + 1, next, std::string(1, text[sep])});
        }
        i = next;
    }
    applyEdits(mt, edits);
}

// "treat-\n ment" -> "treatment"
void TextNormalizer::dehyphenate(MappedText &mt) const
{
    for (int pass = 0; pass < kMaxDehyphenationPasses; ++pass) {
        const std::string &text = mt.text;
        std::vector<TextEdit> edits;
        std::size_t i = 0;
        while (i + 1 < text.size()) {
            if (!isAsciiAlpha(text[i]) || text[i + 1] != '-') {
                ++i;
                continue;
            }
            std::size_t j = skipBlanks(text, i + 2);
            if (j < text.size() && text[j] == '\r') {
                ++j;
            }
            if (j >= text.size() || text[j] != '\n') {
                ++i;
                continue;
            }
            j = skipBlanks(text, j + 1);
            if (j >= text.size() || !isAsciiAlpha(text[j])) {
                ++i;
                continue;
            }
            edits.push_back({i + 1, j, std::string()});
            i = j;
        }
        if (edits.empty()) {
            break;
        }
        applyEdits(mt, edits);
    }
}

void TextNormalizer::repairOcrDates(MappedText &mt) const
{
    static const std::regex kDateShape(
        "\\b([0-9lIO]{1,2})([/.-])([0-9lIO]{1,2})\\2([0-9lIO]{4}|[0-9lIO]{2})\\b");

    std::vector<TextEdit> edits;
    for (auto it = std::sregex_iterator(mt.text.begin(), mt.text.end(), kDateShape);
         it != std::sregex_iterator(); ++it) {
        const auto &m = *it;
        const std::string whole = m.str(0);
        if (whole.find_first_of("lIO") == std::string::npos) {
            continue;
        }
        if (!hasDigit(m.str(1)) || !hasDigit(m.str(3)) || !hasDigit(m.str(4))) {
            continue;
        }
        const std::string first = repairDigits(m.str(1));
        const std::string second = repairDigits(m.str(3));
        const std::string year = repairDigits(m.str(4));
        if (!plausibleDate(std::stoi(first), std::stoi(second), year)) {
            continue;
        }
        const auto start = static_cast<std::size_t>(m.position(0));
        edits.push_back({start, start + whole.size(), repairDigits(whole)});
        util::logger::debug("TextNormalizer: repaired date-shaped token at " + std::to_string(start));
    }
    applyEdits(mt, edits);
}

ContainerSpans TextNormalizer::findContainerSpans(const std::string &canonical) const
{
    static const std::shared_ptr<re2::RE2> kUrl = util::compilePattern("https?://\\S+", true);
    static const std::shared_ptr<re2::RE2> kFilename =
        util::compilePattern("\\b[\\w.-]+\\.(pdf|png|jpe?g|tiff?|txt|rtf|docx?)\\b", true);

    ContainerSpans spans;
    util::forEachMatch(*kUrl, canonical, [&](const std::vector<re2::StringPiece> &m) {
        const std::size_t pos = util::offsetOf(canonical, m[0]);
        spans.urls.emplace_back(pos, pos + m[0].size());
    });
    util::forEachMatch(*kFilename, canonical, [&](const std::vector<re2::StringPiece> &m) {
        const std::size_t pos = util::offsetOf(canonical, m[0]);
        spans.filenames.emplace_back(pos, pos + m[0].size());
    });
    return spans;
}

} // namespace normalizer
} // namespace phiguard
