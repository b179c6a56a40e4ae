// test/unit/test_regex_detector.cpp
// -----------------------------------------------------------
// Unit tests for RegexDetector: capture-group spans, custom patterns and long inputs.

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

#include "model/entity.hpp"
#include "pipeline/candidate_detector.hpp"

namespace {

using phiguard::model::CandidateEntity;
using phiguard::model::Category;
using phiguard::model::DetectorSource;
using phiguard::pipeline::RegexDetector;

std::vector<CandidateEntity> ofCategory(const std::vector<CandidateEntity> &all, Category category)
{
    std::vector<CandidateEntity> out;
    for (const auto &c : all) {
        if (c.category == category) {
            out.push_back(c);
        }
    }
    return out;
}

TEST(RegexDetectorTest, ReportsCaptureGroupWhenPresent) {
    auto detector = RegexDetector::withDefaultPatterns();
    auto found = detector->detect("MRN: A12345 fax: 617-555-0100");

    auto mrn = ofCategory(found, Category::Mrn);
    ASSERT_EQ(mrn.size(), 1u);
    EXPECT_EQ(mrn[0].start, 5u);
    EXPECT_EQ(mrn[0].end, 11u);
    EXPECT_EQ(mrn[0].source, DetectorSource::Rule);

    auto fax = ofCategory(found, Category::FaxNumber);
    ASSERT_EQ(fax.size(), 1u);
    EXPECT_EQ(fax[0].start, 17u);
}

TEST(RegexDetectorTest, CustomPatternsAndInvalidSyntax) {
    RegexDetector detector("site-rules");
    detector.addPattern("\\bacct-\\d{6}\\b", Category::AccountNumber, 0.8, true);

    auto found = detector.detect("ACCT-123456 and acct-654321");
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[1].start, 16u);
    EXPECT_DOUBLE_EQ(found[1].confidence, 0.8);

    EXPECT_THROW(detector.addPattern("(unclosed", Category::Mrn, 0.5), std::invalid_argument);
    // backreferences are outside RE2 syntax
    EXPECT_THROW(detector.addPattern("(a)\\1", Category::Mrn, 0.5), std::invalid_argument);
}

TEST(RegexDetectorTest, VeryLongUrlAndEmailAreMatchedWhole) {
    auto detector = RegexDetector::withDefaultPatterns();
    const std::string url = "https://x.org/" + std::string(150000, 'a');
    const std::string email = std::string(100000, 'b') + "@example.org";
    const std::string text = "see " + url + " or " + email;

    auto found = detector->detect(text);

    auto urls = ofCategory(found, Category::Url);
    ASSERT_EQ(urls.size(), 1u);
    EXPECT_EQ(urls[0].start, 4u);
    EXPECT_EQ(urls[0].end, 4u + url.size());

    auto emails = ofCategory(found, Category::EmailAddress);
    ASSERT_EQ(emails.size(), 1u);
    EXPECT_EQ(emails[0].end, text.size());
}

} // namespace
