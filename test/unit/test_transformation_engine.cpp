// test/unit/test_transformation_engine.cpp
// -----------------------------------------------------------
// Unit tests for TransformationEngine: actions, guards, token widening and the audit trail.

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "config/deid_config.hpp"
#include "model/entity.hpp"
#include "transform/subject_context.hpp"
#include "transform/transformation_engine.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"

namespace {

using phiguard::config::DeidConfig;
using phiguard::model::ActionTaken;
using phiguard::model::Category;
using phiguard::model::DetectorSource;
using phiguard::model::ResolvedEntity;
using phiguard::transform::Action;
using phiguard::transform::SubjectContext;
using phiguard::transform::SubjectRegistry;
using phiguard::transform::TransformationEngine;
using phiguard::transform::TransformResult;

ResolvedEntity entity(std::size_t start, std::size_t end, Category category, double confidence = 0.9,
                      DetectorSource source = DetectorSource::Rule)
{
    ResolvedEntity e;
    e.start = start;
    e.end = end;
    e.category = category;
    e.confidence = confidence;
    e.weightedConfidence = confidence;
    e.source = source;
    return e;
}

DeidConfig saltedConfig()
{
    DeidConfig cfg;
    cfg.salt = "unit-salt";
    return cfg;
}

TEST(TransformationEngineTest, ShiftsDateOfBirthForSubject) {
    DeidConfig cfg = saltedConfig();
    cfg.rulebook.setAction(Category::Date, Action::DateShift);
    TransformationEngine engine(cfg);

    TransformResult result = engine.transform("DOB: 03/12/1958", {entity(5, 15, Category::Date)}, std::string("p1"));

    EXPECT_EQ(result.text, "DOB: 06/02/1958");
    ASSERT_EQ(result.audit.size(), 1u);
    EXPECT_EQ(result.audit[0].start, 5u);
    EXPECT_EQ(result.audit[0].end, 15u);
    EXPECT_EQ(result.audit[0].category, Category::Date);
    EXPECT_EQ(result.audit[0].action, ActionTaken::DateShifted);
}

TEST(TransformationEngineTest, RedactsWithCategoryLabel) {
    TransformationEngine engine(saltedConfig());
    const std::string text = "Call 555-123-4567 now";

    TransformResult result = engine.transform(text, {entity(5, 17, Category::PhoneNumber)});

    EXPECT_EQ(result.text, "Call [REDACTED:PHONE_NUMBER] now");
    ASSERT_EQ(result.audit.size(), 1u);
    EXPECT_EQ(result.audit[0].action, ActionTaken::Redacted);
}

TEST(TransformationEngineTest, BytesOutsideSpansAreUntouched) {
    TransformationEngine engine(saltedConfig());
    const std::string text = "Pt: Jane Roe\tSSN 123-45-6789 \xE2\x80\x94 ok";

    TransformResult result = engine.transform(text, {entity(4, 12, Category::Name), entity(17, 28, Category::Ssn)});

    EXPECT_EQ(result.text, "Pt: [REDACTED:NAME]\tSSN [REDACTED:SSN] \xE2\x80\x94 ok");
    EXPECT_EQ(result.audit.size(), 2u);
}

TEST(TransformationEngineTest, EmailIsWidenedToWholeToken) {
    TransformationEngine engine(saltedConfig());
    const std::string text = "Email: jane.doe@example.org.";

    // detector only caught the middle of the address; a NAME inside it is absorbed
    TransformResult result = engine.transform(text, {entity(7, 11, Category::Name),
                                                     entity(12, 23, Category::EmailAddress)});

    EXPECT_EQ(result.text, "Email: [REDACTED:EMAIL_ADDRESS].");
    ASSERT_EQ(result.audit.size(), 1u);
    EXPECT_EQ(result.audit[0].start, 7u);
    EXPECT_EQ(result.audit[0].end, 27u);
    EXPECT_EQ(result.audit[0].category, Category::EmailAddress);
}

TEST(TransformationEngineTest, ExpandTokenTrimsWrappingPunctuation) {
    using Span = std::pair<std::size_t, std::size_t>;
    EXPECT_EQ(TransformationEngine::expandToken("(jane@x.org)", 1, 11, Category::EmailAddress), Span(1, 11));
    EXPECT_EQ(TransformationEngine::expandToken("see a@b.co, thanks", 5, 9, Category::EmailAddress), Span(4, 10));
}

TEST(TransformationEngineTest, ExpandTokenFollowsCategoryCharacters) {
    using Span = std::pair<std::size_t, std::size_t>;
    // a label glued to the address is not part of it
    EXPECT_EQ(TransformationEngine::expandToken("Contact:jane.doe@example.com today", 12, 20,
                                                Category::EmailAddress), Span(8, 28));
    EXPECT_EQ(TransformationEngine::expandToken("go to https://x.org/a?b=1\"> now", 14, 19, Category::Url),
              Span(6, 25));
    EXPECT_EQ(TransformationEngine::expandToken("link:www.x.org/a now", 5, 14, Category::Url), Span(5, 16));
    EXPECT_EQ(TransformationEngine::expandToken("DOB:03/12/1958.", 4, 9, Category::Date), Span(4, 14));
    EXPECT_EQ(TransformationEngine::expandToken("SSN#123-45-6789, x", 8, 10, Category::Ssn), Span(4, 15));
    EXPECT_EQ(TransformationEngine::expandToken("ID: AB-1234-X9.", 4, 8, Category::HealthPlanId), Span(4, 14));
    EXPECT_EQ(TransformationEngine::expandToken("IP:10.0.0.12", 3, 8, Category::IpAddress), Span(3, 12));
    // non-atomic categories keep their span
    EXPECT_EQ(TransformationEngine::expandToken("Dr.Jane Roe", 3, 7, Category::Name), Span(3, 7));
    // bounds are respected
    EXPECT_EQ(TransformationEngine::expandToken("01/15/1980-01/20/1980", 0, 10, Category::Date, 0, 11),
              Span(0, 10));
}

TEST(TransformationEngineTest, GluedLabelSurvivesEmailRedaction) {
    TransformationEngine engine(saltedConfig());
    const std::string text = "Contact:jane.doe@example.com today";

    TransformResult result = engine.transform(text, {entity(8, 28, Category::EmailAddress)});

    EXPECT_EQ(result.text, "Contact:[REDACTED:EMAIL_ADDRESS] today");
    ASSERT_EQ(result.audit.size(), 1u);
    EXPECT_EQ(result.audit[0].start, 8u);
    EXPECT_EQ(result.audit[0].end, 28u);
}

TEST(TransformationEngineTest, PartialIdentifiersAreWidened) {
    DeidConfig cfg = saltedConfig();
    cfg.rulebook.setAction(Category::Date, Action::DateShift);
    TransformationEngine engine(cfg);

    // only "123-45" and "03/12" were flagged
    TransformResult ssn = engine.transform("SSN: 123-45-6789 on file", {entity(5, 11, Category::Ssn)});
    EXPECT_EQ(ssn.text, "SSN: [REDACTED:SSN] on file");
    ASSERT_EQ(ssn.audit.size(), 1u);
    EXPECT_EQ(ssn.audit[0].end, 16u);

    TransformResult dob = engine.transform("DOB: 03/12/1958 seen", {entity(5, 10, Category::Date)},
                                           std::string("p1"));
    EXPECT_EQ(dob.text, "DOB: 06/02/1958 seen");
    ASSERT_EQ(dob.audit.size(), 1u);
    EXPECT_EQ(dob.audit[0].start, 5u);
    EXPECT_EQ(dob.audit[0].end, 15u);
    EXPECT_EQ(dob.audit[0].action, ActionTaken::DateShifted);
}

TEST(TransformationEngineTest, AdjacentDatesAreNotMerged) {
    DeidConfig cfg = saltedConfig();
    cfg.rulebook.setAction(Category::Date, Action::DateShift);
    TransformationEngine engine(cfg);

    TransformResult result = engine.transform("01/15/1980-01/20/1980",
                                              {entity(0, 10, Category::Date), entity(11, 21, Category::Date)},
                                              std::string("p1"));

    EXPECT_EQ(result.text, "04/06/1980-04/11/1980");
    ASSERT_EQ(result.audit.size(), 2u);
    EXPECT_EQ(result.audit[0].end, 10u);
    EXPECT_EQ(result.audit[1].start, 11u);
}

TEST(TransformationEngineTest, HeadersAndClinicalTermsArePreserved) {
    TransformationEngine engine(saltedConfig());
    const std::string text = "Progress Note\nSpringfield Medical Center: HTN, metformin 500 mg";

    TransformResult result = engine.transform(text, {
        entity(0, 13, Category::Name),
        entity(14, 40, Category::Organization),
        entity(42, 45, Category::Name),
        entity(57, 63, Category::Name),
    });

    EXPECT_EQ(result.text, text);
    ASSERT_EQ(result.audit.size(), 4u);
    for (const auto &record : result.audit) {
        EXPECT_EQ(record.action, ActionTaken::Preserved);
    }
}

TEST(TransformationEngineTest, HeaderPatterns) {
    DeidConfig cfg = saltedConfig();
    cfg.headerPhrases = {"Nursing Handoff"};
    TransformationEngine engine(cfg);

    EXPECT_TRUE(engine.isProtectedHeader("Chief Complaint"));
    EXPECT_TRUE(engine.isProtectedHeader("  assessment/plan "));
    EXPECT_TRUE(engine.isProtectedHeader("Social Work Notes:"));
    EXPECT_TRUE(engine.isProtectedHeader("nursing handoff"));
    EXPECT_FALSE(engine.isProtectedHeader("John Smith"));
    EXPECT_FALSE(engine.isProtectedHeader(""));

    EXPECT_TRUE(engine.isClinicalTerm("bid"));
    EXPECT_TRUE(engine.isClinicalTerm("2.5 mg"));
    EXPECT_FALSE(engine.isClinicalTerm("Boston"));
}

TEST(TransformationEngineTest, ShortIdentifiersPassThroughHashing) {
    DeidConfig cfg = saltedConfig();
    cfg.rulebook.setAction(Category::Mrn, Action::Hash);
    TransformationEngine engine(cfg);

    TransformResult result = engine.transform("MRN: 12 ok", {entity(5, 7, Category::Mrn)});

    EXPECT_EQ(result.text, "MRN: 12 ok");
    ASSERT_EQ(result.audit.size(), 1u);
    EXPECT_EQ(result.audit[0].action, ActionTaken::PassedThrough);
}

TEST(TransformationEngineTest, HashesWithSubjectScopedKey) {
    DeidConfig cfg = saltedConfig();
    cfg.rulebook.setAction(Category::Mrn, Action::Hash);
    TransformationEngine engine(cfg);

    TransformResult result = engine.transform("MRN: 00123", {entity(5, 10, Category::Mrn)}, std::string("p1"));

    const std::string code = phiguard::util::hashing::hmacCode("unit-salt", "p1:MRN:00123", 12);
    EXPECT_EQ(result.text, "MRN: " + code);
    ASSERT_EQ(result.audit.size(), 1u);
    EXPECT_EQ(result.audit[0].action, ActionTaken::Hashed);
}

TEST(TransformationEngineTest, PseudonymsAreStableAcrossDocuments) {
    DeidConfig cfg = saltedConfig();
    cfg.rulebook.setAction(Category::Name, Action::Pseudonym);
    cfg.rulebook.setTemplate(Category::Name, "PATIENT-{code}");
    TransformationEngine engine(cfg);

    TransformResult first = engine.transform("Seen: John Smith", {entity(6, 16, Category::Name)}, std::string("p1"));
    TransformResult second = engine.transform("Smith, John called", {entity(0, 11, Category::Name)}, std::string("p1"));

    const std::string pseudonym = first.text.substr(6);
    EXPECT_EQ(pseudonym.rfind("PATIENT-", 0), 0u);
    EXPECT_EQ(second.text, pseudonym + " called");
    EXPECT_EQ(first.audit[0].action, ActionTaken::Pseudonymized);
}

TEST(TransformationEngineTest, GeneralizesByCategory) {
    TransformationEngine engine(saltedConfig());
    SubjectContext ctx;

    EXPECT_EQ(engine.generalize(Category::Zip, "02139", ctx), "021XX");
    EXPECT_EQ(engine.generalize(Category::Zip, "02139-1234", ctx), "021XX");
    EXPECT_EQ(engine.generalize(Category::Location, "94110", ctx), "941XX");
    EXPECT_EQ(engine.generalize(Category::AgeOver89, "92", ctx), "AGE_OVER_89");
    EXPECT_EQ(engine.generalize(Category::Date, "03/12/1958", ctx), "1958");
    EXPECT_EQ(engine.generalize(Category::Date, "last spring", ctx), "[GENERALIZED:DATE]");
    EXPECT_EQ(engine.generalize(Category::Location, "Boston", ctx), "[GENERALIZED:LOCATION]");
    EXPECT_EQ(engine.generalize(Category::Zip, "ZIP unknown", ctx).size(), 8u);
}

TEST(TransformationEngineTest, UnparseableDateIsPassedThrough) {
    DeidConfig cfg = saltedConfig();
    cfg.rulebook.setAction(Category::Date, Action::DateShift);
    TransformationEngine engine(cfg);

    TransformResult result = engine.transform("Seen last spring", {entity(5, 16, Category::Date)}, std::string("p1"));

    EXPECT_EQ(result.text, "Seen last spring");
    ASSERT_EQ(result.audit.size(), 1u);
    EXPECT_EQ(result.audit[0].action, ActionTaken::PassedThrough);
}

TEST(TransformationEngineTest, AuditIsRoundedAndSorted) {
    TransformationEngine engine(saltedConfig());
    const std::string text = "Jane Roe 123-45-6789";

    TransformResult result = engine.transform(text, {
        entity(9, 20, Category::Ssn, 0.98765),
        entity(0, 8, Category::Name, 0.87654, DetectorSource::Statistical),
        entity(5, 200, Category::Name, 0.5),
    });

    ASSERT_EQ(result.audit.size(), 2u);
    EXPECT_EQ(result.audit[0].start, 0u);
    EXPECT_DOUBLE_EQ(result.audit[0].confidence, 0.877);
    EXPECT_EQ(result.audit[0].source, DetectorSource::Statistical);
    EXPECT_EQ(result.audit[1].start, 9u);
    EXPECT_DOUBLE_EQ(result.audit[1].confidence, 0.988);
    EXPECT_EQ(result.text, "[REDACTED:NAME] [REDACTED:SSN]");
}

TEST(TransformationEngineTest, WarnsWhenFallingBackToDefaultSalt) {
    using namespace phiguard::util::logger;
    std::vector<std::string> warnings;
    setSink([&warnings](LogLevel level, const std::string &msg) {
        if (level == LogLevel::WARN) {
            warnings.push_back(msg);
        }
    });

    DeidConfig cfg;
    TransformationEngine engine(cfg);
    setSink(LogSink());

    EXPECT_TRUE(engine.usingFallbackSalt());
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find(TransformationEngine::kFallbackSalt), std::string::npos);

    EXPECT_TRUE(TransformationEngine::resolveSalt("DEFAULT_SALT_REPLACE_IN_PRODUCTION").second);
    EXPECT_TRUE(TransformationEngine::resolveSalt("   ").second);
    EXPECT_FALSE(TransformationEngine::resolveSalt("site-secret").second);
    EXPECT_EQ(TransformationEngine::resolveSalt("site-secret").first, "site-secret");
}

TEST(TransformationEngineTest, RejectsNullRegistry) {
    EXPECT_THROW(TransformationEngine engine(saltedConfig(), std::shared_ptr<SubjectRegistry>()),
                 std::invalid_argument);
}

} // namespace
