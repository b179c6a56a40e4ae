// test/unit/test_pseudonymizer.cpp
// -----------------------------------------------------------
// Unit tests for pseudonym cache keys, the Pseudonymizer and the RuleBook.

#include <gtest/gtest.h>
#include <optional>
#include <stdexcept>
#include <string>

#include "model/category.hpp"
#include "transform/pseudonymizer.hpp"
#include "transform/rulebook.hpp"
#include "transform/subject_context.hpp"
#include "util/hashing.hpp"

namespace {

using phiguard::model::Category;
using phiguard::transform::Action;
using phiguard::transform::Pseudonymizer;
using phiguard::transform::RuleBook;
using phiguard::transform::SubjectContext;
using phiguard::transform::normalizeIdentifierText;
using phiguard::transform::normalizeNameText;
using phiguard::transform::pseudonymCacheKey;

TEST(PseudonymKeyTest, NameKeysIgnoreOrderCaseAndPunctuation) {
    EXPECT_EQ(normalizeNameText("Smith, John"), "john smith");
    EXPECT_EQ(normalizeNameText("John Smith"), "john smith");
    EXPECT_EQ(normalizeNameText("JOHN   SMITH"), "john smith");
    EXPECT_EQ(normalizeNameText("John Q. Smith"), "john smith");
    EXPECT_EQ(normalizeNameText("Dr. Smith"), "dr smith");
}

TEST(PseudonymKeyTest, IdentifierKeysCollapseWhitespace) {
    EXPECT_EQ(normalizeIdentifierText("  AB  12 "), "ab 12");
    EXPECT_EQ(normalizeIdentifierText("MRN-00123"), "mrn-00123");
}

TEST(PseudonymKeyTest, SubjectPrefixesTheKey) {
    EXPECT_EQ(pseudonymCacheKey(Category::Name, "Smith, John", std::string("p1")), "p1:NAME:john smith");
    EXPECT_EQ(pseudonymCacheKey(Category::Name, "Smith, John", std::nullopt), "NAME:john smith");
    EXPECT_EQ(pseudonymCacheKey(Category::Mrn, "00123", std::string("")), "MRN:00123");
}

TEST(PseudonymizerTest, SameNameInAnyOrderGetsOnePseudonym) {
    Pseudonymizer pseudonymizer("unit-salt", 12, 8);
    RuleBook rules;
    rules.setTemplate(Category::Name, "PATIENT-{code}");
    SubjectContext ctx(std::string("p1"));

    const std::string a = pseudonymizer.transform(Category::Name, "Smith, John", Action::Pseudonym, rules, ctx);
    const std::string b = pseudonymizer.transform(Category::Name, "John Smith", Action::Pseudonym, rules, ctx);

    EXPECT_EQ(a, b);
    EXPECT_EQ(a, "PATIENT-" + phiguard::util::hashing::hmacCode("unit-salt", "p1:NAME:john smith", 8));
    EXPECT_EQ(ctx.pseudonymCount(), 1u);
}

TEST(PseudonymizerTest, HashAndPseudonymUseSeparateSlots) {
    Pseudonymizer pseudonymizer("unit-salt", 12, 8);
    RuleBook rules;
    SubjectContext ctx(std::string("p1"));

    const std::string pseudo = pseudonymizer.transform(Category::Mrn, "00123", Action::Pseudonym, rules, ctx);
    const std::string hashed = pseudonymizer.transform(Category::Mrn, "00123", Action::Hash, rules, ctx);

    EXPECT_EQ(pseudo.size(), 8u);
    EXPECT_EQ(hashed.size(), 12u);
    EXPECT_EQ(hashed.substr(0, 8), pseudo);
    EXPECT_EQ(ctx.pseudonymCount(), 2u);
}

TEST(PseudonymizerTest, SubjectsAreIsolated) {
    Pseudonymizer pseudonymizer("unit-salt", 12, 8);
    RuleBook rules;
    SubjectContext p1(std::string("p1"));
    SubjectContext p2(std::string("p2"));

    EXPECT_NE(pseudonymizer.transform(Category::Name, "Jane Doe", Action::Pseudonym, rules, p1),
              pseudonymizer.transform(Category::Name, "Jane Doe", Action::Pseudonym, rules, p2));
}

TEST(PseudonymizerTest, SaltChangesEveryCode) {
    RuleBook rules;
    SubjectContext a;
    SubjectContext b;
    EXPECT_NE(Pseudonymizer("salt-one", 12, 8).transform(Category::Name, "Jane Doe", Action::Hash, rules, a),
              Pseudonymizer("salt-two", 12, 8).transform(Category::Name, "Jane Doe", Action::Hash, rules, b));
}

TEST(PseudonymizerTest, EmptyTextIsRejected) {
    Pseudonymizer pseudonymizer("unit-salt", 12, 8);
    RuleBook rules;
    SubjectContext ctx;
    EXPECT_THROW(pseudonymizer.transform(Category::Name, "", Action::Hash, rules, ctx), std::invalid_argument);
}

TEST(RuleBookTest, RenderSubstitutesPlaceholders) {
    EXPECT_EQ(RuleBook::render("{category}-{code}/{code}", "ab12", Category::Mrn), "MRN-ab12/ab12");
    EXPECT_EQ(RuleBook::render("{code", "ab12", Category::Mrn), "{code");
    EXPECT_EQ(RuleBook::render(RuleBook::kDefaultTemplate, "ab12", Category::Mrn), "ab12");
}

TEST(RuleBookTest, ExplicitRulesSurviveDefaultChanges) {
    RuleBook rules(Action::Redact);
    rules.setAction(Category::Date, Action::DateShift);
    rules.setDefaultAction(Action::Hash);

    EXPECT_EQ(rules.action(Category::Date), Action::DateShift);
    EXPECT_EQ(rules.action(Category::Name), Action::Hash);
    EXPECT_EQ(rules.defaultAction(), Action::Hash);
}

TEST(RuleBookTest, TemplatesFallBackToDefault) {
    RuleBook rules;
    rules.setDefaultTemplate("ID-{code}");
    rules.setTemplate(Category::Name, "PATIENT-{code}");
    EXPECT_EQ(rules.templateFor(Category::Name), "PATIENT-{code}");
    EXPECT_EQ(rules.templateFor(Category::Mrn), "ID-{code}");
}

TEST(RuleBookTest, ActionNamesParse) {
    using phiguard::transform::actionFromString;
    EXPECT_EQ(actionFromString("Pseudonymize"), Action::Pseudonym);
    EXPECT_EQ(actionFromString("date-shift"), Action::DateShift);
    EXPECT_EQ(actionFromString("MASK"), Action::Redact);
    EXPECT_EQ(actionFromString("generalise"), Action::Generalize);
    EXPECT_THROW(actionFromString("scramble"), std::invalid_argument);
}

} // namespace
