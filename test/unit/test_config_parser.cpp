// test/unit/test_config_parser.cpp
// -----------------------------------------------------------
// Unit tests for ConfigParser: key=value parsing into DeidConfig.

#include <gtest/gtest.h>
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/deid_config.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

namespace {

using phiguard::config::DeidConfig;
using phiguard::model::Category;
using phiguard::model::DetectorSource;
using phiguard::transform::Action;
using phiguard::util::ConfigParser;

void load(DeidConfig &cfg, const std::string &text)
{
    std::istringstream in(text);
    ConfigParser parser(cfg);
    parser.loadFromStream(in);
}

// Collects WARN messages for the lifetime of the object.
class WarningCapture
{
public:
    WarningCapture()
    {
        phiguard::util::logger::setSink([this](phiguard::util::logger::LogLevel level, const std::string &msg) {
            if (level == phiguard::util::logger::LogLevel::WARN) {
                warnings.push_back(msg);
            }
        });
    }

    ~WarningCapture()
    {
        phiguard::util::logger::setSink(phiguard::util::logger::LogSink());
    }

    bool contains(const std::string &needle) const
    {
        return std::any_of(warnings.begin(), warnings.end(), [&](const std::string &w) {
            return w.find(needle) != std::string::npos;
        });
    }

    std::vector<std::string> warnings;
};

TEST(ConfigParserTest, LoadsAllRecognisedKeys) {
    DeidConfig cfg;
    const std::size_t builtinTerms = cfg.clinicalTerms.size();
    load(cfg,
         "# site configuration\n"
         "\n"
         "salt = site-secret\n"
         "date_shift_days=45\n"
         "default_action=hash\n"
         "rule.DATE=date_shift\n"
         "rule.person=pseudonym\n"
         "format.NAME=PATIENT-{code}\n"
         "format.default=ID-{code}\n"
         "hash_code_length=16\n"
         "pseudonym_code_length=10\n"
         "min_transform_length=4\n"
         "merge_fragments=no\n"
         "clinical_terms=metformin, lisinopril ,\n"
         "header_phrases=Nursing Handoff\n"
         "weight.rule.NAME=0.5\n"
         "worker_threads=2\n");

    EXPECT_EQ(cfg.salt, "site-secret");
    EXPECT_EQ(cfg.dateShiftDays, 45);
    EXPECT_EQ(cfg.rulebook.action(Category::Date), Action::DateShift);
    EXPECT_EQ(cfg.rulebook.action(Category::Name), Action::Pseudonym);
    EXPECT_EQ(cfg.rulebook.action(Category::Mrn), Action::Hash);
    EXPECT_EQ(cfg.rulebook.templateFor(Category::Name), "PATIENT-{code}");
    EXPECT_EQ(cfg.rulebook.templateFor(Category::Mrn), "ID-{code}");
    EXPECT_EQ(cfg.hashCodeLength, 16u);
    EXPECT_EQ(cfg.pseudonymCodeLength, 10u);
    EXPECT_EQ(cfg.minTransformLength, 4u);
    EXPECT_FALSE(cfg.mergeFragments);
    ASSERT_EQ(cfg.clinicalTerms.size(), builtinTerms + 2);
    EXPECT_EQ(cfg.clinicalTerms.back(), "lisinopril");
    ASSERT_EQ(cfg.headerPhrases.size(), 1u);
    EXPECT_EQ(cfg.headerPhrases[0], "Nursing Handoff");
    EXPECT_DOUBLE_EQ(cfg.sourceWeights.weight(DetectorSource::Rule, Category::Name), 0.5);
    EXPECT_EQ(cfg.workerThreads, 2u);
}

TEST(ConfigParserTest, InvalidValuesThrow) {
    DeidConfig cfg;
    EXPECT_THROW(load(cfg, "rule.DATE=scramble\n"), std::runtime_error);
    EXPECT_THROW(load(cfg, "default_action=\n"), std::runtime_error);
    EXPECT_THROW(load(cfg, "date_shift_days=abc\n"), std::runtime_error);
    EXPECT_THROW(load(cfg, "hash_code_length=-3\n"), std::runtime_error);
    EXPECT_THROW(load(cfg, "merge_fragments=maybe\n"), std::runtime_error);
    EXPECT_THROW(load(cfg, "weight.rule.NAME=-1\n"), std::runtime_error);
    EXPECT_THROW(load(cfg, "weight.NAME=1.0\n"), std::runtime_error);
    EXPECT_THROW(load(cfg, "weight.rule.NAME=nan\n"), std::runtime_error);
    EXPECT_THROW(load(cfg, "weight.statistical.DATE=inf\n"), std::runtime_error);
}

TEST(ConfigParserTest, MalformedLineReportsLineNumber) {
    DeidConfig cfg;
    try {
        load(cfg, "salt=abc\nthis line has no separator\n");
        FAIL() << "expected std::runtime_error";
    }
    catch (const std::runtime_error &ex) {
        EXPECT_NE(std::string(ex.what()).find("line 2"), std::string::npos) << ex.what();
    }
    EXPECT_THROW(load(cfg, " = value\n"), std::runtime_error);
}

TEST(ConfigParserTest, UnknownNamesWarnAndAreSkipped) {
    DeidConfig cfg;
    WarningCapture capture;
    load(cfg,
         "colour=blue\n"
         "rule.SPACESHIP=redact\n"
         "weight.oracle.NAME=1.0\n");

    EXPECT_TRUE(capture.contains("colour"));
    EXPECT_TRUE(capture.contains("rule.SPACESHIP"));
    EXPECT_TRUE(capture.contains("weight.oracle.NAME"));
    EXPECT_EQ(cfg.rulebook.action(Category::Name), Action::Redact);
}

TEST(ConfigParserTest, SaltIsNeverLogged) {
    DeidConfig cfg;
    std::vector<std::string> messages;
    phiguard::util::logger::setSink([&messages](phiguard::util::logger::LogLevel, const std::string &msg) {
        messages.push_back(msg);
    });
    load(cfg, "salt=very-secret-value\n");
    phiguard::util::logger::setSink(phiguard::util::logger::LogSink());

    EXPECT_FALSE(messages.empty());
    for (const auto &m : messages) {
        EXPECT_EQ(m.find("very-secret-value"), std::string::npos) << m;
    }
}

TEST(ConfigParserTest, MissingFileKeepsDefaults) {
    DeidConfig cfg;
    WarningCapture capture;
    ConfigParser parser(cfg);
    parser.loadFromFile("/nonexistent/phiguard/test.conf");

    EXPECT_TRUE(cfg.salt.empty());
    EXPECT_EQ(cfg.dateShiftDays, 30);
    EXPECT_TRUE(capture.contains("not found"));
}

TEST(ConfigParserTest, LoadsFromFile) {
    const std::string path = ::testing::TempDir() + "phiguard_config_parser_test.conf";
    {
        std::ofstream out(path);
        ASSERT_TRUE(out.is_open());
        out << "salt=file-salt\nrule.SSN=hash\n";
    }

    DeidConfig cfg;
    ConfigParser parser(cfg);
    parser.loadFromFile(path);
    std::remove(path.c_str());

    EXPECT_EQ(cfg.salt, "file-salt");
    EXPECT_EQ(cfg.rulebook.action(Category::Ssn), Action::Hash);
}

} // namespace
