#ifndef PHIGUARD_UTIL_CONFIG_PARSER_HPP
#define PHIGUARD_UTIL_CONFIG_PARSER_HPP

#include <string>
#include <fstream>
#include <istream>
#include <sstream>
#include <stdexcept>
#include <cstdint>
#include <algorithm>
#include <mutex>
#include <cctype>
#include <cmath>
#include <vector>
#include "../../config/deid_config.hpp"
#include "../model/category.hpp"
#include "../transform/rulebook.hpp"
#include "logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Minimal parser for phiguard's DeidConfig.
 *
 * DESIGN GOALS:
 *   - Read a simple "key=value" style configuration file or stream.
 *   - Populate phiguard::config::DeidConfig fields (salt, rules, templates, weights, ...).
 *   - Header-only, no JSON/YAML dependency.
 *   - '#' starts a comment line; blank lines are skipped.
 *
 * KEYS:
 *   salt=<secret>
 *   date_shift_days=<int>
 *   default_action=redact|hash|pseudonym|generalize|date_shift
 *   hash_code_length=<uint>          pseudonym_code_length=<uint>
 *   min_transform_length=<uint>      worker_threads=<uint>
 *   merge_fragments=true|false
 *   rule.<CATEGORY>=<action>         e.g. rule.DATE=date_shift
 *   format.<CATEGORY|DEFAULT>=<template with {code} / {category}>
 *   clinical_terms=a,b,c             (appended to the built-in list)
 *   header_phrases=a,b,c             (appended)
 *   weight.<source>.<CATEGORY>=<float>   e.g. weight.rule.PHONE_NUMBER=1.2
 *
 * USAGE:
 *   @code
 *   phiguard::config::DeidConfig cfg;
 *   phiguard::util::ConfigParser parser(cfg);
 *   parser.loadFromFile("phiguard.conf");
 *   @endcode
 *
 * NOTE:
 *   - A missing file is logged and leaves the defaults in place.
 *   - Malformed lines and invalid values throw std::runtime_error.
 *   - Unknown keys, categories and sources are logged as warnings and skipped.
 */

namespace phiguard {
namespace util {

/**
 * @class ConfigParser
 * @brief Reads a plain text key=value config and updates DeidConfig fields.
 */
class ConfigParser
{
public:
    /**
     * @brief Construct a new ConfigParser object, referencing a DeidConfig to populate.
     * @param config A reference to an existing DeidConfig struct.
     */
    explicit ConfigParser(phiguard::config::DeidConfig &config)
        : config_(config)
    {
    }

    /**
     * @brief Read the given file, parse line by line, storing recognized keys in config_.
     * @param filepath The path to the config file.
     * @throw std::runtime_error if lines are malformed or values invalid.
     */
    inline void loadFromFile(const std::string &filepath)
    {
        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            // Log that the file is missing, but just go with defaults
            logger::warn("ConfigParser: File not found: " + filepath);
            return;
        }

        logger::info("ConfigParser: Loading config from " + filepath);
        loadFromStream(inFile);
    }

    /**
     * @brief Parse key=value lines from any input stream.
     * @throw std::runtime_error if lines are malformed or values invalid.
     */
    inline void loadFromStream(std::istream &in)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string line;
        std::size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            trim(line);

            // Skip comments (# at line start) or blank lines
            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw std::runtime_error("ConfigParser: invalid line " + std::to_string(lineNo)
                                         + " (no '='): " + line);
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);
            if (key.empty()) {
                throw std::runtime_error("ConfigParser: empty key on line " + std::to_string(lineNo));
            }

            applyKeyValue(key, val);
        }

        logger::info("ConfigParser: Config loaded.");
    }

private:
    phiguard::config::DeidConfig &config_;
    std::mutex mutex_;

    /**
     * @brief Apply a recognized key-value pair to config_ fields.
     */
    inline void applyKeyValue(const std::string &key, const std::string &val)
    {
        if (key == "salt") {
            config_.salt = val;
            // never log the salt itself
            logger::debug("ConfigParser: salt set (" + std::to_string(val.size()) + " chars)");
        }
        else if (key == "date_shift_days") {
            config_.dateShiftDays = parseInt(val);
            logger::debug("ConfigParser: date_shift_days set to " + std::to_string(config_.dateShiftDays));
        }
        else if (key == "default_action") {
            config_.rulebook.setDefaultAction(parseAction(val));
            logger::debug("ConfigParser: default_action set to " + val);
        }
        else if (key == "hash_code_length") {
            config_.hashCodeLength = static_cast<std::size_t>(parseUInt(val));
        }
        else if (key == "pseudonym_code_length") {
            config_.pseudonymCodeLength = static_cast<std::size_t>(parseUInt(val));
        }
        else if (key == "min_transform_length") {
            config_.minTransformLength = static_cast<std::size_t>(parseUInt(val));
        }
        else if (key == "worker_threads") {
            config_.workerThreads = static_cast<std::size_t>(parseUInt(val));
        }
        else if (key == "merge_fragments") {
            config_.mergeFragments = parseBool(val);
        }
        else if (key == "clinical_terms") {
            appendList(val, config_.clinicalTerms);
        }
        else if (key == "header_phrases") {
            appendList(val, config_.headerPhrases);
        }
        else if (key.rfind("rule.", 0) == 0) {
            model::Category c = model::Category::Unknown;
            if (parseCategory(key.substr(5), key, c)) {
                config_.rulebook.setAction(c, parseAction(val));
                logger::debug("ConfigParser: rule for " + std::string(model::categoryName(c)) + " set to " + val);
            }
        }
        else if (key.rfind("format.", 0) == 0) {
            const std::string name = key.substr(7);
            if (model::upperLabel(name) == "DEFAULT") {
                config_.rulebook.setDefaultTemplate(val);
            }
            else {
                model::Category c = model::Category::Unknown;
                if (parseCategory(name, key, c)) {
                    config_.rulebook.setTemplate(c, val);
                }
            }
        }
        else if (key.rfind("weight.", 0) == 0) {
            applyWeight(key, val);
        }
        else {
            logger::warn("ConfigParser: Unrecognized key '" + key + "'");
        }
    }

    inline void applyWeight(const std::string &key, const std::string &val)
    {
        const std::string rest = key.substr(7);
        const auto dot = rest.find('.');
        if (dot == std::string::npos) {
            throw std::runtime_error("ConfigParser: weight key must be weight.<source>.<category>: " + key);
        }
        const model::DetectorSource source = model::sourceFromLabel(rest.substr(0, dot));
        if (source == model::DetectorSource::Unknown) {
            logger::warn("ConfigParser: Unknown detector source in '" + key + "'");
            return;
        }
        model::Category c = model::Category::Unknown;
        if (!parseCategory(rest.substr(dot + 1), key, c)) {
            return;
        }
        const double w = parseDouble(val);
        if (w < 0.0) {
            throw std::runtime_error("ConfigParser: negative weight for '" + key + "'");
        }
        config_.sourceWeights.set(source, c, w);
    }

    inline bool parseCategory(const std::string &name, const std::string &key, model::Category &out) const
    {
        out = model::categoryFromLabel(name);
        if (out == model::Category::Unknown) {
            logger::warn("ConfigParser: Unknown category in '" + key + "'");
            return false;
        }
        return true;
    }

    inline transform::Action parseAction(const std::string &val) const
    {
        try {
            return transform::actionFromString(val);
        }
        catch (const std::invalid_argument &ex) {
            throw std::runtime_error(std::string("ConfigParser: ") + ex.what());
        }
    }

    /**
     * @brief Split a comma-separated list, trimming entries, skipping empties.
     */
    inline void appendList(const std::string &val, std::vector<std::string> &out)
    {
        std::stringstream ss(val);
        std::string item;
        while (std::getline(ss, item, ',')) {
            trim(item);
            if (!item.empty()) {
                out.push_back(item);
            }
        }
    }

    /**
     * @brief Trim leading/trailing whitespace from a string.
     */
    inline void trim(std::string &s)
    {
        static const std::string whitespace = " \t\r\n";
        // left trim
        auto pos = s.find_first_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(0, pos);
        }
        else {
            s.clear();
            return;
        }
        // right trim
        pos = s.find_last_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(pos + 1);
        }
    }

    inline bool parseBool(const std::string &val) const
    {
        std::string lower(val);
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
            return true;
        }
        if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
            return false;
        }
        throw std::runtime_error("ConfigParser: parseBool failed on '" + val + "'");
    }

    inline int parseInt(const std::string &val) const
    {
        try {
            size_t idx = 0;
            int n = std::stoi(val, &idx, 10);
            if (idx != val.size()) {
                throw std::runtime_error("Non-numeric suffix");
            }
            return n;
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: parseInt failed on '" + val + "': " + ex.what());
        }
    }

    /**
     * @brief Parse a string into an unsigned integer. If invalid, throw.
     * @param val The string to parse
     * @return The parsed uint64_t value
     */
    inline uint64_t parseUInt(const std::string &val) const
    {
        if (!val.empty() && val[0] == '-') {
            throw std::runtime_error("ConfigParser: parseUInt failed on '" + val + "': negative");
        }
        try {
            size_t idx = 0;
            uint64_t n = std::stoull(val, &idx, 10);
            if (idx != val.size()) {
                throw std::runtime_error("Non-numeric suffix");
            }
            return n;
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: parseUInt failed on '" + val + "': " + ex.what());
        }
    }

    inline double parseDouble(const std::string &val) const
    {
        try {
            size_t idx = 0;
            double d = std::stod(val, &idx);
            if (idx != val.size()) {
                throw std::runtime_error("Non-numeric suffix");
            }
            if (!std::isfinite(d)) {
                throw std::runtime_error("Value is not finite");
            }
            return d;
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: parseDouble failed on '" + val + "': " + ex.what());
        }
    }
};

} // namespace util
} // namespace phiguard

#endif // PHIGUARD_UTIL_CONFIG_PARSER_HPP
