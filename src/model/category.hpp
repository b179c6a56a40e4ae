#ifndef PHIGUARD_MODEL_CATEGORY_HPP
#define PHIGUARD_MODEL_CATEGORY_HPP

#include <array>
#include <cctype>
#include <cstddef>
#include <string>
#include <unordered_map>

/**
 * @file category.hpp
 * @brief The closed identifier taxonomy, its precedence order, and the detector sources.
 *
 * Detectors report free-form labels ("PERSON", "US_SSN", "MEDICAL_RECORD_NUMBER", ...).
 * categoryFromLabel() folds them onto Category; anything unrecognised becomes
 * Category::Unknown, which the resolver drops.
 *
 * The enumerator order IS the precedence order used for conflict resolution:
 * a lower value is kept preferentially. Atomic structured identifiers come first,
 * free-text names and locations after them, generic identifiers last.
 */

namespace phiguard {
namespace model {

enum class Category : std::size_t {
    Url = 0,
    EmailAddress,
    IpAddress,
    Ssn,
    VehicleId,
    DeviceId,
    HealthPlanId,
    AccountNumber,
    LicenseNumber,
    Mrn,
    EncounterId,
    PhoneNumber,
    FaxNumber,
    Date,
    PhotoId,
    BiometricId,
    Name,
    Location,
    Zip,
    AgeOver89,
    OtherId,
    Organization,
    ClinicalPreserve,   ///< measurement / whitelisted phrase; only ever a preserve span
    Unknown
};

constexpr std::size_t kCategoryCount = static_cast<std::size_t>(Category::Unknown) + 1;

/// Canonical upper-case names, indexed by Category.
constexpr std::array<const char*, kCategoryCount> kCategoryNames = {{
    "URL", "EMAIL_ADDRESS", "IP_ADDRESS", "SSN", "VEHICLE_ID", "DEVICE_ID",
    "HEALTH_PLAN_ID", "ACCOUNT_NUMBER", "LICENSE_NUMBER", "MRN", "ENCOUNTER_ID",
    "PHONE_NUMBER", "FAX_NUMBER", "DATE", "PHOTO_ID", "BIOMETRIC_ID", "NAME",
    "LOCATION", "ZIP", "AGE_OVER_89", "OTHER_ID", "ORGANIZATION",
    "CLINICAL_PRESERVE", "UNKNOWN"
}};

inline const char *categoryName(Category c)
{
    return kCategoryNames[static_cast<std::size_t>(c)];
}

inline std::size_t categoryIndex(Category c)
{
    return static_cast<std::size_t>(c);
}

/**
 * @brief Precedence rank of a category; lower wins. Unknown ranks last.
 */
inline int categoryPriority(Category c)
{
    return static_cast<int>(c);
}

/**
 * @brief Categories that must be replaced as a whole token, never partially.
 */
inline bool isAtomic(Category c)
{
    switch (c) {
    case Category::Url:
    case Category::EmailAddress:
    case Category::IpAddress:
    case Category::Ssn:
    case Category::VehicleId:
    case Category::DeviceId:
    case Category::AccountNumber:
    case Category::HealthPlanId:
    case Category::LicenseNumber:
    case Category::Mrn:
    case Category::EncounterId:
    case Category::Date:
        return true;
    default:
        return false;
    }
}

/**
 * @brief Categories whose pseudonym key is token-order independent.
 */
inline bool isNameLike(Category c)
{
    return c == Category::Name;
}

inline std::string upperLabel(const std::string &label)
{
    std::string out;
    out.reserve(label.size());
    for (unsigned char ch : label) {
        if (ch == ' ' || ch == '-') {
            out.push_back('_');
        } else {
            out.push_back(static_cast<char>(std::toupper(ch)));
        }
    }
    return out;
}

/**
 * @brief Map a detector label onto the taxonomy. Case-insensitive.
 */
inline Category categoryFromLabel(const std::string &label)
{
    static const std::unordered_map<std::string, Category> kLabels = {
        {"PERSON", Category::Name},
        {"NAME", Category::Name},
        {"PATIENT", Category::Name},
        {"DOCTOR", Category::Name},
        {"DATE", Category::Date},
        {"DATE_TIME", Category::Date},
        {"DOB", Category::Date},
        {"ADDRESS", Category::Location},
        {"LOCATION", Category::Location},
        {"CITY", Category::Location},
        {"STATE", Category::Location},
        {"STREET", Category::Location},
        {"GPE", Category::Location},
        {"GEOGRAPHIC_SUBDIVISION", Category::Location},
        {"ZIP", Category::Zip},
        {"ZIP_CODE", Category::Zip},
        {"EMAIL", Category::EmailAddress},
        {"EMAIL_ADDRESS", Category::EmailAddress},
        {"PHONE", Category::PhoneNumber},
        {"PHONE_NUMBER", Category::PhoneNumber},
        {"FAX", Category::FaxNumber},
        {"FAX_NUMBER", Category::FaxNumber},
        {"SSN", Category::Ssn},
        {"US_SSN", Category::Ssn},
        {"MRN", Category::Mrn},
        {"MEDICAL_RECORD_NUMBER", Category::Mrn},
        {"MEDICALRECORD", Category::Mrn},
        {"ENCOUNTER_ID", Category::EncounterId},
        {"ACCOUNT", Category::AccountNumber},
        {"ACCOUNT_NUMBER", Category::AccountNumber},
        {"HEALTH_PLAN_ID", Category::HealthPlanId},
        {"HEALTH_PLAN_BENEFICIARY_NUMBER", Category::HealthPlanId},
        {"HEALTHPLAN", Category::HealthPlanId},
        {"LICENSE", Category::LicenseNumber},
        {"LICENSE_NUMBER", Category::LicenseNumber},
        {"US_DRIVER_LICENSE", Category::LicenseNumber},
        {"VEHICLE_ID", Category::VehicleId},
        {"VIN", Category::VehicleId},
        {"DEVICE", Category::DeviceId},
        {"DEVICE_ID", Category::DeviceId},
        {"MEDICAL_DEVICE_ID", Category::DeviceId},
        {"URL", Category::Url},
        {"IP_ADDRESS", Category::IpAddress},
        {"BIOMETRIC_ID", Category::BiometricId},
        {"BIOID", Category::BiometricId},
        {"PHOTO_ID", Category::PhotoId},
        {"FULL_FACE_PHOTO", Category::PhotoId},
        {"AGE_OVER_89", Category::AgeOver89},
        {"ID", Category::OtherId},
        {"IDNUM", Category::OtherId},
        {"OTHER_ID", Category::OtherId},
        {"IN_PAN", Category::OtherId},
        {"ORGANIZATION", Category::Organization},
        {"ORG", Category::Organization},
        {"HOSPITAL", Category::Organization},
        {"CLINICAL_PRESERVE", Category::ClinicalPreserve},
        {"CLINICAL_VITAL", Category::ClinicalPreserve},
        {"CLINICAL_LAB", Category::ClinicalPreserve},
        {"CLINICAL_TERM", Category::ClinicalPreserve},
        {"HEADER", Category::ClinicalPreserve},
    };
    auto it = kLabels.find(upperLabel(label));
    return it == kLabels.end() ? Category::Unknown : it->second;
}

/**
 * @brief Which kind of detector produced a candidate.
 */
enum class DetectorSource : std::size_t {
    Rule = 0,           ///< pattern / regex recognisers
    Statistical,        ///< general-purpose NER
    Learned,            ///< transformer token classifiers
    ClinicalPreserve,   ///< clinical measurement / whitelist finder
    Unknown
};

constexpr std::size_t kSourceCount = static_cast<std::size_t>(DetectorSource::Unknown) + 1;

inline const char *sourceName(DetectorSource s)
{
    switch (s) {
    case DetectorSource::Rule:             return "rule";
    case DetectorSource::Statistical:      return "statistical";
    case DetectorSource::Learned:          return "learned";
    case DetectorSource::ClinicalPreserve: return "clinical-preserve";
    case DetectorSource::Unknown:          break;
    }
    return "unknown";
}

inline DetectorSource sourceFromLabel(const std::string &label)
{
    std::string lower;
    lower.reserve(label.size());
    for (unsigned char ch : label) {
        lower.push_back(static_cast<char>(std::tolower(ch)));
    }
    if (lower == "rule" || lower == "pattern" || lower == "regex" || lower == "presidio") {
        return DetectorSource::Rule;
    }
    if (lower == "statistical" || lower == "spacy" || lower == "ner") {
        return DetectorSource::Statistical;
    }
    if (lower == "learned" || lower == "hf" || lower == "bert" || lower == "transformer") {
        return DetectorSource::Learned;
    }
    if (lower == "clinical-preserve" || lower == "clinical_preserve" || lower == "clinical") {
        return DetectorSource::ClinicalPreserve;
    }
    return DetectorSource::Unknown;
}

} // namespace model
} // namespace phiguard

#endif // PHIGUARD_MODEL_CATEGORY_HPP
