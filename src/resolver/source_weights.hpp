#ifndef PHIGUARD_RESOLVER_SOURCE_WEIGHTS_HPP
#define PHIGUARD_RESOLVER_SOURCE_WEIGHTS_HPP

#include <array>
#include <cmath>
#include <stdexcept>
#include <string>
#include "../model/category.hpp"

/**
 * @file source_weights.hpp
 * @brief Per (detector source, category) multipliers applied to raw confidences.
 *
 * Each detector source is trusted more on the categories it is good at:
 *   - rule        : structured identifiers (phone, fax, email, SSN, URL, IP, licence, vehicle, device)
 *   - statistical : free-text names, locations, organizations, dates
 *   - learned     : record numbers and other domain identifiers
 * Favoured pairs get 1.2, every other pair of those sources 0.8. ClinicalPreserve and
 * Unknown sources stay at 1.0.
 */

namespace phiguard {
namespace resolver {

class SourceWeights
{
public:
    static constexpr double kFavoured = 1.2;
    static constexpr double kDisfavoured = 0.8;
    static constexpr double kNeutral = 1.0;

    SourceWeights()
    {
        using model::Category;
        using model::DetectorSource;

        for (auto &row : weights_) {
            row.fill(kNeutral);
        }
        fillSource(DetectorSource::Rule, kDisfavoured);
        fillSource(DetectorSource::Statistical, kDisfavoured);
        fillSource(DetectorSource::Learned, kDisfavoured);

        for (Category c : {Category::PhoneNumber, Category::FaxNumber, Category::EmailAddress,
                           Category::Ssn, Category::Url, Category::IpAddress,
                           Category::LicenseNumber, Category::VehicleId, Category::DeviceId}) {
            set(DetectorSource::Rule, c, kFavoured);
        }
        for (Category c : {Category::Name, Category::Location, Category::Organization,
                           Category::Date}) {
            set(DetectorSource::Statistical, c, kFavoured);
        }
        for (Category c : {Category::Mrn, Category::HealthPlanId, Category::AccountNumber,
                           Category::BiometricId, Category::PhotoId, Category::AgeOver89}) {
            set(DetectorSource::Learned, c, kFavoured);
        }
    }

    double weight(model::DetectorSource source, model::Category category) const
    {
        return weights_[index(source)][model::categoryIndex(category)];
    }

    /**
     * @throw std::invalid_argument if w is negative.
     */
    void set(model::DetectorSource source, model::Category category, double w)
    {
        if (!std::isfinite(w) || w < 0.0) {
            throw std::invalid_argument("SourceWeights: negative or non-finite weight for "
                                        + std::string(model::sourceName(source)) + "/"
                                        + model::categoryName(category));
        }
        weights_[index(source)][model::categoryIndex(category)] = w;
    }

private:
    static std::size_t index(model::DetectorSource s) { return static_cast<std::size_t>(s); }

    void fillSource(model::DetectorSource source, double w)
    {
        weights_[index(source)].fill(w);
    }

    std::array<std::array<double, model::kCategoryCount>, model::kSourceCount> weights_;
};

} // namespace resolver
} // namespace phiguard

#endif // PHIGUARD_RESOLVER_SOURCE_WEIGHTS_HPP
