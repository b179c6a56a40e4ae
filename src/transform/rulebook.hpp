#ifndef PHIGUARD_TRANSFORM_RULEBOOK_HPP
#define PHIGUARD_TRANSFORM_RULEBOOK_HPP

#include <array>
#include <cctype>
#include <stdexcept>
#include <string>
#include <utility>
#include "../model/category.hpp"

/**
 * @file rulebook.hpp
 * @brief Category -> action table and the templates used to render pseudonyms.
 *
 * The table is a fixed array indexed by Category, so every category always has an
 * action. Categories without an explicit rule follow the default action, including
 * when the default changes later.
 *
 * Templates understand two placeholders:
 *   {code}     - the truncated HMAC code
 *   {category} - the canonical category name, e.g. NAME
 *
 * USAGE:
 *   @code
 *   phiguard::transform::RuleBook rules(Action::Redact);
 *   rules.setAction(Category::Date, Action::DateShift);
 *   rules.setTemplate(Category::Name, "PATIENT-{code}");
 *   @endcode
 */

namespace phiguard {
namespace transform {

enum class Action {
    Redact,
    Hash,
    Pseudonym,
    Generalize,
    DateShift
};

inline const char *actionName(Action a)
{
    switch (a) {
    case Action::Redact:     return "redact";
    case Action::Hash:       return "hash";
    case Action::Pseudonym:  return "pseudonym";
    case Action::Generalize: return "generalize";
    case Action::DateShift:  return "date_shift";
    }
    return "redact";
}

/**
 * @throw std::invalid_argument for an unrecognised action name.
 */
inline Action actionFromString(const std::string &name)
{
    std::string s;
    s.reserve(name.size());
    for (unsigned char ch : name) {
        s.push_back(ch == '-' ? '_' : static_cast<char>(std::tolower(ch)));
    }
    if (s == "redact" || s == "mask") return Action::Redact;
    if (s == "hash") return Action::Hash;
    if (s == "pseudonym" || s == "pseudonymize") return Action::Pseudonym;
    if (s == "generalize" || s == "generalise") return Action::Generalize;
    if (s == "date_shift" || s == "shift") return Action::DateShift;
    throw std::invalid_argument("unknown action '" + name + "'");
}

class RuleBook
{
public:
    static constexpr const char *kDefaultTemplate = "{code}";

    explicit RuleBook(Action defaultAction = Action::Redact)
        : defaultAction_(defaultAction)
        , defaultTemplate_(kDefaultTemplate)
    {
        actions_.fill(defaultAction);
        explicit_.fill(false);
        hasTemplate_.fill(false);
    }

    Action action(model::Category c) const
    {
        return actions_[model::categoryIndex(c)];
    }

    void setAction(model::Category c, Action a)
    {
        actions_[model::categoryIndex(c)] = a;
        explicit_[model::categoryIndex(c)] = true;
    }

    Action defaultAction() const { return defaultAction_; }

    void setDefaultAction(Action a)
    {
        defaultAction_ = a;
        for (std::size_t i = 0; i < actions_.size(); ++i) {
            if (!explicit_[i]) {
                actions_[i] = a;
            }
        }
    }

    /// Category template if one was set, else the DEFAULT template.
    const std::string &templateFor(model::Category c) const
    {
        const std::size_t i = model::categoryIndex(c);
        return hasTemplate_[i] ? templates_[i] : defaultTemplate_;
    }

    void setTemplate(model::Category c, std::string tmpl)
    {
        const std::size_t i = model::categoryIndex(c);
        templates_[i] = std::move(tmpl);
        hasTemplate_[i] = true;
    }

    const std::string &defaultTemplate() const { return defaultTemplate_; }
    void setDefaultTemplate(std::string tmpl) { defaultTemplate_ = std::move(tmpl); }

    /**
     * @brief Substitute every {code} and {category} in tmpl.
     */
    static std::string render(const std::string &tmpl, const std::string &code, model::Category c)
    {
        std::string out;
        out.reserve(tmpl.size() + code.size());
        std::size_t i = 0;
        while (i < tmpl.size()) {
            if (tmpl.compare(i, 6, "{code}") == 0) {
                out += code;
                i += 6;
            } else if (tmpl.compare(i, 10, "{category}") == 0) {
                out += model::categoryName(c);
                i += 10;
            } else {
                out.push_back(tmpl[i]);
                ++i;
            }
        }
        return out;
    }

private:
    std::array<Action, model::kCategoryCount> actions_;
    std::array<bool, model::kCategoryCount> explicit_;
    std::array<std::string, model::kCategoryCount> templates_;
    std::array<bool, model::kCategoryCount> hasTemplate_;
    Action defaultAction_;
    std::string defaultTemplate_;
};

} // namespace transform
} // namespace phiguard

#endif // PHIGUARD_TRANSFORM_RULEBOOK_HPP
