#ifndef PHIGUARD_TRANSFORM_SUBJECT_CONTEXT_HPP
#define PHIGUARD_TRANSFORM_SUBJECT_CONTEXT_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include "../util/logger.hpp"

/**
 * @file subject_context.hpp
 * @brief Per-subject memo tables that keep pseudonyms and date shifts consistent.
 *
 * DESIGN:
 *   - One SubjectContext per subject id, created lazily by SubjectRegistry::acquire().
 *   - Readers take a shared lock; a miss upgrades to the exclusive lock, re-checks, then
 *     computes and inserts. Two threads asking for the same key always see one value.
 *   - compute callbacks run under the exclusive lock and must not call back into the
 *     same context.
 *   - Calls without a subject share one anonymous context.
 *
 * USAGE:
 *   @code
 *   SubjectRegistry registry;
 *   auto ctx = registry.acquire(std::string("p1"));
 *   int days = ctx->dateShiftDays([] { return 42; });
 *   @endcode
 */

namespace phiguard {
namespace transform {

class SubjectContext
{
public:
    explicit SubjectContext(std::optional<std::string> subjectId = std::nullopt)
        : subjectId_(std::move(subjectId))
    {
    }

    SubjectContext(const SubjectContext&) = delete;
    SubjectContext& operator=(const SubjectContext&) = delete;

    const std::optional<std::string> &subjectId() const { return subjectId_; }

    template<typename F>
    int dateShiftDays(F &&compute)
    {
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            if (dateShiftDays_) {
                return *dateShiftDays_;
            }
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (!dateShiftDays_) {
            dateShiftDays_ = compute();
        }
        return *dateShiftDays_;
    }

    template<typename F>
    std::string pseudonym(const std::string &cacheKey, F &&compute)
    {
        return getOrCompute(pseudonyms_, cacheKey, std::forward<F>(compute));
    }

    template<typename F>
    std::string shiftedDate(const std::string &dateText, F &&compute)
    {
        return getOrCompute(shiftedDates_, dateText, std::forward<F>(compute));
    }

    std::optional<int> cachedDateShiftDays() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return dateShiftDays_;
    }

    std::size_t pseudonymCount() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return pseudonyms_.size();
    }

    std::size_t shiftedDateCount() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return shiftedDates_.size();
    }

private:
    template<typename F>
    std::string getOrCompute(std::unordered_map<std::string, std::string> &table,
                             const std::string &key, F &&compute)
    {
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = table.find(key);
            if (it != table.end()) {
                return it->second;
            }
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = table.find(key);
        if (it == table.end()) {
            it = table.emplace(key, compute()).first;
        }
        return it->second;
    }

    const std::optional<std::string> subjectId_;
    mutable std::shared_mutex mutex_;
    std::optional<int> dateShiftDays_;
    std::unordered_map<std::string, std::string> pseudonyms_;
    std::unordered_map<std::string, std::string> shiftedDates_;
};

/**
 * @brief Owns every SubjectContext of a process (or of one engine).
 */
class SubjectRegistry
{
public:
    SubjectRegistry()
        : anonymous_(std::make_shared<SubjectContext>())
    {
    }

    SubjectRegistry(const SubjectRegistry&) = delete;
    SubjectRegistry& operator=(const SubjectRegistry&) = delete;

    /**
     * @brief Context for subjectId, created on first use. An absent or empty id yields
     *        the shared anonymous context.
     */
    std::shared_ptr<SubjectContext> acquire(const std::optional<std::string> &subjectId)
    {
        if (!subjectId || subjectId->empty()) {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            return anonymous_;
        }
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = contexts_.find(*subjectId);
            if (it != contexts_.end()) {
                return it->second;
            }
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = contexts_.find(*subjectId);
        if (it == contexts_.end()) {
            it = contexts_.emplace(*subjectId, std::make_shared<SubjectContext>(subjectId)).first;
            util::logger::debug("SubjectRegistry: created context #" + std::to_string(contexts_.size()));
        }
        return it->second;
    }

    /**
     * @brief Forget one subject. Holders of the old context keep a valid object.
     * @return true if the subject was known.
     */
    bool reset(const std::string &subjectId)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return contexts_.erase(subjectId) > 0;
    }

    void clear()
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        contexts_.clear();
        anonymous_ = std::make_shared<SubjectContext>();
        util::logger::info("SubjectRegistry: cleared all subject contexts");
    }

    std::size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return contexts_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<SubjectContext>> contexts_;
    std::shared_ptr<SubjectContext> anonymous_;
};

} // namespace transform
} // namespace phiguard

#endif // PHIGUARD_TRANSFORM_SUBJECT_CONTEXT_HPP
