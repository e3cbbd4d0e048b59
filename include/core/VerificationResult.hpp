// Core data model for verification outcomes. Produced by the checks in
// verify/, consumed by the console and JSON reporters.

#ifndef HIVE_VERIFY_CORE_VERIFICATION_RESULT_HPP
#define HIVE_VERIFY_CORE_VERIFICATION_RESULT_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace HiveVerify
{
namespace core
{

/**
 * @brief Outcome of one verification category.
 *
 * Responsibilities:
 *  - Collect hard errors, advisory warnings and named counters.
 *  - Derive pass/fail: passed() is true iff no error was recorded.
 *
 * Design notes:
 *  - Summary metrics keep insertion order so reports list them in the order
 *    the check computed them. Setting an existing name overwrites it in place.
 *  - Checks build a result and return it by value; nothing modifies it after.
 */
class VerificationResult
{
public:
    using Metric  = std::pair<std::string, std::int64_t>;
    using Summary = std::vector<Metric>;

    VerificationResult() = default;

    // ---------- Builders (used by the checks) ----------

    void addError(std::string message)
    {
        m_errors.push_back(std::move(message));
    }

    void addWarning(std::string message)
    {
        m_warnings.push_back(std::move(message));
    }

    void setMetric(const std::string& name, std::int64_t value)
    {
        for (auto& metric : m_summary)
        {
            if (metric.first == name)
            {
                metric.second = value;
                return;
            }
        }
        m_summary.emplace_back(name, value);
    }

    // ---------- Accessors ----------

    bool passed() const noexcept
    {
        return m_errors.empty();
    }

    const std::vector<std::string>& errors() const noexcept { return m_errors; }
    const std::vector<std::string>& warnings() const noexcept { return m_warnings; }
    const Summary& summary() const noexcept { return m_summary; }

    /// Value of a summary metric, if the check recorded it.
    std::optional<std::int64_t> metric(const std::string& name) const
    {
        for (const auto& m : m_summary)
        {
            if (m.first == name)
            {
                return m.second;
            }
        }
        return std::nullopt;
    }

    bool hasMetric(const std::string& name) const
    {
        return metric(name).has_value();
    }

private:
    std::vector<std::string> m_errors;
    std::vector<std::string> m_warnings;
    Summary                  m_summary;
};

/**
 * @brief Results of a full verification run, keyed by category name.
 *
 * Categories keep the order in which they were added; the engine always adds
 * system_startup, agent_lifecycle, tool_execution, llm_interaction.
 */
class VerificationReport
{
public:
    using Category       = std::pair<std::string, VerificationResult>;
    using const_iterator = std::vector<Category>::const_iterator;

    VerificationReport() = default;

    /// Add a category, replacing an existing one with the same name.
    void add(std::string name, VerificationResult result)
    {
        for (auto& category : m_categories)
        {
            if (category.first == name)
            {
                category.second = std::move(result);
                return;
            }
        }
        m_categories.emplace_back(std::move(name), std::move(result));
    }

    /// Category by name, or nullptr.
    const VerificationResult* find(const std::string& name) const noexcept
    {
        for (const auto& category : m_categories)
        {
            if (category.first == name)
            {
                return &category.second;
            }
        }
        return nullptr;
    }

    /// Logical AND of every category's passed(); true for an empty report.
    bool passed() const noexcept
    {
        for (const auto& category : m_categories)
        {
            if (!category.second.passed())
            {
                return false;
            }
        }
        return true;
    }

    std::size_t size() const noexcept { return m_categories.size(); }
    bool empty() const noexcept { return m_categories.empty(); }

    const_iterator begin() const noexcept { return m_categories.begin(); }
    const_iterator end() const noexcept { return m_categories.end(); }

private:
    std::vector<Category> m_categories;
};

} // namespace core
} // namespace HiveVerify

#endif // HIVE_VERIFY_CORE_VERIFICATION_RESULT_HPP
