/**
 * @file resource_scope.hpp
 * @brief Resource isolation boundary around each backend invocation
 *
 * The executor enters a ResourceScope before calling a backend and leaves it
 * when the scope is destroyed, whether the call returned, threw or timed out.
 * What "isolation" means is delegated to an IsolationPolicy so quota
 * enforcement can be plugged in without touching the executor.
 */

#ifndef QUORUM_RESOURCE_SCOPE_HPP
#define QUORUM_RESOURCE_SCOPE_HPP

#include <cstddef>
#include <memory>
#include <string>

namespace quorum {

class Logger;

/**
 * @brief Resource quotas applied to one backend invocation
 */
struct IsolationLimits {
    size_t memory_limit_mb;      ///< Memory quota (default: 500 MB)
    size_t cpu_limit_percent;    ///< CPU quota (default: 70%)

    IsolationLimits() : memory_limit_mb(500), cpu_limit_percent(70) {}
    IsolationLimits(size_t memory_mb, size_t cpu_percent)
        : memory_limit_mb(memory_mb), cpu_limit_percent(cpu_percent) {}
};

/**
 * @brief Strategy interface for isolating a backend invocation
 */
class IsolationPolicy {
public:
    virtual ~IsolationPolicy() = default;

    /**
     * @brief Acquire isolation for a backend call
     *
     * @throws std::exception If isolation cannot be established; the
     *         invocation is then reported as an error
     */
    virtual void enter(const std::string& backend_id) = 0;

    /**
     * @brief Release isolation acquired by enter()
     */
    virtual void exit(const std::string& backend_id) noexcept = 0;

    virtual IsolationLimits limits() const = 0;
};

/**
 * @brief Isolation policy that enforces nothing and logs enter/exit at DEBUG
 */
class PassThroughIsolation : public IsolationPolicy {
public:
    explicit PassThroughIsolation(
        const IsolationLimits& limits = IsolationLimits(),
        Logger* logger = nullptr
    );

    void enter(const std::string& backend_id) override;
    void exit(const std::string& backend_id) noexcept override;
    IsolationLimits limits() const override { return limits_; }

private:
    IsolationLimits limits_;
    Logger* logger_;
};

/**
 * @brief RAII guard: enter() on construction, exit() on destruction
 *
 * Usage Example:
 *   @code
 *   PassThroughIsolation policy;
 *   {
 *       ResourceScope scope(policy, "analyst");
 *       backend->generate_response(query, context, token);
 *   }   // exit() runs here, even if generate_response threw
 *   @endcode
 */
class ResourceScope {
public:
    ResourceScope(IsolationPolicy& policy, const std::string& backend_id);
    ~ResourceScope();

    ResourceScope(const ResourceScope&) = delete;
    ResourceScope& operator=(const ResourceScope&) = delete;
    ResourceScope(ResourceScope&&) = delete;
    ResourceScope& operator=(ResourceScope&&) = delete;

private:
    IsolationPolicy& policy_;
    std::string backend_id_;
};

} // namespace quorum

#endif // QUORUM_RESOURCE_SCOPE_HPP
