#ifndef PROCTOR_SANDBOX_LIMIT_POLICY_H
#define PROCTOR_SANDBOX_LIMIT_POLICY_H

#include <string>
#include <chrono>
#include <cstdint>

namespace proctor {

class EngineProperties;

namespace sandbox {

/**
 * @brief Resource limits applied to every single execution
 *
 * Immutable once built. The memory ceiling keeps its docker-style text
 * form ("128m") for the CLI backend; memoryBytes() gives the engine API
 * value. CPU quota is expressed as a fraction of one core and converted to
 * a CFS quota over a fixed 100ms period.
 */
class LimitPolicy {
public:
    static constexpr int64_t CPU_PERIOD_MICROS = 100000;

    /**
     * @brief Defaults: 10s, "128m", 0.8 cores
     */
    LimitPolicy();

    /**
     * @throws std::invalid_argument on a non-positive timeout or CPU quota,
     *         or an unparseable memory limit
     */
    LimitPolicy(std::chrono::seconds timeout, const std::string& memoryLimit, double cpuQuota);

    /**
     * @brief Build from engine configuration
     * @throws std::invalid_argument as the constructor does
     */
    static LimitPolicy fromProperties(const EngineProperties& props);

    /**
     * @brief Parse "<n>[b|k|m|g]" (case-insensitive) into bytes
     * @throws std::invalid_argument on malformed text or a zero size
     */
    static int64_t parseMemoryLimit(const std::string& text);

    std::chrono::seconds timeout() const { return timeout_; }
    const std::string& memoryLimit() const { return memoryLimit_; }
    int64_t memoryBytes() const { return memoryBytes_; }
    double cpuQuota() const { return cpuQuota_; }

    int64_t cpuQuotaMicros() const;
    int64_t cpuPeriodMicros() const { return CPU_PERIOD_MICROS; }

    /**
     * @brief CPU quota formatted for "docker run --cpus"
     */
    std::string cpusArgument() const;

private:
    std::chrono::seconds timeout_;
    std::string memoryLimit_;
    int64_t memoryBytes_;
    double cpuQuota_;
};

} // namespace sandbox
} // namespace proctor

#endif // PROCTOR_SANDBOX_LIMIT_POLICY_H
