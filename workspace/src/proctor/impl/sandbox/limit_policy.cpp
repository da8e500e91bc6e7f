#include "sandbox/limit_policy.h"
#include "config/engine_properties.h"
#include "utils/log.h"
#include <limits>
#include <stdexcept>
#include <sstream>
#include <cctype>
#include <cmath>

namespace proctor {
namespace sandbox {

LimitPolicy::LimitPolicy()
    : LimitPolicy(std::chrono::seconds(10), "128m", 0.8) {
}

LimitPolicy::LimitPolicy(std::chrono::seconds timeout, const std::string& memoryLimit, double cpuQuota)
    : timeout_(timeout)
    , memoryLimit_(memoryLimit)
    , memoryBytes_(parseMemoryLimit(memoryLimit))
    , cpuQuota_(cpuQuota) {
    if (timeout_.count() <= 0) {
        throw std::invalid_argument("Execution timeout must be positive");
    }
    if (!(cpuQuota_ > 0.0)) {
        throw std::invalid_argument("CPU quota must be positive");
    }
}

LimitPolicy LimitPolicy::fromProperties(const EngineProperties& props) {
    LimitPolicy policy(std::chrono::seconds(props.getTimeoutSeconds()),
                       props.getMemoryLimit(),
                       props.getCpuLimit());
    LOGI_FMT("Limit policy: timeout=" << policy.timeout().count() << "s, memory="
             << policy.memoryLimit() << " (" << policy.memoryBytes() << " bytes), cpus="
             << policy.cpusArgument() << " (quota " << policy.cpuQuotaMicros()
             << "us / " << policy.cpuPeriodMicros() << "us)");
    return policy;
}

int64_t LimitPolicy::parseMemoryLimit(const std::string& text) {
    size_t pos = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    if (pos == 0 || pos + 1 < text.size()) {
        throw std::invalid_argument("Invalid memory limit: '" + text + "'");
    }

    int64_t value = 0;
    try {
        value = std::stoll(text.substr(0, pos));
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Memory limit out of range: '" + text + "'");
    }
    int64_t multiplier = 1;
    if (pos < text.size()) {
        switch (std::tolower(static_cast<unsigned char>(text[pos]))) {
            case 'b': multiplier = 1; break;
            case 'k': multiplier = 1024; break;
            case 'm': multiplier = 1024 * 1024; break;
            case 'g': multiplier = 1024LL * 1024 * 1024; break;
            default:
                throw std::invalid_argument("Invalid memory limit unit: '" + text + "'");
        }
    }

    if (value <= 0) {
        throw std::invalid_argument("Memory limit must be positive: '" + text + "'");
    }
    if (value > std::numeric_limits<int64_t>::max() / multiplier) {
        throw std::invalid_argument("Memory limit out of range: '" + text + "'");
    }
    return value * multiplier;
}

int64_t LimitPolicy::cpuQuotaMicros() const {
    return static_cast<int64_t>(std::llround(cpuQuota_ * CPU_PERIOD_MICROS));
}

std::string LimitPolicy::cpusArgument() const {
    std::ostringstream oss;
    oss << cpuQuota_;
    return oss.str();
}

} // namespace sandbox
} // namespace proctor
