#include "utils/properties.h"
#include <mutex>
#include <stdexcept>

namespace proctor {

Properties::Properties() = default;

Properties::Properties(const Properties& other) {
    std::shared_lock<std::shared_mutex> lock(other.mutex_);
    properties_ = other.properties_;
}

Properties& Properties::operator=(const Properties& other) {
    if (this != &other) {
        std::unique_lock<std::shared_mutex> lock1(mutex_, std::defer_lock);
        std::shared_lock<std::shared_mutex> lock2(other.mutex_, std::defer_lock);
        std::lock(lock1, lock2);
        properties_ = other.properties_;
    }
    return *this;
}

void Properties::set(const std::string& key, const std::any& value) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    properties_[key] = value;
}

std::optional<std::string> Properties::stringForm(const std::any& value) const {
    if (const auto* str = std::any_cast<std::string>(&value)) {
        return *str;
    }
    if (const auto* cstr = std::any_cast<const char*>(&value)) {
        return std::string(*cstr);
    }
    return std::nullopt;
}

std::string Properties::getString(const std::string& key, const std::string& defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = properties_.find(key);
    if (it == properties_.end()) {
        return defaultValue;
    }
    return stringForm(it->second).value_or(defaultValue);
}

int Properties::getInt(const std::string& key, int defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = properties_.find(key);
    if (it == properties_.end()) {
        return defaultValue;
    }

    if (const auto* value = std::any_cast<int>(&it->second)) {
        return *value;
    }

    auto str = stringForm(it->second);
    if (!str) {
        return defaultValue;
    }
    try {
        return std::stoi(*str);
    } catch (const std::logic_error&) {
        return defaultValue;
    }
}

bool Properties::getBool(const std::string& key, bool defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = properties_.find(key);
    if (it == properties_.end()) {
        return defaultValue;
    }

    if (const auto* value = std::any_cast<bool>(&it->second)) {
        return *value;
    }

    auto str = stringForm(it->second);
    if (!str) {
        return defaultValue;
    }
    return *str == "true" || *str == "1" || *str == "yes" || *str == "on";
}

double Properties::getDouble(const std::string& key, double defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = properties_.find(key);
    if (it == properties_.end()) {
        return defaultValue;
    }

    if (const auto* value = std::any_cast<double>(&it->second)) {
        return *value;
    }
    if (const auto* value = std::any_cast<int>(&it->second)) {
        return static_cast<double>(*value);
    }

    auto str = stringForm(it->second);
    if (!str) {
        return defaultValue;
    }
    try {
        return std::stod(*str);
    } catch (const std::logic_error&) {
        return defaultValue;
    }
}

bool Properties::has(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return properties_.find(key) != properties_.end();
}

bool Properties::remove(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return properties_.erase(key) > 0;
}

std::vector<std::string> Properties::keys() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(properties_.size());
    for (const auto& pair : properties_) {
        result.push_back(pair.first);
    }
    return result;
}

size_t Properties::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return properties_.size();
}

void Properties::merge(const Properties& other) {
    if (this == &other) {
        return;
    }

    std::unique_lock<std::shared_mutex> lock1(mutex_, std::defer_lock);
    std::shared_lock<std::shared_mutex> lock2(other.mutex_, std::defer_lock);
    std::lock(lock1, lock2);

    for (const auto& pair : other.properties_) {
        properties_[pair.first] = pair.second;
    }
}

} // namespace proctor
