#ifndef PROCTOR_PROPERTIES_H
#define PROCTOR_PROPERTIES_H

#include <string>
#include <map>
#include <vector>
#include <any>
#include <optional>
#include <shared_mutex>

namespace proctor {

/**
 * @brief Thread-safe key-value property container
 *
 * Values are stored as std::any. Typed getters accept the native type or
 * a string form of it (values loaded from JSON or the environment arrive as
 * strings) and fall back to the supplied default otherwise.
 *
 * Thread-safety: All methods are thread-safe using read-write locks.
 */
class Properties {
public:
    Properties();
    Properties(const Properties& other);
    Properties& operator=(const Properties& other);

    /**
     * @brief Set a property value
     * @param key Property key
     * @param value Property value (any type)
     */
    void set(const std::string& key, const std::any& value);

    /**
     * @brief Get a string property
     * @param key Property key
     * @param defaultValue Default value if key not found
     * @return Property value as string, or defaultValue if not found or wrong type
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get an integer property ("42" is accepted)
     */
    int getInt(const std::string& key, int defaultValue = 0) const;

    /**
     * @brief Get a boolean property ("true", "1", "yes", "on" are accepted)
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    /**
     * @brief Get a double property ("0.8" is accepted)
     */
    double getDouble(const std::string& key, double defaultValue = 0.0) const;

    bool has(const std::string& key) const;

    bool remove(const std::string& key);

    std::vector<std::string> keys() const;

    size_t size() const;

    /**
     * @brief Copy every entry of other into this container, overwriting
     */
    void merge(const Properties& other);

    /**
     * @brief Get a property stored with exactly type T
     */
    template<typename T>
    std::optional<T> getAs(const std::string& key) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);

        auto it = properties_.find(key);
        if (it == properties_.end()) {
            return std::nullopt;
        }

        try {
            return std::any_cast<T>(it->second);
        } catch (const std::bad_any_cast&) {
            return std::nullopt;
        }
    }

private:
    std::optional<std::string> stringForm(const std::any& value) const;

    std::map<std::string, std::any> properties_;
    mutable std::shared_mutex mutex_;
};

} // namespace proctor

#endif // PROCTOR_PROPERTIES_H
