/**
 * @file ResultCache.hpp
 * @brief Time-to-live cache of polled device results.
 */

#pragma once

#include "core/types/DeviceStatus.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace netsentry::core {

/**
 * @brief Kind of result stored for a device.
 */
enum class ResultKind : int {
    Status = 0,
    Interfaces = 1,
    Health = 2
};

/**
 * @brief Per-device, per-kind result cache with lazy expiry.
 *
 * An entry is fresh while now - storedAt < ttl. Stale entries are treated as
 * absent on read and are only removed when overwritten or cleared. The lock
 * is held only around map access, never while a result is being produced.
 */
class ResultCache {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;
    using Value = std::variant<DeviceStatus, std::vector<InterfaceInfo>, DeviceHealth>;

    /**
     * @brief Constructs a cache.
     * @param ttl Time-to-live of every entry.
     * @param now Clock used for storing and expiring entries.
     */
    explicit ResultCache(std::chrono::seconds ttl, TimeSource now = &Clock::now);

    /**
     * @brief Reads a fresh entry.
     * @tparam T Stored type (DeviceStatus, std::vector<InterfaceInfo> or DeviceHealth).
     * @param deviceId Device identifier.
     * @param kind Result kind.
     * @return Copy of the stored value, or std::nullopt if missing or expired.
     */
    template <typename T>
    std::optional<T> get(const std::string& deviceId, ResultKind kind) const {
        std::shared_lock lock(mutex_);
        auto it = entries_.find({deviceId, kind});
        if (it == entries_.end() || !isFresh(it->second)) {
            return std::nullopt;
        }
        if (const auto* value = std::get_if<T>(&it->second.value)) {
            return *value;
        }
        return std::nullopt;
    }

    /**
     * @brief Stores a value, replacing any previous entry for the key.
     * @param deviceId Device identifier.
     * @param kind Result kind.
     * @param value Value to store.
     */
    template <typename T>
    void put(const std::string& deviceId, ResultKind kind, T value) {
        auto storedAt = now_();
        std::unique_lock lock(mutex_);
        entries_[{deviceId, kind}] = Entry{Value(std::move(value)), storedAt};
    }

    /**
     * @brief Removes every entry of one device.
     * @param deviceId Device identifier.
     */
    void clearDevice(const std::string& deviceId);

    /**
     * @brief Removes all entries.
     */
    void clear();

    /**
     * @brief Number of stored entries, expired ones included.
     */
    [[nodiscard]] size_t size() const;

    [[nodiscard]] std::chrono::seconds ttl() const { return ttl_; }

private:
    struct Entry {
        Value value;
        Clock::time_point storedAt;
    };

    [[nodiscard]] bool isFresh(const Entry& entry) const;

    std::chrono::seconds ttl_;
    TimeSource now_;
    std::map<std::pair<std::string, ResultKind>, Entry> entries_;
    mutable std::shared_mutex mutex_;
};

} // namespace netsentry::core
