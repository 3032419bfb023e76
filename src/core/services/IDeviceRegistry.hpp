/**
 * @file IDeviceRegistry.hpp
 * @brief Interface of the store that owns device records.
 */

#pragma once

#include "core/types/DeviceRecord.hpp"

#include <optional>
#include <string>
#include <vector>

namespace netsentry::core {

/**
 * @brief Source of truth for managed devices.
 *
 * The monitoring layer only reads from it; discovery promotion adds to it.
 */
class IDeviceRegistry {
public:
    virtual ~IDeviceRegistry() = default;

    /**
     * @brief Re-reads the device set from its backing store.
     * @throws std::runtime_error if the store cannot be read.
     */
    virtual void reload() = 0;

    /**
     * @brief Returns all devices.
     */
    virtual std::vector<DeviceRecord> getAllDevices() const = 0;

    /**
     * @brief Looks up a device.
     * @param id Device identifier.
     * @return The device, or std::nullopt if unknown.
     */
    virtual std::optional<DeviceRecord> getDevice(const std::string& id) const = 0;

    /**
     * @brief Registers a new device and persists it.
     * @param device Device to add.
     * @throws std::invalid_argument if the record is invalid or the id exists.
     * @throws std::runtime_error if it cannot be persisted.
     */
    virtual void addDevice(const DeviceRecord& device) = 0;
};

} // namespace netsentry::core
