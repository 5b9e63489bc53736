// ============================================================
// device_selector.cpp -- Identifier resolution
// ============================================================

#include "device_selector.hpp"
#include "device_registry.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"

static std::vector<std::string> serials_of(const std::vector<const Device*>& devs) {
    std::vector<std::string> out;
    for (auto* d : devs) out.push_back(d->serial);
    return out;
}

static std::string join(const std::vector<std::string>& v) {
    std::string s;
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) s += ", ";
        s += v[i];
    }
    return s;
}

static const Device* find_exact(const std::vector<Device>& devices, const std::string& key) {
    for (const auto& d : devices) {
        if (d.serial == key || d.fingerprint == key) return &d;
    }
    return nullptr;
}

Device DeviceSelector::select(const std::string& identifier) {
    return select_from(registry_.list_devices(), identifier, aliases_);
}

Device DeviceSelector::select_from(const std::vector<Device>& devices,
                                   const std::string& identifier,
                                   const AliasResolver* aliases) {
    if (devices.empty()) {
        throw DeviceError(DeviceErrc::NO_DEVICES, "no devices found");
    }

    if (identifier.empty()) {
        if (devices.size() == 1) return devices.front();
        std::vector<std::string> all;
        for (const auto& d : devices) all.push_back(d.serial);
        throw DeviceError(DeviceErrc::AMBIGUOUS,
            "more than one device connected: " + join(all), all);
    }

    if (const Device* d = find_exact(devices, identifier)) return *d;

    if (aliases) {
        if (auto target = aliases->lookup_alias(identifier)) {
            LOG_DEBUG("alias " + identifier + " -> " + *target);
            if (const Device* d = find_exact(devices, *target)) return *d;
            throw DeviceError(DeviceErrc::NOT_FOUND,
                "alias '" + identifier + "' names '" + *target + "', which is not connected");
        }
    }

    std::string needle = utils::to_lower(identifier);
    std::vector<const Device*> matches;
    for (const auto& d : devices) {
        if (utils::to_lower(d.serial).find(needle) != std::string::npos) matches.push_back(&d);
    }
    if (matches.size() == 1) return *matches.front();
    if (matches.empty()) {
        throw DeviceError(DeviceErrc::NOT_FOUND, "no device matches '" + identifier + "'");
    }
    auto candidates = serials_of(matches);
    throw DeviceError(DeviceErrc::AMBIGUOUS,
        "'" + identifier + "' matches several devices: " + join(candidates), candidates);
}

void DeviceSelector::require_usable(const Device& device) {
    switch (device.state) {
        case DeviceState::READY:
            return;
        case DeviceState::UNAUTHORIZED:
            throw DeviceError(DeviceErrc::UNAUTHORIZED,
                "device '" + device.serial + "' is unauthorized; accept the debugging prompt on the device");
        case DeviceState::OFFLINE:
            throw DeviceError(DeviceErrc::OFFLINE, "device '" + device.serial + "' is offline");
        case DeviceState::UNKNOWN:
            break;
    }
    throw DeviceError(DeviceErrc::OFFLINE,
        "device '" + device.serial + "' is not ready (" + device.state_word + ")");
}
