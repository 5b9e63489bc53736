#pragma once

// ============================================================
// device_selector.hpp -- Resolve a user identifier to one device
// ============================================================

#include "device.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

class DeviceRegistry;

// Supplied by the configuration layer; aliases may name a serial or a
// fingerprint.
class AliasResolver {
public:
    virtual ~AliasResolver() = default;
    virtual std::optional<std::string> lookup_alias(const std::string& name) const = 0;
    virtual std::optional<std::string> default_pull_dir() const = 0;
};

class MapAliasResolver : public AliasResolver {
public:
    MapAliasResolver() = default;
    explicit MapAliasResolver(std::map<std::string, std::string> aliases,
                              std::optional<std::string> pull_dir = std::nullopt)
        : aliases_(std::move(aliases)), pull_dir_(std::move(pull_dir)) {}

    void set_alias(const std::string& name, const std::string& target) { aliases_[name] = target; }
    void set_default_pull_dir(const std::string& dir) { pull_dir_ = dir; }

    std::optional<std::string> lookup_alias(const std::string& name) const override {
        auto it = aliases_.find(name);
        if (it == aliases_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<std::string> default_pull_dir() const override { return pull_dir_; }

private:
    std::map<std::string, std::string> aliases_;
    std::optional<std::string>         pull_dir_;
};

class DeviceSelector {
public:
    explicit DeviceSelector(DeviceRegistry& registry, const AliasResolver* aliases = nullptr)
        : registry_(registry), aliases_(aliases) {}

    // Enumerates and resolves. Empty identifier auto-selects a lone device.
    Device select(const std::string& identifier);

    // Priority: exact serial or fingerprint, alias, unique case-insensitive
    // substring of the serial. Throws DeviceError NO_DEVICES / NOT_FOUND /
    // AMBIGUOUS (with every candidate serial).
    static Device select_from(const std::vector<Device>& devices,
                              const std::string& identifier,
                              const AliasResolver* aliases);

    // Throws DeviceError OFFLINE / UNAUTHORIZED unless the device is ready
    static void require_usable(const Device& device);

private:
    DeviceRegistry&      registry_;
    const AliasResolver* aliases_;
};
