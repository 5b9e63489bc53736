#pragma once

// ============================================================
// device.hpp -- Device entity as reported by the host server
// ============================================================

#include "../common/platform.hpp"
#include <set>
#include <string>

enum class DeviceState {
    READY,          // wire word "device"
    OFFLINE,
    UNAUTHORIZED,
    UNKNOWN,        // bootloader, recovery, "no permissions", ...
};

enum class AddressKind {
    LOCAL,          // USB / emulator serial
    NETWORK,        // host:port
};

struct Device {
    std::string serial;
    DeviceState state{DeviceState::UNKNOWN};
    std::string state_word;     // as received, e.g. "recovery"
    std::string transport_id;
    std::string product;
    std::string model;
    std::string device;
    std::string usb;
    AddressKind address{AddressKind::LOCAL};
    std::string fingerprint;    // 12 hex digits of xxh3-64(serial)

    // Only filled by DeviceRegistry::probe(); enumeration does not carry them
    std::set<std::string> features;

    bool is_ready() const { return state == DeviceState::READY; }
};

const char* to_string(DeviceState s);
const char* to_string(AddressKind k);

DeviceState parse_device_state(const std::string& word);

// "name:port" with a numeric port is a network device
AddressKind classify_address(const std::string& serial);
