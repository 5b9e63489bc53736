// ============================================================
// device.cpp -- Device state / address helpers
// ============================================================

#include "device.hpp"

const char* to_string(DeviceState s) {
    switch (s) {
        case DeviceState::READY:        return "device";
        case DeviceState::OFFLINE:      return "offline";
        case DeviceState::UNAUTHORIZED: return "unauthorized";
        case DeviceState::UNKNOWN:      return "unknown";
    }
    return "unknown";
}

const char* to_string(AddressKind k) {
    return k == AddressKind::NETWORK ? "network" : "local";
}

DeviceState parse_device_state(const std::string& word) {
    if (word == "device")       return DeviceState::READY;
    if (word == "offline")      return DeviceState::OFFLINE;
    if (word == "unauthorized") return DeviceState::UNAUTHORIZED;
    return DeviceState::UNKNOWN;
}

AddressKind classify_address(const std::string& serial) {
    size_t colon = serial.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == serial.size()) {
        return AddressKind::LOCAL;
    }
    for (size_t i = colon + 1; i < serial.size(); ++i) {
        if (serial[i] < '0' || serial[i] > '9') return AddressKind::LOCAL;
    }
    return AddressKind::NETWORK;
}
