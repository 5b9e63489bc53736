#pragma once

// ============================================================
// device_registry.hpp -- Device enumeration, features, probing
// ============================================================

#include "client_config.hpp"
#include "device.hpp"
#include <set>
#include <string>
#include <vector>

class DeviceRegistry {
public:
    explicit DeviceRegistry(ClientConfig cfg);

    // host:devices-l, retried per cfg.enumeration_retry while empty
    std::vector<Device> list_devices();

    // host-serial:<serial>:features
    std::set<std::string> features(const std::string& serial);

    // Direct CNXN handshake with a device daemon at host:port.
    // READY on CNXN, UNAUTHORIZED on AUTH, ProtocolError otherwise.
    Device probe(const std::string& host, u16 port);

    const ClientConfig& config() const { return cfg_; }

    // ---- Parsing (exposed for tests) ----

    // Newline-delimited "serial state key:value..." records. Blank lines
    // are skipped, unknown keys ignored.
    static std::vector<Device> parse_device_list(const std::string& text);

    // Returns false for a blank or malformed line
    static bool parse_device_line(const std::string& line, Device& out);

    static std::set<std::string> parse_features(const std::string& text);

    // "device::ro.product.name=x;ro.product.model=y;...;features=a,b"
    static void parse_banner(const std::string& banner, Device& out);

private:
    std::vector<Device> query_devices();

    ClientConfig cfg_;
};
