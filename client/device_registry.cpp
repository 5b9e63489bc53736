// ============================================================
// device_registry.cpp -- Device enumeration, features, probing
// ============================================================

#include "device_registry.hpp"
#include "adb_connection.hpp"
#include "../common/hash.hpp"
#include "../common/logger.hpp"
#include "../common/protocol_io.hpp"
#include "../common/utils.hpp"
#include <thread>

// Features this client understands, advertised in the CNXN banner
static const char* const HOST_FEATURES =
    "shell_v2,cmd,stat_v2,ls_v2,sendrecv_v2,sendrecv_v2_zstd";

DeviceRegistry::DeviceRegistry(ClientConfig cfg) : cfg_(std::move(cfg)) {}

std::vector<Device> DeviceRegistry::query_devices() {
    auto conn = AdbConnection::open(cfg_);
    return parse_device_list(conn->query("host:devices-l"));
}

std::vector<Device> DeviceRegistry::list_devices() {
    std::vector<Device> devices = query_devices();
    const auto& policy = cfg_.enumeration_retry;
    for (int attempt = 0; devices.empty() && attempt < policy.attempts; ++attempt) {
        LOG_DEBUG("device list empty, retrying in " +
                  std::to_string(policy.delay.count()) + " ms");
        if (policy.delay.count() > 0) {
            if (cfg_.cancel) {
                if (!cfg_.cancel->wait_for(policy.delay)) cfg_.cancel->throw_if_cancelled();
            } else {
                std::this_thread::sleep_for(policy.delay);
            }
        }
        devices = query_devices();
    }
    LOG_DEBUG("enumerated " + std::to_string(devices.size()) + " device(s)");
    return devices;
}

std::set<std::string> DeviceRegistry::features(const std::string& serial) {
    auto conn = AdbConnection::open(cfg_);
    std::string text;
    try {
        text = conn->query("host-serial:" + serial + ":features");
    } catch (const ProtocolError& e) {
        if (e.kind() == ProtocolErrc::REQUEST_FAILED &&
            utils::to_lower(e.what()).find("not found") != std::string::npos) {
            throw DeviceError(DeviceErrc::NOT_FOUND, "device '" + serial + "' not found");
        }
        throw;
    }
    auto feats = parse_features(text);
    LOG_DEBUG(serial + " features: " + text);
    return feats;
}

Device DeviceRegistry::probe(const std::string& host, u16 port) {
    auto conn = AdbConnection::open(cfg_, host, port);

    proto::AdbFrame hello;
    hello.command = A_CNXN;
    hello.arg0    = FASTADB_A_VERSION;
    hello.arg1    = FASTADB_MAX_PAYLOAD;
    std::string banner = std::string("host::features=") + HOST_FEATURES;
    hello.payload.assign(banner.begin(), banner.end());
    conn->write_frame(hello);

    proto::AdbFrame reply;
    if (!conn->read_frame(reply)) {
        throw ConnectionError(ConnectionErrc::BROKEN,
            "device daemon at " + host + ":" + std::to_string(port) + " closed during handshake");
    }

    Device dev;
    dev.serial      = host + ":" + std::to_string(port);
    dev.address     = AddressKind::NETWORK;
    dev.fingerprint = hash::fingerprint(dev.serial);

    switch (reply.command) {
        case A_CNXN:
            dev.state      = DeviceState::READY;
            dev.state_word = "device";
            parse_banner(std::string(reply.payload.begin(), reply.payload.end()), dev);
            break;
        case A_AUTH:
            dev.state      = DeviceState::UNAUTHORIZED;
            dev.state_word = "unauthorized";
            break;
        default:
            throw ProtocolError(ProtocolErrc::UNEXPECTED_COMMAND,
                "unexpected " + proto::id_to_string(reply.command) + " in handshake reply");
    }
    LOG_DEBUG("probe " + dev.serial + ": " + to_string(dev.state));
    return dev;
}

// ---- Parsing ----

bool DeviceRegistry::parse_device_line(const std::string& line, Device& out) {
    auto tokens = utils::split_ws(line);
    if (tokens.size() < 2) return false;

    Device dev;
    dev.serial      = tokens[0];
    dev.state_word  = tokens[1];
    dev.state       = parse_device_state(tokens[1]);
    dev.address     = classify_address(dev.serial);
    dev.fingerprint = hash::fingerprint(dev.serial);

    for (size_t i = 2; i < tokens.size(); ++i) {
        const std::string& tok = tokens[i];
        size_t colon = tok.find(':');
        // Words without a key belong to a multi-word state ("no permissions")
        if (colon == std::string::npos) continue;
        std::string key = tok.substr(0, colon);
        std::string val = tok.substr(colon + 1);
        if      (key == "product")      dev.product = val;
        else if (key == "model")        dev.model = val;
        else if (key == "device")       dev.device = val;
        else if (key == "usb")          dev.usb = val;
        else if (key == "transport_id") dev.transport_id = val;
    }
    out = std::move(dev);
    return true;
}

std::vector<Device> DeviceRegistry::parse_device_list(const std::string& text) {
    std::vector<Device> devices;
    for (const auto& raw : utils::split(text, '\n')) {
        std::string line = utils::trim(raw);
        if (line.empty()) continue;
        Device dev;
        if (parse_device_line(line, dev)) {
            devices.push_back(std::move(dev));
        } else {
            LOG_DEBUG("ignoring device line: " + line);
        }
    }
    return devices;
}

std::set<std::string> DeviceRegistry::parse_features(const std::string& text) {
    std::set<std::string> out;
    for (const auto& f : utils::split(utils::trim(text), ',', true)) {
        out.insert(utils::trim(f));
    }
    return out;
}

void DeviceRegistry::parse_banner(const std::string& banner, Device& out) {
    // Trailing NUL is tolerated; older daemons send one
    std::string b = banner;
    while (!b.empty() && b.back() == '\0') b.pop_back();

    size_t sep = b.find("::");
    if (sep == std::string::npos) return;
    for (const auto& prop : utils::split(b.substr(sep + 2), ';', true)) {
        size_t eq = prop.find('=');
        if (eq == std::string::npos) continue;
        std::string key = prop.substr(0, eq);
        std::string val = prop.substr(eq + 1);
        if      (key == "ro.product.name")   out.product = val;
        else if (key == "ro.product.model")  out.model = val;
        else if (key == "ro.product.device") out.device = val;
        else if (key == "features")          out.features = parse_features(val);
    }
}
