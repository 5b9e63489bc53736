// ============================================================
// client_config.cpp -- Environment overrides and launch argv
// ============================================================

#include "client_config.hpp"
#include "../common/errors.hpp"
#include "../common/utils.hpp"
#include <cstdlib>

std::chrono::milliseconds BackoffPolicy::delay_for(int attempt) const {
    auto d = initial;
    for (int i = 0; i < attempt && d < max; ++i) d *= 2;
    return d < max ? d : max;
}

std::vector<std::string> ServerLaunchConfig::argv(u16 port) const {
    static const std::string placeholder = "{port}";
    std::vector<std::string> out;
    out.reserve(args.size() + 1);
    out.push_back(program);
    for (const auto& a : args) {
        std::string s = a;
        size_t pos;
        while ((pos = s.find(placeholder)) != std::string::npos) {
            s.replace(pos, placeholder.size(), std::to_string(port));
        }
        out.push_back(std::move(s));
    }
    return out;
}

ClientConfig ClientConfig::from_env() {
    ClientConfig cfg;

    const char* addr = std::getenv("ANDROID_ADB_SERVER_ADDRESS");
    if (addr && *addr) cfg.host = addr;

    const char* port = std::getenv("ANDROID_ADB_SERVER_PORT");
    if (port && *port) {
        char* end = nullptr;
        long v = std::strtol(port, &end, 10);
        if (*end != '\0' || !utils::validate_port(v)) {
            throw FastAdbError(std::string("invalid ANDROID_ADB_SERVER_PORT: ") + port);
        }
        cfg.port = (u16)v;
    }

    const char* adb = std::getenv("ADB_PATH");
    if (adb && *adb) cfg.launch.program = adb;

    return cfg;
}
