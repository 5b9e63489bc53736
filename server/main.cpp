// ============================================================
// server/main.cpp -- fastadb_mock_server entry point
//   Runs the loopback host server emulator until host:kill,
//   SIGINT or SIGTERM.
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "mock_adb_server.hpp"
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>

#include <pthread.h>

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " [options]\n"
        << "\nOptions:\n"
        << "  --port N                 TCP port on 127.0.0.1 (default: 5037, 0 = ephemeral)\n"
        << "  --device SERIAL[=STATE]  add a device (STATE defaults to 'device')\n"
        << "  --file SERIAL:PATH=TEXT  seed a file on a device\n"
        << "  --verbose                enable debug logging\n"
        << "\nExample:\n"
        << "  " << prog << " --port 5038 --device emulator-5554 --device R58M=unauthorized\n";
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;
    Logger::get().configure_from_env();

    long port = FASTADB_DEFAULT_PORT;
    std::vector<MockDevice> devices;
    std::vector<std::string> files;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            char* end = nullptr;
            port = std::strtol(argv[++i], &end, 10);
            if (*end != '\0' || !(port == 0 || utils::validate_port(port))) {
                std::cerr << "ERROR: Invalid port: " << argv[i] << "\n";
                return 2;
            }
        } else if (std::strcmp(argv[i], "--device") == 0 && i + 1 < argc) {
            std::string spec = argv[++i];
            MockDevice dev;
            size_t eq = spec.find('=');
            dev.serial = spec.substr(0, eq);
            if (eq != std::string::npos) dev.state = spec.substr(eq + 1);
            if (dev.serial.empty()) {
                std::cerr << "ERROR: Empty device serial\n";
                return 2;
            }
            devices.push_back(std::move(dev));
        } else if (std::strcmp(argv[i], "--file") == 0 && i + 1 < argc) {
            files.push_back(argv[++i]);
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            Logger::get().set_level(LogLevel::DEBUG);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 2;
        }
    }

    // Signals are taken by a dedicated thread; every other thread inherits
    // the blocked mask.
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGINT);
    sigaddset(&sigs, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &sigs, nullptr);

    try {
        MockAdbServer server((u16)port);
        server.set_devices(devices);
        for (const auto& f : files) {
            size_t colon = f.find(':');
            size_t eq    = f.find('=', colon == std::string::npos ? 0 : colon);
            if (colon == std::string::npos || eq == std::string::npos) {
                std::cerr << "ERROR: --file expects SERIAL:PATH=TEXT, got " << f << "\n";
                return 2;
            }
            server.put_file(f.substr(0, colon), f.substr(colon + 1, eq - colon - 1),
                            f.substr(eq + 1));
        }
        server.start();

        std::thread signal_thread([&server, sigs]() {
            int sig = 0;
            if (sigwait(&sigs, &sig) == 0) {
                LOG_INFO("signal " + std::to_string(sig) + " received");
                server.request_stop();
            }
        });
        signal_thread.detach();

        server.wait();
        server.stop();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 1;
    }
}
