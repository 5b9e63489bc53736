// ============================================================
// client/main.cpp -- fastadb command-line entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "device_registry.hpp"
#include "device_selector.hpp"
#include "file_transfer.hpp"
#include "server_controller.hpp"
#include "shell_session.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <pthread.h>
#include <signal.h>
#include <sys/ioctl.h>
#include <unistd.h>

static constexpr int EXIT_OK        = 0;
static constexpr int EXIT_FAILED    = 1;
static constexpr int EXIT_USAGE     = 2;
static constexpr int EXIT_PARTIAL   = 3;
static constexpr int EXIT_CANCELLED = 130;

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " [global options] <command> [args]\n"
        << "\nGlobal options:\n"
        << "  -s ID               device serial, fingerprint, alias or serial substring\n"
        << "  -H HOST             server host (default: 127.0.0.1)\n"
        << "  -P PORT             server port (default: 5037)\n"
        << "  --alias NAME=ID     define a device alias (repeatable)\n"
        << "  --pull-dir DIR      default destination for pull\n"
        << "  --verbose           enable debug logging\n"
        << "\nCommands:\n"
        << "  devices [-l]                           list connected devices\n"
        << "  features                               device feature set\n"
        << "  shell [COMMAND...]                     run a command, or an interactive shell\n"
        << "  push [-r] [--skip] [-z] [-j N] LOCAL REMOTE\n"
        << "  pull [-r] [--skip] [-z] [-j N] REMOTE [LOCAL]\n"
        << "  stat REMOTE                            remote file metadata\n"
        << "  ls REMOTE                              list a remote directory\n"
        << "  probe HOST:PORT                        handshake with a network device\n"
        << "  server status|start|stop|restart       background server lifecycle\n"
        << "\nExit status: 0 ok, 1 error, 2 usage, 3 some files failed, 130 cancelled\n"
        << "\nExamples:\n"
        << "  " << prog << " -s emulator shell 'ls /sdcard'\n"
        << "  " << prog << " push -r -j 4 ./photos /sdcard/DCIM\n";
}

struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct CliContext {
    ClientConfig     cfg;
    MapAliasResolver aliases;
    std::string      device_id;
};

// ---- Progress rendering ----------------------------------------

class ConsoleProgress : public ProgressSink {
public:
    explicit ConsoleProgress(bool interactive) : interactive_(interactive) {}

    void start(const std::string& file, u64 total) override {
        std::lock_guard<std::mutex> lk(mutex_);
        totals_[file] = total;
    }

    void update(const std::string& file, u64 current) override {
        if (!interactive_) return;
        std::lock_guard<std::mutex> lk(mutex_);
        u64 now = utils::now_ms();
        if (now - last_draw_ms_ < 100) return;
        last_draw_ms_ = now;
        std::cerr << "\r\033[K" << utils::remote_basename(file) << "  "
                  << utils::format_percent(current, totals_[file]) << "  "
                  << utils::format_bytes(current) << std::flush;
    }

    void finish(const std::string& file) override {
        std::lock_guard<std::mutex> lk(mutex_);
        if (interactive_) std::cerr << "\r\033[K" << std::flush;
        totals_.erase(file);
    }

private:
    bool                       interactive_;
    std::mutex                 mutex_;
    std::map<std::string, u64> totals_;
    u64                        last_draw_ms_{0};
};

// ---- Helpers ---------------------------------------------------

static int parse_int(const std::string& s, const char* what) {
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (s.empty() || *end != '\0' || v < 0 || v > 65535) {
        throw UsageError(std::string("invalid ") + what + ": " + s);
    }
    return (int)v;
}

static Device select_device(CliContext& ctx, DeviceRegistry& registry) {
    DeviceSelector selector(registry, &ctx.aliases);
    Device dev = selector.select(ctx.device_id);
    LOG_DEBUG("selected " + dev.serial + " [" + dev.fingerprint + "]");
    return dev;
}

static std::string octal(u32 v) {
    std::ostringstream ss;
    ss << "0" << std::oct << v;
    return ss.str();
}

// ---- Commands --------------------------------------------------

static int cmd_devices(CliContext& ctx, const std::vector<std::string>& args) {
    bool long_format = false;
    for (const auto& a : args) {
        if (a == "-l") long_format = true;
        else throw UsageError("unknown devices option: " + a);
    }

    DeviceRegistry registry(ctx.cfg);
    std::cout << "List of devices attached\n";
    for (const auto& d : registry.list_devices()) {
        std::cout << d.serial << "\t" << d.state_word;
        if (long_format) {
            if (!d.usb.empty())          std::cout << " usb:" << d.usb;
            if (!d.product.empty())      std::cout << " product:" << d.product;
            if (!d.model.empty())        std::cout << " model:" << d.model;
            if (!d.device.empty())       std::cout << " device:" << d.device;
            if (!d.transport_id.empty()) std::cout << " transport_id:" << d.transport_id;
            std::cout << " (" << to_string(d.address) << ", " << d.fingerprint << ")";
        }
        std::cout << "\n";
    }
    return EXIT_OK;
}

static int cmd_features(CliContext& ctx, const std::vector<std::string>& args) {
    if (!args.empty()) throw UsageError("features takes no arguments");
    DeviceRegistry registry(ctx.cfg);
    Device dev = select_device(ctx, registry);
    std::string line;
    for (const auto& f : registry.features(dev.serial)) {
        if (!line.empty()) line += ",";
        line += f;
    }
    std::cout << line << "\n";
    return EXIT_OK;
}

static int cmd_shell(CliContext& ctx, const std::vector<std::string>& args) {
    std::string command;
    for (const auto& a : args) {
        if (!command.empty()) command += " ";
        command += a;
    }

    DeviceRegistry registry(ctx.cfg);
    Device dev = select_device(ctx, registry);
    auto features = registry.features(dev.serial);
    std::shared_ptr<ShellSession> session = ShellSession::open(ctx.cfg, dev, features, command);

    if (command.empty() && ::isatty(STDIN_FILENO)) {
        winsize ws{};
        if (::ioctl(STDIN_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0) {
            session->resize(ws.ws_row, ws.ws_col);
        }
    }

    // Relay stdin until EOF; the thread dies with the process if the
    // remote side finishes first.
    std::thread input([session]() {
        char buf[4096];
        try {
            for (;;) {
                ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
                if (n < 0 && errno == EINTR) continue;
                if (n <= 0) break;
                session->write_input(buf, (size_t)n);
            }
            session->close_input();
        } catch (const FastAdbError& e) {
            LOG_DEBUG(std::string("stdin relay stopped: ") + e.what());
        }
    });
    input.detach();

    ShellResult result = session->wait([](const ShellChunk& chunk) {
        FILE* out = chunk.stream == ShellStream::STDERR ? stderr : stdout;
        std::fwrite(chunk.data.data(), 1, chunk.data.size(), out);
        std::fflush(out);
    });
    if (!result.exit_status_known) {
        LOG_DEBUG("exit status unavailable without shell v2; assuming success");
        return EXIT_OK;
    }
    return result.exit_code;
}

static int cmd_transfer(CliContext& ctx, Direction dir, const std::vector<std::string>& args) {
    TransferRequest req;
    req.direction = dir;
    std::vector<std::string> paths;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if      (a == "-r")     req.recursive = true;
        else if (a == "--skip") req.skip_unchanged = true;
        else if (a == "-z")     req.compress = true;
        else if (a == "-j") {
            if (i + 1 >= args.size()) throw UsageError("-j needs a worker count");
            req.workers = parse_int(args[++i], "worker count");
            if (req.workers < 1) throw UsageError("worker count must be at least 1");
        }
        else if (utils::starts_with(a, "-") && a.size() > 1) throw UsageError("unknown option: " + a);
        else paths.push_back(a);
    }

    if (dir == Direction::FROM_DEVICE && paths.size() == 1) {
        auto pull_dir = ctx.aliases.default_pull_dir();
        paths.push_back(pull_dir ? *pull_dir : std::string("."));
    }
    if (paths.size() != 2) {
        throw UsageError(dir == Direction::TO_DEVICE ? "push needs LOCAL and REMOTE"
                                                     : "pull needs REMOTE [LOCAL]");
    }
    req.source      = paths[0];
    req.destination = paths[1];

    DeviceRegistry registry(ctx.cfg);
    Device dev = select_device(ctx, registry);
    auto features = registry.features(dev.serial);

    ConsoleProgress progress(::isatty(STDERR_FILENO) != 0);
    TransferEngine engine(ctx.cfg, dev, features, &progress);

    u64 t0 = utils::now_ms();
    auto outcomes = engine.run(req);
    u64 elapsed = utils::now_ms() - t0;

    BatchSummary sum = BatchSummary::of(outcomes);
    for (const auto& o : outcomes) {
        if (o.status == OutcomeStatus::FAILED) {
            std::cerr << "failed: " << o.source << ": " << o.error << "\n";
        }
    }
    double secs = elapsed > 0 ? (double)elapsed / 1000.0 : 0.001;
    std::cout << (dir == Direction::TO_DEVICE ? "pushed " : "pulled ")
              << sum.succeeded << " file(s), " << sum.skipped << " skipped, "
              << sum.failed << " failed: " << utils::format_bytes(sum.bytes)
              << " in " << std::fixed << std::setprecision(2) << secs << "s ("
              << utils::format_speed((double)sum.bytes / secs) << ")\n";
    return sum.failed > 0 ? EXIT_PARTIAL : EXIT_OK;
}

static int cmd_stat(CliContext& ctx, const std::vector<std::string>& args) {
    if (args.size() != 1) throw UsageError("stat needs REMOTE");
    DeviceRegistry registry(ctx.cfg);
    Device dev = select_device(ctx, registry);
    TransferEngine engine(ctx.cfg, dev, registry.features(dev.serial));

    RemoteStat st = engine.stat(args[0]);
    if (!st.exists) {
        std::cerr << args[0] << ": No such file or directory\n";
        return EXIT_FAILED;
    }
    std::cout << args[0] << ": mode=" << octal(st.mode) << " size=" << st.size
              << " mtime=" << st.mtime << "\n";
    return EXIT_OK;
}

static int cmd_ls(CliContext& ctx, const std::vector<std::string>& args) {
    if (args.size() != 1) throw UsageError("ls needs REMOTE");
    DeviceRegistry registry(ctx.cfg);
    Device dev = select_device(ctx, registry);
    TransferEngine engine(ctx.cfg, dev, registry.features(dev.serial));

    char line[64];
    for (const auto& e : engine.list(args[0])) {
        std::snprintf(line, sizeof(line), "%08x %08llx %08llx ", e.st.mode,
                      (unsigned long long)e.st.size, (unsigned long long)e.st.mtime);
        std::cout << line << e.name << "\n";
    }
    return EXIT_OK;
}

static int cmd_probe(CliContext& ctx, const std::vector<std::string>& args) {
    if (args.size() != 1) throw UsageError("probe needs HOST:PORT");
    size_t colon = args[0].rfind(':');
    if (colon == std::string::npos || colon == 0) throw UsageError("probe needs HOST:PORT");
    int port = parse_int(args[0].substr(colon + 1), "port");
    if (!utils::validate_port(port)) throw UsageError("invalid port: " + args[0]);

    DeviceRegistry registry(ctx.cfg);
    Device dev = registry.probe(args[0].substr(0, colon), (u16)port);
    std::cout << dev.serial << "\t" << dev.state_word;
    if (!dev.model.empty()) std::cout << " model:" << dev.model;
    if (!dev.features.empty()) {
        std::string feats;
        for (const auto& f : dev.features) feats += (feats.empty() ? "" : ",") + f;
        std::cout << " features:" << feats;
    }
    std::cout << "\n";
    return dev.is_ready() ? EXIT_OK : EXIT_FAILED;
}

static int cmd_server(CliContext& ctx, const std::vector<std::string>& args) {
    if (args.size() != 1) throw UsageError("server needs status|start|stop|restart");
    ServerController ctl(ctx.cfg);
    const std::string& op = args[0];

    auto report = [&ctx](const ServerStatus& st) {
        if (st.running()) {
            std::cout << "server on " << ctx.cfg.endpoint() << " running, version "
                      << st.version << "\n";
        } else {
            std::cout << "server on " << ctx.cfg.endpoint() << " stopped\n";
        }
    };

    if (op == "status") {
        report(ctl.status());
    } else if (op == "start") {
        report(ctl.start());
    } else if (op == "stop") {
        ctl.stop();
        report(ServerStatus{});
    } else if (op == "restart") {
        report(ctl.restart());
    } else {
        throw UsageError("unknown server operation: " + op);
    }
    return EXIT_OK;
}

// ---- Entry point -----------------------------------------------

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;
    Logger::get().configure_from_env();

    // SIGINT/SIGTERM are taken by a dedicated thread that fires the cancel
    // token; blocked here so every later thread inherits the mask.
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGINT);
    sigaddset(&sigs, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &sigs, nullptr);

    CliContext ctx;
    std::string command;
    std::vector<std::string> args;

    try {
        ctx.cfg = ClientConfig::from_env();
        ctx.cfg.cancel = std::make_shared<CancelToken>();

        int i = 1;
        for (; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "-s" && i + 1 < argc) {
                ctx.device_id = argv[++i];
            } else if (a == "-H" && i + 1 < argc) {
                ctx.cfg.host = argv[++i];
            } else if (a == "-P" && i + 1 < argc) {
                int port = parse_int(argv[++i], "port");
                if (!utils::validate_port(port)) throw UsageError("invalid port: " + std::string(argv[i]));
                ctx.cfg.port = (u16)port;
            } else if (a == "--alias" && i + 1 < argc) {
                std::string def = argv[++i];
                size_t eq = def.find('=');
                if (eq == std::string::npos || eq == 0 || eq + 1 == def.size()) {
                    throw UsageError("--alias expects NAME=ID, got " + def);
                }
                ctx.aliases.set_alias(def.substr(0, eq), def.substr(eq + 1));
            } else if (a == "--pull-dir" && i + 1 < argc) {
                ctx.aliases.set_default_pull_dir(argv[++i]);
            } else if (a == "--verbose") {
                Logger::get().set_level(LogLevel::DEBUG);
            } else if (a == "-h" || a == "--help") {
                print_usage(argv[0]);
                return EXIT_OK;
            } else if (utils::starts_with(a, "-")) {
                throw UsageError("unknown option: " + a);
            } else {
                break;
            }
        }
        if (i >= argc) throw UsageError("missing command");
        command = argv[i++];
        for (; i < argc; ++i) args.push_back(argv[i]);
    } catch (const UsageError& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        print_usage(argv[0]);
        return EXIT_USAGE;
    } catch (const FastAdbError& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return EXIT_USAGE;
    }

    std::shared_ptr<CancelToken> cancel = ctx.cfg.cancel;
    std::thread signal_thread([cancel, sigs]() {
        int sig = 0;
        if (sigwait(&sigs, &sig) == 0) {
            LOG_DEBUG("signal " + std::to_string(sig) + ", cancelling");
            cancel->cancel();
        }
    });
    signal_thread.detach();

    try {
        if (command == "devices")  return cmd_devices(ctx, args);
        if (command == "features") return cmd_features(ctx, args);
        if (command == "shell")    return cmd_shell(ctx, args);
        if (command == "push")     return cmd_transfer(ctx, Direction::TO_DEVICE, args);
        if (command == "pull")     return cmd_transfer(ctx, Direction::FROM_DEVICE, args);
        if (command == "stat")     return cmd_stat(ctx, args);
        if (command == "ls")       return cmd_ls(ctx, args);
        if (command == "probe")    return cmd_probe(ctx, args);
        if (command == "server")   return cmd_server(ctx, args);
        throw UsageError("unknown command: " + command);
    } catch (const UsageError& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        print_usage(argv[0]);
        return EXIT_USAGE;
    } catch (const DeviceError& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        for (const auto& c : e.candidates()) std::cerr << "  " << c << "\n";
        return EXIT_FAILED;
    } catch (const FastAdbError& e) {
        if (is_cancelled(e)) {
            std::cerr << "cancelled\n";
            return EXIT_CANCELLED;
        }
        std::cerr << "ERROR: " << e.what() << "\n";
        if (const auto* ce = dynamic_cast<const ConnectionError*>(&e)) {
            if (ce->kind() == ConnectionErrc::REFUSED && command != "probe") {
                std::cerr << "is the server running? try '" << argv[0] << " server start'\n";
            }
        }
        return EXIT_FAILED;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return EXIT_FAILED;
    }
}
