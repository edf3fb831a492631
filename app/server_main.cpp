// voxrelay dedicated server
// Session relay over the ENet transport

#include <voxrelay/core/relay_engine.hpp>
#include <voxrelay/protocol/serialization.hpp>
#include <voxrelay/server/relay_server.hpp>
#include <voxrelay/transport/enet_server.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#ifndef VOXRELAY_VERSION
#define VOXRELAY_VERSION "v0.1.0"
#endif

namespace {

volatile std::sig_atomic_t g_running = 1;
volatile std::sig_atomic_t g_statusRequested = 0;

void signal_handler(int sig) {
    (void)sig;
    g_running = 0;
}

void status_signal_handler(int sig) {
    (void)sig;
    g_statusRequested = 1;
}

void print_banner() {
    std::cout << "\n  voxrelay " << VOXRELAY_VERSION << " (protocol "
              << voxrelay::proto::kSupportedVersion << ")\n";
    std::cout << "  ================================\n\n";
}

void print_usage(const char* progname) {
    std::cout << "Usage: " << progname << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --port <port>           Listen port (default: 3001)\n";
    std::cout << "  --max-clients <n>       Maximum connections (default: 64)\n";
    std::cout << "  --tickrate <n>          Server tick rate (default: 30)\n";
    std::cout << "  --reap-interval <sec>   Stale session sweep period (default: 30)\n";
    std::cout << "  --stats-interval <sec>  Player count log period (default: 60)\n";
    std::cout << "  --world <name:x,y,z>    Add a world; the first is the default\n";
    std::cout << "                          (default: overworld:0,64,0)\n";
    std::cout << "  --log-level <level>     debug, info, warn or error (default: info)\n";
    std::cout << "  --quiet                 Disable logging\n";
    std::cout << "  --help                  Show this help message\n";
    std::cout << "\nExample:\n";
    std::cout << "  " << progname << " --port 3001 --world overworld:0,64,0 --world nether:0,32,0\n";
}

struct Args {
    std::uint16_t port = 3001;
    std::size_t maxClients = 64;
    std::uint32_t tickRate = 30;
    float reapInterval = 30.0f;
    float statsInterval = 60.0f;
    std::vector<voxrelay::server::WorldConfig> worlds;
    voxrelay::LogLevel logLevel = voxrelay::LogLevel::Info;
    bool quiet = false;
    bool help = false;
    bool invalid = false;
};

// "name:x,y,z"
bool parse_world(const char* text, voxrelay::server::WorldConfig& out) {
    const char* colon = std::strchr(text, ':');
    if (!colon || colon == text) return false;

    out.name.assign(text, colon);

    double coords[3];
    const char* cursor = colon + 1;
    for (int i = 0; i < 3; ++i) {
        char* end = nullptr;
        coords[i] = std::strtod(cursor, &end);
        if (end == cursor) return false;

        const char expected = (i < 2) ? ',' : '\0';
        if (*end != expected) return false;
        cursor = end + 1;
    }

    out.spawn = voxrelay::Vec3{coords[0], coords[1], coords[2]};
    return true;
}

bool parse_log_level(const char* text, voxrelay::LogLevel& out) {
    if (std::strcmp(text, "debug") == 0) { out = voxrelay::LogLevel::Debug; return true; }
    if (std::strcmp(text, "info") == 0) { out = voxrelay::LogLevel::Info; return true; }
    if (std::strcmp(text, "warn") == 0) { out = voxrelay::LogLevel::Warning; return true; }
    if (std::strcmp(text, "error") == 0) { out = voxrelay::LogLevel::Error; return true; }
    return false;
}

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            args.help = true;
        }
        else if (std::strcmp(arg, "--port") == 0 && i + 1 < argc) {
            args.port = static_cast<std::uint16_t>(std::atoi(argv[++i]));
        }
        else if (std::strcmp(arg, "--max-clients") == 0 && i + 1 < argc) {
            args.maxClients = static_cast<std::size_t>(std::atoi(argv[++i]));
        }
        else if (std::strcmp(arg, "--tickrate") == 0 && i + 1 < argc) {
            args.tickRate = static_cast<std::uint32_t>(std::atoi(argv[++i]));
        }
        else if (std::strcmp(arg, "--reap-interval") == 0 && i + 1 < argc) {
            args.reapInterval = static_cast<float>(std::atof(argv[++i]));
        }
        else if (std::strcmp(arg, "--stats-interval") == 0 && i + 1 < argc) {
            args.statsInterval = static_cast<float>(std::atof(argv[++i]));
        }
        else if (std::strcmp(arg, "--world") == 0 && i + 1 < argc) {
            voxrelay::server::WorldConfig world;
            if (parse_world(argv[++i], world)) {
                args.worlds.push_back(std::move(world));
            } else {
                std::cerr << "[ERROR] Bad --world value (want name:x,y,z): " << argv[i] << "\n";
                args.invalid = true;
            }
        }
        else if (std::strcmp(arg, "--log-level") == 0 && i + 1 < argc) {
            if (!parse_log_level(argv[++i], args.logLevel)) {
                std::cerr << "[ERROR] Unknown log level: " << argv[i] << "\n";
                args.invalid = true;
            }
        }
        else if (std::strcmp(arg, "--quiet") == 0) {
            args.quiet = true;
        }
        else {
            std::cerr << "[WARNING] Unknown argument: " << arg << "\n";
        }
    }

    return args;
}

} // namespace

int main(int argc, char* argv[]) {
    Args args = parse_args(argc, argv);

    if (args.help) {
        print_banner();
        print_usage(argv[0]);
        return 0;
    }
    if (args.invalid) {
        print_usage(argv[0]);
        return 2;
    }
    if (!args.quiet) {
        print_banner();
    }

    auto transport = std::make_shared<voxrelay::transport::ENetServerTransport>();

    if (!transport->start(args.port, args.maxClients)) {
        std::cerr << "[ERROR] Failed to start server on port " << args.port << "\n";
        return 1;
    }

    voxrelay::server::RelayServer::Options opts;
    if (!args.worlds.empty()) {
        opts.worlds = args.worlds;
    }
    opts.reapIntervalSeconds = args.reapInterval;
    opts.statsIntervalSeconds = args.statsInterval;

    voxrelay::server::RelayServer server(opts);

    voxrelay::RelayEngine::Config config;
    config.tickRate = static_cast<float>(args.tickRate);
    config.logging = !args.quiet;
    config.minLevel = args.logLevel;

    voxrelay::RelayEngine engine(config);
    engine.set_transport(transport);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
#ifdef SIGUSR1
    std::signal(SIGUSR1, status_signal_handler);
#endif

    if (!args.quiet) {
        std::cout << "[INFO] Server started on port " << args.port << "\n";
        std::cout << "[INFO] Max clients: " << args.maxClients << "\n";
        std::cout << "[INFO] Tick rate: " << args.tickRate << " TPS\n";
        std::cout << "[INFO] Press Ctrl+C to stop\n\n";
    }

    // Run in background thread so we can check g_running
    std::thread serverThread([&]() {
        engine.run(server);
    });

    while (g_running && transport->is_running()) {
        if (g_statusRequested) {
            g_statusRequested = 0;
            engine.post([&]() {
                engine.log_info("Status: " + voxrelay::proto::to_json(server.status()));
            });
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    if (!args.quiet) {
        std::cout << "\n[INFO] Shutting down...\n";
    }

    // The loop thread sends server_shutdown before the transport goes away
    engine.stop();
    serverThread.join();
    transport->stop();

    if (!args.quiet) {
        std::cout << "[INFO] Server stopped\n";
    }
    return 0;
}
