/*
 * meshq - Render daemon (meshqd)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "meshq/config.hpp"
#include "meshq/http.hpp"
#include "meshq/logger.hpp"
#include "meshq/render.hpp"
#include "meshq/service.hpp"
#include <iostream>
#include <chrono>
#include <thread>
#include <csignal>
#include <cstdlib>
#include <limits>
#include <memory>
#include <optional>
#include <string>

using namespace meshq;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [workspace] [options]\n"
              << "\n"
              << "Options:\n"
              << "  --host <addr>          listen address (default 0.0.0.0)\n"
              << "  -p, --port <n>         listen port (default 8080, 0 = any)\n"
              << "  --web-root <dir>       directory holding index.html (default templates)\n"
              << "  -q, --queue <n>        work queue capacity (default 100)\n"
              << "  --max-upload <bytes>   largest accepted upload (default 64 MiB)\n"
              << "  --pending-ttl <sec>    drop jobs never claimed by a channel (default 600)\n"
              << "  --io-threads <n>       HTTP/WebSocket threads (default 2)\n"
              << "  --size <w>x<h>         render size (default 1024x1024)\n"
              << "  --log-level <level>    error, warn, info, debug, trace\n"
              << "  -h, --help             show this help\n"
              << "  -v, --version          show version\n"
              << "\n"
              << "Environment: MESHQ_HOST, MESHQ_PORT, MESHQ_WORKSPACE, MESHQ_WEB_ROOT,\n"
              << "  MESHQ_QUEUE_CAPACITY, MESHQ_MAX_UPLOAD, MESHQ_PENDING_TTL,\n"
              << "  MESHQ_IO_THREADS, MESHQ_RENDER_WIDTH, MESHQ_RENDER_HEIGHT, MESHQ_LOG_LEVEL\n";
}

std::optional<unsigned long long> parseCount(const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        return std::stoull(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool parseSize(const std::string& value, int& width, int& height) {
    auto sep = value.find('x');
    std::string w = sep == std::string::npos ? value : value.substr(0, sep);
    std::string h = sep == std::string::npos ? value : value.substr(sep + 1);
    auto pw = parseCount(w);
    auto ph = parseCount(h);
    if (!pw || !ph || *pw == 0 || *ph == 0 || *pw > kMaxRenderSize || *ph > kMaxRenderSize) {
        return false;
    }
    width = static_cast<int>(*pw);
    height = static_cast<int>(*ph);
    return true;
}

// Returns an exit code when the process should stop without running.
std::optional<int> parseArgs(int argc, char* argv[], Config& config) {
    bool workspaceSet = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " needs a value\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };
        auto count = [&](unsigned long long min, unsigned long long max) -> std::optional<unsigned long long> {
            auto value = next();
            if (!value) {
                return std::nullopt;
            }
            auto parsed = parseCount(*value);
            if (!parsed || *parsed < min || *parsed > max) {
                std::cerr << "Error: Invalid value for " << arg << ": " << *value << "\n";
                return std::nullopt;
            }
            return parsed;
        };

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        } else if (arg == "--host") {
            auto value = next();
            if (!value) return 1;
            config.host = *value;
        } else if (arg == "-p" || arg == "--port") {
            auto value = count(0, std::numeric_limits<std::uint16_t>::max());
            if (!value) return 1;
            config.port = static_cast<std::uint16_t>(*value);
        } else if (arg == "--web-root") {
            auto value = next();
            if (!value) return 1;
            config.webRoot = *value;
        } else if (arg == "-q" || arg == "--queue") {
            auto value = count(1, std::numeric_limits<std::size_t>::max());
            if (!value) return 1;
            config.queueCapacity = static_cast<std::size_t>(*value);
        } else if (arg == "--max-upload") {
            auto value = count(1, std::numeric_limits<std::size_t>::max());
            if (!value) return 1;
            config.maxUploadBytes = static_cast<std::size_t>(*value);
        } else if (arg == "--pending-ttl") {
            auto value = count(1, std::numeric_limits<int>::max());
            if (!value) return 1;
            config.pendingTtl = std::chrono::seconds(*value);
        } else if (arg == "--io-threads") {
            auto value = count(1, 256);
            if (!value) return 1;
            config.ioThreads = static_cast<int>(*value);
        } else if (arg == "--size") {
            auto value = next();
            if (!value) return 1;
            if (!parseSize(*value, config.renderWidth, config.renderHeight)) {
                std::cerr << "Error: Invalid render size: " << *value << "\n";
                return 1;
            }
        } else if (arg == "--log-level") {
            auto value = next();
            if (!value) return 1;
            auto level = Logger::parseLevel(*value);
            if (!level) {
                std::cerr << "Error: Unknown log level: " << *value << "\n";
                return 1;
            }
            Logger::setLevel(*level);
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        } else if (!workspaceSet) {
            config.workspace = arg;
            workspaceSet = true;
        } else {
            std::cerr << "Error: Unexpected argument: " << arg << "\n";
            return 1;
        }
    }
    return std::nullopt;
}

int main(int argc, char* argv[]) {
    Config config = Config::fromEnv();
    if (auto exitCode = parseArgs(argc, argv, config)) {
        return *exitCode;
    }

    setThreadName("Main");
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        RenderOptions options;
        options.width = config.renderWidth;
        options.height = config.renderHeight;

        Service service(config, std::make_unique<StlRenderer>(config.workspace, config.outputDir(), options));
        if (!service.init()) {
            LOG_ERROR("Initialization failed for workspace " + config.workspace.string());
            return 1;
        }
        if (!service.start()) {
            LOG_ERROR("Failed to start service");
            return 1;
        }

        HttpServer http(service, config);
        if (!http.start()) {
            service.shutdown();
            return 1;
        }

        LOG_INFO("meshq " + std::string(VERSION) + " serving workspace " + config.workspace.string() +
                 " (queue " + std::to_string(config.queueCapacity) + ", render " +
                 std::to_string(config.renderWidth) + "x" + std::to_string(config.renderHeight) + ")");

        auto lastSweep = std::chrono::steady_clock::now();
        while (!g_shutdown_requested && http.isRunning() && service.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            auto now = std::chrono::steady_clock::now();
            if (now - lastSweep >= std::chrono::seconds(10)) {
                service.expirePending();
                lastSweep = now;
            }
        }

        if (g_shutdown_requested) {
            LOG_INFO("Shutdown requested, stopping server...");
        }

        // Closing the queue first releases registrations blocked on a full
        // queue. The worker is joined while the sessions it notifies still
        // have a live io_context.
        service.queue().close();
        service.shutdown();
        http.shutdown();

    } catch (const std::exception& e) {
        LOG_ERROR("Server error: " + std::string(e.what()));
        return 1;
    }

    LOG_INFO("meshq daemon stopped");
    return 0;
}
