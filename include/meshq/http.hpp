/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

#include "meshq/config.hpp"

namespace boost {
namespace asio {
class io_context;
class thread_pool;
}
}

namespace meshq {

class Service;
class Listener;

// HTTP and WebSocket front end:
//   GET  /              index page from the web root
//   POST /upload        submit an STL file
//   GET  /ws            notification channel
//   GET  /output/<name> rendered images
class HttpServer final {
public:
    HttpServer(Service& service, const Config& config);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;
    HttpServer(HttpServer&&) = delete;
    HttpServer& operator=(HttpServer&&) = delete;

    [[nodiscard]] bool start();

    // Joins the I/O threads and the registration pool, then destroys the
    // io_context. A registration blocked on a full queue only returns once
    // the queue is closed, and the worker still writes to sessions, so
    // close the queue and stop the service first.
    void shutdown() noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    // Bound port; differs from the configured one when that was 0.
    [[nodiscard]] std::uint16_t port() const noexcept { return boundPort_; }

private:
    Service& service_;
    Config config_;

    std::unique_ptr<boost::asio::io_context> ioc_;
    std::unique_ptr<boost::asio::thread_pool> blocking_;
    std::shared_ptr<Listener> listener_;
    std::vector<std::thread> ioThreads_;

    std::atomic<bool> running_{false};
    std::uint16_t boundPort_ = 0;
};

}
