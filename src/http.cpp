/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "meshq/http.hpp"
#include "meshq/channel.hpp"
#include "meshq/logger.hpp"
#include "meshq/multipart.hpp"
#include "meshq/notification.hpp"
#include "meshq/service.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/optional.hpp>
#include <json/json.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <deque>
#include <string>
#include <tuple>
#include <utility>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace meshq {

namespace {
constexpr const char* kServerName = "meshq";
constexpr std::size_t kMultipartOverhead = 64 * 1024;
constexpr auto kReadTimeout = std::chrono::seconds(60);

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

Response jsonResponse(unsigned version, bool keepAlive, http::status status, const Json::Value& body) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";

    Response res{status, version};
    res.set(http::field::server, kServerName);
    res.set(http::field::content_type, "application/json");
    res.keep_alive(keepAlive);
    res.body() = Json::writeString(builder, body);
    res.prepare_payload();
    return res;
}

Response jsonError(const Request& req, http::status status, const std::string& message) {
    Json::Value body(Json::objectValue);
    body["error"] = message;
    return jsonResponse(req.version(), req.keep_alive(), status, body);
}

const char* mimeType(const std::string& name) {
    auto dot = name.rfind('.');
    std::string ext = dot == std::string::npos ? "" : name.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".png")  return "image/png";
    if (ext == ".html" || ext == ".htm") return "text/html";
    if (ext == ".css")  return "text/css";
    if (ext == ".js")   return "application/javascript";
    if (ext == ".json") return "application/json";
    return "application/octet-stream";
}

// Plain file name only: no separators, no parent references.
bool isSafeName(const std::string& name) {
    if (name.empty() || name == "." || name.find("..") != std::string::npos) {
        return false;
    }
    return name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

http::status statusFor(SubmissionError error) {
    switch (error) {
        case SubmissionError::EmptyContent: return http::status::bad_request;
        case SubmissionError::TooLarge:     return http::status::payload_too_large;
        case SubmissionError::IoError:
        default:
            return http::status::internal_server_error;
    }
}
}

// One WebSocket connection. Reads run on the session strand, inbound
// frames are handed to the blocking pool (registration may wait on a full
// queue), outbound frames are queued back onto the strand.
class WsSession final : public ChannelTransport,
                        public std::enable_shared_from_this<WsSession> {
public:
    WsSession(tcp::socket&& socket, Service& service, net::thread_pool& blocking)
        : ws_(std::move(socket)), service_(service), blocking_(blocking) {
    }

    void run(Request req) {
        net::dispatch(ws_.get_executor(),
            beast::bind_front_handler(&WsSession::doAccept, shared_from_this(), std::move(req)));
    }

    bool sendText(const std::string& text) override {
        if (closing_.load()) {
            return false;
        }
        net::post(ws_.get_executor(),
            beast::bind_front_handler(&WsSession::queueFrame, shared_from_this(), text));
        return true;
    }

    void close() noexcept override {
        try {
            net::post(ws_.get_executor(),
                beast::bind_front_handler(&WsSession::requestClose, shared_from_this()));
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to schedule WebSocket close: " + std::string(e.what()));
        }
    }

private:
    void doAccept(Request req) {
        beast::get_lowest_layer(ws_).expires_never();
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
            res.set(http::field::server, kServerName);
        }));
        ws_.async_accept(req, beast::bind_front_handler(&WsSession::onAccept, shared_from_this()));
    }

    void onAccept(beast::error_code ec) {
        if (ec) {
            LOG_WARN("WebSocket upgrade failed: " + ec.message());
            return;
        }
        channel_ = std::make_shared<Channel>(service_, weak_from_this());
        doRead();
    }

    void doRead() {
        ws_.async_read(buffer_, beast::bind_front_handler(&WsSession::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec) {
            if (ec != websocket::error::closed) {
                LOG_DEBUG("WebSocket read ended: " + ec.message());
            }
            closing_.store(true);
            channel_->onClosed();
            return;
        }

        std::string text = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());

        auto channel = channel_;
        net::post(blocking_, [channel, text = std::move(text)]() {
            channel->onMessage(text);
        });
        doRead();
    }

    void queueFrame(std::string text) {
        if (closing_.load()) {
            return;
        }
        outbox_.push_back(std::move(text));
        if (outbox_.size() > 1) {
            return;
        }
        doWrite();
    }

    void doWrite() {
        ws_.text(true);
        ws_.async_write(net::buffer(outbox_.front()),
            beast::bind_front_handler(&WsSession::onWrite, shared_from_this()));
    }

    void onWrite(beast::error_code ec, std::size_t) {
        if (ec) {
            LOG_WARN("WebSocket write failed: " + ec.message());
            closing_.store(true);
            outbox_.clear();
            channel_->onClosed();
            return;
        }
        outbox_.pop_front();
        if (!outbox_.empty()) {
            doWrite();
        } else if (closeRequested_) {
            doClose();
        }
    }

    void requestClose() {
        closeRequested_ = true;
        if (outbox_.empty()) {
            doClose();
        }
    }

    void doClose() {
        if (closing_.exchange(true)) {
            return;
        }
        ws_.async_close(websocket::close_code::normal,
            beast::bind_front_handler(&WsSession::onClose, shared_from_this()));
    }

    void onClose(beast::error_code ec) {
        if (ec) {
            LOG_DEBUG("WebSocket close failed: " + ec.message());
        }
        if (channel_) {
            channel_->onClosed();
        }
    }

    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    Service& service_;
    net::thread_pool& blocking_;
    std::shared_ptr<Channel> channel_;
    std::deque<std::string> outbox_;
    std::atomic<bool> closing_{false};
    bool closeRequested_ = false;
};

class HttpSession final : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket&& socket, Service& service, const Config& config, net::thread_pool& blocking)
        : stream_(std::move(socket)), service_(service), config_(config), blocking_(blocking) {
    }

    void run() {
        net::dispatch(stream_.get_executor(),
            beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
    }

private:
    void doRead() {
        parser_.emplace();
        parser_->body_limit(config_.maxUploadBytes + kMultipartOverhead);
        stream_.expires_after(kReadTimeout);
        http::async_read(stream_, buffer_, *parser_,
            beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            doClose();
            return;
        }
        if (ec == http::error::body_limit) {
            LOG_WARN("Rejected upload over " + std::to_string(config_.maxUploadBytes) + " bytes");
            Json::Value body(Json::objectValue);
            body["error"] = "File exceeds maximum size";
            send(jsonResponse(11, false, http::status::payload_too_large, body));
            return;
        }
        if (ec) {
            LOG_DEBUG("HTTP read failed: " + ec.message());
            return;
        }

        Request req = parser_->release();
        if (websocket::is_upgrade(req)) {
            if (req.target() == "/ws") {
                std::make_shared<WsSession>(stream_.release_socket(), service_, blocking_)->run(std::move(req));
                return;
            }
            send(jsonError(req, http::status::not_found, "Not found"));
            return;
        }
        handle(std::move(req));
    }

    void handle(Request&& req) {
        std::string target(req.target());
        auto query = target.find('?');
        if (query != std::string::npos) {
            target.erase(query);
        }
        LOG_DEBUG(std::string(req.method_string()) + " " + target);

        if (target == "/upload") {
            if (req.method() != http::verb::post) {
                send(jsonError(req, http::status::method_not_allowed, "Invalid request method"));
                return;
            }
            handleUpload(req);
            return;
        }

        if (req.method() != http::verb::get) {
            send(jsonError(req, http::status::method_not_allowed, "Invalid request method"));
            return;
        }

        if (target == "/" || target == "/index.html") {
            serveFile(req, config_.webRoot / "index.html", "text/html");
            return;
        }

        const std::string outputPrefix = "/output/";
        if (target.rfind(outputPrefix, 0) == 0) {
            std::string name = target.substr(outputPrefix.size());
            if (!isSafeName(name)) {
                send(jsonError(req, http::status::bad_request, "Invalid file name"));
                return;
            }
            serveFile(req, config_.outputDir() / name, mimeType(name));
            return;
        }

        send(jsonError(req, http::status::not_found, "Not found"));
    }

    void handleUpload(Request& req) {
        std::string contentType(req[http::field::content_type]);
        std::string content;
        if (multipartBoundary(contentType)) {
            auto part = extractMultipartField(contentType, req.body(), "file");
            if (!part) {
                send(jsonError(req, http::status::bad_request, "Failed to read file"));
                return;
            }
            content = std::move(*part);
        } else {
            content = std::move(req.body());
        }

        SubmitResult result = service_.submit(content);
        if (!result) {
            send(jsonError(req, statusFor(result.error), result.message));
            return;
        }

        Json::Value body(Json::objectValue);
        body["output"] = result.outputRef;
        if (result.status == SubmitStatus::Cached) {
            body["status"] = "cached";
            body["url"] = outputUrl(result.outputRef);
            body["message"] = "This file has already been processed.";
        } else {
            body["status"] = "queued";
            body["job"] = result.job.id;
            body["input"] = result.job.inputRef;
            body["message"] = "Open /ws and send the job id to start processing.";
        }
        send(jsonResponse(req.version(), req.keep_alive(), http::status::ok, body));
    }

    void serveFile(const Request& req, const std::filesystem::path& path, const char* mime) {
        beast::error_code ec;
        http::file_body::value_type body;
        body.open(path.string().c_str(), beast::file_mode::scan, ec);
        if (ec == beast::errc::no_such_file_or_directory) {
            send(jsonError(req, http::status::not_found, "File not found"));
            return;
        }
        if (ec) {
            LOG_WARN("Cannot open " + path.string() + ": " + ec.message());
            send(jsonError(req, http::status::internal_server_error, "Could not read file"));
            return;
        }

        auto const size = body.size();
        http::response<http::file_body> res{
            std::piecewise_construct,
            std::make_tuple(std::move(body)),
            std::make_tuple(http::status::ok, req.version())};
        res.set(http::field::server, kServerName);
        res.set(http::field::content_type, mime);
        res.content_length(size);
        res.keep_alive(req.keep_alive());
        send(std::move(res));
    }

    template <class Body>
    void send(http::response<Body>&& msg) {
        auto sp = std::make_shared<http::response<Body>>(std::move(msg));
        res_ = sp;
        http::async_write(stream_, *sp,
            beast::bind_front_handler(&HttpSession::onWrite, shared_from_this(), sp->need_eof()));
    }

    void onWrite(bool close, beast::error_code ec, std::size_t) {
        if (ec) {
            LOG_DEBUG("HTTP write failed: " + ec.message());
            return;
        }
        if (close) {
            doClose();
            return;
        }
        res_ = nullptr;
        doRead();
    }

    void doClose() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    boost::optional<http::request_parser<http::string_body>> parser_;
    std::shared_ptr<void> res_;
    Service& service_;
    const Config& config_;
    net::thread_pool& blocking_;
};

class Listener final : public std::enable_shared_from_this<Listener> {
public:
    Listener(net::io_context& ioc, Service& service, const Config& config, net::thread_pool& blocking)
        : ioc_(ioc), acceptor_(net::make_strand(ioc)), service_(service),
          config_(config), blocking_(blocking) {
    }

    bool open(const tcp::endpoint& endpoint, beast::error_code& ec) {
        acceptor_.open(endpoint.protocol(), ec);
        if (ec) return false;
        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) return false;
        acceptor_.bind(endpoint, ec);
        if (ec) return false;
        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        return !ec;
    }

    [[nodiscard]] std::uint16_t port() const {
        beast::error_code ec;
        auto endpoint = acceptor_.local_endpoint(ec);
        return ec ? 0 : endpoint.port();
    }

    void run() {
        doAccept();
    }

private:
    void doAccept() {
        acceptor_.async_accept(net::make_strand(ioc_),
            beast::bind_front_handler(&Listener::onAccept, shared_from_this()));
    }

    void onAccept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec == net::error::operation_aborted) {
                return;
            }
            LOG_WARN("Accept failed: " + ec.message());
        } else {
            std::make_shared<HttpSession>(std::move(socket), service_, config_, blocking_)->run();
        }
        doAccept();
    }

    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    Service& service_;
    const Config& config_;
    net::thread_pool& blocking_;
};

HttpServer::HttpServer(Service& service, const Config& config)
    : service_(service), config_(config) {
    LOG_DEBUG("HTTP server created for " + config_.host + ":" + std::to_string(config_.port));
}

HttpServer::~HttpServer() {
    shutdown();
}

bool HttpServer::start() {
    if (running_.load()) {
        LOG_WARN("HTTP server already running");
        return false;
    }

    int threads = std::max(1, config_.ioThreads);
    try {
        ioc_ = std::make_unique<net::io_context>(threads);
        blocking_ = std::make_unique<net::thread_pool>(static_cast<std::size_t>(std::max(2, threads)));
        listener_ = std::make_shared<Listener>(*ioc_, service_, config_, *blocking_);

        beast::error_code ec;
        auto address = net::ip::make_address(config_.host, ec);
        if (ec) {
            LOG_ERROR("Invalid listen address " + config_.host + ": " + ec.message());
            shutdown();
            return false;
        }
        if (!listener_->open(tcp::endpoint{address, config_.port}, ec)) {
            LOG_ERROR("Failed to listen on " + config_.host + ":" + std::to_string(config_.port) +
                      ": " + ec.message());
            shutdown();
            return false;
        }
        boundPort_ = listener_->port();
        listener_->run();

        running_.store(true);
        ioThreads_.reserve(threads);
        for (int i = 0; i < threads; ++i) {
            ioThreads_.emplace_back([this, i] {
                setThreadName("IO-" + std::to_string(i));
                for (;;) {
                    try {
                        ioc_->run();
                        break;
                    } catch (const std::exception& e) {
                        LOG_ERROR("I/O thread error: " + std::string(e.what()));
                    }
                }
            });
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start HTTP server: " + std::string(e.what()));
        shutdown();
        return false;
    }

    LOG_INFO("Server started at http://" + config_.host + ":" + std::to_string(boundPort_));
    return true;
}

void HttpServer::shutdown() noexcept {
    bool wasRunning = running_.exchange(false);
    if (!wasRunning && !ioc_) {
        return;
    }

    LOG_INFO("Stopping HTTP server...");
    if (ioc_) {
        ioc_->stop();
    }
    for (auto& thread : ioThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    ioThreads_.clear();

    if (blocking_) {
        blocking_->stop();
        blocking_->join();
    }

    // Pending handlers own the sessions; destroy them while Service is alive.
    listener_.reset();
    ioc_.reset();
    blocking_.reset();
    LOG_INFO("HTTP server stopped");
}

}
