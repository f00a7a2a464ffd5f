/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "meshq/fingerprint.hpp"
#include "meshq/http.hpp"
#include "meshq/service.hpp"
#include "test_util.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

using namespace meshq;
using meshq::test::FakeTransformer;
using meshq::test::TempDir;
using meshq::test::parseJson;

class HttpServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.workspace = dir_.path();
        config_.host = "127.0.0.1";
        config_.port = 0;
        config_.webRoot = dir_.path() / "web";
        config_.maxUploadBytes = 4096;
        std::filesystem::create_directories(config_.webRoot);
        meshq::test::writeFile(config_.webRoot / "index.html", "<html>meshq</html>");

        auto transformer = std::make_unique<FakeTransformer>(dir_.path());
        transformer_ = transformer.get();
        service_ = std::make_unique<Service>(config_, std::move(transformer));
        ASSERT_TRUE(service_->init());
        ASSERT_TRUE(service_->start());

        http_ = std::make_unique<HttpServer>(*service_, config_);
        ASSERT_TRUE(http_->start());
        ASSERT_NE(http_->port(), 0);
    }

    void TearDown() override {
        if (transformer_) {
            transformer_->release();
        }
        if (service_) {
            service_->queue().close();
            service_->shutdown();
        }
        if (http_) {
            http_->shutdown();
        }
    }

    tcp::endpoint endpoint() const {
        return tcp::endpoint(net::ip::make_address("127.0.0.1"), http_->port());
    }

    http::response<http::string_body> request(http::verb verb, const std::string& target,
                                              const std::string& body = "",
                                              const std::string& contentType = "") {
        net::io_context ioc;
        tcp::socket socket(ioc);
        socket.connect(endpoint());

        http::request<http::string_body> req{verb, target, 11};
        req.set(http::field::host, "127.0.0.1");
        req.keep_alive(false);
        if (!contentType.empty()) {
            req.set(http::field::content_type, contentType);
        }
        if (verb == http::verb::post) {
            req.body() = body;
            req.prepare_payload();
        }
        http::write(socket, req);

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        http::read(socket, buffer, res);

        beast::error_code ec;
        socket.shutdown(tcp::socket::shutdown_both, ec);
        return res;
    }

    TempDir dir_;
    Config config_;
    FakeTransformer* transformer_ = nullptr;
    std::unique_ptr<Service> service_;
    std::unique_ptr<HttpServer> http_;
};

TEST_F(HttpServerTest, ServesIndexPage) {
    auto res = request(http::verb::get, "/");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "<html>meshq</html>");
    EXPECT_EQ(std::string(res[http::field::content_type]), "text/html");
}

TEST_F(HttpServerTest, UnknownRoutesAndMethods) {
    EXPECT_EQ(request(http::verb::get, "/nope").result(), http::status::not_found);
    EXPECT_EQ(request(http::verb::get, "/upload").result(), http::status::method_not_allowed);
    EXPECT_EQ(request(http::verb::delete_, "/").result(), http::status::method_not_allowed);
}

TEST_F(HttpServerTest, RejectsTraversalInOutputNames) {
    EXPECT_EQ(request(http::verb::get, "/output/..").result(), http::status::bad_request);
    EXPECT_EQ(request(http::verb::get, "/output/a/../../file_hashes.json").result(), http::status::bad_request);
    EXPECT_EQ(request(http::verb::get, "/output/missing.png").result(), http::status::not_found);
}

TEST_F(HttpServerTest, RejectsEmptyAndOversizedUploads) {
    auto empty = request(http::verb::post, "/upload", "", "application/octet-stream");
    EXPECT_EQ(empty.result(), http::status::bad_request);
    EXPECT_TRUE(parseJson(empty.body()).isMember("error"));

    auto large = request(http::verb::post, "/upload", std::string(8192, 'x'), "application/octet-stream");
    EXPECT_EQ(large.result(), http::status::payload_too_large);
}

TEST_F(HttpServerTest, MultipartWithoutFileFieldIsRejected) {
    std::string body = "--b\r\nContent-Disposition: form-data; name=\"other\"\r\n\r\nx\r\n--b--\r\n";
    auto res = request(http::verb::post, "/upload", body, "multipart/form-data; boundary=b");
    EXPECT_EQ(res.result(), http::status::bad_request);
}

TEST_F(HttpServerTest, UploadNotifyDownloadThenCacheHit) {
    const std::string content = "solid web\nendsolid web\n";
    std::string body = "--XyZ\r\n"
                       "Content-Disposition: form-data; name=\"file\"; filename=\"web.stl\"\r\n"
                       "Content-Type: application/octet-stream\r\n"
                       "\r\n" + content + "\r\n--XyZ--\r\n";

    auto uploaded = request(http::verb::post, "/upload", body, "multipart/form-data; boundary=XyZ");
    ASSERT_EQ(uploaded.result(), http::status::ok);
    auto queued = parseJson(uploaded.body());
    ASSERT_EQ(queued["status"].asString(), "queued");
    std::string jobId = queued["job"].asString();
    std::string outputRef = queued["output"].asString();
    EXPECT_FALSE(jobId.empty());
    EXPECT_EQ(outputRef, outputRefFor(fingerprint(content)));

    {
        net::io_context ioc;
        websocket::stream<tcp::socket> ws(ioc);
        ws.next_layer().connect(endpoint());
        ws.handshake("127.0.0.1", "/ws");
        ws.write(net::buffer(jobId));

        beast::flat_buffer buffer;
        ws.read(buffer);
        auto processing = parseJson(beast::buffers_to_string(buffer.data()));
        buffer.consume(buffer.size());
        ws.read(buffer);
        auto complete = parseJson(beast::buffers_to_string(buffer.data()));

        EXPECT_EQ(processing["status"].asString(), "processing");
        EXPECT_EQ(processing["job"].asString(), jobId);
        EXPECT_EQ(complete["status"].asString(), "complete");
        EXPECT_EQ(complete["url"].asString(), "/output/" + outputRef);

        ws.close(websocket::close_code::normal);
    }

    auto image = request(http::verb::get, "/output/" + outputRef);
    EXPECT_EQ(image.result(), http::status::ok);
    EXPECT_EQ(image.body(), content);
    EXPECT_EQ(std::string(image[http::field::content_type]), "image/png");

    auto again = request(http::verb::post, "/upload", content, "application/octet-stream");
    ASSERT_EQ(again.result(), http::status::ok);
    auto cached = parseJson(again.body());
    EXPECT_EQ(cached["status"].asString(), "cached");
    EXPECT_EQ(cached["output"].asString(), outputRef);
    EXPECT_EQ(cached["url"].asString(), "/output/" + outputRef);
    EXPECT_FALSE(cached.isMember("job"));
}

TEST_F(HttpServerTest, WebSocketRejectsUnknownJob) {
    net::io_context ioc;
    websocket::stream<tcp::socket> ws(ioc);
    ws.next_layer().connect(endpoint());
    ws.handshake("127.0.0.1", "/ws");
    ws.write(net::buffer(std::string("not-a-real-job")));

    beast::flat_buffer buffer;
    ws.read(buffer);
    auto reply = parseJson(beast::buffers_to_string(buffer.data()));
    EXPECT_EQ(reply["status"].asString(), "error");

    ws.close(websocket::close_code::normal);
}

TEST_F(HttpServerTest, InFlightJobIsDeliveredWhileStopping) {
    transformer_->gate();
    auto uploaded = request(http::verb::post, "/upload", "solid late\nendsolid late\n",
                            "application/octet-stream");
    ASSERT_EQ(uploaded.result(), http::status::ok);
    std::string jobId = parseJson(uploaded.body())["job"].asString();

    net::io_context ioc;
    websocket::stream<tcp::socket> ws(ioc);
    ws.next_layer().connect(endpoint());
    ws.handshake("127.0.0.1", "/ws");
    ws.write(net::buffer(jobId));
    ASSERT_TRUE(transformer_->waitForCalls(1));

    beast::flat_buffer buffer;
    ws.read(buffer);
    EXPECT_EQ(parseJson(beast::buffers_to_string(buffer.data()))["status"].asString(), "processing");
    buffer.consume(buffer.size());

    // Stop the service with the job still inside the transformer.
    std::thread stopper([this] {
        service_->queue().close();
        service_->shutdown();
    });
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!service_->queue().isClosed() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    transformer_->release();
    stopper.join();

    ASSERT_TRUE(http_->isRunning());
    ws.read(buffer);
    auto complete = parseJson(beast::buffers_to_string(buffer.data()));
    EXPECT_EQ(complete["status"].asString(), "complete");
    EXPECT_EQ(complete["job"].asString(), jobId);

    ws.close(websocket::close_code::normal);
    http_->shutdown();
}
