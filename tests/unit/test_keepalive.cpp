// Eden HTTP Listener & Keep-Alive Tests

#include "../../src/core/http_listener.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <httplib.h>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <stdexcept>
#include <thread>

using namespace eden::core;
using namespace eden::http;

namespace {

/// Listener on an ephemeral loopback port, served by a small pool
class TestListener {
public:
    explicit TestListener(RequestHandler handler, ParserLimits limits = {})
        : pool_(2, 16, "test-conn"),
          listener_(ListenerConfig{.name = "test",
                                   .address = "127.0.0.1",
                                   .port = 0,
                                   .backlog = 16,
                                   .limits = limits,
                                   .idle_timeout = std::chrono::milliseconds(2000)},
                    std::move(handler), &pool_, &metrics_) {
        auto ec = listener_.start();
        if (ec) {
            throw std::runtime_error("listener start failed: " + ec.message());
        }
        thread_ = std::thread([this] { listener_.run(); });
    }

    ~TestListener() {
        listener_.stop();
        thread_.join();
        pool_.shutdown();
    }

    [[nodiscard]] uint16_t port() const { return listener_.port(); }
    [[nodiscard]] HttpListener& listener() { return listener_; }
    [[nodiscard]] eden::control::GatewayMetrics& metrics() { return metrics_; }

private:
    eden::control::GatewayMetrics metrics_;
    WorkerPool pool_;
    HttpListener listener_;
    std::thread thread_;
};

/// Blocking loopback client socket
class RawClient {
public:
    explicit RawClient(uint16_t port) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
            ::close(fd_);
            throw std::runtime_error("connect failed");
        }
        timeval tv{2, 0};
        ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    }

    ~RawClient() { ::close(fd_); }

    void send(std::string_view data) const {
        REQUIRE(::send(fd_, data.data(), data.size(), MSG_NOSIGNAL) == static_cast<ssize_t>(data.size()));
    }

    /// Read one response (headers plus Content-Length body); empty on EOF
    std::string read_response() {
        while (true) {
            auto header_end = buffer_.find("\r\n\r\n");
            if (header_end != std::string::npos) {
                size_t length = 0;
                auto pos = buffer_.find("Content-Length: ");
                if (pos != std::string::npos && pos < header_end) {
                    length = std::stoul(buffer_.substr(pos + 16));
                }
                size_t total = header_end + 4 + length;
                if (buffer_.size() >= total) {
                    std::string response = buffer_.substr(0, total);
                    buffer_.erase(0, total);
                    return response;
                }
            }

            char chunk[4096];
            ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
            if (n <= 0) {
                return {};
            }
            buffer_.append(chunk, static_cast<size_t>(n));
        }
    }

    /// True once the server has closed its side
    bool closed_by_peer() {
        char c;
        return ::recv(fd_, &c, 1, 0) == 0;
    }

private:
    int fd_ = -1;
    std::string buffer_;
};

RequestHandler echo_handler(std::atomic<int>& calls) {
    return [&calls](Request request, const CancellationToken&) -> std::optional<Response> {
        calls.fetch_add(1);
        Response response;
        response.set_content_type("text/plain");
        response.body = std::string(request.method_string()) + " " + request.uri;
        response.set_header("X-Client-IP", request.client_ip);
        return response;
    };
}

}  // namespace

TEST_CASE("Keep-alive serves several requests on one connection", "[keepalive][listener]") {
    std::atomic<int> calls{0};
    TestListener server(echo_handler(calls));

    RawClient client(server.port());
    client.send("GET /one HTTP/1.1\r\nHost: x\r\n\r\n");
    auto first = client.read_response();
    REQUIRE(first.starts_with("HTTP/1.1 200"));
    REQUIRE(first.find("Connection: keep-alive") != std::string::npos);
    REQUIRE(first.ends_with("GET /one"));
    REQUIRE(first.find("X-Client-IP: 127.0.0.1") != std::string::npos);

    client.send("POST /two?x=1 HTTP/1.1\r\nHost: x\r\nContent-Length: 3\r\n\r\nabc");
    auto second = client.read_response();
    REQUIRE(second.ends_with("POST /two?x=1"));

    REQUIRE(calls == 2);
    REQUIRE(server.metrics().snapshot().total_connections == 1);
}

TEST_CASE("Pipelined requests are answered in order", "[keepalive][listener]") {
    std::atomic<int> calls{0};
    TestListener server(echo_handler(calls));

    RawClient client(server.port());
    client.send("GET /a HTTP/1.1\r\nHost: x\r\n\r\nGET /b HTTP/1.1\r\nHost: x\r\n\r\n");

    REQUIRE(client.read_response().ends_with("GET /a"));
    REQUIRE(client.read_response().ends_with("GET /b"));
}

TEST_CASE("Connection: close ends the connection", "[keepalive][listener]") {
    std::atomic<int> calls{0};
    TestListener server(echo_handler(calls));

    RawClient client(server.port());
    client.send("GET /bye HTTP/1.1\r\nHost: x\r\nConnection: close\r\n\r\n");
    auto response = client.read_response();
    REQUIRE(response.find("Connection: close") != std::string::npos);
    REQUIRE(client.closed_by_peer());
}

TEST_CASE("HTTP/1.0 closes by default", "[keepalive][listener]") {
    std::atomic<int> calls{0};
    TestListener server(echo_handler(calls));

    RawClient client(server.port());
    client.send("GET /old HTTP/1.0\r\n\r\n");
    REQUIRE_FALSE(client.read_response().empty());
    REQUIRE(client.closed_by_peer());
}

TEST_CASE("Oversized and malformed requests", "[keepalive][listener]") {
    std::atomic<int> calls{0};
    TestListener server(echo_handler(calls), ParserLimits{1024, 16});

    SECTION("Body over the limit is 413") {
        RawClient client(server.port());
        client.send("POST /big HTTP/1.1\r\nHost: x\r\nContent-Length: 64\r\n\r\n" + std::string(64, 'x'));
        auto response = client.read_response();
        REQUIRE(response.starts_with("HTTP/1.1 413"));
        REQUIRE(response.find("Request too large") != std::string::npos);
        REQUIRE(client.closed_by_peer());
    }

    SECTION("Garbage is 400") {
        RawClient client(server.port());
        client.send("NOT AN HTTP REQUEST\r\n\r\n");
        auto response = client.read_response();
        REQUIRE(response.starts_with("HTTP/1.1 400"));
        REQUIRE(client.closed_by_peer());
    }

    REQUIRE(calls == 0);
}

TEST_CASE("Handler outcomes", "[keepalive][listener]") {
    TestListener server([](Request request, const CancellationToken&) -> std::optional<Response> {
        if (request.path == "/throw") {
            throw std::runtime_error("handler bug");
        }
        if (request.path == "/drop") {
            return std::nullopt;
        }
        return Response{};
    });

    SECTION("Exception becomes 500") {
        RawClient client(server.port());
        client.send("GET /throw HTTP/1.1\r\nHost: x\r\n\r\n");
        auto response = client.read_response();
        REQUIRE(response.starts_with("HTTP/1.1 500"));
        REQUIRE(client.closed_by_peer());
    }

    SECTION("No response closes silently") {
        RawClient client(server.port());
        client.send("GET /drop HTTP/1.1\r\nHost: x\r\n\r\n");
        REQUIRE(client.read_response().empty());
    }
}

TEST_CASE("Works with a regular HTTP client", "[keepalive][listener]") {
    std::atomic<int> calls{0};
    TestListener server(echo_handler(calls));

    httplib::Client client("127.0.0.1", server.port());
    client.set_keep_alive(true);

    for (int i = 0; i < 5; ++i) {
        auto res = client.Get("/ping");
        REQUIRE(res);
        REQUIRE(res->status == 200);
        REQUIRE(res->body == "GET /ping");
    }
    REQUIRE(calls == 5);
    REQUIRE(server.metrics().snapshot().total_connections == 1);
}

TEST_CASE("Stop closes idle keep-alive connections", "[keepalive][listener]") {
    std::atomic<int> calls{0};
    auto server = std::make_unique<TestListener>(echo_handler(calls));

    RawClient client(server->port());
    client.send("GET /x HTTP/1.1\r\nHost: x\r\n\r\n");
    REQUIRE_FALSE(client.read_response().empty());

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
    while (server->listener().open_connections() != 1 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    REQUIRE(server->listener().open_connections() == 1);

    server.reset();
    REQUIRE(client.closed_by_peer());
}

TEST_CASE("Aborting in-flight requests cancels their tokens", "[keepalive][listener]") {
    std::atomic<bool> started{false};
    std::atomic<bool> saw_cancel{false};
    std::atomic<bool> finished{false};

    TestListener server([&](Request, const CancellationToken& cancel) -> std::optional<Response> {
        started = true;
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!cancel.is_cancelled() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        saw_cancel = cancel.is_cancelled();
        finished = true;
        return std::nullopt;
    });

    RawClient client(server.port());
    client.send("GET /slow HTTP/1.1\r\nHost: x\r\n\r\n");

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!started && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    REQUIRE(started);

    // The client is still connected, so only the abort can cancel the token
    auto aborted_at = std::chrono::steady_clock::now();
    server.listener().abort_inflight();
    while (!finished && std::chrono::steady_clock::now() < aborted_at + std::chrono::seconds(2)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    REQUIRE(finished);
    REQUIRE(saw_cancel);
    REQUIRE(std::chrono::steady_clock::now() - aborted_at < std::chrono::seconds(1));
    REQUIRE(client.read_response().empty());
    REQUIRE_FALSE(server.listener().is_running());
}
