// Regmock Listener Tests
// Real loopback sockets against an ephemeral port

#include <catch2/catch_test_macros.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "../../src/api/dispatcher.hpp"
#include "../../src/core/logging.hpp"
#include "../../src/core/server.hpp"

using namespace regmock;

namespace {

control::Config make_config(bool concurrent = false, uint32_t max_workers = 64) {
    control::Config config;
    config.server.listen_port = 0;  // Ephemeral
    config.server.poll_interval_ms = 20;
    config.server.io_timeout_ms = 2000;
    config.server.max_request_size = 2048;
    config.server.concurrent_connections = concurrent;
    config.server.max_workers = max_workers;
    return config;
}

// Send raw bytes, read until the server closes the connection.
// No assertions here: also called from client threads. Empty on failure.
std::string exchange(uint16_t port, const std::string& raw) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return {};
    }

    timeval tv{2, 0};
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        close(fd);
        return {};
    }

    size_t sent = 0;
    while (sent < raw.size()) {
        ssize_t n = send(fd, raw.data() + sent, raw.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            break;  // Server may answer 413 and close before reading everything
        }
        sent += static_cast<size_t>(n);
    }

    std::string response;
    char buf[4096];
    ssize_t n;
    while ((n = recv(fd, buf, sizeof(buf), 0)) > 0) {
        response.append(buf, static_cast<size_t>(n));
    }
    close(fd);
    return response;
}

int status_of(const std::string& response) {
    // "HTTP/1.1 200 OK"
    if (response.size() < 12) {
        return 0;
    }
    return std::stoi(response.substr(9, 3));
}

std::string body_of(const std::string& response) {
    auto pos = response.find("\r\n\r\n");
    return pos == std::string::npos ? std::string{} : response.substr(pos + 4);
}

struct RunningServer {
    explicit RunningServer(bool concurrent = false, uint32_t max_workers = 64)
        : config(make_config(concurrent, max_workers)), state(config.mock), dispatcher(config, state),
          server(config, dispatcher) {
        auto ec = server.start();
        REQUIRE_FALSE(ec);
        REQUIRE(server.port() != 0);
        thread = std::thread([this] { server.run(); });
    }

    ~RunningServer() {
        server.stop();
        if (thread.joinable()) {
            thread.join();
        }
    }

    control::Config config;
    api::ServiceState state;
    api::Dispatcher dispatcher;
    core::Server server;
    std::thread thread;
};

}  // namespace

TEST_CASE("Listener answers over a real socket", "[server]") {
    RunningServer rs;

    std::string response =
        exchange(rs.server.port(), "GET /health HTTP/1.1\r\nHost: 127.0.0.1\r\n\r\n");

    REQUIRE(status_of(response) == 200);
    REQUIRE(response.find("Content-Type: application/json\r\n") != std::string::npos);
    REQUIRE(response.find("X-GitHub-Api-Version: 2022-11-28\r\n") != std::string::npos);
    REQUIRE(response.find("X-Request-Id: ") != std::string::npos);
    REQUIRE(response.find("Connection: close\r\n") != std::string::npos);

    auto body = nlohmann::json::parse(body_of(response));
    REQUIRE(body["status"] == "healthy");
    REQUIRE(body["registered_runners"] == 0);
}

TEST_CASE("Scenario: token flow over HTTP", "[server][scenario]") {
    RunningServer rs;
    uint16_t port = rs.server.port();

    REQUIRE(status_of(exchange(port,
                               "POST /orgs/acme/actions/runners/registration-token HTTP/1.1\r\n"
                               "Content-Length: 0\r\n\r\n")) == 401);

    std::string ok = exchange(port,
                              "POST /orgs/acme/actions/runners/registration-token HTTP/1.1\r\n"
                              "Authorization: Bearer ghp_test123\r\n"
                              "Content-Length: 0\r\n\r\n");
    REQUIRE(status_of(ok) == 200);
    std::string token = nlohmann::json::parse(body_of(ok))["token"];
    REQUIRE(token.starts_with("MOCK_REG_"));

    std::string body = R"({"name":"runner-01","labels":"self-hosted,linux"})";
    std::string reg = exchange(port, "POST /actions/runner-registration HTTP/1.1\r\n"
                                     "Authorization: RemoteAuth " + token + "\r\n"
                                     "Content-Type: application/json\r\n"
                                     "Content-Length: " + std::to_string(body.size()) +
                                     "\r\n\r\n" + body);
    REQUIRE(status_of(reg) == 201);

    auto list = nlohmann::json::parse(body_of(exchange(
        port, "GET /repos/acme/widgets/actions/runners?per_page=100 HTTP/1.1\r\n"
              "Authorization: Bearer ghp_test123\r\n\r\n")));
    REQUIRE(list["total_count"] == 1);
    REQUIRE(list["runners"][0]["name"] == "runner-01");

    REQUIRE(status_of(exchange(port, "POST /reset HTTP/1.1\r\nContent-Length: 0\r\n\r\n")) == 200);
    auto health = nlohmann::json::parse(body_of(exchange(port, "GET /health HTTP/1.1\r\n\r\n")));
    REQUIRE(health["registered_runners"] == 0);
    REQUIRE(health["request_count"] == 1);
}

TEST_CASE("Malformed and oversized requests", "[server][errors]") {
    RunningServer rs;
    uint16_t port = rs.server.port();

    SECTION("garbage request line is a 400 and is not counted") {
        std::string response = exchange(port, "THIS IS NOT HTTP\r\n\r\n");
        REQUIRE(status_of(response) == 400);
        REQUIRE(nlohmann::json::parse(body_of(response))["message"] == "Bad Request");
        REQUIRE(rs.state.request_count == 0);
    }

    SECTION("request larger than max_request_size is a 413") {
        std::string big(4096, 'x');
        std::string response =
            exchange(port, "POST /reset HTTP/1.1\r\nContent-Length: " +
                               std::to_string(big.size()) + "\r\n\r\n" + big);
        REQUIRE(status_of(response) == 413);
        REQUIRE(nlohmann::json::parse(body_of(response))["message"] == "Payload Too Large");
        REQUIRE(rs.state.request_count == 0);
    }

    SECTION("client closing without a request gets no answer") {
        int fd = socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        REQUIRE(connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        close(fd);

        // Listener is still serving
        REQUIRE(status_of(exchange(port, "GET /health HTTP/1.1\r\n\r\n")) == 200);
    }
}

TEST_CASE("Graceful stop", "[server][shutdown]") {
    auto config = make_config();
    api::ServiceState state(config.mock);
    api::Dispatcher dispatcher(config, state);
    core::Server server(config, dispatcher);
    REQUIRE_FALSE(server.start());

    SECTION("via stop()") {
        std::thread t([&server] { server.run(); });
        REQUIRE(status_of(exchange(server.port(), "GET /health HTTP/1.1\r\n\r\n")) == 200);

        auto before = std::chrono::steady_clock::now();
        server.stop();
        t.join();
        auto elapsed = std::chrono::steady_clock::now() - before;

        REQUIRE_FALSE(server.is_running());
        REQUIRE(elapsed < std::chrono::seconds(1));
        REQUIRE(server.connections_handled() == 1);
    }

    SECTION("via external flag") {
        std::atomic<bool> keep_running{true};
        std::thread t([&server, &keep_running] { server.run(&keep_running); });

        keep_running.store(false);
        t.join();
        REQUIRE_FALSE(server.is_running());
    }
}

TEST_CASE("Bind failure when the port is taken", "[server][bind]") {
    RunningServer first;

    auto config = make_config();
    config.server.listen_port = first.server.port();
    api::ServiceState state(config.mock);
    api::Dispatcher dispatcher(config, state);
    core::Server second(config, dispatcher);

    auto ec = second.start();
    REQUIRE(ec);
    REQUIRE(ec.value() == EADDRINUSE);
    REQUIRE_FALSE(second.is_running());
}

TEST_CASE("Concurrent connection mode", "[server][concurrency]") {
    RunningServer rs(true);
    uint16_t port = rs.server.port();

    constexpr int clients = 8;
    std::vector<std::thread> threads;
    std::atomic<int> ok{0};
    for (int i = 0; i < clients; ++i) {
        threads.emplace_back([port, &ok] {
            for (int j = 0; j < 5; ++j) {
                std::string response = exchange(port, "GET /health HTTP/1.1\r\n\r\n");
                if (response.starts_with("HTTP/1.1 200")) {
                    ok.fetch_add(1);
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(ok.load() == clients * 5);

    rs.server.stop();
    rs.thread.join();
    REQUIRE(rs.state.request_count == clients * 5);
}

TEST_CASE("Connections beyond the worker cap are served on the accept thread",
          "[server][concurrency]") {
    RunningServer rs(true, 1);
    uint16_t port = rs.server.port();

    constexpr int clients = 6;
    std::vector<std::thread> threads;
    std::atomic<int> ok{0};
    for (int i = 0; i < clients; ++i) {
        threads.emplace_back([port, &ok] {
            for (int j = 0; j < 3; ++j) {
                std::string response = exchange(port, "GET /health HTTP/1.1\r\n\r\n");
                if (response.starts_with("HTTP/1.1 200")) {
                    ok.fetch_add(1);
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(ok.load() == clients * 3);

    rs.server.stop();
    rs.thread.join();
    REQUIRE(rs.server.connections_handled() == clients * 3);
    REQUIRE(rs.state.request_count == clients * 3);
}

TEST_CASE("Chunked registration body over HTTP", "[server][scenario]") {
    RunningServer rs;
    uint16_t port = rs.server.port();

    std::string ok = exchange(port,
                              "POST /orgs/acme/actions/runners/registration-token HTTP/1.1\r\n"
                              "Authorization: Bearer ghp_test123\r\n"
                              "Content-Length: 0\r\n\r\n");
    REQUIRE(status_of(ok) == 200);
    std::string token = nlohmann::json::parse(body_of(ok))["token"];

    // {"name":"chunked-01"} split across two chunks
    std::string reg = exchange(port, "POST /actions/runner-registration HTTP/1.1\r\n"
                                     "Authorization: RemoteAuth " + token + "\r\n"
                                     "Content-Type: application/json\r\n"
                                     "Transfer-Encoding: chunked\r\n\r\n"
                                     "8\r\n{\"name\":\r\n"
                                     "d\r\n\"chunked-01\"}\r\n"
                                     "0\r\n\r\n");
    REQUIRE(status_of(reg) == 201);
    REQUIRE(nlohmann::json::parse(body_of(reg))["name"] == "chunked-01");

    auto list = nlohmann::json::parse(body_of(exchange(
        port, "GET /orgs/acme/actions/runners HTTP/1.1\r\n"
              "Authorization: Bearer ghp_test123\r\n\r\n")));
    REQUIRE(list["total_count"] == 1);
    REQUIRE(list["runners"][0]["name"] == "chunked-01");
}
