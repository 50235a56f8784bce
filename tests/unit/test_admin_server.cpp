// vcadmin Admin Server Tests

#include "../../src/core/admin_server.hpp"
#include "../../src/core/logging.hpp"
#include "../../src/core/socket.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace vcadmin;
using vcadmin::http::Method;
using vcadmin::http::Request;
using vcadmin::http::Response;
using vcadmin::http::StatusCode;

namespace {

constexpr const char* kKey = "admin-test-key";

control::Config test_config() {
    control::Config config;
    config.server.listen_address = "127.0.0.1";
    config.server.listen_port = 0;
    config.server.read_timeout_ms = 2000;
    config.admin.api_key = kKey;
    config.openapi.label = "test-agent";
    return config;
}

Request make_request(Method method, std::string_view path, bool with_key = true) {
    Request req;
    req.method = method;
    req.uri = path;
    req.path = path;
    if (with_key) {
        req.headers.push_back({"x-api-key", kKey});
    }
    return req;
}

struct RawReply {
    int status = 0;
    std::string head;
    std::string body;
};

/// Send a raw request to 127.0.0.1:port and read until the server closes
RawReply exchange(uint16_t port, const std::string& raw) {
    RawReply reply;

    int fd = socket(AF_INET, SOCK_STREAM, 0);
    REQUIRE(fd >= 0);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        close(fd);
        return reply;
    }

    REQUIRE_FALSE(core::send_all(fd, raw));

    std::string data;
    char buf[4096];
    ssize_t n;
    while ((n = recv(fd, buf, sizeof(buf), 0)) > 0) {
        data.append(buf, static_cast<size_t>(n));
    }
    close(fd);

    auto split = data.find("\r\n\r\n");
    if (data.size() < 12 || split == std::string::npos) {
        return reply;
    }
    reply.status = std::stoi(data.substr(9, 3));
    reply.head = data.substr(0, split);
    reply.body = data.substr(split + 4);
    return reply;
}

std::string get(std::string_view path, std::string_view key = kKey) {
    std::string raw = "GET " + std::string(path) + " HTTP/1.1\r\nHost: localhost\r\n";
    if (!key.empty()) {
        raw += "x-api-key: " + std::string(key) + "\r\n";
    }
    return raw + "\r\n";
}

/// Connected socket to 127.0.0.1:port, or -1
int open_connection(uint16_t port) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return -1;
    }
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        close(fd);
        return -1;
    }
    return fd;
}

bool can_connect(uint16_t port) {
    int fd = open_connection(port);
    if (fd < 0) {
        return false;
    }
    close(fd);
    return true;
}

/// Status code of the first reply on 'fd', waiting up to 'timeout'
int read_status(int fd, std::chrono::milliseconds timeout) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    if (poll(&pfd, 1, static_cast<int>(timeout.count())) <= 0) {
        return 0;
    }
    char buf[512];
    ssize_t n = recv(fd, buf, sizeof(buf), 0);
    if (n < 12) {
        return 0;
    }
    return std::stoi(std::string(buf + 9, 3));
}

/// Status of one request, without assertions (usable off the test thread)
int status_of(uint16_t port, const std::string& raw) {
    int fd = open_connection(port);
    if (fd < 0) {
        return 0;
    }
    int status = core::send_all(fd, raw) ? 0 : read_status(fd, std::chrono::milliseconds(2000));
    close(fd);
    return status;
}

using Clock = std::chrono::steady_clock;

}  // namespace

// ============================================================================
// In-process request handling (no sockets)
// ============================================================================

TEST_CASE("AdminServer routes and middleware order", "[admin][routes]") {
    core::AdminServer server(test_config());

    const auto paths = server.route_paths();
    REQUIRE(paths == std::vector<std::string>{"/", "/status/reset", "/status/live",
                                              "/status/ready", "/api/doc",
                                              "/api/docs/swagger.json"});
}

TEST_CASE("AdminServer status endpoints before start", "[admin][health]") {
    core::AdminServer server(test_config());
    REQUIRE_FALSE(server.is_live());
    REQUIRE_FALSE(server.is_ready());

    auto live = make_request(Method::GET, "/status/live");
    Response live_res;
    server.handle_request(live, live_res);
    REQUIRE(live_res.status == StatusCode::ServiceUnavailable);
    REQUIRE(nlohmann::json::parse(live_res.body)["reason"] == "Service not available");

    auto ready = make_request(Method::GET, "/status/ready");
    Response ready_res;
    server.handle_request(ready, ready_res);
    REQUIRE(ready_res.status == StatusCode::ServiceUnavailable);
    REQUIRE(nlohmann::json::parse(ready_res.body)["reason"] == "Service not ready");
}

TEST_CASE("AdminServer authentication", "[admin][auth]") {
    core::AdminServer server(test_config());

    SECTION("Missing key") {
        auto req = make_request(Method::GET, "/status/live", false);
        Response res;
        server.handle_request(req, res);
        REQUIRE(res.status == StatusCode::Unauthorized);
        REQUIRE(nlohmann::json::parse(res.body) == nlohmann::json{{"reason", "Unauthorized"}});
        REQUIRE(res.has_header("X-Correlation-ID"));
    }

    SECTION("Unknown path still requires the key") {
        auto req = make_request(Method::GET, "/nope", false);
        Response res;
        server.handle_request(req, res);
        REQUIRE(res.status == StatusCode::Unauthorized);
    }

    SECTION("Documentation requires the key by default") {
        auto req = make_request(Method::GET, "/api/doc", false);
        Response res;
        server.handle_request(req, res);
        REQUIRE(res.status == StatusCode::Unauthorized);
    }

    SECTION("OPTIONS is never challenged") {
        auto req = make_request(Method::OPTIONS, "/status/live", false);
        req.headers.push_back({"Origin", "https://console.example"});
        req.headers.push_back({"Access-Control-Request-Method", "GET"});
        Response res;
        server.handle_request(req, res);
        REQUIRE(res.status == StatusCode::OK);
        REQUIRE(res.get_header("Access-Control-Allow-Origin") == "https://console.example");
    }

    SECTION("401 carries CORS headers") {
        auto req = make_request(Method::GET, "/status/ready", false);
        req.headers.push_back({"Origin", "https://console.example"});
        Response res;
        server.handle_request(req, res);
        REQUIRE(res.status == StatusCode::Unauthorized);
        REQUIRE(res.get_header("Access-Control-Allow-Origin") == "https://console.example");
    }
}

TEST_CASE("AdminServer insecure mode and allow-list", "[admin][auth]") {
    SECTION("insecure_mode skips the key check") {
        auto config = test_config();
        config.admin.api_key.clear();
        config.admin.insecure_mode = true;
        core::AdminServer server(config);

        auto req = make_request(Method::POST, "/status/reset", false);
        Response res;
        server.handle_request(req, res);
        REQUIRE(res.status == StatusCode::OK);
    }

    SECTION("Exempt probes") {
        auto config = test_config();
        config.admin.exempt_unprotected_paths = true;
        core::AdminServer server(config);

        auto live = make_request(Method::GET, "/status/live", false);
        Response live_res;
        server.handle_request(live, live_res);
        REQUIRE(live_res.status == StatusCode::ServiceUnavailable);  // not started, but not 401

        auto reset = make_request(Method::POST, "/status/reset", false);
        Response reset_res;
        server.handle_request(reset, reset_res);
        REQUIRE(reset_res.status == StatusCode::Unauthorized);
    }
}

TEST_CASE("AdminServer redirect and errors", "[admin][routes]") {
    core::AdminServer server(test_config());

    SECTION("GET / redirects to the docs") {
        auto req = make_request(Method::GET, "/");
        Response res;
        server.handle_request(req, res);
        REQUIRE(res.status == StatusCode::Found);
        REQUIRE(res.get_header("Location") == "/api/doc");
    }

    SECTION("HEAD / redirects without a body") {
        auto req = make_request(Method::HEAD, "/");
        Response res;
        server.handle_request(req, res);
        REQUIRE(res.status == StatusCode::Found);
        REQUIRE(res.head_only);
    }

    SECTION("Unknown path") {
        auto req = make_request(Method::GET, "/status/other");
        Response res;
        server.handle_request(req, res);
        REQUIRE(res.status == StatusCode::NotFound);
    }

    SECTION("Wrong method") {
        auto req = make_request(Method::GET, "/status/reset");
        Response res;
        server.handle_request(req, res);
        REQUIRE(res.status == StatusCode::MethodNotAllowed);
        REQUIRE(res.get_header("Allow") == "POST");
    }

    SECTION("Handler exception becomes 500") {
        server.add_route(gateway::RouteBuilder("/boom")
                             .handler("boom",
                                      [](gateway::RequestContext&) {
                                          throw std::runtime_error("internal detail");
                                      })
                             .build());
        auto req = make_request(Method::GET, "/boom");
        Response res;
        server.handle_request(req, res);
        REQUIRE(res.status == StatusCode::InternalServerError);
        REQUIRE(res.body.find("internal detail") == std::string::npos);
    }
}

TEST_CASE("AdminServer host routes and apply_cors", "[admin][routes]") {
    core::AdminServer server(test_config());
    server.add_route(
        gateway::RouteBuilder("/custom")
            .handler("custom",
                     [](gateway::RequestContext& ctx) {
                         REQUIRE(ctx.admin_context.has_value());
                         REQUIRE(ctx.admin_context->profile->name() == "test-agent");
                         gateway::respond_json(*ctx.response, StatusCode::OK, {{"ok", true}});
                     })
            .build());

    auto preflight = make_request(Method::OPTIONS, "/custom", false);
    preflight.headers.push_back({"Origin", "https://console.example"});
    preflight.headers.push_back({"Access-Control-Request-Method", "GET"});

    Response before;
    server.handle_request(preflight, before);
    REQUIRE(before.status == StatusCode::Forbidden);

    server.apply_cors();
    Response after;
    server.handle_request(preflight, after);
    REQUIRE(after.status == StatusCode::OK);

    auto req = make_request(Method::GET, "/custom");
    Response res;
    server.handle_request(req, res);
    REQUIRE(res.status == StatusCode::OK);
}

TEST_CASE("AdminServer status reset", "[admin][reset]") {
    SECTION("Resets the collector") {
        auto collector = std::make_shared<control::Collector>();
        core::AdminServer server(test_config(), nullptr, collector);

        auto live = make_request(Method::GET, "/status/live");
        Response live_res;
        server.handle_request(live, live_res);
        REQUIRE(collector->get("GET /status/live").has_value());

        auto reset = make_request(Method::POST, "/status/reset");
        Response reset_res;
        server.handle_request(reset, reset_res);
        REQUIRE(reset_res.status == StatusCode::OK);
        REQUIRE(reset_res.body == "{}");
        REQUIRE_FALSE(collector->get("GET /status/live").has_value());
    }

    SECTION("Works without a collector") {
        core::AdminServer server(test_config());
        auto reset = make_request(Method::POST, "/status/reset");
        Response res;
        server.handle_request(reset, res);
        REQUIRE(res.status == StatusCode::OK);
        REQUIRE(res.body == "{}");
    }
}

TEST_CASE("AdminServer documentation routes", "[admin][openapi]") {
    core::AdminServer server(test_config());

    auto spec = make_request(Method::GET, "/api/docs/swagger.json");
    Response spec_res;
    server.handle_request(spec, spec_res);
    REQUIRE(spec_res.status == StatusCode::OK);

    auto doc = nlohmann::json::parse(spec_res.body);
    REQUIRE(doc["info"]["title"] == "test-agent");
    REQUIRE(doc["info"]["version"] == "v11");
    REQUIRE(doc["paths"].contains("/status/live"));
    REQUIRE(doc["paths"].contains("/status/ready"));
    REQUIRE(doc["paths"]["/status/reset"].contains("post"));
    REQUIRE(doc["definitions"].contains("AdminStatusReadinessSchema"));
    REQUIRE(doc["securityDefinitions"]["AuthorizationHeader"]["name"] == "x-api-key");

    auto page = make_request(Method::GET, "/api/doc");
    Response page_res;
    server.handle_request(page, page_res);
    REQUIRE(page_res.status == StatusCode::OK);
    REQUIRE(page_res.body.find("/api/docs/swagger.json") != std::string::npos);
}

// ============================================================================
// Lifecycle over loopback
// ============================================================================

TEST_CASE("AdminServer lifecycle over loopback", "[admin][lifecycle]") {
    core::AdminServer server(test_config());

    REQUIRE_FALSE(server.start("127.0.0.1", 0));
    REQUIRE(server.is_running());
    REQUIRE(server.port() != 0);
    REQUIRE(server.is_live());
    REQUIRE(server.is_ready());
    const uint16_t port = server.port();

    auto live = exchange(port, get("/status/live"));
    REQUIRE(live.status == 200);
    REQUIRE(nlohmann::json::parse(live.body) == nlohmann::json{{"alive", true}});

    auto ready = exchange(port, get("/status/ready"));
    REQUIRE(ready.status == 200);
    REQUIRE(nlohmann::json::parse(ready.body) == nlohmann::json{{"ready", true}});

    auto denied = exchange(port, get("/status/live", "wrong"));
    REQUIRE(denied.status == 401);

    SECTION("Fatal error fails both probes but keeps the listener") {
        server.notify_fatal_error();
        REQUIRE_FALSE(server.state().ready_flag());
        REQUIRE(exchange(port, get("/status/live")).status == 503);
        auto not_ready = exchange(port, get("/status/ready"));
        REQUIRE(not_ready.status == 503);
        REQUIRE(not_ready.head.find("503 Service not ready") != std::string::npos);
    }

    SECTION("Reset keeps liveness") {
        server.reset_ready();
        REQUIRE(server.state().is_live());
        REQUIRE_FALSE(server.state().ready_flag());
        REQUIRE(exchange(port, get("/status/live")).status == 200);
        REQUIRE(exchange(port, get("/status/ready")).status == 503);
    }

    SECTION("Redirect") {
        auto root = exchange(port, get("/"));
        REQUIRE(root.status == 302);
        REQUIRE(root.head.find("Location: /api/doc") != std::string::npos);
    }

    SECTION("Malformed request") {
        REQUIRE(exchange(port, "NOT AN HTTP REQUEST\r\n\r\n").status == 400);
    }

    SECTION("Declared body over the limit") {
        std::string raw =
            "POST /status/reset HTTP/1.1\r\nHost: localhost\r\nx-api-key: admin-test-key\r\n"
            "Content-Length: 5000000\r\n\r\n";
        REQUIRE(exchange(port, raw).status == 413);
    }

    server.stop();
    REQUIRE_FALSE(server.is_running());
    REQUIRE_FALSE(server.is_live());
    REQUIRE_FALSE(server.is_ready());
    REQUIRE_FALSE(can_connect(port));
}

TEST_CASE("AdminServer stop is idempotent and final", "[admin][lifecycle]") {
    core::AdminServer server(test_config());

    // Stop before start is harmless
    server.stop();
    REQUIRE_FALSE(server.is_live());

    REQUIRE_FALSE(server.start("127.0.0.1", 0));
    REQUIRE(server.start("127.0.0.1", 0) == std::errc::operation_in_progress);

    server.stop();
    server.stop();
    REQUIRE_FALSE(server.is_running());

    // No restart within one instance
    REQUIRE(server.start("127.0.0.1", 0) == std::errc::operation_not_permitted);
    REQUIRE_FALSE(server.is_live());
}

TEST_CASE("AdminServer bind failure leaves flags untouched", "[admin][lifecycle]") {
    core::AdminServer first(test_config());
    REQUIRE_FALSE(first.start("127.0.0.1", 0));

    core::AdminServer second(test_config());
    auto ec = second.start("127.0.0.1", first.port());
    REQUIRE(ec);
    REQUIRE_FALSE(second.is_running());
    REQUIRE_FALSE(second.is_live());
    REQUIRE_FALSE(second.is_ready());

    SECTION("Address not on this host") {
        core::AdminServer third(test_config());
        REQUIRE(third.start("192.0.2.1", 0));
        REQUIRE_FALSE(third.is_live());
    }

    first.stop();
}

// ============================================================================
// Concurrent connections
// ============================================================================

TEST_CASE("AdminServer idle connection does not delay status requests", "[admin][connections]") {
    auto config = test_config();
    config.server.read_timeout_ms = 30000;
    core::AdminServer server(config);
    REQUIRE_FALSE(server.start("127.0.0.1", 0));
    const uint16_t port = server.port();

    // Connects and never sends a byte
    int idle = open_connection(port);
    REQUIRE(idle >= 0);

    auto begin = Clock::now();
    auto live = exchange(port, get("/status/live"));
    auto elapsed = Clock::now() - begin;

    REQUIRE(live.status == 200);
    REQUIRE(elapsed < std::chrono::milliseconds(1000));

    // A half-sent request is abandoned promptly on stop()
    REQUIRE_FALSE(core::send_all(idle, "GET /status/live HTTP/1.1\r\n"));
    begin = Clock::now();
    server.stop();
    REQUIRE(Clock::now() - begin < std::chrono::milliseconds(1000));
    REQUIRE(server.active_connections() == 0);

    close(idle);
}

TEST_CASE("AdminServer request deadline covers the whole request", "[admin][connections]") {
    auto config = test_config();
    config.server.read_timeout_ms = 500;
    core::AdminServer server(config);
    REQUIRE_FALSE(server.start("127.0.0.1", 0));

    int fd = open_connection(server.port());
    REQUIRE(fd >= 0);

    auto begin = Clock::now();
    REQUIRE_FALSE(core::send_all(fd, "GET /status/live HTTP/1.1\r\n"));
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    // More bytes do not extend the deadline
    REQUIRE_FALSE(core::send_all(fd, "Host: localhost\r\n"));

    REQUIRE(read_status(fd, std::chrono::milliseconds(2000)) == 408);
    REQUIRE(Clock::now() - begin < std::chrono::milliseconds(750));

    close(fd);
    server.stop();
}

TEST_CASE("AdminServer connection limit", "[admin][connections]") {
    auto config = test_config();
    config.server.max_connections = 1;
    core::AdminServer server(config);
    REQUIRE_FALSE(server.start("127.0.0.1", 0));
    const uint16_t port = server.port();

    int idle = open_connection(port);
    REQUIRE(idle >= 0);

    auto begin = Clock::now();
    while (server.active_connections() == 0 && Clock::now() - begin < std::chrono::seconds(2)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    REQUIRE(server.active_connections() == 1);

    REQUIRE(exchange(port, get("/status/live")).status == 503);

    // Slot frees once the idle peer goes away
    close(idle);
    begin = Clock::now();
    while (server.active_connections() > 0 && Clock::now() - begin < std::chrono::seconds(2)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    REQUIRE(exchange(port, get("/status/live")).status == 200);

    server.stop();
}

TEST_CASE("AdminServer routes added while serving", "[admin][connections][routes]") {
    core::AdminServer server(test_config());
    REQUIRE_FALSE(server.start("127.0.0.1", 0));
    const uint16_t port = server.port();

    std::atomic<bool> done{false};
    std::atomic<int> failures{0};
    std::thread prober([&] {
        while (!done.load()) {
            if (status_of(port, get("/status/live")) != 200) {
                failures.fetch_add(1);
            }
        }
    });

    for (int i = 0; i < 50; ++i) {
        std::string path = "/extra/" + std::to_string(i);
        server.add_route(gateway::RouteBuilder(path)
                             .handler(path,
                                      [](gateway::RequestContext& ctx) {
                                          gateway::respond_json(*ctx.response, StatusCode::OK,
                                                                nlohmann::json::object());
                                      })
                             .build());
        server.apply_cors();
    }

    done.store(true);
    prober.join();
    REQUIRE(failures.load() == 0);

    REQUIRE(server.route_paths().size() == 56);
    REQUIRE(exchange(port, get("/extra/49")).status == 200);

    auto preflight = exchange(port,
                              "OPTIONS /extra/49 HTTP/1.1\r\nHost: localhost\r\n"
                              "Origin: https://console.example\r\n"
                              "Access-Control-Request-Method: GET\r\n\r\n");
    REQUIRE(preflight.status == 200);

    server.stop();
}

TEST_CASE("AdminServer correlation IDs", "[admin][logging]") {
    core::AdminServer server(test_config());

    SECTION("Well-formed caller ID is kept") {
        auto req = make_request(Method::GET, "/status/live");
        req.headers.push_back({"X-Correlation-ID", "550e8400-e29b-41d4-a716-446655440000#7"});
        Response res;
        server.handle_request(req, res);
        REQUIRE(res.get_header("X-Correlation-ID") == "550e8400-e29b-41d4-a716-446655440000#7");
    }

    SECTION("Malformed caller ID is replaced") {
        auto req = make_request(Method::GET, "/status/live");
        req.headers.push_back({"X-Correlation-ID", "<script>"});
        Response res;
        server.handle_request(req, res);
        auto id = res.get_header("X-Correlation-ID");
        REQUIRE(id != "<script>");
        REQUIRE(logging::is_valid_correlation_id(id));
    }

    SECTION("Missing caller ID is generated") {
        auto req = make_request(Method::GET, "/status/live");
        Response res;
        server.handle_request(req, res);
        REQUIRE(logging::is_valid_correlation_id(res.get_header("X-Correlation-ID")));
    }
}
