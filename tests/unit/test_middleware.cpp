// vcadmin Two-Phase Middleware Unit Tests

#include "../../src/control/stats.hpp"
#include "../../src/gateway/pipeline.hpp"
#include "../../src/http/http.hpp"

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using namespace vcadmin::gateway;
using namespace vcadmin::http;

// ============================================================================
// Test Middleware Implementations
// ============================================================================

/// Test middleware that records its execution into a shared trace
class TracingMiddleware : public Middleware {
public:
    TracingMiddleware(std::string label, std::vector<std::string>* trace)
        : label_(std::move(label)), trace_(trace) {}

    MiddlewareResult request_result = MiddlewareResult::Continue;

    MiddlewareResult process_request(RequestContext& ctx) override {
        (void)ctx;
        trace_->push_back(label_ + ".request");
        return request_result;
    }

    MiddlewareResult process_response(RequestContext& ctx) override {
        (void)ctx;
        trace_->push_back(label_ + ".response");
        return MiddlewareResult::Continue;
    }

    std::string_view name() const override { return label_; }

private:
    std::string label_;
    std::vector<std::string>* trace_;
};

/// Test middleware that stops the chain with a 401
class DenyMiddleware : public Middleware {
public:
    MiddlewareResult process_request(RequestContext& ctx) override {
        respond_error(*ctx.response, StatusCode::Unauthorized, "Unauthorized");
        return MiddlewareResult::Stop;
    }

    std::string_view name() const override { return "DenyMiddleware"; }
};

namespace {

RequestContext make_context(Request& req, Response& res) {
    RequestContext ctx;
    ctx.request = &req;
    ctx.response = &res;
    ctx.start_time = std::chrono::steady_clock::now();
    return ctx;
}

}  // namespace

// ============================================================================
// Pipeline Tests
// ============================================================================

TEST_CASE("Pipeline - Add middleware", "[middleware][pipeline]") {
    Pipeline pipeline;
    std::vector<std::string> trace;

    REQUIRE(pipeline.size() == 0);

    pipeline.use(std::make_unique<TracingMiddleware>("a", &trace));
    pipeline.use([](RequestContext&) { return MiddlewareResult::Continue; }, "Inline");
    REQUIRE(pipeline.size() == 2);
    REQUIRE(pipeline.names() == std::vector<std::string_view>{"a", "Inline"});

    pipeline.clear();
    REQUIRE(pipeline.size() == 0);
}

TEST_CASE("Pipeline - Request phase runs in registration order", "[middleware][pipeline]") {
    std::vector<std::string> trace;
    auto pipeline = PipelineBuilder()
                        .use(std::make_unique<TracingMiddleware>("cors", &trace))
                        .use(std::make_unique<TracingMiddleware>("auth", &trace))
                        .use(std::make_unique<TracingMiddleware>("context", &trace))
                        .build();

    Request req;
    Response res;
    auto ctx = make_context(req, res);

    REQUIRE(pipeline.execute_request(ctx) == MiddlewareResult::Continue);
    REQUIRE(trace == std::vector<std::string>{"cors.request", "auth.request", "context.request"});
}

TEST_CASE("Pipeline - Request phase stops on Stop result", "[middleware][pipeline]") {
    std::vector<std::string> trace;
    Pipeline pipeline;
    pipeline.use(std::make_unique<TracingMiddleware>("first", &trace));
    pipeline.use(std::make_unique<DenyMiddleware>());
    pipeline.use(std::make_unique<TracingMiddleware>("after", &trace));

    Request req;
    Response res;
    auto ctx = make_context(req, res);

    REQUIRE(pipeline.execute_request(ctx) == MiddlewareResult::Stop);
    REQUIRE(trace == std::vector<std::string>{"first.request"});  // "after" never ran
    REQUIRE(res.status == StatusCode::Unauthorized);

    // Response phase still runs for every middleware
    REQUIRE(pipeline.execute_response(ctx) == MiddlewareResult::Continue);
    REQUIRE(trace.back() == "after.response");
}

TEST_CASE("Pipeline - Error result sets context error", "[middleware][pipeline]") {
    Pipeline pipeline;
    pipeline.use([](RequestContext&) { return MiddlewareResult::Error; }, "Broken");

    Request req;
    Response res;
    auto ctx = make_context(req, res);

    REQUIRE(pipeline.execute_request(ctx) == MiddlewareResult::Error);
    REQUIRE(ctx.has_error);
    REQUIRE(ctx.error_message == "Broken failed");
}

TEST_CASE("Pipeline - Metadata propagates between phases", "[middleware][pipeline]") {
    Pipeline pipeline;
    pipeline.use(
        [](RequestContext& ctx) {
            ctx.set_metadata("request_key", "request_value");
            return MiddlewareResult::Continue;
        },
        "Writer");

    Request req;
    Response res;
    auto ctx = make_context(req, res);

    REQUIRE(pipeline.execute_request(ctx) == MiddlewareResult::Continue);
    REQUIRE(ctx.get_metadata("request_key") == "request_value");
    REQUIRE(ctx.get_metadata("missing").empty());
}

// ============================================================================
// AdminContextMiddleware Tests
// ============================================================================

TEST_CASE("AdminContextMiddleware attaches profile", "[middleware][context]") {
    auto profile = std::make_shared<const vcadmin::core::Profile>(
        "default", nlohmann::json{{"endpoint", "https://agent.example"}});
    AdminContextMiddleware middleware(profile);

    Request req;
    Response res;
    auto ctx = make_context(req, res);
    REQUIRE_FALSE(ctx.admin_context.has_value());

    REQUIRE(middleware.process_request(ctx) == MiddlewareResult::Continue);
    REQUIRE(ctx.admin_context.has_value());
    REQUIRE(ctx.admin_context->has_profile());
    REQUIRE(ctx.admin_context->profile == profile);
    REQUIRE(ctx.admin_context->profile->name() == "default");
    REQUIRE(ctx.admin_context->profile->setting<std::string>("endpoint", "") ==
            "https://agent.example");
    REQUIRE(ctx.admin_context->profile->setting<int>("endpoint", 7) == 7);
    REQUIRE(ctx.admin_context->profile->setting<bool>("missing", true));
}

// ============================================================================
// LoggingMiddleware Tests
// ============================================================================

TEST_CASE("LoggingMiddleware records routed requests", "[middleware][logging]") {
    vcadmin::control::Collector collector;
    LoggingMiddleware middleware;

    Route route = RouteBuilder("/status/live")
                      .method(Method::GET)
                      .handler("live", [](RequestContext&) {})
                      .build();

    Request req;
    req.method = Method::GET;
    req.path = "/status/live";
    Response res;
    auto ctx = make_context(req, res);
    ctx.collector = &collector;

    SECTION("Matched route is timed under METHOD path") {
        ctx.route_match.route = &route;
        REQUIRE(middleware.process_response(ctx) == MiddlewareResult::Continue);
        REQUIRE(collector.get("GET /status/live").has_value());
    }

    SECTION("Unmatched route is logged but not timed") {
        REQUIRE(middleware.process_response(ctx) == MiddlewareResult::Continue);
        REQUIRE(collector.size() == 0);
    }

    SECTION("Missing request is an error") {
        ctx.request = nullptr;
        REQUIRE(middleware.process_response(ctx) == MiddlewareResult::Error);
    }
}

TEST_CASE("Response helpers", "[middleware][response]") {
    Response res;

    respond_error(res, StatusCode::NotFound, "Not Found");
    REQUIRE(res.status == StatusCode::NotFound);
    REQUIRE(res.reason_phrase == "Not Found");
    REQUIRE(res.get_header("Content-Type") == "application/json");
    REQUIRE(nlohmann::json::parse(res.body) == nlohmann::json{{"reason", "Not Found"}});

    Response ok;
    respond_json(ok, StatusCode::OK, nlohmann::json::object());
    REQUIRE(ok.status == StatusCode::OK);
    REQUIRE(ok.body == "{}");
}
