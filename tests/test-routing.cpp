#include <gtest/gtest.h>
#include "../request.h"
#include "../utility.h"
#include "../routing/context.h"
#include "../routing/interceptor.h"
#include "../routing/route_group.h"
#include "../routing/chain.h"
#include "../routing/router.h"
#include <qb/json.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace qb::swagger;

// --- String helpers ---

TEST(UtilityTest, LowerCasesAsciiOnly) {
    EXPECT_EQ(utility::to_lower("Content-TYPE"), "content-type");
    EXPECT_EQ(utility::to_lower("\xC3\x89t\xC3\xA9"), "\xC3\x89t\xC3\xA9");
    EXPECT_EQ(Method(Method::DEL).lower(), "delete");
    EXPECT_EQ(Method(Method::GET).str(), "GET");
}

TEST(UtilityTest, DumpReplacesInvalidUtf8) {
    EXPECT_EQ(utility::dump(qb::json("ok")), "\"ok\"");
    EXPECT_EQ(utility::dump(qb::json{{"k", "\xff"}}), "{\"k\":\"\xEF\xBF\xBD\"}");
}

// --- Request helpers ---

TEST(RequestTest, ParsesUrlEncodedPairs) {
    auto parsed = parse_urlencoded("a=1&b=hello%20world&flag&a=2&=skipped");
    EXPECT_EQ(parsed["a"], qb::json::parse(R"(["1", "2"])"));
    EXPECT_EQ(parsed["b"], "hello world");
    EXPECT_EQ(parsed["flag"], "");
    EXPECT_EQ(parsed.size(), 3u);
}

TEST(RequestTest, HeadersAreCaseInsensitive) {
    Request request(Method::POST, "/");
    request.set_header("Content-Type", "Application/JSON; charset=utf-8");
    EXPECT_EQ(request.header("content-type"), "Application/JSON; charset=utf-8");
    EXPECT_EQ(request.content_type(), "application/json");
    EXPECT_EQ(request.header("X-Missing"), "");
}

TEST(RequestTest, ExtractQueryKeepsExistingParams) {
    Request request(Method::GET, "/search?q=term&page=2");
    request.query_params["page"] = "1";
    request.extract_query();
    EXPECT_EQ(request.path, "/search");
    EXPECT_EQ(request.query_params["q"], "term");
    EXPECT_EQ(request.query_params["page"], "1");
}

TEST(RequestTest, RecordRoundTrip) {
    Request request(Method::GET, "/");
    request.path_params["id"] = "3";
    auto record = request.to_record();
    EXPECT_TRUE(record["body-params"].is_null());
    record["path-params"]["id"] = 3;
    request.assign_record(record);
    EXPECT_EQ(request.path_params["id"], 3);
}

TEST(ContextTest, ResponseIsSetOnce) {
    Context ctx(Request(Method::GET, "/"));
    EXPECT_FALSE(ctx.has_response());
    EXPECT_THROW((void) ctx.response(), std::logic_error);
    ctx.set_response(Response(status::CREATED));
    EXPECT_EQ(ctx.response().status, status::CREATED);
    EXPECT_EQ(ctx.route(), nullptr);
}

// --- Route groups ---

TEST(RouteGroupTest, JoinsPathSegments) {
    EXPECT_EQ(detail::join_paths("", "/"), "/");
    EXPECT_EQ(detail::join_paths("/", "/x/"), "/x");
    EXPECT_EQ(detail::join_paths("/api", "items/:id"), "/api/items/:id");
    EXPECT_EQ(detail::normalize_path_segment("//a/b//"), "a/b");
}

class RouteGroupTest : public ::testing::Test {
protected:
    static InterceptorPtr named(const std::string &name) {
        return std::make_shared<FunctionalInterceptor>(name, [](Context &) {});
    }

    static std::vector<std::string> names(const Route &route) {
        std::vector<std::string> out;
        for (const auto &interceptor : route.interceptors)
            out.push_back(interceptor->name());
        return out;
    }
};

TEST_F(RouteGroupTest, ExpandsNestedGroupsWithAmbientInterceptors) {
    RouteGroup root("/");
    root.use(named("outer"))
        .get(named("root-handler"))
        .group(RouteGroup("/x/:id")
            .use(named("inner"))
            .put(named("put-handler"))
            .del(named("pre"), named("del-handler")));

    auto routes = root.expand();
    ASSERT_EQ(routes.size(), 3u);

    EXPECT_EQ(routes[0].path, "/");
    EXPECT_EQ(routes[0].method, Method::GET);
    EXPECT_EQ(names(routes[0]), (std::vector<std::string>{"outer", "root-handler"}));

    EXPECT_EQ(routes[1].path, "/x/:id");
    EXPECT_EQ(routes[1].method, Method::PUT);
    EXPECT_EQ(names(routes[1]), (std::vector<std::string>{"outer", "inner", "put-handler"}));

    EXPECT_EQ(routes[2].method, Method::DEL);
    EXPECT_EQ(names(routes[2]), (std::vector<std::string>{"outer", "inner", "pre", "del-handler"}));
    EXPECT_EQ(routes[2].handler()->name(), "del-handler");
}

TEST_F(RouteGroupTest, RejectsEmptyOrNullChains) {
    RouteGroup group("/");
    EXPECT_THROW(group.route(Method::GET, {}), std::invalid_argument);
    EXPECT_THROW(group.route(Method::GET, {nullptr}), std::invalid_argument);
    EXPECT_THROW(group.use(nullptr), std::invalid_argument);
}

// --- Chain execution ---

class ChainTest : public ::testing::Test {
protected:
    std::vector<std::string> trace;

    InterceptorPtr recorder(const std::string &name) {
        return std::make_shared<FunctionalInterceptor>(
            name,
            [this, name](Context &) { trace.push_back(name + ":enter"); },
            [this, name](Context &) { trace.push_back(name + ":leave"); });
    }

    InterceptorPtr responder(const std::string &name, int status) {
        return std::make_shared<FunctionalInterceptor>(
            name,
            [this, name, status](Context &ctx) {
                trace.push_back(name + ":enter");
                ctx.set_response(Response(status));
            },
            [this, name](Context &) { trace.push_back(name + ":leave"); });
    }
};

TEST_F(ChainTest, EnterInOrderLeaveInReverse) {
    Context ctx(Request(Method::GET, "/"));
    Chain({recorder("a"), recorder("b"), responder("h", status::OK)}).execute(ctx);
    EXPECT_EQ(trace, (std::vector<std::string>{"a:enter", "b:enter", "h:enter", "h:leave", "b:leave", "a:leave"}));
    EXPECT_EQ(ctx.response().status, status::OK);
}

TEST_F(ChainTest, ResponseDuringEnterShortCircuits) {
    Context ctx(Request(Method::GET, "/"));
    Chain({recorder("a"), responder("guard", status::UNPROCESSABLE_ENTITY), recorder("h")}).execute(ctx);
    EXPECT_EQ(trace, (std::vector<std::string>{"a:enter", "guard:enter", "guard:leave", "a:leave"}));
    EXPECT_EQ(ctx.response().status, status::UNPROCESSABLE_ENTITY);
}

TEST_F(ChainTest, ErrorStageRecoversAndLeaveResumes) {
    auto recovering = std::make_shared<FunctionalInterceptor>(
        "recovering",
        EnterFn{},
        [this](Context &) { trace.push_back("recovering:leave"); },
        [this](Context &ctx, std::exception_ptr fault) {
            trace.push_back("recovering:error " + describe(fault));
            ctx.set_response(Response(status::BAD_REQUEST));
        });
    auto failing = std::make_shared<FunctionalInterceptor>(
        "failing", [](Context &) { throw std::runtime_error("boom"); });

    Context ctx(Request(Method::GET, "/"));
    Chain({recorder("a"), recovering, recorder("b"), failing}).execute(ctx);

    EXPECT_EQ(trace, (std::vector<std::string>{"a:enter", "b:enter", "recovering:error boom", "a:leave"}));
    EXPECT_EQ(ctx.response().status, status::BAD_REQUEST);
}

TEST_F(ChainTest, FaultInLeaveReachesOuterErrorStages) {
    bool handled = false;
    auto outer = std::make_shared<FunctionalInterceptor>(
        "outer", EnterFn{}, LeaveFn{},
        [&handled](Context &, std::exception_ptr) { handled = true; });
    auto exploding = std::make_shared<FunctionalInterceptor>(
        "exploding", EnterFn{}, [](Context &) { throw std::runtime_error("late"); });

    Context ctx(Request(Method::GET, "/"));
    Chain({outer, exploding, responder("h", status::OK)}).execute(ctx);
    EXPECT_TRUE(handled);
}

TEST_F(ChainTest, UnhandledFaultPropagates) {
    auto failing = std::make_shared<FunctionalInterceptor>(
        "failing", [](Context &) { throw std::out_of_range("unhandled"); });
    Context ctx(Request(Method::GET, "/"));
    EXPECT_THROW(Chain({recorder("a"), failing}).execute(ctx), std::out_of_range);
}

TEST_F(ChainTest, NullInterceptorIsRejected) {
    EXPECT_THROW(Chain({recorder("a"), nullptr}), std::invalid_argument);
}

// --- Router ---

TEST(RouterTest, MatchesTemplatesAndDecodesParams) {
    qb::json params;
    EXPECT_TRUE(match_path("/x/:id", "/x/hello%20there", params));
    EXPECT_EQ(params["id"], "hello there");
    EXPECT_TRUE(match_path("/", "/", params));
    EXPECT_FALSE(match_path("/x/:id", "/x", params));
    EXPECT_FALSE(match_path("/x/:id", "/y/1", params));
    EXPECT_TRUE(match_path("/x/:id/", "/x/1", params));
}

TEST(RouterTest, DispatchesByMethodAndPath) {
    RouteGroup root("/");
    root.group(RouteGroup("/items/:id")
        .get(std::make_shared<FunctionalInterceptor>("show", [](Context &ctx) {
            qb::json body = qb::json::object();
            body["id"] = ctx.request().path_params["id"];
            body["q"] = ctx.request().query_params.value("q", "");
            ctx.set_response(Response(status::OK, body));
        })));
    Router router(root.expand());

    auto ok = router.route(Request(Method::GET, "/items/7?q=x"));
    EXPECT_EQ(ok.status, status::OK);
    EXPECT_EQ(ok.body["id"], "7");
    EXPECT_EQ(ok.body["q"], "x");

    EXPECT_EQ(router.route(Request(Method::POST, "/items/7")).status, status::NOT_FOUND);
    EXPECT_EQ(router.route(Request(Method::GET, "/nowhere")).status, status::NOT_FOUND);
}

TEST(RouterTest, RouteWithoutResponseIsNotFound) {
    RouteGroup root("/");
    root.get(std::make_shared<FunctionalInterceptor>("silent", [](Context &) {}));
    Router router(root.expand());
    EXPECT_EQ(router.route(Request(Method::GET, "/")).status, status::NOT_FOUND);
}

TEST(RouterTest, ContextExposesMatchedRoute) {
    const Route *seen = nullptr;
    RouteGroup root("/");
    root.get(std::make_shared<FunctionalInterceptor>("who", [&seen](Context &ctx) {
        seen = ctx.route();
        ctx.set_response(Response(status::OK));
    }));
    Router router(root.expand());
    (void) router.route(Request(Method::GET, "/"));
    ASSERT_NE(seen, nullptr);
    EXPECT_EQ(seen, &router.routes().front());
}
