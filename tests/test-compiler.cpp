#include <gtest/gtest.h>
#include "../openapi/compiler.h"
#include "../openapi/annotation.h"
#include "../routing/route_group.h"
#include "../middleware/builders.h"
#include <qb/json.h>

using namespace qb::swagger;
using namespace qb::swagger::openapi;

class DocumentCompilerTest : public ::testing::Test {
protected:
    RouteTable routes;

    static Contract contract_of(const char *json) {
        return Contract::from_json(qb::json::parse(json));
    }

    static Response ok(const Request &) {
        return Response(status::OK);
    }

    void SetUp() override {
        auto auth = before("auth", contract_of(R"({
            "description": "Requires auth",
            "parameters": {"header": {"type": "object", "properties": {"auth": {"type": "string"}}, "required": ["auth"]}},
            "responses": {"403": {}}
        })"), [](Context &) {});

        RouteGroup root("/");
        root.use(auth)
            .get(handler("list", contract_of(R"({"summary": "List things", "responses": {"200": {}}})"), ok))
            .head(handler("probe", ok))
            .group(RouteGroup("/x/:id")
                .use(before("id", contract_of(R"({
                    "description": "Requires id on path",
                    "parameters": {"path": {"type": "object", "properties": {"id": {"type": "integer"}}, "required": ["id"]}}
                })"), [](Context &) {}))
                .put(handler("update", contract_of(R"({"summary": "Update"})"), ok))
                .del(handler("remove", contract_of(R"({"summary": "Remove"})"), ok)));
        routes = root.expand();
    }
};

TEST_F(DocumentCompilerTest, RouteContractFoldsOuterToInner) {
    auto contract = route_contract(routes[2]); // PUT /x/:id
    EXPECT_EQ(contract.description, "Requires id on path");
    EXPECT_EQ(contract.summary, "Update");
    EXPECT_TRUE(contract.parameters.count(ParameterLocation::HEADER));
    EXPECT_TRUE(contract.parameters.count(ParameterLocation::PATH));
    EXPECT_TRUE(contract.responses.count(403));
}

TEST_F(DocumentCompilerTest, OnlyDocumentedHandlersAppear) {
    auto paths = gen_paths(routes);
    ASSERT_EQ(paths.size(), 2u);
    ASSERT_TRUE(paths.count("/"));
    EXPECT_EQ(paths.at("/").size(), 1u);
    EXPECT_TRUE(paths.at("/").count("get"));
    EXPECT_FALSE(paths.at("/").count("head"));

    ASSERT_TRUE(paths.count("/x/:id"));
    EXPECT_TRUE(paths.at("/x/:id").count("put"));
    EXPECT_TRUE(paths.at("/x/:id").count("delete"));
    EXPECT_EQ(paths.at("/x/:id").at("delete").description, "Requires id on path");
    EXPECT_EQ(paths.at("/").at("get").description, "Requires auth");
}

TEST_F(DocumentCompilerTest, FirstDeclarationOfADuplicateWins) {
    RouteGroup extra("/");
    extra.get(handler("shadow", contract_of(R"({"summary": "Shadow"})"), ok));
    RouteTable doubled = routes;
    auto more = extra.expand();
    doubled.insert(doubled.end(), more.begin(), more.end());

    auto paths = gen_paths(doubled);
    EXPECT_EQ(paths.at("/").at("get").summary, "List things");
}

TEST_F(DocumentCompilerTest, CompileIsDeterministic) {
    ApiInfo info;
    info.setTitle("Things").setVersion("2.0");
    auto first = compile(routes, info);
    auto second = compile(routes, info);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first.info.title, "Things");
    ASSERT_NE(first.find("/x/:id", Method::PUT), nullptr);
    EXPECT_EQ(first.find("/x/:id", Method::PUT)->summary, "Update");
    EXPECT_EQ(first.find("/x/:id", Method::GET), nullptr);
}

TEST_F(DocumentCompilerTest, InjectDocsAttachesContractsAndSharedDocument) {
    auto compiled = inject_docs(ApiInfo(), routes);
    ASSERT_EQ(compiled.size(), routes.size());
    for (const auto &route : compiled) {
        ASSERT_NE(route.contract, nullptr);
        ASSERT_NE(route.document, nullptr);
        EXPECT_EQ(route.document, compiled.front().document);
    }
    // undocumented routes are still enforced with their ambient contract
    const auto &head = compiled[1];
    EXPECT_EQ(head.method, Method::HEAD);
    EXPECT_TRUE(annotation(head)->parameters.count(ParameterLocation::HEADER));
    EXPECT_EQ(compiled.front().document->paths.size(), 2u);

    // the input table is left untouched
    EXPECT_EQ(routes.front().contract, nullptr);
}
