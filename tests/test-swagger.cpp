#include <gtest/gtest.h>
#include "../openapi/swagger.h"
#include <qb/json.h>

using namespace qb::swagger;
using namespace qb::swagger::openapi;

TEST(SwaggerSerializerTest, PathTemplatesUseBraces) {
    EXPECT_EQ(to_swagger_path("/x/:id"), "/x/{id}");
    EXPECT_EQ(to_swagger_path("/a/:first_id/b/:second-id"), "/a/{first_id}/b/{second-id}");
    EXPECT_EQ(to_swagger_path("/"), "/");
}

TEST(SwaggerSerializerTest, BodyParameterIsASingleEntry) {
    Parameters parameters;
    parameters[ParameterLocation::BODY] = qb::json::parse(R"({"title": "Item", "type": "object"})");
    auto params = to_swagger_parameters(parameters);
    ASSERT_EQ(params.size(), 1u);
    EXPECT_EQ(params[0]["in"], "body");
    EXPECT_EQ(params[0]["name"], "Item");
    EXPECT_EQ(params[0]["required"], true);
    EXPECT_EQ(params[0]["schema"]["type"], "object");

    parameters[ParameterLocation::BODY] = qb::json::parse(R"({"type": "object"})");
    EXPECT_EQ(to_swagger_parameters(parameters)[0]["name"], "body");
}

TEST(SwaggerSerializerTest, OtherLocationsExpandOneEntryPerProperty) {
    Parameters parameters;
    parameters[ParameterLocation::PATH] = qb::json::parse(R"({
        "type": "object", "properties": {"id": {"type": "integer", "title": "Id"}}
    })");
    parameters[ParameterLocation::QUERY] = qb::json::parse(R"({
        "type": "object",
        "properties": {"page": {"type": "integer"}, "q": {"type": "string", "description": "Search"}},
        "required": ["q"]
    })");

    auto params = to_swagger_parameters(parameters);
    ASSERT_EQ(params.size(), 3u);

    auto expected = qb::json::parse(R"([
        {"in": "path", "name": "id", "required": true, "type": "integer"},
        {"in": "query", "name": "page", "required": false, "type": "integer"},
        {"in": "query", "name": "q", "required": true, "type": "string", "description": "Search"}
    ])");
    EXPECT_EQ(params, expected);
}

TEST(SwaggerSerializerTest, ResponsesUseDescriptionOrReasonPhrase) {
    Responses responses;
    responses[200].description = "All good";
    responses[200].schema = qb::json::parse(R"({"type": "string"})");
    responses[404] = ResponseSpec{};
    responses[DEFAULT_RESPONSE].headers = qb::json::parse(R"({
        "type": "object", "properties": {"Location": {"type": "string"}}
    })");

    auto out = to_swagger_responses(responses);
    EXPECT_EQ(out["200"]["description"], "All good");
    EXPECT_EQ(out["200"]["schema"]["type"], "string");
    EXPECT_EQ(out["404"]["description"], status::reason_phrase(404));
    EXPECT_FALSE(out["404"].contains("schema"));
    EXPECT_EQ(out["default"]["description"], "");
    EXPECT_EQ(out["default"]["headers"], qb::json::parse(R"({"Location": {"type": "string"}})"));
}

TEST(SwaggerSerializerTest, DocumentCarriesInfoAndOperations) {
    AggregateDocument document;
    document.info.setTitle("Demo").setVersion("0.1").setDescription("A demo API");

    Contract get;
    get.summary = "Show";
    get.consumes = {"application/json"};
    get.responses[200] = ResponseSpec{"Shown", qb::json(), qb::json()};
    document.paths["/x/:id"]["get"] = get;

    auto swagger = to_swagger_json(document);
    EXPECT_EQ(swagger["swagger"], "2.0");
    EXPECT_EQ(swagger["info"], qb::json::parse(R"({"title": "Demo", "version": "0.1", "description": "A demo API"})"));
    ASSERT_TRUE(swagger["paths"].contains("/x/{id}"));

    const auto &operation = swagger["paths"]["/x/{id}"]["get"];
    EXPECT_EQ(operation["summary"], "Show");
    EXPECT_FALSE(operation.contains("description"));
    EXPECT_EQ(operation["consumes"], qb::json::parse(R"(["application/json"])"));
    EXPECT_EQ(operation["parameters"], qb::json::array());
    EXPECT_EQ(operation["responses"]["200"]["description"], "Shown");
}

TEST(SwaggerSerializerTest, EmptyDocument) {
    auto swagger = to_swagger_json(AggregateDocument());
    EXPECT_EQ(swagger["info"]["title"], "API Documentation");
    EXPECT_EQ(swagger["info"]["version"], "1.0.0");
    EXPECT_FALSE(swagger["info"].contains("description"));
    EXPECT_EQ(swagger["paths"], qb::json::object());
}
