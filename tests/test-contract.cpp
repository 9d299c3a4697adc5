#include <gtest/gtest.h>
#include "../openapi/contract.h"
#include "../openapi/annotation.h"
#include "../routing/interceptor.h"
#include <qb/json.h>

#include <memory>
#include <stdexcept>

using namespace qb::swagger;
using namespace qb::swagger::openapi;

// --- Declaration parsing ---

TEST(ContractTest, ParsesDeclaration) {
    auto contract = Contract::from_json(qb::json::parse(R"({
        "summary": "Update an item",
        "description": "Requires id on path",
        "consumes": ["application/json", "application/json", "text/plain"],
        "parameters": {
            "path": {"type": "object", "properties": {"id": {"type": "integer"}}, "required": ["id"]},
            "formData": {"type": "object"}
        },
        "responses": {
            "200": {"description": "Updated", "schema": {"type": "string"}},
            "default": {"headers": {"type": "object"}}
        }
    })"));

    EXPECT_EQ(contract.summary, "Update an item");
    EXPECT_EQ(contract.description, "Requires id on path");
    EXPECT_EQ(contract.consumes, (std::vector<std::string>{"application/json", "text/plain"}));
    ASSERT_EQ(contract.parameters.size(), 2u);
    EXPECT_TRUE(contract.parameters.count(ParameterLocation::PATH));
    EXPECT_TRUE(contract.parameters.count(ParameterLocation::FORM_DATA));
    ASSERT_EQ(contract.responses.size(), 2u);
    EXPECT_EQ(contract.responses.at(200).description, "Updated");
    EXPECT_EQ(contract.responses.at(200).schema, qb::json::parse(R"({"type": "string"})"));
    EXPECT_TRUE(contract.responses.at(DEFAULT_RESPONSE).schema.is_null());
    EXPECT_FALSE(contract.responses.at(DEFAULT_RESPONSE).headers.is_null());
}

TEST(ContractTest, ToJsonRoundTripsDeclaration) {
    auto declaration = qb::json::parse(R"({
        "summary": "s",
        "parameters": {"query": {"type": "object"}},
        "responses": {"404": {"description": "gone"}, "default": {}}
    })");
    auto contract = Contract::from_json(declaration);
    EXPECT_EQ(contract.to_json(), declaration);
    EXPECT_EQ(Contract::from_json(contract.to_json()), contract);
}

TEST(ContractTest, RejectsMalformedDeclarations) {
    EXPECT_THROW((void) Contract::from_json(qb::json::array()), std::invalid_argument);
    EXPECT_THROW((void) Contract::from_json(qb::json::parse(R"({"summary": 3})")), std::invalid_argument);
    EXPECT_THROW((void) Contract::from_json(qb::json::parse(R"({"consumes": "text/plain"})")), std::invalid_argument);
    EXPECT_THROW((void) Contract::from_json(qb::json::parse(R"({"parameters": {"cookie": {}}})")),
                 std::invalid_argument);
    EXPECT_THROW((void) Contract::from_json(qb::json::parse(R"({"responses": {"2xx": {}}})")),
                 std::invalid_argument);
    EXPECT_THROW((void) Contract::from_json(qb::json::parse(R"({"responses": {"99": {}}})")),
                 std::invalid_argument);
}

TEST(ContractTest, LocationNames) {
    EXPECT_EQ(to_string(ParameterLocation::FORM_DATA), "formData");
    EXPECT_EQ(parse_location("header"), ParameterLocation::HEADER);
    EXPECT_THROW((void) parse_location("cookie"), std::invalid_argument);
}

// --- Merging ---

TEST(ContractMergeTest, ParameterSchemasUnionPropertiesAndRequired) {
    auto outer = qb::json::parse(R"({
        "type": "object",
        "properties": {"auth": {"type": "string"}, "trace": {"type": "string"}},
        "required": ["auth"]
    })");
    auto inner = qb::json::parse(R"({
        "properties": {"trace": {"type": "integer"}, "lang": {"type": "string"}},
        "required": ["lang", "auth"],
        "description": "inner"
    })");
    auto merged = merge_parameter_schema(outer, inner);
    EXPECT_EQ(merged["type"], "object");
    EXPECT_EQ(merged["description"], "inner");
    EXPECT_EQ(merged["properties"]["trace"]["type"], "integer");
    EXPECT_TRUE(merged["properties"].contains("auth"));
    EXPECT_TRUE(merged["properties"].contains("lang"));
    EXPECT_EQ(merged["required"], qb::json::parse(R"(["auth", "lang"])"));
}

TEST(ContractMergeTest, LeafWinsScalarsAndUnionsCollections) {
    auto ambient = Contract::from_json(qb::json::parse(R"({
        "description": "Requires auth",
        "summary": "ambient",
        "consumes": ["application/json"],
        "parameters": {"header": {"type": "object", "properties": {"auth": {"type": "string"}}, "required": ["auth"]}},
        "responses": {"422": {}, "500": {"description": "Boom"}}
    })"));
    auto leaf = Contract::from_json(qb::json::parse(R"({
        "summary": "leaf",
        "consumes": ["application/edn", "application/json"],
        "parameters": {"path": {"type": "object"}},
        "responses": {"200": {"schema": {"type": "string"}}, "500": {"schema": {"type": "object"}}}
    })"));

    auto merged = merge(ambient, leaf);
    EXPECT_EQ(merged.description, "Requires auth");
    EXPECT_EQ(merged.summary, "leaf");
    EXPECT_EQ(merged.consumes, (std::vector<std::string>{"application/json", "application/edn"}));
    EXPECT_EQ(merged.parameters.size(), 2u);
    ASSERT_EQ(merged.responses.size(), 3u);
    EXPECT_EQ(merged.responses.at(500).description, "Boom");
    EXPECT_EQ(merged.responses.at(500).schema, qb::json::parse(R"({"type": "object"})"));
}

TEST(ContractMergeTest, EmptyContractIsNeutral) {
    auto contract = Contract::from_json(qb::json::parse(R"({"summary": "x", "responses": {"200": {}}})"));
    EXPECT_TRUE(Contract().empty());
    EXPECT_EQ(merge(Contract(), contract), contract);
    EXPECT_EQ(merge(contract, Contract()), contract);
}

// --- Annotation ---

TEST(AnnotationTest, AnnotateWrapsAndForwards) {
    int entered = 0;
    InterceptorPtr plain = std::make_shared<FunctionalInterceptor>("plain", [&entered](Context &) { ++entered; });
    EXPECT_EQ(annotation(*plain), nullptr);

    Contract contract;
    contract.summary = "documented";
    auto annotated = annotate(contract, plain);
    ASSERT_NE(annotation(*annotated), nullptr);
    EXPECT_EQ(annotation(*annotated)->summary, "documented");
    EXPECT_EQ(annotated->name(), "plain");

    Context ctx(Request(Method::GET, "/"));
    annotated->enter(ctx);
    EXPECT_EQ(entered, 1);
}

TEST(AnnotationTest, AnnotatingTwiceMergesInsteadOfNesting) {
    auto plain = std::make_shared<FunctionalInterceptor>("plain", [](Context &) {});

    Contract first;
    first.summary = "first";
    first.description = "kept";
    Contract second;
    second.summary = "second";

    auto twice = annotate(second, annotate(first, plain));
    auto wrapper = std::dynamic_pointer_cast<AnnotatedInterceptor>(twice);
    ASSERT_NE(wrapper, nullptr);
    EXPECT_EQ(wrapper->inner().get(), static_cast<IInterceptor *>(plain.get()));
    EXPECT_EQ(annotation(*twice)->summary, "second");
    EXPECT_EQ(annotation(*twice)->description, "kept");
}

TEST(AnnotationTest, NullInterceptorIsRejected) {
    EXPECT_THROW((void) annotate(Contract(), nullptr), std::invalid_argument);
}
