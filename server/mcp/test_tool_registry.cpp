#include "mcp_tests.h"
#include "tool_registry.h"
#include "shared/test_harness.h"

using namespace LangMcp;

static QList<TestResult> testResults;

static bool testDefaultRegistryListsFindUsages(TestContext& ctx) {
    ToolRegistry registry = ToolRegistry::createDefault();
    QList<ToolDescriptor> tools = registry.listTools();

    TEST_REQUIRE(ctx, tools.size() == 1, "Exactly one tool should be registered");
    TEST_ASSERT(ctx, tools.first().name == "find_usages", "The tool should be find_usages");
    TEST_ASSERT(ctx, tools.first().description.startsWith("Finds all references"),
                "Description should explain the tool");
    TEST_ASSERT(ctx, registry.find("find_usages") != nullptr, "find() should resolve the tool");
    TEST_ASSERT(ctx, registry.find("unknown_tool") == nullptr, "find() should reject unknown names");
    return ctx.passed;
}

static bool testInputSchemaShape(TestContext& ctx) {
    QJsonObject tool = ToolRegistry::createDefault().toJson().first().toObject();
    QJsonObject schema = tool.value("inputSchema").toObject();

    TEST_ASSERT(ctx, tool.value("name").toString() == "find_usages", "Serialized name");
    TEST_ASSERT(ctx, schema.value("type").toString() == "object", "Root should be an object");
    TEST_ASSERT(ctx, schema.value("required").toArray() == QJsonArray({"textDocument", "position"}),
                "textDocument and position should be required");

    QJsonObject props = schema.value("properties").toObject();
    QJsonObject uri = props.value("textDocument").toObject().value("properties").toObject().value("uri").toObject();
    TEST_ASSERT(ctx, uri.value("type").toString() == "string", "uri should be a string");
    TEST_ASSERT(ctx, props.value("textDocument").toObject().value("required").toArray() == QJsonArray({"uri"}),
                "uri should be required inside textDocument");

    QJsonObject position = props.value("position").toObject();
    TEST_ASSERT(ctx, position.value("required").toArray() == QJsonArray({"line", "character"}),
                "line and character should be required");
    TEST_ASSERT(ctx, position.value("properties").toObject().value("line").toObject().value("type").toString() == "number",
                "line should be a number");

    QJsonObject include = props.value("context").toObject().value("properties").toObject()
        .value("includeDeclaration").toObject();
    TEST_ASSERT(ctx, include.value("type").toString() == "boolean", "includeDeclaration should be a boolean");
    TEST_ASSERT(ctx, include.value("default").toBool(false) == true, "includeDeclaration should default to true");
    TEST_ASSERT(ctx, !props.value("context").toObject().contains("required"), "context has no required fields");
    return ctx.passed;
}

static bool testListingIsStable(TestContext& ctx) {
    ToolRegistry registry = ToolRegistry::createDefault();
    QJsonArray first = registry.toJson();
    QJsonArray second = registry.toJson();

    TEST_ASSERT(ctx, first == second, "Repeated listings should be identical");
    TEST_ASSERT(ctx, ToolRegistry::createDefault().toJson() == first, "A fresh registry should list the same tools");
    return ctx.passed;
}

static bool testValidationAcceptsMinimalArguments(TestContext& ctx) {
    const ToolDescriptor* tool = ToolRegistry::createDefault().find("find_usages");
    TEST_REQUIRE(ctx, tool != nullptr, "find_usages should exist");

    QJsonObject args{
        {"textDocument", QJsonObject{{"uri", "file:///a.ts"}}},
        {"position", QJsonObject{{"line", 0}, {"character", 0}}}
    };
    QString error = validateToolArguments(tool->inputContract, args);
    TEST_ASSERT(ctx, error.isEmpty(), QString("Minimal arguments should validate, got: %1").arg(error));

    args["context"] = QJsonObject{{"includeDeclaration", false}};
    error = validateToolArguments(tool->inputContract, args);
    TEST_ASSERT(ctx, error.isEmpty(), "Optional context should validate");
    return ctx.passed;
}

static bool testValidationNamesTheField(TestContext& ctx) {
    ToolRegistry registry = ToolRegistry::createDefault();
    const SchemaProperty& contract = registry.find("find_usages")->inputContract;

    QString missingDocument = validateToolArguments(contract, QJsonObject{
        {"position", QJsonObject{{"line", 0}, {"character", 0}}}
    });
    TEST_ASSERT(ctx, missingDocument == "textDocument.uri is required.",
                QString("Missing textDocument should name the uri, got: %1").arg(missingDocument));

    QString missingUri = validateToolArguments(contract, QJsonObject{
        {"textDocument", QJsonObject{}},
        {"position", QJsonObject{{"line", 0}, {"character", 0}}}
    });
    TEST_ASSERT(ctx, missingUri == "textDocument.uri is required.",
                QString("Missing uri, got: %1").arg(missingUri));

    QString badLine = validateToolArguments(contract, QJsonObject{
        {"textDocument", QJsonObject{{"uri", "file:///a.ts"}}},
        {"position", QJsonObject{{"line", "three"}, {"character", 0}}}
    });
    TEST_ASSERT(ctx, badLine == "position.line must be a number.",
                QString("String line, got: %1").arg(badLine));

    QString badContext = validateToolArguments(contract, QJsonObject{
        {"textDocument", QJsonObject{{"uri", "file:///a.ts"}}},
        {"position", QJsonObject{{"line", 1}, {"character", 0}}},
        {"context", QJsonObject{{"includeDeclaration", "yes"}}}
    });
    TEST_ASSERT(ctx, badContext == "context.includeDeclaration must be a boolean.",
                QString("String includeDeclaration, got: %1").arg(badContext));

    QString notObject = validateToolArguments(contract, QJsonValue(42));
    TEST_ASSERT(ctx, notObject == "arguments must be an object.",
                QString("Non-object arguments, got: %1").arg(notObject));
    return ctx.passed;
}

int runToolRegistryTests(int& totalTests, int& passedTests) {
    LangMcpLogger::instance().info("\n[Tool Registry Tests]");

    testResults.clear();

    RUN_TEST(testDefaultRegistryListsFindUsages);
    RUN_TEST(testInputSchemaShape);
    RUN_TEST(testListingIsStable);
    RUN_TEST(testValidationAcceptsMinimalArguments);
    RUN_TEST(testValidationNamesTheField);

    return LangMcpTest::summarizeResults("Tool Registry Tests", testResults, totalTests, passedTests);
}
