#include "mcp_tests.h"
#include "mcpserver_sse.h"
#include "test_support.h"
#include "shared/test_harness.h"
#include <memory>

using namespace LangMcp;
using LangMcpTest::FakeReferenceProvider;
using LangMcpTest::RecordingChannel;
using LangMcpTest::findUsagesArguments;
using LangMcpTest::makeLocation;
using LangMcpTest::resultArray;

static QList<TestResult> testResults;

static QJsonObject request(const QJsonValue& id, const QString& method, const QJsonObject& params = {}) {
    QJsonObject message{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
    if (!params.isEmpty()) {
        message["params"] = params;
    }
    return message;
}

struct ServerFixture {
    std::shared_ptr<FakeReferenceProvider> provider = std::make_shared<FakeReferenceProvider>();
    MCPServerSse server{ToolRegistry::createDefault(), provider};
    std::shared_ptr<RecordingChannel> channel = std::make_shared<RecordingChannel>("s1");

    DispatchOutcome send(const QJsonObject& message) { return server.handleMessage(message, channel); }
};

static bool testInitializeHandshake(TestContext& ctx) {
    ServerFixture fixture;

    DispatchOutcome outcome = fixture.send(request(1, "initialize", QJsonObject{
        {"protocolVersion", "2024-11-05"},
        {"clientInfo", QJsonObject{{"name", "harness"}, {"version", "1.0"}}}
    }));

    TEST_ASSERT(ctx, outcome.ok, "initialize should succeed");
    TEST_REQUIRE(ctx, fixture.channel->sent.size() == 1, "One response expected");

    QJsonObject response = fixture.channel->sent.first();
    QJsonObject result = response.value("result").toObject();
    TEST_ASSERT(ctx, response.value("jsonrpc").toString() == "2.0", "jsonrpc version");
    TEST_ASSERT(ctx, response.value("id").toInt() == 1, "Response id matches");
    TEST_ASSERT(ctx, result.value("protocolVersion").toString() == "2024-11-05", "Protocol version");
    TEST_ASSERT(ctx, result.value("capabilities").toObject().contains("tools"), "Advertises tools");
    TEST_ASSERT(ctx, result.value("serverInfo").toObject().value("name").toString() == "language-tools",
                "Server name");
    TEST_ASSERT(ctx, !fixture.server.isInitialized(), "Not initialized until the client confirms");

    outcome = fixture.send(QJsonObject{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    TEST_ASSERT(ctx, outcome.ok, "Notification accepted");
    TEST_ASSERT(ctx, fixture.server.isInitialized(), "Initialized after the notification");
    TEST_ASSERT(ctx, fixture.channel->sent.size() == 1, "Notifications get no response");
    return ctx.passed;
}

static bool testToolsListed(TestContext& ctx) {
    ServerFixture fixture;
    fixture.send(request("list-1", "tools/list"));

    TEST_REQUIRE(ctx, fixture.channel->sent.size() == 1, "One response expected");
    QJsonObject response = fixture.channel->sent.first();
    QJsonArray tools = response.value("result").toObject().value("tools").toArray();

    TEST_ASSERT(ctx, response.value("id").toString() == "list-1", "String ids are echoed");
    TEST_REQUIRE(ctx, tools.size() == 1, "Exactly one tool");
    QJsonObject tool = tools.first().toObject();
    TEST_ASSERT(ctx, tool.value("name").toString() == "find_usages", "Tool name");
    TEST_ASSERT(ctx, tool.value("inputSchema").toObject().value("type").toString() == "object", "Schema type");
    return ctx.passed;
}

static bool testToolCallSucceeds(TestContext& ctx) {
    ServerFixture fixture;
    fixture.provider->result = ProviderResult::success({makeLocation("file:///b.ts", 3)});

    fixture.send(request(5, "tools/call", QJsonObject{
        {"name", "find_usages"},
        {"arguments", findUsagesArguments("file:///a.ts", 1, 2)}
    }));

    TEST_REQUIRE(ctx, fixture.channel->sent.size() == 1, "One response expected");
    QJsonObject result = fixture.channel->sent.first().value("result").toObject();
    TEST_ASSERT(ctx, result.value("isError").toBool(true) == false, "isError should be false");

    QString text = result.value("content").toArray().first().toObject().value("text").toString();
    QJsonArray refs = resultArray(text);
    TEST_REQUIRE(ctx, refs.size() == 1, QString("One reference expected in %1").arg(text));
    TEST_ASSERT(ctx, refs.first().toObject().value("uri").toString() == "file:///b.ts", "Reference uri");
    return ctx.passed;
}

static bool testToolErrorsAreResults(TestContext& ctx) {
    ServerFixture fixture;

    fixture.send(request(6, "tools/call", QJsonObject{{"name", "unknown_tool"}, {"arguments", QJsonObject{}}}));
    TEST_REQUIRE(ctx, fixture.channel->sent.size() == 1, "One response expected");

    QJsonObject response = fixture.channel->sent.first();
    TEST_ASSERT(ctx, !response.contains("error"), "Tool errors are not JSON-RPC errors");
    QJsonObject result = response.value("result").toObject();
    TEST_ASSERT(ctx, result.value("isError").toBool(), "isError should be true");
    QString text = result.value("content").toArray().first().toObject().value("text").toString();
    TEST_ASSERT(ctx, text.contains("Unknown tool: unknown_tool"), QString("Unexpected text: %1").arg(text));

    fixture.send(request(7, "tools/call", QJsonObject{{"arguments", QJsonObject{}}}));
    TEST_REQUIRE(ctx, fixture.channel->sent.size() == 2, "Missing name still answered");
    QJsonObject missing = fixture.channel->sent.last().value("error").toObject();
    TEST_ASSERT(ctx, missing.value("code").toInt() == MCPServerSse::INVALID_PARAMS, "Missing name is -32602");
    return ctx.passed;
}

static bool testUnknownMethod(TestContext& ctx) {
    ServerFixture fixture;
    DispatchOutcome outcome = fixture.send(request(8, "prompts/list"));

    TEST_ASSERT(ctx, outcome.ok, "Unknown methods are answered, not rejected");
    TEST_REQUIRE(ctx, fixture.channel->sent.size() == 1, "One response expected");
    QJsonObject error = fixture.channel->sent.first().value("error").toObject();
    TEST_ASSERT(ctx, error.value("code").toInt() == -32601, "Method not found code");
    TEST_ASSERT(ctx, error.value("message").toString() == "Method not found: prompts/list", "Method not found text");
    return ctx.passed;
}

static bool testPingAndResources(TestContext& ctx) {
    ServerFixture fixture;
    fixture.send(request(9, "ping"));
    fixture.send(request(10, "resources/list"));

    TEST_REQUIRE(ctx, fixture.channel->sent.size() == 2, "Two responses expected");
    TEST_ASSERT(ctx, fixture.channel->sent.at(0).value("result").toObject().isEmpty(), "Ping result is empty");
    TEST_ASSERT(ctx, fixture.channel->sent.at(1).value("result").toObject().value("resources").toArray().isEmpty(),
                "No resources");
    return ctx.passed;
}

static bool testInvalidEnvelopes(TestContext& ctx) {
    ServerFixture fixture;

    DispatchOutcome wrongVersion = fixture.send(QJsonObject{{"jsonrpc", "1.0"}, {"id", 1}, {"method", "ping"}});
    TEST_ASSERT(ctx, !wrongVersion.ok, "Wrong jsonrpc version rejected");

    DispatchOutcome noMethod = fixture.send(QJsonObject{{"jsonrpc", "2.0"}, {"id", 2}});
    TEST_ASSERT(ctx, !noMethod.ok, "Missing method rejected");

    DispatchOutcome numericMethod = fixture.send(QJsonObject{{"jsonrpc", "2.0"}, {"id", 3}, {"method", 42}});
    TEST_ASSERT(ctx, !numericMethod.ok, "Non-string method rejected");

    DispatchOutcome clientResponse = fixture.send(QJsonObject{{"jsonrpc", "2.0"}, {"id", 4}, {"result", QJsonObject{}}});
    TEST_ASSERT(ctx, clientResponse.ok, "Client responses are accepted silently");
    TEST_ASSERT(ctx, fixture.channel->sent.isEmpty(), "None of these produce a response");
    return ctx.passed;
}

static bool testClosedChannelDropsResponse(TestContext& ctx) {
    ServerFixture fixture;
    fixture.channel->open = false;

    DispatchOutcome outcome = fixture.send(request(11, "ping"));
    TEST_ASSERT(ctx, outcome.ok, "Dropping a response is not a dispatch failure");
    TEST_ASSERT(ctx, fixture.channel->sent.isEmpty(), "Nothing written to a closed channel");

    DispatchOutcome detached = fixture.server.handleMessage(request(12, "ping"), nullptr);
    TEST_ASSERT(ctx, detached.ok, "A missing channel is tolerated");
    return ctx.passed;
}

static bool testDeferredResultAfterClose(TestContext& ctx) {
    ServerFixture fixture;
    fixture.provider->deferAnswer = true;

    fixture.send(request(13, "tools/call", QJsonObject{
        {"name", "find_usages"},
        {"arguments", findUsagesArguments("file:///a.ts", 0, 0)}
    }));
    TEST_REQUIRE(ctx, fixture.provider->deferred.size() == 1, "Lookup should be pending");

    fixture.channel->close();
    fixture.provider->deferred.first()(ProviderResult::success({}));
    TEST_ASSERT(ctx, fixture.channel->sent.isEmpty(), "A late result for a closed session is dropped");
    return ctx.passed;
}

int runProtocolServerTests(int& totalTests, int& passedTests) {
    LangMcpLogger::instance().info("\n[Protocol Server Tests]");

    testResults.clear();

    RUN_TEST(testInitializeHandshake);
    RUN_TEST(testToolsListed);
    RUN_TEST(testToolCallSucceeds);
    RUN_TEST(testToolErrorsAreResults);
    RUN_TEST(testUnknownMethod);
    RUN_TEST(testPingAndResources);
    RUN_TEST(testInvalidEnvelopes);
    RUN_TEST(testClosedChannelDropsResponse);
    RUN_TEST(testDeferredResultAfterClose);

    return LangMcpTest::summarizeResults("Protocol Server Tests", testResults, totalTests, passedTests);
}
