#include "mcp_tests.h"
#include "lsp_framing.h"
#include "lsp_reference_provider.h"
#include "shared/test_harness.h"
#include <QStandardPaths>
#include <QJsonArray>
#include <memory>
#ifndef Q_OS_WIN
#include <csignal>
#endif

using namespace LangMcp;
using LangMcpTest::waitFor;

static QList<TestResult> testResults;

static ReferenceQuery queryFor(const QString& uri, int line = 0, int character = 0) {
    ReferenceQuery query;
    query.location.uri = uri;
    query.location.line = line;
    query.location.character = character;
    return query;
}

static bool testEncodeCountsBytes(TestContext& ctx) {
    QJsonObject message{{"jsonrpc", "2.0"}, {"method", "x"}, {"params", QJsonObject{{"text", QString::fromUtf8("héllo")}}}};
    QByteArray frame = encodeLspMessage(message);

    int split = frame.indexOf("\r\n\r\n");
    TEST_REQUIRE(ctx, split > 0, "Frame has a header terminator");
    QByteArray body = frame.mid(split + 4);
    TEST_ASSERT(ctx, frame.startsWith("Content-Length: " + QByteArray::number(body.size()) + "\r\n"),
                "Content-Length counts UTF-8 bytes, not characters");
    return ctx.passed;
}

static bool testDecodeConcatenatedFrames(TestContext& ctx) {
    QByteArray buffer = encodeLspMessage(QJsonObject{{"id", 1}}) + encodeLspMessage(QJsonObject{{"id", 2}});
    QJsonObject message;

    TEST_REQUIRE(ctx, decodeLspMessage(buffer, message) == FrameStatus::Complete, "First frame");
    TEST_ASSERT(ctx, message.value("id").toInt() == 1, "First id");
    TEST_REQUIRE(ctx, decodeLspMessage(buffer, message) == FrameStatus::Complete, "Second frame");
    TEST_ASSERT(ctx, message.value("id").toInt() == 2, "Second id");
    TEST_ASSERT(ctx, buffer.isEmpty(), "Buffer fully consumed");
    TEST_ASSERT(ctx, decodeLspMessage(buffer, message) == FrameStatus::Incomplete, "Empty buffer is incomplete");
    return ctx.passed;
}

static bool testDecodePartialFrame(TestContext& ctx) {
    QByteArray frame = encodeLspMessage(QJsonObject{{"id", 3}, {"result", QJsonArray{}}});
    QByteArray buffer = frame.left(frame.size() - 5);
    QJsonObject message;

    TEST_ASSERT(ctx, decodeLspMessage(buffer, message) == FrameStatus::Incomplete, "Short body is incomplete");
    TEST_ASSERT(ctx, buffer.size() == frame.size() - 5, "Incomplete decode leaves the buffer alone");

    buffer.append(frame.right(5));
    TEST_ASSERT(ctx, decodeLspMessage(buffer, message) == FrameStatus::Complete, "Completes once the rest arrives");
    TEST_ASSERT(ctx, message.value("id").toInt() == 3, "Decoded id");
    return ctx.passed;
}

static bool testDecodeMalformedFrames(TestContext& ctx) {
    QJsonObject message;
    QString error;

    QByteArray noLength = QByteArray("Content-Type: application/json\r\n\r\n{}") + encodeLspMessage(QJsonObject{{"id", 4}});
    TEST_ASSERT(ctx, decodeLspMessage(noLength, message, &error) == FrameStatus::Malformed, "Missing Content-Length");
    TEST_ASSERT(ctx, !error.isEmpty(), "Error is reported");

    // "{}" left over from the bad frame is not a header; skip to the next real one
    noLength.remove(0, 2);
    TEST_ASSERT(ctx, decodeLspMessage(noLength, message) == FrameStatus::Complete, "Stream resynchronises");
    TEST_ASSERT(ctx, message.value("id").toInt() == 4, "Following frame decoded");

    QByteArray badJson("Content-Length: 5\r\n\r\n{oops");
    TEST_ASSERT(ctx, decodeLspMessage(badJson, message) == FrameStatus::Malformed, "Bad JSON body");
    TEST_ASSERT(ctx, badJson.isEmpty(), "Bad frame is consumed");
    return ctx.passed;
}

static bool testLanguageIds(TestContext& ctx) {
    TEST_ASSERT(ctx, LspReferenceProvider::languageIdForUri("file:///src/a.ts") == "typescript", "ts");
    TEST_ASSERT(ctx, LspReferenceProvider::languageIdForUri("file:///src/main.CPP") == "cpp", "Suffix is case-insensitive");
    TEST_ASSERT(ctx, LspReferenceProvider::languageIdForUri("file:///src/lib.rs") == "rust", "rs");
    TEST_ASSERT(ctx, LspReferenceProvider::languageIdForUri("file:///README") == "plaintext", "No suffix");
    return ctx.passed;
}

static bool testMissingServerFailsLookup(TestContext& ctx) {
    LspServerConfig config;
    config.command = "/nonexistent/langmcp-no-such-language-server";
    config.lookupTimeoutMs = 2000;
    LspReferenceProvider provider(config);

    bool answered = false;
    ProviderResult result;
    provider.findReferences(queryFor("file:///tmp/a.ts"), [&](const ProviderResult& r) {
        answered = true;
        result = r;
    });

    TEST_REQUIRE(ctx, waitFor([&]() { return answered; }), "Lookup should be answered");
    TEST_ASSERT(ctx, !result.ok, "Lookup should fail");
    TEST_ASSERT(ctx, result.error.contains("Failed to start"), QString("Unexpected error: %1").arg(result.error));
    TEST_ASSERT(ctx, provider.pendingLookups() == 0, "No lookups left pending");
    return ctx.passed;
}

static bool testSilentServerTimesOut(TestContext& ctx) {
    QString sleepPath = QStandardPaths::findExecutable("sleep");
    if (sleepPath.isEmpty()) {
        LangMcpLogger::instance().info("    (sleep not available, skipping)");
        return ctx.passed;
    }

    LspServerConfig config;
    config.command = sleepPath;
    config.arguments = {"30"};
    config.lookupTimeoutMs = 200;
    LspReferenceProvider provider(config);

    bool answered = false;
    ProviderResult result;
    provider.findReferences(queryFor("file:///tmp/a.ts"), [&](const ProviderResult& r) {
        answered = true;
        result = r;
    });

    TEST_REQUIRE(ctx, waitFor([&]() { return answered; }, 3000), "Lookup should time out");
    TEST_ASSERT(ctx, !result.ok, "Timed out lookup is a failure");
    TEST_ASSERT(ctx, result.error.contains("200 ms"), QString("Unexpected error: %1").arg(result.error));

    provider.shutdown();
    TEST_ASSERT(ctx, !provider.isRunning(), "Shutdown stops the process");
    return ctx.passed;
}

// cat echoes every request back, so each request is answered with the null
// result we give to server-initiated requests
static bool testEchoServerRoundTrip(TestContext& ctx) {
    QString catPath = QStandardPaths::findExecutable("cat");
    if (catPath.isEmpty()) {
        LangMcpLogger::instance().info("    (cat not available, skipping)");
        return ctx.passed;
    }

    LspServerConfig config;
    config.command = catPath;
    config.lookupTimeoutMs = 5000;
    LspReferenceProvider provider(config);

    int started = 0;
    QObject::connect(&provider, &LspReferenceProvider::serverStarted, [&]() { started++; });

    bool answered = false;
    ProviderResult result;
    provider.findReferences(queryFor("file:///tmp/langmcp-missing.ts"), [&](const ProviderResult& r) {
        answered = true;
        result = r;
    });

    TEST_REQUIRE(ctx, waitFor([&]() { return answered; }), "Lookup should complete");
    TEST_ASSERT(ctx, result.ok, QString("Lookup should succeed: %1").arg(result.error));
    TEST_ASSERT(ctx, result.locations.isEmpty(), "A null result means no locations");
    TEST_ASSERT(ctx, started == 1, "Server initialized once");

    provider.shutdown();
    TEST_ASSERT(ctx, !provider.isRunning(), "Shutdown stops the process");

    answered = false;
    provider.findReferences(queryFor("file:///tmp/langmcp-missing.ts"), [&](const ProviderResult& r) {
        answered = true;
        result = r;
    });
    TEST_REQUIRE(ctx, waitFor([&]() { return answered; }), "Lookup after restart should complete");
    TEST_ASSERT(ctx, result.ok, "Restarted server answers");
    TEST_ASSERT(ctx, started == 2, "Server was started again");

    provider.shutdown();
    return ctx.passed;
}

// A stopped cat takes the request but never answers it, so the lookup times out
// while its textDocument/references request is still outstanding
static bool testTimedOutLookupReleasesRequest(TestContext& ctx) {
#ifdef Q_OS_WIN
    return ctx.passed;
#else
    QString catPath = QStandardPaths::findExecutable("cat");
    if (catPath.isEmpty()) {
        LangMcpLogger::instance().info("    (cat not available, skipping)");
        return ctx.passed;
    }

    LspServerConfig config;
    config.command = catPath;
    config.lookupTimeoutMs = 1000;
    LspReferenceProvider provider(config);

    bool answered = false;
    ProviderResult result;
    provider.findReferences(queryFor("file:///tmp/langmcp-missing.ts"), [&](const ProviderResult& r) {
        answered = true;
        result = r;
    });
    TEST_REQUIRE(ctx, waitFor([&]() { return answered; }), "First lookup should complete");
    TEST_REQUIRE(ctx, result.ok, QString("First lookup should succeed: %1").arg(result.error));
    TEST_ASSERT(ctx, provider.pendingRequests() == 0, "Nothing outstanding after an answer");

    qint64 pid = provider.serverProcessId();
    TEST_REQUIRE(ctx, pid > 0 && ::kill(static_cast<pid_t>(pid), SIGSTOP) == 0, "Could not pause the server");

    answered = false;
    provider.findReferences(queryFor("file:///tmp/langmcp-missing.ts"), [&](const ProviderResult& r) {
        answered = true;
        result = r;
    });
    TEST_ASSERT(ctx, provider.pendingRequests() == 1, "Request outstanding while the server is paused");

    bool timedOut = waitFor([&]() { return answered; }, 5000);
    bool resumed = ::kill(static_cast<pid_t>(pid), SIGCONT) == 0;

    TEST_ASSERT(ctx, resumed, "Server resumed");
    TEST_REQUIRE(ctx, timedOut, "Lookup should time out");
    TEST_ASSERT(ctx, !result.ok, "Timed out lookup is a failure");
    TEST_ASSERT(ctx, provider.pendingRequests() == 0, "Timed out request is forgotten");
    TEST_ASSERT(ctx, provider.pendingLookups() == 0, "No lookups left pending");

    provider.shutdown();
    return ctx.passed;
#endif
}

int runLspTests(int& totalTests, int& passedTests) {
    LangMcpLogger::instance().info("\n[Language Server Tests]");

    testResults.clear();

    RUN_TEST(testEncodeCountsBytes);
    RUN_TEST(testDecodeConcatenatedFrames);
    RUN_TEST(testDecodePartialFrame);
    RUN_TEST(testDecodeMalformedFrames);
    RUN_TEST(testLanguageIds);
    RUN_TEST(testMissingServerFailsLookup);
    RUN_TEST(testSilentServerTimesOut);
    RUN_TEST(testEchoServerRoundTrip);
    RUN_TEST(testTimedOutLookupReleasesRequest);

    return LangMcpTest::summarizeResults("Language Server Tests", testResults, totalTests, passedTests);
}
