#include "mcp_tests.h"
#include "http_request.h"
#include "shared/test_harness.h"

using namespace LangMcp;

static QList<TestResult> testResults;

static bool testParsesGetWithQuery(TestContext& ctx) {
    QByteArray buffer("GET /message?sessionId=abc-123 HTTP/1.1\r\n"
                      "Host: localhost\r\n"
                      "X-Custom-Header:  value \r\n"
                      "\r\n");
    HttpRequest request;

    TEST_REQUIRE(ctx, parseHttpRequest(buffer, request) == ParseStatus::Complete, "Request should parse");
    TEST_ASSERT(ctx, request.method == "GET", "Method");
    TEST_ASSERT(ctx, request.path == "/message", QString("Path was %1").arg(request.path));
    TEST_ASSERT(ctx, request.query.queryItemValue("sessionId") == "abc-123", "Query value");
    TEST_ASSERT(ctx, request.header("x-custom-header") == "value", "Header values are trimmed");
    TEST_ASSERT(ctx, request.header("HOST") == "localhost", "Header lookup is case-insensitive");
    TEST_ASSERT(ctx, buffer.isEmpty(), "Consumed bytes removed from the buffer");
    return ctx.passed;
}

static bool testIncompleteInput(TestContext& ctx) {
    HttpRequest request;

    QByteArray partialHeaders("POST /message HTTP/1.1\r\nContent-Length: 10\r\n");
    TEST_ASSERT(ctx, parseHttpRequest(partialHeaders, request) == ParseStatus::Incomplete,
                "Headers without terminator are incomplete");

    QByteArray partialBody("POST /message HTTP/1.1\r\nContent-Length: 10\r\n\r\n{\"a\":");
    int before = partialBody.size();
    TEST_ASSERT(ctx, parseHttpRequest(partialBody, request) == ParseStatus::Incomplete,
                "Short body is incomplete");
    TEST_ASSERT(ctx, partialBody.size() == before, "Incomplete parse leaves the buffer alone");
    return ctx.passed;
}

static bool testBodyAndPipelinedBytes(TestContext& ctx) {
    QByteArray body("{\"jsonrpc\":\"2.0\"}");
    QByteArray buffer = "POST /message HTTP/1.1\r\nContent-Length: " + QByteArray::number(body.size()) +
                        "\r\n\r\n" + body + "GET /health HTTP/1.1\r\n\r\n";
    HttpRequest request;

    TEST_REQUIRE(ctx, parseHttpRequest(buffer, request) == ParseStatus::Complete, "First request should parse");
    TEST_ASSERT(ctx, request.method == "POST", "Method");
    TEST_ASSERT(ctx, request.body == body, "Body should match Content-Length");
    TEST_ASSERT(ctx, buffer.startsWith("GET /health"), "Pipelined request left in the buffer");

    HttpRequest next;
    TEST_REQUIRE(ctx, parseHttpRequest(buffer, next) == ParseStatus::Complete, "Second request should parse");
    TEST_ASSERT(ctx, next.path == "/health", "Second path");
    TEST_ASSERT(ctx, next.body.isEmpty(), "No body without Content-Length");
    return ctx.passed;
}

static bool testMalformedRequests(TestContext& ctx) {
    HttpRequest request;

    QByteArray noVersion("GET /health\r\n\r\n");
    TEST_ASSERT(ctx, parseHttpRequest(noVersion, request) == ParseStatus::Malformed, "Missing version");

    QByteArray badTarget("GET health HTTP/1.1\r\n\r\n");
    TEST_ASSERT(ctx, parseHttpRequest(badTarget, request) == ParseStatus::Malformed, "Target must be a path");

    QByteArray badHeader("GET /health HTTP/1.1\r\nno colon here\r\n\r\n");
    TEST_ASSERT(ctx, parseHttpRequest(badHeader, request) == ParseStatus::Malformed, "Header without colon");

    QByteArray badLength("POST /message HTTP/1.1\r\nContent-Length: ten\r\n\r\n");
    TEST_ASSERT(ctx, parseHttpRequest(badLength, request) == ParseStatus::Malformed, "Non-numeric Content-Length");

    QByteArray negativeLength("POST /message HTTP/1.1\r\nContent-Length: -4\r\n\r\n");
    TEST_ASSERT(ctx, parseHttpRequest(negativeLength, request) == ParseStatus::Malformed, "Negative Content-Length");
    return ctx.passed;
}

static bool testOversizedRequests(TestContext& ctx) {
    HttpRequest request;

    QByteArray hugeBody = "POST /message HTTP/1.1\r\nContent-Length: " +
                          QByteArray::number(kMaxHttpBodySize + 1) + "\r\n\r\n";
    TEST_ASSERT(ctx, parseHttpRequest(hugeBody, request) == ParseStatus::TooLarge,
                "Declared body over the limit is rejected before it arrives");

    QByteArray endlessHeaders = "GET /health HTTP/1.1\r\nX-Filler: " + QByteArray(kMaxHttpHeaderSize + 1, 'a');
    TEST_ASSERT(ctx, parseHttpRequest(endlessHeaders, request) == ParseStatus::TooLarge,
                "Unterminated headers over the limit are rejected");
    return ctx.passed;
}

static bool testResponseBuilder(TestContext& ctx) {
    QByteArray response = buildHttpResponse(202, "application/json", "{\"status\":\"queued\"}",
                                            {{"X-Session", "s1"}});

    TEST_ASSERT(ctx, response.startsWith("HTTP/1.1 202 Accepted\r\n"), "Status line");
    TEST_ASSERT(ctx, response.contains("Content-Type: application/json\r\n"), "Content type");
    TEST_ASSERT(ctx, response.contains("Content-Length: 19\r\n"), "Content length");
    TEST_ASSERT(ctx, response.contains("Access-Control-Allow-Origin: *\r\n"), "CORS header");
    TEST_ASSERT(ctx, response.contains("X-Session: s1\r\n"), "Extra header");
    TEST_ASSERT(ctx, response.endsWith("\r\n\r\n{\"status\":\"queued\"}"), "Body after blank line");

    QByteArray empty = buildHttpResponse(204, QByteArray(), QByteArray());
    TEST_ASSERT(ctx, empty.startsWith("HTTP/1.1 204 No Content\r\n"), "204 status line");
    TEST_ASSERT(ctx, !empty.contains("Content-Type"), "No content type without a body type");
    TEST_ASSERT(ctx, QByteArray(httpStatusText(413)) == "Payload Too Large", "413 text");
    return ctx.passed;
}

int runHttpRequestTests(int& totalTests, int& passedTests) {
    LangMcpLogger::instance().info("\n[HTTP Request Tests]");

    testResults.clear();

    RUN_TEST(testParsesGetWithQuery);
    RUN_TEST(testIncompleteInput);
    RUN_TEST(testBodyAndPipelinedBytes);
    RUN_TEST(testMalformedRequests);
    RUN_TEST(testOversizedRequests);
    RUN_TEST(testResponseBuilder);

    return LangMcpTest::summarizeResults("HTTP Request Tests", testResults, totalTests, passedTests);
}
