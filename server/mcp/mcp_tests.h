#ifndef LANGMCP_MCP_TESTS_H
#define LANGMCP_MCP_TESTS_H

// Each returns the number of failed tests and fills in the totals
int runToolRegistryTests(int& totalTests, int& passedTests);
int runToolDispatcherTests(int& totalTests, int& passedTests);
int runSessionTransportTests(int& totalTests, int& passedTests);
int runHttpRequestTests(int& totalTests, int& passedTests);
int runProtocolServerTests(int& totalTests, int& passedTests);
int runFrontDoorTests(int& totalTests, int& passedTests);
int runLspTests(int& totalTests, int& passedTests);

#endif // LANGMCP_MCP_TESTS_H
