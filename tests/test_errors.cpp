#include <gtest/gtest.h>

#include <string>

#include "acp/errors.hpp"

using conductor::acp::friendly_error_message;

TEST(FriendlyErrorTest, MissingEnvironmentVariable) {
  EXPECT_EQ(friendly_error_message("Error: Missing environment variables: GITHUB_TOKEN"),
            "MCP server requires environment variable: GITHUB_TOKEN");
}

TEST(FriendlyErrorTest, KnownCategories) {
  EXPECT_EQ(friendly_error_message("MaxFileReadTokenExceededError: too big"),
            "File is too large to read. Try reading smaller portions.");
  EXPECT_EQ(friendly_error_message("mcp-config-invalid"), "MCP server configuration is invalid. Check your settings.");
  EXPECT_EQ(friendly_error_message("connect ECONNREFUSED 127.0.0.1"),
            "Failed to connect to agent. Please check if the agent is running.");
  EXPECT_EQ(friendly_error_message("request timeout"), "Request timed out. Please try again.");
  EXPECT_EQ(friendly_error_message("Agent process exited"), "Agent process terminated unexpectedly.");
  EXPECT_EQ(friendly_error_message("HTTP 401 Unauthorized"), "Authentication failed. Please check your API credentials.");
  EXPECT_EQ(friendly_error_message("429 Too Many Requests"), "Rate limit exceeded. Please wait and try again.");
}

TEST(FriendlyErrorTest, FallbackUsesFirstLine) {
  EXPECT_EQ(friendly_error_message("  something odd happened  \nstack trace here"), "Agent error: something odd happened");
}

TEST(FriendlyErrorTest, FallbackTruncatesLongMessages) {
  std::string long_error(200, 'x');
  auto message = friendly_error_message(long_error);
  EXPECT_EQ(message, "Agent error: " + std::string(150, 'x') + "...");
}
