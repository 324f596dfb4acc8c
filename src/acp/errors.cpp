#include "acp/errors.hpp"

#include <regex>

namespace conductor::acp {

namespace {

bool contains(const std::string& haystack, const char* needle) {
  return haystack.find(needle) != std::string::npos;
}

std::string trim(const std::string& s) {
  auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return "";
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

}  // namespace

std::string friendly_error_message(const std::string& error) {
  if (contains(error, "Missing environment variables")) {
    static const std::regex pattern("Missing environment variables: ([A-Z_]+)");
    std::smatch match;
    std::string var = std::regex_search(error, match, pattern) ? match[1].str() : "unknown";
    return "MCP server requires environment variable: " + var;
  }

  if (contains(error, "MaxFileReadTokenExceededError")) {
    return "File is too large to read. Try reading smaller portions.";
  }

  if (contains(error, "mcp-config-invalid")) {
    return "MCP server configuration is invalid. Check your settings.";
  }

  if (contains(error, "ECONNREFUSED") || contains(error, "ECONNRESET")) {
    return "Failed to connect to agent. Please check if the agent is running.";
  }

  if (contains(error, "ETIMEDOUT") || contains(error, "timeout")) {
    return "Request timed out. Please try again.";
  }

  if (contains(error, "process exited") || contains(error, "spawn")) {
    return "Agent process terminated unexpectedly.";
  }

  if (contains(error, "401") || contains(error, "authentication") || contains(error, "API key")) {
    return "Authentication failed. Please check your API credentials.";
  }

  if (contains(error, "429") || contains(error, "rate limit")) {
    return "Rate limit exceeded. Please wait and try again.";
  }

  // First line only, capped at 150 characters
  std::string first_line = trim(error.substr(0, error.find('\n')));
  if (first_line.size() > 150) {
    first_line = first_line.substr(0, 150) + "...";
  }
  return "Agent error: " + first_line;
}

}  // namespace conductor::acp
