#include <gtest/gtest.h>

#include "acp/protocol.hpp"

using namespace conductor::acp;

// --- JSON-RPC ---

TEST(JsonRpcTest, RequestSerialization) {
  JsonRpcRequest request{methods::kSessionNew, {{"cwd", "/tmp"}}, 7};
  auto j = request.to_json();

  EXPECT_EQ(j["jsonrpc"], "2.0");
  EXPECT_EQ(j["method"], "session/new");
  EXPECT_EQ(j["id"], 7);
  EXPECT_EQ(j["params"]["cwd"], "/tmp");
}

TEST(JsonRpcTest, NotificationHasNoId) {
  JsonRpcNotification notification{methods::kSessionCancel, {{"sessionId", "s1"}}};
  auto j = notification.to_json();

  EXPECT_EQ(j["method"], "session/cancel");
  EXPECT_FALSE(j.contains("id"));
}

TEST(JsonRpcTest, ResponseParsing) {
  auto ok = JsonRpcResponse::from_json(json::parse(R"({"jsonrpc":"2.0","id":3,"result":{"stopReason":"end_turn"}})"));
  EXPECT_EQ(ok.id, 3);
  EXPECT_TRUE(ok.ok());
  EXPECT_EQ((*ok.result)["stopReason"], "end_turn");

  auto err = JsonRpcResponse::from_json(
      json::parse(R"({"jsonrpc":"2.0","id":4,"error":{"code":-32000,"message":"boom","data":"details"}})"));
  EXPECT_FALSE(err.ok());
  EXPECT_EQ(err.error_message(), "boom: details");
}

TEST(JsonRpcTest, ErrorMessageWithoutMessageField) {
  JsonRpcResponse resp;
  resp.error = json{{"code", 1}};
  EXPECT_EQ(resp.error_message(), R"({"code":1})");
}

TEST(JsonRpcTest, ResponsesEchoId) {
  auto result = make_result_response("abc", {{"x", 1}});
  EXPECT_EQ(result["id"], "abc");
  EXPECT_EQ(result["result"]["x"], 1);

  auto error = make_error_response(5, error_codes::kMethodNotFound, "Method not found: fs/read");
  EXPECT_EQ(error["id"], 5);
  EXPECT_EQ(error["error"]["code"], -32601);
}

// --- Content ---

TEST(ContentTest, TextContent) {
  auto content = text_content("hello");
  ASSERT_EQ(content.size(), 1u);
  EXPECT_EQ(first_text(content), "hello");

  auto j = to_json(content);
  ASSERT_TRUE(j.is_array());
  EXPECT_EQ(j[0]["type"], "text");
  EXPECT_EQ(j[0]["text"], "hello");
}

TEST(ContentTest, FirstTextSkipsImages) {
  MessageContent content{ContentBlock::image_block("AAAA", "image/png"), ContentBlock::text_block("caption")};
  EXPECT_EQ(first_text(content), "caption");
  EXPECT_EQ(to_json(content)[0]["mimeType"], "image/png");

  EXPECT_EQ(first_text({}), "");
}

// --- Permission request ---

TEST(PermissionParamsTest, FromJson) {
  auto params = RequestPermissionParams::from_json(json::parse(R"({
    "sessionId": "proto-1",
    "toolCall": {"toolCallId": "tc-1", "title": "AskUserQuestion", "rawInput": {"questions": []}},
    "options": [
      {"optionId": "allow", "name": "Allow", "kind": "allow_once"},
      {"optionId": "reject"}
    ]
  })"));

  EXPECT_EQ(params.session_id, "proto-1");
  EXPECT_EQ(params.tool_call.tool_call_id, "tc-1");
  EXPECT_EQ(params.tool_call.title, "AskUserQuestion");
  EXPECT_FALSE(params.tool_call.status.has_value());
  EXPECT_TRUE(params.tool_call.raw_input.is_object());
  ASSERT_EQ(params.options.size(), 2u);
  EXPECT_EQ(params.options[0].kind, "allow_once");
  EXPECT_EQ(params.options[1].name, "reject");
  EXPECT_FALSE(params.options[1].kind.has_value());

  auto back = params.to_json();
  EXPECT_EQ(back["toolCall"]["title"], "AskUserQuestion");
}

TEST(PermissionParamsTest, MissingSessionIdThrows) {
  EXPECT_THROW(RequestPermissionParams::from_json(json::parse(R"({"toolCall": {}})")), json::exception);
}

// --- Session notification ---

TEST(SessionNotificationTest, UpdateType) {
  auto n = SessionNotification::from_json(
      json::parse(R"({"sessionId":"s","update":{"sessionUpdate":"agent_message_chunk","content":{"type":"text","text":"hi"}}})"));
  EXPECT_EQ(n.session_id, "s");
  EXPECT_EQ(n.update_type(), "agent_message_chunk");

  SessionNotification untagged{"s", json{{"foo", 1}}};
  EXPECT_EQ(untagged.update_type(), "");

  auto j = n.to_json();
  EXPECT_EQ(j["sessionId"], "s");
  EXPECT_EQ(j["update"]["content"]["text"], "hi");
}

TEST(InitializeResultTest, FromJson) {
  auto r = InitializeResult::from_json(json::parse(R"({"protocolVersion":1,"agentInfo":{"name":"x"}})"));
  EXPECT_EQ(r.protocol_version, 1);
  EXPECT_EQ(r.agent_info["name"], "x");
  EXPECT_TRUE(r.agent_capabilities.is_object());
}
