#include <gtest/gtest.h>

#include <string>

#include "helpers/fake_session_ops.hpp"
#include "helpers/manual_scheduler.hpp"
#include "permission/question_tool_guard.hpp"

using namespace conductor;
using conductor::testing::FakeSessionOps;
using conductor::testing::ManualScheduler;
using namespace std::chrono_literals;

namespace {

json question_update(const std::string& tool_call_id, const std::string& status = "in_progress") {
  return json{
      {"sessionUpdate", "tool_call_update"},
      {"toolCallId", tool_call_id},
      {"title", "question"},
      {"status", status},
      {"rawInput",
       {{"questions",
         {
             {{"question", "Which database?"}, {"options", {{{"label", "Postgres"}}, {{"label", "SQLite"}}}}},
             {{"question", "Add tests?"}},
         }}}},
  };
}

}  // namespace

class QuestionToolGuardTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ops_.sessions["proto-1"] = "durable-1";
  }

  ManualScheduler scheduler_;
  FakeSessionOps ops_{scheduler_};
  TimingConfig timing_;
  QuestionToolGuard guard_{scheduler_, ops_, timing_};
};

// ============================================================
// 触发条件
// ============================================================

TEST_F(QuestionToolGuardTest, IgnoresOtherUpdates) {
  auto wrong_type = question_update("tc-1");
  wrong_type["sessionUpdate"] = "tool_call";
  EXPECT_FALSE(guard_.handle_tool_update("proto-1", wrong_type));

  auto wrong_title = question_update("tc-1");
  wrong_title["title"] = "AskUserQuestion";
  EXPECT_FALSE(guard_.handle_tool_update("proto-1", wrong_title));

  EXPECT_FALSE(guard_.handle_tool_update("proto-1", question_update("tc-1", "completed")));
  EXPECT_FALSE(guard_.handle_tool_update("proto-1", json::object()));

  scheduler_.advance(1s);
  EXPECT_TRUE(ops_.cancels.empty());
  EXPECT_EQ(guard_.handled_count(), 0u);
}

TEST_F(QuestionToolGuardTest, UnresolvableSessionIsNoop) {
  EXPECT_FALSE(guard_.handle_tool_update("proto-unknown", question_update("tc-1")));
  EXPECT_FALSE(guard_.is_handled("tc-1"));

  scheduler_.advance(1s);
  EXPECT_TRUE(ops_.cancels.empty());
  EXPECT_TRUE(ops_.prompts.empty());
}

// ============================================================
// 取消并重新提示
// ============================================================

TEST_F(QuestionToolGuardTest, CancelsThenNotifiesAgent) {
  EXPECT_TRUE(guard_.handle_tool_update("proto-1", question_update("tc-1")));
  EXPECT_TRUE(guard_.is_handled("tc-1"));

  // Nothing happens synchronously
  EXPECT_TRUE(ops_.cancels.empty());

  scheduler_.run();
  EXPECT_EQ(ops_.cancels, std::vector<SessionId>{"durable-1"});
  EXPECT_TRUE(ops_.prompts.empty());

  scheduler_.advance(timing_.question_settle_delay - 1ms);
  EXPECT_TRUE(ops_.prompts.empty());

  scheduler_.advance(1ms);
  ASSERT_EQ(ops_.prompts.size(), 1u);
  EXPECT_EQ(ops_.prompts[0].session_id, "durable-1");
  EXPECT_TRUE(ops_.prompts[0].internal);
  EXPECT_NE(ops_.prompts[0].text.find("1. Which database?\n   Options: Postgres, SQLite\n2. Add tests?"),
            std::string::npos);
  EXPECT_NE(ops_.prompts[0].text.find("You tried to ask:"), std::string::npos);
}

TEST_F(QuestionToolGuardTest, DeduplicatesWithinRetention) {
  EXPECT_TRUE(guard_.handle_tool_update("proto-1", question_update("tc-1")));
  EXPECT_FALSE(guard_.handle_tool_update("proto-1", question_update("tc-1")));
  scheduler_.advance(1s);

  EXPECT_EQ(ops_.cancels.size(), 1u);
  EXPECT_EQ(ops_.prompts.size(), 1u);

  // 保留期过后同一个 toolCallId 会再次触发
  scheduler_.advance(timing_.handled_retention);
  EXPECT_FALSE(guard_.is_handled("tc-1"));
  EXPECT_EQ(guard_.handled_count(), 0u);

  EXPECT_TRUE(guard_.handle_tool_update("proto-1", question_update("tc-1")));
  scheduler_.advance(1s);
  EXPECT_EQ(ops_.cancels.size(), 2u);
  EXPECT_EQ(ops_.prompts.size(), 2u);
}

TEST_F(QuestionToolGuardTest, DistinctToolCallsAreIndependent) {
  EXPECT_TRUE(guard_.handle_tool_update("proto-1", question_update("tc-1")));
  EXPECT_TRUE(guard_.handle_tool_update("proto-1", question_update("tc-2")));
  EXPECT_EQ(guard_.handled_count(), 2u);

  scheduler_.advance(1s);
  EXPECT_EQ(ops_.prompts.size(), 2u);
}

TEST_F(QuestionToolGuardTest, CancelFailureSkipsPrompt) {
  ops_.fail_cancel = true;

  EXPECT_TRUE(guard_.handle_tool_update("proto-1", question_update("tc-1")));
  scheduler_.advance(1s);

  EXPECT_EQ(ops_.cancels.size(), 1u);
  EXPECT_TRUE(ops_.prompts.empty());
}

TEST_F(QuestionToolGuardTest, ConfigurableToolTitle) {
  TimingConfig timing;
  timing.hang_guard_tool = "ask";
  QuestionToolGuard guard(scheduler_, ops_, timing);

  auto update = question_update("tc-9");
  EXPECT_FALSE(guard.handle_tool_update("proto-1", update));
  update["title"] = "ask";
  EXPECT_TRUE(guard.handle_tool_update("proto-1", update));
}

TEST_F(QuestionToolGuardTest, DestroyedGuardDropsBackgroundWork) {
  {
    QuestionToolGuard guard(scheduler_, ops_, timing_);
    EXPECT_TRUE(guard.handle_tool_update("proto-1", question_update("tc-1")));
  }
  EXPECT_NO_THROW(scheduler_.advance(2min));
  EXPECT_TRUE(ops_.cancels.empty());
}

// ============================================================
// 文本格式
// ============================================================

TEST(QuestionToolGuardFormatTest, FormatQuestions) {
  EXPECT_EQ(QuestionToolGuard::format_questions(question_update("x")["rawInput"]),
            "1. Which database?\n   Options: Postgres, SQLite\n2. Add tests?");
  EXPECT_EQ(QuestionToolGuard::format_questions(json()), "");
  EXPECT_EQ(QuestionToolGuard::format_questions(json{{"questions", json::array()}}), "");
}

TEST(QuestionToolGuardFormatTest, BuildPrompt) {
  EXPECT_EQ(QuestionToolGuard::build_prompt(""),
            "The \"question\" tool is not available in this environment. Please ask your question directly in the "
            "conversation instead of using the question tool.");
  EXPECT_EQ(QuestionToolGuard::build_prompt("1. Q"),
            "The \"question\" tool is not available in this environment. You tried to ask:\n\n1. Q\n\nPlease ask these "
            "questions directly in the conversation (as plain text) so the user can respond.");
}
