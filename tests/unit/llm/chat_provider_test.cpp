#include <gtest/gtest.h>

#include "helpdesk_core/llm/chat_provider.hpp"

namespace helpdesk_tests {

using namespace helpdesk_core;

TEST(ChatPromptTest, ContextBlockNumbersSources) {
  std::vector<ContextSnippet> context = {
      {"Reset your password", "  Open Settings and choose Reset.  "},
      {"https://help.example.com/billing", "Invoices are sent monthly."}};

  EXPECT_EQ(build_context_block(context),
            "[Source 1: Reset your password]\nOpen Settings and choose Reset.\n\n"
            "[Source 2: https://help.example.com/billing]\nInvoices are sent monthly.");
}

TEST(ChatPromptTest, UserPromptWrapsQuestion) {
  std::vector<ContextSnippet> context = {{"FAQ", "Support is open 9 to 5."}};
  EXPECT_EQ(build_user_prompt("When is support open?", context),
            "Context:\n[Source 1: FAQ]\nSupport is open 9 to 5.\n\nQuestion: When is support open?\n");
}

TEST(ChatPromptTest, EmptyContextIsStatedExplicitly) {
  const std::string prompt = build_user_prompt("Anything?", {});
  EXPECT_NE(prompt.find("no relevant documents"), std::string::npos);
  EXPECT_NE(prompt.find("Question: Anything?"), std::string::npos);
}

TEST(ChatPromptTest, SystemPromptAsksForGroundedAnswers) {
  const std::string system_prompt = kDefaultSystemPrompt;
  EXPECT_NE(system_prompt.find("only the provided context"), std::string::npos);
}

}  // namespace helpdesk_tests
