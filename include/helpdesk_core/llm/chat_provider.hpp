#pragma once

#include <string>
#include <vector>

namespace helpdesk_core {

// A retrieved passage handed to the chat model, labelled with where it came from.
struct ContextSnippet {
  std::string citation;
  std::string text;
};

class ChatProvider {
 public:
  virtual ~ChatProvider() = default;

  // The context may be empty; the provider must still answer (typically that it does not
  // know). Throws ProviderError on any failure.
  virtual std::string answer(const std::string &question,
                             const std::vector<ContextSnippet> &context) = 0;
};

extern const char *const kDefaultSystemPrompt;

// "[Source 1: label]\ntext" segments separated by blank lines.
std::string build_context_block(const std::vector<ContextSnippet> &context);

std::string build_user_prompt(const std::string &question,
                              const std::vector<ContextSnippet> &context);

}  // namespace helpdesk_core
