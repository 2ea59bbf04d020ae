#include "helpdesk_core/llm/chat_provider.hpp"

#include <sstream>

namespace helpdesk_core {

const char *const kDefaultSystemPrompt =
    "You are an AI helpdesk assistant. Answer questions using only the provided context. "
    "Cite the titles or paths of the relevant documents in parentheses. "
    "If the answer is not present in the context, say you do not know.";

namespace {

std::string trim(const std::string &s) {
  const auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos)
    return "";
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

}  // namespace

std::string build_context_block(const std::vector<ContextSnippet> &context) {
  std::ostringstream ss;
  for (size_t i = 0; i < context.size(); ++i) {
    if (i > 0)
      ss << "\n\n";
    ss << "[Source " << (i + 1) << ": " << context[i].citation << "]\n" << trim(context[i].text);
  }
  return ss.str();
}

std::string build_user_prompt(const std::string &question,
                              const std::vector<ContextSnippet> &context) {
  std::string block = build_context_block(context);
  if (block.empty()) {
    block = "(no relevant documents were found in the knowledge base)";
  }
  return "Context:\n" + block + "\n\nQuestion: " + question + "\n";
}

}  // namespace helpdesk_core
