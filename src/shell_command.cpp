#include "shell_command.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace {

bool is_safe_unquoted(unsigned char ch) {
  if(std::isalnum(ch)) return true;
  return std::strchr("@%+=:,./_-", ch) != nullptr && ch != '\0';
}

} // namespace

std::string shell_quote(std::string_view raw) {
  if(raw.empty()) return "''";
  if(std::all_of(raw.begin(), raw.end(),
                 [](char ch){ return is_safe_unquoted(static_cast<unsigned char>(ch)); })) {
    return std::string(raw);
  }

  std::string quoted;
  quoted.reserve(raw.size() + 2);
  quoted.push_back('\'');
  for(char ch : raw) {
    if(ch == '\'') {
      // close, emit a double-quoted quote, reopen
      quoted += "'\"'\"'";
    } else {
      quoted.push_back(ch);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

ShellCommand ShellCommand::pipe(const ShellCommand& upstream, const ShellCommand& downstream) {
  return ShellCommand(upstream.text_ + " | " + downstream.text_);
}

ShellCommand ShellCommand::with_args(const std::vector<std::string>& args) const {
  std::string text = text_;
  for(const auto& arg : args) {
    text += ' ';
    text += shell_quote(arg);
  }
  return ShellCommand(std::move(text));
}
