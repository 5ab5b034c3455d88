#pragma once

#include <spdlog/fmt/fmt.h>

#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

// Quote a string so /bin/sh reads it back as exactly one literal word.
std::string shell_quote(std::string_view raw);

// A command line that is safe to hand to /bin/sh. Instances only come out of
// shell_cmd(), literal() or pipe(), so every interpolated value went through
// shell_quote().
class ShellCommand {
public:
  ShellCommand() = default;

  // Fixed command text with nothing interpolated into it.
  static ShellCommand literal(std::string_view text) { return ShellCommand(std::string(text)); }

  // `upstream | downstream`
  static ShellCommand pipe(const ShellCommand& upstream, const ShellCommand& downstream);

  // Append each value as one more quoted word.
  ShellCommand with_args(const std::vector<std::string>& args) const;

  const std::string& str() const { return text_; }

  bool operator==(const ShellCommand& other) const { return text_ == other.text_; }

private:
  explicit ShellCommand(std::string text) : text_(std::move(text)) {}

  template<typename... Args>
  friend ShellCommand shell_cmd(std::string_view skeleton, const Args&... args);

  std::string text_;
};

namespace detail {

inline std::string quoted_argument(std::string_view value) { return shell_quote(value); }
inline std::string quoted_argument(const std::string& value) { return shell_quote(value); }
inline std::string quoted_argument(const char* value) { return shell_quote(value ? value : ""); }
// A nested command becomes a single word, e.g. the payload of `sh -c` or `ssh`.
inline std::string quoted_argument(const ShellCommand& value) { return shell_quote(value.str()); }

template<typename T, typename = std::enable_if_t<std::is_arithmetic<T>::value>>
std::string quoted_argument(T value) { return shell_quote(fmt::format("{}", value)); }

template<typename T>
struct NamedShellArg {
  const char* name;
  const T& value;
};

struct QuotedNamedArg {
  const char* name;
  std::string value;
};

template<typename T>
QuotedNamedArg quoted_argument(const NamedShellArg<T>& named) {
  return QuotedNamedArg{named.name, quoted_argument(named.value)};
}

inline const std::string& format_argument(const std::string& quoted) { return quoted; }
inline auto format_argument(const QuotedNamedArg& quoted) { return fmt::arg(quoted.name, quoted.value); }

template<typename... Quoted>
std::string render(std::string_view skeleton, const std::tuple<Quoted...>& quoted) {
  return std::apply([&](const auto&... value) {
    return fmt::format(fmt::runtime(skeleton), format_argument(value)...);
  }, quoted);
}

} // namespace detail

// Named placeholder for shell_cmd("docker cp {container}:{path} -", ...).
template<typename T>
detail::NamedShellArg<T> shell_arg(const char* name, const T& value) {
  return detail::NamedShellArg<T>{name, value};
}

// Substitute quoted arguments into an fmt skeleton. The skeleton is trusted
// text written in this code base; arguments never are.
template<typename... Args>
ShellCommand shell_cmd(std::string_view skeleton, const Args&... args) {
  // quoted values must outlive the fmt argument references made in render()
  const auto quoted = std::make_tuple(detail::quoted_argument(args)...);
  return ShellCommand(detail::render(skeleton, quoted));
}
