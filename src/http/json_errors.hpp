#pragma once
#include <algorithm>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>

// Where a JSON parse failed inside a request body: 1-based line and column,
// plus the offending line with a caret under the failing byte.
struct JsonErrorLocation {
  std::size_t line = 1;
  std::size_t column = 1;
  std::string context;
};

inline JsonErrorLocation locate_json_error(const std::string &text,
                                           std::size_t byte_pos) {
  byte_pos = std::min(byte_pos, text.size());
  JsonErrorLocation loc;
  const auto first = text.begin();
  loc.line = 1 + static_cast<std::size_t>(
                     std::count(first, first + byte_pos, '\n'));

  const std::size_t line_start =
      byte_pos == 0 ? 0 : text.rfind('\n', byte_pos - 1) + 1; // npos + 1 == 0
  std::size_t line_end = text.find('\n', byte_pos);
  if (line_end == std::string::npos)
    line_end = text.size();
  loc.column = byte_pos - line_start + 1;

  // long minified bodies: keep 80 bytes either side
  const std::size_t from =
      std::max(line_start, byte_pos > 80 ? byte_pos - 80 : std::size_t{0});
  const std::size_t to = std::min(line_end, byte_pos + 80);
  loc.context = text.substr(from, to - from) + "\n" +
                std::string(byte_pos - from, ' ') + "^";
  return loc;
}

// 400 body for a request whose JSON did not parse.
inline nlohmann::json parse_error_body(const std::string &text,
                                       const nlohmann::json::parse_error &e) {
  // e.byte is 1-based
  const std::size_t byte = e.byte > 0 ? e.byte - 1 : 0;
  const JsonErrorLocation loc = locate_json_error(text, byte);
  return {{"ok", false},          {"kind", "parse_error"},
          {"what", e.what()},     {"byte", byte},
          {"line", loc.line},     {"column", loc.column},
          {"context", loc.context}};
}
