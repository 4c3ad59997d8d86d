#include "util/shell.hpp"

#include <cctype>
#include <stdexcept>

#include "absl/strings/str_join.h"

namespace {

bool IsSafe(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' ||
         c == '@' || c == '%' || c == '+' || c == '=' || c == ':' ||
         c == ',' || c == '.' || c == '/' || c == '-';
}

}  // namespace

namespace util {

std::vector<std::string> ShellSplit(const std::string& command) {
  enum { NONE, SINGLE, DOUBLE } quote = NONE;
  std::vector<std::string> words;
  std::string current;
  bool in_word = false;
  for (size_t i = 0; i < command.size(); i++) {
    char c = command[i];
    switch (quote) {
      case SINGLE:
        if (c == '\'')
          quote = NONE;
        else
          current += c;
        break;
      case DOUBLE:
        if (c == '"') {
          quote = NONE;
        } else if (c == '\\' && i + 1 < command.size() &&
                   (command[i + 1] == '"' || command[i + 1] == '\\' ||
                    command[i + 1] == '$' || command[i + 1] == '`')) {
          current += command[++i];
        } else {
          current += c;
        }
        break;
      case NONE:
        if (std::isspace(static_cast<unsigned char>(c))) {
          if (in_word) words.push_back(std::move(current));
          current.clear();
          in_word = false;
          break;
        }
        in_word = true;
        if (c == '\'') {
          quote = SINGLE;
        } else if (c == '"') {
          quote = DOUBLE;
        } else if (c == '\\') {
          if (i + 1 == command.size())
            throw std::invalid_argument("Trailing backslash in: " + command);
          current += command[++i];
        } else {
          current += c;
        }
        break;
    }
  }
  if (quote != NONE)
    throw std::invalid_argument("Unterminated quote in: " + command);
  if (in_word) words.push_back(std::move(current));
  return words;
}

std::string ShellQuote(const std::string& word) {
  if (word.empty()) return "''";
  bool safe = true;
  for (char c : word) safe = safe && IsSafe(c);
  if (safe) return word;
  std::string quoted = "'";
  for (char c : word) {
    if (c == '\'')
      quoted += "'\"'\"'";
    else
      quoted += c;
  }
  return quoted + "'";
}

std::string ShellJoin(const std::vector<std::string>& words) {
  return absl::StrJoin(words, " ", [](std::string* out, const std::string& w) {
    out->append(ShellQuote(w));
  });
}

}  // namespace util
