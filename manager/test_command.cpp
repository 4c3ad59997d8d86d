#include "manager/test_command.hpp"

#include <limits>
#include <stdexcept>

#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "util/shell.hpp"

namespace manager {

namespace {
const int64_t kMin = std::numeric_limits<int64_t>::min();
const int64_t kMax = std::numeric_limits<int64_t>::max();

int64_t ParseBound(absl::string_view number, const std::string& token) {
  int64_t value = 0;
  if (number.empty() || !absl::SimpleAtoi(number, &value)) {
    throw std::invalid_argument("Invalid number in range " + token);
  }
  return value;
}
}  // namespace

bool IsRange(const std::string& token) {
  return token.size() >= 2 && token.front() == '[' && token.back() == ']' &&
         absl::StrContains(token, "..");
}

std::vector<int64_t> ExpandRange(const std::string& token) {
  if (!IsRange(token)) throw std::invalid_argument("Not a range: " + token);
  absl::string_view body(token);
  body.remove_prefix(1);
  body.remove_suffix(1);
  std::vector<absl::string_view> parts =
      absl::StrSplit(body, absl::MaxSplits("..", 1));
  absl::string_view head = parts[0];
  int64_t end = ParseBound(parts[1], token);

  int64_t begin = 0;
  int64_t step = 1;
  std::vector<absl::string_view> firsts = absl::StrSplit(head, ',');
  if (firsts.size() == 1) {
    begin = ParseBound(firsts[0], token);
    if (begin > end) {
      throw std::invalid_argument("Empty range " + token);
    }
  } else if (firsts.size() == 2) {
    begin = ParseBound(firsts[0], token);
    int64_t second = ParseBound(firsts[1], token);
    if ((begin > 0 && second < kMin + begin) ||
        (begin < 0 && second > kMax + begin)) {
      throw std::invalid_argument("Step out of range in " + token);
    }
    step = second - begin;
    if (step == 0) throw std::invalid_argument("Zero step in range " + token);
    if ((step > 0 && begin > end) || (step < 0 && begin < end)) {
      throw std::invalid_argument("Range " + token + " never reaches its end");
    }
  } else {
    throw std::invalid_argument("Invalid range " + token);
  }

  std::vector<int64_t> values;
  for (int64_t value = begin;; value += step) {
    values.push_back(value);
    // Stops before value + step could overflow.
    if (step > 0 ? value > kMax - step || value + step > end
                 : value < kMin - step || value + step < end) {
      break;
    }
  }
  return values;
}

std::vector<std::string> ExpandGeneratorCommand(const std::string& command) {
  std::vector<std::vector<std::string>> choices;
  for (const std::string& word : util::ShellSplit(command)) {
    std::vector<std::string> options;
    if (IsRange(word)) {
      for (int64_t value : ExpandRange(word)) {
        options.push_back(std::to_string(value));
      }
    } else {
      options.push_back(word);
    }
    choices.push_back(std::move(options));
  }

  std::vector<std::string> commands;
  std::vector<size_t> position(choices.size(), 0);
  while (true) {
    std::vector<std::string> words;
    for (size_t i = 0; i < choices.size(); i++) {
      words.push_back(choices[i][position[i]]);
    }
    commands.push_back(util::ShellJoin(words));
    size_t i = 0;
    while (i < choices.size() && ++position[i] == choices[i].size()) {
      position[i++] = 0;
    }
    if (i == choices.size()) break;
  }
  return commands;
}

bool ExpandsTrivially(const std::string& command) {
  std::vector<std::string> commands = ExpandGeneratorCommand(command);
  return commands.size() == 1 && commands[0] == command;
}

}  // namespace manager
