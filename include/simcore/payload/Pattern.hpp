// Repository: simcore
// Component: Payload Pattern
// Purpose: ECMAScript regular expression with flags and a last-index cursor.
// Copyright (c) 2025 simcore

#ifndef SIMCORE_PAYLOAD_PATTERN_HPP_
#define SIMCORE_PAYLOAD_PATTERN_HPP_

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace simcore::payload {

struct PatternMatch {
  size_t index = 0;
  // groups[0] is the whole match; unmatched groups are nullopt.
  std::vector<std::optional<std::string>> groups;
};

// Supported flags: g (global), i (ignore case), m (multiline), y (sticky).
class Pattern {
 public:
  // Throws std::invalid_argument on an unknown or repeated flag, or a source
  // that does not compile.
  explicit Pattern(std::string source, std::string flags = "");

  const std::string& Source() const { return source_; }
  const std::string& Flags() const { return flags_; }
  bool Global() const { return global_; }
  bool IgnoreCase() const { return ignore_case_; }
  bool Multiline() const { return multiline_; }
  bool Sticky() const { return sticky_; }

  size_t LastIndex() const { return last_index_; }
  void SetLastIndex(size_t index) { last_index_ = index; }

  // Global and sticky patterns search from LastIndex() and advance it past
  // the match, resetting it to 0 on failure.
  std::optional<PatternMatch> Exec(const std::string& input);
  bool Test(const std::string& input) { return Exec(input).has_value(); }

  // Stateless match starting at `from`; honors the sticky flag.
  std::optional<PatternMatch> MatchFrom(const std::string& input, size_t from) const;

 private:
  std::string source_;
  std::string flags_;
  bool global_ = false;
  bool ignore_case_ = false;
  bool multiline_ = false;
  bool sticky_ = false;
  std::regex regex_;
  size_t last_index_ = 0;
};

}  // namespace simcore::payload

#endif  // SIMCORE_PAYLOAD_PATTERN_HPP_
