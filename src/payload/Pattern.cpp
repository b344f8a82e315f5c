// Repository: simcore
// Component: Payload Pattern
// Purpose: ECMAScript regular expression with flags and a last-index cursor.
// Copyright (c) 2025 simcore

#include "simcore/payload/Pattern.hpp"

#include <stdexcept>

namespace simcore::payload {

Pattern::Pattern(std::string source, std::string flags)
    : source_(std::move(source)), flags_(std::move(flags)) {
  auto syntax = std::regex_constants::ECMAScript;
  for (char flag : flags_) {
    bool* target = nullptr;
    switch (flag) {
      case 'g': target = &global_; break;
      case 'i': target = &ignore_case_; break;
      case 'm': target = &multiline_; break;
      case 'y': target = &sticky_; break;
      default:
        throw std::invalid_argument(std::string("Invalid pattern flag '") + flag + "'");
    }
    if (*target) {
      throw std::invalid_argument(std::string("Duplicate pattern flag '") + flag + "'");
    }
    *target = true;
  }
  if (ignore_case_) syntax |= std::regex_constants::icase;
  if (multiline_) syntax |= std::regex_constants::multiline;
  try {
    regex_ = std::regex(source_, syntax);
  } catch (const std::regex_error& e) {
    throw std::invalid_argument("Invalid pattern /" + source_ + "/: " + e.what());
  }
}

std::optional<PatternMatch> Pattern::MatchFrom(const std::string& input,
                                               size_t from) const {
  if (from > input.size()) return std::nullopt;

  auto flags = std::regex_constants::match_default;
  if (sticky_) flags |= std::regex_constants::match_continuous;
  if (from > 0) flags |= std::regex_constants::match_prev_avail;

  std::smatch match;
  if (!std::regex_search(input.cbegin() + static_cast<std::ptrdiff_t>(from),
                         input.cend(), match, regex_, flags)) {
    return std::nullopt;
  }

  PatternMatch result;
  result.index = from + static_cast<size_t>(match.position(0));
  result.groups.reserve(match.size());
  for (size_t i = 0; i < match.size(); ++i) {
    if (match[i].matched) {
      result.groups.emplace_back(match[i].str());
    } else {
      result.groups.emplace_back(std::nullopt);
    }
  }
  return result;
}

std::optional<PatternMatch> Pattern::Exec(const std::string& input) {
  const bool stateful = global_ || sticky_;
  const size_t from = stateful ? last_index_ : 0;
  auto match = MatchFrom(input, from);
  if (!stateful) return match;
  if (!match) {
    last_index_ = 0;
    return std::nullopt;
  }
  const size_t length = match->groups[0] ? match->groups[0]->size() : 0;
  last_index_ = match->index + length;
  return match;
}

}  // namespace simcore::payload
