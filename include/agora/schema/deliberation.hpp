#pragma once

#include <agora/schema/primitives.hpp>
#include <cstddef>

// Deliberation bounds. Spans are measured in blocks of the host chain
// (ten-minute blocks: 144 per day).
namespace agora::schema {

inline constexpr sequence_t kMinDeliberationSpan{144};
inline constexpr sequence_t kMaxDeliberationSpan{4320};
inline constexpr sequence_t kDefaultDeliberationSpan{1008};

inline constexpr std::size_t kMaxTitleLength{50};
inline constexpr std::size_t kMaxSummaryLength{500};

constexpr bool is_valid_deliberation_span(const sequence_t span) {
  return span >= kMinDeliberationSpan && span <= kMaxDeliberationSpan;
}

constexpr bool is_valid_title(const std::string_view title) {
  return !title.empty() && title.size() <= kMaxTitleLength;
}

constexpr bool is_valid_summary(const std::string_view summary) {
  return !summary.empty() && summary.size() <= kMaxSummaryLength;
}

}  // namespace agora::schema
