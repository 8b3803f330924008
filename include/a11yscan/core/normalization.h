#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace a11yscan::core {

// Deterministic, locale-independent text helpers shared by the document model and the
// rule catalogue. Byte-stable across platforms and compilers.

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
// Non-ASCII bytes are preserved unchanged.
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

namespace detail {

inline bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

// Length in bytes of the whitespace sequence starting at input[pos], or 0.
// Recognizes ASCII whitespace and U+00A0 (NO-BREAK SPACE, 0xC2 0xA0 in UTF-8).
inline std::size_t space_at(const std::string_view input, const std::size_t pos) {
  if (is_ascii_space(input[pos])) {
    return 1;
  }
  if (pos + 1 < input.size() && static_cast<unsigned char>(input[pos]) == 0xC2 &&
      static_cast<unsigned char>(input[pos + 1]) == 0xA0) {
    return 2;
  }
  return 0;
}

// Length in bytes of the whitespace sequence ending just before input[end], or 0.
inline std::size_t space_before(const std::string_view input, const std::size_t end) {
  if (is_ascii_space(input[end - 1])) {
    return 1;
  }
  if (end >= 2 && static_cast<unsigned char>(input[end - 2]) == 0xC2 &&
      static_cast<unsigned char>(input[end - 1]) == 0xA0) {
    return 2;
  }
  return 0;
}

}  // namespace detail

// trim removes leading and trailing whitespace (ASCII whitespace and no-break space).
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size()) {
    const std::size_t n = detail::space_at(input, start);
    if (n == 0) {
      break;
    }
    start += n;
  }

  std::size_t end = input.size();
  while (end > start) {
    const std::size_t n = detail::space_before(input, end);
    if (n == 0) {
      break;
    }
    end -= n;
  }

  return std::string{input.substr(start, end - start)};
}

// utf8_length counts code points (bytes that are not UTF-8 continuation bytes).
inline std::size_t utf8_length(const std::string_view input) {
  std::size_t count = 0;
  for (const char ch : input) {
    if ((static_cast<unsigned char>(ch) & 0xC0U) != 0x80U) {
      ++count;
    }
  }
  return count;
}

// utf8_truncate keeps at most max_chars code points, never splitting a sequence.
inline std::string utf8_truncate(const std::string_view input, const std::size_t max_chars) {
  std::size_t seen = 0;
  for (std::size_t i = 0; i < input.size(); ++i) {
    if ((static_cast<unsigned char>(input[i]) & 0xC0U) != 0x80U) {
      if (seen == max_chars) {
        return std::string{input.substr(0, i)};
      }
      ++seen;
    }
  }
  return std::string{input};
}

}  // namespace a11yscan::core
