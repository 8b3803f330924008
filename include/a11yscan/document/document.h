#pragma once

#include "a11yscan/core/result.h"
#include "a11yscan/document/element.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace a11yscan::document {

// How the tree was obtained.
enum class ParseMode {
  kStandard,  // first parse attempt succeeded
  kLenient,   // fallback attempt (recovery, encoding errors ignored) was needed
  kEmpty,     // input was blank; the tree has no elements
};

[[nodiscard]] const char* parse_mode_name(ParseMode mode) noexcept;

struct ParseError {
  std::string message;  // NOLINT(readability-identifier-naming)
};

// Document is an immutable view over one parsed HTML document.
//
// All views are computed from the tree on demand and returned in document order.
// Nothing is cached, so concurrent readers never observe shared mutable state.
class Document {
 public:
  // Parses html. encoding is a hint such as the charset declared by the server.
  // Tolerates malformed markup; fails only when no tree can be built at all.
  // A hint naming a charset libxml2 cannot decode sends the input straight to the
  // lenient attempt, which reads it as UTF-8.
  [[nodiscard]] static core::Result<Document, ParseError> parse(
      std::string_view html, const std::optional<std::string>& encoding = std::nullopt);

  [[nodiscard]] ParseMode parse_mode() const noexcept { return mode_; }

  // First <html> element.
  [[nodiscard]] std::optional<Element> root() const;

  // Trimmed text of the first <title>; nullopt when there is no <title> element.
  [[nodiscard]] std::optional<std::string> title() const;

  [[nodiscard]] std::vector<Element> images() const;
  [[nodiscard]] std::vector<Element> links() const;
  [[nodiscard]] std::vector<Element> forms() const;
  // h1 through h6.
  [[nodiscard]] std::vector<Element> headings() const;
  // input, textarea and select.
  [[nodiscard]] std::vector<Element> inputs() const;
  // <button> elements and <input type="button">.
  [[nodiscard]] std::vector<Element> buttons() const;

  [[nodiscard]] std::vector<Element> elements_by_tag(std::string_view tag) const;
  // Elements whose role attribute equals role exactly.
  [[nodiscard]] std::vector<Element> elements_with_role(std::string_view role) const;
  [[nodiscard]] std::vector<Element> elements_with_attribute(std::string_view name) const;

  // Every id attribute value, duplicates preserved.
  [[nodiscard]] std::vector<std::string> all_ids() const;

  // First <label> whose for attribute equals id.
  [[nodiscard]] std::optional<Element> find_label_for(std::string_view id) const;

 private:
  Document(std::shared_ptr<_xmlDoc> doc, ParseMode mode);

  [[nodiscard]] std::vector<Element> collect(
      const std::function<bool(const Element&)>& predicate) const;

  std::shared_ptr<_xmlDoc> doc_;
  ParseMode mode_;
};

}  // namespace a11yscan::document
