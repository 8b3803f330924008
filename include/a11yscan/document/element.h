#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

struct _xmlNode;
struct _xmlDoc;

namespace a11yscan::document {

inline constexpr std::size_t kDefaultSnippetChars = 100;

// Element is a read-only handle on one element node of a parsed Document.
//
// The handle shares ownership of the underlying tree, so it stays valid after the
// Document that produced it goes out of scope. Element never mutates the tree.
class Element {
 public:
  Element(std::shared_ptr<_xmlDoc> owner, _xmlNode* node);

  // Lowercase tag name, e.g. "img".
  [[nodiscard]] std::string tag_name() const;

  // Attribute value by (lowercase) name. nullopt when the attribute is absent;
  // an attribute written without a value or as name="" yields an empty string.
  [[nodiscard]] std::optional<std::string> attribute(std::string_view name) const;
  [[nodiscard]] bool has_attribute(std::string_view name) const;

  // Concatenated descendant text, trimmed.
  [[nodiscard]] std::string text() const;

  // Parent element, or nullopt at the top of the tree.
  [[nodiscard]] std::optional<Element> parent() const;

  // First descendant (document order, excluding this element) with the given tag.
  [[nodiscard]] std::optional<Element> first_descendant(std::string_view tag) const;

  // Markup of this element rendered by a bounded serializer and cut to at most
  // max_chars code points. Never renders more than the budget requires.
  [[nodiscard]] std::string snippet(std::size_t max_chars = kDefaultSnippetChars) const;

  friend bool operator==(const Element& lhs, const Element& rhs) noexcept {
    return lhs.node_ == rhs.node_;
  }

 private:
  std::shared_ptr<_xmlDoc> owner_;
  _xmlNode* node_;
};

}  // namespace a11yscan::document
