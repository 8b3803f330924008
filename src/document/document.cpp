#include "a11yscan/document/document.h"

#include "a11yscan/core/normalization.h"
#include "tree_walk.h"

#include <libxml/HTMLparser.h>
#include <libxml/HTMLtree.h>
#include <libxml/encoding.h>
#include <libxml/parser.h>
#include <libxml/tree.h>

#include <limits>
#include <mutex>
#include <utility>

namespace a11yscan::document {

namespace {

using ParseResult = core::Result<Document, ParseError>;

constexpr int kStandardOptions = HTML_PARSE_NONET | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING;
constexpr int kLenientOptions = kStandardOptions | HTML_PARSE_RECOVER | HTML_PARSE_IGNORE_ENC;

void ensure_libxml_initialized() {
  static std::once_flag once;
  std::call_once(once, [] { xmlInitParser(); });
}

std::shared_ptr<xmlDoc> adopt(xmlDoc* doc) {
  return std::shared_ptr<xmlDoc>(doc, [](xmlDoc* d) { xmlFreeDoc(d); });
}

// True when libxml2 has a decoder for the named charset.
bool is_known_encoding(const char* name) {
  xmlCharEncodingHandler* handler = xmlFindCharEncodingHandler(name);
  if (handler == nullptr) {
    return false;
  }
  xmlCharEncCloseFunc(handler);
  return true;
}

bool is_heading_tag(const std::string& tag) {
  return tag.size() == 2 && tag[0] == 'h' && tag[1] >= '1' && tag[1] <= '6';
}

}  // namespace

const char* parse_mode_name(const ParseMode mode) noexcept {
  switch (mode) {
    case ParseMode::kStandard:
      return "standard";
    case ParseMode::kLenient:
      return "lenient";
    case ParseMode::kEmpty:
      return "empty";
  }
  return "standard";
}

Document::Document(std::shared_ptr<xmlDoc> doc, const ParseMode mode)
    : doc_(std::move(doc)), mode_(mode) {}

core::Result<Document, ParseError> Document::parse(const std::string_view html,
                                                   const std::optional<std::string>& encoding) {
  if (html.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    return ParseResult::err(ParseError{"Document too large to parse"});
  }
  ensure_libxml_initialized();

  if (core::trim(html).empty()) {
    xmlDoc* empty = htmlNewDocNoDtD(nullptr, nullptr);
    if (empty == nullptr) {
      return ParseResult::err(ParseError{"Failed to allocate an empty document"});
    }
    return ParseResult::ok(Document(adopt(empty), ParseMode::kEmpty));
  }

  const int size = static_cast<int>(html.size());
  const char* hint = encoding.has_value() ? encoding->c_str() : nullptr;
  // A declared charset that cannot be decoded fails the standard attempt.
  const bool hint_usable = hint == nullptr || is_known_encoding(hint);
  if (hint_usable) {
    if (xmlDoc* doc = htmlReadMemory(html.data(), size, nullptr, hint, kStandardOptions)) {
      return ParseResult::ok(Document(adopt(doc), ParseMode::kStandard));
    }
  }

  // Fallback: full recovery, and encoding declarations are ignored in favor of UTF-8.
  if (xmlDoc* doc = htmlReadMemory(html.data(), size, nullptr, "UTF-8", kLenientOptions)) {
    return ParseResult::ok(Document(adopt(doc), ParseMode::kLenient));
  }
  return ParseResult::err(ParseError{"Unable to build a document tree from input"});
}

std::vector<Element> Document::collect(
    const std::function<bool(const Element&)>& predicate) const {
  std::vector<Element> matches;
  auto* top = reinterpret_cast<xmlNode*>(doc_.get());
  for (xmlNode* node = top->children; node != nullptr;
       node = detail::next_in_document_order(node, top)) {
    if (!detail::is_element(node)) {
      continue;
    }
    Element element(doc_, node);
    if (predicate(element)) {
      matches.push_back(std::move(element));
    }
  }
  return matches;
}

std::optional<Element> Document::root() const {
  auto html = elements_by_tag("html");
  if (html.empty()) {
    return std::nullopt;
  }
  return html.front();
}

std::optional<std::string> Document::title() const {
  auto titles = elements_by_tag("title");
  if (titles.empty()) {
    return std::nullopt;
  }
  return titles.front().text();
}

std::vector<Element> Document::images() const { return elements_by_tag("img"); }

std::vector<Element> Document::links() const { return elements_by_tag("a"); }

std::vector<Element> Document::forms() const { return elements_by_tag("form"); }

std::vector<Element> Document::headings() const {
  return collect([](const Element& e) { return is_heading_tag(e.tag_name()); });
}

std::vector<Element> Document::inputs() const {
  return collect([](const Element& e) {
    const std::string tag = e.tag_name();
    return tag == "input" || tag == "textarea" || tag == "select";
  });
}

std::vector<Element> Document::buttons() const {
  return collect([](const Element& e) {
    const std::string tag = e.tag_name();
    if (tag == "button") {
      return true;
    }
    if (tag != "input") {
      return false;
    }
    const auto type = e.attribute("type");
    return type.has_value() && core::normalize_ascii_lower(core::trim(*type)) == "button";
  });
}

std::vector<Element> Document::elements_by_tag(const std::string_view tag) const {
  const std::string wanted = core::normalize_ascii_lower(tag);
  return collect([&wanted](const Element& e) { return e.tag_name() == wanted; });
}

std::vector<Element> Document::elements_with_role(const std::string_view role) const {
  return collect([role](const Element& e) {
    const auto value = e.attribute("role");
    return value.has_value() && *value == role;
  });
}

std::vector<Element> Document::elements_with_attribute(const std::string_view name) const {
  return collect([name](const Element& e) { return e.has_attribute(name); });
}

std::vector<std::string> Document::all_ids() const {
  std::vector<std::string> ids;
  for (const auto& element : elements_with_attribute("id")) {
    ids.push_back(element.attribute("id").value_or(std::string{}));
  }
  return ids;
}

std::optional<Element> Document::find_label_for(const std::string_view id) const {
  for (auto& label : elements_by_tag("label")) {
    const auto target = label.attribute("for");
    if (target.has_value() && *target == id) {
      return label;
    }
  }
  return std::nullopt;
}

}  // namespace a11yscan::document
