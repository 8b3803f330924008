#include "a11yscan/document/element.h"

#include "a11yscan/core/normalization.h"
#include "tree_walk.h"

#include <libxml/tree.h>

#include <array>
#include <utility>

namespace a11yscan::document {

namespace {

struct XmlCharDeleter {
  void operator()(xmlChar* text) const noexcept { xmlFree(text); }
};
using XmlCharPtr = std::unique_ptr<xmlChar, XmlCharDeleter>;

std::string to_string(const xmlChar* text) {
  return text == nullptr ? std::string{} : std::string(reinterpret_cast<const char*>(text));
}

// Elements that never carry content or an end tag.
bool is_void_element(const std::string_view tag) {
  static constexpr std::array<std::string_view, 14> kVoid = {
      "area", "base", "br",   "col",  "embed",  "hr",    "img",
      "input", "link", "meta", "param", "source", "track", "wbr"};
  for (const auto& candidate : kVoid) {
    if (candidate == tag) {
      return true;
    }
  }
  return false;
}

// Appends text escaped for markup, stopping once out holds budget bytes.
void append_escaped(std::string& out, const xmlChar* text, const bool in_attribute,
                    const std::size_t budget) {
  if (text == nullptr) {
    return;
  }
  for (const xmlChar* p = text; *p != '\0' && out.size() < budget; ++p) {
    const char ch = static_cast<char>(*p);
    switch (ch) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        if (in_attribute) {
          out += "&quot;";
        } else {
          out += ch;
        }
        break;
      default:
        out += ch;
    }
  }
}

// Serializes node into out, stopping as soon as out holds budget bytes.
void render_bounded(const xmlNode* node, std::string& out, const std::size_t budget) {
  if (out.size() >= budget) {
    return;
  }
  if (node->type == XML_TEXT_NODE) {
    append_escaped(out, node->content, false, budget);
    return;
  }
  // Raw text of <script> and <style>.
  if (node->type == XML_CDATA_SECTION_NODE) {
    for (const xmlChar* p = node->content; p != nullptr && *p != '\0' && out.size() < budget;
         ++p) {
      out += static_cast<char>(*p);
    }
    return;
  }
  if (node->type != XML_ELEMENT_NODE) {
    return;
  }

  const std::string tag = to_string(node->name);
  out += '<';
  out += tag;
  for (const xmlAttr* attr = node->properties; attr != nullptr; attr = attr->next) {
    if (out.size() >= budget) {
      return;
    }
    out += ' ';
    out += to_string(attr->name);
    out += "=\"";
    // Attribute values are held as text children; read them in place.
    for (const xmlNode* part = attr->children; part != nullptr; part = part->next) {
      append_escaped(out, part->content, true, budget);
    }
    if (out.size() >= budget) {
      return;
    }
    out += '"';
  }
  out += '>';
  if (is_void_element(tag)) {
    return;
  }
  for (const xmlNode* child = node->children; child != nullptr; child = child->next) {
    if (out.size() >= budget) {
      return;
    }
    render_bounded(child, out, budget);
  }
  if (out.size() >= budget) {
    return;
  }
  out += "</";
  out += tag;
  out += '>';
}

}  // namespace

Element::Element(std::shared_ptr<xmlDoc> owner, xmlNode* node)
    : owner_(std::move(owner)), node_(node) {}

std::string Element::tag_name() const {
  return core::normalize_ascii_lower(to_string(node_->name));
}

std::optional<std::string> Element::attribute(const std::string_view name) const {
  const std::string key(name);
  xmlAttr* attr = xmlHasProp(node_, reinterpret_cast<const xmlChar*>(key.c_str()));
  if (attr == nullptr) {
    return std::nullopt;
  }
  XmlCharPtr value(xmlNodeGetContent(reinterpret_cast<const xmlNode*>(attr)));
  return to_string(value.get());
}

bool Element::has_attribute(const std::string_view name) const {
  const std::string key(name);
  return xmlHasProp(node_, reinterpret_cast<const xmlChar*>(key.c_str())) != nullptr;
}

std::string Element::text() const {
  XmlCharPtr content(xmlNodeGetContent(node_));
  return core::trim(to_string(content.get()));
}

std::optional<Element> Element::parent() const {
  if (!detail::is_element(node_->parent)) {
    return std::nullopt;
  }
  return Element(owner_, node_->parent);
}

std::optional<Element> Element::first_descendant(const std::string_view tag) const {
  if (node_->children == nullptr) {
    return std::nullopt;
  }
  for (xmlNode* node = node_->children; node != nullptr;
       node = detail::next_in_document_order(node, node_)) {
    if (detail::is_element(node) && core::normalize_ascii_lower(to_string(node->name)) == tag) {
      return Element(owner_, node);
    }
  }
  return std::nullopt;
}

std::string Element::snippet(const std::size_t max_chars) const {
  // A UTF-8 code point takes at most 4 bytes.
  const std::size_t budget = max_chars * 4 + 4;
  std::string rendered;
  render_bounded(node_, rendered, budget);
  return core::utf8_truncate(rendered, max_chars);
}

}  // namespace a11yscan::document
