#pragma once

#include <libxml/tree.h>

namespace a11yscan::document::detail {

// Pre-order successor of node within the subtree rooted at scope, or nullptr.
// Descends only through element and document nodes; attributes are never visited.
inline xmlNode* next_in_document_order(xmlNode* node, const xmlNode* scope) {
  const bool can_descend = node->type == XML_ELEMENT_NODE || node->type == XML_DOCUMENT_NODE ||
                           node->type == XML_HTML_DOCUMENT_NODE;
  if (can_descend && node->children != nullptr) {
    return node->children;
  }
  while (node != nullptr && node != scope) {
    if (node->next != nullptr) {
      return node->next;
    }
    node = node->parent;
  }
  return nullptr;
}

inline bool is_element(const xmlNode* node) {
  return node != nullptr && node->type == XML_ELEMENT_NODE;
}

}  // namespace a11yscan::document::detail
