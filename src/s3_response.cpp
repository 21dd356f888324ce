#include "s3_response.hpp"

#include "exception.hpp"

#include <exception>
#include <initializer_list>
#include <memory>
#include <string>

#include <libxml/parser.h>
#include <libxml/tree.h>

namespace objxfer {

namespace {

constexpr const char* s3_namespace = "http://s3.amazonaws.com/doc/2006-03-01/";

struct xml_doc_deleter {
  void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};

using xml_doc_ptr = std::unique_ptr<xmlDoc, xml_doc_deleter>;

// Returns nullptr if the body is not well formed
xml_doc_ptr parse(const std::string& body) {
  return xml_doc_ptr(xmlReadMemory(
      body.data(),
      static_cast<int>(body.size()),
      nullptr,
      nullptr,
      XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
}

bool is_element(const xmlNode* node, const char* name) {
  return node && node->type == XML_ELEMENT_NODE && xmlStrcmp(node->name, BAD_CAST name) == 0;
}

xmlNode* first_node(xmlNode* parent, const char* name) {
  for (xmlNode* node = parent ? parent->children : nullptr; node; node = node->next) {
    if (is_element(node, name)) {
      return node;
    }
  }
  return nullptr;
}

// Follows the path of element names from the document root
xmlNode* first_node_of(xmlDoc* doc, std::initializer_list<const char*> names) {
  xmlNode* root = xmlDocGetRootElement(doc);
  auto it = names.begin();
  if (!is_element(root, *it)) {
    throw remote_error(std::string("'") + *it + "' is not found");
  }

  xmlNode* node = root;
  for (++it; it != names.end(); ++it) {
    node = first_node(node, *it);
    if (!node) {
      throw remote_error(std::string("'") + *it + "' is not found");
    }
  }
  return node;
}

std::string node_text(xmlNode* node) {
  if (!node) return "";
  xmlChar* content = xmlNodeGetContent(node);
  if (!content) return "";
  std::string text(reinterpret_cast<const char*>(content));
  xmlFree(content);
  return text;
}

std::string child_text(xmlNode* parent, const char* name) { return node_text(first_node(parent, name)); }

}  // namespace

list_page parse_list_page(const std::string& body) {
  xml_doc_ptr doc = parse(body);
  if (!doc) {
    throw remote_error("cannot parse list objects response");
  }
  xmlNode* root = first_node_of(doc.get(), {"ListBucketResult"});

  list_page page;
  for (xmlNode* node = root->children; node; node = node->next) {
    if (is_element(node, "Contents")) {
      page.keys.push_back(child_text(node, "Key"));
    }
  }

  xmlNode* key_count = first_node(root, "KeyCount");
  if (!key_count) {
    page.key_count = page.keys.size();
  }
  else {
    std::string value = node_text(key_count);
    try {
      page.key_count = std::stoul(value);
    }
    catch (const std::exception&) {
      throw remote_error("invalid KeyCount in list objects response: " + value);
    }
  }

  if (xmlNode* token = first_node(root, "NextContinuationToken")) {
    page.next_continuation_token = node_text(token);
  }

  return page;
}

std::vector<delete_failure> parse_delete_result(const std::string& body) {
  xml_doc_ptr doc = parse(body);
  if (!doc) {
    throw remote_error("cannot parse delete objects response");
  }
  xmlNode* root = first_node_of(doc.get(), {"DeleteResult"});

  std::vector<delete_failure> failures;
  for (xmlNode* node = root->children; node; node = node->next) {
    if (is_element(node, "Error")) {
      failures.push_back({child_text(node, "Key"), child_text(node, "Code"), child_text(node, "Message")});
    }
  }
  return failures;
}

std::optional<s3_error> parse_error(const std::string& body) {
  if (body.empty()) {
    return std::nullopt;
  }
  xml_doc_ptr doc = parse(body);
  if (!doc) {
    return std::nullopt;
  }
  xmlNode* root = xmlDocGetRootElement(doc.get());
  if (!is_element(root, "Error")) {
    return std::nullopt;
  }
  return s3_error{child_text(root, "Code"), child_text(root, "Message")};
}

void check_copy_result(const std::string& body, const std::string& what) {
  if (auto error = parse_error(body)) {
    throw remote_error(what + ": " + error->code + ": " + error->message, 200, error->code);
  }
}

std::string delete_request_body(const std::vector<std::string>& keys) {
  xml_doc_ptr doc(xmlNewDoc(BAD_CAST "1.0"));
  xmlNode* root = xmlNewNode(nullptr, BAD_CAST "Delete");
  xmlDocSetRootElement(doc.get(), root);
  xmlSetNs(root, xmlNewNs(root, BAD_CAST s3_namespace, nullptr));

  xmlNewTextChild(root, nullptr, BAD_CAST "Quiet", BAD_CAST "true");
  for (const auto& key : keys) {
    xmlNode* object = xmlNewChild(root, nullptr, BAD_CAST "Object", nullptr);
    xmlNewTextChild(object, nullptr, BAD_CAST "Key", BAD_CAST key.c_str());
  }

  xmlChar* buffer = nullptr;
  int size = 0;
  xmlDocDumpMemoryEnc(doc.get(), &buffer, &size, "UTF-8");
  if (!buffer) {
    throw exception("failed to serialize delete objects request");
  }
  std::string out(reinterpret_cast<const char*>(buffer), size);
  xmlFree(buffer);
  return out;
}

}  // namespace objxfer
