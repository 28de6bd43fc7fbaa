/*
 * base/xml.cc
 * -------------------------------------------------------------------------
 * XML parsing and XPath queries over libxml2.
 * -------------------------------------------------------------------------
 *
 * Copyright (c) 2012, Tarick Bedeir.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "base/xml.h"

#include <errno.h>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xpath.h>

#include <regex>
#include <stdexcept>

#include "base/logger.h"

namespace s3bulk {
namespace base {

namespace {
struct TransformPair {
  const std::regex expr;
  const std::string subst;
};

// strip out namespace declarations, since S3 error documents may carry one
// and XPath queries would otherwise need a registered prefix
const TransformPair TRANSFORMS[] = {
    {std::regex(" xmlns(:\\w*)?=\"[^\"]*\""), ""},
    {std::regex(" xmlns(:\\w*)?='[^']*'"), ""},
    {std::regex("<\\w*:"), "<"},
    {std::regex("</\\w*:"), "</"}};

std::string Transform(std::string in) {
  for (const auto &t : TRANSFORMS) in = std::regex_replace(in, t.expr, t.subst);
  return in;
}

void FreeXmlChar(xmlChar *p) { xmlFree(p); }

using XmlDocPtr = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;
using XPathContextPtr =
    std::unique_ptr<xmlXPathContext, decltype(&xmlXPathFreeContext)>;
using XPathObjectPtr =
    std::unique_ptr<xmlXPathObject, decltype(&xmlXPathFreeObject)>;
using XmlCharPtr = std::unique_ptr<xmlChar, decltype(&FreeXmlChar)>;

class XmlDocumentImpl : public XmlDocument {
 public:
  explicit XmlDocumentImpl(XmlDocPtr doc)
      : doc_(std::move(doc)),
        xpath_context_(xmlXPathNewContext(doc_.get()), &xmlXPathFreeContext) {
    if (!xpath_context_)
      throw std::runtime_error("failed to create xpath context.");
  }

  ~XmlDocumentImpl() override = default;

  int Find(const std::string &xpath, std::string *element) override {
    auto result = EvalXPath(xpath);
    if (!result || xmlXPathNodeSetIsEmpty(result->nodesetval)) return -ENOENT;

    auto text = XPathNodeToString(result->nodesetval->nodeTab[0]);
    if (!text) return -ENOENT;

    *element = reinterpret_cast<const char *>(text.get());
    return 0;
  }

 private:
  XPathObjectPtr EvalXPath(const std::string &xpath) {
    auto *result = xmlXPathEvalExpression(
        reinterpret_cast<const xmlChar *>(xpath.c_str()), xpath_context_.get());
    if (!result)
      S3BULK_LOG(LOG_WARNING, "XmlDocument::EvalXPath",
                 "invalid xpath expression [%s].\n", xpath.c_str());
    return {result, &xmlXPathFreeObject};
  }

  XmlCharPtr XPathNodeToString(xmlNodePtr node) {
    return {xmlXPathCastNodeToString(node), FreeXmlChar};
  }

  XmlDocPtr doc_;
  XPathContextPtr xpath_context_;
};
}  // namespace

void XmlDocument::Init() {
  xmlInitParser();
  LIBXML_TEST_VERSION;
}

std::unique_ptr<XmlDocument> XmlDocument::Parse(std::string data) {
  data = Transform(data);
  XmlDocPtr doc(xmlReadMemory(data.c_str(), static_cast<int>(data.size()),
                              nullptr, nullptr,
                              XML_PARSE_NOERROR | XML_PARSE_NOWARNING |
                                  XML_PARSE_NONET),
                &xmlFreeDoc);

  if (!doc) {
    S3BULK_LOG(LOG_DEBUG, "XmlDocument::Parse", "error while parsing xml.\n");
    return {};
  }

  if (!xmlDocGetRootElement(doc.get())) {
    S3BULK_LOG(LOG_DEBUG, "XmlDocument::Parse",
               "document does not contain a root node.\n");
    return {};
  }

  return std::unique_ptr<XmlDocument>(new XmlDocumentImpl(std::move(doc)));
}

}  // namespace base
}  // namespace s3bulk
