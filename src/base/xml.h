/*
 * base/xml.h
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

#ifndef S3BULK_BASE_XML_H
#define S3BULK_BASE_XML_H

#include <memory>
#include <string>

namespace s3bulk {
namespace base {
class XmlDocument {
 public:
  static void Init();

  // Returns null if |data| is not a well-formed document.
  static std::unique_ptr<XmlDocument> Parse(std::string data);

  virtual ~XmlDocument() = default;

  // Text of the first node matching |xpath|. Returns 0 or -ENOENT.
  virtual int Find(const std::string &xpath, std::string *element) = 0;
};
}  // namespace base
}  // namespace s3bulk

#endif
