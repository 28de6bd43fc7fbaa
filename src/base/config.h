/*
 * base/config.h
 * -------------------------------------------------------------------------
 * Methods to get cached configuration values.  Mostly auto-generated with
 * configuration keys in config.inc.
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

#ifndef S3BULK_BASE_CONFIG_H
#define S3BULK_BASE_CONFIG_H

#include <cstddef>
#include <iosfwd>
#include <string>

namespace s3bulk {
namespace base {
class Config {
 public:
  // Loads |file|, or the first default config file that exists if |file| is
  // empty. Throws if nothing can be opened or the file is malformed.
  static void Init(const std::string &file = "");

  // Like Init(""), but returns false instead of throwing when none of the
  // default files exist.
  static bool InitFromDefaults();

  // Restores every key to its default value.
  static void Reset();

#define CONFIG(type, name, def, desc)                              \
 private:                                                          \
  static type s_##name;                                            \
                                                                   \
 public:                                                           \
  inline static const type &name() { return s_##name; }            \
  inline static void set_##name(const type &value) { s_##name = value; }

#define CONFIG_REQUIRED(type, name, def, desc) CONFIG(type, name, def, desc)
#define CONFIG_CONSTRAINT(x, y)
#define CONFIG_KEY(x)

#include "base/config.inc"

#undef CONFIG
#undef CONFIG_REQUIRED
#undef CONFIG_CONSTRAINT
#undef CONFIG_KEY

 private:
  static void Load(std::istream *in, const std::string &source);
  static void Validate();
};
}  // namespace base
}  // namespace s3bulk

#endif
