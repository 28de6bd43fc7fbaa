/*
 * base/config.cc
 * -------------------------------------------------------------------------
 * Definitions for s3bulk::base::Config static members and Init() method.
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

#include "base/config.h"

#include <strings.h>

#include <fstream>
#include <stdexcept>

#include <boost/lexical_cast.hpp>

#include "base/logger.h"
#include "base/paths.h"

namespace s3bulk {
namespace base {

namespace {
const std::string DEFAULT_CONFIG_FILES[] = {
    "~/." PACKAGE_NAME "/" PACKAGE_NAME ".conf",
    SYSCONFDIR "/" PACKAGE_NAME ".conf"};

template <typename T>
class OptionParserWorker {
 public:
  static void Parse(const std::string &str, T *out) {
    *out = boost::lexical_cast<T>(str);
  }
};

template <>
class OptionParserWorker<std::string> {
 public:
  static void Parse(const std::string &str, std::string *out) { *out = str; }
};

template <>
class OptionParserWorker<bool> {
 public:
  static void Parse(const std::string &str, bool *out) {
    const char *s = str.c_str();

    if (!strcasecmp(s, "yes") || !strcasecmp(s, "true") ||
        !strcasecmp(s, "1") || !strcasecmp(s, "on")) {
      *out = true;
      return;
    }

    if (!strcasecmp(s, "no") || !strcasecmp(s, "false") ||
        !strcasecmp(s, "0") || !strcasecmp(s, "off")) {
      *out = false;
      return;
    }

    throw std::runtime_error("cannot parse.");
  }
};

template <typename T>
class OptionParser {
 public:
  static void Parse(int line_number, const char *key, const char *type,
                    const std::string &str, T *out) {
    try {
      OptionParserWorker<T>::Parse(str, out);
    } catch (const std::exception &e) {
      S3BULK_LOG(LOG_ERR, "Config::Init",
                 "error at line %i: cannot parse [%s] for key [%s] of type "
                 "%s: %s\n",
                 line_number, str.c_str(), key, type, e.what());
      throw std::runtime_error("malformed config file");
    }
  }
};

std::string Trim(const std::string &in) {
  const char *WHITESPACE = " \t\r";
  const size_t first = in.find_first_not_of(WHITESPACE);
  if (first == std::string::npos) return "";
  const size_t last = in.find_last_not_of(WHITESPACE);
  return in.substr(first, last - first + 1);
}
}  // namespace

#define CONFIG(type, name, def, desc) type Config::s_##name = (def);
#define CONFIG_REQUIRED(type, name, def, desc) CONFIG(type, name, def, desc)
#define CONFIG_CONSTRAINT(x, y)
#define CONFIG_KEY(x)

#include "base/config.inc"

#undef CONFIG
#undef CONFIG_REQUIRED
#undef CONFIG_CONSTRAINT
#undef CONFIG_KEY

void Config::Init(const std::string &file) {
  std::ifstream ifs;
  std::string source = file;

  if (file.empty()) {
    for (const auto &candidate : DEFAULT_CONFIG_FILES) {
      ifs.open(Paths::Transform(candidate).c_str());
      if (ifs.good()) {
        source = candidate;
        break;
      }
      ifs.clear();
    }

    if (!ifs.is_open()) {
      for (const auto &candidate : DEFAULT_CONFIG_FILES)
        S3BULK_LOG(LOG_ERR, "Config::Init",
                   "unable to open configuration in [%s]\n",
                   candidate.c_str());

      throw std::runtime_error("cannot open any default config files");
    }
  } else {
    ifs.open(Paths::Transform(file).c_str());

    if (ifs.fail()) {
      S3BULK_LOG(LOG_ERR, "Config::Init", "cannot open file [%s].\n",
                 file.c_str());
      throw std::runtime_error("cannot open specified config file");
    }
  }

  Load(&ifs, source);
}

bool Config::InitFromDefaults() {
  for (const auto &candidate : DEFAULT_CONFIG_FILES) {
    std::ifstream ifs(Paths::Transform(candidate).c_str());
    if (!ifs.good()) continue;

    Load(&ifs, candidate);
    return true;
  }

  S3BULK_LOG(LOG_DEBUG, "Config::InitFromDefaults",
             "no default config file found. using defaults.\n");
  return false;
}

void Config::Reset() {
#define CONFIG(type, name, def, desc) s_##name = (def);
#define CONFIG_REQUIRED(type, name, def, desc) CONFIG(type, name, def, desc)
#define CONFIG_CONSTRAINT(x, y)
#define CONFIG_KEY(x)

#include "base/config.inc"

#undef CONFIG
#undef CONFIG_REQUIRED
#undef CONFIG_CONSTRAINT
#undef CONFIG_KEY
}

void Config::Load(std::istream *in, const std::string &source) {
  int line_number = 0;

  S3BULK_LOG(LOG_DEBUG, "Config::Load", "reading configuration from [%s]\n",
             source.c_str());

  while (in->good()) {
    std::string line, key, value;
    size_t pos;

    std::getline(*in, line);
    line_number++;
    pos = line.find('#');

    if (pos != std::string::npos) line = line.substr(0, pos);

    line = Trim(line);
    if (line.empty()) continue;

    pos = line.find('=');

    if (pos == std::string::npos) {
      S3BULK_LOG(LOG_ERR, "Config::Init", "error at line %i: missing '='.\n",
                 line_number);
      throw std::runtime_error("malformed config file");
    }

    key = Trim(line.substr(0, pos));
    value = Trim(line.substr(pos + 1));

#define CONFIG(type, name, def, desc)                                      \
  if (key == #name) {                                                      \
    OptionParser<type>::Parse(line_number, #name, #type, value, &s_##name); \
    continue;                                                              \
  }

#define CONFIG_REQUIRED(type, name, def, desc) CONFIG(type, name, def, desc)
#define CONFIG_CONSTRAINT(x, y)
#define CONFIG_KEY(x)

#include "base/config.inc"

#undef CONFIG
#undef CONFIG_REQUIRED
#undef CONFIG_CONSTRAINT
#undef CONFIG_KEY

    S3BULK_LOG(LOG_ERR, "Config::Init",
               "error at line %i: unknown directive '%s'\n", line_number,
               key.c_str());
    throw std::runtime_error("malformed config file");
  }

  Validate();
}

void Config::Validate() {
#define CONFIG(type, name, def, desc)

#define CONFIG_REQUIRED(type, name, def, desc)                           \
  if (s_##name == (def)) {                                               \
    S3BULK_LOG(LOG_ERR, "Config::Init", "required key '%s' not defined.\n", \
               #name);                                                   \
    throw std::runtime_error("malformed config file");                   \
  }

#define CONFIG_CONSTRAINT(test, message)                  \
  if (!(test)) {                                          \
    S3BULK_LOG(LOG_ERR, "Config::Init", "%s\n", message); \
    throw std::runtime_error("malformed config file");    \
  }

#define CONFIG_KEY(key) s_##key

#include "base/config.inc"

#undef CONFIG
#undef CONFIG_REQUIRED
#undef CONFIG_CONSTRAINT
#undef CONFIG_KEY
}

}  // namespace base
}  // namespace s3bulk
