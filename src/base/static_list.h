/*
 * base/static_list.h
 * -------------------------------------------------------------------------
 * Static list of objects, populated at static initialization time.
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

#ifndef S3BULK_BASE_STATIC_LIST_H
#define S3BULK_BASE_STATIC_LIST_H

#include <map>
#include <utility>

namespace s3bulk {
namespace base {
template <class T>
class StaticList {
 private:
  using PriorityMap = std::multimap<int, T>;

 public:
  using const_iterator = typename PriorityMap::const_iterator;

  // Declare one of these at namespace scope to add |t| to the list.
  class Entry {
   public:
    inline Entry(const T &t, int priority) { Add(t, priority); }
  };

  inline static const_iterator begin() { return GetList()->begin(); }
  inline static const_iterator end() { return GetList()->end(); }

 private:
  // function-local so that entries in other translation units can be added
  // regardless of initialization order
  inline static PriorityMap *GetList() {
    static auto *list = new PriorityMap();
    return list;
  }

  inline static void Add(const T &t, int priority) {
    GetList()->insert(std::make_pair(priority, t));
  }
};
}  // namespace base
}  // namespace s3bulk

#endif
