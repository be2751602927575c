/* Ordo
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

#include "ordo/util/util_fwd.hpp"
#include "ordo/util/string_ostream.hpp"
#include <ostream>

namespace ordo::util
{

// Template/constexpr implementations.

template<typename ...T>
std::string ostream_op_string(T const &... args)
{
  String_ostream os;
  ((os.os() << args), ...);
  os.os().flush();
  return os.str();
}

constexpr String_view get_last_path_segment(String_view path)
{
  for (auto idx = path.size(); idx != 0; --idx)
  {
    if ((path[idx - 1] == '/') || (path[idx - 1] == '\\'))
    {
      return path.substr(idx);
    }
  }
  return path;
}

} // namespace ordo::util
