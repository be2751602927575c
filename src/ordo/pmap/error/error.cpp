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
#include "ordo/pmap/error/error.hpp"

namespace ordo::pmap::error
{

// Types.

/**
 * boost.system category of the pmap error codes: supplies the `"ordo_pmap"` name and the message text of each
 * Code.  Private to this translation unit; reached only through `Error_code::category()` and
 * `Error_code::message()`.
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Implements `error_category` API: the category name, shown when an Error_code of this category is printed.
   * @return See above.
   */
  const char* name() const noexcept override;

  /**
   * Implements `error_category` API: the message for a Code value.
   *
   * @param val
   *        `int(Code)`.
   * @return See above.
   */
  std::string message(int val) const override;

private:
  // Constructors/destructor.

  /// Constructs the one instance.
  Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  return Error_code{static_cast<int>(err_code), Category::S_CATEGORY};
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "ordo_pmap";
}

std::string Category::message(int val) const // Virtual.
{
  // Same text as the comments on the Code members.
  switch (static_cast<Code>(val))
  {
  case Code::S_ODD_ARGUMENT_COUNT:
    return "Ordered map requires an even number of arguments: a key was given without a value.";
  case Code::S_INDEX_OUT_OF_RANGE:
    return "Index out of range: no entry is stored under the given sequence number.";
  case Code::S_UNSUPPORTED_MUTATION:
    return "In-place mutation is not supported by an immutable map.";
  case Code::S_END_SENTINEL:
    break;
  }
  return "Unknown ordo_pmap error.";
}

} // namespace ordo::pmap::error
