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

#include "ordo/common.hpp"

/**
 * Ordo module for reporting errors.
 *
 * An Ordo operation that can fail takes a last argument `Error_code* err_code = 0`:
 *   - With `err_code` null, a failure throws Runtime_error, whose `code()` says what went wrong.
 *   - With `err_code` non-null, nothing is thrown.  `*err_code` is set to the failure, or cleared on success.  What
 *     is returned on failure is documented by each operation.
 *
 * Operations are written once, in the second form; ORDO_ERROR_EXEC_AND_THROW_ON_ERROR() at the top of the
 * function supplies the first form.  Error code sets live in per-module `error` namespaces, such as
 * ordo::pmap::error.
 */
namespace ordo::error
{

// Types.

class Runtime_error;

} // namespace ordo::error
