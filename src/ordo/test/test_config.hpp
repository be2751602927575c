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

#include "ordo/log/log_fwd.hpp"

namespace ordo::test
{

/// Settings of the unit test run, filled in by the test executable's `main()` before the tests start.
class Test_config
{
public:
  /**
   * The one instance.
   * @return See above.
   */
  static Test_config& get_singleton();

  /// Default verbosity of Test_logger.
  log::Sev m_sev = log::Sev::S_INFO;

private:
  Test_config() = default;
}; // class Test_config

} // namespace ordo::test
