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


#include "ordo/error/error.hpp"
#include "ordo/pmap/error/error.hpp"
#include "ordo/log/buffer_logger.hpp"
#include "ordo/log/config.hpp"
#include "ordo/test/test_common_util.hpp"
#include "ordo/util/util.hpp"
#include <gtest/gtest.h>
#include <string>

namespace ordo::error::test
{

namespace
{
using std::string;
namespace pmap_error = ordo::pmap::error;

/**
 * Returns `half` of `val`, or emits S_INDEX_OUT_OF_RANGE (standing in for any code) if it is odd.
 * Follows the Error_code convention.
 */
int halve(log::Logger* logger_ptr, int val, Error_code* err_code = 0)
{
  ORDO_ERROR_EXEC_AND_THROW_ON_ERROR(int, halve, logger_ptr, val, _1);
  // From here on err_code is non-null.

  ORDO_LOG_SET_CONTEXT(logger_ptr, Ordo_log_component::S_ERROR);
  if ((val % 2) != 0)
  {
    ORDO_ERROR_EMIT_ERROR(pmap_error::Code::S_INDEX_OUT_OF_RANGE);
    return 0;
  }
  // else
  err_code->clear();
  return val / 2;
}

/// Like halve() but `void`; the result goes to `*result`.
void halve_into(log::Logger* logger_ptr, int val, int* result, Error_code* err_code = 0)
{
  ORDO_ERROR_EXEC_VOID_AND_THROW_ON_ERROR(halve_into, logger_ptr, val, result, _1);

  *result = halve(logger_ptr, val, err_code);
}

} // Anonymous namespace

TEST(Error, Runtime_error)
{
  const Runtime_error with_code(pmap_error::Code::S_UNSUPPORTED_MUTATION, "some_context");
  EXPECT_EQ(with_code.code(), Error_code(pmap_error::Code::S_UNSUPPORTED_MUTATION));
  const string what = with_code.what();
  EXPECT_NE(what.find("some_context"), string::npos) << what;
  EXPECT_NE(what.find("In-place mutation is not supported by an immutable map."), string::npos) << what;
} // TEST(Error, Runtime_error)

TEST(Error, Exec_and_throw_on_error)
{
  log::Config cfg(log::Sev::S_INFO);
  cfg.init_component_names<Ordo_log_component>(S_ORDO_LOG_COMPONENT_NAME_MAP, "ordo_");
  log::Buffer_logger logger(&cfg);

  // Error_code mode.
  Error_code err_code;
  EXPECT_EQ(halve(&logger, 10, &err_code), 5);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(halve(&logger, 11, &err_code), 0);
  EXPECT_EQ(err_code, pmap_error::Code::S_INDEX_OUT_OF_RANGE);
  // The emitted error was logged as a warning.
  const string out = logger.buffer_str_copy();
  EXPECT_NE(out.find("[warn]"), string::npos) << out;
  EXPECT_NE(out.find("ORDO_ERROR"), string::npos) << out;
  EXPECT_NE(out.find("Index out of range"), string::npos) << out;

  // Exception mode.
  EXPECT_EQ(halve(&logger, 4), 2);
  try
  {
    halve(&logger, 5);
    ADD_FAILURE() << "halve(5) should have thrown.";
  }
  catch (const Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), pmap_error::Code::S_INDEX_OUT_OF_RANGE);
    EXPECT_NE(string(exc.what()).find("halve"), string::npos) << exc.what();
  }

  int result = -1;
  halve_into(&logger, 8, &result);
  EXPECT_EQ(result, 4);
  EXPECT_THROW(halve_into(&logger, 9, &result), Runtime_error);
  halve_into(&logger, 7, &result, &err_code);
  EXPECT_EQ(err_code, pmap_error::Code::S_INDEX_OUT_OF_RANGE);
  EXPECT_EQ(result, 0);

  // No logger: same semantics, just silent.
  EXPECT_THROW(halve(0, 3), Runtime_error);
} // TEST(Error, Exec_and_throw_on_error)

TEST(Error, Pmap_codes)
{
  const Error_code odd = pmap_error::Code::S_ODD_ARGUMENT_COUNT;
  const Error_code range = pmap_error::Code::S_INDEX_OUT_OF_RANGE;
  const Error_code mutation = pmap_error::Code::S_UNSUPPORTED_MUTATION;

  EXPECT_EQ(string(odd.category().name()), "ordo_pmap");
  EXPECT_EQ(&odd.category(), &range.category());
  EXPECT_EQ(odd.message(), "Ordered map requires an even number of arguments: a key was given without a value.");
  EXPECT_EQ(range.message(), "Index out of range: no entry is stored under the given sequence number.");
  EXPECT_EQ(mutation.message(), "In-place mutation is not supported by an immutable map.");
  EXPECT_NE(odd, range);
  EXPECT_TRUE(odd);
  EXPECT_EQ(range.value(), ordo::test::to_underlying(pmap_error::Code::S_INDEX_OUT_OF_RANGE));

  const pmap_error::Unpaired_key_error<string> exc("dangling", 3, "ctx");
  EXPECT_EQ(exc.code(), pmap_error::Code::S_ODD_ARGUMENT_COUNT);
  EXPECT_EQ(exc.unpaired_key(), "dangling");
  EXPECT_EQ(exc.arg_count(), 3u);
  const Runtime_error& as_base = exc;
  EXPECT_NE(string(as_base.what()).find("even number of arguments"), string::npos) << as_base.what();
} // TEST(Error, Pmap_codes)

} // namespace ordo::error::test
