/* mpcnet: Lane-Pooled MPC Networking
 * Copyright (c) 2023 Akamai Technologies, Inc.; and other contributors.
 * Each commit is copyright by its respective author or author's employer.
 *
 * Licensed under the MIT License:
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE. */

/// @file
#include "mpcnet/transport/error.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace mpcnet::transport::test
{

TEST(Transport_error, Codes)
{
  using error::Code;

  const Error_code err_code = Code::S_TIMEOUT;
  EXPECT_TRUE(bool(err_code));
  EXPECT_STREQ(err_code.category().name(), "mpcnet/transport");
  EXPECT_FALSE(err_code.message().empty());
  EXPECT_NE(Error_code(Code::S_TIMEOUT), Error_code(Code::S_SHORT_READ));
  EXPECT_EQ(Error_code(Code::S_TIMEOUT), err_code);

  // Every code has its own message.
  for (int val = error::S_CODE_LOWEST_INT_VALUE; val != int(Code::S_END_SENTINEL); ++val)
  {
    const Error_code code = Code(val);
    EXPECT_FALSE(code.message().empty()) << val;
    for (int other = val + 1; other != int(Code::S_END_SENTINEL); ++other)
    {
      EXPECT_NE(code.message(), Error_code(Code(other)).message()) << val << " vs. " << other;
    }
  }
}

TEST(Transport_error, Stream_ops)
{
  using error::Code;

  std::ostringstream os;
  os << Code::S_HANDSHAKE_FAILED;
  EXPECT_EQ(os.str(), "HANDSHAKE_FAILED");

  for (int val = error::S_CODE_LOWEST_INT_VALUE; val != int(Code::S_END_SENTINEL); ++val)
  {
    std::ostringstream out;
    out << Code(val);
    std::istringstream in(out.str());
    Code parsed = Code::S_END_SENTINEL;
    in >> parsed;
    EXPECT_EQ(parsed, Code(val)) << out.str();
  }

  std::istringstream lower("short_read");
  Code parsed = Code::S_END_SENTINEL;
  lower >> parsed;
  EXPECT_EQ(parsed, Code::S_SHORT_READ);

  std::istringstream junk("NOT_A_CODE");
  junk >> parsed;
  EXPECT_EQ(parsed, Code::S_END_SENTINEL);
}

} // namespace mpcnet::transport::test
