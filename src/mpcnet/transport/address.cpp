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
#include "mpcnet/transport/address.hpp"
#include "mpcnet/transport/error.hpp"
#include <boost/lexical_cast.hpp>
#include <algorithm>

namespace mpcnet::transport
{

Address Address::parse(util::String_view str, Error_code* err_code) // Static.
{
  using boost::lexical_cast;
  using boost::bad_lexical_cast;
  using std::string;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Address, Address::parse, str, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const auto colon_pos = str.find(':');
  if ((colon_pos == util::String_view::npos) || (std::count(str.begin(), str.end(), ':') != 1))
  {
    *err_code = error::Code::S_CFG_INVALID_ADDRESS;
    return Address();
  }
  // else

  const auto port_str = str.substr(colon_pos + 1);
  if (port_str.empty() || (!std::all_of(port_str.begin(), port_str.end(),
                                        [](char ch) { return (ch >= '0') && (ch <= '9'); })))
  {
    *err_code = error::Code::S_CFG_INVALID_ADDRESS;
    return Address();
  }
  // else

  Address addr;
  try
  {
    // Go through unsigned int: lexical_cast<uint16_t> would treat the target as a character type on some setups.
    const auto port = lexical_cast<unsigned int>(string(port_str));
    if (port > 0xFFFF)
    {
      *err_code = error::Code::S_CFG_INVALID_ADDRESS;
      return Address();
    }
    addr.m_port = static_cast<uint16_t>(port);
  }
  catch (const bad_lexical_cast&)
  {
    *err_code = error::Code::S_CFG_INVALID_ADDRESS;
    return Address();
  }

  addr.m_host = string(str.substr(0, colon_pos));
  err_code->clear();
  return addr;
} // Address::parse()

std::ostream& operator<<(std::ostream& os, const Address& val)
{
  return os << val.m_host << ':' << val.m_port;
}

std::istream& operator>>(std::istream& is, Address& val)
{
  std::string token;
  if (!(is >> token))
  {
    return is;
  }
  // else

  Error_code err_code;
  auto addr = Address::parse(token, &err_code);
  if (err_code)
  {
    is.setstate(std::ios_base::failbit);
  }
  else
  {
    val = std::move(addr);
  }
  return is;
}

bool operator==(const Address& val1, const Address& val2)
{
  return (val1.m_host == val2.m_host) && (val1.m_port == val2.m_port);
}

bool operator!=(const Address& val1, const Address& val2)
{
  return !(val1 == val2);
}

} // namespace mpcnet::transport
