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
#include "mpcnet/transport/null_transport.hpp"

namespace mpcnet::transport
{

std::vector<Null_transport> Null_transport::create_lanes(size_t n_lanes) // Static.
{
  return std::vector<Null_transport>(n_lanes);
}

party_id_t Null_transport::id() const
{
  return 0;
}

std::vector<party_id_t> Null_transport::peer_ids() const
{
  return std::vector<party_id_t>();
}

void Null_transport::send(party_id_t, const util::Blob_const&, Error_code* err_code)
{
  if (err_code)
  {
    err_code->clear();
  }
}

util::Blob Null_transport::recv(party_id_t, Error_code* err_code)
{
  if (err_code)
  {
    err_code->clear();
  }
  return util::Blob();
}

std::ostream& operator<<(std::ostream& os, const Null_transport& val)
{
  return os << "null@" << &val;
}

} // namespace mpcnet::transport
