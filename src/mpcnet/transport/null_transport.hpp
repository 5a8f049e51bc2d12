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
#pragma once

#include "mpcnet/transport/transport_fwd.hpp"
#include <flow/util/blob.hpp>

namespace mpcnet::transport
{

// Types.

/**
 * Transport that goes nowhere: party ID 0, no peers; `send()` to anyone succeeds and does nothing; `recv()` from
 * anyone immediately returns an empty message.  Implements the Transport concept (see transport_fwd.hpp).
 *
 * Useful for running a protocol single-party, or for exercising the pool and engine without I/O.
 */
class Null_transport
{
public:
  // Methods.

  /**
   * Makes `n_lanes` lanes.
   *
   * @param n_lanes
   *        Count.
   * @return See above.
   */
  static std::vector<Null_transport> create_lanes(size_t n_lanes);

  /**
   * Returns 0.
   *
   * @return See above.
   */
  party_id_t id() const;

  /**
   * Returns nothing.
   *
   * @return See above.
   */
  std::vector<party_id_t> peer_ids() const;

  /**
   * Does nothing.
   *
   * @param to
   *        Ignored.
   * @param data
   *        Ignored.
   * @param err_code
   *        If not null, set to success.
   */
  void send(party_id_t to, const util::Blob_const& data, Error_code* err_code = 0);

  /**
   * Returns an empty message.
   *
   * @param from
   *        Ignored.
   * @param err_code
   *        If not null, set to success.
   * @return See above.
   */
  util::Blob recv(party_id_t from, Error_code* err_code = 0);
}; // class Null_transport

} // namespace mpcnet::transport
