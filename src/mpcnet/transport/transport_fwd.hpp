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

#include "mpcnet/util/util_fwd.hpp"
#include <vector>

/**
 * Transport layer of mpcnet: byte-message channels between the parties of a multi-party computation.
 *
 * ### The Transport concept ###
 * Every transport class here is one *lane*: a full set of connections from this party to every other party.
 * The pool (pool::Resource_pool) and engine (engine::Dual_pool_engine) are templates over any type `T` that
 * is movable and offers:
 *
 *   ~~~
 *   party_id_t id() const;                    // This party's ID.
 *   std::vector<party_id_t> peer_ids() const;  // Reachable peers, sorted.
 *   void send(party_id_t to, const util::Blob_const& data, Error_code* err_code = 0);
 *   util::Blob recv(party_id_t from, Error_code* err_code = 0);
 *   ~~~
 *
 * `send()` and `recv()` block until done or the variant's timeout.  Each (peer, direction) is an independent
 * channel with its own lock: sending to peer A, sending to peer B, and receiving from peer A may all proceed
 * concurrently from different threads.  Two concurrent sends to the same peer are serialized, so messages are
 * never interleaved on the wire.  Errors follow the usual `Error_code* err_code` convention; see
 * transport::error.
 *
 * The variants:
 *   - Socket_transport: TCP.
 *   - Secure_transport: TLS over TCP.
 *   - In_process_transport: in-memory queues; for tests and simulations within one process.
 *   - Null_transport: no peers; sends vanish, receives return empty payloads.
 *
 * Socket_transport and Secure_transport are obtained, all L lanes at once, through their `create_lanes()`
 * factories, which run the connection establishment protocol against the other parties (see Lane_config).
 */
namespace mpcnet::transport
{

// Types.

/// Party identifier within one computation: `0` through `N - 1`.
using party_id_t = size_t;

// Find doc headers near the bodies of these compound types.

struct Address;
struct Lane_config;
struct Tls_credentials;
class Socket_transport;
class Secure_transport;
class In_process_transport;
class Null_transport;

// Free functions.

/**
 * Prints string representation of the given `Address` to the given `ostream`: `host:port`.
 *
 * @relatesalso Address
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Address& val);

/**
 * Parses an `Address` from the given `istream`, reading one whitespace-delimited token.  On parse failure sets
 * `failbit` on `is`.
 *
 * @relatesalso Address
 *
 * @param is
 *        Stream from which to read.
 * @param val
 *        Target; unchanged on failure.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Address& val);

/**
 * Returns `true` if and only if the two addresses have equal host and port.
 *
 * @relatesalso Address
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator==(const Address& val1, const Address& val2);

/**
 * Negation of similar `==`.
 *
 * @relatesalso Address
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator!=(const Address& val1, const Address& val2);

/**
 * Prints string representation of the given `Lane_config` to the given `ostream`.
 *
 * @relatesalso Lane_config
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Lane_config& val);

/**
 * Prints a brief description of the given `Tls_credentials` (certificate count and sizes; never key material)
 * to the given `ostream`.
 *
 * @relatesalso Tls_credentials
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Tls_credentials& val);

/**
 * Prints string representation of the given transport to the given `ostream`.
 *
 * @relatesalso Socket_transport
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Socket_transport& val);

/**
 * Prints string representation of the given transport to the given `ostream`.
 *
 * @relatesalso Secure_transport
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Secure_transport& val);

/**
 * Prints string representation of the given transport to the given `ostream`.
 *
 * @relatesalso In_process_transport
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const In_process_transport& val);

/**
 * Prints string representation of the given transport to the given `ostream`.
 *
 * @relatesalso Null_transport
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Null_transport& val);

} // namespace mpcnet::transport
