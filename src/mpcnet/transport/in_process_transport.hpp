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
#include <deque>
#include <map>
#include <memory>

namespace mpcnet::transport
{

// Types.

/**
 * Transport connecting parties that live in the same process, through in-memory queues: for tests and local
 * simulations of a whole multi-party computation.  Implements the Transport concept (see transport_fwd.hpp).
 *
 * Each ordered pair (sender, receiver) has its own unbounded FIFO queue.  `send()` copies the message into the
 * queue and returns at once.  `recv()` waits for the queue to become non-empty, but only up to the receive
 * timeout (S_DEFAULT_RECV_TIMEOUT unless specified otherwise at creation), after which it fails with
 * error::Code::S_TIMEOUT; so a test with a protocol bug fails instead of hanging.
 *
 * Obtain connected instances via create_parties() (one lane) or create_lanes() (several).
 */
class In_process_transport :
  public flow::log::Log_context
{
public:
  // Constants.

  /// Default receive timeout.
  static const util::Fine_duration S_DEFAULT_RECV_TIMEOUT;

  // Constructors/destructor.

  /**
   * Moves the queues from another transport into a new one.  `src` becomes unusable (except for destruction
   * and assignment).
   *
   * @param src
   *        Moved-from object.
   */
  In_process_transport(In_process_transport&& src);

  /// Boring destructor.  Messages queued toward this party are dropped when every party's transport is gone.
  ~In_process_transport();

  // Methods.

  /**
   * Move-assignment.  Same semantics as move constructor.
   *
   * @param src
   *        Moved-from object.
   * @return `*this`.
   */
  In_process_transport& operator=(In_process_transport&& src);

  /**
   * Creates the transports of `n_parties` mutually connected parties: element `i` is party `i`'s.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param n_parties
   *        Party count; may be 0 or 1 (no peers).
   * @param recv_timeout
   *        Receive timeout.
   * @return See above.
   */
  static std::vector<In_process_transport> create_parties(flow::log::Logger* logger_ptr, size_t n_parties,
                                                          util::Fine_duration recv_timeout = S_DEFAULT_RECV_TIMEOUT);

  /**
   * Creates `n_lanes` independent sets of create_parties() transports: `result[party][lane]`.  Lanes do not
   * share queues: a message sent on lane 2 is received only on lane 2.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param n_parties
   *        Party count.
   * @param n_lanes
   *        Lane count.
   * @param recv_timeout
   *        Receive timeout.
   * @return See above.
   */
  static std::vector<std::vector<In_process_transport>>
    create_lanes(flow::log::Logger* logger_ptr, size_t n_parties, size_t n_lanes,
                 util::Fine_duration recv_timeout = S_DEFAULT_RECV_TIMEOUT);

  /**
   * This party's ID.
   *
   * @return See above.
   */
  party_id_t id() const;

  /**
   * IDs of all other parties, ascending.
   *
   * @return See above.
   */
  std::vector<party_id_t> peer_ids() const;

  /**
   * Enqueues a copy of the message for the given peer.  Never blocks (beyond a brief lock).
   *
   * @param to
   *        Peer ID.
   * @param data
   *        Message; may be empty.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_UNKNOWN_PEER.
   */
  void send(party_id_t to, const util::Blob_const& data, Error_code* err_code = 0);

  /**
   * Dequeues the oldest message from the given peer, waiting for one up to the receive timeout.
   *
   * @param from
   *        Peer ID.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_UNKNOWN_PEER, error::Code::S_TIMEOUT.
   * @return The message; empty on error.
   */
  util::Blob recv(party_id_t from, Error_code* err_code = 0);

private:
  // Types.

  /// Queue of messages from one party to another.
  struct Queue
  {
    /// Protects #m_msgs.
    util::Mutex_non_recursive m_mutex;

    /// Signaled on each push.
    util::Condition_variable m_cond;

    /// Messages in send order.
    std::deque<util::Blob> m_msgs;
  }; // struct Queue

  /// Map from peer ID to the queue to/from it.
  using Queue_map = std::map<party_id_t, std::shared_ptr<Queue>>;

  // Constructors.

  /**
   * Constructs a transport with no peers yet.
   *
   * @param logger_ptr
   *        Logger.
   * @param self_id
   *        See id().
   * @param recv_timeout
   *        Receive timeout.
   */
  explicit In_process_transport(flow::log::Logger* logger_ptr, party_id_t self_id, util::Fine_duration recv_timeout);

  // Data.

  /// See id().
  party_id_t m_self_id;

  /// Receive timeout.
  util::Fine_duration m_recv_timeout;

  /// Queues we push onto, by receiving peer.
  Queue_map m_outbound;

  /// Queues we pop from, by sending peer.
  Queue_map m_inbound;
}; // class In_process_transport

} // namespace mpcnet::transport
