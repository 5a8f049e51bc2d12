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

#include "mpcnet/transport/lane_config.hpp"
#include <flow/util/blob.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <map>
#include <memory>

namespace mpcnet::transport
{

// Types.

/**
 * Lane of plain TCP connections: one connection per peer, carrying length-prefixed frames (see detail/framing.hpp)
 * in both directions.  Implements the Transport concept (see transport_fwd.hpp).
 *
 * Obtain the L lanes of a session via create_lanes(), which runs the connection establishment protocol described
 * in Lane_config.  After that a Socket_transport is immutable except for the I/O on its connections.
 *
 * ### Threads and directions ###
 * For each peer the connection is represented by 2 socket objects: the send socket, and the receive socket,
 * which wraps a `dup()`licate of the same descriptor.  Each has its own mutex.  Hence a send to peer A, a send to
 * peer B, and a receive from peer A never contend.  Concurrent sends to one peer are serialized by that peer's
 * send mutex, so frames are never interleaved.
 *
 * ### Timeouts ###
 * `recv()` has none: it blocks until a frame arrives or the connection fails, as MPC protocol steps legitimately
 * wait for slow peers.  `send()` gives up after Lane_config::m_send_timeout with error::Code::S_TIMEOUT, so a peer
 * that stops reading cannot wedge the sender forever.  boost.asio's synchronous operations do not observe
 * `SO_SNDTIMEO`; hence each connection has its own `Task_engine`, which `send()` runs to carry out an asynchronous
 * write raced against a timer (see detail::write_frame()).  A timed-out frame is partially written, so the
 * connection to that peer must not be used again.
 */
class Socket_transport :
  public flow::log::Log_context
{
public:
  // Types.

  /// Short-hand for the socket type.
  using Socket = boost::asio::ip::tcp::socket;

  // Constructors/destructor.

  /**
   * Moves the connections from another lane into a new one.  `src` becomes unusable (except for destruction
   * and assignment).
   *
   * @param src
   *        Moved-from object.
   */
  Socket_transport(Socket_transport&& src);

  /// Closes all connections of this lane.
  ~Socket_transport();

  // Methods.

  /**
   * Move-assignment.  Same semantics as move constructor.
   *
   * @param src
   *        Moved-from object.
   * @return `*this`.
   */
  Socket_transport& operator=(Socket_transport&& src);

  /**
   * Runs the connection establishment protocol (see Lane_config) and returns the resulting lanes, `L` of them,
   * lane `i` at index `i`.  Blocks until every connection of every lane is up.  Typically all parties call this
   * at about the same time; connects to not-yet-listening parties are retried forever.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently (by the returned objects too).
   * @param cfg
   *        Config.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_CFG_INVALID_PARTY_ID, error::Code::S_CFG_INVALID_ADDRESS,
   *        error::Code::S_CFG_INVALID_LANE_COUNT (see Lane_config::validate()); error::Code::S_HANDSHAKE_FAILED (an incoming connection's header was
   *        invalid); system errors from listening (e.g., `address_in_use`), accepting, or I/O.
   * @return The lanes; empty on error.
   */
  static std::vector<Socket_transport> create_lanes(flow::log::Logger* logger_ptr, const Lane_config& cfg,
                                                    Error_code* err_code = 0);

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
   * Index of this lane in the `create_lanes()` result.
   *
   * @return See above.
   */
  size_t lane_idx() const;

  /**
   * Sends one message to the given peer.  Blocks until it is handed to the kernel, or the send timeout expires.
   *
   * @param to
   *        Peer ID.
   * @param data
   *        Message; may be empty.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_UNKNOWN_PEER, error::Code::S_MESSAGE_TOO_LARGE, error::Code::S_TIMEOUT, system errors
   *        such as `boost::asio::error::broken_pipe`.
   */
  void send(party_id_t to, const util::Blob_const& data, Error_code* err_code = 0);

  /**
   * Receives the next message from the given peer.  Blocks until it has fully arrived.
   *
   * @param from
   *        Peer ID.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_UNKNOWN_PEER, error::Code::S_SHORT_READ (peer closed the connection), system errors
   *        such as `boost::asio::error::connection_reset`.
   * @return The message; empty on error.
   */
  util::Blob recv(party_id_t from, Error_code* err_code = 0);

private:
  // Types.

  /// One direction of the connection to one peer.
  struct Pipe
  {
    /// Execution context of #m_socket and nothing else.  Declared first, so it outlives #m_socket.
    std::unique_ptr<util::Task_engine> m_task_engine;

    /// Serializes operations on #m_socket.
    util::Mutex_non_recursive m_mutex;

    /// The socket.
    Socket m_socket;

    /**
     * Takes ownership of the socket and its execution context.
     *
     * @param task_engine
     *        Execution context of `socket`.
     * @param socket
     *        Connected socket.
     */
    explicit Pipe(std::unique_ptr<util::Task_engine>&& task_engine, Socket&& socket);
  }; // struct Pipe

  /// Map from peer ID to one direction to/from it.  `unique_ptr` as Pipe is not movable.
  using Pipe_map = std::map<party_id_t, std::unique_ptr<Pipe>>;

  // Constructors.

  /**
   * Constructs a lane with no connections yet; create_lanes() adds them via add_peer().
   *
   * @param logger_ptr
   *        Logger.
   * @param self_id
   *        See id().
   * @param lane_idx
   *        See lane_idx().
   * @param send_timeout
   *        See Lane_config::m_send_timeout.
   */
  explicit Socket_transport(flow::log::Logger* logger_ptr, party_id_t self_id, size_t lane_idx,
                            util::Fine_duration send_timeout);

  // Methods.

  /**
   * Installs the connection to the given peer, splitting it into send and receive sockets.
   *
   * @param peer
   *        Peer ID.
   * @param task_engine
   *        Execution context of `socket`; it stays with the send socket.
   * @param socket
   *        Connected socket.
   * @param err_code
   *        Must not be null.  Set to success or the system error from `dup()`.
   */
  void add_peer(party_id_t peer, std::unique_ptr<util::Task_engine>&& task_engine, Socket&& socket,
                Error_code* err_code);

  // Data.

  /// See id().
  party_id_t m_self_id;

  /// See lane_idx().
  size_t m_lane_idx;

  /// See Lane_config::m_send_timeout.
  util::Fine_duration m_send_timeout;

  /// Send direction per peer.
  Pipe_map m_send_pipes;

  /// Receive direction per peer.
  Pipe_map m_recv_pipes;
}; // class Socket_transport

} // namespace mpcnet::transport
