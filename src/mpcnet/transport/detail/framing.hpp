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
#include "mpcnet/transport/error.hpp"
#include <flow/util/blob.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <boost/asio/basic_waitable_timer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/error.hpp>
#include <boost/endian/conversion.hpp>
#include <array>
#include <optional>
#include <cstring>

/**
 * Wire format helpers shared by the stream-based transports (Socket_transport, Secure_transport).
 *
 * Two things travel on a connection:
 *   - Once, right after it is opened: the *lane header*, written by the connecting side:
 *     `lane index (u64 big-endian) | origin party ID (u64 big-endian)`, and, for Secure_transport only,
 *     `| role (u8)`.
 *   - Then, any number of *frames*: `payload length (u32 big-endian) | payload`.
 *
 * The functions are templates on `Sync_stream`, which is anything boost.asio's synchronous `read()`/`write()`
 * accept: a TCP socket or an SSL stream over one.  write_frame() needs the asynchronous counterpart as well
 * (`Async_stream`); both of those types qualify.
 */
namespace mpcnet::transport::detail
{

// Types.

/// Decoded lane header; see namespace doc header.
struct Lane_header
{
  /// Lane index in `[0, L)`.
  uint64_t m_lane_idx = 0;

  /// Party ID of the connecting side.
  uint64_t m_origin = 0;

  /// Direction tag: present only for Secure_transport connections.
  std::optional<uint8_t> m_role;
}; // struct Lane_header

// Constants.

/// Largest payload a frame can carry.
constexpr uint64_t S_MAX_FRAME_PAYLOAD_SIZE = 0xFFFFFFFF;

/// Size of a lane header sans role byte.
constexpr size_t S_LANE_HEADER_SIZE = 2 * sizeof(uint64_t);

// Free functions.

/**
 * Writes one frame (length prefix plus payload) as one gathered write.  Blocks until done, or until `timeout`
 * expires, whichever comes first.
 *
 * The write is asynchronous on `task_engine`, which this call then runs until the write and the timer are both
 * finished.  So `task_engine` must be the execution context of `stream`, and nothing else may run it concurrently.
 * On expiry the pending write is canceled: the frame may be partly on the wire, and `stream` must not be written
 * to again.
 *
 * @tparam Async_stream
 *         See namespace doc header.
 * @param stream
 *        Connected stream.
 * @param task_engine
 *        Execution context of `stream`, not running.
 * @param data
 *        Payload; may be empty.
 * @param timeout
 *        Longest the write may take; zero for no limit.
 * @param err_code
 *        Must not be null.  Set to success; error::Code::S_MESSAGE_TOO_LARGE; error::Code::S_TIMEOUT; or the
 *        stream's write error.
 */
template<typename Async_stream>
void write_frame(Async_stream* stream, util::Task_engine* task_engine, const util::Blob_const& data,
                 util::Fine_duration timeout, Error_code* err_code)
{
  namespace asio = boost::asio;

  if (uint64_t(data.size()) > S_MAX_FRAME_PAYLOAD_SIZE)
  {
    *err_code = error::Code::S_MESSAGE_TOO_LARGE;
    return;
  }
  // else

  const uint32_t length_be = boost::endian::native_to_big(static_cast<uint32_t>(data.size()));
  const std::array<util::Blob_const, 2> bufs{{ asio::buffer(&length_be, sizeof(length_be)), data }};

  util::Timer timer(*task_engine);
  bool write_done = false;
  bool timed_out = false;
  Error_code write_err_code;

  asio::async_write(*stream, bufs, [&](const Error_code& async_err_code, size_t)
  {
    write_done = true;
    write_err_code = async_err_code;
    timer.cancel();
  });

  if (timeout != util::Fine_duration::zero())
  {
    timer.expires_after(timeout);
    timer.async_wait([&](const Error_code& async_err_code)
    {
      // The write may have completed in the same run() just before the timer fired; then there is nothing to do.
      if (async_err_code || write_done)
      {
        return;
      }
      // else
      timed_out = true;
      Error_code dummy;
      stream->lowest_layer().cancel(dummy);
    });
  }

  task_engine->restart();
  task_engine->run();

  if (!write_err_code)
  {
    err_code->clear();
  }
  else
  {
    *err_code = timed_out ? Error_code(error::Code::S_TIMEOUT) : write_err_code;
  }
} // write_frame()

/**
 * Reads one frame, blocking until all of it has arrived.
 *
 * @tparam Sync_stream
 *         See namespace doc header.
 * @param stream
 *        Connected stream.
 * @param err_code
 *        Must not be null.  Set to success; error::Code::S_SHORT_READ (stream ended at or inside a frame); or the
 *        stream's read error.
 * @return The payload (empty on error).
 */
template<typename Sync_stream>
util::Blob read_frame(Sync_stream* stream, Error_code* err_code)
{
  namespace asio = boost::asio;

  uint32_t length_be = 0;
  err_code->clear();
  asio::read(*stream, asio::buffer(&length_be, sizeof(length_be)), *err_code);
  if (*err_code)
  {
    if (*err_code == asio::error::eof)
    {
      *err_code = error::Code::S_SHORT_READ;
    }
    return util::Blob();
  }
  // else

  util::Blob payload(boost::endian::big_to_native(length_be));
  if (!payload.empty())
  {
    asio::read(*stream, payload.mutable_buffer(), *err_code);
    if (*err_code)
    {
      if (*err_code == asio::error::eof)
      {
        *err_code = error::Code::S_SHORT_READ;
      }
      return util::Blob();
    }
  }

  return payload;
}

/**
 * Writes a lane header: 16 bytes, or 17 if `hdr.m_role` is set.
 *
 * @tparam Sync_stream
 *         See namespace doc header.
 * @param stream
 *        Freshly connected stream.
 * @param hdr
 *        What to write.
 * @param err_code
 *        Must not be null.  Set to success or the stream's write error.
 */
template<typename Sync_stream>
void write_lane_header(Sync_stream* stream, const Lane_header& hdr, Error_code* err_code)
{
  std::array<uint8_t, S_LANE_HEADER_SIZE + 1> raw;
  const uint64_t lane_be = boost::endian::native_to_big(hdr.m_lane_idx);
  const uint64_t origin_be = boost::endian::native_to_big(hdr.m_origin);
  std::memcpy(raw.data(), &lane_be, sizeof(lane_be));
  std::memcpy(raw.data() + sizeof(lane_be), &origin_be, sizeof(origin_be));

  size_t size = S_LANE_HEADER_SIZE;
  if (hdr.m_role)
  {
    raw[size++] = *hdr.m_role;
  }

  err_code->clear();
  boost::asio::write(*stream, boost::asio::buffer(raw.data(), size), *err_code);
}

/**
 * Reads a lane header.  Does not validate its contents; that is up to the caller (see Lane_establisher).
 *
 * @tparam Sync_stream
 *         See namespace doc header.
 * @param stream
 *        Freshly accepted stream.
 * @param with_role
 *        Whether to expect the role byte.
 * @param err_code
 *        Must not be null.  Set to success; error::Code::S_HANDSHAKE_FAILED (stream ended early); or the stream's
 *        read error.
 * @return The header.
 */
template<typename Sync_stream>
Lane_header read_lane_header(Sync_stream* stream, bool with_role, Error_code* err_code)
{
  std::array<uint8_t, S_LANE_HEADER_SIZE + 1> raw;
  const size_t size = S_LANE_HEADER_SIZE + (with_role ? 1 : 0);

  err_code->clear();
  boost::asio::read(*stream, boost::asio::buffer(raw.data(), size), *err_code);
  if (*err_code)
  {
    if (*err_code == boost::asio::error::eof)
    {
      *err_code = error::Code::S_HANDSHAKE_FAILED;
    }
    return Lane_header();
  }
  // else

  uint64_t lane_be;
  uint64_t origin_be;
  std::memcpy(&lane_be, raw.data(), sizeof(lane_be));
  std::memcpy(&origin_be, raw.data() + sizeof(lane_be), sizeof(origin_be));

  Lane_header hdr;
  hdr.m_lane_idx = boost::endian::big_to_native(lane_be);
  hdr.m_origin = boost::endian::big_to_native(origin_be);
  if (with_role)
  {
    hdr.m_role = raw[S_LANE_HEADER_SIZE];
  }
  return hdr;
}

} // namespace mpcnet::transport::detail
