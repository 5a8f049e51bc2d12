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
#include "mpcnet/transport/socket_transport.hpp"
#include "mpcnet/transport/detail/lane_establisher.hpp"
#include "mpcnet/transport/detail/framing.hpp"
#include "mpcnet/transport/error.hpp"
#include <unistd.h>
#include <cerrno>

namespace mpcnet::transport
{

// Socket_transport::Pipe implementations.

Socket_transport::Pipe::Pipe(std::unique_ptr<util::Task_engine>&& task_engine, Socket&& socket) :
  m_task_engine(std::move(task_engine)),
  m_socket(std::move(socket))
{
  // That's it.
}

// Socket_transport implementations.

Socket_transport::Socket_transport(flow::log::Logger* logger_ptr, party_id_t self_id, size_t lane_idx,
                                   util::Fine_duration send_timeout) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_self_id(self_id),
  m_lane_idx(lane_idx),
  m_send_timeout(send_timeout)
{
  // Nothing else.
}

Socket_transport::Socket_transport(Socket_transport&&) = default;

Socket_transport& Socket_transport::operator=(Socket_transport&&) = default;

Socket_transport::~Socket_transport()
{
  if (!m_send_pipes.empty())
  {
    FLOW_LOG_TRACE("Socket_transport [" << *this << "]: Closing connections to [" << m_send_pipes.size() << "] "
                   "peers.");
  }
}

std::vector<Socket_transport> Socket_transport::create_lanes(flow::log::Logger* logger_ptr, const Lane_config& cfg,
                                                             Error_code* err_code) // Static.
{
  using detail::Lane_establisher;
  using detail::Lane_header;
  using std::vector;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(vector<Socket_transport>, Socket_transport::create_lanes, logger_ptr, cfg, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_TRANSPORT);

  cfg.validate(err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Socket_transport lane set: Invalid config [" << cfg << "]: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return vector<Socket_transport>();
  }
  // else

  FLOW_LOG_INFO("Socket_transport lane set: Establishing per config [" << cfg << "].");

  util::Task_engine task_engine;
  Lane_establisher establisher(logger_ptr, &task_engine, cfg, false);
  establisher.listen(err_code);
  if (*err_code)
  {
    return vector<Socket_transport>();
  }
  // else

  vector<Socket_transport> lanes;
  lanes.reserve(cfg.m_n_lanes);
  for (size_t lane_idx = 0; lane_idx != cfg.m_n_lanes; ++lane_idx)
  {
    lanes.emplace_back(Socket_transport(logger_ptr, cfg.m_self_id, lane_idx, cfg.m_send_timeout));
  }

  for (const auto& step : establisher.plan())
  {
    auto conn_task_engine = std::make_unique<util::Task_engine>();
    Lane_establisher::Socket sock(*conn_task_engine);
    Lane_header hdr;
    if (step.m_initiate)
    {
      sock = establisher.connect(step.m_peer, conn_task_engine.get(), err_code);
      if (!*err_code)
      {
        hdr.m_lane_idx = step.m_lane_idx;
        hdr.m_origin = cfg.m_self_id;
        detail::write_lane_header(&sock, hdr, err_code);
        hdr.m_origin = step.m_peer; // Route it below as the peer's connection.
      }
    }
    else
    {
      sock = establisher.accept(conn_task_engine.get(), err_code);
      if (!*err_code)
      {
        hdr = detail::read_lane_header(&sock, false, err_code);
      }
      if (!*err_code)
      {
        establisher.check_incoming(hdr, err_code);
      }
    }

    if (!*err_code)
    {
      lanes[hdr.m_lane_idx].add_peer(hdr.m_origin, std::move(conn_task_engine), std::move(sock), err_code);
    }
    if (*err_code)
    {
      FLOW_LOG_WARNING("Socket_transport lane set: Establishment failed at lane [" << step.m_lane_idx << "] "
                       "peer [" << step.m_peer << "] (" << (step.m_initiate ? "connect" : "accept") << "): "
                       "[" << *err_code << "] [" << err_code->message() << "].  Aborting setup.");
      return vector<Socket_transport>();
    }
  } // for (step : plan())

  FLOW_LOG_INFO("Socket_transport lane set: Party [" << cfg.m_self_id << "] established [" << lanes.size() << "] "
                "lanes to [" << (cfg.n_parties() - 1) << "] peers.");
  err_code->clear();
  return lanes;
} // Socket_transport::create_lanes()

void Socket_transport::add_peer(party_id_t peer, std::unique_ptr<util::Task_engine>&& task_engine, Socket&& socket,
                                Error_code* err_code)
{
  const int dup_fd = ::dup(socket.native_handle());
  if (dup_fd == -1)
  {
    *err_code = Error_code(errno, boost::system::system_category());
    return;
  }
  // else

  const auto protocol = socket.local_endpoint(*err_code).protocol();
  if (*err_code)
  {
    ::close(dup_fd);
    return;
  }
  // else

  auto recv_task_engine = std::make_unique<util::Task_engine>();
  Socket recv_socket(*recv_task_engine);
  recv_socket.assign(protocol, dup_fd, *err_code);
  if (*err_code)
  {
    ::close(dup_fd);
    return;
  }
  // else

  m_send_pipes.emplace(peer, std::make_unique<Pipe>(std::move(task_engine), std::move(socket)));
  m_recv_pipes.emplace(peer, std::make_unique<Pipe>(std::move(recv_task_engine), std::move(recv_socket)));
  FLOW_LOG_TRACE("Socket_transport [" << *this << "]: Connected to peer [" << peer << "].");
} // Socket_transport::add_peer()

party_id_t Socket_transport::id() const
{
  return m_self_id;
}

std::vector<party_id_t> Socket_transport::peer_ids() const
{
  std::vector<party_id_t> ids;
  ids.reserve(m_send_pipes.size());
  for (const auto& peer_and_pipe : m_send_pipes)
  {
    ids.push_back(peer_and_pipe.first);
  }
  return ids;
}

size_t Socket_transport::lane_idx() const
{
  return m_lane_idx;
}

void Socket_transport::send(party_id_t to, const util::Blob_const& data, Error_code* err_code)
{
  using util::Lock_guard_non_recursive;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { send(to, data, actual_err_code); },
         err_code, "Socket_transport::send()"))
  {
    return;
  }
  // else

  const auto pipe_it = m_send_pipes.find(to);
  if (pipe_it == m_send_pipes.end())
  {
    FLOW_LOG_WARNING("Socket_transport [" << *this << "]: Send to unknown peer [" << to << "].");
    *err_code = error::Code::S_UNKNOWN_PEER;
    return;
  }
  // else
  auto& pipe = *pipe_it->second;

  FLOW_LOG_TRACE("Socket_transport [" << *this << "]: Sending [" << data.size() << "] bytes to peer [" << to << "].");
  {
    Lock_guard_non_recursive lock(pipe.m_mutex);
    detail::write_frame(&pipe.m_socket, pipe.m_task_engine.get(), data, m_send_timeout, err_code);
  }

  if (*err_code)
  {
    FLOW_LOG_WARNING("Socket_transport [" << *this << "]: Send to peer [" << to << "] failed: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
  }
} // Socket_transport::send()

util::Blob Socket_transport::recv(party_id_t from, Error_code* err_code)
{
  using util::Lock_guard_non_recursive;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(util::Blob, Socket_transport::recv, from, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const auto pipe_it = m_recv_pipes.find(from);
  if (pipe_it == m_recv_pipes.end())
  {
    FLOW_LOG_WARNING("Socket_transport [" << *this << "]: Receive from unknown peer [" << from << "].");
    *err_code = error::Code::S_UNKNOWN_PEER;
    return util::Blob();
  }
  // else
  auto& pipe = *pipe_it->second;

  util::Blob payload;
  {
    Lock_guard_non_recursive lock(pipe.m_mutex);
    payload = detail::read_frame(&pipe.m_socket, err_code);
  }

  if (*err_code)
  {
    FLOW_LOG_WARNING("Socket_transport [" << *this << "]: Receive from peer [" << from << "] failed: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return util::Blob();
  }
  // else

  FLOW_LOG_TRACE("Socket_transport [" << *this << "]: Received [" << payload.size() << "] bytes from peer "
                 "[" << from << "].");
  return payload;
} // Socket_transport::recv()

std::ostream& operator<<(std::ostream& os, const Socket_transport& val)
{
  return os << "tcp:party" << val.id() << "/lane" << val.lane_idx() << '@' << &val;
}

} // namespace mpcnet::transport
