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
#include "mpcnet/transport/detail/lane_establisher.hpp"
#include <boost/asio/connect.hpp>
#include <boost/thread/thread.hpp>
#include <string>

namespace mpcnet::transport::detail
{

Lane_establisher::Lane_establisher(flow::log::Logger* logger_ptr, util::Task_engine* task_engine,
                                   const Lane_config& cfg, bool with_role) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_cfg(cfg),
  m_with_role(with_role),
  m_task_engine(task_engine),
  m_acceptor(*m_task_engine)
{
  // Nothing else.
}

void Lane_establisher::listen(Error_code* err_code)
{
  using boost::asio::ip::tcp;
  using boost::asio::socket_base;

  tcp::resolver resolver(*m_task_engine);
  const auto endpoints = resolver.resolve(m_cfg.m_bind_address.m_host, std::to_string(m_cfg.m_bind_address.m_port),
                                          *err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Party [" << m_cfg.m_self_id << "]: Could not resolve bind address "
                     "[" << m_cfg.m_bind_address << "]: [" << *err_code << "] [" << err_code->message() << "].");
    return;
  }
  // else
  const tcp::endpoint endpoint = *endpoints.begin();

  m_acceptor.open(endpoint.protocol(), *err_code);
  if (!*err_code)
  {
    m_acceptor.set_option(socket_base::reuse_address(true), *err_code);
  }
  if (!*err_code)
  {
    m_acceptor.bind(endpoint, *err_code);
  }
  if (!*err_code)
  {
    m_acceptor.listen(socket_base::max_listen_connections, *err_code);
  }

  if (*err_code)
  {
    FLOW_LOG_WARNING("Party [" << m_cfg.m_self_id << "]: Could not listen on [" << endpoint << "]: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    Error_code dummy;
    m_acceptor.close(dummy);
    return;
  }
  // else

  FLOW_LOG_INFO("Party [" << m_cfg.m_self_id << "]: Listening on [" << endpoint << "].");
} // Lane_establisher::listen()

std::vector<Lane_establisher::Step> Lane_establisher::plan() const
{
  std::vector<Step> steps;
  const size_t n_roles = m_with_role ? 2 : 1;
  for (size_t lane_idx = 0; lane_idx != m_cfg.m_n_lanes; ++lane_idx)
  {
    for (size_t role = 0; role != n_roles; ++role)
    {
      for (party_id_t peer = 0; peer != m_cfg.n_parties(); ++peer)
      {
        if (peer == m_cfg.m_self_id)
        {
          continue;
        }
        // else
        Step step{ lane_idx, std::nullopt, peer, m_cfg.m_self_id < peer };
        if (m_with_role)
        {
          step.m_role = static_cast<uint8_t>(role);
        }
        steps.push_back(step);
      }
    }
  }
  return steps;
} // Lane_establisher::plan()

Lane_establisher::Socket Lane_establisher::connect(party_id_t to, util::Task_engine* task_engine,
                                                   Error_code* err_code)
{
  using boost::asio::ip::tcp;

  const auto& addr = m_cfg.m_party_addresses[to];
  Socket sock(*task_engine);

  tcp::resolver resolver(*m_task_engine);
  for (size_t attempt = 1; ; ++attempt)
  {
    Error_code sys_err_code;
    const auto endpoints = resolver.resolve(addr.m_host, std::to_string(addr.m_port), sys_err_code);
    if (!sys_err_code)
    {
      boost::asio::connect(sock, endpoints, sys_err_code);
    }
    if (!sys_err_code)
    {
      break;
    }
    // else

    // Peers are routinely not up yet; say so once in a while, not every 50 ms.
    if ((attempt == 1) || ((attempt % 100) == 0))
    {
      FLOW_LOG_INFO("Party [" << m_cfg.m_self_id << "]: Connect to party [" << to << "] at [" << addr << "] "
                    "failed (attempt [" << attempt << "]): [" << sys_err_code << "] [" << sys_err_code.message() << "]; "
                    "will keep retrying.");
    }
    boost::this_thread::sleep_for(m_cfg.m_connect_backoff);
  }

  sock.set_option(tcp::no_delay(true), *err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Party [" << m_cfg.m_self_id << "]: Could not set TCP_NODELAY on connection to party "
                     "[" << to << "]: [" << *err_code << "] [" << err_code->message() << "].");
    Error_code dummy;
    sock.close(dummy);
    return sock;
  }
  // else

  FLOW_LOG_TRACE("Party [" << m_cfg.m_self_id << "]: Connected to party [" << to << "] at "
                 "[" << sock.remote_endpoint(*err_code) << "].");
  err_code->clear();
  return sock;
} // Lane_establisher::connect()

Lane_establisher::Socket Lane_establisher::accept(util::Task_engine* task_engine, Error_code* err_code)
{
  Socket sock(*task_engine);

  m_acceptor.accept(sock, *err_code);
  if (!*err_code)
  {
    sock.set_option(boost::asio::ip::tcp::no_delay(true), *err_code);
  }
  if (*err_code)
  {
    FLOW_LOG_WARNING("Party [" << m_cfg.m_self_id << "]: Accept failed: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    Error_code dummy;
    sock.close(dummy);
    return sock;
  }
  // else

  FLOW_LOG_TRACE("Party [" << m_cfg.m_self_id << "]: Accepted connection from "
                 "[" << sock.remote_endpoint(*err_code) << "].");
  err_code->clear();
  return sock;
} // Lane_establisher::accept()

void Lane_establisher::check_incoming(const Lane_header& hdr, Error_code* err_code)
{
  const bool role_ok = m_with_role ? (hdr.m_role && (*hdr.m_role <= 1)) : (!hdr.m_role);
  const auto key = std::make_tuple(hdr.m_lane_idx, hdr.m_origin, hdr.m_role ? *hdr.m_role : uint8_t(0));

  if ((hdr.m_lane_idx >= m_cfg.m_n_lanes) || (hdr.m_origin >= m_cfg.m_self_id) || (!role_ok)
      || (m_seen.count(key) != 0))
  {
    FLOW_LOG_WARNING("Party [" << m_cfg.m_self_id << "]: Rejecting incoming connection with header lane "
                     "[" << hdr.m_lane_idx << "] origin [" << hdr.m_origin << "] role "
                     "[" << (hdr.m_role ? int(*hdr.m_role) : -1) << "]: out of range, unexpected origin, "
                     "bad role, or duplicate.");
    *err_code = error::Code::S_HANDSHAKE_FAILED;
    return;
  }
  // else

  m_seen.insert(key);
  err_code->clear();
}

const Lane_config& Lane_establisher::config() const
{
  return m_cfg;
}

} // namespace mpcnet::transport::detail
