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
#include "mpcnet/transport/in_process_transport.hpp"
#include "mpcnet/transport/error.hpp"

namespace mpcnet::transport
{

// Static initializations.

const util::Fine_duration In_process_transport::S_DEFAULT_RECV_TIMEOUT = boost::chrono::seconds(30);

// Implementations.

In_process_transport::In_process_transport(flow::log::Logger* logger_ptr, party_id_t self_id,
                                           util::Fine_duration recv_timeout) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_self_id(self_id),
  m_recv_timeout(recv_timeout)
{
  // Nothing else.
}

In_process_transport::In_process_transport(In_process_transport&&) = default;

In_process_transport& In_process_transport::operator=(In_process_transport&&) = default;

In_process_transport::~In_process_transport() = default;

std::vector<In_process_transport> In_process_transport::create_parties(flow::log::Logger* logger_ptr,
                                                                       size_t n_parties,
                                                                       util::Fine_duration recv_timeout) // Static.
{
  std::vector<In_process_transport> parties;
  parties.reserve(n_parties);
  for (party_id_t id = 0; id != n_parties; ++id)
  {
    parties.emplace_back(In_process_transport(logger_ptr, id, recv_timeout));
  }

  for (party_id_t sender = 0; sender != n_parties; ++sender)
  {
    for (party_id_t receiver = 0; receiver != n_parties; ++receiver)
    {
      if (sender != receiver)
      {
        auto queue = std::make_shared<Queue>();
        parties[sender].m_outbound.emplace(receiver, queue);
        parties[receiver].m_inbound.emplace(sender, std::move(queue));
      }
    }
  }

  return parties;
} // In_process_transport::create_parties()

std::vector<std::vector<In_process_transport>>
  In_process_transport::create_lanes(flow::log::Logger* logger_ptr, size_t n_parties, size_t n_lanes,
                                     util::Fine_duration recv_timeout) // Static.
{
  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_TRANSPORT);
  FLOW_LOG_INFO("In_process_transport lane set: Creating [" << n_lanes << "] lanes among [" << n_parties << "] "
                "parties; receive timeout [" << recv_timeout << "].");

  std::vector<std::vector<In_process_transport>> by_party(n_parties);
  for (auto& lanes : by_party)
  {
    lanes.reserve(n_lanes);
  }

  for (size_t lane_idx = 0; lane_idx != n_lanes; ++lane_idx)
  {
    auto parties = create_parties(logger_ptr, n_parties, recv_timeout);
    for (party_id_t id = 0; id != n_parties; ++id)
    {
      by_party[id].emplace_back(std::move(parties[id]));
    }
  }
  return by_party;
} // In_process_transport::create_lanes()

party_id_t In_process_transport::id() const
{
  return m_self_id;
}

std::vector<party_id_t> In_process_transport::peer_ids() const
{
  std::vector<party_id_t> ids;
  ids.reserve(m_outbound.size());
  for (const auto& peer_and_queue : m_outbound)
  {
    ids.push_back(peer_and_queue.first);
  }
  return ids;
}

void In_process_transport::send(party_id_t to, const util::Blob_const& data, Error_code* err_code)
{
  using util::Lock_guard_non_recursive;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { send(to, data, actual_err_code); },
         err_code, "In_process_transport::send()"))
  {
    return;
  }
  // else

  const auto queue_it = m_outbound.find(to);
  if (queue_it == m_outbound.end())
  {
    FLOW_LOG_WARNING("In_process_transport [" << *this << "]: Send to unknown peer [" << to << "].");
    *err_code = error::Code::S_UNKNOWN_PEER;
    return;
  }
  // else
  auto& queue = *queue_it->second;

  util::Blob msg(data.size());
  if (!msg.empty())
  {
    msg.assign_copy(data);
  }

  FLOW_LOG_TRACE("In_process_transport [" << *this << "]: Sending [" << data.size() << "] bytes to "
                 "peer [" << to << "].");
  {
    Lock_guard_non_recursive lock(queue.m_mutex);
    queue.m_msgs.emplace_back(std::move(msg));
  }
  queue.m_cond.notify_one();
  err_code->clear();
} // In_process_transport::send()

util::Blob In_process_transport::recv(party_id_t from, Error_code* err_code)
{
  using util::Lock_guard_non_recursive;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(util::Blob, In_process_transport::recv, from, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const auto queue_it = m_inbound.find(from);
  if (queue_it == m_inbound.end())
  {
    FLOW_LOG_WARNING("In_process_transport [" << *this << "]: Receive from unknown peer [" << from << "].");
    *err_code = error::Code::S_UNKNOWN_PEER;
    return util::Blob();
  }
  // else
  auto& queue = *queue_it->second;

  util::Blob msg;
  {
    Lock_guard_non_recursive lock(queue.m_mutex);
    if (!queue.m_cond.wait_for(lock, m_recv_timeout, [&]() -> bool { return !queue.m_msgs.empty(); }))
    {
      FLOW_LOG_WARNING("In_process_transport [" << *this << "]: Nothing from peer [" << from << "] within "
                       "[" << m_recv_timeout << "].");
      *err_code = error::Code::S_TIMEOUT;
      return util::Blob();
    }
    // else
    msg = std::move(queue.m_msgs.front());
    queue.m_msgs.pop_front();
  }

  FLOW_LOG_TRACE("In_process_transport [" << *this << "]: Received [" << msg.size() << "] bytes from "
                 "peer [" << from << "].");
  err_code->clear();
  return msg;
} // In_process_transport::recv()

std::ostream& operator<<(std::ostream& os, const In_process_transport& val)
{
  return os << "in_proc:party" << val.id() << '@' << &val;
}

} // namespace mpcnet::transport
