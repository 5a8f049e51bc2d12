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
#include "mpcnet/transport/secure_transport.hpp"
#include "mpcnet/transport/detail/lane_establisher.hpp"
#include "mpcnet/transport/detail/framing.hpp"
#include "mpcnet/transport/error.hpp"
#include <openssl/ssl.h>
#include <openssl/err.h>

namespace mpcnet::transport
{

namespace
{

namespace ssl = boost::asio::ssl;

/**
 * Builds the TLS client context: trusts exactly the given certificates; requires the peer to present one.
 *
 * @param creds
 *        Credentials.
 * @param err_code
 *        Must not be null.  Set to success or error::Code::S_CFG_CERTIFICATE_REJECTED.
 * @return Context; null on error.
 */
std::shared_ptr<ssl::context> make_client_ctx(const Tls_credentials& creds, Error_code* err_code)
{
  auto ctx = std::make_shared<ssl::context>(ssl::context::tls_client);
  for (const auto& cert_pem : creds.m_certificates_pem)
  {
    ctx->add_certificate_authority(boost::asio::buffer(cert_pem), *err_code);
    if (*err_code)
    {
      *err_code = error::Code::S_CFG_CERTIFICATE_REJECTED;
      return nullptr;
    }
  }
  ctx->set_verify_mode(ssl::verify_peer, *err_code);
  if (*err_code)
  {
    *err_code = error::Code::S_CFG_CERTIFICATE_REJECTED;
    return nullptr;
  }
  return ctx;
}

/**
 * Builds the TLS server context: presents our certificate with our key.
 *
 * @param creds
 *        Credentials.
 * @param self_id
 *        Index of our certificate.
 * @param err_code
 *        Must not be null.  Set to success or error::Code::S_CFG_CERTIFICATE_REJECTED.
 * @return Context; null on error.
 */
std::shared_ptr<ssl::context> make_server_ctx(const Tls_credentials& creds, party_id_t self_id,
                                              Error_code* err_code)
{
  auto ctx = std::make_shared<ssl::context>(ssl::context::tls_server);
  ctx->use_certificate_chain(boost::asio::buffer(creds.m_certificates_pem[self_id]), *err_code);
  if (!*err_code)
  {
    ctx->use_private_key(boost::asio::buffer(creds.m_private_key_pem), ssl::context::pem, *err_code);
  }
  if (!*err_code)
  {
    // Catch a key not matching the certificate now rather than in the first handshake.
    if (SSL_CTX_check_private_key(ctx->native_handle()) != 1)
    {
      *err_code = error::Code::S_CFG_CERTIFICATE_REJECTED;
    }
  }
  if (*err_code)
  {
    *err_code = error::Code::S_CFG_CERTIFICATE_REJECTED;
    return nullptr;
  }
  return ctx;
}

/**
 * Maps a failed TLS handshake's error to ours.
 *
 * @param sys_err_code
 *        Error from `handshake()`.
 * @return error::Code::S_CFG_CERTIFICATE_REJECTED if verification of the peer's certificate failed, else
 *         error::Code::S_HANDSHAKE_FAILED.
 */
Error_code handshake_error(const Error_code& sys_err_code)
{
  if ((sys_err_code.category() == boost::asio::error::get_ssl_category())
      && (ERR_GET_REASON(static_cast<unsigned long>(sys_err_code.value())) == SSL_R_CERTIFICATE_VERIFY_FAILED))
  {
    return error::Code::S_CFG_CERTIFICATE_REJECTED;
  }
  return error::Code::S_HANDSHAKE_FAILED;
}

} // namespace (anon)

Secure_transport::Secure_transport(flow::log::Logger* logger_ptr,
                                   std::shared_ptr<ssl::context> client_ctx,
                                   std::shared_ptr<ssl::context> server_ctx,
                                   party_id_t self_id, size_t lane_idx, util::Fine_duration send_timeout) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_client_ctx(std::move(client_ctx)),
  m_server_ctx(std::move(server_ctx)),
  m_self_id(self_id),
  m_lane_idx(lane_idx),
  m_send_timeout(send_timeout)
{
  // Nothing else.
}

Secure_transport::Secure_transport(Secure_transport&&) = default;

Secure_transport& Secure_transport::operator=(Secure_transport&&) = default;

Secure_transport::~Secure_transport()
{
  if (!m_send_pipes.empty())
  {
    FLOW_LOG_TRACE("Secure_transport [" << *this << "]: Closing connections to [" << m_send_pipes.size() << "] "
                   "peers.");
  }
}

std::vector<Secure_transport> Secure_transport::create_lanes(flow::log::Logger* logger_ptr, const Lane_config& cfg,
                                                             const Tls_credentials& creds,
                                                             Error_code* err_code) // Static.
{
  using detail::Lane_establisher;
  using detail::Lane_header;
  using std::vector;
  using std::unique_ptr;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(vector<Secure_transport>, Secure_transport::create_lanes,
                                     logger_ptr, cfg, creds, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_TRANSPORT);

  cfg.validate(err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Secure_transport lane set: Invalid config [" << cfg << "]: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return vector<Secure_transport>();
  }
  // else

  if (creds.m_certificates_pem.size() != cfg.n_parties())
  {
    FLOW_LOG_WARNING("Secure_transport lane set: Credentials [" << creds << "] do not have exactly one certificate "
                     "for each of [" << cfg.n_parties() << "] parties.");
    *err_code = error::Code::S_CFG_CERTIFICATE_REJECTED;
    return vector<Secure_transport>();
  }
  // else

  std::shared_ptr<ssl::context> server_ctx;
  auto client_ctx = make_client_ctx(creds, err_code);
  if (!*err_code)
  {
    server_ctx = make_server_ctx(creds, cfg.m_self_id, err_code);
  }
  if (*err_code)
  {
    FLOW_LOG_WARNING("Secure_transport lane set: Credentials [" << creds << "] unusable.");
    return vector<Secure_transport>();
  }
  // else

  FLOW_LOG_INFO("Secure_transport lane set: Establishing per config [" << cfg << "]; credentials [" << creds << "].");

  util::Task_engine task_engine;
  Lane_establisher establisher(logger_ptr, &task_engine, cfg, true);
  establisher.listen(err_code);
  if (*err_code)
  {
    return vector<Secure_transport>();
  }
  // else

  vector<Secure_transport> lanes;
  lanes.reserve(cfg.m_n_lanes);
  for (size_t lane_idx = 0; lane_idx != cfg.m_n_lanes; ++lane_idx)
  {
    lanes.emplace_back(Secure_transport(logger_ptr, client_ctx, server_ctx, cfg.m_self_id, lane_idx,
                                        cfg.m_send_timeout));
  }

  for (const auto& step : establisher.plan())
  {
    auto conn_task_engine = std::make_unique<util::Task_engine>();
    unique_ptr<Ssl_stream> stream;
    Lane_header hdr;
    bool sending = false;

    if (step.m_initiate)
    {
      auto sock = establisher.connect(step.m_peer, conn_task_engine.get(), err_code);
      if (!*err_code)
      {
        const auto& host = cfg.m_party_addresses[step.m_peer].m_host;
        stream = std::make_unique<Ssl_stream>(std::move(sock), *client_ctx);
        // SNI, for servers that care; and the check that the certificate names `host`.
        Error_code sys_err_code;
        if (SSL_set_tlsext_host_name(stream->native_handle(), host.c_str()) != 1)
        {
          sys_err_code = boost::asio::error::invalid_argument;
        }
        if (!sys_err_code)
        {
          stream->set_verify_mode(ssl::verify_peer, sys_err_code);
        }
        if (!sys_err_code)
        {
          stream->set_verify_callback(ssl::host_name_verification(host), sys_err_code);
        }
        if (!sys_err_code)
        {
          stream->handshake(ssl::stream_base::client, sys_err_code);
        }
        if (sys_err_code)
        {
          FLOW_LOG_WARNING("Secure_transport lane set: TLS handshake (as client) with party [" << step.m_peer << "] "
                           "failed: [" << sys_err_code << "] [" << sys_err_code.message() << "].");
          *err_code = handshake_error(sys_err_code);
        }
      }
      if (!*err_code)
      {
        hdr.m_lane_idx = step.m_lane_idx;
        hdr.m_origin = cfg.m_self_id;
        hdr.m_role = step.m_role;
        detail::write_lane_header(stream.get(), hdr, err_code);
        hdr.m_origin = step.m_peer; // Route it below as the peer's connection.
        // Role 0 carries lower -> higher, and we are the lower party.
        sending = (*step.m_role == 0);
      }
    }
    else
    {
      auto sock = establisher.accept(conn_task_engine.get(), err_code);
      if (!*err_code)
      {
        stream = std::make_unique<Ssl_stream>(std::move(sock), *server_ctx);
        Error_code sys_err_code;
        stream->handshake(ssl::stream_base::server, sys_err_code);
        if (sys_err_code)
        {
          FLOW_LOG_WARNING("Secure_transport lane set: TLS handshake (as server) failed: "
                           "[" << sys_err_code << "] [" << sys_err_code.message() << "].");
          *err_code = handshake_error(sys_err_code);
        }
      }
      if (!*err_code)
      {
        hdr = detail::read_lane_header(stream.get(), true, err_code);
      }
      if (!*err_code)
      {
        establisher.check_incoming(hdr, err_code);
      }
      if (!*err_code)
      {
        // Role 1 carries higher -> lower, and we are the higher party.
        sending = (*hdr.m_role == 1);
      }
    }

    if (*err_code)
    {
      FLOW_LOG_WARNING("Secure_transport lane set: Establishment failed at lane [" << step.m_lane_idx << "] "
                       "role [" << int(*step.m_role) << "] peer [" << step.m_peer << "] "
                       "(" << (step.m_initiate ? "connect" : "accept") << "): "
                       "[" << *err_code << "] [" << err_code->message() << "].  Aborting setup.");
      return vector<Secure_transport>();
    }
    // else

    lanes[hdr.m_lane_idx].add_pipe(hdr.m_origin, sending, std::move(conn_task_engine), std::move(stream));
  } // for (step : plan())

  FLOW_LOG_INFO("Secure_transport lane set: Party [" << cfg.m_self_id << "] established [" << lanes.size() << "] "
                "lanes to [" << (cfg.n_parties() - 1) << "] peers.");
  err_code->clear();
  return lanes;
} // Secure_transport::create_lanes()

void Secure_transport::add_pipe(party_id_t peer, bool sending, std::unique_ptr<util::Task_engine>&& task_engine,
                                std::unique_ptr<Ssl_stream>&& stream)
{
  auto pipe = std::make_unique<Pipe>();
  pipe->m_task_engine = std::move(task_engine);
  pipe->m_stream = std::move(stream);
  (sending ? m_send_pipes : m_recv_pipes)[peer] = std::move(pipe);

  FLOW_LOG_TRACE("Secure_transport [" << *this << "]: Connected "
                 "[" << (sending ? "send" : "receive") << "] direction with peer [" << peer << "].");
}

party_id_t Secure_transport::id() const
{
  return m_self_id;
}

std::vector<party_id_t> Secure_transport::peer_ids() const
{
  std::vector<party_id_t> ids;
  ids.reserve(m_send_pipes.size());
  for (const auto& peer_and_pipe : m_send_pipes)
  {
    ids.push_back(peer_and_pipe.first);
  }
  return ids;
}

size_t Secure_transport::lane_idx() const
{
  return m_lane_idx;
}

void Secure_transport::send(party_id_t to, const util::Blob_const& data, Error_code* err_code)
{
  using util::Lock_guard_non_recursive;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { send(to, data, actual_err_code); },
         err_code, "Secure_transport::send()"))
  {
    return;
  }
  // else

  const auto pipe_it = m_send_pipes.find(to);
  if (pipe_it == m_send_pipes.end())
  {
    FLOW_LOG_WARNING("Secure_transport [" << *this << "]: Send to unknown peer [" << to << "].");
    *err_code = error::Code::S_UNKNOWN_PEER;
    return;
  }
  // else
  auto& pipe = *pipe_it->second;

  FLOW_LOG_TRACE("Secure_transport [" << *this << "]: Sending [" << data.size() << "] bytes to peer [" << to << "].");
  {
    Lock_guard_non_recursive lock(pipe.m_mutex);
    detail::write_frame(pipe.m_stream.get(), pipe.m_task_engine.get(), data, m_send_timeout, err_code);
  }

  if (*err_code)
  {
    FLOW_LOG_WARNING("Secure_transport [" << *this << "]: Send to peer [" << to << "] failed: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
  }
} // Secure_transport::send()

util::Blob Secure_transport::recv(party_id_t from, Error_code* err_code)
{
  using util::Lock_guard_non_recursive;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(util::Blob, Secure_transport::recv, from, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const auto pipe_it = m_recv_pipes.find(from);
  if (pipe_it == m_recv_pipes.end())
  {
    FLOW_LOG_WARNING("Secure_transport [" << *this << "]: Receive from unknown peer [" << from << "].");
    *err_code = error::Code::S_UNKNOWN_PEER;
    return util::Blob();
  }
  // else
  auto& pipe = *pipe_it->second;

  util::Blob payload;
  {
    Lock_guard_non_recursive lock(pipe.m_mutex);
    payload = detail::read_frame(pipe.m_stream.get(), err_code);
  }

  if (*err_code)
  {
    if (*err_code == ssl::error::stream_truncated)
    {
      *err_code = error::Code::S_SHORT_READ;
    }
    FLOW_LOG_WARNING("Secure_transport [" << *this << "]: Receive from peer [" << from << "] failed: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return util::Blob();
  }
  // else

  FLOW_LOG_TRACE("Secure_transport [" << *this << "]: Received [" << payload.size() << "] bytes from peer "
                 "[" << from << "].");
  return payload;
} // Secure_transport::recv()

std::ostream& operator<<(std::ostream& os, const Secure_transport& val)
{
  return os << "tls:party" << val.id() << "/lane" << val.lane_idx() << '@' << &val;
}

} // namespace mpcnet::transport
