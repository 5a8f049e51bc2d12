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
#include "mpcnet/transport/lane_config.hpp"
#include "mpcnet/transport/error.hpp"
#include <fstream>
#include <sstream>

namespace mpcnet::transport
{

// Static initializations.

const util::Fine_duration Lane_config::S_DEFAULT_CONNECT_BACKOFF = boost::chrono::milliseconds(50);
const util::Fine_duration Lane_config::S_DEFAULT_SEND_TIMEOUT = boost::chrono::seconds(30);

// Implementations.

void Lane_config::validate(Error_code* err_code) const
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { validate(actual_err_code); },
         err_code, "Lane_config::validate()"))
  {
    return;
  }
  // else

  if (m_self_id >= m_party_addresses.size())
  {
    *err_code = error::Code::S_CFG_INVALID_PARTY_ID;
    return;
  }
  if (m_bind_address.m_host.empty())
  {
    *err_code = error::Code::S_CFG_INVALID_ADDRESS;
    return;
  }
  for (party_id_t id = 0; id != m_party_addresses.size(); ++id)
  {
    const auto& addr = m_party_addresses[id];
    if ((id != m_self_id) && (addr.m_host.empty() || (addr.m_port == 0)))
    {
      *err_code = error::Code::S_CFG_INVALID_ADDRESS;
      return;
    }
  }
  if (m_n_lanes == 0)
  {
    *err_code = error::Code::S_CFG_INVALID_LANE_COUNT;
    return;
  }
  err_code->clear();
} // Lane_config::validate()

size_t Lane_config::n_parties() const
{
  return m_party_addresses.size();
}

Tls_credentials Tls_credentials::load(const std::vector<std::string>& certificate_paths,
                                      const std::string& private_key_path,
                                      Error_code* err_code) // Static.
{
  using std::ifstream;
  using std::ostringstream;
  using std::string;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Tls_credentials, Tls_credentials::load,
                                     certificate_paths, private_key_path, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const auto slurp = [](const string& path, string* contents) -> bool
  {
    ifstream file(path, std::ios::binary);
    if (!file)
    {
      return false;
    }
    ostringstream os;
    os << file.rdbuf();
    *contents = os.str();
    return !contents->empty();
  };

  Tls_credentials creds;
  creds.m_certificates_pem.resize(certificate_paths.size());
  for (size_t idx = 0; idx != certificate_paths.size(); ++idx)
  {
    if (!slurp(certificate_paths[idx], &creds.m_certificates_pem[idx]))
    {
      *err_code = error::Code::S_CFG_CERTIFICATE_REJECTED;
      return Tls_credentials();
    }
  }
  if (!slurp(private_key_path, &creds.m_private_key_pem))
  {
    *err_code = error::Code::S_CFG_CERTIFICATE_REJECTED;
    return Tls_credentials();
  }

  err_code->clear();
  return creds;
} // Tls_credentials::load()

std::ostream& operator<<(std::ostream& os, const Lane_config& val)
{
  os << "self[" << val.m_self_id << "] bind[" << val.m_bind_address << "] lanes[" << val.m_n_lanes
     << "] backoff[" << boost::chrono::duration_cast<boost::chrono::milliseconds>(val.m_connect_backoff).count()
     << " ms] send_timeout["
     << boost::chrono::duration_cast<boost::chrono::milliseconds>(val.m_send_timeout).count() << " ms] parties[";
  for (size_t idx = 0; idx != val.m_party_addresses.size(); ++idx)
  {
    if (idx != 0)
    {
      os << ' ';
    }
    os << idx << '=' << val.m_party_addresses[idx];
  }
  return os << ']';
}

std::ostream& operator<<(std::ostream& os, const Tls_credentials& val)
{
  os << "certs[" << val.m_certificates_pem.size() << "] sizes[";
  for (size_t idx = 0; idx != val.m_certificates_pem.size(); ++idx)
  {
    if (idx != 0)
    {
      os << ' ';
    }
    os << val.m_certificates_pem[idx].size();
  }
  return os << "] key_size[" << val.m_private_key_pem.size() << ']';
}

} // namespace mpcnet::transport
