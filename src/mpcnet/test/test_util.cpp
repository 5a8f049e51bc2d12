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
#include "mpcnet/test/test_util.hpp"
#include <boost/asio.hpp>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <unistd.h>

namespace mpcnet::test
{

namespace
{

using Pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using X509_ptr = std::unique_ptr<X509, decltype(&X509_free)>;
using Bio_ptr = std::unique_ptr<BIO, decltype(&BIO_free)>;

void check(bool ok, const char* what)
{
  if (!ok)
  {
    throw std::runtime_error(std::string("OpenSSL failure: ") + what);
  }
}

void add_ext(X509* cert, int nid, const char* value)
{
  X509V3_CTX ctx;
  X509V3_set_ctx_nodb(&ctx);
  X509V3_set_ctx(&ctx, cert, cert, nullptr, nullptr, 0);
  X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &ctx, nid, value);
  check(ext != nullptr, "X509V3_EXT_conf_nid");
  const bool ok = X509_add_ext(cert, ext, -1) == 1;
  X509_EXTENSION_free(ext);
  check(ok, "X509_add_ext");
}

std::string bio_contents(BIO* bio)
{
  BUF_MEM* mem = nullptr;
  BIO_get_mem_ptr(bio, &mem);
  check(mem != nullptr, "BIO_get_mem_ptr");
  return std::string(mem->data, mem->length);
}

} // namespace (anon)

Tls_identity make_tls_identity(size_t idx)
{
  Pkey_ptr pkey(EVP_RSA_gen(2048), &EVP_PKEY_free);
  check(bool(pkey), "EVP_RSA_gen");

  X509_ptr cert(X509_new(), &X509_free);
  check(bool(cert), "X509_new");
  check(X509_set_version(cert.get(), 2) == 1, "X509_set_version");
  check(ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), long(idx + 1)) == 1, "ASN1_INTEGER_set");
  check(X509_gmtime_adj(X509_getm_notBefore(cert.get()), -3600) != nullptr, "notBefore");
  check(X509_gmtime_adj(X509_getm_notAfter(cert.get()), 24 * 3600) != nullptr, "notAfter");
  check(X509_set_pubkey(cert.get(), pkey.get()) == 1, "X509_set_pubkey");

  const std::string org = "party" + std::to_string(idx);
  X509_NAME* name = X509_get_subject_name(cert.get());
  check(X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>(org.c_str()), -1, -1, 0) == 1, "O");
  check(X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>("localhost"), -1, -1, 0) == 1, "CN");
  check(X509_set_issuer_name(cert.get(), name) == 1, "X509_set_issuer_name");

  add_ext(cert.get(), NID_basic_constraints, "critical,CA:TRUE");
  add_ext(cert.get(), NID_key_usage, "critical,keyCertSign,digitalSignature,keyEncipherment");
  add_ext(cert.get(), NID_subject_key_identifier, "hash");
  add_ext(cert.get(), NID_subject_alt_name, "DNS:localhost,IP:127.0.0.1");

  check(X509_sign(cert.get(), pkey.get(), EVP_sha256()) != 0, "X509_sign");

  Tls_identity identity;
  {
    Bio_ptr bio(BIO_new(BIO_s_mem()), &BIO_free);
    check(bool(bio) && (PEM_write_bio_X509(bio.get(), cert.get()) == 1), "PEM_write_bio_X509");
    identity.m_certificate_pem = bio_contents(bio.get());
  }
  {
    Bio_ptr bio(BIO_new(BIO_s_mem()), &BIO_free);
    check(bool(bio) && (PEM_write_bio_PrivateKey(bio.get(), pkey.get(), nullptr, nullptr, 0, nullptr, nullptr) == 1),
          "PEM_write_bio_PrivateKey");
    identity.m_private_key_pem = bio_contents(bio.get());
  }
  return identity;
} // make_tls_identity()

uint16_t free_port()
{
  using boost::asio::ip::tcp;

  boost::asio::io_context task_engine;
  tcp::acceptor acceptor(task_engine, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
  return acceptor.local_endpoint().port();
}

transport::Lane_config local_lane_config(transport::party_id_t self_id, const std::vector<uint16_t>& ports,
                                         size_t n_lanes, const std::string& host)
{
  transport::Lane_config cfg;
  cfg.m_self_id = self_id;
  cfg.m_bind_address.m_host = "127.0.0.1";
  cfg.m_bind_address.m_port = ports[self_id];
  for (const auto port : ports)
  {
    cfg.m_party_addresses.push_back(transport::Address{ host, port });
  }
  cfg.m_n_lanes = n_lanes;
  cfg.m_connect_backoff = boost::chrono::milliseconds(10);
  return cfg;
}

std::string write_temp_file(const std::string& name, const std::string& contents)
{
  const auto path = std::filesystem::temp_directory_path()
                      / (std::string("mpcnet_test_") + std::to_string(::getpid()) + '_' + name);
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  file << contents;
  if (!file)
  {
    throw std::runtime_error("Could not write [" + path.string() + "].");
  }
  return path.string();
}

} // namespace mpcnet::test
