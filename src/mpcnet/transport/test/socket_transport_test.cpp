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
#include "mpcnet/transport/error.hpp"
#include "mpcnet/test/test_logger.hpp"
#include "mpcnet/test/test_util.hpp"
#include <gtest/gtest.h>
#include <boost/chrono/chrono.hpp>
#include <thread>

namespace mpcnet::transport::test
{

namespace
{

using Bytes = std::vector<uint8_t>;

Bytes to_bytes(const util::Blob& blob)
{
  return Bytes(blob.begin(), blob.end());
}

/// Runs create_lanes() for `n_parties` parties concurrently, each in its own thread; returns `[party][lane]`.
std::vector<std::vector<Socket_transport>> establish(flow::log::Logger* logger_ptr, size_t n_parties, size_t n_lanes,
                                                     util::Fine_duration send_timeout
                                                       = Lane_config::S_DEFAULT_SEND_TIMEOUT)
{
  std::vector<uint16_t> ports;
  for (size_t idx = 0; idx != n_parties; ++idx)
  {
    ports.push_back(mpcnet::test::free_port());
  }

  std::vector<std::vector<Socket_transport>> lanes(n_parties);
  std::vector<Error_code> err_codes(n_parties);
  std::vector<std::thread> threads;
  // Start in reverse order, so that connectors have to retry now and then.
  for (size_t idx = n_parties; idx != 0; --idx)
  {
    const size_t party = idx - 1;
    threads.emplace_back([&, party]()
    {
      auto cfg = mpcnet::test::local_lane_config(party, ports, n_lanes);
      cfg.m_send_timeout = send_timeout;
      lanes[party] = Socket_transport::create_lanes(logger_ptr, cfg, &err_codes[party]);
    });
  }
  for (auto& thread : threads)
  {
    thread.join();
  }
  for (size_t party = 0; party != n_parties; ++party)
  {
    EXPECT_FALSE(err_codes[party]) << "party " << party << ": " << err_codes[party].message();
  }
  return lanes;
}

} // Anonymous namespace

TEST(Socket_transport, Establish_and_exchange)
{
  mpcnet::test::Test_logger logger;
  constexpr size_t N = 3;
  constexpr size_t L = 2;

  auto lanes = establish(&logger, N, L);
  for (size_t party = 0; party != N; ++party)
  {
    ASSERT_EQ(lanes[party].size(), L);
    for (size_t lane = 0; lane != L; ++lane)
    {
      EXPECT_EQ(lanes[party][lane].id(), party);
      EXPECT_EQ(lanes[party][lane].lane_idx(), lane);
      EXPECT_EQ(lanes[party][lane].peer_ids().size(), N - 1);
    }
  }

  /* Every party sends, on every lane, to every peer, a message naming (lane, from, to); then receives.
   * Small messages fit in socket buffers, so sending everything first cannot deadlock. */
  for (size_t lane = 0; lane != L; ++lane)
  {
    for (size_t from = 0; from != N; ++from)
    {
      for (const auto to : lanes[from][lane].peer_ids())
      {
        const Bytes msg{ uint8_t(lane), uint8_t(from), uint8_t(to) };
        lanes[from][lane].send(to, util::Blob_const(msg.data(), msg.size()));
      }
    }
  }
  for (size_t lane = 0; lane != L; ++lane)
  {
    for (size_t to = 0; to != N; ++to)
    {
      for (const auto from : lanes[to][lane].peer_ids())
      {
        EXPECT_EQ(to_bytes(lanes[to][lane].recv(from)), (Bytes{ uint8_t(lane), uint8_t(from), uint8_t(to) }));
      }
    }
  }
}

TEST(Socket_transport, Payload_sizes)
{
  mpcnet::test::Test_logger logger;
  auto lanes = establish(&logger, 2, 1);
  auto& alice = lanes[0][0];
  auto& bob = lanes[1][0];

  for (const size_t size : { size_t(0), size_t(1), size_t(1) << 20 })
  {
    Bytes msg(size);
    for (size_t idx = 0; idx != size; ++idx)
    {
      msg[idx] = uint8_t(idx ^ (idx >> 8));
    }

    // 1 MiB may exceed socket buffers: send from another thread.
    std::thread sender([&]() { alice.send(1, util::Blob_const(msg.data(), msg.size())); });
    EXPECT_EQ(to_bytes(bob.recv(0)), msg);
    sender.join();

    std::thread echo([&]()
    {
      const auto got = bob.recv(0);
      bob.send(0, got.const_buffer());
    });
    std::thread sender2([&]() { alice.send(1, util::Blob_const(msg.data(), msg.size())); });
    EXPECT_EQ(to_bytes(alice.recv(1)), msg);
    sender2.join();
    echo.join();
  }
}

TEST(Socket_transport, Errors)
{
  mpcnet::test::Test_logger logger;

  Error_code err_code;
  auto cfg = mpcnet::test::local_lane_config(0, { mpcnet::test::free_port() }, 0);
  auto none = Socket_transport::create_lanes(&logger, cfg, &err_code);
  EXPECT_EQ(err_code, error::Code::S_CFG_INVALID_LANE_COUNT);
  EXPECT_TRUE(none.empty());

  cfg.m_n_lanes = 1;
  cfg.m_self_id = 1;
  none = Socket_transport::create_lanes(&logger, cfg, &err_code);
  EXPECT_EQ(err_code, error::Code::S_CFG_INVALID_PARTY_ID);

  cfg = mpcnet::test::local_lane_config(0, { mpcnet::test::free_port(), 0 }, 1);
  none = Socket_transport::create_lanes(&logger, cfg, &err_code);
  EXPECT_EQ(err_code, error::Code::S_CFG_INVALID_ADDRESS);
  EXPECT_TRUE(none.empty());

  auto lanes = establish(&logger, 2, 1);
  const uint8_t byte = 3;
  lanes[0][0].send(7, util::Blob_const(&byte, 1), &err_code);
  EXPECT_EQ(err_code, error::Code::S_UNKNOWN_PEER);
  lanes[0][0].recv(0, &err_code);
  EXPECT_EQ(err_code, error::Code::S_UNKNOWN_PEER);

  // Peer goes away: its connections close; reading then hits end-of-stream.
  lanes[1].clear();
  lanes[0][0].recv(1, &err_code);
  EXPECT_EQ(err_code, error::Code::S_SHORT_READ);
}

TEST(Socket_transport, Send_timeout)
{
  mpcnet::test::Test_logger logger;
  auto lanes = establish(&logger, 2, 2, boost::chrono::milliseconds(200));
  ASSERT_EQ(lanes[0].size(), 2u);

  // Party 1 never reads lane 0, so a payload far beyond the socket buffers cannot get through.
  const Bytes big(64 * 1024 * 1024, 0x5a);
  const auto start = boost::chrono::steady_clock::now();
  Error_code err_code;
  lanes[0][0].send(1, util::Blob_const(big.data(), big.size()), &err_code);
  EXPECT_EQ(err_code, error::Code::S_TIMEOUT);
  EXPECT_LT(boost::chrono::steady_clock::now() - start, boost::chrono::seconds(10));

  // The other direction, and the other lane, are unaffected.
  const Bytes msg{ 1, 2, 3 };
  lanes[1][0].send(0, util::Blob_const(msg.data(), msg.size()), &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(to_bytes(lanes[0][0].recv(1, &err_code)), msg);
  EXPECT_FALSE(err_code);
  lanes[0][1].send(1, util::Blob_const(msg.data(), msg.size()), &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(to_bytes(lanes[1][1].recv(0, &err_code)), msg);
  EXPECT_FALSE(err_code);
}

TEST(Socket_transport, Single_party)
{
  mpcnet::test::Test_logger logger;
  auto lanes = establish(&logger, 1, 3);
  ASSERT_EQ(lanes[0].size(), 3u);
  EXPECT_TRUE(lanes[0][2].peer_ids().empty());
}

} // namespace mpcnet::transport::test
