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
#include "mpcnet/transport/null_transport.hpp"
#include "mpcnet/transport/error.hpp"
#include "mpcnet/test/test_logger.hpp"
#include <gtest/gtest.h>
#include <thread>

namespace mpcnet::transport::test
{

namespace
{

using Bytes = std::vector<uint8_t>;

Bytes pattern(size_t size, uint8_t seed)
{
  Bytes bytes(size);
  for (size_t idx = 0; idx != size; ++idx)
  {
    bytes[idx] = uint8_t(seed + (idx * 31));
  }
  return bytes;
}

Bytes to_bytes(const util::Blob& blob)
{
  return Bytes(blob.begin(), blob.end());
}

} // Anonymous namespace

TEST(In_process_transport, Round_trip)
{
  mpcnet::test::Test_logger logger;
  auto parties = In_process_transport::create_parties(&logger, 3);
  ASSERT_EQ(parties.size(), 3u);

  EXPECT_EQ(parties[1].id(), 1u);
  EXPECT_EQ(parties[1].peer_ids(), (std::vector<party_id_t>{ 0, 2 }));

  for (const size_t size : { size_t(0), size_t(1), size_t(1) << 20 })
  {
    const auto msg = pattern(size, uint8_t(size));
    parties[0].send(2, util::Blob_const(msg.data(), msg.size()));
    parties[2].send(0, util::Blob_const(msg.data(), msg.size()));
    EXPECT_EQ(to_bytes(parties[2].recv(0)), msg);
    EXPECT_EQ(to_bytes(parties[0].recv(2)), msg);
  }

  // Per-peer FIFO order.
  for (uint8_t val = 0; val != 10; ++val)
  {
    parties[1].send(0, util::Blob_const(&val, 1));
  }
  for (uint8_t val = 0; val != 10; ++val)
  {
    EXPECT_EQ(to_bytes(parties[0].recv(1)), Bytes{ val });
  }
}

TEST(In_process_transport, Concurrent_exchange)
{
  mpcnet::test::Test_logger logger;
  auto parties = In_process_transport::create_parties(&logger, 2);

  const auto big = pattern(size_t(1) << 20, 7);
  std::thread peer([&]()
  {
    const auto got = parties[1].recv(0);
    parties[1].send(0, util::Blob_const(got.const_data(), got.size()));
  });

  parties[0].send(1, util::Blob_const(big.data(), big.size()));
  EXPECT_EQ(to_bytes(parties[0].recv(1)), big);
  peer.join();
}

TEST(In_process_transport, Errors)
{
  mpcnet::test::Test_logger logger;
  auto parties = In_process_transport::create_parties(&logger, 2, boost::chrono::milliseconds(50));

  Error_code err_code;
  const uint8_t byte = 1;

  parties[0].send(0, util::Blob_const(&byte, 1), &err_code); // No self-pipe.
  EXPECT_EQ(err_code, error::Code::S_UNKNOWN_PEER);
  parties[0].send(5, util::Blob_const(&byte, 1), &err_code);
  EXPECT_EQ(err_code, error::Code::S_UNKNOWN_PEER);
  parties[0].recv(5, &err_code);
  EXPECT_EQ(err_code, error::Code::S_UNKNOWN_PEER);

  const auto blob = parties[0].recv(1, &err_code);
  EXPECT_EQ(err_code, error::Code::S_TIMEOUT);
  EXPECT_TRUE(blob.empty());
  EXPECT_THROW(parties[0].recv(1), flow::error::Runtime_error);

  // Still usable after a timeout.
  parties[1].send(0, util::Blob_const(&byte, 1), &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(to_bytes(parties[0].recv(1)), Bytes{ 1 });
}

TEST(In_process_transport, Lanes_are_independent)
{
  mpcnet::test::Test_logger logger;
  auto lanes = In_process_transport::create_lanes(&logger, 2, 3, boost::chrono::milliseconds(50));
  ASSERT_EQ(lanes.size(), 2u);
  ASSERT_EQ(lanes[0].size(), 3u);

  for (uint8_t lane = 0; lane != 3; ++lane)
  {
    lanes[0][lane].send(1, util::Blob_const(&lane, 1));
  }
  for (uint8_t lane = 3; lane != 0; --lane)
  {
    EXPECT_EQ(to_bytes(lanes[1][lane - 1].recv(0)), Bytes{ uint8_t(lane - 1) });
  }

  Error_code err_code;
  lanes[1][0].recv(0, &err_code);
  EXPECT_EQ(err_code, error::Code::S_TIMEOUT);
}

TEST(Null_transport, Interface)
{
  auto lanes = Null_transport::create_lanes(4);
  ASSERT_EQ(lanes.size(), 4u);

  auto& lane = lanes[2];
  EXPECT_EQ(lane.id(), 0u);
  EXPECT_TRUE(lane.peer_ids().empty());

  const uint8_t byte = 9;
  Error_code err_code = error::Code::S_TIMEOUT;
  lane.send(3, util::Blob_const(&byte, 1), &err_code);
  EXPECT_FALSE(err_code);
  err_code = error::Code::S_TIMEOUT;
  EXPECT_TRUE(lane.recv(3, &err_code).empty());
  EXPECT_FALSE(err_code);
  EXPECT_NO_THROW(lane.recv(1));
}

} // namespace mpcnet::transport::test
