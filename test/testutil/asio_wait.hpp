/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <latch>
#include <memory>

namespace testutil {

  /**
   * Wait for all queued tasks.
   */
  inline void wait(boost::asio::io_context &io) {
    auto latch = std::make_shared<std::latch>(2);
    boost::asio::post(io, [latch] { latch->arrive_and_wait(); });
    latch->arrive_and_wait();
  }

}  // namespace testutil
