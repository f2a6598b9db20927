/* Coordinator client: Sessions
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

#include "coord/client/id_alloc.hpp"
#include "coord/client/error.hpp"
#include <flow/error/error.hpp>
#include <gtest/gtest.h>
#include <boost/thread/thread.hpp>
#include <set>
#include <vector>

namespace coord::client::test
{

TEST(Id_allocator, Scenario_range_of_four)
{
  Id_allocator id_alloc(nullptr, 1, 5);

  Error_code err_code;
  std::set<Connection_id> ids;
  for (size_t idx = 0; idx != 4; ++idx)
  {
    const auto id = id_alloc.alloc(&err_code);
    EXPECT_FALSE(err_code);
    EXPECT_GE(id, Connection_id(1));
    EXPECT_LT(id, Connection_id(5));
    ids.insert(id);
  }
  EXPECT_EQ(ids.size(), size_t(4));
  EXPECT_EQ(id_alloc.n_allocated(), size_t(4));

  id_alloc.alloc(&err_code);
  EXPECT_EQ(err_code, error::Code::S_CONN_ID_EXHAUSTED);

  EXPECT_THROW(id_alloc.alloc(), flow::error::Runtime_error);
}

TEST(Id_allocator, Freed_id_is_reusable)
{
  Id_allocator id_alloc(nullptr, 10, 12);
  const auto id1 = id_alloc.alloc();
  const auto id2 = id_alloc.alloc();
  EXPECT_NE(id1, id2);

  Error_code err_code;
  id_alloc.alloc(&err_code);
  EXPECT_TRUE(err_code);

  id_alloc.free(id1);
  EXPECT_FALSE(id_alloc.allocated(id1));
  EXPECT_EQ(id_alloc.alloc(), id1);
  EXPECT_TRUE(id_alloc.allocated(id1));
}

TEST(Id_allocator, Round_robin_defers_reuse)
{
  Id_allocator id_alloc(nullptr, 1, 100);
  const auto id1 = id_alloc.alloc();
  id_alloc.free(id1);
  // Just-freed value is not handed out again until the rest of the range has been.
  EXPECT_NE(id_alloc.alloc(), id1);
}

TEST(Id_allocator, Free_of_unallocated_is_ignored)
{
  Id_allocator id_alloc(nullptr, 1, 3);
  const auto id = id_alloc.alloc();
  id_alloc.free(id + 1);
  id_alloc.free(1000);
  EXPECT_EQ(id_alloc.n_allocated(), size_t(1));
  id_alloc.free(id);
  id_alloc.free(id);
  EXPECT_EQ(id_alloc.n_allocated(), size_t(0));
}

TEST(Id_allocator, Empty_range_rejected)
{
  EXPECT_THROW(Id_allocator(nullptr, 5, 5), flow::error::Runtime_error);
  EXPECT_THROW(Id_allocator(nullptr, 6, 5), flow::error::Runtime_error);
}

TEST(Id_allocator, Large_range)
{
  Id_allocator id_alloc(nullptr, 1, Connection_id(1) << 16);
  std::set<Connection_id> ids;
  for (size_t idx = 0; idx != 50000; ++idx)
  {
    ids.insert(id_alloc.alloc());
  }
  EXPECT_EQ(ids.size(), size_t(50000));
}

TEST(Id_allocator, Concurrent_alloc_free)
{
  constexpr size_t N_THREADS = 8;
  constexpr size_t N_ITERS = 2000;
  constexpr Connection_id RANGE_SZ = 64;

  Id_allocator id_alloc(nullptr, 1, 1 + RANGE_SZ);

  /* Each thread holds at most 4 ids at a time; 8 * 4 < 64 so nobody should ever see exhaustion.  Whoever
   * allocates an id marks it; a second mark means two holders. */
  flow::util::Mutex_non_recursive mutex;
  std::vector<bool> held(1 + RANGE_SZ, false);
  bool dup = false;

  boost::thread_group threads;
  for (size_t thread_idx = 0; thread_idx != N_THREADS; ++thread_idx)
  {
    threads.create_thread([&]()
    {
      std::vector<Connection_id> mine;
      for (size_t iter = 0; iter != N_ITERS; ++iter)
      {
        if (mine.size() < 4)
        {
          const auto id = id_alloc.alloc();
          flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(mutex);
          dup = dup || held[id];
          held[id] = true;
          mine.push_back(id);
        }
        else
        {
          {
            flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(mutex);
            for (const auto id : mine)
            {
              held[id] = false;
            }
          }
          for (const auto id : mine)
          {
            id_alloc.free(id);
          }
          mine.clear();
        }
      }
      flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(mutex);
      for (const auto id : mine)
      {
        held[id] = false;
        id_alloc.free(id);
      }
    });
  }
  threads.join_all();

  EXPECT_FALSE(dup);
  EXPECT_EQ(id_alloc.n_allocated(), size_t(0));
}

} // namespace coord::client::test
