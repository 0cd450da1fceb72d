/* Flow-GELF: Client
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

#include "gelf/util/object_pool.hpp"
#include <gtest/gtest.h>
#include <boost/move/make_unique.hpp>

namespace gelf::util::test
{

namespace
{

struct Widget
{
  explicit Widget(int id) : m_id(id), m_uses(0) {}

  int m_id;
  int m_uses;
};

} // Anonymous namespace

TEST(Object_pool, Reuse)
{
  using Pool = Object_pool<Widget>;

  int n_made = 0;
  Pool pool([&]() -> Pool::Ptr { return boost::movelib::make_unique<Widget>(n_made++); });
  EXPECT_EQ(pool.idle_count(), 0u);
  EXPECT_EQ(pool.created_count(), 0u);

  auto widget = pool.check_out();
  ASSERT_TRUE(widget);
  EXPECT_EQ(widget->m_id, 0);
  ++widget->m_uses;
  EXPECT_EQ(pool.created_count(), 1u);

  pool.give_back(std::move(widget));
  EXPECT_FALSE(widget);
  EXPECT_EQ(pool.idle_count(), 1u);

  // The idle one comes back, with its state; nothing new is created.
  widget = pool.check_out();
  EXPECT_EQ(widget->m_id, 0);
  EXPECT_EQ(widget->m_uses, 1);
  EXPECT_EQ(pool.idle_count(), 0u);
  EXPECT_EQ(pool.created_count(), 1u);

  // Two concurrent holders => two objects.
  auto widget2 = pool.check_out();
  EXPECT_EQ(widget2->m_id, 1);
  EXPECT_EQ(pool.created_count(), 2u);

  pool.give_back(std::move(widget));
  pool.give_back(std::move(widget2));
  EXPECT_EQ(pool.idle_count(), 2u);

  // Most recently returned first.
  EXPECT_EQ(pool.check_out()->m_id, 1);
}

TEST(Object_pool, Discarded_objects_are_not_returned)
{
  using Pool = Object_pool<Widget>;

  int n_made = 0;
  Pool pool([&]() -> Pool::Ptr { return boost::movelib::make_unique<Widget>(n_made++); });

  {
    auto widget = pool.check_out();
    // Destroyed instead of given back.
  }
  EXPECT_EQ(pool.idle_count(), 0u);
  EXPECT_EQ(pool.check_out()->m_id, 1);
  EXPECT_EQ(pool.created_count(), 2u);
}

} // namespace gelf::util::test
