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

/// @file
#pragma once

#include "gelf/util/util_fwd.hpp"
#include <flow/util/util.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/noncopyable.hpp>
#include <deque>

namespace gelf::util
{

// Types.

/**
 * A thread-safe FIFO of `Item`s with a fixed capacity: producers block while it is full; a consumer blocks while it
 * is empty, unless interrupted.  Any number of threads may send(); typically one thread receives.
 *
 * The interruption feature is what makes it suitable as the intake of a worker that must also react to control
 * signals (see Worker_ctl): the control side calls interrupt(), which wakes a receive() in progress (or makes the
 * next one return immediately) with `false` and no item.  An interruption is consumed by the receive() that reports
 * it; multiple interrupt() calls before that receive() collapse into one.
 *
 * Items are never dropped: an interrupted receive() leaves the queued items as they were.
 *
 * @tparam Item
 *         Payload type.  Must be movable.
 */
template<typename Item>
class Bounded_channel :
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for template parameter.
  using Item_type = Item;

  // Constructors/destructor.

  /**
   * Constructs empty channel.
   *
   * @param capacity
   *        Max number of items held at once.  Must be positive.
   */
  explicit Bounded_channel(size_t capacity);

  // Methods.

  /**
   * Appends `item` to the back, first blocking until there is room for it.
   *
   * @param item
   *        Item to move-in.
   */
  void send(Item&& item);

  /**
   * Pops the front item into `*item`, first blocking until one is available; or returns without an item if
   * an interruption is (or becomes) pending.  Items take priority: if both are available, the item is returned and
   * the interruption remains pending for the next call.
   *
   * @param item
   *        Target.  Untouched if `false` returned.
   * @return `true` if an item was received; `false` if interrupted.
   */
  bool receive(Item* item);

  /**
   * Pops the front item into `*item`, if one is available immediately.
   *
   * @param item
   *        Target.  Untouched if `false` returned.
   * @return `true` if an item was received; `false` if channel was empty.
   */
  bool try_receive(Item* item);

  /// Makes a receive() in progress, or the next one, return `false` as soon as the channel has no items.
  void interrupt();

  /**
   * Number of items currently queued.  In a multi-threaded setting it may be stale by the time it is examined.
   *
   * @return See above.
   */
  size_t size() const;

  /**
   * Capacity given to ctor.
   *
   * @return See above.
   */
  size_t capacity() const;

private:
  // Types.

  /// Short-hand for the mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for the lock type.
  using Lock = flow::util::Lock_guard<Mutex>;

  // Data.

  /// See capacity().
  const size_t m_capacity;

  /// Protects the rest of the data members.
  mutable Mutex m_mutex;

  /// The items, front being next to be received.  Protected by #m_mutex.
  std::deque<Item> m_items;

  /// Whether interrupt() was called, and no receive() has reported it yet.  Protected by #m_mutex.
  bool m_interrupted;

  /// Notified when #m_items becomes non-empty or #m_interrupted becomes `true`.
  boost::condition_variable m_readable_cond;

  /// Notified when #m_items gets smaller.
  boost::condition_variable m_writable_cond;
}; // class Bounded_channel

// Template implementations.

template<typename Item>
Bounded_channel<Item>::Bounded_channel(size_t capacity) :
  m_capacity(capacity),
  m_interrupted(false)
{
  assert((m_capacity != 0) && "Zero-capacity channel would block every send() forever.");
}

template<typename Item>
void Bounded_channel<Item>::send(Item&& item)
{
  {
    Lock lock(m_mutex);
    m_writable_cond.wait(lock, [&]() -> bool { return m_items.size() < m_capacity; });
    m_items.emplace_back(std::move(item));
  } // Lock lock(m_mutex)

  m_readable_cond.notify_all();
}

template<typename Item>
bool Bounded_channel<Item>::receive(Item* item)
{
  {
    Lock lock(m_mutex);
    m_readable_cond.wait(lock, [&]() -> bool { return m_interrupted || (!m_items.empty()); });

    if (m_items.empty())
    {
      m_interrupted = false;
      return false;
    }
    // else

    *item = std::move(m_items.front());
    m_items.pop_front();
  } // Lock lock(m_mutex)

  m_writable_cond.notify_all();
  return true;
}

template<typename Item>
bool Bounded_channel<Item>::try_receive(Item* item)
{
  {
    Lock lock(m_mutex);
    if (m_items.empty())
    {
      return false;
    }
    // else

    *item = std::move(m_items.front());
    m_items.pop_front();
  } // Lock lock(m_mutex)

  m_writable_cond.notify_all();
  return true;
}

template<typename Item>
void Bounded_channel<Item>::interrupt()
{
  {
    Lock lock(m_mutex);
    m_interrupted = true;
  }
  m_readable_cond.notify_all();
}

template<typename Item>
size_t Bounded_channel<Item>::size() const
{
  Lock lock(m_mutex);
  return m_items.size();
}

template<typename Item>
size_t Bounded_channel<Item>::capacity() const
{
  return m_capacity;
}

} // namespace gelf::util
