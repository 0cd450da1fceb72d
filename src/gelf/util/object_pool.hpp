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
#include <boost/move/unique_ptr.hpp>
#include <boost/noncopyable.hpp>
#include <vector>

namespace gelf::util
{

// Types.

/**
 * Thread-safe pool of reusable, heap-allocated `Pooled` objects, for objects that are expensive to construct
 * but cheap to reset (e.g., zlib streams, whose state tables are sizable).  check_out() hands out an idle object,
 * or a freshly constructed one (via the factory given to ctor) if none is idle.  give_back() returns an object
 * to the idle set; the caller is responsible for putting it into a reusable state first.  An object that is not
 * given back is simply destroyed by its holder, and the pool never learns of it.
 *
 * No object is ever handed to two holders at once.  The pool does not bound the number of objects: it creates as
 * many as there are concurrent holders.
 *
 * @tparam Pooled
 *         Pooled object type.
 */
template<typename Pooled>
class Object_pool :
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for pointer to a checked-out object.
  using Ptr = boost::movelib::unique_ptr<Pooled>;

  /// Short-hand for the factory type: returns a new, ready-to-use object.
  using Factory = Function<Ptr ()>;

  // Constructors/destructor.

  /**
   * Constructs an empty pool.
   *
   * @param factory
   *        Invoked by check_out() when there is no idle object.  Invoked without any internal lock held;
   *        must return non-null.
   */
  explicit Object_pool(Factory&& factory);

  // Methods.

  /**
   * Returns an idle object, or a new one if none is idle.
   *
   * @return Non-null pointer.
   */
  Ptr check_out();

  /**
   * Adds `obj` to the idle set.
   *
   * @param obj
   *        A non-null object, typically obtained from check_out().  Becomes null.
   */
  void give_back(Ptr&& obj);

  /**
   * Number of objects currently idle in the pool.
   *
   * @return See above.
   */
  size_t idle_count() const;

  /**
   * Number of objects created by the factory so far.
   *
   * @return See above.
   */
  size_t created_count() const;

private:
  // Types.

  /// Short-hand for the mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for the lock type.
  using Lock = flow::util::Lock_guard<Mutex>;

  // Data.

  /// See ctor.
  const Factory m_factory;

  /// Protects #m_idle and #m_n_created.
  mutable Mutex m_mutex;

  /// The idle objects; the most recently returned one is at the back and is checked out first.
  std::vector<Ptr> m_idle;

  /// See created_count().
  size_t m_n_created;
}; // class Object_pool

// Template implementations.

template<typename Pooled>
Object_pool<Pooled>::Object_pool(Factory&& factory) :
  m_factory(std::move(factory)),
  m_n_created(0)
{
  // OK.
}

template<typename Pooled>
typename Object_pool<Pooled>::Ptr Object_pool<Pooled>::check_out()
{
  {
    Lock lock(m_mutex);
    if (!m_idle.empty())
    {
      auto obj = std::move(m_idle.back());
      m_idle.pop_back();
      return obj;
    }
    // else: Create one below; no reason to hold the lock while doing so.
    ++m_n_created;
  } // Lock lock(m_mutex)

  auto obj = m_factory();
  assert(obj && "Factory must not return null.");
  return obj;
}

template<typename Pooled>
void Object_pool<Pooled>::give_back(Ptr&& obj)
{
  assert(obj && "Cannot return null into the pool.");

  Lock lock(m_mutex);
  m_idle.emplace_back(std::move(obj));
}

template<typename Pooled>
size_t Object_pool<Pooled>::idle_count() const
{
  Lock lock(m_mutex);
  return m_idle.size();
}

template<typename Pooled>
size_t Object_pool<Pooled>::created_count() const
{
  Lock lock(m_mutex);
  return m_n_created;
}

} // namespace gelf::util
