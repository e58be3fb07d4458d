/* kmap
 * Copyright 2026 The kmap Authors.
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

#include "kmap/util/ordered_list.hpp"
#include "kmap/util/util_fwd.hpp"
#include <boost/unordered_map.hpp>
#include <cstddef>

namespace kmap::util
{

/**
 * An object of this class is a map that combines the lookup speed of an `unordered_map<>` and the ordering and
 * iterator stability of a `list<>`: a hash table from #Key to Ordered_list::Handle, composed with an Ordered_list
 * holding the actual key/mapped-value pairs.
 *
 * The API is a subset of that of an `unordered_map<>`.  Iteration order is insertion order: insert() places a
 * new element at the back.  Replacing the mapped value of an existing key via the iterator from find() does not
 * move it.  Every lookup, insertion, and
 * erasure is (amortized) constant-time, and so is each iteration step.
 *
 * Invariant: the hash table's entries and the list's nodes are in 1-to-1 correspondence, each table entry holding
 * the handle of the node with the same key.  Every mutator below maintains this before returning.
 *
 * Copy, move, and `swap()` are supported.  Since the list is index-linked, a copy simply copies both members
 * with all handles intact.
 *
 * ### Thread safety ###
 * Same as for `unordered_map<>`.  map::Ordered_map adds the locking.
 *
 * @internal
 * ### Impl notes ###
 * Each key is stored twice: in the list node and as the hash table key.  Storing the handle alone in a hash set,
 * with hashing by dereference into the list, would save that copy, but would make the hash functor depend on the
 * address of the list, complicating copy and `swap()`.
 * @endinternal
 *
 * @tparam Key_t
 *         Key type.  Must be copy-constructible, hashable by #Hash, and comparable by #Pred.
 * @tparam Mapped_t
 *         Mapped-value type.
 * @tparam Hash_t
 *         Hasher type, as for `boost::unordered_map<>`.  The default `boost::hash<Key>` picks up a
 *         `size_t hash_value(const Key&)` free function found by ADL.
 * @tparam Pred_t
 *         Equality-determiner type, as for `boost::unordered_map<>`.
 */
template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
class Linked_hash_map
{
public:
  // Types.

  /// Short-hand for key type.
  using Key = Key_t;

  /// Short-hand for mapped-value type.
  using Mapped = Mapped_t;

  /// Short-hand for hash functor type.
  using Hash = Hash_t;

  /// Short-hand for equality functor type.
  using Pred = Pred_t;

  /// The underlying ordered storage.
  using Value_list = Ordered_list<Key, Mapped>;

  /// Short-hand for key/mapped-value pair.
  using Value = typename Value_list::Value;

  /// Node handle; see Ordered_list::Handle.
  using Handle = typename Value_list::Handle;

  /// Type for index into array of items, where items are all applicable objects including `Value`s and `Key`s.
  using size_type = std::size_t;

  /// Mutable iterator.
  using Iterator = typename Value_list::Iterator;

  /// `const` iterator.
  using Const_iterator = typename Value_list::Const_iterator;

  /// For container compatibility.
  using key_type = Key;
  /// For container compatibility.
  using mapped_type = Mapped;
  /// For container compatibility.
  using value_type = Value;
  /// For container compatibility.
  using iterator = Iterator;
  /// For container compatibility.
  using const_iterator = Const_iterator;

  // Constructors/destructor.

  /**
   * Constructs an empty map.
   *
   * @param n_buckets
   *        Initial bucket count of the hash table; -1 means the Boost.Unordered default.
   * @param hasher_instance
   *        Hasher copied into the table.
   * @param key_equal_instance
   *        Key equality functor copied into the table.
   */
  explicit Linked_hash_map(size_type n_buckets = size_type(-1),
                           const Hash& hasher_instance = Hash(),
                           const Pred& key_equal_instance = Pred());

  /**
   * Constructs object that is a copy of the given source: same elements in the same order.
   *
   * @param src
   *        Source object.
   */
  Linked_hash_map(const Linked_hash_map& src);

  /**
   * Constructs object by making it equal to the given source, while the given source becomes as-if
   * default-cted.
   *
   * @param src
   *        Source object which is emptied.
   */
  Linked_hash_map(Linked_hash_map&& src);

  // Methods.

  /**
   * Replaces the contents with a copy of `src`, order and handles included.
   *
   * @param src
   *        Map to copy; may be `*this`.
   * @return `*this`.
   */
  Linked_hash_map& operator=(const Linked_hash_map& src);

  /**
   * Overwrites this object making it identical to the given source, while the given source becomes as-if
   * default-cted.
   *
   * @param src
   *        Source object which is emptied (unless it is `*this`; then no-op).
   * @return `*this`.
   */
  Linked_hash_map& operator=(Linked_hash_map&& src);

  /**
   * Prepares `*this` to take the place of `predecessor`, typically via a subsequent swap(): advances the
   * generations of this map's handles past every generation `predecessor` has issued, so that no handle into
   * `predecessor` is valid in `*this`.  Linear-time.
   *
   * @param predecessor
   *        The map to be replaced.
   */
  void supersede(const Linked_hash_map& predecessor);

  /**
   * Swaps the contents of this structure and `other`.  Constant-time.
   *
   * @param other
   *        The other structure.
   */
  void swap(Linked_hash_map& other);

  /**
   * Attempts to insert the given key/mapped-value pair at the back.  If the key is already present, does
   * nothing (the existing element, and its position, are left untouched).
   *
   * @param key
   *        Key (moved-from if inserted).
   * @param mapped
   *        Mapped value (moved-from if inserted).
   * @return `false` paired with handle to the existing element if the key was present; else `true` paired with
   *         handle to the new element.
   */
  std::pair<Handle, bool> insert(Key key, Mapped mapped);

  /**
   * Returns handle of the element with the given key; null Handle if not found.
   *
   * @param key
   *        Key.
   * @return See above.
   */
  Handle lookup(const Key& key) const;

  /**
   * Attempts to find value at the given key in the map.
   *
   * @param key
   *        Key whose equal to find.
   * @return Iterator to the element; end() if absent.
   */
  Iterator find(const Key& key);

  /**
   * Attempts to find value at the given key in the map.
   *
   * @param key
   *        Key whose equal to find.
   * @return Iterator to the element; end() if absent.
   */
  Const_iterator find(const Key& key) const;

  /**
   * Returns the number (1 or 0) of elements with a key equal to the given one.
   *
   * @param key
   *        Key.
   * @return See above.
   */
  size_type count(const Key& key) const;

  /**
   * Erases the element at the given iterator.
   *
   * @param it
   *        Iterator of element to erase.  Must not be end().
   * @return Iterator one position past (i.e., toward back() from) `it`.
   */
  Iterator erase(Const_iterator it);

  /**
   * Erases the element with the given key, if it exists.
   *
   * @param key
   *        Key.
   * @return Number of elements erased (1 or 0).
   */
  size_type erase(const Key& key);

  /// Makes it so that `size() == 0`.
  void clear();

  /**
   * Returns handle to the first element; null if empty.
   *
   * @return See above.
   */
  Handle front() const;

  /**
   * Returns handle to the last element; null if empty.
   *
   * @return See above.
   */
  Handle back() const;

  /**
   * Returns handle to the element after the given one; null if it is the last.
   *
   * @param handle
   *        Valid handle.
   * @return See above.
   */
  Handle next(Handle handle) const;

  /**
   * Returns handle to the element before the given one; null if it is the first.
   *
   * @param handle
   *        Valid handle.
   * @return See above.
   */
  Handle prev(Handle handle) const;

  /**
   * Returns `true` if and only if `handle` refers to an element currently in `*this`.
   *
   * @param handle
   *        Any handle.
   * @return See above.
   */
  bool valid(Handle handle) const;

  /**
   * Returns the element at the given handle.
   *
   * @param handle
   *        Valid handle.
   * @return See above.
   */
  const Value& value(Handle handle) const;

  /**
   * Returns iterator to the first element; or end() if empty.
   *
   * @return See above.
   */
  Iterator begin();

  /**
   * Returns past-the-end iterator.
   *
   * @return See above.
   */
  Iterator end();

  /**
   * Returns iterator to the first element; or end() if empty.
   *
   * @return See above.
   */
  Const_iterator begin() const;

  /**
   * Returns past-the-end iterator.
   *
   * @return See above.
   */
  Const_iterator end() const;

  /**
   * Returns `true` if and only if container is empty.  Same performance as of `unordered_map<>`.
   *
   * @return Ditto.
   */
  bool empty() const;

  /**
   * Returns number of elements stored.  Same performance as of `unordered_map<>`.
   *
   * @return Ditto.
   */
  size_type size() const;

private:
  // Types.

  /// Short-hand for the hash table.
  using Handle_map = boost::unordered_map<Key, Handle, Hash, Pred>;

  // Data.

  /// The actual values, in order.
  Value_list m_value_list;

  /// Key to handle of the node in #m_value_list with that key.
  Handle_map m_handles_by_key;
}; // class Linked_hash_map

// Template implementations.

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Linked_hash_map(size_type n_buckets,
                                                                  const Hash& hasher_instance,
                                                                  const Pred& key_equal_instance) :
  m_handles_by_key((n_buckets == size_type(-1))
                     ? boost::unordered::detail::default_bucket_count
                     : n_buckets,
                   hasher_instance, key_equal_instance)
{
  // Nothing.
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Linked_hash_map(const Linked_hash_map& src) = default;

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Linked_hash_map(Linked_hash_map&& src) :
  Linked_hash_map(0, src.m_handles_by_key.hash_function(), src.m_handles_by_key.key_eq())
{
  swap(src);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>&
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::operator=(const Linked_hash_map& src)
{
  if (&src != this)
  {
    // The list's node type is not assignable (the key is `const`); so copy-construct then swap.
    Linked_hash_map src_copy(src);
    swap(src_copy);
  }
  return *this;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>&
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::operator=(Linked_hash_map&& src)
{
  if (&src != this)
  {
    clear();
    swap(src);
  }
  return *this;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
void Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::supersede(const Linked_hash_map& predecessor)
{
  const auto delta = predecessor.m_value_list.max_generation() + 1;
  m_value_list.advance_generations(delta);
  for (auto& key_and_handle : m_handles_by_key)
  {
    key_and_handle.second.m_generation += delta;
  }
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
void Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::swap(Linked_hash_map& other)
{
  using std::swap;

  swap(m_value_list, other.m_value_list);
  swap(m_handles_by_key, other.m_handles_by_key);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
std::pair<typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Handle, bool>
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::insert(Key key, Mapped mapped)
{
  const auto map_it = m_handles_by_key.find(key);
  if (map_it != m_handles_by_key.end())
  {
    return { map_it->second, false };
  }
  // else

  Key key_copy(key);
  const auto handle = m_value_list.push_back(std::move(key), std::move(mapped));
  m_handles_by_key.emplace(std::move(key_copy), handle);
  return { handle, true };
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Handle
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::lookup(const Key& key) const
{
  const auto map_it = m_handles_by_key.find(key);
  return (map_it == m_handles_by_key.end()) ? Handle() : map_it->second;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Iterator
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::find(const Key& key)
{
  return m_value_list.iterator_at(lookup(key));
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Const_iterator
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::find(const Key& key) const
{
  return m_value_list.iterator_at(lookup(key));
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::size_type
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::count(const Key& key) const
{
  return m_handles_by_key.count(key);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Iterator
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::erase(Const_iterator it)
{
  const auto handle = it.handle();
  assert(!handle.null());

  const auto next_handle = m_value_list.next(handle);

  m_handles_by_key.erase(it->first); // Before the node (holding the key) is gone.
  m_value_list.remove(handle);

  return m_value_list.iterator_at(next_handle);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::size_type
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::erase(const Key& key)
{
  const auto map_it = m_handles_by_key.find(key);
  if (map_it == m_handles_by_key.end())
  {
    return 0;
  }
  // else

  const auto handle = map_it->second;
  m_handles_by_key.erase(map_it);
  m_value_list.remove(handle);
  return 1;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
void Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::clear()
{
  m_handles_by_key.clear();
  m_value_list.clear();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Handle
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::front() const
{
  return m_value_list.front();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Handle
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::back() const
{
  return m_value_list.back();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Handle
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::next(Handle handle) const
{
  return m_value_list.next(handle);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Handle
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::prev(Handle handle) const
{
  return m_value_list.prev(handle);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
bool Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::valid(Handle handle) const
{
  return m_value_list.valid(handle);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
const typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Value&
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::value(Handle handle) const
{
  return m_value_list.value(handle);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Iterator
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::begin()
{
  return m_value_list.begin();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Iterator
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::end()
{
  return m_value_list.end();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Const_iterator
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::begin() const
{
  return m_value_list.begin();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Const_iterator
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::end() const
{
  return m_value_list.end();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
bool Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::empty() const
{
  return m_value_list.empty();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::size_type
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::size() const
{
  return m_value_list.size();
}

// Free functions.

/**
 * Same as `val1.swap(val2)`; found by ADL.
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 */
template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
void swap(Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>& val1,
          Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>& val2)
{
  val1.swap(val2);
}

} // namespace kmap::util
