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

#include "kmap/util/util_fwd.hpp"
#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace kmap::util
{

/**
 * A doubly-linked sequence of key/mapped-value pairs whose nodes live in an arena (a `vector` of slots) and are
 * linked by slot index rather than by pointer.  Every operation below is constant-time (amortized, for the
 * insertions, due to the `vector`).
 *
 * A node is addressed by a Handle: the slot index plus the slot's *generation*.  remove() bumps the generation of
 * the freed slot and puts the slot on a free-list for reuse by a later insertion; hence a Handle kept past the
 * removal of its node is detectably stale (valid() returns `false`) even once the slot is reused.  Retaining a
 * handle across removal is nevertheless the caller's problem: methods other than valid() take valid handles as a
 * precondition (`assert()`ed).
 *
 * Since links are indices, copying or moving a list is a plain copy/move of the arena: handles into the source are
 * valid, and refer to the same positions, in the copy.  Linked_hash_map relies on this.
 *
 * Iteration order: from front() to back(), following next().  Iterators (#Iterator, #Const_iterator) are
 * bidirectional and remain valid under insertion and under removal of other nodes.  However, a reference to a
 * #Value obtained from an iterator or from value() is invalidated by any insertion, as the arena may reallocate.
 *
 * ### Thread safety ###
 * Same as for `std::list<>`.
 *
 * @tparam Key_t
 *         Key type.  Must be copy-constructible (the arena's growth copies the `const` key).
 * @tparam Mapped_t
 *         Mapped-value type.  Must be move-constructible.
 */
template<typename Key_t, typename Mapped_t>
class Ordered_list
{
public:
  // Types.

  /// Short-hand for key type.
  using Key = Key_t;

  /// Short-hand for mapped-value type.
  using Mapped = Mapped_t;

  /// Short-hand for the key/mapped-value pair stored in each node.  The key is immutable once inserted.
  using Value = std::pair<Key const, Mapped>;

  /// Type for index into the arena and for size.
  using size_type = std::size_t;

  /// Type for the per-slot generation counter.
  using generation_t = uint64_t;

  /**
   * Light-weight reference to a node.  A default-constructed Handle is null: null() is `true`.  front(), back(),
   * next(), prev() return a null Handle to indicate "none."
   */
  struct Handle
  {
    // Methods.

    /**
     * Returns `true` if and only if this is the null handle.
     *
     * @return See above.
     */
    bool null() const;

    /**
     * Returns `true` if and only if both refer to the same slot in the same generation (or both are null).
     *
     * @param other
     *        Other handle.
     * @return See above.
     */
    bool operator==(const Handle& other) const;

    /**
     * Negation of `operator==()`.
     *
     * @param other
     *        Other handle.
     * @return See above.
     */
    bool operator!=(const Handle& other) const;

    // Data.

    /// Index of the node's slot in the arena; `size_type(-1)` if null.
    size_type m_slot = size_type(-1);

    /// Generation of the slot at the time the node was placed into it.
    generation_t m_generation = 0;
  }; // struct Handle

  /**
   * Bidirectional iterator type, in `const` and mutable flavors.  Dereferences to #Value (the key is `const`
   * in both flavors).
   *
   * @tparam IS_CONST
   *         `true` for #Const_iterator, `false` for #Iterator.
   */
  template<bool IS_CONST>
  class Basic_iterator
  {
  public:
    // Types.

    /// For `std::iterator_traits`.
    using iterator_category = std::bidirectional_iterator_tag;
    /// For `std::iterator_traits`.
    using value_type = Value;
    /// For `std::iterator_traits`.
    using difference_type = std::ptrdiff_t;
    /// For `std::iterator_traits`.
    using pointer = std::conditional_t<IS_CONST, Value const *, Value*>;
    /// For `std::iterator_traits`.
    using reference = std::conditional_t<IS_CONST, Value const &, Value&>;

    /// Pointer to the containing list, `const` or not as appropriate.
    using List_ptr = std::conditional_t<IS_CONST, Ordered_list const *, Ordered_list*>;

    // Constructors/destructor.

    /// Constructs a singular iterator.  Only assignment to it is allowed.
    Basic_iterator();

    /**
     * Constructs iterator to the given slot; or the past-the-end iterator if `slot == S_NIL`.
     *
     * @param list
     *        The list.
     * @param slot
     *        Occupied slot index or `S_NIL`.
     */
    explicit Basic_iterator(List_ptr list, size_type slot);

    /**
     * Converts mutable iterator to `const` iterator.
     *
     * @tparam OTHER_IS_CONST
     *         Must be `false` while `IS_CONST` is `true`.
     * @param src
     *        Source.
     */
    template<bool OTHER_IS_CONST, typename = std::enable_if_t<IS_CONST && (!OTHER_IS_CONST)>>
    Basic_iterator(const Basic_iterator<OTHER_IS_CONST>& src);

    // Methods.

    /**
     * Dereferences.  Undefined behavior if past-the-end.
     *
     * @return See above.
     */
    reference operator*() const;

    /**
     * Dereferences.  Undefined behavior if past-the-end.
     *
     * @return See above.
     */
    pointer operator->() const;

    /**
     * Advances toward back().
     *
     * @return `*this`.
     */
    Basic_iterator& operator++();

    /**
     * Advances toward back().
     *
     * @return Copy of `*this` before the increment.
     */
    Basic_iterator operator++(int);

    /**
     * Moves toward front(); from past-the-end moves to back().
     *
     * @return `*this`.
     */
    Basic_iterator& operator--();

    /**
     * Moves toward front(); from past-the-end moves to back().
     *
     * @return Copy of `*this` before the decrement.
     */
    Basic_iterator operator--(int);

    /**
     * Equality.
     *
     * @param other
     *        Other iterator into the same list.
     * @return See above.
     */
    bool operator==(const Basic_iterator& other) const;

    /**
     * Inequality.
     *
     * @param other
     *        Other iterator into the same list.
     * @return See above.
     */
    bool operator!=(const Basic_iterator& other) const;

    /**
     * Returns Handle to the pointee; null Handle if past-the-end.
     *
     * @return See above.
     */
    Handle handle() const;

  private:
    // Friends.

    /// The converting ctor needs access to the mutable flavor's data.
    template<bool>
    friend class Basic_iterator;

    // Data.

    /// The list.
    List_ptr m_list;

    /// Slot index; `S_NIL` means past-the-end.
    size_type m_slot;
  }; // class Basic_iterator

  /// Mutable iterator.
  using Iterator = Basic_iterator<false>;

  /// `const` iterator.
  using Const_iterator = Basic_iterator<true>;

  /// For container compatibility.
  using iterator = Iterator;
  /// For container compatibility.
  using const_iterator = Const_iterator;
  /// For container compatibility.
  using value_type = Value;

  // Constructors/destructor.

  /// Constructs empty list.
  Ordered_list();

  // Methods.

  /**
   * Inserts a node at the front.
   *
   * @param key
   *        Key (moved-from).
   * @param mapped
   *        Mapped value (moved-from).
   * @return Handle to the new node.
   */
  Handle push_front(Key key, Mapped mapped);

  /**
   * Inserts a node at the back.
   *
   * @param key
   *        Key (moved-from).
   * @param mapped
   *        Mapped value (moved-from).
   * @return Handle to the new node.
   */
  Handle push_back(Key key, Mapped mapped);

  /**
   * Removes the given node, patching its neighbors, whether it is at the front, the back, in the middle, or
   * alone.  The removed slot's links are nulled and its generation bumped.
   *
   * @param handle
   *        Valid handle.
   */
  void remove(Handle handle);

  /**
   * Returns handle to the first node; null if empty.
   *
   * @return See above.
   */
  Handle front() const;

  /**
   * Returns handle to the last node; null if empty.
   *
   * @return See above.
   */
  Handle back() const;

  /**
   * Returns handle to the node after the given one; null if it is the last.
   *
   * @param handle
   *        Valid handle.
   * @return See above.
   */
  Handle next(Handle handle) const;

  /**
   * Returns handle to the node before the given one; null if it is the first.
   *
   * @param handle
   *        Valid handle.
   * @return See above.
   */
  Handle prev(Handle handle) const;

  /**
   * Returns `true` if and only if `handle` refers to a node currently in the list.
   *
   * @param handle
   *        Any handle, including null or stale.
   * @return See above.
   */
  bool valid(Handle handle) const;

  /**
   * Returns the node's key/mapped-value pair.
   *
   * @param handle
   *        Valid handle.
   * @return See above.
   */
  Value& value(Handle handle);

  /**
   * Returns the node's key/mapped-value pair.
   *
   * @param handle
   *        Valid handle.
   * @return See above.
   */
  const Value& value(Handle handle) const;

  /**
   * Returns iterator to the given node.
   *
   * @param handle
   *        Valid handle; or null, yielding end().
   * @return See above.
   */
  Iterator iterator_at(Handle handle);

  /**
   * Returns iterator to the given node.
   *
   * @param handle
   *        Valid handle; or null, yielding end().
   * @return See above.
   */
  Const_iterator iterator_at(Handle handle) const;

  /**
   * Removes all nodes.  Every outstanding Handle becomes stale.
   */
  void clear();

  /**
   * Returns the highest generation of any slot in the arena; 0 if the arena has no slots.  Every Handle ever
   * returned by `*this` has a generation no higher than this.
   *
   * @return See above.
   */
  generation_t max_generation() const;

  /**
   * Adds `delta` to the generation of every slot.  Handles obtained before the call are stale after it; the caller
   * is responsible for advancing any it keeps by the same `delta` (see Handle::m_generation).
   *
   * @param delta
   *        Amount to add.
   */
  void advance_generations(generation_t delta);

  /**
   * Swaps contents with `other`.  Constant-time.
   *
   * @param other
   *        Other list.
   */
  void swap(Ordered_list& other);

  /**
   * Returns iterator to front(); or end() if empty.
   *
   * @return See above.
   */
  Iterator begin();

  /**
   * Returns the past-the-end iterator.
   *
   * @return See above.
   */
  Iterator end();

  /**
   * Returns iterator to front(); or end() if empty.
   *
   * @return See above.
   */
  Const_iterator begin() const;

  /**
   * Returns the past-the-end iterator.
   *
   * @return See above.
   */
  Const_iterator end() const;

  /**
   * Same as `const` begin().
   *
   * @return See above.
   */
  Const_iterator cbegin() const;

  /**
   * Same as `const` end().
   *
   * @return See above.
   */
  Const_iterator cend() const;

  /**
   * Returns number of nodes.
   *
   * @return See above.
   */
  size_type size() const;

  /**
   * Returns `size() == 0`.
   *
   * @return See above.
   */
  bool empty() const;

private:
  // Types.

  /// One arena slot: either occupied by a node or on the free-list.
  struct Slot
  {
    /// The node's value; empty if and only if the slot is free.
    std::optional<Value> m_value;
    /// Previous node's slot; `S_NIL` if none (or if free).
    size_type m_prev = S_NIL;
    /// Next node's slot; `S_NIL` if none (or if free).
    size_type m_next = S_NIL;
    /// Incremented each time a node leaves this slot.
    generation_t m_generation = 0;
  };

  // Constants.

  /// Sentinel slot index meaning "no slot."
  static constexpr size_type S_NIL = size_type(-1);

  // Methods.

  /**
   * Places a new unlinked node into a free (or new) slot.
   *
   * @param key
   *        See push_back().
   * @param mapped
   *        See push_back().
   * @return Its slot index.
   */
  size_type acquire_slot(Key&& key, Mapped&& mapped);

  /**
   * Makes a Handle to the given occupied slot.
   *
   * @param slot
   *        Slot index or `S_NIL`.
   * @return See above.
   */
  Handle handle_of(size_type slot) const;

  /**
   * `assert()`s validity and returns the slot index.
   *
   * @param handle
   *        Handle.
   * @return See above.
   */
  size_type slot_of(Handle handle) const;

  // Data.

  /// The arena.
  std::vector<Slot> m_slots;

  /// Indices of free slots in #m_slots, reused LIFO.
  std::vector<size_type> m_free_slots;

  /// Slot of first node; `S_NIL` if empty.
  size_type m_head;

  /// Slot of last node; `S_NIL` if empty.
  size_type m_tail;

  /// Number of nodes.
  size_type m_size;
}; // class Ordered_list

// Free functions: in *_fwd.hpp.

// Template implementations.

template<typename Key_t, typename Mapped_t>
bool Ordered_list<Key_t, Mapped_t>::Handle::null() const
{
  return m_slot == S_NIL;
}

template<typename Key_t, typename Mapped_t>
bool Ordered_list<Key_t, Mapped_t>::Handle::operator==(const Handle& other) const
{
  return (m_slot == other.m_slot) && (null() || (m_generation == other.m_generation));
}

template<typename Key_t, typename Mapped_t>
bool Ordered_list<Key_t, Mapped_t>::Handle::operator!=(const Handle& other) const
{
  return !operator==(other);
}

template<typename Key_t, typename Mapped_t>
template<bool IS_CONST>
Ordered_list<Key_t, Mapped_t>::Basic_iterator<IS_CONST>::Basic_iterator() :
  m_list(0),
  m_slot(S_NIL)
{
  // Nothing.
}

template<typename Key_t, typename Mapped_t>
template<bool IS_CONST>
Ordered_list<Key_t, Mapped_t>::Basic_iterator<IS_CONST>::Basic_iterator(List_ptr list, size_type slot) :
  m_list(list),
  m_slot(slot)
{
  // Nothing.
}

template<typename Key_t, typename Mapped_t>
template<bool IS_CONST>
template<bool OTHER_IS_CONST, typename>
Ordered_list<Key_t, Mapped_t>::Basic_iterator<IS_CONST>::Basic_iterator(const Basic_iterator<OTHER_IS_CONST>& src) :
  m_list(src.m_list),
  m_slot(src.m_slot)
{
  // Nothing.
}

template<typename Key_t, typename Mapped_t>
template<bool IS_CONST>
typename Ordered_list<Key_t, Mapped_t>::template Basic_iterator<IS_CONST>::reference
  Ordered_list<Key_t, Mapped_t>::Basic_iterator<IS_CONST>::operator*() const
{
  assert(m_list && (m_slot != S_NIL));
  return *(m_list->m_slots[m_slot].m_value);
}

template<typename Key_t, typename Mapped_t>
template<bool IS_CONST>
typename Ordered_list<Key_t, Mapped_t>::template Basic_iterator<IS_CONST>::pointer
  Ordered_list<Key_t, Mapped_t>::Basic_iterator<IS_CONST>::operator->() const
{
  return &(operator*());
}

template<typename Key_t, typename Mapped_t>
template<bool IS_CONST>
typename Ordered_list<Key_t, Mapped_t>::template Basic_iterator<IS_CONST>&
  Ordered_list<Key_t, Mapped_t>::Basic_iterator<IS_CONST>::operator++()
{
  assert(m_list && (m_slot != S_NIL));
  m_slot = m_list->m_slots[m_slot].m_next;
  return *this;
}

template<typename Key_t, typename Mapped_t>
template<bool IS_CONST>
typename Ordered_list<Key_t, Mapped_t>::template Basic_iterator<IS_CONST>
  Ordered_list<Key_t, Mapped_t>::Basic_iterator<IS_CONST>::operator++(int)
{
  const auto prev_it = *this;
  operator++();
  return prev_it;
}

template<typename Key_t, typename Mapped_t>
template<bool IS_CONST>
typename Ordered_list<Key_t, Mapped_t>::template Basic_iterator<IS_CONST>&
  Ordered_list<Key_t, Mapped_t>::Basic_iterator<IS_CONST>::operator--()
{
  assert(m_list);
  m_slot = (m_slot == S_NIL) ? m_list->m_tail : m_list->m_slots[m_slot].m_prev;
  return *this;
}

template<typename Key_t, typename Mapped_t>
template<bool IS_CONST>
typename Ordered_list<Key_t, Mapped_t>::template Basic_iterator<IS_CONST>
  Ordered_list<Key_t, Mapped_t>::Basic_iterator<IS_CONST>::operator--(int)
{
  const auto prev_it = *this;
  operator--();
  return prev_it;
}

template<typename Key_t, typename Mapped_t>
template<bool IS_CONST>
bool Ordered_list<Key_t, Mapped_t>::Basic_iterator<IS_CONST>::operator==(const Basic_iterator& other) const
{
  return (m_list == other.m_list) && (m_slot == other.m_slot);
}

template<typename Key_t, typename Mapped_t>
template<bool IS_CONST>
bool Ordered_list<Key_t, Mapped_t>::Basic_iterator<IS_CONST>::operator!=(const Basic_iterator& other) const
{
  return !operator==(other);
}

template<typename Key_t, typename Mapped_t>
template<bool IS_CONST>
typename Ordered_list<Key_t, Mapped_t>::Handle
  Ordered_list<Key_t, Mapped_t>::Basic_iterator<IS_CONST>::handle() const
{
  return m_list ? m_list->handle_of(m_slot) : Handle();
}

template<typename Key_t, typename Mapped_t>
Ordered_list<Key_t, Mapped_t>::Ordered_list() :
  m_head(S_NIL),
  m_tail(S_NIL),
  m_size(0)
{
  // Nothing.
}

template<typename Key_t, typename Mapped_t>
typename Ordered_list<Key_t, Mapped_t>::size_type
  Ordered_list<Key_t, Mapped_t>::acquire_slot(Key&& key, Mapped&& mapped)
{
  size_type slot;
  if (m_free_slots.empty())
  {
    slot = m_slots.size();
    m_slots.emplace_back();
  }
  else
  {
    slot = m_free_slots.back();
    m_free_slots.pop_back();
  }

  auto& slot_ref = m_slots[slot];
  assert(!slot_ref.m_value);
  slot_ref.m_value.emplace(std::move(key), std::move(mapped));
  slot_ref.m_prev = slot_ref.m_next = S_NIL;
  ++m_size;
  return slot;
}

template<typename Key_t, typename Mapped_t>
typename Ordered_list<Key_t, Mapped_t>::Handle Ordered_list<Key_t, Mapped_t>::push_front(Key key, Mapped mapped)
{
  const auto slot = acquire_slot(std::move(key), std::move(mapped));

  m_slots[slot].m_next = m_head;
  if (m_head == S_NIL)
  {
    m_tail = slot;
  }
  else
  {
    m_slots[m_head].m_prev = slot;
  }
  m_head = slot;

  return handle_of(slot);
}

template<typename Key_t, typename Mapped_t>
typename Ordered_list<Key_t, Mapped_t>::Handle Ordered_list<Key_t, Mapped_t>::push_back(Key key, Mapped mapped)
{
  const auto slot = acquire_slot(std::move(key), std::move(mapped));

  m_slots[slot].m_prev = m_tail;
  if (m_tail == S_NIL)
  {
    m_head = slot;
  }
  else
  {
    m_slots[m_tail].m_next = slot;
  }
  m_tail = slot;

  return handle_of(slot);
}

template<typename Key_t, typename Mapped_t>
void Ordered_list<Key_t, Mapped_t>::remove(Handle handle)
{
  const auto slot = slot_of(handle);
  auto& slot_ref = m_slots[slot];

  if (slot_ref.m_prev == S_NIL)
  {
    assert(m_head == slot);
    m_head = slot_ref.m_next;
  }
  else
  {
    m_slots[slot_ref.m_prev].m_next = slot_ref.m_next;
  }

  if (slot_ref.m_next == S_NIL)
  {
    assert(m_tail == slot);
    m_tail = slot_ref.m_prev;
  }
  else
  {
    m_slots[slot_ref.m_next].m_prev = slot_ref.m_prev;
  }

  slot_ref.m_prev = slot_ref.m_next = S_NIL;
  slot_ref.m_value.reset();
  ++slot_ref.m_generation;
  m_free_slots.push_back(slot);
  --m_size;
} // Ordered_list::remove()

template<typename Key_t, typename Mapped_t>
typename Ordered_list<Key_t, Mapped_t>::Handle Ordered_list<Key_t, Mapped_t>::front() const
{
  return handle_of(m_head);
}

template<typename Key_t, typename Mapped_t>
typename Ordered_list<Key_t, Mapped_t>::Handle Ordered_list<Key_t, Mapped_t>::back() const
{
  return handle_of(m_tail);
}

template<typename Key_t, typename Mapped_t>
typename Ordered_list<Key_t, Mapped_t>::Handle Ordered_list<Key_t, Mapped_t>::next(Handle handle) const
{
  return handle_of(m_slots[slot_of(handle)].m_next);
}

template<typename Key_t, typename Mapped_t>
typename Ordered_list<Key_t, Mapped_t>::Handle Ordered_list<Key_t, Mapped_t>::prev(Handle handle) const
{
  return handle_of(m_slots[slot_of(handle)].m_prev);
}

template<typename Key_t, typename Mapped_t>
bool Ordered_list<Key_t, Mapped_t>::valid(Handle handle) const
{
  return (!handle.null())
         && (handle.m_slot < m_slots.size())
         && m_slots[handle.m_slot].m_value
         && (m_slots[handle.m_slot].m_generation == handle.m_generation);
}

template<typename Key_t, typename Mapped_t>
typename Ordered_list<Key_t, Mapped_t>::Value& Ordered_list<Key_t, Mapped_t>::value(Handle handle)
{
  return *(m_slots[slot_of(handle)].m_value);
}

template<typename Key_t, typename Mapped_t>
const typename Ordered_list<Key_t, Mapped_t>::Value& Ordered_list<Key_t, Mapped_t>::value(Handle handle) const
{
  return *(m_slots[slot_of(handle)].m_value);
}

template<typename Key_t, typename Mapped_t>
typename Ordered_list<Key_t, Mapped_t>::Iterator Ordered_list<Key_t, Mapped_t>::iterator_at(Handle handle)
{
  return Iterator(this, handle.null() ? S_NIL : slot_of(handle));
}

template<typename Key_t, typename Mapped_t>
typename Ordered_list<Key_t, Mapped_t>::Const_iterator
  Ordered_list<Key_t, Mapped_t>::iterator_at(Handle handle) const
{
  return Const_iterator(this, handle.null() ? S_NIL : slot_of(handle));
}

template<typename Key_t, typename Mapped_t>
typename Ordered_list<Key_t, Mapped_t>::generation_t Ordered_list<Key_t, Mapped_t>::max_generation() const
{
  generation_t result = 0;
  for (const auto& slot_ref : m_slots)
  {
    result = std::max(result, slot_ref.m_generation);
  }
  return result;
}

template<typename Key_t, typename Mapped_t>
void Ordered_list<Key_t, Mapped_t>::advance_generations(generation_t delta)
{
  for (auto& slot_ref : m_slots)
  {
    slot_ref.m_generation += delta;
  }
}

template<typename Key_t, typename Mapped_t>
void Ordered_list<Key_t, Mapped_t>::clear()
{
  /* Keep the arena's slots (and their bumped generations) rather than dropping them: this way a Handle
   * obtained before clear() cannot match a node inserted after it. */
  for (size_type slot = m_head; slot != S_NIL; )
  {
    auto& slot_ref = m_slots[slot];
    const auto next_slot = slot_ref.m_next;

    slot_ref.m_prev = slot_ref.m_next = S_NIL;
    slot_ref.m_value.reset();
    ++slot_ref.m_generation;
    m_free_slots.push_back(slot);

    slot = next_slot;
  }
  m_head = m_tail = S_NIL;
  m_size = 0;
}

template<typename Key_t, typename Mapped_t>
void Ordered_list<Key_t, Mapped_t>::swap(Ordered_list& other)
{
  using std::swap;

  swap(m_slots, other.m_slots);
  swap(m_free_slots, other.m_free_slots);
  swap(m_head, other.m_head);
  swap(m_tail, other.m_tail);
  swap(m_size, other.m_size);
}

template<typename Key_t, typename Mapped_t>
typename Ordered_list<Key_t, Mapped_t>::Iterator Ordered_list<Key_t, Mapped_t>::begin()
{
  return Iterator(this, m_head);
}

template<typename Key_t, typename Mapped_t>
typename Ordered_list<Key_t, Mapped_t>::Iterator Ordered_list<Key_t, Mapped_t>::end()
{
  return Iterator(this, S_NIL);
}

template<typename Key_t, typename Mapped_t>
typename Ordered_list<Key_t, Mapped_t>::Const_iterator Ordered_list<Key_t, Mapped_t>::begin() const
{
  return Const_iterator(this, m_head);
}

template<typename Key_t, typename Mapped_t>
typename Ordered_list<Key_t, Mapped_t>::Const_iterator Ordered_list<Key_t, Mapped_t>::end() const
{
  return Const_iterator(this, S_NIL);
}

template<typename Key_t, typename Mapped_t>
typename Ordered_list<Key_t, Mapped_t>::Const_iterator Ordered_list<Key_t, Mapped_t>::cbegin() const
{
  return begin();
}

template<typename Key_t, typename Mapped_t>
typename Ordered_list<Key_t, Mapped_t>::Const_iterator Ordered_list<Key_t, Mapped_t>::cend() const
{
  return end();
}

template<typename Key_t, typename Mapped_t>
typename Ordered_list<Key_t, Mapped_t>::size_type Ordered_list<Key_t, Mapped_t>::size() const
{
  return m_size;
}

template<typename Key_t, typename Mapped_t>
bool Ordered_list<Key_t, Mapped_t>::empty() const
{
  return m_size == 0;
}

template<typename Key_t, typename Mapped_t>
typename Ordered_list<Key_t, Mapped_t>::Handle Ordered_list<Key_t, Mapped_t>::handle_of(size_type slot) const
{
  if (slot == S_NIL)
  {
    return Handle();
  }
  // else
  Handle handle;
  handle.m_slot = slot;
  handle.m_generation = m_slots[slot].m_generation;
  return handle;
}

template<typename Key_t, typename Mapped_t>
typename Ordered_list<Key_t, Mapped_t>::size_type Ordered_list<Key_t, Mapped_t>::slot_of(Handle handle) const
{
  assert(valid(handle) && "Stale or null handle used; retaining handles across removal is disallowed.");
  return handle.m_slot;
}

template<typename Key_t, typename Mapped_t>
void swap(Ordered_list<Key_t, Mapped_t>& val1, Ordered_list<Key_t, Mapped_t>& val2)
{
  val1.swap(val2);
}

} // namespace kmap::util
