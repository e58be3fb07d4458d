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

#include "kmap/map/map_fwd.hpp"
#include "kmap/map/options.hpp"
#include "kmap/map/size_of.hpp"
#include "kmap/map/error/error.hpp"
#include "kmap/persist/codec.hpp"
#include "kmap/persist/image.hpp"
#include "kmap/persist/coordinator.hpp"
#include "kmap/persist/save_options.hpp"
#include "kmap/persist/error/error.hpp"
#include "kmap/util/linked_hash_map.hpp"
#include "kmap/error/error.hpp"
#include "kmap/log/log.hpp"
#include <boost/filesystem/path.hpp>
#include <boost/noncopyable.hpp>
#include <initializer_list>
#include <limits>
#include <memory>
#include <optional>
#include <vector>

namespace kmap::map
{

/**
 * A thread-safe key-value map that iterates in insertion order and bounds its own approximate memory footprint;
 * it can also save itself to, and load itself from, a file.
 *
 * ### Ordering ###
 * set() of a new key appends it at the back.  set() of a present key replaces its value in place: its position
 * is unchanged.  Lookup and ordered traversal are both O(1) per step, as the map is a util::Linked_hash_map
 * (a hash table of handles into a util::Ordered_list).
 *
 * ### Size limit and eviction ###
 * Every value's approximate size (see Size_of) is computed when it is written, and the map keeps the running
 * total (total_size()).  If the map is bounded (Map_options::m_limit_mb positive), then set():
 *   - fails with map::error::Code::S_SIZE_EXCEEDED, changing nothing, if the value's size alone exceeds the limit;
 *   - otherwise, if the new total (that is, the total minus the key's old size, if present, plus the new size)
 *     would exceed the limit, first clears the entire map and then stores the entry as its only one.
 *
 * That is, eviction is all-or-nothing, not per-entry: this is not an LRU cache.  Exceeding the limit in the second
 * way is not an error.  A value exactly as large as the limit is accepted.
 *
 * ### Handles ###
 * front(), back(), handle_of(), next(), prev() yield a #Handle for external traversal; entry() yields the key and
 * value at a Handle.  A Handle whose entry has since been removed (by erase(), clear(), eviction, or load()) is
 * *stale*; this is detected: next() and prev() return a null Handle, and entry() emits
 * map::error::Code::S_INVALID_HANDLE.  A stale Handle never aliases a newer entry.
 *
 * ### Persistence ###
 * save() writes the map (its entries in order, with their recorded sizes, plus the total size and limit) as a
 * binary image; see kmap::persist for the format.  load() replaces the map's contents, total size, and limit
 * with those in an image.  save_async() and load_async() do the same on a background thread, reporting through
 * persist::Async_result.  Keys and values must have a persist::Value_codec; for load() they must also be
 * default-constructible.
 *
 * ### Thread safety ###
 * All methods are safe to call concurrently.  A single reader/writer lock guards the whole map: read-only methods
 * take it in shared mode, mutating ones in exclusive mode.  Hence all operations are linearizable.
 * A save holds the shared lock only while encoding the image (not while compressing or writing it); a load
 * decodes the image into a separate structure without the lock, then takes the exclusive lock only to swap it in.
 * A range() visitor runs under the shared lock: it must not call mutating methods of the same map (deadlock).
 *
 * @tparam Key_t
 *         Key type.  Must be copy-constructible, hashable by `Hash_t`, and comparable by `Pred_t`.
 * @tparam Value_t
 *         Value type.  Must be copy-constructible and copy-assignable, and have a Size_of.
 * @tparam Hash_t
 *         Hasher type.
 * @tparam Pred_t
 *         Equality functor type.
 */
template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
class Ordered_map :
  public log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for template parameter key type.
  using Key = Key_t;

  /// Short-hand for template parameter value type.
  using Value = Value_t;

  /// A key and its value, as returned by entry() and entries().
  using Key_value = std::pair<Key, Value>;

  /**
   * The stored form of a value: the value itself plus its approximate size as computed when it was written
   * (or as recorded in the image it was loaded from).
   */
  struct Entry
  {
    /// The value.
    Value m_value;
    /// Its approximate size.
    int64_t m_size;
  };

  /// Short-hand for the underlying unsynchronized structure.
  using Entries = util::Linked_hash_map<Key, Entry, Hash_t, Pred_t>;

  /// Light-weight reference to an entry, for external traversal.  See class doc header.
  using Handle = typename Entries::Handle;

  /**
   * Function invoked by range() for each entry, in order; it returns `false` to stop the traversal.
   * The references are valid only during the invocation.
   */
  using Visitor = Function<bool (const Key& key, const Value& val)>;

  // Constructors/destructor.

  /**
   * Constructs an empty map.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param opts
   *        Options; copied.
   */
  explicit Ordered_map(log::Logger* logger_ptr, const Map_options& opts = Map_options());

  /// Waits for any pending save_async() and load_async() work to finish, then destroys the map.
  ~Ordered_map();

  // Methods.

  /**
   * Returns a copy of the value for the given key, or none if absent.  The ordering is unaffected.
   *
   * @param key
   *        Key.
   * @return See above.
   */
  std::optional<Value> get(const Key& key) const;

  /**
   * Returns a copy of the value for the given key, or `dflt` if absent.
   *
   * @param key
   *        Key.
   * @param dflt
   *        Value to return if absent.
   * @return See above.
   */
  Value get_or_default(const Key& key, const Value& dflt) const;

  /**
   * Returns a copy of the value for the first of the given keys (in the order given) that is present, or none if
   * none is.  All lookups happen under one lock acquisition.
   *
   * @param keys
   *        Keys.
   * @return See above.
   */
  std::optional<Value> get_any(std::initializer_list<Key> keys) const;

  /**
   * Returns `true` if and only if the given key is present.
   *
   * @param key
   *        Key.
   * @return See above.
   */
  bool contains(const Key& key) const;

  /**
   * Stores the given value for the given key: in place if present; else at the back.  May first clear the entire
   * map, if bounded; see class doc header.
   *
   * @param key
   *        Key.
   * @param val
   *        Value.
   * @param err_code
   *        See #Error_code docs for error reporting semantics.  Error: map::error::Code::S_SIZE_EXCEEDED
   *        (the map is unchanged).
   */
  void set(const Key& key, const Value& val, Error_code* err_code = 0);

  /**
   * Removes the entry for the given key, if present.
   *
   * @param key
   *        Key.
   * @return `true` if and only if an entry was removed.
   */
  bool erase(const Key& key);

  /// Removes all entries; the total size becomes 0.  Every outstanding #Handle becomes stale.
  void clear();

  /// Same as clear().
  void flush();

  /**
   * Returns the number of entries.
   *
   * @return See above.
   */
  size_t len() const;

  /**
   * Returns the size limit in bytes; 0 if unbounded.
   *
   * @return See above.
   */
  int64_t limit_bytes() const;

  /**
   * Returns the sum of the approximate sizes of all entries.
   *
   * @return See above.
   */
  int64_t total_size() const;

  /**
   * Returns #Handle to the first entry; null if empty.
   *
   * @return See above.
   */
  Handle front() const;

  /**
   * Returns #Handle to the last entry; null if empty.
   *
   * @return See above.
   */
  Handle back() const;

  /**
   * Returns #Handle to the entry with the given key; null if there is none.  Lets traversal start mid-map.
   *
   * @param key
   *        Key.
   * @return See above.
   */
  Handle handle_of(const Key& key) const;

  /**
   * Returns #Handle to the entry after the given one; null if it is the last one or if `handle` is null or stale.
   *
   * @param handle
   *        Handle.
   * @return See above.
   */
  Handle next(Handle handle) const;

  /**
   * Returns #Handle to the entry before the given one; null if it is the first one or if `handle` is null or stale.
   *
   * @param handle
   *        Handle.
   * @return See above.
   */
  Handle prev(Handle handle) const;

  /**
   * Returns a copy of the key and value at the given #Handle.
   *
   * @param handle
   *        Handle.
   * @param err_code
   *        See #Error_code docs for error reporting semantics.  Error: map::error::Code::S_INVALID_HANDLE if
   *        `handle` is null or stale.  (#Key and #Value must be default-constructible to use this.)
   * @return See above; default-constructed on error.
   */
  Key_value entry(Handle handle, Error_code* err_code = 0) const;

  /**
   * Invokes `visitor` on each entry, front to back, until it returns `false`.  The shared lock is held
   * throughout; see class doc header.
   *
   * @param visitor
   *        Visitor.
   */
  void range(const Visitor& visitor) const;

  /**
   * Returns the keys, front to back.
   *
   * @return See above.
   */
  std::vector<Key> keys() const;

  /**
   * Returns the values, front to back.
   *
   * @return See above.
   */
  std::vector<Value> values() const;

  /**
   * Returns the keys and values, front to back.
   *
   * @return See above.
   */
  std::vector<Key_value> entries() const;

  /**
   * Returns a new, independent map with the same entries in the same order, the same per-entry sizes and
   * total size, and the same limit.
   *
   * @return See above.
   */
  std::unique_ptr<Ordered_map> copy() const;

  /**
   * Writes the map to `path` as an image.  See class doc header; and persist::Coordinator::write_image().
   *
   * @param path
   *        Target path.  Parent directories are created as needed.
   * @param opts
   *        Options; chiefly whether to compress.
   * @param err_code
   *        See #Error_code docs for error reporting semantics.  Errors: persist::error::Code values; file system
   *        errors.
   */
  void save(const boost::filesystem::path& path, const persist::Save_options& opts = persist::Save_options(),
            Error_code* err_code = 0) const;

  /**
   * Replaces the contents, total size, and limit of the map with those in the image at `path`.  On error
   * the map is unchanged.
   *
   * @param path
   *        Source path.
   * @param err_code
   *        See #Error_code docs for error reporting semantics.  Errors: persist::error::Code values (the image is
   *        malformed; or it repeats a key; or its total size is not the sum of its entries' sizes); file system
   *        errors.
   */
  void load(const boost::filesystem::path& path, Error_code* err_code = 0);

  /**
   * Same as save() but performed on a background thread.  The map must not be destroyed until the returned
   * handle reports completion; or else the destructor waits for it.
   *
   * @param path
   *        See save().
   * @param opts
   *        See save().
   * @return Handle reporting completion and the result; see persist::Async_result.
   */
  persist::Async_result_ptr save_async(const boost::filesystem::path& path,
                                       const persist::Save_options& opts = persist::Save_options()) const;

  /**
   * Same as load() but performed on a background thread.  See save_async().
   *
   * @param path
   *        See load().
   * @return Handle reporting completion and the result; see persist::Async_result.
   */
  persist::Async_result_ptr load_async(const boost::filesystem::path& path);

private:
  // Types.

  /// Short-hand for shared-mode lock of #m_mutex.
  using Lock_sh = util::Lock_guard_shared_non_recursive_sh;

  /// Short-hand for exclusive-mode lock of #m_mutex.
  using Lock_ex = util::Lock_guard_shared_non_recursive_ex;

  // Methods.

  /**
   * Encodes the map into `*image` (appending) under the shared lock.
   *
   * @param image
   *        Target.
   * @return Number of entries encoded.
   */
  size_t encode_image(std::string* image) const;

  /**
   * Decodes `image` into `*entries` (assumed empty) and `*header`; no lock needed.
   *
   * @param image
   *        Uncompressed image.
   * @param entries
   *        Target.
   * @param header
   *        Target.
   * @param err_code
   *        Set on error.  Not null.
   * @return `false` on error.
   */
  bool decode_image(util::String_view image, Entries* entries, persist::Image_header* header,
                    Error_code* err_code) const;

  /**
   * Returns the bucket count to request of a new #Entries.
   *
   * @return See above.
   */
  size_t n_buckets() const;

  // Data.

  /// Options from ctor.
  const Map_options m_opts;

  /// The entries in order, with lookup by key.  Protected by #m_mutex.
  Entries m_entries;

  /// Sum of `m_size` over #m_entries.  Protected by #m_mutex.
  int64_t m_total;

  /// Size limit in bytes; 0 if unbounded.  Set from #m_opts; replaced by load().  Protected by #m_mutex.
  int64_t m_limit;

  /// The lock guarding the whole map.
  mutable util::Mutex_shared_non_recursive m_mutex;

  /**
   * Performs file I/O and compression, and runs the `*_async()` work.  Declared last, so that its destruction,
   * which waits for pending background work, happens before that of anything such work touches.
   */
  mutable persist::Coordinator m_persist;
}; // class Ordered_map

// Template implementations.

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::Ordered_map(log::Logger* logger_ptr, const Map_options& opts) :
  log::Log_context(logger_ptr, Kmap_log_component::S_MAP),
  m_opts(opts),
  m_entries(n_buckets()),
  m_total(0),
  m_limit(m_opts.limit_bytes()),
  m_persist(logger_ptr, "kmap_persist")
{
  KMAP_LOG_INFO("Ordered_map [" << this << "]: Created with limit [" << m_limit << "] bytes "
                "(0 = unbounded).  Options:\n" << m_opts);
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::~Ordered_map()
{
  KMAP_LOG_INFO("Ordered_map [" << this << "]: Destroying; [" << m_entries.size() << "] entries remain.");
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
std::optional<typename Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::Value>
  Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::get(const Key& key) const
{
  Lock_sh lock(m_mutex);
  const auto it = m_entries.find(key);
  if (it == m_entries.end())
  {
    return std::nullopt;
  }
  // else
  return it->second.m_value;
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::Value
  Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::get_or_default(const Key& key, const Value& dflt) const
{
  auto val = get(key);
  return val ? std::move(*val) : dflt;
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
std::optional<typename Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::Value>
  Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::get_any(std::initializer_list<Key> keys) const
{
  Lock_sh lock(m_mutex);
  for (const auto& key : keys)
  {
    const auto it = m_entries.find(key);
    if (it != m_entries.end())
    {
      return it->second.m_value;
    }
  }
  return std::nullopt;
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
bool Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::contains(const Key& key) const
{
  Lock_sh lock(m_mutex);
  return m_entries.count(key) != 0;
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
void Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::set(const Key& key, const Value& val, Error_code* err_code)
{
  if (kmap::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { set(key, val, actual_err_code); },
         err_code, "map::Ordered_map::set()"))
  {
    return;
  }
  // else

  // Computed for every write, bounded or not, so that m_total is always the sum of the sizes.
  const int64_t size = approx_size(val);

  Lock_ex lock(m_mutex);

  if ((m_limit > 0) && (size > m_limit))
  {
    KMAP_LOG_WARNING("Ordered_map [" << this << "]: Value of size [" << size << "] alone exceeds the limit "
                     "[" << m_limit << "]; not stored.");
    KMAP_ERROR_EMIT_ERROR(error::Code::S_SIZE_EXCEEDED);
    return;
  }
  // else

  const auto it = m_entries.find(key);
  const bool existed = it != m_entries.end();
  const int64_t old_size = existed ? it->second.m_size : 0;

  if ((m_limit > 0) && ((m_total - old_size + size) > m_limit))
  {
    KMAP_LOG_INFO("Ordered_map [" << this << "]: Writing value of size [" << size << "] would bring the total "
                  "from [" << m_total << "] to [" << (m_total - old_size + size) << "], above the limit "
                  "[" << m_limit << "]; evicting all [" << m_entries.size() << "] entries first.");
    m_entries.clear();
    m_entries.insert(key, Entry{val, size});
    m_total = size;
  }
  else if (existed)
  {
    it->second = Entry{val, size};
    m_total += size - old_size;
  }
  else
  {
    m_entries.insert(key, Entry{val, size});
    m_total += size;
  }

  KMAP_LOG_TRACE("Ordered_map [" << this << "]: Stored value of size [" << size << "] "
                 "(replacing: [" << existed << "]); now [" << m_entries.size() << "] entries, total "
                 "[" << m_total << "].");
  err_code->clear();
} // Ordered_map::set()

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
bool Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::erase(const Key& key)
{
  Lock_ex lock(m_mutex);

  const auto it = m_entries.find(key);
  if (it == m_entries.end())
  {
    return false;
  }
  // else

  m_total -= it->second.m_size;
  m_entries.erase(it);
  return true;
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
void Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::clear()
{
  Lock_ex lock(m_mutex);

  KMAP_LOG_TRACE("Ordered_map [" << this << "]: Clearing [" << m_entries.size() << "] entries.");
  m_entries.clear();
  m_total = 0;
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
void Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::flush()
{
  clear();
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
size_t Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::len() const
{
  Lock_sh lock(m_mutex);
  return m_entries.size();
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
int64_t Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::limit_bytes() const
{
  Lock_sh lock(m_mutex);
  return m_limit;
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
int64_t Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::total_size() const
{
  Lock_sh lock(m_mutex);
  return m_total;
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::Handle Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::front() const
{
  Lock_sh lock(m_mutex);
  return m_entries.front();
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::Handle Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::back() const
{
  Lock_sh lock(m_mutex);
  return m_entries.back();
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::Handle
  Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::handle_of(const Key& key) const
{
  Lock_sh lock(m_mutex);
  return m_entries.lookup(key);
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::Handle
  Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::next(Handle handle) const
{
  Lock_sh lock(m_mutex);
  return m_entries.valid(handle) ? m_entries.next(handle) : Handle();
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::Handle
  Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::prev(Handle handle) const
{
  Lock_sh lock(m_mutex);
  return m_entries.valid(handle) ? m_entries.prev(handle) : Handle();
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::Key_value
  Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::entry(Handle handle, Error_code* err_code) const
{
  KMAP_ERROR_EXEC_AND_THROW_ON_ERROR(Key_value, entry, handle, _1);
  // If got here, err_code is non-null.

  Lock_sh lock(m_mutex);

  if (!m_entries.valid(handle))
  {
    KMAP_ERROR_EMIT_ERROR(error::Code::S_INVALID_HANDLE);
    return Key_value();
  }
  // else

  const auto& key_and_entry = m_entries.value(handle);
  err_code->clear();
  return Key_value(key_and_entry.first, key_and_entry.second.m_value);
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
void Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::range(const Visitor& visitor) const
{
  Lock_sh lock(m_mutex);
  for (const auto& key_and_entry : m_entries)
  {
    if (!visitor(key_and_entry.first, key_and_entry.second.m_value))
    {
      break;
    }
  }
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
std::vector<typename Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::Key>
  Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::keys() const
{
  std::vector<Key> result;

  Lock_sh lock(m_mutex);
  result.reserve(m_entries.size());
  for (const auto& key_and_entry : m_entries)
  {
    result.push_back(key_and_entry.first);
  }
  return result;
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
std::vector<typename Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::Value>
  Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::values() const
{
  std::vector<Value> result;

  Lock_sh lock(m_mutex);
  result.reserve(m_entries.size());
  for (const auto& key_and_entry : m_entries)
  {
    result.push_back(key_and_entry.second.m_value);
  }
  return result;
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
std::vector<typename Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::Key_value>
  Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::entries() const
{
  std::vector<Key_value> result;

  Lock_sh lock(m_mutex);
  result.reserve(m_entries.size());
  for (const auto& key_and_entry : m_entries)
  {
    result.emplace_back(key_and_entry.first, key_and_entry.second.m_value);
  }
  return result;
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
std::unique_ptr<Ordered_map<Key_t, Value_t, Hash_t, Pred_t>> Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::copy() const
{
  // The new map is not yet visible to any other thread; only *this needs locking.
  auto result = std::make_unique<Ordered_map>(get_logger(), m_opts);

  Lock_sh lock(m_mutex);
  result->m_entries = m_entries;
  result->m_total = m_total;
  result->m_limit = m_limit;

  KMAP_LOG_TRACE("Ordered_map [" << this << "]: Copied [" << m_entries.size() << "] entries "
                 "into Ordered_map [" << result.get() << "].");
  return result;
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
void Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::save(const boost::filesystem::path& path,
                                                      const persist::Save_options& opts,
                                                      Error_code* err_code) const
{
  using boost::chrono::duration_cast;
  using boost::chrono::microseconds;

  if (kmap::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { save(path, opts, actual_err_code); },
         err_code, "map::Ordered_map::save()"))
  {
    return;
  }
  // else

  const auto start_time = Fine_clock::now();

  std::string image;
  const size_t n_entries = encode_image(&image);

  m_persist.write_image(path, image, opts, err_code);
  if (*err_code)
  {
    return;
  }
  // else

  KMAP_LOG_INFO("Ordered_map [" << this << "]: Saved [" << n_entries << "] entries ([" << image.size() << "] "
                "bytes before compression) to [" << path << "] in "
                "[" << duration_cast<microseconds>(Fine_clock::now() - start_time).count() << "] us.  "
                "Options:\n" << opts);
} // Ordered_map::save()

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
void Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::load(const boost::filesystem::path& path, Error_code* err_code)
{
  using boost::chrono::duration_cast;
  using boost::chrono::microseconds;

  if (kmap::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { load(path, actual_err_code); },
         err_code, "map::Ordered_map::load()"))
  {
    return;
  }
  // else

  const auto start_time = Fine_clock::now();

  std::string image;
  m_persist.read_image(path, &image, err_code);
  if (*err_code)
  {
    return;
  }
  // else

  Entries entries(n_buckets());
  persist::Image_header header;
  if (!decode_image(image, &entries, &header, err_code))
  {
    KMAP_LOG_WARNING("Ordered_map [" << this << "]: Image at [" << path << "] is malformed; "
                     "the map is unchanged.");
    return;
  }
  // else

  {
    Lock_ex lock(m_mutex);
    // Handles into the old entries must not match the new ones.
    entries.supersede(m_entries);
    m_entries.swap(entries);
    m_total = header.m_total_size;
    m_limit = (header.m_limit <= 0) ? 0 : header.m_limit;
  }
  // The old entries are destroyed here, outside the lock.

  KMAP_LOG_INFO("Ordered_map [" << this << "]: Loaded " << header << " from [" << path << "] in "
                "[" << duration_cast<microseconds>(Fine_clock::now() - start_time).count() << "] us.");
  err_code->clear();
} // Ordered_map::load()

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
persist::Async_result_ptr
  Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::save_async(const boost::filesystem::path& path,
                                                         const persist::Save_options& opts) const
{
  KMAP_LOG_TRACE("Ordered_map [" << this << "]: Scheduling save to [" << path << "].");
  return m_persist.post([this, path, opts](Error_code* err_code) { save(path, opts, err_code); });
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
persist::Async_result_ptr Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::load_async(const boost::filesystem::path& path)
{
  KMAP_LOG_TRACE("Ordered_map [" << this << "]: Scheduling load from [" << path << "].");
  return m_persist.post([this, path](Error_code* err_code) { load(path, err_code); });
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
size_t Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::encode_image(std::string* image) const
{
  persist::Encoder encoder(get_logger(), image);

  Lock_sh lock(m_mutex);

  persist::encode_image_header(&encoder, { m_total, m_limit, static_cast<int64_t>(m_entries.size()) });
  for (const auto& key_and_entry : m_entries)
  {
    encoder.write(key_and_entry.first);
    encoder.write(key_and_entry.second.m_value);
    encoder.write_int(key_and_entry.second.m_size);
    KMAP_LOG_DATA("Ordered_map [" << this << "]: Encoded entry of size [" << key_and_entry.second.m_size << "]; "
                  "image now [" << encoder.size() << "] bytes.");
  }
  return m_entries.size();
}

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
bool Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::decode_image(util::String_view image, Entries* entries,
                                                              persist::Image_header* header,
                                                              Error_code* err_code) const
{
  persist::Decoder decoder(get_logger(), image);
  if (!persist::decode_image_header(&decoder, header, err_code))
  {
    return false;
  }
  // else

  KMAP_LOG_TRACE("Ordered_map [" << this << "]: Decoding " << *header << ".");

  int64_t total = 0;
  for (int64_t idx = 0; idx != header->m_count; ++idx)
  {
    Key key;
    Value val;
    int64_t size;
    if (!(decoder.read(&key, err_code) && decoder.read(&val, err_code) && decoder.read_int(&size, err_code)))
    {
      return false;
    }
    // else

    if (size < 0)
    {
      KMAP_LOG_WARNING("Entry [" << idx << "] has negative size [" << size << "].");
      return decoder.emit_error(persist::error::Code::S_SIZE_MISMATCH, err_code);
    }
    // else
    if (size > (std::numeric_limits<int64_t>::max() - total))
    {
      KMAP_LOG_WARNING("Entry [" << idx << "] of size [" << size << "] overflows the running total "
                       "[" << total << "].");
      return decoder.emit_error(persist::error::Code::S_SIZE_MISMATCH, err_code);
    }
    // else
    if (!entries->insert(std::move(key), Entry{std::move(val), size}).second)
    {
      KMAP_LOG_WARNING("Entry [" << idx << "] repeats the key of an earlier entry.");
      return decoder.emit_error(persist::error::Code::S_DUPLICATE_KEY, err_code);
    }
    // else

    total += size;
    KMAP_LOG_DATA("Ordered_map [" << this << "]: Decoded entry [" << idx << "] of size [" << size << "].");
  }

  if (!decoder.expect_end(err_code))
  {
    return false;
  }
  // else
  if (total != header->m_total_size)
  {
    KMAP_LOG_WARNING("Entry sizes add up to [" << total << "], but the header says [" << header->m_total_size << "].");
    return decoder.emit_error(persist::error::Code::S_SIZE_MISMATCH, err_code);
  }
  // else
  return true;
} // Ordered_map::decode_image()

template<typename Key_t, typename Value_t, typename Hash_t, typename Pred_t>
size_t Ordered_map<Key_t, Value_t, Hash_t, Pred_t>::n_buckets() const
{
  return (m_opts.m_n_buckets_hint == 0) ? size_t(-1) : m_opts.m_n_buckets_hint;
}

} // namespace kmap::map
