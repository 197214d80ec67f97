/* zcarc: Zero-Copy Archive
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
#pragma once

#include "zcarc/zcarc_fwd.hpp"
#include <memory>

namespace zcarc
{

// Types.

/**
 * State carried through the materialization of native values from a (validated) archive: a pool mapping each
 * archived shared pointee (by address) to the `shared_ptr` already materialized for it.  Thus two Archived_rc pointing
 * to one archived value become two `shared_ptr`s to one native object, restoring the sharing that ser::Unify
 * preserved in the archive.
 *
 * One Deserializer per archive; it holds the pool's `shared_ptr`s (hence keeps their objects alive) until destroyed.
 */
class Deserializer
{
public:
  // Constructors/destructor.

  /// Constructs empty pool.
  Deserializer();

  /// Disallow copying.
  Deserializer(const Deserializer&) = delete;

  // Methods.

  /// Disallow copying.
  Deserializer& operator=(const Deserializer&) = delete;

  /**
   * Returns the `shared_ptr` materialized for the archived value at `archived_address`, creating it via
   * `make_func()` if this is the first request for that address.
   *
   * @tparam T
   *         Native pointee type.
   * @tparam Make_func
   *         Function object with signature `std::shared_ptr<T> ()`.
   * @param archived_address
   *        Address of the archived pointee.
   * @param make_func
   *        See above.
   * @return See above.
   */
  template<typename T, typename Make_func>
  std::shared_ptr<T> deserialize_shared(const void* archived_address, const Make_func& make_func);

  /**
   * Number of shared pointees materialized so far.
   * @return See above.
   */
  size_t size() const;

private:
  // Data.

  /// Archived pointee address => materialized native object.
  boost::unordered_map<const void*, std::shared_ptr<void>> m_pool;
}; // class Deserializer

// Template implementations.

template<typename T, typename Make_func>
std::shared_ptr<T> Deserializer::deserialize_shared(const void* archived_address, const Make_func& make_func)
{
  using std::shared_ptr;
  using std::static_pointer_cast;

  const auto it = m_pool.find(archived_address);
  if (it != m_pool.end())
  {
    return static_pointer_cast<T>(it->second);
  }
  // else

  shared_ptr<T> result = make_func();
  m_pool.emplace(archived_address, result);
  return result;
}

} // namespace zcarc
