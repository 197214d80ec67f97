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
#include <optional>

namespace zcarc::ser
{

// Types.

/**
 * Sharing (see concept in ser/concepts.hpp) that archives each shared value once: the second and later shared
 * pointers to the same native address resolve to the first archived copy.  This preserves the sharing structure
 * (e.g., two `shared_ptr`s to one object become, after from_bytes(), two `shared_ptr`s to one object) and saves space.
 */
class Unify :
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs empty registry.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   */
  explicit Unify(flow::log::Logger* logger_ptr = 0);

  /// Disallow copying.
  Unify(const Unify&) = delete;

  /// Implements move semantics.
  Unify(Unify&&);

  // Methods.

  /// Disallow copying.
  Unify& operator=(const Unify&) = delete;

  /**
   * Implements move semantics.
   * @return `*this`.
   */
  Unify& operator=(Unify&&);

  /**
   * Implements Sharing API.
   *
   * @param address
   *        See Sharing concept.
   * @return See Sharing concept.
   */
  std::optional<size_t> get_shared_ptr(const void* address) const;

  /**
   * Implements Sharing API.  Recording an address already recorded (which the serialize_shared() protocol never does)
   * keeps the first position.
   *
   * @param address
   *        See Sharing concept.
   * @param pos
   *        See Sharing concept.
   * @param err_code
   *        See Sharing concept.  Cannot fail other than by `std::bad_alloc`.
   */
  void add_shared_ptr(const void* address, size_t pos, Error_code* err_code);

  /**
   * Number of distinct addresses recorded.
   * @return See above.
   */
  size_t size() const;

  /// Forgets everything recorded, e.g. before reusing the serializer for another archive.
  void clear();

private:
  // Data.

  /// Native address => position of archived copy.
  boost::unordered_map<const void*, size_t> m_shared_positions;
}; // class Unify

/**
 * Sharing (see concept in ser/concepts.hpp) that records nothing: each shared pointer archives its own copy of the
 * value.  Needs no memory at all, so it is what Core_serializer uses.
 */
class Duplicate
{
public:
  // Methods.

  /**
   * Implements Sharing API: always empty.
   * @return `std::nullopt`.
   */
  std::optional<size_t> get_shared_ptr(const void*) const;

  /**
   * Implements Sharing API: no-op.
   *
   * @param err_code
   *        Untouched.
   */
  void add_shared_ptr(const void*, size_t, Error_code* err_code);
}; // class Duplicate

// Free functions.

/**
 * Implements the shared-pointer serialization protocol on top of any Sharing: if the value at `address` was already
 * archived, returns that position; otherwise invokes `serialize_func()` to archive it now and records the resulting
 * position.
 *
 * @tparam Sharing_t
 *         Models Sharing concept.
 * @tparam Serialize_func
 *         Function object with signature `size_t (Error_code*)` returning position of the archived value.
 * @param sharing
 *        Registry.
 * @param address
 *        Native address of the shared value.
 * @param serialize_func
 *        See above.
 * @param err_code
 *        Must not be null.
 * @return Position of the archived value.  Meaningless on error.
 */
template<typename Sharing_t, typename Serialize_func>
size_t serialize_shared(Sharing_t* sharing, const void* address, const Serialize_func& serialize_func,
                        Error_code* err_code);

/**
 * Prints string representation of the given Unify to the given `ostream`.
 *
 * @relatesalso Unify
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Unify& val);

// Template implementations.

template<typename Sharing_t, typename Serialize_func>
size_t serialize_shared(Sharing_t* sharing, const void* address, const Serialize_func& serialize_func,
                        Error_code* err_code)
{
  assert(err_code);

  const auto existing_pos = sharing->get_shared_ptr(address);
  if (existing_pos)
  {
    return *existing_pos;
  }
  // else

  const size_t pos = serialize_func(err_code);
  if (*err_code)
  {
    return 0;
  }
  // else

  sharing->add_shared_ptr(address, pos, err_code);
  return pos;
}

} // namespace zcarc::ser
