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
#include "zcarc/layout.hpp"
#include "zcarc/place.hpp"
#include "zcarc/pinned.hpp"
#include "zcarc/primitives.hpp"
#include <boost/range/iterator_range.hpp>

namespace zcarc
{

// Types.

/// Metadata of a sized pointee: there is none.
struct No_metadata
{
};

/**
 * Describes what a Rel_ptr can point to, so that Rel_ptr, Archived_box, and the validation helpers can treat sized
 * pointees (one `T`) and unsized pointees (a slice `E[]`) uniformly.  This is the sized version.
 *
 * Each specialization provides:
 *   - `Element`: type of the object(s) at the pointed-to address.
 *   - `Metadata`: what, besides the address, is needed to describe the pointee (No_metadata or an element count).
 *   - `Const_ref`: what a read-only access yields.
 *   - `Pinned_ref`: what a mutable access yields.
 *   - `layout(metadata, err_code)`: size and alignment of the pointee.
 *   - `make_ref(data, metadata)`, `make_pinned(data, metadata)`.
 *
 * @tparam T
 *         Sized archived type.
 */
template<typename T>
struct Pointee_traits
{
  // Types.

  /// See class doc header.
  using Element = T;
  /// See class doc header.
  using Metadata = No_metadata;
  /// See class doc header.
  using Const_ref = const T&;
  /// See class doc header.
  using Pinned_ref = Pinned<T>;

  // Methods.

  /**
   * Layout of `T`.  Cannot fail.
   * @return See above.
   */
  static Layout layout(No_metadata, Error_code*)
  {
    return Layout::of<T>();
  }

  /**
   * Reference to the value at `data`.
   *
   * @param data
   *        Address.
   * @return See above.
   */
  static Const_ref make_ref(const T* data, No_metadata)
  {
    return *data;
  }

  /**
   * Pinned reference to the value at `data`.
   *
   * @param data
   *        Address.
   * @return See above.
   */
  static Pinned_ref make_pinned(T* data, No_metadata)
  {
    return Pinned<T>(data);
  }
}; // struct Pointee_traits

/**
 * Pointee_traits for an archived slice of `E`.
 *
 * @tparam E
 *         Sized archived element type.
 */
template<typename E>
struct Pointee_traits<E[]>
{
  // Types.

  /// See Pointee_traits doc header.
  using Element = E;
  /// Element count.
  using Metadata = size_t;
  /// See Pointee_traits doc header.
  using Const_ref = boost::iterator_range<const E*>;
  /// See Pointee_traits doc header.
  using Pinned_ref = Pinned<E[]>;

  // Methods.

  /**
   * Layout of `n_elems` elements.
   *
   * @param n_elems
   *        Element count (possibly read from an untrusted buffer).
   * @param err_code
   *        Must not be null.  error::Code::S_LAYOUT_OVERFLOW possible.
   * @return See above.
   */
  static Layout layout(size_t n_elems, Error_code* err_code)
  {
    return Layout::array(Layout::of<E>(), n_elems, err_code);
  }

  /**
   * Range of elements at `data`.
   *
   * @param data
   *        Address of first element.
   * @param n_elems
   *        Element count.
   * @return See above.
   */
  static Const_ref make_ref(const E* data, size_t n_elems)
  {
    return boost::make_iterator_range(data, data + n_elems);
  }

  /**
   * Pinned slice at `data`.
   *
   * @param data
   *        Address of first element.
   * @param n_elems
   *        Element count.
   * @return See above.
   */
  static Pinned_ref make_pinned(E* data, size_t n_elems)
  {
    return Pinned<E[]>(data, n_elems);
  }
}; // struct Pointee_traits<E[]>

/**
 * Relative pointer: a 32-bit signed little-endian byte displacement from the pointer's own address to its pointee.
 * Because it encodes no absolute address, an archive containing it can be placed anywhere in memory (copied into
 * a socket buffer, mapped from a file, etc.) and still be read in place.
 *
 * This is the sized-pointee version: 4 bytes, 4-aligned.  `Rel_ptr<E[]>` (slice pointee) adds a 32-bit element
 * count.
 *
 * ### Writing ###
 * A Rel_ptr is never constructed "pointing somewhere."  Its final position is fixed when the enclosing archived value
 * is resolved (see Place), and emplace() computes the offset from that and the (earlier-written) pointee's position.
 * Only positions are involved, never memory addresses.  If the distance does not fit in 32 signed bits,
 * error::Code::S_SER_OFFSET_OUT_OF_RANGE results.
 *
 * ### Reading ###
 * as_ptr() computes `base() + offset()`.  It does no checking whatsoever, so it is only meaningful in a buffer that
 * was validated (or produced locally).  It is the one place where zcarc does unchecked address arithmetic on archived
 * data; validation bounds-checks the same computation in position space first (see
 * validation::bounds_check_subtree_rel_ptr()).
 *
 * ### Pinning ###
 * Copying a Rel_ptr to a different address would silently change what it points to; so it is neither copyable nor
 * movable, and neither is any archived type containing one.  See Pinned.
 *
 * @tparam T
 *         Sized archived pointee type.
 */
template<typename T>
class Rel_ptr
{
public:
  // Types.

  /// Short-hand for template parameter.
  using Pointee = T;

  /// Pointee description.
  using Traits = Pointee_traits<T>;

  /// No_metadata for this version.
  using Metadata = typename Traits::Metadata;

  /// Same as #Pointee for this version.
  using Element = typename Traits::Element;

  // Constructors/destructor.

  /**
   * Constructs a pointer to itself (offset 0).  Only meaningful as the initial state of staging storage before
   * emplace().
   */
  Rel_ptr();

  /// Disallow copy construction (see class doc header).
  Rel_ptr(const Rel_ptr&) = delete;

  // Methods.

  /// Disallow copy assignment (see class doc header).
  Rel_ptr& operator=(const Rel_ptr&) = delete;

  /**
   * Writes into `out` a pointer to the value at position `to_pos`.
   *
   * @param to_pos
   *        Position (from start of archive) of the pointee.
   * @param out
   *        Place of the pointer itself.
   * @param err_code
   *        Must not be null.  error::Code::S_SER_OFFSET_OUT_OF_RANGE possible.
   */
  static void emplace(size_t to_pos, Place<Rel_ptr> out, Error_code* err_code);

  /**
   * Identical to emplace(), for uniformity with `Rel_ptr<E[]>`.
   *
   * @param to_pos
   *        See emplace().
   * @param metadata
   *        Ignored.
   * @param out
   *        See emplace().
   * @param err_code
   *        See emplace().
   */
  static void emplace_unsized(size_t to_pos, Metadata metadata, Place<Rel_ptr> out, Error_code* err_code);

  /**
   * Address of the pointer itself, from which offset() is measured.
   * @return See above.
   */
  const uint8_t* base() const;

  /**
   * Address of the pointer itself, from which offset() is measured.
   * @return See above.
   */
  uint8_t* base();

  /**
   * Byte displacement of the pointee from base().
   * @return See above.
   */
  int32_t offset() const;

  /**
   * Pointee metadata.
   * @return See above.
   */
  Metadata metadata() const;

  /**
   * `base() + offset()`, unchecked.  See class doc header.
   * @return See above.
   */
  const T* as_ptr() const;

  /**
   * `base() + offset()`, unchecked.  See class doc header.
   * @return See above.
   */
  T* as_mut_ptr();

private:
  // Data.

  /// See offset().
  Archived_i32 m_offset;
}; // class Rel_ptr

/**
 * Relative pointer to a slice of `E`: offset as in the sized version, followed by the 32-bit little-endian element
 * count.  8 bytes, 4-aligned.  See Rel_ptr doc header.
 *
 * @tparam E
 *         Sized archived element type.
 */
template<typename E>
class Rel_ptr<E[]>
{
public:
  // Types.

  /// Short-hand for template parameter.
  using Pointee = E[];

  /// Pointee description.
  using Traits = Pointee_traits<E[]>;

  /// Element count.
  using Metadata = typename Traits::Metadata;

  /// Short-hand for template parameter.
  using Element = E;

  // Constructors/destructor.

  /// Constructs an empty slice at offset 0.
  Rel_ptr();

  /// Disallow copy construction.
  Rel_ptr(const Rel_ptr&) = delete;

  // Methods.

  /// Disallow copy assignment.
  Rel_ptr& operator=(const Rel_ptr&) = delete;

  /**
   * Writes into `out` a pointer to the `n_elems` elements starting at position `to_pos`.
   *
   * @param to_pos
   *        Position (from start of archive) of the first element.
   * @param n_elems
   *        Element count.
   * @param out
   *        Place of the pointer itself.
   * @param err_code
   *        Must not be null.  error::Code::S_SER_OFFSET_OUT_OF_RANGE possible, if either the offset or the count
   *        does not fit in 32 bits.
   */
  static void emplace_unsized(size_t to_pos, size_t n_elems, Place<Rel_ptr> out, Error_code* err_code);

  /**
   * See `Rel_ptr<T>::base()`.
   * @return See above.
   */
  const uint8_t* base() const;

  /**
   * See `Rel_ptr<T>::base()`.
   * @return See above.
   */
  uint8_t* base();

  /**
   * See `Rel_ptr<T>::offset()`.
   * @return See above.
   */
  int32_t offset() const;

  /**
   * Element count.
   * @return See above.
   */
  size_t metadata() const;

  /**
   * Address of first element, unchecked.
   * @return See above.
   */
  const E* as_ptr() const;

  /**
   * Address of first element, unchecked.
   * @return See above.
   */
  E* as_mut_ptr();

private:
  // Data.

  /// See offset().
  Archived_i32 m_offset;

  /// See metadata().
  Archived_u32 m_len;
}; // class Rel_ptr<E[]>

namespace detail
{

// Free functions.

/**
 * Computes `to_pos - from_pos` as a 32-bit signed offset.
 *
 * @param from_pos
 *        Position of the pointer.
 * @param to_pos
 *        Position of the pointee.
 * @param err_code
 *        Must not be null.  error::Code::S_SER_OFFSET_OUT_OF_RANGE if not representable.
 * @return The offset; 0 on error.
 */
int32_t rel_offset(size_t from_pos, size_t to_pos, Error_code* err_code);

/**
 * Converts an element count to its 32-bit archived form.
 *
 * @param n_elems
 *        Element count.
 * @param err_code
 *        Must not be null.  error::Code::S_SER_OFFSET_OUT_OF_RANGE if not representable.
 * @return The count; 0 on error.
 */
uint32_t rel_len(size_t n_elems, Error_code* err_code);

} // namespace detail

// Template implementations.

template<typename T>
Rel_ptr<T>::Rel_ptr() :
  m_offset(0)
{
  // That's it.
}

template<typename T>
void Rel_ptr<T>::emplace(size_t to_pos, Place<Rel_ptr> out, Error_code* err_code) // Static.
{
  assert(err_code);
  const auto offset = detail::rel_offset(out.pos(), to_pos, err_code);
  if (*err_code)
  {
    return;
  }
  // else
  out.ptr()->m_offset = offset;
}

template<typename T>
void Rel_ptr<T>::emplace_unsized(size_t to_pos, Metadata, Place<Rel_ptr> out, Error_code* err_code) // Static.
{
  emplace(to_pos, out, err_code);
}

template<typename T>
const uint8_t* Rel_ptr<T>::base() const
{
  return reinterpret_cast<const uint8_t*>(this);
}

template<typename T>
uint8_t* Rel_ptr<T>::base()
{
  return reinterpret_cast<uint8_t*>(this);
}

template<typename T>
int32_t Rel_ptr<T>::offset() const
{
  return m_offset;
}

template<typename T>
typename Rel_ptr<T>::Metadata Rel_ptr<T>::metadata() const
{
  return Metadata();
}

template<typename T>
const T* Rel_ptr<T>::as_ptr() const
{
  return reinterpret_cast<const T*>(base() + offset());
}

template<typename T>
T* Rel_ptr<T>::as_mut_ptr()
{
  return reinterpret_cast<T*>(base() + offset());
}

template<typename E>
Rel_ptr<E[]>::Rel_ptr() :
  m_offset(0),
  m_len(0)
{
  // That's it.
}

template<typename E>
void Rel_ptr<E[]>::emplace_unsized(size_t to_pos, size_t n_elems, Place<Rel_ptr> out,
                                   Error_code* err_code) // Static.
{
  assert(err_code);
  const auto offset = detail::rel_offset(out.pos(), to_pos, err_code);
  if (*err_code)
  {
    return;
  }
  // else
  const auto len = detail::rel_len(n_elems, err_code);
  if (*err_code)
  {
    return;
  }
  // else
  out.ptr()->m_offset = offset;
  out.ptr()->m_len = len;
}

template<typename E>
const uint8_t* Rel_ptr<E[]>::base() const
{
  return reinterpret_cast<const uint8_t*>(this);
}

template<typename E>
uint8_t* Rel_ptr<E[]>::base()
{
  return reinterpret_cast<uint8_t*>(this);
}

template<typename E>
int32_t Rel_ptr<E[]>::offset() const
{
  return m_offset;
}

template<typename E>
size_t Rel_ptr<E[]>::metadata() const
{
  return static_cast<size_t>(static_cast<uint32_t>(m_len));
}

template<typename E>
const E* Rel_ptr<E[]>::as_ptr() const
{
  return reinterpret_cast<const E*>(base() + offset());
}

template<typename E>
E* Rel_ptr<E[]>::as_mut_ptr()
{
  return reinterpret_cast<E*>(base() + offset());
}

} // namespace zcarc
