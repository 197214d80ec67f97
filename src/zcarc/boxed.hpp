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

#include "zcarc/rel_ptr.hpp"
#include "zcarc/ser/serialize.hpp"
#include "zcarc/validation/archive_context.hpp"
#include <boost/range/iterator_range_io.hpp>
#include <type_traits>
#include <ostream>

namespace zcarc
{

// Types.

/// Resolver of Archived_box: position of the already-archived pointee.
struct Box_resolver
{
  // Data.

  /// Position (from start of archive) of the pointee.
  size_t m_pos;
}; // struct Box_resolver

/**
 * Archived counterpart of an owning pointer: one Rel_ptr to a pointee archived earlier in the same buffer, which is
 * considered owned by the box (reachable only through it).  Same size and alignment as the Rel_ptr.  The archived
 * forms of `std::string` and `std::vector` are built on it, but it is equally usable directly inside a user's archived
 * record, to hold any archivable value out of line.
 *
 * Pointee `T` is an archived type: sized (e.g. `Archived<uint32_t>`, a user's archived record), or a slice `E[]`, in
 * which case the element count is stored too and get() yields a range.
 *
 * ### Writing ###
 * serialize_from_ref() archives the native pointee (via the serializer) and yields a Box_resolver; the enclosing
 * record's resolve step then calls resolve_from_ref() (or resolve_from_raw_parts()) with the box's Place.
 *
 * ### Reading ###
 * get() and get_pin_mut() are unchecked (see Rel_ptr::as_ptr()); check_bytes() is the validation that makes them safe
 * on an untrusted buffer: it bounds-checks the pointee against the active subtree range, claims it, validates it
 * recursively, and releases the claim.
 *
 * Like Rel_ptr it is neither copyable nor movable.
 *
 * @tparam T
 *         Archived pointee type, sized or `E[]`.
 */
template<typename T>
class Archived_box
{
public:
  // Types.

  /// Pointee description.
  using Traits = Pointee_traits<T>;

  /// No_metadata for a sized pointee; element count for a slice.
  using Metadata = typename Traits::Metadata;

  // Constructors/destructor.

  /// Constructs a box pointing to itself; only meaningful as the staging state before resolve.
  Archived_box();

  /// Disallow copy construction.
  Archived_box(const Archived_box&) = delete;

  // Methods.

  /// Disallow copy assignment.
  Archived_box& operator=(const Archived_box&) = delete;

  /**
   * The pointee: `const T&`, or for a slice an iterator range of its elements.
   * @return See above.
   */
  typename Traits::Const_ref get() const;

  /**
   * The pointee, pinned: to obtain this on a Pinned box, use `pinned_box->get_pin_mut()`.
   * @return See above.
   */
  typename Traits::Pinned_ref get_pin_mut();

  /**
   * The underlying relative pointer.
   * @return See above.
   */
  const Rel_ptr<T>& rel_ptr() const;

  /**
   * Archives the native pointee `value` (out of line) and returns the resolver for this box.  For a sized `T`
   * the native type `U` must satisfy `Archived<U> == T`; for a slice `T`, `U` must have an Archive_unsized_traits
   * specialization archiving it as `T`.
   *
   * @tparam U
   *         Native pointee type.
   * @tparam Serializer
   *         See serialize_using().
   * @param value
   *        Native pointee.
   * @param serializer
   *        Serializer.
   * @param err_code
   *        Must not be null.
   * @return See above.  Meaningless on error.
   */
  template<typename U, typename Serializer>
  static Box_resolver serialize_from_ref(const U& value, Serializer* serializer, Error_code* err_code);

  /**
   * Resolves the box at `out` to point to the pointee archived by serialize_from_ref().
   *
   * @tparam U
   *         Native pointee type; the metadata (if any) is computed from `value`.
   * @param value
   *        Native pointee, same as passed to serialize_from_ref().
   * @param resolver
   *        What serialize_from_ref() returned.
   * @param out
   *        Place of the box.
   * @param err_code
   *        Must not be null.  error::Code::S_SER_OFFSET_OUT_OF_RANGE.
   */
  template<typename U>
  static void resolve_from_ref(const U& value, const Box_resolver& resolver, Place<Archived_box> out,
                               Error_code* err_code);

  /**
   * Resolves the box at `out` to point to the pointee at `resolver.m_pos` with the given metadata.
   *
   * @param resolver
   *        Pointee position.
   * @param metadata
   *        Pointee metadata.
   * @param out
   *        Place of the box.
   * @param err_code
   *        Must not be null.  error::Code::S_SER_OFFSET_OUT_OF_RANGE.
   */
  static void resolve_from_raw_parts(const Box_resolver& resolver, Metadata metadata, Place<Archived_box> out,
                                     Error_code* err_code);

  /**
   * Validates the box at `value` and, recursively, its pointee.  See class doc header.
   *
   * @tparam Context
   *         Validation context type (see Check_bytes).
   * @param value
   *        Unvalidated box (its own bytes already bounds-checked).
   * @param context
   *        Validation context.
   * @param err_code
   *        Must not be null.
   */
  template<typename Context>
  static void check_bytes(const Archived_box* value, Context* context, Error_code* err_code);

private:
  // Data.

  /// The pointer.
  Rel_ptr<T> m_ptr;
}; // class Archived_box

// Free functions.

/**
 * Returns `true` if and only if the pointees are equal (for slices: same length, equal elements).
 *
 * @relatesalso Archived_box
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
template<typename T>
bool operator==(const Archived_box<T>& val1, const Archived_box<T>& val2);

/**
 * Returns `!(val1 == val2)`.
 *
 * @relatesalso Archived_box
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
template<typename T>
bool operator!=(const Archived_box<T>& val1, const Archived_box<T>& val2);

/**
 * Orders boxes by pointee (for slices: lexicographically).
 *
 * @relatesalso Archived_box
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
template<typename T>
bool operator<(const Archived_box<T>& val1, const Archived_box<T>& val2);

/**
 * Prints the pointee to the given `ostream`.
 *
 * @relatesalso Archived_box
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename T>
std::ostream& operator<<(std::ostream& os, const Archived_box<T>& val);

// Template implementations.

template<typename T>
Archived_box<T>::Archived_box() = default;

template<typename T>
typename Archived_box<T>::Traits::Const_ref Archived_box<T>::get() const
{
  return Traits::make_ref(m_ptr.as_ptr(), m_ptr.metadata());
}

template<typename T>
typename Archived_box<T>::Traits::Pinned_ref Archived_box<T>::get_pin_mut()
{
  return Traits::make_pinned(m_ptr.as_mut_ptr(), m_ptr.metadata());
}

template<typename T>
const Rel_ptr<T>& Archived_box<T>::rel_ptr() const
{
  return m_ptr;
}

template<typename T>
template<typename U, typename Serializer>
Box_resolver Archived_box<T>::serialize_from_ref(const U& value, Serializer* serializer,
                                                 Error_code* err_code) // Static.
{
  assert(err_code);

  size_t pos;
  if constexpr(std::is_array_v<T>)
  {
    pos = Archive_unsized_traits<U>::serialize_unsized(value, serializer, err_code);
  }
  else
  {
    static_assert(std::is_same_v<Archived<U>, T>, "Boxed native type must archive as the box's pointee type.");
    pos = ser::serialize_using(value, serializer, err_code);
  }
  return Box_resolver{ pos };
}

template<typename T>
template<typename U>
void Archived_box<T>::resolve_from_ref(const U& value, const Box_resolver& resolver, Place<Archived_box> out,
                                       Error_code* err_code) // Static.
{
  if constexpr(std::is_array_v<T>)
  {
    resolve_from_raw_parts(resolver, Archive_unsized_traits<U>::archived_metadata(value), out, err_code);
  }
  else
  {
    resolve_from_raw_parts(resolver, Metadata(), out, err_code);
  }
}

template<typename T>
void Archived_box<T>::resolve_from_raw_parts(const Box_resolver& resolver, Metadata metadata,
                                             Place<Archived_box> out, Error_code* err_code) // Static.
{
  Rel_ptr<T>::emplace_unsized(resolver.m_pos, metadata, out.field(&Archived_box::m_ptr), err_code);
}

template<typename T>
template<typename Context>
void Archived_box<T>::check_bytes(const Archived_box* value, Context* context, Error_code* err_code) // Static.
{
  assert(err_code);

  const size_t pos = validation::bounds_check_subtree_rel_ptr(context, value->m_ptr, err_code);
  if (*err_code)
  {
    return;
  }
  // else
  validation::check_prefix_subtree<T>(context, pos, value->m_ptr.metadata(), err_code);
}

template<typename T>
bool operator==(const Archived_box<T>& val1, const Archived_box<T>& val2)
{
  return val1.get() == val2.get();
}

template<typename T>
bool operator!=(const Archived_box<T>& val1, const Archived_box<T>& val2)
{
  return !(val1 == val2);
}

template<typename T>
bool operator<(const Archived_box<T>& val1, const Archived_box<T>& val2)
{
  return val1.get() < val2.get();
}

template<typename T>
std::ostream& operator<<(std::ostream& os, const Archived_box<T>& val)
{
  return os << val.get();
}

} // namespace zcarc
