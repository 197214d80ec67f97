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
#include <typeindex>

namespace zcarc
{

// Types.

/// Resolver of Archived_rc: position of the (possibly shared) archived pointee.
struct Rc_resolver
{
  // Data.

  /// Position (from start of archive) of the pointee.
  size_t m_pos;
}; // struct Rc_resolver

/**
 * Archived counterpart of a shared (reference-counted) pointer: one Rel_ptr to a pointee that other Archived_rc may
 * point to as well.  The archived form of `std::shared_ptr`.
 *
 * Differences from Archived_box:
 *   - Serializing goes through the serializer's Sharing (see ser::serialize_shared()): with ser::Unify, the second and
 *     later pointers to one native value reuse its first archived copy; with ser::Duplicate, each archives its own.
 *   - Validation registers the pointee position with the context's Shared_validator API first; only the first pointer
 *     to reach a given position claims and validates the pointee.  A pointer claiming a known position as a
 *     different type is rejected.  The context must therefore provide `register_shared_ptr()`, as
 *     validation::Validator does.
 *
 * Sized pointees only.  Like Rel_ptr it is neither copyable nor movable.
 *
 * @tparam T
 *         Archived pointee type.
 */
template<typename T>
class Archived_rc
{
public:
  // Constructors/destructor.

  /// Constructs pointer to itself; only meaningful as the staging state before resolve.
  Archived_rc();

  /// Disallow copy construction.
  Archived_rc(const Archived_rc&) = delete;

  // Methods.

  /// Disallow copy assignment.
  Archived_rc& operator=(const Archived_rc&) = delete;

  /**
   * The pointee.
   * @return See above.
   */
  const T& get() const;

  /**
   * The pointee, pinned.  Keep in mind other Archived_rc may point to the same pointee.
   * @return See above.
   */
  Pinned<T> get_pin_mut();

  /**
   * The underlying relative pointer.
   * @return See above.
   */
  const Rel_ptr<T>& rel_ptr() const;

  /**
   * Archives the shared native pointee `value` unless the serializer's Sharing says it already was; returns the
   * resolver either way.
   *
   * @tparam U
   *         Native pointee type; `Archived<U>` must be `T`.
   * @tparam Serializer
   *         See ser::serialize_using().
   * @param value
   *        Native pointee.  Its address identifies it for sharing purposes.
   * @param serializer
   *        Serializer.
   * @param err_code
   *        Must not be null.
   * @return See above.  Meaningless on error.
   */
  template<typename U, typename Serializer>
  static Rc_resolver serialize_from_ref(const U& value, Serializer* serializer, Error_code* err_code);

  /**
   * Resolves the pointer at `out` to point to the pointee at `resolver.m_pos`.
   *
   * @param resolver
   *        What serialize_from_ref() returned.
   * @param out
   *        Place of the pointer.
   * @param err_code
   *        Must not be null.  error::Code::S_SER_OFFSET_OUT_OF_RANGE.
   */
  static void resolve_from_raw_parts(const Rc_resolver& resolver, Place<Archived_rc> out, Error_code* err_code);

  /**
   * Validates the pointer at `value` and, unless already done via another pointer, its pointee.  See class doc
   * header.
   *
   * @tparam Context
   *         Validation context type with the Shared_validator API too.
   * @param value
   *        Unvalidated pointer (its own bytes already bounds-checked).
   * @param context
   *        Validation context.
   * @param err_code
   *        Must not be null.  error::Code::S_VALIDATION_SHARED_TYPE_CONFLICT in addition to the usual.
   */
  template<typename Context>
  static void check_bytes(const Archived_rc* value, Context* context, Error_code* err_code);

private:
  // Data.

  /// The pointer.
  Rel_ptr<T> m_ptr;
}; // class Archived_rc

// Template implementations.

template<typename T>
Archived_rc<T>::Archived_rc() = default;

template<typename T>
const T& Archived_rc<T>::get() const
{
  return *m_ptr.as_ptr();
}

template<typename T>
Pinned<T> Archived_rc<T>::get_pin_mut()
{
  return Pinned<T>(m_ptr.as_mut_ptr());
}

template<typename T>
const Rel_ptr<T>& Archived_rc<T>::rel_ptr() const
{
  return m_ptr;
}

template<typename T>
template<typename U, typename Serializer>
Rc_resolver Archived_rc<T>::serialize_from_ref(const U& value, Serializer* serializer,
                                               Error_code* err_code) // Static.
{
  static_assert(std::is_same_v<Archived<U>, T>, "Shared native type must archive as the pointee type.");

  const size_t pos
    = ser::serialize_shared(serializer, static_cast<const void*>(&value),
                            [&](Error_code* actual_err_code) -> size_t
                              { return ser::serialize_using(value, serializer, actual_err_code); },
                            err_code);
  return Rc_resolver{ pos };
}

template<typename T>
void Archived_rc<T>::resolve_from_raw_parts(const Rc_resolver& resolver, Place<Archived_rc> out,
                                            Error_code* err_code) // Static.
{
  Rel_ptr<T>::emplace(resolver.m_pos, out.field(&Archived_rc::m_ptr), err_code);
}

template<typename T>
template<typename Context>
void Archived_rc<T>::check_bytes(const Archived_rc* value, Context* context, Error_code* err_code) // Static.
{
  assert(err_code);

  const Rel_ptr<T>& ptr = value->m_ptr;

  // Register first: a position that is already registered was claimed and validated when first reached.
  const size_t pos = validation::subtree_target_pos(context, ptr.base(), ptr.offset(), err_code);
  if (*err_code)
  {
    return;
  }
  // else

  const bool first = context->register_shared_ptr(pos, std::type_index(typeid(T)), err_code);
  if (*err_code || (!first))
  {
    return;
  }
  // else

  validation::bounds_check_subtree_rel_ptr(context, ptr, err_code);
  if (*err_code)
  {
    return;
  }
  // else
  validation::check_prefix_subtree<T>(context, pos, No_metadata(), err_code);
}

} // namespace zcarc
