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

namespace zcarc
{

// Types.

/**
 * The *final* position of a to-be-written archived value, together with the staging storage into which its
 * archived bytes are being assembled.  It is what a resolve step (see Archive_traits concept) writes into.
 *
 * Why both?  A relative pointer's encoded offset is a function of the pointer's own position in the finished
 * buffer, so it can only be computed once that position is fixed.  The archive is append-only, so that position
 * is known (it is the writer's position after alignment) before the bytes are actually written; but the bytes
 * themselves are first assembled in staging storage (`ptr()`), then appended by the writer.  Hence `pos()` says
 * *where it will be*, `ptr()` says *where to put the bits now*.
 *
 * Cheap to copy; does not own anything.
 *
 * @tparam T
 *         The archived type being resolved.
 */
template<typename T>
class Place
{
public:
  // Constructors/destructor.

  /**
   * Constructs the place.
   *
   * @param pos
   *        Final position (from start of archive) of the value.
   * @param ptr
   *        Staging storage for the value; a `T` must already be constructed there.
   */
  explicit Place(size_t pos, T* ptr);

  // Methods.

  /**
   * Final position (from start of archive) of the value.
   * @return See above.
   */
  size_t pos() const;

  /**
   * Staging storage for the value.
   * @return See above.
   */
  T* ptr() const;

  /**
   * Place of a data member of the value: same staging storage, position adjusted by the member's offset.
   *
   * @tparam Field
   *         Type of the member.
   * @param member
   *        Pointer to data member of `T`.
   * @return See above.
   */
  template<typename Field>
  Place<Field> field(Field T::* member) const;

private:
  // Data.

  /// See pos().
  size_t m_pos;

  /// See ptr().
  T* m_ptr;
}; // class Place

// Template implementations.

template<typename T>
Place<T>::Place(size_t pos, T* ptr) :
  m_pos(pos),
  m_ptr(ptr)
{
  assert(m_ptr);
}

template<typename T>
size_t Place<T>::pos() const
{
  return m_pos;
}

template<typename T>
T* Place<T>::ptr() const
{
  return m_ptr;
}

template<typename T>
template<typename Field>
Place<Field> Place<T>::field(Field T::* member) const
{
  Field* const field_ptr = &(m_ptr->*member);
  const auto delta = static_cast<size_t>(reinterpret_cast<const uint8_t*>(field_ptr)
                                         - reinterpret_cast<const uint8_t*>(m_ptr));
  return Place<Field>(m_pos + delta, field_ptr);
}

} // namespace zcarc
