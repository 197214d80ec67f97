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
 * Exclusive handle to an archived value living inside a mutable archive buffer, which cannot be used to relocate
 * that value.  It is the only form in which zcarc hands out mutable access to archived data (see access_mut(),
 * Archived_box::get_pin_mut()).
 *
 * ### Why not just `T&`? ###
 * An archived value containing relative pointers (Rel_ptr and everything built on it) encodes the positions of
 * its pointees *relative to its own address*.  Copying or moving it anywhere else -- without moving everything
 * at the same displacement -- would silently corrupt every such pointer.  Pinned is therefore not copyable, and
 * the pointer-bearing archived types themselves are neither copyable nor movable; so the only operations available
 * through a Pinned are in-place ones: reading, and assigning to plain scalar fields.
 *
 * Pinned does not check anything at run time.  Exclusivity (one Pinned per value at a time) is the caller's
 * responsibility, as for any mutable reference.
 *
 * @tparam T
 *         Archived type.  See also the `T[]` specialization for archived slices.
 */
template<typename T>
class Pinned
{
public:
  // Types.

  /// Short-hand for template parameter.
  using Value = T;

  // Constructors/destructor.

  /**
   * Pins the value at the given address.  The caller vouches that `*ptr` lives in an archive buffer and that it has
   * been validated (or is otherwise trusted).
   *
   * @param ptr
   *        Value.  Not null.
   */
  explicit Pinned(T* ptr);

  /// Disallow copy construction.
  Pinned(const Pinned&) = delete;

  /// Moves handle (not the value).
  Pinned(Pinned&&) = default;

  // Methods.

  /// Disallow copy assignment.
  Pinned& operator=(const Pinned&) = delete;

  /**
   * Moves handle (not the value).
   * @return `*this`.
   */
  Pinned& operator=(Pinned&&) = default;

  /**
   * Read-only access.
   * @return See above.
   */
  const T& get() const;

  /**
   * In-place access to members of the value.
   * @return See above.
   */
  T* operator->() const;

  /**
   * In-place access to the value.
   * @return See above.
   */
  T& operator*() const;

private:
  // Data.

  /// The value.
  T* m_ptr;
}; // class Pinned

/**
 * Pinned counterpart for an archived slice: the elements, in place, with their count.
 *
 * @tparam E
 *         Archived element type.
 */
template<typename E>
class Pinned<E[]>
{
public:
  // Constructors/destructor.

  /**
   * Pins the slice `[data, data + size)`.  Same contract as Pinned::Pinned().
   *
   * @param data
   *        First element (may be anything if `size == 0`).
   * @param size
   *        Element count.
   */
  explicit Pinned(E* data, size_t size);

  /// Disallow copy construction.
  Pinned(const Pinned&) = delete;

  /// Moves handle (not the elements).
  Pinned(Pinned&&) = default;

  // Methods.

  /// Disallow copy assignment.
  Pinned& operator=(const Pinned&) = delete;

  /**
   * Moves handle (not the elements).
   * @return `*this`.
   */
  Pinned& operator=(Pinned&&) = default;

  /**
   * Element count.
   * @return See above.
   */
  size_t size() const;

  /**
   * In-place access to element at the given index.
   *
   * @param idx
   *        Index less than size().
   * @return See above.
   */
  E& operator[](size_t idx) const;

  /**
   * Pointer to first element.
   * @return See above.
   */
  E* begin() const;

  /**
   * Pointer just past last element.
   * @return See above.
   */
  E* end() const;

private:
  // Data.

  /// See begin().
  E* m_data;

  /// See size().
  size_t m_size;
}; // class Pinned<E[]>

// Template implementations.

template<typename T>
Pinned<T>::Pinned(T* ptr) :
  m_ptr(ptr)
{
  assert(m_ptr);
}

template<typename T>
const T& Pinned<T>::get() const
{
  return *m_ptr;
}

template<typename T>
T* Pinned<T>::operator->() const
{
  return m_ptr;
}

template<typename T>
T& Pinned<T>::operator*() const
{
  return *m_ptr;
}

template<typename E>
Pinned<E[]>::Pinned(E* data, size_t size) :
  m_data(data),
  m_size(size)
{
  // That's it.
}

template<typename E>
size_t Pinned<E[]>::size() const
{
  return m_size;
}

template<typename E>
E& Pinned<E[]>::operator[](size_t idx) const
{
  assert(idx < m_size);
  return m_data[idx];
}

template<typename E>
E* Pinned<E[]>::begin() const
{
  return m_data;
}

template<typename E>
E* Pinned<E[]>::end() const
{
  return m_data + m_size;
}

} // namespace zcarc
