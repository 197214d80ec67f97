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
#include "zcarc/check_bytes.hpp"
#include "zcarc/validation/archive_validator.hpp"
#include <type_traits>

/* Helpers built on the Archive_validator API, usable with any validation context modeling it (Archive_validator,
 * Validator, or a user's own) that is also a `flow::log::Log_context`.  They are what pointer-bearing archived types
 * call from their check_bytes(). */

namespace zcarc::validation
{

// Free functions.

/**
 * Computes position `(base - context->base()) + offset`, checking only that it lies within the buffer (neither
 * before its start nor after its end).  `base` itself must be within the buffer.
 *
 * @tparam Context
 *         Validation context type.
 * @param context
 *        Validation context.
 * @param base
 *        Address from which `offset` is measured (e.g., Rel_ptr::base()).
 * @param offset
 *        Signed offset (untrusted).
 * @param err_code
 *        Must not be null.  error::Code::S_VALIDATION_POINTER_OUT_OF_BOUNDS.
 * @return See above.  Meaningless on error.
 */
template<typename Context>
size_t subtree_target_pos(const Context* context, const uint8_t* base, int32_t offset, Error_code* err_code);

/**
 * Checks that the `T` (with given metadata) at `base + offset` lies within the active range and is aligned; returns
 * its position.
 *
 * @tparam T
 *         Archived pointee type: sized, or `E[]`.
 * @tparam Context
 *         Validation context type.
 * @param context
 *        Validation context.
 * @param base
 *        See subtree_target_pos().
 * @param offset
 *        See subtree_target_pos().
 * @param metadata
 *        Pointee metadata (untrusted).
 * @param err_code
 *        Must not be null.  error::Code::S_VALIDATION_POINTER_OUT_OF_BOUNDS,
 *        error::Code::S_VALIDATION_POINTER_MISALIGNED, error::Code::S_LAYOUT_OVERFLOW.
 * @return See above.  Meaningless on error.
 */
template<typename T, typename Context>
size_t bounds_check_subtree_base_offset(Context* context, const uint8_t* base, int32_t offset,
                                        typename Pointee_traits<T>::Metadata metadata, Error_code* err_code);

/**
 * bounds_check_subtree_base_offset() for the pointee of the given relative pointer.
 *
 * @tparam T
 *         Archived pointee type.
 * @tparam Context
 *         Validation context type.
 * @param context
 *        Validation context.
 * @param rel_ptr
 *        Relative pointer (within the buffer).
 * @param err_code
 *        See bounds_check_subtree_base_offset().
 * @return See bounds_check_subtree_base_offset().
 */
template<typename T, typename Context>
size_t bounds_check_subtree_rel_ptr(Context* context, const Rel_ptr<T>& rel_ptr, Error_code* err_code);

/**
 * Pushes the subtree range occupied by the `T` at `pos`: `[pos, pos + layout size)`.
 *
 * @tparam T
 *         Archived pointee type.
 * @tparam Context
 *         Validation context type.
 * @param context
 *        Validation context.
 * @param pos
 *        Position of pointee, already bounds-checked.
 * @param metadata
 *        Pointee metadata.
 * @param err_code
 *        Must not be null.
 * @return The token for `pop_subtree_range()`.
 */
template<typename T, typename Context>
Subtree_range push_prefix_subtree(Context* context, size_t pos, typename Pointee_traits<T>::Metadata metadata,
                                  Error_code* err_code);

/**
 * Full check of a bounds-checked pointee: push_prefix_subtree(); Check_bytes on the `T` (on each element, for a
 * slice); pop.
 *
 * @tparam T
 *         Archived pointee type.
 * @tparam Context
 *         Validation context type.
 * @param context
 *        Validation context.
 * @param pos
 *        Position of pointee, already bounds-checked.
 * @param metadata
 *        Pointee metadata.
 * @param err_code
 *        Must not be null.
 */
template<typename T, typename Context>
void check_prefix_subtree(Context* context, size_t pos, typename Pointee_traits<T>::Metadata metadata,
                          Error_code* err_code);

// Template implementations.

template<typename Context>
size_t subtree_target_pos(const Context* context, const uint8_t* base, int32_t offset, Error_code* err_code)
{
  assert(err_code);
  assert((base >= context->base()) && (base <= (context->base() + context->size())));

  const auto base_pos = static_cast<int64_t>(base - context->base());
  const int64_t target_pos = base_pos + offset;
  if ((target_pos < 0) || (static_cast<uint64_t>(target_pos) > context->size()))
  {
    FLOW_LOG_SET_CONTEXT(context->get_logger(), Log_component::S_VALIDATION);
    FLOW_LOG_WARNING("Relative pointer at position [" << base_pos << "] with offset [" << offset << "] points "
                     "outside buffer sized [" << context->size() << "].  Emitting error.");
    *err_code = error::Code::S_VALIDATION_POINTER_OUT_OF_BOUNDS;
    return 0;
  }
  // else
  return static_cast<size_t>(target_pos);
}

template<typename T, typename Context>
size_t bounds_check_subtree_base_offset(Context* context, const uint8_t* base, int32_t offset,
                                        typename Pointee_traits<T>::Metadata metadata, Error_code* err_code)
{
  const size_t pos = subtree_target_pos(context, base, offset, err_code);
  if (*err_code)
  {
    return 0;
  }
  // else

  const Layout layout = Pointee_traits<T>::layout(metadata, err_code);
  if (*err_code)
  {
    FLOW_LOG_SET_CONTEXT(context->get_logger(), Log_component::S_VALIDATION);
    FLOW_LOG_WARNING("Pointee at position [" << pos << "] has metadata implying an invalid layout.  "
                     "Emitting error.");
    return 0;
  }
  // else

  context->check_subtree_ptr(pos, layout, err_code);
  return pos;
}

template<typename T, typename Context>
size_t bounds_check_subtree_rel_ptr(Context* context, const Rel_ptr<T>& rel_ptr, Error_code* err_code)
{
  return bounds_check_subtree_base_offset<T>(context, rel_ptr.base(), rel_ptr.offset(), rel_ptr.metadata(),
                                             err_code);
}

template<typename T, typename Context>
Subtree_range push_prefix_subtree(Context* context, size_t pos, typename Pointee_traits<T>::Metadata metadata,
                                  Error_code* err_code)
{
  assert(err_code);

  const Layout layout = Pointee_traits<T>::layout(metadata, err_code);
  if (*err_code)
  {
    return Subtree_range{ pos, pos };
  }
  // else
  return context->push_subtree_range(pos, pos + layout.m_size, err_code);
}

template<typename T, typename Context>
void check_prefix_subtree(Context* context, size_t pos, typename Pointee_traits<T>::Metadata metadata,
                          Error_code* err_code)
{
  using Element = typename Pointee_traits<T>::Element;

  const auto range = push_prefix_subtree<T>(context, pos, metadata, err_code);
  if (*err_code)
  {
    return;
  }
  // else

  const auto data = reinterpret_cast<const Element*>(context->base() + pos);
  if constexpr(std::is_array_v<T>)
  {
    for (size_t idx = 0; idx != metadata; ++idx)
    {
      check_bytes(data + idx, context, err_code);
      if (*err_code)
      {
        return;
      }
    }
  }
  else
  {
    check_bytes(data, context, err_code);
    if (*err_code)
    {
      return;
    }
  }

  context->pop_subtree_range(range, err_code);
} // check_prefix_subtree()

} // namespace zcarc::validation
