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

#include "zcarc/archive.hpp"
#include "zcarc/deserializer.hpp"
#include "zcarc/validation/validator.hpp"
#include "zcarc/validation/archive_context.hpp"
#include <optional>

/* Entry points for reading an archive in place.  The checked ones (access(), access_pos(), their `_mut` and
 * `_with_context` variants, check_pos_with_context()) validate the whole object graph reachable from the root before
 * handing out a reference: after that every get() on it is memory-safe.  The `_unchecked` ones trust the bytes
 * entirely; they are for buffers the caller produced or validated earlier.
 *
 * By convention the root sits at the very end of the archive (ser::serialize_using() appends it last), so access()
 * looks for it at `bytes.size() - sizeof(T)`; access_pos() and friends take an explicit root position instead.
 *
 * In all cases `T` is an archived type (e.g. `Archived<std::vector<int>>`), not the native type. */

namespace zcarc
{

// Free functions.

/**
 * Validates the archived `T` at position `pos` in `bytes`, and everything reachable from it, using the given
 * validation context (which must have been constructed for the same `bytes` and not used yet).
 *
 * The buffer start must be aligned for `T`; the root must lie entirely in the buffer and be suitably aligned; every
 * relative pointer must point in bounds, at a properly aligned, non-overlapping subtree; every value must be valid for
 * its type.
 *
 * @tparam T
 *         Archived root type.
 * @tparam Context
 *         Validation context type, e.g. validation::Validator.
 * @param bytes
 *        The archive.
 * @param pos
 *        Root position.
 * @param context
 *        Validation context for `bytes`.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  error::Code::S_ACCESS_BUFFER_MISALIGNED; any
 *        `S_VALIDATION_*` code; error::Code::S_LAYOUT_OVERFLOW.
 */
template<typename T, typename Context>
void check_pos_with_context(Blob_const bytes, size_t pos, Context* context, Error_code* err_code = 0);

/**
 * check_pos_with_context(), then returns the validated root.
 *
 * @tparam T
 *         See check_pos_with_context().
 * @tparam Context
 *         See check_pos_with_context().
 * @param bytes
 *        See check_pos_with_context().
 * @param pos
 *        See check_pos_with_context().
 * @param context
 *        See check_pos_with_context().
 * @param err_code
 *        See check_pos_with_context().
 * @return Pointer to the root in `bytes`; null on error.
 */
template<typename T, typename Context>
const T* access_pos_with_context(Blob_const bytes, size_t pos, Context* context, Error_code* err_code = 0);

/**
 * Same as access_pos_with_context() with the root at the end of the buffer.
 *
 * @tparam T
 *         See check_pos_with_context().
 * @tparam Context
 *         See check_pos_with_context().
 * @param bytes
 *        See check_pos_with_context().
 * @param context
 *        See check_pos_with_context().
 * @param err_code
 *        See check_pos_with_context().
 * @return See access_pos_with_context().
 */
template<typename T, typename Context>
const T* access_with_context(Blob_const bytes, Context* context, Error_code* err_code = 0);

/**
 * Same as access_pos_with_context() with a fresh validation::Validator (unlimited subtree depth).
 *
 * @tparam T
 *         See check_pos_with_context().
 * @param logger_ptr
 *        Logger to use for logging.
 * @param bytes
 *        See check_pos_with_context().
 * @param pos
 *        See check_pos_with_context().
 * @param err_code
 *        See check_pos_with_context().
 * @return See access_pos_with_context().
 */
template<typename T>
const T* access_pos(flow::log::Logger* logger_ptr, Blob_const bytes, size_t pos, Error_code* err_code = 0);

/**
 * Same as access_pos() with the root at the end of the buffer.  The usual way to read an archive made by
 * ser::to_bytes().
 *
 * @tparam T
 *         See check_pos_with_context().
 * @param logger_ptr
 *        Logger to use for logging.
 * @param bytes
 *        See check_pos_with_context().
 * @param err_code
 *        See check_pos_with_context().
 * @return See access_pos_with_context().
 */
template<typename T>
const T* access(flow::log::Logger* logger_ptr, Blob_const bytes, Error_code* err_code = 0);

/**
 * Same as access_pos_with_context() but yields the root pinned, for in-place modification.
 *
 * @tparam T
 *         See check_pos_with_context().
 * @tparam Context
 *         See check_pos_with_context().
 * @param bytes
 *        See check_pos_with_context().
 * @param pos
 *        See check_pos_with_context().
 * @param context
 *        See check_pos_with_context().  Its buffer must be `bytes`.
 * @param err_code
 *        See check_pos_with_context().
 * @return The pinned root; empty on error.
 */
template<typename T, typename Context>
std::optional<Pinned<T>> access_pos_with_context_mut(Blob_mutable bytes, size_t pos, Context* context,
                                                     Error_code* err_code = 0);

/**
 * access_pos_with_context_mut() with the root at the end of the buffer.
 *
 * @tparam T
 *         See check_pos_with_context().
 * @tparam Context
 *         See check_pos_with_context().
 * @param bytes
 *        See check_pos_with_context().
 * @param context
 *        See access_pos_with_context_mut().
 * @param err_code
 *        See check_pos_with_context().
 * @return See access_pos_with_context_mut().
 */
template<typename T, typename Context>
std::optional<Pinned<T>> access_with_context_mut(Blob_mutable bytes, Context* context, Error_code* err_code = 0);

/**
 * Same as access_pos() but yields the root pinned, for in-place modification.
 *
 * @tparam T
 *         See check_pos_with_context().
 * @param logger_ptr
 *        Logger to use for logging.
 * @param bytes
 *        See check_pos_with_context().
 * @param pos
 *        See check_pos_with_context().
 * @param err_code
 *        See check_pos_with_context().
 * @return The pinned root; empty on error.
 */
template<typename T>
std::optional<Pinned<T>> access_pos_mut(flow::log::Logger* logger_ptr, Blob_mutable bytes, size_t pos,
                                        Error_code* err_code = 0);

/**
 * Same as access_pos_mut() with the root at the end of the buffer.
 *
 * @tparam T
 *         See check_pos_with_context().
 * @param logger_ptr
 *        Logger to use for logging.
 * @param bytes
 *        See check_pos_with_context().
 * @param err_code
 *        See check_pos_with_context().
 * @return See access_pos_mut().
 */
template<typename T>
std::optional<Pinned<T>> access_mut(flow::log::Logger* logger_ptr, Blob_mutable bytes, Error_code* err_code = 0);

/**
 * Returns the archived `T` at `pos` without any validation.  Behavior is undefined unless `bytes` holds a valid
 * archive with a `T` at `pos` and is suitably aligned.
 *
 * @tparam T
 *         Archived root type.
 * @param bytes
 *        The archive.
 * @param pos
 *        Root position.
 * @return See above.
 */
template<typename T>
const T& access_pos_unchecked(Blob_const bytes, size_t pos);

/**
 * access_pos_unchecked() with the root at the end of the buffer.
 *
 * @tparam T
 *         Archived root type.
 * @param bytes
 *        The archive.
 * @return See above.
 */
template<typename T>
const T& access_unchecked(Blob_const bytes);

/**
 * access_pos_unchecked(), pinned.
 *
 * @tparam T
 *         Archived root type.
 * @param bytes
 *        The archive.
 * @param pos
 *        Root position.
 * @return See above.
 */
template<typename T>
Pinned<T> access_pos_unchecked_mut(Blob_mutable bytes, size_t pos);

/**
 * access_unchecked(), pinned.
 *
 * @tparam T
 *         Archived root type.
 * @param bytes
 *        The archive.
 * @return See above.
 */
template<typename T>
Pinned<T> access_unchecked_mut(Blob_mutable bytes);

/**
 * Validates the archive `bytes` (root at the end) as an `Archived<U>`, then materializes a native `U` from it.  Values
 * shared in the archive via `std::shared_ptr` come out shared again (see Deserializer).
 *
 * @tparam U
 *         Native type with an Archive_traits specialization; default-constructible.
 * @param logger_ptr
 *        Logger to use for logging.
 * @param bytes
 *        The archive, e.g. from ser::to_bytes().
 * @param err_code
 *        See check_pos_with_context().
 * @return The native value; default-constructed on error.
 */
template<typename U>
U from_bytes(flow::log::Logger* logger_ptr, Blob_const bytes, Error_code* err_code = 0);

/**
 * Position of the root `T` by convention: `bytes.size() - sizeof(T)`, or 0 if the buffer is smaller than that (in
 * which case validation will fail on bounds).
 *
 * @tparam T
 *         Archived root type.
 * @param bytes
 *        The archive.
 * @return See above.
 */
template<typename T>
size_t root_pos(Blob_const bytes);

// Template implementations.

template<typename T>
size_t root_pos(Blob_const bytes)
{
  return (bytes.size() >= sizeof(T)) ? (bytes.size() - sizeof(T)) : 0;
}

template<typename T, typename Context>
void check_pos_with_context(Blob_const bytes, size_t pos, Context* context, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { check_pos_with_context<T>(bytes, pos, context, actual_err_code); },
         err_code, "zcarc::check_pos_with_context()"))
  {
    return;
  }
  // If got here: err_code is not null.

  assert(context);
  assert((context->base() == static_cast<const uint8_t*>(bytes.data())) && (context->size() == bytes.size()));

  FLOW_LOG_SET_CONTEXT(context->get_logger(), Log_component::S_ACCESS);

  const auto base_addr = reinterpret_cast<uintptr_t>(bytes.data());
  if ((base_addr % alignof(T)) != 0)
  {
    FLOW_LOG_WARNING("Archive buffer at [" << bytes.data() << "] sized [" << bytes.size() << "] is not aligned to "
                     "[" << alignof(T) << "] as the root type requires.  Emitting error.");
    *err_code = error::Code::S_ACCESS_BUFFER_MISALIGNED;
    return;
  }
  // else

  context->check_subtree_ptr(pos, Layout::of<T>(), err_code);
  if (*err_code)
  {
    return;
  }
  // else

  validation::check_prefix_subtree<T>(context, pos, No_metadata(), err_code);
  if (*err_code)
  {
    return;
  }
  // else

  context->check_balanced(err_code);
  if (!*err_code)
  {
    FLOW_LOG_TRACE("Validated archive sized [" << bytes.size() << "] with root at position [" << pos << "].");
  }
} // check_pos_with_context()

template<typename T, typename Context>
const T* access_pos_with_context(Blob_const bytes, size_t pos, Context* context, Error_code* err_code)
{
  const T* result;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> const T*
           { return access_pos_with_context<T>(bytes, pos, context, actual_err_code); },
         &result, err_code, "zcarc::access_pos_with_context()"))
  {
    return result;
  }
  // If got here: err_code is not null.

  check_pos_with_context<T>(bytes, pos, context, err_code);
  if (*err_code)
  {
    return nullptr;
  }
  // else
  return &access_pos_unchecked<T>(bytes, pos);
}

template<typename T, typename Context>
const T* access_with_context(Blob_const bytes, Context* context, Error_code* err_code)
{
  return access_pos_with_context<T>(bytes, root_pos<T>(bytes), context, err_code);
}

template<typename T>
const T* access_pos(flow::log::Logger* logger_ptr, Blob_const bytes, size_t pos, Error_code* err_code)
{
  validation::Validator validator(validation::Validator::Config{ logger_ptr, 0 }, bytes);
  return access_pos_with_context<T>(bytes, pos, &validator, err_code);
}

template<typename T>
const T* access(flow::log::Logger* logger_ptr, Blob_const bytes, Error_code* err_code)
{
  return access_pos<T>(logger_ptr, bytes, root_pos<T>(bytes), err_code);
}

template<typename T, typename Context>
std::optional<Pinned<T>> access_pos_with_context_mut(Blob_mutable bytes, size_t pos, Context* context,
                                                     Error_code* err_code)
{
  std::optional<Pinned<T>> result;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> std::optional<Pinned<T>>
           { return access_pos_with_context_mut<T>(bytes, pos, context, actual_err_code); },
         &result, err_code, "zcarc::access_pos_with_context_mut()"))
  {
    return result;
  }
  // If got here: err_code is not null.

  check_pos_with_context<T>(Blob_const(bytes.data(), bytes.size()), pos, context, err_code);
  if (*err_code)
  {
    return std::nullopt;
  }
  // else
  return access_pos_unchecked_mut<T>(bytes, pos);
}

template<typename T, typename Context>
std::optional<Pinned<T>> access_with_context_mut(Blob_mutable bytes, Context* context, Error_code* err_code)
{
  const size_t pos = root_pos<T>(Blob_const(bytes.data(), bytes.size()));
  return access_pos_with_context_mut<T>(bytes, pos, context, err_code);
}

template<typename T>
std::optional<Pinned<T>> access_pos_mut(flow::log::Logger* logger_ptr, Blob_mutable bytes, size_t pos,
                                        Error_code* err_code)
{
  validation::Validator validator(validation::Validator::Config{ logger_ptr, 0 },
                                  Blob_const(bytes.data(), bytes.size()));
  return access_pos_with_context_mut<T>(bytes, pos, &validator, err_code);
}

template<typename T>
std::optional<Pinned<T>> access_mut(flow::log::Logger* logger_ptr, Blob_mutable bytes, Error_code* err_code)
{
  const size_t pos = root_pos<T>(Blob_const(bytes.data(), bytes.size()));
  return access_pos_mut<T>(logger_ptr, bytes, pos, err_code);
}

template<typename T>
const T& access_pos_unchecked(Blob_const bytes, size_t pos)
{
  return *reinterpret_cast<const T*>(static_cast<const uint8_t*>(bytes.data()) + pos);
}

template<typename T>
const T& access_unchecked(Blob_const bytes)
{
  return access_pos_unchecked<T>(bytes, root_pos<T>(bytes));
}

template<typename T>
Pinned<T> access_pos_unchecked_mut(Blob_mutable bytes, size_t pos)
{
  return Pinned<T>(reinterpret_cast<T*>(static_cast<uint8_t*>(bytes.data()) + pos));
}

template<typename T>
Pinned<T> access_unchecked_mut(Blob_mutable bytes)
{
  return access_pos_unchecked_mut<T>(bytes, root_pos<T>(Blob_const(bytes.data(), bytes.size())));
}

template<typename U>
U from_bytes(flow::log::Logger* logger_ptr, Blob_const bytes, Error_code* err_code)
{
  U result;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> U { return from_bytes<U>(logger_ptr, bytes, actual_err_code); },
         &result, err_code, "zcarc::from_bytes()"))
  {
    return result;
  }
  // If got here: err_code is not null.

  const auto archived = access<Archived<U>>(logger_ptr, bytes, err_code);
  if (*err_code)
  {
    return U();
  }
  // else

  Deserializer deserializer;
  return Archive_traits<U>::deserialize(*archived, &deserializer);
}

} // namespace zcarc
