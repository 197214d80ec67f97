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

#include "zcarc/ser/composite.hpp"

namespace zcarc::ser
{

// Free functions.

/**
 * Archives `value` via the given serializer: its serialize step (out-of-line data), then its resolve step (the
 * archived value itself, appended at the next aligned position).  Returns the position of the archived value.
 * Archiving a root value this way, and nothing after it, makes it the root of the archive (see access()).
 *
 * @tparam T
 *         Native type with an Archive_traits specialization.
 * @tparam Serializer
 *         Models Writer, Allocator, and Sharing concepts; e.g. Composite_serializer.
 * @param value
 *        Value to archive.
 * @param serializer
 *        Serializer.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  Any code emitted by the serializer's parts;
 *        error::Code::S_SER_OFFSET_OUT_OF_RANGE.
 * @return Position of archived value.  Meaningless on error.
 */
template<typename T, typename Serializer>
size_t serialize_using(const T& value, Serializer* serializer, Error_code* err_code = 0);

/**
 * Archives `value` into a new heap buffer (via a fresh Heap_serializer) and returns that buffer.  The buffer start is
 * aligned to S_BUFFER_ALIGNMENT, so it can be read in place with access() right away, or copied/transmitted/stored
 * and read elsewhere (from a suitably aligned location).
 *
 * @tparam T
 *         Native type with an Archive_traits specialization.
 * @param logger_ptr
 *        Logger to use for logging.
 * @param value
 *        Value to archive.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  See serialize_using().
 * @return The archive.  Empty on error.
 */
template<typename T>
flow::util::Blob to_bytes(flow::log::Logger* logger_ptr, const T& value, Error_code* err_code = 0);

// Template implementations.

template<typename T, typename Serializer>
size_t serialize_using(const T& value, Serializer* serializer, Error_code* err_code)
{
  size_t pos;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> size_t { return serialize_using(value, serializer, actual_err_code); },
         &pos, err_code, "zcarc::ser::serialize_using()"))
  {
    return pos;
  }
  // If got here: err_code is not null.

  const auto resolver = Archive_traits<T>::serialize(value, serializer, err_code);
  if (*err_code)
  {
    return 0;
  }
  // else
  return resolve_aligned(serializer, value, resolver, err_code);
}

template<typename T>
flow::util::Blob to_bytes(flow::log::Logger* logger_ptr, const T& value, Error_code* err_code)
{
  using flow::util::Blob;

  Blob result;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> Blob { return to_bytes(logger_ptr, value, actual_err_code); },
         &result, err_code, "zcarc::ser::to_bytes()"))
  {
    return result;
  }
  // If got here: err_code is not null.

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_SER);

  auto serializer = make_heap_serializer(logger_ptr);
  const size_t root_pos = serialize_using(value, &serializer, err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Archiving failed at position [" << serializer.pos() << "] "
                     "[" << *err_code << "] [" << err_code->message() << "].  Emitting error.");
    return Blob(logger_ptr);
  }
  // else

  FLOW_LOG_TRACE("Archived root at position [" << root_pos << "]; archive size [" << serializer.pos() << "].");
  return std::get<0>(std::move(serializer).into_raw_parts()).into_blob();
} // to_bytes()

} // namespace zcarc::ser
