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

#include <flow/common.hpp>
#include <flow/log/log.hpp>
#include <flow/error/error.hpp>
#include <flow/util/string_view.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/unordered_map.hpp>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>

/**
 * Catch-all namespace for zcarc: a zero-copy archive format whose serialization can be interpreted in place, as
 * typed data, after (optionally) validating it.
 *
 * The library is organized as follows:
 *   - Relative pointers and the things built on them: Rel_ptr, Archived_box, Archived_rc; plus Place and Pinned,
 *     which are the write-side and mutable-read-side handles onto an archived value inside a buffer.
 *   - zcarc::ser: everything needed to *write* an archive: writers, scratch allocators, sharing registries, and
 *     the Composite_serializer that bundles one of each.
 *   - zcarc::validation: everything needed to *trust* an archive: Archive_validator (subtree ranges),
 *     Shared_validator (shared pointees), and the default Validator combining both.
 *   - The access functions (access(), access_mut(), from_bytes(), etc.) in access.hpp.
 */
namespace zcarc
{

// Types.

/// Short-hand for Flow's `Error_code` which is very common.
using Error_code = flow::Error_code;

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;

/// Read-only view of a contiguous byte area, such as a finished archive.
using Blob_const = boost::asio::const_buffer;

/// Writable view of a contiguous byte area, such as a fixed-capacity serialization target.
using Blob_mutable = boost::asio::mutable_buffer;

/// The `flow::log::Component` payload enumeration comprising various log components used by zcarc's own logging.
enum class Log_component
{
  /**
   * CAUTION -- this is a reserved value; code must not specify it when logging; it is used internally.
   * Analogous to `flow::Flow_log_component::S_UNCAT`.
   */
  S_UNCAT = 0,

  /// Serialization: writers, scratch allocators, sharing registries, composite serializer.
  S_SER,

  /// Validation: subtree-range and shared-pointer validators.
  S_VALIDATION,

  /// Access and deserialization entry points.
  S_ACCESS,

  /// SENTINEL: Not a component.
  S_END_SENTINEL
}; // enum class Log_component

// Constants.

/**
 * Alignment (in bytes) guaranteed for the start of every buffer allocated by zcarc itself (e.g., by
 * ser::Heap_writer).  No archived type defined by zcarc requires more than this.
 */
constexpr size_t S_BUFFER_ALIGNMENT = alignof(std::max_align_t);

/**
 * The map generated by `flow::log` macro magic that maps each enumerated value in zcarc::Log_component to its
 * string representation as used in log output and verbosity config.  zcarc emitters of log messages do not need
 * it; but the user configuring a `flow::log::Config` does: pass it to `Config::init_component_names()`.
 */
extern const boost::unordered_multimap<Log_component, std::string> S_ZCARC_LOG_COMPONENT_NAME_MAP;

} // namespace zcarc
