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
#include <flow/util/blob.hpp>
#include <type_traits>
#include <new>
#include <cstring>
#include <algorithm>

namespace zcarc::ser
{

// Types.

/**
 * Writer (see concept in ser/concepts.hpp) that appends into a caller-supplied fixed-capacity area.  It never
 * allocates; when the area is full, write() emits error::Code::S_SER_WRITER_CAPACITY_EXHAUSTED.
 *
 * The area's first byte is position 0 of the archive.  For the archive to be readable in place from that same area
 * (see access()), the area must be aligned to at least the largest alignment of any archived type in it; the
 * writer does not check that, as it only deals in positions.
 */
class Buffer_writer :
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs writer at position 0 of `target`.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param target
   *        Area to fill.  Must remain valid while `*this` writes into it.
   */
  explicit Buffer_writer(flow::log::Logger* logger_ptr, Blob_mutable target);

  /// Disallow copying.
  Buffer_writer(const Buffer_writer&) = delete;

  /// Implements move semantics.
  Buffer_writer(Buffer_writer&&);

  // Methods.

  /// Disallow copying.
  Buffer_writer& operator=(const Buffer_writer&) = delete;

  /**
   * Implements move semantics.
   * @return `*this`.
   */
  Buffer_writer& operator=(Buffer_writer&&);

  /**
   * Implements Writer API.
   * @return See above.
   */
  size_t pos() const;

  /**
   * Implements Writer API.
   *
   * @param bytes
   *        See Writer concept.
   * @param err_code
   *        See Writer concept.  error::Code::S_SER_WRITER_CAPACITY_EXHAUSTED if it does not fit.
   */
  void write(Blob_const bytes, Error_code* err_code);

  /**
   * The bytes written so far: `[target start, target start + pos())`.
   * @return See above.
   */
  Blob_const written() const;

  /**
   * Total capacity of the target area.
   * @return See above.
   */
  size_t capacity() const;

private:
  // Data.

  /// The area being filled; `m_target.size()` is the capacity.
  Blob_mutable m_target;

  /// See pos().
  size_t m_pos;
}; // class Buffer_writer

/**
 * Writer (see concept in ser/concepts.hpp) that appends into a heap buffer it owns, growing it as needed (at least
 * doubling capacity each time, so that appending is amortized constant time).  The buffer is a `flow::util::Blob`;
 * when the archive is complete, take it via into_blob().
 *
 * The buffer start is aligned to S_BUFFER_ALIGNMENT (it is allocated by the standard allocator); hence so is the
 * buffer returned by into_blob(), so it can be read in place right away.
 *
 * Growth reallocates and so moves the bytes written so far.  That is harmless: archived data refers to other
 * archived data by position only.
 */
class Heap_writer :
  public flow::log::Log_context
{
public:
  // Types.

  /// Configuration (all values may be defaulted).
  struct Config
  {
    // Data.

    /// Logger to use for logging subsequently.
    flow::log::Logger* m_logger_ptr;

    /// Capacity allocated on first write(); 0 means a reasonable default.
    size_t m_initial_capacity;
  }; // struct Config

  // Constructors/destructor.

  /**
   * Constructs writer at position 0 of an empty buffer.  Allocation is deferred until the first write().
   *
   * @param config
   *        See Config.
   */
  explicit Heap_writer(const Config& config);

  /// Disallow copying.
  Heap_writer(const Heap_writer&) = delete;

  /// Implements move semantics.
  Heap_writer(Heap_writer&&);

  /// Logs.
  ~Heap_writer();

  // Methods.

  /// Disallow copying.
  Heap_writer& operator=(const Heap_writer&) = delete;

  /**
   * Implements move semantics.
   * @return `*this`.
   */
  Heap_writer& operator=(Heap_writer&&);

  /**
   * Implements Writer API.
   * @return See above.
   */
  size_t pos() const;

  /**
   * Implements Writer API.  Cannot fail other than by `std::bad_alloc`.
   *
   * @param bytes
   *        See Writer concept.
   * @param err_code
   *        See Writer concept.
   */
  void write(Blob_const bytes, Error_code* err_code);

  /**
   * The bytes written so far.
   * @return See above.
   */
  Blob_const written() const;

  /**
   * Capacity currently allocated.
   * @return See above.
   */
  size_t capacity() const;

  /**
   * Gives up the buffer, `size() == pos()`.  `*this` is then back at position 0 with no buffer.
   * @return See above.
   */
  flow::util::Blob into_blob();

private:
  // Constants.

  /// Initial capacity used if Config::m_initial_capacity is 0.
  static constexpr size_t S_DEFAULT_INITIAL_CAPACITY = 1024;

  // Methods.

  /**
   * Reallocates #m_buf to capacity at least `min_capacity`, keeping its contents.
   *
   * @param min_capacity
   *        Required capacity.
   */
  void grow(size_t min_capacity);

  // Data.

  /// See Config::m_initial_capacity.
  size_t m_initial_capacity;

  /// The buffer: `[begin(), end())` is the archive so far.
  flow::util::Blob m_buf;
}; // class Heap_writer

// Free functions.

/**
 * Writes `n_bytes` zero bytes via the given Writer.
 *
 * @tparam Writer_t
 *         Models Writer concept.
 * @param writer
 *        Writer.
 * @param n_bytes
 *        Count.
 * @param err_code
 *        Must not be null.
 */
template<typename Writer_t>
void pad(Writer_t* writer, size_t n_bytes, Error_code* err_code);

/**
 * Pads, as needed, so that the Writer position is a multiple of `alignment`; returns that position.
 *
 * @tparam Writer_t
 *         Models Writer concept.
 * @param writer
 *        Writer.
 * @param alignment
 *        Power of 2.
 * @param err_code
 *        Must not be null.
 * @return The aligned position.  Meaningless on error.
 */
template<typename Writer_t>
size_t align(Writer_t* writer, size_t alignment, Error_code* err_code);

/**
 * `align(writer, alignof(T), err_code)`.
 *
 * @tparam T
 *         Archived type about to be written.
 * @tparam Writer_t
 *         Models Writer concept.
 * @param writer
 *        Writer.
 * @param err_code
 *        Must not be null.
 * @return See align().
 */
template<typename T, typename Writer_t>
size_t align_for(Writer_t* writer, Error_code* err_code);

/**
 * Appends `Archived<T>` resolved from `value` and `resolver` at the next suitably aligned position: aligns;
 * default-constructs the archived value in zeroed staging storage; invokes `Archive_traits<T>::resolve()` with the
 * Place (aligned position, staging storage); writes the staged bytes.  This is the resolve step of every archived
 * value.
 *
 * @tparam T
 *         Native type with an Archive_traits specialization.
 * @tparam Writer_t
 *         Models Writer concept.
 * @param writer
 *        Writer.
 * @param value
 *        Value passed to `Archive_traits<T>::serialize()`.
 * @param resolver
 *        What that returned.
 * @param err_code
 *        Must not be null.
 * @return Position of the archived value.  Meaningless on error.
 */
template<typename T, typename Writer_t>
size_t resolve_aligned(Writer_t* writer, const T& value, const Resolver<T>& resolver, Error_code* err_code);

/**
 * Prints string representation of the given Buffer_writer to the given `ostream`.
 *
 * @relatesalso Buffer_writer
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Buffer_writer& val);

/**
 * Prints string representation of the given Heap_writer to the given `ostream`.
 *
 * @relatesalso Heap_writer
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Heap_writer& val);

// Template implementations.

template<typename Writer_t>
void pad(Writer_t* writer, size_t n_bytes, Error_code* err_code)
{
  constexpr size_t ZEROES_SZ = 16;
  static const uint8_t ZEROES[ZEROES_SZ] = {};

  assert(err_code);
  while (n_bytes != 0)
  {
    const size_t chunk_sz = std::min(n_bytes, ZEROES_SZ);
    writer->write(Blob_const(ZEROES, chunk_sz), err_code);
    if (*err_code)
    {
      return;
    }
    // else
    n_bytes -= chunk_sz;
  }
}

template<typename Writer_t>
size_t align(Writer_t* writer, size_t alignment, Error_code* err_code)
{
  assert(err_code);
  assert((alignment != 0) && ((alignment & (alignment - 1)) == 0) && "Alignment must be a power of 2.");

  const size_t pos = writer->pos();
  const size_t aligned_pos = align_up(pos, alignment);
  pad(writer, aligned_pos - pos, err_code);
  return aligned_pos;
}

template<typename T, typename Writer_t>
size_t align_for(Writer_t* writer, Error_code* err_code)
{
  return align(writer, alignof(T), err_code);
}

template<typename T, typename Writer_t>
size_t resolve_aligned(Writer_t* writer, const T& value, const Resolver<T>& resolver, Error_code* err_code)
{
  using Archived_t = Archived<T>;
  using Staging = std::aligned_storage_t<sizeof(Archived_t), alignof(Archived_t)>;
  static_assert(alignof(Archived_t) <= S_BUFFER_ALIGNMENT,
                "Archived types must not require more than buffer alignment.");

  assert(err_code);

  const size_t pos = align_for<Archived_t>(writer, err_code);
  if (*err_code)
  {
    return 0;
  }
  // else

  // Zero first: padding bytes inside the archived value must not carry stale memory into the archive.
  Staging staging;
  std::memset(&staging, 0, sizeof(Staging));
  Archived_t* const archived = new (&staging) Archived_t();

  Archive_traits<T>::resolve(value, resolver, Place<Archived_t>(pos, archived), err_code);
  if (*err_code)
  {
    FLOW_LOG_SET_CONTEXT(writer->get_logger(), Log_component::S_SER);
    FLOW_LOG_WARNING("Resolving archived value sized [" << sizeof(Archived_t) << "] at position [" << pos << "] "
                     "failed [" << *err_code << "] [" << err_code->message() << "].  Emitting error.");
  }
  else
  {
    writer->write(Blob_const(archived, sizeof(Archived_t)), err_code);
  }
  archived->~Archived_t();
  return pos;
} // resolve_aligned()

} // namespace zcarc::ser
