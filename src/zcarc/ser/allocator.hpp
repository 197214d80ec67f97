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
#include <flow/util/blob.hpp>
#include <boost/move/unique_ptr.hpp>
#include <vector>

namespace zcarc::ser
{

// Types.

/**
 * Allocator (see concept in ser/concepts.hpp) carving scratch space out of a caller-supplied fixed area, bump-pointer
 * style.  It never allocates; when the area is exhausted, push_alloc() emits
 * error::Code::S_SER_SCRATCH_CAPACITY_EXHAUSTED.
 *
 * Each allocation is followed, within the area itself, by a small bookkeeping record (its position, its size, and the
 * bump position before it was pushed).  So pop_alloc() can insist on the exact most recent allocation, and rewinds to
 * where the matching push started (padding included), without any heap use.
 */
class Buffer_allocator :
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs allocator with nothing allocated.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param area
   *        Scratch area.  Must remain valid while `*this` hands it out.
   */
  explicit Buffer_allocator(flow::log::Logger* logger_ptr, Blob_mutable area);

  /// Disallow copying.
  Buffer_allocator(const Buffer_allocator&) = delete;

  /// Implements move semantics.
  Buffer_allocator(Buffer_allocator&&);

  // Methods.

  /// Disallow copying.
  Buffer_allocator& operator=(const Buffer_allocator&) = delete;

  /**
   * Implements move semantics.
   * @return `*this`.
   */
  Buffer_allocator& operator=(Buffer_allocator&&);

  /**
   * Implements Allocator API.
   *
   * @param layout
   *        See Allocator concept.
   * @param err_code
   *        See Allocator concept.
   * @return See Allocator concept.
   */
  uint8_t* push_alloc(const Layout& layout, Error_code* err_code);

  /**
   * Implements Allocator API.
   *
   * @param ptr
   *        See Allocator concept.
   * @param layout
   *        See Allocator concept.
   * @param err_code
   *        See Allocator concept.
   */
  void pop_alloc(uint8_t* ptr, const Layout& layout, Error_code* err_code);

  /**
   * Bytes in use (including alignment padding and bookkeeping).
   * @return See above.
   */
  size_t used() const;

  /**
   * Number of outstanding allocations.
   * @return See above.
   */
  size_t depth() const;

private:
  // Types.

  /// Record stored right after (aligned) each allocation in #m_area; the topmost one ends at #m_pos.
  struct Entry
  {
    /// Position of what push_alloc() returned.
    size_t m_start;
    /// Requested size.
    size_t m_size;
    /// #m_pos before the push.
    size_t m_prev_pos;
  };

  // Data.

  /// The scratch area.
  Blob_mutable m_area;

  /// Bump position within #m_area.
  size_t m_pos;

  /// See depth().
  size_t m_depth;
}; // class Buffer_allocator

/**
 * Allocator (see concept in ser/concepts.hpp) that owns a chain of heap blocks, adding a larger block when the
 * current ones cannot satisfy a request.  Blocks are kept (not freed) when popped, so a serializer reused for
 * many archives quickly stops allocating altogether.
 *
 * Unlike Buffer_allocator it keeps a full record of outstanding allocations, so out-of-order pops are detected
 * exactly (pointer and size must match the most recent push).
 */
class Heap_allocator :
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

    /// Size of the first block, allocated on first push_alloc(); 0 means a reasonable default.
    size_t m_first_block_sz;
  }; // struct Config

  // Constructors/destructor.

  /**
   * Constructs allocator with no blocks.
   *
   * @param config
   *        See Config.
   */
  explicit Heap_allocator(const Config& config);

  /// Disallow copying.
  Heap_allocator(const Heap_allocator&) = delete;

  /// Implements move semantics.
  Heap_allocator(Heap_allocator&&);

  /// Logs (warning, if allocations are outstanding).
  ~Heap_allocator();

  // Methods.

  /// Disallow copying.
  Heap_allocator& operator=(const Heap_allocator&) = delete;

  /**
   * Implements move semantics.
   * @return `*this`.
   */
  Heap_allocator& operator=(Heap_allocator&&);

  /**
   * Implements Allocator API.  Cannot fail other than by `std::bad_alloc`, or by error::Code::S_LAYOUT_OVERFLOW
   * for an absurd layout.
   *
   * @param layout
   *        See Allocator concept.
   * @param err_code
   *        See Allocator concept.
   * @return See Allocator concept.
   */
  uint8_t* push_alloc(const Layout& layout, Error_code* err_code);

  /**
   * Implements Allocator API.
   *
   * @param ptr
   *        See Allocator concept.
   * @param layout
   *        See Allocator concept.
   * @param err_code
   *        See Allocator concept.
   */
  void pop_alloc(uint8_t* ptr, const Layout& layout, Error_code* err_code);

  /**
   * Number of outstanding allocations.
   * @return See above.
   */
  size_t depth() const;

  /**
   * Number of blocks allocated so far.
   * @return See above.
   */
  size_t n_blocks() const;

private:
  // Types.

  /// Record of one outstanding allocation.
  struct Entry
  {
    /// What push_alloc() returned.
    uint8_t* m_ptr;
    /// Requested size.
    size_t m_size;
    /// Block index before the push.
    size_t m_prev_block_idx;
    /// Position within that block before the push.
    size_t m_prev_pos;
  };

  // Constants.

  /// Initial block size used if Config::m_first_block_sz is 0.
  static constexpr size_t S_DEFAULT_FIRST_BLOCK_SZ = 4096;

  // Methods.

  /**
   * Tries to carve `layout` out of block #m_block_idx at #m_pos.
   *
   * @param layout
   *        Request.
   * @return Pointer, or null if it does not fit.
   */
  uint8_t* try_carve(const Layout& layout);

  // Data.

  /// See Config::m_first_block_sz.
  size_t m_first_block_sz;

  /// The blocks, in order of allocation (each at least twice the previous).
  std::vector<boost::movelib::unique_ptr<flow::util::Blob>> m_blocks;

  /// Index into #m_blocks of the block currently being carved.
  size_t m_block_idx;

  /// Bump position within the current block.
  size_t m_pos;

  /// Outstanding allocations, most recent last.
  std::vector<Entry> m_entries;
}; // class Heap_allocator

/**
 * RAII holder of at most one scratch allocation from an Allocator: pops it on destruction if not yet released.
 * The explicit release() is the normal path, as it reports a failed pop; the destructor can only log it (at WARNING
 * level), which is what happens on early-return error paths, where an error is being reported anyway.
 *
 * @tparam Allocator_t
 *         Models Allocator concept and is a `flow::log::Log_context`; e.g. Buffer_allocator, Heap_allocator,
 *         Composite_serializer.
 */
template<typename Allocator_t>
class Scratch_guard
{
public:
  // Constructors/destructor.

  /**
   * Constructs guard holding nothing.
   *
   * @param allocator
   *        Allocator.  Must outlive `*this`.
   */
  explicit Scratch_guard(Allocator_t* allocator);

  /// Disallow copying.
  Scratch_guard(const Scratch_guard&) = delete;

  /// Pops the allocation if still held.
  ~Scratch_guard();

  // Methods.

  /// Disallow copying.
  Scratch_guard& operator=(const Scratch_guard&) = delete;

  /**
   * Allocates via `push_alloc()` and holds the result.  Behavior undefined if already holding one.
   *
   * @param layout
   *        See Allocator concept.
   * @param err_code
   *        Must not be null.  See Allocator concept.
   * @return See Allocator concept.
   */
  uint8_t* push(const Layout& layout, Error_code* err_code);

  /**
   * Pops the held allocation (no-op if none).
   *
   * @param err_code
   *        Must not be null.  See Allocator concept.
   */
  void release(Error_code* err_code);

private:
  // Data.

  /// See ctor.
  Allocator_t* const m_allocator;

  /// Whether an allocation is held.
  bool m_held;

  /// Held allocation, if #m_held.  (May be null for a zero-sized allocation.)
  uint8_t* m_ptr;

  /// Layout of held allocation.
  Layout m_layout;
}; // class Scratch_guard

// Free functions.

/**
 * Prints string representation of the given Buffer_allocator to the given `ostream`.
 *
 * @relatesalso Buffer_allocator
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Buffer_allocator& val);

/**
 * Prints string representation of the given Heap_allocator to the given `ostream`.
 *
 * @relatesalso Heap_allocator
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Heap_allocator& val);

// Template implementations.

template<typename Allocator_t>
Scratch_guard<Allocator_t>::Scratch_guard(Allocator_t* allocator) :
  m_allocator(allocator),
  m_held(false),
  m_ptr(nullptr),
  m_layout{ 0, 1 }
{
  assert(m_allocator);
}

template<typename Allocator_t>
Scratch_guard<Allocator_t>::~Scratch_guard()
{
  if (!m_held)
  {
    return;
  }
  // else

  Error_code err_code;
  release(&err_code);
  if (err_code)
  {
    FLOW_LOG_SET_CONTEXT(m_allocator->get_logger(), Log_component::S_SER);
    FLOW_LOG_WARNING("Scratch_guard [" << this << "]: Scratch pop on scope exit failed "
                     "[" << err_code << "] [" << err_code.message() << "].  Scratch space is now inconsistent; "
                     "the serializer should not be used further.");
  }
}

template<typename Allocator_t>
uint8_t* Scratch_guard<Allocator_t>::push(const Layout& layout, Error_code* err_code)
{
  assert(err_code);
  assert((!m_held) && "Scratch_guard holds at most one allocation.");

  uint8_t* const ptr = m_allocator->push_alloc(layout, err_code);
  if (*err_code)
  {
    return nullptr;
  }
  // else
  m_held = true;
  m_ptr = ptr;
  m_layout = layout;
  return ptr;
}

template<typename Allocator_t>
void Scratch_guard<Allocator_t>::release(Error_code* err_code)
{
  assert(err_code);
  if (!m_held)
  {
    return;
  }
  // else

  m_held = false; // Whether or not it works, do not try again.
  m_allocator->pop_alloc(m_ptr, m_layout, err_code);
}

} // namespace zcarc::ser
