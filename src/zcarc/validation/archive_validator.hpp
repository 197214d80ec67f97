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
#include <vector>

namespace zcarc::validation
{

// Types.

/// Half-open range `[m_start, m_end)` of positions in the archive being validated.
struct Subtree_range
{
  // Data.

  /// First position in range.
  size_t m_start;

  /// One past last position in range.
  size_t m_end;
}; // struct Subtree_range

/**
 * The core validation context: tracks which part of an untrusted buffer may still be claimed by a pointer, so that
 * every pointer is in bounds and no two archived objects (other than a shared value reached via Archived_rc) overlap.
 *
 * ### Model ###
 * The archive is written front to back, and an object's out-of-line data is always written *before* the object.
 * So validation descends from the root (at the back) and, at each object, claims the object's bytes and confines its
 * children to the bytes *preceding* it.  In detail, the validator holds an *active range*, initially the whole
 * buffer.  When a pointer to an object occupying `[root, end)` is followed:
 *   - check_subtree_ptr() verifies the object lies within the active range and is aligned;
 *   - push_subtree_range(root, end) narrows the active range to `[active.start, root)` (where the object's children
 *     must lie), and returns the *remainder* `[end, active.end)` as a token;
 *   - the object is checked (recursively, for its own pointers);
 *   - pop_subtree_range(token) makes the remainder the active range.  The object and everything before it are now
 *     consumed: no later pointer may claim them.
 *
 * Pushes and pops must be strictly nested: popping any token other than the most recently pushed one, or popping a
 * token that starts before the current active end (i.e., a child claimed bytes past it), fails with
 * error::Code::S_VALIDATION_RANGE_POPPED_OUT_OF_ORDER.  After the root is checked, check_balanced() ensures nothing
 * remains pushed.
 *
 * Positions are used throughout (offsets from buffer start), so arithmetic is on sizes, not pointers; only the
 * alignment check looks at the absolute address, since alignment is a property of memory, not of position.
 *
 * An optional maximum depth (count of simultaneously pushed ranges) bounds the recursion that a malicious, deeply
 * nested buffer can cause.
 *
 * Once any method emitted an error, `*this` should be discarded.
 */
class Archive_validator :
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs validator with the whole of `bytes` active and nothing pushed.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param bytes
   *        The untrusted buffer.  Must remain valid while `*this` is used.
   * @param max_subtree_depth
   *        Maximum number of simultaneously pushed ranges; 0 means unlimited.
   */
  explicit Archive_validator(flow::log::Logger* logger_ptr, Blob_const bytes, size_t max_subtree_depth = 0);

  // Methods.

  /**
   * Start of the buffer being validated.
   * @return See above.
   */
  const uint8_t* base() const;

  /**
   * Size of the buffer being validated.
   * @return See above.
   */
  size_t size() const;

  /**
   * Checks that an object with the given layout at position `pos` lies entirely within the active range and that its
   * absolute address satisfies `layout.m_align`.
   *
   * @param pos
   *        Position of object.
   * @param layout
   *        Its layout.
   * @param err_code
   *        Must not be null.  error::Code::S_VALIDATION_POINTER_OUT_OF_BOUNDS or
   *        error::Code::S_VALIDATION_POINTER_MISALIGNED.
   */
  void check_subtree_ptr(size_t pos, const Layout& layout, Error_code* err_code) const;

  /**
   * Claims `[root, end)` and confines subsequent checks to `[active.start, root)`; returns the remainder.  See class
   * doc header.
   *
   * @param root
   *        Start of claimed object.
   * @param end
   *        End of claimed object.
   * @param err_code
   *        Must not be null.  error::Code::S_VALIDATION_RANGE_UNDERFLOW unless
   *        `active.start <= root <= end <= active.end`; error::Code::S_VALIDATION_SUBTREE_DEPTH_EXCEEDED.
   * @return The token to pass to pop_subtree_range().  Meaningless on error.
   */
  Subtree_range push_subtree_range(size_t root, size_t end, Error_code* err_code);

  /**
   * Undoes the matching push_subtree_range(), making `range` the active range.  See class doc header.
   *
   * @param range
   *        What the matching push returned.
   * @param err_code
   *        Must not be null.  error::Code::S_VALIDATION_RANGE_POPPED_OUT_OF_ORDER.
   */
  void pop_subtree_range(const Subtree_range& range, Error_code* err_code);

  /**
   * Emits error if any pushed range was not popped.
   *
   * @param err_code
   *        Must not be null.  error::Code::S_VALIDATION_UNBALANCED_RANGES.
   */
  void check_balanced(Error_code* err_code) const;

  /**
   * The active range.
   * @return See above.
   */
  Subtree_range active_range() const;

  /**
   * Number of ranges pushed and not yet popped.
   * @return See above.
   */
  size_t depth() const;

private:
  // Data.

  /// See ctor.
  Blob_const m_bytes;

  /// See ctor.
  size_t m_max_subtree_depth;

  /// See active_range().
  Subtree_range m_active;

  /// Tokens returned by push_subtree_range() and not yet popped, most recent last.
  std::vector<Subtree_range> m_pushed;
}; // class Archive_validator

// Free functions.

/**
 * Returns `true` if and only if the two ranges are equal.
 *
 * @relatesalso Subtree_range
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator==(const Subtree_range& val1, const Subtree_range& val2);

/**
 * Returns `!(val1 == val2)`.
 *
 * @relatesalso Subtree_range
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator!=(const Subtree_range& val1, const Subtree_range& val2);

/**
 * Prints string representation of the given range to the given `ostream`.
 *
 * @relatesalso Subtree_range
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Subtree_range& val);

/**
 * Prints string representation of the given validator to the given `ostream`.
 *
 * @relatesalso Archive_validator
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Archive_validator& val);

} // namespace zcarc::validation
