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

#include "zcarc/common.hpp"
#include <flow/log/simple_ostream_logger.hpp>
#include <flow/log/config.hpp>
#include <sstream>
#include <vector>

namespace zcarc::test
{

// Types.

/**
 * Heap copy of an archive at a chosen misalignment from S_BUFFER_ALIGNMENT, writable so that tests can corrupt it.
 * Shift 0 gives the alignment zcarc's own buffers have.
 */
class Test_buffer
{
public:
  // Constructors/destructor.

  /**
   * Copies `bytes`.
   *
   * @param bytes
   *        Source.
   * @param shift
   *        Copy starts this many bytes past a maximally aligned address.
   */
  explicit Test_buffer(Blob_const bytes, size_t shift = 0);

  // Methods.

  /**
   * The copy.
   * @return See above.
   */
  Blob_const bytes() const;

  /**
   * The copy, writable.
   * @return See above.
   */
  Blob_mutable mutable_bytes();

  /**
   * Byte at `pos`, writable.
   *
   * @param pos
   *        Position in the copy.
   * @return See above.
   */
  uint8_t& operator[](size_t pos);

private:
  // Data.

  /// Backing storage; its start is maximally aligned.
  std::vector<std::max_align_t> m_storage;

  /// See ctor.
  size_t m_shift;

  /// Copy size.
  size_t m_size;
}; // class Test_buffer

/**
 * Logger configured like test_logger() but writing into a string, so tests can check what was logged.
 */
class Log_capture
{
public:
  // Constructors/destructor.

  /// Constructs logger with nothing logged yet.
  Log_capture();

  // Methods.

  /**
   * The logger.
   * @return See above.
   */
  flow::log::Logger* logger();

  /**
   * Everything logged so far.
   * @return See above.
   */
  std::string text() const;

private:
  // Data.

  /// Log destination.
  std::ostringstream m_os;

  /// Severity and component configuration.
  flow::log::Config m_config;

  /// Logger writing to #m_os.
  flow::log::Simple_ostream_logger m_logger;
}; // class Log_capture

// Free functions.

/**
 * Logger for the unit tests: console, WARNING and more severe, with zcarc's component names registered.
 * @return See above.
 */
flow::log::Logger* test_logger();

} // namespace zcarc::test
