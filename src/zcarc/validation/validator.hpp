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

#include "zcarc/validation/archive_validator.hpp"
#include "zcarc/validation/shared_validator.hpp"

namespace zcarc::validation
{

// Types.

/**
 * The default validation context: an Archive_validator plus a Shared_validator, with the union of their APIs, which
 * is what the check_bytes() of every archived type provided by zcarc may require.  Pass it (or anything with the same
 * API) to the `*_with_context()` access functions; or just use access() and friends, which construct one.
 */
class Validator :
  public flow::log::Log_context
{
public:
  // Types.

  /// Short-hand for Shared_validator type identity.
  using Type_id = Shared_validator::Type_id;

  /// Configuration (all values may be defaulted).
  struct Config
  {
    // Data.

    /// Logger to use for logging subsequently.
    flow::log::Logger* m_logger_ptr;

    /// See Archive_validator ctor.  0 means unlimited.
    size_t m_max_subtree_depth;
  }; // struct Config

  // Constructors/destructor.

  /**
   * Constructs validator for the given buffer.
   *
   * @param config
   *        See Config.
   * @param bytes
   *        See Archive_validator ctor.
   */
  explicit Validator(const Config& config, Blob_const bytes);

  // Methods.

  /**
   * See Archive_validator.
   * @return See above.
   */
  const uint8_t* base() const;

  /**
   * See Archive_validator.
   * @return See above.
   */
  size_t size() const;

  /**
   * See Archive_validator.
   *
   * @param pos
   *        See Archive_validator.
   * @param layout
   *        See Archive_validator.
   * @param err_code
   *        See Archive_validator.
   */
  void check_subtree_ptr(size_t pos, const Layout& layout, Error_code* err_code) const;

  /**
   * See Archive_validator.
   *
   * @param root
   *        See Archive_validator.
   * @param end
   *        See Archive_validator.
   * @param err_code
   *        See Archive_validator.
   * @return See Archive_validator.
   */
  Subtree_range push_subtree_range(size_t root, size_t end, Error_code* err_code);

  /**
   * See Archive_validator.
   *
   * @param range
   *        See Archive_validator.
   * @param err_code
   *        See Archive_validator.
   */
  void pop_subtree_range(const Subtree_range& range, Error_code* err_code);

  /**
   * See Archive_validator.
   *
   * @param err_code
   *        See Archive_validator.
   */
  void check_balanced(Error_code* err_code) const;

  /**
   * See Shared_validator.
   *
   * @param pos
   *        See Shared_validator.
   * @param type_id
   *        See Shared_validator.
   * @param err_code
   *        See Shared_validator.
   * @return See Shared_validator.
   */
  bool register_shared_ptr(size_t pos, const Type_id& type_id, Error_code* err_code);

  /**
   * The Archive_validator part.
   * @return See above.
   */
  const Archive_validator& archive_validator() const;

  /**
   * The Shared_validator part.
   * @return See above.
   */
  const Shared_validator& shared_validator() const;

private:
  // Data.

  /// See archive_validator().
  Archive_validator m_archive_validator;

  /// See shared_validator().
  Shared_validator m_shared_validator;
}; // class Validator

} // namespace zcarc::validation
