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
#include "zcarc/primitives.hpp"

namespace zcarc
{

// Types.

/**
 * Validation hook for archived type `Archived_t`: determines whether the bytes at a given address, which lie within
 * the validation context's active subtree range and are suitably aligned, form a valid `Archived_t`.  Everything that
 * can be read from an untrusted buffer must have one.
 *
 * The primary template forwards to `Archived_t::check_bytes(value, context, err_code)`, which is how the archived
 * types defined by zcarc (and, typically, by users for their own records) provide it.  Specializations cover the
 * scalar types, which cannot hold invalid bit patterns (save for Archived_bool which has its own check_bytes()).
 *
 * An archived record containing pointers must, in its check_bytes(), check each of its fields in turn; each pointer
 * field in turn bounds-checks its target and pushes/pops a subtree range around the recursive check (see
 * Archived_box::check_bytes()).
 *
 * `Context` is a validation context: it must provide the Archive_validator-style API and, if shared pointers may be
 * present, the Shared_validator-style API; validation::Validator provides both.
 *
 * @tparam Archived_t
 *         Archived type.
 * @tparam Enable
 *         Leave as `void`; for SFINAE-based specializations.
 */
template<typename Archived_t, typename Enable>
struct Check_bytes
{
  /**
   * Validates `*value`.  On failure sets `*err_code`.
   *
   * @tparam Context
   *         See class doc header.
   * @param value
   *        Address of the unvalidated value.
   * @param context
   *        Validation context.
   * @param err_code
   *        Must not be null.
   */
  template<typename Context>
  static void check(const Archived_t* value, Context* context, Error_code* err_code)
  {
    Archived_t::check_bytes(value, context, err_code);
  }
};

/**
 * Check_bytes for little-endian scalars: every bit pattern is valid.
 *
 * @tparam Order
 *         See `boost::endian::endian_arithmetic`.
 * @tparam T
 *         See `boost::endian::endian_arithmetic`.
 * @tparam N_BITS
 *         See `boost::endian::endian_arithmetic`.
 * @tparam Align
 *         See `boost::endian::endian_arithmetic`.
 */
template<boost::endian::order Order, typename T, size_t N_BITS, boost::endian::align Align>
struct Check_bytes<boost::endian::endian_arithmetic<Order, T, N_BITS, Align>, void>
{
  /**
   * No-op.
   *
   * @tparam Context
   *         Unused.
   * @param err_code
   *        Unused.
   */
  template<typename Context>
  static void check(const boost::endian::endian_arithmetic<Order, T, N_BITS, Align>*, Context*, Error_code*)
  {
    // Nothing to do.
  }
};

/// Check_bytes for `char` (string contents): every byte is valid.
template<>
struct Check_bytes<char, void>
{
  /**
   * No-op.
   *
   * @tparam Context
   *         Unused.
   */
  template<typename Context>
  static void check(const char*, Context*, Error_code*)
  {
    // Nothing to do.
  }
};

// Free functions.

/**
 * Short-hand for `Check_bytes<Archived_t>::check(value, context, err_code)`.
 *
 * @tparam Archived_t
 *         Archived type.
 * @tparam Context
 *         Validation context type.
 * @param value
 *        See Check_bytes::check().
 * @param context
 *        See Check_bytes::check().
 * @param err_code
 *        See Check_bytes::check().
 */
template<typename Archived_t, typename Context>
void check_bytes(const Archived_t* value, Context* context, Error_code* err_code)
{
  Check_bytes<Archived_t>::check(value, context, err_code);
}

} // namespace zcarc
