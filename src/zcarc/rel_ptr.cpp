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
#include "zcarc/rel_ptr.hpp"
#include <limits>

namespace zcarc::detail
{

// Implementations.

int32_t rel_offset(size_t from_pos, size_t to_pos, Error_code* err_code)
{
  using std::numeric_limits;
  assert(err_code);

  // Work with magnitudes, so that neither direction can overflow before the range check.
  if (to_pos >= from_pos)
  {
    const size_t delta = to_pos - from_pos;
    if (delta > static_cast<size_t>(numeric_limits<int32_t>::max()))
    {
      *err_code = error::Code::S_SER_OFFSET_OUT_OF_RANGE;
      return 0;
    }
    // else
    return static_cast<int32_t>(delta);
  }
  // else

  const size_t delta = from_pos - to_pos;
  // |INT32_MIN| = INT32_MAX + 1.
  if (delta > (static_cast<size_t>(numeric_limits<int32_t>::max()) + 1))
  {
    *err_code = error::Code::S_SER_OFFSET_OUT_OF_RANGE;
    return 0;
  }
  // else
  return static_cast<int32_t>(-static_cast<int64_t>(delta));
} // rel_offset()

uint32_t rel_len(size_t n_elems, Error_code* err_code)
{
  assert(err_code);
  if (n_elems > static_cast<size_t>(std::numeric_limits<uint32_t>::max()))
  {
    *err_code = error::Code::S_SER_OFFSET_OUT_OF_RANGE;
    return 0;
  }
  // else
  return static_cast<uint32_t>(n_elems);
}

} // namespace zcarc::detail
