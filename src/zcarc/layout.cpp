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
#include "zcarc/layout.hpp"
#include <cstdint>
#include <limits>

namespace zcarc
{

// Implementations.

Layout Layout::from_size_align(size_t size, size_t align, Error_code* err_code) // Static.
{
  assert(err_code);

  constexpr auto MAX_SZ = static_cast<size_t>(std::numeric_limits<std::ptrdiff_t>::max());

  if ((align == 0) || ((align & (align - 1)) != 0))
  {
    // Only ever computed from real C++ types, so this is on us (or the collaborator), not on the buffer.
    assert(false && "Alignment must be a nonzero power of 2.");
    *err_code = error::Code::S_LAYOUT_OVERFLOW;
    return Layout{ 0, 1 };
  }
  // else

  // Rounding up to `align` must not exceed MAX_SZ either.
  if (size > (MAX_SZ - (align - 1)))
  {
    *err_code = error::Code::S_LAYOUT_OVERFLOW;
    return Layout{ 0, align };
  }
  // else
  return Layout{ size, align };
}

Layout Layout::array(const Layout& elem, size_t n_elems, Error_code* err_code) // Static.
{
  assert(err_code);

  const size_t stride = elem.padded_size();
  if ((stride != 0) && (n_elems > (std::numeric_limits<size_t>::max() / stride)))
  {
    *err_code = error::Code::S_LAYOUT_OVERFLOW;
    return Layout{ 0, elem.m_align };
  }
  // else
  return from_size_align(stride * n_elems, elem.m_align, err_code);
}

size_t Layout::padded_size() const
{
  return align_up(m_size, m_align);
}

std::ostream& operator<<(std::ostream& os, const Layout& val)
{
  return os << "size[" << val.m_size << "]/align[" << val.m_align << ']';
}

bool operator==(const Layout& val1, const Layout& val2)
{
  return (val1.m_size == val2.m_size) && (val1.m_align == val2.m_align);
}

bool operator!=(const Layout& val1, const Layout& val2)
{
  return !(val1 == val2);
}

} // namespace zcarc
