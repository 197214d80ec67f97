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
#include "zcarc/archive.hpp"
#include <ostream>

namespace zcarc
{

// Archived_string implementations.

Archived_string::Archived_string() = default;

String_view Archived_string::as_str() const
{
  return String_view(m_box.rel_ptr().as_ptr(), size());
}

size_t Archived_string::size() const
{
  return m_box.rel_ptr().metadata();
}

bool Archived_string::empty() const
{
  return size() == 0;
}

Pinned<char[]> Archived_string::get_pin_mut()
{
  return m_box.get_pin_mut();
}

void Archived_string::resolve_from_str(const std::string& value, const Box_resolver& resolver,
                                       Place<Archived_string> out, Error_code* err_code) // Static.
{
  Archived_box<char[]>::resolve_from_ref(value, resolver, out.field(&Archived_string::m_box), err_code);
}

bool operator==(const Archived_string& val1, String_view val2)
{
  return val1.as_str() == val2;
}

bool operator!=(const Archived_string& val1, String_view val2)
{
  return !(val1 == val2);
}

std::ostream& operator<<(std::ostream& os, const Archived_string& val)
{
  return os << val.as_str();
}

} // namespace zcarc
