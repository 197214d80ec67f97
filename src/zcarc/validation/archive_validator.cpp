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
#include "zcarc/validation/archive_validator.hpp"

namespace zcarc::validation
{

// Archive_validator implementations.

Archive_validator::Archive_validator(flow::log::Logger* logger_ptr, Blob_const bytes, size_t max_subtree_depth) :
  flow::log::Log_context(logger_ptr, Log_component::S_VALIDATION),
  m_bytes(bytes),
  m_max_subtree_depth(max_subtree_depth),
  m_active{ 0, bytes.size() }
{
  FLOW_LOG_TRACE("Archive_validator [" << *this << "]: Validating buffer @[" << m_bytes.data() << "] "
                 "sized [" << m_bytes.size() << "]; max subtree depth [" << m_max_subtree_depth << "] "
                 "(0 = unlimited).");
}

const uint8_t* Archive_validator::base() const
{
  return static_cast<const uint8_t*>(m_bytes.data());
}

size_t Archive_validator::size() const
{
  return m_bytes.size();
}

void Archive_validator::check_subtree_ptr(size_t pos, const Layout& layout, Error_code* err_code) const
{
  assert(err_code);

  if ((pos < m_active.m_start) || (pos > m_active.m_end) || (layout.m_size > (m_active.m_end - pos)))
  {
    FLOW_LOG_WARNING("Archive_validator [" << *this << "]: Object at position [" << pos << "] with "
                     "[" << layout << "] is not within active range " << m_active << ".  Emitting error.");
    *err_code = error::Code::S_VALIDATION_POINTER_OUT_OF_BOUNDS;
    return;
  }
  // else

  const auto address = reinterpret_cast<uintptr_t>(base()) + pos;
  if ((address & (layout.m_align - 1)) != 0)
  {
    FLOW_LOG_WARNING("Archive_validator [" << *this << "]: Object at position [" << pos << "] "
                     "(address @[" << static_cast<const void*>(base() + pos) << "]) is not aligned to "
                     "[" << layout.m_align << "].  Emitting error.");
    *err_code = error::Code::S_VALIDATION_POINTER_MISALIGNED;
  }
}

Subtree_range Archive_validator::push_subtree_range(size_t root, size_t end, Error_code* err_code)
{
  assert(err_code);

  if (!((m_active.m_start <= root) && (root <= end) && (end <= m_active.m_end)))
  {
    FLOW_LOG_WARNING("Archive_validator [" << *this << "]: Subtree [" << root << ", " << end << ") does not lie "
                     "within active range " << m_active << ".  Emitting error.");
    *err_code = error::Code::S_VALIDATION_RANGE_UNDERFLOW;
    return m_active;
  }
  // else

  if ((m_max_subtree_depth != 0) && (m_pushed.size() >= m_max_subtree_depth))
  {
    FLOW_LOG_WARNING("Archive_validator [" << *this << "]: Subtree [" << root << ", " << end << ") would exceed "
                     "max subtree depth [" << m_max_subtree_depth << "].  Emitting error.");
    *err_code = error::Code::S_VALIDATION_SUBTREE_DEPTH_EXCEEDED;
    return m_active;
  }
  // else

  const Subtree_range remainder{ end, m_active.m_end };
  m_active.m_end = root;
  m_pushed.push_back(remainder);

  FLOW_LOG_TRACE("Archive_validator [" << *this << "]: Pushed subtree [" << root << ", " << end << "); "
                 "active range now " << m_active << "; depth [" << m_pushed.size() << "].");
  return remainder;
}

void Archive_validator::pop_subtree_range(const Subtree_range& range, Error_code* err_code)
{
  assert(err_code);

  if (m_pushed.empty() || (m_pushed.back() != range) || (range.m_start < m_active.m_end))
  {
    FLOW_LOG_WARNING("Archive_validator [" << *this << "]: Pop of " << range << " does not match most recent push "
                     "(depth [" << m_pushed.size() << "]; active range " << m_active << ").  Emitting error.");
    *err_code = error::Code::S_VALIDATION_RANGE_POPPED_OUT_OF_ORDER;
    return;
  }
  // else

  m_active = range;
  m_pushed.pop_back();
}

void Archive_validator::check_balanced(Error_code* err_code) const
{
  assert(err_code);

  if (!m_pushed.empty())
  {
    FLOW_LOG_WARNING("Archive_validator [" << *this << "]: Validation finished with [" << m_pushed.size() << "] "
                     "subtree ranges still pushed.  Emitting error.");
    *err_code = error::Code::S_VALIDATION_UNBALANCED_RANGES;
  }
}

Subtree_range Archive_validator::active_range() const
{
  return m_active;
}

size_t Archive_validator::depth() const
{
  return m_pushed.size();
}

bool operator==(const Subtree_range& val1, const Subtree_range& val2)
{
  return (val1.m_start == val2.m_start) && (val1.m_end == val2.m_end);
}

bool operator!=(const Subtree_range& val1, const Subtree_range& val2)
{
  return !(val1 == val2);
}

std::ostream& operator<<(std::ostream& os, const Subtree_range& val)
{
  return os << '[' << val.m_start << ", " << val.m_end << ')';
}

std::ostream& operator<<(std::ostream& os, const Archive_validator& val)
{
  return os << '@' << &val;
}

} // namespace zcarc::validation
