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
#include "zcarc/ser/sharing.hpp"

namespace zcarc::ser
{

// Unify implementations.

Unify::Unify(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_SER)
{
  // That's it.
}

Unify::Unify(Unify&&) = default;

Unify& Unify::operator=(Unify&&) = default;

std::optional<size_t> Unify::get_shared_ptr(const void* address) const
{
  const auto it = m_shared_positions.find(address);
  if (it == m_shared_positions.end())
  {
    return std::nullopt;
  }
  // else
  return it->second;
}

void Unify::add_shared_ptr(const void* address, size_t pos, Error_code* err_code)
{
  assert(err_code);

  const bool inserted = m_shared_positions.emplace(address, pos).second;
  if (inserted)
  {
    FLOW_LOG_TRACE("Unify [" << *this << "]: Shared value @[" << address << "] archived at position [" << pos << "].");
  }
}

size_t Unify::size() const
{
  return m_shared_positions.size();
}

void Unify::clear()
{
  m_shared_positions.clear();
}

std::ostream& operator<<(std::ostream& os, const Unify& val)
{
  return os << '@' << &val << " shared[" << val.size() << ']';
}

// Duplicate implementations.

std::optional<size_t> Duplicate::get_shared_ptr(const void*) const
{
  return std::nullopt;
}

void Duplicate::add_shared_ptr(const void*, size_t, [[maybe_unused]] Error_code* err_code)
{
  assert(err_code);
}

} // namespace zcarc::ser
