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
#include "zcarc/ser/writer.hpp"

namespace zcarc::ser
{

// Buffer_writer implementations.

Buffer_writer::Buffer_writer(flow::log::Logger* logger_ptr, Blob_mutable target) :
  flow::log::Log_context(logger_ptr, Log_component::S_SER),
  m_target(target),
  m_pos(0)
{
  FLOW_LOG_TRACE("Buffer_writer [" << *this << "]: Writing into fixed area "
                 "@[" << m_target.data() << "] sized [" << m_target.size() << "].");
}

Buffer_writer::Buffer_writer(Buffer_writer&&) = default;

Buffer_writer& Buffer_writer::operator=(Buffer_writer&&) = default;

size_t Buffer_writer::pos() const
{
  return m_pos;
}

void Buffer_writer::write(Blob_const bytes, Error_code* err_code)
{
  assert(err_code);

  const size_t n = bytes.size();
  if (n > (m_target.size() - m_pos))
  {
    FLOW_LOG_WARNING("Buffer_writer [" << *this << "]: Write of [" << n << "] bytes at position [" << m_pos << "] "
                     "would exceed capacity [" << m_target.size() << "].  Emitting error.");
    *err_code = error::Code::S_SER_WRITER_CAPACITY_EXHAUSTED;
    return;
  }
  // else

  if (n != 0)
  {
    std::memcpy(static_cast<uint8_t*>(m_target.data()) + m_pos, bytes.data(), n);
    m_pos += n;
  }
}

Blob_const Buffer_writer::written() const
{
  return Blob_const(m_target.data(), m_pos);
}

size_t Buffer_writer::capacity() const
{
  return m_target.size();
}

std::ostream& operator<<(std::ostream& os, const Buffer_writer& val)
{
  return os << '@' << &val << " pos[" << val.pos() << '/' << val.capacity() << ']';
}

// Heap_writer implementations.

Heap_writer::Heap_writer(const Config& config) :
  flow::log::Log_context(config.m_logger_ptr, Log_component::S_SER),
  m_initial_capacity((config.m_initial_capacity == 0) ? S_DEFAULT_INITIAL_CAPACITY : config.m_initial_capacity),
  m_buf(get_logger())
{
  FLOW_LOG_TRACE("Heap_writer [" << *this << "]: Started: initial capacity [" << m_initial_capacity << "].");
}

Heap_writer::Heap_writer(Heap_writer&&) = default;

Heap_writer::~Heap_writer()
{
  FLOW_LOG_TRACE("Heap_writer [" << *this << "]: Being destroyed.");
}

Heap_writer& Heap_writer::operator=(Heap_writer&&) = default;

size_t Heap_writer::pos() const
{
  return m_buf.size();
}

void Heap_writer::write(Blob_const bytes, Error_code* err_code)
{
  assert(err_code);

  const size_t n = bytes.size();
  if (n == 0)
  {
    return;
  }
  // else

  const size_t old_sz = m_buf.size();
  if (n > (m_buf.capacity() - old_sz))
  {
    grow(old_sz + n);
  }

  m_buf.resize(old_sz + n);
  std::memcpy(m_buf.begin() + old_sz, bytes.data(), n);
}

void Heap_writer::grow(size_t min_capacity)
{
  using flow::util::Blob;
  using std::max;

  const size_t old_cap = m_buf.capacity();
  const size_t new_cap = max(min_capacity, max(old_cap * 2, m_initial_capacity));

  /* A Blob cannot be reserve()d beyond its capacity once allocated; so make a new one and copy.  (The standard
   * allocator's result is aligned for any fundamental type, so S_BUFFER_ALIGNMENT holds for the new one too.) */
  Blob new_buf(get_logger());
  new_buf.reserve(new_cap);
  new_buf.resize(m_buf.size());
  if (!m_buf.empty())
  {
    std::memcpy(new_buf.begin(), m_buf.const_data(), m_buf.size());
  }
  assert((reinterpret_cast<uintptr_t>(new_buf.const_data()) % S_BUFFER_ALIGNMENT) == 0);

  FLOW_LOG_TRACE("Heap_writer [" << *this << "]: Growing capacity [" << old_cap << "] => [" << new_cap << "]; "
                 "moving [" << m_buf.size() << "] bytes written so far.");
  m_buf = std::move(new_buf);
}

Blob_const Heap_writer::written() const
{
  return Blob_const(m_buf.const_data(), m_buf.size());
}

size_t Heap_writer::capacity() const
{
  return m_buf.capacity();
}

flow::util::Blob Heap_writer::into_blob()
{
  using flow::util::Blob;

  FLOW_LOG_TRACE("Heap_writer [" << *this << "]: Giving up buffer of [" << m_buf.size() << "] bytes.");

  Blob result(std::move(m_buf));
  m_buf = Blob(get_logger());
  return result;
}

std::ostream& operator<<(std::ostream& os, const Heap_writer& val)
{
  return os << '@' << &val << " pos[" << val.pos() << '/' << val.capacity() << ']';
}

} // namespace zcarc::ser
