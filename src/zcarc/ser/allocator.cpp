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
#include "zcarc/ser/allocator.hpp"
#include <boost/move/make_unique.hpp>
#include <algorithm>
#include <cstring>

namespace zcarc::ser
{

// Buffer_allocator implementations.

Buffer_allocator::Buffer_allocator(flow::log::Logger* logger_ptr, Blob_mutable area) :
  flow::log::Log_context(logger_ptr, Log_component::S_SER),
  m_area(area),
  m_pos(0),
  m_depth(0)
{
  FLOW_LOG_TRACE("Buffer_allocator [" << *this << "]: Scratch space in fixed area "
                 "@[" << m_area.data() << "] sized [" << m_area.size() << "].");
}

Buffer_allocator::Buffer_allocator(Buffer_allocator&&) = default;

Buffer_allocator& Buffer_allocator::operator=(Buffer_allocator&&) = default;

uint8_t* Buffer_allocator::push_alloc(const Layout& layout, Error_code* err_code)
{
  assert(err_code);

  uint8_t* const data = static_cast<uint8_t*>(m_area.data());
  const auto base = reinterpret_cast<uintptr_t>(data);
  const size_t start = align_up(base + m_pos, layout.m_align) - base;
  const size_t entry_pos = ((start > m_area.size()) || (layout.m_size > (m_area.size() - start)))
                             ? m_area.size()
                             : (align_up(base + start + layout.m_size, alignof(Entry)) - base);

  if ((entry_pos > m_area.size()) || (sizeof(Entry) > (m_area.size() - entry_pos)))
  {
    FLOW_LOG_WARNING("Buffer_allocator [" << *this << "]: Scratch request [" << layout << "] at "
                     "position [" << m_pos << "] does not fit in [" << m_area.size() << "] bytes.  Emitting error.");
    *err_code = error::Code::S_SER_SCRATCH_CAPACITY_EXHAUSTED;
    return nullptr;
  }
  // else

  const Entry entry{ start, layout.m_size, m_pos };
  std::memcpy(data + entry_pos, &entry, sizeof(Entry));

  m_pos = entry_pos + sizeof(Entry);
  ++m_depth;
  return data + start;
}

void Buffer_allocator::pop_alloc(uint8_t* ptr, const Layout& layout, Error_code* err_code)
{
  assert(err_code);

  uint8_t* const data = static_cast<uint8_t*>(m_area.data());
  Entry top{ 0, 0, 0 };
  if (m_depth != 0)
  {
    std::memcpy(&top, data + m_pos - sizeof(Entry), sizeof(Entry));
  }

  if ((m_depth == 0) || (ptr != (data + top.m_start)) || (layout.m_size != top.m_size))
  {
    FLOW_LOG_WARNING("Buffer_allocator [" << *this << "]: Scratch pop @[" << static_cast<const void*>(ptr) << "] "
                     "[" << layout << "] is not the most recent push (depth [" << m_depth << "]).  "
                     "Emitting error.");
    *err_code = error::Code::S_SER_SCRATCH_POPPED_OUT_OF_ORDER;
    return;
  }
  // else

  m_pos = top.m_prev_pos;
  --m_depth;
}

size_t Buffer_allocator::used() const
{
  return m_pos;
}

size_t Buffer_allocator::depth() const
{
  return m_depth;
}

std::ostream& operator<<(std::ostream& os, const Buffer_allocator& val)
{
  return os << '@' << &val << " used[" << val.used() << "] depth[" << val.depth() << ']';
}

// Heap_allocator implementations.

Heap_allocator::Heap_allocator(const Config& config) :
  flow::log::Log_context(config.m_logger_ptr, Log_component::S_SER),
  m_first_block_sz((config.m_first_block_sz == 0) ? S_DEFAULT_FIRST_BLOCK_SZ : config.m_first_block_sz),
  m_block_idx(0),
  m_pos(0)
{
  FLOW_LOG_TRACE("Heap_allocator [" << *this << "]: Started: first block size [" << m_first_block_sz << "].");
}

Heap_allocator::Heap_allocator(Heap_allocator&&) = default;

Heap_allocator::~Heap_allocator()
{
  if (!m_entries.empty())
  {
    FLOW_LOG_WARNING("Heap_allocator [" << *this << "]: Being destroyed with [" << m_entries.size() << "] "
                     "scratch allocations outstanding.  Some scratch user did not pop.");
  }
  else
  {
    FLOW_LOG_TRACE("Heap_allocator [" << *this << "]: Being destroyed; [" << m_blocks.size() << "] blocks freed.");
  }
}

Heap_allocator& Heap_allocator::operator=(Heap_allocator&&) = default;

uint8_t* Heap_allocator::push_alloc(const Layout& layout, Error_code* err_code)
{
  using flow::util::Blob;
  using boost::movelib::make_unique;
  using std::max;

  assert(err_code);

  // Re-validate: a block must be able to hold size plus worst-case alignment padding.
  const auto checked = Layout::from_size_align(layout.m_size, layout.m_align, err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Heap_allocator [" << *this << "]: Scratch request [" << layout << "] is not a valid layout.  "
                     "Emitting error.");
    return nullptr;
  }
  // else

  const Entry entry{ nullptr, checked.m_size, m_block_idx, m_pos };

  uint8_t* ptr = m_blocks.empty() ? nullptr : try_carve(checked);
  while (!ptr)
  {
    if (!m_blocks.empty())
    {
      ++m_block_idx;
    }

    if (m_block_idx == m_blocks.size())
    {
      const size_t prev_sz = m_blocks.empty() ? 0 : m_blocks.back()->size();
      const size_t block_sz = max(max(m_first_block_sz, prev_sz * 2), checked.m_size + checked.m_align);

      m_blocks.emplace_back(make_unique<Blob>(get_logger()));
      auto& block = *(m_blocks.back());
      block.reserve(block_sz);
      block.resize(block_sz);

      FLOW_LOG_TRACE("Heap_allocator [" << *this << "]: Added scratch block [" << m_block_idx << "] (0-based) "
                     "@[" << static_cast<const void*>(block.const_data()) << "] sized [" << block_sz << "].");
    }
    m_pos = 0;
    ptr = try_carve(checked);
  } // while (!ptr)

  m_entries.push_back(entry);
  m_entries.back().m_ptr = ptr;
  return ptr;
} // Heap_allocator::push_alloc()

uint8_t* Heap_allocator::try_carve(const Layout& layout)
{
  auto& block = *(m_blocks[m_block_idx]);
  uint8_t* const data = block.begin();
  const auto base = reinterpret_cast<uintptr_t>(data);
  const size_t start = align_up(base + m_pos, layout.m_align) - base;

  if ((start > block.size()) || (layout.m_size > (block.size() - start)))
  {
    return nullptr;
  }
  // else
  m_pos = start + layout.m_size;
  return data + start;
}

void Heap_allocator::pop_alloc(uint8_t* ptr, const Layout& layout, Error_code* err_code)
{
  assert(err_code);

  if (m_entries.empty() || (m_entries.back().m_ptr != ptr) || (m_entries.back().m_size != layout.m_size))
  {
    FLOW_LOG_WARNING("Heap_allocator [" << *this << "]: Scratch pop @[" << static_cast<const void*>(ptr) << "] "
                     "[" << layout << "] is not the most recent push (depth [" << m_entries.size() << "]).  "
                     "Emitting error.");
    *err_code = error::Code::S_SER_SCRATCH_POPPED_OUT_OF_ORDER;
    return;
  }
  // else

  m_block_idx = m_entries.back().m_prev_block_idx;
  m_pos = m_entries.back().m_prev_pos;
  m_entries.pop_back();
}

size_t Heap_allocator::depth() const
{
  return m_entries.size();
}

size_t Heap_allocator::n_blocks() const
{
  return m_blocks.size();
}

std::ostream& operator<<(std::ostream& os, const Heap_allocator& val)
{
  return os << '@' << &val << " blocks[" << val.n_blocks() << "] depth[" << val.depth() << ']';
}

} // namespace zcarc::ser
