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

#include "zcarc/ser/writer.hpp"
#include "zcarc/ser/allocator.hpp"
#include "zcarc/ser/sharing.hpp"
#include <tuple>

namespace zcarc::ser
{

// Types.

/**
 * The serializer passed through the serialize step of every archived type: models Writer, Allocator, and Sharing
 * (see ser/concepts.hpp) by forwarding each capability to the corresponding member.  Which implementations are
 * combined is a compile-time choice; the two usual combinations are aliased as Core_serializer (fixed buffers, no
 * allocation, no unification) and Heap_serializer (growing heap buffers, unification).  A user-supplied
 * implementation of any of the three concepts can be dropped in just as well.
 *
 * @tparam Writer_t
 *         Models Writer concept.
 * @tparam Allocator_t
 *         Models Allocator concept.
 * @tparam Sharing_t
 *         Models Sharing concept.
 */
template<typename Writer_t, typename Allocator_t, typename Sharing_t>
class Composite_serializer :
  public flow::log::Log_context
{
public:
  // Types.

  /// Short-hand for template parameter.
  using Writer = Writer_t;
  /// Short-hand for template parameter.
  using Allocator = Allocator_t;
  /// Short-hand for template parameter.
  using Sharing = Sharing_t;

  // Constructors/destructor.

  /**
   * Constructs serializer from its three parts.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param writer
   *        Writer; moved-from.
   * @param allocator
   *        Allocator; moved-from.
   * @param sharing
   *        Sharing; moved-from.
   */
  explicit Composite_serializer(flow::log::Logger* logger_ptr,
                                Writer_t&& writer, Allocator_t&& allocator, Sharing_t&& sharing);

  /// Disallow copying.
  Composite_serializer(const Composite_serializer&) = delete;

  /// Implements move semantics.
  Composite_serializer(Composite_serializer&&) = default;

  // Methods.

  /// Disallow copying.
  Composite_serializer& operator=(const Composite_serializer&) = delete;

  /**
   * Implements move semantics.
   * @return `*this`.
   */
  Composite_serializer& operator=(Composite_serializer&&) = default;

  /**
   * Implements Writer API by forwarding to writer().
   * @return See Writer concept.
   */
  size_t pos() const;

  /**
   * Implements Writer API by forwarding to writer().
   *
   * @param bytes
   *        See Writer concept.
   * @param err_code
   *        See Writer concept.
   */
  void write(Blob_const bytes, Error_code* err_code);

  /**
   * Implements Allocator API by forwarding to allocator().
   *
   * @param layout
   *        See Allocator concept.
   * @param err_code
   *        See Allocator concept.
   * @return See Allocator concept.
   */
  uint8_t* push_alloc(const Layout& layout, Error_code* err_code);

  /**
   * Implements Allocator API by forwarding to allocator().
   *
   * @param ptr
   *        See Allocator concept.
   * @param layout
   *        See Allocator concept.
   * @param err_code
   *        See Allocator concept.
   */
  void pop_alloc(uint8_t* ptr, const Layout& layout, Error_code* err_code);

  /**
   * Implements Sharing API by forwarding to sharing().
   *
   * @param address
   *        See Sharing concept.
   * @return See Sharing concept.
   */
  std::optional<size_t> get_shared_ptr(const void* address) const;

  /**
   * Implements Sharing API by forwarding to sharing().
   *
   * @param address
   *        See Sharing concept.
   * @param pos
   *        See Sharing concept.
   * @param err_code
   *        See Sharing concept.
   */
  void add_shared_ptr(const void* address, size_t pos, Error_code* err_code);

  /**
   * The Writer.
   * @return See above.
   */
  Writer_t& writer();

  /**
   * The Writer.
   * @return See above.
   */
  const Writer_t& writer() const;

  /**
   * The Allocator.
   * @return See above.
   */
  Allocator_t& allocator();

  /**
   * The Sharing.
   * @return See above.
   */
  Sharing_t& sharing();

  /**
   * Dismantles `*this` into its parts, e.g. to take the finished buffer out of the Writer.
   * @return Writer, Allocator, Sharing, in that order.
   */
  std::tuple<Writer_t, Allocator_t, Sharing_t> into_raw_parts() &&;

private:
  // Data.

  /// See writer().
  Writer_t m_writer;

  /// See allocator().
  Allocator_t m_allocator;

  /// See sharing().
  Sharing_t m_sharing;
}; // class Composite_serializer

// Free functions.

/**
 * Constructs Core_serializer writing into `target` with scratch space `scratch`.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param target
 *        See Buffer_writer.
 * @param scratch
 *        See Buffer_allocator.
 * @return See above.
 */
Core_serializer make_core_serializer(flow::log::Logger* logger_ptr, Blob_mutable target, Blob_mutable scratch);

/**
 * Constructs Heap_serializer with default-sized buffers.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @return See above.
 */
Heap_serializer make_heap_serializer(flow::log::Logger* logger_ptr);

/**
 * Prints string representation of the given serializer to the given `ostream`.
 *
 * @relatesalso Composite_serializer
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename Writer_t, typename Allocator_t, typename Sharing_t>
std::ostream& operator<<(std::ostream& os, const Composite_serializer<Writer_t, Allocator_t, Sharing_t>& val);

// Template implementations.

template<typename Writer_t, typename Allocator_t, typename Sharing_t>
Composite_serializer<Writer_t, Allocator_t, Sharing_t>::Composite_serializer
  (flow::log::Logger* logger_ptr, Writer_t&& writer, Allocator_t&& allocator, Sharing_t&& sharing) :

  flow::log::Log_context(logger_ptr, Log_component::S_SER),
  m_writer(std::move(writer)),
  m_allocator(std::move(allocator)),
  m_sharing(std::move(sharing))
{
  FLOW_LOG_TRACE("Composite_serializer [" << *this << "]: Started at position [" << m_writer.pos() << "].");
}

template<typename Writer_t, typename Allocator_t, typename Sharing_t>
size_t Composite_serializer<Writer_t, Allocator_t, Sharing_t>::pos() const
{
  return m_writer.pos();
}

template<typename Writer_t, typename Allocator_t, typename Sharing_t>
void Composite_serializer<Writer_t, Allocator_t, Sharing_t>::write(Blob_const bytes, Error_code* err_code)
{
  m_writer.write(bytes, err_code);
}

template<typename Writer_t, typename Allocator_t, typename Sharing_t>
uint8_t* Composite_serializer<Writer_t, Allocator_t, Sharing_t>::push_alloc(const Layout& layout,
                                                                           Error_code* err_code)
{
  return m_allocator.push_alloc(layout, err_code);
}

template<typename Writer_t, typename Allocator_t, typename Sharing_t>
void Composite_serializer<Writer_t, Allocator_t, Sharing_t>::pop_alloc(uint8_t* ptr, const Layout& layout,
                                                                      Error_code* err_code)
{
  m_allocator.pop_alloc(ptr, layout, err_code);
}

template<typename Writer_t, typename Allocator_t, typename Sharing_t>
std::optional<size_t>
  Composite_serializer<Writer_t, Allocator_t, Sharing_t>::get_shared_ptr(const void* address) const
{
  return m_sharing.get_shared_ptr(address);
}

template<typename Writer_t, typename Allocator_t, typename Sharing_t>
void Composite_serializer<Writer_t, Allocator_t, Sharing_t>::add_shared_ptr(const void* address, size_t pos,
                                                                           Error_code* err_code)
{
  m_sharing.add_shared_ptr(address, pos, err_code);
}

template<typename Writer_t, typename Allocator_t, typename Sharing_t>
Writer_t& Composite_serializer<Writer_t, Allocator_t, Sharing_t>::writer()
{
  return m_writer;
}

template<typename Writer_t, typename Allocator_t, typename Sharing_t>
const Writer_t& Composite_serializer<Writer_t, Allocator_t, Sharing_t>::writer() const
{
  return m_writer;
}

template<typename Writer_t, typename Allocator_t, typename Sharing_t>
Allocator_t& Composite_serializer<Writer_t, Allocator_t, Sharing_t>::allocator()
{
  return m_allocator;
}

template<typename Writer_t, typename Allocator_t, typename Sharing_t>
Sharing_t& Composite_serializer<Writer_t, Allocator_t, Sharing_t>::sharing()
{
  return m_sharing;
}

template<typename Writer_t, typename Allocator_t, typename Sharing_t>
std::tuple<Writer_t, Allocator_t, Sharing_t> Composite_serializer<Writer_t, Allocator_t, Sharing_t>::into_raw_parts() &&
{
  FLOW_LOG_TRACE("Composite_serializer [" << *this << "]: Dismantling at position [" << m_writer.pos() << "].");
  return std::tuple<Writer_t, Allocator_t, Sharing_t>(std::move(m_writer), std::move(m_allocator),
                                                      std::move(m_sharing));
}

template<typename Writer_t, typename Allocator_t, typename Sharing_t>
std::ostream& operator<<(std::ostream& os, const Composite_serializer<Writer_t, Allocator_t, Sharing_t>& val)
{
  return os << '@' << &val << " pos[" << val.pos() << ']';
}

} // namespace zcarc::ser
