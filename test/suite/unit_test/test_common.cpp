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
#include "test_common.hpp"
#include <cstring>

namespace zcarc::test
{

namespace
{

/// Registers the Flow and zcarc log components in `config`.
void init_components(flow::log::Config* config)
{
  using flow::Flow_log_component;

  config->init_component_to_union_idx_mapping<Flow_log_component>(1000, 999);
  config->init_component_names<Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "flow-");
  config->init_component_to_union_idx_mapping<Log_component>(2000, 999);
  config->init_component_names<Log_component>(S_ZCARC_LOG_COMPONENT_NAME_MAP, false, "zcarc-");
}

} // namespace (anon)

// Test_buffer implementations.

Test_buffer::Test_buffer(Blob_const bytes, size_t shift) :
  m_storage(((bytes.size() + shift) / sizeof(std::max_align_t)) + 1),
  m_shift(shift),
  m_size(bytes.size())
{
  if (m_size != 0)
  {
    std::memcpy(reinterpret_cast<uint8_t*>(m_storage.data()) + m_shift, bytes.data(), m_size);
  }
}

Blob_const Test_buffer::bytes() const
{
  return Blob_const(reinterpret_cast<const uint8_t*>(m_storage.data()) + m_shift, m_size);
}

Blob_mutable Test_buffer::mutable_bytes()
{
  return Blob_mutable(reinterpret_cast<uint8_t*>(m_storage.data()) + m_shift, m_size);
}

uint8_t& Test_buffer::operator[](size_t pos)
{
  assert(pos < m_size);
  return reinterpret_cast<uint8_t*>(m_storage.data())[m_shift + pos];
}

// Free function implementations.

flow::log::Logger* test_logger()
{
  using flow::log::Config;
  using flow::log::Sev;
  using flow::log::Simple_ostream_logger;

  static Config s_config = []()
  {
    Config config(Sev::S_WARNING);
    init_components(&config);
    return config;
  }();
  static Simple_ostream_logger s_logger(&s_config);
  return &s_logger;
}

// Log_capture implementations.

Log_capture::Log_capture() :
  m_config(flow::log::Sev::S_WARNING),
  m_logger(&m_config, m_os, m_os)
{
  init_components(&m_config);
}

flow::log::Logger* Log_capture::logger()
{
  return &m_logger;
}

std::string Log_capture::text() const
{
  return m_os.str();
}

} // namespace zcarc::test
