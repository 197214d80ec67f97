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
#include "zcarc/archive.hpp"
#include "zcarc/error.hpp"
#include "test_common.hpp"
#include <gtest/gtest.h>
#include <flow/error/error.hpp>
#include <vector>
#include <algorithm>

namespace zcarc::test
{

namespace
{

/// Writer that only counts, starting far into an imaginary archive.
class Counting_writer :
  public flow::log::Log_context
{
public:
  explicit Counting_writer(flow::log::Logger* logger_ptr, size_t start_pos) :
    flow::log::Log_context(logger_ptr, Log_component::S_SER),
    m_pos(start_pos)
  {
    // That's it.
  }

  size_t pos() const
  {
    return m_pos;
  }

  void write(Blob_const bytes, Error_code*)
  {
    m_pos += bytes.size();
  }

private:
  size_t m_pos;
}; // class Counting_writer

} // namespace (anon)

TEST(Buffer_writer, Write_and_pad)
{
  alignas(S_BUFFER_ALIGNMENT) uint8_t buf[16];
  ser::Buffer_writer writer(test_logger(), Blob_mutable(buf, sizeof(buf)));
  EXPECT_EQ(writer.pos(), 0u);
  EXPECT_EQ(writer.capacity(), sizeof(buf));

  Error_code err_code;
  const uint8_t bytes[] = { 1, 2, 3 };
  writer.write(Blob_const(bytes, sizeof(bytes)), &err_code);
  ASSERT_FALSE(err_code);
  EXPECT_EQ(writer.pos(), 3u);

  EXPECT_EQ(ser::align(&writer, 8, &err_code), 8u);
  ASSERT_FALSE(err_code);
  EXPECT_EQ(writer.pos(), 8u);
  for (size_t idx = 3; idx != 8; ++idx)
  {
    EXPECT_EQ(buf[idx], 0) << "padding at [" << idx << "]";
  }
  EXPECT_EQ(writer.written().size(), 8u);
  EXPECT_EQ(writer.written().data(), static_cast<const void*>(buf));
}

TEST(Buffer_writer, Capacity_exhausted)
{
  alignas(S_BUFFER_ALIGNMENT) uint8_t buf[4];
  ser::Buffer_writer writer(test_logger(), Blob_mutable(buf, sizeof(buf)));

  Error_code err_code;
  const uint8_t bytes[] = { 1, 2, 3, 4, 5 };
  writer.write(Blob_const(bytes, 3), &err_code);
  ASSERT_FALSE(err_code);
  writer.write(Blob_const(bytes, 2), &err_code);
  EXPECT_EQ(err_code, error::Code::S_SER_WRITER_CAPACITY_EXHAUSTED);
  EXPECT_EQ(writer.pos(), 3u); // Nothing partially written.
}

TEST(Heap_writer, Grows_and_keeps_content)
{
  ser::Heap_writer writer(ser::Heap_writer::Config{ test_logger(), 8 });

  std::vector<uint8_t> expected;
  Error_code err_code;
  for (uint8_t val = 0; val != 100; ++val)
  {
    const uint8_t bytes[] = { val, static_cast<uint8_t>(val + 1) };
    writer.write(Blob_const(bytes, sizeof(bytes)), &err_code);
    ASSERT_FALSE(err_code);
    expected.insert(expected.end(), bytes, bytes + sizeof(bytes));
  }
  EXPECT_EQ(writer.pos(), expected.size());
  EXPECT_GE(writer.capacity(), expected.size());
  EXPECT_EQ(reinterpret_cast<uintptr_t>(writer.written().data()) % S_BUFFER_ALIGNMENT, 0u);

  const auto blob = writer.into_blob();
  ASSERT_EQ(blob.size(), expected.size());
  EXPECT_TRUE(std::equal(expected.begin(), expected.end(), blob.const_data()));
  EXPECT_EQ(writer.pos(), 0u);
}

TEST(Resolve_aligned, Offset_out_of_range_is_logged)
{
  // A string resolved 2^31 + 8 bytes after its characters: the backward offset does not fit in 32 bits.
  constexpr size_t FAR_POS = (size_t(1) << 31) + 8;
  Log_capture log;
  Counting_writer writer(log.logger(), FAR_POS);

  Error_code err_code;
  EXPECT_EQ(ser::resolve_aligned(&writer, std::string("abc"), Box_resolver{ 0 }, &err_code), FAR_POS);
  EXPECT_EQ(err_code, error::Code::S_SER_OFFSET_OUT_OF_RANGE);
  EXPECT_EQ(writer.pos(), FAR_POS); // Nothing written.

  const auto text = log.text();
  EXPECT_NE(text.find("position [" + std::to_string(FAR_POS) + "]"), std::string::npos) << text;
  EXPECT_NE(text.find("Emitting error"), std::string::npos) << text;
}

} // namespace zcarc::test
