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
#include "zcarc/ser/composite.hpp"

namespace zcarc::ser
{

// Implementations.

Core_serializer make_core_serializer(flow::log::Logger* logger_ptr, Blob_mutable target, Blob_mutable scratch)
{
  return Core_serializer(logger_ptr,
                         Buffer_writer(logger_ptr, target),
                         Buffer_allocator(logger_ptr, scratch),
                         Duplicate());
}

Heap_serializer make_heap_serializer(flow::log::Logger* logger_ptr)
{
  return Heap_serializer(logger_ptr,
                         Heap_writer(Heap_writer::Config{ logger_ptr, 0 }),
                         Heap_allocator(Heap_allocator::Config{ logger_ptr, 0 }),
                         Unify(logger_ptr));
}

} // namespace zcarc::ser
