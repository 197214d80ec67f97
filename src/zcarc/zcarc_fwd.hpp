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

#include "zcarc/common.hpp"

/* Find the `namespace zcarc` doc header in common.hpp.  Here we forward-declare the library's compound types, so that
 * headers can refer to each other without dragging in definitions they do not need. */

namespace zcarc
{

// Types.

// Find doc headers near the bodies of these compound types.

struct Layout;

template<typename T>
class Place;
template<typename T>
class Pinned;

struct No_metadata;
template<typename T>
struct Pointee_traits;
template<typename T>
class Rel_ptr;

struct Box_resolver;
template<typename T>
class Archived_box;
struct Rc_resolver;
template<typename T>
class Archived_rc;

template<typename T, typename Enable = void>
struct Archive_traits;
template<typename U>
struct Archive_unsized_traits;
template<typename Archived_t, typename Enable = void>
struct Check_bytes;

class Archived_bool;
class Archived_string;
template<typename T>
class Archived_vec;

class Deserializer;

/**
 * Short-hand for the archived counterpart of native type `T`, as defined by its Archive_traits specialization.
 * E.g., `Archived<uint32_t>` is a little-endian 32-bit integer type; `Archived<std::string>` is Archived_string.
 *
 * @tparam T
 *         Type for which Archive_traits is specialized.
 */
template<typename T>
using Archived = typename Archive_traits<T, void>::Archived;

/**
 * Short-hand for the resolver of native type `T`, as defined by its Archive_traits specialization.  This is what
 * the serialize step returns and the resolve step consumes.
 *
 * @tparam T
 *         Type for which Archive_traits is specialized.
 */
template<typename T>
using Resolver = typename Archive_traits<T, void>::Resolver;

/**
 * Sub-module of zcarc responsible for producing archives: see the Writer, Allocator, and Sharing concepts
 * (documentation-only, in ser/concepts.hpp), their implementations, and Composite_serializer combining one of each.
 */
namespace ser
{

class Buffer_writer;
class Heap_writer;
class Buffer_allocator;
class Heap_allocator;
template<typename Allocator_t>
class Scratch_guard;
class Unify;
class Duplicate;
template<typename Writer_t, typename Allocator_t, typename Sharing_t>
class Composite_serializer;

/// Serializer for a caller-supplied fixed buffer and scratch area; never unifies shared pointers.
using Core_serializer = Composite_serializer<Buffer_writer, Buffer_allocator, Duplicate>;

/// Serializer that grows its own heap buffer and scratch area; unifies shared pointers.
using Heap_serializer = Composite_serializer<Heap_writer, Heap_allocator, Unify>;

} // namespace ser

/**
 * Sub-module of zcarc responsible for deciding whether an untrusted byte buffer may be read as a given archived
 * type: see Archive_validator, Shared_validator, and Validator combining both.
 */
namespace validation
{

struct Subtree_range;
class Archive_validator;
class Shared_validator;
class Validator;

} // namespace validation

} // namespace zcarc
