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

#include "zcarc/boxed.hpp"
#include "zcarc/rc.hpp"
#include "zcarc/deserializer.hpp"
#include "zcarc/primitives.hpp"
#include <memory>
#include <string>
#include <vector>
#include <type_traits>
#include <new>
#include <cassert>

/* Archive_traits (see concept in ser/concepts.hpp) for the native types zcarc knows how to archive out of the box,
 * together with their archived counterparts.  A user's own record type gets archived the same way: define an archived
 * record type made of these archived counterparts (plus a static check_bytes()), and an Archive_traits specialization
 * whose serialize()/resolve() call the fields' traits in order. */

namespace zcarc
{

// Types.

/// Resolver of scalar types: there is nothing to remember.
struct Scalar_resolver
{
};

/**
 * Archive_traits implementation for a scalar `T` archived as the fixed-size `Archived_t`: nothing out of line; the
 * archived value is just the converted value.
 *
 * @tparam T
 *         Native scalar type.
 * @tparam Archived_t
 *         Archived scalar type, assignable from `T` and convertible to it.
 */
template<typename T, typename Archived_t>
struct Scalar_archive_traits
{
  // Types.

  /// See Archive_traits concept.
  using Archived = Archived_t;

  /// See Archive_traits concept.
  using Resolver = Scalar_resolver;

  // Methods.

  /**
   * See Archive_traits concept.  Writes nothing.
   *
   * @tparam Serializer
   *         See Archive_traits concept.
   * @return See Archive_traits concept.
   */
  template<typename Serializer>
  static Resolver serialize(const T&, Serializer*, Error_code*)
  {
    return Resolver();
  }

  /**
   * See Archive_traits concept.
   *
   * @param value
   *        See Archive_traits concept.
   * @param out
   *        See Archive_traits concept.
   */
  static void resolve(const T& value, const Resolver&, Place<Archived> out, Error_code*)
  {
    *out.ptr() = value;
  }

  /**
   * See Archive_traits concept.
   *
   * @param archived
   *        See Archive_traits concept.
   * @return See Archive_traits concept.
   */
  static T deserialize(const Archived& archived, Deserializer*)
  {
    return static_cast<T>(archived);
  }
}; // struct Scalar_archive_traits

/// Archive_traits for `bool`.
template<>
struct Archive_traits<bool, void> : Scalar_archive_traits<bool, Archived_bool> {};
/// Archive_traits for `int8_t`.
template<>
struct Archive_traits<int8_t, void> : Scalar_archive_traits<int8_t, Archived_i8> {};
/// Archive_traits for `int16_t`.
template<>
struct Archive_traits<int16_t, void> : Scalar_archive_traits<int16_t, Archived_i16> {};
/// Archive_traits for `int32_t`.
template<>
struct Archive_traits<int32_t, void> : Scalar_archive_traits<int32_t, Archived_i32> {};
/// Archive_traits for `int64_t`.
template<>
struct Archive_traits<int64_t, void> : Scalar_archive_traits<int64_t, Archived_i64> {};
/// Archive_traits for `uint8_t`.
template<>
struct Archive_traits<uint8_t, void> : Scalar_archive_traits<uint8_t, Archived_u8> {};
/// Archive_traits for `uint16_t`.
template<>
struct Archive_traits<uint16_t, void> : Scalar_archive_traits<uint16_t, Archived_u16> {};
/// Archive_traits for `uint32_t`.
template<>
struct Archive_traits<uint32_t, void> : Scalar_archive_traits<uint32_t, Archived_u32> {};
/// Archive_traits for `uint64_t`.
template<>
struct Archive_traits<uint64_t, void> : Scalar_archive_traits<uint64_t, Archived_u64> {};
/// Archive_traits for `float`.
template<>
struct Archive_traits<float, void> : Scalar_archive_traits<float, Archived_f32> {};
/// Archive_traits for `double`.
template<>
struct Archive_traits<double, void> : Scalar_archive_traits<double, Archived_f64> {};

/**
 * Archived counterpart of `std::string`: an Archived_box of `char[]`.  The characters are stored as-is (no
 * terminator, no encoding check), right before the first archived object that refers to them.
 */
class Archived_string
{
public:
  // Constructors/destructor.

  /// Constructs empty string pointing to itself; only meaningful as the staging state before resolve.
  Archived_string();

  /// Disallow copy construction.
  Archived_string(const Archived_string&) = delete;

  // Methods.

  /// Disallow copy assignment.
  Archived_string& operator=(const Archived_string&) = delete;

  /**
   * The characters.
   * @return See above.
   */
  String_view as_str() const;

  /**
   * Number of characters.
   * @return See above.
   */
  size_t size() const;

  /**
   * `size() == 0`.
   * @return See above.
   */
  bool empty() const;

  /**
   * The characters, pinned, for in-place modification (the length cannot change).
   * @return See above.
   */
  Pinned<char[]> get_pin_mut();

  /**
   * Resolves the string at `out` to refer to the characters archived by `Archive_traits<std::string>::serialize()`.
   *
   * @param value
   *        Native string.
   * @param resolver
   *        What serialize() returned.
   * @param out
   *        Place of the archived string.
   * @param err_code
   *        Must not be null.
   */
  static void resolve_from_str(const std::string& value, const Box_resolver& resolver, Place<Archived_string> out,
                               Error_code* err_code);

  /**
   * Validates the archived string at `value` (the characters must be in bounds and not overlap other objects).
   *
   * @tparam Context
   *         See Check_bytes.
   * @param value
   *        See Check_bytes.
   * @param context
   *        See Check_bytes.
   * @param err_code
   *        See Check_bytes.
   */
  template<typename Context>
  static void check_bytes(const Archived_string* value, Context* context, Error_code* err_code);

private:
  // Data.

  /// The characters, out of line.
  Archived_box<char[]> m_box;
}; // class Archived_string

/**
 * Archived counterpart of `std::vector<T>`: an Archived_box of `E[]`, `E` being `Archived<T>`.  Elements are stored
 * contiguously, each element's own out-of-line data preceding the whole array.
 *
 * @tparam E
 *         Archived element type.
 */
template<typename E>
class Archived_vec
{
public:
  // Types.

  /// Read-only view of the elements.
  using Const_range = boost::iterator_range<const E*>;

  // Constructors/destructor.

  /// Constructs empty vector pointing to itself; only meaningful as the staging state before resolve.
  Archived_vec();

  /// Disallow copy construction.
  Archived_vec(const Archived_vec&) = delete;

  // Methods.

  /// Disallow copy assignment.
  Archived_vec& operator=(const Archived_vec&) = delete;

  /**
   * The elements.
   * @return See above.
   */
  Const_range as_slice() const;

  /**
   * Element count.
   * @return See above.
   */
  size_t size() const;

  /**
   * `size() == 0`.
   * @return See above.
   */
  bool empty() const;

  /**
   * Element at index `idx < size()`.
   *
   * @param idx
   *        Index.
   * @return See above.
   */
  const E& operator[](size_t idx) const;

  /**
   * First element.
   * @return See above.
   */
  const E* begin() const;

  /**
   * Past last element.
   * @return See above.
   */
  const E* end() const;

  /**
   * The elements, pinned.
   * @return See above.
   */
  Pinned<E[]> get_pin_mut();

  /**
   * Resolves the vector at `out` to refer to the elements archived by `Archive_traits<std::vector>::serialize()`.
   *
   * @tparam U
   *         Native vector type.
   * @param value
   *        Native vector.
   * @param resolver
   *        What serialize() returned.
   * @param out
   *        Place of the archived vector.
   * @param err_code
   *        Must not be null.
   */
  template<typename U>
  static void resolve_from_slice(const U& value, const Box_resolver& resolver, Place<Archived_vec> out,
                                 Error_code* err_code);

  /**
   * Validates the archived vector at `value`, and each element.
   *
   * @tparam Context
   *         See Check_bytes.
   * @param value
   *        See Check_bytes.
   * @param context
   *        See Check_bytes.
   * @param err_code
   *        See Check_bytes.
   */
  template<typename Context>
  static void check_bytes(const Archived_vec* value, Context* context, Error_code* err_code);

private:
  // Data.

  /// The elements, out of line.
  Archived_box<E[]> m_box;
}; // class Archived_vec

/**
 * Describes how unsized native type `U` is archived as a slice (out of line, behind an Archived_box).  The primary
 * template is not defined; zcarc specializes it for `std::string` and `std::vector`.
 *
 * Each specialization provides:
 *   - `Archived`: the archived slice type `E[]`.
 *   - `serialize_unsized(value, serializer, err_code) -> size_t`: writes the slice, returns its position.
 *   - `archived_metadata(value) -> size_t`: element count.
 *
 * @tparam U
 *         Native type.
 */
template<typename U>
struct Archive_unsized_traits;

/// Archive_unsized_traits for `std::string`: archived as its characters.
template<>
struct Archive_unsized_traits<std::string>
{
  // Types.

  /// See Archive_unsized_traits doc header.
  using Archived = char[];

  // Methods.

  /**
   * Writes the characters.
   *
   * @tparam Serializer
   *         Models Writer concept.
   * @param value
   *        String.
   * @param serializer
   *        Serializer.
   * @param err_code
   *        Must not be null.
   * @return Position of the first character.
   */
  template<typename Serializer>
  static size_t serialize_unsized(const std::string& value, Serializer* serializer, Error_code* err_code)
  {
    const size_t pos = serializer->pos();
    serializer->write(Blob_const(value.data(), value.size()), err_code);
    return pos;
  }

  /**
   * Character count.
   *
   * @param value
   *        String.
   * @return See above.
   */
  static size_t archived_metadata(const std::string& value)
  {
    return value.size();
  }
}; // struct Archive_unsized_traits<std::string>

/**
 * Archive_unsized_traits for `std::vector<T>`: archived as an array of `Archived<T>`.
 *
 * @tparam T
 *         Native element type.
 */
template<typename T>
struct Archive_unsized_traits<std::vector<T>>
{
  // Types.

  /// See Archive_unsized_traits doc header.
  using Archived = typename Archive_traits<T>::Archived[];

  // Methods.

  /**
   * Serializes each element (their resolvers kept in scratch space), then resolves each element into the array.
   *
   * @tparam Serializer
   *         Models Writer and Allocator concepts; a `flow::log::Log_context`.
   * @param value
   *        Vector.
   * @param serializer
   *        Serializer.
   * @param err_code
   *        Must not be null.
   * @return Position of the first element.  Meaningless on error.
   */
  template<typename Serializer>
  static size_t serialize_unsized(const std::vector<T>& value, Serializer* serializer, Error_code* err_code);

  /**
   * Element count.
   *
   * @param value
   *        Vector.
   * @return See above.
   */
  static size_t archived_metadata(const std::vector<T>& value)
  {
    return value.size();
  }
}; // struct Archive_unsized_traits<std::vector<T>>

/// Archive_traits for `std::string`.
template<>
struct Archive_traits<std::string, void>
{
  // Types.

  /// See Archive_traits concept.
  using Archived = Archived_string;

  /// See Archive_traits concept.
  using Resolver = Box_resolver;

  // Methods.

  /**
   * See Archive_traits concept.
   *
   * @tparam Serializer
   *         See Archive_traits concept.
   * @param value
   *        See Archive_traits concept.
   * @param serializer
   *        See Archive_traits concept.
   * @param err_code
   *        See Archive_traits concept.
   * @return See Archive_traits concept.
   */
  template<typename Serializer>
  static Resolver serialize(const std::string& value, Serializer* serializer, Error_code* err_code)
  {
    return Archived_box<char[]>::serialize_from_ref(value, serializer, err_code);
  }

  /**
   * See Archive_traits concept.
   *
   * @param value
   *        See Archive_traits concept.
   * @param resolver
   *        See Archive_traits concept.
   * @param out
   *        See Archive_traits concept.
   * @param err_code
   *        See Archive_traits concept.
   */
  static void resolve(const std::string& value, const Resolver& resolver, Place<Archived> out, Error_code* err_code)
  {
    Archived_string::resolve_from_str(value, resolver, out, err_code);
  }

  /**
   * See Archive_traits concept.
   *
   * @param archived
   *        See Archive_traits concept.
   * @return See Archive_traits concept.
   */
  static std::string deserialize(const Archived& archived, Deserializer*)
  {
    const auto str = archived.as_str();
    return std::string(str.data(), str.size());
  }
}; // struct Archive_traits<std::string>

/**
 * Archive_traits for `std::vector<T>`.
 *
 * @tparam T
 *         Native element type with an Archive_traits specialization.
 */
template<typename T>
struct Archive_traits<std::vector<T>, void>
{
  // Types.

  /// Archived element type.
  using Archived_elem = typename Archive_traits<T>::Archived;

  /// See Archive_traits concept.
  using Archived = Archived_vec<Archived_elem>;

  /// See Archive_traits concept.
  using Resolver = Box_resolver;

  // Methods.

  /**
   * See Archive_traits concept.
   *
   * @tparam Serializer
   *         See Archive_traits concept.
   * @param value
   *        See Archive_traits concept.
   * @param serializer
   *        See Archive_traits concept.
   * @param err_code
   *        See Archive_traits concept.
   * @return See Archive_traits concept.
   */
  template<typename Serializer>
  static Resolver serialize(const std::vector<T>& value, Serializer* serializer, Error_code* err_code)
  {
    return Archived_box<Archived_elem[]>::serialize_from_ref(value, serializer, err_code);
  }

  /**
   * See Archive_traits concept.
   *
   * @param value
   *        See Archive_traits concept.
   * @param resolver
   *        See Archive_traits concept.
   * @param out
   *        See Archive_traits concept.
   * @param err_code
   *        See Archive_traits concept.
   */
  static void resolve(const std::vector<T>& value, const Resolver& resolver, Place<Archived> out,
                      Error_code* err_code)
  {
    Archived::resolve_from_slice(value, resolver, out, err_code);
  }

  /**
   * See Archive_traits concept.
   *
   * @param archived
   *        See Archive_traits concept.
   * @param deserializer
   *        See Archive_traits concept.
   * @return See Archive_traits concept.
   */
  static std::vector<T> deserialize(const Archived& archived, Deserializer* deserializer)
  {
    std::vector<T> result;
    result.reserve(archived.size());
    for (const auto& elem : archived.as_slice())
    {
      result.push_back(Archive_traits<T>::deserialize(elem, deserializer));
    }
    return result;
  }
}; // struct Archive_traits<std::vector<T>>

/**
 * Archive_traits for `std::shared_ptr<T>`.  The pointer must not be null.
 *
 * @tparam T
 *         Native pointee type with an Archive_traits specialization.
 */
template<typename T>
struct Archive_traits<std::shared_ptr<T>, void>
{
  // Types.

  /// See Archive_traits concept.
  using Archived = Archived_rc<typename Archive_traits<T>::Archived>;

  /// See Archive_traits concept.
  using Resolver = Rc_resolver;

  // Methods.

  /**
   * See Archive_traits concept.
   *
   * @tparam Serializer
   *         See Archive_traits concept; must model Sharing too.
   * @param value
   *        See Archive_traits concept.  Not null.
   * @param serializer
   *        See Archive_traits concept.
   * @param err_code
   *        See Archive_traits concept.
   * @return See Archive_traits concept.
   */
  template<typename Serializer>
  static Resolver serialize(const std::shared_ptr<T>& value, Serializer* serializer, Error_code* err_code)
  {
    assert(value && "A null shared_ptr cannot be archived.");
    return Archived::serialize_from_ref(*value, serializer, err_code);
  }

  /**
   * See Archive_traits concept.
   *
   * @param resolver
   *        See Archive_traits concept.
   * @param out
   *        See Archive_traits concept.
   * @param err_code
   *        See Archive_traits concept.
   */
  static void resolve(const std::shared_ptr<T>&, const Resolver& resolver, Place<Archived> out, Error_code* err_code)
  {
    Archived::resolve_from_raw_parts(resolver, out, err_code);
  }

  /**
   * See Archive_traits concept.  Two archived pointers to one archived value yield two `shared_ptr`s to one object.
   *
   * @param archived
   *        See Archive_traits concept.
   * @param deserializer
   *        See Archive_traits concept.
   * @return See Archive_traits concept.
   */
  static std::shared_ptr<T> deserialize(const Archived& archived, Deserializer* deserializer)
  {
    const auto& pointee = archived.get();
    return deserializer->deserialize_shared<T>(static_cast<const void*>(&pointee), [&]() -> std::shared_ptr<T>
    {
      return std::make_shared<T>(Archive_traits<T>::deserialize(pointee, deserializer));
    });
  }
}; // struct Archive_traits<std::shared_ptr<T>>

// Free functions.

/**
 * Returns `true` if and only if the archived string's characters equal `val2`.
 *
 * @relatesalso Archived_string
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator==(const Archived_string& val1, String_view val2);

/**
 * Returns `!(val1 == val2)`.
 *
 * @relatesalso Archived_string
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator!=(const Archived_string& val1, String_view val2);

/**
 * Prints the archived string's characters to the given `ostream`.
 *
 * @relatesalso Archived_string
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Archived_string& val);

// Template implementations.

template<typename Context>
void Archived_string::check_bytes(const Archived_string* value, Context* context, Error_code* err_code) // Static.
{
  Archived_box<char[]>::check_bytes(&value->m_box, context, err_code);
}

template<typename E>
Archived_vec<E>::Archived_vec() = default;

template<typename E>
typename Archived_vec<E>::Const_range Archived_vec<E>::as_slice() const
{
  return m_box.get();
}

template<typename E>
size_t Archived_vec<E>::size() const
{
  return m_box.rel_ptr().metadata();
}

template<typename E>
bool Archived_vec<E>::empty() const
{
  return size() == 0;
}

template<typename E>
const E& Archived_vec<E>::operator[](size_t idx) const
{
  assert(idx < size());
  return begin()[idx];
}

template<typename E>
const E* Archived_vec<E>::begin() const
{
  return m_box.rel_ptr().as_ptr();
}

template<typename E>
const E* Archived_vec<E>::end() const
{
  return begin() + size();
}

template<typename E>
Pinned<E[]> Archived_vec<E>::get_pin_mut()
{
  return m_box.get_pin_mut();
}

template<typename E>
template<typename U>
void Archived_vec<E>::resolve_from_slice(const U& value, const Box_resolver& resolver, Place<Archived_vec> out,
                                         Error_code* err_code) // Static.
{
  Archived_box<E[]>::resolve_from_ref(value, resolver, out.field(&Archived_vec::m_box), err_code);
}

template<typename E>
template<typename Context>
void Archived_vec<E>::check_bytes(const Archived_vec* value, Context* context, Error_code* err_code) // Static.
{
  Archived_box<E[]>::check_bytes(&value->m_box, context, err_code);
}

template<typename T>
template<typename Serializer>
size_t Archive_unsized_traits<std::vector<T>>::serialize_unsized(const std::vector<T>& value, Serializer* serializer,
                                                                 Error_code* err_code) // Static.
{
  using Elem_resolver = typename Archive_traits<T>::Resolver;
  using Elem_archived = typename Archive_traits<T>::Archived;
  static_assert(std::is_trivially_destructible_v<Elem_resolver>, "Resolvers must be trivially destructible.");

  assert(err_code);

  const size_t n_elems = value.size();
  const auto layout = Layout::array(Layout::of<Elem_resolver>(), n_elems, err_code);
  if (*err_code)
  {
    return 0;
  }
  // else

  // Phase 1: each element's out-of-line data; remember where it went.
  ser::Scratch_guard<Serializer> scratch(serializer);
  auto* const resolvers = reinterpret_cast<Elem_resolver*>(scratch.push(layout, err_code));
  if (*err_code)
  {
    return 0;
  }
  // else

  for (size_t idx = 0; idx != n_elems; ++idx)
  {
    const T& elem = value[idx];
    new (resolvers + idx) Elem_resolver(Archive_traits<T>::serialize(elem, serializer, err_code));
    if (*err_code)
    {
      return 0;
    }
  }

  // Phase 2: the elements themselves, contiguously.
  const size_t pos = ser::align_for<Elem_archived>(serializer, err_code);
  if (*err_code)
  {
    return 0;
  }
  // else

  for (size_t idx = 0; idx != n_elems; ++idx)
  {
    const T& elem = value[idx];
    ser::resolve_aligned<T>(serializer, elem, resolvers[idx], err_code);
    if (*err_code)
    {
      return 0;
    }
  }

  scratch.release(err_code);
  return pos;
} // Archive_unsized_traits<std::vector<T>>::serialize_unsized()

} // namespace zcarc
