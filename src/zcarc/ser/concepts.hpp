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

// Not compiled: for documentation only.  Contains concept docs as of this writing.
#ifndef ZCARC_DOXYGEN_ONLY
static_assert(false, "As of this writing this is a documentation-only \"header\" "
                       "(the \"source\" is for humans and Doxygen only).");
#else // ifdef ZCARC_DOXYGEN_ONLY

namespace zcarc::ser
{

// Types.

/**
 * A documentation-only *concept* defining the behavior of an object into which an archive is appended, front to
 * back.  Implementations: Buffer_writer (fixed caller-supplied area), Heap_writer (growing heap buffer);
 * Composite_serializer also models it by forwarding to its Writer.
 *
 * The writer's only state visible to the serialization algorithm is its *position*: the number of bytes written so
 * far, which is also the position (from start of archive) at which the next byte shall land.  Everything archived
 * refers to other archived things via positions; so the writer never needs to reveal where in memory the bytes
 * actually are.  This is what lets Buffer_writer and Heap_writer (whose buffer moves around when it grows) be
 * interchangeable.
 *
 * ### Helpers ###
 * The free functions pad(), align(), align_for(), resolve_aligned() in ser/writer.hpp work on any Writer and
 * implement what every archived type needs: padding to alignment, and writing a resolved value at the correct
 * (aligned) position.
 *
 * ### Errors ###
 * A Writer emits an `Error_code` when it cannot accept more bytes (error::Code::S_SER_WRITER_CAPACITY_EXHAUSTED
 * for the built-in ones; a user-supplied writer may emit anything).  After an error the archive is unusable;
 * the caller is to stop and report it.
 */
class Writer // Note: movable, not copyable.
{
public:
  // Methods.

  /**
   * Number of bytes written so far.
   * @return See above.
   */
  size_t pos() const;

  /**
   * Appends the given bytes.
   *
   * @param bytes
   *        Bytes to append.
   * @param err_code
   *        Must not be null.  On error the position does not change.
   */
  void write(Blob_const bytes, Error_code* err_code);

  /**
   * Logger used by the helpers in ser/writer.hpp (typically via `flow::log::Log_context`).
   * @return See above.
   */
  flow::log::Logger* get_logger() const;
}; // class Writer

/**
 * A documentation-only *concept* defining the behavior of a stack-like scratch-space allocator used during
 * serialization for temporary storage, such as the per-element resolvers of a vector while its elements are written.
 * Implementations: Buffer_allocator (fixed caller-supplied area), Heap_allocator (chain of heap blocks);
 * Composite_serializer also models it by forwarding to its Allocator.
 *
 * Allocations must be released in exact reverse order (LIFO).  Use Scratch_guard to make this automatic.
 */
class Allocator // Note: movable, not copyable.
{
public:
  // Methods.

  /**
   * Allocates scratch space with the given layout.
   *
   * @param layout
   *        Size and alignment.
   * @param err_code
   *        Must not be null.  error::Code::S_SER_SCRATCH_CAPACITY_EXHAUSTED is typical.
   * @return Pointer to at least `layout.m_size` writable bytes aligned to `layout.m_align`.  Null on error.
   *         For a zero-sized layout the pointer is aligned but must not be dereferenced.
   */
  uint8_t* push_alloc(const Layout& layout, Error_code* err_code);

  /**
   * Releases the most recent allocation.
   *
   * @param ptr
   *        Pointer returned by the matching push_alloc().
   * @param layout
   *        Layout passed to the matching push_alloc().
   * @param err_code
   *        Must not be null.  error::Code::S_SER_SCRATCH_POPPED_OUT_OF_ORDER if it is not the most recent one.
   */
  void pop_alloc(uint8_t* ptr, const Layout& layout, Error_code* err_code);
}; // class Allocator

/**
 * A documentation-only *concept* defining the registry that decides whether a value reachable through several shared
 * pointers is archived once or once per pointer.  Implementations: Unify (once), Duplicate (once per pointer);
 * Composite_serializer also models it by forwarding to its Sharing.
 *
 * The free function serialize_shared() in ser/sharing.hpp implements the look-up-else-serialize-and-record protocol
 * on top of this API.
 */
class Sharing // Note: movable, not copyable.
{
public:
  // Methods.

  /**
   * Returns the position at which the value at `address` was already archived, if it was.
   *
   * @param address
   *        Address of the *native* (not archived) value.
   * @return See above.
   */
  std::optional<size_t> get_shared_ptr(const void* address) const;

  /**
   * Records that the value at `address` was archived at position `pos`.
   *
   * @param address
   *        See get_shared_ptr().
   * @param pos
   *        Position of the archived value.
   * @param err_code
   *        Must not be null.
   */
  void add_shared_ptr(const void* address, size_t pos, Error_code* err_code);
}; // class Sharing

} // namespace zcarc::ser

namespace zcarc
{

/**
 * A documentation-only *concept* defining how native type `T` is archived: an actual Archive_traits specialization
 * (for `T` as first template argument) must provide these members.  zcarc provides them for `bool`, the fixed-width
 * integers, `float`, `double`, `std::string`, `std::vector`, and `std::shared_ptr` (see archive.hpp); the user adds
 * them for their own types.
 *
 * Archiving is two-phase.  serialize() writes everything `T` *points to* (its out-of-line data) and returns a
 * Resolver remembering where that landed.  Then resolve() builds the archived `T` itself, given its final Place;
 * resolve_aligned() (ser/writer.hpp) is what appends it.  Two phases are needed because a Rel_ptr's offset depends
 * on the position of the pointer itself, which is only known once its pointee is written.
 */
template<typename T>
struct Archive_traits
{
  // Types.

  /**
   * The archived counterpart.  Must be readable in place: fixed layout, alignment at most S_BUFFER_ALIGNMENT,
   * default-constructible (the initial staging state for resolve()), with a Check_bytes hook.
   */
  using Archived = unspecified;

  /// Whatever resolve() needs to know from serialize(); typically positions.  Must be trivially destructible.
  using Resolver = unspecified;

  // Methods.

  /**
   * Writes the out-of-line data of `value`.
   *
   * @tparam Serializer
   *         Models Writer, Allocator, Sharing; e.g. Composite_serializer.
   * @param value
   *        Value to archive.
   * @param serializer
   *        Serializer.
   * @param err_code
   *        Must not be null.
   * @return The resolver.  Meaningless on error.
   */
  template<typename Serializer>
  static Resolver serialize(const T& value, Serializer* serializer, Error_code* err_code);

  /**
   * Fills in the archived value at `out`.
   *
   * @param value
   *        Same as passed to serialize().
   * @param resolver
   *        Returned by serialize().
   * @param out
   *        Place of the archived value, already default-constructed.
   * @param err_code
   *        Must not be null.
   */
  static void resolve(const T& value, const Resolver& resolver, Place<Archived> out, Error_code* err_code);

  /**
   * Materializes a native value from a (validated) archived one.
   *
   * @param archived
   *        Archived value.
   * @param deserializer
   *        Pool restoring pointer sharing.
   * @return See above.
   */
  static T deserialize(const Archived& archived, Deserializer* deserializer);
}; // struct Archive_traits

} // namespace zcarc

#endif // ZCARC_DOXYGEN_ONLY
