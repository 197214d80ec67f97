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
#include "zcarc/validation/shared_validator.hpp"

namespace zcarc::validation
{

// Shared_validator implementations.

Shared_validator::Shared_validator(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_VALIDATION)
{
  // That's it.
}

bool Shared_validator::register_shared_ptr(size_t pos, const Type_id& type_id, Error_code* err_code)
{
  assert(err_code);

  const auto result = m_registry.emplace(pos, type_id);
  if (result.second)
  {
    FLOW_LOG_TRACE("Shared_validator [" << *this << "]: Shared pointee at position [" << pos << "] registered as "
                   "type [" << type_id.name() << "]; will validate.");
    return true;
  }
  // else

  const Type_id& registered_type_id = result.first->second;
  if (registered_type_id != type_id)
  {
    FLOW_LOG_WARNING("Shared_validator [" << *this << "]: Shared pointee at position [" << pos << "] claimed as "
                     "type [" << type_id.name() << "] but already registered as type "
                     "[" << registered_type_id.name() << "].  Emitting error.");
    *err_code = error::Code::S_VALIDATION_SHARED_TYPE_CONFLICT;
  }
  return false;
}

size_t Shared_validator::size() const
{
  return m_registry.size();
}

std::ostream& operator<<(std::ostream& os, const Shared_validator& val)
{
  return os << '@' << &val << " shared[" << val.size() << ']';
}

} // namespace zcarc::validation
