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
#include "zcarc/validation/validator.hpp"

namespace zcarc::validation
{

// Validator implementations.

Validator::Validator(const Config& config, Blob_const bytes) :
  flow::log::Log_context(config.m_logger_ptr, Log_component::S_VALIDATION),
  m_archive_validator(config.m_logger_ptr, bytes, config.m_max_subtree_depth),
  m_shared_validator(config.m_logger_ptr)
{
  // That's it.
}

const uint8_t* Validator::base() const
{
  return m_archive_validator.base();
}

size_t Validator::size() const
{
  return m_archive_validator.size();
}

void Validator::check_subtree_ptr(size_t pos, const Layout& layout, Error_code* err_code) const
{
  m_archive_validator.check_subtree_ptr(pos, layout, err_code);
}

Subtree_range Validator::push_subtree_range(size_t root, size_t end, Error_code* err_code)
{
  return m_archive_validator.push_subtree_range(root, end, err_code);
}

void Validator::pop_subtree_range(const Subtree_range& range, Error_code* err_code)
{
  m_archive_validator.pop_subtree_range(range, err_code);
}

void Validator::check_balanced(Error_code* err_code) const
{
  m_archive_validator.check_balanced(err_code);
}

bool Validator::register_shared_ptr(size_t pos, const Type_id& type_id, Error_code* err_code)
{
  return m_shared_validator.register_shared_ptr(pos, type_id, err_code);
}

const Archive_validator& Validator::archive_validator() const
{
  return m_archive_validator;
}

const Shared_validator& Validator::shared_validator() const
{
  return m_shared_validator;
}

} // namespace zcarc::validation
