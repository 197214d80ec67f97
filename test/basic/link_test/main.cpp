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

#include <zcarc/zcarc.hpp>
#include <flow/log/simple_ostream_logger.hpp>
#include <flow/log/async_file_logger.hpp>

/* This little thing is *not* a unit-test; it is built to ensure the proper stuff links through our
 * build process.  We try to use a compiled thing or two; and a template (header-only) thing or two;
 * not so much for correctness testing but to see it build successfully and run without barfing. */
int main()
{
  using zcarc::Archived;
  using zcarc::Blob_const;
  using zcarc::ser::to_bytes;
  using zcarc::access;
  using zcarc::from_bytes;

  using flow::log::Simple_ostream_logger;
  using flow::log::Async_file_logger;
  using flow::log::Config;
  using flow::log::Sev;
  using flow::Flow_log_component;

  using std::string;
  using std::vector;
  using std::shared_ptr;
  using std::make_shared;
  using std::exception;

  using Value = vector<shared_ptr<string>>;

  const string LOG_FILE = "zcarc_link_test.log";
  const int BAD_EXIT = 1;
  const string TEST_VAL = "cool value";

  /* Set up logging within this function.  We could easily just use `cout` and `cerr` instead, but this
   * Flow stuff will give us time stamps and such for free, so why not?  Normally, one derives from
   * Log_context to do this very trivially, but we just have the one function, main(), so far so: */
  Config std_log_config;
  std_log_config.init_component_to_union_idx_mapping<Flow_log_component>(1000, 999);
  std_log_config.init_component_names<Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "link_test-");
  std_log_config.init_component_to_union_idx_mapping<zcarc::Log_component>(2000, 999);
  std_log_config.init_component_names<zcarc::Log_component>(zcarc::S_ZCARC_LOG_COMPONENT_NAME_MAP, false, "zcarc-");

  Simple_ostream_logger std_logger(&std_log_config);
  FLOW_LOG_SET_CONTEXT(&std_logger, Flow_log_component::S_UNCAT);

  // This is separate: the zcarc/Flow logging will go into this file.
  FLOW_LOG_INFO("Opening log file [" << LOG_FILE << "] for zcarc/Flow logs only.");
  Config log_config = std_log_config;
  log_config.configure_default_verbosity(Sev::S_TRACE, true);
  Async_file_logger log_logger(nullptr, &log_config, LOG_FILE, false /* No rotation; we're no serious business. */);

  try
  {
    // Two pointers to one value: archived once, validated once, and shared again once materialized.
    const auto shared_val = make_shared<string>(TEST_VAL);
    const Value val{ shared_val, shared_val, make_shared<string>("other") };

    const auto bytes = to_bytes(&log_logger, val);
    FLOW_LOG_INFO("Archived value with [" << val.size() << "] elements into [" << bytes.size() << "] bytes.");

    const Blob_const bytes_view(bytes.const_data(), bytes.size());
    const auto archived = access<Archived<Value>>(&log_logger, bytes_view);
    if ((archived->size() != val.size()) || (archived->begin()->get() != TEST_VAL)
        || (&(*archived)[0].get() != &(*archived)[1].get()))
    {
      FLOW_LOG_FATAL("WTF?!  Archived value does not match.");
      return BAD_EXIT;
    }

    const auto restored = from_bytes<Value>(&log_logger, bytes_view);
    if ((restored.size() != val.size()) || (*restored[0] != TEST_VAL) || (restored[0] != restored[1]))
    {
      FLOW_LOG_FATAL("WTF?!  Restored value does not match.");
      return BAD_EXIT;
    }

    FLOW_LOG_INFO("Looks good.  Exiting.");
  } // try
  catch (const exception& exc)
  {
    FLOW_LOG_WARNING("Caught exception: [" << exc.what() << "].");
    return BAD_EXIT;
  }

  return 0;
} // main()
