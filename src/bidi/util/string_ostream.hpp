/* bidi
 * Copyright 2026 The bidi Authors
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */
/// @file
#pragma once

#include "bidi/util/util_fwd.hpp"
#include <boost/iostreams/stream.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/noncopyable.hpp>
#include <string>

namespace bidi::util
{

/**
 * An `ostream` that appends to an `std::string`, which can be read in place through str() instead of being copied
 * out as `ostringstream::str()` does.  The string is either one the caller supplies or one owned by `*this`.
 *
 * The stream buffers: call `os().flush()` (or stream `std::flush`) before reading str().
 *
 * ostream_op_to_string() and log::Buffer_logger are built on it.
 */
class String_ostream :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Sets up the stream.
   *
   * @param target_str
   *        String to append to, which must outlive `*this` and must not be touched except through `*this` meanwhile;
   *        or null to append to an internal string, initially empty.
   */
  explicit String_ostream(std::string* target_str = 0);

  // Methods.

  /**
   * The stream.
   * @return See above.
   */
  std::ostream& os();

  /**
   * The string written so far (up to the last flush).  The reference stays valid, at the same address, for the life of
   * `*this`.
   *
   * @return See above.
   */
  const std::string& str() const;

  /// Empties str().
  void str_clear();

private:
  // Types.

  /// Device appending to an `std::string`.
  using Appender = boost::iostreams::back_insert_device<std::string>;

  // Data.

  /// Target when the constructor got null; otherwise stays empty.
  std::string m_owned_str;

  /// The target string: the caller's, or #m_owned_str.
  std::string* const m_str;

  /// Device over `*m_str`.
  Appender m_appender;

  /// Stream writing through #m_appender.
  boost::iostreams::stream<Appender> m_os;
}; // class String_ostream

} // namespace bidi::util
