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

#include <boost/system/error_code.hpp>
#include <boost/unordered_map.hpp>
#include <functional>
#include <string>

// The headers rely on `if constexpr`, fold expressions and inline variables.
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "bidi/ headers require C++17 or later."
#endif

/**
 * The bidi project: bidirectional mapping containers and the small support modules they use.
 *
 * Modules (sub-namespaces):
 *   - bidi::dict: the containers (dict::Bidict, dict::Ordered_bidict, their frozen variants), the inverse view,
 *     collision policies, options and archive support.
 *   - bidi::log: the logging used inside bidi::dict; applications may use it too.
 *   - bidi::error: error codes and the exception carrying them.
 *   - bidi::util: helpers used by the above.
 *
 * Directly in `bidi` live only the few names every module needs, such as #Error_code.
 *
 * ### Errors ###
 * A fallible call reports failure through a non-null trailing `Error_code*` if given one, and by throwing
 * error::Runtime_error otherwise.  The exception's `code()` is the code the other form would have set.
 *
 * ### Logging ###
 * Objects able to log take a `log::Logger*` when constructed; null turns their logging off.
 *
 * ### Threads ###
 * Concurrent `const` access to one object is safe.  Any mutation must be externally serialized with all other
 * access to the object.
 */
namespace bidi
{

// Types.

/// Result of a fallible operation: falsy on success, else a value such as a dict::error::Code.
using Error_code = boost::system::error_code;

/**
 * Type-erased callable used in bidi APIs (e.g., dict::Readable::for_each()).
 *
 * @tparam Signature
 *         As for `std::function`.
 */
template<typename Signature>
using Function = std::function<Signature>;

/**
 * Log components of bidi's own code.  Pass #S_BIDI_LOG_COMPONENT_NAME_MAP to log::Config::init_component_names()
 * to have them printed by name and to configure their verbosity by name.
 *
 * Applications should log under a component `enum` of their own.
 */
enum class Bidi_log_component : unsigned int
{
  /// No specific component.
  S_UNCAT = 0,
  /// bidi::util.
  S_UTIL,
  /// bidi::log.
  S_LOG,
  /// bidi::error.
  S_ERROR,
  /// bidi::dict.
  S_DICT,
  /// One past the last value.
  S_END_SENTINEL
}; // enum class Bidi_log_component

// Globals.

/// Name of each Bidi_log_component value.
extern const boost::unordered_multimap<Bidi_log_component, std::string> S_BIDI_LOG_COMPONENT_NAME_MAP;

} // namespace bidi
