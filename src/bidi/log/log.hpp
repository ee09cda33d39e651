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

#include "bidi/log/log_fwd.hpp"
#include "bidi/util/util.hpp"
#include <boost/noncopyable.hpp>
#include <chrono>
#include <string>
#include <typeinfo>
#include <typeindex>
#include <type_traits>

// Macros.  These (conceptually) belong to the bidi::log namespace (hence the prefix for each macro).

/**
 * @name Severity-specific logging macros
 *
 * Each of these logs the `<<`-chained `ARG_stream_fragment` (e.g., `"Erased [" << n << "] items."`) at the
 * severity in its name, to `get_logger()` under `get_log_component()`, provided the Logger is not null and its
 * Logger::should_log() accepts that severity and component.  Otherwise the fragment is not even evaluated, so an
 * expensive fragment costs nothing when filtered out.
 *
 * `get_logger()` and `get_log_component()` must be callable unqualified at the call site: as members inherited from
 * Log_context, or as the locals BIDI_LOG_SET_CONTEXT() declares.
 */
///@{

/// Logs at Sev::S_FATAL.  @param ARG_stream_fragment See above.
#define BIDI_LOG_FATAL(ARG_stream_fragment) \
  BIDI_LOG_WITH_CHECKING(::bidi::log::Sev::S_FATAL, ARG_stream_fragment)
/// Logs at Sev::S_ERROR.  @param ARG_stream_fragment See above.
#define BIDI_LOG_ERROR(ARG_stream_fragment) \
  BIDI_LOG_WITH_CHECKING(::bidi::log::Sev::S_ERROR, ARG_stream_fragment)
/// Logs at Sev::S_WARNING.  @param ARG_stream_fragment See above.
#define BIDI_LOG_WARNING(ARG_stream_fragment) \
  BIDI_LOG_WITH_CHECKING(::bidi::log::Sev::S_WARNING, ARG_stream_fragment)
/// Logs at Sev::S_INFO.  @param ARG_stream_fragment See above.
#define BIDI_LOG_INFO(ARG_stream_fragment) \
  BIDI_LOG_WITH_CHECKING(::bidi::log::Sev::S_INFO, ARG_stream_fragment)
/// Logs at Sev::S_DEBUG.  @param ARG_stream_fragment See above.
#define BIDI_LOG_DEBUG(ARG_stream_fragment) \
  BIDI_LOG_WITH_CHECKING(::bidi::log::Sev::S_DEBUG, ARG_stream_fragment)
/// Logs at Sev::S_TRACE.  @param ARG_stream_fragment See above.
#define BIDI_LOG_TRACE(ARG_stream_fragment) \
  BIDI_LOG_WITH_CHECKING(::bidi::log::Sev::S_TRACE, ARG_stream_fragment)
/// Logs at Sev::S_DATA.  @param ARG_stream_fragment See above.
#define BIDI_LOG_DATA(ARG_stream_fragment) \
  BIDI_LOG_WITH_CHECKING(::bidi::log::Sev::S_DATA, ARG_stream_fragment)

///@}

/**
 * Declares, in the current block, the callables `get_logger()` (returning `ARG_logger_ptr`) and
 * `get_log_component()` (returning `Component(ARG_component_payload)`) that the `BIDI_LOG_...()` macros use.  For free
 * functions and `static` methods, which have no Log_context to inherit them from.  Inside a Log_context subclass
 * the locals shadow the members for the rest of the block.
 *
 * @param ARG_logger_ptr
 *        `Logger*` to log to; null means do not log.
 * @param ARG_component_payload
 *        Value of an `enum class` registered as a component type (e.g., bidi::Bidi_log_component::S_DICT).
 */
#define BIDI_LOG_SET_CONTEXT(ARG_logger_ptr, ARG_component_payload) \
  [[maybe_unused]] \
    const auto get_logger \
      = [BIDI_LOG_SET_CTX_logger = static_cast<::bidi::log::Logger*>(ARG_logger_ptr)] \
          () -> ::bidi::log::Logger* { return BIDI_LOG_SET_CTX_logger; }; \
  [[maybe_unused]] \
    const auto get_log_component \
      = [BIDI_LOG_SET_CTX_component = ::bidi::log::Component(ARG_component_payload)] \
          () -> const ::bidi::log::Component& { return BIDI_LOG_SET_CTX_component; }

/**
 * Logs at the given severity, if `get_logger()` is not null and its Logger::should_log() allows it.  The
 * severity-specific macros above are what call sites normally use.
 *
 * @param ARG_sev
 *        A log::Sev.
 * @param ARG_stream_fragment
 *        See BIDI_LOG_WARNING().
 */
#define BIDI_LOG_WITH_CHECKING(ARG_sev, ARG_stream_fragment) \
  BIDI_UTIL_SEMICOLON_SAFE \
  ( \
    ::bidi::log::Logger const * const BIDI_LOG_W_CHK_logger = get_logger(); \
    if (BIDI_LOG_W_CHK_logger && BIDI_LOG_W_CHK_logger->should_log(ARG_sev, get_log_component())) \
    { \
      BIDI_LOG_WITHOUT_CHECKING(ARG_sev, ARG_stream_fragment); \
    } \
  )

/**
 * Logs at the given severity, skipping Logger::should_log(); only a null `get_logger()` is checked for.  Use only
 * where the caller has already established the severity is enabled.
 *
 * Source file (last path segment) and function names are compile-time `String_view`s; the message is composed in a
 * util::String_ostream and handed to Logger::do_log() with a Msg_metadata.
 *
 * @param ARG_sev
 *        See BIDI_LOG_WITH_CHECKING().
 * @param ARG_stream_fragment
 *        See BIDI_LOG_WITH_CHECKING().
 */
#define BIDI_LOG_WITHOUT_CHECKING(ARG_sev, ARG_stream_fragment) \
  BIDI_UTIL_SEMICOLON_SAFE \
  ( \
    ::bidi::log::Logger* const BIDI_LOG_WO_CHK_logger = get_logger(); \
    if (!BIDI_LOG_WO_CHK_logger) \
    { \
      break; \
    } \
    /* else */ \
    constexpr ::bidi::util::String_view BIDI_LOG_WO_CHK_file \
      = ::bidi::util::get_last_path_segment(::bidi::util::String_view(__FILE__, sizeof(__FILE__) - 1)); \
    constexpr ::bidi::util::String_view BIDI_LOG_WO_CHK_func(__FUNCTION__, sizeof(__FUNCTION__) - 1); \
    ::bidi::util::String_ostream BIDI_LOG_WO_CHK_os; \
    BIDI_LOG_WO_CHK_os.os() << ARG_stream_fragment << ::std::flush; \
    /* Fill the fields one by one: a braced initializer's commas would split this macro's argument. */ \
    ::bidi::log::Msg_metadata BIDI_LOG_WO_CHK_metadata; \
    BIDI_LOG_WO_CHK_metadata.m_msg_component = get_log_component(); \
    BIDI_LOG_WO_CHK_metadata.m_msg_sev = ARG_sev; \
    BIDI_LOG_WO_CHK_metadata.m_msg_src_file = BIDI_LOG_WO_CHK_file; \
    BIDI_LOG_WO_CHK_metadata.m_msg_src_line = __LINE__; \
    BIDI_LOG_WO_CHK_metadata.m_msg_src_function = BIDI_LOG_WO_CHK_func; \
    BIDI_LOG_WO_CHK_metadata.m_called_when = ::std::chrono::system_clock::now(); \
    BIDI_LOG_WO_CHK_metadata.m_call_thread_id = ::boost::this_thread::get_id(); \
    BIDI_LOG_WO_CHK_logger->do_log(&BIDI_LOG_WO_CHK_metadata, BIDI_LOG_WO_CHK_os.str()); \
  )

namespace bidi::log
{

// Types.

/**
 * The component a log message belongs to: a value of some `enum class` (underlying type #enum_raw_t) chosen by the
 * logging module, plus the identity of that `enum class` type.  Keeping the type lets several modules, each with its
 * own component `enum`, share one Config without their numeric values clashing.
 *
 * A default-constructed Component is empty(): the message has no component, and Config applies its default
 * verbosity to it.
 */
class Component
{
public:
  // Types.

  /// Underlying integer type required of every component `enum class`.
  using enum_raw_t = unsigned int;

  // Constructors/destructor.

  /// Constructs an empty() Component.
  Component();

  /**
   * Constructs a Component holding the given `enum` value.
   *
   * @tparam Payload
   *         `enum class Payload : enum_raw_t`.
   * @param payload
   *        The component.
   */
  template<typename Payload>
  Component(Payload payload);

  // Methods.

  /**
   * Whether no payload is held.
   * @return See above.
   */
  bool empty() const;

  /**
   * The held value, converted back to its `enum` type.  `Payload` must be the type given at construction; and
   * `!empty()`.
   *
   * @tparam Payload
   *         See above.
   * @return See above.
   */
  template<typename Payload>
  Payload payload() const;

  /**
   * `typeid` of the `enum` type given at construction.  Requires `!empty()`.
   * @return See above.
   */
  const std::type_info& payload_type() const;

  /**
   * payload_type() wrapped for use as an associative-container key.  Requires `!empty()`.
   * @return See above.
   */
  std::type_index payload_type_index() const;

  /**
   * The held value as an integer.  Requires `!empty()`.
   * @return See above.
   */
  enum_raw_t payload_enum_raw_value() const;

private:
  // Data.

  /// `&typeid(Payload)`; null if and only if empty().
  const std::type_info* m_type;

  /// The `enum` value as an integer; 0 if empty().
  enum_raw_t m_raw_value;
}; // class Component

/**
 * What a `BIDI_LOG_...()` call site knows about a message, other than its text: handed to Logger::do_log() along
 * with the text.  Aggregate; the macros fill it in.
 */
struct Msg_metadata
{
  // Data.

  /// Component given by Log_context or BIDI_LOG_SET_CONTEXT(); possibly empty.
  Component m_msg_component;

  /// Severity, from the macro used.
  Sev m_msg_sev;

  /// Source file of the call site, without directories.  Refers to a string literal.
  util::String_view m_msg_src_file;

  /// Source line of the call site.
  unsigned int m_msg_src_line;

  /// Function containing the call site.  Refers to a string literal.
  util::String_view m_msg_src_function;

  /// When the call site executed.
  std::chrono::system_clock::time_point m_called_when;

  /// Thread that executed the call site.
  util::Thread_id m_call_thread_id;
}; // struct Msg_metadata

/**
 * A destination for log messages, plus the filter deciding which messages are worth producing at all.  Objects that
 * log (e.g., every bidi::dict container) take a `Logger*` at construction, null meaning no logging at all.
 *
 * Implementations must allow should_log() and do_log() to be called concurrently.
 */
class Logger :
  public util::Null_interface,
  private boost::noncopyable
{
public:
  // Methods.

  /**
   * Whether a message with the given severity and component would be output; call sites skip composing messages for
   * which this is `false`.
   *
   * @param sev
   *        Message severity.
   * @param component
   *        Message component; may be empty().
   * @return See above.
   */
  virtual bool should_log(Sev sev, const Component& component) const = 0;

  /**
   * `true` if do_log() may return before the message is output (and therefore copies whatever it needs).
   * @return See above.
   */
  virtual bool logs_asynchronously() const = 0;

  /**
   * Outputs a message, unconditionally (should_log() is the caller's business).
   *
   * @param metadata
   *        Everything but the text.  Not null.
   * @param msg
   *        The text.  Valid only until this returns.
   */
  virtual void do_log(Msg_metadata* metadata, util::String_view msg) = 0;
}; // class Logger

/**
 * Holder of a `Logger*` and a Component, exposing them as get_logger() and get_log_component(): the 2 names the
 * `BIDI_LOG_...()` macros call.  A class that logs derives from it (typically `public`ly, so its user can query the
 * Logger) and passes its Logger and component `enum` value to this constructor.
 */
class Log_context
{
public:
  // Constructors/destructor.

  /**
   * Stores `logger` and an empty Component.
   * @param logger
   *        May be null.
   */
  explicit Log_context(Logger* logger = 0);

  /**
   * Stores `logger` and `Component(component_payload)`.
   *
   * @tparam Component_payload
   *         See Component.
   * @param logger
   *        May be null.
   * @param component_payload
   *        See Component.
   */
  template<typename Component_payload>
  explicit Log_context(Logger* logger, Component_payload component_payload);

  /**
   * Copies the Logger pointer and Component.
   * @param src
   *        Source.
   */
  Log_context(const Log_context& src);

  /**
   * Takes the Logger pointer and Component; `src` is left with a null Logger and an empty Component.
   * @param src
   *        Source.
   */
  Log_context(Log_context&& src);

  // Methods.

  /**
   * Copies the Logger pointer and Component.
   * @param src
   *        Source.
   * @return `*this`.
   */
  Log_context& operator=(const Log_context& src);

  /**
   * Takes the Logger pointer and Component, as in the move constructor.
   * @param src
   *        Source.
   * @return `*this`.
   */
  Log_context& operator=(Log_context&& src);

  /**
   * Exchanges contents with `other`.
   * @param other
   *        Other object.
   */
  void swap(Log_context& other);

  /**
   * The stored Logger; possibly null.
   * @return See above.
   */
  Logger* get_logger() const;

  /**
   * The stored Component; possibly empty.
   * @return See above.
   */
  const Component& get_log_component() const;

private:
  // Data.

  /// See get_logger().
  Logger* m_logger;

  /// See get_log_component().
  Component m_component;
}; // class Log_context

// Template implementations.

template<typename Payload>
Component::Component(Payload payload) :
  m_type(&typeid(Payload)),
  m_raw_value(static_cast<enum_raw_t>(payload))
{
  static_assert(std::is_enum_v<Payload>, "A log component must be an enum value.");
  static_assert(std::is_same_v<std::underlying_type_t<Payload>, enum_raw_t>,
                "A log component enum must have Component::enum_raw_t as its underlying type.");
}

template<typename Payload>
Payload Component::payload() const
{
  return static_cast<Payload>(m_raw_value);
}

template<typename Component_payload>
Log_context::Log_context(Logger* logger, Component_payload component_payload) :
  m_logger(logger),
  m_component(component_payload)
{
  // Nothing else.
}

} // namespace bidi::log
