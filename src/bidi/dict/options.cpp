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
#include "bidi/dict/options.hpp"
#include "bidi/dict/error/error.hpp"
#include "bidi/error/error.hpp"
#include "bidi/log/log.hpp"
#include <boost/algorithm/string.hpp>

// File-local macros; #undef-ed at the bottom.

/// @cond

#define ADD_CONFIG_OPTION(ARG_opt, ARG_desc) \
  Bidict_options::add_config_option(opts_desc, #ARG_opt, &target->ARG_opt, defaults_source.ARG_opt, ARG_desc, \
                                    printout_only)
#define VALIDATE_CHECK(ARG_check) \
  validate_option_check(logger_ptr, ARG_check, #ARG_check, err_code)

/// @endcond

namespace bidi::dict
{

namespace
{

/**
 * Checks one condition of validate_options(); on failure logs the failed condition and emits
 * error::Code::S_INVALID_OPTION.
 *
 * @param logger_ptr
 *        Logger to use.
 * @param check
 *        Result of the condition.
 * @param check_str
 *        Text of the condition.
 * @param err_code
 *        Non-null error code pointer.
 * @return `check`.
 */
bool validate_option_check(log::Logger* logger_ptr, bool check, const std::string& check_str, Error_code* err_code)
{
  BIDI_LOG_SET_CONTEXT(logger_ptr, Bidi_log_component::S_DICT);

  if (!check)
  {
    BIDI_LOG_WARNING("Option check [" << check_str << "] is false.  Rejecting entire option set.");
    BIDI_ERROR_EMIT_ERROR(error::Code::S_INVALID_OPTION);
    return false;
  }
  // else
  return true;
}

} // namespace (anon)

// Method bodies.

Bidict_options::Bidict_options() :
  // Strict: a value collision is an error unless the user opts into overwriting.
  m_st_collision_policy(Collision_policy::S_RAISE),
  // Let boost.unordered pick.
  m_st_n_buckets_hint(0)
{
  // Nothing.
}

template<typename Opt_type>
void Bidict_options::add_config_option(Options_description* opts_desc,
                                       const std::string& opt_id,
                                       Opt_type* target_val, const Opt_type& default_val,
                                       const char* description, bool printout_only) // Static.
{
  namespace opts = boost::program_options;

  const auto name = opt_id_to_str(opt_id);
  if (!printout_only)
  {
    opts_desc->add_options()
      (name.c_str(), opts::value<Opt_type>(target_val)->default_value(default_val), description);
    return;
  }
  // else: value only; the help text would just clutter a printout of current settings.
  opts_desc->add_options()(name.c_str(), opts::value<Opt_type>()->default_value(default_val));
}

void Bidict_options::setup_config_parsing_helper(Options_description* opts_desc,
                                                 Bidict_options* target,
                                                 const Bidict_options& defaults_source,
                                                 bool printout_only) // Static.
{
  ADD_CONFIG_OPTION
    (m_st_collision_policy,
     "What to do when a key is to be associated with a value that is already associated with another key.  "
       "RAISE: reject the operation with a value-duplicate error, changing nothing.  OVERWRITE: first remove the "
       "other key's association, then proceed.  (Associating an existing key with a new value is never an error: "
       "the key's old value is replaced.)  Case-insensitive.");
  ADD_CONFIG_OPTION
    (m_st_n_buckets_hint,
     "Initial bucket count of each of the two hash indices (key to value, value to key).  0 means use the hash "
       "table default.  If the eventual number of associations is known, setting this to about that number avoids "
       "rehashing while the container grows.");
}

void Bidict_options::setup_config_parsing(Options_description* opts_desc)
{
  setup_config_parsing_helper(opts_desc, this, *this, false);
}

std::ostream& operator<<(std::ostream& os, const Bidict_options& opts)
{
  Bidict_options sink;
  Bidict_options::Options_description opts_desc{"Per-bidi::dict container option values"};
  Bidict_options::setup_config_parsing_helper(&opts_desc, &sink, opts, true);
  return os << opts_desc;
}

std::string Bidict_options::opt_id_to_str(const std::string& opt_id) // Static.
{
  constexpr util::String_view S_MEMBER_PREFIX = "m_st_";

  std::string name = boost::algorithm::starts_with(opt_id, S_MEMBER_PREFIX)
                       ? opt_id.substr(S_MEMBER_PREFIX.size())
                       : opt_id;
  boost::algorithm::replace_all(name, "_", "-");
  return name;
}

bool validate_options(log::Logger* logger_ptr, const Bidict_options& opts, Error_code* err_code)
{
  BIDI_ERROR_EXEC_AND_THROW_ON_ERROR(bool, validate_options, logger_ptr, opts, _1);

  BIDI_LOG_SET_CONTEXT(logger_ptr, Bidi_log_component::S_DICT);

  if (!collision_policy_valid(opts.m_st_collision_policy))
  {
    BIDI_LOG_WARNING("Collision policy [" << opts.m_st_collision_policy << "] is not a supported policy.");
    BIDI_ERROR_EMIT_ERROR(error::Code::S_INVALID_POLICY);
    return false;
  }
  // else

  if (!VALIDATE_CHECK(opts.m_st_n_buckets_hint <= Bidict_options::S_MAX_N_BUCKETS_HINT))
  {
    return false; // *err_code is set.
  }
  // else

  err_code->clear();
  return true;
} // validate_options()

} // namespace bidi::dict

#undef VALIDATE_CHECK
#undef ADD_CONFIG_OPTION
