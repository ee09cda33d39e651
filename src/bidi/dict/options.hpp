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

#include "bidi/dict/dict_fwd.hpp"
#include "bidi/log/log_fwd.hpp"
#include <boost/program_options.hpp>
#include <iosfwd>
#include <string>

namespace bidi::dict
{

// Types.

/**
 * A set of low-level options affecting a single bidi::dict container (Bidict, Ordered_bidict, or a frozen variant),
 * supplied at construction.  Typical user flow: construct a Bidict_options with defaults; optionally fill it from a
 * config file or command line via setup_config_parsing() and boost.program_options; pass it to the container's
 * constructor, which checks it with validate_options().
 *
 * You may print a filled Bidict_options to an `ostream` for the current settings stored in it (with the help text).
 *
 * ### Thread safety ###
 * Same as any `struct` with no locking done therein.
 *
 * @internal
 *
 * If you want to add an option: add the data member (`m_st_` prefix: options are fixed once a container accepts
 * them); initialize it in the constructor; add an ADD_CONFIG_OPTION() line into setup_config_parsing_helper(); and add
 * any sanity check into validate_options().
 */
struct Bidict_options
{
  // Types.

  /// Short-hand for boost.program_options config options description.  See setup_config_parsing().
  using Options_description = boost::program_options::options_description;

  // Constants.

  /**
   * The largest value of #m_st_n_buckets_hint accepted by validate_options().  Each of the two hash tables is
   * pre-allocated with that many buckets, so a larger value is almost certainly a configuration error.
   */
  static constexpr size_t S_MAX_N_BUCKETS_HINT = size_t(1) << 26;

  // Constructors/destructor.

  /// Constructs a Bidict_options with values equal to those used when the container creator supplies none.
  explicit Bidict_options();

  // Methods.

  /**
   * Modifies an `options_description` object: registers the options in `*this`, each with its default (the
   * current value in `*this`) and description, such that a subsequent parse (e.g., `boost::program_options::store()`
   * followed by `notify()`) loads the values into `*this`.  The option names are the member names without the
   * `m_st_` prefix, with `_` replaced by `-`; e.g., `collision-policy`.
   *
   * @param opts_desc
   *        The #Options_description object into which to load the help information, defaults, and mapping to members
   *        of `*this`.
   */
  void setup_config_parsing(Options_description* opts_desc);

  // Data.

  /**
   * How a value collision (associating a value with a key, while it is associated with another key) is resolved.
   * Config-file/command-line form: `raise` or `overwrite` (case-insensitive).
   */
  Collision_policy m_st_collision_policy;

  /**
   * Initial bucket count of each of the two hash indices; 0 means the hash table's own default.  Setting it to about
   * the expected number of associations avoids rehashing while the container grows.
   */
  size_t m_st_n_buckets_hint;

private:
  // Friends.

  // Friend of Bidict_options: For access to our internals.
  friend std::ostream& operator<<(std::ostream& os, const Bidict_options& opts);

  // Methods.

  /**
   * With `printout_only == false`: registers each option in `*opts_desc` to load into the corresponding member of
   * `*target`, with default and description from the same member of `defaults_source`.  With
   * `printout_only == true`: registers each option in a form suitable only for printing out `defaults_source` (no
   * target, no description).
   *
   * @param opts_desc
   *        The #Options_description object to modify.
   * @param target
   *        Where to load values on parse; ignored if `printout_only`.
   * @param defaults_source
   *        Defaults (or, for printing, values) come from here.
   * @param printout_only
   *        See above.
   */
  static void setup_config_parsing_helper(Options_description* opts_desc,
                                          Bidict_options* target,
                                          const Bidict_options& defaults_source,
                                          bool printout_only);

  /**
   * Helper of setup_config_parsing_helper() registering one option.
   *
   * @tparam Opt_type
   *         Type of the option's data member.
   * @param opts_desc
   *        See setup_config_parsing_helper().
   * @param opt_id
   *        Name of the data member, e.g., `"m_st_collision_policy"`.
   * @param target_val
   *        Pointer to the data member in the target.
   * @param default_val
   *        Default value.
   * @param description
   *        Help text.
   * @param printout_only
   *        See setup_config_parsing_helper().
   */
  template<typename Opt_type>
  static void add_config_option(Options_description* opts_desc,
                                const std::string& opt_id,
                                Opt_type* target_val, const Opt_type& default_val,
                                const char* description, bool printout_only);

  /**
   * Returns the option name for the data member named `opt_id`: e.g., `"m_st_n_buckets_hint"` yields
   * `"n-buckets-hint"`.
   *
   * @param opt_id
   *        Data member name.
   * @return See above.
   */
  static std::string opt_id_to_str(const std::string& opt_id);
}; // struct Bidict_options

// Free functions.

/**
 * Prints the name of each option in `opts`, along with its current value, to the given `ostream`.
 *
 * @param os
 *        Stream to which to serialize.
 * @param opts
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Bidict_options& opts);

/**
 * Checks the given options for values that cannot be used by a container: a collision policy outside the supported
 * policies (e.g., an unrecognized name parsed from a config file), or a bucket hint above
 * Bidict_options::S_MAX_N_BUCKETS_HINT.  Every container constructor taking a Bidict_options calls this.
 *
 * @param logger_ptr
 *        Logger to use for logging the failed check, if any (null allowed).
 * @param opts
 *        Options to check.
 * @param err_code
 *        See bidi::Error_code docs for error reporting semantics.  Error codes generated:
 *        error::Code::S_INVALID_POLICY, error::Code::S_INVALID_OPTION.
 * @return `true` if and only if `opts` passed every check.
 */
bool validate_options(log::Logger* logger_ptr, const Bidict_options& opts, Error_code* err_code = 0);

} // namespace bidi::dict
