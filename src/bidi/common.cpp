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
#include "bidi/common.hpp"

namespace bidi
{

// Globals.

const boost::unordered_multimap<Bidi_log_component, std::string> S_BIDI_LOG_COMPONENT_NAME_MAP
  {
    { Bidi_log_component::S_UNCAT, "UNCAT" },
    { Bidi_log_component::S_UTIL, "UTIL" },
    { Bidi_log_component::S_LOG, "LOG" },
    { Bidi_log_component::S_ERROR, "ERROR" },
    { Bidi_log_component::S_DICT, "DICT" }
  };

} // namespace bidi
