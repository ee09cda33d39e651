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

// Everything a user of bidi::dict containers needs.  serialization.hpp is separate (it pulls in Boost.Serialization).
#include "bidi/dict/dict_fwd.hpp"
#include "bidi/dict/interfaces.hpp"
#include "bidi/dict/options.hpp"
#include "bidi/dict/basic_bidict.hpp"
#include "bidi/dict/inverse_view.hpp"
#include "bidi/dict/frozen_bidict.hpp"
#include "bidi/dict/named_bidict.hpp"
#include "bidi/dict/util.hpp"
#include "bidi/dict/error/error.hpp"
#include "bidi/dict/detail/hashed_dual_index.hpp"
#include "bidi/dict/detail/linked_dual_index.hpp"
