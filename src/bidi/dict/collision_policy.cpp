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
#include "bidi/dict/dict_fwd.hpp"
#include "bidi/util/util.hpp"
#include <cassert>
#include <ostream>

namespace bidi::dict
{

// Implementations.

Collision_decision decide_on_collision(Collision_policy policy, bool, bool value_exists_elsewhere)
{
  if (!value_exists_elsewhere)
  {
    // Key-only collision (or none): a key's value is always replaceable.
    return collision_policy_valid(policy) ? Collision_decision::S_PROCEED : Collision_decision::S_REJECT;
  }
  // else

  switch (policy)
  {
  case Collision_policy::S_RAISE:
    return Collision_decision::S_REJECT;
  case Collision_policy::S_OVERWRITE:
    return Collision_decision::S_PROCEED_AFTER_EVICTING_OTHER;
  case Collision_policy::S_END_SENTINEL:
    break;
  }
  return Collision_decision::S_REJECT;
} // decide_on_collision()

bool collision_policy_valid(Collision_policy policy)
{
  return (policy == Collision_policy::S_RAISE) || (policy == Collision_policy::S_OVERWRITE);
}

std::ostream& operator<<(std::ostream& os, Collision_policy val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  switch (val)
  {
  case Collision_policy::S_RAISE: return os << "RAISE";
  case Collision_policy::S_OVERWRITE: return os << "OVERWRITE";
  case Collision_policy::S_END_SENTINEL: break;
  }
  // Sentinel or an arbitrary integer cast to the enum: print the number.
  return os << static_cast<int>(val);
}

std::istream& operator>>(std::istream& is, Collision_policy& val)
{
  // Range [RAISE, END_SENTINEL); no match => END_SENTINEL; allow for number; case-insensitive.
  val = util::istream_to_enum(&is, Collision_policy::S_END_SENTINEL, Collision_policy::S_END_SENTINEL);
  return is;
}

std::ostream& operator<<(std::ostream& os, Collision_decision val)
{
  switch (val)
  {
  case Collision_decision::S_PROCEED: return os << "PROCEED";
  case Collision_decision::S_PROCEED_AFTER_EVICTING_OTHER: return os << "PROCEED_AFTER_EVICTING_OTHER";
  case Collision_decision::S_REJECT: return os << "REJECT";
  }
  assert(false && "Looks like a corrupt Collision_decision value.");
  return os;
}

} // namespace bidi::dict
