#pragma once

#include "core/gameSnapshot.hpp"

#include <string>

namespace ttt::store {

//! Single line record of the full game state.
//! Format: "STATE:round=<n>,status=<name>,turn=<A|B|None>,board=<r0>;<r1>;<r2>,seatA=<player>,seatB=<player>,queue=<player>;<player>..."
//! Rows hold the signed piece weights separated by '|'. A player is "<id>" or "<id>:<name>", an empty seat is empty.
//! Reserved characters in ids and names are percent encoded.
std::string encodeState(const GameSnapshot& snapshot);

//! Human readable multi line view of the table.
std::string renderState(const GameSnapshot& snapshot);

//! Percent encode the characters that delimit the state record.
std::string escapeField(const std::string& value);

} // namespace ttt::store
