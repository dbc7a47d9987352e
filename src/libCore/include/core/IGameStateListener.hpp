#pragma once

#include "core/gameSnapshot.hpp"

namespace ttt {

//! Consumer of the full game state, e.g. a persistence sink.
//! \note Called on the notification thread, never on the thread that changed the game.
class IGameStateListener {
public:
	virtual ~IGameStateListener()                          = default;
	virtual void onGameState(const GameSnapshot& snapshot) = 0;
};

} // namespace ttt
