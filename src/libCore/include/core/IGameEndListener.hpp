#pragma once

#include "data/gameStatus.hpp"

namespace shroom {

class IGameEndListener {
public:
	virtual ~IGameEndListener()                     = default;
	virtual void onGameEnded(GameOverReason reason) = 0;
};

} // namespace shroom
