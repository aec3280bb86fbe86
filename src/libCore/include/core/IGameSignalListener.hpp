#pragma once

#include "core/gameSignal.hpp"

namespace shroom {

class IGameSignalListener {
public:
	virtual ~IGameSignalListener()               = default;
	virtual void onGameSignal(GameSignal signal) = 0;
};

} // namespace shroom
