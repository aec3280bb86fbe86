#pragma once

#include <cstdint>

namespace shroom {

using CoinId = uint64_t;

//! Coin in the game world that the player can collect.
class ICoin {
public:
	virtual ~ICoin()          = default;
	virtual CoinId id() const = 0; //!< Stable for the lifetime of the coin.
};

} // namespace shroom
