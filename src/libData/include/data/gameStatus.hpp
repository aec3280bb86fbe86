#pragma once

namespace shroom {

enum class GameStatus {
	Active, //!< Game being played.
	Done    //!< Game over.
};

enum class GameOverReason {
	PlayerWon,  //!< All coins collected.
	PlayerDied, //!< Player fell out of the world.
	Quit        //!< Player left the game.
};

inline constexpr const char* toString(GameOverReason reason) {
	switch (reason) {
	case GameOverReason::PlayerWon:
		return "PlayerWon";
	case GameOverReason::PlayerDied:
		return "PlayerDied";
	case GameOverReason::Quit:
		return "Quit";
	}
	return "Unknown";
}

} // namespace shroom
