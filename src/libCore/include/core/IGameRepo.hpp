#pragma once

#include "core/IGameEndListener.hpp"
#include "core/IGameSignalListener.hpp"
#include "core/saveTracker.hpp"
#include "data/autoProp.hpp"
#include "data/coin.hpp"
#include "data/gameStatus.hpp"
#include "data/math.hpp"

#include <cstdint>
#include <optional>

namespace shroom {

//! Game session state shared between the views, UI, audio and the save system.
//! Views push the per frame state and report gameplay events. Everything else subscribes to the
//! observable properties or to the game signals.
class IGameRepo {
public:
	virtual ~IGameRepo() = default;

	// Observable session state
	virtual IAutoProp<bool>& isMouseCaptured()         = 0; //!< Mouse captured status.
	virtual IAutoProp<int>& numCoinsCollected()        = 0; //!< Number of coins collected by the player.
	virtual IAutoProp<int>& numCoinsAtStart()          = 0; //!< Total number of coins the world started with.
	virtual IAutoProp<Vector3>& playerGlobalPosition() = 0; //!< Player position in global coordinates.
	virtual IAutoProp<Basis>& cameraBasis()            = 0; //!< Camera global transform basis.

	virtual Vector3 globalCameraDirection() const = 0; //!< Camera global forward direction. Derived from the camera basis.

	virtual GameStatus status() const                            = 0;
	virtual std::optional<GameOverReason> gameOverReason() const = 0; //!< Set once the game ended.
	virtual bool isSaving() const                                = 0;
	virtual std::optional<SaveId> pendingSave() const            = 0;

	// Game signals
	virtual void subscribe(IGameSignalListener* listener, uint64_t signalMask) = 0;
	virtual void unsubscribe(IGameSignalListener* listener)                    = 0;
	virtual void subscribe(IGameEndListener* listener)                         = 0;
	virtual void unsubscribe(IGameEndListener* listener)                       = 0;

	// Per frame updates from the views
	virtual void setPlayerGlobalPosition(const Vector3& position) = 0;
	virtual void setCameraBasis(const Basis& basis)               = 0;

	// Gameplay
	virtual void startCoinCollection(const ICoin& coin)    = 0; //!< Player touched a coin. Collection animation starts. Coins already in flight are deduplicated by id.
	virtual void onFinishCoinCollection(const ICoin& coin) = 0; //!< Collection animation of the coin is done.
	virtual void onNumCoinsAtStart(int numCoinsAtStart)    = 0; //!< Called once when the world is set up.
	virtual void onJumpshroomUsed()                        = 0;
	virtual void jump()                                    = 0;
	virtual void onGameEnded(GameOverReason reason)        = 0; //!< Releases the mouse and informs listeners.
	virtual void pause()                                   = 0; //!< Release the mouse.
	virtual void resume()                                  = 0; //!< Recapture the mouse.

	// Saving
	virtual SaveId startSaving()           = 0; //!< Ask the save system to save. Completion is reported with completeSaving.
	virtual bool completeSaving(SaveId id) = 0; //!< Save system finished the given save.
	virtual bool cancelSaving()            = 0; //!< Drop the pending save.

	//! Complete all observable properties and drop every listener. Safe to call more than once.
	virtual void dispose() = 0;
};

} // namespace shroom
