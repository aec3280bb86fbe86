#pragma once

#include "core/IGameRepo.hpp"
#include "core/eventHub.hpp"
#include "core/saveTracker.hpp"

#include <unordered_set>

namespace shroom {

//! Owns the state of one game session.
//! The session host owns the repository and hands it to its collaborators as IGameRepo.
//! \note Single threaded. Listeners are notified synchronously from within the call that changed the state.
//!       A listener calling back into the repository sees the counters already updated for the current call.
class GameRepo : public IGameRepo {
public:
	GameRepo();
	~GameRepo();

	GameRepo(const GameRepo&)            = delete;
	GameRepo& operator=(const GameRepo&) = delete;

	IAutoProp<bool>& isMouseCaptured() override;
	IAutoProp<int>& numCoinsCollected() override;
	IAutoProp<int>& numCoinsAtStart() override;
	IAutoProp<Vector3>& playerGlobalPosition() override;
	IAutoProp<Basis>& cameraBasis() override;

	Vector3 globalCameraDirection() const override;

	GameStatus status() const override;
	std::optional<GameOverReason> gameOverReason() const override;
	bool isSaving() const override;
	std::optional<SaveId> pendingSave() const override;

	int coinsBeingCollected() const; //!< Coins with a running collection animation.
	bool isDisposed() const;

	void subscribe(IGameSignalListener* listener, uint64_t signalMask) override;
	void unsubscribe(IGameSignalListener* listener) override;
	void subscribe(IGameEndListener* listener) override;
	void unsubscribe(IGameEndListener* listener) override;

	void setPlayerGlobalPosition(const Vector3& position) override;
	void setCameraBasis(const Basis& basis) override;

	void startCoinCollection(const ICoin& coin) override;
	void onFinishCoinCollection(const ICoin& coin) override;
	void onNumCoinsAtStart(int numCoinsAtStart) override;
	void onJumpshroomUsed() override;
	void jump() override;
	void onGameEnded(GameOverReason reason) override;
	void pause() override;
	void resume() override;

	SaveId startSaving() override;
	bool completeSaving(SaveId id) override;
	bool cancelSaving() override;

	void dispose() override;

	//! Restart the session: no coins collected, none in flight and game active again.
	//! Only available to the session host, not to collaborators using IGameRepo.
	void reset();

private:
	bool isWon() const; //!< All collections finished and enough coins collected.

private:
	AutoProp<bool> m_isMouseCaptured{false};
	AutoProp<Vector3> m_playerGlobalPosition{Vector3{0.0f}};
	AutoProp<Basis> m_cameraBasis{identityBasis()};
	AutoProp<int> m_numCoinsCollected{0};
	AutoProp<int> m_numCoinsAtStart{0};

	std::unordered_set<CoinId> m_coinsInFlight; //!< Coins started but not finished collecting.

	GameStatus m_status{GameStatus::Active};
	std::optional<GameOverReason> m_gameOverReason;

	SaveTracker m_saves;
	EventHub m_eventHub; //!< Hub to signal game events to external components.
	bool m_disposed{false};
};

} // namespace shroom
