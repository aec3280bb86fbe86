#include "core/gameRepo.hpp"

#include "Logging.hpp"

#include <format>

namespace shroom {

GameRepo::GameRepo() = default;
GameRepo::~GameRepo() {
	dispose();
}

IAutoProp<bool>& GameRepo::isMouseCaptured() {
	return m_isMouseCaptured;
}
IAutoProp<int>& GameRepo::numCoinsCollected() {
	return m_numCoinsCollected;
}
IAutoProp<int>& GameRepo::numCoinsAtStart() {
	return m_numCoinsAtStart;
}
IAutoProp<Vector3>& GameRepo::playerGlobalPosition() {
	return m_playerGlobalPosition;
}
IAutoProp<Basis>& GameRepo::cameraBasis() {
	return m_cameraBasis;
}

Vector3 GameRepo::globalCameraDirection() const {
	return forward(m_cameraBasis.value());
}

GameStatus GameRepo::status() const {
	return m_status;
}
std::optional<GameOverReason> GameRepo::gameOverReason() const {
	return m_gameOverReason;
}
bool GameRepo::isSaving() const {
	return m_saves.isPending();
}
std::optional<SaveId> GameRepo::pendingSave() const {
	return m_saves.pending();
}
int GameRepo::coinsBeingCollected() const {
	return static_cast<int>(m_coinsInFlight.size());
}
bool GameRepo::isDisposed() const {
	return m_disposed;
}

void GameRepo::subscribe(IGameSignalListener* listener, uint64_t signalMask) {
	if (m_disposed) {
		Logger().Log(Logging::LogLevel::Warning, "[GameRepo] Subscribe after dispose ignored.");
		return;
	}
	m_eventHub.subscribe(listener, signalMask);
}
void GameRepo::unsubscribe(IGameSignalListener* listener) {
	m_eventHub.unsubscribe(listener);
}
void GameRepo::subscribe(IGameEndListener* listener) {
	if (m_disposed) {
		Logger().Log(Logging::LogLevel::Warning, "[GameRepo] Subscribe after dispose ignored.");
		return;
	}
	m_eventHub.subscribe(listener);
}
void GameRepo::unsubscribe(IGameEndListener* listener) {
	m_eventHub.unsubscribe(listener);
}

void GameRepo::setPlayerGlobalPosition(const Vector3& position) {
	m_playerGlobalPosition.set(position);
}
void GameRepo::setCameraBasis(const Basis& basis) {
	m_cameraBasis.set(basis);
}

void GameRepo::startCoinCollection(const ICoin& coin) {
	if (m_status != GameStatus::Active) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[GameRepo] Coin {} touched after game over. Ignored.", coin.id()));
		return;
	}
	if (!m_coinsInFlight.insert(coin.id()).second) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[GameRepo] Coin {} is already being collected.", coin.id()));
		return;
	}

	m_numCoinsCollected.set(m_numCoinsCollected.value() + 1);
	Logger().Log(Logging::LogLevel::Debug, std::format("[GameRepo] Collecting coin {} ({}/{}).", coin.id(), m_numCoinsCollected.value(),
	                                                   m_numCoinsAtStart.value()));

	m_eventHub.signal(GS_CoinCollected);
}

void GameRepo::onFinishCoinCollection(const ICoin& coin) {
	if (m_coinsInFlight.erase(coin.id()) == 0u) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[GameRepo] Coin {} finished without being collected. Ignored.", coin.id()));
		return;
	}

	// The game only ends once the last collection animation finished.
	if (m_status == GameStatus::Active && isWon()) {
		onGameEnded(GameOverReason::PlayerWon);
	}
}

void GameRepo::onNumCoinsAtStart(int numCoinsAtStart) {
	m_numCoinsAtStart.set(numCoinsAtStart);
	Logger().Log(Logging::LogLevel::Info, std::format("[GameRepo] World contains {} coins.", numCoinsAtStart));
}

void GameRepo::onJumpshroomUsed() {
	m_eventHub.signal(GS_JumpshroomUsed);
}

void GameRepo::jump() {
	m_eventHub.signal(GS_Jumped);
}

void GameRepo::onGameEnded(GameOverReason reason) {
	if (m_status == GameStatus::Done) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[GameRepo] Game already over. Ignoring end reason '{}'.", toString(reason)));
		return;
	}

	m_status         = GameStatus::Done;
	m_gameOverReason = reason;
	m_isMouseCaptured.set(false);

	Logger().Log(Logging::LogLevel::Info, std::format("[GameRepo] Game over: {}.", toString(reason)));
	m_eventHub.signal(GS_GameEnded);
	m_eventHub.signalEnd(reason);
}

void GameRepo::pause() {
	m_isMouseCaptured.set(false);
}

void GameRepo::resume() {
	m_isMouseCaptured.set(true);
}

SaveId GameRepo::startSaving() {
	bool isNew    = false;
	const auto id = m_saves.request(isNew);
	if (!isNew) {
		Logger().Log(Logging::LogLevel::Info, std::format("[GameRepo] Save {} still pending. Request ignored.", id));
		return id;
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[GameRepo] Save {} requested.", id));
	m_eventHub.signal(GS_SaveRequested);
	return id;
}

bool GameRepo::completeSaving(SaveId id) {
	if (!m_saves.complete(id)) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[GameRepo] Save {} is not pending. Completion ignored.", id));
		return false;
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[GameRepo] Save {} completed.", id));
	m_eventHub.signal(GS_SaveCompleted);
	return true;
}

bool GameRepo::cancelSaving() {
	const auto pending = m_saves.pending();
	if (!m_saves.cancel()) {
		Logger().Log(Logging::LogLevel::Warning, "[GameRepo] No save pending. Cancel ignored.");
		return false;
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[GameRepo] Save {} cancelled.", pending.value_or(0u)));
	m_eventHub.signal(GS_SaveCancelled);
	return true;
}

void GameRepo::dispose() {
	if (m_disposed) {
		return;
	}
	m_disposed = true;

	// Listeners are gone after dispose; a pending save is dropped without notification.
	m_eventHub.clear();
	m_saves.cancel();

	m_isMouseCaptured.complete();
	m_playerGlobalPosition.complete();
	m_cameraBasis.complete();
	m_numCoinsCollected.complete();
	m_numCoinsAtStart.complete();
}

void GameRepo::reset() {
	m_numCoinsCollected.set(0);
	m_coinsInFlight.clear();
	m_status = GameStatus::Active;
	m_gameOverReason.reset();

	Logger().Log(Logging::LogLevel::Info, "[GameRepo] Session reset.");
}

bool GameRepo::isWon() const {
	return m_coinsInFlight.empty() && m_numCoinsCollected.value() >= m_numCoinsAtStart.value();
}

} // namespace shroom
