#include "core/gameRepo.hpp"

#include <glm/gtc/matrix_transform.hpp>

#include <format>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

namespace shroom::app {

//! Coin handle created from the ids typed on the command line.
class SessionCoin : public ICoin {
public:
	explicit SessionCoin(CoinId id) : m_id{id} {
	}
	CoinId id() const override {
		return m_id;
	}

private:
	CoinId m_id;
};

//! Prints everything the repository broadcasts.
class ConsoleListener : public IGameSignalListener, public IGameEndListener {
public:
	explicit ConsoleListener(GameRepo& repo) : m_repo{repo} {
		m_repo.subscribe(static_cast<IGameSignalListener*>(this), GS_All);
		m_repo.subscribe(static_cast<IGameEndListener*>(this));

		m_mouseSub = m_repo.isMouseCaptured().subscribe({
		        .onChanged   = [](const bool& captured) { std::cout << std::format("[Session] Mouse captured: {}\n", captured); },
		        .onCompleted = [] { std::cout << "[Session] Mouse capture released for good.\n"; },
		});
		m_coinSub = m_repo.numCoinsCollected().subscribe({
		        .onChanged   = [this](const int& collected) { std::cout << std::format("[Session] Coins: {}/{}\n", collected, m_repo.numCoinsAtStart().value()); },
		        .onCompleted = nullptr,
		});
	}
	~ConsoleListener() {
		m_repo.unsubscribe(static_cast<IGameSignalListener*>(this));
		m_repo.unsubscribe(static_cast<IGameEndListener*>(this));
		m_repo.isMouseCaptured().unsubscribe(m_mouseSub);
		m_repo.numCoinsCollected().unsubscribe(m_coinSub);
	}

	void onGameSignal(GameSignal signal) override {
		switch (signal) {
		case GS_CoinCollected:
			std::cout << "[Session] Coin collected.\n";
			break;
		case GS_JumpshroomUsed:
			std::cout << "[Session] Boing! Jumpshroom used.\n";
			break;
		case GS_Jumped:
			std::cout << "[Session] Jumped.\n";
			break;
		case GS_SaveRequested:
			std::cout << std::format("[Session] Save {} requested.\n", m_repo.pendingSave().value_or(0u));
			break;
		case GS_SaveCompleted:
			std::cout << "[Session] Save completed.\n";
			break;
		case GS_SaveCancelled:
			std::cout << "[Session] Save cancelled.\n";
			break;
		case GS_GameEnded:
			std::cout << "[Session] Game ended.\n";
			break;
		default:
			break;
		}
	}

	void onGameEnded(GameOverReason reason) override {
		std::cout << std::format("[Session] Game over reason: {}\n", toString(reason));
	}

private:
	GameRepo& m_repo;
	SubscriptionId m_mouseSub{kInvalidSubscription};
	SubscriptionId m_coinSub{kInvalidSubscription};
};

static std::optional<GameOverReason> parseReason(const std::string& text) {
	if (text == "won") {
		return GameOverReason::PlayerWon;
	}
	if (text == "died") {
		return GameOverReason::PlayerDied;
	}
	if (text == "quit") {
		return GameOverReason::Quit;
	}
	return std::nullopt;
}

static void printStatus(GameRepo& repo) {
	const auto pos = repo.playerGlobalPosition().value();
	std::cout << std::format("[Session] Status: {} | coins {}/{} ({} in flight) | mouse {} | player ({}, {}, {}) | saving {}\n",
	                         repo.status() == GameStatus::Active ? "Active" : "Done", repo.numCoinsCollected().value(), repo.numCoinsAtStart().value(),
	                         repo.coinsBeingCollected(), repo.isMouseCaptured().value() ? "captured" : "free", pos.x, pos.y, pos.z, repo.isSaving());
}

//! Execute a single command line. Returns false if the session should stop.
static bool execute(GameRepo& repo, const std::string& line) {
	std::istringstream input(line);
	std::string command;
	if (!(input >> command)) {
		return true;
	}

	if (command == "quit" || command == "exit") {
		return false;
	} else if (command == "coins") {
		int count = 0;
		if (input >> count) {
			repo.onNumCoinsAtStart(count);
			return true;
		}
	} else if (command == "collect" || command == "finish") {
		CoinId id = 0u;
		if (input >> id) {
			const SessionCoin coin{id};
			if (command == "collect") {
				repo.startCoinCollection(coin);
			} else {
				repo.onFinishCoinCollection(coin);
			}
			return true;
		}
	} else if (command == "jump") {
		repo.jump();
		return true;
	} else if (command == "shroom") {
		repo.onJumpshroomUsed();
		return true;
	} else if (command == "save") {
		repo.startSaving();
		return true;
	} else if (command == "save-done") {
		SaveId id = repo.pendingSave().value_or(0u);
		input >> id;
		if (!repo.completeSaving(id)) {
			std::cerr << std::format("[Session] Save {} is not pending.\n", id);
		}
		return true;
	} else if (command == "save-cancel") {
		if (!repo.cancelSaving()) {
			std::cerr << "[Session] No save to cancel.\n";
		}
		return true;
	} else if (command == "pause") {
		repo.pause();
		return true;
	} else if (command == "resume") {
		repo.resume();
		return true;
	} else if (command == "pos") {
		Vector3 position{0.0f};
		if (input >> position.x >> position.y >> position.z) {
			repo.setPlayerGlobalPosition(position);
			return true;
		}
	} else if (command == "yaw") {
		float degrees = 0.0f;
		if (input >> degrees) {
			repo.setCameraBasis(Basis{glm::rotate(glm::mat4{1.0f}, glm::radians(degrees), glm::vec3{0.0f, 1.0f, 0.0f})});
			return true;
		}
	} else if (command == "dir") {
		const auto dir = repo.globalCameraDirection();
		std::cout << std::format("[Session] Camera direction: ({:.3f}, {:.3f}, {:.3f})\n", dir.x, dir.y, dir.z);
		return true;
	} else if (command == "end") {
		std::string reasonText;
		input >> reasonText;
		if (const auto reason = parseReason(reasonText)) {
			repo.onGameEnded(*reason);
			return true;
		}
	} else if (command == "reset") {
		repo.reset();
		return true;
	} else if (command == "status") {
		printStatus(repo);
		return true;
	}

	std::cerr << std::format("[Session] Cannot handle '{}'.\n", line);
	return true;
}

} // namespace shroom::app

int main(int, char**) {
	shroom::GameRepo repo;
	{
		shroom::app::ConsoleListener listener{repo};

		// Drive the session from stdin until it closes or a quit command.
		std::string line;
		while (std::getline(std::cin, line)) {
			if (!shroom::app::execute(repo, line)) {
				break;
			}
		}

		// Listener still attached so it sees the teardown.
		repo.dispose();
	}
	return 0;
}
