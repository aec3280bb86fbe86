#include "core/eventHub.hpp"
#include "mockListener.hpp"

#include <gtest/gtest.h>
#include <memory>

namespace shroom::gtest {

TEST(EventHub, SignalMask) {
	EventHub hub;
	MockListener jumps;
	MockListener saves;
	hub.subscribe(static_cast<IGameSignalListener*>(&jumps), GS_Jumped | GS_JumpshroomUsed);
	hub.subscribe(static_cast<IGameSignalListener*>(&saves), GS_SaveRequested | GS_SaveCompleted);

	hub.signal(GS_Jumped);
	hub.signal(GS_SaveRequested);
	hub.signal(GS_JumpshroomUsed);
	hub.signal(GS_CoinCollected);

	EXPECT_EQ(jumps.signals, (std::vector<GameSignal>{GS_Jumped, GS_JumpshroomUsed}));
	EXPECT_EQ(saves.signals, (std::vector<GameSignal>{GS_SaveRequested}));
}

TEST(EventHub, SubscriptionOrder) {
	struct OrderListener : IGameSignalListener {
		OrderListener(std::vector<int>& log, int tag) : log{log}, tag{tag} {
		}
		void onGameSignal(GameSignal) override {
			log.push_back(tag);
		}
		std::vector<int>& log;
		int tag;
	};

	std::vector<int> log;
	OrderListener first{log, 1};
	OrderListener second{log, 2};
	OrderListener third{log, 3};

	EventHub hub;
	hub.subscribe(&first, GS_All);
	hub.subscribe(&second, GS_All);
	hub.subscribe(&third, GS_All);
	hub.signal(GS_CoinCollected);

	EXPECT_EQ(log, (std::vector<int>{1, 2, 3}));
}

TEST(EventHub, EndListeners) {
	EventHub hub;
	MockListener listener;
	hub.subscribe(static_cast<IGameEndListener*>(&listener));

	hub.signalEnd(GameOverReason::PlayerDied);
	EXPECT_EQ(listener.endReasons, (std::vector<GameOverReason>{GameOverReason::PlayerDied}));
	EXPECT_TRUE(listener.signals.empty());
}

TEST(EventHub, Unsubscribe) {
	EventHub hub;
	MockListener listener;
	hub.subscribe(static_cast<IGameSignalListener*>(&listener), GS_All);
	hub.subscribe(static_cast<IGameEndListener*>(&listener));
	EXPECT_EQ(hub.listenerCount(), 2u);

	hub.unsubscribe(static_cast<IGameSignalListener*>(&listener));
	hub.signal(GS_Jumped);
	hub.signalEnd(GameOverReason::Quit);
	EXPECT_TRUE(listener.signals.empty());
	EXPECT_EQ(listener.endReasons.size(), 1u);

	hub.unsubscribe(static_cast<IGameEndListener*>(&listener));
	hub.signalEnd(GameOverReason::Quit);
	EXPECT_EQ(listener.endReasons.size(), 1u);
	EXPECT_EQ(hub.listenerCount(), 0u);
}

// Listener leaving the hub while it is being notified.
TEST(EventHub, UnsubscribeFromCallback) {
	struct OneShot : IGameSignalListener {
		explicit OneShot(EventHub& hub) : hub{hub} {
		}
		void onGameSignal(GameSignal) override {
			++calls;
			hub.unsubscribe(this);
		}
		EventHub& hub;
		int calls{0};
	};

	EventHub hub;
	OneShot oneShot{hub};
	MockListener other;
	hub.subscribe(&oneShot, GS_All);
	hub.subscribe(static_cast<IGameSignalListener*>(&other), GS_All);

	hub.signal(GS_Jumped);
	hub.signal(GS_Jumped);

	EXPECT_EQ(oneShot.calls, 1);
	EXPECT_EQ(other.count(GS_Jumped), 2u);
}

// A listener removing and destroying a later listener while being notified.
TEST(EventHub, UnsubscribeOtherFromCallback) {
	struct Teardown : IGameSignalListener, IGameEndListener {
		Teardown(EventHub& hub, std::unique_ptr<MockListener>& hud) : hub{hub}, hud{hud} {
		}
		void onGameSignal(GameSignal) override {
			dropHud();
		}
		void onGameEnded(GameOverReason) override {
			dropHud();
		}
		void dropHud() {
			if (hud) {
				hub.unsubscribe(static_cast<IGameSignalListener*>(hud.get()));
				hub.unsubscribe(static_cast<IGameEndListener*>(hud.get()));
				hud.reset();
			}
		}
		EventHub& hub;
		std::unique_ptr<MockListener>& hud;
	};

	EventHub hub;
	auto hud = std::make_unique<MockListener>();
	Teardown teardown{hub, hud};
	hub.subscribe(static_cast<IGameSignalListener*>(&teardown), GS_GameEnded);
	hub.subscribe(static_cast<IGameSignalListener*>(hud.get()), GS_All);

	hub.signal(GS_GameEnded);
	EXPECT_FALSE(hud);
	EXPECT_EQ(hub.listenerCount(), 1u);

	hud = std::make_unique<MockListener>();
	hub.subscribe(static_cast<IGameEndListener*>(&teardown));
	hub.subscribe(static_cast<IGameEndListener*>(hud.get()));

	hub.signalEnd(GameOverReason::Quit);
	EXPECT_FALSE(hud);
	EXPECT_EQ(hub.listenerCount(), 2u);
}

TEST(EventHub, Clear) {
	EventHub hub;
	MockListener listener;
	hub.subscribe(static_cast<IGameSignalListener*>(&listener), GS_All);
	hub.subscribe(static_cast<IGameEndListener*>(&listener));

	hub.clear();
	hub.signal(GS_GameEnded);
	hub.signalEnd(GameOverReason::PlayerWon);

	EXPECT_TRUE(listener.signals.empty());
	EXPECT_TRUE(listener.endReasons.empty());
	EXPECT_EQ(hub.listenerCount(), 0u);
}

} // namespace shroom::gtest
