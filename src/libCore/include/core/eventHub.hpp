#pragma once

#include "core/IGameEndListener.hpp"
#include "core/IGameSignalListener.hpp"

#include <cstddef>
#include <vector>

namespace shroom {

//! Allows external components to be updated on game events.
//! \note Signals are synchronous and run on the caller thread. Not thread safe: the game logic runs on a single thread.
//!       Listeners removed during a broadcast (by themselves or by another listener) are not called for the rest of it.
class EventHub {
	struct SignalListenerEntry {
		IGameSignalListener* listener; //!< Pointer to the listener.
		uint64_t signalMask;           //!< What events the listener cares about.
	};
	struct EndListenerEntry {
		IGameEndListener* listener; //!< Pointer to the listener.
	};

public:
	void subscribe(IGameSignalListener* listener, uint64_t signalMask);
	void unsubscribe(IGameSignalListener* listener);

	void subscribe(IGameEndListener* listener);
	void unsubscribe(IGameEndListener* listener);

	void signal(GameSignal signal);        //!< Signal a game event.
	void signalEnd(GameOverReason reason); //!< Signal the end of the game with its reason.
	void clear();                          //!< Drop all listeners.

	std::size_t listenerCount() const;

private:
	bool isSubscribed(const IGameSignalListener* listener) const;
	bool isSubscribed(const IGameEndListener* listener) const;

private:
	std::vector<SignalListenerEntry> m_signalListeners;
	std::vector<EndListenerEntry> m_endListeners;
};

} // namespace shroom
