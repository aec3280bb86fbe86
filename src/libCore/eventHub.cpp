#include "core/eventHub.hpp"

#include <algorithm>
#include <cassert>

namespace shroom {

void EventHub::subscribe(IGameSignalListener* listener, uint64_t signalMask) {
	assert(listener);
	m_signalListeners.push_back({listener, signalMask});
}

void EventHub::unsubscribe(IGameSignalListener* listener) {
	m_signalListeners.erase(
	        std::remove_if(m_signalListeners.begin(), m_signalListeners.end(), [&](const SignalListenerEntry& e) { return e.listener == listener; }),
	        m_signalListeners.end());
}

void EventHub::subscribe(IGameEndListener* listener) {
	assert(listener);
	m_endListeners.push_back({listener});
}

void EventHub::unsubscribe(IGameEndListener* listener) {
	m_endListeners.erase(
	        std::remove_if(m_endListeners.begin(), m_endListeners.end(), [&](const EndListenerEntry& e) { return e.listener == listener; }),
	        m_endListeners.end());
}

void EventHub::signal(GameSignal signal) {
	// Copy: listeners may unsubscribe themselves or others from within their callback.
	// Entries removed during the broadcast are skipped.
	const auto listeners = m_signalListeners;
	for (const auto& [listener, signalMask]: listeners) {
		if ((signalMask & signal) && isSubscribed(listener)) {
			listener->onGameSignal(signal);
		}
	}
}

void EventHub::signalEnd(GameOverReason reason) {
	const auto listeners = m_endListeners;
	for (const auto& entry: listeners) {
		if (isSubscribed(entry.listener)) {
			entry.listener->onGameEnded(reason);
		}
	}
}

void EventHub::clear() {
	m_signalListeners.clear();
	m_endListeners.clear();
}

std::size_t EventHub::listenerCount() const {
	return m_signalListeners.size() + m_endListeners.size();
}

bool EventHub::isSubscribed(const IGameSignalListener* listener) const {
	return std::any_of(m_signalListeners.begin(), m_signalListeners.end(), [&](const SignalListenerEntry& e) { return e.listener == listener; });
}

bool EventHub::isSubscribed(const IGameEndListener* listener) const {
	return std::any_of(m_endListeners.begin(), m_endListeners.end(), [&](const EndListenerEntry& e) { return e.listener == listener; });
}

} // namespace shroom
