#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace shroom {

using SubscriptionId = uint64_t;

inline constexpr SubscriptionId kInvalidSubscription = 0u;

//! Read only view on an observable value.
//! \note Not thread safe. Subscribers are notified synchronously on the thread changing the value.
template <class T>
class IAutoProp {
public:
	struct Callbacks {
		std::function<void(const T&)> onChanged;
		std::function<void()> onCompleted; //!< Optional. Called once when the value is torn down.
	};

	virtual ~IAutoProp() = default;

	virtual const T& value() const   = 0;
	virtual bool isCompleted() const = 0;

	//! Get notified whenever the value changes. Returns kInvalidSubscription once completed.
	virtual SubscriptionId subscribe(Callbacks callbacks) = 0;

	//! Subscribe and immediately receive the current value.
	virtual SubscriptionId sync(Callbacks callbacks) = 0;

	virtual void unsubscribe(SubscriptionId id) = 0;
};

//! Value holder that notifies its subscribers on change.
template <class T>
class AutoProp : public IAutoProp<T> {
public:
	using Callbacks = typename IAutoProp<T>::Callbacks;

	explicit AutoProp(T initial);

	const T& value() const override;
	bool isCompleted() const override;

	SubscriptionId subscribe(Callbacks callbacks) override;
	SubscriptionId sync(Callbacks callbacks) override;
	void unsubscribe(SubscriptionId id) override;

	//! Store a new value. Returns true if it differed from the old one and subscribers were notified.
	//! \note Ignored once completed.
	bool set(T value);

	//! Notify completion and drop all subscribers. Later calls do nothing.
	void complete();

	std::size_t subscriberCount() const;

private:
	bool isSubscribed(SubscriptionId id) const;

	struct Subscriber {
		SubscriptionId id;
		Callbacks callbacks;
	};

private:
	T m_value;
	bool m_completed{false};
	SubscriptionId m_nextId{kInvalidSubscription + 1u};
	std::vector<Subscriber> m_subscribers; //!< In subscription order.
};


template <class T>
AutoProp<T>::AutoProp(T initial) : m_value(std::move(initial)) {
}

template <class T>
const T& AutoProp<T>::value() const {
	return m_value;
}

template <class T>
bool AutoProp<T>::isCompleted() const {
	return m_completed;
}

template <class T>
SubscriptionId AutoProp<T>::subscribe(Callbacks callbacks) {
	if (m_completed) {
		return kInvalidSubscription;
	}

	const auto id = m_nextId++;
	m_subscribers.push_back({id, std::move(callbacks)});
	return id;
}

template <class T>
SubscriptionId AutoProp<T>::sync(Callbacks callbacks) {
	auto onChanged = callbacks.onChanged;

	const auto id = subscribe(std::move(callbacks));
	if (id != kInvalidSubscription && onChanged) {
		onChanged(m_value);
	}
	return id;
}

template <class T>
void AutoProp<T>::unsubscribe(SubscriptionId id) {
	m_subscribers.erase(std::remove_if(m_subscribers.begin(), m_subscribers.end(), [&](const Subscriber& s) { return s.id == id; }),
	                    m_subscribers.end());
}

template <class T>
bool AutoProp<T>::set(T value) {
	if (m_completed || m_value == value) {
		return false;
	}
	m_value = std::move(value);

	// Work on a copy: subscribers may (un)subscribe while being notified.
	const T current        = m_value;
	const auto subscribers = m_subscribers;
	for (const auto& subscriber: subscribers) {
		if (subscriber.callbacks.onChanged && isSubscribed(subscriber.id)) {
			subscriber.callbacks.onChanged(current);
		}
	}
	return true;
}

template <class T>
void AutoProp<T>::complete() {
	if (m_completed) {
		return;
	}
	m_completed = true;

	const auto subscribers = std::move(m_subscribers);
	m_subscribers.clear();
	for (const auto& subscriber: subscribers) {
		if (subscriber.callbacks.onCompleted) {
			subscriber.callbacks.onCompleted();
		}
	}
}

template <class T>
std::size_t AutoProp<T>::subscriberCount() const {
	return m_subscribers.size();
}

template <class T>
bool AutoProp<T>::isSubscribed(SubscriptionId id) const {
	return std::any_of(m_subscribers.begin(), m_subscribers.end(), [&](const Subscriber& s) { return s.id == id; });
}

} // namespace shroom
