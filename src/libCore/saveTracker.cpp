#include "core/saveTracker.hpp"

namespace shroom {

SaveId SaveTracker::request(bool& isNew) {
	isNew = !m_pending.has_value();
	if (isNew) {
		m_pending = m_nextId++;
	}
	return *m_pending;
}

bool SaveTracker::complete(SaveId id) {
	if (!m_pending || *m_pending != id) {
		return false;
	}
	m_pending.reset();
	return true;
}

bool SaveTracker::cancel() {
	if (!m_pending) {
		return false;
	}
	m_pending.reset();
	return true;
}

bool SaveTracker::isPending() const {
	return m_pending.has_value();
}
std::optional<SaveId> SaveTracker::pending() const {
	return m_pending;
}

} // namespace shroom
