#pragma once

#include <cstdint>
#include <optional>

namespace shroom {

using SaveId = uint64_t;

//! Book keeping for the save request currently handled by the save system.
//! At most one save is pending. Completion is reported separately from the request.
class SaveTracker {
public:
	//! Start a new save. Returns the pending id if a save is already running.
	//! \param [out] isNew True if a new save was started by this call.
	SaveId request(bool& isNew);

	bool complete(SaveId id); //!< Finish the pending save. False if id is not the pending save.
	bool cancel();            //!< Drop the pending save. False if nothing is pending.

	bool isPending() const;
	std::optional<SaveId> pending() const;

private:
	SaveId m_nextId{1u};
	std::optional<SaveId> m_pending; //!< Save handed to the save system but not finished yet.
};

} // namespace shroom
