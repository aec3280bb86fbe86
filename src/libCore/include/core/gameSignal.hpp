#pragma once

#include <cstdint>

namespace shroom {

//! Types of signals.
enum GameSignal : std::uint64_t {
	GS_None           = 0,
	GS_CoinCollected  = 1 << 0, //!< Player started collecting a coin.
	GS_JumpshroomUsed = 1 << 1, //!< Player bounced off a jumpshroom.
	GS_Jumped         = 1 << 2, //!< Player jumped.
	GS_SaveRequested  = 1 << 3, //!< Game should be saved. Query the pending save id.
	GS_SaveCompleted  = 1 << 4, //!< Save system finished the pending save.
	GS_SaveCancelled  = 1 << 5, //!< Pending save was dropped.
	GS_GameEnded      = 1 << 6, //!< Game over. Query the reason.
	GS_All            = (1 << 7) - 1,
};

} // namespace shroom
