#pragma once

#include <cstdint>

namespace tschnorr {

// Nonzero, unique within a signing session. Doubles as the participant's
// x-coordinate for Lagrange interpolation.
using ParticipantId = uint32_t;

}  // namespace tschnorr
