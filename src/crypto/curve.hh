#pragma once

#include "core/types.hh"

namespace suitegen {

// ============================================================================
// Ed25519 Curve Membership
// ============================================================================

// True when the 32 bytes decompress to a point on the ed25519 curve, using
// the same rule as the runtime (y taken from the low 255 bits, reduced mod p;
// the point exists when (y^2 - 1) / (d*y^2 + 1) is a square mod p).
// Derived addresses must fail this test.
[[nodiscard]] bool is_on_ed25519_curve(const Pubkey& point);

}  // namespace suitegen
