// =============================================================================
// KasaLan Library - Unity Build
// =============================================================================
// Single translation unit that includes every implementation module.
//   - Arduino IDE compatible (.inl files are not compiled separately)
//   - Same sources build the host static library used by the unit tests
// =============================================================================

#include "KasaLan.h"

// Order matters: Core must be first (defines globals and utilities)
#include "internal/KasaLanCore.inl"
#include "internal/KasaLanTransport.inl"
#include "internal/KasaLanDiscovery.inl"
#include "internal/KasaLanDevice.inl"
