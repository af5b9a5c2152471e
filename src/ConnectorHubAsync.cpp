// =============================================================================
// ConnectorHubAsync Library - Unity Build
// =============================================================================
// Single translation unit that pulls in every implementation module.
// Arduino compiles it as-is; the host build compiles it as one library source.
// =============================================================================

// Include the public header first
#include "ConnectorHubAsync.h"

// Order matters: Core must be first (defines globals and utilities)
#include "internal/ConnectorHubCore.inl"
#include "internal/ConnectorHubCrypto.inl"
#include "internal/ConnectorHubProtocol.inl"
#include "internal/ConnectorHubClient.inl"
#include "internal/ConnectorHubRegistry.inl"
#include "internal/ConnectorHubDiscovery.inl"
