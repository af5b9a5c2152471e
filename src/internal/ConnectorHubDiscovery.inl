// =============================================================================
// ConnectorHubAsync - Discovery Module
// =============================================================================
// Contains: Backoff policies, ConnectorHubDiscovery (per-hub scan state
// machine, registry reconciliation, deferred stale removal)
// =============================================================================

#include "ConnectorHubInternal.h"

using namespace ConnectorHubInternal;

// =========================
// Backoff Policies
// =========================

uint32_t ChubFixedBackoff::delayMs(uint32_t failures) const {
  (void)failures;
  return _intervalMs;
}

uint32_t ChubExponentialBackoff::delayMs(uint32_t failures) const {
  if (_baseMs == 0) return 0;
  uint32_t delay = _baseMs;
  for (uint32_t i = 1; i < failures && delay < _maxMs; ++i) {
    if (delay > _maxMs / 2) {
      delay = _maxMs;
      break;
    }
    delay *= 2;
  }
  return delay > _maxMs ? _maxMs : delay;
}

// =========================
// Lifecycle
// =========================

ConnectorHubDiscovery::ConnectorHubDiscovery()
    : _defaultBackoff(CONNECTOR_HUB_DISCOVERY_RETRY_MS),
      _backoff(&_defaultBackoff),
      _hubCount(0),
      _retryMs(CONNECTOR_HUB_DISCOVERY_RETRY_MS),
      _suspended(false),
      _started(false),
      _staleRemovalRequested(false),
      _staleCheckAt(0),
      _now(0),
      _accessoryCallback(nullptr),
      _accessoryContext(nullptr) {
  memset(_hubs, 0, sizeof(_hubs));
}

bool ConnectorHubDiscovery::begin(ConnectorHubTransport &transport, const ConnectorHubConfig &config) {
  ConnectorHub_setDebugLogEnabled(config.enableDebugLog);

  ChubConfigError errors[8];
  const size_t maxErrors = sizeof(errors) / sizeof(errors[0]);
  size_t errorCount = ConnectorHub_validateConfig(config, errors, maxErrors);
  if (errorCount > 0) {
    _suspended = true;
    CHUB_LOGE_F("Discovery suspended. Invalid configuration:");
    for (size_t i = 0; i < errorCount && i < maxErrors; ++i) {
      CHUB_LOGE_F("  %s", errors[i].message);
    }
    return false;
  }
  _suspended = false;

  memset(_hubs, 0, sizeof(_hubs));
  _hubCount = 0;
  bool joinMulticast = false;
  for (size_t i = 0; i < config.hubIpCount; ++i) {
    ChubIp address;
    ConnectorHub_parseIPv4(config.hubIps[i], address);
    if (findHub(address) != nullptr) {
      CHUB_LOGD_F("Ignoring duplicate hub IP %s", config.hubIps[i]);
      continue;
    }
    _hubs[_hubCount].address = address;
    _hubs[_hubCount].state = ChubScanState::PENDING;
    if (address.isMulticast()) joinMulticast = true;
    _hubCount++;
  }
  if (_hubCount == 0) {
    CHUB_LOGI_F("No hub IPs configured, using multicast discovery");
    _hubs[0].address = multicastIp();
    _hubs[0].state = ChubScanState::PENDING;
    _hubCount = 1;
    joinMulticast = true;
  }

  _retryMs = config.discoveryRetryMs;
  _defaultBackoff.setInterval(_retryMs);
  _client.setTimeouts(config.discoveryWindowMs, config.requestTimeoutMs, config.commandAttempts);
  _client.setSealedPayloads(config.sealedPayloads);
  if (!_client.begin(transport, config.connectorKey, joinMulticast)) {
    return false;
  }

  ChubIp addresses[kChubMaxHubs];
  for (size_t i = 0; i < _hubCount; ++i) {
    addresses[i] = _hubs[i].address;
  }
  _registry.setHubs(addresses, _hubCount);

  _started = false;
  _staleRemovalRequested = false;
  CHUB_LOGD_F("Finished initializing discovery (%u hubs)", static_cast<unsigned>(_hubCount));
  return true;
}

void ConnectorHubDiscovery::end() {
  _client.end();
  _started = false;
  _staleRemovalRequested = false;
}

// =========================
// Cache Restore
// =========================

bool ConnectorHubDiscovery::loadCache(const ChubCachedEntry entries[], size_t count) {
  if (_started) {
    CHUB_LOGW_F("Cache must be loaded before discovery starts");
    return false;
  }
  bool allLoaded = true;
  for (size_t i = 0; i < count; ++i) {
    if (!_registry.addCached(entries[i].identity, entries[i].displayName)) {
      allLoaded = false;
    }
  }
  return allLoaded;
}

bool ConnectorHubDiscovery::addCachedEntry(const char *identity, const char *displayName) {
  if (_started) {
    CHUB_LOGW_F("Cache must be loaded before discovery starts");
    return false;
  }
  return _registry.addCached(identity, displayName);
}

// =========================
// Scan State Machine
// =========================

bool ConnectorHubDiscovery::startDiscovery(uint32_t nowMs) {
  if (_suspended || !_client.isRunning()) return false;

  if (!_started) {
    CHUB_LOGD_F("Finished restoring %u cached accessories",
                static_cast<unsigned>(_registry.size()));
  }
  _started = true;
  _now = nowMs;

  for (size_t i = 0; i < _hubCount; ++i) {
    ChubHubScanState &hub = _hubs[i];
    // A scan already in flight covers this request
    if (hub.state == ChubScanState::SCANNING) continue;
    hub.state = ChubScanState::PENDING;
    issueScan(hub, nowMs);
  }
  return true;
}

void ConnectorHubDiscovery::update(uint32_t nowMs) {
  if (_suspended) return;
  _now = nowMs;

  // Command traffic flows even before the first scan
  _client.update(nowMs);
  if (!_started || !_client.isRunning()) return;

  for (size_t i = 0; i < _hubCount; ++i) {
    ChubHubScanState &hub = _hubs[i];
    if (hub.state == ChubScanState::PENDING) {
      issueScan(hub, nowMs);
    } else if (hub.state == ChubScanState::FAILED_RETRY && timeReached(nowMs, hub.retryAt)) {
      issueScan(hub, nowMs);
    }
  }

  if (_staleRemovalRequested && timeReached(nowMs, _staleCheckAt)) {
    if (_registry.allHubsScanned()) {
      _staleRemovalRequested = false;
      removeStaleEntries();
    } else {
      CHUB_LOGD_F("Not every hub has reported yet, checking again in %lu ms",
                  static_cast<unsigned long>(_retryMs));
      _staleCheckAt = nowMs + _retryMs;
    }
  }
}

void ConnectorHubDiscovery::issueScan(ChubHubScanState &hub, uint32_t nowMs) {
  char ipStr[16];
  ConnectorHub_ipToStr(hub.address, ipStr, sizeof(ipStr));

  ChubErr err = _client.queryDeviceList(hub.address, nowMs, &ConnectorHubDiscovery::onDeviceList, this);
  if (err == ChubErr::OK) {
    hub.state = ChubScanState::SCANNING;
    CHUB_LOGD_F("Scanning %s for devices", ipStr);
    return;
  }

  CHUB_LOGW_F("Could not query %s (%s)", ipStr, ConnectorHub_errName(err));
  scheduleRetry(hub, nowMs);
}

void ConnectorHubDiscovery::scheduleRetry(ChubHubScanState &hub, uint32_t nowMs) {
  hub.failures++;
  uint32_t delay = _backoff->delayMs(hub.failures);
  hub.retryAt = nowMs + delay;
  hub.state = ChubScanState::FAILED_RETRY;

  char ipStr[16];
  ConnectorHub_ipToStr(hub.address, ipStr, sizeof(ipStr));
  CHUB_LOGW_F("Failed to reach %s, retry in %lu ms", ipStr, static_cast<unsigned long>(delay));
}

void ConnectorHubDiscovery::onDeviceList(void *context, const ChubIp &target, ChubErr err,
                                         const ChubDiscoveryReply *replies, size_t replyCount) {
  (void)err;
  static_cast<ConnectorHubDiscovery *>(context)->handleDeviceList(target, replies, replyCount);
}

void ConnectorHubDiscovery::handleDeviceList(const ChubIp &target, const ChubDiscoveryReply *replies,
                                             size_t replyCount) {
  ChubHubScanState *hub = hubFor(target);
  if (hub == nullptr) return;

  // The host may pump the client directly, so take the client's clock
  if (replyCount == 0) {
    scheduleRetry(*hub, _client.lastUpdateMs());
    return;
  }

  for (size_t r = 0; r < replyCount; ++r) {
    const ChubDiscoveryReply &reply = replies[r];
    char ipStr[16];
    ConnectorHub_ipToStr(reply.from, ipStr, sizeof(ipStr));
    CHUB_LOGD_F("Hub %s (fw %s) lists %u devices", ipStr, reply.fwVersion,
                static_cast<unsigned>(reply.deviceCount));

    for (size_t d = 0; d < reply.deviceCount; ++d) {
      const ChubDeviceRecord &device = reply.devices[d];
      if (device.kind == ChubDeviceKind::WIFI_BRIDGE) continue;

      ChubExtendedDeviceRecord extended;
      memset(&extended, 0, sizeof(extended));
      static_cast<ChubDeviceRecord &>(extended) = device;
      safeCopyStr(extended.fwVersion, sizeof(extended.fwVersion), reply.fwVersion);

      // Commands go to the hub that answered, not the multicast group
      ChubAccessoryAction action;
      const ChubRegistryEntry *entry = nullptr;
      if (!_registry.reconcile(extended, reply.from, reply.token, action, entry)) continue;

      if (_accessoryCallback != nullptr) {
        _accessoryCallback(_accessoryContext, action, *entry);
      }
    }
  }

  _registry.markHubScanned(hub->address);
  hub->state = ChubScanState::SUCCEEDED;
  hub->failures = 0;
  hub->completedScans++;
}

// =========================
// Stale Removal
// =========================

void ConnectorHubDiscovery::requestStaleRemoval() {
  if (_suspended) return;
  _staleRemovalRequested = true;
  _staleCheckAt = _now;
}

int ConnectorHubDiscovery::removeStaleEntries() {
  if (_suspended) return -1;
  int removed = _registry.removeStale(_accessoryCallback, _accessoryContext);
  if (removed < 0) {
    CHUB_LOGD_F("Not every hub has reported yet, keeping cached accessories");
  }
  return removed;
}

// =========================
// Accessors
// =========================

void ConnectorHubDiscovery::setAccessoryCallback(ChubAccessoryCallback cb, void *context) {
  _accessoryCallback = cb;
  _accessoryContext = context;
}

void ConnectorHubDiscovery::setBackoffPolicy(const ChubBackoffPolicy *policy) {
  _backoff = (policy != nullptr) ? policy : &_defaultBackoff;
}

const ChubHubScanState *ConnectorHubDiscovery::getHub(size_t index) const {
  return (index < _hubCount) ? &_hubs[index] : nullptr;
}

const ChubHubScanState *ConnectorHubDiscovery::findHub(const ChubIp &address) const {
  for (size_t i = 0; i < _hubCount; ++i) {
    if (_hubs[i].address == address) return &_hubs[i];
  }
  return nullptr;
}

ChubHubScanState *ConnectorHubDiscovery::hubFor(const ChubIp &address) {
  for (size_t i = 0; i < _hubCount; ++i) {
    if (_hubs[i].address == address) return &_hubs[i];
  }
  return nullptr;
}
