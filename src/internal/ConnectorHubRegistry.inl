// =============================================================================
// ConnectorHubAsync - Registry Module
// =============================================================================
// Contains: ConnectorHubRegistry (cached identities, live claims, stale pass)
// =============================================================================

#include "ConnectorHubInternal.h"

using namespace ConnectorHubInternal;

ConnectorHubRegistry::ConnectorHubRegistry() {
  reset();
}

void ConnectorHubRegistry::reset() {
  memset(_entries, 0, sizeof(_entries));
  _entryCount = 0;
  memset(_hubs, 0, sizeof(_hubs));
  memset(_hubScanned, 0, sizeof(_hubScanned));
  _hubCount = 0;
}

bool ConnectorHubRegistry::addCached(const char *identity, const char *displayName) {
  if (identity == nullptr || identity[0] == '\0') return false;
  if (find(identity) != nullptr) {
    CHUB_LOGD_F("Ignoring duplicate cached identity %s", identity);
    return false;
  }
  if (_entryCount >= kChubMaxRegistryEntries) {
    CHUB_LOGE_F("Registry full, cannot restore %s", displayName ? displayName : identity);
    return false;
  }

  ChubRegistryEntry &entry = _entries[_entryCount++];
  memset(&entry, 0, sizeof(entry));
  safeCopyStr(entry.identity, sizeof(entry.identity), identity);
  safeCopyStr(entry.displayName, sizeof(entry.displayName),
              (displayName && displayName[0]) ? displayName : identity);
  entry.claimed = false;

  CHUB_LOGI_F("Loading accessory from cache: %s", entry.displayName);
  return true;
}

void ConnectorHubRegistry::setHubs(const ChubIp hubs[], size_t count) {
  _hubCount = (count > kChubMaxHubs) ? kChubMaxHubs : count;
  for (size_t i = 0; i < _hubCount; ++i) {
    _hubs[i] = hubs[i];
    _hubScanned[i] = false;
  }
}

bool ConnectorHubRegistry::reconcile(const ChubExtendedDeviceRecord &device, const ChubIp &hub,
                                     const char *token, ChubAccessoryAction &action,
                                     const ChubRegistryEntry *&entry) {
  char identity[kChubIdentitySize];
  ConnectorHub_accessoryIdentity(device.mac, identity, sizeof(identity));

  ChubRegistryEntry *target = nullptr;
  for (size_t i = 0; i < _entryCount; ++i) {
    if (strcmp(_entries[i].identity, identity) == 0) {
      target = &_entries[i];
      break;
    }
  }

  if (target == nullptr) {
    if (_entryCount >= kChubMaxRegistryEntries) {
      CHUB_LOGE_F("Registry full, cannot add device %s", device.mac);
      return false;
    }
    target = &_entries[_entryCount++];
    memset(target, 0, sizeof(*target));
    safeCopyStr(target->identity, sizeof(target->identity), identity);
    snprintf(target->displayName, sizeof(target->displayName), "Connector Device %s", device.mac);
    action = ChubAccessoryAction::ADDED;
    CHUB_LOGI_F("Adding new accessory: %s", target->displayName);
  } else if (!target->claimed) {
    action = ChubAccessoryAction::RESTORED;
    CHUB_LOGI_F("Restoring existing accessory from cache: %s", target->displayName);
  } else {
    action = ChubAccessoryAction::UPDATED;
  }

  target->claimed = true;
  target->device = device;
  target->hub = hub;
  safeCopyStr(target->token, sizeof(target->token), token);

  entry = target;
  return true;
}

// =========================
// Scan Bookkeeping
// =========================

void ConnectorHubRegistry::markHubScanned(const ChubIp &hub) {
  for (size_t i = 0; i < _hubCount; ++i) {
    if (_hubs[i] == hub) {
      _hubScanned[i] = true;
      return;
    }
  }
}

bool ConnectorHubRegistry::isHubScanned(const ChubIp &hub) const {
  for (size_t i = 0; i < _hubCount; ++i) {
    if (_hubs[i] == hub) return _hubScanned[i];
  }
  return false;
}

bool ConnectorHubRegistry::allHubsScanned() const {
  if (_hubCount == 0) return false;
  for (size_t i = 0; i < _hubCount; ++i) {
    if (!_hubScanned[i]) return false;
  }
  return true;
}

int ConnectorHubRegistry::removeStale(ChubAccessoryCallback cb, void *context) {
  if (!allHubsScanned()) return -1;

  int removed = 0;
  size_t i = 0;
  while (i < _entryCount) {
    if (_entries[i].claimed) {
      ++i;
      continue;
    }

    CHUB_LOGI_F("Removing stale accessory: %s", _entries[i].displayName);
    if (cb != nullptr) {
      cb(context, ChubAccessoryAction::REMOVED, _entries[i]);
    }

    // Keep insertion order for the survivors
    for (size_t j = i + 1; j < _entryCount; ++j) {
      _entries[j - 1] = _entries[j];
    }
    --_entryCount;
    ++removed;
  }

  CHUB_LOGD_F("Finished looking for stale accessories, removed %d", removed);
  return removed;
}

// =========================
// Lookup
// =========================

const ChubRegistryEntry *ConnectorHubRegistry::find(const char *identity) const {
  if (identity == nullptr) return nullptr;
  for (size_t i = 0; i < _entryCount; ++i) {
    if (strcmp(_entries[i].identity, identity) == 0) return &_entries[i];
  }
  return nullptr;
}

const ChubRegistryEntry *ConnectorHubRegistry::entryAt(size_t index) const {
  return (index < _entryCount) ? &_entries[index] : nullptr;
}

size_t ConnectorHubRegistry::unclaimedCount() const {
  size_t count = 0;
  for (size_t i = 0; i < _entryCount; ++i) {
    if (!_entries[i].claimed) ++count;
  }
  return count;
}
