// =============================================================================
// ConnectorHubAsync - Core Module
// =============================================================================
// Contains: Global log state, shared buffers, logging, addresses,
// error names, device types, configuration validation
// =============================================================================

#include "ConnectorHubInternal.h"

namespace ConnectorHubInternal {

// =========================
// Global State Definitions
// =========================

ChubLogSink g_logSink = nullptr;
bool g_debugLogEnabled = false;

// Shared scratch buffers (RAM optimization, never held across update() calls)
StaticJsonDocument<kJsonCapacity> g_sharedJsonDoc;
InboundMessage g_sharedInbound;

}  // namespace ConnectorHubInternal

// =========================
// Logging
// =========================

void ConnectorHub_setLogSink(ChubLogSink sink) {
  g_logSink = sink;
}

void ConnectorHub_setDebugLogEnabled(bool enabled) {
  g_debugLogEnabled = enabled;
}

bool ConnectorHub_isDebugLogEnabled() {
  return g_debugLogEnabled;
}

void ConnectorHub_log(ChubLogLevel level, const char *fmt, ...) {
  if (g_logSink == nullptr || fmt == nullptr) return;
  char line[kLogLineSize];
  va_list args;
  va_start(args, fmt);
  vsnprintf(line, sizeof(line), fmt, args);
  va_end(args);
  g_logSink(level, line);
}

// =========================
// Addresses
// =========================

bool ConnectorHub_parseIPv4(const char *str, ChubIp &out) {
  if (str == nullptr) return false;

  ChubIp ip{};
  const char *p = str;
  for (int i = 0; i < 4; ++i) {
    if (*p < '0' || *p > '9') return false;
    // "01" style octets are ambiguous (octal in some parsers), reject them
    if (*p == '0' && p[1] >= '0' && p[1] <= '9') return false;

    unsigned value = 0;
    int digits = 0;
    while (*p >= '0' && *p <= '9') {
      if (++digits > 3) return false;
      value = value * 10 + static_cast<unsigned>(*p - '0');
      ++p;
    }
    if (value > 255) return false;
    ip.octet[i] = static_cast<uint8_t>(value);

    if (i < 3) {
      if (*p != '.') return false;
      ++p;
    }
  }
  if (*p != '\0') return false;

  out = ip;
  return true;
}

bool ConnectorHub_isIPv4(const char *str) {
  ChubIp ignored;
  return ConnectorHub_parseIPv4(str, ignored);
}

void ConnectorHub_ipToStr(const ChubIp &ip, char *out, size_t outSize) {
  if (out == nullptr || outSize < 16) return;  // "255.255.255.255\0"
  snprintf(out, outSize, "%u.%u.%u.%u", ip.octet[0], ip.octet[1], ip.octet[2], ip.octet[3]);
}

ChubIp ConnectorHub_multicastGroup() {
  return multicastIp();
}

// =========================
// Names
// =========================

const char *ConnectorHub_errName(ChubErr err) {
  switch (err) {
    case ChubErr::OK:               return "OK";
    case ChubErr::TIMEOUT:          return "TIMEOUT";
    case ChubErr::WRONG_SOURCE_IP:  return "WRONG_SOURCE_IP";
    case ChubErr::DECRYPT_FAIL:     return "DECRYPT_FAIL";
    case ChubErr::INVALID_RESPONSE: return "INVALID_RESPONSE";
    case ChubErr::HUB_REJECTED:     return "HUB_REJECTED";
    case ChubErr::INVALID_CONFIG:   return "INVALID_CONFIG";
    case ChubErr::SEND_FAIL:        return "SEND_FAIL";
    case ChubErr::BUSY:             return "BUSY";
    case ChubErr::NO_TOKEN:         return "NO_TOKEN";
  }
  return "UNKNOWN";
}

const char *ConnectorHub_actionName(ChubAccessoryAction action) {
  switch (action) {
    case ChubAccessoryAction::ADDED:    return "ADDED";
    case ChubAccessoryAction::RESTORED: return "RESTORED";
    case ChubAccessoryAction::UPDATED:  return "UPDATED";
    case ChubAccessoryAction::REMOVED:  return "REMOVED";
  }
  return "UNKNOWN";
}

ChubDeviceKind ConnectorHub_deviceKind(const char *deviceType) {
  if (deviceType == nullptr || deviceType[0] == '\0') return ChubDeviceKind::UNKNOWN;
  if (strcmp(deviceType, CHUB_DEVICE_TYPE_WIFI_BRIDGE) == 0) return ChubDeviceKind::WIFI_BRIDGE;
  if (strcmp(deviceType, CHUB_DEVICE_TYPE_RADIO_MOTOR) == 0) return ChubDeviceKind::RADIO_MOTOR;
  if (strcmp(deviceType, CHUB_DEVICE_TYPE_WIFI_CURTAIN) == 0) return ChubDeviceKind::WIFI_CURTAIN;
  if (strcmp(deviceType, CHUB_DEVICE_TYPE_WIFI_TUBULAR_MOTOR) == 0) return ChubDeviceKind::WIFI_TUBULAR_MOTOR;
  if (strcmp(deviceType, CHUB_DEVICE_TYPE_WIFI_RECEIVER) == 0) return ChubDeviceKind::WIFI_RECEIVER;
  return ChubDeviceKind::UNKNOWN;
}

// =========================
// Configuration
// =========================

namespace {

void addConfigError(ChubConfigError errors[], size_t maxErrors, size_t &count,
                    const char *fmt, ...) {
  if (errors != nullptr && count < maxErrors) {
    va_list args;
    va_start(args, fmt);
    vsnprintf(errors[count].message, sizeof(errors[count].message), fmt, args);
    va_end(args);
  }
  ++count;
}

}  // namespace

size_t ConnectorHub_validateConfig(const ConnectorHubConfig &config,
                                   ChubConfigError errors[], size_t maxErrors) {
  size_t count = 0;

  if (config.connectorKey == nullptr || config.connectorKey[0] == '\0') {
    addConfigError(errors, maxErrors, count, "App Key has not been configured");
  } else if (!keyIsUsable(config.connectorKey)) {
    addConfigError(errors, maxErrors, count, "App Key must be %u characters",
                   static_cast<unsigned>(kChubKeyLen));
  }

  if (config.hubIpCount > 0 && config.hubIps == nullptr) {
    addConfigError(errors, maxErrors, count, "Hub IP list is missing");
    return count;
  }
  if (config.hubIpCount > kChubMaxHubs) {
    addConfigError(errors, maxErrors, count, "Too many hub IPs (max %u)",
                   static_cast<unsigned>(kChubMaxHubs));
  }
  for (size_t i = 0; i < config.hubIpCount; ++i) {
    const char *ip = config.hubIps[i];
    if (!ConnectorHub_isIPv4(ip)) {
      addConfigError(errors, maxErrors, count, "Hub IP is not valid IPv4: %.40s",
                     ip ? ip : "(null)");
    }
  }

  if (config.commandAttempts == 0) {
    addConfigError(errors, maxErrors, count, "commandAttempts must be at least 1");
  }
  if (config.discoveryRetryMs == 0) {
    addConfigError(errors, maxErrors, count, "discoveryRetryMs must be greater than 0");
  }
  if (config.discoveryWindowMs == 0) {
    addConfigError(errors, maxErrors, count, "discoveryWindowMs must be greater than 0");
  }
  if (config.requestTimeoutMs == 0) {
    addConfigError(errors, maxErrors, count, "requestTimeoutMs must be greater than 0");
  }

  return count;
}
