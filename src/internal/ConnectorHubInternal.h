// =============================================================================
// ConnectorHubAsync - Internal Header
// =============================================================================
// Internal types, constants, and declarations shared between the
// implementation modules. NOT part of the public API.
// =============================================================================

#pragma once

#include "../ConnectorHubAsync.h"

#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <ArduinoJson.h>

#include "mbedtls/aes.h"
#include "mbedtls/sha1.h"

namespace ConnectorHubInternal {

// =========================
// Protocol Constants
// =========================
constexpr uint16_t kSendPort = 32100;
constexpr uint16_t kReceivePort = 32101;
constexpr uint8_t kMulticastIp[4] = {238, 0, 0, 18};
constexpr size_t kAesBlock = 16;
constexpr size_t kMsgIdDigits = 17;
constexpr size_t kMaxPacketsPerUpdate = 8;
constexpr size_t kLogLineSize = 192;

// Capacity of the shared parse document: a kChubMaxDatagram-sized device list
// parsed in place (strings stay in the datagram, only nodes live here)
constexpr size_t kJsonCapacity = 2 * kChubMaxDatagram;

// Operation codes understood by WriteDevice
constexpr int kOpCloseDown = 0;
constexpr int kOpOpenUp = 1;
constexpr int kOpStop = 2;
constexpr int kOpStatusQuery = 5;

// =========================
// Inbound Messages
// =========================

enum class MsgType : uint8_t {
  UNKNOWN,
  DEVICE_LIST_ACK,
  WRITE_DEVICE_ACK,
  READ_DEVICE_ACK,
  REPORT,
  HEARTBEAT
};

// Tagged reply: `type` selects which of deviceList / status is meaningful
struct InboundMessage {
  MsgType type;
  char msgId[kChubMsgIdSize];
  bool hasMsgId;
  char actionResult[48];
  bool rejected;
  ChubDiscoveryReply deviceList;   // DEVICE_LIST_ACK
  ChubDeviceStatus status;         // WRITE_DEVICE_ACK, READ_DEVICE_ACK, REPORT
};

// =========================
// Global State (extern declarations)
// =========================
extern ChubLogSink g_logSink;
extern bool g_debugLogEnabled;

// Shared scratch (single-threaded use only)
extern StaticJsonDocument<kJsonCapacity> g_sharedJsonDoc;
extern InboundMessage g_sharedInbound;

// =========================
// Core Utility Functions
// =========================

// Safe string copy, always null-terminated
inline void safeCopyStr(char *dest, size_t destSize, const char *src) {
  if (destSize == 0) return;
  if (src == nullptr) {
    dest[0] = '\0';
    return;
  }
  size_t srcLen = strlen(src);
  size_t copyLen = (srcLen < destSize - 1) ? srcLen : destSize - 1;
  memcpy(dest, src, copyLen);
  dest[copyLen] = '\0';
}

// Wrap-safe "now has reached deadline"
inline bool timeReached(uint32_t now, uint32_t deadline) {
  return static_cast<int32_t>(now - deadline) >= 0;
}

inline ChubIp multicastIp() {
  ChubIp ip = {{kMulticastIp[0], kMulticastIp[1], kMulticastIp[2], kMulticastIp[3]}};
  return ip;
}

bool keyIsUsable(const char *key);
void bytesToHexUpper(const uint8_t *in, size_t len, char *out);
size_t pkcs7Unpad(const uint8_t *buffer, size_t len);

// Message building. Each returns bytes written (excluding terminator), 0 on overflow.
size_t buildGetDeviceList(const char *msgId, char *out, size_t outCap);
size_t buildWriteDevice(const ChubDeviceRecord &device, const char *accessToken,
                        const char *msgId, const ChubCommand &command,
                        char *out, size_t outCap);
size_t buildReadDevice(const ChubDeviceRecord &device, const char *accessToken,
                       const char *msgId, char *out, size_t outCap);

// Validates the datagram against the reply schema. json is parsed in place.
ChubErr parseInboundMessage(char *json, size_t len, InboundMessage &out);
MsgType msgTypeFromString(const char *msgType);

}  // namespace ConnectorHubInternal

// Bring commonly used items into scope for implementation files
using namespace ConnectorHubInternal;
