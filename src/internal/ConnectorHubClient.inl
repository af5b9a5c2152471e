// =============================================================================
// ConnectorHubAsync - Client Module
// =============================================================================
// Contains: ConnectorHubClient (requests, correlation, timeouts, token cache)
// =============================================================================

#include "ConnectorHubInternal.h"

using namespace ConnectorHubInternal;

ConnectorHubClient::ConnectorHubClient()
    : _transport(nullptr),
      _hasKey(false),
      _sealed(false),
      _discoveryWindowMs(CONNECTOR_HUB_DISCOVERY_WINDOW_MS),
      _requestTimeoutMs(CONNECTOR_HUB_REQUEST_TIMEOUT_MS),
      _commandAttempts(CONNECTOR_HUB_COMMAND_ATTEMPTS),
      _nextMsgId(1),
      _lastUpdateMs(0),
      _errorCallback(nullptr),
      _errorContext(nullptr) {
  memset(_key, 0, sizeof(_key));
  memset(_discoveries, 0, sizeof(_discoveries));
  memset(_commands, 0, sizeof(_commands));
  memset(_tokens, 0, sizeof(_tokens));
}

bool ConnectorHubClient::begin(ConnectorHubTransport &transport, const char *connectorKey,
                               bool joinMulticast) {
  if (_transport != nullptr) {
    end();
  }

  // Discovery works without a key; commands refuse with INVALID_CONFIG
  _hasKey = keyIsUsable(connectorKey);
  safeCopyStr(_key, sizeof(_key), _hasKey ? connectorKey : "");

  bool opened = joinMulticast ? transport.beginMulticast(multicastIp(), kReceivePort)
                              : transport.begin(kReceivePort);
  if (!opened) {
    CHUB_LOGE_F("Failed to open UDP port %u", static_cast<unsigned>(kReceivePort));
    return false;
  }

  _transport = &transport;
  return true;
}

void ConnectorHubClient::end() {
  if (_transport != nullptr) {
    _transport->stop();
  }
  _transport = nullptr;
  for (size_t i = 0; i < kChubMaxHubs; ++i) {
    _discoveries[i].inUse = false;
  }
  for (size_t i = 0; i < kChubMaxPendingCommands; ++i) {
    _commands[i].inUse = false;
  }
}

void ConnectorHubClient::setTimeouts(uint32_t discoveryWindowMs, uint32_t requestTimeoutMs,
                                     uint8_t commandAttempts) {
  _discoveryWindowMs = discoveryWindowMs;
  _requestTimeoutMs = requestTimeoutMs;
  _commandAttempts = commandAttempts > 0 ? commandAttempts : 1;
}

void ConnectorHubClient::setErrorCallback(ChubErrorCallback cb, void *context) {
  _errorCallback = cb;
  _errorContext = context;
}

// =========================
// Requests
// =========================

ChubErr ConnectorHubClient::queryDeviceList(const ChubIp &hub, uint32_t nowMs,
                                            ChubDeviceListCallback cb, void *context) {
  if (_transport == nullptr) return ChubErr::SEND_FAIL;

  DiscoverySlot *slot = nullptr;
  for (size_t i = 0; i < kChubMaxHubs; ++i) {
    if (_discoveries[i].inUse) {
      if (_discoveries[i].target == hub) return ChubErr::BUSY;
    } else if (slot == nullptr) {
      slot = &_discoveries[i];
    }
  }
  if (slot == nullptr) return ChubErr::BUSY;

  char msgId[kChubMsgIdSize];
  nextMsgId(msgId, sizeof(msgId));

  char json[128];
  size_t len = buildGetDeviceList(msgId, json, sizeof(json));
  if (len == 0) return ChubErr::SEND_FAIL;

  char ipStr[16];
  ConnectorHub_ipToStr(hub, ipStr, sizeof(ipStr));
  if (!_transport->send(hub, kSendPort, reinterpret_cast<const uint8_t *>(json), len)) {
    CHUB_LOGW_F("Failed to send GetDeviceList to %s", ipStr);
    emitError(hub, ChubOp::Discovery, ChubErr::SEND_FAIL, 0);
    return ChubErr::SEND_FAIL;
  }
  CHUB_LOGNET_F("-> %s %s", ipStr, json);

  memset(slot, 0, sizeof(*slot));
  slot->inUse = true;
  slot->target = hub;
  slot->multicast = hub.isMulticast();
  safeCopyStr(slot->msgId, sizeof(slot->msgId), msgId);
  slot->sentAt = nowMs;
  slot->deadline = nowMs + _discoveryWindowMs;
  slot->cb = cb;
  slot->context = context;
  return ChubErr::OK;
}

ChubErr ConnectorHubClient::sendCommand(const ChubIp &hub, const char *token,
                                        const ChubDeviceRecord &device, const ChubCommand &command,
                                        uint32_t nowMs, ChubDeviceAckCallback cb, void *context) {
  return startDeviceRequest(ChubOp::WriteDevice, hub, token, device, &command, nowMs, cb, context);
}

ChubErr ConnectorHubClient::queryStatus(const ChubIp &hub, const char *token,
                                        const ChubDeviceRecord &device, uint32_t nowMs,
                                        ChubDeviceAckCallback cb, void *context) {
  return startDeviceRequest(ChubOp::ReadDevice, hub, token, device, nullptr, nowMs, cb, context);
}

ChubErr ConnectorHubClient::startDeviceRequest(ChubOp op, const ChubIp &hub, const char *token,
                                               const ChubDeviceRecord &device,
                                               const ChubCommand *command, uint32_t nowMs,
                                               ChubDeviceAckCallback cb, void *context) {
  if (_transport == nullptr) return ChubErr::SEND_FAIL;
  if (!_hasKey) return ChubErr::INVALID_CONFIG;

  char cachedToken[kChubTokenSize];
  if (token == nullptr) {
    if (!getHubToken(hub, cachedToken, sizeof(cachedToken))) return ChubErr::NO_TOKEN;
    token = cachedToken;
  }
  char accessToken[kAesBlock * 2 + 1];
  if (!ConnectorHub_accessToken(token, _key, accessToken, sizeof(accessToken))) {
    return ChubErr::NO_TOKEN;
  }

  CommandSlot *slot = nullptr;
  for (size_t i = 0; i < kChubMaxPendingCommands; ++i) {
    if (!_commands[i].inUse) {
      slot = &_commands[i];
      break;
    }
  }
  if (slot == nullptr) return ChubErr::BUSY;

  char msgId[kChubMsgIdSize];
  nextMsgId(msgId, sizeof(msgId));

  char json[kChubMaxCommandDatagram];
  size_t len = (op == ChubOp::WriteDevice)
                   ? buildWriteDevice(device, accessToken, msgId, *command, json, sizeof(json))
                   : buildReadDevice(device, accessToken, msgId, json, sizeof(json));
  if (len == 0) return ChubErr::SEND_FAIL;

  memset(slot, 0, sizeof(*slot));
  if (_sealed) {
    slot->datagramLen = ConnectorHub_encrypt(reinterpret_cast<const uint8_t *>(json), len, _key,
                                             slot->datagram, sizeof(slot->datagram));
    if (slot->datagramLen == 0) return ChubErr::SEND_FAIL;
  } else {
    memcpy(slot->datagram, json, len);
    slot->datagramLen = len;
  }

  char ipStr[16];
  ConnectorHub_ipToStr(hub, ipStr, sizeof(ipStr));
  if (!_transport->send(hub, kSendPort, slot->datagram, slot->datagramLen)) {
    CHUB_LOGW_F("Failed to send request for %s to %s", device.mac, ipStr);
    emitError(hub, op, ChubErr::SEND_FAIL, 0);
    return ChubErr::SEND_FAIL;
  }
  CHUB_LOGNET_F("-> %s %s", ipStr, json);

  slot->inUse = true;
  slot->op = op;
  slot->target = hub;
  safeCopyStr(slot->msgId, sizeof(slot->msgId), msgId);
  slot->sentAt = nowMs;
  slot->deadline = nowMs + _requestTimeoutMs;
  slot->attempts = 1;
  slot->cb = cb;
  slot->context = context;
  return ChubErr::OK;
}

// =========================
// Event Pump
// =========================

void ConnectorHubClient::update(uint32_t nowMs) {
  _lastUpdateMs = nowMs;
  if (_transport == nullptr) return;

  for (size_t i = 0; i < kMaxPacketsPerUpdate; ++i) {
    ChubIp from{};
    int len = _transport->receive(from, _rxBuffer, kChubMaxDatagram);
    if (len == 0) break;
    if (len < 0) {
      char ipStr[16];
      ConnectorHub_ipToStr(from, ipStr, sizeof(ipStr));
      CHUB_LOGW_F("Dropped oversized datagram from %s", ipStr);
      continue;
    }
    handleDatagram(from, static_cast<size_t>(len), nowMs);
    // A callback may have shut the client down
    if (_transport == nullptr) return;
  }

  expireRequests(nowMs);
}

void ConnectorHubClient::handleDatagram(const ChubIp &from, size_t len, uint32_t nowMs) {
  char ipStr[16];
  ConnectorHub_ipToStr(from, ipStr, sizeof(ipStr));

  char *json = reinterpret_cast<char *>(_rxBuffer);
  size_t jsonLen = len;

  if (_rxBuffer[0] != '{') {
    if (!_hasKey) {
      CHUB_LOGD_F("Discarding binary datagram from %s", ipStr);
      return;
    }
    size_t plainLen = 0;
    ChubErr err = ConnectorHub_decrypt(_rxBuffer, len, _key, _plainBuffer, kChubMaxDatagram, plainLen);
    if (err != ChubErr::OK) {
      CHUB_LOGW_F("Discarding undecryptable datagram from %s (%u bytes)", ipStr,
                  static_cast<unsigned>(len));
      emitError(from, ChubOp::Receive, ChubErr::DECRYPT_FAIL, 0);
      return;
    }
    _plainBuffer[plainLen] = '\0';
    json = reinterpret_cast<char *>(_plainBuffer);
    jsonLen = plainLen;
  } else {
    _rxBuffer[len] = '\0';
  }

  CHUB_LOGNET_F("<- %s %s", ipStr, json);

  if (parseInboundMessage(json, jsonLen, g_sharedInbound) != ChubErr::OK) {
    CHUB_LOGD_F("Discarding malformed reply from %s", ipStr);
    return;
  }

  switch (g_sharedInbound.type) {
    case MsgType::DEVICE_LIST_ACK:
      handleDeviceListAck(from, nowMs);
      break;
    case MsgType::WRITE_DEVICE_ACK:
    case MsgType::READ_DEVICE_ACK:
      handleDeviceAck(from, nowMs);
      break;
    case MsgType::REPORT:
    case MsgType::HEARTBEAT:
    case MsgType::UNKNOWN:
      CHUB_LOGNET_F("Ignoring unsolicited message from %s", ipStr);
      break;
  }
}

void ConnectorHubClient::handleDeviceListAck(const ChubIp &from, uint32_t nowMs) {
  const InboundMessage &msg = g_sharedInbound;
  char ipStr[16];
  ConnectorHub_ipToStr(from, ipStr, sizeof(ipStr));

  DiscoverySlot *slot = nullptr;
  bool wrongSource = false;
  for (size_t i = 0; i < kChubMaxHubs; ++i) {
    DiscoverySlot &candidate = _discoveries[i];
    if (!candidate.inUse) continue;
    if (msg.hasMsgId && strcmp(candidate.msgId, msg.msgId) != 0) continue;
    if (!candidate.multicast && candidate.target != from) {
      if (msg.hasMsgId) wrongSource = true;
      continue;
    }
    slot = &candidate;
    break;
  }

  if (slot == nullptr) {
    if (wrongSource) {
      CHUB_LOGW_F("GetDeviceListAck from unexpected address %s", ipStr);
      emitError(from, ChubOp::Discovery, ChubErr::WRONG_SOURCE_IP, 0);
    } else {
      CHUB_LOGD_F("Discarding uncorrelated GetDeviceListAck from %s", ipStr);
    }
    return;
  }

  if (msg.rejected) {
    CHUB_LOGW_F("Hub %s rejected GetDeviceList: %s", ipStr, msg.actionResult);
    return;
  }

  // Duplicated datagram, or a hub answering a retransmitted query
  for (size_t i = 0; i < slot->replyCount; ++i) {
    if (slot->replies[i].from == from) return;
  }
  if (slot->replyCount >= kChubMaxRepliesPerQuery) {
    CHUB_LOGW_F("Too many hubs answered, ignoring %s", ipStr);
    return;
  }

  ChubDiscoveryReply &reply = slot->replies[slot->replyCount++];
  reply = msg.deviceList;
  reply.from = from;
  storeHubToken(from, reply.token, nowMs);

  // Only one hub lives behind a unicast address
  if (!slot->multicast) {
    completeDiscovery(*slot, nowMs);
  }
}

void ConnectorHubClient::handleDeviceAck(const ChubIp &from, uint32_t nowMs) {
  const InboundMessage &msg = g_sharedInbound;
  char ipStr[16];
  ConnectorHub_ipToStr(from, ipStr, sizeof(ipStr));

  if (!msg.hasMsgId) {
    CHUB_LOGD_F("Discarding ack without msgID from %s", ipStr);
    return;
  }

  for (size_t i = 0; i < kChubMaxPendingCommands; ++i) {
    CommandSlot &slot = _commands[i];
    if (!slot.inUse || strcmp(slot.msgId, msg.msgId) != 0) continue;

    if (slot.target != from) {
      CHUB_LOGW_F("Ack for msgID %s from unexpected address %s", msg.msgId, ipStr);
      emitError(from, slot.op, ChubErr::WRONG_SOURCE_IP, nowMs - slot.sentAt);
      return;
    }
    if (msg.rejected) {
      CHUB_LOGW_F("Hub %s rejected request for %s: %s", ipStr, msg.status.mac, msg.actionResult);
      completeCommand(slot, ChubErr::HUB_REJECTED, nullptr, nowMs);
      return;
    }
    completeCommand(slot, ChubErr::OK, &msg.status, nowMs);
    return;
  }

  CHUB_LOGD_F("Discarding uncorrelated ack from %s (msgID %s)", ipStr, msg.msgId);
}

// =========================
// Completion
// =========================

void ConnectorHubClient::completeDiscovery(DiscoverySlot &slot, uint32_t nowMs) {
  ChubErr err = slot.replyCount > 0 ? ChubErr::OK : ChubErr::TIMEOUT;
  if (err != ChubErr::OK) {
    emitError(slot.target, ChubOp::Discovery, err, nowMs - slot.sentAt);
  }

  // Slot stays reserved while the callback reads the replies in place
  if (slot.cb != nullptr) {
    slot.cb(slot.context, slot.target, err, slot.replies, slot.replyCount);
  }
  slot.inUse = false;
}

void ConnectorHubClient::completeCommand(CommandSlot &slot, ChubErr err,
                                         const ChubDeviceStatus *status, uint32_t nowMs) {
  if (err != ChubErr::OK) {
    emitError(slot.target, slot.op, err, nowMs - slot.sentAt);
  }

  ChubDeviceAckCallback cb = slot.cb;
  void *context = slot.context;
  ChubIp target = slot.target;
  slot.inUse = false;

  if (cb != nullptr) {
    cb(context, target, err, status);
  }
}

void ConnectorHubClient::expireRequests(uint32_t nowMs) {
  for (size_t i = 0; i < kChubMaxHubs; ++i) {
    if (_transport == nullptr) return;
    DiscoverySlot &slot = _discoveries[i];
    if (slot.inUse && timeReached(nowMs, slot.deadline)) {
      completeDiscovery(slot, nowMs);
    }
  }

  for (size_t i = 0; i < kChubMaxPendingCommands; ++i) {
    if (_transport == nullptr) return;
    CommandSlot &slot = _commands[i];
    if (!slot.inUse || !timeReached(nowMs, slot.deadline)) continue;

    char ipStr[16];
    ConnectorHub_ipToStr(slot.target, ipStr, sizeof(ipStr));

    if (slot.attempts < _commandAttempts) {
      // Same msgID, so a late reply to any attempt still correlates
      if (_transport->send(slot.target, kSendPort, slot.datagram, slot.datagramLen)) {
        slot.attempts++;
        slot.deadline = nowMs + _requestTimeoutMs;
        CHUB_LOGD_F("Retrying msgID %s to %s (attempt %u/%u)", slot.msgId, ipStr,
                    static_cast<unsigned>(slot.attempts), static_cast<unsigned>(_commandAttempts));
        continue;
      }
      CHUB_LOGW_F("Failed to resend msgID %s to %s", slot.msgId, ipStr);
      completeCommand(slot, ChubErr::SEND_FAIL, nullptr, nowMs);
      continue;
    }

    CHUB_LOGW_F("No reply from %s for msgID %s after %u attempts", ipStr, slot.msgId,
                static_cast<unsigned>(slot.attempts));
    completeCommand(slot, ChubErr::TIMEOUT, nullptr, nowMs);
  }
}

// =========================
// Token Cache
// =========================

void ConnectorHubClient::storeHubToken(const ChubIp &hub, const char *token, uint32_t nowMs) {
  const size_t capacity = sizeof(_tokens) / sizeof(_tokens[0]);
  HubToken *target = nullptr;

  for (size_t i = 0; i < capacity; ++i) {
    if (_tokens[i].valid && _tokens[i].hub == hub) {
      target = &_tokens[i];
      break;
    }
  }
  if (target == nullptr) {
    for (size_t i = 0; i < capacity; ++i) {
      if (!_tokens[i].valid) {
        target = &_tokens[i];
        break;
      }
    }
  }
  if (target == nullptr) {
    // Evict the least recently refreshed hub
    target = &_tokens[0];
    for (size_t i = 1; i < capacity; ++i) {
      if (static_cast<int32_t>(_tokens[i].updatedAt - target->updatedAt) < 0) {
        target = &_tokens[i];
      }
    }
  }

  target->valid = true;
  target->hub = hub;
  safeCopyStr(target->token, sizeof(target->token), token);
  target->updatedAt = nowMs;
}

bool ConnectorHubClient::getHubToken(const ChubIp &hub, char *out, size_t outSize) const {
  if (out == nullptr || outSize == 0) return false;
  const size_t capacity = sizeof(_tokens) / sizeof(_tokens[0]);
  for (size_t i = 0; i < capacity; ++i) {
    if (_tokens[i].valid && _tokens[i].hub == hub) {
      safeCopyStr(out, outSize, _tokens[i].token);
      return true;
    }
  }
  return false;
}

size_t ConnectorHubClient::pendingCount() const {
  size_t count = 0;
  for (size_t i = 0; i < kChubMaxHubs; ++i) {
    if (_discoveries[i].inUse) ++count;
  }
  for (size_t i = 0; i < kChubMaxPendingCommands; ++i) {
    if (_commands[i].inUse) ++count;
  }
  return count;
}

// =========================
// Helpers
// =========================

void ConnectorHubClient::nextMsgId(char *out, size_t outSize) {
  snprintf(out, outSize, "%0*lu", static_cast<int>(kMsgIdDigits),
           static_cast<unsigned long>(_nextMsgId++));
}

void ConnectorHubClient::emitError(const ChubIp &hub, ChubOp op, ChubErr err, uint32_t elapsedMs) {
  if (_errorCallback == nullptr) return;

  ChubErrorInfo info{};
  info.hub = hub;
  info.operation = op;
  info.error = err;
  info.elapsedMs = elapsedMs;

  _errorCallback(_errorContext, info);
}
