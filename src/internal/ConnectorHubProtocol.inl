// =============================================================================
// ConnectorHubAsync - Protocol Module
// =============================================================================
// Contains: Request message builders, strict reply schema parser
// =============================================================================

#include "ConnectorHubInternal.h"

namespace ConnectorHubInternal {

namespace {

// serializeJson() silently truncates, so measure first
size_t serializeChecked(const JsonDocument &doc, char *out, size_t outCap) {
  if (out == nullptr || outCap == 0) return 0;
  if (doc.overflowed()) return 0;
  size_t needed = measureJson(doc);
  if (needed + 1 > outCap) return 0;
  return serializeJson(doc, out, outCap);
}

uint8_t clampUint(uint8_t value, uint8_t maxValue) {
  return value > maxValue ? maxValue : value;
}

void copyOptional(JsonObjectConst obj, const char *key, char *dest, size_t destSize) {
  const char *value = obj[key];
  safeCopyStr(dest, destSize, value ? value : "");
}

bool copyRequired(JsonObjectConst obj, const char *key, char *dest, size_t destSize) {
  const char *value = obj[key];
  if (value == nullptr || value[0] == '\0' || strlen(value) >= destSize) return false;
  safeCopyStr(dest, destSize, value);
  return true;
}

void addDeviceHeader(JsonDocument &doc, const char *msgType, const ChubDeviceRecord &device,
                     const char *accessToken, const char *msgId) {
  doc["msgType"] = msgType;
  doc["mac"] = static_cast<const char *>(device.mac);
  doc["deviceType"] = static_cast<const char *>(device.deviceType);
  doc["AccessToken"] = accessToken;
  doc["msgID"] = msgId;
}

ChubErr parseDeviceList(JsonObjectConst root, ChubDiscoveryReply &reply) {
  if (!copyRequired(root, "token", reply.token, sizeof(reply.token))) {
    return ChubErr::INVALID_RESPONSE;
  }
  JsonArrayConst data = root["data"];
  if (data.isNull()) return ChubErr::INVALID_RESPONSE;

  copyOptional(root, "mac", reply.hubMac, sizeof(reply.hubMac));
  copyOptional(root, "deviceType", reply.hubDeviceType, sizeof(reply.hubDeviceType));
  copyOptional(root, "ProtocolVersion", reply.protocolVersion, sizeof(reply.protocolVersion));
  copyOptional(root, "fwVersion", reply.fwVersion, sizeof(reply.fwVersion));

  size_t dropped = 0;
  for (JsonVariantConst entry : data) {
    JsonObjectConst device = entry.as<JsonObjectConst>();
    if (device.isNull()) return ChubErr::INVALID_RESPONSE;

    if (reply.deviceCount >= kChubMaxDevicesPerHub) {
      ++dropped;
      continue;
    }
    ChubDeviceRecord &record = reply.devices[reply.deviceCount];
    if (!copyRequired(device, "mac", record.mac, sizeof(record.mac)) ||
        !copyRequired(device, "deviceType", record.deviceType, sizeof(record.deviceType))) {
      return ChubErr::INVALID_RESPONSE;
    }
    record.kind = ConnectorHub_deviceKind(record.deviceType);
    reply.deviceCount++;
  }

  if (dropped > 0) {
    CHUB_LOGW_F("Hub %s lists more than %u devices, ignoring %u",
                reply.hubMac, static_cast<unsigned>(kChubMaxDevicesPerHub),
                static_cast<unsigned>(dropped));
  }
  return ChubErr::OK;
}

ChubErr parseDeviceStatus(JsonObjectConst root, ChubDeviceStatus &status) {
  if (!copyRequired(root, "mac", status.mac, sizeof(status.mac))) {
    return ChubErr::INVALID_RESPONSE;
  }
  copyOptional(root, "deviceType", status.deviceType, sizeof(status.deviceType));

  JsonObjectConst data = root["data"];
  if (data.isNull()) return ChubErr::INVALID_RESPONSE;

  status.type = data["type"] | -1;
  status.operation = data["operation"] | -1;
  status.currentPosition = data["currentPosition"] | -1;
  status.currentAngle = data["currentAngle"] | -1;
  status.currentState = data["currentState"] | -1;
  status.voltageMode = data["voltageMode"] | -1;
  status.batteryLevel = data["batteryLevel"] | -1;
  status.wirelessMode = data["wirelessMode"] | -1;
  status.rssi = data["RSSI"] | -1;
  return ChubErr::OK;
}

}  // namespace

// =========================
// Request Builders
// =========================

size_t buildGetDeviceList(const char *msgId, char *out, size_t outCap) {
  StaticJsonDocument<128> doc;
  doc["msgType"] = "GetDeviceList";
  doc["msgID"] = msgId;
  return serializeChecked(doc, out, outCap);
}

size_t buildWriteDevice(const ChubDeviceRecord &device, const char *accessToken,
                        const char *msgId, const ChubCommand &command,
                        char *out, size_t outCap) {
  StaticJsonDocument<384> doc;
  addDeviceHeader(doc, "WriteDevice", device, accessToken, msgId);

  JsonObject data = doc.createNestedObject("data");
  switch (command.type) {
    case ChubCommandType::CLOSE:
      data["operation"] = kOpCloseDown;
      break;
    case ChubCommandType::OPEN:
      data["operation"] = kOpOpenUp;
      break;
    case ChubCommandType::STOP:
      data["operation"] = kOpStop;
      break;
    case ChubCommandType::STATUS_QUERY:
      data["operation"] = kOpStatusQuery;
      break;
    case ChubCommandType::SET_POSITION:
      data["targetPosition"] = clampUint(command.value, 100);
      break;
    case ChubCommandType::SET_ANGLE:
      data["targetAngle"] = clampUint(command.value, 180);
      break;
  }
  return serializeChecked(doc, out, outCap);
}

size_t buildReadDevice(const ChubDeviceRecord &device, const char *accessToken,
                       const char *msgId, char *out, size_t outCap) {
  StaticJsonDocument<256> doc;
  addDeviceHeader(doc, "ReadDevice", device, accessToken, msgId);
  return serializeChecked(doc, out, outCap);
}

// =========================
// Reply Parser
// =========================

MsgType msgTypeFromString(const char *msgType) {
  if (msgType == nullptr) return MsgType::UNKNOWN;
  if (strcmp(msgType, "GetDeviceListAck") == 0) return MsgType::DEVICE_LIST_ACK;
  if (strcmp(msgType, "WriteDeviceAck") == 0) return MsgType::WRITE_DEVICE_ACK;
  if (strcmp(msgType, "ReadDeviceAck") == 0) return MsgType::READ_DEVICE_ACK;
  if (strcmp(msgType, "Report") == 0) return MsgType::REPORT;
  if (strcmp(msgType, "Heartbeat") == 0) return MsgType::HEARTBEAT;
  return MsgType::UNKNOWN;
}

ChubErr parseInboundMessage(char *json, size_t len, InboundMessage &out) {
  memset(&out, 0, sizeof(out));
  out.type = MsgType::UNKNOWN;
  if (json == nullptr || len == 0) return ChubErr::INVALID_RESPONSE;

  g_sharedJsonDoc.clear();
  DeserializationError err = deserializeJson(g_sharedJsonDoc, json, len);
  if (err) {
    CHUB_LOGNET_F("JSON parse failed: %s", err.c_str());
    return ChubErr::INVALID_RESPONSE;
  }

  JsonObjectConst root = g_sharedJsonDoc.as<JsonObjectConst>();
  if (root.isNull()) return ChubErr::INVALID_RESPONSE;

  out.type = msgTypeFromString(root["msgType"]);
  if (out.type == MsgType::UNKNOWN) return ChubErr::INVALID_RESPONSE;

  const char *msgId = root["msgID"];
  if (msgId != nullptr && msgId[0] != '\0' && strlen(msgId) < sizeof(out.msgId)) {
    safeCopyStr(out.msgId, sizeof(out.msgId), msgId);
    out.hasMsgId = true;
  }

  const char *actionResult = root["actionResult"];
  if (actionResult != nullptr) {
    safeCopyStr(out.actionResult, sizeof(out.actionResult), actionResult);
    out.rejected = true;
  }

  switch (out.type) {
    case MsgType::DEVICE_LIST_ACK:
      if (out.rejected) return ChubErr::OK;
      return parseDeviceList(root, out.deviceList);

    case MsgType::WRITE_DEVICE_ACK:
    case MsgType::READ_DEVICE_ACK:
      if (out.rejected) {
        copyOptional(root, "mac", out.status.mac, sizeof(out.status.mac));
        return ChubErr::OK;
      }
      return parseDeviceStatus(root, out.status);

    case MsgType::REPORT:
      return parseDeviceStatus(root, out.status);

    case MsgType::HEARTBEAT:
    case MsgType::UNKNOWN:
      break;
  }
  return ChubErr::OK;
}

}  // namespace ConnectorHubInternal
