#pragma once

#include <stdarg.h>
#include <stddef.h>
#include <stdint.h>
#include <string.h>

// =========================
// Library Version
// =========================
#define CONNECTOR_HUB_ASYNC_VERSION "1.2.0"
#define CONNECTOR_HUB_ASYNC_VERSION_MAJOR 1
#define CONNECTOR_HUB_ASYNC_VERSION_MINOR 2
#define CONNECTOR_HUB_ASYNC_VERSION_PATCH 0

// =========================
// Minimal compile-time logging
// Variant A: GEN / DBG / NET
// Prefix: CHUB
// =========================
//
// Enable via build flags or uncomment:
#ifndef CHUB_DEBUG_GEN
     #define CHUB_DEBUG_GEN
#endif
//   #define CHUB_DEBUG_NET
//
// CHUB_LOGD_F is additionally gated at runtime by
// ConnectorHub_setDebugLogEnabled() (the "enableDebugLog" config toggle).
// Output goes to the sink installed with ConnectorHub_setLogSink(); with no
// sink installed every log line is dropped.

enum class ChubLogLevel : uint8_t {
  ERROR,
  WARN,
  INFO,
  DEBUG,
  NET
};

typedef void (*ChubLogSink)(ChubLogLevel level, const char *message);

void ConnectorHub_setLogSink(ChubLogSink sink);
void ConnectorHub_setDebugLogEnabled(bool enabled);
bool ConnectorHub_isDebugLogEnabled();
void ConnectorHub_log(ChubLogLevel level, const char *fmt, ...);

#if defined(CHUB_DEBUG_GEN)
  #define CHUB_LOGI_F(...) do { ConnectorHub_log(ChubLogLevel::INFO, __VA_ARGS__); } while(0)
  #define CHUB_LOGW_F(...) do { ConnectorHub_log(ChubLogLevel::WARN, __VA_ARGS__); } while(0)
  #define CHUB_LOGE_F(...) do { ConnectorHub_log(ChubLogLevel::ERROR, __VA_ARGS__); } while(0)
  #define CHUB_LOGD_F(...) do { if (ConnectorHub_isDebugLogEnabled()) ConnectorHub_log(ChubLogLevel::DEBUG, __VA_ARGS__); } while(0)
#else
  #define CHUB_LOGI_F(...) do {} while(0)
  #define CHUB_LOGW_F(...) do {} while(0)
  #define CHUB_LOGE_F(...) do {} while(0)
  #define CHUB_LOGD_F(...) do {} while(0)
#endif

#if defined(CHUB_DEBUG_NET)
  #define CHUB_LOGNET_F(...) do { ConnectorHub_log(ChubLogLevel::NET, __VA_ARGS__); } while(0)
#else
  #define CHUB_LOGNET_F(...) do {} while(0)
#endif

// =========================
// Timing defaults (override via build flags)
// =========================
#ifndef CONNECTOR_HUB_DISCOVERY_RETRY_MS
#define CONNECTOR_HUB_DISCOVERY_RETRY_MS 5000
#endif

// How long a discovery query collects GetDeviceListAck replies
#ifndef CONNECTOR_HUB_DISCOVERY_WINDOW_MS
#define CONNECTOR_HUB_DISCOVERY_WINDOW_MS 2000
#endif

#ifndef CONNECTOR_HUB_REQUEST_TIMEOUT_MS
#define CONNECTOR_HUB_REQUEST_TIMEOUT_MS 1000
#endif

#ifndef CONNECTOR_HUB_COMMAND_ATTEMPTS
#define CONNECTOR_HUB_COMMAND_ATTEMPTS 3
#endif

// =========================
// Capacities
// =========================
constexpr size_t kChubMaxHubs = 4;
constexpr size_t kChubMaxDevicesPerHub = 16;
constexpr size_t kChubMaxRepliesPerQuery = 4;
constexpr size_t kChubMaxPendingCommands = 8;
constexpr size_t kChubMaxRegistryEntries = 32;
// Large enough for a GetDeviceListAck from a fully paired hub
constexpr size_t kChubMaxDatagram = 4096;
constexpr size_t kChubMaxCommandDatagram = 384;
constexpr size_t kChubKeyLen = 16;
constexpr size_t kChubTokenLen = 16;

constexpr size_t kChubMacSize = 24;
constexpr size_t kChubDeviceTypeSize = 12;
constexpr size_t kChubVersionSize = 24;
constexpr size_t kChubTokenSize = 33;
constexpr size_t kChubIdentitySize = 37;
constexpr size_t kChubDisplayNameSize = 48;
constexpr size_t kChubMsgIdSize = 24;

// =========================
// Addresses
// =========================

struct ChubIp {
  uint8_t octet[4];

  bool operator==(const ChubIp &other) const {
    return memcmp(octet, other.octet, sizeof(octet)) == 0;
  }
  bool operator!=(const ChubIp &other) const { return !(*this == other); }
  bool isMulticast() const { return octet[0] >= 224 && octet[0] <= 239; }
  bool isZero() const { return (octet[0] | octet[1] | octet[2] | octet[3]) == 0; }
};

// Strict dotted-quad parser: four decimal octets 0..255, no leading zeros,
// no surrounding whitespace.
bool ConnectorHub_parseIPv4(const char *str, ChubIp &out);
bool ConnectorHub_isIPv4(const char *str);

// IP to string without heap allocation. outSize must be at least 16.
void ConnectorHub_ipToStr(const ChubIp &ip, char *out, size_t outSize);

// Well-known group used when no hub address is configured
ChubIp ConnectorHub_multicastGroup();

// =========================
// Error Classification
// =========================
enum class ChubErr {
  OK,
  TIMEOUT,            // no reply within the request window
  WRONG_SOURCE_IP,    // correlated reply arrived from another address
  DECRYPT_FAIL,       // AES decrypt or padding check failed
  INVALID_RESPONSE,   // decrypted but malformed or unexpected payload
  HUB_REJECTED,       // hub answered with an actionResult instead of data
  INVALID_CONFIG,     // missing key, malformed address
  SEND_FAIL,          // transport refused the datagram
  BUSY,               // no free request slot
  NO_TOKEN            // no usable session token for this hub
};

const char *ConnectorHub_errName(ChubErr err);

// Operation context reported with errors
enum class ChubOp {
  Discovery,
  WriteDevice,
  ReadDevice,
  Receive
};

struct ChubErrorInfo {
  ChubIp hub;
  ChubOp operation;
  ChubErr error;
  uint32_t elapsedMs;
};

// Informational only. Must not block or start new requests.
typedef void (*ChubErrorCallback)(void *context, const ChubErrorInfo &info);

// =========================
// Device Model
// =========================

// deviceType strings reported by Connector hubs
#define CHUB_DEVICE_TYPE_WIFI_BRIDGE "02000001"
#define CHUB_DEVICE_TYPE_RADIO_MOTOR "10000000"
#define CHUB_DEVICE_TYPE_WIFI_CURTAIN "22000000"
#define CHUB_DEVICE_TYPE_WIFI_TUBULAR_MOTOR "22000002"
#define CHUB_DEVICE_TYPE_WIFI_RECEIVER "22000005"

enum class ChubDeviceKind : uint8_t {
  UNKNOWN = 0,
  WIFI_BRIDGE,        // the hub itself, never exposed as a covering
  RADIO_MOTOR,        // 433MHz motor behind a hub
  WIFI_CURTAIN,
  WIFI_TUBULAR_MOTOR,
  WIFI_RECEIVER
};

ChubDeviceKind ConnectorHub_deviceKind(const char *deviceType);

struct ChubDeviceRecord {
  char mac[kChubMacSize];
  char deviceType[kChubDeviceTypeSize];
  ChubDeviceKind kind;
};

// A device record augmented with the firmware of the hub that reported it
struct ChubExtendedDeviceRecord : ChubDeviceRecord {
  char fwVersion[kChubVersionSize];
};

struct ChubDiscoveryReply {
  ChubIp from;
  char hubMac[kChubMacSize];
  char hubDeviceType[kChubDeviceTypeSize];
  char protocolVersion[kChubVersionSize];
  char fwVersion[kChubVersionSize];
  char token[kChubTokenSize];
  ChubDeviceRecord devices[kChubMaxDevicesPerHub];
  size_t deviceCount;
};

// Values a hub reports in WriteDeviceAck / ReadDeviceAck. -1 = not reported.
struct ChubDeviceStatus {
  char mac[kChubMacSize];
  char deviceType[kChubDeviceTypeSize];
  int32_t type;
  int32_t operation;
  int32_t currentPosition;
  int32_t currentAngle;
  int32_t currentState;
  int32_t voltageMode;
  int32_t batteryLevel;
  int32_t wirelessMode;
  int32_t rssi;
};

enum class ChubCommandType : uint8_t {
  CLOSE,          // operation 0 (down)
  OPEN,           // operation 1 (up)
  STOP,           // operation 2
  STATUS_QUERY,   // operation 5, for motors that only answer WriteDevice
  SET_POSITION,   // targetPosition = value (0..100)
  SET_ANGLE       // targetAngle = value (0..180)
};

struct ChubCommand {
  ChubCommandType type;
  uint8_t value;
};

// =========================
// Crypto Codec
// =========================
// AES-128, ECB blocks, PKCS#7 padding. key is the 16-character connector key.

// Returns ciphertext length, 0 on failure (bad key, output too small).
size_t ConnectorHub_encrypt(const uint8_t *plain, size_t len, const char *key,
                            uint8_t *out, size_t outCap);
ChubErr ConnectorHub_decrypt(const uint8_t *cipher, size_t len, const char *key,
                             uint8_t *out, size_t outCap, size_t &outLen);

// AccessToken = uppercase hex of AES-128-ECB(token). out needs 33 bytes.
bool ConnectorHub_accessToken(const char *token, const char *key, char *out, size_t outSize);

// Deterministic accessory identity (UUID string) derived from a MAC address.
// out needs kChubIdentitySize bytes.
void ConnectorHub_accessoryIdentity(const char *mac, char *out, size_t outSize);

// =========================
// Configuration
// =========================

struct ConnectorHubConfig {
  const char *connectorKey;      // "App Key" from the Connector app
  const char *const *hubIps;     // empty: multicast discovery
  size_t hubIpCount;
  bool enableDebugLog;
  uint32_t discoveryRetryMs;
  uint32_t discoveryWindowMs;
  uint32_t requestTimeoutMs;
  uint8_t commandAttempts;
  bool sealedPayloads;           // encrypt whole command payloads

  ConnectorHubConfig()
      : connectorKey(nullptr),
        hubIps(nullptr),
        hubIpCount(0),
        enableDebugLog(false),
        discoveryRetryMs(CONNECTOR_HUB_DISCOVERY_RETRY_MS),
        discoveryWindowMs(CONNECTOR_HUB_DISCOVERY_WINDOW_MS),
        requestTimeoutMs(CONNECTOR_HUB_REQUEST_TIMEOUT_MS),
        commandAttempts(CONNECTOR_HUB_COMMAND_ATTEMPTS),
        sealedPayloads(false) {}
};

struct ChubConfigError {
  char message[64];
};

// Lists every configuration problem. Returns the number of problems found;
// at most maxErrors of them are written to errors (which may be null).
size_t ConnectorHub_validateConfig(const ConnectorHubConfig &config,
                                   ChubConfigError errors[], size_t maxErrors);

// =========================
// Transport
// =========================

// Thin asynchronous datagram endpoint. No retry logic lives here.
class ConnectorHubTransport {
public:
  virtual ~ConnectorHubTransport() {}

  virtual bool begin(uint16_t localPort) = 0;
  virtual bool beginMulticast(const ChubIp &group, uint16_t localPort) = 0;
  virtual bool send(const ChubIp &ip, uint16_t port, const uint8_t *data, size_t len) = 0;
  // Returns the datagram length, 0 if nothing is pending, -1 if a datagram
  // was dropped because it did not fit into capacity.
  virtual int receive(ChubIp &from, uint8_t *buffer, size_t capacity) = 0;
  virtual void stop() = 0;
};

// =========================
// Protocol Client
// =========================

// replyCount == 0 means nothing answered within the window (err == TIMEOUT)
typedef void (*ChubDeviceListCallback)(void *context, const ChubIp &target, ChubErr err,
                                       const ChubDiscoveryReply *replies, size_t replyCount);

// status is null unless err == OK
typedef void (*ChubDeviceAckCallback)(void *context, const ChubIp &hub, ChubErr err,
                                      const ChubDeviceStatus *status);

class ConnectorHubClient {
public:
  ConnectorHubClient();

  bool begin(ConnectorHubTransport &transport, const char *connectorKey, bool joinMulticast);
  // Stops the transport and drops every pending request without callbacks.
  void end();
  bool isRunning() const { return _transport != nullptr; }

  void setTimeouts(uint32_t discoveryWindowMs, uint32_t requestTimeoutMs, uint8_t commandAttempts);
  void setSealedPayloads(bool sealed) { _sealed = sealed; }
  void setErrorCallback(ChubErrorCallback cb, void *context);
  void setMsgIdSeed(uint32_t seed) { _nextMsgId = seed; }

  // Sends one GetDeviceList query. A unicast query completes on the first
  // correlated reply; a multicast query collects replies for the whole window.
  ChubErr queryDeviceList(const ChubIp &hub, uint32_t nowMs,
                          ChubDeviceListCallback cb, void *context);

  // token == nullptr uses the token cached from the last discovery reply.
  ChubErr sendCommand(const ChubIp &hub, const char *token, const ChubDeviceRecord &device,
                      const ChubCommand &command, uint32_t nowMs,
                      ChubDeviceAckCallback cb, void *context);
  ChubErr queryStatus(const ChubIp &hub, const char *token, const ChubDeviceRecord &device,
                      uint32_t nowMs, ChubDeviceAckCallback cb, void *context);

  // Drains the transport, correlates replies, expires and retransmits requests.
  void update(uint32_t nowMs);
  // Time passed to the latest update(). Completion callbacks run inside it.
  uint32_t lastUpdateMs() const { return _lastUpdateMs; }

  bool getHubToken(const ChubIp &hub, char *out, size_t outSize) const;
  size_t pendingCount() const;

private:
  struct DiscoverySlot {
    bool inUse;
    ChubIp target;
    bool multicast;
    char msgId[kChubMsgIdSize];
    uint32_t sentAt;
    uint32_t deadline;
    ChubDeviceListCallback cb;
    void *context;
    ChubDiscoveryReply replies[kChubMaxRepliesPerQuery];
    size_t replyCount;
  };

  struct CommandSlot {
    bool inUse;
    ChubOp op;
    ChubIp target;
    char msgId[kChubMsgIdSize];
    uint32_t sentAt;
    uint32_t deadline;
    uint8_t attempts;
    ChubDeviceAckCallback cb;
    void *context;
    uint8_t datagram[kChubMaxCommandDatagram];
    size_t datagramLen;
  };

  struct HubToken {
    bool valid;
    ChubIp hub;
    char token[kChubTokenSize];
    uint32_t updatedAt;
  };

  ChubErr startDeviceRequest(ChubOp op, const ChubIp &hub, const char *token,
                             const ChubDeviceRecord &device, const ChubCommand *command,
                             uint32_t nowMs, ChubDeviceAckCallback cb, void *context);
  void handleDatagram(const ChubIp &from, size_t len, uint32_t nowMs);
  void handleDeviceListAck(const ChubIp &from, uint32_t nowMs);
  void handleDeviceAck(const ChubIp &from, uint32_t nowMs);
  void completeDiscovery(DiscoverySlot &slot, uint32_t nowMs);
  void completeCommand(CommandSlot &slot, ChubErr err, const ChubDeviceStatus *status, uint32_t nowMs);
  void expireRequests(uint32_t nowMs);
  void storeHubToken(const ChubIp &hub, const char *token, uint32_t nowMs);
  void nextMsgId(char *out, size_t outSize);
  void emitError(const ChubIp &hub, ChubOp op, ChubErr err, uint32_t elapsedMs);

  ConnectorHubTransport *_transport;
  char _key[kChubKeyLen + 1];
  bool _hasKey;
  bool _sealed;
  uint32_t _discoveryWindowMs;
  uint32_t _requestTimeoutMs;
  uint8_t _commandAttempts;
  uint32_t _nextMsgId;
  uint32_t _lastUpdateMs;
  ChubErrorCallback _errorCallback;
  void *_errorContext;

  DiscoverySlot _discoveries[kChubMaxHubs];
  CommandSlot _commands[kChubMaxPendingCommands];
  HubToken _tokens[kChubMaxHubs * kChubMaxRepliesPerQuery];

  uint8_t _rxBuffer[kChubMaxDatagram + 1];
  uint8_t _plainBuffer[kChubMaxDatagram + 1];
};

// =========================
// Registry Reconciler
// =========================

enum class ChubAccessoryAction {
  ADDED,      // new identity, register it with the host
  RESTORED,   // cached identity claimed by a live device
  UPDATED,    // live identity seen again, attributes refreshed
  REMOVED     // unclaimed cached identity, deregister it from the host
};

const char *ConnectorHub_actionName(ChubAccessoryAction action);

struct ChubCachedEntry {
  const char *identity;
  const char *displayName;
};

struct ChubRegistryEntry {
  char identity[kChubIdentitySize];
  char displayName[kChubDisplayNameSize];
  bool claimed;       // seen live during this run
  ChubExtendedDeviceRecord device;   // valid when claimed
  ChubIp hub;                        // address to send commands to
  char token[kChubTokenSize];        // session token of that hub
};

typedef void (*ChubAccessoryCallback)(void *context, ChubAccessoryAction action,
                                      const ChubRegistryEntry &entry);

class ConnectorHubRegistry {
public:
  ConnectorHubRegistry();

  void reset();
  bool addCached(const char *identity, const char *displayName);
  void setHubs(const ChubIp hubs[], size_t count);

  // Claims, refreshes or creates the entry for a live device. Returns false
  // only when a new entry is needed and the registry is full.
  bool reconcile(const ChubExtendedDeviceRecord &device, const ChubIp &hub, const char *token,
                 ChubAccessoryAction &action, const ChubRegistryEntry *&entry);

  void markHubScanned(const ChubIp &hub);
  bool isHubScanned(const ChubIp &hub) const;
  bool allHubsScanned() const;

  // Removes every unclaimed cached entry, reporting each as REMOVED.
  // Returns -1 without touching anything until all hubs have been scanned.
  int removeStale(ChubAccessoryCallback cb, void *context);

  const ChubRegistryEntry *find(const char *identity) const;
  size_t size() const { return _entryCount; }
  const ChubRegistryEntry *entryAt(size_t index) const;
  size_t unclaimedCount() const;

private:
  ChubRegistryEntry _entries[kChubMaxRegistryEntries];
  size_t _entryCount;
  ChubIp _hubs[kChubMaxHubs];
  bool _hubScanned[kChubMaxHubs];
  size_t _hubCount;
};

// =========================
// Discovery Orchestrator
// =========================

class ChubBackoffPolicy {
public:
  virtual ~ChubBackoffPolicy() {}
  // Delay before the next scan after `failures` consecutive failures (>= 1)
  virtual uint32_t delayMs(uint32_t failures) const = 0;
};

class ChubFixedBackoff : public ChubBackoffPolicy {
public:
  explicit ChubFixedBackoff(uint32_t intervalMs) : _intervalMs(intervalMs) {}
  uint32_t delayMs(uint32_t failures) const override;
  void setInterval(uint32_t intervalMs) { _intervalMs = intervalMs; }

private:
  uint32_t _intervalMs;
};

class ChubExponentialBackoff : public ChubBackoffPolicy {
public:
  ChubExponentialBackoff(uint32_t baseMs, uint32_t maxMs) : _baseMs(baseMs), _maxMs(maxMs) {}
  uint32_t delayMs(uint32_t failures) const override;

private:
  uint32_t _baseMs;
  uint32_t _maxMs;
};

enum class ChubScanState : uint8_t {
  PENDING,
  SCANNING,
  SUCCEEDED,
  FAILED_RETRY
};

struct ChubHubScanState {
  ChubIp address;
  ChubScanState state;
  uint32_t failures;        // consecutive failed scans
  uint32_t retryAt;
  uint32_t completedScans;
};

class ConnectorHubDiscovery {
public:
  ConnectorHubDiscovery();

  // Validates the config. An invalid config suspends the orchestrator:
  // errors are logged once and every later call is a no-op.
  bool begin(ConnectorHubTransport &transport, const ConnectorHubConfig &config);
  void end();
  bool isSuspended() const { return _suspended; }

  // Phase one: identities the host restored from disk. Only before startDiscovery().
  bool loadCache(const ChubCachedEntry entries[], size_t count);
  bool addCachedEntry(const char *identity, const char *displayName);

  // Phase two: scan every configured hub (or the multicast group).
  // May be called again to re-scan; live identities are never duplicated.
  bool startDiscovery(uint32_t nowMs);
  void update(uint32_t nowMs);

  void setAccessoryCallback(ChubAccessoryCallback cb, void *context);
  void setBackoffPolicy(const ChubBackoffPolicy *policy);

  // Runs the stale pass inside update() once every hub has completed a scan.
  void requestStaleRemoval();
  bool isStaleRemovalPending() const { return _staleRemovalRequested; }
  // Runs the stale pass now. -1 if not every hub has been scanned yet.
  int removeStaleEntries();

  size_t hubCount() const { return _hubCount; }
  const ChubHubScanState *getHub(size_t index) const;
  const ChubHubScanState *findHub(const ChubIp &address) const;

  ConnectorHubClient &client() { return _client; }
  const ConnectorHubRegistry &registry() const { return _registry; }

private:
  static void onDeviceList(void *context, const ChubIp &target, ChubErr err,
                           const ChubDiscoveryReply *replies, size_t replyCount);
  void handleDeviceList(const ChubIp &target, const ChubDiscoveryReply *replies, size_t replyCount);
  void issueScan(ChubHubScanState &hub, uint32_t nowMs);
  void scheduleRetry(ChubHubScanState &hub, uint32_t nowMs);
  ChubHubScanState *hubFor(const ChubIp &address);

  ConnectorHubClient _client;
  ConnectorHubRegistry _registry;
  ChubFixedBackoff _defaultBackoff;
  const ChubBackoffPolicy *_backoff;

  ChubHubScanState _hubs[kChubMaxHubs];
  size_t _hubCount;
  uint32_t _retryMs;
  bool _suspended;
  bool _started;
  bool _staleRemovalRequested;
  uint32_t _staleCheckAt;
  uint32_t _now;

  ChubAccessoryCallback _accessoryCallback;
  void *_accessoryContext;
};
