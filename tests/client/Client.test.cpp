#include <stdio.h>
#include <string.h>
#include "unity.h"
#include "ConnectorHubAsync.h"
#include "support/FakeTransport.h"

static const char *kKey = "12ab345c-d67e-8f";
static const char *kToken = "1A2B3C4D5E6F7A8B";
static const char *kMotorJson = "{\"mac\":\"f0f5bd4f2e450001\",\"deviceType\":\"10000000\"}";

struct ListCapture {
  int calls;
  ChubErr err;
  ChubIp target;
  size_t replyCount;
  ChubIp from[kChubMaxRepliesPerQuery];
  ChubDiscoveryReply first;
};

struct AckCapture {
  int calls;
  ChubErr err;
  bool hasStatus;
  ChubDeviceStatus status;
};

struct ErrorCapture {
  int calls;
  ChubErrorInfo last;
};

static void captureList(void *context, const ChubIp &target, ChubErr err,
                        const ChubDiscoveryReply *replies, size_t replyCount) {
  ListCapture *capture = static_cast<ListCapture *>(context);
  capture->calls++;
  capture->err = err;
  capture->target = target;
  capture->replyCount = replyCount;
  for (size_t i = 0; i < replyCount && i < kChubMaxRepliesPerQuery; ++i) {
    capture->from[i] = replies[i].from;
  }
  if (replyCount > 0) capture->first = replies[0];
}

static void captureAck(void *context, const ChubIp &hub, ChubErr err, const ChubDeviceStatus *status) {
  (void)hub;
  AckCapture *capture = static_cast<AckCapture *>(context);
  capture->calls++;
  capture->err = err;
  capture->hasStatus = status != nullptr;
  if (status != nullptr) capture->status = *status;
}

static void captureError(void *context, const ChubErrorInfo &info) {
  ErrorCapture *capture = static_cast<ErrorCapture *>(context);
  capture->calls++;
  capture->last = info;
}

static ChubDeviceRecord motor() {
  ChubDeviceRecord device = {"f0f5bd4f2e450001", "10000000", ChubDeviceKind::RADIO_MOTOR};
  return device;
}

static void test_begin_opens_receive_port() {
  FakeTransport transport;
  ConnectorHubClient client;
  TEST_ASSERT_TRUE(client.begin(transport, kKey, false));
  TEST_ASSERT_TRUE(client.isRunning());
  TEST_ASSERT_TRUE(transport.opened);
  TEST_ASSERT_FALSE(transport.multicast);
  TEST_ASSERT_EQUAL_UINT16(32101, transport.localPort);

  FakeTransport group;
  ConnectorHubClient multicastClient;
  TEST_ASSERT_TRUE(multicastClient.begin(group, kKey, true));
  TEST_ASSERT_TRUE(group.multicast);
  TEST_ASSERT_TRUE(group.group == ConnectorHub_multicastGroup());

  FakeTransport broken;
  broken.failBegin = true;
  ConnectorHubClient failed;
  TEST_ASSERT_FALSE(failed.begin(broken, kKey, false));
  TEST_ASSERT_FALSE(failed.isRunning());
}

static void test_unicast_query_completes_on_reply() {
  FakeTransport transport;
  ConnectorHubClient client;
  client.begin(transport, kKey, false);
  ChubIp hub = makeIp(10, 0, 0, 5);

  ListCapture capture = {};
  TEST_ASSERT_TRUE(client.queryDeviceList(hub, 0, captureList, &capture) == ChubErr::OK);
  TEST_ASSERT_EQUAL_UINT(1, transport.sentCount);
  TEST_ASSERT_TRUE(transport.sent[0].ip == hub);
  TEST_ASSERT_EQUAL_UINT16(32100, transport.sent[0].port);
  TEST_ASSERT_NOT_NULL(strstr(transport.sent[0].text(), "\"msgType\":\"GetDeviceList\""));

  char msgId[kChubMsgIdSize];
  TEST_ASSERT_TRUE(transport.sentMsgId(0, msgId, sizeof(msgId)));
  TEST_ASSERT_EQUAL_UINT(17, strlen(msgId));

  char reply[512];
  makeDeviceListAck(reply, sizeof(reply), msgId, "v2.1", kToken, kMotorJson);
  transport.inject(hub, reply);
  client.update(120);

  TEST_ASSERT_EQUAL_INT(1, capture.calls);
  TEST_ASSERT_EQUAL_STRING("OK", ConnectorHub_errName(capture.err));
  TEST_ASSERT_EQUAL_UINT(1, capture.replyCount);
  TEST_ASSERT_TRUE(capture.first.from == hub);
  TEST_ASSERT_EQUAL_UINT(2, capture.first.deviceCount);
  TEST_ASSERT_EQUAL_STRING("v2.1", capture.first.fwVersion);
  TEST_ASSERT_EQUAL_UINT(0, client.pendingCount());
}

static void test_unmatched_msg_id_leaves_timeout_alone() {
  FakeTransport transport;
  ConnectorHubClient client;
  client.begin(transport, kKey, false);
  ChubIp hub = makeIp(10, 0, 0, 5);

  ListCapture capture = {};
  client.queryDeviceList(hub, 0, captureList, &capture);

  char reply[512];
  makeDeviceListAck(reply, sizeof(reply), "99999999999999999", "v2.1", kToken, kMotorJson);
  transport.inject(hub, reply);
  client.update(500);
  TEST_ASSERT_EQUAL_INT(0, capture.calls);
  TEST_ASSERT_EQUAL_UINT(1, client.pendingCount());

  client.update(1999);
  TEST_ASSERT_EQUAL_INT(0, capture.calls);

  client.update(2000);
  TEST_ASSERT_EQUAL_INT(1, capture.calls);
  TEST_ASSERT_EQUAL_STRING("TIMEOUT", ConnectorHub_errName(capture.err));
  TEST_ASSERT_EQUAL_UINT(0, capture.replyCount);
  TEST_ASSERT_TRUE(capture.target == hub);
}

static void test_reply_from_wrong_address_is_reported() {
  FakeTransport transport;
  ConnectorHubClient client;
  client.begin(transport, kKey, false);
  ErrorCapture errors = {};
  client.setErrorCallback(captureError, &errors);

  ListCapture capture = {};
  client.queryDeviceList(makeIp(10, 0, 0, 5), 0, captureList, &capture);
  char msgId[kChubMsgIdSize];
  transport.sentMsgId(0, msgId, sizeof(msgId));

  char reply[512];
  makeDeviceListAck(reply, sizeof(reply), msgId, "v2.1", kToken, kMotorJson);
  transport.inject(makeIp(10, 0, 0, 9), reply);
  client.update(100);

  TEST_ASSERT_EQUAL_INT(0, capture.calls);
  TEST_ASSERT_EQUAL_INT(1, errors.calls);
  TEST_ASSERT_EQUAL_STRING("WRONG_SOURCE_IP", ConnectorHub_errName(errors.last.error));
  TEST_ASSERT_TRUE(errors.last.hub == makeIp(10, 0, 0, 9));
  TEST_ASSERT_EQUAL_UINT(1, client.pendingCount());
}

static void test_fully_paired_hub_list_is_received() {
  FakeTransport transport;
  ConnectorHubClient client;
  client.begin(transport, kKey, false);
  ChubIp hub = makeIp(10, 0, 0, 5);

  ListCapture capture = {};
  client.queryDeviceList(hub, 0, captureList, &capture);
  char msgId[kChubMsgIdSize];
  transport.sentMsgId(0, msgId, sizeof(msgId));

  static char devices[2048];
  size_t used = 0;
  for (unsigned i = 1; i <= 25; ++i) {
    used += snprintf(devices + used, sizeof(devices) - used,
                     "%s{\"mac\":\"f0f5bd4f2e45%04x\",\"deviceType\":\"10000000\"}",
                     i > 1 ? "," : "", i);
  }
  static char reply[kChubMaxDatagram];
  makeDeviceListAck(reply, sizeof(reply), msgId, "v2.1", kToken, devices);
  TEST_ASSERT_TRUE(strlen(reply) > 1472);
  transport.inject(hub, reply);
  client.update(100);

  // Hub record plus the first 15 motors
  TEST_ASSERT_EQUAL_INT(1, capture.calls);
  TEST_ASSERT_EQUAL_STRING("OK", ConnectorHub_errName(capture.err));
  TEST_ASSERT_EQUAL_UINT(kChubMaxDevicesPerHub, capture.first.deviceCount);
  TEST_ASSERT_EQUAL_STRING("f0f5bd4f2e45000f", capture.first.devices[15].mac);
  TEST_ASSERT_TRUE(logContains("ignoring 10"));
  TEST_ASSERT_FALSE(logContains("oversized"));
}

static void test_oversized_datagram_is_dropped() {
  FakeTransport transport;
  ConnectorHubClient client;
  client.begin(transport, kKey, false);
  ChubIp hub = makeIp(10, 0, 0, 5);

  ListCapture capture = {};
  client.queryDeviceList(hub, 0, captureList, &capture);
  char msgId[kChubMsgIdSize];
  transport.sentMsgId(0, msgId, sizeof(msgId));

  transport.injectOversized(hub);
  char reply[512];
  makeDeviceListAck(reply, sizeof(reply), msgId, "v2.1", kToken, kMotorJson);
  transport.inject(hub, reply);
  client.update(100);

  // The next datagram in the same pump still gets through
  TEST_ASSERT_TRUE(logContains("Dropped oversized datagram from 10.0.0.5"));
  TEST_ASSERT_EQUAL_INT(1, capture.calls);
  TEST_ASSERT_EQUAL_STRING("OK", ConnectorHub_errName(capture.err));
  TEST_ASSERT_EQUAL_UINT(2, capture.first.deviceCount);
}

static void test_second_query_to_same_hub_is_busy() {
  FakeTransport transport;
  ConnectorHubClient client;
  client.begin(transport, kKey, false);
  ListCapture capture = {};

  TEST_ASSERT_TRUE(client.queryDeviceList(makeIp(10, 0, 0, 5), 0, captureList, &capture) == ChubErr::OK);
  TEST_ASSERT_TRUE(client.queryDeviceList(makeIp(10, 0, 0, 5), 10, captureList, &capture) == ChubErr::BUSY);
  TEST_ASSERT_TRUE(client.queryDeviceList(makeIp(10, 0, 0, 6), 10, captureList, &capture) == ChubErr::OK);
  TEST_ASSERT_EQUAL_UINT(2, transport.sentCount);
}

static void test_multicast_query_collects_every_hub() {
  FakeTransport transport;
  ConnectorHubClient client;
  client.begin(transport, kKey, true);

  ListCapture capture = {};
  client.queryDeviceList(ConnectorHub_multicastGroup(), 0, captureList, &capture);
  char msgId[kChubMsgIdSize];
  transport.sentMsgId(0, msgId, sizeof(msgId));

  char reply[512];
  makeDeviceListAck(reply, sizeof(reply), msgId, "v2.1", kToken, kMotorJson);
  transport.inject(makeIp(10, 0, 0, 5), reply);
  transport.inject(makeIp(10, 0, 0, 5), reply);  // duplicate
  makeDeviceListAck(reply, sizeof(reply), msgId, "v3.0", "8B7A6F5E4D3C2B1A", "");
  transport.inject(makeIp(10, 0, 0, 6), reply);
  client.update(100);

  // Replies keep arriving until the window closes
  TEST_ASSERT_EQUAL_INT(0, capture.calls);

  client.update(2000);
  TEST_ASSERT_EQUAL_INT(1, capture.calls);
  TEST_ASSERT_EQUAL_STRING("OK", ConnectorHub_errName(capture.err));
  TEST_ASSERT_EQUAL_UINT(2, capture.replyCount);
  TEST_ASSERT_TRUE(capture.from[0] == makeIp(10, 0, 0, 5));
  TEST_ASSERT_TRUE(capture.from[1] == makeIp(10, 0, 0, 6));
  TEST_ASSERT_EQUAL_UINT(1, transport.sentCount);

  char token[kChubTokenSize];
  TEST_ASSERT_TRUE(client.getHubToken(makeIp(10, 0, 0, 6), token, sizeof(token)));
  TEST_ASSERT_EQUAL_STRING("8B7A6F5E4D3C2B1A", token);
}

static void test_command_ack_completes_with_status() {
  FakeTransport transport;
  ConnectorHubClient client;
  client.begin(transport, kKey, false);
  ChubIp hub = makeIp(10, 0, 0, 5);

  AckCapture capture = {};
  ChubCommand open = {ChubCommandType::OPEN, 0};
  TEST_ASSERT_TRUE(client.sendCommand(hub, kToken, motor(), open, 0, captureAck, &capture) == ChubErr::OK);
  TEST_ASSERT_NOT_NULL(strstr(transport.sent[0].text(), "\"AccessToken\":\"7F2D0B618E21008D7A63304C607FB034\""));
  TEST_ASSERT_NOT_NULL(strstr(transport.sent[0].text(), "\"data\":{\"operation\":1}"));

  char msgId[kChubMsgIdSize];
  transport.sentMsgId(0, msgId, sizeof(msgId));
  char ack[256];
  snprintf(ack, sizeof(ack),
           "{\"msgType\":\"WriteDeviceAck\",\"mac\":\"f0f5bd4f2e450001\",\"deviceType\":\"10000000\","
           "\"msgID\":\"%s\",\"data\":{\"type\":1,\"operation\":1,\"currentPosition\":0,\"RSSI\":-70}}",
           msgId);
  transport.inject(hub, ack);
  client.update(40);

  TEST_ASSERT_EQUAL_INT(1, capture.calls);
  TEST_ASSERT_EQUAL_STRING("OK", ConnectorHub_errName(capture.err));
  TEST_ASSERT_TRUE(capture.hasStatus);
  TEST_ASSERT_EQUAL_INT32(0, capture.status.currentPosition);
  TEST_ASSERT_EQUAL_INT32(-70, capture.status.rssi);
  TEST_ASSERT_EQUAL_UINT(0, client.pendingCount());
}

static void test_command_ack_from_wrong_address_keeps_waiting() {
  FakeTransport transport;
  ConnectorHubClient client;
  client.begin(transport, kKey, false);
  ErrorCapture errors = {};
  client.setErrorCallback(captureError, &errors);
  ChubIp hub = makeIp(10, 0, 0, 5);

  AckCapture capture = {};
  ChubCommand stop = {ChubCommandType::STOP, 0};
  client.sendCommand(hub, kToken, motor(), stop, 0, captureAck, &capture);
  char msgId[kChubMsgIdSize];
  transport.sentMsgId(0, msgId, sizeof(msgId));
  char ack[256];
  snprintf(ack, sizeof(ack),
           "{\"msgType\":\"WriteDeviceAck\",\"mac\":\"f0f5bd4f2e450001\",\"deviceType\":\"10000000\","
           "\"msgID\":\"%s\",\"data\":{\"type\":1,\"operation\":2,\"currentPosition\":30}}",
           msgId);

  transport.inject(makeIp(10, 0, 0, 9), ack);
  client.update(40);
  TEST_ASSERT_EQUAL_INT(0, capture.calls);
  TEST_ASSERT_EQUAL_INT(1, errors.calls);
  TEST_ASSERT_EQUAL_STRING("WRONG_SOURCE_IP", ConnectorHub_errName(errors.last.error));
  TEST_ASSERT_TRUE(errors.last.operation == ChubOp::WriteDevice);
  TEST_ASSERT_TRUE(errors.last.hub == makeIp(10, 0, 0, 9));
  TEST_ASSERT_EQUAL_UINT(1, client.pendingCount());

  transport.inject(hub, ack);
  client.update(60);
  TEST_ASSERT_EQUAL_INT(1, capture.calls);
  TEST_ASSERT_EQUAL_STRING("OK", ConnectorHub_errName(capture.err));
  TEST_ASSERT_EQUAL_INT32(30, capture.status.currentPosition);
  TEST_ASSERT_EQUAL_UINT(0, client.pendingCount());
}

static void test_command_retransmits_then_times_out() {
  FakeTransport transport;
  ConnectorHubClient client;
  client.begin(transport, kKey, false);
  client.setTimeouts(2000, 1000, 3);
  ErrorCapture errors = {};
  client.setErrorCallback(captureError, &errors);
  ChubIp hub = makeIp(10, 0, 0, 5);

  AckCapture capture = {};
  ChubCommand stop = {ChubCommandType::STOP, 0};
  client.sendCommand(hub, kToken, motor(), stop, 0, captureAck, &capture);
  TEST_ASSERT_EQUAL_UINT(1, transport.sentCount);

  client.update(999);
  TEST_ASSERT_EQUAL_UINT(1, transport.sentCount);

  client.update(1000);
  TEST_ASSERT_EQUAL_UINT(2, transport.sentCount);
  // Retransmission reuses the msgID
  TEST_ASSERT_EQUAL_STRING(transport.sent[0].text(), transport.sent[1].text());

  client.update(2000);
  TEST_ASSERT_EQUAL_UINT(3, transport.sentCount);
  TEST_ASSERT_EQUAL_INT(0, capture.calls);

  client.update(3000);
  TEST_ASSERT_EQUAL_UINT(3, transport.sentCount);
  TEST_ASSERT_EQUAL_INT(1, capture.calls);
  TEST_ASSERT_EQUAL_STRING("TIMEOUT", ConnectorHub_errName(capture.err));
  TEST_ASSERT_FALSE(capture.hasStatus);

  TEST_ASSERT_EQUAL_INT(1, errors.calls);
  TEST_ASSERT_TRUE(errors.last.operation == ChubOp::WriteDevice);
  TEST_ASSERT_EQUAL_UINT32(3000, errors.last.elapsedMs);
}

static void test_late_reply_to_first_attempt_still_counts() {
  FakeTransport transport;
  ConnectorHubClient client;
  client.begin(transport, kKey, false);
  ChubIp hub = makeIp(10, 0, 0, 5);

  AckCapture capture = {};
  client.queryStatus(hub, kToken, motor(), 0, captureAck, &capture);
  client.update(1000);
  TEST_ASSERT_EQUAL_UINT(2, transport.sentCount);

  char msgId[kChubMsgIdSize];
  transport.sentMsgId(0, msgId, sizeof(msgId));
  char ack[256];
  snprintf(ack, sizeof(ack),
           "{\"msgType\":\"ReadDeviceAck\",\"mac\":\"f0f5bd4f2e450001\",\"msgID\":\"%s\","
           "\"data\":{\"currentPosition\":75}}",
           msgId);
  transport.inject(hub, ack);
  client.update(1100);

  TEST_ASSERT_EQUAL_INT(1, capture.calls);
  TEST_ASSERT_EQUAL_STRING("OK", ConnectorHub_errName(capture.err));
  TEST_ASSERT_EQUAL_INT32(75, capture.status.currentPosition);
}

static void test_action_result_rejects_command() {
  FakeTransport transport;
  ConnectorHubClient client;
  client.begin(transport, kKey, false);
  ChubIp hub = makeIp(10, 0, 0, 5);

  AckCapture capture = {};
  ChubCommand close = {ChubCommandType::CLOSE, 0};
  client.sendCommand(hub, kToken, motor(), close, 0, captureAck, &capture);

  char msgId[kChubMsgIdSize];
  transport.sentMsgId(0, msgId, sizeof(msgId));
  char ack[256];
  snprintf(ack, sizeof(ack),
           "{\"msgType\":\"WriteDeviceAck\",\"mac\":\"f0f5bd4f2e450001\",\"msgID\":\"%s\","
           "\"actionResult\":\"AccessToken error\"}",
           msgId);
  transport.inject(hub, ack);
  client.update(30);

  TEST_ASSERT_EQUAL_INT(1, capture.calls);
  TEST_ASSERT_EQUAL_STRING("HUB_REJECTED", ConnectorHub_errName(capture.err));
  TEST_ASSERT_FALSE(capture.hasStatus);
}

static void test_token_cache_feeds_commands() {
  FakeTransport transport;
  ConnectorHubClient client;
  client.begin(transport, kKey, false);
  ChubIp hub = makeIp(10, 0, 0, 5);
  AckCapture capture = {};
  ChubCommand open = {ChubCommandType::OPEN, 0};

  TEST_ASSERT_TRUE(client.sendCommand(hub, nullptr, motor(), open, 0, captureAck, &capture) ==
                   ChubErr::NO_TOKEN);

  ListCapture list = {};
  client.queryDeviceList(hub, 0, captureList, &list);
  char msgId[kChubMsgIdSize];
  transport.sentMsgId(0, msgId, sizeof(msgId));
  char reply[512];
  makeDeviceListAck(reply, sizeof(reply), msgId, "v2.1", kToken, kMotorJson);
  transport.inject(hub, reply);
  client.update(50);

  char token[kChubTokenSize];
  TEST_ASSERT_TRUE(client.getHubToken(hub, token, sizeof(token)));
  TEST_ASSERT_EQUAL_STRING(kToken, token);
  TEST_ASSERT_FALSE(client.getHubToken(makeIp(10, 0, 0, 77), token, sizeof(token)));

  TEST_ASSERT_TRUE(client.sendCommand(hub, nullptr, motor(), open, 60, captureAck, &capture) ==
                   ChubErr::OK);
  TEST_ASSERT_NOT_NULL(strstr(transport.sent[1].text(), "7F2D0B618E21008D7A63304C607FB034"));
}

static void test_commands_need_a_key() {
  FakeTransport transport;
  ConnectorHubClient client;
  client.begin(transport, nullptr, false);
  AckCapture capture = {};
  ChubCommand open = {ChubCommandType::OPEN, 0};
  TEST_ASSERT_TRUE(client.sendCommand(makeIp(10, 0, 0, 5), kToken, motor(), open, 0, captureAck,
                                      &capture) == ChubErr::INVALID_CONFIG);
  TEST_ASSERT_EQUAL_UINT(0, transport.sentCount);
}

static void test_sealed_payloads_round_trip() {
  FakeTransport transport;
  ConnectorHubClient client;
  client.begin(transport, kKey, false);
  client.setSealedPayloads(true);
  ChubIp hub = makeIp(10, 0, 0, 5);

  AckCapture capture = {};
  client.queryStatus(hub, kToken, motor(), 0, captureAck, &capture);
  TEST_ASSERT_EQUAL_UINT(1, transport.sentCount);
  TEST_ASSERT_EQUAL_UINT(0, transport.sent[0].len % 16);
  TEST_ASSERT_TRUE(transport.sent[0].data[0] != '{');

  uint8_t plain[kChubMaxDatagram];
  size_t plainLen = 0;
  TEST_ASSERT_TRUE(ConnectorHub_decrypt(transport.sent[0].data, transport.sent[0].len, kKey, plain,
                                        sizeof(plain), plainLen) == ChubErr::OK);
  plain[plainLen] = '\0';
  TEST_ASSERT_NOT_NULL(strstr(reinterpret_cast<char *>(plain), "\"msgType\":\"ReadDevice\""));

  char msgId[kChubMsgIdSize];
  const char *idStart = strstr(reinterpret_cast<char *>(plain), "\"msgID\":\"");
  TEST_ASSERT_NOT_NULL(idStart);
  snprintf(msgId, sizeof(msgId), "%.17s", idStart + 9);

  char ack[256];
  snprintf(ack, sizeof(ack),
           "{\"msgType\":\"ReadDeviceAck\",\"mac\":\"f0f5bd4f2e450001\",\"msgID\":\"%s\","
           "\"data\":{\"currentPosition\":40}}",
           msgId);
  uint8_t sealed[320];
  size_t sealedLen = ConnectorHub_encrypt(reinterpret_cast<const uint8_t *>(ack), strlen(ack), kKey,
                                          sealed, sizeof(sealed));
  transport.injectBytes(hub, sealed, sealedLen);
  client.update(20);

  TEST_ASSERT_EQUAL_INT(1, capture.calls);
  TEST_ASSERT_EQUAL_STRING("OK", ConnectorHub_errName(capture.err));
  TEST_ASSERT_EQUAL_INT32(40, capture.status.currentPosition);
}

static void test_undecryptable_datagram_is_dropped() {
  FakeTransport transport;
  ConnectorHubClient client;
  client.begin(transport, kKey, false);
  ErrorCapture errors = {};
  client.setErrorCallback(captureError, &errors);

  // Not a whole number of AES blocks
  const uint8_t garbage[15] = {0x01, 0x02, 0x03};
  transport.injectBytes(makeIp(10, 0, 0, 5), garbage, sizeof(garbage));
  transport.inject(makeIp(10, 0, 0, 5), "{not json");
  client.update(10);

  TEST_ASSERT_EQUAL_INT(1, errors.calls);
  TEST_ASSERT_EQUAL_STRING("DECRYPT_FAIL", ConnectorHub_errName(errors.last.error));
  TEST_ASSERT_TRUE(errors.last.operation == ChubOp::Receive);
  TEST_ASSERT_TRUE(logContains("undecryptable"));
}

static void test_end_drops_pending_requests() {
  FakeTransport transport;
  ConnectorHubClient client;
  client.begin(transport, kKey, false);

  ListCapture capture = {};
  client.queryDeviceList(makeIp(10, 0, 0, 5), 0, captureList, &capture);
  TEST_ASSERT_EQUAL_UINT(1, client.pendingCount());

  client.end();
  TEST_ASSERT_FALSE(client.isRunning());
  TEST_ASSERT_EQUAL_INT(1, transport.stopCount);
  TEST_ASSERT_EQUAL_UINT(0, client.pendingCount());

  client.update(5000);
  TEST_ASSERT_EQUAL_INT(0, capture.calls);
  TEST_ASSERT_TRUE(client.queryDeviceList(makeIp(10, 0, 0, 5), 5000, captureList, &capture) ==
                   ChubErr::SEND_FAIL);
}

void run_client_tests() {
  RUN_TEST(test_begin_opens_receive_port);
  RUN_TEST(test_unicast_query_completes_on_reply);
  RUN_TEST(test_unmatched_msg_id_leaves_timeout_alone);
  RUN_TEST(test_reply_from_wrong_address_is_reported);
  RUN_TEST(test_fully_paired_hub_list_is_received);
  RUN_TEST(test_oversized_datagram_is_dropped);
  RUN_TEST(test_second_query_to_same_hub_is_busy);
  RUN_TEST(test_multicast_query_collects_every_hub);
  RUN_TEST(test_command_ack_completes_with_status);
  RUN_TEST(test_command_ack_from_wrong_address_keeps_waiting);
  RUN_TEST(test_command_retransmits_then_times_out);
  RUN_TEST(test_late_reply_to_first_attempt_still_counts);
  RUN_TEST(test_action_result_rejects_command);
  RUN_TEST(test_token_cache_feeds_commands);
  RUN_TEST(test_commands_need_a_key);
  RUN_TEST(test_sealed_payloads_round_trip);
  RUN_TEST(test_undecryptable_datagram_is_dropped);
  RUN_TEST(test_end_drops_pending_requests);
}
