#include <stdio.h>
#include <string.h>
#include "unity.h"

#include "ConnectorHubAsync.h"
#include "support/FakeTransport.h"

LogCapture g_logCapture;

void captureLogSink(ChubLogLevel level, const char *message) {
  if (g_logCapture.count >= LogCapture::kMaxLines) return;
  snprintf(g_logCapture.lines[g_logCapture.count], sizeof(g_logCapture.lines[0]), "%s", message);
  g_logCapture.levels[g_logCapture.count] = level;
  g_logCapture.count++;
}

bool logContains(const char *needle) {
  for (size_t i = 0; i < g_logCapture.count; ++i) {
    if (strstr(g_logCapture.lines[i], needle) != nullptr) return true;
  }
  return false;
}

void setUp(void) {
  memset(&g_logCapture, 0, sizeof(g_logCapture));
  ConnectorHub_setLogSink(captureLogSink);
  ConnectorHub_setDebugLogEnabled(false);
}

void tearDown(void) {
  ConnectorHub_setLogSink(nullptr);
}

void run_config_tests();
void run_crypto_tests();
void run_protocol_tests();
void run_client_tests();
void run_registry_tests();
void run_discovery_tests();

int main(void) {
  printf("Starting Unity Tests...\n");

  UNITY_BEGIN();

  run_config_tests();
  run_crypto_tests();
  run_protocol_tests();
  run_client_tests();
  run_registry_tests();
  run_discovery_tests();

  return UNITY_END();
}
