#pragma once

// =============================================================================
// ConnectorHubAsync - Arduino glue
// =============================================================================
// WiFiUDP transport and Serial log sink. The core library only sees the
// abstract ConnectorHubTransport, so this header is the one place that pulls
// in the Arduino networking stack.
// =============================================================================

#include <Arduino.h>
#include <WiFiUdp.h>

#include "ConnectorHubAsync.h"

class ConnectorHubWiFiUdpTransport : public ConnectorHubTransport {
public:
  explicit ConnectorHubWiFiUdpTransport(WiFiUDP &udp) : _udp(&udp), _open(false) {}

  bool begin(uint16_t localPort) override;
  bool beginMulticast(const ChubIp &group, uint16_t localPort) override;
  bool send(const ChubIp &ip, uint16_t port, const uint8_t *data, size_t len) override;
  int receive(ChubIp &from, uint8_t *buffer, size_t capacity) override;
  void stop() override;

private:
  void discardPacket();

  WiFiUDP *_udp;
  bool _open;
};

// Prints "[E] ...", "[W] ...", "[I] ...", "[D] ...", "[N] ..." lines to Serial.
void ConnectorHub_serialLogSink(ChubLogLevel level, const char *message);
