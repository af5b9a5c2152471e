#include "ConnectorHubWiFiUdp.h"

namespace {

IPAddress toIPAddress(const ChubIp &ip) {
  return IPAddress(ip.octet[0], ip.octet[1], ip.octet[2], ip.octet[3]);
}

ChubIp fromIPAddress(const IPAddress &ip) {
  ChubIp out = {{ip[0], ip[1], ip[2], ip[3]}};
  return out;
}

}  // namespace

bool ConnectorHubWiFiUdpTransport::begin(uint16_t localPort) {
  if (_open) _udp->stop();
  _open = _udp->begin(localPort) == 1;
  return _open;
}

bool ConnectorHubWiFiUdpTransport::beginMulticast(const ChubIp &group, uint16_t localPort) {
  if (_open) _udp->stop();
  _open = _udp->beginMulticast(toIPAddress(group), localPort) == 1;
  return _open;
}

bool ConnectorHubWiFiUdpTransport::send(const ChubIp &ip, uint16_t port, const uint8_t *data,
                                        size_t len) {
  if (!_open) return false;
  if (_udp->beginPacket(toIPAddress(ip), port) != 1) return false;
  if (_udp->write(data, len) != len) {
    _udp->endPacket();
    return false;
  }
  return _udp->endPacket() == 1;
}

int ConnectorHubWiFiUdpTransport::receive(ChubIp &from, uint8_t *buffer, size_t capacity) {
  if (!_open) return 0;
  int len = _udp->parsePacket();
  if (len <= 0) return 0;

  from = fromIPAddress(_udp->remoteIP());
  if (static_cast<size_t>(len) > capacity) {
    discardPacket();  // Safe discard instead of flush()
    return -1;
  }

  int readLen = _udp->read(buffer, len);
  if (readLen != len) {
    discardPacket();
    return -1;
  }
  return readLen;
}

void ConnectorHubWiFiUdpTransport::stop() {
  if (_open) _udp->stop();
  _open = false;
}

void ConnectorHubWiFiUdpTransport::discardPacket() {
  uint8_t discard[64];
  while (_udp->available()) {
    _udp->read(discard, min((int)sizeof(discard), _udp->available()));
  }
}

void ConnectorHub_serialLogSink(ChubLogLevel level, const char *message) {
  const char *prefix = "[I] ";
  switch (level) {
    case ChubLogLevel::ERROR: prefix = "[E] "; break;
    case ChubLogLevel::WARN:  prefix = "[W] "; break;
    case ChubLogLevel::INFO:  prefix = "[I] "; break;
    case ChubLogLevel::DEBUG: prefix = "[D] "; break;
    case ChubLogLevel::NET:   prefix = "[N] "; break;
  }
  Serial.print(prefix);
  Serial.println(message);
}
