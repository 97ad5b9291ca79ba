// =============================================================================
// KasaLan - Internal Header
// =============================================================================
// Internal types, constants, and helpers shared between the implementation
// modules. NOT part of the public API (unit tests include it).
// =============================================================================

#pragma once

#include "../KasaLan.h"

#include <errno.h>
#include <string.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace KasaLanInternal {

// =========================
// Protocol Constants
// =========================
constexpr uint8_t kCipherInitialKey = 0xAB;
constexpr size_t kHeaderLen = 4;
constexpr const char *kBroadcastAddress = "255.255.255.255";

// Multi-namespace probe; devices answer only the namespaces they know.
constexpr const char *kDiscoveryProbe =
    "{\"system\":{\"get_sysinfo\":{}},"
    "\"emeter\":{\"get_realtime\":{}},"
    "\"smartlife.iot.dimmer\":{\"get_dimmer_parameters\":{}},"
    "\"smartlife.iot.common.emeter\":{\"get_realtime\":{}},"
    "\"smartlife.iot.smartbulb.lightingservice\":{\"get_light_state\":{}}}";

// =========================
// Scoped UDP socket
// =========================

// Owns one datagram socket; closed on every exit path.
class UdpSocket {
public:
  UdpSocket() : _fd(-1) {}
  ~UdpSocket() { close(); }

  UdpSocket(const UdpSocket &) = delete;
  UdpSocket &operator=(const UdpSocket &) = delete;

  // Binds 0.0.0.0:0 and applies timeouts (0 = block forever).
  KasaErr open(uint32_t readTimeoutMs, uint32_t writeTimeoutMs, bool broadcast);
  void close();

  KasaErr sendTo(const sockaddr_in &to, const uint8_t *data, size_t len);
  // TIMEOUT when the read timeout elapses with nothing received.
  KasaErr receiveFrom(uint8_t *buffer, size_t cap, size_t &received, sockaddr_in &from);

  int fd() const { return _fd; }

private:
  int _fd;
};

// =========================
// Discovery response set
// =========================

struct DiscoveryResponse {
  char ip[16];
  std::vector<uint8_t> plain;
};

// Source address order is preserved; one entry per address.
typedef std::vector<DiscoveryResponse> DiscoveryResponses;

// =========================
// Global State (extern declarations)
// =========================
extern KasaErrorCallback g_errorCallback;

// =========================
// Core Utility Functions
// =========================

// In-place safe (in == out allowed)
void cipherEncrypt(const uint8_t *in, size_t len, uint8_t *out);
void cipherDecrypt(const uint8_t *in, size_t len, uint8_t *out);

inline void writeBe32(uint8_t *out, uint32_t v) {
  out[0] = static_cast<uint8_t>(v >> 24);
  out[1] = static_cast<uint8_t>(v >> 16);
  out[2] = static_cast<uint8_t>(v >> 8);
  out[3] = static_cast<uint8_t>(v);
}

inline uint32_t readBe32(const uint8_t *in) {
  return (uint32_t(in[0]) << 24) | (uint32_t(in[1]) << 16) |
         (uint32_t(in[2]) << 8) | uint32_t(in[3]);
}

// Safe string copy, always null-terminated
void safeCopyStr(char *dest, size_t destSize, const char *src);

bool resolveIpv4(const char *ip, uint16_t port, sockaddr_in &out);
void sockaddrToStr(const sockaddr_in &addr, char *out, size_t outSize);

// Error handling
void emitErrorCallback(const char *ip, KasaOp operation, KasaErr error, uint32_t elapsedMs);

// JSON helpers
KasaErr serializeRequest(const char *ns, const char *command, JsonVariantConst argument,
                         std::vector<uint8_t> &out);
// Locates [ns][command] in a parsed reply; SERIALIZATION if either key is absent.
KasaErr extractResult(JsonDocument &reply, const char *ns, const char *command, JsonDocument &out);
bool findMember(JsonObjectConst obj, const char *key, JsonVariantConst &out);

// Discovery helpers
bool collectDiscoveryResponse(DiscoveryResponses &responses, const char *ip,
                              const uint8_t *plain, size_t len);
KasaErr classifyDiscoveryResponse(const uint8_t *plain, size_t len, KasaDiscoveredDevice &out);
KasaErr sweep(const KasaLanConfig &config, DiscoveryResponses &responses);

}  // namespace KasaLanInternal

// Bring commonly used items into scope for implementation files
using namespace KasaLanInternal;
