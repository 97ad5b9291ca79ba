// =============================================================================
// KasaLan - Core Module
// =============================================================================
// Contains: Global state, clock, cipher, sockets, JSON helpers, configuration
// =============================================================================

#include "KasaLanInternal.h"

#include <chrono>

namespace KasaLanInternal {

// =========================
// Global State Definitions
// =========================

KasaErrorCallback g_errorCallback = nullptr;

// =========================
// String / Address Helpers
// =========================

void safeCopyStr(char *dest, size_t destSize, const char *src) {
  if (destSize == 0 || src == nullptr) return;
  size_t srcLen = strlen(src);
  size_t copyLen = (srcLen < destSize - 1) ? srcLen : destSize - 1;
  memcpy(dest, src, copyLen);
  dest[copyLen] = '\0';
}

bool resolveIpv4(const char *ip, uint16_t port, sockaddr_in &out) {
  memset(&out, 0, sizeof(out));
  if (ip == nullptr || ip[0] == '\0') return false;
  out.sin_family = AF_INET;
  out.sin_port = htons(port);
  return inet_pton(AF_INET, ip, &out.sin_addr) == 1;
}

void sockaddrToStr(const sockaddr_in &addr, char *out, size_t outSize) {
  if (outSize < INET_ADDRSTRLEN) return;  // "255.255.255.255\0"
  if (inet_ntop(AF_INET, &addr.sin_addr, out, outSize) == nullptr) {
    out[0] = '\0';
  }
}

// =========================
// Cipher (XOR autokey, 0xAB seed)
// =========================

void cipherEncrypt(const uint8_t *in, size_t len, uint8_t *out) {
  uint8_t key = kCipherInitialKey;
  for (size_t i = 0; i < len; ++i) {
    key ^= in[i];
    out[i] = key;
  }
}

void cipherDecrypt(const uint8_t *in, size_t len, uint8_t *out) {
  uint8_t key = kCipherInitialKey;
  for (size_t i = 0; i < len; ++i) {
    uint8_t c = in[i];
    out[i] = c ^ key;
    key = c;
  }
}

// =========================
// UDP Socket
// =========================

static timeval toTimeval(uint32_t ms) {
  timeval tv;
  tv.tv_sec = ms / 1000;
  tv.tv_usec = (ms % 1000) * 1000;
  return tv;
}

KasaErr UdpSocket::open(uint32_t readTimeoutMs, uint32_t writeTimeoutMs, bool broadcast) {
  close();
  _fd = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
  if (_fd < 0) {
    KASA_LOGE_F("socket() failed: errno=%d", errno);
    return KasaErr::IO;
  }

  timeval rcv = toTimeval(readTimeoutMs);
  timeval snd = toTimeval(writeTimeoutMs);
  if (::setsockopt(_fd, SOL_SOCKET, SO_RCVTIMEO, &rcv, sizeof(rcv)) < 0 ||
      ::setsockopt(_fd, SOL_SOCKET, SO_SNDTIMEO, &snd, sizeof(snd)) < 0) {
    KASA_LOGE_F("setsockopt(timeouts) failed: errno=%d", errno);
    close();
    return KasaErr::IO;
  }

  if (broadcast) {
    int enable = 1;
    if (::setsockopt(_fd, SOL_SOCKET, SO_BROADCAST, &enable, sizeof(enable)) < 0) {
      KASA_LOGE_F("setsockopt(SO_BROADCAST) failed: errno=%d", errno);
      close();
      return KasaErr::IO;
    }
  }

  sockaddr_in local;
  memset(&local, 0, sizeof(local));
  local.sin_family = AF_INET;
  local.sin_port = htons(0);
  local.sin_addr.s_addr = htonl(INADDR_ANY);
  if (::bind(_fd, reinterpret_cast<sockaddr *>(&local), sizeof(local)) < 0) {
    KASA_LOGE_F("bind() failed: errno=%d", errno);
    close();
    return KasaErr::IO;
  }
  return KasaErr::OK;
}

void UdpSocket::close() {
  if (_fd >= 0) {
    ::close(_fd);
    _fd = -1;
  }
}

KasaErr UdpSocket::sendTo(const sockaddr_in &to, const uint8_t *data, size_t len) {
  if (_fd < 0) return KasaErr::IO;
  ssize_t sent = ::sendto(_fd, data, len, 0, reinterpret_cast<const sockaddr *>(&to), sizeof(to));
  if (sent < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK) return KasaErr::TIMEOUT;
    KASA_LOGE_F("sendto() failed: errno=%d", errno);
    return KasaErr::IO;
  }
  if (static_cast<size_t>(sent) != len) {
    KASA_LOGE_F("sendto() short write: %d of %u", static_cast<int>(sent), static_cast<unsigned>(len));
    return KasaErr::IO;
  }
  KASA_LOGNET_F("-> %u bytes", static_cast<unsigned>(len));
  return KasaErr::OK;
}

KasaErr UdpSocket::receiveFrom(uint8_t *buffer, size_t cap, size_t &received, sockaddr_in &from) {
  received = 0;
  if (_fd < 0) return KasaErr::IO;
  socklen_t fromLen = sizeof(from);
  memset(&from, 0, sizeof(from));
  ssize_t len = ::recvfrom(_fd, buffer, cap, 0, reinterpret_cast<sockaddr *>(&from), &fromLen);
  if (len < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK) return KasaErr::TIMEOUT;
    KASA_LOGE_F("recvfrom() failed: errno=%d", errno);
    return KasaErr::IO;
  }
  received = static_cast<size_t>(len);
  KASA_LOGNET_F("<- %u bytes", static_cast<unsigned>(received));
  return KasaErr::OK;
}

// =========================
// Error Handling
// =========================

void emitErrorCallback(const char *ip, KasaOp operation, KasaErr error, uint32_t elapsedMs) {
  if (g_errorCallback == nullptr) return;

  KasaErrorInfo info{};
  safeCopyStr(info.ip, sizeof(info.ip), ip);
  info.operation = operation;
  info.error = error;
  info.elapsedMs = elapsedMs;

  g_errorCallback(info);
}

// =========================
// JSON Helpers
// =========================

bool findMember(JsonObjectConst obj, const char *key, JsonVariantConst &out) {
  if (obj.isNull() || key == nullptr) return false;
  for (JsonPairConst kv : obj) {
    if (strcmp(kv.key().c_str(), key) == 0) {
      out = kv.value();
      return true;
    }
  }
  return false;
}

KasaErr serializeRequest(const char *ns, const char *command, JsonVariantConst argument,
                         std::vector<uint8_t> &out) {
  JsonDocument doc;
  JsonObject target = doc[ns].to<JsonObject>();
  if (argument.isNull()) {
    target[command].to<JsonObject>();
  } else {
    target[command] = argument;
  }
  if (doc.overflowed()) {
    return KasaErr::SERIALIZATION;
  }

  size_t len = measureJson(doc);
  std::vector<char> text(len + 1);
  serializeJson(doc, text.data(), text.size());
  out.assign(text.begin(), text.begin() + len);
  return KasaErr::OK;
}

KasaErr extractResult(JsonDocument &reply, const char *ns, const char *command, JsonDocument &out) {
  JsonVariantConst nsValue;
  if (!findMember(reply.as<JsonObjectConst>(), ns, nsValue)) {
    KASA_LOGW_F("reply has no \"%s\" namespace", ns);
    return KasaErr::SERIALIZATION;
  }
  JsonVariantConst result;
  if (!findMember(nsValue.as<JsonObjectConst>(), command, result)) {
    KASA_LOGW_F("reply has no \"%s.%s\" result", ns, command);
    return KasaErr::SERIALIZATION;
  }
  if (!out.set(result)) {
    return KasaErr::SERIALIZATION;
  }
  return KasaErr::OK;
}

}  // namespace KasaLanInternal

// =========================
// Public: time / errors
// =========================

uint32_t KasaLan_millis() {
  static const std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
  return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                   std::chrono::steady_clock::now() - start)
                                   .count());
}

const char *KasaLan_errToStr(KasaErr err) {
  switch (err) {
    case KasaErr::OK:                    return "OK";
    case KasaErr::TIMEOUT:               return "TIMEOUT";
    case KasaErr::IO:                    return "IO";
    case KasaErr::SERIALIZATION:         return "SERIALIZATION";
    case KasaErr::FRAMING:               return "FRAMING";
    case KasaErr::UNSUPPORTED_OPERATION: return "UNSUPPORTED_OPERATION";
    case KasaErr::INVALID_PARAMETER:     return "INVALID_PARAMETER";
  }
  return "UNKNOWN";
}

const char *KasaLan_kindToStr(KasaDeviceKind kind) {
  switch (kind) {
    case KasaDeviceKind::PLUG:        return "Plug";
    case KasaDeviceKind::BULB:        return "Bulb";
    case KasaDeviceKind::POWER_STRIP: return "PowerStrip";
    case KasaDeviceKind::UNKNOWN:     break;
  }
  return "Unknown";
}

void KasaLan_setErrorCallback(KasaErrorCallback cb) {
  g_errorCallback = cb;
}

// =========================
// Public: cipher
// =========================

std::vector<uint8_t> KasaLan_encrypt(const uint8_t *data, size_t len) {
  std::vector<uint8_t> out(len);
  if (len > 0) cipherEncrypt(data, len, out.data());
  return out;
}

std::vector<uint8_t> KasaLan_encrypt(const std::vector<uint8_t> &data) {
  return KasaLan_encrypt(data.data(), data.size());
}

std::vector<uint8_t> KasaLan_decrypt(const uint8_t *data, size_t len) {
  std::vector<uint8_t> out(len);
  if (len > 0) cipherDecrypt(data, len, out.data());
  return out;
}

std::vector<uint8_t> KasaLan_decrypt(const std::vector<uint8_t> &data) {
  return KasaLan_decrypt(data.data(), data.size());
}

std::vector<uint8_t> KasaLan_encryptWithHeader(const uint8_t *data, size_t len) {
  std::vector<uint8_t> out(kHeaderLen + len);
  writeBe32(out.data(), static_cast<uint32_t>(len));
  if (len > 0) cipherEncrypt(data, len, out.data() + kHeaderLen);
  return out;
}

std::vector<uint8_t> KasaLan_encryptWithHeader(const std::vector<uint8_t> &data) {
  return KasaLan_encryptWithHeader(data.data(), data.size());
}

KasaErr KasaLan_decryptWithHeader(const uint8_t *data, size_t len, std::vector<uint8_t> &out) {
  out.clear();
  if (data == nullptr || len < kHeaderLen) {
    KASA_LOGW_F("framed payload shorter than header (%u bytes)", static_cast<unsigned>(len));
    return KasaErr::FRAMING;
  }
  uint32_t declared = readBe32(data);
  size_t body = len - kHeaderLen;
  if (declared != body) {
    KASA_LOGW_F("framed payload length mismatch: header=%lu body=%u",
                static_cast<unsigned long>(declared), static_cast<unsigned>(body));
    return KasaErr::FRAMING;
  }
  out = KasaLan_decrypt(data + kHeaderLen, body);
  return KasaErr::OK;
}

KasaErr KasaLan_decryptWithHeader(const std::vector<uint8_t> &data, std::vector<uint8_t> &out) {
  return KasaLan_decryptWithHeader(data.data(), data.size(), out);
}

// =========================
// Public: configuration
// =========================

KasaLanConfig KasaLan_configForHost(const char *ip) {
  KasaLanConfig config{};
  safeCopyStr(config.host, sizeof(config.host), ip);
  config.port = KASA_LAN_DEFAULT_PORT;
  config.bufferSize = KASA_LAN_BUFFER_SIZE;
  config.readTimeoutMs = KASA_LAN_TIMEOUT_MS;
  config.writeTimeoutMs = KASA_LAN_TIMEOUT_MS;
  config.broadcast = false;
  config.resendCount = 1;
  config.cacheEnabled = false;
  config.cacheTtlMs = 0;
  return config;
}

KasaLanConfig KasaLan_discoveryConfig() {
  KasaLanConfig config = KasaLan_configForHost(kBroadcastAddress);
  config.broadcast = true;
  config.resendCount = KASA_LAN_DISCOVERY_RESENDS;
  return config;
}
