#pragma once

#include <stddef.h>
#include <stdint.h>

#include <map>
#include <string>
#include <utility>
#include <vector>

#include <ArduinoJson.h>

// =========================
// Library Version
// =========================
#define KASA_LAN_VERSION "0.3.0"
#define KASA_LAN_VERSION_MAJOR 0
#define KASA_LAN_VERSION_MINOR 3
#define KASA_LAN_VERSION_PATCH 0

// =========================
// Minimal compile-time logging (Serial)
// Variant A: GEN / HOT / NET
// Prefix: KASA
// =========================
//
// Enable via build flags or uncomment:
//   #define KASA_DEBUG_GEN
//   #define KASA_DEBUG_HOT
//   #define KASA_DEBUG_NET
//

#if defined(__has_include)
  #if __has_include("DebugConfig.h")
    #include "DebugConfig.h"
  #elif __has_include(<DebugConfig.h>)
    #include <DebugConfig.h>
  #endif
#endif

#if defined(KASA_DEBUG_GEN) || defined(KASA_DEBUG_HOT) || defined(KASA_DEBUG_NET)
  #include <Arduino.h>
#endif

#if defined(KASA_DEBUG_GEN)
  #define KASA_LOGI_F(...) do { Serial.printf("[I] " __VA_ARGS__); Serial.println(); } while(0)
  #define KASA_LOGW_F(...) do { Serial.printf("[W] " __VA_ARGS__); Serial.println(); } while(0)
  #define KASA_LOGE_F(...) do { Serial.printf("[E] " __VA_ARGS__); Serial.println(); } while(0)
#else
  #define KASA_LOGI_F(...) do {} while(0)
  #define KASA_LOGW_F(...) do {} while(0)
  #define KASA_LOGE_F(...) do {} while(0)
#endif

#if defined(KASA_DEBUG_HOT)
  #define KASA_LOGHOT_F(...) do { Serial.printf("[H] " __VA_ARGS__); Serial.println(); } while(0)
#else
  #define KASA_LOGHOT_F(...) do {} while(0)
#endif

#if defined(KASA_DEBUG_NET)
  #define KASA_LOGNET_F(...) do { Serial.printf("[N] " __VA_ARGS__); Serial.println(); } while(0)
#else
  #define KASA_LOGNET_F(...) do {} while(0)
#endif

// =========================
// Compile-time defaults
// =========================
#ifndef KASA_LAN_DEFAULT_PORT
#define KASA_LAN_DEFAULT_PORT 9999
#endif

// Receive buffer per exchange (bytes). Larger replies are truncated by the socket.
#ifndef KASA_LAN_BUFFER_SIZE
#define KASA_LAN_BUFFER_SIZE 4096
#endif

#ifndef KASA_LAN_TIMEOUT_MS
#define KASA_LAN_TIMEOUT_MS 3000
#endif

// Discovery probe is sent this many times; UDP has no acknowledgment.
#ifndef KASA_LAN_DISCOVERY_RESENDS
#define KASA_LAN_DISCOVERY_RESENDS 3
#endif

/* Example: blocking discovery + cached sysinfo
#include <WiFi.h>
#include <KasaLan.h>

void setup() {
  Serial.begin(115200);
  WiFi.begin("your-ssid", "your-pass");
  while (WiFi.status() != WL_CONNECTED) {
    delay(500);
  }

  std::map<std::string, KasaDiscoveredDevice> devices;
  if (KasaLan_discover(devices) == KasaErr::OK) {
    KasaLan_printDiscoveredDevices(devices);
  }

  KasaLanConfig config = KasaLan_configForHost("192.168.1.107");
  config.cacheEnabled = true;
  config.cacheTtlMs = 3000;
  KasaLanDevice plug(config);

  JsonDocument info;
  if (plug.sysinfo(info) == KasaErr::OK) {
    Serial.println(info["alias"].as<const char *>());
  }
}
*/

// Error Classification
enum class KasaErr {
  OK,
  TIMEOUT,                // no reply within the read timeout
  IO,                     // socket create/bind/send/receive failure
  SERIALIZATION,          // reply received but not understood
  FRAMING,                // length-header framed payload is truncated or inconsistent
  UNSUPPORTED_OPERATION,  // caller-level: device lacks the capability
  INVALID_PARAMETER       // caller-level: argument rejected before sending
};

// Operation context for error reports
enum class KasaOp {
  Execute,
  SendBytes,
  Discovery
};

enum class KasaDeviceKind : uint8_t {
  UNKNOWN = 0,
  PLUG,
  BULB,
  POWER_STRIP
};

// How Transport::execute interacts with the response cache
enum class CachePolicy {
  BYPASS,                // never touch the cache
  READ_THROUGH,          // serve from cache, populate on miss
  INVALIDATE_NAMESPACE,  // drop every entry of the namespace, then send uncached
  INVALIDATE_ALL         // clear the cache, then send uncached (reboot, reset)
};

// Error reporting structure - informational only, does NOT affect control flow
struct KasaErrorInfo {
  char ip[16];
  KasaOp operation;
  KasaErr error;
  uint32_t elapsedMs;
};

// Callback must never block or trigger retries
typedef void (*KasaErrorCallback)(const KasaErrorInfo &);

// Monotonic millisecond time source
typedef uint32_t (*KasaClockFn)();

struct KasaLanConfig {
  char host[16];             // dotted IPv4, e.g. "192.168.1.107"
  uint16_t port;
  size_t bufferSize;
  uint32_t readTimeoutMs;
  uint32_t writeTimeoutMs;
  bool broadcast;            // SO_BROADCAST on the socket
  uint8_t resendCount;       // discovery only
  bool cacheEnabled;
  uint32_t cacheTtlMs;       // caller-chosen, no built-in default
};

struct KasaDiscoveredDevice {
  char ip[16];
  KasaDeviceKind kind;
  JsonDocument sysinfo;
};

// Identity for caching is (ns, command) only. The argument is deliberately
// not part of the key: mutating commands must invalidate before sending.
struct KasaRequestKey {
  std::string ns;
  std::string command;

  KasaRequestKey() {}
  KasaRequestKey(const char *ns_, const char *command_)
      : ns(ns_ ? ns_ : ""), command(command_ ? command_ : "") {}

  bool operator==(const KasaRequestKey &other) const {
    return ns == other.ns && command == other.command;
  }
  bool operator<(const KasaRequestKey &other) const {
    return ns < other.ns || (ns == other.ns && command < other.command);
  }
};

// =========================
// Time / errors
// =========================
uint32_t KasaLan_millis();
const char *KasaLan_errToStr(KasaErr err);
const char *KasaLan_kindToStr(KasaDeviceKind kind);
void KasaLan_setErrorCallback(KasaErrorCallback cb);

// =========================
// Response Cache
// =========================

template <typename K, typename V>
class KasaTtlCache {
public:
  explicit KasaTtlCache(uint32_t ttlMs, KasaClockFn clock = KasaLan_millis)
      : _ttlMs(ttlMs), _clock(clock ? clock : KasaLan_millis), _hits(0), _misses(0) {}

  // Copies a live value into out. An expired entry is evicted and counts as a miss.
  bool get(const K &key, V &out) {
    typename Store::iterator it = _store.find(key);
    if (it == _store.end()) {
      ++_misses;
      return false;
    }
    uint32_t age = _clock() - it->second.insertedAtMs;
    if (age >= _ttlMs) {
      _store.erase(it);
      ++_misses;
      return false;
    }
    ++_hits;
    out = it->second.value;
    return true;
  }

  void insert(const K &key, const V &value) {
    Entry &entry = _store[key];
    entry.insertedAtMs = _clock();
    entry.value = value;
  }

  bool remove(const K &key) {
    return _store.erase(key) > 0;
  }

  // Producer signature: KasaErr(const K &, V &). Nothing is stored on failure.
  template <typename Producer>
  KasaErr getOrInsertWith(const K &key, Producer producer, V &out) {
    if (get(key, out)) {
      return KasaErr::OK;
    }
    KasaErr err = producer(key, out);
    if (err != KasaErr::OK) {
      return err;
    }
    insert(key, out);
    return KasaErr::OK;
  }

  // Keeps entries for which pred(key, value) is true.
  template <typename Predicate>
  void retain(Predicate pred) {
    typename Store::iterator it = _store.begin();
    while (it != _store.end()) {
      if (pred(it->first, it->second.value)) {
        ++it;
      } else {
        it = _store.erase(it);
      }
    }
  }

  void clear() { _store.clear(); }

  uint32_t hits() const { return _hits; }
  uint32_t misses() const { return _misses; }
  uint32_t ttlMs() const { return _ttlMs; }
  size_t len() const { return _store.size(); }

private:
  struct Entry {
    uint32_t insertedAtMs;
    V value;
  };
  typedef std::map<K, Entry> Store;

  Store _store;
  uint32_t _ttlMs;
  KasaClockFn _clock;
  uint32_t _hits;
  uint32_t _misses;
};

typedef KasaTtlCache<KasaRequestKey, JsonDocument> KasaResponseCache;

// =========================
// Cipher
// =========================
std::vector<uint8_t> KasaLan_encrypt(const uint8_t *data, size_t len);
std::vector<uint8_t> KasaLan_encrypt(const std::vector<uint8_t> &data);
std::vector<uint8_t> KasaLan_decrypt(const uint8_t *data, size_t len);
std::vector<uint8_t> KasaLan_decrypt(const std::vector<uint8_t> &data);
std::vector<uint8_t> KasaLan_encryptWithHeader(const uint8_t *data, size_t len);
std::vector<uint8_t> KasaLan_encryptWithHeader(const std::vector<uint8_t> &data);
KasaErr KasaLan_decryptWithHeader(const uint8_t *data, size_t len, std::vector<uint8_t> &out);
KasaErr KasaLan_decryptWithHeader(const std::vector<uint8_t> &data, std::vector<uint8_t> &out);

// =========================
// Configuration
// =========================
KasaLanConfig KasaLan_configForHost(const char *ip);
KasaLanConfig KasaLan_discoveryConfig();

// =========================
// Transport
// =========================

class KasaLanTransport {
public:
  explicit KasaLanTransport(const KasaLanConfig &config);

  // Sends {ns: {command: argument}} and returns the reply's [ns][command] in out.
  // A null argument is sent as {}.
  KasaErr execute(const char *ns, const char *command, JsonVariantConst argument,
                  CachePolicy policy, JsonDocument &out);
  KasaErr execute(const char *ns, const char *command, JsonDocument &out);

  // Raw exchange: request is already ciphered, reply is returned deciphered.
  KasaErr sendBytes(const uint8_t *request, size_t len, std::vector<uint8_t> &reply);

  void invalidate(const char *ns);
  void invalidateAll();

  KasaResponseCache *cache() { return _cacheEnabled ? &_cache : nullptr; }
  const KasaResponseCache *cache() const { return _cacheEnabled ? &_cache : nullptr; }
  const KasaLanConfig &config() const { return _config; }

private:
  KasaErr fetch(const KasaRequestKey &key, JsonVariantConst argument, JsonDocument &out);

  const KasaLanConfig _config;
  const bool _cacheEnabled;
  KasaResponseCache _cache;
};

// =========================
// Device handle (system namespace shared by all models)
// =========================

class KasaLanDevice {
public:
  explicit KasaLanDevice(const KasaLanConfig &config);
  explicit KasaLanDevice(const char *ip);

  KasaErr sysinfo(JsonDocument &out);
  KasaErr alias(char *out, size_t outSize);
  KasaErr reboot(uint32_t delaySec = 1);
  KasaErr factoryReset(uint32_t delaySec = 1);

  KasaErr execute(const char *ns, const char *command, JsonVariantConst argument,
                  CachePolicy policy, JsonDocument &out) {
    return _transport.execute(ns, command, argument, policy, out);
  }

  KasaLanTransport &transport() { return _transport; }
  const char *host() const { return _transport.config().host; }

private:
  KasaErr sendDelayed(const char *command, uint32_t delaySec);

  KasaLanTransport _transport;
};

// =========================
// Discovery API
// =========================

// Blocks for at least one read timeout. Keyed by dotted source address.
KasaErr KasaLan_discover(std::map<std::string, KasaDiscoveredDevice> &out);
KasaErr KasaLan_discover(const KasaLanConfig &config, std::map<std::string, KasaDiscoveredDevice> &out);

KasaDeviceKind KasaLan_classifySysinfo(JsonVariantConst sysinfo);
void KasaLan_printDiscoveredDevices(const std::map<std::string, KasaDiscoveredDevice> &devices);
