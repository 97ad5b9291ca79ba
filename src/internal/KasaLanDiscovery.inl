// =============================================================================
// KasaLan - Discovery Module
// =============================================================================
// Contains: broadcast sweep, first-responder dedup, device classification
// =============================================================================

#include "KasaLanInternal.h"

#include <ctype.h>

namespace KasaLanInternal {

// =========================
// Classification Helpers
// =========================

// Reads "type" (plugs) or "mic_type" (bulbs), lowercased. Non-string values
// are compared by their JSON text.
static bool readTypeIndicator(JsonObjectConst sysinfo, char *out, size_t outSize) {
  JsonVariantConst value;
  if (!findMember(sysinfo, "type", value) && !findMember(sysinfo, "mic_type", value)) {
    return false;
  }
  if (value.is<const char *>()) {
    safeCopyStr(out, outSize, value.as<const char *>());
  } else {
    serializeJson(value, out, outSize);
  }
  for (char *p = out; *p; ++p) {
    *p = static_cast<char>(tolower(static_cast<unsigned char>(*p)));
  }
  return true;
}

static KasaDeviceKind kindFromIndicator(const char *type, bool hasChildren) {
  if (strstr(type, "plug") != nullptr) {
    return hasChildren ? KasaDeviceKind::POWER_STRIP : KasaDeviceKind::PLUG;
  }
  if (strstr(type, "bulb") != nullptr) {
    return KasaDeviceKind::BULB;
  }
  return KasaDeviceKind::UNKNOWN;
}

bool collectDiscoveryResponse(DiscoveryResponses &responses, const char *ip,
                              const uint8_t *plain, size_t len) {
  for (size_t i = 0; i < responses.size(); ++i) {
    if (strcmp(responses[i].ip, ip) == 0) return false;
  }
  DiscoveryResponse response;
  safeCopyStr(response.ip, sizeof(response.ip), ip);
  response.plain.assign(plain, plain + len);
  responses.push_back(std::move(response));
  return true;
}

KasaErr classifyDiscoveryResponse(const uint8_t *plain, size_t len, KasaDiscoveredDevice &out) {
  JsonDocument doc;
  DeserializationError jsonErr = deserializeJson(doc, reinterpret_cast<const char *>(plain), len);
  if (jsonErr) {
    KASA_LOGW_F("discovery reply is not JSON: %s", jsonErr.c_str());
    return KasaErr::SERIALIZATION;
  }

  JsonVariantConst system;
  JsonVariantConst sysinfoValue;
  if (!findMember(doc.as<JsonObjectConst>(), "system", system) ||
      !findMember(system.as<JsonObjectConst>(), "get_sysinfo", sysinfoValue)) {
    return KasaErr::SERIALIZATION;
  }
  JsonObjectConst sysinfo = sysinfoValue.as<JsonObjectConst>();

  char type[48];
  if (!readTypeIndicator(sysinfo, type, sizeof(type))) {
    return KasaErr::SERIALIZATION;
  }

  JsonVariantConst children;
  out.kind = kindFromIndicator(type, findMember(sysinfo, "children", children));
  if (!out.sysinfo.set(sysinfo)) {
    return KasaErr::SERIALIZATION;
  }
  return KasaErr::OK;
}

KasaErr sweep(const KasaLanConfig &config, DiscoveryResponses &responses) {
  sockaddr_in target;
  if (!resolveIpv4(config.host, config.port, target) || config.bufferSize == 0) {
    KASA_LOGE_F("invalid discovery target \"%s\":%u", config.host, static_cast<unsigned>(config.port));
    return KasaErr::INVALID_PARAMETER;
  }

  UdpSocket socket;
  KasaErr err = socket.open(config.readTimeoutMs, config.writeTimeoutMs, config.broadcast);
  if (err != KasaErr::OK) return err;

  std::vector<uint8_t> probe(kDiscoveryProbe, kDiscoveryProbe + strlen(kDiscoveryProbe));
  cipherEncrypt(probe.data(), probe.size(), probe.data());

  uint8_t resends = config.resendCount > 0 ? config.resendCount : 1;
  for (uint8_t i = 0; i < resends; ++i) {
    err = socket.sendTo(target, probe.data(), probe.size());
    if (err != KasaErr::OK) return err;
  }

  std::vector<uint8_t> buffer(config.bufferSize);
  while (true) {
    size_t received = 0;
    sockaddr_in from;
    err = socket.receiveFrom(buffer.data(), buffer.size(), received, from);
    if (err == KasaErr::TIMEOUT) break;  // quiet for one read timeout: sweep done
    if (err != KasaErr::OK) return err;

    char ip[INET_ADDRSTRLEN];
    sockaddrToStr(from, ip, sizeof(ip));
    cipherDecrypt(buffer.data(), received, buffer.data());
    if (!collectDiscoveryResponse(responses, ip, buffer.data(), received)) {
      KASA_LOGHOT_F("duplicate discovery reply from %s dropped", ip);
    }
  }
  return KasaErr::OK;
}

}  // namespace KasaLanInternal

// =========================
// Discovery API
// =========================

KasaErr KasaLan_discover(std::map<std::string, KasaDiscoveredDevice> &out) {
  return KasaLan_discover(KasaLan_discoveryConfig(), out);
}

KasaErr KasaLan_discover(const KasaLanConfig &config, std::map<std::string, KasaDiscoveredDevice> &out) {
  out.clear();
  uint32_t start = KasaLan_millis();

  DiscoveryResponses responses;
  KasaErr err = sweep(config, responses);
  if (err != KasaErr::OK) {
    KASA_LOGE_F("discovery sweep failed: %s", KasaLan_errToStr(err));
    emitErrorCallback(config.host, KasaOp::Discovery, err, KasaLan_millis() - start);
    return err;
  }

  for (size_t i = 0; i < responses.size(); ++i) {
    const DiscoveryResponse &response = responses[i];
    KasaDiscoveredDevice device;
    safeCopyStr(device.ip, sizeof(device.ip), response.ip);
    device.kind = KasaDeviceKind::UNKNOWN;

    KasaErr entryErr = classifyDiscoveryResponse(response.plain.data(), response.plain.size(), device);
    if (entryErr != KasaErr::OK) {
      KASA_LOGW_F("skipping malformed discovery reply from %s", response.ip);
      emitErrorCallback(response.ip, KasaOp::Discovery, entryErr, KasaLan_millis() - start);
      continue;
    }
    out[response.ip] = std::move(device);
  }

  KASA_LOGI_F("discovery: %u replies, %u devices", static_cast<unsigned>(responses.size()),
              static_cast<unsigned>(out.size()));
  return KasaErr::OK;
}

KasaDeviceKind KasaLan_classifySysinfo(JsonVariantConst sysinfo) {
  JsonObjectConst info = sysinfo.as<JsonObjectConst>();
  char type[48];
  if (!readTypeIndicator(info, type, sizeof(type))) {
    return KasaDeviceKind::UNKNOWN;
  }
  JsonVariantConst children;
  return kindFromIndicator(type, findMember(info, "children", children));
}

void KasaLan_printDiscoveredDevices(const std::map<std::string, KasaDiscoveredDevice> &devices) {
  KASA_LOGI_F("Discovered Kasa devices:");
  if (devices.empty()) {
    KASA_LOGI_F("  (none)");
    return;
  }
  for (std::map<std::string, KasaDiscoveredDevice>::const_iterator it = devices.begin();
       it != devices.end(); ++it) {
    const KasaDiscoveredDevice &device = it->second;
    const char *alias = device.sysinfo["alias"] | "";
    const char *model = device.sysinfo["model"] | "";
    KASA_LOGI_F("  IP: %s | Kind: %s | Model: %s | Alias: %s",
                device.ip, KasaLan_kindToStr(device.kind), model, alias);
  }
}
