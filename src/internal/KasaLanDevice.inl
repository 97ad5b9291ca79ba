// =============================================================================
// KasaLan - Device Module
// =============================================================================
// Contains: KasaLanDevice (system namespace commands shared by all models)
// =============================================================================

#include "KasaLanInternal.h"

using namespace KasaLanInternal;

KasaLanDevice::KasaLanDevice(const KasaLanConfig &config) : _transport(config) {}

KasaLanDevice::KasaLanDevice(const char *ip) : _transport(KasaLan_configForHost(ip)) {}

KasaErr KasaLanDevice::sysinfo(JsonDocument &out) {
  return _transport.execute("system", "get_sysinfo", JsonVariantConst(), CachePolicy::READ_THROUGH, out);
}

KasaErr KasaLanDevice::alias(char *out, size_t outSize) {
  if (out == nullptr || outSize == 0) return KasaErr::INVALID_PARAMETER;
  out[0] = '\0';

  JsonDocument info;
  KasaErr err = sysinfo(info);
  if (err != KasaErr::OK) return err;

  JsonVariantConst alias;
  if (!findMember(info.as<JsonObjectConst>(), "alias", alias) || !alias.is<const char *>()) {
    KASA_LOGW_F("(%s) sysinfo carries no alias", host());
    return KasaErr::SERIALIZATION;
  }
  safeCopyStr(out, outSize, alias.as<const char *>());
  return KasaErr::OK;
}

KasaErr KasaLanDevice::reboot(uint32_t delaySec) {
  return sendDelayed("reboot", delaySec);
}

KasaErr KasaLanDevice::factoryReset(uint32_t delaySec) {
  return sendDelayed("reset", delaySec);
}

// Destructive: every cached reply is stale once the device restarts.
KasaErr KasaLanDevice::sendDelayed(const char *command, uint32_t delaySec) {
  JsonDocument arg;
  arg["delay"] = delaySec;

  JsonDocument response;
  KasaErr err = _transport.execute("system", command, arg.as<JsonVariantConst>(),
                                   CachePolicy::INVALIDATE_ALL, response);
  if (err == KasaErr::OK) {
    KASA_LOGI_F("(%s) system.%s scheduled in %lu s", host(), command, static_cast<unsigned long>(delaySec));
  }
  return err;
}
