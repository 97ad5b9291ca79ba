// =============================================================================
// KasaLan - Transport Module
// =============================================================================
// Contains: KasaLanTransport (single request/response exchange + cache policy)
// =============================================================================

#include "KasaLanInternal.h"

using namespace KasaLanInternal;

KasaLanTransport::KasaLanTransport(const KasaLanConfig &config)
    : _config(config),
      _cacheEnabled(config.cacheEnabled),
      _cache(config.cacheTtlMs) {}

KasaErr KasaLanTransport::execute(const char *ns, const char *command, JsonDocument &out) {
  return execute(ns, command, JsonVariantConst(), CachePolicy::BYPASS, out);
}

KasaErr KasaLanTransport::execute(const char *ns, const char *command, JsonVariantConst argument,
                                  CachePolicy policy, JsonDocument &out) {
  if (ns == nullptr || command == nullptr || ns[0] == '\0' || command[0] == '\0') {
    return KasaErr::INVALID_PARAMETER;
  }

  KasaRequestKey key(ns, command);

  switch (policy) {
    case CachePolicy::READ_THROUGH:
      if (_cacheEnabled) {
        uint32_t hitsBefore = _cache.hits();
        KasaErr err = _cache.getOrInsertWith(
            key,
            [this, argument](const KasaRequestKey &k, JsonDocument &value) {
              return fetch(k, argument, value);
            },
            out);
        if (_cache.hits() != hitsBefore) {
          KASA_LOGHOT_F("(%s) cache hit %s.%s", _config.host, ns, command);
        } else {
          KASA_LOGHOT_F("(%s) cache miss %s.%s", _config.host, ns, command);
        }
        return err;
      }
      break;
    case CachePolicy::INVALIDATE_NAMESPACE:
      invalidate(ns);
      break;
    case CachePolicy::INVALIDATE_ALL:
      invalidateAll();
      break;
    case CachePolicy::BYPASS:
      break;
  }

  return fetch(key, argument, out);
}

KasaErr KasaLanTransport::fetch(const KasaRequestKey &key, JsonVariantConst argument, JsonDocument &out) {
  const char *ns = key.ns.c_str();
  const char *command = key.command.c_str();
  uint32_t start = KasaLan_millis();

  std::vector<uint8_t> request;
  KasaErr err = serializeRequest(ns, command, argument, request);
  if (err != KasaErr::OK) {
    KASA_LOGE_F("(%s) cannot serialize %s.%s", _config.host, ns, command);
    emitErrorCallback(_config.host, KasaOp::Execute, err, KasaLan_millis() - start);
    return err;
  }
  cipherEncrypt(request.data(), request.size(), request.data());

  std::vector<uint8_t> reply;
  err = sendBytes(request.data(), request.size(), reply);
  if (err != KasaErr::OK) {
    return err;
  }

  JsonDocument doc;
  DeserializationError jsonErr = deserializeJson(doc, reinterpret_cast<const char *>(reply.data()), reply.size());
  if (jsonErr) {
    KASA_LOGW_F("(%s) %s.%s reply is not JSON: %s", _config.host, ns, command, jsonErr.c_str());
    emitErrorCallback(_config.host, KasaOp::Execute, KasaErr::SERIALIZATION, KasaLan_millis() - start);
    return KasaErr::SERIALIZATION;
  }

  err = extractResult(doc, ns, command, out);
  if (err != KasaErr::OK) {
    emitErrorCallback(_config.host, KasaOp::Execute, err, KasaLan_millis() - start);
  }
  return err;
}

KasaErr KasaLanTransport::sendBytes(const uint8_t *request, size_t len, std::vector<uint8_t> &reply) {
  reply.clear();
  uint32_t start = KasaLan_millis();

  sockaddr_in target;
  if (!resolveIpv4(_config.host, _config.port, target) || _config.bufferSize == 0) {
    KASA_LOGE_F("invalid transport target \"%s\":%u (buffer=%u)", _config.host,
                static_cast<unsigned>(_config.port), static_cast<unsigned>(_config.bufferSize));
    emitErrorCallback(_config.host, KasaOp::SendBytes, KasaErr::INVALID_PARAMETER, 0);
    return KasaErr::INVALID_PARAMETER;
  }

  UdpSocket socket;
  KasaErr err = socket.open(_config.readTimeoutMs, _config.writeTimeoutMs, _config.broadcast);
  if (err == KasaErr::OK) {
    err = socket.sendTo(target, request, len);
  }

  std::vector<uint8_t> buffer;
  size_t received = 0;
  if (err == KasaErr::OK) {
    buffer.resize(_config.bufferSize);
    sockaddr_in from;
    err = socket.receiveFrom(buffer.data(), buffer.size(), received, from);
  }

  if (err != KasaErr::OK) {
    uint32_t elapsed = KasaLan_millis() - start;
    KASA_LOGW_F("(%s) exchange failed: %s after %lu ms", _config.host, KasaLan_errToStr(err),
                static_cast<unsigned long>(elapsed));
    emitErrorCallback(_config.host, KasaOp::SendBytes, err, elapsed);
    return err;
  }

  reply.assign(buffer.begin(), buffer.begin() + received);
  cipherDecrypt(reply.data(), reply.size(), reply.data());
  return KasaErr::OK;
}

void KasaLanTransport::invalidate(const char *ns) {
  if (!_cacheEnabled || ns == nullptr) return;
  std::string target(ns);
  _cache.retain([&target](const KasaRequestKey &key, const JsonDocument &) {
    return key.ns != target;
  });
}

void KasaLanTransport::invalidateAll() {
  if (!_cacheEnabled) return;
  _cache.clear();
}
