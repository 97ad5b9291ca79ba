#include "fake_device.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

const char *kLampReply = "{\"system\":{\"get_sysinfo\":{\"alias\":\"Lamp\",\"type\":\"IOT.SMARTPLUGSWITCH\"}}}";

std::vector<FakeReply> reply(const std::string &body) {
  return std::vector<FakeReply>{FakeReply{body, ""}};
}

std::vector<KasaErrorInfo> g_reported;
void recordError(const KasaErrorInfo &info) { g_reported.push_back(info); }

class TransportTest : public ::testing::Test {
protected:
  void SetUp() override {
    g_reported.clear();
    KasaLan_setErrorCallback(recordError);
  }
  void TearDown() override { KasaLan_setErrorCallback(nullptr); }
};

}  // namespace

TEST_F(TransportTest, ExecuteReturnsCommandResult) {
  FakeDevice device;
  device.serve(1, [](const std::string &) {
    return reply("{\"system\":{\"get_sysinfo\":{\"alias\":\"Lamp\"}}}");
  });

  KasaLanTransport transport(loopbackConfig(device.port()));
  JsonDocument out;
  ASSERT_EQ(transport.execute("system", "get_sysinfo", out), KasaErr::OK);
  device.join();

  ASSERT_EQ(device.requests().size(), 1u);
  EXPECT_EQ(device.requests()[0], "{\"system\":{\"get_sysinfo\":{}}}");
  EXPECT_STREQ(out["alias"].as<const char *>(), "Lamp");
  EXPECT_EQ(out.as<JsonObjectConst>().size(), 1u);
}

TEST_F(TransportTest, ArgumentIsSerializedUnderCommand) {
  FakeDevice device;
  device.serve(1, [](const std::string &) {
    return reply("{\"system\":{\"set_relay_state\":{\"err_code\":0}}}");
  });

  JsonDocument arg;
  arg["state"] = 1;
  KasaLanTransport transport(loopbackConfig(device.port()));
  JsonDocument out;
  ASSERT_EQ(transport.execute("system", "set_relay_state", arg.as<JsonVariantConst>(),
                              CachePolicy::BYPASS, out),
            KasaErr::OK);
  device.join();

  ASSERT_EQ(device.requests().size(), 1u);
  EXPECT_EQ(device.requests()[0], "{\"system\":{\"set_relay_state\":{\"state\":1}}}");
  EXPECT_EQ(out["err_code"].as<int>(), 0);
}

TEST_F(TransportTest, TimeoutWhenDeviceStaysSilent) {
  FakeDevice device;
  device.serve(1, [](const std::string &) { return std::vector<FakeReply>(); });

  KasaLanTransport transport(loopbackConfig(device.port(), 200));
  JsonDocument out;
  EXPECT_EQ(transport.execute("system", "get_sysinfo", out), KasaErr::TIMEOUT);
  device.join();

  ASSERT_FALSE(g_reported.empty());
  EXPECT_EQ(g_reported.back().error, KasaErr::TIMEOUT);
  EXPECT_EQ(g_reported.back().operation, KasaOp::SendBytes);
  EXPECT_STREQ(g_reported.back().ip, "127.0.0.1");
}

TEST_F(TransportTest, GarbageReplyIsSerializationError) {
  FakeDevice device;
  device.serve(1, [](const std::string &) { return reply("definitely not json"); });

  KasaLanTransport transport(loopbackConfig(device.port()));
  JsonDocument out;
  EXPECT_EQ(transport.execute("system", "get_sysinfo", out), KasaErr::SERIALIZATION);
  device.join();
  ASSERT_FALSE(g_reported.empty());
  EXPECT_EQ(g_reported.back().error, KasaErr::SERIALIZATION);
  EXPECT_EQ(g_reported.back().operation, KasaOp::Execute);
}

TEST_F(TransportTest, MissingNamespaceOrCommandIsSerializationError) {
  FakeDevice device;
  device.serve(2, [](const std::string &request) {
    if (request.find("get_sysinfo") != std::string::npos) {
      return reply("{\"emeter\":{\"get_realtime\":{}}}");
    }
    return reply("{\"system\":{\"get_sysinfo\":{}}}");
  });

  KasaLanTransport transport(loopbackConfig(device.port()));
  JsonDocument out;
  EXPECT_EQ(transport.execute("system", "get_sysinfo", out), KasaErr::SERIALIZATION);
  EXPECT_EQ(transport.execute("system", "get_time", out), KasaErr::SERIALIZATION);
  device.join();
}

TEST_F(TransportTest, InvalidHostIsRejectedBeforeSending) {
  KasaLanConfig config = KasaLan_configForHost("not-an-ip");
  KasaLanTransport transport(config);
  JsonDocument out;
  EXPECT_EQ(transport.execute("system", "get_sysinfo", out), KasaErr::INVALID_PARAMETER);
  EXPECT_EQ(transport.execute("", "get_sysinfo", out), KasaErr::INVALID_PARAMETER);
}

TEST_F(TransportTest, SendBytesReturnsDecipheredReply) {
  FakeDevice device;
  device.serve(1, [](const std::string &request) { return reply("echo:" + request); });

  KasaLanTransport transport(loopbackConfig(device.port()));
  std::string plain = "ping";
  std::vector<uint8_t> wire = KasaLan_encrypt(reinterpret_cast<const uint8_t *>(plain.data()), plain.size());
  std::vector<uint8_t> answer;
  ASSERT_EQ(transport.sendBytes(wire.data(), wire.size(), answer), KasaErr::OK);
  device.join();
  EXPECT_EQ(std::string(answer.begin(), answer.end()), "echo:ping");
}

TEST_F(TransportTest, BufferSizeBoundsTheReply) {
  FakeDevice device;
  device.serve(1, [](const std::string &) { return reply("0123456789"); });

  KasaLanConfig config = loopbackConfig(device.port());
  config.bufferSize = 4;
  KasaLanTransport transport(config);
  std::vector<uint8_t> wire = KasaLan_encrypt(std::vector<uint8_t>{'x'});
  std::vector<uint8_t> answer;
  ASSERT_EQ(transport.sendBytes(wire.data(), wire.size(), answer), KasaErr::OK);
  device.join();
  EXPECT_EQ(std::string(answer.begin(), answer.end()), "0123");
}

// =========================
// Cache policies
// =========================

TEST_F(TransportTest, ReadThroughServesSecondCallFromCache) {
  FakeDevice device;
  device.serve(2, [](const std::string &) { return reply(kLampReply); }, 600);

  KasaLanConfig config = loopbackConfig(device.port());
  config.cacheEnabled = true;
  config.cacheTtlMs = 60000;
  KasaLanTransport transport(config);

  JsonDocument first;
  JsonDocument second;
  ASSERT_EQ(transport.execute("system", "get_sysinfo", JsonVariantConst(), CachePolicy::READ_THROUGH, first),
            KasaErr::OK);
  ASSERT_EQ(transport.execute("system", "get_sysinfo", JsonVariantConst(), CachePolicy::READ_THROUGH, second),
            KasaErr::OK);
  device.join();

  EXPECT_EQ(device.requests().size(), 1u);
  EXPECT_STREQ(second["alias"].as<const char *>(), "Lamp");
  ASSERT_NE(transport.cache(), nullptr);
  EXPECT_EQ(transport.cache()->hits(), 1u);
  EXPECT_EQ(transport.cache()->misses(), 1u);
}

TEST_F(TransportTest, ReadThroughIgnoresArgumentInKey) {
  FakeDevice device;
  device.serve(2, [](const std::string &request) {
    if (request.find("10") != std::string::npos) {
      return reply("{\"lightingservice\":{\"transition_light_state\":{\"brightness\":10}}}");
    }
    return reply("{\"lightingservice\":{\"transition_light_state\":{\"brightness\":90}}}");
  }, 600);

  KasaLanConfig config = loopbackConfig(device.port());
  config.cacheEnabled = true;
  config.cacheTtlMs = 60000;
  KasaLanTransport transport(config);

  JsonDocument dim10;
  dim10["brightness"] = 10;
  JsonDocument dim90;
  dim90["brightness"] = 90;

  JsonDocument out;
  ASSERT_EQ(transport.execute("lightingservice", "transition_light_state", dim10.as<JsonVariantConst>(),
                              CachePolicy::READ_THROUGH, out),
            KasaErr::OK);
  ASSERT_EQ(transport.execute("lightingservice", "transition_light_state", dim90.as<JsonVariantConst>(),
                              CachePolicy::READ_THROUGH, out),
            KasaErr::OK);
  device.join();

  // Stale: the second request never reached the device.
  EXPECT_EQ(device.requests().size(), 1u);
  EXPECT_EQ(out["brightness"].as<int>(), 10);
}

TEST_F(TransportTest, FailedFetchIsNotCached) {
  FakeDevice device;
  device.serve(2, [](const std::string &) { return reply("garbage"); }, 600);

  KasaLanConfig config = loopbackConfig(device.port());
  config.cacheEnabled = true;
  config.cacheTtlMs = 60000;
  KasaLanTransport transport(config);

  JsonDocument out;
  EXPECT_EQ(transport.execute("system", "get_sysinfo", JsonVariantConst(), CachePolicy::READ_THROUGH, out),
            KasaErr::SERIALIZATION);
  EXPECT_EQ(transport.execute("system", "get_sysinfo", JsonVariantConst(), CachePolicy::READ_THROUGH, out),
            KasaErr::SERIALIZATION);
  device.join();

  EXPECT_EQ(device.requests().size(), 2u);
  EXPECT_EQ(transport.cache()->len(), 0u);
}

TEST_F(TransportTest, InvalidateNamespaceBeforeWrite) {
  FakeDevice device;
  device.serve(3, [](const std::string &request) {
    if (request.find("get_realtime") != std::string::npos) {
      return reply("{\"emeter\":{\"get_realtime\":{\"power\":5}}}");
    }
    if (request.find("set_dev_alias") != std::string::npos) {
      return reply("{\"system\":{\"set_dev_alias\":{\"err_code\":0}}}");
    }
    return reply(kLampReply);
  });

  KasaLanConfig config = loopbackConfig(device.port());
  config.cacheEnabled = true;
  config.cacheTtlMs = 60000;
  KasaLanTransport transport(config);

  JsonDocument out;
  ASSERT_EQ(transport.execute("system", "get_sysinfo", JsonVariantConst(), CachePolicy::READ_THROUGH, out),
            KasaErr::OK);
  ASSERT_EQ(transport.execute("emeter", "get_realtime", JsonVariantConst(), CachePolicy::READ_THROUGH, out),
            KasaErr::OK);
  ASSERT_EQ(transport.cache()->len(), 2u);

  JsonDocument alias;
  alias["alias"] = "Desk";
  ASSERT_EQ(transport.execute("system", "set_dev_alias", alias.as<JsonVariantConst>(),
                              CachePolicy::INVALIDATE_NAMESPACE, out),
            KasaErr::OK);
  device.join();

  EXPECT_EQ(device.requests().size(), 3u);
  EXPECT_EQ(transport.cache()->len(), 1u);
  JsonDocument cached;
  EXPECT_TRUE(transport.cache()->get(KasaRequestKey("emeter", "get_realtime"), cached));
  EXPECT_FALSE(transport.cache()->get(KasaRequestKey("system", "get_sysinfo"), cached));
}

TEST_F(TransportTest, ReadThroughWithoutCacheAlwaysSends) {
  FakeDevice device;
  device.serve(2, [](const std::string &) { return reply(kLampReply); });

  KasaLanTransport transport(loopbackConfig(device.port()));
  EXPECT_EQ(transport.cache(), nullptr);

  JsonDocument out;
  ASSERT_EQ(transport.execute("system", "get_sysinfo", JsonVariantConst(), CachePolicy::READ_THROUGH, out),
            KasaErr::OK);
  ASSERT_EQ(transport.execute("system", "get_sysinfo", JsonVariantConst(), CachePolicy::READ_THROUGH, out),
            KasaErr::OK);
  device.join();
  EXPECT_EQ(device.requests().size(), 2u);
}

// =========================
// Device handle
// =========================

TEST_F(TransportTest, DeviceAliasAndRebootClearsCache) {
  FakeDevice device;
  device.serve(2, [](const std::string &request) {
    if (request.find("reboot") != std::string::npos) {
      return reply("{\"system\":{\"reboot\":{\"err_code\":0}}}");
    }
    return reply(kLampReply);
  });

  KasaLanConfig config = loopbackConfig(device.port());
  config.cacheEnabled = true;
  config.cacheTtlMs = 60000;
  KasaLanDevice plug(config);

  char alias[32];
  ASSERT_EQ(plug.alias(alias, sizeof(alias)), KasaErr::OK);
  EXPECT_STREQ(alias, "Lamp");
  ASSERT_EQ(plug.alias(alias, sizeof(alias)), KasaErr::OK);  // cached
  EXPECT_EQ(plug.transport().cache()->len(), 1u);

  ASSERT_EQ(plug.reboot(5), KasaErr::OK);
  device.join();

  ASSERT_EQ(device.requests().size(), 2u);
  EXPECT_EQ(device.requests()[1], "{\"system\":{\"reboot\":{\"delay\":5}}}");
  EXPECT_EQ(plug.transport().cache()->len(), 0u);
  EXPECT_STREQ(plug.host(), "127.0.0.1");
}

TEST_F(TransportTest, DeviceAliasMissingIsSerializationError) {
  FakeDevice device;
  device.serve(1, [](const std::string &) {
    return reply("{\"system\":{\"get_sysinfo\":{\"model\":\"HS100(EU)\"}}}");
  });

  KasaLanDevice plug(loopbackConfig(device.port()));
  char alias[32];
  EXPECT_EQ(plug.alias(alias, sizeof(alias)), KasaErr::SERIALIZATION);
  EXPECT_STREQ(alias, "");
  device.join();
}

TEST_F(TransportTest, FactoryResetSendsDelayedReset) {
  FakeDevice device;
  device.serve(1, [](const std::string &) {
    return reply("{\"system\":{\"reset\":{\"err_code\":0}}}");
  });

  KasaLanDevice plug(loopbackConfig(device.port()));
  ASSERT_EQ(plug.factoryReset(), KasaErr::OK);
  device.join();

  ASSERT_EQ(device.requests().size(), 1u);
  EXPECT_EQ(device.requests()[0], "{\"system\":{\"reset\":{\"delay\":1}}}");
}

TEST(Config, DefaultsMatchProtocol) {
  KasaLanConfig config = KasaLan_configForHost("192.168.1.107");
  EXPECT_STREQ(config.host, "192.168.1.107");
  EXPECT_EQ(config.port, 9999);
  EXPECT_EQ(config.bufferSize, 4096u);
  EXPECT_EQ(config.readTimeoutMs, 3000u);
  EXPECT_EQ(config.writeTimeoutMs, 3000u);
  EXPECT_FALSE(config.broadcast);
  EXPECT_FALSE(config.cacheEnabled);

  KasaLanConfig discovery = KasaLan_discoveryConfig();
  EXPECT_STREQ(discovery.host, "255.255.255.255");
  EXPECT_TRUE(discovery.broadcast);
  EXPECT_EQ(discovery.resendCount, 3);
}

TEST(Errors, NamesAreStable) {
  EXPECT_STREQ(KasaLan_errToStr(KasaErr::TIMEOUT), "TIMEOUT");
  EXPECT_STREQ(KasaLan_errToStr(KasaErr::SERIALIZATION), "SERIALIZATION");
  EXPECT_STREQ(KasaLan_errToStr(KasaErr::UNSUPPORTED_OPERATION), "UNSUPPORTED_OPERATION");
  EXPECT_STREQ(KasaLan_errToStr(KasaErr::INVALID_PARAMETER), "INVALID_PARAMETER");
}
