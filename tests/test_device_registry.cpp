// ============================================================
// test_device_registry.cpp -- Device list parsing, retry,
//   features, network probe
// ============================================================

#include "test_support.hpp"
#include "../client/device_registry.hpp"
#include "../common/hash.hpp"

TEST(DeviceParsing, LongFormatLine) {
    Device d;
    ASSERT_TRUE(DeviceRegistry::parse_device_line(
        "emulator-5554          device product:sdk_gphone64 model:Pixel_7 "
        "device:emu64 transport_id:3", d));
    EXPECT_EQ(d.serial, "emulator-5554");
    EXPECT_EQ(d.state, DeviceState::READY);
    EXPECT_EQ(d.product, "sdk_gphone64");
    EXPECT_EQ(d.model, "Pixel_7");
    EXPECT_EQ(d.device, "emu64");
    EXPECT_EQ(d.transport_id, "3");
    EXPECT_EQ(d.address, AddressKind::LOCAL);
    EXPECT_EQ(d.fingerprint.size(), (size_t)hash::FINGERPRINT_DIGITS);
}

TEST(DeviceParsing, StatesAndAddressKinds) {
    auto devs = DeviceRegistry::parse_device_list(
        "R58M123\tunauthorized usb:1-1\n"
        "\n"
        "192.168.1.20:5555\toffline\n"
        "weird\tbootloader\n");
    ASSERT_EQ(devs.size(), 3u);
    EXPECT_EQ(devs[0].state, DeviceState::UNAUTHORIZED);
    EXPECT_EQ(devs[0].usb, "1-1");
    EXPECT_EQ(devs[1].state, DeviceState::OFFLINE);
    EXPECT_EQ(devs[1].address, AddressKind::NETWORK);
    EXPECT_EQ(devs[2].state, DeviceState::UNKNOWN);
    EXPECT_EQ(devs[2].state_word, "bootloader");
}

TEST(DeviceParsing, MalformedLinesAreSkipped) {
    Device d;
    EXPECT_FALSE(DeviceRegistry::parse_device_line("lonely", d));
    EXPECT_FALSE(DeviceRegistry::parse_device_line("   ", d));
    EXPECT_TRUE(DeviceRegistry::parse_device_list("").empty());
}

TEST(DeviceParsing, FingerprintIsStable) {
    EXPECT_EQ(hash::fingerprint("emulator-5554"), hash::fingerprint("emulator-5554"));
    EXPECT_NE(hash::fingerprint("emulator-5554"), hash::fingerprint("emulator-5556"));
    EXPECT_EQ(hash::fingerprint("x"), hash::to_hex(hash::xxh3_64("x", 1), 12));
}

TEST(DeviceParsing, FeaturesAndBanner) {
    auto feats = DeviceRegistry::parse_features("shell_v2,cmd, stat_v2,\n");
    EXPECT_EQ(feats, (std::set<std::string>{"shell_v2", "cmd", "stat_v2"}));

    Device d;
    DeviceRegistry::parse_banner(
        std::string("device::ro.product.name=sdk;ro.product.model=Pixel;"
                    "ro.product.device=emu;features=shell_v2,ls_v2") + '\0', d);
    EXPECT_EQ(d.product, "sdk");
    EXPECT_EQ(d.model, "Pixel");
    EXPECT_EQ(d.device, "emu");
    EXPECT_EQ(d.features, (std::set<std::string>{"shell_v2", "ls_v2"}));
}

class RegistryTest : public MockServerTest {};

TEST_F(RegistryTest, ListsDevicesFromServer) {
    server_.add_device(mock_device("192.168.1.7:5555", "offline"));
    DeviceRegistry registry(cfg_);
    auto devs = registry.list_devices();
    ASSERT_EQ(devs.size(), 2u);
    EXPECT_EQ(devs[0].serial, SERIAL);
    EXPECT_EQ(devs[0].model, "Pixel_7");
    EXPECT_EQ(devs[0].transport_id, "1");
    EXPECT_EQ(devs[1].address, AddressKind::NETWORK);
    EXPECT_EQ(devs[1].state, DeviceState::OFFLINE);
}

TEST_F(RegistryTest, EmptyListIsRetriedOnce) {
    server_.set_empty_enumerations(1);
    DeviceRegistry registry(cfg_);
    auto devs = registry.list_devices();
    ASSERT_EQ(devs.size(), 1u);
    EXPECT_EQ(server_.device_list_requests(), 2);
}

TEST_F(RegistryTest, RetryGivesUpAfterPolicyAttempts) {
    server_.set_empty_enumerations(10);
    cfg_.enumeration_retry.attempts = 2;
    DeviceRegistry registry(cfg_);
    EXPECT_TRUE(registry.list_devices().empty());
    EXPECT_EQ(server_.device_list_requests(), 3);
}

TEST_F(RegistryTest, FeaturesOfKnownAndUnknownDevice) {
    DeviceRegistry registry(cfg_);
    auto feats = registry.features(SERIAL);
    EXPECT_TRUE(feats.count(FEATURE_SHELL_V2));
    EXPECT_TRUE(feats.count(FEATURE_SENDRECV_V2_ZSTD));

    try {
        registry.features("nobody");
        FAIL() << "expected DeviceError";
    } catch (const DeviceError& e) {
        EXPECT_EQ(e.kind(), DeviceErrc::NOT_FOUND);
    }
}

TEST(Probe, ReadyDaemonReportsBanner) {
    MockDeviceDaemon daemon("device::ro.product.model=Pixel_8;features=shell_v2,stat_v2");
    daemon.start();

    DeviceRegistry registry(ClientConfig{});
    Device d = registry.probe("127.0.0.1", daemon.port());
    EXPECT_EQ(d.state, DeviceState::READY);
    EXPECT_EQ(d.address, AddressKind::NETWORK);
    EXPECT_EQ(d.serial, "127.0.0.1:" + std::to_string(daemon.port()));
    EXPECT_EQ(d.model, "Pixel_8");
    EXPECT_TRUE(d.features.count("stat_v2"));
    EXPECT_EQ(daemon.last_client_banner().rfind("host::features=", 0), 0u);
    daemon.stop();
}

TEST(Probe, AuthChallengeMeansUnauthorized) {
    MockDeviceDaemon daemon("device::", false);
    daemon.start();

    DeviceRegistry registry(ClientConfig{});
    Device d = registry.probe("127.0.0.1", daemon.port());
    EXPECT_EQ(d.state, DeviceState::UNAUTHORIZED);
    EXPECT_FALSE(d.is_ready());
    daemon.stop();
}
