// ============================================================
// test_device_selector.cpp -- Identifier resolution
// ============================================================

#include "test_support.hpp"
#include "../client/device_selector.hpp"
#include "../common/hash.hpp"

namespace {

Device make(const std::string& serial, DeviceState state = DeviceState::READY) {
    Device d;
    d.serial      = serial;
    d.state       = state;
    d.state_word  = state == DeviceState::READY ? "device" : to_string(state);
    d.fingerprint = hash::fingerprint(serial);
    d.address     = classify_address(serial);
    return d;
}

DeviceErrc select_error(const std::vector<Device>& devs, const std::string& id,
                        const AliasResolver* aliases = nullptr,
                        std::vector<std::string>* candidates = nullptr) {
    try {
        DeviceSelector::select_from(devs, id, aliases);
    } catch (const DeviceError& e) {
        if (candidates) *candidates = e.candidates();
        return e.kind();
    }
    ADD_FAILURE() << "'" << id << "' resolved unexpectedly";
    return DeviceErrc::NOT_FOUND;
}

} // namespace

TEST(DeviceSelector, AmbiguousPrefixListsEveryCandidate) {
    std::vector<Device> devs{make("abc123"), make("abc999")};
    std::vector<std::string> candidates;
    EXPECT_EQ(select_error(devs, "abc", nullptr, &candidates), DeviceErrc::AMBIGUOUS);
    EXPECT_EQ(candidates, (std::vector<std::string>{"abc123", "abc999"}));
}

TEST(DeviceSelector, UniqueSubstringSelects) {
    std::vector<Device> devs{make("abc123"), make("abc999")};
    EXPECT_EQ(DeviceSelector::select_from(devs, "abc1", nullptr).serial, "abc123");
    EXPECT_EQ(DeviceSelector::select_from(devs, "C99", nullptr).serial, "abc999");
}

TEST(DeviceSelector, EmptyIdentifier) {
    EXPECT_EQ(DeviceSelector::select_from({make("solo")}, "", nullptr).serial, "solo");
    EXPECT_EQ(select_error({}, ""), DeviceErrc::NO_DEVICES);
    EXPECT_EQ(select_error({make("a1"), make("b2")}, ""), DeviceErrc::AMBIGUOUS);
}

TEST(DeviceSelector, ExactMatchBeatsSubstring) {
    std::vector<Device> devs{make("emulator-5554"), make("emulator-55541")};
    EXPECT_EQ(DeviceSelector::select_from(devs, "emulator-5554", nullptr).serial, "emulator-5554");
}

TEST(DeviceSelector, FingerprintSelects) {
    std::vector<Device> devs{make("abc123"), make("abc999")};
    std::string fp = hash::fingerprint("abc999");
    EXPECT_EQ(DeviceSelector::select_from(devs, fp, nullptr).serial, "abc999");
}

TEST(DeviceSelector, AliasResolution) {
    std::vector<Device> devs{make("R58M123"), make("emulator-5554")};
    MapAliasResolver aliases;
    aliases.set_alias("phone", "R58M123");
    aliases.set_alias("emu", hash::fingerprint("emulator-5554"));
    aliases.set_alias("old", "gone-device");

    EXPECT_EQ(DeviceSelector::select_from(devs, "phone", &aliases).serial, "R58M123");
    EXPECT_EQ(DeviceSelector::select_from(devs, "emu", &aliases).serial, "emulator-5554");
    EXPECT_EQ(select_error(devs, "old", &aliases), DeviceErrc::NOT_FOUND);
}

TEST(DeviceSelector, NoMatch) {
    EXPECT_EQ(select_error({make("abc123")}, "xyz"), DeviceErrc::NOT_FOUND);
}

TEST(DeviceSelector, RequireUsable) {
    EXPECT_NO_THROW(DeviceSelector::require_usable(make("a")));
    try {
        DeviceSelector::require_usable(make("b", DeviceState::UNAUTHORIZED));
        FAIL() << "expected DeviceError";
    } catch (const DeviceError& e) {
        EXPECT_EQ(e.kind(), DeviceErrc::UNAUTHORIZED);
    }
    try {
        DeviceSelector::require_usable(make("c", DeviceState::OFFLINE));
        FAIL() << "expected DeviceError";
    } catch (const DeviceError& e) {
        EXPECT_EQ(e.kind(), DeviceErrc::OFFLINE);
    }
}

class SelectorTest : public MockServerTest {};

TEST_F(SelectorTest, SelectsThroughRegistry) {
    server_.add_device(mock_device("R58M123"));
    DeviceRegistry registry(cfg_);
    DeviceSelector selector(registry);
    EXPECT_EQ(selector.select("r58").serial, "R58M123");
    EXPECT_EQ(selector.select("emu").model, "Pixel_7");
}
