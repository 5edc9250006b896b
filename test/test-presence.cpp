#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <presence/presence.hpp>
#include <presence/presence_prometheus_exposer.hpp>

#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class FakeSource: public ble::AdvertisementSource {
public:
    std::vector<ble::BlePacket> packets;
    bool fail = false;
    bool stopped = false;

    void run(std::function<ble::listener_callback> cb) override {
        for (auto const& p : packets) cb(p);
        if (fail) throw ble::scan_error("Adapter hci0 disappeared");
    }
    void stop() noexcept override { stopped = true; }
};

ble::BlePacket packet(std::string mac, int16_t rssi, std::optional<std::string> name = {}) {
    ble::BlePacket r;
    r.mac             = std::move(mac);
    r.signal_strength = rssi;
    r.device_name     = std::move(name);
    return r;
}

std::string padded(std::string s, size_t width) {
    if (s.size() < width) s.append(width - s.size(), ' ');
    return s;
}

class PresenceTest: public ::testing::Test {
protected:
    fs::path dir;
    fs::path file;

    void SetUp() override {
        auto const* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() /
              ("ble-presence-loop-" + std::to_string(::getpid()) + "-" + info->name());
        fs::remove_all(dir);
        fs::create_directories(dir);
        file = dir / "device_mappings.txt";
        write("# test devices\nAA:BB:CC:DD:EE:FF = Alice\n");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void write(std::string const& s) {
        std::ofstream ofs(file, std::ios::trunc);
        ofs << s;
    }

    void write_later(std::string const& s) {
        auto before = fs::last_write_time(file);
        write(s);
        fs::last_write_time(file, before + 10s);
    }
};

TEST_F(PresenceTest, ClassifiesKnownAddress) {
    presence::MappingStore store(file);
    store.load();

    auto r = presence::classify(store, packet("aa:bb:cc:dd:ee:ff", -58, "Phone"));
    EXPECT_EQ(r.kind, presence::classification::known);
    EXPECT_EQ(r.name, "Alice");
    EXPECT_EQ(r.advertised_name, "Phone");
    EXPECT_EQ(r.signal_strength, -58);
    EXPECT_EQ(r.mac, "aa:bb:cc:dd:ee:ff");
}

TEST_F(PresenceTest, ClassifiesUnknownAddress) {
    presence::MappingStore store(file);
    store.load();

    auto named = presence::classify(store, packet("C1:D2:E3:F4:A5:B6", -70, "Pixel 7"));
    EXPECT_EQ(named.kind, presence::classification::unknown);
    EXPECT_EQ(named.name, "Pixel 7");

    auto unnamed = presence::classify(store, packet("C1:D2:E3:F4:A5:B6", -70));
    EXPECT_EQ(unnamed.kind, presence::classification::unknown);
    EXPECT_EQ(unnamed.name, presence::unnamed_placeholder);

    auto empty = presence::classify(store, packet("C1:D2:E3:F4:A5:B6", -70, ""));
    EXPECT_EQ(empty.name, presence::unnamed_placeholder);
}

TEST_F(PresenceTest, ClassifiesByAdvertisedName) {
    write("iPhone Will = Will\n");
    presence::MappingStore store(file);
    store.load();

    auto r = presence::classify(store, packet("11:22:33:44:55:66", -40, "iPhone Will"));
    EXPECT_EQ(r.kind, presence::classification::known);
    EXPECT_EQ(r.name, "Will");
}

TEST_F(PresenceTest, FormatsLines) {
    presence::MappingStore store(file);
    store.load();

    std::ostringstream known;
    known << presence::classify(store, packet("aa:bb:cc:dd:ee:ff", -58));
    EXPECT_EQ(known.str(), "[KNOWN]   " + padded("Alice", 20) + " | RSSI  -58 | aa:bb:cc:dd:ee:ff");

    std::ostringstream unknown;
    unknown << presence::classify(store, packet("C1:D2:E3:F4:A5:B6", -7));
    EXPECT_EQ(unknown.str(),
              "[UNKNOWN] Name=" + padded("N/A", 15) + " | RSSI   -7 | C1:D2:E3:F4:A5:B6");
}

TEST_F(PresenceTest, LoopPrintsEveryAdvertisement) {
    presence::MappingStore store(file);
    store.load();
    std::ostringstream out;
    presence::PresenceLoop loop(store, out);

    FakeSource source;
    source.packets = { packet("aa:bb:cc:dd:ee:ff", -58), packet("C1:D2:E3:F4:A5:B6", -80, "Tag") };
    loop.run(source);

    std::istringstream lines(out.str());
    std::string line;
    ASSERT_TRUE(std::getline(lines, line));
    EXPECT_EQ(line.rfind("[KNOWN]   Alice", 0), 0u) << line;
    ASSERT_TRUE(std::getline(lines, line));
    EXPECT_EQ(line.rfind("[UNKNOWN] Name=Tag", 0), 0u) << line;
    EXPECT_FALSE(std::getline(lines, line)) << "Unexpected extra line: " << line;
}

TEST_F(PresenceTest, LoopPropagatesScanError) {
    presence::MappingStore store(file);
    store.load();
    std::ostringstream out;
    presence::PresenceLoop loop(store, out);

    FakeSource source;
    source.packets = { packet("aa:bb:cc:dd:ee:ff", -58) };
    source.fail    = true;
    EXPECT_THROW(loop.run(source), ble::scan_error);
    EXPECT_FALSE(out.str().empty()) << "Packets before the failure were not printed";
}

TEST_F(PresenceTest, LoopPicksUpMappingChanges) {
    presence::MappingStore store(file);
    store.load();
    std::ostringstream out;
    presence::PresenceLoop loop(store, out, 0s);

    auto bob = packet("11:22:33:44:55:66", -60, "Phone");
    EXPECT_EQ(loop.on_advertisement(bob).kind, presence::classification::unknown);

    write_later("AA:BB:CC:DD:EE:FF = Alice\n11:22:33:44:55:66 = Bob\n");
    auto r = loop.on_advertisement(bob);
    EXPECT_EQ(r.kind, presence::classification::known);
    EXPECT_EQ(r.name, "Bob");
}

TEST_F(PresenceTest, LoopRespectsReloadInterval) {
    presence::MappingStore store(file);
    store.load();
    std::ostringstream out;
    presence::PresenceLoop loop(store, out, 1h);

    auto bob = packet("11:22:33:44:55:66", -60);
    EXPECT_EQ(loop.on_advertisement(bob).kind, presence::classification::unknown);

    write_later("11:22:33:44:55:66 = Bob\n");
    EXPECT_EQ(loop.on_advertisement(bob).kind, presence::classification::unknown)
        << "Mapping file checked before the reload interval elapsed";
}

namespace {

prometheus::MetricFamily const* find_family(std::vector<prometheus::MetricFamily> const& fs,
                                            std::string const& name) {
    for (auto const& f : fs) {
        if (f.name == name) return &f;
    }
    return nullptr;
}

bool has_label(prometheus::ClientMetric const& m, std::string const& name,
               std::string const& value) {
    for (auto const& l : m.label) {
        if (l.name == name && l.value == value) return true;
    }
    return false;
}

}  // namespace

TEST_F(PresenceTest, ExposerCountsAdvertisements) {
    presence::MappingStore store(file);
    store.load();
    std::ostringstream out;
    auto exposer = std::make_shared<presence::PresenceExposer>();
    presence::PresenceLoop loop(store, out, 0s, exposer);

    loop.on_advertisement(packet("aa:bb:cc:dd:ee:ff", -58));
    loop.on_advertisement(packet("aa:bb:cc:dd:ee:ff", -61));
    loop.on_advertisement(packet("C1:D2:E3:F4:A5:B6", -80));
    write_later("AA:BB:CC:DD:EE:FF = Alice\n11:22:33:44:55:66 = Bob\n");
    loop.on_advertisement(packet("C1:D2:E3:F4:A5:B6", -81));

    auto metrics = exposer->Collect();

    auto const* ads = find_family(metrics, "presence_advertisements_total");
    ASSERT_NE(ads, nullptr);
    double known = 0, unknown = 0;
    for (auto const& m : ads->metric) {
        if (has_label(m, "classification", "known")) known = m.counter.value;
        if (has_label(m, "classification", "unknown")) unknown = m.counter.value;
    }
    EXPECT_DOUBLE_EQ(known, 2);
    EXPECT_DOUBLE_EQ(unknown, 2);

    auto const* rssi = find_family(metrics, "presence_rssi_dbm");
    ASSERT_NE(rssi, nullptr);
    bool found = false;
    for (auto const& m : rssi->metric) {
        if (has_label(m, "mac", "aa:bb:cc:dd:ee:ff") && has_label(m, "name", "Alice")) {
            found = true;
            EXPECT_DOUBLE_EQ(m.gauge.value, -61);
        }
    }
    EXPECT_TRUE(found) << "No rssi gauge for Alice";

    auto const* entries = find_family(metrics, "presence_mapping_entries");
    ASSERT_NE(entries, nullptr);
    ASSERT_EQ(entries->metric.size(), 1u);
    EXPECT_DOUBLE_EQ(entries->metric[0].gauge.value, 2);

    auto const* reloads = find_family(metrics, "presence_mapping_reloads_total");
    ASSERT_NE(reloads, nullptr);
    ASSERT_EQ(reloads->metric.size(), 1u);
    EXPECT_DOUBLE_EQ(reloads->metric[0].counter.value, 1);
}

TEST_F(PresenceTest, ExposerKeepsOneSeriesPerRenamedDevice) {
    presence::MappingStore store(file);
    store.load();
    std::ostringstream out;
    auto exposer = std::make_shared<presence::PresenceExposer>();
    presence::PresenceLoop loop(store, out, 0s, exposer);

    loop.on_advertisement(packet("aa:bb:cc:dd:ee:ff", -58));
    write_later("AA:BB:CC:DD:EE:FF = Carol\n");
    loop.on_advertisement(packet("aa:bb:cc:dd:ee:ff", -63));

    auto metrics = exposer->Collect();
    auto const* rssi = find_family(metrics, "presence_rssi_dbm");
    ASSERT_NE(rssi, nullptr);

    size_t series = 0;
    for (auto const& m : rssi->metric) {
        if (!has_label(m, "mac", "aa:bb:cc:dd:ee:ff")) continue;
        ++series;
        EXPECT_TRUE(has_label(m, "name", "Carol")) << "Stale name label left behind";
        EXPECT_DOUBLE_EQ(m.gauge.value, -63);
    }
    EXPECT_EQ(series, 1u);
}
