#include <presence/presence.hpp>

#include <presence/presence_prometheus_exposer.hpp>

#include <iomanip>

#include <spdlog/spdlog.h>

namespace presence {

char const* to_string(classification c) {
    switch (c) {
    case classification::known: return "known";
    case classification::unknown: return "unknown";
    }
    return "unknown";
}

PresenceRecord classify(MappingStore const& store, ble::BlePacket const& p) {
    PresenceRecord r;
    r.mac             = p.mac;
    r.signal_strength = p.signal_strength;
    r.advertised_name = p.device_name.value_or("");

    auto mapped = store.lookup(p.mac);
    if (!mapped && !r.advertised_name.empty()) mapped = store.lookup_name(r.advertised_name);

    if (mapped) {
        r.kind = classification::known;
        r.name = std::move(*mapped);
    } else {
        r.kind = classification::unknown;
        r.name = r.advertised_name.empty() ? unnamed_placeholder : r.advertised_name;
    }
    return r;
}

std::ostream& operator<<(std::ostream& os, PresenceRecord const& r) {
    auto fmt = os.flags();
    if (r.kind == classification::known) {
        os << "[KNOWN]   " << std::left << std::setw(20) << r.name;
    } else {
        os << "[UNKNOWN] Name=" << std::left << std::setw(15) << r.name;
    }
    os << " | RSSI " << std::right << std::setw(4) << r.signal_strength << " | " << r.mac;
    os.flags(fmt);
    return os;
}

PresenceLoop::PresenceLoop(MappingStore& s, std::ostream& o, clock::duration interval,
                           std::shared_ptr<PresenceExposer> e)
    : store(s), out(o), reload_interval(interval), exposer(std::move(e)) {
    if (exposer) exposer->set_mapping_entries(store.size());
}

void PresenceLoop::check_reload() {
    auto now = clock::now();
    if (last_check && now - *last_check < reload_interval) return;
    last_check = now;

    if (store.maybe_reload()) {
        spdlog::debug("Reloaded {}", store.path().string());
        if (exposer) exposer->mappings_reloaded(store.size());
    }
}

PresenceRecord PresenceLoop::on_advertisement(ble::BlePacket const& p) {
    check_reload();

    auto record = classify(store, p);
    out << record << std::endl;
    if (exposer) exposer->update(record);
    return record;
}

void PresenceLoop::run(ble::AdvertisementSource& source) {
    spdlog::info("Scanning for BLE devices...");
    source.run([this](ble::BlePacket const& p) { on_advertisement(p); });
}

}  // namespace presence
