#include <presence/presence_prometheus_exposer.hpp>

#include <map>
#include <mutex>
#include <string>
#include <utility>

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/registry.h>

using namespace prometheus;

namespace presence {

class PresenceExposer::Impl {
public:
    Impl()
        : registry(std::make_shared<Registry>()),
          advertisements(BuildCounter()
                             .Name("presence_advertisements_total")
                             .Help("Received advertisements by classification")
                             .Register(*registry)),
          rssi(BuildGauge()
                   .Name("presence_rssi_dbm")
                   .Help("Last received signal strength per device")
                   .Register(*registry)),
          entries(BuildGauge()
                      .Name("presence_mapping_entries")
                      .Help("Number of entries in the device mapping table")
                      .Register(*registry)
                      .Add({})),
          reloads(BuildCounter()
                      .Name("presence_mapping_reloads_total")
                      .Help("Number of times the mapping file was reloaded")
                      .Register(*registry)
                      .Add({})) {}

    void update(PresenceRecord const& r) {
        std::lock_guard grd(mtx);
        advertisements.Add({ { "classification", to_string(r.kind) } }).Increment();

        // One series per device, a renamed device drops its old series
        auto p = rssi_series.find(r.mac);
        if (p != rssi_series.end() && p->second.first != r.name) {
            rssi.Remove(p->second.second);
            rssi_series.erase(p);
            p = rssi_series.end();
        }
        if (p == rssi_series.end()) {
            auto& g = rssi.Add({ { "mac", r.mac }, { "name", r.name } });
            p       = rssi_series.emplace(r.mac, std::make_pair(r.name, &g)).first;
        }
        p->second.second->Set(r.signal_strength);
    }

    void set_entries(size_t n) { entries.Set(static_cast<double>(n)); }

    void reloaded(size_t n) {
        reloads.Increment();
        set_entries(n);
    }

    std::vector<MetricFamily> collect() const { return registry->Collect(); }

private:
    const std::shared_ptr<Registry> registry;
    Family<Counter>& advertisements;
    Family<Gauge>& rssi;
    Gauge& entries;
    Counter& reloads;
    // mac -> (name label, gauge)
    std::map<std::string, std::pair<std::string, Gauge*>> rssi_series;
    std::mutex mtx;
};

PresenceExposer::PresenceExposer(): impl(std::make_unique<Impl>()) {}

PresenceExposer::~PresenceExposer() = default;

void PresenceExposer::update(PresenceRecord const& r) { impl->update(r); }

void PresenceExposer::set_mapping_entries(size_t n) { impl->set_entries(n); }

void PresenceExposer::mappings_reloaded(size_t n) { impl->reloaded(n); }

std::vector<MetricFamily> PresenceExposer::Collect() const { return impl->collect(); }

}  // namespace presence
