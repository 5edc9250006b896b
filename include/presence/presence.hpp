#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include <ble/receiver.hpp>
#include <presence/mapping_store.hpp>

namespace presence {

class PresenceExposer;

enum class classification { known, unknown };

inline constexpr char const* unnamed_placeholder = "N/A";

struct PresenceRecord {
    classification kind = classification::unknown;
    std::string name;  // Mapped name if known, else advertised name or placeholder
    std::string advertised_name;
    std::string mac;
    int16_t signal_strength = 0;
};

char const* to_string(classification c);

/**
 * @brief classify Resolves a packet against the mappings
 * The address is tried first, then the advertised device name.
 */
PresenceRecord classify(MappingStore const& store, ble::BlePacket const& p);

std::ostream& operator<<(std::ostream& os, PresenceRecord const& r);

/**
 * @brief The PresenceLoop class
 * Prints one presence line per advertisement. The mapping file is
 * re-checked before handling an event, at most once per reload interval.
 */
class PresenceLoop {
public:
    using clock = std::chrono::steady_clock;

    PresenceLoop(MappingStore& store, std::ostream& out,
                 clock::duration reload_interval            = std::chrono::seconds(5),
                 std::shared_ptr<PresenceExposer> exposer = nullptr);
    PresenceLoop(PresenceLoop const&)            = delete;
    PresenceLoop& operator=(PresenceLoop const&) = delete;

    PresenceRecord on_advertisement(ble::BlePacket const& p);

    /**
     * @brief run Consumes source until it is stopped
     * @throws ble::scan_error when the source fails
     */
    void run(ble::AdvertisementSource& source);

private:
    MappingStore& store;
    std::ostream& out;
    const clock::duration reload_interval;
    std::shared_ptr<PresenceExposer> exposer;
    std::optional<clock::time_point> last_check;

    void check_reload();
};

}  // namespace presence
