#pragma once

#include "presence.hpp"

#include <memory>
#include <vector>

#include <prometheus/collectable.h>

namespace presence {

/**
 * @brief The PresenceExposer class
 * Prometheus collectable for advertisement counts, last seen signal strength
 * per device and the state of the mapping table.
 */
class PresenceExposer: public prometheus::Collectable {
public:
    PresenceExposer();
    ~PresenceExposer();

    /**
     * @brief update Counts the record and sets its device signal strength
     * This is done in thread-safe manner
     */
    void update(PresenceRecord const& r);

    void set_mapping_entries(size_t n);
    void mappings_reloaded(size_t n);

    std::vector<prometheus::MetricFamily> Collect() const override;

private:
    class Impl;
    std::unique_ptr<Impl> impl;
};

}  // namespace presence
