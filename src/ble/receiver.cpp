#include "receiver_impl.hpp"

#include <spdlog/spdlog.h>

#include <thread>
#include <utility>

using namespace ble;

namespace {
constexpr char const* bluez_service    = "org.bluez";
constexpr char const* device_interface = "org.bluez.Device1";
constexpr char const* adapter_interface = "org.bluez.Adapter1";
constexpr char const* properties_interface = "org.freedesktop.DBus.Properties";
constexpr char const* objmanager_interface = "org.freedesktop.DBus.ObjectManager";

template<class Map> bool has_device_interface(Map const& interfaces) {
    return interfaces.find(device_interface) != interfaces.end();
}
}  // namespace

BleListener::BleListener(std::string const& nm): impl(std::make_unique<Impl>(nm)) {}

BleListener::~BleListener() = default;

void BleListener::run(std::function<listener_callback> cb) { impl->run(std::move(cb)); }
void BleListener::stop() noexcept { impl->stop(); }


BleListener::Impl::Impl(std::string const& nm)
    : adapter_name(nm), adapter_path("/org/bluez/" + nm) {
    try {
        create_connection();
    } catch (sdbus::Error const& e) {
        throw scan_error("Failed to connect to bluez on " + adapter_name + ": " + e.getName() +
                         " - " + e.getMessage());
    }
}

BleListener::Impl::~Impl() {
    stop();
}

void BleListener::Impl::create_connection() {
    connection = sdbus::createConnection();

    manager = sdbus::createProxy(*connection, bluez_service, adapter_path);

    objmanager = sdbus::createProxy(*connection, bluez_service, "/");

    objmanager->uponSignal("InterfacesAdded")
        .onInterface(objmanager_interface)
        .call([this](sdbus::ObjectPath const& obj, interface_map const& m) {
            this->add_cb(obj, m);
        });

    objmanager->uponSignal("InterfacesRemoved")
        .onInterface(objmanager_interface)
        .call([this](sdbus::ObjectPath const& obj, std::vector<std::string> const& interfaces) {
            this->rem_cb(obj, interfaces);
        });

    manager->uponSignal("PropertiesChanged")
        .onInterface(properties_interface)
        .call([this](std::string const& interface,
                     std::map<std::string, sdbus::Variant> const& changed,
                     std::vector<std::string> const& invalid) {
            this->discovery_failed_cb(interface, changed, invalid);
        });

    manager->finishRegistration();
    objmanager->finishRegistration();
}

void BleListener::Impl::run(std::function<listener_callback> cb) {
    if (!cb) { throw std::logic_error("BleListener started with empty callback"); }
    callback_ = std::move(cb);
    exited_with_error = false;

    try {
        start_discovery();
        add_known_devices();
    } catch (sdbus::Error const& e) {
        throw scan_error("Failed to start discovery on " + adapter_name + ": " + e.getName() +
                         " - " + e.getMessage());
    }

    connection->enterEventLoop();
    if (exited_with_error) throw scan_error("BleListener exited with error");
}

void BleListener::Impl::add_known_devices() {
    std::map<sdbus::ObjectPath, interface_map> objects;
    objmanager->callMethod("GetManagedObjects")
        .onInterface(objmanager_interface)
        .storeResultsTo(objects);

    for (auto const& [obj, interfaces] : objects) {
        if (obj.rfind(adapter_path + "/", 0) != 0) continue;
        if (has_device_interface(interfaces)) add_cb(obj, interfaces);
    }
}

void BleListener::Impl::add_cb(sdbus::ObjectPath const& obj, interface_map const& interfaces) {
    if (!has_device_interface(interfaces)) return;

    try {
        {
            std::lock_guard g(listeners_mtx);
            if (listeners.find(obj) != listeners.end()) { return; }
        }

        auto properties = sdbus::createProxy(*connection, bluez_service, obj);

        spdlog::debug("Added {}", std::string(obj));

        properties->uponSignal("PropertiesChanged")
            .onInterface(properties_interface)
            .call([this, obj](std::string const& interface,
                              std::map<std::string, sdbus::Variant> const& changed,
                              std::vector<std::string> const& invalid) {
                this->properties_cb(obj, interface, changed, invalid);
            });

        properties->finishRegistration();

        {
            std::lock_guard g(listeners_mtx);
            listeners.insert({ obj, std::move(properties) });
        }
        emit_packet(obj);
    } catch (sdbus::Error const& e) {
        spdlog::warn("Failed to add device: {} - {}", e.getName(), e.getMessage());
    }
}

void BleListener::Impl::rem_cb(sdbus::ObjectPath const& obj,
                               std::vector<std::string> const& interfaces) {

    bool found = false;
    for (auto& i : interfaces) {
        if (i == device_interface) {
            found = true;
            break;
        }
    }
    if (!found) return;

    spdlog::debug("Removed {}", std::string(obj));
    std::lock_guard g(listeners_mtx);
    auto p = listeners.find(obj);
    if (p != listeners.end()) { listeners.erase(p); }
}

void BleListener::Impl::discovery_failed_cb(std::string const& interface,
                                            std::map<std::string, sdbus::Variant> const& changed,
                                            std::vector<std::string> const& /*invalid*/) {
    spdlog::trace("Adapter properties changed");

    if (interface != adapter_interface) return;
    if (should_discover == false) return;

    auto p = changed.find("Discovering");
    if (p != changed.end()) {
        bool new_state = p->second.get<bool>();
        if (new_state == false) {
            spdlog::info("Restarting discovery");
            if (!retry_discovery()) {
                should_discover   = false;
                exited_with_error = true;
                stop();
            }
        }
    }
}

bool BleListener::Impl::retry_discovery(int times, std::chrono::seconds wait) {
    for (int i = 0; i < times; ++i) {
        std::this_thread::sleep_for(wait);
        try {
            start_discovery();
            return true;
        } catch (sdbus::Error const& e) {
            spdlog::warn("Failed to restart discovery, {} remaining: {} - {}", times - i - 1,
                         e.getName(), e.getMessage());
        }
    }
    return false;
}

void BleListener::Impl::properties_cb(sdbus::ObjectPath const& obj,
                                      std::string const& /*interface*/,
                                      std::map<std::string, sdbus::Variant> const& changed,
                                      std::vector<std::string> const& /*invalid*/) {
    auto end = changed.end();
    if (changed.find("RSSI") != end || changed.find("Name") != end ||
        changed.find("ManufacturerData") != end) {
        try {
            emit_packet(obj);
        } catch (sdbus::Error const& e) {
            spdlog::warn("Failed to read device {}: {} - {}", std::string(obj), e.getName(),
                         e.getMessage());
        }
    }
}

void BleListener::Impl::emit_packet(const sdbus::ObjectPath& obj) {
    sdbus::IProxy* proxy = nullptr;
    {
        std::lock_guard g(listeners_mtx);
        auto p = listeners.find(obj);
        if (p == listeners.end()) return;
        proxy = p->second.get();
    }

    std::map<std::string, sdbus::Variant> properties_;
    proxy->callMethod("GetAll")
        .onInterface(properties_interface)
        .withArguments(device_interface)
        .storeResultsTo(properties_);
    auto const& properties = std::as_const(properties_);

    auto end = properties.end();
    auto rssi = properties.find("RSSI");
    // Cached devices without RSSI are not currently in range
    if (rssi == end) return;

    BlePacket packet;
    packet.signal_strength = rssi->second.get<int16_t>();
    auto mac = properties.find("Address");
    if (mac != end) { packet.mac = mac->second.get<std::string>(); }
    auto name = properties.find("Name");
    if (name != end) { packet.device_name = name->second.get<std::string>(); }

    try {
        callback_(packet);
    } catch (std::exception const& e) {
        spdlog::error("Advertisement handler failed for {}: {}", packet.mac, e.what());
    }
}

void BleListener::Impl::start_discovery() {
    spdlog::info("Starting bluetooth discovery on {}", adapter_name);

    std::map<std::string, sdbus::Variant> dict;
    dict["DuplicateData"] = sdbus::Variant(true);
    manager->callMethod("SetDiscoveryFilter")
        .onInterface(adapter_interface)
        .withArguments(dict)
        .storeResultsTo();

    should_discover = true;
    manager->callMethod("StartDiscovery").onInterface(adapter_interface).storeResultsTo();
}

void BleListener::Impl::stop_discovery() {
    if (should_discover) {
        spdlog::info("Stopping bluetooth discovery");
        should_discover = false;
        manager->callMethod("StopDiscovery").onInterface(adapter_interface).storeResultsTo();
    }
}

void BleListener::Impl::stop() noexcept {
    try {
        stop_discovery();
    } catch (sdbus::Error const& e) {
        spdlog::warn("Failed to stop discovery: {} - {}", e.getName(), e.getMessage());
    }
    connection->leaveEventLoop();
}
