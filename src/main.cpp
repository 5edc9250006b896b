#include <ble/receiver.hpp>
#include <logging/logging.hpp>
#include <presence/mapping_store.hpp>
#include <presence/presence.hpp>
#include <presence/presence_prometheus_exposer.hpp>

#include <prometheus/exposer.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

#include <args.hxx>
#include <spdlog/spdlog.h>

class PresenceScanner {
public:
    PresenceScanner(std::string const& mapping_file, std::string const& interface,
                    std::chrono::seconds reload_interval, uint16_t metrics_port)
        : store(mapping_file), listener(interface) {
        try {
            store.load();
        } catch (presence::io_error const& e) {
            spdlog::warn("Starting with empty mappings: {}", e.what());
        }

        spdlog::info("Initial mappings:");
        auto entries = store.entries();
        if (entries.empty()) spdlog::info("  (none yet)");
        for (auto const& [ident, name] : entries) spdlog::info("  {} -> {}", ident, name);

        if (metrics_port != 0) {
            exposer = std::make_unique<prometheus::Exposer>("[::]:" + std::to_string(metrics_port));
            pexposer = std::make_shared<presence::PresenceExposer>();
            exposer->RegisterCollectable(pexposer);
            spdlog::info("Exposing metrics on port {}", metrics_port);
        }
        loop = std::make_unique<presence::PresenceLoop>(store, std::cout, reload_interval,
                                                        pexposer);
    }
    PresenceScanner(PresenceScanner const&)            = delete;
    PresenceScanner& operator=(PresenceScanner const&) = delete;

    void start() {
        spdlog::info("Starting ble listener");
        loop->run(listener);
    }
    void stop() {
        spdlog::info("Stopping ble listener");
        listener.stop();
    }

private:
    presence::MappingStore store;
    ble::BleListener listener;
    std::unique_ptr<prometheus::Exposer> exposer;
    std::shared_ptr<presence::PresenceExposer> pexposer;
    std::unique_ptr<presence::PresenceLoop> loop;
};

namespace {
std::atomic_flag stop_all           = ATOMIC_FLAG_INIT;
std::atomic_bool stopped_with_error = false;
}  // namespace

extern "C" void stop_handler(int) {
    //
    stop_all.clear();
}

int main(int argc, char** argv) {
    args::ArgumentParser p("Bluetooth Low Energy presence scanner",
                           "Prints every advertisement, named after the mapping file when the "
                           "address is known. The file is reloaded when it changes.");
    args::HelpFlag help(p, "help", "Display this help menu", {'h', "help"});
    args::CompletionFlag complete(p, {"complete"});
    args::ValueFlag<std::string> file(p, "file",
                                      "Mapping file (default device_mappings.txt)",
                                      {'f', "file"}, presence::MappingStore::default_location);
    args::ValueFlag<std::string> interface(p, "interface", "Bluetooth interface to listen on (hci0)",
                                           {'i', "interface"}, "hci0");
    args::ValueFlag<unsigned> reload(p, "seconds",
                                     "Minimum seconds between mapping file checks (default 5)",
                                     {'r', "reload-interval"}, 5);
    args::ValueFlag<uint16_t> port(p, "port", "Expose prometheus metrics on port, 0 disables (default 0)",
                                   {'p', "metrics-port"}, 0);
    args::Flag systemd(p, "log-to-systemd", "Send log output to systemd-journald", {"systemd"});
    args::Flag debug(p, "debug", "Enable debug logs", {"debug"});
    args::Flag trace(p, "trace", "Enable trace logs", {"trace"});

    try {
        p.ParseCLI(argc, argv);
    } catch (args::Help const&) {
        std::cout << p;
        return EXIT_SUCCESS;
    } catch (args::Completion const& e) {
        std::cout << e.what();
        return EXIT_SUCCESS;
    } catch (args::Error const& e) {
        std::cerr << e.what() << "\n" << p;
        return EXIT_FAILURE;
    }

    try {
        logging::configure("ble-presence", systemd, debug, trace);

        PresenceScanner scanner(file.Get(), interface.Get(), std::chrono::seconds(reload.Get()),
                                port.Get());
        stop_all.test_and_set();

        std::thread runner([&scanner]() {
            try {
                scanner.start();
            } catch (std::exception const& e) {
                stopped_with_error = true;
                spdlog::error("Runner thread exited with error: {}", e.what());
            }
            // Wake the stopper if the listener ended by itself
            stop_all.clear();
        });

        std::thread stopper([&scanner]() {
            while (stop_all.test_and_set()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(500));
            }
            spdlog::info("Stopping...");
            scanner.stop();
        });

        std::signal(SIGTERM, stop_handler);
        std::signal(SIGINT, stop_handler);

        stopper.join();
        runner.join();
    } catch (std::exception const& e) {
        spdlog::error("Uncaught exception: {}", e.what());
        stopped_with_error = true;
    }
    return stopped_with_error ? EXIT_FAILURE : EXIT_SUCCESS;
}
