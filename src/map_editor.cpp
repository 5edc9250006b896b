#include <logging/logging.hpp>
#include <presence/editor.hpp>
#include <presence/mapping_store.hpp>

#include <iostream>

#include <args.hxx>
#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
    args::ArgumentParser p("Add or update a BLE device mapping");
    args::HelpFlag help(p, "help", "Display this help menu", {'h', "help"});
    args::ValueFlag<std::string> file(p, "file",
                                      "Mapping file (default device_mappings.txt)",
                                      {'f', "file"}, presence::MappingStore::default_location);
    args::Flag debug(p, "debug", "Enable debug logs", {"debug"});
    args::Positional<std::string> address(p, "address", "BLE device address (e.g. AA:BB:CC:DD:EE:FF)",
                                          args::Options::Required);
    args::Positional<std::string> name(p, "name", "Friendly name (e.g. 'Alice')",
                                       args::Options::Required);

    try {
        p.ParseCLI(argc, argv);
    } catch (args::Help const&) {
        std::cout << p;
        return EXIT_SUCCESS;
    } catch (args::Error const& e) {
        std::cerr << e.what() << "\n" << p;
        return EXIT_FAILURE;
    }

    logging::configure("ble-presence-map", false, debug, false);

    return presence::run_editor(file.Get(), address.Get(), name.Get(), std::cerr);
}
