#include <presence/editor.hpp>

#include <presence/mapping_store.hpp>

#include <cstdlib>
#include <stdexcept>

int presence::run_editor(std::string const& file, std::string const& address,
                         std::string const& name, std::ostream& err) {
    try {
        MappingStore store(file);
        store.load();
        store.upsert(address, name);
    } catch (std::invalid_argument const& e) {
        err << e.what() << std::endl;
        return EXIT_FAILURE;
    } catch (io_error const& e) {
        err << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
