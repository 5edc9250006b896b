#include <presence/mapping_store.hpp>

#include <presence/address.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include <unistd.h>

namespace fs = std::filesystem;

namespace presence {

namespace {

std::optional<fs::file_time_type> modification_time(fs::path const& p) {
    std::error_code ec;
    auto t = fs::last_write_time(p, ec);
    if (ec) return std::nullopt;
    return t;
}

struct file_contents {
    mapping_table table;
    std::optional<fs::file_time_type> mtime;
};

file_contents read_file(fs::path const& p) {
    // Take the timestamp first so a concurrent write triggers another reload
    file_contents r;
    r.mtime = modification_time(p);

    std::error_code ec;
    if (fs::exists(p, ec) && !fs::is_regular_file(p, ec))
        throw io_error(p.string() + " is not a regular file");

    std::ifstream ifs(p);
    if (!ifs.is_open()) {
        if (!fs::exists(p, ec) && !ec) {
            r.mtime.reset();
            return r;
        }
        throw io_error("Failed to open " + p.string() + ": " + std::strerror(errno));
    }

    r.table = parse_mappings(ifs, p.string());
    if (ifs.bad()) throw io_error("Failed to read " + p.string());
    return r;
}

struct file_lines {
    std::vector<std::string> lines;
    std::string eol = "\n";
};

file_lines read_lines(fs::path const& p) {
    file_lines r;
    std::ifstream ifs(p);
    if (!ifs.is_open())
        throw io_error("Failed to open " + p.string() + ": " + std::strerror(errno));

    std::string line;
    while (std::getline(ifs, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
            // The first line decides the terminator written back
            if (r.lines.empty()) r.eol = "\r\n";
        }
        r.lines.push_back(std::move(line));
    }
    if (ifs.bad()) throw io_error("Failed to read " + p.string());
    return r;
}

// Symlinked mapping files are rewritten at their target
fs::path resolve_target(fs::path const& p) {
    std::error_code ec;
    if (!fs::is_symlink(p, ec)) return p;
    auto target = fs::canonical(p, ec);
    if (ec) throw io_error("Failed to resolve " + p.string() + ": " + ec.message());
    return target;
}

void write_atomically(fs::path const& p, file_lines const& contents) {
    auto const target = resolve_target(p);

    auto pattern = target.string() + ".XXXXXX";
    int fd       = ::mkstemp(pattern.data());
    if (fd == -1)
        throw io_error("Failed to create temporary file for " + target.string() + ": " +
                       std::strerror(errno));
    ::close(fd);
    fs::path const tmp(pattern);

    auto fail = [&tmp](std::string const& msg) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw io_error(msg);
    };

    {
        std::ofstream ofs(tmp, std::ios::trunc | std::ios::binary);
        if (!ofs.is_open()) fail("Failed to open " + tmp.string() + ": " + std::strerror(errno));
        for (auto const& l : contents.lines) ofs << l << contents.eol;
        ofs.flush();
        if (!ofs.good()) fail("Failed to write " + tmp.string());
    }

    // mkstemp creates 0600, keep the mode of the file being replaced
    std::error_code ec;
    auto st = fs::status(target, ec);
    auto perms = fs::exists(st) ? st.permissions()
                                : fs::perms::owner_read | fs::perms::owner_write |
                                      fs::perms::group_read | fs::perms::others_read;
    fs::permissions(tmp, perms, fs::perm_options::replace, ec);
    if (ec) fail("Failed to set permissions on " + tmp.string() + ": " + ec.message());

    fs::rename(tmp, target, ec);
    if (ec) fail("Failed to replace " + target.string() + ": " + ec.message());
}

void log_mappings(mapping_table const& t) {
    if (t.empty()) {
        spdlog::info("  (none yet)");
        return;
    }
    for (auto const& [ident, name] : t) spdlog::info("  {} -> {}", ident, name);
}

}  // namespace

mapping_table parse_mappings(std::istream& is, std::string const& source) {
    mapping_table r;
    std::string line;
    size_t lineno = 0;

    while (std::getline(is, line)) {
        ++lineno;
        auto stripped = trim(line);
        if (stripped.empty() || stripped.front() == '#') continue;

        auto sep = stripped.find('=');
        if (sep == std::string::npos) {
            spdlog::warn("Ignoring malformed line {} in {}: {}", lineno, source, stripped);
            continue;
        }

        auto ident = trim(std::string_view(stripped).substr(0, sep));
        auto name  = trim(std::string_view(stripped).substr(sep + 1));
        if (ident.empty() || name.empty()) {
            spdlog::warn("Ignoring line {} in {} with empty address or name: {}", lineno, source,
                         stripped);
            continue;
        }

        r[normalize_identifier(ident)] = std::move(name);
    }
    return r;
}

MappingStore::MappingStore(fs::path p): path_(std::move(p)) {}

void MappingStore::load() {
    auto contents = read_file(path_);
    if (!contents.mtime) spdlog::info("Mapping file {} does not exist yet", path_.string());
    spdlog::debug("Loaded {} mappings from {}", contents.table.size(), path_.string());

    std::lock_guard g(mtx);
    table      = std::move(contents.table);
    last_write = contents.mtime;
}

bool MappingStore::maybe_reload() {
    auto current = modification_time(path_);
    {
        std::lock_guard g(mtx);
        if (current == last_write) return false;
    }

    file_contents contents;
    try {
        contents = read_file(path_);
    } catch (io_error const& e) {
        spdlog::warn("Keeping previous mappings: {}", e.what());
        return false;
    }

    bool changed = false;
    {
        std::lock_guard g(mtx);
        changed = contents.table != table;
        table.swap(contents.table);
        last_write = contents.mtime;
    }

    if (changed) {
        spdlog::info("Device mappings updated:");
        log_mappings(entries());
    }
    return true;
}

std::optional<std::string> MappingStore::lookup(std::string_view address) const {
    auto key = normalize_identifier(address);
    std::lock_guard g(mtx);
    auto p = table.find(key);
    if (p == table.end()) return std::nullopt;
    return p->second;
}

std::optional<std::string> MappingStore::lookup_name(std::string_view device_name) const {
    auto key = to_upper(trim(device_name));
    // A name that looks like a MAC would already have matched by address
    if (key.empty() || normalize_mac(key)) return std::nullopt;
    std::lock_guard g(mtx);
    auto p = table.find(key);
    if (p == table.end()) return std::nullopt;
    return p->second;
}

bool MappingStore::upsert(std::string_view address, std::string_view name) {
    auto mac = normalize_mac(address);
    if (!mac) throw std::invalid_argument("Malformed address: " + std::string(address));
    auto nm = trim(name);
    if (nm.empty()) throw std::invalid_argument("Empty name for " + *mac);

    auto const entry = *mac + " = " + nm;

    // Serializes the read-modify-write of the file and the commit below
    std::lock_guard w(write_mtx);

    std::error_code ec;
    bool const exists = fs::exists(path_, ec);
    if (ec) throw io_error("Failed to access " + path_.string() + ": " + ec.message());

    bool updated = false;
    file_lines contents;
    auto& lines = contents.lines;
    if (!exists) {
        lines = { "# Device mappings: ADDRESS = Friendly Name",
                  "# Lines starting with # are comments.", "", entry };
    } else {
        contents = read_lines(path_);
        for (auto& l : lines) {
            auto stripped = trim(l);
            if (stripped.empty() || stripped.front() == '#') continue;
            auto sep = stripped.find('=');
            if (sep == std::string::npos) continue;
            if (normalize_identifier(std::string_view(stripped).substr(0, sep)) == *mac) {
                l       = entry;
                updated = true;
            }
        }
        if (!updated) {
            if (!lines.empty() && !trim(lines.back()).empty()) lines.emplace_back();
            lines.push_back(entry);
        }
    }

    write_atomically(path_, contents);

    {
        std::lock_guard g(mtx);
        table[*mac] = nm;
    }
    spdlog::info("{} mapping: {} -> {} in {}", updated ? "Updated" : "Added", *mac, nm,
                 path_.string());
    return updated;
}

mapping_table MappingStore::entries() const {
    std::lock_guard g(mtx);
    return table;
}

size_t MappingStore::size() const {
    std::lock_guard g(mtx);
    return table.size();
}

}  // namespace presence
