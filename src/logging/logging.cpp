#include <logging/logging.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/systemd_sink.h>
#include <spdlog/spdlog.h>

void logging::configure(std::string const& name, bool systemd, bool debug, bool trace) {
    spdlog::flush_on(spdlog::level::err);
    // stdout carries presence lines, keep diagnostics off it
    if (systemd)
        spdlog::set_default_logger(spdlog::systemd_logger_mt(name));
    else
        spdlog::set_default_logger(spdlog::stderr_color_mt(name));

    spdlog::set_level(spdlog::level::info);
    if (trace)
        spdlog::set_level(spdlog::level::trace);
    else if (debug)
        spdlog::set_level(spdlog::level::debug);
}
