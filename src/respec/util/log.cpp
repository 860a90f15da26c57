#include "./log.hpp"

#include <respec/error/errors.hpp>

#include <magic_enum.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <array>

using namespace respec::log;

namespace {

constexpr std::array<spdlog::level::level_enum, 7> spdlog_levels = {
    spdlog::level::trace,
    spdlog::level::debug,
    spdlog::level::info,
    spdlog::level::warn,
    spdlog::level::err,
    spdlog::level::critical,
    spdlog::level::off,
};

spdlog::level::level_enum to_spdlog(level l) noexcept {
    return spdlog_levels[static_cast<std::size_t>(l)];
}

std::shared_ptr<spdlog::logger>& the_logger() noexcept {
    static std::shared_ptr<spdlog::logger> inst;
    return inst;
}

// Set once a file mirror is attached: from then on every level is formatted.
bool have_file_sink = false;

}  // namespace

void respec::log::init_logger() noexcept {
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern("[%^%-5l%$] %v");
    auto logger = std::make_shared<spdlog::logger>("respec", console);
    logger->set_level(spdlog::level::trace);
    the_logger() = logger;
}

void respec::log::mirror_to_file(const std::filesystem::path& path) {
    auto& logger = the_logger();
    if (!logger) {
        init_logger();
    }
    try {
        auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), true);
        file->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] %v");
        file->set_level(spdlog::level::trace);
        logger->sinks().push_back(std::move(file));
    } catch (const spdlog::spdlog_ex& exc) {
        throw_user_error<errc::io_failure>("Cannot open log file [{}]: {}",
                                           path.string(),
                                           exc.what());
    }
    // The console sink keeps honoring the requested level
    logger->sinks().front()->set_level(to_spdlog(current_log_level));
    have_file_sink = true;
    logger->flush_on(spdlog::level::info);
}

bool respec::log::any_sink_wants(level l) noexcept {
    return have_file_sink ? l != level::silent : int(l) >= int(current_log_level);
}

respec::log::level respec::log::parse_level(std::string_view name) {
    auto lvl = magic_enum::enum_cast<level>(name);
    if (!lvl) {
        throw_user_error<errc::invalid_config>("Unknown log level '{}'", name);
    }
    return *lvl;
}

void respec::log::log_print(level l, std::string_view msg) noexcept {
    auto& logger = the_logger();
    if (!logger) {
        spdlog::default_logger_raw()->log(to_spdlog(l), "{}", msg);
        return;
    }
    if (!have_file_sink && !(int(l) >= int(current_log_level))) {
        return;
    }
    logger->log(to_spdlog(l), "{}", msg);
}
