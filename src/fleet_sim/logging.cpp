#include "fleet_sim/logging.hpp"

#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace fleet_sim {

namespace {
constexpr char k_logger_name[] = "fleet_sim";
constexpr char k_log_file_name[] = "fleet_sim.log";
constexpr char k_console_pattern[] = "[%l] %v";
// Each record is one JSON object; callers pass a JSON value (usually an object) as the message.
constexpr char k_file_pattern[] = R"({"ts":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%l","msg":%v})";
constexpr std::size_t k_max_file_size_bytes{10 * 1024 * 1024};
constexpr std::size_t k_max_rotated_files{5};
constexpr auto k_default_level = spdlog::level::info;

std::once_flag flag_logger_once;
std::shared_ptr<spdlog::logger> fleet_logger;

spdlog::sink_ptr make_console_sink() {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(k_console_pattern);
    return console_sink;
}

spdlog::sink_ptr make_file_sink(const std::filesystem::path& path_log_dir) {
    std::error_code error_directory;
    std::filesystem::create_directories(path_log_dir, error_directory);
    if (error_directory) {
        throw std::runtime_error("Unable to create log directory at " + path_log_dir.string() + ": " + error_directory.message());
    }
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        (path_log_dir / k_log_file_name).string(),
        k_max_file_size_bytes,
        k_max_rotated_files
    );
    file_sink->set_pattern(k_file_pattern);
    return file_sink;
}
}  // namespace

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory) {
    std::call_once(flag_logger_once, [&log_directory]() {
        spdlog::sinks_init_list sinks{make_console_sink(), make_file_sink(std::filesystem::path{log_directory})};
        fleet_logger = std::make_shared<spdlog::logger>(k_logger_name, sinks);
        fleet_logger->set_level(k_default_level);
        spdlog::register_logger(fleet_logger);
    });
    return fleet_logger;
}

std::shared_ptr<spdlog::logger> get_logger() {
    if (!fleet_logger) {
        throw std::runtime_error("Logger not initialized; call initialize_logger first");
    }
    return fleet_logger;
}

void set_log_level(const std::string& str_level) {
    if (!fleet_logger) {
        return;
    }
    // from_str maps unknown names to off instead of throwing.
    const spdlog::level::level_enum level = spdlog::level::from_str(str_level);
    if (level == spdlog::level::off && str_level != "off") {
        fleet_logger->warn("Unknown log level {}; defaulting to info", str_level);
        fleet_logger->set_level(k_default_level);
        return;
    }
    fleet_logger->set_level(level);
}

}  // namespace fleet_sim
