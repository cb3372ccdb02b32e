#include "logging.hpp"

#include <memory>
#include <string>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace hwprov::logging {

void init(const Options& options) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern("%^[%l]%$ %v");
    sinks.push_back(console);

    std::string file_error;
    if (!options.log_file.empty()) {
        try {
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.log_file.string(), false);
            file->set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
            file->set_level(spdlog::level::debug);
            sinks.push_back(file);
        } catch (const spdlog::spdlog_ex& ex) {
            file_error = ex.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("hwprov", sinks.begin(), sinks.end());
    console->set_level(options.level);
    // Logger passes everything the file sink wants; the console filters itself.
    logger->set_level(sinks.size() > 1 ? spdlog::level::debug : options.level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    if (!file_error.empty()) {
        spdlog::warn("log file {} not usable: {}", options.log_file.string(), file_error);
    }
}

} // namespace hwprov::logging
