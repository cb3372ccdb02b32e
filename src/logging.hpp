#pragma once

#include <filesystem>

#include <spdlog/common.h>

namespace hwprov::logging {

struct Options {
    spdlog::level::level_enum level = spdlog::level::info;
    std::filesystem::path log_file;   // empty: console only
};

// Replaces the default logger: colored stderr, plus an appending file sink
// when a log file is given. A file that cannot be opened is reported and
// skipped; console logging always works.
void init(const Options& options);

} // namespace hwprov::logging
