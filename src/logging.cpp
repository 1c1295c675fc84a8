// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "depmap/logging.hpp"
#include "depmap/errors.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <ostream>

namespace depmap {

namespace {

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&time, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

bool needs_quotes(const std::string &value) {
    return value.empty() || value.find_first_of(" \t\"=") != std::string::npos;
}

} // namespace

const char *log_level_to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Error:
        return "error";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Info:
        return "info";
    case LogLevel::Debug:
        return "debug";
    }
    return "error";
}

LogLevel log_level_from_string(const std::string &name) {
    if (name == "error")
        return LogLevel::Error;
    if (name == "warn" || name == "warning")
        return LogLevel::Warn;
    if (name == "info")
        return LogLevel::Info;
    if (name == "debug")
        return LogLevel::Debug;
    throw ConfigError("unknown log level: " + name);
}

StreamLogger::StreamLogger(std::ostream &stream, LogLevel level) : stream_(&stream), level_(level) {}

void StreamLogger::log(LogLevel lvl, const std::string &message, const LogFields &fields) {
    if (!enabled(lvl))
        return;

    std::lock_guard<std::mutex> lock(output_mutex_);
    (*stream_) << "[" << timestamp() << "] " << std::left << std::setw(5)
               << log_level_to_string(lvl) << " " << message;
    for (const auto &[key, value] : fields) {
        (*stream_) << " " << key << "=";
        if (needs_quotes(value)) {
            (*stream_) << std::quoted(value);
        } else {
            (*stream_) << value;
        }
    }
    (*stream_) << std::endl;
}

std::shared_ptr<Logger> make_stream_logger(std::ostream &stream, LogLevel level) {
    return std::make_shared<StreamLogger>(stream, level);
}

std::shared_ptr<Logger> ensure_logger(std::shared_ptr<Logger> logger) {
    if (!logger)
        return std::make_shared<NullLogger>();
    return logger;
}

} // namespace depmap
