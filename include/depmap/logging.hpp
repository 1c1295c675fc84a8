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

#pragma once

#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace depmap {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

using LogFields = std::vector<std::pair<std::string, std::string>>;

const char *log_level_to_string(LogLevel level);

// Throws ConfigError on an unknown name
LogLevel log_level_from_string(const std::string &name);

class Logger {
public:
    virtual ~Logger() = default;

    virtual void log(LogLevel level, const std::string &message, const LogFields &fields = {}) = 0;
    virtual LogLevel level() const = 0;

    bool enabled(LogLevel lvl) const { return static_cast<int>(lvl) <= static_cast<int>(level()); }

    void error(const std::string &message, const LogFields &fields = {}) {
        log(LogLevel::Error, message, fields);
    }
    void warn(const std::string &message, const LogFields &fields = {}) {
        log(LogLevel::Warn, message, fields);
    }
    void info(const std::string &message, const LogFields &fields = {}) {
        log(LogLevel::Info, message, fields);
    }
    void debug(const std::string &message, const LogFields &fields = {}) {
        log(LogLevel::Debug, message, fields);
    }
};

class NullLogger : public Logger {
public:
    void log(LogLevel, const std::string &, const LogFields &) override {}
    LogLevel level() const override { return LogLevel::Error; }
};

// Writes "[timestamp] level message key=value ..." lines. Safe to share
// between scan workers.
class StreamLogger : public Logger {
public:
    StreamLogger(std::ostream &stream, LogLevel level);

    void log(LogLevel level, const std::string &message, const LogFields &fields) override;
    LogLevel level() const override { return level_; }

private:
    std::ostream *stream_;
    LogLevel level_;
    std::mutex output_mutex_;
};

std::shared_ptr<Logger> make_stream_logger(std::ostream &stream, LogLevel level);

// Returns a NullLogger when given nullptr
std::shared_ptr<Logger> ensure_logger(std::shared_ptr<Logger> logger);

} // namespace depmap
