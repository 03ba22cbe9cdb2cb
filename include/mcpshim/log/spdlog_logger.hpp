#pragma once

#include "mcpshim/log/logger.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace mcpshim {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger
// ─────────────────────────────────────────────────────────────────────────────
// ILogger backed by spdlog. The console sink writes to stderr: the desktop
// client reads stdout as the JSON-RPC channel and captures stderr into its
// own log file.

class SpdlogLogger final : public ILogger {
public:
    /// stderr sink only
    explicit SpdlogLogger(LogLevel min_level = LogLevel::Warn);

    /// Wrap an existing spdlog logger (tests use an ostream sink)
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level);

    ~SpdlogLogger() override = default;

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    [[nodiscard]] std::shared_ptr<spdlog::logger> get_spdlog_logger() const noexcept {
        return logger_;
    }

    void set_level(LogLevel level) noexcept;

    void flush();

    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

private:
    std::shared_ptr<spdlog::logger> logger_;
    LogLevel min_level_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Factory
// ─────────────────────────────────────────────────────────────────────────────

/// stderr sink, plus a file sink when log_file is set.
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_diagnostics_logger(
    LogLevel min_level,
    const std::optional<std::string>& log_file = std::nullopt
);

}  // namespace mcpshim
