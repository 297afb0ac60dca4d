#pragma once

/// @file log.hpp
/// @brief Logging utilities for jsonld_engine

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>
#include <string>
#include <map>
#include <memory>
#include <optional>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <vector>

// =============================================================================
// Logging Macros
// =============================================================================

#define JSONLD_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define JSONLD_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define JSONLD_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define JSONLD_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define JSONLD_LOG_ERROR(...) spdlog::error(__VA_ARGS__)

namespace jsonld_core {

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::warn;
};

/// Configure logging system with full options
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Context processing logger ("jsonld.context")
std::shared_ptr<spdlog::logger> context_logger();

/// Expansion logger ("jsonld.expansion")
std::shared_ptr<spdlog::logger> expansion_logger();

/// Compaction logger ("jsonld.compaction")
std::shared_ptr<spdlog::logger> compaction_logger();

/// Document loader logger ("jsonld.loader")
std::shared_ptr<spdlog::logger> loader_logger();

// =============================================================================
// Log Level Management
// =============================================================================

/// Set global log level
void set_global_log_level(spdlog::level::level_enum level);

/// Set log level for specific logger
void set_logger_level(const std::string& name, spdlog::level::level_enum level);

/// Get current global log level
spdlog::level::level_enum get_global_log_level();

/// Parse log level from string
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Get log level name
const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// RAII log scope for tracing one algorithm invocation
class LogScope {
public:
    LogScope(const std::string& name, std::shared_ptr<spdlog::logger> logger);
    ~LogScope();

    // Non-copyable, non-movable
    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;
    LogScope(LogScope&&) = delete;
    LogScope& operator=(LogScope&&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

// =============================================================================
// Processing Warnings
// =============================================================================

/// Recoverable conditions the processor skips over
enum class WarningKind : std::uint8_t {
    KeywordLikeTerm,       ///< Term definition ignored
    KeywordLikeValue,      ///< Key or IRI value ignored
    MalformedLanguageTag,  ///< Tag kept as given
};

/// Get warning kind name
const char* warning_kind_name(WarningKind kind);

struct Warning {
    WarningKind kind;
    std::string message;
};

/// Collects warnings for the caller of an algorithm. Thread-safe.
class WarningSink {
public:
    void report(WarningKind kind, std::string message);

    [[nodiscard]] std::vector<Warning> warnings() const;
    [[nodiscard]] std::size_t size() const;
    void clear();

private:
    mutable std::mutex m_mutex;
    std::vector<Warning> m_warnings;
};

using WarningSinkPtr = std::shared_ptr<WarningSink>;

/// Log @p message at warn level and record it in @p sink when one is set
void report_warning(const std::shared_ptr<spdlog::logger>& logger, const WarningSinkPtr& sink,
                    WarningKind kind, const std::string& message);

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush all loggers
void flush_all_loggers();

/// Shutdown logging system
void shutdown_logging();

} // namespace jsonld_core
