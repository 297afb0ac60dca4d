/// @file log.cpp
/// @brief Logging system implementation for jsonld_core
///
/// Extends the spdlog-based logging with:
/// - Named loggers for the context, expansion, compaction and loader stages
/// - Log level configuration
/// - Optional rotating file output

#include <jsonld_engine/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <mutex>
#include <map>
#include <memory>
#include <filesystem>
#include <vector>

namespace jsonld_core {

// =============================================================================
// Logger Registry
// =============================================================================

namespace {

/// Registry of named loggers
struct LoggerRegistry {
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    spdlog::level::level_enum global_level = spdlog::level::warn;
    std::string log_directory;
    bool console_enabled = true;
    bool file_enabled = false;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
};

LoggerRegistry& get_registry() {
    static LoggerRegistry registry;
    return registry;
}

/// Create sinks based on current configuration
std::vector<spdlog::sink_ptr> create_sinks(const std::string& name) {
    auto& reg = get_registry();
    std::vector<spdlog::sink_ptr> sinks;

    if (reg.console_enabled) {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        sinks.push_back(console_sink);
    }

    if (reg.file_enabled && !reg.log_directory.empty()) {
        try {
            std::filesystem::path log_path = std::filesystem::path(reg.log_directory) / (name + ".log");
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_path.string(),
                reg.max_file_size,
                reg.max_files);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            // Keep the console sink; report why the file sink is missing
            spdlog::warn("Could not open log file for '{}': {}", name, e.what());
        }
    }

    return sinks;
}

} // anonymous namespace

// =============================================================================
// Logger Configuration
// =============================================================================

void configure_logging(const LogConfig& config) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.console_enabled = config.console_enabled;
    reg.file_enabled = config.file_enabled;
    reg.log_directory = config.log_directory;
    reg.max_file_size = config.max_file_size;
    reg.max_files = config.max_files;
    reg.global_level = config.level;

    for (auto& [name, logger] : reg.loggers) {
        logger->set_level(reg.global_level);
    }

    spdlog::set_level(reg.global_level);
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto it = reg.loggers.find(name);
    if (it != reg.loggers.end()) {
        return it->second;
    }

    auto sinks = create_sinks(name);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(reg.global_level);

    reg.loggers[name] = logger;
    if (!spdlog::get(name)) {
        spdlog::register_logger(logger);
    }

    return logger;
}

std::shared_ptr<spdlog::logger> context_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("jsonld.context");
    return logger;
}

std::shared_ptr<spdlog::logger> expansion_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("jsonld.expansion");
    return logger;
}

std::shared_ptr<spdlog::logger> compaction_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("jsonld.compaction");
    return logger;
}

std::shared_ptr<spdlog::logger> loader_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("jsonld.loader");
    return logger;
}

// =============================================================================
// Log Level Management
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.global_level = level;
    spdlog::set_level(level);

    for (auto& [name, logger] : reg.loggers) {
        logger->set_level(level);
    }
}

void set_logger_level(const std::string& name, spdlog::level::level_enum level) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto it = reg.loggers.find(name);
    if (it != reg.loggers.end()) {
        it->second->set_level(level);
    }
}

spdlog::level::level_enum get_global_log_level() {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.global_level;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "trace") return spdlog::level::trace;
    if (str == "debug") return spdlog::level::debug;
    if (str == "info") return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error" || str == "err") return spdlog::level::err;
    if (str == "critical" || str == "fatal") return spdlog::level::critical;
    if (str == "off") return spdlog::level::off;
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

// =============================================================================
// Log Scoping
// =============================================================================

LogScope::LogScope(const std::string& name, std::shared_ptr<spdlog::logger> logger)
    : m_name(name)
    , m_logger(std::move(logger))
    , m_start(std::chrono::steady_clock::now())
{
    m_logger->trace(">>> Entering {}", m_name);
}

LogScope::~LogScope() {
    auto end = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - m_start);
    m_logger->trace("<<< Exiting {} ({}us)", m_name, duration.count());
}

// =============================================================================
// Processing Warnings
// =============================================================================

const char* warning_kind_name(WarningKind kind) {
    switch (kind) {
        case WarningKind::KeywordLikeTerm: return "keyword-like term";
        case WarningKind::KeywordLikeValue: return "keyword-like value";
        case WarningKind::MalformedLanguageTag: return "malformed language tag";
    }
    return "unknown";
}

void WarningSink::report(WarningKind kind, std::string message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_warnings.push_back(Warning{kind, std::move(message)});
}

std::vector<Warning> WarningSink::warnings() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_warnings;
}

std::size_t WarningSink::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_warnings.size();
}

void WarningSink::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_warnings.clear();
}

void report_warning(const std::shared_ptr<spdlog::logger>& logger, const WarningSinkPtr& sink,
                    WarningKind kind, const std::string& message) {
    logger->warn("{}", message);
    if (sink) {
        sink->report(kind, message);
    }
}

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers() {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
    }
    spdlog::default_logger()->flush();
}

void shutdown_logging() {
    flush_all_loggers();

    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        spdlog::drop(name);
    }
    reg.loggers.clear();
}

} // namespace jsonld_core
