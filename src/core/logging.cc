#include "logging.hh"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace suitegen {

namespace {

std::string format_timestamp(std::chrono::system_clock::time_point timestamp) {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()) % 1000;

    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t);
#else
    localtime_r(&time_t, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

}  // namespace

LogLevel parse_log_level(std::string_view name, LogLevel fallback) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    for (auto level : {LogLevel::TRACE, LogLevel::DEBUG, LogLevel::INFO,
                       LogLevel::WARN, LogLevel::ERROR, LogLevel::OFF}) {
        if (upper == log_level_name(level)) {
            return level;
        }
    }
    if (upper == "WARNING") {
        return LogLevel::WARN;
    }
    return fallback;
}

// ============================================================================
// ConsoleSink Implementation
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors)
    : use_colors_(use_colors) {}

void ConsoleSink::write(const LogEntry& entry) {
    std::ostringstream oss;
    oss << format_timestamp(entry.timestamp);

    if (use_colors_) {
        oss << " " << log_level_color(entry.level);
    }
    oss << " [" << std::setw(5) << log_level_name(entry.level) << "]";
    if (use_colors_) {
        oss << "\033[0m";
    }

    if (!entry.component.empty()) {
        oss << " [" << entry.component << "]";
    }
    oss << " " << entry.message;

    if (show_source_location_ && !entry.file.empty()) {
        oss << " (" << entry.file << ":" << entry.line << ")";
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << oss.str() << std::endl;
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr.flush();
}

// ============================================================================
// FileSink Implementation
// ============================================================================

FileSink::FileSink(const std::string& filename)
    : filename_(filename) {
    file_ = std::fopen(filename.c_str(), "a");
    if (!file_) {
        std::cerr << "suitegen: cannot open log file " << filename << std::endl;
    }
}

FileSink::~FileSink() {
    if (file_) {
        std::fclose(file_);
    }
}

void FileSink::write(const LogEntry& entry) {
    std::ostringstream oss;
    oss << format_timestamp(entry.timestamp)
        << " [" << entry.thread_id << "]"
        << " [" << std::setw(5) << log_level_name(entry.level) << "]";
    if (!entry.component.empty()) {
        oss << " [" << entry.component << "]";
    }
    oss << " " << entry.message;
    if (!entry.file.empty()) {
        oss << " (" << entry.file << ":" << entry.line << ")";
    }
    oss << "\n";

    std::string line = oss.str();

    std::lock_guard<std::mutex> lock(mutex_);
    if (file_) {
        std::fwrite(line.c_str(), 1, line.size(), file_);
    }
}

void FileSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_) {
        std::fflush(file_);
    }
}

// ============================================================================
// MemorySink Implementation
// ============================================================================

void MemorySink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(entry);
}

std::vector<LogEntry> MemorySink::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

std::size_t MemorySink::count(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(),
        [level](const LogEntry& e) { return e.level == level; }));
}

bool MemorySink::contains(std::string_view fragment) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(entries_.begin(), entries_.end(), [fragment](const LogEntry& e) {
        return e.message.find(fragment) != std::string::npos;
    });
}

void MemorySink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

// ============================================================================
// Logger Implementation
// ============================================================================

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() {
    add_sink(std::make_shared<ConsoleSink>(true));
}

Logger::~Logger() {
    flush();
}

void Logger::set_level(LogLevel level) {
    level_.store(level);
}

void Logger::set_component_level(const std::string& component, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    component_levels_[component] = level;
}

void Logger::add_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::remove_sink(const std::shared_ptr<LogSink>& sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

bool Logger::is_enabled(LogLevel level, const std::string& component) const {
    if (!component.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);

        // Exact match first, then parents ("analysis" for "analysis.graph")
        std::string name = component;
        while (true) {
            auto it = component_levels_.find(name);
            if (it != component_levels_.end()) {
                return level >= it->second;
            }
            auto pos = name.rfind('.');
            if (pos == std::string::npos) {
                break;
            }
            name.resize(pos);
        }
    }

    return level >= level_.load();
}

void Logger::log(LogLevel level,
                 std::string_view component,
                 std::string_view message,
                 const std::source_location& loc) {
    if (level == LogLevel::OFF || !is_enabled(level, std::string(component))) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.timestamp = std::chrono::system_clock::now();
    entry.thread_id = std::this_thread::get_id();
    entry.component = std::string(component);
    entry.message = std::string(message);
    entry.file = loc.file_name();
    entry.line = loc.line();

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->write(entry);
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->flush();
    }
}

// ============================================================================
// LogStream Implementation
// ============================================================================

LogStream::LogStream(LogLevel level,
                     std::string_view component,
                     const std::source_location& loc)
    : level_(level)
    , component_(component)
    , loc_(loc)
    , enabled_(Logger::instance().is_enabled(level, std::string(component))) {}

LogStream::~LogStream() {
    if (enabled_ && !stream_.str().empty()) {
        Logger::instance().log(level_, component_, stream_.str(), loc_);
    }
}

// ============================================================================
// ComponentLogger Implementation
// ============================================================================

ComponentLogger::ComponentLogger(std::string component)
    : component_(std::move(component)) {}

bool ComponentLogger::is_trace_enabled() const {
    return Logger::instance().is_enabled(LogLevel::TRACE, component_);
}

bool ComponentLogger::is_debug_enabled() const {
    return Logger::instance().is_enabled(LogLevel::DEBUG, component_);
}

bool ComponentLogger::is_info_enabled() const {
    return Logger::instance().is_enabled(LogLevel::INFO, component_);
}

LogStream ComponentLogger::trace(const std::source_location& loc) const {
    return LogStream(LogLevel::TRACE, component_, loc);
}

LogStream ComponentLogger::debug(const std::source_location& loc) const {
    return LogStream(LogLevel::DEBUG, component_, loc);
}

LogStream ComponentLogger::info(const std::source_location& loc) const {
    return LogStream(LogLevel::INFO, component_, loc);
}

LogStream ComponentLogger::warn(const std::source_location& loc) const {
    return LogStream(LogLevel::WARN, component_, loc);
}

LogStream ComponentLogger::error(const std::source_location& loc) const {
    return LogStream(LogLevel::ERROR, component_, loc);
}

void ComponentLogger::info(std::string_view msg, const std::source_location& loc) const {
    Logger::instance().log(LogLevel::INFO, component_, msg, loc);
}

void ComponentLogger::warn(std::string_view msg, const std::source_location& loc) const {
    Logger::instance().log(LogLevel::WARN, component_, msg, loc);
}

void ComponentLogger::error(std::string_view msg, const std::source_location& loc) const {
    Logger::instance().log(LogLevel::ERROR, component_, msg, loc);
}

// ============================================================================
// Initialization
// ============================================================================

void init_logging(const LogConfig& config) {
    Logger& logger = Logger::instance();
    logger.clear_sinks();
    logger.set_level(config.default_level);

    if (config.console_enabled) {
        auto console = std::make_shared<ConsoleSink>(config.console_colors);
        console->set_show_source_location(config.console_source_location);
        logger.add_sink(console);
    }

    if (config.file_enabled) {
        logger.add_sink(std::make_shared<FileSink>(config.file_path));
    }

    SUITEGEN_LOG_DEBUG(log::core) << "Logging initialized at level "
                                  << log_level_name(config.default_level);
}

void shutdown_logging() {
    Logger::instance().flush();
}

}  // namespace suitegen
