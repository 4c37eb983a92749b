#pragma once

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#endif

#include <algorithm>
#include <atomic>
#include <cstring>
#include <fstream>
#include <mutex>
#include <string>
#include <fmt/format.h>

#ifdef ERROR
#undef ERROR
#endif

namespace appxmanifest {

/**
 * @brief 进程级日志器
 *
 * - 控制台输出写到stderr（库代码不占用stdout）
 * - 可选日志文件，按大小滚动
 * - 未显式初始化时只输出WARN及以上级别到控制台，不创建日志文件
 */
class Logger {
public:
    enum class Level {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERROR = 4,
        CRITICAL = 5,
        OFF = 6
    };

    enum class WriteMode {
        TRUNCATE = 0,  // 覆盖模式（默认）
        APPEND = 1     // 追加模式
    };

    static Logger& getInstance();

    /**
     * @brief 初始化日志系统
     * @param log_file_path 日志文件路径，为空时不写文件
     * @param level 最低输出级别
     * @param enable_console 是否输出到控制台
     * @param max_file_size 单个日志文件最大字节数，超过后滚动
     * @param max_files 保留的滚动文件数
     * @param write_mode 覆盖或追加
     */
    void initialize(const std::string& log_file_path = "",
                    Level level = Level::INFO,
                    bool enable_console = true,
                    size_t max_file_size = 10 * 1024 * 1024,
                    size_t max_files = 5,
                    WriteMode write_mode = WriteMode::TRUNCATE);

    void setLevel(Level level);
    Level getLevel() const;
    bool isInitialized() const { return initialized_.load(); }

    void log(Level level, const std::string& message);

    void trace(const std::string& message) { log(Level::TRACE, message); }
    void debug(const std::string& message) { log(Level::DEBUG, message); }
    void info(const std::string& message) { log(Level::INFO, message); }
    void warn(const std::string& message) { log(Level::WARN, message); }
    void error(const std::string& message) { log(Level::ERROR, message); }
    void critical(const std::string& message) { log(Level::CRITICAL, message); }

    template<typename... Args>
    inline void logFormat(Level level, const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        try {
            log(level, fmt::vformat(fmt_str, fmt::make_format_args(args...)));
        } catch (const fmt::format_error&) {
            // 格式串与参数不匹配时原样输出格式串
            log(level, fmt_str);
        }
    }

    // 带源码位置信息的便捷接口（在宏中使用）
    template<typename... Args>
    inline void logCtx(Level level, const char* file, int line, const char* func,
                       const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        const std::string fmt_with_ctx = fmt::format("[{}:{}:{}] {}", baseFilename(file), line, func ? func : "", fmt_str);
        logFormat(level, fmt_with_ctx, std::forward<Args>(args)...);
    }

    void flush();

    /**
     * @brief 关闭日志文件，之后可以重新initialize
     */
    void shutdown();

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool should_log(Level level) const;
    void log_to_console(Level level, const std::string& message);
    void log_to_file(const std::string& message);
    std::string format_message(Level level, const std::string& message) const;
    static const char* level_to_string(Level level);
    std::string get_timestamp() const;
    void rotate_file_if_needed();
    std::string get_rotated_filename(size_t index) const;

    // 提取文件名（去除路径）
    static inline const char* baseFilename(const char* path) {
        if (!path) return "";
        const char* slash1 = std::strrchr(path, '/');
        const char* slash2 = std::strrchr(path, '\\');
        const char* p = (slash1 && slash2) ? (std::max(slash1, slash2)) : (slash1 ? slash1 : slash2);
        return p ? (p + 1) : path;
    }

    mutable std::mutex mutex_;
    std::atomic<Level> current_level_{Level::WARN};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> enable_console_{true};

    std::string log_file_path_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;
    WriteMode write_mode_ = WriteMode::TRUNCATE;
};

// 跨编译器的函数名宏
#if defined(_MSC_VER) || defined(__GNUC__) || defined(__clang__)
#  define APPXMANIFEST_FUNC __FUNCTION__
#else
#  define APPXMANIFEST_FUNC __func__
#endif

// 统一日志宏（带源码位置信息，不包含模块前缀）
#define APPXMANIFEST_LOG_TRACE(fmt, ...)    ::appxmanifest::Logger::getInstance().logCtx(::appxmanifest::Logger::Level::TRACE,    __FILE__, __LINE__, APPXMANIFEST_FUNC, fmt, ##__VA_ARGS__)
#define APPXMANIFEST_LOG_DEBUG(fmt, ...)    ::appxmanifest::Logger::getInstance().logCtx(::appxmanifest::Logger::Level::DEBUG,    __FILE__, __LINE__, APPXMANIFEST_FUNC, fmt, ##__VA_ARGS__)
#define APPXMANIFEST_LOG_INFO(fmt, ...)     ::appxmanifest::Logger::getInstance().logCtx(::appxmanifest::Logger::Level::INFO,     __FILE__, __LINE__, APPXMANIFEST_FUNC, fmt, ##__VA_ARGS__)
#define APPXMANIFEST_LOG_WARN(fmt, ...)     ::appxmanifest::Logger::getInstance().logCtx(::appxmanifest::Logger::Level::WARN,     __FILE__, __LINE__, APPXMANIFEST_FUNC, fmt, ##__VA_ARGS__)
#define APPXMANIFEST_LOG_ERROR(fmt, ...)    ::appxmanifest::Logger::getInstance().logCtx(::appxmanifest::Logger::Level::ERROR,    __FILE__, __LINE__, APPXMANIFEST_FUNC, fmt, ##__VA_ARGS__)
#define APPXMANIFEST_LOG_CRITICAL(fmt, ...) ::appxmanifest::Logger::getInstance().logCtx(::appxmanifest::Logger::Level::CRITICAL, __FILE__, __LINE__, APPXMANIFEST_FUNC, fmt, ##__VA_ARGS__)

} // namespace appxmanifest
