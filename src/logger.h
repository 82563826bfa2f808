// logger.h - 统一日志系统
//
// 特性:
// - 双向输出: stdout + 日志文件
// - 线程安全: 工作线程池并发求解各分区
// - 日志级别: WARN/INFO/DETAIL/DEBUG
// - 线程标签: 工作线程通过 ScopedLogTag 给每行日志加上分区编号
// - CPLEX 直接使用 GetTeeStream() (仅 DEBUG 级别)
//
// 用法:
//   Logger logger("logs/cycle", LogLevel::INFO);
//   LOG("[系统] 启动");
//   ScopedLogTag tag(partition.partition_id);
//   LOG_WARN_FMT("[修复] 分区 %s 不可行\n", id.c_str());
//
// 未创建 Logger 时 (g_logger == nullptr) 所有宏均为空操作,
// 库代码与单元测试因此无需初始化日志。

#ifndef LOGGER_H_
#define LOGGER_H_

#include "tee_stream.h"
#include <fstream>
#include <string>
#include <chrono>
#include <iomanip>
#include <ctime>
#include <sstream>
#include <mutex>
#include <filesystem>
#include <cstdio>
#include <cstdarg>
#include <memory>

class Logger;
extern Logger* g_logger;

// 日志级别
enum class LogLevel { WARN = 0, INFO = 1, DETAIL = 2, DEBUG = 3 };

// 当前线程的日志标签 (分区编号), 空串表示无标签
inline std::string& CurrentLogTag() {
    static thread_local std::string tag;
    return tag;
}

// 作用域内设置线程日志标签, 析构时恢复
class ScopedLogTag {
public:
    explicit ScopedLogTag(const std::string& tag) : saved_(CurrentLogTag()) {
        CurrentLogTag() = tag;
    }
    ~ScopedLogTag() { CurrentLogTag() = saved_; }

    ScopedLogTag(const ScopedLogTag&) = delete;
    ScopedLogTag& operator=(const ScopedLogTag&) = delete;

private:
    std::string saved_;
};

class Logger {
public:
    explicit Logger(const std::string& log_prefix, LogLevel level = LogLevel::INFO)
        : log_file_path_(log_prefix + ".log")
        , level_(level)
    {
        // 创建日志目录
        std::filesystem::path log_path(log_file_path_);
        std::error_code ec;
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path(), ec);
        }

        // 打开日志文件, 失败时退化为仅终端输出
        log_file_.open(log_file_path_, std::ios::out | std::ios::trunc);
        if (!log_file_.is_open()) {
            std::cerr << "[Logger] 无法打开日志文件: " << log_file_path_ << std::endl;
        }

        tee_stream_ = std::make_unique<TeeStream>(
            std::cout, log_file_.is_open() ? &log_file_ : nullptr);
        g_logger = this;
    }

    ~Logger() {
        Flush();
        if (g_logger == this) {
            g_logger = nullptr;
        }
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void SetLevel(LogLevel level) { level_ = level; }
    LogLevel GetLevel() const { return level_; }
    bool Enabled(LogLevel level) const { return level <= level_; }

    // 获取双向输出流，供 CPLEX 使用
    std::ostream& GetTeeStream() {
        return *tee_stream_;
    }

    // 写入带时间戳的日志（线程安全）
    void Write(LogLevel level, const std::string& msg) {
        if (level > level_) return;

        std::string line = Prefix(level) + msg;
        std::lock_guard<std::mutex> lock(mutex_);
        *tee_stream_ << line;
        tee_stream_->flush();
    }

    // 格式化写入带时间戳的日志（线程安全）
    void WriteFormat(LogLevel level, const char* fmt, ...) {
        if (level > level_) return;

        char buffer[4096];
        va_list args;
        va_start(args, fmt);
        vsnprintf(buffer, sizeof(buffer), fmt, args);
        va_end(args);

        std::string line = Prefix(level) + buffer;
        std::lock_guard<std::mutex> lock(mutex_);
        *tee_stream_ << line;
        tee_stream_->flush();
    }

    // 写入原始消息（无时间戳）
    void WriteRaw(const std::string& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        *tee_stream_ << msg;
        tee_stream_->flush();
    }

    void Flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (tee_stream_) {
            tee_stream_->flush();
        }
        if (log_file_.is_open()) {
            log_file_.flush();
        }
    }

    std::string GetLogFilePath() const { return log_file_path_; }

private:
    std::string Prefix(LogLevel level) const {
        std::string prefix = "[" + GetTimestamp() + "] ";
        if (level == LogLevel::WARN) {
            prefix += "WARN ";
        }
        const std::string& tag = CurrentLogTag();
        if (!tag.empty()) {
            prefix += "[" + tag + "] ";
        }
        return prefix;
    }

    static std::string GetTimestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);

        std::tm tm_buf;
#ifdef _WIN32
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::stringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    std::string log_file_path_;
    std::ofstream log_file_;
    std::unique_ptr<TeeStream> tee_stream_;
    std::mutex mutex_;
    LogLevel level_;
};

// ============================================================================
// 日志宏
// ============================================================================

// WARN 级别 - 修复、回退、失败 (始终输出)
#define LOG_WARN(msg) do { \
    if (g_logger) { \
        g_logger->Write(LogLevel::WARN, std::string(msg) + "\n"); \
    } \
} while(0)

#define LOG_WARN_FMT(fmt, ...) do { \
    if (g_logger) { \
        g_logger->WriteFormat(LogLevel::WARN, fmt, ##__VA_ARGS__); \
    } \
} while(0)

// INFO 级别 - 关键事件（默认输出）
#define LOG(msg) do { \
    if (g_logger) { \
        g_logger->Write(LogLevel::INFO, std::string(msg) + "\n"); \
    } \
} while(0)

#define LOG_FMT(fmt, ...) do { \
    if (g_logger) { \
        g_logger->WriteFormat(LogLevel::INFO, fmt, ##__VA_ARGS__); \
    } \
} while(0)

// DETAIL 级别 - 分区流水线过程（-v 参数启用）
#define LOG_DETAIL(msg) do { \
    if (g_logger) { \
        g_logger->Write(LogLevel::DETAIL, std::string(msg) + "\n"); \
    } \
} while(0)

#define LOG_DETAIL_FMT(fmt, ...) do { \
    if (g_logger) { \
        g_logger->WriteFormat(LogLevel::DETAIL, fmt, ##__VA_ARGS__); \
    } \
} while(0)

// DEBUG 级别 - 模型规模、求解器原始输出（-vv 参数启用）
#define LOG_DEBUG(msg) do { \
    if (g_logger) { \
        g_logger->Write(LogLevel::DEBUG, std::string(msg) + "\n"); \
    } \
} while(0)

#define LOG_DEBUG_FMT(fmt, ...) do { \
    if (g_logger) { \
        g_logger->WriteFormat(LogLevel::DEBUG, fmt, ##__VA_ARGS__); \
    } \
} while(0)

#define LOG_RAW(msg) do { \
    if (g_logger) { \
        g_logger->WriteRaw(msg); \
    } \
} while(0)

// ============================================================================
// 辅助函数
// ============================================================================

// 格式化已用时间为 [MM:SS.s] 格式
inline std::string FormatElapsed(double elapsed_sec) {
    int minutes = static_cast<int>(elapsed_sec) / 60;
    double seconds = elapsed_sec - minutes * 60;
    char buf[16];
    snprintf(buf, sizeof(buf), "[%02d:%04.1f]", minutes, seconds);
    return std::string(buf);
}

#endif  // LOGGER_H_
