// src/utils/logger.h
#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <memory>
#include <sstream>

namespace FairSlot {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

// "debug" / "info" / "warning" / "error"，未知值回退到INFO
LogLevel ParseLogLevel(const std::string& name);

class Logger {
public:
    static Logger& GetInstance();
    
    // 配置日志系统
    void Initialize(const std::string& log_file_path = "", 
                   LogLevel console_level = LogLevel::INFO,
                   LogLevel file_level = LogLevel::DEBUG,
                   bool enable_console = true,
                   bool enable_file = true);
    
    void Log(LogLevel level, const std::string& message, 
             const std::string& component = "");
    
    void Debug(const std::string& message, const std::string& component = "");
    void Info(const std::string& message, const std::string& component = "");
    void Warning(const std::string& message, const std::string& component = "");
    void Error(const std::string& message, const std::string& component = "");
    
    void SetConsoleLevel(LogLevel level) { console_level_ = level; }
    void SetFileLevel(LogLevel level) { file_level_ = level; }
    void SetConsoleEnabled(bool enabled) { enable_console_ = enabled; }
    
    void Shutdown();

private:
    Logger() = default;
    ~Logger();
    
    std::mutex mutex_;
    std::unique_ptr<std::ofstream> file_stream_;
    std::string log_file_path_;
    
    LogLevel console_level_ = LogLevel::INFO;
    LogLevel file_level_ = LogLevel::DEBUG;
    bool enable_console_ = true;
    bool enable_file_ = false;
    
    std::string GetTimestamp() const;
    std::string LogLevelToString(LogLevel level) const;
    void WriteToConsole(const std::string& formatted_message) const;
    void WriteToFile(const std::string& formatted_message);
};

#define LOG_DEBUG(msg, component) Logger::GetInstance().Debug(msg, component)
#define LOG_INFO(msg, component) Logger::GetInstance().Info(msg, component)
#define LOG_WARNING(msg, component) Logger::GetInstance().Warning(msg, component)
#define LOG_ERROR(msg, component) Logger::GetInstance().Error(msg, component)

} // namespace FairSlot
