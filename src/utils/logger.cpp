// src/utils/logger.cpp
#include "logger.h"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <filesystem>
#include <algorithm>
#include <cctype>

namespace FairSlot {

LogLevel ParseLogLevel(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    
    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "warning" || lowered == "warn") return LogLevel::WARNING;
    if (lowered == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

Logger& Logger::GetInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    Shutdown();
}

void Logger::Initialize(const std::string& log_file_path, 
                       LogLevel console_level,
                       LogLevel file_level,
                       bool enable_console,
                       bool enable_file) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    console_level_ = console_level;
    file_level_ = file_level;
    enable_console_ = enable_console;
    enable_file_ = enable_file;
    
    if (enable_file && !log_file_path.empty()) {
        log_file_path_ = log_file_path;
        
        // 创建日志目录（如果不存在）
        std::filesystem::path file_path(log_file_path_);
        if (file_path.has_parent_path()) {
            std::filesystem::create_directories(file_path.parent_path());
        }
        
        file_stream_ = std::make_unique<std::ofstream>(log_file_path_, 
                                                      std::ios::out | std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Failed to open log file: " << log_file_path_ << std::endl;
            enable_file_ = false;
        }
    } else {
        enable_file_ = false;
    }
}

void Logger::Log(LogLevel level, const std::string& message, const std::string& component) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::ostringstream oss;
    oss << "[" << GetTimestamp() << "] [" << LogLevelToString(level) << "]";
    if (!component.empty()) {
        oss << " [" << component << "]";
    }
    oss << " " << message;
    
    std::string formatted_message = oss.str();
    
    if (enable_console_ && level >= console_level_) {
        WriteToConsole(formatted_message);
    }
    
    if (enable_file_ && level >= file_level_) {
        WriteToFile(formatted_message);
    }
}

void Logger::Debug(const std::string& message, const std::string& component) {
    Log(LogLevel::DEBUG, message, component);
}

void Logger::Info(const std::string& message, const std::string& component) {
    Log(LogLevel::INFO, message, component);
}

void Logger::Warning(const std::string& message, const std::string& component) {
    Log(LogLevel::WARNING, message, component);
}

void Logger::Error(const std::string& message, const std::string& component) {
    Log(LogLevel::ERROR, message, component);
}

void Logger::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
        file_stream_->close();
    }
    file_stream_.reset();
    enable_file_ = false;
}

std::string Logger::GetTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    
    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);
    
    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();
    
    return oss.str();
}

std::string Logger::LogLevelToString(LogLevel level) const {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO ";
        case LogLevel::WARNING: return "WARN ";
        case LogLevel::ERROR:   return "ERROR";
        default:               return "UNKNW";
    }
}

void Logger::WriteToConsole(const std::string& formatted_message) const {
    std::cout << formatted_message << std::endl;
}

void Logger::WriteToFile(const std::string& formatted_message) {
    if (file_stream_ && file_stream_->is_open()) {
        *file_stream_ << formatted_message << std::endl;
    }
}

} // namespace FairSlot
