// src/main.cpp
#include "load_test_engine.h"
#include "core/config.h"
#include "utils/logger.h"
#include <iostream>
#include <string>
#include <filesystem>

using namespace FairSlot;

void PrintUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n"
              << "Options:\n"
              << "  -c, --config <file>    Service config file (default: config/service.yaml)\n"
              << "  -t, --threads <num>    Number of session threads (default: from config)\n"
              << "  -v, --verbose          Enable verbose logging\n"
              << "  -h, --help            Show this help message\n"
              << "  --log-file <file>     Log file path (default: from config)\n"
              << "  --no-console          Disable console output\n";
}

int main(int argc, char* argv[]) {
    std::string config_file = "config/service.yaml";
    std::string log_file;
    int thread_count = 0;  // 0表示使用配置
    bool verbose = false;
    bool enable_console = true;
    
    // 解析命令行参数
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        
        if (arg == "-h" || arg == "--help") {
            PrintUsage(argv[0]);
            return 0;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                config_file = argv[++i];
            } else {
                std::cerr << "Error: " << arg << " requires a filename\n";
                return 1;
            }
        } else if (arg == "-t" || arg == "--threads") {
            if (i + 1 < argc) {
                try {
                    thread_count = std::stoi(argv[++i]);
                } catch (const std::exception&) {
                    std::cerr << "Error: invalid thread count: " << argv[i] << "\n";
                    return 1;
                }
            } else {
                std::cerr << "Error: " << arg << " requires a number\n";
                return 1;
            }
        } else if (arg == "--log-file") {
            if (i + 1 < argc) {
                log_file = argv[++i];
            } else {
                std::cerr << "Error: " << arg << " requires a filename\n";
                return 1;
            }
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "--no-console") {
            enable_console = false;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            PrintUsage(argv[0]);
            return 1;
        }
    }
    
    if (!std::filesystem::exists(config_file)) {
        std::cerr << "Configuration file not found: " << config_file << "\n";
        return 1;
    }
    
    try {
        ConfigManager config_manager;
        if (!config_manager.LoadServiceConfig(config_file) || 
            !config_manager.ValidateServiceConfig()) {
            std::cerr << "Invalid configuration: " << config_file << "\n";
            return 1;
        }
        const auto& config = config_manager.GetServiceConfig();
        
        // 命令行参数覆盖配置文件中的日志设置
        const LoggingConfig& logging = config.logging;
        LogLevel console_level = verbose ? LogLevel::DEBUG : ParseLogLevel(logging.console_level);
        LogLevel file_level = ParseLogLevel(logging.file_level);
        std::string log_path = log_file.empty() ? logging.file : log_file;
        
        Logger::GetInstance().Initialize(log_path, console_level, file_level,
                                         enable_console && logging.console, !log_path.empty());
        
        LOG_INFO("Fair Slot Service Starting", "Main");
        LOG_INFO("Config file: " + config_file, "Main");
        LOG_INFO("Thread count: " + (thread_count > 0 ? std::to_string(thread_count) : "config"), 
                 "Main");
        
        LoadTestEngine engine;
        bool success = engine.Run(config, thread_count);
        
        if (success) {
            LOG_INFO("Load test completed successfully", "Main");
            return 0;
        } else {
            LOG_ERROR("Load test failed", "Main");
            return 1;
        }
        
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: " + std::string(e.what()), "Main");
        return 1;
    }
}
