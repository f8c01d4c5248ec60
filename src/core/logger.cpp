#include "core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace blueadv
{
    namespace core
    {
        namespace
        {
            std::string current_timestamp()
            {
                auto now = std::chrono::system_clock::now();
                std::time_t seconds = std::chrono::system_clock::to_time_t(now);
                auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                  now.time_since_epoch()) %
                              1000;

                std::tm local{};
                localtime_r(&seconds, &local);

                std::ostringstream ss;
                ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
                   << "." << std::setfill('0') << std::setw(3) << millis.count();
                return ss.str();
            }
        } // namespace

        LogContext &LogContext::add_hex(const std::string &key, const std::vector<uint8_t> &bytes)
        {
            std::ostringstream ss;
            ss << std::hex << std::setfill('0');
            for (uint8_t b : bytes)
            {
                ss << std::setw(2) << static_cast<int>(b);
            }
            fields_[key] = ss.str();
            return *this;
        }

        std::string LogContext::format() const
        {
            std::ostringstream ss;
            for (auto it = fields_.begin(); it != fields_.end(); ++it)
            {
                if (it != fields_.begin())
                {
                    ss << " ";
                }
                ss << it->first << "=" << it->second;
            }
            return ss.str();
        }

        Logger::Logger(const std::string &name, LogLevel level)
            : name_(name), level_(level), console_output_(true)
        {
        }

        Logger::~Logger()
        {
            if (file_output_)
            {
                file_output_->close();
            }
        }

        void Logger::set_output_file(const std::string &filename)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            if (file_output_)
            {
                file_output_->close();
                file_output_.reset();
            }

            if (filename.empty())
            {
                return;
            }

            file_output_ = std::make_unique<std::ofstream>(filename, std::ios::app);
            if (!file_output_->is_open())
            {
                std::cerr << "Failed to open log file: " << filename << std::endl;
                file_output_.reset();
            }
        }

        void Logger::debug(const std::string &message, const LogContext &context)
        {
            if (is_enabled(LogLevel::DEBUG))
                log(LogLevel::DEBUG, message, context);
        }

        void Logger::info(const std::string &message, const LogContext &context)
        {
            if (is_enabled(LogLevel::INFO))
                log(LogLevel::INFO, message, context);
        }

        void Logger::warning(const std::string &message, const LogContext &context)
        {
            if (is_enabled(LogLevel::WARNING))
                log(LogLevel::WARNING, message, context);
        }

        void Logger::error(const std::string &message, const LogContext &context)
        {
            if (is_enabled(LogLevel::ERROR))
                log(LogLevel::ERROR, message, context);
        }

        void Logger::critical(const std::string &message, const LogContext &context)
        {
            if (is_enabled(LogLevel::CRITICAL))
                log(LogLevel::CRITICAL, message, context);
        }

        void Logger::log(LogLevel level, const std::string &message, const LogContext &context)
        {
            std::string line = format_message(level, message, context);

            std::lock_guard<std::mutex> lock(mutex_);

            if (console_output_)
            {
                std::ostream &out = level >= LogLevel::ERROR ? std::cerr : std::cout;
                out << line << std::endl;
            }

            if (file_output_ && file_output_->is_open())
            {
                *file_output_ << line << std::endl;
            }
        }

        std::string Logger::format_message(LogLevel level, const std::string &message, const LogContext &context) const
        {
            std::ostringstream ss;
            ss << current_timestamp() << " [" << LoggerManager::level_to_string(level) << "] "
               << name_ << ": " << message;

            if (!context.empty())
            {
                ss << " " << context.format();
            }
            return ss.str();
        }

        LoggerManager &LoggerManager::instance()
        {
            static LoggerManager manager;
            return manager;
        }

        void LoggerManager::setup_logging(LogLevel level, const std::string &log_file, bool console_output)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            default_level_ = level;
            default_log_file_ = log_file;
            default_console_output_ = console_output;

            for (auto &[name, logger] : loggers_)
            {
                logger->set_level(level);
                logger->set_console_output(console_output);
                logger->set_output_file(log_file);
            }
        }

        std::shared_ptr<Logger> LoggerManager::get_logger(const std::string &name)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            auto it = loggers_.find(name);
            if (it != loggers_.end())
            {
                return it->second;
            }

            auto logger = std::make_shared<Logger>(name, default_level_);
            logger->set_console_output(default_console_output_);
            if (!default_log_file_.empty())
            {
                logger->set_output_file(default_log_file_);
            }

            loggers_[name] = logger;
            return logger;
        }

        LogLevel LoggerManager::string_to_level(const std::string &level_str)
        {
            std::string upper = level_str;
            std::transform(upper.begin(), upper.end(), upper.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

            if (upper == "DEBUG")
                return LogLevel::DEBUG;
            if (upper == "INFO")
                return LogLevel::INFO;
            if (upper == "WARNING" || upper == "WARN")
                return LogLevel::WARNING;
            if (upper == "ERROR")
                return LogLevel::ERROR;
            if (upper == "CRITICAL" || upper == "CRIT")
                return LogLevel::CRITICAL;

            return LogLevel::INFO;
        }

        std::string LoggerManager::level_to_string(LogLevel level)
        {
            switch (level)
            {
            case LogLevel::DEBUG:
                return "DEBUG";
            case LogLevel::INFO:
                return "INFO";
            case LogLevel::WARNING:
                return "WARN";
            case LogLevel::ERROR:
                return "ERROR";
            case LogLevel::CRITICAL:
                return "CRIT";
            }
            return "UNKNOWN";
        }

        std::shared_ptr<Logger> get_logger(const std::string &name)
        {
            return LoggerManager::instance().get_logger(name);
        }

        void setup_logging(LogLevel level, const std::string &log_file, bool console_output)
        {
            LoggerManager::instance().setup_logging(level, log_file, console_output);
        }

    } // namespace core
} // namespace blueadv
