#ifndef BLUEADV_CORE_LOGGER_HPP
#define BLUEADV_CORE_LOGGER_HPP

#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <sstream>
#include <map>
#include <vector>
#include <cstdint>

namespace blueadv
{
    namespace core
    {

        enum class LogLevel
        {
            DEBUG = 0,
            INFO = 1,
            WARNING = 2,
            ERROR = 3,
            CRITICAL = 4
        };

        /**
         * Key-value pairs appended to a log line, sorted by key
         */
        class LogContext
        {
        public:
            LogContext() = default;

            template <typename T>
            LogContext &add(const std::string &key, const T &value)
            {
                std::ostringstream ss;
                ss << value;
                fields_[key] = ss.str();
                return *this;
            }

            // Byte payloads are rendered as contiguous lowercase hex
            LogContext &add_hex(const std::string &key, const std::vector<uint8_t> &bytes);

            std::string format() const;
            bool empty() const { return fields_.empty(); }
            size_t size() const { return fields_.size(); }

        private:
            std::map<std::string, std::string> fields_;
        };

        /**
         * Named, thread-safe logger writing to console and/or a file
         */
        class Logger
        {
        public:
            explicit Logger(const std::string &name, LogLevel level = LogLevel::INFO);
            ~Logger();

            void set_level(LogLevel level) { level_ = level; }
            LogLevel level() const { return level_; }
            void set_output_file(const std::string &filename);
            void set_console_output(bool enabled) { console_output_ = enabled; }

            void debug(const std::string &message, const LogContext &context = LogContext{});
            void info(const std::string &message, const LogContext &context = LogContext{});
            void warning(const std::string &message, const LogContext &context = LogContext{});
            void error(const std::string &message, const LogContext &context = LogContext{});
            void critical(const std::string &message, const LogContext &context = LogContext{});

            bool is_enabled(LogLevel level) const { return level >= level_; }
            const std::string &name() const { return name_; }

            std::string format_message(LogLevel level, const std::string &message, const LogContext &context) const;

        private:
            void log(LogLevel level, const std::string &message, const LogContext &context);

            std::string name_;
            LogLevel level_;
            bool console_output_;
            std::unique_ptr<std::ofstream> file_output_;
            mutable std::mutex mutex_;
        };

        /**
         * Owns every named logger so that setup_logging() reaches loggers
         * created before and after it is called
         */
        class LoggerManager
        {
        public:
            static LoggerManager &instance();

            void setup_logging(LogLevel level = LogLevel::INFO,
                               const std::string &log_file = "",
                               bool console_output = true);

            std::shared_ptr<Logger> get_logger(const std::string &name);

            static LogLevel string_to_level(const std::string &level_str);
            static std::string level_to_string(LogLevel level);

        private:
            LoggerManager() = default;

            LogLevel default_level_ = LogLevel::WARNING;
            std::string default_log_file_;
            bool default_console_output_ = true;
            std::map<std::string, std::shared_ptr<Logger>> loggers_;
            std::mutex mutex_;
        };

        std::shared_ptr<Logger> get_logger(const std::string &name);
        void setup_logging(LogLevel level = LogLevel::INFO,
                           const std::string &log_file = "",
                           bool console_output = true);

    } // namespace core
} // namespace blueadv

#endif // BLUEADV_CORE_LOGGER_HPP
