/* SPDX-FileCopyrightText: 2025 DollyCam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <fmt/format.h>
#include <iostream>
#include <memory>
#include <mutex>
#include <source_location>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <vector>

namespace dolly::core {

    // Console sink: "[hh:mm:ss.mmm] [level] file:line  message", frame logs in their own color
    template <typename Mutex>
    class frame_color_sink : public spdlog::sinks::base_sink<Mutex> {
    public:
        frame_color_sink() {
            colors_[spdlog::level::trace] = "\033[37m";
            colors_[spdlog::level::debug] = "\033[36m";
            colors_[spdlog::level::info] = "\033[32m";
            colors_[spdlog::level::warn] = "\033[33m";
            colors_[spdlog::level::err] = "\033[31m";
            colors_[spdlog::level::critical] = "\033[1;31m";
            colors_[spdlog::level::off] = "\033[0m";

            frame_color_ = "\033[94m";
            reset_color_ = "\033[0m";
        }

    protected:
        void sink_it_(const spdlog::details::log_msg& msg) override {
            const auto time_t_val = std::chrono::system_clock::to_time_t(msg.time);
            const auto tm = *std::localtime(&time_t_val);
            const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                    msg.time.time_since_epoch())
                                    .count() %
                                1000;

            std::string_view full_path(msg.source.filename ? msg.source.filename : "");
            const auto last_slash = full_path.find_last_of("/\\");
            const std::string_view filename = (last_slash != std::string_view::npos)
                                                  ? full_path.substr(last_slash + 1)
                                                  : full_path;

            std::string_view payload(msg.payload.data(), msg.payload.size());
            std::string label;
            std::string color;

            // Frame logs carry a [FRAME] prefix
            if (payload.starts_with("[FRAME] ")) {
                payload.remove_prefix(8);
                label = "frame";
                color = frame_color_;
            } else {
                switch (msg.level) {
                case spdlog::level::trace: label = "trace"; break;
                case spdlog::level::debug: label = "debug"; break;
                case spdlog::level::info: label = "info"; break;
                case spdlog::level::warn: label = "warn"; break;
                case spdlog::level::err: label = "error"; break;
                case spdlog::level::critical: label = "critical"; break;
                default: label = "info"; break;
                }
                color = colors_[msg.level];
            }

            std::cout << fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {}[{}]{} {}:{}  {}\n",
                                     tm.tm_hour,
                                     tm.tm_min,
                                     tm.tm_sec,
                                     static_cast<int>(millis),
                                     color,
                                     label,
                                     reset_color_,
                                     filename,
                                     msg.source.line,
                                     payload)
                      << std::flush;
        }

        void flush_() override {
            std::cout << std::flush;
        }

    private:
        std::array<std::string, 7> colors_;
        std::string frame_color_;
        std::string reset_color_;
    };

    using frame_color_sink_mt = frame_color_sink<std::mutex>;
    using frame_color_sink_st = frame_color_sink<spdlog::details::null_mutex>;

    enum class LogLevel : uint8_t {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5,
        Off = 6
    };

    // Module detection from file path
    enum class LogModule : uint8_t {
        Core = 0,
        Path = 1,
        Sequencer = 2,
        Operator = 3,
        Input = 4,
        App = 5,
        Unknown = 6,
        Count = 7
    };

    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void init(LogLevel console_level = LogLevel::Info,
                  const std::string& log_file = "") {
            std::lock_guard lock(mutex_);

            std::vector<spdlog::sink_ptr> sinks;

            auto console_sink = std::make_shared<frame_color_sink_mt>();
            sinks.push_back(console_sink);

            if (!log_file.empty()) {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
                file_sink->set_level(spdlog::level::trace);
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %s:%# %v");
                sinks.push_back(file_sink);
            }

            logger_ = std::make_shared<spdlog::logger>("dolly", sinks.begin(), sinks.end());
            logger_->set_level(spdlog::level::trace);
            spdlog::set_default_logger(logger_);

            global_level_ = static_cast<uint8_t>(console_level);

            for (size_t i = 0; i < static_cast<size_t>(LogModule::Count); ++i) {
                module_enabled_[i] = true;
                module_level_[i] = static_cast<uint8_t>(LogLevel::Trace);
            }
        }

        template <typename... Args>
        void log_internal(LogLevel level, const std::source_location& loc,
                          fmt::format_string<Args...> format, Args&&... args) {
            if (!logger_)
                return;

            const auto module_idx = static_cast<size_t>(detect_module(loc.file_name()));
            if (!module_enabled_[module_idx] ||
                static_cast<uint8_t>(level) < module_level_[module_idx]) {
                return;
            }
            if (static_cast<uint8_t>(level) < global_level_) {
                return;
            }

            logger_->log(
                spdlog::source_loc{loc.file_name(),
                                   static_cast<int>(loc.line()),
                                   loc.function_name()},
                to_spdlog_level(level),
                fmt::format(format, std::forward<Args>(args)...));
        }

        // Per-frame state dump, only emitted while frame logging is on
        template <typename... Args>
        void log_frame(const std::source_location& loc,
                       fmt::format_string<Args...> format, Args&&... args) {
            if (!logger_ || !frame_logging_)
                return;
            logger_->log(
                spdlog::source_loc{loc.file_name(),
                                   static_cast<int>(loc.line()),
                                   loc.function_name()},
                spdlog::level::info,
                "[FRAME] " + fmt::format(format, std::forward<Args>(args)...));
        }

        void set_frame_logging(bool enabled) { frame_logging_ = enabled; }
        [[nodiscard]] bool frame_logging() const { return frame_logging_; }

        void enable_module(LogModule module, bool enabled = true) {
            module_enabled_[static_cast<size_t>(module)] = enabled;
        }

        void set_module_level(LogModule module, LogLevel level) {
            module_level_[static_cast<size_t>(module)] = static_cast<uint8_t>(level);
        }

        [[nodiscard]] LogLevel module_level(LogModule module) const {
            return static_cast<LogLevel>(module_level_[static_cast<size_t>(module)].load());
        }

        void set_level(LogLevel level) {
            if (logger_) {
                logger_->set_level(to_spdlog_level(level));
            }
            global_level_ = static_cast<uint8_t>(level);
        }

        void flush() {
            if (logger_)
                logger_->flush();
        }

    private:
        Logger() {
            for (size_t i = 0; i < static_cast<size_t>(LogModule::Count); ++i) {
                module_enabled_[i] = true;
                module_level_[i] = static_cast<uint8_t>(LogLevel::Trace);
            }
        }

        static LogModule detect_module(std::string_view path) {
            if (path.find("/path/") != std::string_view::npos)
                return LogModule::Path;
            if (path.find("sequencer") != std::string_view::npos)
                return LogModule::Sequencer;
            if (path.find("input") != std::string_view::npos)
                return LogModule::Input;
            if (path.find("operator") != std::string_view::npos)
                return LogModule::Operator;
            if (path.find("/app/") != std::string_view::npos ||
                path.find("main.cpp") != std::string_view::npos)
                return LogModule::App;
            if (path.find("core") != std::string_view::npos)
                return LogModule::Core;
            return LogModule::Unknown;
        }

        static constexpr spdlog::level::level_enum to_spdlog_level(LogLevel level) {
            switch (level) {
            case LogLevel::Trace: return spdlog::level::trace;
            case LogLevel::Debug: return spdlog::level::debug;
            case LogLevel::Info: return spdlog::level::info;
            case LogLevel::Warn: return spdlog::level::warn;
            case LogLevel::Error: return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off: return spdlog::level::off;
            default: return spdlog::level::info;
            }
        }

        std::shared_ptr<spdlog::logger> logger_;
        mutable std::mutex mutex_;
        std::atomic<uint8_t> global_level_{static_cast<uint8_t>(LogLevel::Info)};
        std::atomic<bool> frame_logging_{false};
        std::array<std::atomic<bool>, static_cast<size_t>(LogModule::Count)> module_enabled_{};
        std::array<std::atomic<uint8_t>, static_cast<size_t>(LogModule::Count)> module_level_{};
    };

    // Scoped timer for performance measurement
    class ScopedTimer {
        std::chrono::high_resolution_clock::time_point start_;
        std::string name_;
        LogLevel level_;
        std::source_location loc_;

    public:
        explicit ScopedTimer(std::string name, LogLevel level = LogLevel::Debug,
                             std::source_location loc = std::source_location::current())
            : start_(std::chrono::high_resolution_clock::now()),
              name_(std::move(name)),
              level_(level),
              loc_(loc) {}

        ~ScopedTimer() {
            const auto duration = std::chrono::high_resolution_clock::now() - start_;
            const auto ms = std::chrono::duration<double, std::milli>(duration).count();
            Logger::get().log_internal(level_, loc_, "{} took {:.2f}ms", name_, ms);
        }
    };

} // namespace dolly::core

#define LOG_TRACE(...) \
    ::dolly::core::Logger::get().log_internal(::dolly::core::LogLevel::Trace, std::source_location::current(), __VA_ARGS__)

#define LOG_DEBUG(...) \
    ::dolly::core::Logger::get().log_internal(::dolly::core::LogLevel::Debug, std::source_location::current(), __VA_ARGS__)

#define LOG_INFO(...) \
    ::dolly::core::Logger::get().log_internal(::dolly::core::LogLevel::Info, std::source_location::current(), __VA_ARGS__)

#define LOG_WARN(...) \
    ::dolly::core::Logger::get().log_internal(::dolly::core::LogLevel::Warn, std::source_location::current(), __VA_ARGS__)

#define LOG_ERROR(...) \
    ::dolly::core::Logger::get().log_internal(::dolly::core::LogLevel::Error, std::source_location::current(), __VA_ARGS__)

#define LOG_CRITICAL(...) \
    ::dolly::core::Logger::get().log_internal(::dolly::core::LogLevel::Critical, std::source_location::current(), __VA_ARGS__)

#define LOG_FRAME(...) \
    ::dolly::core::Logger::get().log_frame(std::source_location::current(), __VA_ARGS__)

#define LOG_TIMER(name)       ::dolly::core::ScopedTimer _timer##__LINE__(name)
#define LOG_TIMER_TRACE(name) ::dolly::core::ScopedTimer _timer##__LINE__(name, ::dolly::core::LogLevel::Trace)
