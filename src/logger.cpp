#include "logger.hpp"
#include <mutex>
#include <stdexcept>

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;

namespace {
    std::mutex init_mx; // guards Logger::logger_
}

void Logger::create_locked(const std::string& name, spdlog::level::level_enum level) {
    logger_ = spdlog::get(name);
    if (logger_ == nullptr) logger_ = spdlog::stdout_color_mt(name);
    logger_->set_level(level);
    logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
}

void Logger::init(const std::string& name, spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lk(init_mx);
    if (logger_ == nullptr) create_locked(name, level);
}

std::shared_ptr<spdlog::logger> Logger::get() {
    std::lock_guard<std::mutex> lk(init_mx);
    if (logger_ == nullptr) create_locked("pgshift", spdlog::level::info);
    return logger_;
}

void Logger::set_level(spdlog::level::level_enum level) {
    get()->set_level(level);
}

spdlog::level::level_enum Logger::parse_level(const std::string& name) {
    if (name == "trace"   ) return spdlog::level::trace   ;
    if (name == "debug"   ) return spdlog::level::debug   ;
    if (name == "info"    ) return spdlog::level::info    ;
    if (name == "warn"    ) return spdlog::level::warn    ;
    if (name == "error"   ) return spdlog::level::err     ;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off"     ) return spdlog::level::off     ;
    throw std::runtime_error("Invalid log level: " + name);
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lk(init_mx);
    if (logger_ != nullptr) {
        spdlog::drop(logger_->name());
        logger_.reset();
    }
}
