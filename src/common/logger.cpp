/**
 * @file logger.cpp
 * @brief Logger implementation
 */

#include "common/logger.hpp"

namespace smither {

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;
std::once_flag Logger::init_flag_;

void Logger::init(const std::string& name, spdlog::level::level_enum level) {
    std::call_once(init_flag_, [&] {
        // Another component may have registered the same name already.
        logger_ = spdlog::get(name);
        if (logger_ == nullptr) {
            logger_ = spdlog::stdout_color_mt(name);
        }
        logger_->set_level(level);
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
    });
}

std::shared_ptr<spdlog::logger>& Logger::get() {
    init();
    return logger_;
}

void Logger::set_level(spdlog::level::level_enum level) {
    init();
    logger_->set_level(level);
}

}  // namespace smither
