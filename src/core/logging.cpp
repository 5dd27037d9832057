#include "kemtls/core/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace kemtls::protocol {

namespace {
    constexpr const char* kLoggerName = "kemtls";

    std::mutex& LoggerMutex() {
        static std::mutex mutex;
        return mutex;
    }

    std::shared_ptr<spdlog::logger>& LoggerSlot() {
        static std::shared_ptr<spdlog::logger> logger;
        return logger;
    }
}

std::shared_ptr<spdlog::logger> Logging::Get() {
    std::lock_guard lock(LoggerMutex());
    auto& slot = LoggerSlot();
    if (!slot) {
        auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] %^[%l]%$ %v");
        slot = std::make_shared<spdlog::logger>(kLoggerName, std::move(sink));
        slot->set_level(Level::info);
    }
    return slot;
}

void Logging::Set(std::shared_ptr<spdlog::logger> logger) {
    std::lock_guard lock(LoggerMutex());
    LoggerSlot() = std::move(logger);
}

void Logging::SetLevel(const Level level) {
    Get()->set_level(level);
}

}  // namespace kemtls::protocol
