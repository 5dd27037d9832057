#pragma once
#include <spdlog/spdlog.h>
#include <memory>

namespace kemtls::protocol {

/// Library-wide logger named "kemtls". Created lazily with a colour stdout
/// sink at info level; embedders may replace it with their own.
class Logging {
public:
    using Level = spdlog::level::level_enum;

    [[nodiscard]] static std::shared_ptr<spdlog::logger> Get();
    static void Set(std::shared_ptr<spdlog::logger> logger);
    static void SetLevel(Level level);

private:
    Logging() = delete;
};

}  // namespace kemtls::protocol
