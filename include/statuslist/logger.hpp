/**
 * @file logger.hpp
 * @brief Library logging.
 *
 * Thread-safe singleton that configures spdlog for stderr and optional
 * rotating file output. Library code logs through LogManager::Instance().
 */

#ifndef STATUSLIST_LOGGER_HPP
#define STATUSLIST_LOGGER_HPP

#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace statuslist {

class LogManager {
public:
    static LogManager& Instance();

    /**
     * @brief Configure sinks once per process.
     *
     * Later calls are ignored. An empty @p log_file disables file output.
     */
    void Initialize(const std::string& log_file = "",
                    spdlog::level::level_enum level = spdlog::level::warn);

    std::shared_ptr<spdlog::logger> Logger();
    void SetLevel(spdlog::level::level_enum level);

    template <typename... Args>
    void Debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        Logger()->debug(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void Info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        Logger()->info(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void Warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        Logger()->warn(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void Error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        Logger()->error(fmt, std::forward<Args>(args)...);
    }

private:
    LogManager() = default;
    void ConfigureLogger(const std::string& log_file, spdlog::level::level_enum level);

    std::shared_ptr<spdlog::logger> logger_;
    std::once_flag init_flag_;
};

} // namespace statuslist

#endif // STATUSLIST_LOGGER_HPP
