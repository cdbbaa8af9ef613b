#pragma once

#include <chrono>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

namespace storefront {

inline std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&time_t, &tm);
    std::stringstream ss;
    ss << std::put_time(&tm, "%FT%TZ");
    return ss.str();
}

namespace detail {

/**
 * Write one JSON log line. Never throws: invalid UTF-8 in any field is
 * replaced with U+FFFD, and a record that still cannot be built falls back
 * to a plain line.
 */
inline void emit_log(std::ostream& out, const char* level, const std::string& component,
                     const std::string& message, const nlohmann::json& fields) noexcept {
    try {
        nlohmann::json log_entry = {
            {"level", level},
            {"message", message},
            {"component", component},
            {"timestamp", now_iso8601()}
        };
        for (auto& [key, value] : fields.items()) {
            log_entry[key] = value;
        }
        out << log_entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
            << std::endl;
    } catch (const std::exception& e) {
        out << level << " " << component << " " << message << " (log record dropped: "
            << e.what() << ")" << std::endl;
    }
}

} // namespace detail

inline void log_info(const std::string& component, const std::string& message,
                     const nlohmann::json& fields = {}) noexcept {
    detail::emit_log(std::cout, "info", component, message, fields);
}

inline void log_warn(const std::string& component, const std::string& message,
                     const nlohmann::json& fields = {}) noexcept {
    detail::emit_log(std::cerr, "warn", component, message, fields);
}

inline void log_error(const std::string& component, const std::string& message,
                      const nlohmann::json& fields = {}) noexcept {
    detail::emit_log(std::cerr, "error", component, message, fields);
}

} // namespace storefront
