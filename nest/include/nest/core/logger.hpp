#pragma once
#include <chrono>
#include <format>
#include <memory>
#include <string>
#include <string_view>

namespace nest::logger {
using Clock = std::chrono::system_clock;

inline constexpr auto error_v{'E'};
inline constexpr auto warn_v{'W'};
inline constexpr auto info_v{'I'};
inline constexpr auto debug_v{'D'};

///
/// \brief Format a single log line: [level][Tthread] [domain] message [HH:MM:SS], time in UTC.
///
[[nodiscard]] auto format_line(std::string_view domain, std::string_view message, char level) -> std::string;

auto print(std::string_view domain, std::string_view message, char level) -> void;

struct Logger {
	std::string_view domain{};

	template <typename... Args>
	auto error(std::format_string<Args...> fmt, Args&&... args) const {
		print(domain, std::format(fmt, std::forward<Args>(args)...), error_v);
	}

	template <typename... Args>
	auto warn(std::format_string<Args...> fmt, Args&&... args) const {
		print(domain, std::format(fmt, std::forward<Args>(args)...), warn_v);
	}

	template <typename... Args>
	auto info(std::format_string<Args...> fmt, Args&&... args) const {
		print(domain, std::format(fmt, std::forward<Args>(args)...), info_v);
	}

	template <typename... Args>
	auto debug(std::format_string<Args...> fmt, Args&&... args) const {
		print(domain, std::format(fmt, std::forward<Args>(args)...), debug_v);
	}
};

struct File;

///
/// \brief Mirror all log output to a file for as long as the returned handle is alive.
/// \param path Path of log file (truncated on open)
///
/// Each line is written and flushed as it is logged. Calling again while a handle is alive redirects the same sink.
///
[[nodiscard]] auto log_to_file(std::string path = "nest.log") -> std::shared_ptr<File>;

inline auto const g_log{Logger{"nest"}};
} // namespace nest::logger
