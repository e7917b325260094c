#include <nest/core/logger.hpp>
#include <atomic>
#include <fstream>
#include <iostream>
#include <mutex>

namespace nest {
struct logger::File {
	std::mutex mutex{};
	std::ofstream stream{};

	auto open(std::string const& path) -> void {
		auto lock = std::scoped_lock{mutex};
		stream = std::ofstream{path, std::ios::binary | std::ios::trunc};
		if (!stream) { std::cerr << std::format("[{}] [nest] failed to open log file '{}'\n", error_v, path); }
	}

	auto write(std::string_view const line) -> void {
		auto lock = std::scoped_lock{mutex};
		if (!stream) { return; }
		stream << line;
		stream.flush();
	}
};

namespace {
// sequential per-thread index, stable for the thread's lifetime
auto this_thread_index() -> int {
	static auto s_count{std::atomic<int>{}};
	thread_local auto const ret{s_count.fetch_add(1)};
	return ret;
}

struct Sink {
	std::mutex mutex{};
	std::weak_ptr<logger::File> file{};

	auto get() -> std::shared_ptr<logger::File> {
		auto lock = std::scoped_lock{mutex};
		return file.lock();
	}
};

auto sink() -> Sink& {
	static auto ret = Sink{};
	return ret;
}
} // namespace

auto logger::format_line(std::string_view const domain, std::string_view const message, char const level) -> std::string {
	auto const now = std::chrono::floor<std::chrono::seconds>(Clock::now());
	return std::format("[{}][T{}] [{}] {} [{:%T}]\n", level, this_thread_index(), domain, message, now);
}

auto logger::print(std::string_view const domain, std::string_view const message, char const level) -> void {
	auto const line = format_line(domain, message, level);
	if (auto file = sink().get()) { file->write(line); }
	(level == error_v ? std::cerr : std::cout) << line;
}

auto logger::log_to_file(std::string path) -> std::shared_ptr<File> {
	auto& global = sink();
	auto lock = std::scoped_lock{global.mutex};
	auto ret = global.file.lock();
	if (!ret) {
		ret = std::make_shared<File>();
		global.file = ret;
	}
	ret->open(path);
	return ret;
}
} // namespace nest
