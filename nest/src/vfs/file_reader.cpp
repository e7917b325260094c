#include <nest/vfs/file_reader.hpp>
#include <filesystem>
#include <fstream>

namespace nest {
namespace {
namespace fs = std::filesystem;

template <typename OutT>
	requires(sizeof(std::declval<OutT>()[0]) == sizeof(char))
auto read_into(OutT& out, std::string const& path) -> void {
	auto file = std::ifstream{path, std::ios::binary | std::ios::ate};
	if (!file) { return; }
	auto const size = file.tellg();
	if (size <= 0) { return; }
	out.resize(static_cast<std::size_t>(size));
	file.seekg({}, std::ios::beg);
	// NOLINTNEXTLINE
	file.read(reinterpret_cast<char*>(out.data()), size);
}
} // namespace

auto FileReader::find_super_directory(std::string_view suffix, std::string_view start_path) -> std::string {
	for (auto path = fs::absolute(start_path); !path.empty() && path != path.parent_path(); path = path.parent_path()) {
		auto ret = path / suffix;
		if (fs::is_directory(ret)) { return ret.generic_string(); }
	}
	return {};
}

auto FileReader::read_bytes(std::string_view const path) const -> std::vector<std::byte> {
	auto ret = std::vector<std::byte>{};
	read_into(ret, absolute(path));
	return ret;
}

auto FileReader::read_string(std::string_view const path) const -> std::string {
	auto ret = std::string{};
	read_into(ret, absolute(path));
	return ret;
}

auto FileReader::exists(std::string_view const path) const -> bool { return fs::is_regular_file(absolute(path)); }

auto FileReader::absolute(std::string_view const path) const -> std::string {
	auto const input = fs::path{path};
	if (input.is_absolute()) { return input.generic_string(); }
	return (fs::path{m_mount_point} / input).generic_string();
}
} // namespace nest
