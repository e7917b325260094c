#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace nest {
///
/// \brief Reads files relative to a mount point.
///
class FileReader {
  public:
	///
	/// \brief Walk up from start_path until a directory named suffix is found.
	/// \returns Path of found directory, or empty string
	///
	[[nodiscard]] static auto find_super_directory(std::string_view suffix, std::string_view start_path) -> std::string;

	explicit FileReader(std::string mount_point = ".") : m_mount_point(std::move(mount_point)) {}

	///
	/// \brief Read entire file.
	/// \returns Empty vector if path does not exist or cannot be opened
	///
	[[nodiscard]] auto read_bytes(std::string_view path) const -> std::vector<std::byte>;
	[[nodiscard]] auto read_string(std::string_view path) const -> std::string;

	[[nodiscard]] auto exists(std::string_view path) const -> bool;
	[[nodiscard]] auto absolute(std::string_view path) const -> std::string;
	[[nodiscard]] auto mount_point() const -> std::string_view { return m_mount_point; }

  private:
	std::string m_mount_point{};
};
} // namespace nest
