#pragma once
#include <filesystem>
#include <format>
#include <fstream>
#include <random>
#include <string_view>
#include <system_error>

namespace test {
///
/// \brief Uniquely named scratch directory, removed with everything in it on destruction.
///
class TempDir {
  public:
	explicit TempDir(std::string_view const prefix) {
		auto device = std::random_device{};
		auto const base = std::filesystem::temp_directory_path();
		do {
			m_path = base / std::format("nest-{}-{:08x}{:08x}", prefix, device(), device());
		} while (!std::filesystem::create_directories(m_path));
	}

	TempDir(TempDir const&) = delete;
	TempDir(TempDir&&) = delete;
	auto operator=(TempDir const&) -> TempDir& = delete;
	auto operator=(TempDir&&) -> TempDir& = delete;

	~TempDir() {
		auto ec = std::error_code{};
		std::filesystem::remove_all(m_path, ec);
	}

	[[nodiscard]] auto path() const -> std::filesystem::path const& { return m_path; }

	auto write(std::filesystem::path const& relative, std::string_view const contents) const -> void {
		auto const target = m_path / relative;
		std::filesystem::create_directories(target.parent_path());
		auto file = std::ofstream{target, std::ios::binary};
		file << contents;
	}

  private:
	std::filesystem::path m_path{};
};
} // namespace test
