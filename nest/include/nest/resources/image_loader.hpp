#pragma once
#include <nest/core/result.hpp>
#include <nest/vfs/file_reader.hpp>
#include <memory>
#include <span>
#include <string>

namespace nest {
namespace graphics {
class Texture;
}

struct ResourceLoadError {
	enum class Kind : int {
		eNotFound,
		eDecodeFailed,
		eInvalidDescriptor,
	};

	Kind kind{};
	std::string path{};
};

[[nodiscard]] auto to_string(ResourceLoadError::Kind kind) -> std::string_view;

///
/// \brief Loads images into shareable, immutable textures.
///
/// Paths are resolved against CreateInfo::mount_point. A path with a .json extension is a texture descriptor:
/// 	{ "image": "petal.png" }
/// whose image path is resolved against the same mount point.
/// Failures are logged and returned, never retried.
///
class ImageLoader {
  public:
	using TexturePtr = std::shared_ptr<graphics::Texture const>;
	using Result = nest::Result<TexturePtr, ResourceLoadError>;

	struct CreateInfo {
		std::string mount_point{"."};
	};

	ImageLoader();
	explicit ImageLoader(CreateInfo create_info);

	[[nodiscard]] auto load(std::string_view path) const -> Result;
	[[nodiscard]] auto load(std::span<std::byte const> compressed, std::string name) const -> Result;

	[[nodiscard]] auto reader() const -> FileReader const& { return m_reader; }

  private:
	[[nodiscard]] auto load_descriptor(std::string_view path) const -> Result;
	[[nodiscard]] auto load_image(std::string_view path) const -> Result;

	FileReader m_reader;
};
} // namespace nest
