#include <djson/json.hpp>
#include <nest/core/logger.hpp>
#include <nest/graphics/texture.hpp>
#include <nest/resources/image_loader.hpp>
#include <filesystem>

namespace nest {
namespace {
auto const g_log{logger::Logger{"ImageLoader"}};

auto fail(ResourceLoadError::Kind kind, std::string_view path) -> ImageLoader::Result {
	g_log.error("failed to load '{}': {}", path, to_string(kind));
	return ImageLoader::Result::as_error(ResourceLoadError{.kind = kind, .path = std::string{path}});
}
} // namespace

auto to_string(ResourceLoadError::Kind const kind) -> std::string_view {
	switch (kind) {
	case ResourceLoadError::Kind::eNotFound: return "not found";
	case ResourceLoadError::Kind::eDecodeFailed: return "decode failed";
	case ResourceLoadError::Kind::eInvalidDescriptor: return "invalid descriptor";
	}
	return "unknown";
}

ImageLoader::ImageLoader() : ImageLoader(CreateInfo{}) {}

ImageLoader::ImageLoader(CreateInfo create_info) : m_reader(std::move(create_info.mount_point)) {}

auto ImageLoader::load(std::string_view const path) const -> Result {
	if (std::filesystem::path{path}.extension() == ".json") { return load_descriptor(path); }
	return load_image(path);
}

auto ImageLoader::load(std::span<std::byte const> compressed, std::string name) const -> Result {
	if (compressed.empty()) { return fail(ResourceLoadError::Kind::eNotFound, name); }

	auto texture = graphics::Texture::decode(compressed, name);
	if (!texture) { return fail(ResourceLoadError::Kind::eDecodeFailed, name); }

	g_log.debug("loaded '{}' [{}x{}]", texture->name(), texture->extent().x, texture->extent().y);
	return texture;
}

auto ImageLoader::load_descriptor(std::string_view const path) const -> Result {
	auto const text = m_reader.read_string(path);
	if (text.empty()) { return fail(ResourceLoadError::Kind::eNotFound, path); }

	auto const json = dj::Json::parse(text);
	if (!json) { return fail(ResourceLoadError::Kind::eInvalidDescriptor, path); }

	auto const image_path = json["image"].as<std::string>();
	if (image_path.empty()) { return fail(ResourceLoadError::Kind::eInvalidDescriptor, path); }

	return load_image(image_path);
}

auto ImageLoader::load_image(std::string_view const path) const -> Result {
	auto const bytes = m_reader.read_bytes(path);
	if (bytes.empty()) { return fail(ResourceLoadError::Kind::eNotFound, path); }
	return load(bytes, std::string{path});
}
} // namespace nest
