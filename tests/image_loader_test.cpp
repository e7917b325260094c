#include <nest/graphics/texture.hpp>
#include <nest/resources/image_loader.hpp>
#include <test/temp_dir.hpp>
#include <test/test.hpp>
#include <filesystem>

namespace {
namespace fs = std::filesystem;
using namespace nest;
using Kind = ResourceLoadError::Kind;

// 2x1 binary PPM: one red pixel, one blue pixel
auto make_ppm() -> std::string {
	auto ret = std::string{"P6\n2 1\n255\n"};
	for (int const channel : {255, 0, 0, 0, 0, 255}) { ret.push_back(static_cast<char>(channel)); }
	return ret;
}

auto to_bytes(std::string_view const text) -> std::vector<std::byte> {
	auto ret = std::vector<std::byte>{};
	for (char const c : text) { ret.push_back(static_cast<std::byte>(c)); }
	return ret;
}

ADD_TEST(ImageLoader_Memory) {
	auto const loader = ImageLoader{};
	auto const result = loader.load(to_bytes(make_ppm()), "pixels");
	ASSERT(result.has_value());
	auto const& texture = result.value();
	ASSERT(texture != nullptr);
	EXPECT(texture->extent() == glm::uvec2{2, 1});
	EXPECT(texture->name() == "pixels");
	ASSERT(texture->bytes().size() == 8);
	EXPECT(texture->bytes()[0] == std::byte{255});
	EXPECT(texture->bytes()[3] == std::byte{255});
	EXPECT(texture->bytes()[6] == std::byte{255});
	EXPECT(texture->height_per_width() == 0.5f);
}

ADD_TEST(Texture_Decode) {
	auto const texture = graphics::Texture::decode(to_bytes(make_ppm()), "decoded");
	ASSERT(texture != nullptr);
	EXPECT(texture->extent() == glm::uvec2{2, 1});
	EXPECT(texture->bytes().size() == 2 * graphics::Bitmap::channels_v);
	EXPECT(texture->bitmap().extent == texture->extent());

	EXPECT(graphics::Texture::decode({}) == nullptr);
	EXPECT(graphics::Texture::decode(to_bytes("not an image")) == nullptr);
}

ADD_TEST(ImageLoader_Errors) {
	auto const loader = ImageLoader{{.mount_point = fs::temp_directory_path().generic_string()}};

	auto result = loader.load("nest/does/not/exist.png");
	ASSERT(result.has_error());
	EXPECT(result.error().kind == Kind::eNotFound);
	EXPECT(result.error().path == "nest/does/not/exist.png");

	result = loader.load(to_bytes("definitely not an image"), "garbage");
	ASSERT(result.has_error());
	EXPECT(result.error().kind == Kind::eDecodeFailed);

	result = loader.load({}, "empty");
	ASSERT(result.has_error());
	EXPECT(result.error().kind == Kind::eNotFound);

	EXPECT(to_string(Kind::eNotFound) == "not found");
	EXPECT(to_string(Kind::eDecodeFailed) == "decode failed");
	EXPECT(to_string(Kind::eInvalidDescriptor) == "invalid descriptor");
}

ADD_TEST(ImageLoader_Descriptor) {
	auto const dir = test::TempDir{"image-loader"};
	dir.write("petal.ppm", make_ppm());
	dir.write("petal.json", R"({ "image": "petal.ppm" })");
	dir.write("no_image.json", R"({ "name": "petal" })");
	dir.write("dangling.json", R"({ "image": "missing.ppm" })");

	auto const loader = ImageLoader{{.mount_point = dir.path().generic_string()}};
	EXPECT(loader.reader().exists("petal.ppm"));

	auto result = loader.load("petal.json");
	ASSERT(result.has_value());
	EXPECT(result.value()->extent() == glm::uvec2{2, 1});
	EXPECT(result.value()->name() == "petal.ppm");

	// direct load yields an equivalent (but distinct) texture
	auto const direct = loader.load("petal.ppm");
	ASSERT(direct.has_value());
	EXPECT(direct.value() != result.value());
	EXPECT(direct.value()->extent() == result.value()->extent());

	result = loader.load("no_image.json");
	ASSERT(result.has_error());
	EXPECT(result.error().kind == Kind::eInvalidDescriptor);
	EXPECT(result.error().path == "no_image.json");

	result = loader.load("dangling.json");
	ASSERT(result.has_error());
	EXPECT(result.error().kind == Kind::eNotFound);
	EXPECT(result.error().path == "missing.ppm");

	result = loader.load("absent.json");
	ASSERT(result.has_error());
	EXPECT(result.error().kind == Kind::eNotFound);
}
} // namespace
