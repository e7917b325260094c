#include <nest/nest.hpp>
#include <nest/vfs/file_reader.hpp>
#include <charconv>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <string_view>

namespace example {
using namespace nest;

namespace {
auto const g_log{logger::Logger{"Example"}};

struct Config {
	std::string image_uri{"petal.json"};
	std::size_t frames{120};
	float frame_rate{60.0f};
	float spin{1.0f}; // radians per second
	std::size_t petals{6};
};

// usage: nest-example [image_uri] [frames]
auto parse_args(int argc, char const* const* argv) -> Config {
	auto ret = Config{};
	if (argc > 1) { ret.image_uri = argv[1]; } // NOLINT
	if (argc > 2) {
		auto const str = std::string_view{argv[2]}; // NOLINT
		auto frames = std::size_t{};
		auto const result = std::from_chars(str.data(), str.data() + str.size(), frames);
		if (result.ec == std::errc{}) {
			ret.frames = frames;
		} else {
			g_log.warn("invalid frame count: '{}', using {}", str, ret.frames);
		}
	}
	return ret;
}

auto data_path(char const* exe_path) -> std::string {
	auto ret = FileReader::find_super_directory("example/data", std::filesystem::path{exe_path}.parent_path().string());
	if (ret.empty()) { ret = FileReader::find_super_directory("data", std::filesystem::current_path().string()); }
	if (ret.empty()) { return "."; }
	return ret;
}

// a petal: image rectangle 0.4 wide, pushed out from the centre of the flower
auto make_petal(ImageLoader const& loader, std::string_view uri) -> Translate<Rect> {
	if (auto const texture = loader.load(uri)) { return image_w(texture.value(), 0.4f).translate({0.3f, 0.0f}); }
	g_log.warn("using flat coloured petals");
	return Rect{{-0.2f, -0.1f}, {0.2f, 0.1f}, graphics::magenta_v}.translate({0.3f, 0.0f});
}

auto run(Config const& config, std::string mount_point) -> void {
	auto const loader = ImageLoader{ImageLoader::CreateInfo{.mount_point = std::move(mount_point)}};
	auto const petal = make_petal(loader, config.image_uri);

	// N copies of the petal rotated around the centre
	auto const petals = static_cast<float>(config.petals);
	auto const flower = generate(config.petals, [&](std::size_t i) { return petal.rotate(static_cast<float>(i) / petals * tau_v); });
	auto const stem = Rect{{-0.02f, -1.0f}, {0.02f, 0.0f}, graphics::green_v};

	auto draw_list = graphics::DrawList{};
	for (std::size_t frame = 0; frame < config.frames; ++frame) {
		auto const elapsed = static_cast<float>(frame) / config.frame_rate;
		draw_list.clear();
		// stem first: emission order is draw order
		draw_list.append(stem.combine(flower.rotate(elapsed * config.spin)));
		if (frame % static_cast<std::size_t>(config.frame_rate) == 0) {
			g_log.info("frame {}: {} triangles in {} batch(es)", frame, draw_list.triangle_count(), draw_list.batches().size());
		}
	}
	g_log.info("drew {} frames of {} triangles", config.frames, draw_list.triangle_count());
}
} // namespace
} // namespace example

auto main(int argc, char** argv) -> int {
	if (argc < 1) { return EXIT_FAILURE; }

	auto const log_file = nest::logger::log_to_file("nest-example.log");
	try {
		auto const config = example::parse_args(argc, argv);
		example::run(config, example::data_path(*argv));
	} catch (std::exception const& e) {
		example::g_log.error("fatal error: {}", e.what());
		return EXIT_FAILURE;
	}
}
