#include <nest/vfs/file_reader.hpp>
#include <test/temp_dir.hpp>
#include <test/test.hpp>

namespace {
using namespace nest;

ADD_TEST(FileReader_FindSuperDirectory) {
	auto const dir = test::TempDir{"file-reader"};
	std::filesystem::create_directories(dir.path() / "example/data");
	std::filesystem::create_directories(dir.path() / "build/bin/debug");
	auto const start = (dir.path() / "build/bin/debug").generic_string();

	EXPECT(FileReader::find_super_directory("example/data", start) == (dir.path() / "example/data").generic_string());
	// a file of the same name does not count
	dir.write("build/data", "not a directory");
	EXPECT(FileReader::find_super_directory("data", start) != (dir.path() / "build/data").generic_string());
	EXPECT(FileReader::find_super_directory("nest-no-such-directory-3f9c1a", start).empty());
}

ADD_TEST(FileReader_Read) {
	auto const dir = test::TempDir{"file-reader"};
	dir.write("assets/petal.json", R"({ "image": "petal.ppm" })");
	auto const reader = FileReader{dir.path().generic_string()};

	EXPECT(reader.mount_point() == dir.path().generic_string());
	EXPECT(reader.exists("assets/petal.json"));
	EXPECT(!reader.exists("assets"));
	EXPECT(!reader.exists("assets/missing.json"));
	EXPECT(reader.read_string("assets/petal.json") == R"({ "image": "petal.ppm" })");
	EXPECT(reader.read_bytes("assets/petal.json").size() == 24);
	EXPECT(reader.read_bytes("assets/missing.json").empty());
	EXPECT(reader.read_string("assets/missing.json").empty());

	// absolute paths bypass the mount point
	auto const absolute = (dir.path() / "assets/petal.json").generic_string();
	EXPECT(FileReader{"/nest/nowhere"}.read_string(absolute) == reader.read_string("assets/petal.json"));
	EXPECT(reader.absolute("assets/petal.json") == absolute);
}
} // namespace
