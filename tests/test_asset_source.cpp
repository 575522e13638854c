#include <catch2/catch_test_macros.hpp>

#include "asset_source.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

// RAII temp directory with a models/ subdirectory.
struct TmpDir {
    fs::path path;

    TmpDir() {
        path = fs::temp_directory_path() / ("sg_test_assets_" + std::to_string(::getpid()));
        fs::create_directories(path / "models");
    }

    ~TmpDir() { fs::remove_all(path); }

    void write(const std::string& rel, const std::string& content) const {
        std::ofstream f(path / rel, std::ios::binary);
        f << content;
    }
};

std::string slurp(std::istream& in) {
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

} // namespace

TEST_CASE("DirectoryAssetSource", "[assets]") {
    TmpDir dir;
    dir.write("models/tiny.bin", "ggml-bytes");
    dir.write("secret.txt", "outside models");
    DirectoryAssetSource assets(dir.path / "models");

    SECTION("OpensExistingAsset") {
        auto in = assets.open("tiny.bin");
        REQUIRE(in);
        REQUIRE(slurp(*in) == "ggml-bytes");
    }

    SECTION("MissingAsset") {
        REQUIRE(assets.open("base.bin") == nullptr);
    }

    SECTION("DirectoryIsNotAnAsset") {
        DirectoryAssetSource root(dir.path);
        REQUIRE(root.open("models") == nullptr);
    }

    SECTION("RejectsAbsolutePath") {
        REQUIRE(assets.open((dir.path / "secret.txt").string()) == nullptr);
    }

    SECTION("RejectsEscapingRoot") {
        REQUIRE(assets.open("../secret.txt") == nullptr);
        REQUIRE(assets.open("sub/../../secret.txt") == nullptr);
    }

    SECTION("RejectsEmptyPath") {
        REQUIRE(assets.open("") == nullptr);
    }
}
