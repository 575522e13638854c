#include "asset_source.hpp"

#include <fstream>
#include <print>

namespace fs = std::filesystem;

DirectoryAssetSource::DirectoryAssetSource(fs::path root)
    : root_(std::move(root)) {}

std::unique_ptr<std::istream> DirectoryAssetSource::open(const std::string& asset_path) {
    fs::path rel(asset_path);
    if (asset_path.empty() || rel.is_absolute()) {
        std::println(stderr, "assets: refusing asset path '{}'", asset_path);
        return nullptr;
    }

    // Reject anything that climbs out of the root.
    for (const auto& part : rel.lexically_normal()) {
        if (part == "..") {
            std::println(stderr, "assets: refusing asset path '{}'", asset_path);
            return nullptr;
        }
    }

    auto full = root_ / rel.lexically_normal();
    std::error_code ec;
    if (!fs::is_regular_file(full, ec)) return nullptr;

    auto stream = std::make_unique<std::ifstream>(full, std::ios::binary);
    if (!stream->is_open()) return nullptr;
    return stream;
}
