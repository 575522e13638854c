#pragma once

#include <filesystem>
#include <istream>
#include <memory>
#include <string>

// Resolves bundled assets (models shipped with the host application).
class AssetSource {
public:
    virtual ~AssetSource() = default;
    // Returns nullptr if the asset does not exist.
    virtual std::unique_ptr<std::istream> open(const std::string& asset_path) = 0;
};

class DirectoryAssetSource : public AssetSource {
public:
    explicit DirectoryAssetSource(std::filesystem::path root);

    std::unique_ptr<std::istream> open(const std::string& asset_path) override;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};
