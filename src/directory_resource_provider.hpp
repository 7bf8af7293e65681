#pragma once

#include <filesystem>
#include <memory>

#include "pack_obfuscator.hpp"
#include "pack_resource.hpp"

class Logger;

// Offers every regular file below a source directory as a resource. Files
// under "overlays/<name>/" go to overlay <name>, everything else to the
// root overlay. With obfuscation on, file stems are replaced by tokens:
// "models/" files draw from the models namespace, all others from textures.
class DirectoryResourceProvider : public ResourceProvider {
public:
  static constexpr const char* kOverlayFolder = "overlays";
  static constexpr const char* kModelFolder = "models";

  DirectoryResourceProvider(std::filesystem::path source,
                            bool use_obfuscation,
                            std::shared_ptr<Logger> logger = nullptr);

  PackBuild build_resources() override;

private:
  std::string pack_name(const std::string& relative);

  std::filesystem::path source_;
  bool use_obfuscation_;
  ObfuscatorPair obfuscators_;
  std::shared_ptr<Logger> logger_;
};
