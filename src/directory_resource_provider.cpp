#include "directory_resource_provider.hpp"

#include <algorithm>
#include <stdexcept>

#include "log.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

DirectoryResourceProvider::DirectoryResourceProvider(fs::path source,
                                                     bool use_obfuscation,
                                                     std::shared_ptr<Logger> logger)
  : source_(std::move(source)),
    use_obfuscation_(use_obfuscation),
    obfuscators_(ObfuscatorPair::create(use_obfuscation)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("resources")) {}

std::string DirectoryResourceProvider::pack_name(const std::string& relative) {
  if(!use_obfuscation_) return relative;
  fs::path path(relative);
  auto& namespace_obfuscator = (relative.rfind(std::string(kModelFolder) + "/", 0) == 0)
    ? obfuscators_.models
    : obfuscators_.textures;
  auto token = namespace_obfuscator->obfuscate(path.stem().string());
  auto renamed = path.parent_path() / (token + path.extension().string());
  return renamed.generic_string();
}

PackBuild DirectoryResourceProvider::build_resources() {
  if(!fs::is_directory(source_)) {
    throw std::runtime_error("Resource source " + source_.string() + " is not a directory");
  }

  std::vector<fs::path> files;
  for(const auto& entry : fs::recursive_directory_iterator(source_)) {
    if(entry.is_regular_file()) files.push_back(entry.path());
  }
  // Obfuscation tokens depend on request order; keep it stable across runs.
  std::sort(files.begin(), files.end());

  PackBuild build;
  const std::string overlay_prefix = std::string(kOverlayFolder) + "/";
  for(const auto& file : files) {
    auto relative = file.lexically_relative(source_).generic_string();
    std::string overlay;
    if(relative.rfind(overlay_prefix, 0) == 0) {
      auto rest = relative.substr(overlay_prefix.size());
      auto slash = rest.find('/');
      if(slash == std::string::npos) {
        logger_->warn("Skipping {}: files directly under {} have no overlay", relative, kOverlayFolder);
        continue;
      }
      overlay = rest.substr(0, slash);
      relative = rest.substr(slash + 1);
    }
    std::error_code ec;
    auto size = fs::file_size(file, ec);
    build.add(PackPath{overlay, pack_name(relative)}, ec ? 0 : size,
              [file]{ return read_file_bytes(file); });
  }

  build.meta = {
    {"source", source_.generic_string()},
    {"resource_count", build.resources.size()},
    {"obfuscated", use_obfuscation_}
  };
  logger_->info("Found {} resources in {}", build.resources.size(), source_.string());
  return build;
}
