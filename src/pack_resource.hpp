#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>
#include <vector>

#include <nlohmann/json.hpp>

// Location of one produced file. An empty overlay is the root overlay.
struct PackPath {
  std::string overlay;
  std::string path;

  std::string full_path() const {
    return overlay.empty() ? path : overlay + "/" + path;
  }

  bool operator<(const PackPath& other) const {
    return std::tie(overlay, path) < std::tie(other.overlay, other.path);
  }
  bool operator==(const PackPath& other) const {
    return overlay == other.overlay && path == other.path;
  }
};

// One lazily produced resource. The supplier runs at most once, on the first
// call to bytes(); later calls return the cached payload.
class PackResource {
public:
  using Supplier = std::function<std::vector<char>()>;

  PackResource(PackPath location, uint64_t estimated_size, Supplier supplier)
    : location_(std::move(location)),
      estimated_size_(estimated_size),
      supplier_(std::move(supplier)) {}

  PackResource(const PackResource&) = delete;
  PackResource& operator=(const PackResource&) = delete;

  const PackPath& location() const { return location_; }
  const std::string& overlay() const { return location_.overlay; }
  const std::string& path() const { return location_.path; }
  uint64_t estimated_size() const { return estimated_size_; }

  const std::vector<char>& bytes() {
    std::call_once(once_, [this]{
      bytes_ = supplier_();
      supplier_ = nullptr;
    });
    return bytes_;
  }

private:
  PackPath location_;
  uint64_t estimated_size_;
  Supplier supplier_;
  std::once_flag once_;
  std::vector<char> bytes_;
};

struct PackBuild {
  nlohmann::json meta = nlohmann::json::object();
  std::vector<std::unique_ptr<PackResource>> resources;

  PackResource& add(PackPath location, uint64_t estimated_size, PackResource::Supplier supplier) {
    resources.push_back(std::make_unique<PackResource>(std::move(location), estimated_size, std::move(supplier)));
    return *resources.back();
  }
};

class ResourceProvider {
public:
  virtual ~ResourceProvider() = default;
  virtual PackBuild build_resources() = 0;
};
