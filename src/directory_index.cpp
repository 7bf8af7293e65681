#include "directory_index.hpp"

DirectoryIndex::DirectoryIndex(const std::filesystem::path& root){
    namespace fs = std::filesystem;
    fs::create_directories(root);
    for(auto it = fs::recursive_directory_iterator(root); it != fs::recursive_directory_iterator(); ++it){
        auto rel = it->path().lexically_relative(root).generic_string();
        map_.emplace(std::move(rel), it->path());
    }
}

std::optional<std::filesystem::path> DirectoryIndex::claim(const std::string& relative_path){
    std::lock_guard lg(m_);
    auto it = map_.find(relative_path);
    if(it == map_.end()) return std::nullopt;
    auto path = std::move(it->second);
    map_.erase(it);
    return path;
}

std::size_t DirectoryIndex::size(){
    std::lock_guard lg(m_);
    return map_.size();
}

std::vector<std::string> DirectoryIndex::keys(){
    std::lock_guard lg(m_);
    std::vector<std::string> out;
    out.reserve(map_.size());
    for(auto &p: map_) out.push_back(p.first);
    return out;
}

DirectoryIndex::Entries DirectoryIndex::take_remaining(){
    std::lock_guard lg(m_);
    Entries out;
    out.swap(map_);
    return out;
}
