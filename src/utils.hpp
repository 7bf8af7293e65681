#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <openssl/evp.h>

std::string hex_from_bytes(const std::vector<unsigned char>&);

// Incremental SHA-256 over several buffers.
class Sha256Stream {
public:
    Sha256Stream();
    ~Sha256Stream();
    Sha256Stream(const Sha256Stream&) = delete;
    Sha256Stream& operator=(const Sha256Stream&) = delete;

    void update(const void* data, std::size_t size);
    void update(const std::string& data) { update(data.data(), data.size()); }
    void update_u64(uint64_t value);
    std::string hex_digest();
private:
    EVP_MD_CTX* ctx_;
};

std::vector<char> read_file_bytes(const std::filesystem::path& path);
void write_file_bytes(const std::filesystem::path& path, const std::vector<char>& bytes);
std::string to_lower_copy(std::string value);
