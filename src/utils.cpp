#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    return oss.str();
}

Sha256Stream::Sha256Stream() : ctx_(EVP_MD_CTX_new()) {
    if(!ctx_ || EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("Unable to initialise SHA-256 digest");
    }
}

Sha256Stream::~Sha256Stream() {
    EVP_MD_CTX_free(ctx_);
}

void Sha256Stream::update(const void* data, std::size_t size) {
    if(size == 0) return;
    if(EVP_DigestUpdate(ctx_, data, size) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }
}

void Sha256Stream::update_u64(uint64_t value) {
    unsigned char le[8];
    for(int i = 0; i < 8; ++i) le[i] = static_cast<unsigned char>((value >> (8 * i)) & 0xff);
    update(le, sizeof(le));
}

std::string Sha256Stream::hex_digest() {
    std::vector<unsigned char> out(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if(EVP_DigestFinal_ex(ctx_, out.data(), &len) != 1) {
        throw std::runtime_error("SHA-256 finalisation failed");
    }
    out.resize(len);
    return hex_from_bytes(out);
}

std::vector<char> read_file_bytes(const std::filesystem::path& path){
    std::ifstream in(path, std::ios::binary);
    if(!in) throw std::runtime_error("Unable to open " + path.string());
    return std::vector<char>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

void write_file_bytes(const std::filesystem::path& path, const std::vector<char>& bytes){
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if(!out) throw std::runtime_error("Unable to write " + path.string());
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if(!out) throw std::runtime_error("Short write to " + path.string());
}

std::string to_lower_copy(std::string value){
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
    return value;
}
