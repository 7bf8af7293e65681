#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// Maps raw resource names to short tokens. Implementations are shared by
// parallel producers and must be safe to call concurrently.
class PackObfuscator {
public:
  virtual ~PackObfuscator() = default;
  virtual std::string obfuscate(const std::string& raw_name) = 0;
};

// Returns names unchanged.
class NoopObfuscator : public PackObfuscator {
public:
  std::string obfuscate(const std::string& raw_name) override { return raw_name; }
};

// Hands out tokens by assignment order: the n-th distinct name receives the
// digits of n over kAlphabet, least significant first, so the first 36 names
// get one character and the 37th gets "ab".
class OrderObfuscator : public PackObfuscator {
public:
  static constexpr char kAlphabet[] = {
    'a', 'b', 'c', 'd', 'e', 'f', 'g',
    'h', 'i', 'j', 'k', 'm', 'n', 'l', 'o', 'p',
    'q', 'r', 's', 't', 'u', 'v',
    'w', 'x', 'y', 'z',
    '0', '1', '2', '3', '4', '5', '6', '7', '8', '9'
  };
  static constexpr std::size_t kAlphabetSize = sizeof(kAlphabet);

  std::string obfuscate(const std::string& raw_name) override;

  std::size_t size() const;
  std::vector<std::pair<std::string, std::string>> assignments() const;

  static std::string token_for_index(std::size_t index);

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::string> names_;
  std::vector<std::string> order_;
};

std::shared_ptr<PackObfuscator> make_order_obfuscator(bool enabled);

// Separate namespaces for model names and texture/file names, so equal raw
// names in different namespaces never fight over a token.
struct ObfuscatorPair {
  std::shared_ptr<PackObfuscator> models;
  std::shared_ptr<PackObfuscator> textures;

  static ObfuscatorPair create(bool enabled) {
    return ObfuscatorPair{make_order_obfuscator(enabled), make_order_obfuscator(enabled)};
  }
};
