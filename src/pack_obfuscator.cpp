#include "pack_obfuscator.hpp"

std::string OrderObfuscator::token_for_index(std::size_t index) {
  std::string token;
  while(index >= kAlphabetSize) {
    token.push_back(kAlphabet[index % kAlphabetSize]);
    index /= kAlphabetSize;
  }
  token.push_back(kAlphabet[index]);
  return token;
}

std::string OrderObfuscator::obfuscate(const std::string& raw_name) {
  std::lock_guard lg(mutex_);
  auto it = names_.find(raw_name);
  if(it != names_.end()) return it->second;
  auto token = token_for_index(order_.size());
  names_.emplace(raw_name, token);
  order_.push_back(raw_name);
  return token;
}

std::size_t OrderObfuscator::size() const {
  std::lock_guard lg(mutex_);
  return order_.size();
}

std::vector<std::pair<std::string, std::string>> OrderObfuscator::assignments() const {
  std::lock_guard lg(mutex_);
  std::vector<std::pair<std::string, std::string>> out;
  out.reserve(order_.size());
  for(const auto& name : order_) out.emplace_back(name, names_.at(name));
  return out;
}

std::shared_ptr<PackObfuscator> make_order_obfuscator(bool enabled) {
  if(enabled) return std::make_shared<OrderObfuscator>();
  return std::make_shared<NoopObfuscator>();
}
