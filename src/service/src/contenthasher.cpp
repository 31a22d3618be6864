#include "../include/contenthasher.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string ContentHasher::hashData(
    const std::map<std::string, std::string> &data) {
  std::string joined;
  for (const auto &[key, value] : data) {
    if (!joined.empty()) joined += ';';
    joined += key + "=" + value;
  }
  return sha1Hex(joined);
}

std::string ContentHasher::hashResource(const nlohmann::json &resource) {
  std::map<std::string, std::string> entries;
  if (!resource.is_object()) return hashData(entries);

  for (const char *field : {"data", "binaryData"}) {
    auto section = resource.find(field);
    if (section == resource.end() || !section->is_object()) continue;
    for (const auto &[key, value] : section->items()) {
      entries[key] = value.is_string() ? value.get<std::string>() : value.dump();
    }
  }
  return hashData(entries);
}

std::string ContentHasher::sha1Hex(const std::string &input) {
  EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw std::runtime_error("Failed to create EVP context");
  }

  const EVP_MD *md = EVP_sha1();
  if (EVP_DigestInit_ex(mdctx, md, nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("Failed to initialize SHA1 digest");
  }
  if (EVP_DigestUpdate(mdctx, input.data(), input.size()) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("Failed to update SHA1 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(mdctx, hash, &len) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("Failed to finalize SHA1 digest");
  }
  EVP_MD_CTX_free(mdctx);

  std::stringstream ss;
  ss << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < len; i++) {
    ss << std::setw(2) << static_cast<unsigned>(hash[i]);
  }
  return ss.str();
}
