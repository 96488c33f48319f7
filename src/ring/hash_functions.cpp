#include "quorum_cache/hash_ring.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>

namespace quorum_cache {
namespace {

std::uint64_t digest_prefix(const EVP_MD *md, std::string_view data) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), digest, &len, md, nullptr) != 1 ||
      len < 8)
    return 0;
  std::uint64_t h = 0;
  for (int i = 0; i < 8; ++i)
    h = (h << 8) | static_cast<std::uint64_t>(digest[i]);
  return h;
}

std::uint64_t fnv1a(std::string_view s) {
  std::uint64_t h = 1469598103934665603ULL;
  for (unsigned char c : s) {
    h ^= static_cast<std::uint64_t>(c);
    h *= 1099511628211ULL;
  }
  return h;
}

} // namespace

HashFunction make_hash_function(const std::string &algorithm) {
  std::string a = algorithm;
  std::transform(a.begin(), a.end(), a.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (a == "md5")
    return [](std::string_view s) { return digest_prefix(EVP_md5(), s); };
  if (a == "sha1")
    return [](std::string_view s) { return digest_prefix(EVP_sha1(), s); };
  if (a == "sha256")
    return [](std::string_view s) { return digest_prefix(EVP_sha256(), s); };
  if (a == "fnv1a")
    return fnv1a;
  return {};
}

} // namespace quorum_cache
