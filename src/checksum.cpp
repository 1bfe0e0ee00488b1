#include <array>
#include <cctype>
#include <memory>

#include <openssl/evp.h>

#include <catx/checksum.hpp>

namespace catx {

namespace {

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};

} // namespace

std::optional<std::string> md5Hex(std::span<const uint8_t> data) {
  std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) {
    return std::nullopt;
  }

  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digestSize = 0;

  if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest.data(), &digestSize) != 1) {
    return std::nullopt;
  }

  static constexpr char hexDigits[] = "0123456789abcdef";
  std::string result;
  result.reserve(digestSize * 2);
  for (unsigned int i = 0; i < digestSize; ++i) {
    result += hexDigits[digest[i] >> 4];
    result += hexDigits[digest[i] & 0x0F];
  }
  return result;
}

bool isMd5Hex(std::string_view text) {
  if (text.size() != 32) {
    return false;
  }
  for (char c : text) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

} // namespace catx
