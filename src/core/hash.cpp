#include "bufferfile/core/hash.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <memory>
#include <sstream>

namespace bufferfile::core {
  auto to_hex(std::span<const uint8_t> data) -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto b : data) oss << std::setw(2) << static_cast<int>(b);
    return oss.str();
  }

  auto sha256(std::span<const uint8_t> data) -> Hash256 {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) throw DigestError("sha256: EVP_MD_CTX_new failed");
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) throw DigestError("sha256: init failed");
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) throw DigestError("sha256: update failed");

    Hash256 out{};
    unsigned int len = static_cast<unsigned int>(out.size());
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1) throw DigestError("sha256: final failed");
    return out;
  }
}
