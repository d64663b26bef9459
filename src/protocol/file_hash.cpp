#include <cstdio>
#include <fstream>
#include <memory>
#include <vector>

#include <openssl/evp.h>

#include "./file_hash.hpp"

#define HASH_READ_BUFFER_SIZE (64 * 1024)

std::optional<std::string> file_md5(const std::filesystem::path &path) {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return std::nullopt;
    }
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        return std::nullopt;
    }
    std::vector<char> buffer(HASH_READ_BUFFER_SIZE);
    while (stream) {
        stream.read(buffer.data(), buffer.size());
        const auto count = stream.gcount();
        if (count > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(count)) != 1) {
            return std::nullopt;
        }
    }
    if (stream.bad()) {
        return std::nullopt;
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_length) != 1) {
        return std::nullopt;
    }
    std::string ret;
    char hex[3];
    for (unsigned int i = 0; i < digest_length; i++) {
        snprintf(hex, sizeof(hex), "%02x", digest[i]);
        ret += hex;
    }
    return ret;
}
