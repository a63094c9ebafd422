#include "hash.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <memory>
#include <sstream>

namespace {

// Custom deleter for EVP_MD_CTX
struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

class Sha256 {
public:
    Sha256() : md_ctx_(EVP_MD_CTX_new()) {
        if (!md_ctx_) {
            throw RvmException(ErrorKind::Io, get_string("error.openssl_ctx_failed"));
        }
        if (EVP_DigestInit_ex(md_ctx_.get(), EVP_sha256(), nullptr) != 1) {
            throw RvmException(ErrorKind::Io, get_string("error.openssl_init_failed"));
        }
    }

    void update(const void* data, size_t len) {
        if (EVP_DigestUpdate(md_ctx_.get(), data, len) != 1) {
            throw RvmException(ErrorKind::Io, get_string("error.openssl_update_failed"));
        }
    }

    std::string hex_digest() {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hash_len = 0;
        if (EVP_DigestFinal_ex(md_ctx_.get(), hash, &hash_len) != 1) {
            throw RvmException(ErrorKind::Io, get_string("error.openssl_final_failed"));
        }

        std::stringstream ss;
        for (unsigned int i = 0; i < hash_len; ++i) {
            ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
        }
        return ss.str();
    }

private:
    EvpMdCtxPtr md_ctx_;
};

} // anonymous namespace

std::string calculate_sha256(std::string_view data) {
    Sha256 hasher;
    hasher.update(data.data(), data.size());
    return hasher.hex_digest();
}

void verify_sha256(std::string_view data, const std::string& expected_hex) {
    std::string expected = expected_hex;
    if (expected.starts_with("0x")) expected.erase(0, 2);

    const bool valid_hex = expected.size() == 64 &&
        std::all_of(expected.begin(), expected.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
    if (!valid_hex) {
        throw RvmException(ErrorKind::HexDecoding, string_format("error.invalid_checksum", expected_hex));
    }
    std::transform(expected.begin(), expected.end(), expected.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::string actual = calculate_sha256(data);
    if (actual != expected) {
        throw ChecksumValidationError(expected_hex, actual);
    }
}
