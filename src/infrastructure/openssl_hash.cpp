#include "infrastructure/openssl_hash.h"
#include "infrastructure/error_handler.h"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <memory>

namespace ulagen::infrastructure {

namespace {

struct evp_md_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

std::string last_openssl_error() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown error";
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return buffer;
}

}

OpenSSLHashFunction::OpenSSLHashFunction(const std::string& algorithm)
    : algorithm_(algorithm), md_(EVP_get_digestbyname(algorithm.c_str())) {
    if (md_ == nullptr) {
        THROW_INTERNAL_ERROR("openssl does not provide digest " + algorithm);
    }
}

size_t OpenSSLHashFunction::digest_size() const {
    return static_cast<size_t>(EVP_MD_size(md_));
}

std::vector<uint8_t> OpenSSLHashFunction::digest(const std::vector<uint8_t>& data) const {
    std::unique_ptr<EVP_MD_CTX, evp_md_ctx_deleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        THROW_INTERNAL_ERROR("failed to allocate digest context: " + last_openssl_error());
    }

    if (EVP_DigestInit_ex(ctx.get(), md_, nullptr) != 1) {
        THROW_INTERNAL_ERROR(algorithm_ + " init failed: " + last_openssl_error());
    }

    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        THROW_INTERNAL_ERROR(algorithm_ + " update failed: " + last_openssl_error());
    }

    std::vector<uint8_t> hash(EVP_MAX_MD_SIZE);
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash.data(), &hash_len) != 1) {
        THROW_INTERNAL_ERROR(algorithm_ + " final failed: " + last_openssl_error());
    }

    hash.resize(hash_len);
    return hash;
}

}
