#pragma once

#include "../domain/interfaces.h"
#include <string>
#include <vector>

typedef struct evp_md_st EVP_MD;

namespace ulagen::infrastructure {

// One-shot message digest over OpenSSL's EVP interface.
class OpenSSLHashFunction : public domain::IHashFunction {
public:
    // algorithm is an OpenSSL digest name such as "SHA1" or "SHA256".
    explicit OpenSSLHashFunction(const std::string& algorithm);

    std::vector<uint8_t> digest(const std::vector<uint8_t>& data) const override;
    size_t digest_size() const override;
    std::string name() const override { return algorithm_; }

private:
    std::string algorithm_;
    const EVP_MD* md_;
};

class OpenSSLSha1 : public OpenSSLHashFunction {
public:
    OpenSSLSha1() : OpenSSLHashFunction("SHA1") {}
};

}
