// MILESCROW - SHA256 Implementation
// Copyright (c) 2024 MILESCROW Developers
// MIT License

#include "milescrow/crypto/sha256.h"

#include <openssl/evp.h>

#include <stdexcept>

namespace milescrow {

SHA256::SHA256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    Reset();
}

SHA256::~SHA256() {
    EVP_MD_CTX_free(ctx_);
}

SHA256& SHA256::Write(const Byte* data, size_t len) {
    if (len > 0 && EVP_DigestUpdate(ctx_, data, len) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    return *this;
}

SHA256& SHA256::WriteUInt64(uint64_t value) {
    Byte buf[8];
    for (int i = 0; i < 8; ++i) {
        buf[i] = static_cast<Byte>((value >> (i * 8)) & 0xFF);
    }
    return Write(buf, sizeof(buf));
}

void SHA256::Finalize(Byte hash[OUTPUT_SIZE]) {
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_, hash, &len) != 1 || len != OUTPUT_SIZE) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    Reset();
}

SHA256& SHA256::Reset() {
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    return *this;
}

Hash256 SHA256Hash(const Byte* data, size_t len) {
    Byte out[SHA256::OUTPUT_SIZE];
    SHA256().Write(data, len).Finalize(out);
    return Hash256(out, sizeof(out));
}

} // namespace milescrow
