#include "strong_hasher.hpp"
#include <stdexcept>

EvpHasher::EvpHasher(const EVP_MD* md) : md_(md), ctx_(EVP_MD_CTX_new()) {
    if (ctx_ == nullptr)
        throw std::runtime_error("EVP_MD_CTX_new failed");
    if (EVP_DigestInit_ex(ctx_, md_, nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
}

EvpHasher::~EvpHasher() {
    EVP_MD_CTX_free(ctx_);
}

void EvpHasher::reset() {
    if (EVP_DigestInit_ex(ctx_, md_, nullptr) != 1)
        throw std::runtime_error("EVP_DigestInit_ex failed");
}

void EvpHasher::write(const char* data, size_t len) {
    if (EVP_DigestUpdate(ctx_, data, len) != 1)
        throw std::runtime_error("EVP_DigestUpdate failed");
}

std::string EvpHasher::digest() const {
    // finalize a copy so more data can still be written afterwards
    EVP_MD_CTX* copy = EVP_MD_CTX_new();
    if (copy == nullptr)
        throw std::runtime_error("EVP_MD_CTX_new failed");
    if (EVP_MD_CTX_copy_ex(copy, ctx_) != 1) {
        EVP_MD_CTX_free(copy);
        throw std::runtime_error("EVP_MD_CTX_copy_ex failed");
    }

    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    int ok = EVP_DigestFinal_ex(copy, out, &len);
    EVP_MD_CTX_free(copy);
    if (ok != 1)
        throw std::runtime_error("EVP_DigestFinal_ex failed");

    return std::string(reinterpret_cast<const char*>(out), len);
}

size_t EvpHasher::digestSize() const {
    return static_cast<size_t>(EVP_MD_size(md_));
}

std::unique_ptr<StrongHasher> EvpHasher::sha256() {
    return std::make_unique<EvpHasher>(EVP_sha256());
}

std::unique_ptr<StrongHasher> EvpHasher::sha1() {
    return std::make_unique<EvpHasher>(EVP_sha1());
}

Result<std::unique_ptr<StrongHasher>> EvpHasher::byName(const std::string& name) {
    if (name == "sha256")
        return Result<std::unique_ptr<StrongHasher>>::Ok(sha256());
    if (name == "sha1")
        return Result<std::unique_ptr<StrongHasher>>::Ok(sha1());
    return Result<std::unique_ptr<StrongHasher>>::Error(ErrorCode::InvalidArgument,
                                                        "unknown strong digest: " + name);
}
