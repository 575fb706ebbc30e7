#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <openssl/evp.h>
#include "result.hpp"

// Incremental cryptographic digest used to confirm fast checksum candidates.
class StrongHasher {
public:
    virtual ~StrongHasher() = default;
    virtual void reset() = 0;
    virtual void write(const char* data, size_t len) = 0;
    // Raw digest bytes of everything written since the last reset.
    // Does not change the hasher state.
    virtual std::string digest() const = 0;
    virtual size_t digestSize() const = 0;
};

// StrongHasher over an OpenSSL EVP message digest.
class EvpHasher : public StrongHasher {
public:
    explicit EvpHasher(const EVP_MD* md);
    ~EvpHasher() override;

    EvpHasher(const EvpHasher&) = delete;
    EvpHasher& operator=(const EvpHasher&) = delete;

    void reset() override;
    void write(const char* data, size_t len) override;
    std::string digest() const override;
    size_t digestSize() const override;

    static std::unique_ptr<StrongHasher> sha256();
    static std::unique_ptr<StrongHasher> sha1();
    // "sha256" or "sha1"
    static Result<std::unique_ptr<StrongHasher>> byName(const std::string& name);

private:
    const EVP_MD* md_;
    EVP_MD_CTX* ctx_;
};
