/**
 * ML-KEM Utility Functions Implementation
 * OpenSSL-based cryptographic primitives
 */

#include "utils.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <climits>
#include <memory>
#include <stdexcept>
#include <string>

namespace mlkem {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

MdCtxPtr new_digest(const EVP_MD* md, ByteParts parts, const char* name) {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Failed to create EVP_MD_CTX");
    }
    if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
        throw std::runtime_error(std::string(name) + " initialization failed");
    }
    for (auto part : parts) {
        if (EVP_DigestUpdate(ctx.get(), part.data(), part.size()) != 1) {
            throw std::runtime_error(std::string(name) + " update failed");
        }
    }
    return ctx;
}

template <size_t Len>
std::array<uint8_t, Len> fixed_digest(const EVP_MD* md, ByteParts parts, const char* name) {
    auto ctx = new_digest(md, parts, name);
    std::array<uint8_t, Len> hash{};
    if (EVP_DigestFinal_ex(ctx.get(), hash.data(), nullptr) != 1) {
        throw std::runtime_error(std::string(name) + " hash failed");
    }
    return hash;
}

} // namespace

// SHA3-256 implementation
std::array<uint8_t, 32> sha3_256(ByteParts parts) {
    return fixed_digest<32>(EVP_sha3_256(), parts, "SHA3-256");
}

// SHA3-512 implementation
std::array<uint8_t, 64> sha3_512(ByteParts parts) {
    return fixed_digest<64>(EVP_sha3_512(), parts, "SHA3-512");
}

// SHAKE256 XOF function
void shake256(ByteParts parts, std::span<uint8_t> out) {
    auto ctx = new_digest(EVP_shake256(), parts, "SHAKE256");
    if (EVP_DigestFinalXOF(ctx.get(), out.data(), out.size()) != 1) {
        throw std::runtime_error("SHAKE256 failed");
    }
}

// SHAKE128Stream implementation
SHAKE128Stream::SHAKE128Stream(ByteParts parts) {
    for (auto part : parts) {
        seed_.insert(seed_.end(), part.begin(), part.end());
    }
    // Three blocks cover SampleNTT for all but a tiny fraction of seeds
    squeeze(3 * BLOCK_BYTES);
}

void SHAKE128Stream::squeeze(size_t total_len) {
    // The first buffer_.size() bytes are identical in the longer output,
    // so buffer_pos_ stays valid across re-derivation.
    auto ctx = new_digest(EVP_shake128(), ByteParts{seed_}, "SHAKE128");
    buffer_.resize(total_len);
    if (EVP_DigestFinalXOF(ctx.get(), buffer_.data(), total_len) != 1) {
        throw std::runtime_error("SHAKE128 squeeze failed");
    }
}

void SHAKE128Stream::read(std::span<uint8_t> out) {
    // Reasonable maximum to prevent runaway allocation
    constexpr size_t MAX_BUFFER_SIZE = 1ULL << 20;

    if (buffer_pos_ + out.size() > buffer_.size()) {
        size_t needed = buffer_pos_ + out.size();
        size_t grown = buffer_.size() * 2;
        size_t total = ((std::max(needed, grown) + BLOCK_BYTES - 1) / BLOCK_BYTES) * BLOCK_BYTES;
        if (total > MAX_BUFFER_SIZE) {
            throw std::runtime_error("SHAKE128 read request too large");
        }
        squeeze(total);
    }

    std::copy_n(buffer_.begin() + static_cast<std::ptrdiff_t>(buffer_pos_), out.size(), out.begin());
    buffer_pos_ += out.size();
}

// Random bytes generation
void random_bytes(std::span<uint8_t> out) {
    if (out.size() > static_cast<size_t>(INT_MAX)) {
        throw std::runtime_error("Random request too large");
    }
    if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
        throw std::runtime_error("Random number generation failed");
    }
}

} // namespace mlkem
