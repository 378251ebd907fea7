// ==============================================================================
// hasher.cpp - Отпечаток содержимого файла (SHA-256 через OpenSSL EVP)
// ==============================================================================

#include "fiq/hasher.hpp"

#include "fiq/platform.hpp"

#include <openssl/evp.h>
#include <stdexcept>

namespace fiq::hash {

namespace {

/// RAII-обёртка над EVP_MD_CTX
class DigestContext {
public:
    DigestContext() : ctx_(EVP_MD_CTX_new()) {
        if (ctx_ == nullptr) {
            throw std::runtime_error("failed to create EVP_MD_CTX");
        }
    }

    ~DigestContext() { EVP_MD_CTX_free(ctx_); }

    DigestContext(const DigestContext&) = delete;
    DigestContext& operator=(const DigestContext&) = delete;

    EVP_MD_CTX* get() const { return ctx_; }

private:
    EVP_MD_CTX* ctx_;
};

std::string to_hex(const unsigned char* digest, unsigned int len) {
    static constexpr char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(static_cast<std::size_t>(len) * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(HEX[digest[i] >> 4]);
        out.push_back(HEX[digest[i] & 0x0F]);
    }
    return out;
}

}  // namespace

std::string hash_bytes(std::string_view bytes) {
    DigestContext ctx;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("failed to initialize SHA-256");
    }
    if (!bytes.empty() && EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1) {
        throw std::runtime_error("failed to update SHA-256");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
        throw std::runtime_error("failed to finalize SHA-256");
    }
    return to_hex(digest, len);
}

const std::string& empty_fingerprint() {
    static const std::string fingerprint = hash_bytes(std::string_view());
    return fingerprint;
}

std::optional<std::string> hash_file(const std::filesystem::path& path, std::uint64_t size) {
    if (size == 0) {
        return empty_fingerprint();
    }

    if (size >= platform::MMAP_THRESHOLD) {
        auto mapped = platform::MappedFile::open(path);
        if (!mapped) {
            return std::nullopt;
        }
        return hash_bytes(mapped->view());
    }

    auto data = platform::read_file(path);
    if (!data) {
        return std::nullopt;
    }
    return hash_bytes(*data);
}

}  // namespace fiq::hash
