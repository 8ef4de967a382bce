// src/canonical/fingerprint.cpp

#include "../../include/canonical/fingerprint.h"
#include "../../include/debug_utils.h"

#include <openssl/evp.h>
#include <openssl/err.h>

namespace schemata {
namespace canonical {

namespace {

std::string getOpenSSLError() {
    unsigned long err_code = ERR_get_error();
    if (err_code == 0) return "No error";
    char buffer[256];
    ERR_error_string_n(err_code, buffer, sizeof(buffer));
    return std::string(buffer);
}

// RAII wrapper for OpenSSL EVP_MD_CTX
class EVPDigestCtx {
public:
    EVPDigestCtx() : ctx(EVP_MD_CTX_new()) {}
    ~EVPDigestCtx() {
        if (ctx) EVP_MD_CTX_free(ctx);
    }
    EVP_MD_CTX* get() const { return ctx; }
private:
    EVP_MD_CTX* ctx;
    EVPDigestCtx(const EVPDigestCtx&) = delete;
    EVPDigestCtx& operator=(const EVPDigestCtx&) = delete;
};

} // anonymous namespace

#define CHECK_DIGEST_RESULT(result, operation) \
    if ((result) != 1) { \
        return registry::RegistryError::internal(std::string(operation) + " failed: " + getOpenSSLError()); \
    }

registry::Result<std::string> sha256Hex(const std::string& data) {
    EVPDigestCtx ctx;
    if (!ctx.get()) {
        return registry::RegistryError::internal("Failed to create EVP digest context");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    CHECK_DIGEST_RESULT(EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr), "EVP_DigestInit_ex");
    CHECK_DIGEST_RESULT(EVP_DigestUpdate(ctx.get(), data.data(), data.size()), "EVP_DigestUpdate");
    CHECK_DIGEST_RESULT(EVP_DigestFinal_ex(ctx.get(), digest, &digest_len), "EVP_DigestFinal_ex");

    return hex_dump_string(std::string(reinterpret_cast<const char*>(digest), digest_len));
}

#undef CHECK_DIGEST_RESULT

} // namespace canonical
} // namespace schemata
