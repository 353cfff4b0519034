#include "exchange/kraken/KrakenAuth.hpp"
#include "core/Strike.hpp"
#include "core/StrikeError.hpp"

#include <stdexcept>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

using namespace strikebox;

uint64_t NonceSource::next() {
    uint64_t now  = static_cast<uint64_t>(now_epoch_ms());
    uint64_t prev = last_.load(std::memory_order_relaxed);
    uint64_t want = 0;
    do {
        want = (now > prev) ? now : prev + 1;
    } while (!last_.compare_exchange_weak(prev, want, std::memory_order_relaxed));
    return want;
}

// ---------------------------------------------------------------------------
// Base64: BIO chain for encode (single line), EVP_DecodeBlock for decode so
// malformed input is detected instead of silently truncated.
// ---------------------------------------------------------------------------
std::string strikebox::base64_encode(const unsigned char* data, size_t len) {
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* mem = BIO_new(BIO_s_mem());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    BIO_push(b64, mem);
    BIO_write(b64, data, static_cast<int>(len));
    BIO_flush(b64);

    BUF_MEM* buf = nullptr;
    BIO_get_mem_ptr(mem, &buf);
    std::string out(buf->data, buf->length);

    BIO_free_all(b64);
    return out;
}

std::vector<unsigned char> strikebox::base64_decode(const std::string& in) {
    if (in.empty() || in.size() % 4 != 0)
        throw std::invalid_argument("base64: length must be a non-zero multiple of 4");

    size_t pad = 0;
    for (size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        bool alnum = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
        if (alnum || c == '+' || c == '/') {
            if (pad) throw std::invalid_argument("base64: data after padding");
            continue;
        }
        if (c == '=' && i + 2 >= in.size()) { ++pad; continue; }
        throw std::invalid_argument("base64: invalid character");
    }

    std::vector<unsigned char> out(in.size() / 4 * 3);
    int n = EVP_DecodeBlock(out.data(),
                            reinterpret_cast<const unsigned char*>(in.data()),
                            static_cast<int>(in.size()));
    if (n < 0) throw std::invalid_argument("base64: decode failed");

    // EVP_DecodeBlock counts padding bytes as output.
    out.resize(static_cast<size_t>(n) - pad);
    return out;
}

KrakenAuth::KrakenAuth(const std::string& api_key, const std::string& api_secret_b64)
    : api_key_(api_key) {
    if (api_key_.empty())
        throw StrikeError(ErrorCode::ConfigurationError, "KRAKEN_API_KEY is empty");
    try {
        secret_ = base64_decode(api_secret_b64);
    } catch (const std::invalid_argument& e) {
        throw StrikeError(ErrorCode::ConfigurationError,
                          std::string("KRAKEN_API_SECRET is not valid base64 (") + e.what() + ")");
    }
}

std::string KrakenAuth::sign(const std::string& path,
                             uint64_t nonce,
                             const std::string& post_data) const {
    // inner = SHA256(nonce || postdata)
    std::string inner_msg = std::to_string(nonce) + post_data;
    unsigned char inner[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(inner_msg.data()), inner_msg.size(), inner);

    // message = path || inner
    std::string msg = path;
    msg.append(reinterpret_cast<const char*>(inner), sizeof(inner));

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int  digest_len = 0;
    HMAC(EVP_sha512(),
         secret_.data(), static_cast<int>(secret_.size()),
         reinterpret_cast<const unsigned char*>(msg.data()), msg.size(),
         digest, &digest_len);

    return base64_encode(digest, digest_len);
}

std::string KrakenAuth::masked_key() const {
    return api_key_.substr(0, 4) + "...";
}
