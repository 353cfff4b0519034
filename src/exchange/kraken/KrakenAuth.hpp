#pragma once
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace strikebox {

// ---------------------------------------------------------------------------
// Replay-protection nonce: epoch milliseconds, strictly increasing per
// account. Two calls inside the same millisecond get last+1.
// ---------------------------------------------------------------------------
class NonceSource {
public:
    uint64_t next();

private:
    std::atomic<uint64_t> last_{0};
};

// ---------------------------------------------------------------------------
// Kraken private API signing:
//   API-Sign = base64( HMAC-SHA512( base64decode(secret),
//                                   path + SHA256(nonce + postdata) ) )
// postdata is the exact url-encoded body sent on the wire, nonce included.
//
// The secret is decoded once in the constructor. An undecodable secret is a
// ConfigurationError and the message never echoes the secret.
// THREAD-SAFE: sign() uses stack-local buffers only.
// ---------------------------------------------------------------------------
class KrakenAuth {
public:
    KrakenAuth(const std::string& api_key, const std::string& api_secret_b64);

    std::string sign(const std::string& path,
                     uint64_t nonce,
                     const std::string& post_data) const;

    const std::string& api_key() const { return api_key_; }

    // Safe-to-log form of the key: first 4 chars only.
    std::string masked_key() const;

private:
    std::string                api_key_;
    std::vector<unsigned char> secret_;
};

// Standard base64 (with padding). decode throws std::invalid_argument on
// malformed input.
std::string                base64_encode(const unsigned char* data, size_t len);
std::vector<unsigned char> base64_decode(const std::string& in);

} // namespace strikebox
