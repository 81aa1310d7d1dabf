// RC4 is only reachable through the deprecated low-level API in OpenSSL 3
// (EVP_rc4 lives in the legacy provider).
#define OPENSSL_SUPPRESS_DEPRECATED

#include "prudp/stream_cipher.hpp"

#include <openssl/rc4.h>
#include <stdexcept>

namespace prudp {

Rc4Cipher::Rc4Cipher(const std::vector<uint8_t>& key)
    : m_key(std::make_unique<RC4_KEY>())
{
    if (key.empty()) {
        throw std::invalid_argument("RC4 key must not be empty");
    }
    RC4_set_key(m_key.get(), static_cast<int>(key.size()), key.data());
}

Rc4Cipher::Rc4Cipher(const std::string& key)
    : Rc4Cipher(std::vector<uint8_t>(key.begin(), key.end()))
{
}

Rc4Cipher::~Rc4Cipher() = default;

void Rc4Cipher::apply(std::vector<uint8_t>& data) {
    if (data.empty()) {
        return;
    }
    RC4(m_key.get(), data.size(), data.data(), data.data());
}

} // namespace prudp
