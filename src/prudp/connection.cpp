#include "prudp/connection.hpp"
#include "utils/crypto.hpp"
#include "utils/logger.hpp"

namespace prudp {

Connection::Connection(const CodecConfig& config)
    : m_checksumVersion(config.checksum_version)
    , m_flagsVersion(config.flags_version)
    , m_checksumPolicy(config.checksum_policy)
    , m_accessKey(config.access_key)
    , m_rc4Key(config.rc4_key.begin(), config.rc4_key.end())
{
    reset();
}

void Connection::reset() {
    updateAccessKey(m_accessKey);
    updateRC4Key(m_rc4Key);

    m_serverConnectionSignature = Signature{};
    m_clientConnectionSignature = Signature{};
}

void Connection::updateAccessKey(const std::string& accessKey) {
    m_accessKey = accessKey;
    m_signatureBase = utils::Crypto::byteSum(accessKey);
    m_signatureKey = utils::Crypto::md5(accessKey);

    LOG_DEBUG("Access key set to '{}' (signature base {})", m_accessKey, m_signatureBase);
}

void Connection::updateRC4Key(const std::vector<uint8_t>& key) {
    m_rc4Key = key;
    m_cipher = std::make_unique<Rc4Cipher>(key);
    m_decipher = std::make_unique<Rc4Cipher>(key);
}

} // namespace prudp
