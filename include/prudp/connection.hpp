#pragma once

#include "prudp/packet.hpp"
#include "prudp/stream_cipher.hpp"
#include "prudp/types.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace prudp {

/**
 * Connection
 *
 * Per-connection state the packet codec reads and advances: negotiated
 * header options, checksum seed, signing key, connection signatures and
 * one stream cipher per direction.
 *
 * A connection is exclusively owned by its session. The codec serializes
 * encodes against encodes and decodes against decodes with one mutex per
 * direction; encode and decode may run concurrently.
 */
class Connection {
public:
    explicit Connection(const CodecConfig& config = CodecConfig{});
    ~Connection() = default;

    // Disable copy
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /**
     * Restore the initial state: default RC4 key on both ciphers,
     * signature base and key derived from the access key again,
     * zeroed connection signatures.
     */
    void reset();

    /**
     * Switch the service access key.
     * The checksum seed becomes the byte sum of the key and the
     * signature key becomes MD5(key).
     */
    void updateAccessKey(const std::string& accessKey);

    /**
     * Re-key both stream ciphers with RC4(key)
     */
    void updateRC4Key(const std::vector<uint8_t>& key);

    // Replace a direction's cipher (keystream restarts with the new object)
    void setCipher(std::unique_ptr<StreamCipher> cipher) { m_cipher = std::move(cipher); }
    void setDecipher(std::unique_ptr<StreamCipher> decipher) { m_decipher = std::move(decipher); }

    StreamCipher& getCipher() { return *m_cipher; }
    StreamCipher& getDecipher() { return *m_decipher; }

    // Negotiated options
    uint8_t getChecksumVersion() const { return m_checksumVersion; }
    uint8_t getFlagsVersion() const { return m_flagsVersion; }
    size_t getChecksumSize() const { return m_checksumVersion == 0 ? 4 : 1; }

    ChecksumPolicy getChecksumPolicy() const { return m_checksumPolicy; }
    void setChecksumPolicy(ChecksumPolicy policy) { m_checksumPolicy = policy; }

    const std::string& getAccessKey() const { return m_accessKey; }
    bool isFriendsService() const { return m_accessKey == FRIENDS_ACCESS_KEY; }

    uint32_t getSignatureBase() const { return m_signatureBase; }
    const std::vector<uint8_t>& getSignatureKey() const { return m_signatureKey; }

    // Connection signatures exchanged during SYN / CONNECT
    const std::optional<Signature>& getServerConnectionSignature() const { return m_serverConnectionSignature; }
    void setServerConnectionSignature(const Signature& signature) { m_serverConnectionSignature = signature; }

    const std::optional<Signature>& getClientConnectionSignature() const { return m_clientConnectionSignature; }
    void setClientConnectionSignature(const Signature& signature) { m_clientConnectionSignature = signature; }
    void clearClientConnectionSignature() { m_clientConnectionSignature.reset(); }

    // Per-direction serialization
    std::mutex& encodeMutex() { return m_encodeMutex; }
    std::mutex& decodeMutex() { return m_decodeMutex; }

private:
    uint8_t m_checksumVersion;
    uint8_t m_flagsVersion;
    ChecksumPolicy m_checksumPolicy;

    std::string m_accessKey;
    uint32_t m_signatureBase = 0;
    std::vector<uint8_t> m_signatureKey;
    std::vector<uint8_t> m_rc4Key;

    std::optional<Signature> m_serverConnectionSignature;
    std::optional<Signature> m_clientConnectionSignature;

    std::unique_ptr<StreamCipher> m_cipher;
    std::unique_ptr<StreamCipher> m_decipher;

    std::mutex m_encodeMutex;
    std::mutex m_decodeMutex;
};

} // namespace prudp
