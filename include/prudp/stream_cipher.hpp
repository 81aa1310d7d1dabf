#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct rc4_key_st;

namespace prudp {

/**
 * Stateful keystream transform applied to DATA payloads.
 *
 * The keystream position advances with every byte processed, so one
 * instance must see a connection's payloads in wire order.
 */
class StreamCipher {
public:
    virtual ~StreamCipher() = default;

    // XOR the next data.size() keystream bytes into data
    virtual void apply(std::vector<uint8_t>& data) = 0;
};

/**
 * RC4 stream cipher (OpenSSL)
 */
class Rc4Cipher : public StreamCipher {
public:
    explicit Rc4Cipher(const std::vector<uint8_t>& key);
    explicit Rc4Cipher(const std::string& key);
    ~Rc4Cipher() override;

    Rc4Cipher(const Rc4Cipher&) = delete;
    Rc4Cipher& operator=(const Rc4Cipher&) = delete;

    void apply(std::vector<uint8_t>& data) override;

private:
    std::unique_ptr<rc4_key_st> m_key;
};

} // namespace prudp
