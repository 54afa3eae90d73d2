#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace codemode {

// Incremental SHA-256, used for the audit hash chain.
class Sha256 {
public:
    Sha256();
    void update(const uint8_t* data, size_t n);
    void update(const std::string& s) {
        update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    }
    std::array<uint8_t, 32> finish();
    std::string finish_hex();

private:
    void compress(const uint8_t block[64]);

    uint32_t state_[8];
    uint8_t buf_[64];
    size_t buf_len_{0};
    uint64_t total_{0};
};

std::string sha256_hex(const std::string& s);

// Fills out with kernel randomness (getrandom, then /dev/urandom).
// Throws std::runtime_error when neither source works.
void secure_random_bytes(uint8_t* out, size_t n);

// RFC 4122 version 4 UUID, lowercase hex with dashes.
std::string uuid_v4();

} // namespace codemode
