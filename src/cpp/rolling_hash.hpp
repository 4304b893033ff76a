#pragma once
#include <cstddef>
#include <cstdint>
#include <zlib.h>

namespace rkrGST {

/**
 * @brief Adler-32 checksum that can slide over a fixed-width window.
 *
 * The state is the pair (a, b) of the Adler-32 definition, so hash() of a
 * window built by update() calls is identical to zlib's adler32() of the
 * same bytes. remove() drops the oldest token of a window of known width,
 * which together with update() shifts the window by one position in O(1).
 *
 * Tokens wider than a byte are reduced modulo the Adler base before being
 * added; the checksum is then only a hash, never an identity.
 */
class RollingAdler32 {
public:
    static constexpr uint32_t MOD = 65521;

    RollingAdler32() = default;

    /**
     * @brief Checksum of a byte window, computed by zlib.
     *
     * @param data First byte of the window
     * @param size Window width in bytes
     * @return Rolling state positioned on the window
     */
    static RollingAdler32 of_window(const char* data, size_t size) {
        uLong adler = adler32_z(1L, reinterpret_cast<const Bytef*>(data), size);
        RollingAdler32 h;
        h.a_ = static_cast<uint32_t>(adler & 0xffff);
        h.b_ = static_cast<uint32_t>((adler >> 16) & 0xffff);
        return h;
    }

    /**
     * @brief Checksum of a token window.
     *
     * @param data First token of the window
     * @param size Window width in tokens
     * @return Rolling state positioned on the window
     */
    static RollingAdler32 of_window(const uint32_t* data, size_t size) {
        RollingAdler32 h;
        for (size_t i = 0; i < size; ++i) h.update(data[i]);
        return h;
    }

    /**
     * @brief Appends a token at the end of the window.
     */
    void update(uint32_t token) {
        a_ = (a_ + token % MOD) % MOD;
        b_ = (b_ + a_) % MOD;
    }

    /**
     * @brief Removes the first token of a window of @p window tokens.
     *
     * @param window Width of the window before the removal
     * @param token The token leaving the window
     */
    void remove(size_t window, uint32_t token) {
        const uint64_t t = token % MOD;
        a_ = static_cast<uint32_t>((a_ + MOD - t) % MOD);
        b_ = static_cast<uint32_t>((uint64_t{b_} + (MOD - 1) + (MOD - (window % MOD) * t % MOD)) % MOD);
    }

    uint32_t hash() const { return (b_ << 16) | a_; }

private:
    uint32_t a_ = 1;
    uint32_t b_ = 0;
};

} // namespace rkrGST
