#include "tcpros/core/utf8.hpp"

namespace tcpros::core {
    namespace {
        [[nodiscard]] bool is_cont(u8 b) noexcept {
            return (b & 0xc0u) == 0x80u;
        }

        // Length of the well-formed sequence starting at p, or 0 if it is
        // not. On 0, *bad is the length of the maximal invalid prefix
        // (always >= 1).
        [[nodiscard]] u32 seq_len(const u8* p, u32 avail, u32* bad) noexcept {
            const u8 b0 = p[0];
            *bad = 1;
            if (b0 < 0x80u) {
                return 1;
            }

            u32 need = 0;
            u8 lo = 0x80u;
            u8 hi = 0xbfu;
            if (b0 >= 0xc2u && b0 <= 0xdfu) {
                need = 2;
            } else if (b0 == 0xe0u) {
                need = 3;
                lo = 0xa0u;
            } else if (b0 == 0xedu) {
                need = 3;
                hi = 0x9fu;
            } else if (b0 >= 0xe1u && b0 <= 0xefu) {
                need = 3;
            } else if (b0 == 0xf0u) {
                need = 4;
                lo = 0x90u;
            } else if (b0 >= 0xf1u && b0 <= 0xf3u) {
                need = 4;
            } else if (b0 == 0xf4u) {
                need = 4;
                hi = 0x8fu;
            } else {
                return 0;
            }

            if (avail < 2 || p[1] < lo || p[1] > hi) {
                return 0;
            }
            for (u32 i = 2; i < need; ++i) {
                if (i >= avail || !is_cont(p[i])) {
                    *bad = i;
                    return 0;
                }
            }
            return need;
        }
    } // namespace

    bool utf8_valid(const u8* data, u32 len) noexcept {
        if (len > 0 && data == nullptr) {
            return false;
        }
        u32 i = 0;
        while (i < len) {
            u32 bad = 0;
            const u32 n = seq_len(data + i, len - i, &bad);
            if (n == 0) {
                return false;
            }
            i += n;
        }
        return true;
    }

    std::string utf8_lossy(const u8* data, u32 len) {
        std::string out;
        if (data == nullptr) {
            return out;
        }
        out.reserve(len);

        u32 i = 0;
        while (i < len) {
            u32 bad = 0;
            const u32 n = seq_len(data + i, len - i, &bad);
            if (n == 0) {
                out.append("\xef\xbf\xbd");
                i += bad;
                continue;
            }
            out.append(reinterpret_cast<const char*>(data + i), n);
            i += n;
        }
        return out;
    }
} // namespace tcpros::core
