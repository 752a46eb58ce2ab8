#include "tcpros/msg/md5sum.hpp"

#include <array>
#include <utility>
#include <vector>

#include <openssl/evp.h>

namespace tcpros::msg {
    namespace {
        using tcpros::core::StatusCode;

        constexpr std::array<std::string_view, 16> kBuiltinTypes = {
            "bool", "byte", "char",
            "int8", "uint8", "int16", "uint16", "int32", "uint32", "int64", "uint64",
            "float32", "float64",
            "string", "time", "duration",
        };

        [[nodiscard]] tcpros::core::Status msg_status(StatusCode code, tcpros::core::u32 aux = 0) noexcept {
            return tcpros::core::make_status(tcpros::core::StatusDomain::Msg, code, aux);
        }

        [[nodiscard]] bool is_space(char c) noexcept {
            return c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f';
        }

        [[nodiscard]] std::string_view trim(std::string_view s) noexcept {
            while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
            while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
            return s;
        }

        [[nodiscard]] std::string_view strip_comment(std::string_view line) noexcept {
            const size_t hash = line.find('#');
            return trim(line.substr(0, hash));
        }

        // Type without any array suffix ("int32[4]" -> "int32").
        [[nodiscard]] std::string_view base_type(std::string_view type) noexcept {
            return type.substr(0, type.find('['));
        }

        // Splits "a  b" into its first token and the trimmed remainder.
        [[nodiscard]] std::string_view next_token(std::string_view* s) noexcept {
            std::string_view in = trim(*s);
            size_t end = 0;
            while (end < in.size() && !is_space(in[end])) ++end;
            *s = trim(in.substr(end));
            return in.substr(0, end);
        }

        struct Line {
            std::string text;
            bool constant{false};
        };
    } // namespace

    bool is_builtin_type(std::string_view type) noexcept {
        const std::string_view base = base_type(type);
        for (std::string_view t : kBuiltinTypes) {
            if (t == base) {
                return true;
            }
        }
        return false;
    }

    tcpros::core::Status msg_md5_text(std::string_view definition, std::string* out) {
        if (out == nullptr) {
            return msg_status(StatusCode::Invalid);
        }

        std::vector<Line> lines;
        tcpros::core::u32 line_no = 0;
        std::string_view rest = definition;
        while (!rest.empty()) {
            const size_t nl = rest.find('\n');
            const std::string_view raw = rest.substr(0, nl);
            rest = nl == std::string_view::npos ? std::string_view{} : rest.substr(nl + 1);
            ++line_no;

            const std::string_view clean = strip_comment(raw);
            if (clean.empty()) {
                continue;
            }

            std::string_view tail = clean;
            const std::string_view type = next_token(&tail);

            if (clean.find('=') != std::string_view::npos) {
                // String constants keep the raw text after '=', '#' included.
                const bool is_string = type == "string";
                const std::string_view src = is_string ? trim(raw) : clean;
                std::string_view after_type = src.substr(type.size());
                const size_t eq = after_type.find('=');
                const std::string_view name = trim(after_type.substr(0, eq));
                const std::string_view value = trim(after_type.substr(eq + 1));
                if (name.empty() || name.find_first_of(" \t") != std::string_view::npos) {
                    return msg_status(StatusCode::Invalid, line_no);
                }
                if (!is_builtin_type(type) || base_type(type) != type) {
                    return msg_status(StatusCode::Invalid, line_no);
                }

                Line l{};
                l.text.append(type).append(" ").append(name).append("=").append(value);
                l.constant = true;
                lines.push_back(std::move(l));
                continue;
            }

            const std::string_view name = next_token(&tail);
            if (name.empty() || !tail.empty()) {
                return msg_status(StatusCode::Invalid, line_no);
            }
            if (!is_builtin_type(type)) {
                return msg_status(StatusCode::Unsupported, line_no);
            }

            Line l{};
            l.text.append(type).append(" ").append(name);
            lines.push_back(std::move(l));
        }

        std::string text;
        for (int pass = 0; pass < 2; ++pass) {
            const bool want_constant = pass == 0;
            for (const Line& l : lines) {
                if (l.constant != want_constant) {
                    continue;
                }
                if (!text.empty()) {
                    text.push_back('\n');
                }
                text.append(l.text);
            }
        }

        *out = std::move(text);
        return tcpros::core::ok_status();
    }

    tcpros::core::Status msg_md5sum(std::string_view definition, std::string* hex_out) {
        if (hex_out == nullptr) {
            return msg_status(StatusCode::Invalid);
        }

        std::string text;
        const tcpros::core::Status s = msg_md5_text(definition, &text);
        if (!tcpros::core::is_ok(s)) {
            return s;
        }

        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        if (!ctx) {
            return msg_status(StatusCode::Unavailable);
        }

        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int digest_len = 0;
        int ok = 1;
        ok &= EVP_DigestInit_ex(ctx, EVP_md5(), nullptr);
        ok &= EVP_DigestUpdate(ctx, text.data(), text.size());
        ok &= EVP_DigestFinal_ex(ctx, digest, &digest_len);
        EVP_MD_CTX_free(ctx);

        if (!ok || digest_len * 2 != kMd5HexChars) {
            return msg_status(StatusCode::Unavailable);
        }

        static const char hex[] = "0123456789abcdef";
        std::string out(kMd5HexChars, '0');
        for (unsigned i = 0; i < digest_len; ++i) {
            out[i * 2] = hex[(digest[i] >> 4) & 0xF];
            out[i * 2 + 1] = hex[digest[i] & 0xF];
        }
        *hex_out = std::move(out);
        return tcpros::core::ok_status();
    }
} // namespace tcpros::msg
