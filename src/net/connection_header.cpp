#include "tcpros/net/connection_header.hpp"

#include <cstring>
#include <string_view>
#include <utility>

#include "tcpros/core/utf8.hpp"

namespace tcpros::net {
    namespace {
        using tcpros::core::LogLevel;
        using tcpros::core::LogSink;
        using tcpros::core::Status;

        constexpr std::string_view kCallerId = "callerid";
        constexpr std::string_view kLatching = "latching";
        constexpr std::string_view kMd5Sum = "md5sum";
        constexpr std::string_view kMessageDefinition = "message_definition";
        constexpr std::string_view kTcpNoDelay = "tcp_nodelay";
        constexpr std::string_view kTopic = "topic";
        constexpr std::string_view kType = "type";

        void put_u32_le(u8* p, u32 v) noexcept {
            p[0] = static_cast<u8>((v >> 0) & 0xffu);
            p[1] = static_cast<u8>((v >> 8) & 0xffu);
            p[2] = static_cast<u8>((v >> 16) & 0xffu);
            p[3] = static_cast<u8>((v >> 24) & 0xffu);
        }

        [[nodiscard]] u32 get_u32_le(const u8* p) noexcept {
            return (static_cast<u32>(p[0]) << 0) |
                   (static_cast<u32>(p[1]) << 8) |
                   (static_cast<u32>(p[2]) << 16) |
                   (static_cast<u32>(p[3]) << 24);
        }

        [[nodiscard]] std::string_view bool_text(bool v) noexcept {
            return v ? std::string_view{"1"} : std::string_view{"0"};
        }

        [[nodiscard]] u64 field_size(std::string_view name, std::string_view value) noexcept {
            return header_field_size(name.size(), value.size());
        }

        // Caller guarantees room for field_size(name, value) bytes at p.
        u8* write_field(u8* p, std::string_view name, std::string_view value) noexcept {
            put_u32_le(p, static_cast<u32>(name.size() + 1 + value.size()));
            p += kHeaderLengthBytes;
            std::memcpy(p, name.data(), name.size());
            p += name.size();
            *p++ = static_cast<u8>('=');
            if (!value.empty()) {
                std::memcpy(p, value.data(), value.size());
                p += value.size();
            }
            return p;
        }

        [[nodiscard]] Status corrupt(HeaderError e) noexcept {
            return tcpros::core::make_status(tcpros::core::StatusDomain::Net,
                tcpros::core::StatusCode::Corrupt,
                static_cast<u32>(e));
        }

        void assign_field(ConnectionHeader* h, std::string_view name, std::string_view value, const LogSink& log) {
            if (name == kCallerId) {
                h->caller_id.assign(value);
            } else if (name == kMessageDefinition) {
                h->msg_definition.assign(value);
            } else if (name == kMd5Sum) {
                h->md5sum.assign(value);
            } else if (name == kTopic) {
                h->topic.assign(value);
            } else if (name == kType) {
                h->topic_type.assign(value);
            } else if (name == kLatching) {
                h->latching = value != "0";
            } else if (name == kTcpNoDelay) {
                h->tcp_nodelay = value != "0";
            } else {
                log_write(log, LogLevel::Warn, "unknown connection header field '%.*s' ignored",
                    static_cast<int>(name.size()), name.data());
            }
        }
    } // namespace

    const char* header_error_name(HeaderError e) noexcept {
        switch (e) {
        case HeaderError::None: return "None";
        case HeaderError::Truncated: return "Truncated";
        case HeaderError::MissingSeparator: return "MissingSeparator";
        case HeaderError::FieldUnderflow: return "FieldUnderflow";
        case HeaderError::OuterUnderflow: return "OuterUnderflow";
        case HeaderError::InvalidUtf8: return "InvalidUtf8";
        }
        return "Unknown";
    }

    u64 header_encoded_size(const ConnectionHeader& h, bool to_publisher) noexcept {
        u64 n = kHeaderLengthBytes;
        n += field_size(kCallerId, h.caller_id);
        n += field_size(kLatching, bool_text(h.latching));
        n += field_size(kMd5Sum, h.md5sum);
        n += field_size(kMessageDefinition, h.msg_definition);
        if (to_publisher) {
            n += field_size(kTcpNoDelay, bool_text(h.tcp_nodelay));
        }
        n += field_size(kTopic, h.topic);
        n += field_size(kType, h.topic_type);
        return n;
    }

    u32 header_encode(const ConnectionHeader& h, bool to_publisher, BufferMut out) noexcept {
        // out.len is a u32, so a frame that fits also fits every length prefix.
        const u64 need = header_encoded_size(h, to_publisher);
        if (out.data == nullptr || out.len < need) {
            return 0;
        }

        // Block length is patched in once every field is written.
        u8* p = out.data + kHeaderLengthBytes;
        p = write_field(p, kCallerId, h.caller_id);
        p = write_field(p, kLatching, bool_text(h.latching));
        p = write_field(p, kMd5Sum, h.md5sum);
        p = write_field(p, kMessageDefinition, h.msg_definition);
        if (to_publisher) {
            p = write_field(p, kTcpNoDelay, bool_text(h.tcp_nodelay));
        }
        p = write_field(p, kTopic, h.topic);
        p = write_field(p, kType, h.topic_type);

        const u32 written = static_cast<u32>(p - out.data);
        put_u32_le(out.data, written - kHeaderLengthBytes);
        return written;
    }

    std::vector<u8> header_encode(const ConnectionHeader& h, bool to_publisher) {
        const u64 need = header_encoded_size(h, to_publisher);
        if (need > kMaxFrameBytes) {
            return {};
        }
        std::vector<u8> buf(static_cast<size_t>(need));
        const u32 written = header_encode(h, to_publisher, {buf.data(), static_cast<u32>(buf.size())});
        buf.resize(written);
        return buf;
    }

    tcpros::core::Status header_decode(BufferView in, ConnectionHeader* out, const LogSink& log) {
        if (out == nullptr) {
            return tcpros::core::make_status(tcpros::core::StatusDomain::Net, tcpros::core::StatusCode::Invalid);
        }
        if (in.len > 0 && in.data == nullptr) {
            return tcpros::core::make_status(tcpros::core::StatusDomain::Net, tcpros::core::StatusCode::Invalid);
        }
        if (in.len < kHeaderLengthBytes) {
            log_write(log, LogLevel::Warn, "connection header shorter than its length prefix (%u bytes)", in.len);
            return corrupt(HeaderError::Truncated);
        }

        const u8* const base = in.data;
        u32 remaining = get_u32_le(base);
        u32 pos = kHeaderLengthBytes;

        ConnectionHeader h{};
        while (remaining > 0) {
            if (in.len - pos < kHeaderLengthBytes) {
                log_write(log, LogLevel::Warn, "connection header truncated before field length at offset %u", pos);
                return corrupt(HeaderError::Truncated);
            }
            const u32 field_len = get_u32_le(base + pos);
            const u32 name_pos = pos + kHeaderLengthBytes;

            const void* eq = std::memchr(base + name_pos, '=', in.len - name_pos);
            if (eq == nullptr) {
                log_write(log, LogLevel::Warn, "connection header field at offset %u has no '='", pos);
                return corrupt(HeaderError::MissingSeparator);
            }
            const u32 name_len = static_cast<u32>(static_cast<const u8*>(eq) - (base + name_pos));

            if (static_cast<u64>(field_len) < static_cast<u64>(name_len) + 1) {
                log_write(log, LogLevel::Warn, "underflow in connection header, nothing remaining after '='");
                return corrupt(HeaderError::FieldUnderflow);
            }
            const u32 value_len = field_len - name_len - 1;
            const u32 value_pos = name_pos + name_len + 1;
            if (in.len - value_pos < value_len) {
                log_write(log, LogLevel::Warn, "connection header field claims %u bytes, only %u left in buffer",
                    field_len, in.len - name_pos);
                return corrupt(HeaderError::Truncated);
            }

            const u8* name_bytes = base + name_pos;
            const u8* value_bytes = base + value_pos;
            if (!tcpros::core::utf8_valid(name_bytes, name_len)) {
                const std::string lossy = tcpros::core::utf8_lossy(name_bytes, name_len);
                log_write(log, LogLevel::Warn, "connection header field name %s (lossy) is invalid UTF-8", lossy.c_str());
                return corrupt(HeaderError::InvalidUtf8);
            }
            if (!tcpros::core::utf8_valid(value_bytes, value_len)) {
                const std::string lossy = tcpros::core::utf8_lossy(value_bytes, value_len);
                log_write(log, LogLevel::Warn, "connection header value %s (lossy) is invalid UTF-8", lossy.c_str());
                return corrupt(HeaderError::InvalidUtf8);
            }

            const u64 consumed = static_cast<u64>(kHeaderLengthBytes) + field_len;
            if (consumed > remaining) {
                log_write(log, LogLevel::Warn, "underflow in connection header, field overruns block by %llu bytes",
                    static_cast<unsigned long long>(consumed - remaining));
                return corrupt(HeaderError::OuterUnderflow);
            }

            const std::string_view name{reinterpret_cast<const char*>(name_bytes), name_len};
            const std::string_view value{reinterpret_cast<const char*>(value_bytes), value_len};
            assign_field(&h, name, value, log);

            remaining -= static_cast<u32>(consumed);
            pos = value_pos + value_len;
        }

        *out = std::move(h);
        return tcpros::core::ok_status();
    }

    HeaderPeekResult header_peek_length(BufferView in, u32* frame_len) noexcept {
        if (frame_len == nullptr) return HeaderPeekResult::Invalid;
        if (in.data == nullptr) return HeaderPeekResult::NeedMore;
        if (in.len < kHeaderLengthBytes) return HeaderPeekResult::NeedMore;

        const u32 block_len = get_u32_le(in.data);
        if (block_len > kMaxHeaderBytes) return HeaderPeekResult::Invalid;

        *frame_len = kHeaderLengthBytes + block_len;
        return HeaderPeekResult::Ok;
    }
} // namespace tcpros::net
