#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include "tcpros/cli/commands.hpp"
#include "tcpros/cli/options.hpp"
#include "tcpros/core/errors.hpp"
#include "tcpros/core/log.hpp"
#include "tcpros/fs/discovery.hpp"
#include "tcpros/msg/md5sum.hpp"
#include "tcpros/net/buffer.hpp"
#include "tcpros/net/connection_header.hpp"

// ========================================================================
// Configuration
// ========================================================================

struct CliConfig {
    tcpros::core::LogSink log{tcpros::core::log_stderr_sink()};
    const char* package_path{nullptr};  // ROS_PACKAGE_PATH
    bool verbose{false};
};

namespace {

constexpr tcpros::cli::u32 kMaxOptions = 32;

const tcpros::cli::OptionSpec kEncodeOptions[] = {
    {tcpros::cli::OptionId::CallerId, tcpros::cli::OptionType::String, "callerid", 'c'},
    {tcpros::cli::OptionId::Topic, tcpros::cli::OptionType::String, "topic", 't'},
    {tcpros::cli::OptionId::Type, tcpros::cli::OptionType::String, "type", 'y'},
    {tcpros::cli::OptionId::Md5Sum, tcpros::cli::OptionType::String, "md5sum", 'm'},
    {tcpros::cli::OptionId::Definition, tcpros::cli::OptionType::String, "definition", 'd'},
    {tcpros::cli::OptionId::Latching, tcpros::cli::OptionType::Flag, "latching", 'l'},
    {tcpros::cli::OptionId::TcpNoDelay, tcpros::cli::OptionType::Flag, "tcp-nodelay", 'n'},
    {tcpros::cli::OptionId::ToPublisher, tcpros::cli::OptionType::Flag, "to-publisher", 'p'},
    {tcpros::cli::OptionId::Output, tcpros::cli::OptionType::String, "output", 'o'},
};

const tcpros::cli::OptionSpec kDecodeOptions[] = {
    {tcpros::cli::OptionId::Verbose, tcpros::cli::OptionType::Flag, "verbose", 'v'},
};

const tcpros::cli::OptionSpec kFindOptions[] = {
    {tcpros::cli::OptionId::Kind, tcpros::cli::OptionType::String, "kind", 'k'},
};

// ========================================================================
// File I/O Utilities
// ========================================================================

tcpros::core::Status read_file(const char* path, std::vector<tcpros::core::u8>* out) {
    FILE* f = std::fopen(path, "rb");
    if (!f) {
        return tcpros::core::make_status(tcpros::core::StatusDomain::Cli, tcpros::core::StatusCode::NotFound);
    }

    std::vector<tcpros::core::u8> data;
    tcpros::core::u8 chunk[4096];
    size_t n = 0;
    while ((n = std::fread(chunk, 1, sizeof(chunk), f)) > 0) {
        data.insert(data.end(), chunk, chunk + n);
    }
    const bool failed = std::ferror(f) != 0;
    std::fclose(f);

    if (failed) {
        return tcpros::core::make_status(tcpros::core::StatusDomain::Cli, tcpros::core::StatusCode::Io);
    }
    *out = std::move(data);
    return tcpros::core::ok_status();
}

tcpros::core::Status write_file(const char* path, const tcpros::core::u8* data, size_t size) {
    FILE* f = std::fopen(path, "wb");
    if (!f) {
        return tcpros::core::make_status(tcpros::core::StatusDomain::Cli, tcpros::core::StatusCode::PermissionDenied);
    }

    const size_t written = std::fwrite(data, 1, size, f);
    const int close_rc = std::fclose(f);

    if (written != size || close_rc != 0) {
        return tcpros::core::make_status(tcpros::core::StatusDomain::Cli, tcpros::core::StatusCode::Io);
    }
    return tcpros::core::ok_status();
}

// ========================================================================
// Error Handling
// ========================================================================

void print_error(const char* msg) {
    std::fprintf(stderr, "error: %s\n", msg);
}

void print_status_error(const char* context, tcpros::core::Status s) {
    std::fprintf(stderr,
        "error: %s failed (code=%s, domain=%s, aux=%u)\n",
        context,
        tcpros::core::status_code_name(s.code),
        tcpros::core::status_domain_name(s.domain),
        s.aux);
    if (s.domain == tcpros::core::StatusDomain::Net && s.code == tcpros::core::StatusCode::Corrupt) {
        std::fprintf(stderr, "error: %s: %s\n", context,
            tcpros::net::header_error_name(static_cast<tcpros::net::HeaderError>(s.aux)));
    }
}

const char* option_str(const tcpros::cli::ParsedOptions& opts, tcpros::cli::OptionId id) {
    const tcpros::cli::ParsedOption* o = tcpros::cli::find_option(opts, id);
    return o != nullptr ? o->value : nullptr;
}

bool option_flag(const tcpros::cli::ParsedOptions& opts, tcpros::cli::OptionId id) {
    return tcpros::cli::find_option(opts, id) != nullptr;
}

// Parses options for a sub-command; the remaining positionals land in *rest.
bool parse_command_options(const char* command,
    const tcpros::cli::CliArgs& args,
    const tcpros::cli::OptionSpec* specs,
    tcpros::cli::u32 spec_count,
    tcpros::cli::ParsedOptions* opts,
    tcpros::cli::CliArgs* rest) {
    tcpros::cli::u32 consumed = 0;
    const tcpros::core::Status s = tcpros::cli::parse_options(args, specs, spec_count, opts, &consumed);
    if (!tcpros::core::is_ok(s)) {
        std::fprintf(stderr, "error: %s: bad option (see 'tcpros help')\n", command);
        return false;
    }
    rest->argv = args.argv + consumed;
    rest->argc = args.argc - consumed;
    return true;
}

// ========================================================================
// Command Handlers
// ========================================================================

void handle_help() {
    std::printf("Usage: tcpros <command> [options]\n");
    std::printf("Commands:\n");
    std::printf("  decode [-v] <file>        Decode a connection header frame and print its fields\n");
    std::printf("  encode [opts] -o <file>   Write a connection header frame\n");
    std::printf("                   Options: --callerid S, --topic S, --type S, --md5sum S,\n");
    std::printf("                            --definition FILE (md5sum computed if not given),\n");
    std::printf("                            --latching, --tcp-nodelay, --to-publisher\n");
    std::printf("  find [--kind msg|srv|action] <root>  List definition files and their packages\n");
    std::printf("  installed                 List .msg files under ROS_PACKAGE_PATH\n");
    std::printf("  md5 <file.msg>            Print the md5sum of a message definition\n");
    std::printf("  help                      Show this help\n");
}

int handle_decode(const CliConfig& cfg, const tcpros::cli::CliArgs& args) {
    tcpros::cli::ParsedOption buf[kMaxOptions]{};
    tcpros::cli::ParsedOptions opts{buf, 0, kMaxOptions};
    tcpros::cli::CliArgs rest{};
    if (!parse_command_options("decode", args, kDecodeOptions, 1, &opts, &rest)) {
        return EXIT_FAILURE;
    }
    if (rest.argc != 1) {
        print_error("decode: expected exactly one file");
        return EXIT_FAILURE;
    }
    const bool verbose = cfg.verbose || option_flag(opts, tcpros::cli::OptionId::Verbose);

    std::vector<tcpros::core::u8> data;
    tcpros::core::Status s = read_file(rest.argv[0], &data);
    if (!tcpros::core::is_ok(s)) {
        std::fprintf(stderr, "error: decode: failed to read %s\n", rest.argv[0]);
        return EXIT_FAILURE;
    }

    tcpros::net::BufferView in{};
    if (!tcpros::net::buffer_view_of(data.data(), data.size(), &in)) {
        std::fprintf(stderr, "error: decode: %s is too large (%zu bytes)\n", rest.argv[0], data.size());
        return EXIT_FAILURE;
    }
    tcpros::core::u32 frame_len = 0;
    const tcpros::net::HeaderPeekResult peek = tcpros::net::header_peek_length(in, &frame_len);
    if (peek != tcpros::net::HeaderPeekResult::Ok) {
        print_error(peek == tcpros::net::HeaderPeekResult::NeedMore ? "decode: file shorter than length prefix"
                                                                    : "decode: header length exceeds limit");
        return EXIT_FAILURE;
    }
    if (verbose) {
        std::fprintf(stderr, "info: frame is %u bytes, file is %zu bytes\n", frame_len, data.size());
    }

    tcpros::net::ConnectionHeader h{};
    s = tcpros::net::header_decode(in, &h, cfg.log);
    if (!tcpros::core::is_ok(s)) {
        print_status_error("decode", s);
        return EXIT_FAILURE;
    }

    std::printf("callerid=%s\n", h.caller_id.c_str());
    std::printf("latching=%d\n", h.latching ? 1 : 0);
    std::printf("md5sum=%s\n", h.md5sum.c_str());
    std::printf("message_definition=%s\n", h.msg_definition.c_str());
    std::printf("tcp_nodelay=%d\n", h.tcp_nodelay ? 1 : 0);
    std::printf("topic=%s\n", h.topic.c_str());
    std::printf("type=%s\n", h.topic_type.c_str());
    return EXIT_SUCCESS;
}

int handle_encode(const CliConfig& cfg, const tcpros::cli::CliArgs& args) {
    tcpros::cli::ParsedOption buf[kMaxOptions]{};
    tcpros::cli::ParsedOptions opts{buf, 0, kMaxOptions};
    tcpros::cli::CliArgs rest{};
    const tcpros::cli::u32 spec_count = sizeof(kEncodeOptions) / sizeof(kEncodeOptions[0]);
    if (!parse_command_options("encode", args, kEncodeOptions, spec_count, &opts, &rest)) {
        return EXIT_FAILURE;
    }
    if (rest.argc != 0) {
        std::fprintf(stderr, "error: encode: unexpected argument %s\n", rest.argv[0]);
        return EXIT_FAILURE;
    }

    const char* output = option_str(opts, tcpros::cli::OptionId::Output);
    if (output == nullptr) {
        print_error("encode: --output is required");
        return EXIT_FAILURE;
    }

    tcpros::net::ConnectionHeader h{};
    if (const char* v = option_str(opts, tcpros::cli::OptionId::CallerId)) h.caller_id = v;
    if (const char* v = option_str(opts, tcpros::cli::OptionId::Topic)) h.topic = v;
    if (const char* v = option_str(opts, tcpros::cli::OptionId::Type)) h.topic_type = v;
    if (const char* v = option_str(opts, tcpros::cli::OptionId::Md5Sum)) h.md5sum = v;
    h.latching = option_flag(opts, tcpros::cli::OptionId::Latching);
    h.tcp_nodelay = option_flag(opts, tcpros::cli::OptionId::TcpNoDelay);
    const bool to_publisher = option_flag(opts, tcpros::cli::OptionId::ToPublisher);

    if (const char* def_path = option_str(opts, tcpros::cli::OptionId::Definition)) {
        std::vector<tcpros::core::u8> def;
        const tcpros::core::Status s = read_file(def_path, &def);
        if (!tcpros::core::is_ok(s)) {
            std::fprintf(stderr, "error: encode: failed to read %s\n", def_path);
            return EXIT_FAILURE;
        }
        h.msg_definition.assign(def.begin(), def.end());

        if (h.md5sum.empty()) {
            const tcpros::core::Status ms = tcpros::msg::msg_md5sum(h.msg_definition, &h.md5sum);
            if (!tcpros::core::is_ok(ms)) {
                print_status_error("encode: md5sum", ms);
                return EXIT_FAILURE;
            }
        }
    }

    const std::vector<tcpros::core::u8> bytes = tcpros::net::header_encode(h, to_publisher);
    if (bytes.empty()) {
        print_error("encode: header fields exceed the 4 GiB frame limit");
        return EXIT_FAILURE;
    }
    const tcpros::core::Status s = write_file(output, bytes.data(), bytes.size());
    if (!tcpros::core::is_ok(s)) {
        std::fprintf(stderr, "error: encode: failed to write %s\n", output);
        return EXIT_FAILURE;
    }
    if (cfg.verbose) {
        std::fprintf(stderr, "info: wrote %zu bytes to %s\n", bytes.size(), output);
    }
    return EXIT_SUCCESS;
}

void print_files(const std::vector<tcpros::fs::RosFile>& files) {
    for (const tcpros::fs::RosFile& f : files) {
        std::printf("%s %s\n", f.package_name.c_str(), f.path.string().c_str());
    }
}

int handle_find(const tcpros::cli::CliArgs& args) {
    tcpros::cli::ParsedOption buf[kMaxOptions]{};
    tcpros::cli::ParsedOptions opts{buf, 0, kMaxOptions};
    tcpros::cli::CliArgs rest{};
    if (!parse_command_options("find", args, kFindOptions, 1, &opts, &rest)) {
        return EXIT_FAILURE;
    }
    if (rest.argc != 1) {
        print_error("find: expected exactly one root directory");
        return EXIT_FAILURE;
    }

    const char* kind = option_str(opts, tcpros::cli::OptionId::Kind);
    if (kind == nullptr) {
        kind = "msg";
    }

    std::vector<tcpros::fs::RosFile> files;
    tcpros::core::Status s{};
    if (std::strcmp(kind, "msg") == 0) {
        s = tcpros::fs::find_msg_files(rest.argv[0], &files);
    } else if (std::strcmp(kind, "srv") == 0) {
        s = tcpros::fs::find_srv_files(rest.argv[0], &files);
    } else if (std::strcmp(kind, "action") == 0) {
        s = tcpros::fs::find_action_files(rest.argv[0], &files);
    } else {
        std::fprintf(stderr, "error: find: unknown kind %s\n", kind);
        return EXIT_FAILURE;
    }

    if (!tcpros::core::is_ok(s)) {
        print_status_error("find", s);
        return EXIT_FAILURE;
    }
    print_files(files);
    return EXIT_SUCCESS;
}

int handle_installed(const CliConfig& cfg) {
    std::vector<tcpros::fs::RosFile> files;
    const tcpros::core::Status s = tcpros::fs::find_installed_msgs(cfg.package_path, &files, cfg.log);
    if (!tcpros::core::is_ok(s)) {
        if (s.code == tcpros::core::StatusCode::NotFound && (cfg.package_path == nullptr || *cfg.package_path == '\0')) {
            print_error("installed: ROS_PACKAGE_PATH is not set");
        } else {
            print_status_error("installed", s);
        }
        return EXIT_FAILURE;
    }
    print_files(files);
    return EXIT_SUCCESS;
}

int handle_md5(const tcpros::cli::CliArgs& args) {
    if (args.argc != 1) {
        print_error("md5: expected exactly one definition file");
        return EXIT_FAILURE;
    }

    std::vector<tcpros::core::u8> def;
    tcpros::core::Status s = read_file(args.argv[0], &def);
    if (!tcpros::core::is_ok(s)) {
        std::fprintf(stderr, "error: md5: failed to read %s\n", args.argv[0]);
        return EXIT_FAILURE;
    }

    std::string hex;
    s = tcpros::msg::msg_md5sum(std::string(def.begin(), def.end()), &hex);
    if (!tcpros::core::is_ok(s)) {
        if (s.code == tcpros::core::StatusCode::Unsupported) {
            std::fprintf(stderr, "error: md5: line %u uses a non built-in type\n", s.aux);
        } else {
            print_status_error("md5", s);
        }
        return EXIT_FAILURE;
    }
    std::printf("%s\n", hex.c_str());
    return EXIT_SUCCESS;
}

} // namespace

// ========================================================================
// Main
// ========================================================================

int main(int argc, char** argv) {
    CliConfig cfg;
    cfg.package_path = std::getenv("ROS_PACKAGE_PATH");
    const char* verbose_env = std::getenv("TCPROS_VERBOSE");
    cfg.verbose = verbose_env != nullptr && std::strcmp(verbose_env, "1") == 0;

    const tcpros::cli::CommandSpec commands[] = {
        {tcpros::cli::CommandId::Help, "help"},
        {tcpros::cli::CommandId::Decode, "decode"},
        {tcpros::cli::CommandId::Encode, "encode"},
        {tcpros::cli::CommandId::Find, "find"},
        {tcpros::cli::CommandId::Installed, "installed"},
        {tcpros::cli::CommandId::Md5, "md5"},
    };
    const tcpros::core::u32 command_count = sizeof(commands) / sizeof(commands[0]);

    if (argc < 2) {
        handle_help();
        return EXIT_FAILURE;
    }

    tcpros::cli::CommandInvocation cmd{};
    tcpros::core::u32 consumed = 0;
    const tcpros::cli::CliArgs args{argv + 1, static_cast<tcpros::core::u32>(argc - 1)};
    const tcpros::core::Status s = tcpros::cli::parse_command(args, commands, command_count, &cmd, &consumed);
    if (!tcpros::core::is_ok(s)) {
        std::fprintf(stderr, "error: unknown command %s\n", argv[1]);
        return EXIT_FAILURE;
    }

    switch (cmd.id) {
    case tcpros::cli::CommandId::Help:
        handle_help();
        return EXIT_SUCCESS;
    case tcpros::cli::CommandId::Decode:
        return handle_decode(cfg, cmd.args);
    case tcpros::cli::CommandId::Encode:
        return handle_encode(cfg, cmd.args);
    case tcpros::cli::CommandId::Find:
        return handle_find(cmd.args);
    case tcpros::cli::CommandId::Installed:
        return handle_installed(cfg);
    case tcpros::cli::CommandId::Md5:
        return handle_md5(cmd.args);
    default:
        break;
    }

    print_error("unknown command");
    return EXIT_FAILURE;
}
