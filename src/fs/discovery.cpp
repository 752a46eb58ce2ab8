#include "tcpros/fs/discovery.hpp"

#include <iterator>
#include <string_view>
#include <system_error>
#include <utility>

namespace tcpros::fs {
    namespace {
        namespace stdfs = std::filesystem;

        [[nodiscard]] tcpros::core::Status fs_status(tcpros::core::StatusCode code, tcpros::core::u32 aux = 0) noexcept {
            return tcpros::core::make_status(tcpros::core::StatusDomain::Fs, code, aux);
        }

        [[nodiscard]] bool has_suffix(const stdfs::directory_entry& e, std::string_view suffix) {
            const std::string name = e.path().filename().string();
            return name.size() >= suffix.size() &&
                   name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
        }

        bool is_msg(const stdfs::directory_entry& e) {
            return has_suffix(e, ".msg");
        }

        bool is_srv(const stdfs::directory_entry& e) {
            return has_suffix(e, ".srv");
        }

        bool is_action(const stdfs::directory_entry& e) {
            return has_suffix(e, ".action");
        }
    } // namespace

    tcpros::core::Status find_package_from_path(const stdfs::path& file, std::string* out) {
        if (out == nullptr) {
            return fs_status(tcpros::core::StatusCode::Invalid);
        }

        std::error_code ec;
        stdfs::path dir = stdfs::absolute(file, ec);
        if (ec) {
            return fs_status(tcpros::core::StatusCode::Io, static_cast<tcpros::core::u32>(ec.value()));
        }

        std::string found;
        bool have = false;
        while (true) {
            if (!dir.filename().empty() && stdfs::exists(dir / kPackageMarker, ec)) {
                // Keep walking: the outermost package wins.
                found = dir.filename().string();
                have = true;
            }
            if (!dir.has_relative_path()) {
                break;
            }
            stdfs::path parent = dir.parent_path();
            if (parent == dir) {
                break;
            }
            dir = std::move(parent);
        }

        if (!have) {
            return fs_status(tcpros::core::StatusCode::NotFound);
        }
        *out = std::move(found);
        return tcpros::core::ok_status();
    }

    tcpros::core::Status find_files(const stdfs::path& root, FilePredicate predicate, std::vector<RosFile>* out) {
        if (out == nullptr || predicate == nullptr) {
            return fs_status(tcpros::core::StatusCode::Invalid);
        }

        std::error_code ec;
        if (!stdfs::is_directory(root, ec)) {
            return fs_status(tcpros::core::StatusCode::NotFound, static_cast<tcpros::core::u32>(ec.value()));
        }

        const auto opts = stdfs::directory_options::follow_directory_symlink |
                          stdfs::directory_options::skip_permission_denied;
        stdfs::recursive_directory_iterator it(root, opts, ec);
        if (ec) {
            return fs_status(tcpros::core::StatusCode::Io, static_cast<tcpros::core::u32>(ec.value()));
        }

        // Canonical directories on the current descent path, root first.
        std::vector<stdfs::path> ancestors;
        ancestors.push_back(stdfs::canonical(root, ec));
        if (ec) {
            return fs_status(tcpros::core::StatusCode::Io, static_cast<tcpros::core::u32>(ec.value()));
        }

        std::vector<RosFile> found;
        const stdfs::recursive_directory_iterator end{};
        for (; it != end; it.increment(ec)) {
            if (ec) {
                // The iterator is unusable after a failed increment.
                return fs_status(tcpros::core::StatusCode::Io, static_cast<tcpros::core::u32>(ec.value()));
            }
            const stdfs::directory_entry& entry = *it;
            std::error_code type_ec;
            if (entry.is_directory(type_ec)) {
                ancestors.resize(static_cast<size_t>(it.depth()) + 1);
                stdfs::path dir = stdfs::canonical(entry.path(), type_ec);
                bool loop = static_cast<bool>(type_ec);
                for (const stdfs::path& a : ancestors) {
                    loop = loop || a == dir;
                }
                if (loop) {
                    it.disable_recursion_pending();
                } else {
                    ancestors.push_back(std::move(dir));
                }
                continue;
            }
            if (!entry.is_regular_file(type_ec) || !predicate(entry)) {
                continue;
            }

            RosFile f{};
            f.path = entry.path();
            const tcpros::core::Status s = find_package_from_path(f.path, &f.package_name);
            if (!tcpros::core::is_ok(s)) {
                return s;
            }
            found.push_back(std::move(f));
        }

        out->insert(out->end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
        return tcpros::core::ok_status();
    }

    tcpros::core::Status find_msg_files(const stdfs::path& root, std::vector<RosFile>* out) {
        return find_files(root, &is_msg, out);
    }

    tcpros::core::Status find_srv_files(const stdfs::path& root, std::vector<RosFile>* out) {
        return find_files(root, &is_srv, out);
    }

    tcpros::core::Status find_action_files(const stdfs::path& root, std::vector<RosFile>* out) {
        return find_files(root, &is_action, out);
    }

    tcpros::core::Status find_installed_msgs(const char* package_path,
        std::vector<RosFile>* out,
        const tcpros::core::LogSink& log) {
        if (out == nullptr) {
            return fs_status(tcpros::core::StatusCode::Invalid);
        }
        if (package_path == nullptr || *package_path == '\0') {
            return fs_status(tcpros::core::StatusCode::NotFound);
        }

        std::vector<RosFile> all;
        std::string_view rest{package_path};
        while (!rest.empty()) {
            const size_t colon = rest.find(':');
            const std::string_view entry = rest.substr(0, colon);
            rest = colon == std::string_view::npos ? std::string_view{} : rest.substr(colon + 1);
            if (entry.empty()) {
                continue;
            }

            const stdfs::path dir(entry);
            std::error_code ec;
            if (!stdfs::is_directory(dir, ec)) {
                tcpros::core::log_write(log, tcpros::core::LogLevel::Warn, "skipping package path entry '%s': not a directory",
                    dir.string().c_str());
                continue;
            }

            const tcpros::core::Status s = find_msg_files(dir, &all);
            if (!tcpros::core::is_ok(s)) {
                return s;
            }
        }

        out->insert(out->end(), std::make_move_iterator(all.begin()), std::make_move_iterator(all.end()));
        return tcpros::core::ok_status();
    }
} // namespace tcpros::fs
