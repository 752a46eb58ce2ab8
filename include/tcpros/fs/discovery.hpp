#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "tcpros/core/errors.hpp"
#include "tcpros/core/log.hpp"

namespace tcpros::fs {

    // Marker file identifying a package root directory.
    inline constexpr const char* kPackageMarker = "package.xml";

    // A definition file and the package it belongs to.
    struct RosFile {
        std::string package_name;
        std::filesystem::path path;
    };

    using FilePredicate = bool (*)(const std::filesystem::directory_entry& entry);

    // Recursively walks 'root' (following directory symlinks) and appends
    // every regular file accepted by 'predicate'. Entries that cannot be
    // read are skipped, and a symlink back to a directory already on the
    // descent path is not entered. Fails with Fs/NotFound if a match has no
    // package, Fs/Io if the walk itself fails part way.
    [[nodiscard]] tcpros::core::Status find_files(const std::filesystem::path& root,
        FilePredicate predicate,
        std::vector<RosFile>* out);

    // Package name of 'file': the name of the outermost ancestor directory
    // that contains a package marker.
    [[nodiscard]] tcpros::core::Status find_package_from_path(const std::filesystem::path& file, std::string* out);

    [[nodiscard]] tcpros::core::Status find_msg_files(const std::filesystem::path& root, std::vector<RosFile>* out);
    [[nodiscard]] tcpros::core::Status find_srv_files(const std::filesystem::path& root, std::vector<RosFile>* out);
    [[nodiscard]] tcpros::core::Status find_action_files(const std::filesystem::path& root, std::vector<RosFile>* out);

    // Searches each entry of a ':'-separated path list (ROS_PACKAGE_PATH
    // format) for .msg files. Empty entries and entries that are not
    // directories are skipped; the latter are reported at Warn.
    [[nodiscard]] tcpros::core::Status find_installed_msgs(const char* package_path,
        std::vector<RosFile>* out,
        const tcpros::core::LogSink& log = tcpros::core::log_null_sink());

} // namespace tcpros::fs
