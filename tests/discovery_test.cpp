#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <unistd.h>

#include <gtest/gtest.h>

#include "tcpros/fs/discovery.hpp"

namespace {
    namespace stdfs = std::filesystem;

    void capture(void* user, tcpros::core::LogLevel level, const char* msg) noexcept {
        if (level == tcpros::core::LogLevel::Warn) {
            static_cast<std::vector<std::string>*>(user)->emplace_back(msg);
        }
    }

    void touch(const stdfs::path& p) {
        stdfs::create_directories(p.parent_path());
        std::ofstream(p) << "int32 x\n";
    }

    class DiscoveryTest : public ::testing::Test {
    protected:
        void SetUp() override {
            const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
            root_ = stdfs::temp_directory_path() /
                    ("tcpros_discovery_" + std::to_string(::getpid()) + "_" + info->name());
            stdfs::remove_all(root_);

            touch(root_ / "pkgs/pkg_a/package.xml");
            touch(root_ / "pkgs/pkg_a/msg/Foo.msg");
            touch(root_ / "pkgs/pkg_a/srv/Bar.srv");
            touch(root_ / "pkgs/pkg_a/action/Do.action");
            touch(root_ / "pkgs/pkg_b/package.xml");
            touch(root_ / "pkgs/pkg_b/msg/Baz.msg");
            touch(root_ / "pkgs/pkg_b/msg/notes.txt");
        }

        void TearDown() override {
            std::error_code ec;
            stdfs::remove_all(root_, ec);
        }

        static std::vector<std::string> names(const std::vector<tcpros::fs::RosFile>& files) {
            std::vector<std::string> out;
            for (const tcpros::fs::RosFile& f : files) {
                out.push_back(f.package_name + ":" + f.path.filename().string());
            }
            std::sort(out.begin(), out.end());
            return out;
        }

        stdfs::path root_;
    };
} // namespace

TEST_F(DiscoveryTest, FindsMessagesWithTheirPackages) {
    std::vector<tcpros::fs::RosFile> files;
    const tcpros::core::Status s = tcpros::fs::find_msg_files(root_ / "pkgs", &files);
    ASSERT_EQ(s.code, tcpros::core::StatusCode::Ok);
    EXPECT_EQ(names(files), (std::vector<std::string>{"pkg_a:Foo.msg", "pkg_b:Baz.msg"}));
}

TEST_F(DiscoveryTest, FindsServicesAndActions) {
    std::vector<tcpros::fs::RosFile> srvs;
    ASSERT_EQ(tcpros::fs::find_srv_files(root_ / "pkgs", &srvs).code, tcpros::core::StatusCode::Ok);
    EXPECT_EQ(names(srvs), (std::vector<std::string>{"pkg_a:Bar.srv"}));

    std::vector<tcpros::fs::RosFile> actions;
    ASSERT_EQ(tcpros::fs::find_action_files(root_ / "pkgs", &actions).code, tcpros::core::StatusCode::Ok);
    EXPECT_EQ(names(actions), (std::vector<std::string>{"pkg_a:Do.action"}));
}

TEST_F(DiscoveryTest, CustomPredicate) {
    std::vector<tcpros::fs::RosFile> files;
    const tcpros::fs::FilePredicate is_xml = [](const stdfs::directory_entry& e) {
        return e.path().extension() == ".xml";
    };
    ASSERT_EQ(tcpros::fs::find_files(root_ / "pkgs", is_xml, &files).code, tcpros::core::StatusCode::Ok);
    EXPECT_EQ(names(files), (std::vector<std::string>{"pkg_a:package.xml", "pkg_b:package.xml"}));
}

TEST_F(DiscoveryTest, OutermostPackageWins) {
    touch(root_ / "nested/outer/package.xml");
    touch(root_ / "nested/outer/inner/package.xml");
    touch(root_ / "nested/outer/inner/msg/X.msg");

    std::string pkg;
    ASSERT_EQ(tcpros::fs::find_package_from_path(root_ / "nested/outer/inner/msg/X.msg", &pkg).code,
              tcpros::core::StatusCode::Ok);
    EXPECT_EQ(pkg, "outer");
}

TEST_F(DiscoveryTest, FileOutsideAnyPackageIsNotFound) {
    touch(root_ / "orphans/msg/Lost.msg");

    std::string pkg;
    const tcpros::core::Status s = tcpros::fs::find_package_from_path(root_ / "orphans/msg/Lost.msg", &pkg);
    EXPECT_EQ(s.domain, tcpros::core::StatusDomain::Fs);
    EXPECT_EQ(s.code, tcpros::core::StatusCode::NotFound);

    std::vector<tcpros::fs::RosFile> files;
    EXPECT_EQ(tcpros::fs::find_msg_files(root_ / "orphans", &files).code, tcpros::core::StatusCode::NotFound);
    EXPECT_TRUE(files.empty());
}

TEST_F(DiscoveryTest, MissingRootIsNotFound) {
    std::vector<tcpros::fs::RosFile> files;
    EXPECT_EQ(tcpros::fs::find_msg_files(root_ / "does_not_exist", &files).code, tcpros::core::StatusCode::NotFound);
}

TEST_F(DiscoveryTest, InstalledMessagesSpanPathList) {
    touch(root_ / "other/pkg_c/package.xml");
    touch(root_ / "other/pkg_c/msg/Qux.msg");

    const std::string path_list = (root_ / "pkgs").string() + "::" + (root_ / "other").string() + ":";
    std::vector<tcpros::fs::RosFile> files;
    ASSERT_EQ(tcpros::fs::find_installed_msgs(path_list.c_str(), &files).code, tcpros::core::StatusCode::Ok);
    EXPECT_EQ(names(files), (std::vector<std::string>{"pkg_a:Foo.msg", "pkg_b:Baz.msg", "pkg_c:Qux.msg"}));
}

TEST_F(DiscoveryTest, InstalledWithoutPathIsNotFound) {
    std::vector<tcpros::fs::RosFile> files;
    EXPECT_EQ(tcpros::fs::find_installed_msgs(nullptr, &files).code, tcpros::core::StatusCode::NotFound);
    EXPECT_EQ(tcpros::fs::find_installed_msgs("", &files).code, tcpros::core::StatusCode::NotFound);
}

TEST_F(DiscoveryTest, InstalledSkipsEntriesThatAreNotDirectories) {
    touch(root_ / "plain_file");
    const std::string path_list = (root_ / "gone").string() + ":" + (root_ / "plain_file").string() + ":" +
                                  (root_ / "pkgs").string();

    std::vector<std::string> warnings;
    std::vector<tcpros::fs::RosFile> files;
    ASSERT_EQ(tcpros::fs::find_installed_msgs(path_list.c_str(), &files, {&capture, &warnings}).code,
              tcpros::core::StatusCode::Ok);
    EXPECT_EQ(names(files), (std::vector<std::string>{"pkg_a:Foo.msg", "pkg_b:Baz.msg"}));
    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_NE(warnings[0].find("gone"), std::string::npos);
}

TEST_F(DiscoveryTest, InstalledWithOnlyStaleEntriesFindsNothing) {
    const std::string path_list = (root_ / "gone").string();
    std::vector<tcpros::fs::RosFile> files;
    EXPECT_EQ(tcpros::fs::find_installed_msgs(path_list.c_str(), &files).code, tcpros::core::StatusCode::Ok);
    EXPECT_TRUE(files.empty());
}

TEST_F(DiscoveryTest, SymlinkCycleIsWalkedOnce) {
    stdfs::create_directory_symlink("..", root_ / "pkgs/pkg_a/aaa_loop");
    stdfs::create_directory_symlink("../../pkg_b", root_ / "pkgs/pkg_a/msg/self");

    std::vector<tcpros::fs::RosFile> files;
    ASSERT_EQ(tcpros::fs::find_msg_files(root_ / "pkgs", &files).code, tcpros::core::StatusCode::Ok);
    // pkg_b is reachable twice without a cycle: directly and through msg/self.
    EXPECT_EQ(names(files), (std::vector<std::string>{"pkg_a:Baz.msg", "pkg_a:Foo.msg", "pkg_b:Baz.msg"}));
}

TEST_F(DiscoveryTest, SymlinkToRootIsNotEntered) {
    stdfs::create_directory_symlink(root_ / "pkgs", root_ / "pkgs/pkg_b/msg/up");

    std::vector<tcpros::fs::RosFile> files;
    ASSERT_EQ(tcpros::fs::find_msg_files(root_ / "pkgs", &files).code, tcpros::core::StatusCode::Ok);
    EXPECT_EQ(files.size(), 2u);
}
