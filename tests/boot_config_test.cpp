#include "vm/boot_config.hpp"
#include "core/errors.hpp"
#include "fake_command_runner.hpp"

#include <gtest/gtest.h>

using namespace fcsandbox;
using fcsandbox::test::TempDir;
using fcsandbox::test::boot_config_json;
using fcsandbox::test::write_text;

TEST(BootConfig, ParsesFirecrackerConfig) {
    auto config = BootConfig::parse(boot_config_json("vmlinux.bin", "rootfs.ext4"));

    EXPECT_EQ(config.kernel_image_path, "vmlinux.bin");
    EXPECT_EQ(config.rootfs_path, "rootfs.ext4");
    EXPECT_EQ(config.root_drive_id, "rootfs");
    EXPECT_EQ(config.boot_args, "console=ttyS0 reboot=k panic=1");
    EXPECT_EQ(config.vcpu_count, 2);
    EXPECT_EQ(config.mem_size_mib, 1024);
    ASSERT_EQ(config.network_interfaces.size(), 1u);
    EXPECT_EQ(config.network_interfaces[0].host_dev_name, "tap0");
    EXPECT_EQ(config.network_interfaces[0].guest_mac, "06:00:AC:10:00:02");
    EXPECT_TRUE(config.binds_device("tap0"));
    EXPECT_FALSE(config.binds_device("tap1"));
    EXPECT_FALSE(config.vsock_uds_path.has_value());
}

TEST(BootConfig, PicksRootDrive) {
    auto config = BootConfig::parse(R"({
        "boot-source": {"kernel_image_path": "k"},
        "drives": [
            {"drive_id": "data", "path_on_host": "data.ext4", "is_root_device": false},
            {"drive_id": "rootfs", "path_on_host": "root.ext4", "is_root_device": true}
        ],
        "vsock": {"guest_cid": 3, "uds_path": "/tmp/v.sock"}
    })");
    EXPECT_EQ(config.rootfs_path, "root.ext4");
    EXPECT_EQ(config.vsock_uds_path, std::optional<std::string>("/tmp/v.sock"));
}

TEST(BootConfig, RejectsIncompleteConfigs) {
    EXPECT_THROW(BootConfig::parse("{"), ConfigurationError);
    EXPECT_THROW(BootConfig::parse("{}"), ConfigurationError);
    EXPECT_THROW(BootConfig::parse(R"({"boot-source": {}})"), ConfigurationError);
    EXPECT_THROW(BootConfig::parse(R"({"boot-source": {"kernel_image_path": "k"}, "drives": []})"),
                 ConfigurationError);
}

TEST(BootConfig, LoadNamesMissingFile) {
    try {
        BootConfig::load("/nonexistent/vm-config.json");
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_NE(std::string(e.what()).find("/nonexistent/vm-config.json"), std::string::npos);
    }
}

TEST(BootConfig, LoadFromFile) {
    TempDir dir;
    auto path = dir.path() / "vm-config.json";
    write_text(path, boot_config_json("vmlinux.bin", "rootfs.ext4"));

    auto config = BootConfig::load(path);
    EXPECT_EQ(config.source, path);
    EXPECT_EQ(config.kernel_image_path, "vmlinux.bin");
}

TEST(BootConfig, RelocatedKeepsEverythingElse) {
    auto config = BootConfig::parse(boot_config_json("vmlinux.bin", "rootfs.ext4"));
    auto moved = config.relocated("/snap/vmlinux.bin", "/snap/rootfs.ext4");

    EXPECT_EQ(moved["boot-source"]["kernel_image_path"], "/snap/vmlinux.bin");
    EXPECT_EQ(moved["drives"][0]["path_on_host"], "/snap/rootfs.ext4");
    EXPECT_EQ(moved["machine-config"], config.document["machine-config"]);
    EXPECT_EQ(moved["network-interfaces"], config.document["network-interfaces"]);
    EXPECT_EQ(config.document["boot-source"]["kernel_image_path"], "vmlinux.bin");
}
