#include <gtest/gtest.h>
#include "test_env.hpp"
#include "../main/src/config.hpp"
#include "../main/src/exception.hpp"
#include "../main/src/localization.hpp"
#include "../main/src/storage.hpp"

#include <nlohmann/json.hpp>
#include <sys/stat.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

class StorageTest : public ::testing::Test {
protected:
    fs::path test_root;

    void SetUp() override {
        init_localization();
        test_root = make_test_dir("storage");
    }

    void TearDown() override {
        fs::remove_all(test_root);
    }

    static Build make_build(const std::string& version) {
        return nlohmann::json::parse(build_json(version, "https://example.invalid/" + version,
                                                calculate_sha256(std::string_view(FAKE_RESOLC))))
            .get<Build>();
    }

    size_t lock_files() const {
        size_t count = 0;
        for (const auto& entry : fs::directory_iterator(test_root)) {
            if (entry.path().filename().string().starts_with(LOCK_FILE_PREFIX)) ++count;
        }
        return count;
    }
};

TEST_F(StorageTest, InstallWritesBinaryAndSidecar) {
    Storage storage(test_root);
    const Build build = make_build("0.1.0-dev.13");
    storage.install_version(build, FAKE_RESOLC);

    const fs::path binary = test_root / "0.1.0-dev.13" / "resolc-x86_64-unknown-linux-musl";
    EXPECT_EQ(storage.binary_path(build), binary);
    EXPECT_EQ(read_file(binary), FAKE_RESOLC);

    struct stat st;
    ASSERT_EQ(stat(binary.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0755u);

    auto sidecar = nlohmann::json::parse(read_file(test_root / "0.1.0-dev.13" / BUILD_METADATA_FILE));
    EXPECT_EQ(sidecar.at("version"), "0.1.0-dev.13");
    EXPECT_EQ(sidecar.at("longVersion"), "0.1.0-dev.13+commit.ad331534");
    EXPECT_EQ(lock_files(), 0u);
}

TEST_F(StorageTest, ReinstallIsNoOp) {
    Storage storage(test_root);
    const Build build = make_build("0.1.0-dev.13");
    storage.install_version(build, FAKE_RESOLC);
    EXPECT_NO_THROW(storage.install_version(build, "different bytes"));
    EXPECT_EQ(read_file(storage.binary_path(build)), FAKE_RESOLC);
}

TEST_F(StorageTest, ConcurrentInstallOfSameVersion) {
    const Build build = make_build("0.1.0-dev.13");
    const int num_threads = 6;
    std::atomic<int> successes{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&]() {
            Storage storage(test_root);
            try {
                storage.install_version(build, FAKE_RESOLC);
                ++successes;
            } catch (const RvmException&) {
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(successes.load(), num_threads);
    size_t files = 0;
    for ([[maybe_unused]] const auto& entry : fs::directory_iterator(test_root / "0.1.0-dev.13")) ++files;
    EXPECT_EQ(files, 2u);
    EXPECT_EQ(read_file(test_root / "0.1.0-dev.13" / build.name), FAKE_RESOLC);
    EXPECT_EQ(lock_files(), 0u);
}

TEST_F(StorageTest, ConcurrentInstallOfDifferentVersions) {
    std::vector<std::thread> threads;
    for (const std::string version : {"0.1.0-dev.11", "0.1.0-dev.12", "0.1.0-dev.13"}) {
        threads.emplace_back([this, version]() {
            Storage(test_root).install_version(make_build(version), FAKE_RESOLC);
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(Storage(test_root).installed_versions().size(), 3u);
}

TEST_F(StorageTest, EnumerationSkipsFilesAndBrokenSidecars) {
    Storage storage(test_root);
    storage.install_version(make_build("0.1.0-dev.13"), FAKE_RESOLC);
    storage.install_version(make_build("0.1.0-dev.12"), FAKE_RESOLC);
    write_text(test_root / "mirror.conf", "file:///nowhere\n");
    write_text(test_root / "0.1.0-dev.11" / BUILD_METADATA_FILE, "{ not json");
    fs::create_directories(test_root / "0.1.0-dev.10");

    auto installed = storage.installed_versions();
    ASSERT_EQ(installed.size(), 2u);
    std::vector<std::string> versions;
    for (const auto& build : installed) versions.push_back(build.version.to_string());
    std::sort(versions.begin(), versions.end());
    EXPECT_EQ(versions, (std::vector<std::string>{"0.1.0-dev.12", "0.1.0-dev.13"}));
}

TEST_F(StorageTest, DefaultPointerLifecycle) {
    Storage storage(test_root);
    try {
        storage.get_default_version();
        FAIL() << "unset pointer must throw";
    } catch (const RvmException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Io);
    }

    storage.set_default_version(Version::parse("0.1.0-dev.13"));
    EXPECT_EQ(trim(read_file(test_root / DEFAULT_VERSION_FILE)), "0.1.0-dev.13");
    EXPECT_EQ(storage.get_default_version(), Version::parse("0.1.0-dev.13"));

    storage.set_default_version(Version::parse("0.1.0-dev.12"));
    EXPECT_EQ(storage.get_default_version(), Version::parse("0.1.0-dev.12"));

    storage.remove_default();
    EXPECT_FALSE(fs::exists(test_root / DEFAULT_VERSION_FILE));
    EXPECT_THROW(storage.remove_default(), RvmException);
    EXPECT_EQ(lock_files(), 0u);
}

TEST_F(StorageTest, RemoveClearsMatchingDefault) {
    Storage storage(test_root);
    storage.install_version(make_build("0.1.0-dev.13"), FAKE_RESOLC);
    storage.install_version(make_build("0.1.0-dev.12"), FAKE_RESOLC);

    storage.set_default_version(Version::parse("0.1.0-dev.12"));
    storage.remove_version(Version::parse("0.1.0-dev.13"));
    EXPECT_EQ(storage.get_default_version(), Version::parse("0.1.0-dev.12"));

    storage.remove_version(Version::parse("0.1.0-dev.12"));
    EXPECT_FALSE(fs::exists(test_root / "0.1.0-dev.12"));
    EXPECT_FALSE(fs::exists(test_root / DEFAULT_VERSION_FILE));
    EXPECT_TRUE(storage.installed_versions().empty());
}

TEST_F(StorageTest, RemoveDefaultAtLockVersion) {
    Storage storage(test_root);
    const Version zero = Version::parse("0.0.0");
    storage.install_version(make_build("0.0.0"), FAKE_RESOLC);
    storage.set_default_version(zero);

    // Runs detached so a stuck lock fails the test instead of hanging it.
    std::packaged_task<void()> task([&storage, zero] { storage.remove_version(zero); });
    std::future<void> done = task.get_future();
    std::thread(std::move(task)).detach();
    ASSERT_EQ(done.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_NO_THROW(done.get());

    EXPECT_FALSE(fs::exists(test_root / "0.0.0"));
    EXPECT_FALSE(fs::exists(test_root / DEFAULT_VERSION_FILE));
    EXPECT_EQ(lock_files(), 0u);
}

TEST_F(StorageTest, RemoveMissingVersionIsNoOp) {
    Storage storage(test_root);
    EXPECT_NO_THROW(storage.remove_version(Version::parse("9.9.9")));
    EXPECT_EQ(lock_files(), 0u);
}
