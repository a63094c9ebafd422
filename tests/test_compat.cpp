#include <gtest/gtest.h>
#include "../main/src/compat.hpp"
#include "../main/src/exception.hpp"
#include "../main/src/localization.hpp"

#include <nlohmann/json.hpp>

class CompatTest : public ::testing::Test {
protected:
    Build build;

    void SetUp() override {
        init_localization();
        build = nlohmann::json::parse(R"({
            "name": "resolc-x86_64-unknown-linux-musl",
            "version": "0.1.0-dev.13",
            "build": "commit.ad331534",
            "longVersion": "0.1.0-dev.13+commit.ad331534",
            "url": "https://github.com/paritytech/revive/releases/download/v0.1.0-dev.13/resolc-x86_64-unknown-linux-musl",
            "sha256": "14d7c165eae626dbe40d182d7f2a435015efb50b1183bf22b0411749106b8c47",
            "firstSolcVersion": "0.8.0",
            "lastSolcVersion": "0.8.29"
        })").get<Build>();
    }
};

TEST_F(CompatTest, AcceptsVersionsInsideRange) {
    EXPECT_NO_THROW(check_solc_compat(build, Version(0, 8, 0)));
    EXPECT_NO_THROW(check_solc_compat(build, Version(0, 8, 17)));
    EXPECT_NO_THROW(check_solc_compat(build, Version(0, 8, 29)));
}

TEST_F(CompatTest, RejectsOldSolcWithRange) {
    try {
        check_solc_compat(build, Version(0, 3, 4));
        FAIL() << "0.3.4 must be rejected";
    } catch (const SolcVersionNotSupportedError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SolcVersionNotSupported);
        EXPECT_EQ(e.solc_version(), Version(0, 3, 4));
        EXPECT_EQ(e.resolc_version(), Version::parse("0.1.0-dev.13"));
        EXPECT_EQ(e.supported_range().to_string(), ">=0.8.0, <=0.8.29");
        EXPECT_STREQ(e.what(),
                     "Unsupported version of `solc` - v0.3.4 for Resolc v0.1.0-dev.13. "
                     "Only versions \">=0.8.0, <=0.8.29\" is supported by this version of Resolc");
    }
}

TEST_F(CompatTest, RejectsNewerThanRange) {
    EXPECT_THROW(check_solc_compat(build, Version(0, 8, 30)), SolcVersionNotSupportedError);
    EXPECT_THROW(check_solc_compat(build, Version(0, 9, 0)), SolcVersionNotSupportedError);
}

TEST_F(CompatTest, GlobalFloorOverridesDeclaredRange) {
    build.first_supported_solc_version = Version(0, 7, 0);
    build.last_supported_solc_version = Version(0, 8, 5);

    try {
        check_solc_compat(build, Version(0, 7, 5));
        FAIL() << "versions below the floor must be rejected";
    } catch (const SolcVersionNotSupportedError& e) {
        EXPECT_EQ(e.supported_range().to_string(), ">=0.7.0, <=0.8.5");
    }
    EXPECT_NO_THROW(check_solc_compat(build, Version(0, 8, 0)));
}

TEST_F(CompatTest, PrereleaseSolcIsRejected) {
    EXPECT_FALSE(is_solc_compatible(build.solc_range(), Version::parse("0.8.4-nightly.2021.1.1")));
    EXPECT_TRUE(is_solc_compatible(build.solc_range(), Version(0, 8, 4)));
}
