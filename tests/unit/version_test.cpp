#include <gtest/gtest.h>

#include <string>

#include "sgw/core/result.hpp"
#include "sgw/version.hpp"

TEST(VersionTest, MajorMinorPatch) {
    EXPECT_EQ(sgw::Version::major, 0);
    EXPECT_EQ(sgw::Version::minor, 3);
    EXPECT_EQ(sgw::Version::patch, 0);
}

TEST(VersionTest, VersionString) {
    EXPECT_STREQ(sgw::Version::string, "0.3.0");
}

TEST(VersionTest, ProtocolRevision) {
    EXPECT_EQ(sgw::Version::protocolRevision, 2);
    EXPECT_EQ(sgw::Version::protocolRevision, SGW_PROTOCOL_REVISION);
}

TEST(ResultTest, OkValue) {
    auto result = sgw::Result<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorCarriesDefaultCode) {
    auto result = sgw::Result<int>::err(sgw::Error("frame truncated"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message, "frame truncated");
    EXPECT_EQ(result.error().code, -1);
}

TEST(ResultTest, ErrorWithCode) {
    auto result = sgw::Result<int>::err(sgw::Error(7, "unknown kind"));
    EXPECT_EQ(result.error().code, 7);
    EXPECT_EQ(result.error().message, "unknown kind");
}

TEST(ResultTest, SameValueAndErrorType) {
    using Either = sgw::Result<std::string, std::string>;
    auto ok = Either::ok("engine");
    auto err = Either::err("no engine");
    EXPECT_TRUE(ok.hasValue());
    EXPECT_EQ(ok.value(), "engine");
    EXPECT_TRUE(err.hasError());
    EXPECT_EQ(err.error(), "no engine");
}

TEST(ResultTest, ValueOrAndMove) {
    auto ok = sgw::Result<std::string>::ok("running");
    auto err = sgw::Result<std::string>::err(sgw::Error("absent"));
    EXPECT_EQ(ok.valueOr("?"), "running");
    EXPECT_EQ(err.valueOr("?"), "?");
    EXPECT_FALSE(static_cast<bool>(err));

    std::string moved = std::move(ok).value();
    EXPECT_EQ(moved, "running");
}

TEST(ResultVoidTest, OkAndError) {
    auto ok = sgw::Result<void>::ok();
    EXPECT_TRUE(ok.hasValue());
    EXPECT_TRUE(static_cast<bool>(ok));

    auto err = sgw::Result<void>::err(sgw::Error("send failed"));
    EXPECT_TRUE(err.hasError());
    EXPECT_EQ(err.error().message, "send failed");
}
