/**
 * @file test_confinement_policy.cpp
 * @brief Rule matching, path resolution and serialization of ConfinementPolicy
 */

#include "scriptjail/core/confinement_policy.hpp"
#include "scriptjail/utils/string_utils.hpp"

#include <gtest/gtest.h>

#include <fcntl.h>

#include <fstream>

using namespace scriptjail::core;
namespace fs = std::filesystem;

class ConfinementPolicyTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::canonical(fs::temp_directory_path()) /
                ("scriptjail_policy_" + scriptjail::utils::StringUtils::RandomAlphanumeric(8));
        work_ = root_ / "work";
        outside_ = root_ / "outside";
        runtime_ = root_ / "runtime";
        fs::create_directories(work_);
        fs::create_directories(outside_);
        fs::create_directories(runtime_);
        std::ofstream(outside_ / "secret.txt") << "secret";
        std::ofstream(runtime_ / "module.py") << "x = 1";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    ConfinementPolicy StandardPolicy() const {
        ConfinementPolicy policy;
        policy.Allow(work_, AccessMode::READ_WRITE)
              .Allow(runtime_, AccessMode::READ_ONLY);
        return policy;
    }

    fs::path root_;
    fs::path work_;
    fs::path outside_;
    fs::path runtime_;
};

// ============================================================================
// MATCHING
// ============================================================================

TEST_F(ConfinementPolicyTest, WorkDirectoryAllowsReadAndWrite) {
    auto policy = StandardPolicy();

    EXPECT_TRUE(policy.Evaluate(work_ / "out.txt", AccessIntent::WRITE).allowed);
    EXPECT_TRUE(policy.Evaluate(work_ / "out.txt", AccessIntent::READ).allowed);
    EXPECT_TRUE(policy.Evaluate(work_ / "nested" / "deep" / "file", AccessIntent::WRITE).allowed);
}

TEST_F(ConfinementPolicyTest, ReadOnlyPrefixRejectsWrites) {
    auto policy = StandardPolicy();

    auto read = policy.Evaluate(runtime_ / "module.py", AccessIntent::READ);
    EXPECT_TRUE(read.allowed);
    ASSERT_TRUE(read.rule_index.has_value());
    EXPECT_EQ(*read.rule_index, 1u);

    auto write = policy.Evaluate(runtime_ / "module.py", AccessIntent::WRITE);
    EXPECT_FALSE(write.allowed);
    ASSERT_TRUE(write.rule_index.has_value());
    EXPECT_EQ(*write.rule_index, 1u);
}

TEST_F(ConfinementPolicyTest, UnmatchedPathIsDeniedByDefault) {
    auto policy = StandardPolicy();

    auto decision = policy.Evaluate(outside_ / "secret.txt", AccessIntent::READ);
    EXPECT_FALSE(decision.allowed);
    EXPECT_FALSE(decision.rule_index.has_value());
    EXPECT_EQ(decision.resolved_path, outside_ / "secret.txt");

    EXPECT_FALSE(policy.Evaluate("/etc/passwd", AccessIntent::READ).allowed);
}

TEST_F(ConfinementPolicyTest, EmptyPolicyDeniesEverything) {
    ConfinementPolicy policy;
    EXPECT_TRUE(policy.Empty());
    EXPECT_FALSE(policy.Evaluate(work_ / "a", AccessIntent::READ).allowed);
}

TEST_F(ConfinementPolicyTest, FirstMatchingRuleWins) {
    ConfinementPolicy deny_first;
    deny_first.Deny(work_ / "private")
              .Allow(work_, AccessMode::READ_WRITE);
    EXPECT_FALSE(deny_first.Evaluate(work_ / "private" / "key", AccessIntent::READ).allowed);
    EXPECT_TRUE(deny_first.Evaluate(work_ / "public", AccessIntent::READ).allowed);

    ConfinementPolicy allow_first;
    allow_first.Allow(work_, AccessMode::READ_WRITE)
               .Deny(work_ / "private");
    EXPECT_TRUE(allow_first.Evaluate(work_ / "private" / "key", AccessIntent::READ).allowed);
}

TEST_F(ConfinementPolicyTest, PrefixMatchIsComponentWise) {
    fs::create_directories(root_ / "workspace");
    auto policy = StandardPolicy();

    EXPECT_FALSE(policy.Evaluate(root_ / "workspace" / "file", AccessIntent::READ).allowed);
    EXPECT_TRUE(ConfinementPolicy::IsUnder("/work/a", "/work"));
    EXPECT_TRUE(ConfinementPolicy::IsUnder("/work", "/work"));
    EXPECT_FALSE(ConfinementPolicy::IsUnder("/workspace", "/work"));
    EXPECT_FALSE(ConfinementPolicy::IsUnder("/wo", "/work"));
    EXPECT_TRUE(ConfinementPolicy::IsUnder("/anything", "/"));
}

// ============================================================================
// RESOLUTION
// ============================================================================

TEST_F(ConfinementPolicyTest, DotDotCannotEscapeThePrefix) {
    auto policy = StandardPolicy();

    auto decision = policy.Evaluate(work_ / ".." / "outside" / "secret.txt", AccessIntent::READ);
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.resolved_path, outside_ / "secret.txt");
}

TEST_F(ConfinementPolicyTest, SymlinkOutOfTheWorkDirectoryIsResolved) {
    fs::create_directory_symlink(outside_, work_ / "escape");
    auto policy = StandardPolicy();

    auto decision = policy.Evaluate(work_ / "escape" / "secret.txt", AccessIntent::READ);
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.resolved_path, outside_ / "secret.txt");
}

TEST_F(ConfinementPolicyTest, DanglingSymlinkIsFollowedForCreation) {
    fs::create_symlink(outside_ / "planted.txt", work_ / "dangling");
    auto policy = StandardPolicy();

    auto decision = policy.Evaluate(work_ / "dangling", AccessIntent::WRITE);
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.resolved_path, outside_ / "planted.txt");
}

TEST_F(ConfinementPolicyTest, RelativePathUsesBaseDirectory) {
    auto policy = StandardPolicy();

    EXPECT_TRUE(policy.Evaluate("result.txt", AccessIntent::WRITE, work_).allowed);
    EXPECT_FALSE(policy.Evaluate("secret.txt", AccessIntent::READ, outside_).allowed);
    EXPECT_FALSE(policy.Evaluate("../outside/secret.txt", AccessIntent::READ, work_).allowed);
}

TEST_F(ConfinementPolicyTest, CanonicalizedFollowsSymlinkedPrefixes) {
    fs::create_directory_symlink(work_, root_ / "work-link");

    ConfinementPolicy policy;
    policy.Allow(root_ / "work-link", AccessMode::READ_WRITE);

    // Accessed paths are resolved, so the raw link prefix does not match
    EXPECT_FALSE(policy.Evaluate(work_ / "file", AccessIntent::WRITE).allowed);

    auto canonical = policy.Canonicalized();
    ASSERT_EQ(canonical.Rules().size(), 1u);
    EXPECT_EQ(canonical.Rules()[0].prefix, work_);
    EXPECT_TRUE(canonical.Evaluate(work_ / "file", AccessIntent::WRITE).allowed);
    EXPECT_TRUE(canonical.Evaluate(root_ / "work-link" / "file", AccessIntent::WRITE).allowed);
}

TEST_F(ConfinementPolicyTest, TrailingSeparatorIsNormalized) {
    ConfinementPolicy policy;
    policy.Allow(work_.string() + "/", AccessMode::READ_WRITE);

    ASSERT_EQ(policy.Rules().size(), 1u);
    EXPECT_EQ(policy.Rules()[0].prefix, work_);
}

// ============================================================================
// VALIDATION AND SERIALIZATION
// ============================================================================

TEST_F(ConfinementPolicyTest, AllowRejectsRelativeOrMultilinePrefixes) {
    ConfinementPolicy policy;
    EXPECT_THROW(policy.Allow("relative/dir", AccessMode::READ_ONLY), PolicyFormatError);
    EXPECT_THROW(policy.Allow("", AccessMode::READ_ONLY), PolicyFormatError);
    EXPECT_THROW(policy.Allow("/tmp/a\nrw\t/", AccessMode::READ_ONLY), PolicyFormatError);
    EXPECT_TRUE(policy.Empty());
}

TEST_F(ConfinementPolicyTest, SerializedPolicyParsesBackToTheSameRules) {
    ConfinementPolicy policy;
    policy.Allow(work_, AccessMode::READ_WRITE)
          .Allow(runtime_, AccessMode::READ_ONLY)
          .Deny(outside_);

    const std::string text = policy.Serialize();
    EXPECT_EQ(text, "rw\t" + work_.string() + "\n" +
                    "ro\t" + runtime_.string() + "\n" +
                    "deny\t" + outside_.string() + "\n");

    auto parsed = ConfinementPolicy::Parse(text);
    ASSERT_EQ(parsed.Rules().size(), 3u);
    for (std::size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(parsed.Rules()[i].prefix, policy.Rules()[i].prefix);
        EXPECT_EQ(parsed.Rules()[i].mode, policy.Rules()[i].mode);
    }
}

TEST_F(ConfinementPolicyTest, ParseSkipsCommentsBlankLinesAndCarriageReturns) {
    auto policy = ConfinementPolicy::Parse("# header\n\nrw\t/tmp/job\r\nro\t/usr/lib\n");

    ASSERT_EQ(policy.Rules().size(), 2u);
    EXPECT_EQ(policy.Rules()[0].prefix, fs::path("/tmp/job"));
    EXPECT_EQ(policy.Rules()[1].mode, AccessMode::READ_ONLY);
}

TEST_F(ConfinementPolicyTest, ParseRejectsMalformedLines) {
    EXPECT_THROW(ConfinementPolicy::Parse("rw /tmp/job\n"), PolicyFormatError);
    EXPECT_THROW(ConfinementPolicy::Parse("rx\t/tmp/job\n"), PolicyFormatError);
    EXPECT_THROW(ConfinementPolicy::Parse("ro\trelative\n"), PolicyFormatError);

    try {
        ConfinementPolicy::Parse("rw\t/a\nbogus\n");
        FAIL() << "expected PolicyFormatError";
    } catch (const PolicyFormatError& e) {
        EXPECT_NE(std::string(e.what()).find("line 2"), std::string::npos);
    }
}

TEST(AccessModeNames, RoundTrip) {
    EXPECT_STREQ(AccessModeName(AccessMode::READ_ONLY), "ro");
    EXPECT_STREQ(AccessModeName(AccessMode::READ_WRITE), "rw");
    EXPECT_STREQ(AccessModeName(AccessMode::DENIED), "deny");
    EXPECT_EQ(ParseAccessMode("rw"), AccessMode::READ_WRITE);
    EXPECT_FALSE(ParseAccessMode("RW").has_value());
}

// ============================================================================
// INTENT CLASSIFICATION
// ============================================================================

TEST(AccessIntentTest, OpenFlags) {
    EXPECT_EQ(IntentFromOpenFlags(O_RDONLY), AccessIntent::READ);
    EXPECT_EQ(IntentFromOpenFlags(O_RDONLY | O_CLOEXEC), AccessIntent::READ);
    EXPECT_EQ(IntentFromOpenFlags(O_RDONLY | O_DIRECTORY), AccessIntent::READ);
    EXPECT_EQ(IntentFromOpenFlags(O_WRONLY), AccessIntent::WRITE);
    EXPECT_EQ(IntentFromOpenFlags(O_RDWR), AccessIntent::WRITE);
    EXPECT_EQ(IntentFromOpenFlags(O_RDONLY | O_CREAT), AccessIntent::WRITE);
    EXPECT_EQ(IntentFromOpenFlags(O_RDONLY | O_TRUNC), AccessIntent::WRITE);
    EXPECT_EQ(IntentFromOpenFlags(O_WRONLY | O_APPEND), AccessIntent::WRITE);
}

TEST(AccessIntentTest, FopenModes) {
    EXPECT_EQ(IntentFromFopenMode("r"), AccessIntent::READ);
    EXPECT_EQ(IntentFromFopenMode("rb"), AccessIntent::READ);
    EXPECT_EQ(IntentFromFopenMode("re"), AccessIntent::READ);
    EXPECT_EQ(IntentFromFopenMode("w"), AccessIntent::WRITE);
    EXPECT_EQ(IntentFromFopenMode("a"), AccessIntent::WRITE);
    EXPECT_EQ(IntentFromFopenMode("r+"), AccessIntent::WRITE);
    EXPECT_EQ(IntentFromFopenMode(nullptr), AccessIntent::READ);
}
