/**
 * @file test_environment_injector.cpp
 * @brief Composition of the script environment
 */

#include "scriptjail/core/environment_injector.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

using namespace scriptjail::core;

namespace {

CredentialSet SampleCredentials() {
    CredentialSet credentials;
    credentials.access_key = "AKIAEXAMPLE";
    credentials.secret_key = "secret-value";
    credentials.session_token = "session-value";
    credentials.account_id = "123456789012";
    return credentials;
}

} // anonymous namespace

// ============================================================================
// REGION
// ============================================================================

TEST(EnvironmentInjectorTest, BothRegionVariablesPassThrough) {
    EnvironmentInjector injector(EnvironmentMap{{kEnvRegion, "us-east-1"}, {kEnvDefaultRegion, "us-west-2"}});
    auto env = injector.Compose({}, {}, "/workspace");

    EXPECT_EQ(env.at(kEnvRegion), "us-east-1");
    EXPECT_EQ(env.at(kEnvDefaultRegion), "us-west-2");
}

TEST(EnvironmentInjectorTest, RegionFillsDefaultRegion) {
    EnvironmentInjector injector(EnvironmentMap{{kEnvRegion, "eu-central-1"}});
    auto env = injector.Compose({}, {}, "/workspace");

    EXPECT_EQ(env.at(kEnvRegion), "eu-central-1");
    EXPECT_EQ(env.at(kEnvDefaultRegion), "eu-central-1");
}

TEST(EnvironmentInjectorTest, DefaultRegionFillsRegion) {
    EnvironmentInjector injector(EnvironmentMap{{kEnvDefaultRegion, "ap-south-1"}});
    auto env = injector.Compose({}, {}, "/workspace");

    EXPECT_EQ(env.at(kEnvRegion), "ap-south-1");
    EXPECT_EQ(env.at(kEnvDefaultRegion), "ap-south-1");
}

TEST(EnvironmentInjectorTest, ConfiguredRegionIsTheLastResort) {
    EnvironmentInjector injector(EnvironmentMap{}, "eu-west-1");
    auto env = injector.Compose({}, {}, "/workspace");

    EXPECT_EQ(env.at(kEnvRegion), "eu-west-1");
    EXPECT_EQ(env.at(kEnvDefaultRegion), "eu-west-1");

    EnvironmentInjector host_wins(EnvironmentMap{{kEnvRegion, "us-east-2"}}, "eu-west-1");
    EXPECT_EQ(host_wins.Compose({}, {}, "/workspace").at(kEnvRegion), "us-east-2");
}

TEST(EnvironmentInjectorTest, RegionIsOmittedWhenUnknown) {
    EnvironmentInjector injector(EnvironmentMap{});
    auto env = injector.Compose({}, {}, "/workspace");

    EXPECT_EQ(env.count(kEnvRegion), 0u);
    EXPECT_EQ(env.count(kEnvDefaultRegion), 0u);
}

// ============================================================================
// CREDENTIALS AND ARTIFACTS
// ============================================================================

TEST(EnvironmentInjectorTest, CredentialsAreExposed) {
    EnvironmentInjector injector(EnvironmentMap{});
    auto env = injector.Compose(SampleCredentials(), {}, "/workspace");

    EXPECT_EQ(env.at(kEnvAccessKeyId), "AKIAEXAMPLE");
    EXPECT_EQ(env.at(kEnvSecretAccessKey), "secret-value");
    EXPECT_EQ(env.at(kEnvSessionToken), "session-value");
    EXPECT_EQ(env.at(kEnvAccountId), "123456789012");
}

TEST(EnvironmentInjectorTest, EmptyCredentialFieldsAreOmitted) {
    EnvironmentInjector injector(EnvironmentMap{});
    CredentialSet credentials;
    credentials.access_key = "AKIAEXAMPLE";
    credentials.secret_key = "secret-value";

    auto env = injector.Compose(credentials, {}, "/workspace");
    EXPECT_EQ(env.count(kEnvSessionToken), 0u);
    EXPECT_EQ(env.count(kEnvAccountId), 0u);

    auto bare = injector.Compose({}, {}, "/workspace");
    EXPECT_EQ(bare.count(kEnvAccessKeyId), 0u);
    EXPECT_EQ(bare.count(kEnvSecretAccessKey), 0u);
}

TEST(EnvironmentInjectorTest, ArtifactDirectoryDefaultsToSandboxWorkDirectory) {
    EnvironmentInjector injector(EnvironmentMap{});
    EXPECT_FALSE(injector.ExternalArtifactDirectory().has_value());

    auto env = injector.Compose({}, {}, "/workspace");
    EXPECT_EQ(env.at("ARTIFACT_DIR"), "/workspace");
}

TEST(EnvironmentInjectorTest, HostArtifactDirectoryIsUsed) {
    EnvironmentInjector injector(EnvironmentMap{{"ARTIFACT_DIR", "/srv/artifacts/../artifacts/run1"}});

    auto external = injector.ExternalArtifactDirectory();
    ASSERT_TRUE(external.has_value());
    EXPECT_EQ(*external, std::filesystem::path("/srv/artifacts/run1"));
    EXPECT_EQ(injector.Compose({}, {}, "/workspace").at("ARTIFACT_DIR"), "/srv/artifacts/run1");
}

TEST(EnvironmentInjectorTest, CustomArtifactVariable) {
    EnvironmentInjector injector(EnvironmentMap{{"OUTPUT_DIR", "/data/out"}}, "", "OUTPUT_DIR");
    auto env = injector.Compose({}, {}, "/workspace");

    EXPECT_EQ(injector.ArtifactVariable(), "OUTPUT_DIR");
    EXPECT_EQ(env.at("OUTPUT_DIR"), "/data/out");
    EXPECT_EQ(env.count("ARTIFACT_DIR"), 0u);
}

TEST(EnvironmentInjectorTest, CallerOverridesWin) {
    EnvironmentInjector injector(EnvironmentMap{{kEnvRegion, "us-east-1"}});
    EnvironmentMap overrides = {
        {"TEST_VAR", "test_value"},
        {kEnvRegion, "eu-north-1"},
        {"ARTIFACT_DIR", "/custom"},
    };

    auto env = injector.Compose(SampleCredentials(), overrides, "/workspace");
    EXPECT_EQ(env.at("TEST_VAR"), "test_value");
    EXPECT_EQ(env.at(kEnvRegion), "eu-north-1");
    EXPECT_EQ(env.at(kEnvDefaultRegion), "us-east-1");
    EXPECT_EQ(env.at("ARTIFACT_DIR"), "/custom");
}

TEST(EnvironmentInjectorTest, CaptureHostEnvironmentTakesOnlyRelevantVariables) {
    ::setenv("AWS_REGION", "sa-east-1", 1);
    ::setenv("SCRIPTJAIL_TEST_UNRELATED", "1", 1);
    ::setenv("SCRIPTJAIL_TEST_ARTIFACTS", "/tmp/artifacts", 1);

    auto env = EnvironmentInjector::CaptureHostEnvironment("SCRIPTJAIL_TEST_ARTIFACTS");

    ::unsetenv("AWS_REGION");
    ::unsetenv("SCRIPTJAIL_TEST_UNRELATED");
    ::unsetenv("SCRIPTJAIL_TEST_ARTIFACTS");

    EXPECT_EQ(env.at("AWS_REGION"), "sa-east-1");
    EXPECT_EQ(env.at("SCRIPTJAIL_TEST_ARTIFACTS"), "/tmp/artifacts");
    EXPECT_EQ(env.count("SCRIPTJAIL_TEST_UNRELATED"), 0u);
}

// ============================================================================
// REDACTION
// ============================================================================

TEST(EnvironmentInjectorTest, RedactionMasksCredentialValues) {
    EnvironmentInjector injector(EnvironmentMap{{kEnvRegion, "us-east-1"}});
    auto env = injector.Compose(SampleCredentials(), {{"DB_PASSWORD", "hunter2"}}, "/workspace");

    auto redacted = EnvironmentInjector::RedactForLog(env);
    EXPECT_EQ(redacted.at(kEnvRegion), "us-east-1");
    EXPECT_EQ(redacted.at(kEnvAccountId), "123456789012");
    EXPECT_NE(redacted.at(kEnvAccessKeyId), "AKIAEXAMPLE");
    EXPECT_NE(redacted.at(kEnvSecretAccessKey), "secret-value");
    EXPECT_NE(redacted.at(kEnvSessionToken), "session-value");
    EXPECT_NE(redacted.at("DB_PASSWORD"), "hunter2");

    // Input is left untouched
    EXPECT_EQ(env.at(kEnvSecretAccessKey), "secret-value");
}

TEST(EnvironmentInjectorTest, SensitiveNames) {
    EXPECT_TRUE(EnvironmentInjector::IsSensitive(kEnvAccessKeyId));
    EXPECT_TRUE(EnvironmentInjector::IsSensitive("GITHUB_TOKEN"));
    EXPECT_TRUE(EnvironmentInjector::IsSensitive("my_secret"));
    EXPECT_FALSE(EnvironmentInjector::IsSensitive(kEnvRegion));
    EXPECT_FALSE(EnvironmentInjector::IsSensitive("ARTIFACT_DIR"));
}
