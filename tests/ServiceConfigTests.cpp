/*
 * JitGuard - Endpoint Privilege Elevation Service
 * Copyright (C) 2026 JitGuard Security
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include <gtest/gtest.h>

#include "../src/Config/ServiceConfig.hpp"
#include "TestSupport.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

using namespace JitGuard;
using namespace JitGuard::Config;
using JitGuard::Core::ErrorKind;
using JitGuard::Core::ServiceError;
using JitGuard::Utils::JSON::Json;

class ServiceConfigFileTests : public ::testing::Test {
protected:
    void SetUp() override {
        m_dir = Testing::UniqueTempPath("jitguard_config", "");
        std::filesystem::create_directories(m_dir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }

    void WriteFile(const std::filesystem::path& path, const std::string& text) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << text;
    }

    std::filesystem::path m_dir;
};

TEST(ServiceConfigTests, DefaultsAreValid) {
    ServiceConfig config;
    ServiceError err;
    EXPECT_TRUE(config.IsValid(&err));
    EXPECT_EQ(config.database.path, "jitguard.db");
    EXPECT_TRUE(config.elevation.sweeperEnabled);
    EXPECT_EQ(config.audit.maxPageSize, 1000u);
}

TEST(ServiceConfigTests, ReadsNestedKeysAndKeepsDefaultsForTheRest) {
    const Json j = Json::parse(R"({
        "DataDirectory": "/srv/jitguard",
        "Database": { "Path": "policy.db", "BusyTimeoutMs": 250 },
        "Logging": { "MinimalLevel": "Debug", "ToConsole": true },
        "Elevation": { "SweeperEnabled": false },
        "Unrelated": 1
    })");

    ServiceConfig config;
    ServiceError err;
    ASSERT_TRUE(FromJson(j, config, &err));
    EXPECT_EQ(config.dataDirectory, "/srv/jitguard");
    EXPECT_EQ(config.database.path, "policy.db");
    EXPECT_EQ(config.database.busyTimeoutMs, 250);
    EXPECT_TRUE(config.database.enableWAL);
    EXPECT_EQ(config.logging.minimalLevel, Utils::LogLevel::Debug);
    EXPECT_TRUE(config.logging.toConsole);
    EXPECT_TRUE(config.logging.toFile);
    EXPECT_FALSE(config.elevation.sweeperEnabled);
}

TEST(ServiceConfigTests, WrongTypeIsRejectedAndOutputUntouched) {
    ServiceConfig config;
    config.dataDirectory = "/keep";
    ServiceError err;
    EXPECT_FALSE(FromJson(Json::parse(R"({ "DataDirectory": "/new", "Database": { "EnableWAL": "yes" } })"), config, &err));
    EXPECT_EQ(err.kind, ErrorKind::InvalidParameter);
    EXPECT_NE(err.message.find(L"Database.EnableWAL"), std::wstring::npos);
    EXPECT_EQ(config.dataDirectory, "/keep");
}

TEST(ServiceConfigTests, NonObjectRootIsRejected) {
    ServiceConfig config;
    ServiceError err;
    EXPECT_FALSE(FromJson(Json::parse("[1, 2]"), config, &err));
    EXPECT_EQ(err.kind, ErrorKind::InvalidParameter);
}

TEST(ServiceConfigTests, OutOfRangeValuesFailValidation) {
    ServiceConfig config;
    ServiceError err;
    EXPECT_FALSE(FromJson(Json::parse(R"({ "Audit": { "MaxPageSize": 0 } })"), config, &err));
    EXPECT_EQ(err.kind, ErrorKind::InvalidParameter);

    err.Clear();
    EXPECT_FALSE(FromJson(Json::parse(R"({ "Database": { "BusyTimeoutMs": -1 } })"), config, &err));
    EXPECT_EQ(err.kind, ErrorKind::InvalidParameter);

    err.Clear();
    EXPECT_FALSE(FromJson(Json::parse(R"({ "Database": { "Path": "" } })"), config, &err));
    EXPECT_EQ(err.kind, ErrorKind::InvalidParameter);
}

TEST(ServiceConfigTests, UnknownLogLevelFallsBackToInfo) {
    ServiceConfig config;
    ASSERT_TRUE(FromJson(Json::parse(R"({ "Logging": { "MinimalLevel": "chatty" } })"), config));
    EXPECT_EQ(config.logging.minimalLevel, Utils::LogLevel::Info);
}

TEST(ServiceConfigTests, RelativePathsResolveAgainstDataDirectory) {
    ServiceConfig config;
    config.dataDirectory = "/srv/jitguard";
    EXPECT_EQ(config.ResolvedDatabasePath(), std::filesystem::path("/srv/jitguard") / "jitguard.db");
    EXPECT_EQ(config.ResolvedLogDirectory(), std::filesystem::path("/srv/jitguard") / "logs");

    config.database.path = "/var/lib/jitguard/policy.db";
    EXPECT_EQ(config.ResolvedDatabasePath(), std::filesystem::path("/var/lib/jitguard/policy.db"));

    const auto db = config.ToDatabaseConfig();
    EXPECT_EQ(db.databasePath, std::filesystem::path("/var/lib/jitguard/policy.db").wstring());
    EXPECT_TRUE(db.IsValid());

    const auto logger = config.ToLoggerConfig();
    EXPECT_EQ(logger.logDirectory, (std::filesystem::path("/srv/jitguard") / "logs").wstring());
}

TEST(ServiceConfigTests, JsonFormReadsBackIdentically) {
    ServiceConfig config;
    config.dataDirectory = "/opt/jg";
    config.logging.minimalLevel = Utils::LogLevel::Warn;
    config.audit.maxPageSize = 200;

    ServiceConfig back;
    ASSERT_TRUE(FromJson(ToJson(config), back));
    EXPECT_EQ(back.dataDirectory, "/opt/jg");
    EXPECT_EQ(back.logging.minimalLevel, Utils::LogLevel::Warn);
    EXPECT_EQ(back.audit.maxPageSize, 200u);
    EXPECT_EQ(ToJson(back), ToJson(config));
}

TEST_F(ServiceConfigFileTests, MissingFileIsCreatedWithDefaults) {
    const auto path = m_dir / "jitguard.json";
    ServiceConfig config;
    config.dataDirectory = "/not/the/default";

    ServiceError err;
    ASSERT_TRUE(LoadOrCreate(path, config, &err));
    EXPECT_EQ(config.dataDirectory, ".");
    ASSERT_TRUE(std::filesystem::exists(path));

    Json written;
    ASSERT_TRUE(Utils::JSON::LoadFromFile(path, written));
    EXPECT_EQ(written, ToJson(ServiceConfig{}));
}

TEST_F(ServiceConfigFileTests, ExistingFileIsLoaded) {
    const auto path = m_dir / "jitguard.json";
    WriteFile(path, R"({
        // operator overrides
        "DataDirectory": "/data",
        "Audit": { "MaxPageSize": 50 }
    })");

    ServiceConfig config;
    ServiceError err;
    ASSERT_TRUE(LoadOrCreate(path, config, &err));
    EXPECT_EQ(config.dataDirectory, "/data");
    EXPECT_EQ(config.audit.maxPageSize, 50u);
}

TEST_F(ServiceConfigFileTests, MalformedFileReportsPosition) {
    const auto path = m_dir / "jitguard.json";
    WriteFile(path, "{\n  \"DataDirectory\": \n}");

    ServiceConfig config;
    ServiceError err;
    EXPECT_FALSE(LoadOrCreate(path, config, &err));
    EXPECT_EQ(err.kind, ErrorKind::InvalidParameter);
    EXPECT_NE(err.message.find(L"line 3"), std::wstring::npos);
}
