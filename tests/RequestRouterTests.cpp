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

#include "../src/Audit/AuditLog.hpp"
#include "../src/Config/ServiceConfig.hpp"
#include "../src/Elevation/SessionManager.hpp"
#include "../src/Policy/DecisionEngine.hpp"
#include "../src/Policy/PolicyRepository.hpp"
#include "../src/Service/ElevationService.hpp"
#include "../src/Service/RequestJournal.hpp"
#include "../src/Service/RequestRouter.hpp"
#include "../src/Service/ServiceHost.hpp"
#include "../src/Utils/StringUtils.hpp"
#include "TestSupport.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <system_error>

using namespace JitGuard;
using namespace JitGuard::Service;
using JitGuard::Core::ErrorKind;
using JitGuard::Core::ServiceError;
using JitGuard::Testing::MakeIdentity;
using JitGuard::Testing::MakeUser;
using nlohmann::json;

namespace {
    constexpr uint32_t ALICE_SHELL_PID = 500;

    Caller MakeCaller(const Policy::User& user, uint32_t pid, bool isAdmin) {
        Caller caller;
        caller.user = user;
        caller.processId = pid;
        caller.isAdmin = isAdmin;
        return caller;
    }

    const char* const REGEDIT_RULE = R"({
        "Name": "Registry editor from Explorer",
        "ElevationKind": "Confirm",
        "Asker": { "Path": { "Kind": "FileName", "Data": "explorer.exe" } },
        "Target": { "Path": { "Kind": "FileName", "Data": "regedit.exe" } }
    })";
}

TEST(StatusForErrorKindTests, MapsEveryKind) {
    EXPECT_EQ(StatusForErrorKind(ErrorKind::None), 200);
    EXPECT_EQ(StatusForErrorKind(ErrorKind::InvalidParameter), 400);
    EXPECT_EQ(StatusForErrorKind(ErrorKind::AccessDenied), 403);
    EXPECT_EQ(StatusForErrorKind(ErrorKind::NotFound), 404);
    EXPECT_EQ(StatusForErrorKind(ErrorKind::Cancelled), 499);
    EXPECT_EQ(StatusForErrorKind(ErrorKind::Internal), 500);
}

class RequestRouterTests : public Testing::DatabaseTest {
protected:
    void SetUp() override {
        Testing::DatabaseTest::SetUp();
        m_clock = std::make_shared<Testing::ManualClock>();
        m_repo = std::make_unique<Policy::PolicyRepository>(Db());
        m_audit = std::make_unique<Audit::AuditLog>(Db());
        m_journal = std::make_unique<RequestJournal>(Db());
        ServiceError err;
        ASSERT_TRUE(m_repo->Initialize(&err));
        ASSERT_TRUE(m_audit->Initialize(&err));
        ASSERT_TRUE(m_journal->Initialize("test", &err));
        m_engine = std::make_unique<Policy::DecisionEngine>(*m_repo, *m_audit);
        m_sessions = std::make_unique<Elevation::SessionManager>(m_clock);
        m_service = std::make_unique<ElevationService>(*m_repo, *m_engine, *m_sessions, *m_audit,
            m_resolver, m_executor);
        m_router = std::make_unique<RequestRouter>(*m_service, m_journal.get());

        m_resolver.AddProcess(ALICE_SHELL_PID, MakeIdentity("C:\\Windows\\explorer.exe", m_alice.user));
    }

    void TearDown() override {
        m_router.reset();
        m_service.reset();
        m_sessions.reset();
        m_engine.reset();
        m_journal.reset();
        m_audit.reset();
        m_repo.reset();
        Testing::DatabaseTest::TearDown();
    }

    Response Call(const Caller& caller, const std::string& method, const std::string& path,
        const std::string& body = {}) {
        Request request;
        request.method = method;
        request.path = path;
        request.caller = caller;
        request.body = body;
        return m_router->Handle(request);
    }

    static json Body(const Response& response) {
        return json::parse(response.body);
    }

    /// Rule + profile (Confirm by default, 10 minute temporary elevation) assigned to alice
    void SeedPolicy() {
        auto rule = Call(m_admin, "POST", "/policy/rules", REGEDIT_RULE);
        ASSERT_EQ(rule.status, 200) << rule.body;
        const int64_t ruleId = Body(rule).at("Id").get<int64_t>();

        const json profile{
            {"Name", "Helpdesk"},
            {"DefaultElevationKind", "AutoApprove"},
            {"TemporaryElevation", { {"Enabled", true}, {"MaximumSeconds", 600} }},
            {"SessionElevation", { {"Enabled", true} }},
            {"Rules", { ruleId }}
        };
        auto created = Call(m_admin, "POST", "/policy/profiles", profile.dump());
        ASSERT_EQ(created.status, 200) << created.body;
        m_profileId = Body(created).at("Id").get<int64_t>();

        const json users{ {"Users", { m_alice.user }} };
        auto assigned = Call(m_admin, "PUT", "/policy/assignments/" + std::to_string(m_profileId), users.dump());
        ASSERT_EQ(assigned.status, 200) << assigned.body;
    }

    const Caller m_alice = MakeCaller(MakeUser("alice", "S-1-5-21-1000-1001"), ALICE_SHELL_PID, false);
    const Caller m_admin = MakeCaller(MakeUser("admin", "S-1-5-21-1000-500"), 0, true);
    int64_t m_profileId = 0;

    std::shared_ptr<Testing::ManualClock> m_clock;
    Testing::FakeResolver m_resolver;
    Testing::FakeExecutor m_executor;
    std::unique_ptr<Policy::PolicyRepository> m_repo;
    std::unique_ptr<Audit::AuditLog> m_audit;
    std::unique_ptr<RequestJournal> m_journal;
    std::unique_ptr<Policy::DecisionEngine> m_engine;
    std::unique_ptr<Elevation::SessionManager> m_sessions;
    std::unique_ptr<ElevationService> m_service;
    std::unique_ptr<RequestRouter> m_router;
};

// ============================================================================
// ROUTING
// ============================================================================

TEST_F(RequestRouterTests, HealthCheck) {
    const auto response = Call(m_alice, "GET", "/health");
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(Body(response), json("OK"));
}

TEST_F(RequestRouterTests, UnknownRouteIsNotFound) {
    const auto response = Call(m_alice, "GET", "/policy/unknown");
    EXPECT_EQ(response.status, 404);
    EXPECT_EQ(Body(response).at("Kind"), "NotFound");
}

TEST_F(RequestRouterTests, WrongMethodIsRejected) {
    const auto response = Call(m_alice, "DELETE", "/health");
    EXPECT_EQ(response.status, 405);
    EXPECT_TRUE(Body(response).contains("Message"));
}

TEST_F(RequestRouterTests, TrailingSlashIsIgnored) {
    EXPECT_EQ(Call(m_alice, "GET", "/health/").status, 200);
}

TEST_F(RequestRouterTests, MalformedBodyIsBadRequest) {
    const auto response = Call(m_admin, "POST", "/policy/rules", "{ \"Name\": ");
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(Body(response).at("Kind"), "InvalidParameter");
}

TEST_F(RequestRouterTests, BodyMissingRequiredFieldsIsBadRequest) {
    EXPECT_EQ(Call(m_admin, "POST", "/policy/rules", R"({ "ElevationKind": "Confirm" })").status, 400);
    EXPECT_EQ(Call(m_admin, "POST", "/policy/profiles", R"({ "Name": "x", "DefaultElevationKind": "Maybe" })").status, 400);
    EXPECT_EQ(Call(m_alice, "POST", "/elevate/temporary", "{}").status, 400);
    EXPECT_TRUE(m_repo->ListRules().empty());
}

TEST_F(RequestRouterTests, InvalidIdsAreBadRequest) {
    EXPECT_EQ(Call(m_admin, "GET", "/policy/rules/abc").status, 400);
    EXPECT_EQ(Call(m_admin, "GET", "/policy/rules/0").status, 400);
    EXPECT_EQ(Call(m_admin, "GET", "/policy/profiles/-4").status, 400);
    EXPECT_EQ(Call(m_admin, "GET", "/policy/rules/12").status, 404);
}

// ============================================================================
// POLICY ADMINISTRATION
// ============================================================================

TEST_F(RequestRouterTests, RuleLifecycle) {
    auto created = Call(m_admin, "POST", "/policy/rules", REGEDIT_RULE);
    ASSERT_EQ(created.status, 200) << created.body;
    const int64_t id = Body(created).at("Id").get<int64_t>();
    EXPECT_GT(id, 0);

    auto fetched = Call(m_admin, "GET", "/policy/rules/" + std::to_string(id));
    ASSERT_EQ(fetched.status, 200);
    EXPECT_EQ(Body(fetched).at("Name"), "Registry editor from Explorer");
    EXPECT_EQ(Body(fetched).at("Target").at("Path").at("Data"), "regedit.exe");

    json renamed = json::parse(REGEDIT_RULE);
    renamed["Name"] = "Registry editor";
    EXPECT_EQ(Call(m_admin, "PUT", "/policy/rules/" + std::to_string(id), renamed.dump()).status, 200);
    EXPECT_EQ(Body(Call(m_admin, "GET", "/policy/rules")).size(), 1u);
    EXPECT_EQ(Body(Call(m_admin, "GET", "/policy/rules"))[0].at("Name"), "Registry editor");

    EXPECT_EQ(Call(m_admin, "DELETE", "/policy/rules/" + std::to_string(id)).status, 200);
    EXPECT_EQ(Call(m_admin, "GET", "/policy/rules/" + std::to_string(id)).status, 404);
}

TEST_F(RequestRouterTests, AdministrationIsForbiddenToUsers) {
    const auto response = Call(m_alice, "POST", "/policy/rules", REGEDIT_RULE);
    EXPECT_EQ(response.status, 403);
    EXPECT_EQ(Body(response).at("Kind"), "AccessDenied");
    EXPECT_EQ(Call(m_alice, "GET", "/log/jit").status, 403);
}

TEST_F(RequestRouterTests, ReferencedRuleCannotBeDeleted) {
    SeedPolicy();
    const auto rules = Body(Call(m_admin, "GET", "/policy/rules"));
    ASSERT_EQ(rules.size(), 1u);
    const auto id = rules[0].at("Id").get<int64_t>();
    EXPECT_EQ(Call(m_admin, "DELETE", "/policy/rules/" + std::to_string(id)).status, 400);
}

TEST_F(RequestRouterTests, AssignmentsAndSelection) {
    SeedPolicy();

    const auto assignment = Body(Call(m_admin, "GET", "/policy/assignments/" + std::to_string(m_profileId)));
    ASSERT_EQ(assignment.at("Users").size(), 1u);
    EXPECT_EQ(assignment.at("Users")[0].at("AccountSid"), "S-1-5-21-1000-1001");

    const auto me = Body(Call(m_alice, "GET", "/policy/me"));
    EXPECT_EQ(me.at("Active"), m_profileId);
    EXPECT_EQ(me.at("Available"), json::array({ m_profileId }));

    EXPECT_EQ(Call(m_alice, "PUT", "/policy/me/" + std::to_string(m_profileId)).status, 200);
    EXPECT_EQ(Call(m_alice, "PUT", "/policy/me/999").status, 404);
}

// ============================================================================
// ELEVATION
// ============================================================================

TEST_F(RequestRouterTests, StatusReportsTemporaryCountdown) {
    SeedPolicy();

    auto status = Body(Call(m_alice, "GET", "/status"));
    EXPECT_FALSE(status.at("Elevated").get<bool>());
    EXPECT_TRUE(status.at("Session").at("Enabled").get<bool>());
    EXPECT_TRUE(status.at("Temporary").at("Enabled").get<bool>());
    EXPECT_EQ(status.at("Temporary").at("MaxSeconds"), 600);

    ASSERT_EQ(Call(m_alice, "POST", "/elevate/temporary", R"({ "Seconds": 90 })").status, 200);
    m_clock->Advance(std::chrono::seconds(30));

    status = Body(Call(m_alice, "GET", "/status"));
    EXPECT_TRUE(status.at("Elevated").get<bool>());
    EXPECT_EQ(status.at("Temporary").at("TimeLeft"), 60);

    EXPECT_EQ(Call(m_alice, "POST", "/revoke").status, 200);
    EXPECT_FALSE(Body(Call(m_alice, "GET", "/status")).at("Elevated").get<bool>());
}

TEST_F(RequestRouterTests, TemporaryElevationWithoutProfileIsForbidden) {
    const auto response = Call(m_alice, "POST", "/elevate/temporary", R"({ "Seconds": 60 })");
    EXPECT_EQ(response.status, 403);
}

TEST_F(RequestRouterTests, LaunchReturnsProcessAndThread) {
    SeedPolicy();

    const json request{
        {"ExecutablePath", "C:\\Windows\\regedit.exe"},
        {"StartupInfo", { {"ShowWindow", 1}, {"Title", "Registry"} }},
        {"Reason", "Printer fix"}
    };
    const auto response = Call(m_alice, "POST", "/launch", request.dump());
    ASSERT_EQ(response.status, 200) << response.body;
    EXPECT_EQ(Body(response).at("ProcessId"), 4200);
    EXPECT_EQ(Body(response).at("ThreadId"), 5200);

    ASSERT_EQ(m_executor.plans.size(), 1u);
    EXPECT_EQ(m_executor.plans[0].kind, Policy::ElevationKind::Confirm);
    EXPECT_EQ(m_executor.plans[0].startupInfo.showWindow, 1);
    EXPECT_EQ(m_executor.plans[0].startupInfo.title, "Registry");
}

TEST_F(RequestRouterTests, LaunchFailureCarriesPlatformCode) {
    SeedPolicy();
    m_executor.failWithCode = 740;

    const auto response = Call(m_alice, "POST", "/launch", R"({ "CommandLine": "regedit.exe /s" })");
    EXPECT_EQ(response.status, 500);
    EXPECT_EQ(Body(response).at("Kind"), "Internal");
    EXPECT_EQ(Body(response).at("Code"), 740);
}

// ============================================================================
// AUDIT LOG
// ============================================================================

TEST_F(RequestRouterTests, AuditQueryParametersArePassedThrough) {
    SeedPolicy();
    const json launch{ {"ExecutablePath", "C:\\Windows\\regedit.exe"} };
    for (int i = 0; i < 3; ++i) {
        ASSERT_EQ(Call(m_alice, "POST", "/launch", launch.dump()).status, 200);
    }

    auto page = Body(Call(m_admin, "GET", "/log/jit?page=1&page_size=2&sort_column=id&sort_descending=false"));
    EXPECT_EQ(page.at("TotalRecords"), 6);
    EXPECT_EQ(page.at("TotalPages"), 3);
    ASSERT_EQ(page.at("Results").size(), 2u);
    EXPECT_LT(page.at("Results")[0].at("Id").get<int64_t>(), page.at("Results")[1].at("Id").get<int64_t>());

    page = Body(Call(m_admin, "GET", "/log/jit?outcome=LaunchSucceeded&user=S-1-5-21-1000-1001"));
    EXPECT_EQ(page.at("TotalRecords"), 3);

    const auto firstId = Body(Call(m_admin, "GET", "/log/jit?sort_column=id&sort_descending=false"))
        .at("Results")[0].at("Id").get<int64_t>();
    const auto entry = Call(m_admin, "GET", "/log/jit/" + std::to_string(firstId));
    ASSERT_EQ(entry.status, 200);
    EXPECT_EQ(Body(entry).at("Outcome"), "Granted");
}

TEST_F(RequestRouterTests, InvalidAuditParametersAreBadRequest) {
    EXPECT_EQ(Call(m_admin, "GET", "/log/jit?page=abc").status, 400);
    EXPECT_EQ(Call(m_admin, "GET", "/log/jit?page=0").status, 400);
    EXPECT_EQ(Call(m_admin, "GET", "/log/jit?sort_descending=maybe").status, 400);
    EXPECT_EQ(Call(m_admin, "GET", "/log/jit?outcome=Approved").status, 400);
    EXPECT_EQ(Call(m_admin, "GET", "/log/jit?start_time=200&end_time=100").status, 400);
    EXPECT_EQ(Call(m_admin, "GET", "/log/jit?snapshot=-1").status, 400);
    EXPECT_EQ(Call(m_admin, "GET", "/log/jit?start_time=9300000000000000").status, 400);
    EXPECT_EQ(Call(m_admin, "GET", "/log/jit?end_time=-9300000000000000").status, 400);
    EXPECT_EQ(Call(m_admin, "GET", "/log/jit?end_time=" + std::to_string(JitGuard::Audit::MAX_UNIX_MICROS)).status, 200);
    EXPECT_EQ(Call(m_admin, "GET", "/log/jit/77").status, 404);
}

TEST_F(RequestRouterTests, QueryValuesArePercentDecoded) {
    Request request;
    request.method = "GET";
    request.path = "/log/jit?sort_column=target%5Fpath&user=S%2D1%2D5%2D21%2D1000%2D1001";
    request.caller = m_admin;
    const auto response = m_router->Handle(request);
    ASSERT_EQ(response.status, 200) << response.body;
    EXPECT_EQ(Body(response).at("TotalRecords"), 0);
}

// ============================================================================
// JOURNAL AND COUNTERS
// ============================================================================

TEST_F(RequestRouterTests, RequestsAreNumberedAndCounted) {
    const auto first = Call(m_alice, "GET", "/health");
    const auto second = Call(m_alice, "GET", "/nowhere");
    const auto third = Call(m_admin, "GET", "/policy/rules/abc");

    EXPECT_EQ(second.requestId, first.requestId + 1);
    EXPECT_EQ(third.requestId, first.requestId + 2);
    EXPECT_EQ(m_journal->LastRequestId(), third.requestId);

    const auto& stats = m_router->Stats();
    EXPECT_EQ(stats.requestsHandled.load(), 3u);
    EXPECT_EQ(stats.clientErrors.load(), 2u);
    EXPECT_EQ(stats.serverErrors.load(), 0u);
}

TEST_F(RequestRouterTests, RequestIdsContinueAfterRestart) {
    const auto before = Call(m_alice, "GET", "/health").requestId;
    const int64_t firstRun = m_journal->RunId();

    RequestJournal restarted(Db());
    ServiceError err;
    ASSERT_TRUE(restarted.Initialize("test", &err));
    EXPECT_GT(restarted.RunId(), firstRun);
    EXPECT_EQ(restarted.NextRequestId(), before + 1);
}

// ============================================================================
// SERVICE HOST
// ============================================================================

class ServiceHostTests : public ::testing::Test {
protected:
    void SetUp() override {
        m_dir = Testing::UniqueTempPath("jitguard_host", "");
        std::filesystem::create_directories(m_dir);
        m_config.dataDirectory = m_dir.string();
        m_config.logging.toFile = false;
        m_config.elevation.sweeperEnabled = false;
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }

    std::filesystem::path m_dir;
    Config::ServiceConfig m_config;
    Testing::FakeResolver m_resolver;
    Testing::FakeExecutor m_executor;
};

TEST_F(ServiceHostTests, StartServeStop) {
    ServiceHost host(m_resolver, m_executor);
    ServiceError err;
    ASSERT_TRUE(host.Start(m_config, "test", &err)) << Utils::ToNarrow(err.message);
    EXPECT_TRUE(host.IsRunning());
    EXPECT_TRUE(std::filesystem::exists(m_dir / "jitguard.db"));

    Request request;
    request.method = "GET";
    request.path = "/health";
    request.caller = MakeCaller(MakeUser("alice", "S-1-5-21-1000-1001"), 1, false);
    EXPECT_EQ(host.GetRouter().Handle(request).status, 200);
    request.path = "/missing";
    EXPECT_EQ(host.GetRouter().Handle(request).status, 404);

    const auto report = json::parse(host.GetStatusReport());
    EXPECT_EQ(report.at("Service"), "JitGuard");
    EXPECT_TRUE(report.at("Running").get<bool>());
    EXPECT_FALSE(report.at("SweeperRunning").get<bool>());
    EXPECT_EQ(report.at("Requests").at("Handled"), 2);
    EXPECT_EQ(report.at("Requests").at("ClientErrors"), 1);
    EXPECT_EQ(report.at("Requests").at("LastId"), 2);

    host.Stop();
    EXPECT_FALSE(host.IsRunning());
    EXPECT_FALSE(Database::DatabaseManager::Instance().IsInitialized());
    EXPECT_FALSE(json::parse(host.GetStatusReport()).at("Running").get<bool>());
}

TEST_F(ServiceHostTests, RestartKeepsPolicyAndRequestNumbering) {
    const Caller admin = MakeCaller(MakeUser("admin", "S-1-5-21-1000-500"), 1, true);
    int64_t runId = 0;
    {
        ServiceHost host(m_resolver, m_executor);
        ASSERT_TRUE(host.Start(m_config));
        Request request;
        request.method = "POST";
        request.path = "/policy/rules";
        request.caller = admin;
        request.body = REGEDIT_RULE;
        const auto response = host.GetRouter().Handle(request);
        ASSERT_EQ(response.status, 200) << response.body;
        EXPECT_EQ(response.requestId, 1);
        runId = json::parse(host.GetStatusReport()).at("RunId").get<int64_t>();
    }

    ServiceHost host(m_resolver, m_executor);
    m_config.elevation.sweeperEnabled = true;
    ASSERT_TRUE(host.Start(m_config));
    EXPECT_GT(json::parse(host.GetStatusReport()).at("RunId").get<int64_t>(), runId);
    EXPECT_TRUE(json::parse(host.GetStatusReport()).at("SweeperRunning").get<bool>());

    Request request;
    request.method = "GET";
    request.path = "/policy/rules";
    request.caller = admin;
    const auto response = host.GetRouter().Handle(request);
    ASSERT_EQ(response.status, 200);
    EXPECT_EQ(response.requestId, 2);
    EXPECT_EQ(json::parse(response.body).size(), 1u);
    host.Stop();
}

TEST_F(ServiceHostTests, InvalidConfigIsRejected) {
    m_config.audit.maxPageSize = 0;
    ServiceHost host(m_resolver, m_executor);
    ServiceError err;
    EXPECT_FALSE(host.Start(m_config, "test", &err));
    EXPECT_EQ(err.kind, ErrorKind::InvalidParameter);
    EXPECT_FALSE(host.IsRunning());
}
