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
#include "../src/Policy/DecisionEngine.hpp"
#include "../src/Policy/PolicyRepository.hpp"
#include "TestSupport.hpp"

#include <set>
#include <thread>
#include <vector>

using namespace JitGuard;
using namespace JitGuard::Policy;
using JitGuard::Core::ErrorKind;
using JitGuard::Core::ServiceError;
using JitGuard::Testing::AnyPathFilter;
using JitGuard::Testing::FileNameFilter;
using JitGuard::Testing::MakeIdentity;
using JitGuard::Testing::MakeProfile;
using JitGuard::Testing::MakeRule;
using JitGuard::Testing::MakeUser;

class DecisionEngineTests : public Testing::DatabaseTest {
protected:
    void SetUp() override {
        Testing::DatabaseTest::SetUp();
        m_repo = std::make_unique<PolicyRepository>(Db());
        m_audit = std::make_unique<Audit::AuditLog>(Db());
        ServiceError err;
        ASSERT_TRUE(m_repo->Initialize(&err));
        ASSERT_TRUE(m_audit->Initialize(&err));
        m_engine = std::make_unique<DecisionEngine>(*m_repo, *m_audit);
    }

    void TearDown() override {
        m_engine.reset();
        m_audit.reset();
        m_repo.reset();
        Testing::DatabaseTest::TearDown();
    }

    int64_t AddRule(const std::string& name, ElevationKind kind,
        ApplicationFilter asker, ApplicationFilter target) {
        auto id = m_repo->CreateRule(MakeRule(name, kind, std::move(asker), std::move(target)));
        EXPECT_TRUE(id.has_value());
        return id.value_or(0);
    }

    int64_t AssignProfile(Profile profile, const User& user) {
        auto id = m_repo->CreateProfile(profile);
        EXPECT_TRUE(id.has_value());
        EXPECT_TRUE(m_repo->SetAssignment(id.value_or(0), { user }));
        return id.value_or(0);
    }

    ElevationRequest Request(const std::string& askerPath, const std::string& targetPath) const {
        ElevationRequest request;
        request.user = m_alice;
        request.asker = MakeIdentity(askerPath, m_alice);
        request.target = MakeIdentity(targetPath, m_alice);
        return request;
    }

    const User m_alice = MakeUser("alice", "S-1-5-21-1000-1001");
    std::unique_ptr<PolicyRepository> m_repo;
    std::unique_ptr<Audit::AuditLog> m_audit;
    std::unique_ptr<DecisionEngine> m_engine;
};

TEST_F(DecisionEngineTests, MatchingRuleOverridesProfileDefault) {
    const int64_t ruleId = AddRule("Registry editor from Notepad", ElevationKind::Confirm,
        FileNameFilter("notepad.exe"), FileNameFilter("regedit.exe"));
    const int64_t profileId = AssignProfile(MakeProfile("Default", ElevationKind::AutoApprove, { ruleId }), m_alice);

    ServiceError err;
    const auto decision = m_engine->Decide(Request("C:\\Windows\\notepad.exe", "C:\\Windows\\regedit.exe"), &err);

    EXPECT_TRUE(decision.IsGranted());
    EXPECT_FALSE(err.HasError());
    EXPECT_EQ(decision.kind, ElevationKind::Confirm);
    EXPECT_EQ(decision.profileId, profileId);
    EXPECT_EQ(decision.ruleId, ruleId);
}

TEST_F(DecisionEngineTests, NoMatchingRuleUsesProfileDefault) {
    const int64_t ruleId = AddRule("Registry editor from Notepad", ElevationKind::Confirm,
        FileNameFilter("notepad.exe"), FileNameFilter("regedit.exe"));
    AssignProfile(MakeProfile("Default", ElevationKind::AutoApprove, { ruleId }), m_alice);

    const auto decision = m_engine->Decide(Request("C:\\Windows\\explorer.exe", "C:\\Windows\\regedit.exe"));
    EXPECT_TRUE(decision.IsGranted());
    EXPECT_EQ(decision.kind, ElevationKind::AutoApprove);
    EXPECT_FALSE(decision.ruleId.has_value());
}

TEST_F(DecisionEngineTests, FirstMatchingRuleWinsNotMostSpecific) {
    const int64_t broad = AddRule("Anything", ElevationKind::ReasonApproval, AnyPathFilter(), AnyPathFilter());
    ApplicationFilter exact;
    exact.path.kind = PathFilterKind::Equals;
    exact.path.pattern = "C:\\Windows\\regedit.exe";
    const int64_t specific = AddRule("Exact regedit", ElevationKind::Deny, AnyPathFilter(), exact);
    AssignProfile(MakeProfile("Ordered", ElevationKind::Deny, { broad, specific }), m_alice);

    const auto decision = m_engine->Decide(Request("C:\\Windows\\explorer.exe", "C:\\Windows\\regedit.exe"));
    EXPECT_TRUE(decision.IsGranted());
    EXPECT_EQ(decision.kind, ElevationKind::ReasonApproval);
    EXPECT_EQ(decision.ruleId, broad);
}

TEST_F(DecisionEngineTests, DenyVerdictIsAccessDenied) {
    const int64_t ruleId = AddRule("No cmd", ElevationKind::Deny, AnyPathFilter(), FileNameFilter("cmd.exe"));
    AssignProfile(MakeProfile("Default", ElevationKind::AutoApprove, { ruleId }), m_alice);

    ServiceError err;
    const auto decision = m_engine->Decide(Request("C:\\Windows\\explorer.exe", "C:\\Windows\\System32\\cmd.exe"), &err);
    EXPECT_FALSE(decision.IsGranted());
    EXPECT_EQ(err.kind, ErrorKind::AccessDenied);
    EXPECT_EQ(decision.kind, ElevationKind::Deny);
}

TEST_F(DecisionEngineTests, UserWithoutAssignmentIsDenied) {
    m_repo->CreateProfile(MakeProfile("Unassigned", ElevationKind::AutoApprove));

    ServiceError err;
    const auto decision = m_engine->Decide(Request("C:\\Windows\\explorer.exe", "C:\\Windows\\regedit.exe"), &err);
    EXPECT_FALSE(decision.IsGranted());
    EXPECT_EQ(err.kind, ErrorKind::AccessDenied);
    EXPECT_EQ(decision.profileId, 0);
    EXPECT_GT(decision.auditId, 0);
}

TEST_F(DecisionEngineTests, UnsignedTargetDeniedWhenProfileRequiresSignature) {
    auto profile = MakeProfile("Signed only", ElevationKind::AutoApprove);
    profile.targetMustBeSigned = true;
    AssignProfile(profile, m_alice);

    auto request = Request("C:\\Windows\\explorer.exe", "C:\\Users\\alice\\Downloads\\setup.exe");
    request.target.signature.status = SignatureStatus::NotSigned;

    ServiceError err;
    EXPECT_FALSE(m_engine->Decide(request, &err).IsGranted());
    EXPECT_EQ(err.kind, ErrorKind::AccessDenied);

    request.target.signature.status = SignatureStatus::Valid;
    err.Clear();
    EXPECT_TRUE(m_engine->Decide(request, &err).IsGranted());
}

TEST_F(DecisionEngineTests, EveryDecisionIsAuditedExactlyOnce) {
    const int64_t ruleId = AddRule("Registry editor", ElevationKind::Confirm, AnyPathFilter(), FileNameFilter("regedit.exe"));
    const int64_t profileId = AssignProfile(MakeProfile("Default", ElevationKind::Deny, { ruleId }), m_alice);

    auto request = Request("C:\\Windows\\explorer.exe", "C:\\Windows\\regedit.exe");
    request.target.commandLine = { "regedit.exe", "/s", "settings.reg" };
    request.reason = "import settings";

    const int64_t before = m_audit->LatestId();
    const auto granted = m_engine->Decide(request);
    ASSERT_GT(granted.auditId, before);
    EXPECT_EQ(m_audit->LatestId(), granted.auditId);

    auto entry = m_audit->GetEntry(granted.auditId);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->outcome, Audit::AuditOutcome::Granted);
    EXPECT_TRUE(entry->success);
    EXPECT_EQ(entry->user.accountSid, m_alice.accountSid);
    EXPECT_EQ(entry->targetPath, "C:\\Windows\\regedit.exe");
    EXPECT_EQ(entry->targetCommandLine, request.target.commandLine);
    EXPECT_EQ(entry->elevationKind, ElevationKind::Confirm);
    EXPECT_EQ(entry->profileId, profileId);
    EXPECT_EQ(entry->ruleId, ruleId);
    EXPECT_EQ(entry->reason, "import settings");

    const auto denied = m_engine->Decide(Request("C:\\Windows\\explorer.exe", "C:\\Windows\\System32\\cmd.exe"));
    EXPECT_EQ(denied.auditId, granted.auditId + 1);
    entry = m_audit->GetEntry(denied.auditId);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->outcome, Audit::AuditOutcome::Denied);
    EXPECT_FALSE(entry->success);
    EXPECT_FALSE(entry->reason.empty());
}

TEST_F(DecisionEngineTests, MalformedRequestIsRejectedWithoutAudit) {
    AssignProfile(MakeProfile("Default", ElevationKind::AutoApprove), m_alice);
    const int64_t before = m_audit->LatestId();

    ServiceError err;
    auto request = Request("C:\\Windows\\explorer.exe", "");
    EXPECT_FALSE(m_engine->Decide(request, &err).IsGranted());
    EXPECT_EQ(err.kind, ErrorKind::InvalidParameter);

    request = Request("C:\\Windows\\explorer.exe", "C:\\Windows\\regedit.exe");
    request.user.accountSid.clear();
    err.Clear();
    const auto decision = m_engine->Decide(request, &err);
    EXPECT_EQ(err.kind, ErrorKind::InvalidParameter);
    EXPECT_EQ(decision.auditId, -1);
    EXPECT_EQ(m_audit->LatestId(), before);
}

TEST_F(DecisionEngineTests, UnavailablePolicyFailsClosed) {
    PolicyRepository unloaded(Db());
    DecisionEngine engine(unloaded, *m_audit);

    ServiceError err;
    const auto decision = engine.Decide(Request("C:\\Windows\\explorer.exe", "C:\\Windows\\regedit.exe"), &err);
    EXPECT_FALSE(decision.IsGranted());
    EXPECT_EQ(err.kind, ErrorKind::Internal);

    auto entry = m_audit->GetEntry(decision.auditId);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->outcome, Audit::AuditOutcome::Denied);
}

TEST_F(DecisionEngineTests, EvaluateIsPure) {
    const int64_t ruleId = AddRule("Registry editor", ElevationKind::Confirm, AnyPathFilter(), FileNameFilter("regedit.exe"));
    AssignProfile(MakeProfile("Default", ElevationKind::Deny, { ruleId }), m_alice);

    const int64_t before = m_audit->LatestId();
    const auto snapshot = m_repo->GetSnapshot();
    ASSERT_TRUE(snapshot);

    const auto decision = DecisionEngine::Evaluate(*snapshot, Request("C:\\Windows\\explorer.exe", "C:\\Windows\\regedit.exe"));
    EXPECT_TRUE(decision.IsGranted());
    EXPECT_EQ(decision.auditId, -1);
    EXPECT_EQ(m_audit->LatestId(), before);
}

// ============================================================================
// CONCURRENCY
// ============================================================================

TEST_F(DecisionEngineTests, ConcurrentDecisionsSeeWholeRuleLists) {
    const int64_t allow = AddRule("Regedit", ElevationKind::Confirm, AnyPathFilter(), FileNameFilter("regedit.exe"));
    const Profile original = MakeProfile("Toggled", ElevationKind::AutoApprove, { allow });
    const int64_t profileId = AssignProfile(original, m_alice);

    constexpr int WRITER_ROUNDS = 15;
    constexpr int READERS = 3;
    constexpr int DECISIONS_PER_READER = 40;

    // Writer: insert a blocking rule in front, then take it out and delete it
    std::vector<int64_t> blockIds;
    bool writerOk = true;
    std::thread writer([&] {
        for (int i = 0; i < WRITER_ROUNDS && writerOk; ++i) {
            const auto block = m_repo->CreateRule(MakeRule("Block " + std::to_string(i), ElevationKind::Deny,
                AnyPathFilter(), FileNameFilter("regedit.exe")));
            if (!block) {
                writerOk = false;
                break;
            }
            blockIds.push_back(*block);

            Profile blocked = original;
            blocked.ruleIds = { *block, allow };
            writerOk = m_repo->PutProfile(profileId, blocked) &&
                m_repo->PutProfile(profileId, original) &&
                m_repo->DeleteRule(*block);
        }
    });

    struct Observation {
        Decision decision;
        bool danglingRule = false;
    };
    std::vector<std::vector<Observation>> observed(READERS);
    std::vector<std::thread> readers;
    for (int r = 0; r < READERS; ++r) {
        readers.emplace_back([&, r] {
            for (int i = 0; i < DECISIONS_PER_READER; ++i) {
                Observation o;
                const auto snapshot = m_repo->GetSnapshot();
                for (const auto& [id, profile] : snapshot->profiles) {
                    for (int64_t ruleId : profile.ruleIds) {
                        o.danglingRule = o.danglingRule || snapshot->FindRule(ruleId) == nullptr;
                    }
                }
                o.decision = m_engine->Decide(Request("C:\\Windows\\explorer.exe", "C:\\Windows\\regedit.exe"));
                observed[r].push_back(o);
            }
        });
    }

    writer.join();
    for (auto& reader : readers) {
        reader.join();
    }

    ASSERT_TRUE(writerOk);
    const std::set<int64_t> blocks(blockIds.begin(), blockIds.end());
    for (const auto& perReader : observed) {
        ASSERT_EQ(perReader.size(), static_cast<size_t>(DECISIONS_PER_READER));
        for (const auto& o : perReader) {
            EXPECT_FALSE(o.danglingRule);
            EXPECT_GT(o.decision.auditId, 0);
            EXPECT_EQ(o.decision.profileId, profileId);
            ASSERT_TRUE(o.decision.ruleId.has_value());
            if (o.decision.IsGranted()) {
                EXPECT_EQ(*o.decision.ruleId, allow);
                EXPECT_EQ(o.decision.kind, ElevationKind::Confirm);
            }
            else {
                EXPECT_EQ(blocks.count(*o.decision.ruleId), 1u);
                EXPECT_EQ(o.decision.kind, ElevationKind::Deny);
            }
        }
    }

    Audit::AuditQuery query;
    query.pageSize = 1;
    const auto page = m_audit->Query(query);
    ASSERT_TRUE(page.has_value());
    EXPECT_EQ(page->totalRecords, READERS * DECISIONS_PER_READER);
    EXPECT_EQ(m_repo->GetProfile(profileId)->ruleIds, std::vector<int64_t>{ allow });
}
