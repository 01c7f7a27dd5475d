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
#include "TestSupport.hpp"

#include <set>
#include <thread>
#include <vector>

using namespace JitGuard;
using namespace JitGuard::Audit;
using JitGuard::Core::ErrorKind;
using JitGuard::Core::ServiceError;
using JitGuard::Testing::MakeUser;

namespace {
    constexpr int64_t BASE_TIME_US = 1'760'000'000'000'000;   // 2025-10-09
}

class AuditLogTests : public Testing::DatabaseTest {
protected:
    void SetUp() override {
        Testing::DatabaseTest::SetUp();
        m_log = std::make_unique<AuditLog>(Db());
        ServiceError err;
        ASSERT_TRUE(m_log->Initialize(&err));
    }

    void TearDown() override {
        m_log.reset();
        Testing::DatabaseTest::TearDown();
    }

    AuditEntry Entry(int64_t timestampUs, const Policy::User& user, AuditOutcome outcome) {
        AuditEntry entry;
        entry.timestamp = FromUnixMicros(timestampUs);
        entry.outcome = outcome;
        entry.success = outcome == AuditOutcome::Granted || outcome == AuditOutcome::LaunchSucceeded;
        entry.user = user;
        entry.askerPath = "C:\\Windows\\explorer.exe";
        entry.targetPath = "C:\\Windows\\regedit.exe";
        entry.targetCommandLine = { "regedit.exe", "/s" };
        entry.elevationKind = Policy::ElevationKind::Confirm;
        entry.elevationMethod = Policy::ElevationMethod::LocalAdmin;
        entry.profileId = 1;
        return entry;
    }

    /// Appends `count` Granted entries for alice one second apart; returns the ids.
    std::vector<int64_t> AppendMany(int count, int64_t startUs = BASE_TIME_US) {
        std::vector<int64_t> ids;
        for (int i = 0; i < count; ++i) {
            const int64_t id = m_log->Append(Entry(startUs + i * 1'000'000LL, m_alice, AuditOutcome::Granted));
            EXPECT_GT(id, 0);
            ids.push_back(id);
        }
        return ids;
    }

    const Policy::User m_alice = MakeUser("alice", "S-1-5-21-1000-1001");
    const Policy::User m_bob = MakeUser("bob", "S-1-5-21-1000-1002");
    std::unique_ptr<AuditLog> m_log;
};

TEST_F(AuditLogTests, AppendAssignsIncreasingIds) {
    const auto ids = AppendMany(3);
    EXPECT_EQ(ids[1], ids[0] + 1);
    EXPECT_EQ(ids[2], ids[1] + 1);
    EXPECT_EQ(m_log->LatestId(), ids[2]);
}

TEST_F(AuditLogTests, EntryFieldsSurviveStorage) {
    auto entry = Entry(BASE_TIME_US, m_alice, AuditOutcome::LaunchFailed);
    entry.errorCode = 740;
    entry.targetSigner = "Contoso CA";
    entry.targetSignatureStatus = Policy::SignatureStatus::NotTrusted;
    entry.ruleId = 9;
    entry.reason = "The requested operation requires elevation";
    const int64_t id = m_log->Append(entry);
    ASSERT_GT(id, 0);

    ServiceError err;
    const auto stored = m_log->GetEntry(id, &err);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->id, id);
    EXPECT_EQ(ToUnixMicros(stored->timestamp), BASE_TIME_US);
    EXPECT_EQ(stored->outcome, AuditOutcome::LaunchFailed);
    EXPECT_FALSE(stored->success);
    EXPECT_EQ(stored->errorCode, 740);
    EXPECT_EQ(stored->user, m_alice);
    EXPECT_EQ(stored->targetCommandLine, entry.targetCommandLine);
    EXPECT_EQ(stored->targetSignatureStatus, Policy::SignatureStatus::NotTrusted);
    EXPECT_EQ(stored->targetSigner, entry.targetSigner);
    EXPECT_EQ(stored->elevationKind, Policy::ElevationKind::Confirm);
    EXPECT_EQ(stored->profileId, 1);
    EXPECT_EQ(stored->ruleId, 9);
    EXPECT_EQ(stored->reason, entry.reason);
}

TEST_F(AuditLogTests, MissingEntryIsNotFound) {
    ServiceError err;
    EXPECT_FALSE(m_log->GetEntry(12345, &err).has_value());
    EXPECT_EQ(err.kind, ErrorKind::NotFound);
}

TEST_F(AuditLogTests, TimestampsNeverGoBackwards) {
    const int64_t first = m_log->Append(Entry(BASE_TIME_US + 5'000'000, m_alice, AuditOutcome::Granted));
    const int64_t second = m_log->Append(Entry(BASE_TIME_US, m_alice, AuditOutcome::Granted));
    ASSERT_GT(second, first);
    EXPECT_EQ(ToUnixMicros(m_log->GetEntry(second)->timestamp), BASE_TIME_US + 5'000'000);
}

TEST_F(AuditLogTests, PagesNewestFirst) {
    const auto ids = AppendMany(25);

    AuditQuery query;
    query.pageSize = 10;
    ServiceError err;
    auto page = m_log->Query(query, &err);
    ASSERT_TRUE(page.has_value());
    EXPECT_EQ(page->totalRecords, 25);
    EXPECT_EQ(page->totalPages, 3);
    EXPECT_EQ(page->snapshotId, ids.back());
    ASSERT_EQ(page->rows.size(), 10u);
    EXPECT_EQ(page->rows.front().id, ids[24]);
    EXPECT_EQ(page->rows.back().id, ids[15]);

    query.pageNumber = 3;
    page = m_log->Query(query, &err);
    ASSERT_TRUE(page.has_value());
    ASSERT_EQ(page->rows.size(), 5u);
    EXPECT_EQ(page->rows.back().id, ids[0]);

    query.pageNumber = 4;
    page = m_log->Query(query, &err);
    ASSERT_TRUE(page.has_value());
    EXPECT_TRUE(page->rows.empty());
}

TEST_F(AuditLogTests, SnapshotKeepsPagesStableWhileAppending) {
    const auto ids = AppendMany(25);

    AuditQuery query;
    query.pageSize = 10;
    auto first = m_log->Query(query);
    ASSERT_TRUE(first.has_value());

    AppendMany(5, BASE_TIME_US + 100'000'000);

    query.pageNumber = 2;
    query.snapshotId = first->snapshotId;
    auto second = m_log->Query(query);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->totalRecords, 25);
    ASSERT_EQ(second->rows.size(), 10u);
    EXPECT_EQ(second->rows.front().id, ids[14]);
    EXPECT_EQ(second->rows.back().id, ids[5]);

    // A fresh query sees the new rows
    query.pageNumber = 1;
    query.snapshotId.reset();
    EXPECT_EQ(m_log->Query(query)->totalRecords, 30);
}

TEST_F(AuditLogTests, AscendingSortAndFilters) {
    AppendMany(3);
    const int64_t bobDenied = m_log->Append(Entry(BASE_TIME_US + 10'000'000, m_bob, AuditOutcome::Denied));
    ASSERT_GT(bobDenied, 0);

    AuditQuery query;
    query.sortDescending = false;
    query.sortColumn = "id";
    auto page = m_log->Query(query);
    ASSERT_TRUE(page.has_value());
    ASSERT_EQ(page->rows.size(), 4u);
    EXPECT_LT(page->rows.front().id, page->rows.back().id);

    query.accountSid = m_bob.accountSid;
    page = m_log->Query(query);
    ASSERT_TRUE(page.has_value());
    ASSERT_EQ(page->rows.size(), 1u);
    EXPECT_EQ(page->rows[0].id, bobDenied);

    query.accountSid.reset();
    query.outcome = AuditOutcome::Granted;
    EXPECT_EQ(m_log->Query(query)->totalRecords, 3);

    query.outcome.reset();
    query.startTime = FromUnixMicros(BASE_TIME_US + 1'000'000);
    query.endTime = FromUnixMicros(BASE_TIME_US + 2'000'000);
    EXPECT_EQ(m_log->Query(query)->totalRecords, 2);
}

TEST_F(AuditLogTests, UnknownSortColumnFallsBackToTimestamp) {
    AppendMany(2);
    AuditQuery query;
    query.sortColumn = "timestamp; DROP TABLE jit_elevation_log";
    auto page = m_log->Query(query);
    ASSERT_TRUE(page.has_value());
    EXPECT_EQ(page->rows.size(), 2u);
    EXPECT_EQ(m_log->LatestId(), page->rows.front().id);
}

TEST_F(AuditLogTests, InvalidQueriesAreRejected) {
    ServiceError err;
    AuditQuery query;
    query.pageNumber = 0;
    EXPECT_FALSE(m_log->Query(query, &err).has_value());
    EXPECT_EQ(err.kind, ErrorKind::InvalidParameter);

    query = AuditQuery{};
    query.pageSize = 0;
    err.Clear();
    EXPECT_FALSE(m_log->Query(query, &err).has_value());
    EXPECT_EQ(err.kind, ErrorKind::InvalidParameter);

    query = AuditQuery{};
    query.startTime = FromUnixMicros(BASE_TIME_US + 1);
    query.endTime = FromUnixMicros(BASE_TIME_US);
    err.Clear();
    EXPECT_FALSE(m_log->Query(query, &err).has_value());
    EXPECT_EQ(err.kind, ErrorKind::InvalidParameter);
}

TEST_F(AuditLogTests, PageSizeIsClampedToMaximum) {
    AuditLog small(Db(), 5);
    ASSERT_TRUE(small.Initialize());
    AppendMany(8);

    AuditQuery query;
    query.pageSize = 100;
    auto page = small.Query(query);
    ASSERT_TRUE(page.has_value());
    EXPECT_EQ(page->rows.size(), 5u);
    EXPECT_EQ(page->totalPages, 2);
}

TEST_F(AuditLogTests, HistorySurvivesRestart) {
    const auto ids = AppendMany(4);

    m_log.reset();
    ASSERT_TRUE(ReopenDatabase());
    m_log = std::make_unique<AuditLog>(Db());
    ASSERT_TRUE(m_log->Initialize());

    EXPECT_EQ(m_log->LatestId(), ids.back());
    const int64_t next = m_log->Append(Entry(BASE_TIME_US, m_alice, AuditOutcome::Granted));
    EXPECT_GT(next, ids.back());
    EXPECT_EQ(ToUnixMicros(m_log->GetEntry(next)->timestamp), BASE_TIME_US + 3'000'000);
}

TEST_F(AuditLogTests, PageSerializesToLogShape) {
    AppendMany(2);
    auto page = m_log->Query(AuditQuery{});
    ASSERT_TRUE(page.has_value());

    const nlohmann::json j = *page;
    EXPECT_EQ(j.at("TotalRecords"), 2);
    EXPECT_EQ(j.at("TotalPages"), 1);
    ASSERT_EQ(j.at("Results").size(), 2u);
    const auto& row = j.at("Results")[0];
    EXPECT_EQ(row.at("Outcome"), "Granted");
    EXPECT_EQ(row.at("ElevationKind"), "Confirm");
    EXPECT_EQ(row.at("User").at("AccountSid"), m_alice.accountSid);
    EXPECT_FALSE(row.contains("RuleId"));
}

TEST_F(AuditLogTests, ConcurrentAppendsKeepIdAndTimeOrder) {
    constexpr int WRITERS = 4;
    constexpr int PER_WRITER = 25;

    // Writers use interleaved, partly backwards timestamps
    std::vector<std::vector<int64_t>> ids(WRITERS);
    std::vector<std::thread> writers;
    for (int w = 0; w < WRITERS; ++w) {
        writers.emplace_back([&, w] {
            const auto user = MakeUser("writer" + std::to_string(w), "S-1-5-21-1000-" + std::to_string(3000 + w));
            for (int i = 0; i < PER_WRITER; ++i) {
                const int64_t ts = BASE_TIME_US + (w % 2 == 0 ? i : PER_WRITER - i) * 1'000'000LL;
                ids[w].push_back(m_log->Append(Entry(ts, user, AuditOutcome::Granted)));
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }

    std::set<int64_t> all;
    for (const auto& perWriter : ids) {
        ASSERT_EQ(perWriter.size(), static_cast<size_t>(PER_WRITER));
        for (size_t i = 0; i < perWriter.size(); ++i) {
            EXPECT_GT(perWriter[i], 0);
            if (i > 0) {
                EXPECT_GT(perWriter[i], perWriter[i - 1]);
            }
            all.insert(perWriter[i]);
        }
    }
    EXPECT_EQ(all.size(), static_cast<size_t>(WRITERS * PER_WRITER));

    AuditQuery query;
    query.sortColumn = "id";
    query.sortDescending = false;
    query.pageSize = WRITERS * PER_WRITER;
    auto page = m_log->Query(query);
    ASSERT_TRUE(page.has_value());
    ASSERT_EQ(page->rows.size(), static_cast<size_t>(WRITERS * PER_WRITER));
    for (size_t i = 1; i < page->rows.size(); ++i) {
        EXPECT_GT(page->rows[i].id, page->rows[i - 1].id);
        EXPECT_GE(page->rows[i].timestamp, page->rows[i - 1].timestamp);
    }
    EXPECT_EQ(page->rows.back().id, *all.rbegin());
}
