#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <string>

#include "internal/db/sql/sql_queries.hpp"

namespace bidsub::db::sqlite {

using bidsub::db::ErrorCode;
using bidsub::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static std::string ColBlob(sqlite3_stmt* st, int col) {
    const void* data = sqlite3_column_blob(st, col);
    const int   size = sqlite3_column_bytes(st, col);
    return data ? std::string(static_cast<const char*>(data), static_cast<size_t>(size)) : std::string();
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

// Binds every job column except job_id starting at `first`; returns next index.
static int BindJobColumns(sqlite3_stmt* st, int first, const model::JobRecord& r) {
    int i = first;
    BindText(st, i++, r.rfp_id);
    BindText(st, i++, r.portal);
    BindBlob(st, i++, r.bid_document);
    BindI32(st, i++, r.status);
    BindI32(st, i++, r.priority);
    BindU64(st, i++, r.deadline_ms);
    BindU64(st, i++, r.scheduled_time_ms);
    BindI32(st, i++, static_cast<int>(r.attempts));
    BindI32(st, i++, static_cast<int>(r.max_retries));
    BindI32(st, i++, static_cast<int>(r.assembly_failures));
    BindText(st, i++, r.confirmation_number);
    BindU64(st, i++, r.submitted_at_ms);
    BindU64(st, i++, r.confirmed_at_ms);
    BindText(st, i++, r.last_error);
    BindU64(st, i++, r.created_at_ms);
    BindU64(st, i++, r.updated_at_ms);
    BindI32(st, i++, r.deadline_warned ? 1 : 0);
    return i;
}

static model::JobRecord ReadJob(sqlite3_stmt* st) {
    model::JobRecord r;
    r.job_id              = ColText(st, 0);
    r.rfp_id              = ColText(st, 1);
    r.portal              = ColText(st, 2);
    r.bid_document        = ColBlob(st, 3);
    r.status              = ColI32(st, 4);
    r.priority            = ColI32(st, 5);
    r.deadline_ms         = ColU64(st, 6);
    r.scheduled_time_ms   = ColU64(st, 7);
    r.attempts            = static_cast<uint32_t>(ColI32(st, 8));
    r.max_retries         = static_cast<uint32_t>(ColI32(st, 9));
    r.assembly_failures   = static_cast<uint32_t>(ColI32(st, 10));
    r.confirmation_number = ColText(st, 11);
    r.submitted_at_ms     = ColU64(st, 12);
    r.confirmed_at_ms     = ColU64(st, 13);
    r.last_error          = ColText(st, 14);
    r.created_at_ms       = ColU64(st, 15);
    r.updated_at_ms       = ColU64(st, 16);
    r.deadline_warned     = ColI32(st, 17) != 0;
    return r;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result SqliteRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_JOB, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.job_id);
    BindJobColumns(st, 2, r);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if ((rc & 0xFF) == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, "job " + r.job_id);
    return Translate(db, rc);
}

std::optional<model::JobRecord>
SqliteRepository::GetJob(Transaction& t, const std::string& job_id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::SELECT_JOB, -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, job_id);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto record = ReadJob(st);
    sqlite3_finalize(st);
    return record;
}

std::vector<model::JobRecord> SqliteRepository::ListJobs(Transaction& t) {
    auto* db = TX(t).Handle();

    const std::string query = std::string(sql::SELECT_JOB_COLUMNS) + " ORDER BY created_at_ms ASC, job_id ASC;";

    std::vector<model::JobRecord> out;
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, query.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return out;

    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadJob(st));
    }

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPDATE_JOB, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    const int next = BindJobColumns(st, 1, r);
    BindText(st, next, r.job_id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (!result) return result;

    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "job " + r.job_id);
    return Result::Ok();
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result SqliteRepository::AppendAudit(Transaction& t, model::AuditRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::NEXT_AUDIT_SEQUENCE, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.job_id);
    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        auto result = Translate(db, rc);
        sqlite3_finalize(st);
        return result ? Result::Err(ErrorCode::InternalError, "audit sequence query returned no row") : result;
    }
    const uint64_t sequence = ColU64(st, 0);
    sqlite3_finalize(st);

    st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_AUDIT, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.job_id);
    BindU64(st, 2, sequence);
    BindText(st, 3, r.event_type);
    BindI32(st, 4, r.success ? 1 : 0);
    BindText(st, 5, r.details_json);
    if (r.has_error)
        BindText(st, 6, r.error_message);
    else
        sqlite3_bind_null(st, 6);
    BindU64(st, 7, r.timestamp_ms);

    rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (result) r.sequence = sequence;
    return result;
}

std::vector<model::AuditRecord>
SqliteRepository::ListAudit(Transaction& t, const std::string& job_id) {
    auto* db = TX(t).Handle();

    std::vector<model::AuditRecord> out;
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::SELECT_AUDIT, -1, &st, nullptr) != SQLITE_OK)
        return out;

    BindText(st, 1, job_id);

    while (sqlite3_step(st) == SQLITE_ROW) {
        model::AuditRecord r;
        r.job_id       = ColText(st, 0);
        r.sequence     = ColU64(st, 1);
        r.event_type   = ColText(st, 2);
        r.success      = ColI32(st, 3) != 0;
        r.details_json = ColText(st, 4);
        r.has_error    = sqlite3_column_type(st, 5) != SQLITE_NULL;
        r.error_message = ColText(st, 5);
        r.timestamp_ms = ColU64(st, 6);
        out.push_back(std::move(r));
    }

    sqlite3_finalize(st);
    return out;
}

// ------------------------------------------------------------------
// RFPs
// ------------------------------------------------------------------

Result SqliteRepository::UpsertRfp(Transaction& t, const model::RfpRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPSERT_RFP, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.rfp_id);
    BindText(st, 2, r.solicitation_number);
    BindText(st, 3, r.title);
    BindText(st, 4, r.agency);
    BindU64(st, 5, r.response_deadline_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::optional<model::RfpRecord>
SqliteRepository::GetRfp(Transaction& t, const std::string& rfp_id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::SELECT_RFP, -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, rfp_id);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    model::RfpRecord r;
    r.rfp_id               = ColText(st, 0);
    r.solicitation_number  = ColText(st, 1);
    r.title                = ColText(st, 2);
    r.agency               = ColText(st, 3);
    r.response_deadline_ms = ColU64(st, 4);

    sqlite3_finalize(st);
    return r;
}

} // namespace bidsub::db::sqlite
