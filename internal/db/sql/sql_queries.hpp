#pragma once

namespace bidsub::db::sql {

/*
  Canonical SQL used by the sqlite backend.

  Column order in the SELECTs matches the Col* reads in
  sqlite_repository.cpp; keep them in sync.
*/

static constexpr const char* CREATE_SUBMISSION_JOBS =
    "CREATE TABLE IF NOT EXISTS submission_jobs ("
    " job_id TEXT PRIMARY KEY,"
    " rfp_id TEXT NOT NULL,"
    " portal TEXT NOT NULL,"
    " bid_document BLOB NOT NULL,"
    " status INTEGER NOT NULL,"
    " priority INTEGER NOT NULL,"
    " deadline_ms INTEGER NOT NULL,"
    " scheduled_time_ms INTEGER NOT NULL DEFAULT 0,"
    " attempts INTEGER NOT NULL DEFAULT 0,"
    " max_retries INTEGER NOT NULL,"
    " assembly_failures INTEGER NOT NULL DEFAULT 0,"
    " confirmation_number TEXT,"
    " submitted_at_ms INTEGER NOT NULL DEFAULT 0,"
    " confirmed_at_ms INTEGER NOT NULL DEFAULT 0,"
    " last_error TEXT,"
    " created_at_ms INTEGER NOT NULL,"
    " updated_at_ms INTEGER NOT NULL,"
    " deadline_warned INTEGER NOT NULL DEFAULT 0);";

static constexpr const char* CREATE_SUBMISSION_AUDIT_LOG =
    "CREATE TABLE IF NOT EXISTS submission_audit_log ("
    " job_id TEXT NOT NULL,"
    " sequence INTEGER NOT NULL,"
    " event_type TEXT NOT NULL,"
    " success INTEGER NOT NULL,"
    " details TEXT NOT NULL,"
    " error_message TEXT,"
    " timestamp_ms INTEGER NOT NULL,"
    " PRIMARY KEY (job_id, sequence));";

static constexpr const char* CREATE_RFP_OPPORTUNITIES =
    "CREATE TABLE IF NOT EXISTS rfp_opportunities ("
    " rfp_id TEXT PRIMARY KEY,"
    " solicitation_number TEXT,"
    " title TEXT,"
    " agency TEXT,"
    " response_deadline_ms INTEGER NOT NULL);";

// jobs

static constexpr const char* INSERT_JOB =
    "INSERT INTO submission_jobs(job_id,rfp_id,portal,bid_document,status,priority,deadline_ms,"
    "scheduled_time_ms,attempts,max_retries,assembly_failures,confirmation_number,submitted_at_ms,"
    "confirmed_at_ms,last_error,created_at_ms,updated_at_ms,deadline_warned)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_JOB_COLUMNS =
    "SELECT job_id,rfp_id,portal,bid_document,status,priority,deadline_ms,scheduled_time_ms,"
    "attempts,max_retries,assembly_failures,confirmation_number,submitted_at_ms,confirmed_at_ms,"
    "last_error,created_at_ms,updated_at_ms,deadline_warned FROM submission_jobs";

static constexpr const char* SELECT_JOB =
    "SELECT job_id,rfp_id,portal,bid_document,status,priority,deadline_ms,scheduled_time_ms,"
    "attempts,max_retries,assembly_failures,confirmation_number,submitted_at_ms,confirmed_at_ms,"
    "last_error,created_at_ms,updated_at_ms,deadline_warned FROM submission_jobs WHERE job_id=?;";

static constexpr const char* UPDATE_JOB =
    "UPDATE submission_jobs SET rfp_id=?,portal=?,bid_document=?,status=?,priority=?,deadline_ms=?,"
    "scheduled_time_ms=?,attempts=?,max_retries=?,assembly_failures=?,confirmation_number=?,"
    "submitted_at_ms=?,confirmed_at_ms=?,last_error=?,created_at_ms=?,updated_at_ms=?,deadline_warned=?"
    " WHERE job_id=?;";

// audit

static constexpr const char* NEXT_AUDIT_SEQUENCE =
    "SELECT COALESCE(MAX(sequence),0)+1 FROM submission_audit_log WHERE job_id=?;";

static constexpr const char* INSERT_AUDIT =
    "INSERT INTO submission_audit_log(job_id,sequence,event_type,success,details,error_message,timestamp_ms)"
    " VALUES(?,?,?,?,?,?,?);";

static constexpr const char* SELECT_AUDIT =
    "SELECT job_id,sequence,event_type,success,details,error_message,timestamp_ms"
    " FROM submission_audit_log WHERE job_id=? ORDER BY sequence ASC;";

// rfps

static constexpr const char* UPSERT_RFP =
    "INSERT INTO rfp_opportunities(rfp_id,solicitation_number,title,agency,response_deadline_ms)"
    " VALUES(?,?,?,?,?)"
    " ON CONFLICT(rfp_id) DO UPDATE SET"
    " solicitation_number=excluded.solicitation_number,"
    " title=excluded.title,"
    " agency=excluded.agency,"
    " response_deadline_ms=excluded.response_deadline_ms;";

static constexpr const char* SELECT_RFP =
    "SELECT rfp_id,solicitation_number,title,agency,response_deadline_ms"
    " FROM rfp_opportunities WHERE rfp_id=?;";

}
