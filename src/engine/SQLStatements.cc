/*******************************************************************************
 * Copyright 2018 IBM Corp. All Rights Reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *  https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 *******************************************************************************/
#include "EngineIncludes.h"

/** @page sqlite SQLite tables

    # SQLite tables

    The checkpoint store keeps three tables. The database either is a
    file (default: /var/run/pkgmig/PKGMIG.db) that can be shared by
    several processes or it is kept in memory.

    ## RUNS

    column | data type | details
    ---|---|---
    RUN_ID | INTEGER | run id, incremented for each new run
    PRIOR_RUN_ID | INT | run whose committed artifacts are skipped, -1 if none
    STRATEGY | INT | selected strategy: see strategy_t
    STATE | INT | run state: see RunInfo::run_state
    START_TIME | BIGINT | start time in seconds since epoch
    END_TIME | BIGINT | end time, 0 if not finished
    TOTAL | BIGINT | number of artifacts of the listing snapshot
    PID | INT | process id of the owning process
    COMMITTED | BIGINT | number of committed artifacts
    FAILED_RETRYABLE | BIGINT | number of artifacts exhausting their retries
    FAILED_FATAL | BIGINT | number of fatally failed artifacts
    SKIPPED | BIGINT | number of artifacts committed before
    CONFLICTS | BIGINT | number of lost conditional writes
    BYTES | BIGINT | number of transferred bytes
    REASON | VARCHAR | reason of a systemic failure

    ## ARTIFACTS

    The listing snapshot of a run. Resuming a run uses this snapshot
    instead of listing the source again.

    column | data type | details
    ---|---|---
    RUN_ID | INT | run id
    SEQ | INT | position within the listing
    IDENTITY | VARCHAR | identity of the artifact
    SIZE | BIGINT | declared size
    CHECKSUM | VARCHAR | declared checksum, may be empty
    CONTENT_TYPE | VARCHAR | content type

    ## TRANSFER_RECORDS

    column | data type | details
    ---|---|---
    RUN_ID | INT | run id
    IDENTITY | VARCHAR | identity of the artifact
    STATE | INT | see TransferRecord::state_t
    LAST_ATTEMPT | BIGINT | time of the last attempt
    ATTEMPTS | INT | number of attempts
    ERROR_CLASS | VARCHAR | class of the last error
    ERROR_DETAIL | VARCHAR | detail of the last error
    CHECKSUM | VARCHAR | computed checksum
    BYTES | BIGINT | number of transferred bytes
 */

/* ======== SQLiteCheckpointStore ======== */

const std::string SQLiteCheckpointStore::CREATE_RUNS =
        "CREATE TABLE IF NOT EXISTS RUNS("
                " RUN_ID INTEGER PRIMARY KEY AUTOINCREMENT,"
                " PRIOR_RUN_ID INT NOT NULL,"
                " STRATEGY INT NOT NULL,"
                " STATE INT NOT NULL,"
                " START_TIME BIGINT NOT NULL,"
                " END_TIME BIGINT NOT NULL,"
                " TOTAL BIGINT NOT NULL,"
                " PID INT NOT NULL,"
                " COMMITTED BIGINT NOT NULL,"
                " FAILED_RETRYABLE BIGINT NOT NULL,"
                " FAILED_FATAL BIGINT NOT NULL,"
                " SKIPPED BIGINT NOT NULL,"
                " CONFLICTS BIGINT NOT NULL,"
                " BYTES BIGINT NOT NULL,"
                " REASON VARCHAR)";

const std::string SQLiteCheckpointStore::CREATE_ARTIFACTS =
        "CREATE TABLE IF NOT EXISTS ARTIFACTS("
                " RUN_ID INT NOT NULL,"
                " SEQ INT NOT NULL,"
                " IDENTITY VARCHAR NOT NULL,"
                " SIZE BIGINT NOT NULL,"
                " CHECKSUM VARCHAR,"
                " CONTENT_TYPE VARCHAR,"
                " CONSTRAINT ARTIFACTS_UNIQUE UNIQUE (RUN_ID, IDENTITY))";

const std::string SQLiteCheckpointStore::CREATE_TRANSFER_RECORDS =
        "CREATE TABLE IF NOT EXISTS TRANSFER_RECORDS("
                " RUN_ID INT NOT NULL,"
                " IDENTITY VARCHAR NOT NULL,"
                " STATE INT NOT NULL,"
                " LAST_ATTEMPT BIGINT NOT NULL,"
                " ATTEMPTS INT NOT NULL,"
                " ERROR_CLASS VARCHAR,"
                " ERROR_DETAIL VARCHAR,"
                " CHECKSUM VARCHAR,"
                " BYTES BIGINT NOT NULL,"
                " CONSTRAINT TRANSFER_RECORDS_UNIQUE UNIQUE (RUN_ID, IDENTITY))";

const std::string SQLiteCheckpointStore::CREATE_RECORDS_STATE_INDEX =
        "CREATE INDEX IF NOT EXISTS TRANSFER_RECORDS_STATE"
                " ON TRANSFER_RECORDS (RUN_ID, STATE)";

const std::string SQLiteCheckpointStore::TRANSACTION_BEGIN =
        "BEGIN IMMEDIATE TRANSACTION";

const std::string SQLiteCheckpointStore::TRANSACTION_COMMIT = "COMMIT";

const std::string SQLiteCheckpointStore::TRANSACTION_ROLLBACK = "ROLLBACK";

const std::string SQLiteCheckpointStore::ADD_RUN =
        "INSERT INTO RUNS (PRIOR_RUN_ID, STRATEGY, STATE, START_TIME, END_TIME,"
                " TOTAL, PID, COMMITTED, FAILED_RETRYABLE, FAILED_FATAL, SKIPPED,"
                " CONFLICTS, BYTES, REASON)"
                " VALUES (" /* PRIOR_RUN_ID */"%1%, " /* STRATEGY */"%2%, "
                /* STATE */"%3%, " /* START_TIME */"%4%, " /* END_TIME */"%5%, "
                /* TOTAL */"%6%, " /* PID */"%7%, " /* COMMITTED */"%8%, "
                /* FAILED_RETRYABLE */"%9%, " /* FAILED_FATAL */"%10%, "
                /* SKIPPED */"%11%, " /* CONFLICTS */"%12%, " /* BYTES */"%13%, "
                /* REASON */"'%14%')";

const std::string SQLiteCheckpointStore::UPDATE_RUN =
        "UPDATE RUNS SET PRIOR_RUN_ID=%1%, STRATEGY=%2%, STATE=%3%,"
                " START_TIME=%4%, END_TIME=%5%, TOTAL=%6%, PID=%7%,"
                " COMMITTED=%8%, FAILED_RETRYABLE=%9%, FAILED_FATAL=%10%,"
                " SKIPPED=%11%, CONFLICTS=%12%, BYTES=%13%, REASON='%14%'"
                " WHERE RUN_ID=%15%";

const std::string SQLiteCheckpointStore::SELECT_RUN =
        "SELECT RUN_ID, PRIOR_RUN_ID, STRATEGY, STATE, START_TIME, END_TIME,"
                " TOTAL, PID, COMMITTED, FAILED_RETRYABLE, FAILED_FATAL, SKIPPED,"
                " CONFLICTS, BYTES, REASON FROM RUNS WHERE RUN_ID=%1%";

const std::string SQLiteCheckpointStore::SELECT_RUNS =
        "SELECT RUN_ID, PRIOR_RUN_ID, STRATEGY, STATE, START_TIME, END_TIME,"
                " TOTAL, PID, COMMITTED, FAILED_RETRYABLE, FAILED_FATAL, SKIPPED,"
                " CONFLICTS, BYTES, REASON FROM RUNS ORDER BY RUN_ID ASC";

const std::string SQLiteCheckpointStore::DELETE_LISTING =
        "DELETE FROM ARTIFACTS WHERE RUN_ID=%1%";

const std::string SQLiteCheckpointStore::ADD_ARTIFACT =
        "INSERT INTO ARTIFACTS (RUN_ID, SEQ, IDENTITY, SIZE, CHECKSUM, CONTENT_TYPE)"
                " VALUES (" /* RUN_ID */"%1%, " /* SEQ */"?, " /* IDENTITY */"?, "
                /* SIZE */"?, " /* CHECKSUM */"?, " /* CONTENT_TYPE */"?)";

const std::string SQLiteCheckpointStore::SELECT_LISTING =
        "SELECT IDENTITY, SIZE, CHECKSUM, CONTENT_TYPE FROM ARTIFACTS"
                " WHERE RUN_ID=%1% ORDER BY SEQ ASC";

const std::string SQLiteCheckpointStore::SELECT_RECORD =
        "SELECT STATE, LAST_ATTEMPT, ATTEMPTS, ERROR_CLASS, ERROR_DETAIL,"
                " CHECKSUM, BYTES FROM TRANSFER_RECORDS"
                " WHERE RUN_ID=%1%"
                " AND IDENTITY='%2%'";

const std::string SQLiteCheckpointStore::INSERT_RECORD =
        "INSERT OR IGNORE INTO TRANSFER_RECORDS (RUN_ID, IDENTITY, STATE,"
                " LAST_ATTEMPT, ATTEMPTS, ERROR_CLASS, ERROR_DETAIL, CHECKSUM, BYTES)"
                " VALUES (" /* RUN_ID */"%1%, " /* IDENTITY */"'%2%', "
                /* STATE */"%3%, " /* LAST_ATTEMPT */"%4%, " /* ATTEMPTS */"%5%, "
                /* ERROR_CLASS */"'%6%', " /* ERROR_DETAIL */"'%7%', "
                /* CHECKSUM */"'%8%', " /* BYTES */"%9%)";

const std::string SQLiteCheckpointStore::UPDATE_RECORD =
        "UPDATE TRANSFER_RECORDS SET STATE=%1%, LAST_ATTEMPT=%2%, ATTEMPTS=%3%,"
                " ERROR_CLASS='%4%', ERROR_DETAIL='%5%', CHECKSUM='%6%', BYTES=%7%"
                " WHERE RUN_ID=%8%"
                " AND IDENTITY='%9%'"
                " AND STATE=%10%";

const std::string SQLiteCheckpointStore::SELECT_IDENTITIES =
        "SELECT IDENTITY FROM TRANSFER_RECORDS"
                " WHERE RUN_ID=%1%"
                " AND STATE=%2%";

const std::string SQLiteCheckpointStore::SELECT_RECORDS =
        "SELECT IDENTITY, STATE, LAST_ATTEMPT, ATTEMPTS, ERROR_CLASS,"
                " ERROR_DETAIL, CHECKSUM, BYTES FROM TRANSFER_RECORDS"
                " WHERE RUN_ID=%1%";

const std::string SQLiteCheckpointStore::REQUEUE_RECORDS =
        "UPDATE TRANSFER_RECORDS SET STATE=%1%"
                " WHERE RUN_ID=%2%"
                " AND (STATE=%3% OR STATE=%4%)";
