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

DataBase::~DataBase()

{
    close();
}

void DataBase::close()

{
    if (dbNeedsClosed)
        sqlite3_close_v2(db);

    db = NULL;
    dbNeedsClosed = false;
}

void DataBase::open(std::string _fileName, bool dbUseMemory)

{
    int rc;
    std::string uri;

    if (dbUseMemory) {
        fileName = "";
        uri = "file::memory:";
    } else {
        fileName = _fileName;
        uri = std::string("file:") + fileName;
    }

    rc = sqlite3_open_v2(uri.c_str(), &db, SQLITE_OPEN_READWRITE |
    SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_URI, NULL);

    if (rc != SQLITE_OK) {
        TRACE(Trace::error, rc, uri);
        MSG(PKGMIGE0002E, uri, rc);
        if (db != NULL)
            sqlite3_close_v2(db);
        db = NULL;
        errno = rc;
        THROW(Error::CHECKPOINT_ERROR, uri, rc);
    }

    dbNeedsClosed = true;

    rc = sqlite3_extended_result_codes(db, 1);

    if (rc != SQLITE_OK) {
        TRACE(Trace::error, rc);
        errno = rc;
        THROW(Error::CHECKPOINT_ERROR, rc);
    }

    rc = sqlite3_busy_timeout(db, Const::DB_BUSY_TIMEOUT_MS);

    if (rc != SQLITE_OK) {
        TRACE(Trace::error, rc);
        errno = rc;
        THROW(Error::CHECKPOINT_ERROR, rc);
    }

    TRACE(Trace::normal, uri);
}

int DataBase::lastUpdates()

{
    return sqlite3_changes(db);
}

long DataBase::lastInsertId()

{
    return sqlite3_last_insert_rowid(db);
}

SQLStatement::~SQLStatement()

{
    if (stmt != nullptr)
        sqlite3_finalize(stmt);
}

SQLStatement& SQLStatement::operator()(std::string _fmtstr)

{
    fmtstr = _fmtstr;

    if (stmt != nullptr) {
        sqlite3_finalize(stmt);
        stmt = nullptr;
    }

    try {
        fmt = boost::format(fmtstr);
    } catch (const std::exception& e) {
        MSG(PKGMIGE0001E, fmtstr);
        THROW(Error::CHECKPOINT_ERROR, e.what(), fmtstr);
    }

    return *this;
}

void SQLStatement::prepare()

{
    int rc;
    std::string sql = str();

    if (stmt != nullptr) {
        sqlite3_finalize(stmt);
        stmt = nullptr;
    }

    stmt_rc = 0;

    rc = sqlite3_prepare_v2(db.getDB(), sql.c_str(), -1, &stmt, NULL);

    if (rc != SQLITE_OK) {
        TRACE(Trace::error, sql, rc);
        stmt = nullptr;
        errno = rc;
        THROW(Error::CHECKPOINT_ERROR, rc, sqlite3_errstr(rc));
    }
}

std::string SQLStatement::encode(std::string s)

{
    std::string enc;

    for (char c : s) {
        switch (c) {
            case 0047:
                enc += "\\0047";
                break;
            case 0134:
                enc += "\\0134";
                break;
            default:
                enc += c;
        }
    }

    return enc;
}

std::string SQLStatement::decode(std::string s)

{
    unsigned long pos = s.size();

    while (pos > 0 && (pos = s.rfind("\\", pos - 1)) != std::string::npos) {
        if (s.compare(pos, 5, "\\0047") == 0) {
            s.replace(pos, 5, std::string(1, 0047));
        } else if (s.compare(pos, 5, "\\0134") == 0) {
            s.replace(pos, 5, std::string(1, 0134));
        } else {
            THROW(Error::CHECKPOINT_ERROR, s);
        }
    }

    return s;
}

void SQLStatement::getColumn(int *result, int column)

{
    *result = sqlite3_column_int(stmt, column);
}

void SQLStatement::getColumn(TransferRecord::state_t *result, int column)

{
    *result = static_cast<TransferRecord::state_t>(sqlite3_column_int(stmt,
            column));
}

void SQLStatement::getColumn(RunInfo::run_state *result, int column)

{
    *result = static_cast<RunInfo::run_state>(sqlite3_column_int(stmt, column));
}

void SQLStatement::getColumn(strategy_t *result, int column)

{
    *result = static_cast<strategy_t>(sqlite3_column_int(stmt, column));
}

void SQLStatement::getColumn(long *result, int column)

{
    *result = sqlite3_column_int64(stmt, column);
}

void SQLStatement::getColumn(unsigned long *result, int column)

{
    *result = static_cast<unsigned long>(sqlite3_column_int64(stmt, column));
}

void SQLStatement::getColumn(std::string *result, int column)

{
    const char *column_ctr = reinterpret_cast<const char*>(sqlite3_column_text(
            stmt, column));
    if (column_ctr != NULL)
        *result = decode(std::string(column_ctr));
    else
        *result = "";
}

std::string SQLStatement::str()

{
    std::string str;

    try {
        str = fmt.str();
    } catch (const std::exception& e) {
        MSG(PKGMIGE0001E, fmtstr);
        THROW(Error::CHECKPOINT_ERROR, e.what(), fmtstr);
    }

    return str;
}

void SQLStatement::bind(int num, int value)

{
    int rc;

    if ((rc = sqlite3_bind_int(stmt, num, value)) != SQLITE_OK) {
        TRACE(Trace::error, rc);
        errno = rc;
        THROW(Error::CHECKPOINT_ERROR, rc);
    }
}

void SQLStatement::bind(int num, long value)

{
    int rc;

    if ((rc = sqlite3_bind_int64(stmt, num, value)) != SQLITE_OK) {
        TRACE(Trace::error, rc);
        errno = rc;
        THROW(Error::CHECKPOINT_ERROR, rc);
    }
}

void SQLStatement::bind(int num, std::string value)

{
    int rc;
    std::string enc = encode(value);

    if ((rc = sqlite3_bind_text(stmt, num, enc.c_str(), enc.size(),
    SQLITE_TRANSIENT)) != SQLITE_OK) {
        TRACE(Trace::error, rc);
        errno = rc;
        THROW(Error::CHECKPOINT_ERROR, rc);
    }
}

void SQLStatement::reset()

{
    int rc;

    if (stmt_rc != SQLITE_ROW && stmt_rc != SQLITE_DONE) {
        TRACE(Trace::error, fmt.str(), stmt_rc);
        errno = stmt_rc;
        THROW(Error::CHECKPOINT_ERROR, stmt_rc, sqlite3_errstr(stmt_rc));
    }

    if ((rc = sqlite3_reset(stmt)) != SQLITE_OK
            || (rc = sqlite3_clear_bindings(stmt)) != SQLITE_OK) {
        TRACE(Trace::error, rc);
        errno = rc;
        THROW(Error::CHECKPOINT_ERROR, rc, sqlite3_errstr(rc));
    }

    stmt_rc = SQLITE_DONE;
}

void SQLStatement::finalize()

{
    int rc;

    // SQLITE_OK: prepared but never stepped
    if (stmt_rc != SQLITE_OK && stmt_rc != SQLITE_ROW
            && stmt_rc != SQLITE_DONE) {
        TRACE(Trace::error, fmt.str(), stmt_rc);
        sqlite3_finalize(stmt);
        stmt = nullptr;
        errno = stmt_rc;
        THROW(Error::CHECKPOINT_ERROR, stmt_rc, sqlite3_errstr(stmt_rc));
    }

    rc = sqlite3_finalize(stmt);
    stmt = nullptr;

    if (rc != SQLITE_OK) {
        TRACE(Trace::error, fmt.str(), rc);
        errno = rc;
        THROW(Error::CHECKPOINT_ERROR, rc, sqlite3_errstr(rc));
    }
}

void SQLStatement::doall()

{
    prepare();
    step();
    finalize();
}
