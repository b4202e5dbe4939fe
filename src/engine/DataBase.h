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
#pragma once

class DataBase
{
private:
    sqlite3 *db;
    bool dbNeedsClosed;
    std::string fileName;
public:
    DataBase() :
            db(NULL), dbNeedsClosed(false)
    {
    }
    ~DataBase();
    void open(std::string fileName, bool dbUseMemory);
    void close();
    int lastUpdates();
    long lastInsertId();
    sqlite3 *getDB()
    {
        return db;
    }
};

class SQLStatement
{
private:
    DataBase& db;
    std::string fmtstr;
    sqlite3_stmt *stmt;
    boost::format fmt;
    int stmt_rc;

    std::string encode(std::string s);
    std::string decode(std::string s);
    void getColumn(int *result, int column);
    void getColumn(TransferRecord::state_t *result, int column);
    void getColumn(RunInfo::run_state *result, int column);
    void getColumn(strategy_t *result, int column);
    void getColumn(long *result, int column);
    void getColumn(unsigned long *result, int column);
    void getColumn(std::string *result, int column);

    void eval(int column)
    {
    }

    template<typename T>
    void eval(int column, T s)
    {
        getColumn(s, column);
    }

    template<typename T, typename ... Args>
    void eval(int column, T s, Args ... args)
    {
        getColumn(s, column);
        column++;
        eval(column, args ...);
    }

public:
    SQLStatement(DataBase& _db) :
            db(_db), fmtstr(""), stmt(nullptr), fmt(""), stmt_rc(0)
    {
    }
    SQLStatement(DataBase& _db, std::string _fmtstr) :
            db(_db), fmtstr(_fmtstr), stmt(nullptr), fmt(
                    boost::format(fmtstr)), stmt_rc(0)
    {
    }
    SQLStatement& operator()(std::string _fmtstr);
    ~SQLStatement();

    // convert unsigned to signed since there is no unsigned in SQLite
    SQLStatement& operator<<(unsigned long lu)
    {
        try {
            fmt % static_cast<long>(lu);
        } catch (const std::exception& e) {
            MSG(PKGMIGE0001E, fmtstr);
            THROW(Error::CHECKPOINT_ERROR, e.what(), fmtstr);
        }

        return *this;
    }

    SQLStatement& operator<<(std::string s)
    {
        try {
            fmt % encode(s);
        } catch (const std::exception& e) {
            MSG(PKGMIGE0001E, fmtstr);
            THROW(Error::CHECKPOINT_ERROR, e.what(), fmtstr);
        }

        return *this;
    }

    SQLStatement& operator<<(strategy_t strategy)
    {
        try {
            fmt % static_cast<int>(strategy);
        } catch (const std::exception& e) {
            MSG(PKGMIGE0001E, fmtstr);
            THROW(Error::CHECKPOINT_ERROR, e.what(), fmtstr);
        }

        return *this;
    }

    template<typename T>
    SQLStatement& operator<<(T s)
    {
        try {
            fmt % (s);
        } catch (const std::exception& e) {
            MSG(PKGMIGE0001E, fmtstr);
            THROW(Error::CHECKPOINT_ERROR, e.what(), fmtstr);
        }

        return *this;
    }

    std::string str();
    void bind(int num, int value);
    void bind(int num, long value);
    void bind(int num, std::string value);
    void prepare();
    void reset();

    template<typename ... Args>
    bool step(Args ... args)
    {
        int column = 0;

        stmt_rc = sqlite3_step(stmt);

        if (stmt_rc != SQLITE_ROW)
            return false;

        eval(column, args ...);

        return true;
    }

    void finalize();
    void doall();
};
