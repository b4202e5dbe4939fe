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

#include <stdio.h>
#include <time.h>
#include <unistd.h>
#include <string.h>
#include <libgen.h>
#include <sys/types.h>
#include <sys/time.h>
#include <sys/syscall.h>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <atomic>
#include <mutex>

#include "src/common/messages/Message.h"
#include "src/common/exception/PkgMigException.h"
#include "src/common/errors/errors.h"

/** @page tracing Tracing

    Tracing writes the names and values of variables to the trace
    file. The TRACE() macro takes a trace level followed by the
    variables to be printed:

    @verbatim
    TRACE(Trace::normal, runId, identity, attempt);
    @endverbatim

    which results in a line like

    @verbatim
    2026-10-17T10:00:00.000123:[004711:004712]:-------Transfer.cc(0042): runId(3), identity(a/b.tgz), attempt(1)
    @endverbatim

    Trace levels are none, always, error, normal and full. The default
    level is error. Tracing is disabled as long as Trace::init() has not
    been called, which is the case for library users and unit tests.
    The trace file is rotated when it exceeds Const::TRACE_ROTATE_SIZE
    bytes, two older generations are kept.
 */

class Trace
{
private:
    std::mutex mtx;
    int fd;
    std::string fileName;
public:
    enum traceLevel
    {
        none, always, error, normal, full
    };
private:
    std::atomic<Trace::traceLevel> trclevel;

    void processParms(std::stringstream *stream)
    {
        *stream << "";
    }

    template<typename T>
    void processParms(std::stringstream *stream, std::string varlist, T s)
    {
        *stream << varlist.substr(varlist.find_first_not_of(" "),
                varlist.size()) << "(" << s << ")";
    }

    template<typename T, typename ... Args>
    void processParms(std::stringstream *stream, std::string varlist, T s,
            Args ... args)
    {
        std::string name = varlist.substr(0, varlist.find(','));

        *stream << name.substr(name.find_first_not_of(" "), name.size())
                << "(" << s << "), ";
        processParms(stream,
                varlist.substr(varlist.find(',') + 1, varlist.size()),
                args ...);
    }

    void rotate();
    void writeTrace(const std::string& line);
public:
    Trace() :
            fd(Const::UNSET), fileName(Const::TRACE_FILE), trclevel(error)
    {
    }
    ~Trace();

    void init(std::string extension = "");

    void setTrclevel(traceLevel level);
    int getTrclevel();

    template<typename ... Args>
    void trace(const char *filename, int linenr, traceLevel tl,
            std::string varlist, Args ... args)

    {
        struct timeval curtime;
        struct tm tmval;
        std::stringstream stream;
        char curctime[26];

        if (fd == Const::UNSET)
            return;

        if (getTrclevel() > none && tl <= getTrclevel()) {
            gettimeofday(&curtime, NULL);
            localtime_r(&(curtime.tv_sec), &tmval);
            strftime(curctime, sizeof(curctime) - 1, "%Y-%m-%dT%H:%M:%S",
                    &tmval);
            stream << curctime << "." << std::setfill('0') << std::setw(6)
                    << curtime.tv_usec << ":[" << std::setfill('0')
                    << std::setw(6) << getpid() << ":" << std::setfill('0')
                    << std::setw(6) << syscall(SYS_gettid) << "]:"
                    << std::setfill('-') << std::setw(20)
                    << basename((char *) filename) << "(" << std::setfill('0')
                    << std::setw(4) << linenr << "): ";
            processParms(&stream, varlist, args ...);
            stream << std::endl;

            writeTrace(stream.str());
        }
    }
};

extern Trace traceObject;

#define TRACE(tracelevel, args ...) traceObject.trace(__FILE__, __LINE__, tracelevel, #args, args)
