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

#include <string.h>
#include <atomic>
#include <string>
#include <sstream>
#include <fstream>
#include <iostream>
#include <iomanip>
#include <mutex>

#include "boost/format.hpp"

#include "msgdefs.h"
#include "src/common/errors/errors.h"
#include "src/common/const/Const.h"

/**
    @page messaging_system Messaging

    # Messaging System

    PkgMig writes output to the console and to a log file. Every output
    to these two locations is regarded as a message even if it is a
    single character. Tracing does not use messages since only values
    of variables are printed out. All messages are consolidated within
    a single file <a href="../messages.cfg">messages.cfg</a> that is
    located in the root of the code tree.

    There are two types of messages:

    - Informational messages do not show up the message identifier.
      Those messages can be used by specifying the INFO() macro. They
      are used for the output of the client commands.
    - Messages that should show up the message identifier. For those
      the MSG() macro should be specified.

    The <a href="../messages.cfg">messages.cfg</a> file has a special
    format:

    - Empty lines are allowed.
    - A '#' character at the beginning of a line indicates a comment.
    - A message starts with a message identifier followed by the message
      surrounded by quotes.
    - If a line starts without a message identifier the message text is
      added to the previous message.

    The message identifier is assembled in the following way:

    @verbatim
    PKGMIG[X|C|E]NNNN[I|E|W]
    @endverbatim

    characters | meaning
    :---:|---
    X | common message used in multiple parts of the code
    C | a client message
    E | a message of the migration engine
    NNNN | a four digit number
    I | an informational message
    E | an error message
    W | a warning

    A line feed is not automatically added.

    The message compiler @ref msgcompiler.cc transforms messages.cfg
    into the header msgdefs.h at the beginning of the build. Formatting
    is performed with the
    <a href="http://www.boost.org/doc/libs/release/libs/format/">Boost Format library</a>.

    For each process there exists a single messaging object
    @ref messageObject. It should not be used directly but through
    the MSG() and INFO() macros.
 */

class Message
{
private:
    std::mutex mtx;
    int fd;
    std::string fileName;
public:
    enum LogType
    {
        STDOUT, LOGFILE
    };
private:
    std::atomic<Message::LogType> logType;

    inline void processParms(boost::format *fmter)
    {
    }
    template<typename T>
    void processParms(boost::format *fmter, T s)
    {
        *fmter % s;
    }
    template<typename T, typename ... Args>
    void processParms(boost::format *fmter, T s, Args ... args)
    {
        *fmter % s;
        processParms(fmter, args ...);
    }

    void writeOut(std::string msgstr);
    void writeLog(std::string msgstr);

    template<typename ... Args>
    std::string format(pkgmig_msg_id msg, char *filename, int linenr,
            Args ... args)

    {
        std::string fmtstr = pkgmig_msgname[msg] + "(%04d): "
                + pkgmig_messages[msg];
        boost::format fmter(fmtstr);
        fmter.exceptions(boost::io::all_error_bits);

        try {
            fmter % linenr;
            processParms(&fmter, args ...);
            return fmter.str();
        } catch (const std::exception& e) {
            std::stringstream err;
            err << pkgmig_messages[PKGMIGX0005E] << " ("
                    << pkgmig_msgname[msg] << ":" << filename << ":"
                    << std::setfill('0') << std::setw(4) << linenr << ")"
                    << std::endl;
            return err.str();
        }
    }

public:
    Message() :
            fd(Const::UNSET), fileName(Const::LOG_FILE), logType(
                    Message::STDOUT)
    {
    }
    ~Message();

    void init(std::string extension = "");

    void setLogType(Message::LogType type)
    {
        logType = type;
    }

    Message::LogType getLogType()
    {
        return logType;
    }

    template<typename ... Args>
    void message(pkgmig_msg_id msg, char *filename, int linenr, Args ... args)
    {
        std::string msgstr = format(msg, filename, linenr, args ...);

        if (logType == Message::STDOUT)
            writeOut(msgstr);
        else
            writeLog(msgstr);
    }

    template<typename ... Args>
    void info(pkgmig_msg_id msg, char *filename, int linenr, Args ... args)
    {
        boost::format fmter(pkgmig_messages[msg]);
        fmter.exceptions(boost::io::all_error_bits);

        try {
            processParms(&fmter, args ...);
            writeOut(fmter.str());
        } catch (const std::exception& e) {
            std::cerr << pkgmig_messages[PKGMIGX0005E] << " (" << filename
                    << ":" << std::setfill('0') << std::setw(4) << linenr
                    << ")" << std::endl;
        }
    }
};

extern Message messageObject;

#define MSG(msg, args ...) messageObject.message(msg, (char *) __FILE__, __LINE__, ##args)
#define INFO(msg, args ...) messageObject.info(msg, (char *) __FILE__, __LINE__, ##args)
