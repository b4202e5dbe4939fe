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
#include <stdio.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>
#include <errno.h>
#include <time.h>

#include <string>
#include <sstream>
#include <iomanip>
#include <iostream>
#include <vector>
#include <exception>

#include "src/common/errors/errors.h"
#include "src/common/exception/PkgMigException.h"
#include "src/common/messages/Message.h"
#include "src/common/tracing/Trace.h"
#include "src/common/const/Const.h"

#include "util.h"

void mkTmpDir()

{
    struct stat statbuf;

    if (stat(Const::PKGMIG_TMP_DIR.c_str(), &statbuf) != 0) {
        if (mkdir(Const::PKGMIG_TMP_DIR.c_str(), 0700) != 0) {
            std::cerr << boost::format(pkgmig_messages[PKGMIGX0006E])
                    % Const::PKGMIG_TMP_DIR;
            THROW(Error::GENERAL_ERROR, Const::PKGMIG_TMP_DIR, errno);
        }
    } else if (!S_ISDIR(statbuf.st_mode)) {
        std::cerr << boost::format(pkgmig_messages[PKGMIGX0007E])
                % Const::PKGMIG_TMP_DIR;
        THROW(Error::GENERAL_ERROR, Const::PKGMIG_TMP_DIR);
    }
}

//! [init]
void PKGMIG::init(std::string ident)

{
    mkTmpDir();
    messageObject.init(ident);
    traceObject.init(ident);
}
//! [init]

std::string PKGMIG::timeStr(time_t t)

{
    struct tm tmval;
    char buf[32];

    if (t == 0)
        return "-";

    localtime_r(&t, &tmval);
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tmval);

    return std::string(buf);
}

std::string PKGMIG::sizeStr(unsigned long size)

{
    std::stringstream ss;
    const char *units[] = { "B", "KiB", "MiB", "GiB", "TiB" };
    double value = size;
    int i = 0;

    while (value >= 1024 && i < 4) {
        value /= 1024;
        i++;
    }

    if (i == 0)
        ss << size << units[0];
    else
        ss << std::fixed << std::setprecision(1) << value << units[i];

    return ss.str();
}

std::string PKGMIG::trim(const std::string& s)

{
    size_t first = s.find_first_not_of(" \t\r\n");

    if (first == std::string::npos)
        return "";

    return s.substr(first, s.find_last_not_of(" \t\r\n") - first + 1);
}

std::vector<std::string> PKGMIG::split(const std::string& s, char delim)

{
    std::vector<std::string> tokens;
    std::istringstream stream(s);
    std::string token;

    while (std::getline(stream, token, delim))
        tokens.push_back(trim(token));

    return tokens;
}
