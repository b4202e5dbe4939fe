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

#include <string>

namespace Const {
const int UNSET = -1;
const std::string CLIENT_COMMAND = "pkgmig";
const int OUTPUT_LINE_SIZE = 1024;
const std::string PKGMIG_TMP_DIR = "/var/run/pkgmig";
const std::string DELIM = "/";
const std::string TRACE_FILE = PKGMIG_TMP_DIR + DELIM + "PKGMIG.trc";
const std::string LOG_FILE = PKGMIG_TMP_DIR + DELIM + "PKGMIG.log";
const std::string DB_FILE = PKGMIG_TMP_DIR + DELIM + "PKGMIG.db";
const std::string CONFIG_FILE = "/etc/pkgmig.conf";
const long TRACE_ROTATE_SIZE = 100 * 1024 * 1024;
const int DB_BUSY_TIMEOUT_MS = 10000;
const int READ_BUFFER_SIZE = 512 * 1024;
const int PROGRESS_INTERVAL = 10;
const std::string SOURCE_BUCKET = "source";
const std::string TARGET_BUCKET = "target";
const std::string CHECKSUM_SUFFIX = ".sha256";
const std::string TMP_FILE_SUFFIX = ".pkgmig.tmp";
const unsigned long SMALL_SCALE_LIMIT = 100UL * 1024 * 1024;
const unsigned long MEDIUM_SCALE_LIMIT = 100UL * 1024 * 1024 * 1024;
const int DEFAULT_MAX_RETRIES = 5;
const long DEFAULT_BACKOFF_BASE_MS = 200;
const double DEFAULT_BACKOFF_FACTOR = 2.0;
const long DEFAULT_BACKOFF_CAP_MS = 60000;
const long DEFAULT_ACQUIRE_TIMEOUT_MS = 30000;
const int DEFAULT_SYSTEMIC_FAILURE_THRESHOLD = 20;
const int LISTING_RETRY = 3;
const int COMMAND_PARTIALLY_FAILED = 1;
const int COMMAND_FAILED = 2;
}
