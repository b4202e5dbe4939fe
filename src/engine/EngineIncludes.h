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

#include <unistd.h>
#include <errno.h>
#include <time.h>
#include <signal.h>
#include <pthread.h>
#include <sys/types.h>

#include <string>
#include <sstream>
#include <iomanip>
#include <vector>
#include <deque>
#include <map>
#include <set>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <chrono>
#include <functional>
#include <random>
#include <algorithm>
#include <exception>
#include <cmath>
#include <cctype>

#include <sqlite3.h>
#include <openssl/evp.h>
#include "boost/format.hpp"

#include "src/common/const/Const.h"
#include "src/common/errors/errors.h"
#include "src/common/exception/PkgMigException.h"
#include "src/common/messages/Message.h"
#include "src/common/tracing/Trace.h"
#include "src/common/util/util.h"
#include "src/common/configuration/Configuration.h"

#include "src/engine/Artifact.h"
#include "src/engine/Collaborators.h"
#include "src/engine/TransferRecord.h"
#include "src/engine/Run.h"
#include "src/engine/ObservabilitySink.h"
#include "src/engine/CheckpointStore.h"
#include "src/engine/DataBase.h"
#include "src/engine/SQLiteCheckpointStore.h"
#include "src/engine/Cancellation.h"
#include "src/engine/RateLimiter.h"
#include "src/engine/Validator.h"
#include "src/engine/RetryClassifier.h"
#include "src/engine/Strategy.h"
#include "src/engine/Partitioner.h"
#include "src/engine/ThreadPool.h"
#include "src/engine/Transfer.h"
#include "src/engine/Status.h"
#include "src/engine/WorkerPool.h"
#include "src/engine/MigrationController.h"
