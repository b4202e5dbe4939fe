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

/** @page collaborators Source and target stores

    The migration engine accesses the remote object stores through the
    SourceStore and TargetStore interfaces. Implementations report
    failures by throwing a PkgMigException with one of the following
    Error codes:

    Error | meaning | classification
    ---|---|---
    REMOTE_NETWORK | connection or transport problem | retryable
    REMOTE_THROTTLED | throttled by the remote side (HTTP 429) | retryable
    REMOTE_SERVER_ERROR | server side failure (HTTP 5xx) | retryable
    REMOTE_TIMEOUT | the request timed out | retryable
    REMOTE_AUTHORIZATION | credentials rejected | fatal, halts the run
    REMOTE_MALFORMED_REQUEST | the request has been rejected | fatal
    REMOTE_NOT_FOUND | the artifact does not exist | fatal

    Any other exception is regarded as an unknown remote error and is
    retried.

    Content is passed as a stream of chunks: SourceStore::read() returns
    a ContentReader and TargetStore::write() consumes one. This way the
    memory required by a transfer does not depend on the size of the
    artifact. An exception thrown by ContentReader::read() while the
    target consumes the content aborts the write. The target must not
    store a partially received artifact in that case and passes the
    exception on.
 */

class ContentReader
{
public:
    virtual ~ContentReader()
    {
    }
    // returns 0 at the end of the content
    virtual size_t read(char *buffer, size_t count) = 0;
};

class StringReader: public ContentReader
{
private:
    std::string content;
    size_t pos;
public:
    StringReader(std::string content_) :
            content(content_), pos(0)
    {
    }
    size_t read(char *buffer, size_t count)
    {
        size_t num = content.copy(buffer, count, pos);

        pos += num;

        return num;
    }
};

struct SourceObject
{
    std::unique_ptr<ContentReader> content;
    std::string checksum;
    unsigned long size = 0;
    std::string contentType;
    std::map<std::string, std::string> metadata;
};

struct WriteConfirmation
{
    std::string checksum;
    unsigned long size = 0;
};

class SourceStore
{
public:
    virtual ~SourceStore()
    {
    }
    virtual std::vector<Artifact> list() = 0;
    virtual SourceObject read(std::string identity) = 0;
};

class TargetStore
{
public:
    virtual ~TargetStore()
    {
    }
    virtual WriteConfirmation write(std::string identity,
            ContentReader& content, std::string contentType,
            const std::map<std::string, std::string>& metadata) = 0;
};
