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

/** @page fs_connector File system connector

    The file system connector implements the SourceStore and
    TargetStore interfaces for directory trees. This way artifacts can
    be migrated between two mounted object stores or file systems.

    - The identity of an artifact is its path relative to the root
      directory. Identities must not be absolute and must not contain
      ".." components.
    - The listing is sorted lexically and thereby deterministic.
    - A file <artifact>.sha256 beside an artifact contains its
      declared checksum. Such a file is not listed if <artifact>
      exists. A .sha256 file without a companion is an artifact.
    - Files ending with .pkgmig.tmp are left over by an interrupted
      write. They are not listed but reported by a warning and
      returned by FsSourceStore::getSkipped().
    - The content type is derived from the file name extension.
    - Content is read and written in chunks of Const::READ_BUFFER_SIZE.
    - The target writes an artifact to a temporary file that is synced
      and renamed afterwards. The confirmed checksum is computed by
      reading back the renamed file. If the content stream fails the
      temporary file is removed and the former artifact stays intact.

    Errors are mapped to the Error codes expected by the migration
    engine:

    errno | Error
    ---|---
    ENOENT, ENOTDIR | REMOTE_NOT_FOUND
    EACCES, EPERM, EROFS | REMOTE_AUTHORIZATION
    ENAMETOOLONG, EISDIR, EINVAL | REMOTE_MALFORMED_REQUEST
    other | REMOTE_NETWORK
 */

class FsStore
{
protected:
    std::string root;

    std::string path(std::string identity);
public:
    FsStore(std::string root_) :
            root(root_)
    {
    }
    static Error mapErrno(int err);
    static void checkIdentity(std::string identity);
    static std::string contentType(std::string identity);
    static std::string digestFile(std::string fileName, unsigned long *size);
};

class FsReader: public ContentReader
{
private:
    std::string fileName;
    int fd;
    unsigned long size;
public:
    FsReader(std::string fileName_);
    ~FsReader();
    size_t read(char *buffer, size_t count);
    unsigned long getSize()
    {
        return size;
    }
};

class FsSourceStore: public FsStore, public SourceStore
{
private:
    std::vector<std::string> skipped;

    void walk(std::string dir, std::vector<std::string> *identities);
    std::string declaredChecksum(std::string identity);
public:
    FsSourceStore(std::string root_) :
            FsStore(root_)
    {
    }
    std::vector<Artifact> list();
    SourceObject read(std::string identity);
    std::vector<std::string> getSkipped()
    {
        return skipped;
    }
};

class FsTargetStore: public FsStore, public TargetStore
{
private:
    void mkParents(std::string identity);
    void writeFile(std::string fileName, ContentReader& content);
public:
    FsTargetStore(std::string root_) :
            FsStore(root_)
    {
    }
    WriteConfirmation write(std::string identity, ContentReader& content,
            std::string contentType,
            const std::map<std::string, std::string>& metadata);
};
