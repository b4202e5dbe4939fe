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
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <dirent.h>

#include <fstream>

#include "src/engine/EngineIncludes.h"

#include "FsStore.h"

Error FsStore::mapErrno(int err)

{
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            return Error::REMOTE_NOT_FOUND;
        case EACCES:
        case EPERM:
        case EROFS:
            return Error::REMOTE_AUTHORIZATION;
        case ENAMETOOLONG:
        case EISDIR:
        case EINVAL:
            return Error::REMOTE_MALFORMED_REQUEST;
        default:
            return Error::REMOTE_NETWORK;
    }
}

void FsStore::checkIdentity(std::string identity)

{
    if (identity.size() == 0 || identity[0] == '/') {
        TRACE(Trace::error, identity);
        THROW(Error::REMOTE_MALFORMED_REQUEST, identity);
    }

    for (std::string component : PKGMIG::split(identity, '/')) {
        if (component.size() == 0 || component.compare(".") == 0
                || component.compare("..") == 0) {
            TRACE(Trace::error, identity);
            THROW(Error::REMOTE_MALFORMED_REQUEST, identity);
        }
    }
}

std::string FsStore::contentType(std::string identity)

{
    const std::vector<std::pair<std::string, std::string>> types = {
            { ".tar.gz", "application/gzip" },
            { ".tgz", "application/gzip" },
            { ".gz", "application/gzip" },
            { ".tar", "application/x-tar" },
            { ".zip", "application/zip" },
            { ".whl", "application/zip" },
            { ".jar", "application/java-archive" },
            { ".rpm", "application/x-rpm" },
            { ".deb", "application/vnd.debian.binary-package" },
            { ".json", "application/json" },
            { ".xml", "application/xml" },
            { ".txt", "text/plain" } };

    for (const auto& type : types)
        if (identity.size() >= type.first.size()
                && identity.compare(identity.size() - type.first.size(),
                        type.first.size(), type.first) == 0)
            return type.second;

    return "application/octet-stream";
}

std::string FsStore::path(std::string identity)

{
    return root + Const::DELIM + identity;
}

std::string FsStore::digestFile(std::string fileName, unsigned long *size)

{
    FsReader reader(fileName);
    Digest digest;
    std::unique_ptr<char[]> buffer(new char[Const::READ_BUFFER_SIZE]);
    size_t rsize;

    while ((rsize = reader.read(buffer.get(), Const::READ_BUFFER_SIZE)) != 0)
        digest.update(buffer.get(), rsize);

    *size = digest.getSize();

    return digest.final();
}

FsReader::FsReader(std::string fileName_) :
        fileName(fileName_), fd(-1), size(0)

{
    struct stat statbuf;

    if ((fd = open(fileName.c_str(), O_RDONLY | O_CLOEXEC)) == -1) {
        TRACE(Trace::error, fileName, errno);
        THROW(FsStore::mapErrno(errno), fileName, errno);
    }

    if (fstat(fd, &statbuf) == -1) {
        int err = errno;
        TRACE(Trace::error, fileName, err);
        close(fd);
        errno = err;
        THROW(FsStore::mapErrno(err), fileName, err);
    }

    if (!S_ISREG(statbuf.st_mode)) {
        close(fd);
        THROW(Error::REMOTE_MALFORMED_REQUEST, fileName);
    }

    size = statbuf.st_size;
}

FsReader::~FsReader()

{
    close(fd);
}

size_t FsReader::read(char *buffer, size_t count)

{
    ssize_t rsize;

    while ((rsize = ::read(fd, buffer, count)) == -1) {
        if (errno == EINTR)
            continue;
        TRACE(Trace::error, fileName, errno);
        THROW(FsStore::mapErrno(errno), fileName, errno);
    }

    return rsize;
}

static bool hasSuffix(std::string name, std::string suffix)

{
    return name.size() > suffix.size()
            && name.compare(name.size() - suffix.size(), suffix.size(),
                    suffix) == 0;
}

void FsSourceStore::walk(std::string dir, std::vector<std::string> *identities)

{
    DIR *dirp;
    struct dirent *dp;
    struct stat statbuf;
    std::string name;
    std::string identity;
    std::set<std::string> files;
    std::vector<std::string> subdirs;

    if ((dirp = opendir(path(dir).c_str())) == NULL) {
        TRACE(Trace::error, dir, errno);
        THROW(mapErrno(errno), path(dir), errno);
    }

    while ((dp = readdir(dirp)) != NULL) {
        name = dp->d_name;
        if (name.compare(".") == 0 || name.compare("..") == 0)
            continue;

        identity = dir.size() ? dir + Const::DELIM + name : name;

        if (stat(path(identity).c_str(), &statbuf) == -1) {
            TRACE(Trace::error, identity, errno);
            continue;
        }

        if (S_ISDIR(statbuf.st_mode))
            subdirs.push_back(identity);
        else if (S_ISREG(statbuf.st_mode))
            files.insert(name);
    }

    closedir(dirp);

    for (std::string file : files) {
        identity = dir.size() ? dir + Const::DELIM + file : file;

        if (hasSuffix(file, Const::TMP_FILE_SUFFIX)) {
            MSG(PKGMIGE0070W, path(identity));
            skipped.push_back(identity);
            continue;
        }

        // checksum sidecar of an artifact
        if (hasSuffix(file, Const::CHECKSUM_SUFFIX)
                && files.count(
                        file.substr(0,
                                file.size() - Const::CHECKSUM_SUFFIX.size()))
                        != 0)
            continue;

        identities->push_back(identity);
    }

    for (std::string subdir : subdirs)
        walk(subdir, identities);
}

std::string FsSourceStore::declaredChecksum(std::string identity)

{
    std::ifstream sidecar(path(identity) + Const::CHECKSUM_SUFFIX);
    std::string checksum;

    if (!sidecar.is_open())
        return "";

    sidecar >> checksum;

    return checksum;
}

std::vector<Artifact> FsSourceStore::list()

{
    std::vector<std::string> identities;
    std::vector<Artifact> artifacts;
    struct stat statbuf;

    skipped.clear();

    walk("", &identities);

    std::sort(identities.begin(), identities.end());

    for (std::string identity : identities) {
        Artifact artifact;

        if (stat(path(identity).c_str(), &statbuf) == -1) {
            TRACE(Trace::error, identity, errno);
            continue;
        }

        artifact.identity = identity;
        artifact.size = statbuf.st_size;
        artifact.checksum = declaredChecksum(identity);
        artifact.contentType = contentType(identity);
        artifacts.push_back(artifact);
    }

    TRACE(Trace::normal, root, artifacts.size());

    return artifacts;
}

SourceObject FsSourceStore::read(std::string identity)

{
    SourceObject object;
    FsReader *reader;

    checkIdentity(identity);

    reader = new FsReader(path(identity));
    object.content = std::unique_ptr<ContentReader>(reader);
    object.size = reader->getSize();
    object.checksum = declaredChecksum(identity);
    object.contentType = contentType(identity);

    TRACE(Trace::full, identity, object.size);

    return object;
}

void FsTargetStore::mkParents(std::string identity)

{
    std::string dir = root;
    std::vector<std::string> components = PKGMIG::split(identity, '/');

    components.pop_back();

    for (std::string component : components) {
        dir += Const::DELIM + component;
        if (mkdir(dir.c_str(), 0755) == -1 && errno != EEXIST) {
            TRACE(Trace::error, dir, errno);
            THROW(mapErrno(errno), dir, errno);
        }
    }
}

void FsTargetStore::writeFile(std::string fileName, ContentReader& content)

{
    std::string tmpName = fileName + Const::TMP_FILE_SUFFIX;
    std::unique_ptr<char[]> buffer(new char[Const::READ_BUFFER_SIZE]);
    size_t rsize;
    size_t written;
    ssize_t wsize;
    int fd;
    int err;

    if ((fd = open(tmpName.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
            0644)) == -1) {
        TRACE(Trace::error, tmpName, errno);
        THROW(mapErrno(errno), tmpName, errno);
    }

    try {
        while ((rsize = content.read(buffer.get(), Const::READ_BUFFER_SIZE))
                != 0) {
            written = 0;
            while (written < rsize) {
                wsize = ::write(fd, buffer.get() + written, rsize - written);
                if (wsize == -1) {
                    if (errno == EINTR)
                        continue;
                    err = errno;
                    TRACE(Trace::error, tmpName, err);
                    errno = err;
                    THROW(mapErrno(err), tmpName, err);
                }
                written += wsize;
            }
        }
    } catch (const std::exception& e) {
        TRACE(Trace::error, tmpName, e.what());
        close(fd);
        unlink(tmpName.c_str());
        throw;
    }

    err = 0;
    if (fsync(fd) == -1)
        err = errno;
    if (close(fd) == -1 && err == 0)
        err = errno;

    if (err != 0) {
        TRACE(Trace::error, tmpName, err);
        unlink(tmpName.c_str());
        errno = err;
        THROW(mapErrno(err), tmpName, err);
    }

    if (rename(tmpName.c_str(), fileName.c_str()) == -1) {
        err = errno;
        TRACE(Trace::error, tmpName, fileName, err);
        unlink(tmpName.c_str());
        errno = err;
        THROW(mapErrno(err), fileName, err);
    }
}

WriteConfirmation FsTargetStore::write(std::string identity,
        ContentReader& content, std::string contentType,
        const std::map<std::string, std::string>& metadata)

{
    WriteConfirmation confirmation;

    checkIdentity(identity);
    mkParents(identity);

    TRACE(Trace::full, identity, contentType, metadata.size());

    writeFile(path(identity), content);

    confirmation.checksum = digestFile(path(identity), &confirmation.size);

    StringReader sidecar(confirmation.checksum + "\n");
    writeFile(path(identity) + Const::CHECKSUM_SUFFIX, sidecar);

    return confirmation;
}
