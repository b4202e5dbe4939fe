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
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <sys/stat.h>
#include <dirent.h>

#include <fstream>

#include <gtest/gtest.h>

#include "src/engine/EngineIncludes.h"
#include "src/connector/fs/FsStore.h"
#include "FakeStores.h"

class FsStoreTest: public ::testing::Test
{
protected:
    std::string source;
    std::string target;
    std::vector<std::string> created;

    std::string mkTempDir()
    {
        char tmpl[] = "/tmp/pkgmig-fs-XXXXXX";

        if (mkdtemp(tmpl) == nullptr)
            return "";

        created.push_back(tmpl);
        return tmpl;
    }

    void SetUp()
    {
        source = mkTempDir();
        target = mkTempDir();
        ASSERT_NE("", source);
        ASSERT_NE("", target);
    }

    void TearDown()
    {
        for (std::string dir : created)
            EXPECT_EQ(0, system((std::string("rm -rf ") + dir).c_str()));
    }

    void writeFile(std::string fileName, std::string content)
    {
        std::ofstream out(fileName, std::ofstream::trunc);
        out << content;
    }

    static int openFiles()
    {
        DIR *dirp = opendir("/proc/self/fd");
        int num = 0;

        if (dirp == NULL)
            return -1;
        while (readdir(dirp) != NULL)
            num++;
        closedir(dirp);

        return num;
    }

    std::string readFile(std::string fileName)
    {
        std::ifstream in(fileName);
        std::stringstream content;
        content << in.rdbuf();
        return content.str();
    }
};

TEST_F(FsStoreTest, ListIsSortedAndSkipsSidecars)
{
    FsSourceStore store(source);

    ASSERT_EQ(0, mkdir((source + "/pypi").c_str(), 0755));
    ASSERT_EQ(0, mkdir((source + "/npm").c_str(), 0755));
    writeFile(source + "/pypi/requests-2.31.0.whl", "wheel");
    writeFile(source + "/npm/left-pad-1.3.0.tgz", "tarball");
    writeFile(source + "/npm/left-pad-1.3.0.tgz.sha256",
            Validator::digest("tarball") + "\n");
    writeFile(source + "/index.json", "{}");
    writeFile(source + "/npm/partial.tgz.pkgmig.tmp", "half");

    std::vector<Artifact> artifacts = store.list();

    ASSERT_EQ(3u, artifacts.size());
    EXPECT_EQ("index.json", artifacts[0].identity);
    EXPECT_EQ("npm/left-pad-1.3.0.tgz", artifacts[1].identity);
    EXPECT_EQ("pypi/requests-2.31.0.whl", artifacts[2].identity);

    EXPECT_EQ("", artifacts[0].checksum);
    EXPECT_EQ(Validator::digest("tarball"), artifacts[1].checksum);
    EXPECT_EQ(7u, artifacts[1].size);
    EXPECT_EQ("application/json", artifacts[0].contentType);
    EXPECT_EQ("application/gzip", artifacts[1].contentType);
    EXPECT_EQ("application/zip", artifacts[2].contentType);
}

TEST_F(FsStoreTest, StrayFilesAreNotLost)
{
    FsSourceStore store(source);

    writeFile(source + "/pkg.tgz", "package");
    writeFile(source + "/checksums.sha256", "list of checksums");
    writeFile(source + "/build.pkgmig.tmp", "half");

    std::vector<Artifact> artifacts = store.list();

    ASSERT_EQ(2u, artifacts.size());
    EXPECT_EQ("checksums.sha256", artifacts[0].identity);
    EXPECT_EQ(17u, artifacts[0].size);
    EXPECT_EQ("pkg.tgz", artifacts[1].identity);

    std::vector<std::string> skipped = store.getSkipped();
    ASSERT_EQ(1u, skipped.size());
    EXPECT_EQ("build.pkgmig.tmp", skipped[0]);

    // a sidecar in another directory does not hide the artifact
    ASSERT_EQ(0, mkdir((source + "/sub").c_str(), 0755));
    writeFile(source + "/sub/pkg.tgz.sha256", Validator::digest("x"));
    EXPECT_EQ(3u, store.list().size());
    EXPECT_EQ(1u, store.getSkipped().size());
}

TEST_F(FsStoreTest, Read)
{
    FsSourceStore store(source);

    writeFile(source + "/a.txt", "hello");

    SourceObject object = store.read("a.txt");

    ASSERT_NE(nullptr, object.content);
    EXPECT_EQ("hello", readAll(*object.content));
    EXPECT_EQ(5u, object.size);
    EXPECT_EQ("text/plain", object.contentType);
}

TEST_F(FsStoreTest, ReadIsChunked)
{
    FsSourceStore store(source);
    std::string content;

    for (int i = 0; content.size() < 3 * (size_t) Const::READ_BUFFER_SIZE; i++)
        content += std::to_string(i) + ",";
    writeFile(source + "/big.tar", content);

    SourceObject object = store.read("big.tar");
    std::unique_ptr<char[]> buffer(new char[Const::READ_BUFFER_SIZE * 4]);
    std::string received;
    size_t num;
    int chunks = 0;

    EXPECT_EQ(content.size(), object.size);

    while ((num = object.content->read(buffer.get(), Const::READ_BUFFER_SIZE))
            != 0) {
        EXPECT_LE(num, (size_t) Const::READ_BUFFER_SIZE);
        received.append(buffer.get(), num);
        chunks++;
    }

    EXPECT_EQ(content, received);
    EXPECT_GE(chunks, 4);
}

TEST_F(FsStoreTest, ReadErrors)
{
    FsSourceStore store(source);

    ASSERT_EQ(0, mkdir((source + "/dir").c_str(), 0755));

    try {
        store.read("missing.tgz");
        FAIL() << "read of a missing artifact succeeded";
    } catch (const PkgMigException& e) {
        EXPECT_EQ(Error::REMOTE_NOT_FOUND, e.getError());
    }

    for (std::string identity : { "../etc/passwd", "/etc/passwd", "a//b",
            "dir" }) {
        try {
            store.read(identity);
            FAIL() << identity;
        } catch (const PkgMigException& e) {
            EXPECT_EQ(Error::REMOTE_MALFORMED_REQUEST, e.getError())
                    << identity;
        }
    }
}

TEST_F(FsStoreTest, ListOfMissingRoot)
{
    FsSourceStore store(source + "/nonexistent");

    try {
        store.list();
        FAIL() << "listing of a missing directory succeeded";
    } catch (const PkgMigException& e) {
        EXPECT_EQ(Error::REMOTE_NOT_FOUND, e.getError());
    }
}

TEST_F(FsStoreTest, WriteCreatesParentsAndSidecar)
{
    FsTargetStore store(target);
    std::map<std::string, std::string> metadata;

    StringReader content("jar content");
    WriteConfirmation confirmation = store.write("maven/org/junit/junit-4.13.jar",
            content, "application/java-archive", metadata);

    EXPECT_EQ(Validator::digest("jar content"), confirmation.checksum);
    EXPECT_EQ(11u, confirmation.size);
    EXPECT_EQ("jar content", readFile(target + "/maven/org/junit/junit-4.13.jar"));
    EXPECT_EQ(confirmation.checksum + "\n",
            readFile(target + "/maven/org/junit/junit-4.13.jar.sha256"));
    EXPECT_NE(0,
            access((target + "/maven/org/junit/junit-4.13.jar.pkgmig.tmp").c_str(),
                    F_OK));
}

TEST_F(FsStoreTest, WriteIsIdempotent)
{
    FsTargetStore store(target);
    std::map<std::string, std::string> metadata;

    StringReader oldContent("old");
    StringReader newContent("new");

    store.write("a.tgz", oldContent, "application/gzip", metadata);
    WriteConfirmation confirmation = store.write("a.tgz", newContent,
            "application/gzip", metadata);

    EXPECT_EQ(Validator::digest("new"), confirmation.checksum);
    EXPECT_EQ("new", readFile(target + "/a.tgz"));
}

TEST_F(FsStoreTest, TargetIsReadableAsSource)
{
    FsTargetStore targetStore(target);
    FsSourceStore sourceStore(target);
    std::map<std::string, std::string> metadata;

    StringReader content("debian");

    targetStore.write("x/y.deb", content, "", metadata);

    std::vector<Artifact> artifacts = sourceStore.list();

    ASSERT_EQ(1u, artifacts.size());
    EXPECT_EQ("x/y.deb", artifacts[0].identity);
    EXPECT_EQ(Validator::digest("debian"), artifacts[0].checksum);
}

TEST_F(FsStoreTest, WriteRejectsEscapingIdentity)
{
    FsTargetStore store(target);
    std::map<std::string, std::string> metadata;

    StringReader content("x");

    EXPECT_THROW(store.write("../outside.tgz", content, "", metadata),
            PkgMigException);
}

class FailingReader: public ContentReader
{
private:
    int chunks;
public:
    FailingReader(int chunks_) :
            chunks(chunks_)
    {
    }
    size_t read(char *buffer, size_t count)
    {
        if (chunks-- == 0)
            THROW(Error::INTEGRITY_MISMATCH, "source");
        memset(buffer, 'f', count);
        return count;
    }
};

TEST_F(FsStoreTest, FailedStreamKeepsFormerArtifact)
{
    FsTargetStore store(target);
    std::map<std::string, std::string> metadata;
    StringReader content("former");
    FailingReader failing(3);

    store.write("a.tgz", content, "application/gzip", metadata);

    int before = openFiles();

    try {
        store.write("a.tgz", failing, "application/gzip", metadata);
        FAIL() << "write of a failing stream succeeded";
    } catch (const PkgMigException& e) {
        EXPECT_EQ(Error::INTEGRITY_MISMATCH, e.getError());
    }

    // the descriptor of the temporary file has been closed
    EXPECT_EQ(before, openFiles());

    EXPECT_EQ("former", readFile(target + "/a.tgz"));
    EXPECT_EQ(Validator::digest("former") + "\n",
            readFile(target + "/a.tgz.sha256"));
    EXPECT_NE(0, access((target + "/a.tgz.pkgmig.tmp").c_str(), F_OK));
}

TEST_F(FsStoreTest, LargeWriteIsStreamed)
{
    FsTargetStore store(target);
    std::map<std::string, std::string> metadata;
    std::string data(2 * Const::READ_BUFFER_SIZE + 11, 'l');
    StringReader content(data);

    WriteConfirmation confirmation = store.write("large.tar", content,
            "application/x-tar", metadata);

    EXPECT_EQ(data.size(), confirmation.size);
    EXPECT_EQ(Validator::digest(data), confirmation.checksum);
    EXPECT_EQ(data, readFile(target + "/large.tar"));
}

TEST(FsStore, ErrnoMapping)
{
    EXPECT_EQ(Error::REMOTE_NOT_FOUND, FsStore::mapErrno(ENOENT));
    EXPECT_EQ(Error::REMOTE_AUTHORIZATION, FsStore::mapErrno(EACCES));
    EXPECT_EQ(Error::REMOTE_MALFORMED_REQUEST, FsStore::mapErrno(ENAMETOOLONG));
    EXPECT_EQ(Error::REMOTE_NETWORK, FsStore::mapErrno(EIO));
}
