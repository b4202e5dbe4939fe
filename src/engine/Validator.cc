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
#include "EngineIncludes.h"

/** @page validation Validation

    Each artifact is validated twice:

    - while the content read from the source is streamed to the target
      it is compared to the declaration of the listing (identity, size,
      content type and, if declared, the SHA-256 checksum). This
      happens at the end of the content before the target completes the
      write, see ValidatingReader.
    - after the transfer the checksum and size confirmed by the target
      are compared to the same declaration. If the source did not
      declare a checksum the one computed at the first read is used.

    A mismatch is an integrity error which is never retried. The
    details of the result contain expected and actual values.
    Validation has no side effects and can be repeated any time.
 */

Digest::Digest() :
        ctx(EVP_MD_CTX_new()), size(0)

{
    if (ctx == nullptr)
        THROW(Error::GENERAL_ERROR);

    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        TRACE(Trace::error, "EVP_DigestInit_ex");
        THROW(Error::GENERAL_ERROR);
    }
}

Digest::~Digest()

{
    EVP_MD_CTX_free(ctx);
}

void Digest::update(const char *data, size_t count)

{
    if (value.size() != 0)
        THROW(Error::GENERAL_ERROR, size);

    if (EVP_DigestUpdate(ctx, data, count) != 1) {
        TRACE(Trace::error, size, count);
        THROW(Error::GENERAL_ERROR, size, count);
    }

    size += count;
}

std::string Digest::final()

{
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    std::stringstream ss;

    if (value.size() != 0)
        return value;

    if (EVP_DigestFinal_ex(ctx, hash, &hashLen) != 1) {
        TRACE(Trace::error, size);
        THROW(Error::GENERAL_ERROR, size);
    }

    for (unsigned int i = 0; i < hashLen; i++)
        ss << std::hex << std::setw(2) << std::setfill('0') << (int) hash[i];

    value = ss.str();

    return value;
}

std::string Validator::digest(const std::string& content)

{
    Digest digest;

    digest.update(content.data(), content.size());

    return digest.final();
}

static std::string lowerCase(std::string s)

{
    std::transform(s.begin(), s.end(), s.begin(),
            [](unsigned char c) {return ::tolower(c);});

    return s;
}

Validator::result_t Validator::verifyDigest(std::string identity,
        std::string digest, unsigned long size, std::string contentType,
        const Artifact& expected) const

{
    std::stringstream details;
    result_t result = { true, "" };

    if (identity.compare(expected.identity) != 0) {
        result.ok = false;
        details << "identity: expected " << expected.identity << ", actual "
                << identity << "; ";
    }

    if (size != expected.size) {
        result.ok = false;
        details << "size: expected " << expected.size << ", actual " << size
                << "; ";
    }

    if (contentType.size() != 0 && expected.contentType.size() != 0
            && contentType.compare(expected.contentType) != 0) {
        result.ok = false;
        details << "content type: expected " << expected.contentType
                << ", actual " << contentType << "; ";
    }

    if (expected.checksum.size() != 0
            && lowerCase(digest).compare(lowerCase(expected.checksum)) != 0) {
        result.ok = false;
        details << "checksum: expected " << lowerCase(expected.checksum)
                << ", actual " << lowerCase(digest) << "; ";
    }

    if (!result.ok) {
        result.details = details.str();
        result.details.erase(result.details.size() - 2);
        TRACE(Trace::normal, identity, result.details);
    }

    return result;
}

Validator::result_t Validator::verify(std::string identity,
        const std::string& content, std::string contentType,
        const Artifact& expected) const

{
    return verifyDigest(identity, digest(content), content.size(),
            contentType, expected);
}

void ValidatingReader::check()

{
    done = true;
    checksum = digest.final();

    result = validator.verifyDigest(identity, checksum, digest.getSize(),
            contentType, expected);

    if (!result.ok) {
        MSG(PKGMIGE0030E, identity, result.details);
        THROW(Error::INTEGRITY_MISMATCH, "source", result.details);
    }
}

size_t ValidatingReader::read(char *buffer, size_t count)

{
    size_t num;

    if (done)
        return 0;

    if ((num = content.read(buffer, count)) == 0) {
        check();
        return 0;
    }

    digest.update(buffer, num);

    return num;
}

void ValidatingReader::finish()

{
    std::unique_ptr<char[]> buffer;

    if (done) {
        if (!result.ok)
            THROW(Error::INTEGRITY_MISMATCH, "source", result.details);
        return;
    }

    // the target did not consume the whole content
    buffer = std::unique_ptr<char[]>(new char[Const::READ_BUFFER_SIZE]);
    while (read(buffer.get(), Const::READ_BUFFER_SIZE) != 0)
        ;
}
