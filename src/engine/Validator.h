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

class Digest
{
private:
    EVP_MD_CTX *ctx;
    unsigned long size;
    std::string value;
public:
    Digest();
    ~Digest();
    void update(const char *data, size_t count);
    std::string final();
    unsigned long getSize()
    {
        return size;
    }
};

class Validator
{
public:
    struct result_t
    {
        bool ok;
        std::string details;
    };

    static std::string digest(const std::string& content);

    result_t verify(std::string identity, const std::string& content,
            std::string contentType, const Artifact& expected) const;
    result_t verifyDigest(std::string identity, std::string digest,
            unsigned long size, std::string contentType,
            const Artifact& expected) const;
};

/**
    Passes the content of a source object on to the target and validates
    it against the listing while it is streamed. The validation happens
    when the end of the content has been reached, i.e. before the target
    completes the write. A mismatch is thrown as integrity error out of
    read().
 */
class ValidatingReader: public ContentReader
{
private:
    ContentReader& content;
    const Validator& validator;
    std::string identity;
    std::string contentType;
    Artifact expected;
    Digest digest;
    std::string checksum;
    bool done;
    Validator::result_t result;

    void check();
public:
    ValidatingReader(ContentReader& content_, const Validator& validator_,
            std::string identity_, std::string contentType_,
            const Artifact& expected_) :
            content(content_), validator(validator_), identity(identity_), contentType(
                    contentType_), expected(expected_), done(false), result( {
                    true, "" })
    {
    }
    size_t read(char *buffer, size_t count);
    void finish();
    std::string getChecksum()
    {
        return checksum;
    }
    unsigned long getSize()
    {
        return digest.getSize();
    }
};
