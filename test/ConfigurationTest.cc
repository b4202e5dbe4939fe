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
#include <unistd.h>

#include <fstream>

#include <gtest/gtest.h>

#include "src/engine/EngineIncludes.h"

class ConfigurationTest: public ::testing::Test
{
protected:
    std::string fileName;

    void SetUp()
    {
        char tmpl[] = "/tmp/pkgmig-conf-XXXXXX";
        int fd = mkstemp(tmpl);

        ASSERT_NE(-1, fd);
        close(fd);
        fileName = tmpl;
    }

    void TearDown()
    {
        unlink(fileName.c_str());
    }

    void writeConfig(std::string content)
    {
        std::ofstream out(fileName, std::ofstream::trunc);
        out << content;
    }
};

TEST_F(ConfigurationTest, Defaults)
{
    Configuration conf;
    MigrationConfig config = conf.get();

    EXPECT_EQ(strategy_t::AUTO, config.strategyHint);
    EXPECT_EQ(0, config.concurrencyLimit);
    EXPECT_EQ(Const::DEFAULT_MAX_RETRIES, config.maxRetries);
    EXPECT_EQ(Const::UNSET, config.resumeFromRun);
}

TEST_F(ConfigurationTest, ReadFile)
{
    Configuration conf;

    writeConfig("# migration of the package index\n"
            "\n"
            "strategyHint: medium\n"
            "  concurrencyLimit : 4\n"
            "maxRetries: 2\n"
            "backoffFactor: 1.5\n"
            "rateLimitTarget: 12.5\n");

    conf.read(fileName, true);

    MigrationConfig config = conf.get();
    EXPECT_EQ(strategy_t::MEDIUM, config.strategyHint);
    EXPECT_EQ(4, config.concurrencyLimit);
    EXPECT_EQ(2, config.maxRetries);
    EXPECT_DOUBLE_EQ(1.5, config.backoffFactor);
    EXPECT_DOUBLE_EQ(12.5, config.rateLimitTarget);
}

TEST_F(ConfigurationTest, MissingFile)
{
    Configuration conf;

    unlink(fileName.c_str());

    EXPECT_NO_THROW(conf.read(fileName));
    EXPECT_THROW(conf.read(fileName, true), PkgMigException);
}

TEST_F(ConfigurationTest, OptionsOverrideFile)
{
    Configuration conf;

    writeConfig("maxRetries: 2\n");
    conf.read(fileName);
    conf.setOption("maxRetries=7");
    conf.setOption("resumeFromRun", "3");

    EXPECT_EQ(7, conf.get().maxRetries);
    EXPECT_EQ(3, conf.get().resumeFromRun);
    EXPECT_NE(std::string::npos, conf.str().find("maxRetries: 7"));
}

TEST_F(ConfigurationTest, FormatErrors)
{
    Configuration conf;

    for (std::string option : { "maxRetries", "unknownKey=1",
            "maxRetries=many", "concurrencyLimit=4x", "strategyHint=huge" }) {
        try {
            conf.setOption(option);
            FAIL() << option;
        } catch (const PkgMigException& e) {
            EXPECT_EQ(Error::CONFIG_FORMAT_ERROR, e.getError()) << option;
        }
    }

    writeConfig("maxRetries 2\n");
    EXPECT_THROW(conf.read(fileName), PkgMigException);
}

TEST_F(ConfigurationTest, ValueErrorsLeaveConfigurationUnchanged)
{
    Configuration conf;

    conf.setOption("backoffFactor=3");

    for (std::string option : { "backoffFactor=0.5", "maxRetries=-1",
            "rateLimitSource=-2", "batchByteSize=-10" }) {
        try {
            conf.setOption(option);
            FAIL() << option;
        } catch (const PkgMigException& e) {
            EXPECT_EQ(Error::CONFIG_VALUE_ERROR, e.getError()) << option;
        }
    }

    EXPECT_DOUBLE_EQ(3.0, conf.get().backoffFactor);
    EXPECT_EQ(Const::DEFAULT_MAX_RETRIES, conf.get().maxRetries);
}

TEST_F(ConfigurationTest, StrategyNames)
{
    for (strategy_t strategy : { strategy_t::SMALL, strategy_t::MEDIUM,
            strategy_t::LARGE, strategy_t::AUTO })
        EXPECT_EQ(strategy,
                Configuration::strategyFromStr(
                        Configuration::strategyStr(strategy)));
}
