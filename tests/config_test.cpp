// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The JobSync Authors - All Rights Reserved                   *
// *****************************************************************************

#include <gtest/gtest.h>
#include "test_utils.h"
#include "../JobSync/Source/base/config.h"

using namespace zen;
using namespace jsync;
using namespace jsync::test;


TEST(Config, WriteThenRead)
{
    TempFolder tmp;

    JobSyncConfig cfg;
    cfg.jobs.push_back({L"Documents", "/home/user/Documents", "/mnt/backup/Documents"});
    cfg.jobs.push_back({L"", "/home/user/Pictures", "/mnt/backup/Pictures"});
    cfg.preview = true;
    cfg.logFolderPath = "/var/log/jobsync";

    writeConfig(cfg, tmp / "jobs.xml");

    JobSyncConfig cfg2;
    std::wstring warningMsg;
    readConfig(tmp / "jobs.xml", cfg2, warningMsg);

    EXPECT_EQ(cfg2, cfg);
    EXPECT_TRUE(warningMsg.empty());
}


TEST(Config, ReadHandWrittenFile)
{
    TempFolder tmp;
    writeFile(tmp / "jobs.xml",
              "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
              "<JobSync XmlType=\"JOBS\" XmlFormat=\"1\">\n"
              "    <Jobs>\n"
              "        <Job Name=\"Documents\">\n"
              "            <Source>/home/user/Documents</Source>\n"
              "            <Target>/mnt/backup/Documents</Target>\n"
              "        </Job>\n"
              "        <Job>\n"
              "            <Source>/home/user/Music/</Source>\n"
              "            <Target>/mnt/backup/Music</Target>\n"
              "        </Job>\n"
              "    </Jobs>\n"
              "    <Preview Enabled=\"false\"/>\n"
              "    <LogFolder>/var/log/jobsync</LogFolder>\n"
              "</JobSync>\n");

    JobSyncConfig cfg;
    std::wstring warningMsg;
    readConfig(tmp / "jobs.xml", cfg, warningMsg);

    EXPECT_TRUE(warningMsg.empty());
    ASSERT_EQ(cfg.jobs.size(), 2u);
    EXPECT_EQ(getJobName(cfg.jobs[0]), L"Documents");
    EXPECT_EQ(cfg.jobs[0].sourceFolderPath, "/home/user/Documents");
    EXPECT_EQ(cfg.jobs[0].targetFolderPath, "/mnt/backup/Documents");
    EXPECT_EQ(getJobName(cfg.jobs[1]), L"Music"); //default: source folder name
    EXPECT_FALSE(cfg.preview);
    EXPECT_EQ(cfg.logFolderPath, "/var/log/jobsync");
}


TEST(Config, MissingElementsAreReported)
{
    TempFolder tmp;
    writeFile(tmp / "jobs.xml",
              "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
              "<JobSync XmlType=\"JOBS\" XmlFormat=\"1\">\n"
              "    <Jobs>\n"
              "        <Job Name=\"A\">\n"
              "            <Source>/a</Source>\n"
              "        </Job>\n"
              "    </Jobs>\n"
              "    <Preview Enabled=\"maybe\"/>\n"
              "</JobSync>\n");

    JobSyncConfig cfg;
    std::wstring warningMsg;
    readConfig(tmp / "jobs.xml", cfg, warningMsg);

    ASSERT_EQ(cfg.jobs.size(), 1u);
    EXPECT_EQ(cfg.jobs[0].sourceFolderPath, "/a");
    EXPECT_TRUE(cfg.jobs[0].targetFolderPath.empty());
    EXPECT_FALSE(cfg.preview);
    EXPECT_TRUE(cfg.logFolderPath.empty());

    EXPECT_TRUE(contains(warningMsg, L"Target"));
    EXPECT_TRUE(contains(warningMsg, L"Enabled"));
    EXPECT_TRUE(contains(warningMsg, L"LogFolder"));
}


TEST(Config, InvalidFilesAreRejected)
{
    TempFolder tmp;
    JobSyncConfig cfg;
    std::wstring warningMsg;

    EXPECT_THROW(readConfig(tmp / "missing.xml", cfg, warningMsg), FileError);

    writeFile(tmp / "other.xml", "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n<FreeFileSync XmlType=\"REAL\"/>\n");
    EXPECT_THROW(readConfig(tmp / "other.xml", cfg, warningMsg), FileError);

    writeFile(tmp / "type.xml", "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n<JobSync XmlType=\"BATCH\"/>\n");
    EXPECT_THROW(readConfig(tmp / "type.xml", cfg, warningMsg), FileError);

    writeFile(tmp / "broken.xml", "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n<JobSync XmlType=\"JOBS\">\n");
    EXPECT_THROW(readConfig(tmp / "broken.xml", cfg, warningMsg), FileError);
}


TEST(Config, JobNameFallsBackToSourceFolder)
{
    EXPECT_EQ(getJobName({L"Named", "/a/b", "/c"}), L"Named");
    EXPECT_EQ(getJobName({L"", "/home/user/Photos", "/c"}), L"Photos");
    EXPECT_EQ(getJobName({L"", "/home/user/Photos//", "/c"}), L"Photos");
    EXPECT_EQ(getJobName({L"", "relative", "/c"}), L"relative");
}
