// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The JobSync Authors - All Rights Reserved                   *
// *****************************************************************************

#include <algorithm>
#include <gtest/gtest.h>
#include "test_utils.h"
#include "../JobSync/Source/base/mirror_job.h"

using namespace zen;
using namespace jsync;
using namespace jsync::test;


namespace
{
//one line per job notification: "<kind> <path relative to test folder>"
struct JobTrace
{
    JobTrace(Job& job, const Zstring& basePath) : basePath_(utfTo<std::wstring>(basePath) + L'/')
    {
        JobEvents& je = job.events();
        je.createdFile      .subscribe([this](const FileCopyEvent& ce) { add(L"created "  , ce.targetDir.getChildFile(ce.sourceFile.getName()).getFullPath()); });
        je.modifiedFile     .subscribe([this](const FileCopyEvent& ce) { add(L"modified " , ce.targetDir.getChildFile(ce.sourceFile.getName()).getFullPath()); });
        je.deletedFile      .subscribe([this](const FileDeletionEvent& de) { add(L"deleted ", de.file.getFullPath()); });
        je.createdDirectory .subscribe([this](const DirectoryCreationEvent& ce) { add(L"created dir ", ce.targetDir.getChildDirectory(ce.sourceDir.getName()).getFullPath()); });
        je.deletedDirectory .subscribe([this](const DirectoryDeletionEvent& de) { add(L"deleted dir ", de.dir.getFullPath()); });
        je.fileCopyError    .subscribe([this](const FileCopyErrorEvent& ee) { add(L"copy error ", ee.sourceFile.getFullPath()); });
        je.proceededFile    .subscribe([this](const FileProceededEvent& pe) { ++proceededFiles; proceededBytes += pe.fileSize; });
        je.finished         .subscribe([this] { ++finished; });
    }

    bool has(const std::wstring& item) const { return std::find(items.begin(), items.end(), item) != items.end(); }

    std::vector<std::wstring> items;
    size_t proceededFiles = 0;
    uint64_t proceededBytes = 0;
    size_t finished = 0;

private:
    void add(const std::wstring& kind, const std::wstring& fullPath)
    {
        items.push_back(kind + (startsWith(fullPath, basePath_) ? fullPath.substr(basePath_.size()) : fullPath));
    }

    const std::wstring basePath_;
};


class MirrorJobTest : public ::testing::Test
{
protected:
    void SetUp() override { takeExtraLog(); }

    SharedRef<MirrorJob> makeJob(const Zstring& sourceRelPath, const Zstring& targetRelPath, const AfsDevice& targetFs)
    {
        return makeSharedRef<MirrorJob>(L"Test",
                                        nativeFs_.ref().getDirectoryHandle(tmp_ / sourceRelPath),
                                        targetFs.ref().getDirectoryHandle(tmp_ / targetRelPath));
    }
    SharedRef<MirrorJob> makeJob(const Zstring& sourceRelPath, const Zstring& targetRelPath) { return makeJob(sourceRelPath, targetRelPath, nativeFs_); }

    TempFolder tmp_;
    const AfsDevice nativeFs_ = makeSharedRef<NativeFileSystem>();
};
}


TEST_F(MirrorJobTest, TargetBecomesCopyOfSource)
{
    writeFile(tmp_ / "src/a.txt", "aaa");
    writeFile(tmp_ / "src/sub/b.txt", "bb");
    writeFile(tmp_ / "src/sub/deep/c.txt", "cccc");

    writeFile(tmp_ / "dst/a.txt", "a");
    writeFile(tmp_ / "dst/old.txt", "old");
    writeFile(tmp_ / "dst/oldDir/x.txt", "x");
    createDirectory(tmp_ / "dst/sub");

    SharedRef<MirrorJob> job = makeJob("src", "dst");
    JobTrace trace(job.ref(), tmp_.getPath());

    job.ref().run(false /*preview*/);

    EXPECT_EQ(readFile(tmp_ / "dst/a.txt"), "aaa");
    EXPECT_EQ(readFile(tmp_ / "dst/sub/b.txt"), "bb");
    EXPECT_EQ(readFile(tmp_ / "dst/sub/deep/c.txt"), "cccc");
    EXPECT_FALSE(itemExists(tmp_ / "dst/old.txt"));
    EXPECT_FALSE(itemExists(tmp_ / "dst/oldDir"));

    EXPECT_TRUE(trace.has(L"modified dst/a.txt"));
    EXPECT_TRUE(trace.has(L"created dst/sub/b.txt"));
    EXPECT_TRUE(trace.has(L"created dir dst/sub/deep"));
    EXPECT_TRUE(trace.has(L"created dst/sub/deep/c.txt"));
    EXPECT_TRUE(trace.has(L"deleted dst/old.txt"));
    EXPECT_TRUE(trace.has(L"deleted dir dst/oldDir"));
    EXPECT_EQ(trace.items.size(), 6u);

    EXPECT_EQ(trace.proceededFiles, 3u);
    EXPECT_EQ(trace.proceededBytes, 9u);
    EXPECT_EQ(trace.finished, 1u);
    EXPECT_EQ(job.ref().getWrittenBytes(), 9u);

    EXPECT_TRUE(takeExtraLog().empty());
}


TEST_F(MirrorJobTest, SameSizeFileIsNotCopied)
{
    writeFile(tmp_ / "src/a.txt", "new");
    writeFile(tmp_ / "dst/a.txt", "old");

    SharedRef<MirrorJob> job = makeJob("src", "dst");
    JobTrace trace(job.ref(), tmp_.getPath());

    job.ref().run(false /*preview*/);

    EXPECT_EQ(readFile(tmp_ / "dst/a.txt"), "old");
    EXPECT_TRUE(trace.items.empty());
    EXPECT_EQ(trace.proceededFiles, 1u);
    EXPECT_EQ(job.ref().getWrittenBytes(), 0u);
}


TEST_F(MirrorJobTest, MissingTargetIsCreated)
{
    writeFile(tmp_ / "src/a.txt", "a");

    SharedRef<MirrorJob> job = makeJob("src", "backup/dst");
    job.ref().run(false /*preview*/);

    EXPECT_EQ(readFile(tmp_ / "backup/dst/a.txt"), "a");
}


TEST_F(MirrorJobTest, PreviewChangesNothing)
{
    writeFile(tmp_ / "src/a.txt", "aaa");
    writeFile(tmp_ / "src/sub/b.txt", "bb");
    writeFile(tmp_ / "dst/old.txt", "old");

    SharedRef<MirrorJob> job = makeJob("src", "dst");
    JobTrace trace(job.ref(), tmp_.getPath());

    job.ref().run(true /*preview*/);

    EXPECT_FALSE(itemExists(tmp_ / "dst/a.txt"));
    EXPECT_FALSE(itemExists(tmp_ / "dst/sub"));
    EXPECT_TRUE(itemExists(tmp_ / "dst/old.txt"));

    //notifications describe what would happen
    EXPECT_TRUE(trace.has(L"created dst/a.txt"));
    EXPECT_TRUE(trace.has(L"created dir dst/sub"));
    EXPECT_TRUE(trace.has(L"created dst/sub/b.txt"));
    EXPECT_TRUE(trace.has(L"deleted dst/old.txt"));

    EXPECT_EQ(job.ref().getWrittenBytes(), 0u);
    EXPECT_EQ(trace.finished, 1u);
}


TEST_F(MirrorJobTest, PreviewOfMissingTarget)
{
    writeFile(tmp_ / "src/a.txt", "a");

    SharedRef<MirrorJob> job = makeJob("src", "dst");
    JobTrace trace(job.ref(), tmp_.getPath());

    job.ref().run(true /*preview*/);

    EXPECT_FALSE(itemExists(tmp_ / "dst"));
    EXPECT_TRUE(trace.has(L"created dst/a.txt"));
    EXPECT_TRUE(takeExtraLog().empty());
}


TEST_F(MirrorJobTest, MissingSourceIsLogged)
{
    writeFile(tmp_ / "dst/a.txt", "a");

    SharedRef<MirrorJob> job = makeJob("src", "dst");
    JobTrace trace(job.ref(), tmp_.getPath());

    job.ref().run(false /*preview*/);

    EXPECT_TRUE(itemExists(tmp_ / "dst/a.txt")); //nothing is deleted
    EXPECT_EQ(trace.finished, 1u);
    EXPECT_EQ(getStats(takeExtraLog()).error, 1);
}


TEST_F(MirrorJobTest, CopyErrorIsReportedAndRunContinues)
{
    writeFile(tmp_ / "src/a.bin", makeTestData(500));
    writeFile(tmp_ / "src/b.txt", "b");
    createDirectory(tmp_ / "dst");

    SharedRef<MirrorJob> job = makeJob("src", "dst", makeSharedRef<FailingWriteFileSystem>(100));
    JobTrace trace(job.ref(), tmp_.getPath());

    job.ref().run(false /*preview*/);

    EXPECT_FALSE(itemExists(tmp_ / "dst/a.bin"));
    EXPECT_EQ(readFile(tmp_ / "dst/b.txt"), "b");

    EXPECT_TRUE(trace.has(L"copy error src/a.bin"));
    EXPECT_TRUE(trace.has(L"created dst/b.txt"));
    EXPECT_FALSE(trace.has(L"created dst/a.bin"));
    EXPECT_EQ(trace.proceededFiles, 2u);
    EXPECT_EQ(job.ref().getWrittenBytes(), 1u);
    EXPECT_EQ(trace.finished, 1u);

    EXPECT_TRUE(logContains(takeExtraLog(), L"Simulated disk failure."));
}


TEST_F(MirrorJobTest, StopKeepsCompletedFiles)
{
    writeFile(tmp_ / "src/1.txt", "1");
    writeFile(tmp_ / "src/2.txt", "2");
    writeFile(tmp_ / "src/3.txt", "3");
    createDirectory(tmp_ / "dst");

    SharedRef<MirrorJob> job = makeJob("src", "dst");
    JobTrace trace(job.ref(), tmp_.getPath());

    job.ref().events().createdFile.subscribe([&](const FileCopyEvent& ce)
    {
        if (ce.sourceFile.getName() == "2.txt")
            job.ref().stop();
    });

    job.ref().run(false /*preview*/);

    EXPECT_TRUE (itemExists(tmp_ / "dst/1.txt"));
    EXPECT_TRUE (itemExists(tmp_ / "dst/2.txt"));
    EXPECT_FALSE(itemExists(tmp_ / "dst/3.txt"));
    EXPECT_EQ(trace.finished, 0u);
}


TEST_F(MirrorJobTest, CountFilesIsRecursive)
{
    writeFile(tmp_ / "src/a.txt", "aaa");
    writeFile(tmp_ / "src/sub/b.txt", "bb");
    writeFile(tmp_ / "src/sub/deep/c.txt", "cccc");
    createDirectory(tmp_ / "src/empty");

    EXPECT_EQ(makeJob("src", "dst").ref().countFiles(), (FileCounterResult{3, 9}));
    EXPECT_EQ(makeJob("src/empty", "dst").ref().countFiles(), FileCounterResult());
    EXPECT_THROW(makeJob("missing", "dst").ref().countFiles(), FileError);
}
