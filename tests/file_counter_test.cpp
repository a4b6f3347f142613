// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The JobSync Authors - All Rights Reserved                   *
// *****************************************************************************

#include <vector>
#include <gtest/gtest.h>
#include "../JobSync/Source/base/file_counter.h"

using namespace jsync;


TEST(FileCounterResult, EmptyIsIdentity)
{
    const FileCounterResult fc{3, 1000};

    EXPECT_EQ(fc + FileCounterResult(), fc);
    EXPECT_EQ(FileCounterResult() + fc, fc);
    EXPECT_EQ(FileCounterResult(), (FileCounterResult{0, 0}));
}


TEST(FileCounterResult, CombineIsCommutativeAndAssociative)
{
    const FileCounterResult a{1, 10};
    const FileCounterResult b{2, 200};
    const FileCounterResult c{5, 3000};

    EXPECT_EQ(a + b, b + a);
    EXPECT_EQ((a + b) + c, a + (b + c));
    EXPECT_EQ(a + b + c, (FileCounterResult{8, 3210}));
}


TEST(FileCounterResult, SumOverJobs)
{
    const std::vector<FileCounterResult> perJob{{2, 20}, {0, 0}, {5, 500}};

    FileCounterResult total;
    for (const FileCounterResult& fc : perJob)
        total += fc;

    EXPECT_EQ(total.countedFiles, 7u);
    EXPECT_EQ(total.countedBytes, 520u);
}
