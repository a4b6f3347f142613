// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The JobSync Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef FILE_COUNTER_H_4782309457823490572345
#define FILE_COUNTER_H_4782309457823490572345

#include <cstdint>


namespace jsync
{
//best-effort estimate of the work ahead: progress denominator only
struct FileCounterResult
{
    uint64_t countedFiles = 0;
    uint64_t countedBytes = 0; //unit: bytes!

    bool operator==(const FileCounterResult&) const = default;
};


inline
FileCounterResult& operator+=(FileCounterResult& lhs, const FileCounterResult& rhs)
{
    lhs.countedFiles += rhs.countedFiles;
    lhs.countedBytes += rhs.countedBytes;
    return lhs;
}


inline
FileCounterResult operator+(FileCounterResult lhs, const FileCounterResult& rhs) { return lhs += rhs; }
}

#endif //FILE_COUNTER_H_4782309457823490572345
