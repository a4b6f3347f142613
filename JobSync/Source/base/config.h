// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef CONFIG_H_3458723049857230948572
#define CONFIG_H_3458723049857230948572

#include <vector>
#include <zen/zstring.h>
#include <zen/file_error.h>


namespace jsync
{
struct JobConfig
{
    std::wstring name; //empty: use source folder name
    Zstring sourceFolderPath;
    Zstring targetFolderPath;

    bool operator==(const JobConfig&) const = default;
};


struct JobSyncConfig
{
    std::vector<JobConfig> jobs;
    bool preview = false;
    Zstring logFolderPath; //empty: no log file

    bool operator==(const JobSyncConfig&) const = default;
};


//missing elements are set to default values and reported via warningMsg
void readConfig(const Zstring& filePath, JobSyncConfig& cfg, std::wstring& warningMsg); //throw FileError
void writeConfig(const JobSyncConfig& cfg, const Zstring& filePath); //throw FileError

std::wstring getJobName(const JobConfig& jobCfg);
}

#endif //CONFIG_H_3458723049857230948572
