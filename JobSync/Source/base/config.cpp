// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "config.h"
#include <zen/file_path.h>
#include <zenxml/xml.h>

using namespace zen;
using namespace jsync;

//-------------------------------------------------------------------------------------------------------------------------------
const int XML_FORMAT_JOBS_CFG = 1; //2026-10-19
//-------------------------------------------------------------------------------------------------------------------------------


namespace
{
std::string getConfigType(const XmlDoc& doc)
{
    if (doc.root().getName() == "JobSync")
    {
        std::string type;
        if (doc.root().getAttribute("XmlType", type))
            return type;
    }
    return {};
}


void readConfig(const XmlIn& in, JobSyncConfig& cfg, int /*formatVer*/)
{
    cfg.jobs.clear();

    in["Jobs"].visitChildren([&](const XmlIn& inJob)
    {
        JobConfig jobCfg;
        if (inJob.hasAttribute("Name"))
            inJob.attribute("Name", jobCfg.name);
        inJob["Source"](jobCfg.sourceFolderPath);
        inJob["Target"](jobCfg.targetFolderPath);

        cfg.jobs.push_back(jobCfg);
    });

    in["Preview"].attribute("Enabled", cfg.preview);
    in["LogFolder"](cfg.logFolderPath);
}


void writeConfig(const JobSyncConfig& cfg, XmlOut& out)
{
    XmlOut outJobs = out["Jobs"];
    for (const JobConfig& jobCfg : cfg.jobs)
    {
        XmlOut outJob = outJobs.addChild("Job");
        outJob.attribute("Name", jobCfg.name);
        outJob["Source"](jobCfg.sourceFolderPath);
        outJob["Target"](jobCfg.targetFolderPath);
    }

    out["Preview"].attribute("Enabled", cfg.preview);
    out["LogFolder"](cfg.logFolderPath);
}
}


void jsync::readConfig(const Zstring& filePath, JobSyncConfig& cfg, std::wstring& warningMsg) //throw FileError
{
    XmlDoc doc = loadXml(filePath); //throw FileError

    if (getConfigType(doc) != "JOBS")
        throw FileError(replaceCpy(_("File %x does not contain a valid configuration."), L"%x", fmtPath(filePath)));

    int formatVer = 0;
    /*bool success =*/ doc.root().getAttribute("XmlFormat", formatVer);

    XmlIn in(doc);
    ::readConfig(in, cfg, formatVer);

    warningMsg.clear();
    if (const std::wstring& errors = in.getErrors();
        !errors.empty())
        warningMsg = replaceCpy(_("Configuration file %x is incomplete. The missing elements have been set to their default values."), L"%x", fmtPath(filePath)) + L"\n\n" +
                     _("The following XML elements could not be read:") + L'\n' + errors;
}


void jsync::writeConfig(const JobSyncConfig& cfg, const Zstring& filePath) //throw FileError
{
    XmlDoc doc("JobSync");
    doc.root().setAttribute("XmlType", "JOBS");
    doc.root().setAttribute("XmlFormat", XML_FORMAT_JOBS_CFG);

    XmlOut out(doc);
    ::writeConfig(cfg, out);

    saveXml(doc, filePath); //throw FileError
}


std::wstring jsync::getJobName(const JobConfig& jobCfg)
{
    if (!jobCfg.name.empty())
        return jobCfg.name;

    return utfTo<std::wstring>(getItemName(normalizeSeparators(jobCfg.sourceFolderPath)));
}
