// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef RETURN_CODES_H_81307482137054156
#define RETURN_CODES_H_81307482137054156

#include <cassert>
#include <zen/i18n.h>


namespace jsync
{
enum JsyncReturnCode //as returned after process exit
{
    JSYNC_RC_SUCCESS = 0,
    JSYNC_RC_WARNING,
    JSYNC_RC_ERROR,
    JSYNC_RC_ABORTED,
};


inline
void raiseReturnCode(JsyncReturnCode& rc, JsyncReturnCode rcProposed)
{
    if (rc < rcProposed)
        rc = rcProposed;
}


enum class SyncResult
{
    finishedSuccess,
    finishedWarning,
    finishedError,
    aborted,
};


inline
JsyncReturnCode mapToReturnCode(SyncResult syncStatus)
{
    switch (syncStatus)
    {
        case SyncResult::finishedSuccess:
            return JSYNC_RC_SUCCESS;
        case SyncResult::finishedWarning:
            return JSYNC_RC_WARNING;
        case SyncResult::finishedError:
            return JSYNC_RC_ERROR;
        case SyncResult::aborted:
            return JSYNC_RC_ABORTED;
    }
    assert(false);
    return JSYNC_RC_ABORTED;
}


inline
std::wstring getFinalStatusLabel(SyncResult finalStatus)
{
    switch (finalStatus)
    {
        case SyncResult::finishedSuccess:
            return _("Completed successfully");
        case SyncResult::finishedWarning:
            return _("Completed with warnings");
        case SyncResult::finishedError:
            return _("Completed with errors");
        case SyncResult::aborted:
            return _("Stopped");
    }
    assert(false);
    return std::wstring();
}
}

#endif //RETURN_CODES_H_81307482137054156
