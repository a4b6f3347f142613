// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef I18_N_H_3843489325044253425456
#define I18_N_H_3843489325044253425456

#include <string>


//marks user-visible text: JobSync ships English only, so _() yields the text unchanged

#define ZEN_TRANS_CONCAT_SUB(X, Y) X ## Y
#define _(s) std::wstring(ZEN_TRANS_CONCAT_SUB(L, s))

#endif //I18_N_H_3843489325044253425456
