// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/Result.hpp"

// Early returns for functions that report through Utils::Result.

#define UTILS_GUARD_OK(cond, msg) \
    do { \
        if (!(cond)) \
            return ::Utils::Result::failure((msg)); \
    } while (false)

#define UTILS_RETURN_IF_FAILED(expr) \
    do { \
        if (::Utils::Result _utilsResult = (expr); !_utilsResult) \
            return _utilsResult; \
    } while (false)
