// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "inference/InferenceGlobal.hpp"

Q_LOGGING_CATEGORY(inferencelog, "kiln.inference")
