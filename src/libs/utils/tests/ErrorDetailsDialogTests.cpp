// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "utils/ui/ErrorDetailsDialog.hpp"

#include <QtWidgets/QApplication>

#include <memory>

using Utils::ErrorDetailsDialog;

namespace {

std::unique_ptr<QApplication> ensureApp()
{
    if (QCoreApplication::instance())
        return {};
    static int argc = 1;
    static char arg0[] = "kiln-utils-tests";
    static char* argv[] = {arg0, nullptr};
    return std::make_unique<QApplication>(argc, argv);
}

} // namespace

TEST(ErrorDetailsDialogTests, JsonBodiesAreIndented)
{
    const QString text = ErrorDetailsDialog::formatResponseBody(
        R"({"error":{"type":"prompt_outputs_failed_validation"}})");
    EXPECT_TRUE(text.contains(QStringLiteral("\n")));
    EXPECT_TRUE(text.contains(QStringLiteral("prompt_outputs_failed_validation")));
}

TEST(ErrorDetailsDialogTests, PlainBodiesAreKeptAsText)
{
    EXPECT_EQ(ErrorDetailsDialog::formatResponseBody("  Bad Gateway \n"), QStringLiteral("Bad Gateway"));
    EXPECT_TRUE(ErrorDetailsDialog::formatResponseBody({}).isEmpty());
}

TEST(ErrorDetailsDialogTests, EmptyResponseCannotBeShown)
{
    auto app = ensureApp();

    ErrorDetailsDialog empty(QStringLiteral("API Error"), QStringLiteral("Rejected"), {});
    empty.setResponseVisible(true);
    EXPECT_FALSE(empty.isResponseVisible());
    EXPECT_EQ(empty.windowTitle(), QStringLiteral("API Error"));

    ErrorDetailsDialog full(QStringLiteral("API Error"), QStringLiteral("Rejected"), "{\"node_errors\":{}}");
    full.setResponseVisible(true);
    EXPECT_TRUE(full.isResponseVisible());
    full.setResponseVisible(false);
    EXPECT_FALSE(full.isResponseVisible());
}
