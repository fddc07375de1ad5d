// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "inference/ComfyProtocol.hpp"
#include "inference/PromptTracker.hpp"

#include <QtCore/QObject>
#include <QtTest/QSignalSpy>

using namespace Qt::StringLiterals;
namespace Protocol = Inference::ComfyProtocol;
using Inference::ComfyTask;
using Inference::PromptTracker;

namespace {

Protocol::SocketEvent frame(const char* json)
{
    QString error;
    Protocol::SocketEvent event = Protocol::parseTextFrame(QByteArray(json), &error);
    EXPECT_TRUE(error.isEmpty()) << error.toStdString();
    return event;
}

} // namespace

TEST(PromptTrackerTests, RoutesEventsToTheirTask)
{
    QObject owner;
    PromptTracker tracker;
    ComfyTask* task = tracker.createTask(u"p"_s, &owner);
    QSignalSpy progress(task, &ComfyTask::progressUpdated);
    QSignalSpy completed(task, &ComfyTask::completed);

    tracker.dispatch(frame(R"({"type":"executing","data":{"node":"Sampler","prompt_id":"p"}})"));
    tracker.dispatch(frame(R"({"type":"progress","data":{"value":3,"max":20,"prompt_id":"p"}})"));
    EXPECT_EQ(task->runningNode(), u"Sampler"_s);
    EXPECT_EQ(progress.count(), 1);

    tracker.dispatch(frame(R"({"type":"executing","data":{"node":null,"prompt_id":"p"}})"));
    EXPECT_EQ(completed.count(), 1);
    EXPECT_EQ(task->state(), ComfyTask::State::Completed);
}

TEST(PromptTrackerTests, CompletionBeforeAcceptanceIsReplayed)
{
    QObject owner;
    PromptTracker tracker;

    tracker.dispatch(frame(R"({"type":"executing","data":{"node":null,"prompt_id":"p"}})"));
    EXPECT_EQ(tracker.earlyOutcomeCount(), 1);

    ComfyTask* task = tracker.createTask(u"p"_s, &owner);
    EXPECT_EQ(task->state(), ComfyTask::State::Completed);
    EXPECT_EQ(tracker.earlyOutcomeCount(), 0);
}

TEST(PromptTrackerTests, FailureBeforeAcceptanceIsReplayed)
{
    QObject owner;
    PromptTracker tracker;

    tracker.dispatch(frame(R"({"type":"execution_interrupted","data":{"prompt_id":"q"}})"));

    ComfyTask* task = tracker.createTask(u"q"_s, &owner);
    EXPECT_EQ(task->state(), ComfyTask::State::Failed);
    EXPECT_EQ(task->errorMessage(), u"Interrupted"_s);

    ComfyTask* other = tracker.createTask(u"r"_s, &owner);
    EXPECT_EQ(other->state(), ComfyTask::State::Pending);
}

TEST(PromptTrackerTests, EarlyOutcomesAreBounded)
{
    PromptTracker tracker;
    for (int i = 0; i < PromptTracker::kMaxEarlyOutcomes + 5; ++i) {
        Protocol::SocketEvent done;
        done.type = Protocol::SocketEvent::Type::Executing;
        done.promptId = u"p%1"_s.arg(i);
        tracker.dispatch(done);
    }
    EXPECT_EQ(tracker.earlyOutcomeCount(), PromptTracker::kMaxEarlyOutcomes);

    QObject owner;
    EXPECT_EQ(tracker.createTask(u"p0"_s, &owner)->state(), ComfyTask::State::Pending);
    EXPECT_EQ(tracker.createTask(u"p%1"_s.arg(PromptTracker::kMaxEarlyOutcomes + 4), &owner)->state(), ComfyTask::State::Completed);
}

TEST(PromptTrackerTests, FailAllSettlesRunningTasks)
{
    QObject owner;
    PromptTracker tracker;
    ComfyTask* running = tracker.createTask(u"a"_s, &owner);
    ComfyTask* done = tracker.createTask(u"b"_s, &owner);
    done->complete();
    QSignalSpy failed(running, &ComfyTask::failed);

    tracker.failAll(u"Connection to the backend was closed."_s);

    ASSERT_EQ(failed.count(), 1);
    EXPECT_EQ(failed.first().at(0).toString(), u"Connection to the backend was closed."_s);
    EXPECT_EQ(done->state(), ComfyTask::State::Completed);
    EXPECT_EQ(tracker.taskFor(u"a"_s), nullptr);
}

TEST(PromptTrackerTests, DestroyedTasksAreNotRevived)
{
    PromptTracker tracker;
    {
        QObject owner;
        tracker.createTask(u"gone"_s, &owner);
    }
    EXPECT_EQ(tracker.taskFor(u"gone"_s), nullptr);

    tracker.dispatch(frame(R"({"type":"executing","data":{"node":null,"prompt_id":"gone"}})"));
    EXPECT_EQ(tracker.earlyOutcomeCount(), 0);
}
