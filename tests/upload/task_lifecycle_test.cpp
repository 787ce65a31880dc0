#include "rup/upload/task_lifecycle.hpp"

#include <gtest/gtest.h>

using rup::upload::TaskLifecycle;
using rup::upload::TaskStatus;
using rup::upload::UploadTask;

namespace {

UploadTask make_task(std::size_t chunks) {
    UploadTask task;
    task.id = "task-1";
    task.file_name = "video.mp4";
    for (std::uint32_t i = 0; i < chunks; ++i) {
        task.chunk_plan.push_back({i, static_cast<std::uint64_t>(i) * 10, 10});
    }
    return task;
}

} // namespace

TEST(TaskLifecycleTest, FollowsNormalUploadPath) {
    auto task = make_task(2);

    EXPECT_TRUE(TaskLifecycle::transition(task, TaskStatus::Uploading).is_ok());
    EXPECT_TRUE(TaskLifecycle::transition(task, TaskStatus::Paused).is_ok());
    EXPECT_TRUE(TaskLifecycle::transition(task, TaskStatus::Pending).is_ok());
    EXPECT_TRUE(TaskLifecycle::transition(task, TaskStatus::Uploading).is_ok());
    EXPECT_TRUE(TaskLifecycle::transition(task, TaskStatus::Completed).is_ok());
    EXPECT_EQ(task.status, TaskStatus::Completed);
}

TEST(TaskLifecycleTest, TerminalStatesAreFinal) {
    auto task = make_task(1);
    ASSERT_TRUE(TaskLifecycle::transition(task, TaskStatus::Cancelled).is_ok());

    auto illegal = TaskLifecycle::transition(task, TaskStatus::Pending);
    ASSERT_TRUE(illegal.is_error());
    EXPECT_EQ(illegal.error().kind, rup::ErrorKind::InvalidInput);
    EXPECT_EQ(task.status, TaskStatus::Cancelled);

    EXPECT_FALSE(TaskLifecycle::can_transition(TaskStatus::Completed, TaskStatus::Uploading));
    EXPECT_FALSE(TaskLifecycle::can_transition(TaskStatus::Completed, TaskStatus::Failed));
}

TEST(TaskLifecycleTest, PausedCannotJumpToUploading) {
    EXPECT_FALSE(TaskLifecycle::can_transition(TaskStatus::Paused, TaskStatus::Uploading));
    EXPECT_FALSE(TaskLifecycle::can_transition(TaskStatus::AwaitingConflictResolution, TaskStatus::Uploading));
    EXPECT_TRUE(TaskLifecycle::can_transition(TaskStatus::AwaitingConflictResolution, TaskStatus::Pending));
}

TEST(TaskLifecycleTest, FailureRecordsErrorAndRetryClearsIt) {
    auto task = make_task(3);
    ASSERT_TRUE(TaskLifecycle::transition(task, TaskStatus::Uploading).is_ok());

    ASSERT_TRUE(TaskLifecycle::mark_failed(task, "Chunk upload failed: 500").is_ok());
    EXPECT_EQ(task.status, TaskStatus::Failed);
    ASSERT_TRUE(task.last_error.has_value());
    EXPECT_EQ(*task.last_error, "Chunk upload failed: 500");

    ASSERT_TRUE(TaskLifecycle::transition(task, TaskStatus::Pending).is_ok());
    EXPECT_FALSE(task.last_error.has_value());
}

TEST(TaskLifecycleTest, PendingTaskCannotFail) {
    auto task = make_task(1);

    EXPECT_TRUE(TaskLifecycle::mark_failed(task, "boom").is_error());
    EXPECT_EQ(task.status, TaskStatus::Pending);
    EXPECT_FALSE(task.last_error.has_value());
}

TEST(UploadTaskTest, ProgressIsFlooredPercentOfChunks) {
    auto task = make_task(3);
    EXPECT_EQ(task.progress_percent(), 0);

    task.uploaded_chunks.insert(0);
    EXPECT_EQ(task.progress_percent(), 33);

    task.uploaded_chunks.insert(2);
    EXPECT_EQ(task.progress_percent(), 66);
    ASSERT_TRUE(task.next_missing_chunk().has_value());
    EXPECT_EQ(task.next_missing_chunk()->index, 1u);

    task.uploaded_chunks.insert(1);
    EXPECT_TRUE(task.all_chunks_uploaded());
    EXPECT_FALSE(task.next_missing_chunk().has_value());
    EXPECT_EQ(task.progress_percent(), 100);
}

TEST(UploadTaskTest, StatusNamesRoundTrip) {
    for (auto status : {TaskStatus::Pending, TaskStatus::Uploading, TaskStatus::Paused,
                        TaskStatus::AwaitingConflictResolution, TaskStatus::Completed,
                        TaskStatus::Failed, TaskStatus::Cancelled}) {
        EXPECT_EQ(rup::upload::status_from_string(rup::upload::to_string(status)), status);
    }
    EXPECT_EQ(rup::upload::status_from_string("bogus"), TaskStatus::Pending);
}
