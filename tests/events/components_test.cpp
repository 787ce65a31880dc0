#include "rup/events/components.hpp"
#include "rup/events/event_bus.hpp"
#include "rup/events/events.hpp"

#include <gtest/gtest.h>

using rup::events::ConflictBatchEvent;
using rup::events::EventBus;
using rup::events::LoggerComponent;
using rup::events::TransferStatsComponent;
using rup::events::UploadCancelledEvent;
using rup::events::UploadProgressEvent;
using rup::upload::ConflictRecord;
using rup::upload::TaskStatus;

TEST(TransferStatsComponentTest, CountsTerminalOutcomesAndConflicts) {
    EventBus bus;
    TransferStatsComponent stats(bus);

    bus.emit(UploadProgressEvent{"t1", "a.bin", 40, TaskStatus::Uploading, std::nullopt});
    bus.emit(UploadProgressEvent{"t1", "a.bin", 100, TaskStatus::Completed, std::nullopt});
    bus.emit(UploadProgressEvent{"t2", "b.bin", 10, TaskStatus::Failed, std::string("Upload failed: 500")});
    bus.emit(UploadCancelledEvent{"t3"});

    ConflictBatchEvent batch;
    batch.round_id = 1;
    batch.conflicts.push_back(ConflictRecord{"t4", "docs/c.txt", {}});
    batch.conflicts.push_back(ConflictRecord{"t5", "docs/d.txt", {}});
    bus.emit(batch);

    EXPECT_EQ(stats.completed(), 1u);
    EXPECT_EQ(stats.failed(), 1u);
    EXPECT_EQ(stats.cancelled(), 1u);
    EXPECT_EQ(stats.conflicts(), 2u);
}

TEST(LoggerComponentTest, SubscribesToUploadEventsAndUnsubscribesOnDestruction) {
    EventBus bus;
    {
        LoggerComponent logger(bus);
        EXPECT_EQ(bus.subscriber_count<UploadProgressEvent>(), 1u);
        EXPECT_EQ(bus.subscriber_count<ConflictBatchEvent>(), 1u);

        EXPECT_NO_THROW(bus.emit(UploadProgressEvent{"t1", "a.bin", 100, TaskStatus::Completed, std::nullopt}));
        EXPECT_NO_THROW(bus.emit(UploadProgressEvent{"t2", "b.bin", 0, TaskStatus::Failed, std::nullopt}));
    }
    EXPECT_EQ(bus.subscriber_count<UploadProgressEvent>(), 0u);
}
