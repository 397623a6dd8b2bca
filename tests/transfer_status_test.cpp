#include <gtest/gtest.h>

#include <thread>
#include <vector>
#include "uartrx/transfer_status.h"

using namespace uartrx;

namespace {

TransferOutcome outcome(bool ok, size_t inserted) {
    TransferOutcome o;
    o.success = ok;
    o.records_inserted = inserted;
    o.completed_at = std::chrono::system_clock::now();
    return o;
}

} // namespace

TEST(TransferStatusTest, InitialSnapshot) {
    TransferStatus status;
    StatusSnapshot s = status.snapshot();
    EXPECT_FALSE(s.transfer_active);
    EXPECT_FALSE(s.last_transfer_ok.has_value());
    EXPECT_EQ(0u, s.total_transfers);
    EXPECT_FALSE(status.last_outcome().has_value());
}

TEST(TransferStatusTest, SnapshotsWithoutChangesAreEqual) {
    TransferStatus status;
    status.set_active(true);
    EXPECT_EQ(status.snapshot(), status.snapshot());
}

TEST(TransferStatusTest, OutcomeClearsActiveAndCounts) {
    TransferStatus status;
    status.set_active(true);
    EXPECT_TRUE(status.snapshot().transfer_active);

    status.record_outcome(outcome(false, 0));
    StatusSnapshot s = status.snapshot();
    EXPECT_FALSE(s.transfer_active);
    ASSERT_TRUE(s.last_transfer_ok.has_value());
    EXPECT_FALSE(*s.last_transfer_ok);
    EXPECT_EQ(1u, s.total_transfers);

    status.set_active(true);
    status.record_outcome(outcome(true, 12));
    s = status.snapshot();
    EXPECT_TRUE(*s.last_transfer_ok);
    EXPECT_EQ(2u, s.total_transfers);
    EXPECT_EQ(12u, status.last_outcome()->records_inserted);
}

TEST(TransferStatusTest, AbortDoesNotCountAsTransfer) {
    TransferStatus status;
    status.set_active(true);
    status.set_active(false);

    StatusSnapshot s = status.snapshot();
    EXPECT_FALSE(s.transfer_active);
    EXPECT_FALSE(s.last_transfer_ok.has_value());
    EXPECT_EQ(0u, s.total_transfers);
}

TEST(TransferStatusTest, ReadersSeeMonotonicTotals) {
    TransferStatus status;
    const int transfers = 500;

    std::thread writer([&status] {
        for (int i = 0; i < transfers; i++) {
            status.set_active(true);
            status.record_outcome(outcome(i % 2 == 0, 1));
        }
    });

    uint64_t last = 0;
    while (last < (uint64_t)transfers) {
        StatusSnapshot s = status.snapshot();
        ASSERT_GE(s.total_transfers, last);
        if (s.total_transfers > 0) {
            ASSERT_TRUE(s.last_transfer_ok.has_value());
        }
        last = s.total_transfers;
    }
    writer.join();
    EXPECT_EQ((uint64_t)transfers, status.snapshot().total_transfers);
}
