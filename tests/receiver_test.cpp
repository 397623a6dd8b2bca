#include <gtest/gtest.h>

#include <string>
#include "fake_link.h"
#include "uartrx/receiver.h"

using namespace uartrx;
using uartrx::test::FakeLink;

namespace {

const std::string GPS_CSV =
    "utc_time,latitude,longitude,fix_quality,num_satellites,hdop,altitude,geoid_height\n"
    "123456.00,29.6516,-82.3248,1,8,1.2,30.5,0.0\n"
    "123457.00,29.6517,-82.3249,1,9,1.1,30.7,0.0\n";

class CountingArchive : public RawArchive {
public:
    int calls = 0;
    std::vector<uint8_t> last;

    bool archive_raw(const std::vector<uint8_t>& data) override {
        calls++;
        last = data;
        return true;
    }
};

class FailingStore : public MemoryRecordStore {
public:
    size_t persist_batch(const std::vector<GpsPoint>&) override {
        throw StoreError("disk full");
    }
};

} // namespace

class ReceiverTest : public ::testing::Test {
protected:
    FakeLink link;
    MemoryRecordStore store;
    CountingArchive archive;
    TransferStatus status;
    Receiver rx{link, store, archive, status};

    void send(uint8_t type, const std::vector<uint8_t>& payload = std::vector<uint8_t>()) {
        Frame f;
        f.type = type;
        f.payload = payload;
        rx.handle_frame(f);
    }

    // START, DATA in chunks of `chunk` bytes, END.
    void sendFile(const std::string& text, uint32_t declared, size_t chunk = 16) {
        send(TYPE_START, start_payload(declared));
        for (size_t off = 0; off < text.size(); off += chunk) {
            std::string part = text.substr(off, chunk);
            send(TYPE_DATA, std::vector<uint8_t>(part.begin(), part.end()));
        }
        send(TYPE_END);
    }

    size_t countType(uint8_t type) {
        size_t n = 0;
        for (const Frame& f : link.written_frames()) {
            if (f.type == type) {
                n++;
            }
        }
        return n;
    }

    // Status byte of the last COMMIT written, or -1 if there was none.
    int lastCommit() {
        std::vector<Frame> frames = link.written_frames();
        for (auto it = frames.rbegin(); it != frames.rend(); ++it) {
            if (it->type == TYPE_COMMIT && it->payload.size() == 1) {
                return it->payload[0];
            }
        }
        return -1;
    }
};

TEST_F(ReceiverTest, StartIsAckedAndArmsTransfer) {
    send(TYPE_START, start_payload(42));

    EXPECT_EQ(build_ack(), link.written());
    EXPECT_EQ(Receiver::RECEIVING, rx.state());
    EXPECT_EQ(42u, rx.expected_size());
    EXPECT_EQ(0u, rx.buffered_bytes());
    EXPECT_TRUE(status.snapshot().transfer_active);
}

TEST_F(ReceiverTest, StartWithoutSizeIsIgnoredWhenIdle) {
    send(TYPE_START, {0x01, 0x02});

    EXPECT_TRUE(link.written().empty());
    EXPECT_EQ(Receiver::IDLE, rx.state());
    EXPECT_FALSE(status.snapshot().transfer_active);
}

TEST_F(ReceiverTest, OtherFramesAreIgnoredWhenIdle) {
    send(TYPE_DATA, {'1', '2'});
    send(TYPE_END);
    send(TYPE_ACK);
    send(0x42);

    EXPECT_TRUE(link.written().empty());
    EXPECT_EQ(Receiver::IDLE, rx.state());
    EXPECT_EQ(0u, status.snapshot().total_transfers);
}

TEST_F(ReceiverTest, CompleteTransferCommitsOk) {
    sendFile(GPS_CSV, (uint32_t)GPS_CSV.size());

    size_t chunks = (GPS_CSV.size() + 15) / 16;
    EXPECT_EQ(chunks + 2, countType(TYPE_ACK));
    EXPECT_EQ(1u, countType(TYPE_COMMIT));
    EXPECT_EQ(COMMIT_OK, lastCommit());
    EXPECT_EQ(TYPE_COMMIT, link.written_frames().back().type);

    ASSERT_EQ(2u, store.count());
    EXPECT_DOUBLE_EQ(29.6516, store.all()[0].latitude);
    EXPECT_EQ(1, archive.calls);
    EXPECT_EQ(GPS_CSV, std::string(archive.last.begin(), archive.last.end()));

    EXPECT_EQ(Receiver::IDLE, rx.state());
    StatusSnapshot s = status.snapshot();
    EXPECT_FALSE(s.transfer_active);
    ASSERT_TRUE(s.last_transfer_ok.has_value());
    EXPECT_TRUE(*s.last_transfer_ok);
    EXPECT_EQ(1u, s.total_transfers);

    std::optional<TransferOutcome> o = status.last_outcome();
    ASSERT_TRUE(o.has_value());
    EXPECT_TRUE(o->success);
    EXPECT_EQ(GPS_CSV.size(), o->bytes_received);
    EXPECT_EQ(2u, o->records_inserted);
    EXPECT_EQ(1u, o->rows_skipped);
    EXPECT_LT(o->commit_latency_ms, (int64_t)COMMIT_DEADLINE_MS);
}

TEST_F(ReceiverTest, ShortTransferCommitsFail) {
    sendFile(GPS_CSV, (uint32_t)GPS_CSV.size() + 10);

    EXPECT_EQ(COMMIT_FAIL, lastCommit());
    EXPECT_EQ(0u, store.count());
    EXPECT_EQ(0, archive.calls);
    EXPECT_FALSE(*status.snapshot().last_transfer_ok);
    EXPECT_EQ(1u, status.snapshot().total_transfers);
}

TEST_F(ReceiverTest, OverrunIsCappedAndCommitsFail) {
    send(TYPE_START, start_payload(4));
    send(TYPE_DATA, {'1', '.', '0', ','});
    send(TYPE_DATA, {'2', '.', '0'});

    EXPECT_EQ(4u, rx.buffered_bytes());
    EXPECT_TRUE(rx.overflowed());
    EXPECT_EQ(3u, countType(TYPE_ACK));

    send(TYPE_END);
    EXPECT_EQ(COMMIT_FAIL, lastCommit());
    EXPECT_EQ(0u, store.count());
}

TEST_F(ReceiverTest, SizeCorrectButNoRecordsCommitsFail) {
    std::string header_only =
        "utc_time,latitude,longitude,fix_quality,num_satellites,hdop,altitude,geoid_height\n";
    sendFile(header_only, (uint32_t)header_only.size());

    EXPECT_EQ(COMMIT_FAIL, lastCommit());
    EXPECT_EQ(0u, store.count());
    EXPECT_EQ(1, archive.calls); // kept for diagnosis
    EXPECT_FALSE(*status.snapshot().last_transfer_ok);
}

TEST_F(ReceiverTest, RestartDiscardsPreviousBuffer) {
    std::string stale = "999999.00,1.0,1.0,1,1,1.0,1.0,1.0\n";
    send(TYPE_START, start_payload(500));
    send(TYPE_DATA, std::vector<uint8_t>(stale.begin(), stale.end()));
    ASSERT_EQ(stale.size(), rx.buffered_bytes());

    sendFile(GPS_CSV, (uint32_t)GPS_CSV.size());

    EXPECT_EQ(COMMIT_OK, lastCommit());
    std::vector<GpsPoint> points = store.all();
    ASSERT_EQ(2u, points.size());
    for (const GpsPoint& p : points) {
        EXPECT_NE("999999.00", p.utc_time);
    }
    EXPECT_EQ(1u, status.snapshot().total_transfers);
}

TEST_F(ReceiverTest, RestartWithoutSizeKeepsDeclaredSize) {
    send(TYPE_START, start_payload(77));
    send(TYPE_DATA, {'x'});
    send(TYPE_START, {});

    EXPECT_EQ(Receiver::RECEIVING, rx.state());
    EXPECT_EQ(77u, rx.expected_size());
    EXPECT_EQ(0u, rx.buffered_bytes());
    EXPECT_EQ(3u, countType(TYPE_ACK));
}

TEST_F(ReceiverTest, UnexpectedFrameWhileReceivingIsNotAcked) {
    send(TYPE_START, start_payload(10));
    link.clear_written();

    send(TYPE_ACK);
    send(TYPE_COMMIT, {0x00});
    send(0x42, {1, 2, 3});

    EXPECT_TRUE(link.written().empty());
    EXPECT_EQ(Receiver::RECEIVING, rx.state());
    EXPECT_EQ(0u, rx.buffered_bytes());
}

TEST_F(ReceiverTest, WriteFailureAbortsToIdle) {
    send(TYPE_START, start_payload(10));
    link.set_fail_writes(true);

    Frame data;
    data.type = TYPE_DATA;
    data.payload = {'a'};
    EXPECT_THROW(rx.handle_frame(data), LinkError);

    EXPECT_EQ(Receiver::IDLE, rx.state());
    EXPECT_EQ(0u, rx.buffered_bytes());
    EXPECT_FALSE(status.snapshot().transfer_active);
    EXPECT_EQ(0u, status.snapshot().total_transfers);
}

TEST_F(ReceiverTest, AbortDropsTransfer) {
    send(TYPE_START, start_payload(10));
    send(TYPE_DATA, {'a', 'b'});

    rx.abort();

    EXPECT_EQ(Receiver::IDLE, rx.state());
    EXPECT_EQ(0u, rx.buffered_bytes());
    EXPECT_FALSE(status.snapshot().transfer_active);

    // END after the abort belongs to no transfer.
    link.clear_written();
    send(TYPE_END);
    EXPECT_TRUE(link.written().empty());
}

TEST_F(ReceiverTest, StoreFailureCommitsFail) {
    FailingStore failing;
    Receiver failing_rx(link, failing, archive, status);

    Frame f;
    f.type = TYPE_START;
    f.payload = start_payload((uint32_t)GPS_CSV.size());
    failing_rx.handle_frame(f);
    f.type = TYPE_DATA;
    f.payload.assign(GPS_CSV.begin(), GPS_CSV.end());
    failing_rx.handle_frame(f);
    f.type = TYPE_END;
    f.payload.clear();
    failing_rx.handle_frame(f);

    EXPECT_EQ(COMMIT_FAIL, lastCommit());
    EXPECT_FALSE(*status.snapshot().last_transfer_ok);
}

TEST_F(ReceiverTest, NextTransferSupersedesOutcome) {
    sendFile(GPS_CSV, (uint32_t)GPS_CSV.size() + 1);
    EXPECT_FALSE(*status.snapshot().last_transfer_ok);

    sendFile(GPS_CSV, (uint32_t)GPS_CSV.size());
    StatusSnapshot s = status.snapshot();
    EXPECT_TRUE(*s.last_transfer_ok);
    EXPECT_EQ(2u, s.total_transfers);
    EXPECT_EQ(2u, status.last_outcome()->records_inserted);
}
