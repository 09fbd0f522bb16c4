/**
 * @file test_transfer_session.cpp
 * @brief Upload state machine against the simulated device: commit, abort paths, revert.
 */
#include "dlc/simulated_device.hpp"
#include "dlc/transfer_session.hpp"
#include "shared_test_helpers.h"

#include "gtest/gtest.h"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace plushlink::dlc;
using namespace plushlink::utils;
using namespace std::chrono_literals;
using plushlink::tests::helper::make_payload;

class TransferSessionTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        dev_opts_.max_write_size = 200;
        device_ = std::make_unique<SimulatedDevice>(dev_opts_);
        device_->set_notify_handler([this](std::span<const uint8_t> b)
                                    { router_.on_notification(b); });
        opts_.ready_timeout = 100ms;
        opts_.chunk_ack_timeout = 100ms;
        opts_.completion_timeout = 100ms;
    }

    std::unique_ptr<TransferSession> make_session()
    {
        return std::make_unique<TransferSession>(*device_, router_, registry_, protocol_,
                                                 dispatcher_, opts_);
    }

    ProtocolConfig protocol_;
    SimulatedDeviceOptions dev_opts_;
    std::unique_ptr<SimulatedDevice> device_;
    NotificationRouter router_{protocol_};
    SlotRegistry registry_{4};
    CallbackDispatcher dispatcher_;
    SessionOptions opts_;
};

TEST_F(TransferSessionTest, CommitsAndMarksSlotUploaded)
{
    auto session = make_session();
    const Bytes payload = make_payload(1600, 1);
    ASSERT_TRUE(session->request(2, payload.size()).is_ok());
    EXPECT_EQ(session->state(), SessionState::Reserved);
    EXPECT_EQ(registry_.state(2), SlotState::Uploading);

    auto r = session->run(payload);
    ASSERT_TRUE(r.is_ok()) << to_string(r.error());
    EXPECT_EQ(session->state(), SessionState::Committed);
    EXPECT_EQ(session->outcome(), SessionOutcome::Succeeded);
    EXPECT_EQ(session->bytes_sent(), 1600u);
    EXPECT_EQ(r.content().slot, 2);
    EXPECT_EQ(r.content().chunks_sent, 8u);
    EXPECT_EQ(registry_.state(2), SlotState::Uploaded);
    EXPECT_EQ(device_->slot_content(2), payload);

    const auto cmds = device_->writes_to(Endpoint::Command);
    ASSERT_EQ(cmds.size(), 1u);
    EXPECT_EQ(cmds[0], (Bytes{0x50, 0x02, 0x00, 0x06, 0x40, 0x00}));
}

TEST_F(TransferSessionTest, StepAckModeAnnouncesAndAwaitsAcks)
{
    opts_.ack_mode = true;
    auto session = make_session();
    const Bytes payload = make_payload(700);
    ASSERT_TRUE(session->request(0, payload.size()).is_ok());
    auto r = session->run(payload);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.content().acks_awaited, 4u);
    EXPECT_EQ(device_->writes_to(Endpoint::Command)[0].back(), 0x01);
}

TEST_F(TransferSessionTest, RequestValidatesInOrder)
{
    auto s1 = make_session();
    EXPECT_EQ(s1->request(4, 10).error(), TransferError::InvalidSlot);

    opts_.max_payload_bytes = 100;
    auto s2 = make_session();
    EXPECT_EQ(s2->request(1, 101).error(), TransferError::PayloadTooLarge);

    registry_.replace_all({SlotState::Empty, SlotState::Active, SlotState::Empty, SlotState::Empty});
    auto s3 = make_session();
    EXPECT_EQ(s3->request(1, 10).error(), TransferError::SlotInUse);
    // Nothing was reserved by the failed requests.
    EXPECT_FALSE(registry_.uploading_slot().has_value());
    EXPECT_TRUE(device_->writes().empty());
}

TEST_F(TransferSessionTest, SecondSessionIsBusy)
{
    auto first = make_session();
    ASSERT_TRUE(first->request(0, 10).is_ok());
    auto second = make_session();
    EXPECT_EQ(second->request(1, 10).error(), TransferError::SlotBusy);

    // Busy is reported even when the second target is the Active slot.
    registry_.replace_all({SlotState::Empty, SlotState::Empty, SlotState::Active,
                           SlotState::Empty});
    ASSERT_EQ(registry_.uploading_slot(), 0);
    auto third = make_session();
    EXPECT_EQ(third->request(2, 10).error(), TransferError::SlotBusy);
}

TEST_F(TransferSessionTest, MisuseThrows)
{
    auto session = make_session();
    const Bytes payload = make_payload(10);
    EXPECT_THROW((void)session->run(payload), std::logic_error);
    ASSERT_TRUE(session->request(0, 10).is_ok());
    EXPECT_THROW((void)session->request(1, 10), std::logic_error);
    EXPECT_THROW((void)session->run(make_payload(11)), std::logic_error);
}

TEST_F(TransferSessionTest, NoReadyAbortsAndRevertsSlot)
{
    registry_.replace_all({SlotState::Uploaded, SlotState::Empty, SlotState::Empty,
                           SlotState::Empty});
    device_->set_respond_ready(false);
    auto session = make_session();
    const Bytes payload = make_payload(300);
    ASSERT_TRUE(session->request(0, payload.size()).is_ok());
    auto r = session->run(payload);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), TransferError::NotReady);
    EXPECT_EQ(session->state(), SessionState::Aborted);
    EXPECT_EQ(session->failure(), TransferError::NotReady);
    EXPECT_EQ(registry_.state(0), SlotState::Uploaded);
    EXPECT_EQ(device_->file_write_count(), 0u);
}

TEST_F(TransferSessionTest, ReadyForAnotherSlotIsRejected)
{
    device_->set_ready_slot_override(3);
    auto session = make_session();
    const Bytes payload = make_payload(100);
    ASSERT_TRUE(session->request(1, payload.size()).is_ok());
    auto r = session->run(payload);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), TransferError::DeviceRejected);
    EXPECT_EQ(r.error_code(), protocol_.start_transfer_opcode);
    EXPECT_EQ(registry_.state(1), SlotState::Empty);
    EXPECT_EQ(device_->file_write_count(), 0u);
}

TEST_F(TransferSessionTest, MissingCompletionIsCompletionTimeout)
{
    device_->set_respond_complete(false);
    auto session = make_session();
    const Bytes payload = make_payload(400);
    ASSERT_TRUE(session->request(2, payload.size()).is_ok());
    auto r = session->run(payload);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), TransferError::CompletionTimeout);
    EXPECT_EQ(r.error_code(), 400);
    EXPECT_EQ(session->bytes_sent(), 400u);
    EXPECT_EQ(registry_.state(2), SlotState::Empty);
}

TEST_F(TransferSessionTest, FailedChunkAbortsWithOffset)
{
    device_->fail_file_write_at(2);
    auto session = make_session();
    const Bytes payload = make_payload(1000);
    ASSERT_TRUE(session->request(3, payload.size()).is_ok());
    auto r = session->run(payload);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), TransferError::ChunkFailed);
    EXPECT_EQ(r.error_code(), 400);
    EXPECT_EQ(registry_.state(3), SlotState::Empty);
    EXPECT_FALSE(registry_.uploading_slot().has_value());
}

TEST_F(TransferSessionTest, CancelIdleSessionAbortsWithoutReservation)
{
    auto session = make_session();
    session->cancel();
    EXPECT_EQ(session->state(), SessionState::Aborted);
    EXPECT_EQ(session->failure(), TransferError::Cancelled);
    EXPECT_THROW((void)session->request(0, 10), std::logic_error);
}

TEST_F(TransferSessionTest, CancelReservedSessionRevertsImmediately)
{
    auto session = make_session();
    ASSERT_TRUE(session->request(1, 10).is_ok());
    session->cancel();
    EXPECT_EQ(session->state(), SessionState::Aborted);
    EXPECT_EQ(registry_.state(1), SlotState::Empty);

    auto r = session->run(make_payload(10));
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), TransferError::Cancelled);
    EXPECT_TRUE(device_->writes().empty());
}

TEST_F(TransferSessionTest, CancelWakesRunningUpload)
{
    device_->set_respond_ready(false);
    opts_.ready_timeout = 10000ms;
    auto session = make_session();
    const Bytes payload = make_payload(100);
    ASSERT_TRUE(session->request(0, payload.size()).is_ok());

    std::thread canceller(
        [&]
        {
            while (session->state() != SessionState::Negotiating)
                std::this_thread::sleep_for(1ms);
            session->cancel();
        });
    const auto t0 = std::chrono::steady_clock::now();
    auto r = session->run(payload);
    canceller.join();
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 5000ms);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), TransferError::Cancelled);
    EXPECT_EQ(registry_.state(0), SlotState::Empty);
    // Cancelling a finished session changes nothing.
    session->cancel();
    EXPECT_EQ(session->failure(), TransferError::Cancelled);
}

TEST_F(TransferSessionTest, CancelWhileStreamingRestoresPreviousState)
{
    registry_.replace_all({SlotState::Empty, SlotState::Uploaded, SlotState::Empty,
                           SlotState::Empty});
    opts_.pacing = 10000ms;
    auto session = make_session();
    const Bytes payload = make_payload(1000);
    ASSERT_TRUE(session->request(1, payload.size()).is_ok());

    std::thread canceller(
        [&]
        {
            while (device_->file_write_count() < 1)
                std::this_thread::sleep_for(1ms);
            session->cancel();
        });
    auto r = session->run(payload);
    canceller.join();
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), TransferError::Cancelled);
    EXPECT_EQ(session->state(), SessionState::Aborted);
    EXPECT_LT(device_->file_write_count(), 5u);
    EXPECT_EQ(registry_.state(1), SlotState::Uploaded);
    EXPECT_FALSE(registry_.uploading_slot().has_value());
    EXPECT_EQ(router_.pending_count(), 0u);
}

TEST_F(TransferSessionTest, CancelWhileAwaitingChunkAckRestoresPreviousState)
{
    opts_.ack_mode = true;
    opts_.chunk_ack_timeout = 10000ms;
    device_->set_ack_chunks(false);
    auto session = make_session();
    const Bytes payload = make_payload(600);
    ASSERT_TRUE(session->request(3, payload.size()).is_ok());

    std::thread canceller(
        [&]
        {
            while (device_->file_write_count() < 1)
                std::this_thread::sleep_for(1ms);
            session->cancel();
        });
    const auto t0 = std::chrono::steady_clock::now();
    auto r = session->run(payload);
    canceller.join();
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 5000ms);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), TransferError::Cancelled);
    EXPECT_EQ(device_->file_write_count(), 1u);
    EXPECT_EQ(registry_.state(3), SlotState::Empty);
    EXPECT_EQ(router_.pending_count(), 0u);
}

TEST_F(TransferSessionTest, CancelWhileAwaitingCompletionRestoresPreviousState)
{
    registry_.replace_all({SlotState::Empty, SlotState::Empty, SlotState::Uploaded,
                           SlotState::Empty});
    opts_.completion_timeout = 10000ms;
    device_->set_respond_complete(false);
    auto session = make_session();
    const Bytes payload = make_payload(400);
    ASSERT_TRUE(session->request(2, payload.size()).is_ok());

    std::thread canceller(
        [&]
        {
            while (session->state() != SessionState::AwaitingCompletion)
                std::this_thread::sleep_for(1ms);
            session->cancel();
        });
    auto r = session->run(payload);
    canceller.join();
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), TransferError::Cancelled);
    EXPECT_EQ(session->bytes_sent(), 400u);
    EXPECT_EQ(registry_.state(2), SlotState::Uploaded);
    EXPECT_EQ(router_.pending_count(), 0u);
}

TEST_F(TransferSessionTest, DestroyingReservedSessionReleasesSlot)
{
    {
        auto session = make_session();
        ASSERT_TRUE(session->request(2, 10).is_ok());
        EXPECT_EQ(registry_.uploading_slot(), 2);
    }
    EXPECT_FALSE(registry_.uploading_slot().has_value());
    EXPECT_EQ(registry_.state(2), SlotState::Empty);
}

TEST_F(TransferSessionTest, LinkLossDuringCompletionWaitIsTransportFailure)
{
    device_->set_respond_complete(false);
    opts_.completion_timeout = 10000ms;
    device_->set_link_lost_handler([this] { router_.fail_all(WaitError::LinkLost); });
    auto session = make_session();
    const Bytes payload = make_payload(200);
    ASSERT_TRUE(session->request(0, payload.size()).is_ok());

    std::thread dropper(
        [&]
        {
            while (session->state() != SessionState::AwaitingCompletion)
                std::this_thread::sleep_for(1ms);
            device_->disconnect();
        });
    auto r = session->run(payload);
    dropper.join();
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), TransferError::TransportFailure);
    EXPECT_EQ(registry_.state(0), SlotState::Empty);
}
