/**
 * @file test_dlc_controller.cpp
 * @brief End-to-end DLC flows through DlcController and the simulated device.
 */
#include "dlc/dlc_controller.hpp"
#include "dlc/simulated_device.hpp"
#include "shared_test_helpers.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace plushlink::dlc;
using namespace std::chrono_literals;
using plushlink::tests::helper::make_payload;
using ::testing::ElementsAre;

namespace
{
constexpr auto E = SlotState::Empty;
constexpr auto D = SlotState::Uploaded;
constexpr auto A = SlotState::Active;

template <typename Pred> bool wait_until(Pred pred, std::chrono::milliseconds timeout = 2000ms)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred())
    {
        if (std::chrono::steady_clock::now() > deadline)
            return false;
        std::this_thread::sleep_for(1ms);
    }
    return true;
}
} // namespace

class DlcControllerTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        SimulatedDeviceOptions dev;
        dev.max_write_size = 200;
        device_ = std::make_unique<SimulatedDevice>(dev);

        options_.session.ready_timeout = 100ms;
        options_.session.chunk_ack_timeout = 100ms;
        options_.session.completion_timeout = 100ms;
        options_.lifecycle = LifecycleOptions{100ms, 100ms};
        controller_ = std::make_unique<DlcController>(*device_, options_);
    }

    void TearDown() override
    {
        controller_.reset();
        device_.reset();
    }

    UploadParams chunked(size_t chunk, bool ack = false)
    {
        UploadParams p;
        p.chunk_size = chunk;
        p.ack_mode = ack;
        return p;
    }

    DlcOptions options_;
    std::unique_ptr<SimulatedDevice> device_;
    std::unique_ptr<DlcController> controller_;
};

TEST_F(DlcControllerTest, InitializeReadsDeviceSlotTable)
{
    device_->set_slot_states({D, A, E, E});
    auto r = controller_->initialize();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(controller_->slot_status(), (SlotSnapshot{D, A, E, E}));
}

TEST_F(DlcControllerTest, InitializeWithSilentDeviceAssumesEmpty)
{
    device_->set_answer_status(false);
    auto r = controller_->initialize();
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), TransferError::Unacknowledged);
    EXPECT_EQ(controller_->slot_status(), (SlotSnapshot{E, E, E, E}));
}

TEST_F(DlcControllerTest, StreamingUploadOf1600BytesIn200ByteChunks)
{
    const Bytes payload = make_payload(1600, 5);
    std::mutex mu;
    std::vector<size_t> progress;
    UploadParams params = chunked(200);
    params.progress = [&](size_t sent, size_t total)
    {
        std::lock_guard<std::mutex> lock(mu);
        EXPECT_EQ(total, 1600u);
        progress.push_back(sent);
    };

    auto r = controller_->upload(2, payload, params);
    controller_->flush_callbacks();
    ASSERT_TRUE(r.is_ok()) << to_string(r.error());
    EXPECT_EQ(r.content().chunks_sent, 8u);
    EXPECT_EQ(r.content().chunk_size, 200u);
    EXPECT_EQ(r.content().total_bytes, 1600u);
    EXPECT_EQ(device_->file_write_count(), 8u);
    EXPECT_EQ(device_->slot_content(2), payload);
    EXPECT_EQ(controller_->slot_status(), (SlotSnapshot{E, E, D, E}));
    EXPECT_FALSE(controller_->upload_in_flight());

    std::lock_guard<std::mutex> lock(mu);
    EXPECT_THAT(progress, ElementsAre(200u, 400u, 600u, 800u, 1000u, 1200u, 1400u, 1600u));
}

TEST_F(DlcControllerTest, StepAckUpload)
{
    const Bytes payload = make_payload(1000);
    auto r = controller_->upload(1, payload, chunked(100, true));
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.content().chunks_sent, 10u);
    EXPECT_EQ(r.content().acks_awaited, 10u);
    EXPECT_EQ(controller_->slot_status()[1], D);
}

TEST_F(DlcControllerTest, ChunkSizeAboveLinkLimitIsClamped)
{
    device_->set_max_write_size(20);
    auto r = controller_->upload(0, make_payload(100), chunked(200));
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.content().chunk_size, 20u);
    EXPECT_EQ(r.content().chunks_sent, 5u);
}

TEST_F(DlcControllerTest, EmptyPayloadUploadsAsOneEmptyWrite)
{
    auto r = controller_->upload(0, Bytes{}, {});
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.content().chunks_sent, 1u);
    EXPECT_EQ(device_->file_write_count(), 1u);
    EXPECT_EQ(controller_->slot_status()[0], D);
}

TEST_F(DlcControllerTest, UploadValidationErrors)
{
    EXPECT_EQ(controller_->upload(4, make_payload(10), {}).error(), TransferError::InvalidSlot);
    EXPECT_EQ(controller_->upload(-1, make_payload(10), {}).error(), TransferError::InvalidSlot);
    EXPECT_TRUE(device_->writes().empty());
}

TEST_F(DlcControllerTest, PayloadTooLarge)
{
    options_.session.max_payload_bytes = 64;
    DlcController limited(*device_, options_);
    auto r = limited.upload(0, make_payload(65), {});
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), TransferError::PayloadTooLarge);
    EXPECT_TRUE(device_->writes().empty());
}

TEST_F(DlcControllerTest, DeviceNeverReadyIsNotReady)
{
    device_->set_respond_ready(false);
    auto r = controller_->upload(1, make_payload(300), {});
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), TransferError::NotReady);
    EXPECT_EQ(controller_->slot_status()[1], E);
    EXPECT_EQ(device_->file_write_count(), 0u);
}

TEST_F(DlcControllerTest, MissingCompletionRevertsPreviousContent)
{
    ASSERT_TRUE(controller_->upload(3, make_payload(200), {}).is_ok());
    device_->set_respond_complete(false);
    auto r = controller_->upload(3, make_payload(400), {});
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), TransferError::CompletionTimeout);
    EXPECT_EQ(controller_->slot_status()[3], D);
}

TEST_F(DlcControllerTest, FailedChunkReportsOffset)
{
    device_->fail_file_write_at(5);
    auto r = controller_->upload(0, make_payload(1600), chunked(200));
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), TransferError::ChunkFailed);
    EXPECT_EQ(r.error_code(), 1000);
    EXPECT_EQ(controller_->slot_status()[0], E);
}

TEST_F(DlcControllerTest, LinkLossMidUploadIsTransportFailure)
{
    device_->set_ack_chunks(false);
    options_.session.chunk_ack_timeout = 10000ms;
    DlcController ctl(*device_, options_);

    auto fut = std::async(std::launch::async,
                          [&] { return ctl.upload(0, make_payload(1000), chunked(200, true)); });
    ASSERT_TRUE(wait_until([&] { return device_->file_write_count() >= 1; }));
    device_->disconnect();
    auto r = fut.get();
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), TransferError::TransportFailure);
    EXPECT_EQ(ctl.slot_status()[0], E);
    EXPECT_FALSE(ctl.upload_in_flight());

    // Subsequent operations fail fast on the dead link.
    EXPECT_EQ(ctl.upload(1, make_payload(10), {}).error(), TransferError::TransportFailure);
}

TEST_F(DlcControllerTest, SecondUploadAndDeleteWhileUploadingAreBusy)
{
    device_->set_respond_ready(false);
    options_.session.ready_timeout = 10000ms;
    DlcController ctl(*device_, options_);

    auto fut = std::async(std::launch::async, [&] { return ctl.upload(1, make_payload(300), {}); });
    ASSERT_TRUE(wait_until([&] { return ctl.upload_in_flight(); }));

    EXPECT_EQ(ctl.upload(2, make_payload(10), {}).error(), TransferError::SlotBusy);
    EXPECT_EQ(ctl.delete_slot(1).error(), TransferError::SlotBusy);

    ASSERT_TRUE(wait_until([&] { return ctl.cancel_upload(); }));
    auto r = fut.get();
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), TransferError::Cancelled);
    EXPECT_FALSE(ctl.upload_in_flight());
    EXPECT_EQ(ctl.slot_status()[1], E);
}

TEST_F(DlcControllerTest, SecondUploadIntoActiveSlotIsBusyWhileUploading)
{
    options_.session.ready_timeout = 10000ms;
    DlcController ctl(*device_, options_);
    ASSERT_TRUE(ctl.upload(1, make_payload(100), {}).is_ok());
    ASSERT_TRUE(ctl.activate(1).is_ok());

    device_->set_respond_ready(false);
    auto fut = std::async(std::launch::async, [&] { return ctl.upload(0, make_payload(300), {}); });
    ASSERT_TRUE(wait_until([&] { return ctl.upload_in_flight(); }));

    EXPECT_EQ(ctl.upload(1, make_payload(10), {}).error(), TransferError::SlotBusy);
    EXPECT_EQ(ctl.slot_status()[1], A);

    ASSERT_TRUE(wait_until([&] { return ctl.cancel_upload(); }));
    EXPECT_EQ(fut.get().error(), TransferError::Cancelled);
    EXPECT_EQ(ctl.slot_status(), (SlotSnapshot{E, A, E, E}));
}

TEST_F(DlcControllerTest, CancelWithoutUploadReturnsFalse)
{
    EXPECT_FALSE(controller_->cancel_upload());
}

TEST_F(DlcControllerTest, FullLifecycleUploadLoadActivateTrigger)
{
    ASSERT_TRUE(controller_->upload(2, make_payload(500), {}).is_ok());
    ASSERT_TRUE(controller_->load(2).is_ok());
    ASSERT_TRUE(controller_->activate(2).is_ok());
    EXPECT_EQ(controller_->slot_status(), (SlotSnapshot{E, E, A, E}));

    ASSERT_TRUE(controller_->trigger_action(1, 0, 0).is_ok());
    ASSERT_TRUE(device_->last_trigger().has_value());
    EXPECT_EQ(*device_->last_trigger(), (Bytes{0x13, 0x00, 75, 0x01, 0x00, 0x00}));

    // Active content cannot be overwritten or deleted.
    EXPECT_EQ(controller_->upload(2, make_payload(10), {}).error(), TransferError::SlotInUse);
    EXPECT_EQ(controller_->delete_slot(2).error(), TransferError::SlotInUse);

    ASSERT_TRUE(controller_->deactivate().is_ok());
    ASSERT_TRUE(controller_->delete_slot(2).is_ok());
    EXPECT_EQ(controller_->slot_status(), (SlotSnapshot{E, E, E, E}));
    EXPECT_TRUE(device_->slot_content(2).empty());
}

TEST_F(DlcControllerTest, TriggerNeedsActiveSlot)
{
    auto r = controller_->trigger_action(1, 0, 0);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), TransferError::NoActiveSlot);
    EXPECT_FALSE(device_->last_trigger().has_value());
}

TEST_F(DlcControllerTest, LoadOfEmptySlotIsRefused)
{
    EXPECT_EQ(controller_->load(0).error(), TransferError::SlotNotUploaded);
    EXPECT_EQ(controller_->activate(0).error(), TransferError::SlotNotUploaded);
}

TEST_F(DlcControllerTest, SlotListenerFollowsUpload)
{
    std::vector<SlotSnapshot> seen;
    controller_->set_slot_listener([&](const SlotSnapshot &s) { seen.push_back(s); });
    ASSERT_TRUE(controller_->upload(1, make_payload(50), {}).is_ok());
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0][1], SlotState::Uploading);
    EXPECT_EQ(seen[1][1], D);
}

TEST_F(DlcControllerTest, QueryStatusAfterDeviceSideChange)
{
    ASSERT_TRUE(controller_->upload(0, make_payload(50), {}).is_ok());
    device_->set_slot_states({E, D, D, A});
    auto r = controller_->query_status();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(controller_->slot_status(), (SlotSnapshot{E, D, D, A}));
}

TEST_F(DlcControllerTest, UnsolicitedNotificationsAreDropped)
{
    device_->inject_notification(Bytes{0x24, 0x03});
    device_->inject_notification(Bytes{0x09});
    EXPECT_EQ(controller_->router().dropped_count(), 2u);
    // A stale completion does not let a later upload commit early.
    device_->set_respond_complete(false);
    EXPECT_EQ(controller_->upload(0, make_payload(10), {}).error(),
              TransferError::CompletionTimeout);
}

TEST_F(DlcControllerTest, EverySlotAcceptsFullyAcknowledgedUploadsOfAnySize)
{
    for (int slot = 0; slot < 4; ++slot)
    {
        for (size_t size : {0u, 1u, 199u, 200u, 201u, 1600u})
        {
            const Bytes payload = make_payload(size, static_cast<uint8_t>(slot));
            auto r = controller_->upload(slot, payload, chunked(200, true));
            ASSERT_TRUE(r.is_ok()) << "slot " << slot << " size " << size;
            EXPECT_EQ(r.content().acks_awaited, ChunkScheduler::chunk_count(size, 200));
            EXPECT_EQ(device_->slot_content(slot), payload);

            const SlotSnapshot snap = controller_->slot_status();
            EXPECT_EQ(snap[static_cast<size_t>(slot)], D);
            EXPECT_FALSE(controller_->upload_in_flight());
        }
    }
}

TEST_F(DlcControllerTest, ActivateMovesActiveFromSlotOneToSlotTwo)
{
    device_->set_slot_states({E, A, E, E});
    ASSERT_TRUE(controller_->initialize().is_ok());
    ASSERT_TRUE(controller_->upload(2, make_payload(1600), chunked(200)).is_ok());
    ASSERT_TRUE(controller_->activate(2).is_ok());
    EXPECT_EQ(controller_->slot_status(), (SlotSnapshot{E, D, A, E}));
    EXPECT_EQ(device_->slot_states(), controller_->slot_status());
}
