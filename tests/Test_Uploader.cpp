#include <gtest/gtest.h>
#include <cstddef>
#include <cstring>
#include <memory>
#include <utility>
#include <vector>

#include "RHI.Vulkan.hpp"

import RHI;
import Core;

#include "UploadTestDoubles.h"

using namespace UploadTest;

namespace {

class UploaderTest : public ::testing::Test
{
protected:
    FakeStagingAllocator m_Staging;
    FakeTranscoder m_Transcoder;
    FakeQueue m_Queue;
    RHI::Uploader m_Uploader{m_Staging, m_Transcoder};

    [[nodiscard]] EncoderLog& Log() const { return *m_Queue.Log; }

    // Direct-path encoder whose log is separate from the queue's.
    std::shared_ptr<EncoderLog> m_DirectLog = std::make_shared<EncoderLog>();
    RecordingEncoder m_Direct{m_DirectLog};
};

// -----------------------------------------------------------------------------
// Empty payloads
// -----------------------------------------------------------------------------

TEST_F(UploaderTest, EmptyPayloadsQueueNothingAndFlushSubmitsNothing)
{
    const std::vector<std::byte> empty;
    const auto desc = MakeImageDesc(VK_FORMAT_R8G8B8A8_UNORM, VK_FORMAT_R8G8B8A8_UNORM);

    EXPECT_TRUE(m_Uploader.UploadBuffer(FakeBuffer(1), 0, empty).has_value());
    EXPECT_TRUE(m_Uploader.UploadImage(desc, empty).has_value());
    EXPECT_FALSE(m_Uploader.HasPendingUploads());
    EXPECT_EQ(m_Staging.Allocations, 0u);

    ASSERT_TRUE(m_Uploader.Flush(m_Queue).has_value());
    EXPECT_EQ(m_Queue.CreatedEncoders, 0u);
    EXPECT_EQ(m_Queue.SubmittedBatches, 0u);
    EXPECT_EQ(m_Uploader.GetFlushCount(), 0u);
}

TEST_F(UploaderTest, EmptyPayloadsOnTheDirectPathRecordNothing)
{
    const std::vector<std::byte> empty;
    const auto desc = MakeImageDesc(VK_FORMAT_R8G8B8_UNORM, VK_FORMAT_R8G8B8A8_UNORM);

    EXPECT_TRUE(m_Uploader.UploadBufferWith(FakeHandle<VkBuffer>(1), 0, empty, m_Direct).has_value());
    EXPECT_TRUE(m_Uploader.UploadImageWith(desc, empty, m_Direct).has_value());
    EXPECT_TRUE(m_DirectLog->Calls.empty());
    EXPECT_EQ(m_Staging.Allocations, 0u);
}

// -----------------------------------------------------------------------------
// Queue draining
// -----------------------------------------------------------------------------

TEST_F(UploaderTest, FlushDrainsQueueExactlyOnce)
{
    constexpr uint32_t kUploads = 7;
    for (uint32_t i = 0; i < kUploads; ++i)
    {
        ASSERT_TRUE(m_Uploader.EnqueueBufferUpload(FakeStagingAllocator::MakeStaging(64), FakeBuffer(0x10 + i),
                                                   i * 64, RHI::AccessAll, RHI::AccessAll).has_value());
    }
    EXPECT_EQ(m_Uploader.GetPendingBufferUploads(), kUploads);

    ASSERT_TRUE(m_Uploader.Flush(m_Queue).has_value());

    EXPECT_EQ(m_Uploader.GetPendingBufferUploads(), 0u);
    EXPECT_EQ(Log().Count("CopyBuffer"), kUploads);
    EXPECT_EQ(m_Queue.SubmittedBatches, 1u);
    EXPECT_EQ(m_Queue.SubmittedEncoders, 1u);
    EXPECT_EQ(Log().Ended, 1u);

    // Nothing left: the second flush is a no-op.
    ASSERT_TRUE(m_Uploader.Flush(m_Queue).has_value());
    EXPECT_EQ(m_Queue.CreatedEncoders, 1u);
    EXPECT_EQ(m_Uploader.GetFlushCount(), 1u);
}

TEST_F(UploaderTest, BufferCopiesUsePayloadSizeAndDestinationOffset)
{
    const auto data = Bytes(10);
    ASSERT_TRUE(m_Uploader.UploadBuffer(FakeBuffer(1), 256, data).has_value());
    ASSERT_TRUE(m_Uploader.Flush(m_Queue).has_value());

    ASSERT_EQ(Log().BufferCopies.size(), 1u);
    EXPECT_EQ(Log().BufferCopies[0].srcOffset, 0u);
    EXPECT_EQ(Log().BufferCopies[0].dstOffset, 256u);
    EXPECT_EQ(Log().BufferCopies[0].size, 10u);
    ASSERT_EQ(m_Staging.Usages.size(), 1u);
    EXPECT_EQ(m_Staging.Usages[0], RHI::StagingUsage::TransferSrc);
}

// -----------------------------------------------------------------------------
// Barrier bracketing
// -----------------------------------------------------------------------------

TEST_F(UploaderTest, BufferPhaseEmitsTwoBarriersRegardlessOfUploadCount)
{
    for (uint32_t count : {1u, 5u, 32u})
    {
        FakeQueue queue;
        for (uint32_t i = 0; i < count; ++i)
        {
            const VkAccessFlags2 oldAccess = (i % 2) ? VK_ACCESS_2_SHADER_READ_BIT : VK_ACCESS_2_UNIFORM_READ_BIT;
            const VkAccessFlags2 newAccess = (i % 2) ? VK_ACCESS_2_VERTEX_ATTRIBUTE_READ_BIT : VK_ACCESS_2_INDEX_READ_BIT;
            ASSERT_TRUE(m_Uploader.EnqueueBufferUpload(FakeStagingAllocator::MakeStaging(16), FakeBuffer(1),
                                                       0, oldAccess, newAccess).has_value());
        }
        ASSERT_TRUE(m_Uploader.Flush(queue).has_value());

        const EncoderLog& log = *queue.Log;
        ASSERT_EQ(log.GlobalBarriers.size(), 2u) << "count=" << count;
        EXPECT_EQ(log.Count("ImageBarriers"), 0u);

        // Enter, N copies, exit.
        ASSERT_EQ(log.Calls.size(), count + 2);
        EXPECT_EQ(log.Calls.front(), "GlobalMemoryBarrier");
        EXPECT_EQ(log.Calls.back(), "GlobalMemoryBarrier");

        const auto& enter = log.GlobalBarriers.front();
        EXPECT_EQ(enter.SrcStages, VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT);
        EXPECT_EQ(enter.DstStages, VK_PIPELINE_STAGE_2_TRANSFER_BIT);
        EXPECT_EQ(enter.DstAccess, VK_ACCESS_2_TRANSFER_WRITE_BIT);

        const auto& exit = log.GlobalBarriers.back();
        EXPECT_EQ(exit.SrcStages, VK_PIPELINE_STAGE_2_TRANSFER_BIT);
        EXPECT_EQ(exit.SrcAccess, VK_ACCESS_2_TRANSFER_WRITE_BIT);
        EXPECT_EQ(exit.DstStages, VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT);

        if (count > 1)
        {
            EXPECT_EQ(enter.SrcAccess, VK_ACCESS_2_SHADER_READ_BIT | VK_ACCESS_2_UNIFORM_READ_BIT);
            EXPECT_EQ(exit.DstAccess, VK_ACCESS_2_VERTEX_ATTRIBUTE_READ_BIT | VK_ACCESS_2_INDEX_READ_BIT);
        }
        else
        {
            EXPECT_EQ(enter.SrcAccess, VK_ACCESS_2_UNIFORM_READ_BIT);
            EXPECT_EQ(exit.DstAccess, VK_ACCESS_2_INDEX_READ_BIT);
        }
    }
}

TEST_F(UploaderTest, ImagePhaseBatchesLayoutTransitionsIntoTwoCalls)
{
    constexpr uint32_t kImages = 6;
    for (uint32_t i = 0; i < kImages; ++i)
    {
        auto desc = MakeImageDesc(VK_FORMAT_R8G8B8A8_UNORM, VK_FORMAT_R8G8B8A8_UNORM, 2, 2, 0x2000 + i);
        desc.NewLayout = (i % 2) ? VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL : VK_IMAGE_LAYOUT_GENERAL;
        ASSERT_TRUE(m_Uploader.UploadImage(desc, Bytes(16)).has_value());
    }
    ASSERT_TRUE(m_Uploader.Flush(m_Queue).has_value());

    const EncoderLog& log = Log();
    ASSERT_EQ(log.ImageBarriers.size(), 2u);
    EXPECT_EQ(log.GlobalBarriers.size(), 0u);
    EXPECT_EQ(log.Count("CopyBufferToImage"), kImages);

    const auto& enter = log.ImageBarriers.front();
    const auto& exit = log.ImageBarriers.back();
    ASSERT_EQ(enter.Barriers.size(), kImages);
    ASSERT_EQ(exit.Barriers.size(), kImages);

    EXPECT_EQ(enter.SrcStages, VK_PIPELINE_STAGE_2_TOP_OF_PIPE_BIT);
    EXPECT_EQ(enter.DstStages, VK_PIPELINE_STAGE_2_TRANSFER_BIT);
    EXPECT_EQ(exit.SrcStages, VK_PIPELINE_STAGE_2_TRANSFER_BIT);
    EXPECT_EQ(exit.DstStages, VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT);

    for (uint32_t i = 0; i < kImages; ++i)
    {
        EXPECT_FALSE(enter.Barriers[i].OldLayout.has_value());
        EXPECT_EQ(enter.Barriers[i].NewLayout, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL);
        EXPECT_EQ(enter.Barriers[i].NewAccess, VK_ACCESS_2_TRANSFER_WRITE_BIT);

        ASSERT_TRUE(exit.Barriers[i].OldLayout.has_value());
        EXPECT_EQ(*exit.Barriers[i].OldLayout, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL);
        EXPECT_EQ(exit.Barriers[i].NewLayout,
                  (i % 2) ? VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL : VK_IMAGE_LAYOUT_GENERAL);
        EXPECT_EQ(exit.Barriers[i].NewAccess, RHI::AccessAll);
    }
}

TEST_F(UploaderTest, ImagePhaseEnterStageCoversPriorAccess)
{
    auto desc = MakeImageDesc(VK_FORMAT_R8G8B8A8_UNORM, VK_FORMAT_R8G8B8A8_UNORM);
    desc.OldLayout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;
    desc.OldAccess = VK_ACCESS_2_SHADER_SAMPLED_READ_BIT;
    ASSERT_TRUE(m_Uploader.UploadImage(desc, Bytes(64)).has_value());
    ASSERT_TRUE(m_Uploader.Flush(m_Queue).has_value());

    ASSERT_EQ(Log().ImageBarriers.size(), 2u);
    const auto& enter = Log().ImageBarriers.front();
    EXPECT_EQ(enter.SrcStages, VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT);
    ASSERT_EQ(enter.Barriers.size(), 1u);
    ASSERT_TRUE(enter.Barriers[0].OldLayout.has_value());
    EXPECT_EQ(*enter.Barriers[0].OldLayout, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);
    EXPECT_EQ(enter.Barriers[0].OldAccess, VK_ACCESS_2_SHADER_SAMPLED_READ_BIT);
}

TEST_F(UploaderTest, BufferPhaseRunsBeforeImagePhaseInOneSubmission)
{
    ASSERT_TRUE(m_Uploader.UploadBuffer(FakeBuffer(1), 0, Bytes(32)).has_value());
    ASSERT_TRUE(m_Uploader.UploadBuffer(FakeBuffer(2), 0, Bytes(32)).has_value());
    ASSERT_TRUE(m_Uploader.UploadImage(MakeImageDesc(VK_FORMAT_R8G8B8A8_UNORM, VK_FORMAT_R8G8B8A8_UNORM),
                                       Bytes(64)).has_value());
    ASSERT_TRUE(m_Uploader.Flush(m_Queue).has_value());

    const std::vector<std::string> expected{
        "GlobalMemoryBarrier", "CopyBuffer", "CopyBuffer", "GlobalMemoryBarrier",
        "ImageBarriers", "CopyBufferToImage", "ImageBarriers",
    };
    EXPECT_EQ(Log().Calls, expected);
    EXPECT_EQ(m_Queue.SubmittedBatches, 1u);
}

// -----------------------------------------------------------------------------
// Copy vs transcode
// -----------------------------------------------------------------------------

TEST_F(UploaderTest, IdentityFormatsNeverInvokeTheTranscoder)
{
    auto desc = MakeImageDesc(VK_FORMAT_R8G8B8A8_SRGB, VK_FORMAT_R8G8B8A8_SRGB, 8, 4);
    desc.RowLength = 8;
    ASSERT_TRUE(m_Uploader.UploadImage(desc, Bytes(8 * 4 * 4)).has_value());
    ASSERT_TRUE(m_Uploader.Flush(m_Queue).has_value());

    EXPECT_EQ(m_Transcoder.Calls, 0u);
    EXPECT_EQ(Log().Count("CopyBufferToImage"), 1u);
    ASSERT_EQ(Log().BufferImageCopies.size(), 1u);
    EXPECT_EQ(Log().BufferImageCopies[0].bufferRowLength, 8u);
    EXPECT_EQ(Log().BufferImageCopies[0].imageExtent.width, 8u);
    EXPECT_EQ(Log().BufferImageCopies[0].imageExtent.height, 4u);

    ASSERT_TRUE(m_Uploader.UploadImageWith(desc, Bytes(8 * 4 * 4), m_Direct).has_value());
    EXPECT_EQ(m_Transcoder.Calls, 0u);
    EXPECT_EQ(m_DirectLog->Count("CopyBufferToImage"), 1u);
    EXPECT_EQ(m_DirectLog->Count("ImageBarriers"), 2u);
    EXPECT_EQ(m_Staging.Usages.back(), RHI::StagingUsage::TransferSrc);
}

TEST_F(UploaderTest, RgbSourcesGoThroughTheTranscoder)
{
    auto desc = MakeImageDesc(VK_FORMAT_R8G8B8_SRGB, VK_FORMAT_R8G8B8A8_SRGB, 3, 2);
    desc.RowLength = 4;
    // Padded rows: (1 * 4 + 3) texels * 3 bytes.
    ASSERT_TRUE(m_Uploader.UploadImage(desc, Bytes(21)).has_value());
    ASSERT_TRUE(m_Uploader.Flush(m_Queue).has_value());

    EXPECT_EQ(m_Transcoder.Calls, 1u);
    EXPECT_EQ(m_Transcoder.LastRowLength, 4u);
    EXPECT_EQ(m_Transcoder.LastSource, VK_FORMAT_R8G8B8_SRGB);
    EXPECT_EQ(m_Transcoder.LastDestination, VK_FORMAT_R8G8B8A8_SRGB);
    EXPECT_EQ(Log().Count("CopyBufferToImage"), 0u);
    ASSERT_EQ(m_Staging.Usages.size(), 1u);
    EXPECT_EQ(m_Staging.Usages[0], RHI::StagingUsage::UniformTexel);

    // The transcoder records between the two batched transitions.
    const std::vector<std::string> expected{"ImageBarriers", "CopyImage", "ImageBarriers"};
    EXPECT_EQ(Log().Calls, expected);
}

TEST_F(UploaderTest, TranscodedEnqueueNeedsATexelStagingBuffer)
{
    const auto desc = MakeImageDesc(VK_FORMAT_R8G8B8_UNORM, VK_FORMAT_R8G8B8A8_UNORM, 2, 2);
    auto staging = FakeStagingAllocator::MakeStaging(12, RHI::StagingUsage::TransferSrc);

    auto result = m_Uploader.EnqueueImageUpload(std::move(staging), desc);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::InvalidArgument);
    EXPECT_EQ(m_Uploader.GetPendingImageUploads(), 0u);
}

// -----------------------------------------------------------------------------
// Unsupported format pairs
// -----------------------------------------------------------------------------

TEST_F(UploaderTest, UnsupportedFormatPairsAreRejectedBeforeAnythingIsQueued)
{
    const VkFormat formats[] = {
        VK_FORMAT_R8_UNORM,         VK_FORMAT_R8G8_UNORM,          VK_FORMAT_R8G8B8_UNORM,
        VK_FORMAT_R8G8B8_SRGB,      VK_FORMAT_B8G8R8_UNORM,        VK_FORMAT_R8G8B8A8_UNORM,
        VK_FORMAT_R8G8B8A8_SRGB,    VK_FORMAT_B8G8R8A8_UNORM,      VK_FORMAT_B8G8R8A8_SRGB,
        VK_FORMAT_R16G16B16A16_SFLOAT, VK_FORMAT_R32G32B32A32_SFLOAT, VK_FORMAT_BC7_UNORM_BLOCK,
    };

    uint32_t rejected = 0;
    for (VkFormat source : formats)
    {
        for (VkFormat destination : formats)
        {
            if (source == destination || RHI::IsSupportedConversion(source, destination))
                continue;

            const auto desc = MakeImageDesc(source, destination, 2, 2);
            const auto data = Bytes(256);

            auto queued = m_Uploader.UploadImage(desc, data);
            ASSERT_FALSE(queued.has_value()) << source << " -> " << destination;
            EXPECT_EQ(queued.error(), Core::ErrorCode::UnsupportedConversion);

            auto direct = m_Uploader.UploadImageWith(desc, data, m_Direct);
            ASSERT_FALSE(direct.has_value());
            EXPECT_EQ(direct.error(), Core::ErrorCode::UnsupportedConversion);

            auto enqueued = m_Uploader.EnqueueImageUpload(
                FakeStagingAllocator::MakeStaging(256, RHI::StagingUsage::UniformTexel), desc);
            ASSERT_FALSE(enqueued.has_value());
            EXPECT_EQ(enqueued.error(), Core::ErrorCode::UnsupportedConversion);
            ++rejected;
        }
    }

    EXPECT_GT(rejected, 100u);
    EXPECT_EQ(m_Uploader.GetPendingImageUploads(), 0u);
    EXPECT_EQ(m_Staging.Allocations, 0u);
    EXPECT_EQ(m_Transcoder.Calls, 0u);
    EXPECT_TRUE(m_DirectLog->Calls.empty());
}

TEST_F(UploaderTest, UndefinedFormatsAreInvalid)
{
    const auto desc = MakeImageDesc(VK_FORMAT_UNDEFINED, VK_FORMAT_R8G8B8A8_UNORM);
    auto result = m_Uploader.UploadImage(desc, Bytes(64));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::InvalidFormat);
}

TEST_F(UploaderTest, PayloadSmallerThanRegionIsRejected)
{
    const auto desc = MakeImageDesc(VK_FORMAT_R8G8B8A8_UNORM, VK_FORMAT_R8G8B8A8_UNORM, 4, 4);
    auto result = m_Uploader.UploadImage(desc, Bytes(4 * 4 * 4 - 1));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::InvalidArgument);
    EXPECT_EQ(m_Staging.Allocations, 0u);
}

// -----------------------------------------------------------------------------
// Inline vs staged direct buffer uploads
// -----------------------------------------------------------------------------

TEST_F(UploaderTest, SmallDirectBufferUploadsStayInline)
{
    for (size_t size : {4u, 256u, 16384u})
    {
        ASSERT_TRUE(m_Uploader.UploadBufferWith(FakeHandle<VkBuffer>(1), 0, Bytes(size), m_Direct).has_value());
    }
    EXPECT_EQ(m_Staging.Allocations, 0u);
    EXPECT_EQ(m_DirectLog->Count("UpdateBuffer"), 3u);
    EXPECT_EQ(m_DirectLog->Count("CopyBuffer"), 0u);
    EXPECT_EQ(m_DirectLog->InlineUpdateSizes.back(), 16384u);
}

TEST_F(UploaderTest, LargeDirectBufferUploadsAreStaged)
{
    for (size_t size : {16388u, 65536u, 1u << 20})
    {
        ASSERT_TRUE(m_Uploader.UploadBufferWith(FakeHandle<VkBuffer>(1), 128, Bytes(size), m_Direct).has_value());
    }
    EXPECT_EQ(m_Staging.Allocations, 3u);
    EXPECT_EQ(m_DirectLog->Count("UpdateBuffer"), 0u);
    ASSERT_EQ(m_DirectLog->BufferCopies.size(), 3u);
    EXPECT_EQ(m_DirectLog->BufferCopies[0].size, 16388u);
    EXPECT_EQ(m_DirectLog->BufferCopies[0].dstOffset, 128u);
    EXPECT_FALSE(m_Uploader.HasPendingUploads());
}

TEST_F(UploaderTest, InlineLimitFollowsConfig)
{
    RHI::Uploader uploader(m_Staging, m_Transcoder, RHI::UploaderConfig{.InlineUpdateLimit = 256});

    ASSERT_TRUE(uploader.UploadBufferWith(FakeHandle<VkBuffer>(1), 0, Bytes(256), m_Direct).has_value());
    ASSERT_TRUE(uploader.UploadBufferWith(FakeHandle<VkBuffer>(1), 0, Bytes(260), m_Direct).has_value());

    EXPECT_EQ(m_DirectLog->Count("UpdateBuffer"), 1u);
    EXPECT_EQ(m_DirectLog->Count("CopyBuffer"), 1u);
    EXPECT_EQ(m_Staging.Allocations, 1u);
}

TEST_F(UploaderTest, DirectStagingFailureIsReported)
{
    m_Staging.Fail = Core::ErrorCode::OutOfMemory;

    auto result = m_Uploader.UploadBufferWith(FakeHandle<VkBuffer>(1), 0, Bytes(32768), m_Direct);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::OutOfMemory);
    EXPECT_TRUE(m_DirectLog->Calls.empty());
}

// -----------------------------------------------------------------------------
// Failure keeps the backlog
// -----------------------------------------------------------------------------

TEST_F(UploaderTest, TranscoderFailureLeavesQueueIntactAndSubmitsNothing)
{
    ASSERT_TRUE(m_Uploader.UploadBuffer(FakeBuffer(1), 0, Bytes(16)).has_value());
    ASSERT_TRUE(m_Uploader.UploadImage(MakeImageDesc(VK_FORMAT_R8G8B8_UNORM, VK_FORMAT_R8G8B8A8_UNORM, 2, 2),
                                       Bytes(12)).has_value());

    m_Transcoder.Fail = Core::ErrorCode::OutOfMemory;
    auto failed = m_Uploader.Flush(m_Queue);
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error(), Core::ErrorCode::OutOfMemory);

    EXPECT_EQ(m_Uploader.GetPendingBufferUploads(), 1u);
    EXPECT_EQ(m_Uploader.GetPendingImageUploads(), 1u);
    EXPECT_EQ(m_Queue.SubmittedBatches, 0u);
    EXPECT_EQ(Log().Ended, 0u);
    EXPECT_EQ(Log().Destroyed, 1u);

    // Retrying replays the whole backlog.
    m_Transcoder.Fail.reset();
    m_Queue.Log->Calls.clear();
    ASSERT_TRUE(m_Uploader.Flush(m_Queue).has_value());
    EXPECT_FALSE(m_Uploader.HasPendingUploads());
    EXPECT_EQ(m_Queue.SubmittedBatches, 1u);
    EXPECT_EQ(Log().Count("CopyBuffer"), 1u);
    EXPECT_EQ(m_Transcoder.Calls, 2u);
}

TEST_F(UploaderTest, EncoderCreationFailureLeavesQueueIntact)
{
    ASSERT_TRUE(m_Uploader.UploadBuffer(FakeBuffer(1), 0, Bytes(16)).has_value());
    m_Queue.FailCreate = Core::ErrorCode::OutOfDeviceMemory;

    auto failed = m_Uploader.Flush(m_Queue);
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error(), Core::ErrorCode::OutOfDeviceMemory);
    EXPECT_EQ(m_Uploader.GetPendingBufferUploads(), 1u);
}

TEST_F(UploaderTest, SubmitFailureLeavesQueueIntact)
{
    ASSERT_TRUE(m_Uploader.UploadImage(MakeImageDesc(VK_FORMAT_R8G8B8A8_UNORM, VK_FORMAT_R8G8B8A8_UNORM, 1, 1),
                                       Bytes(4)).has_value());
    m_Queue.FailSubmit = Core::ErrorCode::DeviceLost;

    auto failed = m_Uploader.Flush(m_Queue);
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error(), Core::ErrorCode::DeviceLost);
    EXPECT_EQ(m_Uploader.GetPendingImageUploads(), 1u);
    EXPECT_EQ(m_Uploader.GetFlushCount(), 0u);
}

TEST_F(UploaderTest, StagingFailureQueuesNothing)
{
    m_Staging.Fail = Core::ErrorCode::OutOfMemory;

    auto buffer = m_Uploader.UploadBuffer(FakeBuffer(1), 0, Bytes(16));
    ASSERT_FALSE(buffer.has_value());
    EXPECT_EQ(buffer.error(), Core::ErrorCode::OutOfMemory);

    auto image = m_Uploader.UploadImage(MakeImageDesc(VK_FORMAT_R8G8B8A8_UNORM, VK_FORMAT_R8G8B8A8_UNORM, 1, 1),
                                        Bytes(4));
    ASSERT_FALSE(image.has_value());
    EXPECT_EQ(image.error(), Core::ErrorCode::OutOfMemory);

    EXPECT_FALSE(m_Uploader.HasPendingUploads());
}

// -----------------------------------------------------------------------------
// Transcode requests the flush could never record
// -----------------------------------------------------------------------------

// Each of these passes the format and payload checks but breaks a rule of the
// transcode pass itself.
std::vector<std::pair<const char*, RHI::ImageUploadDesc>> UnrecordableTranscodes()
{
    std::vector<std::pair<const char*, RHI::ImageUploadDesc>> cases;

    auto deep = MakeImageDesc(VK_FORMAT_R8G8B8_UNORM, VK_FORMAT_R8G8B8A8_UNORM, 2, 2);
    deep.Region.ImageExtent.depth = 2;
    deep.Region.Extent.depth = 2;
    cases.emplace_back("depth 2", deep);

    auto layered = MakeImageDesc(VK_FORMAT_R8G8B8_UNORM, VK_FORMAT_R8G8B8A8_UNORM, 2, 2);
    layered.Region.Subresource.layerCount = 2;
    cases.emplace_back("two layers", layered);

    auto overhanging = MakeImageDesc(VK_FORMAT_R8G8B8_UNORM, VK_FORMAT_R8G8B8A8_UNORM, 2, 2);
    overhanging.Region.Offset = {1, 0, 0};
    cases.emplace_back("region past the image edge", overhanging);

    auto unsized = MakeImageDesc(VK_FORMAT_R8G8B8_UNORM, VK_FORMAT_R8G8B8A8_UNORM, 2, 2);
    unsized.Region.ImageExtent = {0, 0, 0};
    cases.emplace_back("image extent left at zero", unsized);

    return cases;
}

TEST_F(UploaderTest, UnrecordableTranscodesAreRejectedOnEveryEntryPoint)
{
    // Large enough for every case, the two-layer one included.
    const auto data = Bytes(64);

    for (const auto& [name, desc] : UnrecordableTranscodes())
    {
        auto queued = m_Uploader.UploadImage(desc, data);
        ASSERT_FALSE(queued.has_value()) << name;
        EXPECT_EQ(queued.error(), Core::ErrorCode::InvalidArgument) << name;

        auto enqueued = m_Uploader.EnqueueImageUpload(
            FakeStagingAllocator::MakeStaging(data.size(), RHI::StagingUsage::UniformTexel), desc);
        ASSERT_FALSE(enqueued.has_value()) << name;
        EXPECT_EQ(enqueued.error(), Core::ErrorCode::InvalidArgument) << name;

        auto direct = m_Uploader.UploadImageWith(desc, data, m_Direct);
        ASSERT_FALSE(direct.has_value()) << name;
        EXPECT_EQ(direct.error(), Core::ErrorCode::InvalidArgument) << name;
    }

    EXPECT_FALSE(m_Uploader.HasPendingUploads());
    EXPECT_EQ(m_Staging.Allocations, 0u);
    EXPECT_EQ(m_Transcoder.Calls, 0u);
    EXPECT_TRUE(m_DirectLog->Calls.empty());

    // Nothing queued, so a flush has nothing to fail on.
    ASSERT_TRUE(m_Uploader.Flush(m_Queue).has_value());
    EXPECT_EQ(m_Queue.CreatedEncoders, 0u);
}

TEST_F(UploaderTest, TranscoderLimitsAreCheckedBeforeStaging)
{
    m_Transcoder.FailValidate = Core::ErrorCode::OutOfRange;
    const auto desc = MakeImageDesc(VK_FORMAT_R8G8B8_UNORM, VK_FORMAT_R8G8B8A8_UNORM, 2, 2);

    auto queued = m_Uploader.UploadImage(desc, Bytes(12));
    ASSERT_FALSE(queued.has_value());
    EXPECT_EQ(queued.error(), Core::ErrorCode::OutOfRange);
    EXPECT_EQ(m_Staging.Allocations, 0u);
    EXPECT_EQ(m_Transcoder.ValidateCalls, 1u);
    EXPECT_FALSE(m_Uploader.HasPendingUploads());
}

TEST_F(UploaderTest, CopiedUploadsSkipTranscoderValidation)
{
    const auto desc = MakeImageDesc(VK_FORMAT_R8G8B8A8_UNORM, VK_FORMAT_R8G8B8A8_UNORM, 2, 2);
    ASSERT_TRUE(m_Uploader.UploadImage(desc, Bytes(16)).has_value());
    EXPECT_EQ(m_Transcoder.ValidateCalls, 0u);
}

TEST_F(UploaderTest, ValidTranscodesStillFlush)
{
    auto desc = MakeImageDesc(VK_FORMAT_R8G8B8_UNORM, VK_FORMAT_R8G8B8A8_UNORM, 4, 4);
    desc.Region.Offset = {2, 2, 0};
    desc.Region.Extent = {2, 2, 1};
    ASSERT_TRUE(m_Uploader.UploadImage(desc, Bytes(12)).has_value());
    ASSERT_TRUE(m_Uploader.Flush(m_Queue).has_value());
    EXPECT_EQ(m_Transcoder.Calls, 1u);
    EXPECT_FALSE(m_Uploader.HasPendingUploads());
}

// -----------------------------------------------------------------------------
// Queued uploads keep their destinations alive
// -----------------------------------------------------------------------------

TEST_F(UploaderTest, QueuedBufferUploadHoldsItsDestinationUntilSubmitted)
{
    std::weak_ptr<const void> watched;
    {
        auto owner = FakeOwner(7);
        watched = owner;
        ASSERT_TRUE(m_Uploader.UploadBuffer(RHI::BufferTarget{FakeHandle<VkBuffer>(7), owner}, 0, Bytes(16))
                        .has_value());
    }
    EXPECT_FALSE(watched.expired());

    m_Queue.FailSubmit = Core::ErrorCode::DeviceLost;
    ASSERT_FALSE(m_Uploader.Flush(m_Queue).has_value());
    EXPECT_FALSE(watched.expired());

    m_Queue.FailSubmit.reset();
    ASSERT_TRUE(m_Uploader.Flush(m_Queue).has_value());
    EXPECT_TRUE(watched.expired());
}

TEST_F(UploaderTest, QueuedImageUploadHoldsItsImageUntilSubmitted)
{
    std::weak_ptr<const void> watched;
    {
        auto desc = MakeImageDesc(VK_FORMAT_R8G8B8_UNORM, VK_FORMAT_R8G8B8A8_UNORM, 2, 2);
        watched = desc.Owner;
        ASSERT_TRUE(m_Uploader.UploadImage(desc, Bytes(12)).has_value());
    }
    EXPECT_FALSE(watched.expired());

    m_Transcoder.Fail = Core::ErrorCode::OutOfMemory;
    ASSERT_FALSE(m_Uploader.Flush(m_Queue).has_value());
    EXPECT_FALSE(watched.expired());

    m_Transcoder.Fail.reset();
    ASSERT_TRUE(m_Uploader.Flush(m_Queue).has_value());
    EXPECT_TRUE(watched.expired());
}

TEST_F(UploaderTest, QueuedUploadsWithoutAnOwnerAreRejected)
{
    auto buffer = m_Uploader.UploadBuffer(RHI::BufferTarget{FakeHandle<VkBuffer>(1), nullptr}, 0, Bytes(16));
    ASSERT_FALSE(buffer.has_value());
    EXPECT_EQ(buffer.error(), Core::ErrorCode::InvalidArgument);

    auto enqueued = m_Uploader.EnqueueBufferUpload(FakeStagingAllocator::MakeStaging(16),
                                                   RHI::BufferTarget{FakeHandle<VkBuffer>(1), nullptr},
                                                   0, RHI::AccessAll, RHI::AccessAll);
    ASSERT_FALSE(enqueued.has_value());
    EXPECT_EQ(enqueued.error(), Core::ErrorCode::InvalidArgument);

    auto desc = MakeImageDesc(VK_FORMAT_R8G8B8A8_UNORM, VK_FORMAT_R8G8B8A8_UNORM, 1, 1);
    desc.Owner.reset();
    auto image = m_Uploader.UploadImage(desc, Bytes(4));
    ASSERT_FALSE(image.has_value());
    EXPECT_EQ(image.error(), Core::ErrorCode::InvalidArgument);

    auto enqueuedImage = m_Uploader.EnqueueImageUpload(FakeStagingAllocator::MakeStaging(4), desc);
    ASSERT_FALSE(enqueuedImage.has_value());
    EXPECT_EQ(enqueuedImage.error(), Core::ErrorCode::InvalidArgument);

    EXPECT_FALSE(m_Uploader.HasPendingUploads());
    EXPECT_EQ(m_Staging.Allocations, 0u);

    // The direct path records immediately; the caller owns the lifetime.
    EXPECT_TRUE(m_Uploader.UploadImageWith(desc, Bytes(4), m_Direct).has_value());
}

} // namespace
