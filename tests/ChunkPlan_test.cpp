/*
 * File:   ChunkPlan_test.cpp
 * Author: me
 *
 * Created on March 21, 2024, 10:15 AM
 */

#include "sdsclient/ChunkPlan.hpp"

#include <gtest/gtest.h>

using namespace sdsclient;

TEST(ChunkPlanTest, EmptyTransferHasOneEmptyPart)
{
    ChunkPlan plan = ChunkPlan::calculate(0, 1024);
    EXPECT_EQ(1u, plan.getPartCount());
    EXPECT_EQ(0u, plan.getLastPartSize());
    EXPECT_EQ(0u, plan.partSize(1));
    EXPECT_EQ(0u, plan.partOffset(1));
}

TEST(ChunkPlanTest, ExactMultipleHasNoTrailingEmptyPart)
{
    ChunkPlan plan = ChunkPlan::calculate(4096, 1024);
    EXPECT_EQ(4u, plan.getPartCount());
    EXPECT_EQ(1024u, plan.getLastPartSize());
    EXPECT_EQ(3072u, plan.partOffset(4));
}

TEST(ChunkPlanTest, RemainderGoesToLastPart)
{
    ChunkPlan plan = ChunkPlan::calculate(2500, 1024);
    ASSERT_EQ(3u, plan.getPartCount());
    EXPECT_EQ(1024u, plan.partSize(1));
    EXPECT_EQ(1024u, plan.partSize(2));
    EXPECT_EQ(452u, plan.partSize(3));
    EXPECT_EQ(2048u, plan.partOffset(3));

    uint64_t sum = 0;
    for (uint64_t part = 1; part <= plan.getPartCount(); part++)
    {
        sum += plan.partSize(part);
    }
    EXPECT_EQ(plan.getTotalSize(), sum);
}

TEST(ChunkPlanTest, SmallerThanOneChunk)
{
    ChunkPlan plan = ChunkPlan::calculate(1, 32 * 1024 * 1024);
    EXPECT_EQ(1u, plan.getPartCount());
    EXPECT_EQ(1u, plan.partSize(1));
}
