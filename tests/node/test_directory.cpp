// NODEREWARD - Node Directory Tests
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include <gtest/gtest.h>
#include "nodereward/node/directory.h"

namespace nodereward {
namespace node {
namespace test {

class NodeDirectoryTest : public ::testing::Test {
protected:
    NodeInfo MakeNode(const std::string& id, NodeStatus status) {
        Byte raw[] = {0x42};
        NodeInfo info;
        info.nodeId = id;
        info.operatorId = OperatorId(raw, sizeof(raw));
        info.status = status;
        info.providerType = ProviderType::Storage;
        info.capacity = 2048;
        return info;
    }

    StaticNodeDirectory directory_;
};

TEST_F(NodeDirectoryTest, NodeIdFormat) {
    EXPECT_TRUE(IsValidNodeId("node-01.eu_west"));
    EXPECT_FALSE(IsValidNodeId(""));
    EXPECT_FALSE(IsValidNodeId("has space"));
    EXPECT_FALSE(IsValidNodeId("semi;colon"));
    EXPECT_TRUE(IsValidNodeId(std::string(MAX_NODE_ID_LENGTH, 'a')));
    EXPECT_FALSE(IsValidNodeId(std::string(MAX_NODE_ID_LENGTH + 1, 'a')));
}

TEST_F(NodeDirectoryTest, RewardableStatuses) {
    EXPECT_TRUE(IsRewardable(NodeStatus::Active));
    EXPECT_TRUE(IsRewardable(NodeStatus::Listed));
    EXPECT_FALSE(IsRewardable(NodeStatus::Pending));
    EXPECT_FALSE(IsRewardable(NodeStatus::Maintenance));
    EXPECT_FALSE(IsRewardable(NodeStatus::Suspended));
    EXPECT_FALSE(IsRewardable(NodeStatus::Offline));
}

TEST_F(NodeDirectoryTest, StatusValuesAreStable) {
    EXPECT_EQ(static_cast<int>(NodeStatus::Pending), 0);
    EXPECT_EQ(static_cast<int>(NodeStatus::Deregistered), 5);
    EXPECT_EQ(static_cast<int>(NodeStatus::Offline), 7);
    EXPECT_STREQ(NodeStatusToString(NodeStatus::Listed), "Listed");
}

TEST_F(NodeDirectoryTest, AddAndLookup) {
    ASSERT_TRUE(directory_.Add(MakeNode("gpu-1", NodeStatus::Active)));
    EXPECT_FALSE(directory_.Add(MakeNode("gpu-1", NodeStatus::Pending)));
    EXPECT_FALSE(directory_.Add(MakeNode("bad id", NodeStatus::Active)));

    EXPECT_TRUE(directory_.NodeExists("gpu-1"));
    auto info = directory_.GetNodeInfo("gpu-1");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->status, NodeStatus::Active);
    EXPECT_EQ(info->capacity, 2048u);
    EXPECT_FALSE(directory_.GetNodeInfo("gpu-2").has_value());
}

TEST_F(NodeDirectoryTest, UpdateStatusAndRemove) {
    ASSERT_TRUE(directory_.Add(MakeNode("n1", NodeStatus::Pending)));
    EXPECT_TRUE(directory_.SetStatus("n1", NodeStatus::Listed));
    EXPECT_EQ(directory_.GetNodeInfo("n1")->status, NodeStatus::Listed);
    EXPECT_FALSE(directory_.SetStatus("n2", NodeStatus::Active));

    NodeInfo changed = MakeNode("n1", NodeStatus::Offline);
    changed.capacity = 1;
    EXPECT_TRUE(directory_.Update(changed));
    EXPECT_EQ(directory_.GetNodeInfo("n1")->capacity, 1u);

    EXPECT_TRUE(directory_.Remove("n1"));
    EXPECT_FALSE(directory_.Remove("n1"));
    EXPECT_EQ(directory_.Size(), 0u);
}

TEST_F(NodeDirectoryTest, ToStringNamesFields) {
    std::string text = MakeNode("n1", NodeStatus::Active).ToString();
    EXPECT_NE(text.find("n1"), std::string::npos);
    EXPECT_NE(text.find("status=Active"), std::string::npos);
}

} // namespace test
} // namespace node
} // namespace nodereward
