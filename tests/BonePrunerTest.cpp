#include "BonePruner.h"
#include "FakeScene.h"

#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

namespace {

// Removing a bone also takes its direct children with it.
class CascadingSkeleton : public FakeSkeleton {
public:
    using FakeSkeleton::FakeSkeleton;

    bool removeBone(const std::string& name) override
    {
        std::vector<std::string> children;
        for (const auto& b : bones()) {
            if (b.parent == name) children.push_back(b.name);
        }
        if (!FakeSkeleton::removeBone(name)) return false;
        for (const auto& child : children) FakeSkeleton::removeBone(child);
        return true;
    }
};

const std::vector<Bone> kSpineChain = {
    {"Hip", ""},
    {"Spine", "Hip"},
    {"Head", "Spine"},
};

} // namespace

class BonePrunerTest : public ::testing::Test {
protected:
    FakeSceneHost host;
};

TEST_F(BonePrunerTest, DeletesExactlyTheUnnamedBones)
{
    FakeSkeleton& rig = host.addSkeleton("Rig", kSpineChain);

    std::string error;
    int deleted = BonePruner::pruneUnusedBones(host, rig, {"Hip"}, &error);

    EXPECT_EQ(deleted, 2);
    EXPECT_TRUE(error.empty());
    EXPECT_EQ(rig.boneNames(), (std::vector<std::string>{"Hip"}));
    EXPECT_EQ(rig.removeLog, (std::vector<std::string>{"Spine", "Head"}));
}

TEST_F(BonePrunerTest, KeepsBonesWhenEveryNameIsUsed)
{
    FakeSkeleton& rig = host.addSkeleton("Rig", kSpineChain);

    EXPECT_EQ(BonePruner::pruneUnusedBones(host, rig, {"Hip", "Spine", "Head"}), 0);
    EXPECT_EQ(rig.boneNames().size(), 3u);
}

TEST_F(BonePrunerTest, SecondRunDeletesNothing)
{
    FakeSkeleton& rig = host.addSkeleton("Rig", kSpineChain);
    const std::set<std::string> used = {"Hip", "Head"};

    EXPECT_EQ(BonePruner::pruneUnusedBones(host, rig, used), 1);
    EXPECT_EQ(rig.boneParent("Head"), "Hip");
    EXPECT_EQ(BonePruner::pruneUnusedBones(host, rig, used), 0);
}

TEST_F(BonePrunerTest, EntersEditModeAndRestoresThePreviousMode)
{
    FakeSkeleton& rig = host.addSkeleton("Rig", kSpineChain);
    host.setCurrentMode(InteractionMode::Pose);

    BonePruner::pruneUnusedBones(host, rig, {"Hip"});

    EXPECT_EQ(host.modeRequests,
              (std::vector<InteractionMode>{InteractionMode::Edit, InteractionMode::Pose}));
    EXPECT_EQ(host.mode(), InteractionMode::Pose);
}

TEST_F(BonePrunerTest, EditModeScopeRestoresOnEarlyExit)
{
    FakeSkeleton& rig = host.addSkeleton("Rig", kSpineChain);
    {
        EditModeScope scope(host, rig);
        ASSERT_TRUE(scope.entered());
        EXPECT_EQ(host.mode(), InteractionMode::Edit);
    }
    EXPECT_EQ(host.mode(), InteractionMode::Object);
}

TEST_F(BonePrunerTest, NothingIsDeletedWhenEditModeIsRefused)
{
    FakeSkeleton& rig = host.addSkeleton("Rig", kSpineChain);
    host.failEditMode = true;

    std::string error;
    int deleted = BonePruner::pruneUnusedBones(host, rig, {"Hip"}, &error);

    EXPECT_EQ(deleted, 0);
    EXPECT_EQ(error, "Could not enter edit mode on 'Rig'.");
    EXPECT_EQ(rig.boneNames().size(), 3u);
    EXPECT_EQ(host.modeRequests, (std::vector<InteractionMode>{InteractionMode::Edit}));
    EXPECT_EQ(host.mode(), InteractionMode::Object);
}

TEST_F(BonePrunerTest, SkipsBonesThatHaveAlreadyGone)
{
    CascadingSkeleton rig("Rig", kSpineChain);

    int deleted = BonePruner::pruneUnusedBones(host, rig, {"Hip"});

    // Head went with Spine, so only one removal was requested.
    EXPECT_EQ(deleted, 1);
    EXPECT_EQ(rig.boneNames(), (std::vector<std::string>{"Hip"}));
}

TEST_F(BonePrunerTest, FailedRemovalIsNotCounted)
{
    FakeSkeleton& rig = host.addSkeleton("Rig", kSpineChain);
    rig.failRemove.insert("Head");

    EXPECT_EQ(BonePruner::pruneUnusedBones(host, rig, {"Hip"}), 1);
    EXPECT_EQ(rig.boneNames(), (std::vector<std::string>{"Hip", "Head"}));
    EXPECT_EQ(host.mode(), InteractionMode::Object);
}
