#include "BoneDeleteWorkflow.h"
#include "FakeScene.h"

#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

class BoneDeleteWorkflowTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        rig = &host.addSkeleton("Rig", {
            {"Hip", ""},
            {"Spine", "Hip"},
            {"Head", "Spine"},
            {"Tail", "Hip"},
        });
        body = &host.addRiggedMesh("Body", *rig);
        int v = body->addVertex(0, 0, 0);
        body->setWeight(v, "Hip", 1.0);
        body->addGroup("Spine");   // present but unweighted
    }

    SceneContext ctx(InteractionMode mode = InteractionMode::Object) const
    {
        return host.context(body, {body}, mode);
    }

    FakeSceneHost host;
    FakeSkeleton* rig = nullptr;
    FakeMesh* body = nullptr;
};

TEST_F(BoneDeleteWorkflowTest, UsedNamesIncludeUnweightedGroups)
{
    EXPECT_EQ(BoneDeleteWorkflow::usedBoneNames(*body), (std::set<std::string>{"Hip", "Spine"}));
}

TEST_F(BoneDeleteWorkflowTest, PrunesSkeletonInPlace)
{
    BoneDeleteResult out = BoneDeleteWorkflow::run(host, ctx(), false);

    ASSERT_TRUE(out.result.finished());
    EXPECT_EQ(out.result.message, "Deleted 2 unused bones.");
    EXPECT_EQ(out.deleted, 2);
    EXPECT_FALSE(out.duplicated);
    EXPECT_EQ(out.skeletonName, "Rig");
    EXPECT_EQ(rig->boneNames(), (std::vector<std::string>{"Hip", "Spine"}));
    EXPECT_EQ(host.selection, (std::vector<std::string>{"Rig"}));
    EXPECT_EQ(host.mode(), InteractionMode::Object);
}

TEST_F(BoneDeleteWorkflowTest, PrunesDuplicateAndLeavesOriginal)
{
    FakeObject& root = host.addObject("CharacterRoot");
    rig->setParentObject(&root);

    BoneDeleteResult out = BoneDeleteWorkflow::run(host, ctx(), true);

    ASSERT_TRUE(out.result.finished());
    EXPECT_TRUE(out.duplicated);
    EXPECT_EQ(out.deleted, 2);
    EXPECT_EQ(out.skeletonName, "Rig.001");
    EXPECT_EQ(rig->boneNames().size(), 4u);

    FakeSkeleton* copy = dynamic_cast<FakeSkeleton*>(body->parent());
    ASSERT_NE(copy, nullptr);
    EXPECT_NE(copy, rig);
    EXPECT_EQ(copy->boneNames(), (std::vector<std::string>{"Hip", "Spine"}));
    EXPECT_EQ(copy->parent(), nullptr);
    EXPECT_EQ(copy->clearParentCalls, 1);

    ASSERT_EQ(body->modifiers().size(), 1u);
    EXPECT_EQ(body->modifiers()[0].skeleton, copy);
    // Parent switch keeps the existing parent-inverse.
    EXPECT_FALSE(body->hasParentInverse);
}

TEST_F(BoneDeleteWorkflowTest, HiddenSkeletonIsShownFirst)
{
    rig->setHidden(true);

    BoneDeleteWorkflow::run(host, ctx(), false);

    EXPECT_FALSE(rig->isHidden());
}

TEST_F(BoneDeleteWorkflowTest, DuplicateFailureDeletesNothing)
{
    host.failDuplicate = true;

    BoneDeleteResult out = BoneDeleteWorkflow::run(host, ctx(), true);

    EXPECT_FALSE(out.result.finished());
    EXPECT_EQ(out.result.severity, Severity::Error);
    EXPECT_EQ(out.deleted, 0);
    EXPECT_EQ(rig->boneNames().size(), 4u);
    EXPECT_EQ(body->parent(), rig);
}

TEST_F(BoneDeleteWorkflowTest, DuplicateNotBoundDeletesNothing)
{
    body->ignoreRebind = true;

    BoneDeleteResult out = BoneDeleteWorkflow::run(host, ctx(), true);

    EXPECT_FALSE(out.result.finished());
    EXPECT_EQ(out.deleted, 0);
    EXPECT_EQ(rig->boneNames().size(), 4u);
    EXPECT_EQ(body->modifiers()[0].skeleton, rig);
    EXPECT_TRUE(host.modeRequests.empty());
}

TEST_F(BoneDeleteWorkflowTest, EditModeRefusalCancels)
{
    host.failEditMode = true;

    BoneDeleteResult out = BoneDeleteWorkflow::run(host, ctx(), false);

    EXPECT_FALSE(out.result.finished());
    EXPECT_EQ(out.result.message, "Could not enter edit mode on 'Rig'.");
    EXPECT_EQ(rig->boneNames().size(), 4u);
}

TEST_F(BoneDeleteWorkflowTest, RefusesOutsideObjectMode)
{
    BoneDeleteResult out = BoneDeleteWorkflow::run(host, ctx(InteractionMode::Pose), false);

    EXPECT_FALSE(out.result.finished());
    EXPECT_EQ(out.result.message, "This function only works in object mode! Current mode is: 'POSE'");
    EXPECT_TRUE(host.modeRequests.empty());
}

TEST_F(BoneDeleteWorkflowTest, RefusesUnparentedMesh)
{
    body->setParentObject(nullptr);

    EXPECT_EQ(BoneDeleteWorkflow::checkPreconditions(ctx()), "Object must be parented to an armature.");
}
