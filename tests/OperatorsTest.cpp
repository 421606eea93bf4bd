#include "FakeScene.h"
#include "Operators.h"
#include "PluginLog.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

using ::testing::HasSubstr;
using Operators::Action;

class OperatorsTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        PluginLog::setDisplaySink([this](PluginLog::Level, const std::string& msg) {
            displayed.push_back(msg);
        });

        rig = &host.addSkeleton("Rig", {{"Hip", ""}, {"Spine", "Hip"}, {"Head", "Spine"}});
        body = &host.addRiggedMesh("Body", *rig);
        body->addGroup("Unused");
        int v = body->addVertex(0, 0, 0);
        body->setWeight(v, "Hip", 1.0);
        body->addGroup("Spare");
        shirt = &host.addMesh("Shirt");
        shirt->addVertex(0, 0, 0);
    }

    void TearDown() override
    {
        PluginLog::setDisplaySink(nullptr);
    }

    FakeSceneHost host;
    FakeSkeleton* rig = nullptr;
    FakeMesh* body = nullptr;
    FakeMesh* shirt = nullptr;
    std::vector<std::string> displayed;
};

TEST_F(OperatorsTest, ActionNamesRoundTrip)
{
    for (Action a : {Action::TransferVertexGroups, Action::DeleteUnusedVertexGroups,
                     Action::DeleteUnusedBones}) {
        Action parsed;
        ASSERT_TRUE(Operators::actionFromName(Operators::actionName(a), parsed));
        EXPECT_EQ(parsed, a);
        EXPECT_STRNE(Operators::actionLabel(a), "");
        EXPECT_STRNE(Operators::actionDescription(a), "");
    }

    Action ignored;
    EXPECT_FALSE(Operators::actionFromName("deleteEverything", ignored));
}

TEST_F(OperatorsTest, PollDispatchesPerAction)
{
    SceneContext single = host.context(body, {body});

    EXPECT_EQ(Operators::poll(Action::TransferVertexGroups, single),
              "You must select at least 2 objects.");
    EXPECT_EQ(Operators::poll(Action::DeleteUnusedVertexGroups, single), std::nullopt);
    EXPECT_EQ(Operators::poll(Action::DeleteUnusedBones, single), std::nullopt);
}

TEST_F(OperatorsTest, NoActiveObjectDisablesEverything)
{
    SceneContext empty = host.context(nullptr, {});

    EXPECT_EQ(Operators::pollDeleteUnusedVertexGroups(empty), "No active object!");
    EXPECT_EQ(Operators::pollDeleteUnusedBones(empty), "No active object!");
    EXPECT_EQ(Operators::pollTransferVertexGroups(empty), "You must select at least 2 objects.");
}

TEST_F(OperatorsTest, DeleteGroupsDoesNotNeedArmatureParent)
{
    body->setParentObject(nullptr);
    EXPECT_EQ(Operators::pollDeleteUnusedVertexGroups(host.context(body, {body})), std::nullopt);
}

TEST_F(OperatorsTest, DeleteGroupsNeedsBoundModifier)
{
    FakeMesh& loose = host.addMesh("Loose");
    loose.addGroup("Hip");
    loose.addModifier("Armature", ModifierKind::Armature, nullptr);

    EXPECT_EQ(Operators::pollDeleteUnusedVertexGroups(host.context(&loose, {&loose})),
              "Armature modifier has no object assigned.");
}

TEST_F(OperatorsTest, DeleteUnusedVertexGroupsReportsCount)
{
    OperationResult first = Operators::executeDeleteUnusedVertexGroups(host, host.context(body, {body}));
    EXPECT_TRUE(first.finished());
    EXPECT_EQ(first.severity, Severity::Info);
    EXPECT_EQ(first.message, "Removed 2 zero-weight vertex groups!");
    EXPECT_EQ(body->vertexGroups(), (std::vector<std::string>{"Hip"}));

    OperationResult second = Operators::executeDeleteUnusedVertexGroups(host, host.context(body, {body}));
    EXPECT_TRUE(second.finished());
    EXPECT_EQ(second.message, "No zero-weight vertex groups found.");
}

TEST_F(OperatorsTest, ExecuteRepollsAndCancels)
{
    OperationResult result = Operators::executeDeleteUnusedVertexGroups(
        host, host.context(body, {body}, InteractionMode::Edit));

    EXPECT_FALSE(result.finished());
    EXPECT_EQ(result.severity, Severity::Error);
    EXPECT_EQ(result.message, "This function only works in object mode! Current mode is: 'EDIT'");
    EXPECT_EQ(body->vertexGroups().size(), 3u);
}

TEST_F(OperatorsTest, ConfirmTextNamesTheSkeleton)
{
    EXPECT_EQ(Operators::confirmDeleteUnusedBonesText(host.context(body, {body})),
              "You are about to delete unused bones from 'Rig'");
}

TEST_F(OperatorsTest, DeleteUnusedBonesKeepsBonesNamedByGroups)
{
    OperationResult result = Operators::executeDeleteUnusedBones(host, host.context(body, {body}), false);

    ASSERT_TRUE(result.finished());
    EXPECT_EQ(result.message, "Deleted 2 unused bones.");
    EXPECT_EQ(rig->boneNames(), (std::vector<std::string>{"Hip"}));
}

TEST_F(OperatorsTest, GroupCleanupThenBoneCleanup)
{
    FakeSkeleton& skel = host.addSkeleton("Skel", {{"Hip", ""}, {"Spine", "Hip"}, {"Head", "Spine"}});
    FakeMesh& pants = host.addRiggedMesh("Pants", skel);
    int v0 = pants.addVertex(0, 0, 0);
    int v1 = pants.addVertex(0, 1, 0);
    pants.setWeight(v0, "Hip", 1.0);
    pants.setWeight(v1, "Spine", 0.0);
    SceneContext ctx = host.context(&pants, {&pants});

    // Spine still names a bone until its zero-weight group is gone.
    OperationResult groups = Operators::executeDeleteUnusedVertexGroups(host, ctx);
    ASSERT_TRUE(groups.finished());
    EXPECT_EQ(groups.message, "Removed 1 zero-weight vertex groups!");
    EXPECT_EQ(pants.vertexGroups(), (std::vector<std::string>{"Hip"}));

    OperationResult bones = Operators::executeDeleteUnusedBones(host, ctx, false);
    ASSERT_TRUE(bones.finished());
    EXPECT_EQ(bones.message, "Deleted 2 unused bones.");
    EXPECT_EQ(skel.boneNames(), (std::vector<std::string>{"Hip"}));
}

TEST_F(OperatorsTest, DeleteUnusedBonesRepollsAndCancels)
{
    OperationResult result = Operators::executeDeleteUnusedBones(
        host, host.context(body, {body}, InteractionMode::Edit), false);

    EXPECT_FALSE(result.finished());
    EXPECT_EQ(result.message, "This function only works in object mode! Current mode is: 'EDIT'");
    EXPECT_EQ(rig->boneNames().size(), 3u);
    EXPECT_TRUE(host.modeRequests.empty());
}

TEST_F(OperatorsTest, TransferReportsThroughLog)
{
    OperationResult result = Operators::executeTransferVertexGroups(host, host.context(body, {body, shirt}));

    ASSERT_TRUE(result.finished());
    EXPECT_EQ(result.message, "Vertex groups transferred from 'Body' to 1 objects");
    EXPECT_THAT(displayed, ::testing::Contains(HasSubstr("Created a new armature modifier for 'Shirt'.")));
}
