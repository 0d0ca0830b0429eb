#include "pch.h"
#include <envmgr/history/undo_stack.h>
#include <gtest/gtest.h>
#include "test_helpers.h"

using namespace envmgr;
using envmgr::test::plain;

namespace
{

Command* make_command(const std::string& name)
{
    std::vector<Change> changes{Change{Scope::User, name, std::nullopt, plain(Scope::User, name, "1")}};
    return new Command(CommandKind::Add, "Add " + name, std::move(changes));
}

} // namespace

TEST(CommandTest, InverseSwapsStatesInReverseOrder)
{
    std::vector<Change> changes{
        Change{Scope::User, "A", std::nullopt, plain(Scope::User, "A", "1")},
        Change{Scope::System, "B", plain(Scope::System, "B", "old"), plain(Scope::System, "B", "new")},
    };
    auto* command = new Command(CommandKind::BulkImport, "Import", changes);

    const auto inverse = command->inverse();
    ASSERT_EQ(inverse.size(), 2u);
    EXPECT_EQ(inverse[0].name, "B");
    EXPECT_EQ(inverse[0].after->value, "old");
    EXPECT_EQ(inverse[1].name, "A");
    EXPECT_FALSE(inverse[1].after.has_value());

    const auto scopes = command->scopes();
    ASSERT_EQ(scopes.size(), 2u);
    EXPECT_EQ(command->names(), (std::vector<std::string>{"A", "B"}));

    command->release(REFCOUNT_DEBUG_ARGS);
}

TEST(UndoStackTest, UndoThenRedoMovesBetweenStacks)
{
    UndoStack stack{10};
    EXPECT_FALSE(stack.can_undo());
    EXPECT_EQ(stack.next_undo(), nullptr);

    stack.push(make_command("A"));
    stack.push(make_command("B"));
    ASSERT_TRUE(stack.can_undo());
    EXPECT_EQ(stack.next_undo()->description(), "Add B");

    stack.commit_undo();
    EXPECT_EQ(stack.undo_count(), 1u);
    ASSERT_TRUE(stack.can_redo());
    EXPECT_EQ(stack.next_redo()->description(), "Add B");

    stack.commit_redo();
    EXPECT_EQ(stack.undo_count(), 2u);
    EXPECT_FALSE(stack.can_redo());
}

TEST(UndoStackTest, PushClearsRedoFuture)
{
    UndoStack stack{10};
    stack.push(make_command("A"));
    stack.commit_undo();
    ASSERT_TRUE(stack.can_redo());

    stack.push(make_command("B"));
    EXPECT_FALSE(stack.can_redo());
    EXPECT_EQ(stack.undo_count(), 1u);
}

TEST(UndoStackTest, EvictsOldestBeyondCapacity)
{
    UndoStack stack{3};
    for (const char* name : {"A", "B", "C", "D", "E"})
        stack.push(make_command(name));

    ASSERT_EQ(stack.undo_count(), 3u);
    const auto history = stack.history();
    EXPECT_EQ(history.front()->description(), "Add C");
    EXPECT_EQ(history.back()->description(), "Add E");
}

TEST(UndoStackTest, FutureListsNextRedoFirst)
{
    UndoStack stack{10};
    stack.push(make_command("A"));
    stack.push(make_command("B"));
    stack.commit_undo();
    stack.commit_undo();

    const auto future = stack.future();
    ASSERT_EQ(future.size(), 2u);
    EXPECT_EQ(future[0]->description(), "Add A");
    EXPECT_EQ(future[1]->description(), "Add B");
}

TEST(UndoStackTest, ZeroCapacityKeepsOneEntry)
{
    UndoStack stack{0};
    stack.push(make_command("A"));
    stack.push(make_command("B"));
    EXPECT_EQ(stack.capacity(), 1u);
    EXPECT_EQ(stack.undo_count(), 1u);
}
