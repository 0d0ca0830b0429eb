#pragma once

// =============================================================================
// envmgr/history/undo_stack.h - Bounded undo/redo history
// =============================================================================

#include <envmgr/history/command.h>
#include <deque>
#include <vector>

namespace envmgr
{

    /// Two bounded sequences of commands: history (undoable) and redo-future.
    ///
    /// The stack owns one reference to every command it holds. Not persisted.
    class UndoStack
    {
        PNQ_DECLARE_NON_COPYABLE(UndoStack)

    public:
        explicit UndoStack(size_t capacity);
        ~UndoStack();

        /// Record a new command. Takes over the caller's reference.
        /// Clears redo-future and evicts the oldest entry beyond capacity.
        void push(Command* command);

        /// Command undo() would revert, or nullptr. The stack keeps ownership.
        Command* next_undo() const;

        /// Command redo() would reapply, or nullptr. The stack keeps ownership.
        Command* next_redo() const;

        /// Move the newest history entry to redo-future (after a successful undo).
        void commit_undo();

        /// Move the newest redo-future entry back to history (after a successful redo).
        void commit_redo();

        bool can_undo() const { return !m_history.empty(); }
        bool can_redo() const { return !m_future.empty(); }

        size_t capacity() const { return m_capacity; }
        size_t undo_count() const { return m_history.size(); }
        size_t redo_count() const { return m_future.size(); }

        /// History entries, oldest first.
        std::vector<const Command*> history() const;

        /// Redo-future entries, next redo first.
        std::vector<const Command*> future() const;

        void clear();

    private:
        static void release_all(std::deque<Command*>& commands);

        const size_t m_capacity;
        std::deque<Command*> m_history; ///< back() is the newest
        std::deque<Command*> m_future;  ///< back() is the next redo
    };

} // namespace envmgr
