#include "pch.h"
#include <envmgr/history/undo_stack.h>

namespace envmgr
{

    UndoStack::UndoStack(size_t capacity)
        : m_capacity{capacity == 0 ? 1 : capacity}
    {
    }

    UndoStack::~UndoStack()
    {
        clear();
    }

    void UndoStack::release_all(std::deque<Command*>& commands)
    {
        for (auto* command : commands)
            command->release(REFCOUNT_DEBUG_ARGS);
        commands.clear();
    }

    void UndoStack::push(Command* command)
    {
        release_all(m_future);
        m_history.push_back(command);

        while (m_history.size() > m_capacity)
        {
            Command* oldest = m_history.front();
            m_history.pop_front();
            spdlog::debug("History full, dropping '{}'", oldest->description());
            oldest->release(REFCOUNT_DEBUG_ARGS);
        }
    }

    Command* UndoStack::next_undo() const
    {
        return m_history.empty() ? nullptr : m_history.back();
    }

    Command* UndoStack::next_redo() const
    {
        return m_future.empty() ? nullptr : m_future.back();
    }

    void UndoStack::commit_undo()
    {
        if (m_history.empty())
            return;

        m_future.push_back(m_history.back());
        m_history.pop_back();
    }

    void UndoStack::commit_redo()
    {
        if (m_future.empty())
            return;

        m_history.push_back(m_future.back());
        m_future.pop_back();
    }

    std::vector<const Command*> UndoStack::history() const
    {
        return {m_history.begin(), m_history.end()};
    }

    std::vector<const Command*> UndoStack::future() const
    {
        return {m_future.rbegin(), m_future.rend()};
    }

    void UndoStack::clear()
    {
        release_all(m_history);
        release_all(m_future);
    }

} // namespace envmgr
