#pragma once

// ============================================================================
// HistoryManager - Bounded undo/redo log reconciled with the element service
// ============================================================================
// Undo and redo are replays against the remote service: each step is a real
// create/update/delete/undelete call, and the stacks move only after the
// service answered. While a replay runs, further undo/redo requests are
// dropped. Actions pushed during a replay are held back and recorded when it
// ends, after the replay has moved its own action.
//
// Deleted elements are restored with undelete when the service still has
// them; otherwise a copy is created and the new id is remembered so a later
// redo removes the right record.
// ============================================================================

#include "HistoryAction.h"

#include <QObject>
#include <QVector>
#include <memory>

class ElementSync;

class HistoryManager : public QObject {
    Q_OBJECT

public:
    static constexpr int DEFAULT_CAPACITY = 200;

    explicit HistoryManager(ElementSync* sync, int capacity = DEFAULT_CAPACITY,
                            QObject* parent = nullptr);
    ~HistoryManager() override;

    /**
     * @brief Record a confirmed action. Clears the redo stack.
     *
     * During a replay the action is queued and recorded when the replay ends.
     */
    void push(const HistoryAction& action);

    /**
     * @brief Start undoing the most recent action.
     * @return False if there is nothing to undo or a replay is already running.
     */
    bool undo();

    /**
     * @brief Start redoing the most recently undone action.
     * @return False if there is nothing to redo or a replay is already running.
     */
    bool redo();

    bool canUndo() const { return !m_undoStack.isEmpty(); }
    bool canRedo() const { return !m_redoStack.isEmpty(); }
    int undoCount() const { return m_undoStack.size(); }
    int redoCount() const { return m_redoStack.size(); }
    int capacity() const { return m_capacity; }
    int deferredCount() const { return m_deferredPushes.size(); }

    bool isReplaying() const { return m_replaying; }

    const QVector<HistoryAction>& undoStack() const { return m_undoStack; }
    const QVector<HistoryAction>& redoStack() const { return m_redoStack; }

    void clear();

signals:
    void undoAvailableChanged(bool available);
    void redoAvailableChanged(bool available);

    /**
     * @brief A replay ended (successfully or not).
     */
    void replayFinished();

    void errorOccurred(const QString& message);

private:
    struct DeleteRestore;
    struct DeleteRedo;

    void record(const HistoryAction& action);
    void trimUndoStack();
    void clearRedoStack();
    void beginReplay();
    void endReplay(const QString& error);

    void undoCreate(const HistoryAction& action);
    void undoDelete(const HistoryAction& action);
    void restoreNext(std::shared_ptr<DeleteRestore> job);
    void finishRestore(std::shared_ptr<DeleteRestore> job);
    void undoUpdate(const HistoryAction& action);

    void redoCreate(const HistoryAction& action);
    void redoDelete(const HistoryAction& action);
    void deleteNext(std::shared_ptr<DeleteRedo> job);
    void finishRedoDelete(std::shared_ptr<DeleteRedo> job);
    void redoUpdate(const HistoryAction& action);

    ElementSync* m_sync = nullptr;
    int m_capacity = DEFAULT_CAPACITY;
    QVector<HistoryAction> m_undoStack;
    QVector<HistoryAction> m_redoStack;
    QVector<HistoryAction> m_deferredPushes;
    bool m_replaying = false;
};
