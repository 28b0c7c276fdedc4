// ============================================================================
// HistoryManager - Implementation
// ============================================================================

#include "HistoryManager.h"
#include "../core/ElementSync.h"

#include <QPointer>
#include <QDebug>

/// Progress of an undo of a grouped delete.
struct HistoryManager::DeleteRestore {
    HistoryAction source;
    int index = 0;
    bool identityPreserved = true;
    QVector<CanvasElement> recreated;
    QVector<QString> liveIds;
    QString firstError;
};

/// Progress of a redo of a grouped delete.
struct HistoryManager::DeleteRedo {
    HistoryAction source;
    QVector<QString> ids;
    int index = 0;
    QVector<CanvasElement> deleted;
    QString firstError;
};

HistoryManager::HistoryManager(ElementSync* sync, int capacity, QObject* parent)
    : QObject(parent)
    , m_sync(sync)
    , m_capacity(capacity > 0 ? capacity : DEFAULT_CAPACITY)
{
}

HistoryManager::~HistoryManager() = default;

// ============================================================================
// Recording
// ============================================================================

void HistoryManager::push(const HistoryAction& action)
{
    if (m_replaying) {
        qDebug() << "HistoryManager::push: Deferred until replay ends";
        m_deferredPushes.append(action);
        return;
    }

    record(action);
    emit undoAvailableChanged(canUndo());
}

void HistoryManager::record(const HistoryAction& action)
{
    m_undoStack.append(action);
    trimUndoStack();
    clearRedoStack();
}

void HistoryManager::trimUndoStack()
{
    while (m_undoStack.size() > m_capacity) {
        m_undoStack.remove(0);
    }
}

void HistoryManager::clearRedoStack()
{
    const bool hadRedo = !m_redoStack.isEmpty();
    m_redoStack.clear();
    if (hadRedo) {
        emit redoAvailableChanged(false);
    }
}

void HistoryManager::clear()
{
    const bool hadUndo = canUndo();
    const bool hadRedo = canRedo();
    m_undoStack.clear();
    m_redoStack.clear();
    m_deferredPushes.clear();
    if (hadUndo) {
        emit undoAvailableChanged(false);
    }
    if (hadRedo) {
        emit redoAvailableChanged(false);
    }
}

// ============================================================================
// Replay
// ============================================================================

void HistoryManager::beginReplay()
{
    m_replaying = true;
}

void HistoryManager::endReplay(const QString& error)
{
    m_replaying = false;

    // Confirmed while the replay ran; they supersede whatever it left on redo
    const QVector<HistoryAction> deferred = std::move(m_deferredPushes);
    m_deferredPushes.clear();
    for (const HistoryAction& action : deferred) {
        record(action);
    }

    emit undoAvailableChanged(canUndo());
    emit redoAvailableChanged(canRedo());
    if (!error.isEmpty()) {
        qWarning() << "HistoryManager: Replay failed:" << error;
        emit errorOccurred(error);
    }
    emit replayFinished();
}

bool HistoryManager::undo()
{
    if (m_replaying) {
        qDebug() << "HistoryManager::undo: Replay in flight, ignoring";
        return false;
    }
    if (m_undoStack.isEmpty()) {
        return false;
    }

    const HistoryAction action = m_undoStack.takeLast();
    beginReplay();

    switch (action.type) {
        case HistoryAction::Create:
            undoCreate(action);
            break;
        case HistoryAction::Delete:
            undoDelete(action);
            break;
        case HistoryAction::Update:
            undoUpdate(action);
            break;
    }
    return true;
}

bool HistoryManager::redo()
{
    if (m_replaying) {
        qDebug() << "HistoryManager::redo: Replay in flight, ignoring";
        return false;
    }
    if (m_redoStack.isEmpty()) {
        return false;
    }

    const HistoryAction action = m_redoStack.takeLast();
    beginReplay();

    switch (action.type) {
        case HistoryAction::Create:
            redoCreate(action);
            break;
        case HistoryAction::Delete:
            redoDelete(action);
            break;
        case HistoryAction::Update:
            redoUpdate(action);
            break;
    }
    return true;
}

// ===== Undo =====

void HistoryManager::undoCreate(const HistoryAction& action)
{
    QPointer<HistoryManager> self(this);
    m_sync->remove(action.element.id, [self, action](const ServiceResult& result) {
        if (!self) return;
        if (!result.success) {
            self->m_undoStack.append(action);
            self->endReplay(result.error);
            return;
        }
        self->m_redoStack.append(action);
        self->endReplay(QString());
    });
}

void HistoryManager::undoDelete(const HistoryAction& action)
{
    auto job = std::make_shared<DeleteRestore>();
    job->source = action;
    restoreNext(job);
}

void HistoryManager::restoreNext(std::shared_ptr<DeleteRestore> job)
{
    if (job->index >= job->source.elements.size()) {
        finishRestore(job);
        return;
    }

    const CanvasElement snap = job->source.elements.at(job->index);
    QPointer<HistoryManager> self(this);

    // Fallback: a fresh copy with a new id
    auto recreate = [self, job, snap]() {
        if (!self) return;
        job->identityPreserved = false;
        CanvasElement draft = snap;
        draft.id.clear();
        self->m_sync->create(draft, [self, job](const ServiceResult& result) {
            if (!self) return;
            if (result.success && result.element) {
                job->recreated.append(*result.element);
                job->liveIds.append(result.element->id);
            } else if (job->firstError.isEmpty()) {
                job->firstError = result.error;
            }
            ++job->index;
            self->restoreNext(job);
        });
    };

    if (snap.id.isEmpty()) {
        recreate();
        return;
    }

    m_sync->undelete(snap, [self, job, snap, recreate](const ServiceResult& result) {
        if (!self) return;
        if (result.success) {
            job->liveIds.append(result.element ? result.element->id : snap.id);
            ++job->index;
            self->restoreNext(job);
            return;
        }
        qDebug() << "HistoryManager: Undelete of" << snap.id << "unavailable, recreating";
        recreate();
    });
}

void HistoryManager::finishRestore(std::shared_ptr<DeleteRestore> job)
{
    if (job->liveIds.isEmpty() && !job->source.elements.isEmpty()) {
        // Nothing came back: the action stays where it was
        m_undoStack.append(job->source);
        endReplay(job->firstError);
        return;
    }

    HistoryAction redoAction = HistoryAction::deleted(job->source.elements);
    redoAction.identityPreserved = job->identityPreserved;
    redoAction.recreated = job->recreated;
    redoAction.liveIds = job->liveIds;
    m_redoStack.append(redoAction);

    endReplay(job->firstError);
}

void HistoryManager::undoUpdate(const HistoryAction& action)
{
    QPointer<HistoryManager> self(this);
    m_sync->update(action.id, action.prev, [self, action](const ServiceResult& result) {
        if (!self) return;
        if (!result.success) {
            self->m_undoStack.append(action);
            self->endReplay(result.error);
            return;
        }
        self->m_redoStack.append(action);
        self->endReplay(QString());
    });
}

// ===== Redo =====

void HistoryManager::redoCreate(const HistoryAction& action)
{
    QPointer<HistoryManager> self(this);

    auto recreate = [self, action]() {
        if (!self) return;
        CanvasElement draft = action.element;
        draft.id.clear();
        self->m_sync->create(draft, [self, action](const ServiceResult& result) {
            if (!self) return;
            if (!result.success || !result.element) {
                self->m_redoStack.append(action);
                self->endReplay(result.error);
                return;
            }
            self->m_undoStack.append(HistoryAction::created(*result.element));
            self->trimUndoStack();
            self->endReplay(QString());
        });
    };

    if (action.element.id.isEmpty()) {
        recreate();
        return;
    }

    m_sync->undelete(action.element, [self, action, recreate](const ServiceResult& result) {
        if (!self) return;
        if (!result.success) {
            qDebug() << "HistoryManager::redoCreate: Undelete unavailable, recreating";
            recreate();
            return;
        }
        self->m_undoStack.append(HistoryAction::created(result.element ? *result.element
                                                                       : action.element));
        self->trimUndoStack();
        self->endReplay(QString());
    });
}

void HistoryManager::redoDelete(const HistoryAction& action)
{
    auto job = std::make_shared<DeleteRedo>();
    job->source = action;
    job->ids = action.idsToDelete();
    deleteNext(job);
}

void HistoryManager::deleteNext(std::shared_ptr<DeleteRedo> job)
{
    if (job->index >= job->ids.size()) {
        finishRedoDelete(job);
        return;
    }

    const QString id = job->ids.at(job->index);

    // Snapshot what exists now, so the next undo restores the current record
    CanvasElement snapshot;
    bool haveSnapshot = false;
    if (const CanvasElement* live = m_sync->store()->element(id)) {
        snapshot = *live;
        haveSnapshot = true;
    } else {
        for (const CanvasElement& el : job->source.recreated + job->source.elements) {
            if (el.id == id) {
                snapshot = el;
                haveSnapshot = true;
                break;
            }
        }
    }

    QPointer<HistoryManager> self(this);
    m_sync->remove(id, [self, job, snapshot, haveSnapshot](const ServiceResult& result) {
        if (!self) return;
        if (result.success) {
            if (haveSnapshot) {
                job->deleted.append(snapshot);
            }
        } else if (job->firstError.isEmpty()) {
            job->firstError = result.error;
        }
        ++job->index;
        self->deleteNext(job);
    });
}

void HistoryManager::finishRedoDelete(std::shared_ptr<DeleteRedo> job)
{
    if (job->deleted.isEmpty() && !job->ids.isEmpty()) {
        m_redoStack.append(job->source);
        endReplay(job->firstError);
        return;
    }

    m_undoStack.append(HistoryAction::deleted(job->deleted));
    trimUndoStack();
    endReplay(job->firstError);
}

void HistoryManager::redoUpdate(const HistoryAction& action)
{
    QPointer<HistoryManager> self(this);
    m_sync->update(action.id, action.next, [self, action](const ServiceResult& result) {
        if (!self) return;
        if (!result.success) {
            self->m_redoStack.append(action);
            self->endReplay(result.error);
            return;
        }
        self->m_undoStack.append(action);
        self->trimUndoStack();
        self->endReplay(QString());
    });
}
