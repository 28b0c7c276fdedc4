#pragma once

// ============================================================================
// FakeElementApi - Deterministic in-memory element service
// ============================================================================
// Backs the test suites. Ids are assigned from a counter starting at 1.
// Deleted records are kept so undelete can restore them under their old id.
//
// Immediate mode (default) completes every call before it returns. Deferred
// mode queues completions until flush(), which lets tests observe in-flight
// states.
// ============================================================================

#include "ElementApi.h"

#include <QMap>
#include <QSet>
#include <QStringList>
#include <QVector>
#include <functional>

class FakeElementApi : public ElementApi {
public:
    enum class Operation {
        Create,
        Update,
        Delete,
        Undelete,
        Upload
    };

    FakeElementApi() = default;

    void createElement(const CanvasElement& element, const DocumentOwner& owner,
                       ServiceCallback done) override;
    void updateElement(const QString& id, const ElementPatch& patch,
                       ServiceCallback done) override;
    void deleteElement(const QString& id, ServiceCallback done) override;
    void undeleteElement(const QString& id, ServiceCallback done) override;
    void uploadImage(const QString& filePath, const QRect& rect, int zIndex,
                     const DocumentOwner& owner, ServiceCallback done) override;

    // ===== Test Controls =====

    /// False makes every undelete fail (records are "permanently removed").
    void setUndeleteSupported(bool supported) { m_undeleteSupported = supported; }

    /// Every call of this operation fails while set.
    void setFailing(Operation op, bool failing);

    /// Every call touching this element id fails while set.
    void setFailingId(const QString& id, bool failing);

    void setDeferred(bool deferred) { m_deferred = deferred; }

    /// Creates and uploads still succeed but the reply carries no element.
    void setOmitReplyElement(bool omit) { m_omitReplyElement = omit; }

    /**
     * @brief Complete all queued calls in order.
     * @return Number of completions delivered.
     */
    int flush();

    int pendingCount() const { return m_pending.size(); }

    /**
     * @brief Seed a server-side record without going through create.
     */
    void seed(const CanvasElement& element);

    // ===== Inspection =====

    bool hasRecord(const QString& id) const { return m_live.contains(id); }
    CanvasElement record(const QString& id) const { return m_live.value(id); }
    int recordCount() const { return m_live.size(); }

    /// Owner field name of the last create/upload ("note_id" / "shared_note_id").
    QString lastOwnerField() const { return m_lastOwnerField; }

    /// Calls in order: "create", "update:<id>", "delete:<id>", "undelete:<id>", "upload".
    const QStringList& calls() const { return m_calls; }
    void clearCalls() { m_calls.clear(); }

    int callCount(const QString& prefix) const;

private:
    bool shouldFail(Operation op, const QString& id = QString()) const;
    void complete(ServiceCallback done, const ServiceResult& result);
    QString nextId() { return QString::number(m_nextId++); }

    QMap<QString, CanvasElement> m_live;
    QMap<QString, CanvasElement> m_deleted;
    QSet<int> m_failingOps;
    QSet<QString> m_failingIds;
    QVector<std::function<void()>> m_pending;
    QStringList m_calls;
    QString m_lastOwnerField;
    int m_nextId = 1;
    bool m_undeleteSupported = true;
    bool m_deferred = false;
    bool m_omitReplyElement = false;
};
