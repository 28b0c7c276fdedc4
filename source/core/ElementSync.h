#pragma once

// ============================================================================
// ElementSync - Applies server-confirmed mutations to the ElementStore
// ============================================================================
// Every mutation goes to the ElementApi first; the store only changes when the
// service reports success. Completions are keyed by element id, so a late
// response for an element that no longer exists is a no-op.
// ============================================================================

#include "ElementStore.h"
#include "EditorOptions.h"
#include "../network/ElementApi.h"

#include <QObject>

class ElementSync : public QObject {
    Q_OBJECT

public:
    /**
     * @param store Store to mutate (not owned).
     * @param api Remote service (not owned).
     * @param owner Owning document for create and upload requests.
     */
    ElementSync(ElementStore* store, ElementApi* api, const DocumentOwner& owner,
                QObject* parent = nullptr);

    ElementStore* store() const { return m_store; }
    const DocumentOwner& owner() const { return m_owner; }

    /**
     * @brief Create an element from a draft (id ignored); the confirmed
     *        element is appended to the store.
     */
    void create(const CanvasElement& draft, ServiceCallback done = nullptr);

    /**
     * @brief Update fields; the patch is applied locally once confirmed.
     */
    void update(const QString& id, const ElementPatch& patch, ServiceCallback done = nullptr);

    /**
     * @brief Delete; the element leaves the store once confirmed.
     */
    void remove(const QString& id, ServiceCallback done = nullptr);

    /**
     * @brief Restore a deleted element under its original id.
     * @param snapshot The element as it was before deletion. Added to the store
     *        when the service confirms without returning the element.
     */
    void undelete(const CanvasElement& snapshot, ServiceCallback done = nullptr);

    /**
     * @brief Upload an image and add the resulting element.
     */
    void uploadImage(const QString& filePath, const QRect& rect, int zIndex,
                     ServiceCallback done = nullptr);

    /**
     * @brief Number of calls sent and not yet completed.
     */
    int inFlightCount() const { return m_inFlight; }

signals:
    /**
     * @brief A confirmed mutation changed the store.
     */
    void elementsChanged();

private:
    ServiceCallback wrap(const char* operation, std::function<void(const ServiceResult&)> apply,
                         ServiceCallback done);

    ElementStore* m_store = nullptr;
    ElementApi* m_api = nullptr;
    DocumentOwner m_owner;
    int m_inFlight = 0;
};
