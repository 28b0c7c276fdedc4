// ============================================================================
// ElementSync - Implementation
// ============================================================================

#include "ElementSync.h"

#include <QPointer>
#include <QDebug>

ElementSync::ElementSync(ElementStore* store, ElementApi* api, const DocumentOwner& owner,
                         QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_api(api)
    , m_owner(owner)
{
}

ServiceCallback ElementSync::wrap(const char* operation,
                                  std::function<void(const ServiceResult&)> apply,
                                  ServiceCallback done)
{
    ++m_inFlight;
    QPointer<ElementSync> self(this);
    return [self, operation, apply, done](const ServiceResult& result) {
        // Responses arriving after the editor went away are dropped
        if (!self) {
            return;
        }
        --self->m_inFlight;

        if (result.success) {
            if (apply) {
                apply(result);
            }
        } else {
            qWarning() << "ElementSync:" << operation << "failed:" << result.error;
        }
        if (done) {
            done(result);
        }
    };
}

void ElementSync::create(const CanvasElement& draft, ServiceCallback done)
{
    auto apply = [this](const ServiceResult& result) {
        if (!result.element) {
            qWarning() << "ElementSync::create: Success without element";
            return;
        }
        m_store->addElement(*result.element);
        emit elementsChanged();
    };
    m_api->createElement(draft, m_owner, wrap("create", apply, std::move(done)));
}

void ElementSync::update(const QString& id, const ElementPatch& patch, ServiceCallback done)
{
    auto apply = [this, id, patch](const ServiceResult&) {
        if (!m_store->applyPatch(id, patch)) {
            qDebug() << "ElementSync::update: Element" << id << "is gone, ignoring";
            return;
        }
        emit elementsChanged();
    };
    m_api->updateElement(id, patch, wrap("update", apply, std::move(done)));
}

void ElementSync::remove(const QString& id, ServiceCallback done)
{
    auto apply = [this, id](const ServiceResult&) {
        if (m_store->removeElement(id)) {
            emit elementsChanged();
        }
    };
    m_api->deleteElement(id, wrap("delete", apply, std::move(done)));
}

void ElementSync::undelete(const CanvasElement& snapshot, ServiceCallback done)
{
    auto apply = [this, snapshot](const ServiceResult& result) {
        m_store->addElement(result.element ? *result.element : snapshot);
        emit elementsChanged();
    };
    m_api->undeleteElement(snapshot.id, wrap("undelete", apply, std::move(done)));
}

void ElementSync::uploadImage(const QString& filePath, const QRect& rect, int zIndex,
                              ServiceCallback done)
{
    auto apply = [this](const ServiceResult& result) {
        if (!result.element) {
            qWarning() << "ElementSync::uploadImage: Success without element";
            return;
        }
        m_store->addElement(*result.element);
        emit elementsChanged();
    };
    m_api->uploadImage(filePath, rect, zIndex, m_owner, wrap("upload", apply, std::move(done)));
}
