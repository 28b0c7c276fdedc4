#include "FakeElementApi.h"

#include <QFileInfo>

void FakeElementApi::setFailing(Operation op, bool failing)
{
    if (failing) {
        m_failingOps.insert(static_cast<int>(op));
    } else {
        m_failingOps.remove(static_cast<int>(op));
    }
}

void FakeElementApi::setFailingId(const QString& id, bool failing)
{
    if (failing) {
        m_failingIds.insert(id);
    } else {
        m_failingIds.remove(id);
    }
}

bool FakeElementApi::shouldFail(Operation op, const QString& id) const
{
    return m_failingOps.contains(static_cast<int>(op))
        || (!id.isEmpty() && m_failingIds.contains(id));
}

void FakeElementApi::complete(ServiceCallback done, const ServiceResult& result)
{
    if (!done) {
        return;
    }
    if (m_deferred) {
        m_pending.append([done, result]() { done(result); });
        return;
    }
    done(result);
}

int FakeElementApi::flush()
{
    int delivered = 0;
    // Completions may issue new calls; keep draining until the queue is empty
    while (!m_pending.isEmpty()) {
        std::function<void()> next = m_pending.takeFirst();
        next();
        ++delivered;
    }
    return delivered;
}

int FakeElementApi::callCount(const QString& prefix) const
{
    int count = 0;
    for (const QString& call : m_calls) {
        if (call.startsWith(prefix)) {
            ++count;
        }
    }
    return count;
}

void FakeElementApi::seed(const CanvasElement& element)
{
    CanvasElement copy = element;
    if (copy.id.isEmpty()) {
        copy.id = nextId();
    }
    m_live.insert(copy.id, copy);
}

void FakeElementApi::createElement(const CanvasElement& element, const DocumentOwner& owner,
                                   ServiceCallback done)
{
    m_calls.append(QStringLiteral("create"));
    m_lastOwnerField = owner.fieldName();

    if (shouldFail(Operation::Create) || !owner.isValid()) {
        complete(std::move(done), ServiceResult::failure(
            element.type() == ElementType::Freehand ? ServiceErrors::createDrawing()
                                                    : ServiceErrors::createShape()));
        return;
    }

    CanvasElement created = element;
    created.id = nextId();
    m_live.insert(created.id, created);
    complete(std::move(done), m_omitReplyElement ? ServiceResult::ok() : ServiceResult::ok(created));
}

void FakeElementApi::updateElement(const QString& id, const ElementPatch& patch,
                                   ServiceCallback done)
{
    m_calls.append(QStringLiteral("update:%1").arg(id));

    if (shouldFail(Operation::Update, id) || !m_live.contains(id)) {
        complete(std::move(done), ServiceResult::failure(ServiceErrors::update()));
        return;
    }

    patch.applyTo(m_live[id]);
    complete(std::move(done), ServiceResult::ok(m_live.value(id)));
}

void FakeElementApi::deleteElement(const QString& id, ServiceCallback done)
{
    m_calls.append(QStringLiteral("delete:%1").arg(id));

    if (shouldFail(Operation::Delete, id) || !m_live.contains(id)) {
        complete(std::move(done), ServiceResult::failure(ServiceErrors::remove()));
        return;
    }

    m_deleted.insert(id, m_live.take(id));
    complete(std::move(done), ServiceResult::ok());
}

void FakeElementApi::undeleteElement(const QString& id, ServiceCallback done)
{
    m_calls.append(QStringLiteral("undelete:%1").arg(id));

    if (!m_undeleteSupported || shouldFail(Operation::Undelete, id) || !m_deleted.contains(id)) {
        complete(std::move(done), ServiceResult::failure(ServiceErrors::undelete()));
        return;
    }

    const CanvasElement restored = m_deleted.take(id);
    m_live.insert(id, restored);
    complete(std::move(done), ServiceResult::ok(restored));
}

void FakeElementApi::uploadImage(const QString& filePath, const QRect& rect, int zIndex,
                                 const DocumentOwner& owner, ServiceCallback done)
{
    m_calls.append(QStringLiteral("upload"));
    m_lastOwnerField = owner.fieldName();

    if (shouldFail(Operation::Upload) || !owner.isValid()) {
        complete(std::move(done), ServiceResult::failure(ServiceErrors::upload()));
        return;
    }

    CanvasElement image = CanvasElement::makeImage(
        rect, QStringLiteral("/media/canvas_images/%1").arg(QFileInfo(filePath).fileName()));
    image.zIndex = zIndex;
    image.id = nextId();
    m_live.insert(image.id, image);
    complete(std::move(done), m_omitReplyElement ? ServiceResult::ok() : ServiceResult::ok(image));
}
