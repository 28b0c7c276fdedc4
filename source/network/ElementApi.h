#pragma once

// ============================================================================
// ElementApi - Abstract interface to the remote element service
// ============================================================================
// The editor never talks HTTP directly. HttpElementApi is the production
// backend; FakeElementApi is the in-memory backend used by the test suites.
//
// Exactly one callback is invoked per call, on the thread that made it.
// HttpElementApi always completes later from the event loop; the in-memory
// backend may complete before the call returns. Failures travel as
// ServiceResult values; nothing is thrown.
// ============================================================================

#include "../elements/CanvasElement.h"
#include "../elements/ElementPatch.h"
#include "../core/EditorOptions.h"

#include <QString>
#include <QRect>
#include <functional>
#include <optional>

/**
 * @brief Outcome of one element service call.
 */
struct ServiceResult {
    bool success = false;
    std::optional<CanvasElement> element;   ///< Present when the service returned one
    QString error;                          ///< Message when success is false

    static ServiceResult ok(const std::optional<CanvasElement>& el = std::nullopt) {
        ServiceResult r;
        r.success = true;
        r.element = el;
        return r;
    }

    static ServiceResult failure(const QString& message) {
        ServiceResult r;
        r.error = message;
        return r;
    }
};

using ServiceCallback = std::function<void(const ServiceResult&)>;

/**
 * @brief Default failure messages, used when neither the service nor the
 *        transport supplied one.
 */
namespace ServiceErrors {
inline QString createShape()   { return QStringLiteral("Failed to create shape"); }
inline QString createDrawing() { return QStringLiteral("Failed to create drawing"); }
inline QString update()        { return QStringLiteral("Failed to update element"); }
inline QString remove()        { return QStringLiteral("Failed to delete one or more elements"); }
inline QString undelete()      { return QStringLiteral("Failed to restore element"); }
inline QString upload()        { return QStringLiteral("Failed to upload image"); }
}

/**
 * @brief Abstract remote element service.
 */
class ElementApi {
public:
    virtual ~ElementApi() = default;

    /**
     * @brief Create an element. The id of @p element is ignored.
     * @param owner Owning note; written as note_id or shared_note_id.
     */
    virtual void createElement(const CanvasElement& element, const DocumentOwner& owner,
                               ServiceCallback done) = 0;

    /**
     * @brief Update a subset of an element's fields.
     */
    virtual void updateElement(const QString& id, const ElementPatch& patch,
                               ServiceCallback done) = 0;

    /**
     * @brief Delete an element.
     */
    virtual void deleteElement(const QString& id, ServiceCallback done) = 0;

    /**
     * @brief Restore a deleted element under its original id.
     *
     * Fails when the service cannot restore the record; callers fall back to
     * creating a copy.
     */
    virtual void undeleteElement(const QString& id, ServiceCallback done) = 0;

    /**
     * @brief Upload an image file and create an image element for it.
     */
    virtual void uploadImage(const QString& filePath, const QRect& rect, int zIndex,
                             const DocumentOwner& owner, ServiceCallback done) = 0;
};
