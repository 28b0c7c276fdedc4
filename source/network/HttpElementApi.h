#pragma once

// ============================================================================
// HttpElementApi - ElementApi over JSON/HTTP
// ============================================================================
// POST requests relative to a base URL, each carrying the X-CSRFToken header.
// Responses are {success, element?, error?} objects.
// ============================================================================

#include "ElementApi.h"

#include <QObject>
#include <QUrl>

class QNetworkAccessManager;
class QNetworkReply;
class QNetworkRequest;

class HttpElementApi : public QObject, public ElementApi {
    Q_OBJECT

public:
    HttpElementApi(const QString& baseUrl, const QString& csrfToken, QObject* parent = nullptr);
    ~HttpElementApi() override;

    void createElement(const CanvasElement& element, const DocumentOwner& owner,
                       ServiceCallback done) override;
    void updateElement(const QString& id, const ElementPatch& patch,
                       ServiceCallback done) override;
    void deleteElement(const QString& id, ServiceCallback done) override;
    void undeleteElement(const QString& id, ServiceCallback done) override;
    void uploadImage(const QString& filePath, const QRect& rect, int zIndex,
                     const DocumentOwner& owner, ServiceCallback done) override;

    /**
     * @brief Parse a response body into a ServiceResult.
     * @param body Raw response bytes.
     * @param transportError Transport error text, empty when the request succeeded.
     * @param fallbackError Message used when neither body nor transport has one.
     */
    static ServiceResult parseResponse(const QByteArray& body, const QString& transportError,
                                       const QString& fallbackError);

    /**
     * @brief Absolute URL for a path below the base URL.
     */
    QUrl endpoint(const QString& path) const;

private:
    QNetworkRequest makeRequest(const QString& path) const;
    void postJson(const QString& path, const QJsonObject& body,
                  const QString& fallbackError, ServiceCallback done);
    void postEmpty(const QString& path, const QString& fallbackError, ServiceCallback done);
    void watchReply(QNetworkReply* reply, const QString& fallbackError, ServiceCallback done);

    QNetworkAccessManager* m_network = nullptr;
    QString m_baseUrl;
    QString m_csrfToken;
};
