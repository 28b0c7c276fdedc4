// ============================================================================
// HttpElementApi - Implementation
// ============================================================================

#include "HttpElementApi.h"

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QHttpMultiPart>
#include <QHttpPart>
#include <QFile>
#include <QFileInfo>
#include <QMimeDatabase>
#include <QJsonDocument>
#include <QJsonObject>
#include <QUrl>
#include <QDebug>

HttpElementApi::HttpElementApi(const QString& baseUrl, const QString& csrfToken, QObject* parent)
    : QObject(parent)
    , m_network(new QNetworkAccessManager(this))
    , m_baseUrl(baseUrl)
    , m_csrfToken(csrfToken)
{
    while (m_baseUrl.endsWith('/')) {
        m_baseUrl.chop(1);
    }
}

HttpElementApi::~HttpElementApi() = default;

QUrl HttpElementApi::endpoint(const QString& path) const
{
    return QUrl(m_baseUrl + path);
}

QNetworkRequest HttpElementApi::makeRequest(const QString& path) const
{
    QNetworkRequest request(endpoint(path));
    request.setRawHeader("X-CSRFToken", m_csrfToken.toUtf8());
    return request;
}

ServiceResult HttpElementApi::parseResponse(const QByteArray& body, const QString& transportError,
                                            const QString& fallbackError)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);

    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (!transportError.isEmpty()) {
            return ServiceResult::failure(transportError);
        }
        qWarning() << "HttpElementApi: Non-JSON response:" << parseError.errorString();
        return ServiceResult::failure(fallbackError);
    }

    const QJsonObject obj = doc.object();
    if (!obj.value("success").toBool()) {
        const QString error = obj.value("error").toString();
        if (!error.isEmpty()) {
            return ServiceResult::failure(error);
        }
        return ServiceResult::failure(transportError.isEmpty() ? fallbackError : transportError);
    }

    ServiceResult result = ServiceResult::ok();
    if (obj.value("element").isObject()) {
        result.element = CanvasElement::fromJson(obj.value("element").toObject());
    }
    return result;
}

void HttpElementApi::watchReply(QNetworkReply* reply, const QString& fallbackError,
                                ServiceCallback done)
{
    connect(reply, &QNetworkReply::finished, this, [reply, fallbackError, done]() {
        const QString transportError = reply->error() != QNetworkReply::NoError
            ? reply->errorString() : QString();
        const ServiceResult result = parseResponse(reply->readAll(), transportError, fallbackError);
        reply->deleteLater();

        if (!result.success) {
            qWarning() << "HttpElementApi: Request failed:" << reply->url().toString()
                       << result.error;
        }
        if (done) {
            done(result);
        }
    });
}

void HttpElementApi::postJson(const QString& path, const QJsonObject& body,
                              const QString& fallbackError, ServiceCallback done)
{
    QNetworkRequest request = makeRequest(path);
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    QNetworkReply* reply = m_network->post(request, QJsonDocument(body).toJson(QJsonDocument::Compact));
    watchReply(reply, fallbackError, std::move(done));
}

void HttpElementApi::postEmpty(const QString& path, const QString& fallbackError,
                               ServiceCallback done)
{
    QNetworkReply* reply = m_network->post(makeRequest(path), QByteArray());
    watchReply(reply, fallbackError, std::move(done));
}

void HttpElementApi::createElement(const CanvasElement& element, const DocumentOwner& owner,
                                   ServiceCallback done)
{
    QJsonObject body = element.toJson(false);
    owner.writeTo(body);

    const QString fallback = element.type() == ElementType::Freehand
        ? ServiceErrors::createDrawing() : ServiceErrors::createShape();
    postJson(QStringLiteral("/canvas/elements/create/"), body, fallback, std::move(done));
}

void HttpElementApi::updateElement(const QString& id, const ElementPatch& patch,
                                   ServiceCallback done)
{
    postJson(QStringLiteral("/canvas/elements/%1/update/").arg(id), patch.toJson(),
             ServiceErrors::update(), std::move(done));
}

void HttpElementApi::deleteElement(const QString& id, ServiceCallback done)
{
    postEmpty(QStringLiteral("/canvas/elements/%1/delete/").arg(id),
              ServiceErrors::remove(), std::move(done));
}

void HttpElementApi::undeleteElement(const QString& id, ServiceCallback done)
{
    postEmpty(QStringLiteral("/canvas/elements/%1/undelete/").arg(id),
              ServiceErrors::undelete(), std::move(done));
}

void HttpElementApi::uploadImage(const QString& filePath, const QRect& rect, int zIndex,
                                 const DocumentOwner& owner, ServiceCallback done)
{
    auto* file = new QFile(filePath);
    if (!file->open(QIODevice::ReadOnly)) {
        const QString message = QStringLiteral("Cannot open image file: %1").arg(file->errorString());
        delete file;
        qWarning() << "HttpElementApi::uploadImage:" << message;
        if (done) {
            QMetaObject::invokeMethod(this, [done, message]() {
                done(ServiceResult::failure(message));
            }, Qt::QueuedConnection);
        }
        return;
    }

    auto* multiPart = new QHttpMultiPart(QHttpMultiPart::FormDataType);

    QHttpPart imagePart;
    const QString mime = QMimeDatabase().mimeTypeForFile(filePath).name();
    imagePart.setHeader(QNetworkRequest::ContentTypeHeader, mime);
    imagePart.setHeader(QNetworkRequest::ContentDispositionHeader,
                        QStringLiteral("form-data; name=\"image\"; filename=\"%1\"")
                            .arg(QFileInfo(filePath).fileName()));
    imagePart.setBodyDevice(file);
    file->setParent(multiPart);
    multiPart->append(imagePart);

    auto addField = [multiPart](const QString& name, const QString& value) {
        QHttpPart part;
        part.setHeader(QNetworkRequest::ContentDispositionHeader,
                       QStringLiteral("form-data; name=\"%1\"").arg(name));
        part.setBody(value.toUtf8());
        multiPart->append(part);
    };
    addField("x", QString::number(rect.x()));
    addField("y", QString::number(rect.y()));
    addField("width", QString::number(rect.width()));
    addField("height", QString::number(rect.height()));
    addField("z_index", QString::number(zIndex));
    addField(owner.fieldName(), owner.id);

    QNetworkReply* reply = m_network->post(makeRequest(QStringLiteral("/canvas/elements/upload-image/")),
                                           multiPart);
    multiPart->setParent(reply);
    watchReply(reply, ServiceErrors::upload(), std::move(done));
}
