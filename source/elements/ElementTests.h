#ifndef ELEMENTTESTS_H
#define ELEMENTTESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>
#include <QFile>

#include "CanvasElement.h"
#include "ElementPatch.h"
#include "PathData.h"
#include "../cli/CliParser.h"
#include "../core/ElementStore.h"
#include "../core/ElementSync.h"
#include "../network/FakeElementApi.h"
#include "../network/HttpElementApi.h"

/**
 * Unit tests for the element model, the store and the service wrappers.
 * Run with: notecanvas_tests --test-elements
 */
class ElementTests : public QObject {
    Q_OBJECT

private:
    static CanvasElement rectAt(const QString& id, const QRect& r, int z) {
        CanvasElement el = CanvasElement::makeRectangle(r, StrokeStyle());
        el.id = id;
        el.zIndex = z;
        return el;
    }

private slots:
    // ===== Wire format =====

    void testFromJsonReadsEveryType() {
        const QByteArray json = R"([
            {"id": 17, "element_type": "textbox", "x": 10, "y": 20, "width": 200, "height": 100,
             "z_index": 3, "text_content": "hello"},
            {"id": "18", "element_type": "image", "x": 0, "y": 0, "width": 50, "height": 40,
             "image_url": "/media/canvas_images/a.png"},
            {"id": 19, "element_type": "circle", "x": 5, "y": 5, "width": 30, "height": 30,
             "stroke_color": "red", "stroke_width": 4, "fill_color": "blue"},
            {"id": 20, "element_type": "line", "x": 100, "y": 100, "width": -40, "height": 25},
            {"id": 21, "element_type": "freehand", "x": 1, "y": 2, "width": 30, "height": 30,
             "path_data": "M 4 4 L 10 12"}
        ])";
        const QVector<CanvasElement> list =
            CanvasElement::listFromJson(QJsonDocument::fromJson(json).array());
        QCOMPARE(list.size(), 5);

        QCOMPARE(list[0].id, QString("17"));
        QCOMPARE(list[0].type(), ElementType::TextBox);
        QCOMPARE(list[0].zIndex, 3);
        QCOMPARE(list[0].as<TextBoxData>()->text, QString("hello"));

        QCOMPARE(list[1].id, QString("18"));
        QCOMPARE(list[1].as<ImageData>()->imageUrl, QString("/media/canvas_images/a.png"));

        QCOMPARE(list[2].strokeStyle()->color, QString("red"));
        QCOMPARE(list[2].strokeStyle()->width, 4);
        QCOMPARE(list[2].fillColor(), QString("blue"));

        // Lines keep signed deltas
        QCOMPARE(list[3].width, -40);
        QCOMPARE(list[3].height, 25);
        // Missing stroke fields default
        QCOMPARE(list[3].strokeStyle()->color, QString("default"));
        QCOMPARE(list[3].strokeStyle()->width, 2);

        const FreehandData* ink = list[4].as<FreehandData>();
        QVERIFY(ink);
        QCOMPARE(ink->path.size(), 2);
        QCOMPARE(ink->path[1], QPointF(10, 12));
    }

    void testListSkipsMalformedEntries() {
        QJsonArray array;
        array.append(QJsonObject{{"id", 1}, {"element_type", "hexagon"}});
        array.append(QStringLiteral("not an object"));
        array.append(QJsonObject{{"id", 2}, {"element_type", "rectangle"}, {"x", 4}});

        const QVector<CanvasElement> list = CanvasElement::listFromJson(array);
        QCOMPARE(list.size(), 1);
        QCOMPARE(list[0].id, QString("2"));
        QCOMPARE(list[0].x, 4);
        QCOMPARE(list[0].width, 0);
    }

    void testCreateBodyHasNoId() {
        CanvasElement el = CanvasElement::makeRectangle(QRect(1, 2, 30, 40), StrokeStyle());
        el.id = QStringLiteral("99");

        const QJsonObject body = el.toJson(false);
        QVERIFY(!body.contains("id"));
        QCOMPARE(body.value("element_type").toString(), QString("rectangle"));
        QCOMPARE(body.value("width").toInt(), 30);
        QCOMPARE(body.value("stroke_color").toString(), QString("default"));
        QVERIFY(el.toJson(true).contains("id"));
    }

    void testPathDataDecodeIsSeparatorAgnostic() {
        const QVector<QPointF> spaced = PathData::decode(QStringLiteral("M 1 2 L 3 4"));
        const QVector<QPointF> compact = PathData::decode(QStringLiteral("M1,2L3,4"));
        QCOMPARE(spaced, compact);
        QCOMPARE(spaced.size(), 2);

        // Negative and fractional values; trailing unpaired number dropped
        const QVector<QPointF> odd = PathData::decode(QStringLiteral("M -1.5 2 L 3 .5 L 7"));
        QCOMPARE(odd.size(), 2);
        QCOMPARE(odd[0], QPointF(-1.5, 2));
        QCOMPARE(odd[1], QPointF(3, 0.5));
    }

    void testPathDataEncode() {
        QCOMPARE(PathData::encode({QPointF(0, 0), QPointF(10, 5.5)}),
                 QString("M 0 0 L 10 5.5"));
        QVERIFY(PathData::encode({}).isEmpty());
    }

    // ===== Patches =====

    void testPatchCaptureAndApply() {
        CanvasElement el = CanvasElement::makeRectangle(QRect(10, 20, 100, 50), StrokeStyle());

        const ElementPatch next = ElementPatch::position(40, 60);
        const ElementPatch prev = next.capture(el);
        QCOMPARE(prev.x, std::optional<int>(10));
        QCOMPARE(prev.y, std::optional<int>(20));
        QVERIFY(!prev.width);
        QVERIFY(!prev.text);

        next.applyTo(el);
        QCOMPARE(el.rect(), QRect(40, 60, 100, 50));

        // Text is ignored for shapes
        ElementPatch::textContent(QStringLiteral("x")).applyTo(el);
        QCOMPARE(el.type(), ElementType::Rectangle);
    }

    void testPatchJsonUsesWireNames() {
        ElementPatch patch = ElementPatch::textContent(QStringLiteral("note"));
        patch.x = 5;
        const QJsonObject obj = patch.toJson();
        QCOMPARE(obj.size(), 2);
        QCOMPARE(obj.value("text_content").toString(), QString("note"));
        QCOMPARE(obj.value("x").toInt(), 5);
    }

    // ===== Store =====

    void testPaintOrderIsStable() {
        ElementStore store;
        store.setElements({rectAt("a", QRect(0, 0, 10, 10), 2),
                           rectAt("b", QRect(0, 0, 10, 10), 1),
                           rectAt("c", QRect(0, 0, 10, 10), 2),
                           rectAt("d", QRect(0, 0, 10, 10), 1)});

        QStringList ids;
        for (const CanvasElement& el : store.paintOrder()) {
            ids.append(el.id);
        }
        QCOMPARE(ids, QStringList({"b", "d", "a", "c"}));
    }

    void testAddReplacesExistingId() {
        ElementStore store;
        store.addElement(rectAt("a", QRect(0, 0, 10, 10), 0));
        store.addElement(rectAt("a", QRect(5, 5, 10, 10), 0));
        QCOMPARE(store.elementCount(), 1);
        QCOMPARE(store.element("a")->x, 5);
        QCOMPARE(store.nextZIndex(), 1);
    }

    void testTopmostPrefersHigherZ() {
        ElementStore store;
        store.setElements({rectAt("top", QRect(0, 0, 100, 100), 5),
                           rectAt("bottom", QRect(0, 0, 100, 100), 1)});
        QCOMPARE(store.topmostAt(QPointF(50, 50), 0)->id, QString("top"));

        // Equal z: the later one paints on top
        store.setElements({rectAt("first", QRect(0, 0, 100, 100), 0),
                           rectAt("second", QRect(0, 0, 100, 100), 0)});
        QCOMPARE(store.topmostAt(QPointF(50, 50), 0)->id, QString("second"));
        QVERIFY(!store.topmostAt(QPointF(500, 500), 0));
    }

    void testElementsInRectPartialOverlap() {
        ElementStore store;
        store.setElements({rectAt("a", QRect(0, 0, 100, 100), 0),
                           rectAt("b", QRect(300, 300, 50, 50), 1)});

        const QVector<QString> hit = store.elementsInRect(QRectF(90, 90, 50, 50));
        QCOMPARE(hit, QVector<QString>({"a"}));
    }

    void testContentExtent() {
        ElementStore store;
        QCOMPARE(store.contentExtent(), QSize(0, 0));

        CanvasElement line = CanvasElement::makeLine(QPoint(500, 100), -200, 300, StrokeStyle());
        line.id = "l";
        store.setElements({rectAt("a", QRect(10, 10, 100, 700), 0), line});
        QCOMPARE(store.contentExtent(), QSize(500, 710));
    }

    // ===== Service wrappers =====

    void testSyncAppliesConfirmedCreate() {
        ElementStore store;
        FakeElementApi api;
        ElementSync sync(&store, &api, DocumentOwner::note("42"));
        QSignalSpy changed(&sync, &ElementSync::elementsChanged);

        std::optional<ServiceResult> received;
        sync.create(CanvasElement::makeCircle(QRect(0, 0, 40, 40), StrokeStyle()),
                    [&](const ServiceResult& r) { received = r; });

        QVERIFY(received && received->success);
        QCOMPARE(received->element->id, QString("1"));
        QVERIFY(store.contains("1"));
        QCOMPARE(changed.count(), 1);
        QCOMPARE(api.lastOwnerField(), QString("note_id"));
    }

    void testSyncLeavesStoreOnFailure() {
        ElementStore store;
        FakeElementApi api;
        store.setElements({rectAt("7", QRect(0, 0, 10, 10), 0)});
        api.seed(rectAt("7", QRect(0, 0, 10, 10), 0));
        api.setFailing(FakeElementApi::Operation::Update, true);

        ElementSync sync(&store, &api, DocumentOwner::sharedNote("s1"));
        QSignalSpy changed(&sync, &ElementSync::elementsChanged);

        QString error;
        sync.update("7", ElementPatch::position(50, 50), [&](const ServiceResult& r) { error = r.error; });

        QCOMPARE(error, ServiceErrors::update());
        QCOMPARE(store.element("7")->x, 0);
        QCOMPARE(changed.count(), 0);
    }

    void testSyncIgnoresVanishedElement() {
        ElementStore store;
        FakeElementApi api;
        api.seed(rectAt("3", QRect(0, 0, 10, 10), 0));
        ElementSync sync(&store, &api, DocumentOwner::note("1"));
        QSignalSpy changed(&sync, &ElementSync::elementsChanged);

        bool ok = false;
        sync.update("3", ElementPatch::position(5, 5), [&](const ServiceResult& r) { ok = r.success; });
        QVERIFY(ok);
        QVERIFY(store.isEmpty());
        QCOMPARE(changed.count(), 0);
    }

    void testSyncTracksInFlightCalls() {
        ElementStore store;
        FakeElementApi api;
        api.setDeferred(true);
        ElementSync sync(&store, &api, DocumentOwner::note("1"));

        sync.create(CanvasElement::makeTextBox(QRect(0, 0, 200, 100)));
        sync.create(CanvasElement::makeTextBox(QRect(0, 0, 200, 100)));
        QCOMPARE(sync.inFlightCount(), 2);
        QVERIFY(store.isEmpty());

        QCOMPARE(api.flush(), 2);
        QCOMPARE(sync.inFlightCount(), 0);
        QCOMPARE(store.elementCount(), 2);
    }

    void testCreateWithoutOwnerFails() {
        ElementStore store;
        FakeElementApi api;
        ElementSync sync(&store, &api, DocumentOwner());

        QString error;
        sync.create(CanvasElement::makeFreehand(QRect(0, 0, 20, 20), {QPointF(1, 1), QPointF(5, 5)},
                                                StrokeStyle()),
                    [&](const ServiceResult& r) { error = r.error; });
        QCOMPARE(error, ServiceErrors::createDrawing());
        QVERIFY(store.isEmpty());
    }

    void testParseResponse() {
        const ServiceResult ok = HttpElementApi::parseResponse(
            R"({"success": true, "element": {"id": 5, "element_type": "line", "width": 30}})",
            QString(), ServiceErrors::createShape());
        QVERIFY(ok.success);
        QVERIFY(ok.element);
        QCOMPARE(ok.element->id, QString("5"));

        const ServiceResult withError = HttpElementApi::parseResponse(
            R"({"success": false, "error": "Note not found"})", QString(), ServiceErrors::update());
        QVERIFY(!withError.success);
        QCOMPARE(withError.error, QString("Note not found"));

        const ServiceResult html = HttpElementApi::parseResponse(
            "<html>502</html>", QString(), ServiceErrors::remove());
        QCOMPARE(html.error, ServiceErrors::remove());

        const ServiceResult transport = HttpElementApi::parseResponse(
            QByteArray(), QStringLiteral("Connection refused"), ServiceErrors::remove());
        QCOMPARE(transport.error, QString("Connection refused"));
    }

    void testEndpointStripsTrailingSlash() {
        HttpElementApi api(QStringLiteral("https://notes.example/"), QStringLiteral("tok"));
        QCOMPARE(api.endpoint(QStringLiteral("/canvas/elements/create/")).toString(),
                 QString("https://notes.example/canvas/elements/create/"));
    }

    // ===== Command line =====

    void testOwnerFromCommandLine() {
        {
            QCommandLineParser parser;
            Cli::setupParser(parser);
            QVERIFY(parser.parse({"notecanvas", "--shared-note-id", "77", "--readonly"}));

            Cli::LaunchOptions opts;
            QString error;
            QVERIFY(Cli::parseLaunchOptions(parser, &opts, &error));
            QCOMPARE(opts.editor.owner.fieldName(), QString("shared_note_id"));
            QCOMPARE(opts.editor.owner.id, QString("77"));
            QVERIFY(opts.editor.readonly);
        }
        {
            QCommandLineParser parser;
            Cli::setupParser(parser);
            QVERIFY(parser.parse({"notecanvas", "--note-id", "1", "--shared-note-id", "2"}));

            Cli::LaunchOptions opts;
            QString error;
            QVERIFY(!Cli::parseLaunchOptions(parser, &opts, &error));
            QVERIFY(!error.isEmpty());
        }
    }

    void testElementsFileAcceptsWrappedArray() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath("elements.json");
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write(R"({"elements": [{"id": 1, "element_type": "textbox"}]})");
        file.close();

        QJsonArray array;
        QString error;
        QVERIFY(Cli::loadElementsFile(path, &array, &error));
        QCOMPARE(array.size(), 1);

        QVERIFY(!Cli::loadElementsFile(dir.filePath("missing.json"), &array, &error));
        QVERIFY(!error.isEmpty());
    }
};

#endif // ELEMENTTESTS_H
