#include <gtest/gtest.h>
#include <QTemporaryDir>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include "recordstore.h"
#include "recordsheet.h"
#include "boxsidecar.h"
#include "testutils.h"

class RecordStoreTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
        m_folder = m_dir.path();
    }

    void addImages(const QStringList& names)
    {
        for (const QString& name : names) {
            ASSERT_TRUE(testutils::writeFile(QDir(m_folder).filePath(name), "img"));
        }
    }

    QString dataPath() const { return QDir(m_folder).filePath("data.xlsx"); }
    QString boxPath() const { return QDir(m_folder).filePath("bbox_data.json"); }

    QTemporaryDir m_dir;
    QString m_folder;
    AppConfig m_config;
};

TEST_F(RecordStoreTest, NewFolderYieldsOneBlankRecordPerImage)
{
    RecordStore store(m_config);
    LoadReport report = store.loadOrCreate(m_folder, {"c.jpg", "a.jpg", "b.jpg"});

    EXPECT_FALSE(report.sheetLoaded);
    EXPECT_FALSE(report.sidecarLoaded);
    EXPECT_FALSE(report.hasNotices());
    EXPECT_EQ(report.addedCount, 3);
    EXPECT_EQ(store.fileNames(), QStringList({"a.jpg", "b.jpg", "c.jpg"}));

    for (const CardRecord& record : store.records()) {
        EXPECT_TRUE(record.isBlank());
        EXPECT_FALSE(record.dirty);
        EXPECT_EQ(record.ocrState, OcrState::NotAttempted);
        EXPECT_EQ(record.fields.keys().size(), m_config.fields.size());
    }
    EXPECT_FALSE(store.hasUnsavedChanges());
}

TEST_F(RecordStoreTest, LoadingTwiceIsIdempotent)
{
    addImages({"a.jpg", "b.jpg"});
    RecordStore store(m_config);
    store.loadOrCreate(m_folder, {"a.jpg", "b.jpg"});
    ASSERT_TRUE(store.applyManualEdit("a.jpg", "village", "Rampur"));
    ASSERT_TRUE(store.save());

    store.loadOrCreate(m_folder, {"a.jpg", "b.jpg"});
    QList<CardRecord> first = store.records();
    store.loadOrCreate(m_folder, {"a.jpg", "b.jpg"});
    EXPECT_EQ(store.records(), first);
}

TEST_F(RecordStoreTest, RemovedFileIsPrunedOthersUnaffected)
{
    RecordStore store(m_config);
    store.loadOrCreate(m_folder, {"a.jpg", "b.jpg", "c.jpg"});
    ASSERT_TRUE(store.applyManualEdit("a.jpg", "notes", "keep me"));
    ASSERT_TRUE(store.applyManualEdit("b.jpg", "notes", "goes away"));
    ASSERT_TRUE(store.save(m_folder));

    LoadReport report = store.loadOrCreate(m_folder, {"a.jpg", "c.jpg"});
    EXPECT_EQ(report.prunedCount, 1);
    EXPECT_FALSE(store.contains("b.jpg"));
    ASSERT_NE(store.getRecord("a.jpg"), nullptr);
    EXPECT_EQ(store.getRecord("a.jpg")->value("notes"), "keep me");
    EXPECT_TRUE(store.getRecord("c.jpg")->isBlank());
}

TEST_F(RecordStoreTest, PersistedRowForAbsentImageIsDropped)
{
    CardRecord row("card002.jpg");
    row.fields["ration_card_id"] = "R999";
    OperationError error;
    ASSERT_TRUE(RecordSheet::save(dataPath(), m_config, {row}, &error));

    RecordStore store(m_config);
    LoadReport report = store.loadOrCreate(m_folder, {"card001.jpg"});

    EXPECT_TRUE(report.sheetLoaded);
    EXPECT_EQ(report.persistedRecords, 1);
    EXPECT_EQ(report.prunedCount, 1);
    EXPECT_FALSE(store.contains("card002.jpg"));
    EXPECT_EQ(store.fileNames(), QStringList({"card001.jpg"}));
}

TEST_F(RecordStoreTest, OcrResultSurvivesSaveAndReload)
{
    RecordStore store(m_config);
    store.loadOrCreate(m_folder, {"f.jpg"});

    FieldMap fields;
    fields.insert("name_of_card_holder", "X");
    ASSERT_TRUE(store.applyOcrResult("f.jpg", fields, {}));
    ASSERT_TRUE(store.save());

    RecordStore reloaded(m_config);
    reloaded.loadOrCreate(m_folder, {"f.jpg"});
    ASSERT_NE(reloaded.getRecord("f.jpg"), nullptr);
    EXPECT_EQ(reloaded.getRecord("f.jpg")->value("name_of_card_holder"), "X");
    EXPECT_FALSE(reloaded.getRecord("f.jpg")->dirty);
}

TEST_F(RecordStoreTest, ManualEditNeverClearsOtherFields)
{
    RecordStore store(m_config);
    store.loadOrCreate(m_folder, {"a.jpg"});

    FieldMap fields;
    fields.insert("ration_card_id", "R123");
    fields.insert("name_of_card_holder", "Jane Doe");
    fields.insert("village", "Rampur");
    ASSERT_TRUE(store.applyOcrResult("a.jpg", fields, {BoundingBox("village", 1, 2, 3, 4)}));

    ASSERT_TRUE(store.applyManualEdit("a.jpg", "name_of_card_holder", "Jane Q. Doe"));

    const CardRecord* record = store.getRecord("a.jpg");
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->value("ration_card_id"), "R123");
    EXPECT_EQ(record->value("village"), "Rampur");
    EXPECT_EQ(record->value("name_of_card_holder"), "Jane Q. Doe");
    EXPECT_EQ(record->boxes.size(), 1);
}

TEST_F(RecordStoreTest, ManualEditRejectsUnknownTargets)
{
    RecordStore store(m_config);
    store.loadOrCreate(m_folder, {"a.jpg"});

    EXPECT_FALSE(store.applyManualEdit("missing.jpg", "village", "x"));
    EXPECT_FALSE(store.applyManualEdit("a.jpg", "no_such_field", "x"));
    EXPECT_FALSE(store.hasUnsavedChanges());
}

TEST_F(RecordStoreTest, OcrScenarioWritesOneRowAndOneBox)
{
    RecordStore store(m_config);
    store.loadOrCreate(m_folder, {"card001.jpg"});

    FieldMap fields;
    fields.insert("ration_card_id", "R123");
    fields.insert("name_of_card_holder", "Jane Doe");
    BoundingBox box("ration_card_id", 383, 251, 404, 446);
    ASSERT_TRUE(store.applyOcrResult("card001.jpg", fields, {box}));

    const CardRecord* record = store.getRecord("card001.jpg");
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->value("ration_card_id"), "R123");
    EXPECT_EQ(record->value("name_of_card_holder"), "Jane Doe");
    EXPECT_EQ(record->value("guardian_name"), "");
    EXPECT_EQ(record->value("head_of_family"), "");
    EXPECT_EQ(record->value("village"), "");
    EXPECT_TRUE(record->dirty);
    EXPECT_EQ(record->ocrState, OcrState::Succeeded);

    OperationError error;
    ASSERT_TRUE(store.save(m_folder, &error)) << qPrintable(error.toString());
    EXPECT_FALSE(store.hasUnsavedChanges());

    QList<CardRecord> rows;
    ASSERT_TRUE(RecordSheet::load(dataPath(), m_config, rows, &error));
    ASSERT_EQ(rows.size(), 1);
    EXPECT_EQ(rows[0].fileName, "card001.jpg");

    QJsonObject root = QJsonDocument::fromJson(testutils::readFile(boxPath())).object();
    EXPECT_EQ(root.size(), 1);
    EXPECT_EQ(root.value("card001.jpg").toArray().size(), 1);
}

TEST_F(RecordStoreTest, OcrResultOverwritesOnlyReturnedFields)
{
    RecordStore store(m_config);
    store.loadOrCreate(m_folder, {"a.jpg"});
    ASSERT_TRUE(store.applyManualEdit("a.jpg", "guardian_name", "Typed"));
    ASSERT_TRUE(store.applyManualEdit("a.jpg", "village", "Old"));

    FieldMap fields;
    fields.insert("village", "New");
    fields.insert("unknown_key", "ignored");
    ASSERT_TRUE(store.applyOcrResult("a.jpg", fields, {}));

    const CardRecord* record = store.getRecord("a.jpg");
    EXPECT_EQ(record->value("guardian_name"), "Typed");
    EXPECT_EQ(record->value("village"), "New");
    EXPECT_FALSE(record->fields.contains("unknown_key"));
}

TEST_F(RecordStoreTest, FailedOcrLeavesFieldsUntouched)
{
    RecordStore store(m_config);
    store.loadOrCreate(m_folder, {"a.jpg"});
    ASSERT_TRUE(store.applyManualEdit("a.jpg", "village", "Rampur"));
    FieldMap before = store.getRecord("a.jpg")->fields;

    ASSERT_TRUE(store.markOcrFailed("a.jpg"));
    EXPECT_EQ(store.getRecord("a.jpg")->fields, before);
    EXPECT_EQ(store.getRecord("a.jpg")->ocrState, OcrState::Failed);
    EXPECT_FALSE(store.markOcrFailed("nope.jpg"));
}

TEST_F(RecordStoreTest, TruncatedSidecarDegradesToSpreadsheetData)
{
    CardRecord row("a.jpg");
    row.fields["village"] = "Rampur";
    OperationError error;
    ASSERT_TRUE(RecordSheet::save(dataPath(), m_config, {row}, &error));
    ASSERT_TRUE(testutils::writeFile(boxPath(), R"({"a.jpg": [{"field": "vil)"));

    RecordStore store(m_config);
    LoadReport report = store.loadOrCreate(m_folder, {"a.jpg"});

    EXPECT_TRUE(report.sheetLoaded);
    EXPECT_FALSE(report.sidecarLoaded);
    ASSERT_EQ(report.notices.size(), 1);
    EXPECT_EQ(report.notices.first().kind, ErrorKind::CorruptData);
    EXPECT_EQ(store.getRecord("a.jpg")->value("village"), "Rampur");
    EXPECT_TRUE(store.getRecord("a.jpg")->boxes.isEmpty());
}

TEST_F(RecordStoreTest, CorruptSpreadsheetKeepsSidecarBoxes)
{
    ASSERT_TRUE(testutils::writeFile(dataPath(), "not a workbook"));
    BoxMap boxes;
    boxes.insert("a.jpg", {BoundingBox("village", 1, 2, 3, 4)});
    ASSERT_TRUE(BoxSidecar::save(boxPath(), boxes));

    RecordStore store(m_config);
    LoadReport report = store.loadOrCreate(m_folder, {"a.jpg", "b.jpg"});

    EXPECT_FALSE(report.sheetLoaded);
    EXPECT_TRUE(report.sidecarLoaded);
    ASSERT_EQ(report.notices.size(), 1);
    EXPECT_EQ(report.notices.first().kind, ErrorKind::CorruptData);
    EXPECT_EQ(store.getRecord("a.jpg")->boxes.size(), 1);
    EXPECT_EQ(store.size(), 2);
}

TEST_F(RecordStoreTest, SidecarOnlyRecordsAreMerged)
{
    BoxMap boxes;
    boxes.insert("a.jpg", {BoundingBox("ration_card_id", 10, 20, 30, 40)});
    ASSERT_TRUE(BoxSidecar::save(boxPath(), boxes));

    RecordStore store(m_config);
    store.loadOrCreate(m_folder, {"a.jpg"});
    const CardRecord* record = store.getRecord("a.jpg");
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->boxes.first(), BoundingBox("ration_card_id", 10, 20, 30, 40));
    EXPECT_EQ(record->value("ration_card_id"), "");
}

TEST_F(RecordStoreTest, RecordsWithoutBoxesAreLeftOutOfSidecar)
{
    RecordStore store(m_config);
    store.loadOrCreate(m_folder, {"a.jpg", "b.jpg"});
    ASSERT_TRUE(store.applyOcrResult("a.jpg", FieldMap(), {BoundingBox("village", 1, 2, 3, 4)}));
    ASSERT_TRUE(store.save());

    QJsonObject root = QJsonDocument::fromJson(testutils::readFile(boxPath())).object();
    EXPECT_TRUE(root.contains("a.jpg"));
    EXPECT_FALSE(root.contains("b.jpg"));

    QList<CardRecord> rows;
    ASSERT_TRUE(RecordSheet::load(dataPath(), m_config, rows));
    EXPECT_EQ(rows.size(), 2);
}

TEST_F(RecordStoreTest, FailedSaveKeepsDirtyFlags)
{
    RecordStore store(m_config);
    store.loadOrCreate(m_folder, {"a.jpg"});
    ASSERT_TRUE(store.applyManualEdit("a.jpg", "village", "x"));

    OperationError error;
    EXPECT_FALSE(store.save(QDir(m_folder).filePath("missing/subdir"), &error));
    EXPECT_TRUE(error.isError());
    EXPECT_TRUE(store.hasUnsavedChanges());
    EXPECT_EQ(store.dirtyCount(), 1);
}

TEST_F(RecordStoreTest, SidecarFailureAfterSheetKeepsDirtyFlags)
{
    RecordStore store(m_config);
    store.loadOrCreate(m_folder, {"a.jpg"});
    ASSERT_TRUE(store.applyManualEdit("a.jpg", "village", "Rampur"));

    // A directory in place of the sidecar makes only the second write fail
    ASSERT_TRUE(QDir(m_folder).mkdir("bbox_data.json"));

    OperationError error;
    EXPECT_FALSE(store.save(&error));
    EXPECT_TRUE(error.isError());
    EXPECT_TRUE(store.hasUnsavedChanges());
    EXPECT_EQ(store.dirtyCount(), 1);

    QList<CardRecord> rows;
    ASSERT_TRUE(RecordSheet::load(dataPath(), m_config, rows));
    ASSERT_EQ(rows.size(), 1);
    EXPECT_EQ(rows[0].value("village"), "Rampur");
}

TEST_F(RecordStoreTest, RenameMovesFieldsAndBoxes)
{
    RecordStore store(m_config);
    store.loadOrCreate(m_folder, {"a.jpg", "b.jpg"});
    ASSERT_TRUE(store.applyOcrResult("a.jpg", {{"ration_card_id", "R1"}}, {BoundingBox("ration_card_id", 1, 2, 3, 4)}));

    EXPECT_FALSE(store.renameRecord("a.jpg", "b.jpg"));
    ASSERT_TRUE(store.renameRecord("a.jpg", "R1.jpg"));

    EXPECT_FALSE(store.contains("a.jpg"));
    const CardRecord* record = store.getRecord("R1.jpg");
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->fileName, "R1.jpg");
    EXPECT_EQ(record->value("ration_card_id"), "R1");
    EXPECT_EQ(record->boxes.size(), 1);
}

TEST_F(RecordStoreTest, DirtyStateSignalFollowsEditsAndSaves)
{
    RecordStore store(m_config);
    store.loadOrCreate(m_folder, {"a.jpg"});

    QList<bool> states;
    QObject::connect(&store, &RecordStore::dirtyStateChanged, [&states](bool dirty) { states.append(dirty); });

    ASSERT_TRUE(store.applyManualEdit("a.jpg", "village", "x"));
    ASSERT_TRUE(store.applyManualEdit("a.jpg", "notes", "y"));
    ASSERT_TRUE(store.save());

    EXPECT_EQ(states, QList<bool>({true, false}));
}
