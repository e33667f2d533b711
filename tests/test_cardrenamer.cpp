#include <gtest/gtest.h>
#include <QTemporaryDir>
#include <QFileInfo>
#include <memory>
#include "cardrenamer.h"
#include "imagesource.h"
#include "recordstore.h"
#include "recordsheet.h"
#include "testutils.h"

TEST(CardRenamerNames, SanitizeDropsPathCharacters)
{
    EXPECT_EQ(CardRenamer::sanitizeFileStem("  PHH 0046010534 "), "PHH 0046010534");
    EXPECT_EQ(CardRenamer::sanitizeFileStem("AAY/12:34*?"), "AAY1234");
    EXPECT_EQ(CardRenamer::sanitizeFileStem("<|>"), "");
}

TEST(CardRenamerNames, TargetKeepsExtension)
{
    EXPECT_EQ(CardRenamer::targetFileName("AAY 0123", "card001.JPG"), "AAY 0123.JPG");
    EXPECT_EQ(CardRenamer::targetFileName("R1", "scan"), "R1");
    EXPECT_TRUE(CardRenamer::targetFileName("  ", "card001.jpg").isEmpty());
}

class CardRenamerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
        ASSERT_TRUE(testutils::writeImage(m_dir.path(), "card001.jpg"));
        ASSERT_TRUE(testutils::writeImage(m_dir.path(), "card002.jpg"));

        m_source = std::make_unique<ImageSource>(m_config.imageExtensions);
        ASSERT_TRUE(m_source->open(m_dir.path()));
        m_store = std::make_unique<RecordStore>(m_config);
        m_store->loadOrCreate(m_dir.path(), m_source->fileNames());
    }

    QTemporaryDir m_dir;
    AppConfig m_config;
    std::unique_ptr<ImageSource> m_source;
    std::unique_ptr<RecordStore> m_store;
};

TEST_F(CardRenamerTest, RenamesFileAndRecordThenSaves)
{
    ASSERT_TRUE(m_store->applyManualEdit("card001.jpg", "ration_card_id", "AAY 0123"));
    ASSERT_TRUE(m_store->applyManualEdit("card001.jpg", "village", "Rampur"));

    QString newName;
    OperationError error;
    ASSERT_TRUE(CardRenamer::apply(*m_source, *m_store, "card001.jpg", &newName, &error))
        << qPrintable(error.toString());

    EXPECT_EQ(newName, "AAY 0123.jpg");
    EXPECT_TRUE(QFileInfo::exists(m_dir.filePath("AAY 0123.jpg")));
    EXPECT_FALSE(QFileInfo::exists(m_dir.filePath("card001.jpg")));
    EXPECT_FALSE(m_store->contains("card001.jpg"));
    EXPECT_EQ(m_store->getRecord("AAY 0123.jpg")->value("village"), "Rampur");
    EXPECT_FALSE(m_store->hasUnsavedChanges());

    QList<CardRecord> rows;
    ASSERT_TRUE(RecordSheet::load(m_dir.filePath("data.xlsx"), m_config, rows));
    QStringList names;
    for (const CardRecord& row : rows) {
        names.append(row.fileName);
    }
    EXPECT_TRUE(names.contains("AAY 0123.jpg"));
    EXPECT_FALSE(names.contains("card001.jpg"));
}

TEST_F(CardRenamerTest, EmptyIdIsRejected)
{
    OperationError error;
    EXPECT_FALSE(CardRenamer::apply(*m_source, *m_store, "card001.jpg", nullptr, &error));
    EXPECT_EQ(error.kind, ErrorKind::UnrecognizedFormat);
    EXPECT_TRUE(QFileInfo::exists(m_dir.filePath("card001.jpg")));
}

TEST_F(CardRenamerTest, ConflictingIdIsRejected)
{
    ASSERT_TRUE(m_store->applyManualEdit("card001.jpg", "ration_card_id", "card002"));

    OperationError error;
    EXPECT_FALSE(CardRenamer::apply(*m_source, *m_store, "card001.jpg", nullptr, &error));
    EXPECT_EQ(error.kind, ErrorKind::IOError);
    EXPECT_TRUE(m_store->contains("card001.jpg"));
    EXPECT_TRUE(m_store->contains("card002.jpg"));
    EXPECT_TRUE(m_store->hasUnsavedChanges());
}

TEST_F(CardRenamerTest, MatchingNameOnlySaves)
{
    ASSERT_TRUE(m_store->applyManualEdit("card001.jpg", "ration_card_id", "card001"));

    QString newName;
    ASSERT_TRUE(CardRenamer::apply(*m_source, *m_store, "card001.jpg", &newName));
    EXPECT_EQ(newName, "card001.jpg");
    EXPECT_TRUE(QFileInfo::exists(m_dir.filePath("card001.jpg")));
    EXPECT_TRUE(QFileInfo::exists(m_dir.filePath("data.xlsx")));
    EXPECT_FALSE(m_store->hasUnsavedChanges());
}

TEST_F(CardRenamerTest, UnknownRecordIsNotFound)
{
    OperationError error;
    EXPECT_FALSE(CardRenamer::apply(*m_source, *m_store, "ghost.jpg", nullptr, &error));
    EXPECT_EQ(error.kind, ErrorKind::NotFound);
}
