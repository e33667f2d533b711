#include <gtest/gtest.h>
#include <QTemporaryDir>
#include <QSemaphore>
#include <memory>
#include "ocrcoordinator.h"
#include "recordstore.h"
#include "statusreporter.h"
#include "formbinding.h"
#include "testutils.h"

namespace {

OcrResult successResult()
{
    OcrResult result;
    result.success = true;
    result.fields.insert("ration_card_id", "R123");
    result.fields.insert("name_of_card_holder", "Jane Doe");
    result.boxes.append(BoundingBox("ration_card_id", 383, 251, 404, 446));
    return result;
}

} // namespace

class OcrCoordinatorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
        ASSERT_TRUE(testutils::writeImage(m_dir.path(), "a.jpg"));
        ASSERT_TRUE(testutils::writeImage(m_dir.path(), "b.png"));
        m_store = std::make_unique<RecordStore>(m_config);
        m_store->loadOrCreate(m_dir.path(), {"a.jpg", "b.png"});
    }

    void TearDown() override
    {
        // Let a blocked worker finish before the coordinator joins it
        m_gate.release(10);
        m_coordinator.reset();
    }

    testutils::GatedOcrEngine* createCoordinator(const OcrResult& result)
    {
        auto engine = std::make_unique<testutils::GatedOcrEngine>(&m_gate, result);
        testutils::GatedOcrEngine* raw = engine.get();
        m_coordinator = std::make_unique<OcrCoordinator>(m_store.get(), &m_status, std::move(engine));
        return raw;
    }

    QString path(const QString& name) const { return m_dir.filePath(name); }

    QTemporaryDir m_dir;
    AppConfig m_config;
    QSemaphore m_gate;
    StatusReporter m_status;
    std::unique_ptr<RecordStore> m_store;
    std::unique_ptr<OcrCoordinator> m_coordinator;
};

TEST_F(OcrCoordinatorTest, AppliesResultToRecord)
{
    testutils::GatedOcrEngine* engine = createCoordinator(successResult());

    EXPECT_EQ(m_coordinator->request("a.jpg", path("a.jpg")), OcrCoordinator::RequestOutcome::Started);
    EXPECT_EQ(m_status.state(), StatusReporter::State::OcrInProgress);

    m_gate.release();
    ASSERT_TRUE(testutils::waitFor([this]() { return !m_coordinator->isBusy(); }));

    const CardRecord* record = m_store->getRecord("a.jpg");
    EXPECT_EQ(record->value("ration_card_id"), "R123");
    EXPECT_EQ(record->value("name_of_card_holder"), "Jane Doe");
    EXPECT_EQ(record->value("village"), "");
    EXPECT_EQ(record->boxes.size(), 1);
    EXPECT_EQ(record->ocrState, OcrState::Succeeded);
    EXPECT_TRUE(record->dirty);

    EXPECT_EQ(m_status.state(), StatusReporter::State::OcrCompleted);
    EXPECT_EQ(engine->calls(), 1);
    EXPECT_EQ(engine->lastMime(), "image/png");
    EXPECT_GT(engine->lastBytes(), 0);
}

TEST_F(OcrCoordinatorTest, SecondTriggerOnSameRecordIsRejected)
{
    testutils::GatedOcrEngine* engine = createCoordinator(successResult());

    EXPECT_EQ(m_coordinator->request("a.jpg", path("a.jpg")), OcrCoordinator::RequestOutcome::Started);
    EXPECT_EQ(m_coordinator->request("a.jpg", path("a.jpg")), OcrCoordinator::RequestOutcome::AlreadyPending);
    EXPECT_EQ(m_coordinator->request("b.png", path("b.png")), OcrCoordinator::RequestOutcome::Busy);
    EXPECT_TRUE(m_coordinator->isPending("a.jpg"));
    EXPECT_FALSE(m_coordinator->isPending("b.png"));

    m_gate.release();
    ASSERT_TRUE(testutils::waitFor([this]() { return !m_coordinator->isBusy(); }));
    EXPECT_EQ(engine->calls(), 1);

    // Accepted again once the first call has completed
    EXPECT_EQ(m_coordinator->request("b.png", path("b.png")), OcrCoordinator::RequestOutcome::Started);
    m_gate.release();
    ASSERT_TRUE(testutils::waitFor([this]() { return !m_coordinator->isBusy(); }));
    EXPECT_EQ(engine->calls(), 2);
}

TEST_F(OcrCoordinatorTest, ResultLandsOnRequestedRecordAfterNavigation)
{
    createCoordinator(successResult());
    FormBinding binding(m_store.get());

    ASSERT_TRUE(binding.show("a.jpg"));
    ASSERT_EQ(m_coordinator->request("a.jpg", path("a.jpg")), OcrCoordinator::RequestOutcome::Started);

    // Operator moves on and edits another card while OCR runs
    ASSERT_TRUE(binding.show("b.png"));
    ASSERT_TRUE(binding.editField("village", "Rampur"));

    m_gate.release();
    ASSERT_TRUE(testutils::waitFor([this]() { return !m_coordinator->isBusy(); }));

    EXPECT_EQ(m_store->getRecord("a.jpg")->value("ration_card_id"), "R123");
    EXPECT_EQ(m_store->getRecord("b.png")->value("ration_card_id"), "");
    EXPECT_EQ(m_store->getRecord("b.png")->value("village"), "Rampur");
    EXPECT_EQ(binding.activeFile(), "b.png");
    EXPECT_EQ(binding.values().value("village"), "Rampur");
}

TEST_F(OcrCoordinatorTest, FailureLeavesFieldsUntouched)
{
    createCoordinator(OcrResult::failure(ErrorKind::Network, "connection refused"));
    ASSERT_TRUE(m_store->applyManualEdit("a.jpg", "name_of_card_holder", "Typed by hand"));
    FieldMap before = m_store->getRecord("a.jpg")->fields;

    bool finishedOk = true;
    QObject::connect(m_coordinator.get(), &OcrCoordinator::ocrFinished,
                     [&finishedOk](const QString&, bool success) { finishedOk = success; });

    ASSERT_EQ(m_coordinator->request("a.jpg", path("a.jpg")), OcrCoordinator::RequestOutcome::Started);
    m_gate.release();
    ASSERT_TRUE(testutils::waitFor([this]() { return !m_coordinator->isBusy(); }));

    const CardRecord* record = m_store->getRecord("a.jpg");
    EXPECT_EQ(record->fields, before);
    EXPECT_TRUE(record->boxes.isEmpty());
    EXPECT_EQ(record->ocrState, OcrState::Failed);
    EXPECT_FALSE(finishedOk);
    EXPECT_EQ(m_status.state(), StatusReporter::State::Error);
    EXPECT_TRUE(m_status.message().contains("NetworkError"));
}

TEST_F(OcrCoordinatorTest, UnreadableImageFailsBeforeEngine)
{
    testutils::GatedOcrEngine* engine = createCoordinator(successResult());
    ASSERT_TRUE(testutils::writeFile(path("a.jpg"), "not an image"));

    ASSERT_EQ(m_coordinator->request("a.jpg", path("a.jpg")), OcrCoordinator::RequestOutcome::Started);
    ASSERT_TRUE(testutils::waitFor([this]() { return !m_coordinator->isBusy(); }));

    EXPECT_EQ(engine->calls(), 0);
    EXPECT_EQ(m_store->getRecord("a.jpg")->ocrState, OcrState::Failed);
    EXPECT_EQ(m_store->getRecord("a.jpg")->value("ration_card_id"), "");
}

TEST_F(OcrCoordinatorTest, UnknownRecordIsRejected)
{
    testutils::GatedOcrEngine* engine = createCoordinator(successResult());
    EXPECT_EQ(m_coordinator->request("zzz.jpg", path("zzz.jpg")), OcrCoordinator::RequestOutcome::UnknownRecord);
    EXPECT_FALSE(m_coordinator->isBusy());
    EXPECT_EQ(engine->calls(), 0);
}
