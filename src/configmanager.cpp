#include "configmanager.h"
#include <QDebug>
#include <QtGlobal>

// Configuration keys
const QString ConfigManager::KEY_MODEL_INDEX = "ocr/modelIndex";
const QString ConfigManager::KEY_ENDPOINT = "ocr/endpoint";
const QString ConfigManager::KEY_REQUEST_TIMEOUT = "ocr/requestTimeoutMs";
const QString ConfigManager::KEY_LAST_FOLDER = "session/lastFolder";
const QString ConfigManager::KEY_WINDOW_GEOMETRY = "session/windowGeometry";
const QString ConfigManager::KEY_SHOW_BOXES = "session/showBoxes";
const char* ConfigManager::ENV_API_KEY = "GEMINI_API_KEY";

AppConfig::AppConfig() :
    modelNames({"gemini-2.5-pro-exp-03-25",
                "gemini-1.5-flash-8b-exp-0924",
                "gemini-2.0-flash"}),
    modelIndex(2),
    endpoint("https://generativelanguage.googleapis.com/v1beta/models"),
    prompt(defaultPrompt()),
    requestTimeoutMs(60000),
    maxImageBytes(10 * 1024 * 1024),
    fields(defaultFields()),
    fileNameColumn("image_name"),
    dataFileName("data.xlsx"),
    boxFileName("bbox_data.json"),
    imageExtensions({".jpg", ".jpeg", ".png", ".bmp", ".gif"})
{}

QString AppConfig::modelName() const
{
    if (modelNames.isEmpty()) {
        return QString();
    }
    return modelNames.at(qBound(0, modelIndex, modelNames.size() - 1));
}

const FieldDefinition* AppConfig::field(const QString& key) const
{
    for (const FieldDefinition& def : fields) {
        if (def.key == key) {
            return &def;
        }
    }
    return nullptr;
}

const FieldDefinition* AppConfig::fieldForOcrKey(const QString& ocrKey) const
{
    if (ocrKey.isEmpty()) {
        return nullptr;
    }
    for (const FieldDefinition& def : fields) {
        if (def.ocrKey == ocrKey) {
            return &def;
        }
    }
    return nullptr;
}

QStringList AppConfig::fieldKeys() const
{
    QStringList keys;
    for (const FieldDefinition& def : fields) {
        keys.append(def.key);
    }
    return keys;
}

QList<FieldDefinition> AppConfig::defaultFields()
{
    return {
        FieldDefinition("ration_card_id", "Ration Card ID", "Ration Card ID:", "ration_card_id"),
        FieldDefinition("name_of_card_holder", "Name of Card Holder", "Name of Card Holder:", "name_of_card_holder"),
        FieldDefinition("guardian_name", "Guardian's Name", "Guardian's Name:", "guardian_name"),
        FieldDefinition("head_of_family", "Head of Family", "Head of Family:", "head_of_family"),
        FieldDefinition("village", "Village", "Village:", "address"),
        FieldDefinition("notes", "Notes", "Notes:", QString())
    };
}

QString AppConfig::defaultPrompt()
{
    return QStringLiteral(
        "Perform OCR on the ration card document image and return EXCLUSIVELY\n"
        "these 5 fields and their bounding box coordinates with strict JSON keys:\n"
        "\n"
        "1. `ration_card_id`:\n"
        "- Either one of \"AAY/SPHH/PHH/RKSY-I/RKSY-II\", followed by a number.\n"
        "- For example: \"AAY 0123456789\"\n"
        "- Return empty string if missing (not \"NA\")\n"
        "- Return bounding box coordinates\n"
        "\n"
        "2. `name_of_card_holder`:\n"
        "- Name of primary card holder (e.g., \"FIRST_NAME LAST_NAME\")\n"
        "- Return empty string if missing (not \"NA\")\n"
        "- Return bounding box coordinates\n"
        "\n"
        "3. `guardian_name`:\n"
        "- Name of father/husband/guardian\n"
        "- Return empty string if missing (not \"NA\")\n"
        "- Return bounding box coordinates\n"
        "\n"
        "4. `head_of_family`:\n"
        "- Name of family head\n"
        "- Return empty string if missing (not \"NA\")\n"
        "- Return bounding box coordinates\n"
        "\n"
        "5. `address`:\n"
        "- Village name\n"
        "- Return empty string if missing (not \"NA\")\n"
        "- Return bounding box coordinates\n"
        "\n"
        "FORMAT REQUIREMENTS:\n"
        "- Use exactly these lowercase snake_case keys\n"
        "- Bounding boxes as [y_min, x_min, y_max, x_max] (top-left origin coordinates)\n"
        "- Empty strings for missing fields (no \"NA\")\n"
        "- Strict JSON format, no extra fields/markdown\n"
        "\n"
        "EXAMPLE RESPONSE:\n"
        "{\n"
        "  \"ration_card_id\": {\n"
        "    \"value\": \"alphanumeric code\",\n"
        "    \"bounding_box\": [y_min, x_min, y_max, x_max]\n"
        "  }\n"
        "}\n");
}

ConfigManager::ConfigManager(QObject *parent)
    : QObject(parent)
{
    m_settings = new QSettings("RationCardProcessor", "RationCardProcessor", this);
}

AppConfig ConfigManager::loadConfig()
{
    AppConfig config;

    config.apiKey = qEnvironmentVariable(ENV_API_KEY).trimmed();
    config.modelIndex = m_settings->value(KEY_MODEL_INDEX, config.modelIndex).toInt();
    if (config.modelIndex < 0 || config.modelIndex >= config.modelNames.size()) {
        qWarning() << "ConfigManager: Model index out of range, using default:" << config.modelIndex;
        config.modelIndex = config.modelNames.size() - 1;
    }
    config.endpoint = m_settings->value(KEY_ENDPOINT, config.endpoint).toString();
    config.requestTimeoutMs = m_settings->value(KEY_REQUEST_TIMEOUT, config.requestTimeoutMs).toInt();
    if (config.requestTimeoutMs <= 0) {
        config.requestTimeoutMs = AppConfig().requestTimeoutMs;
    }

    qInfo() << "ConfigManager: Using model" << config.modelName()
            << "API key" << (config.apiKey.isEmpty() ? "missing" : "present");

    return config;
}

bool ConfigManager::validate(const AppConfig& config, QString* message)
{
    QString problem;
    if (config.apiKey.isEmpty()) {
        problem = QString("%1 environment variable not set").arg(ENV_API_KEY);
    } else if (config.modelNames.isEmpty()) {
        problem = "Model list cannot be empty";
    } else if (config.prompt.trimmed().isEmpty()) {
        problem = "OCR prompt configuration missing";
    }

    if (message) {
        *message = problem;
    }
    return problem.isEmpty();
}

QString ConfigManager::lastFolder() const
{
    return m_settings->value(KEY_LAST_FOLDER).toString();
}

void ConfigManager::setLastFolder(const QString& folder)
{
    m_settings->setValue(KEY_LAST_FOLDER, folder);
    m_settings->sync();
}

QByteArray ConfigManager::windowGeometry() const
{
    return m_settings->value(KEY_WINDOW_GEOMETRY).toByteArray();
}

void ConfigManager::setWindowGeometry(const QByteArray& geometry)
{
    m_settings->setValue(KEY_WINDOW_GEOMETRY, geometry);
    m_settings->sync();
}

bool ConfigManager::showBoxes() const
{
    return m_settings->value(KEY_SHOW_BOXES, true).toBool();
}

void ConfigManager::setShowBoxes(bool show)
{
    m_settings->setValue(KEY_SHOW_BOXES, show);
    m_settings->sync();
}
