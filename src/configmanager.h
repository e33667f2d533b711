#ifndef CONFIGMANAGER_H
#define CONFIGMANAGER_H

#include <QObject>
#include <QSettings>
#include <QString>
#include <QStringList>
#include <QByteArray>
#include <QList>

/**
 * One editable field of a ration card record
 */
struct FieldDefinition {
    QString key;          // e.g., "ration_card_id"
    QString column;       // Spreadsheet header, e.g., "Ration Card ID"
    QString label;        // Form label, e.g., "Ration Card ID:"
    QString ocrKey;       // Key in the OCR response, empty if not extracted by OCR

    FieldDefinition() {}
    FieldDefinition(const QString& key, const QString& column,
                    const QString& label, const QString& ocrKey)
        : key(key), column(column), label(label), ocrKey(ocrKey) {}
};

/**
 * Immutable application configuration, built once at startup
 */
struct AppConfig {
    // OCR
    QString apiKey;
    QStringList modelNames;
    int modelIndex;
    QString endpoint;
    QString prompt;
    int requestTimeoutMs;
    qint64 maxImageBytes;

    // Data
    QList<FieldDefinition> fields;
    QString fileNameColumn;
    QString dataFileName;
    QString boxFileName;
    QStringList imageExtensions;

    AppConfig();

    /**
     * Get the model selected by modelIndex
     * @return Model name, empty if the list is empty
     */
    QString modelName() const;

    /**
     * Look up a field by key
     * @param key Field key
     * @return Pointer into fields, nullptr if unknown
     */
    const FieldDefinition* field(const QString& key) const;

    /**
     * Look up a field by OCR response key
     * @param ocrKey OCR key
     * @return Pointer into fields, nullptr if unknown
     */
    const FieldDefinition* fieldForOcrKey(const QString& ocrKey) const;

    /**
     * Get all field keys in catalog order
     */
    QStringList fieldKeys() const;

    /**
     * Default field catalog
     */
    static QList<FieldDefinition> defaultFields();

    /**
     * Default extraction prompt sent along with each image
     */
    static QString defaultPrompt();
};

class ConfigManager : public QObject
{
    Q_OBJECT

public:
    explicit ConfigManager(QObject *parent = nullptr);

    /**
     * Build configuration from persistent settings and the environment
     * @return AppConfig with loaded settings
     */
    AppConfig loadConfig();

    /**
     * Check that OCR can run with the given configuration
     * @param config Configuration to check
     * @param message Output description of the first problem found
     * @return true if valid
     */
    static bool validate(const AppConfig& config, QString* message = nullptr);

    // Session state persisted alongside the configuration
    QString lastFolder() const;
    void setLastFolder(const QString& folder);
    QByteArray windowGeometry() const;
    void setWindowGeometry(const QByteArray& geometry);
    bool showBoxes() const;
    void setShowBoxes(bool show);

private:
    QSettings* m_settings;

    static const QString KEY_MODEL_INDEX;
    static const QString KEY_ENDPOINT;
    static const QString KEY_REQUEST_TIMEOUT;
    static const QString KEY_LAST_FOLDER;
    static const QString KEY_WINDOW_GEOMETRY;
    static const QString KEY_SHOW_BOXES;
    static const char* ENV_API_KEY;
};

#endif // CONFIGMANAGER_H
