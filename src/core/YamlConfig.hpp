#pragma once

#include <QList>
#include <QString>
#include <QStringList>
#include <yaml-cpp/yaml.h>
#include <plink/Client/ClientConfig.hpp>

namespace paige {

class YamlConfig {
public:
    YamlConfig();

    /// Throws YAML::Exception if the file is missing or malformed.
    void load(const QString& filePath);
    void save(const QString& filePath) const;

    // Link
    QString url() const;
    void setUrl(const QString& v);
    int correlationTimeoutMs() const;
    void setCorrelationTimeoutMs(int v);
    QList<int> reconnectDelaysMs() const;
    void setReconnectDelaysMs(const QList<int>& v);
    QStringList fireAndForgetTypes() const;
    void setFireAndForgetTypes(const QStringList& v);

    // Handshake
    QString handshakeType() const;
    void setHandshakeType(const QString& v);
    QString handshakeVersion() const;
    void setHandshakeVersion(const QString& v);
    QString handshakePlatform() const;
    void setHandshakePlatform(const QString& v);
    int windowWidth() const;
    void setWindowWidth(int v);
    int windowHeight() const;
    void setWindowHeight(int v);

    /// Client settings built from the current tree. Out-of-range values
    /// fall back to the built-in defaults.
    plink::ClientConfig toClientConfig() const;

private:
    YAML::Node root_;

    void initDefaults();
};

} // namespace paige
