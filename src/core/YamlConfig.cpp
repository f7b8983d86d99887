#include "core/YamlConfig.hpp"
#include <QSize>
#include <QUrl>
#include <algorithm>
#include <boost/log/trivial.hpp>
#include <fstream>
#include <plink/Version.hpp>

namespace paige {

namespace {

// The loaded file is laid over the defaults: maps merge key by key, lists
// and scalars from the file replace the default wholesale.
YAML::Node overlayDefaults(const YAML::Node& defaults, const YAML::Node& loaded)
{
    if (!loaded.IsDefined() || loaded.IsNull())
        return YAML::Clone(defaults);
    if (!defaults.IsMap() || !loaded.IsMap())
        return YAML::Clone(loaded);

    YAML::Node merged = YAML::Clone(defaults);
    for (const auto& entry : loaded) {
        const std::string key = entry.first.as<std::string>();
        merged[key] = overlayDefaults(merged[key], entry.second);
    }
    return merged;
}

// Entries that are not scalars are skipped.
QStringList readStringList(const YAML::Node& node)
{
    QStringList result;
    if (!node.IsSequence())
        return result;

    for (const auto& item : node) {
        if (item.IsScalar())
            result.append(QString::fromStdString(item.as<std::string>()));
        else
            BOOST_LOG_TRIVIAL(warning) << "[YamlConfig] Skipping non-scalar list entry";
    }
    return result;
}

YAML::Node toSequence(const QStringList& values)
{
    YAML::Node seq(YAML::NodeType::Sequence);
    for (const auto& v : values)
        seq.push_back(v.toStdString());
    return seq;
}

} // namespace

YamlConfig::YamlConfig()
{
    initDefaults();
}

void YamlConfig::initDefaults()
{
    const plink::ClientConfig defaults;

    root_ = YAML::Node(YAML::NodeType::Map);

    root_["link"]["url"] = defaults.url.toString().toStdString();
    root_["link"]["correlation_timeout_ms"] = defaults.correlationTimeout;
    root_["link"]["reconnect_delays_ms"] = YAML::Node(YAML::NodeType::Sequence);
    for (int delay : defaults.reconnectDelays)
        root_["link"]["reconnect_delays_ms"].push_back(delay);

    QStringList fireAndForget(defaults.fireAndForgetTypes.begin(),
                              defaults.fireAndForgetTypes.end());
    fireAndForget.sort();
    root_["link"]["fire_and_forget"] = toSequence(fireAndForget);

    root_["handshake"]["type"] = defaults.handshake.type.toStdString();
    root_["handshake"]["version"] = defaults.handshake.version.toStdString();
    root_["handshake"]["platform"] = "";
    root_["handshake"]["window_width"] = 0;
    root_["handshake"]["window_height"] = 0;
}

void YamlConfig::load(const QString& filePath)
{
    initDefaults();
    YAML::Node defaults = YAML::Clone(root_);

    YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
    root_ = overlayDefaults(defaults, loaded);
}

void YamlConfig::save(const QString& filePath) const
{
    std::ofstream fout(filePath.toStdString());
    fout << root_;
}

// --- Link ---

QString YamlConfig::url() const
{
    return QString::fromStdString(root_["link"]["url"].as<std::string>(plink::DEFAULT_URL));
}

void YamlConfig::setUrl(const QString& v)
{
    root_["link"]["url"] = v.toStdString();
}

int YamlConfig::correlationTimeoutMs() const
{
    return root_["link"]["correlation_timeout_ms"].as<int>(plink::CORRELATION_TIMEOUT_MS);
}

void YamlConfig::setCorrelationTimeoutMs(int v)
{
    root_["link"]["correlation_timeout_ms"] = v;
}

QList<int> YamlConfig::reconnectDelaysMs() const
{
    QList<int> result;
    const YAML::Node node = root_["link"]["reconnect_delays_ms"];
    if (node.IsSequence()) {
        // Unreadable entries come back as -1 so toClientConfig() rejects the table.
        for (const auto& item : node)
            result.append(item.as<int>(-1));
    }
    return result;
}

void YamlConfig::setReconnectDelaysMs(const QList<int>& v)
{
    root_["link"]["reconnect_delays_ms"] = YAML::Node(YAML::NodeType::Sequence);
    for (int delay : v)
        root_["link"]["reconnect_delays_ms"].push_back(delay);
}

QStringList YamlConfig::fireAndForgetTypes() const
{
    return readStringList(root_["link"]["fire_and_forget"]);
}

void YamlConfig::setFireAndForgetTypes(const QStringList& v)
{
    root_["link"]["fire_and_forget"] = toSequence(v);
}

// --- Handshake ---

QString YamlConfig::handshakeType() const
{
    return QString::fromStdString(
        root_["handshake"]["type"].as<std::string>(plink::ClientMessageType::CONNECTION_HELLO));
}

void YamlConfig::setHandshakeType(const QString& v)
{
    root_["handshake"]["type"] = v.toStdString();
}

QString YamlConfig::handshakeVersion() const
{
    return QString::fromStdString(
        root_["handshake"]["version"].as<std::string>(plink::CLIENT_VERSION));
}

void YamlConfig::setHandshakeVersion(const QString& v)
{
    root_["handshake"]["version"] = v.toStdString();
}

QString YamlConfig::handshakePlatform() const
{
    return QString::fromStdString(root_["handshake"]["platform"].as<std::string>(""));
}

void YamlConfig::setHandshakePlatform(const QString& v)
{
    root_["handshake"]["platform"] = v.toStdString();
}

int YamlConfig::windowWidth() const
{
    return root_["handshake"]["window_width"].as<int>(0);
}

void YamlConfig::setWindowWidth(int v)
{
    root_["handshake"]["window_width"] = v;
}

int YamlConfig::windowHeight() const
{
    return root_["handshake"]["window_height"].as<int>(0);
}

void YamlConfig::setWindowHeight(int v)
{
    root_["handshake"]["window_height"] = v;
}

// --- Conversion ---

plink::ClientConfig YamlConfig::toClientConfig() const
{
    plink::ClientConfig config;

    QUrl linkUrl(url());
    if (linkUrl.isValid() && (linkUrl.scheme() == "ws" || linkUrl.scheme() == "wss")) {
        config.url = linkUrl;
    } else {
        BOOST_LOG_TRIVIAL(warning) << "[YamlConfig] Ignoring link.url '" << url().toStdString()
                                   << "', using " << plink::DEFAULT_URL;
    }

    int timeout = correlationTimeoutMs();
    if (timeout > 0) {
        config.correlationTimeout = timeout;
    } else {
        BOOST_LOG_TRIVIAL(warning) << "[YamlConfig] Ignoring link.correlation_timeout_ms "
                                   << timeout;
    }

    QList<int> delays = reconnectDelaysMs();
    bool delaysValid = !delays.isEmpty()
        && std::all_of(delays.begin(), delays.end(), [](int d) { return d >= 0; });
    if (delaysValid) {
        config.reconnectDelays = delays;
    } else {
        BOOST_LOG_TRIVIAL(warning) << "[YamlConfig] Ignoring link.reconnect_delays_ms";
    }

    // An explicitly empty list disables fire-and-forget entirely.
    const QStringList types = fireAndForgetTypes();
    config.fireAndForgetTypes = QSet<QString>(types.begin(), types.end());

    if (!handshakeType().isEmpty())
        config.handshake.type = handshakeType();
    config.handshake.version = handshakeVersion();
    config.handshake.platform = handshakePlatform();
    if (windowWidth() > 0 && windowHeight() > 0)
        config.handshake.windowSize = QSize(windowWidth(), windowHeight());

    return config;
}

} // namespace paige
