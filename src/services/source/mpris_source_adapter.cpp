#include "listen_along/services/source/mpris_source_adapter.hpp"
#include "listen_along/services/network/http_client.hpp"
#include "listen_along/utils/logger.hpp"

#include <QDBusArgument>
#include <QDBusConnection>
#include <QDBusConnectionInterface>
#include <QDBusInterface>
#include <QDBusReply>
#include <QDBusVariant>
#include <QFile>
#include <QStringList>
#include <QUrl>
#include <QVariantMap>

namespace listen_along::services {

namespace {
    const QString MPRIS_PREFIX = QStringLiteral("org.mpris.MediaPlayer2.");
    const QString MPRIS_PATH = QStringLiteral("/org/mpris/MediaPlayer2");
    const QString PLAYER_IFACE = QStringLiteral("org.mpris.MediaPlayer2.Player");
    const QString PROPERTIES_IFACE = QStringLiteral("org.freedesktop.DBus.Properties");

    std::optional<QVariant> get_property(QDBusInterface& props, const QString& name) {
        QDBusReply<QDBusVariant> reply = props.call(QStringLiteral("Get"), PLAYER_IFACE, name);
        if (!reply.isValid()) {
            return std::nullopt;
        }
        return reply.value().variant();
    }

    QVariantMap to_map(const QVariant& value) {
        if (value.canConvert<QDBusArgument>()) {
            return qdbus_cast<QVariantMap>(value.value<QDBusArgument>());
        }
        return value.toMap();
    }

    // xesam:artist is a string list; some players send a plain string
    std::string first_artist(const QVariant& value) {
        const auto list = value.toStringList();
        if (!list.isEmpty()) {
            return list.join(QStringLiteral(", ")).toStdString();
        }
        return value.toString().toStdString();
    }
}

MprisSourceAdapter::MprisSourceAdapter(core::MediaSessionConfig config, std::shared_ptr<HttpClient> http_client)
    : m_config(std::move(config))
    , m_http_client(std::move(http_client)) {}

MprisSourceAdapter::~MprisSourceAdapter() = default;

std::vector<std::string> MprisSourceAdapter::list_players() const {
    std::vector<std::string> players;

    auto* bus = QDBusConnection::sessionBus().interface();
    if (!bus) {
        return players;
    }

    const QDBusReply<QStringList> names = bus->registeredServiceNames();
    if (!names.isValid()) {
        return players;
    }

    const auto filter = QString::fromStdString(m_config.player_filter);
    for (const auto& service : names.value()) {
        if (!service.startsWith(MPRIS_PREFIX)) {
            continue;
        }
        if (!filter.isEmpty() && !service.contains(filter, Qt::CaseInsensitive)) {
            continue;
        }
        players.push_back(service.toStdString());
    }
    return players;
}

std::expected<std::optional<core::TrackSnapshot>, core::AdapterProbeError> MprisSourceAdapter::probe() {
    if (!m_config.enabled) {
        return std::optional<core::TrackSnapshot>{};
    }
    if (!QDBusConnection::sessionBus().isConnected()) {
        return std::unexpected(core::AdapterProbeError::Unavailable);
    }

    std::optional<core::TrackSnapshot> paused;
    for (const auto& service : list_players()) {
        auto snapshot = read_player(QString::fromStdString(service));
        if (!snapshot) {
            continue;
        }
        if (snapshot->is_playing) {
            return snapshot;
        }
        if (!paused) {
            paused = std::move(snapshot);
        }
    }
    return paused;
}

std::optional<core::TrackSnapshot> MprisSourceAdapter::read_player(const QString& service) {
    QDBusInterface props(service, MPRIS_PATH, PROPERTIES_IFACE, QDBusConnection::sessionBus());
    if (!props.isValid()) {
        return std::nullopt;
    }

    const auto status = get_property(props, QStringLiteral("PlaybackStatus"));
    const auto metadata_value = get_property(props, QStringLiteral("Metadata"));
    if (!status || !metadata_value) {
        LOG_DEBUG("MprisSource", "Player " + service.toStdString() + " did not answer");
        return std::nullopt;
    }

    const auto metadata = to_map(*metadata_value);
    const auto title = metadata.value(QStringLiteral("xesam:title")).toString().toStdString();
    if (title.empty()) {
        return std::nullopt;
    }

    core::TrackSnapshot snapshot;
    snapshot.title = title;
    snapshot.artist = first_artist(metadata.value(QStringLiteral("xesam:artist")));
    snapshot.source_id = core::SourceId::PrimarySource;
    snapshot.is_playing = status->toString() == QStringLiteral("Playing");

    const auto album = metadata.value(QStringLiteral("xesam:album")).toString().toStdString();
    if (!album.empty()) {
        snapshot.album = album;
    }

    // MPRIS reports microseconds
    const auto length_us = metadata.value(QStringLiteral("mpris:length")).toLongLong();
    if (length_us > 0) {
        snapshot.duration_ms = length_us / 1000;
    }
    if (const auto position = get_property(props, QStringLiteral("Position"))) {
        snapshot.position_ms = position->toLongLong() / 1000;
    }

    // Paused players lose to playing ones, so only playing ones need art
    const auto art_url = metadata.value(QStringLiteral("mpris:artUrl")).toString().toStdString();
    if (snapshot.is_playing && !art_url.empty()) {
        snapshot.artwork_bytes = cover_for(art_url);
    }

    return snapshot;
}

std::optional<std::vector<std::uint8_t>> MprisSourceAdapter::cover_for(const std::string& art_url) {
    if (art_url.empty()) {
        return std::nullopt;
    }
    if (art_url == m_cover_url) {
        return m_cover;
    }

    m_cover_url = art_url;
    m_cover.reset();

    const QUrl url(QString::fromStdString(art_url));
    if (url.isLocalFile()) {
        QFile file(url.toLocalFile());
        if (file.open(QIODevice::ReadOnly)) {
            const QByteArray data = file.readAll();
            m_cover = std::vector<std::uint8_t>(data.begin(), data.end());
        }
    } else if (m_http_client && (url.scheme() == QStringLiteral("http") || url.scheme() == QStringLiteral("https"))) {
        auto response = m_http_client->get(art_url);
        if (response && response->is_success() && !response->body.empty()) {
            m_cover = std::vector<std::uint8_t>(response->body.begin(), response->body.end());
        }
    }

    if (!m_cover) {
        LOG_DEBUG("MprisSource", "Could not load cover art from " + art_url);
    }
    return m_cover;
}

} // namespace listen_along::services
