/**
 * @file DownloadListModel.cpp
 * @brief Implementation of DownloadListModel
 *
 * @copyright Copyright (c) 2024 DadaLoader Project
 * @license GPL-3.0-or-later
 */

#include "dadaloader/viewmodel/DownloadListModel.h"
#include "dadaloader/engine/TaskManager.h"

#include <QTimer>

#include <algorithm>

namespace DadaLoader {

namespace {

bool sameRow(const TaskSnapshot& a, const TaskSnapshot& b) {
    return a.record.status == b.record.status &&
           a.record.fileSize == b.record.fileSize &&
           a.record.downloadedBytes == b.record.downloadedBytes &&
           a.record.progressPercent == b.record.progressPercent &&
           a.speedBytesPerSec == b.speedBytesPerSec &&
           a.etaSeconds == b.etaSeconds &&
           a.errorMessage == b.errorMessage;
}

} // namespace

DownloadListModel::DownloadListModel(TaskManager* manager, QObject* parent)
    : QAbstractListModel(parent)
    , m_manager(manager)
    , m_refreshTimer(new QTimer(this))
{
    connect(m_manager, &TaskManager::taskAdded, this, &DownloadListModel::refresh);
    connect(m_manager, &TaskManager::taskRemoved, this, &DownloadListModel::refresh);

    connect(m_refreshTimer, &QTimer::timeout, this, &DownloadListModel::refresh);
    m_refreshTimer->setInterval(Config::UI_REFRESH_INTERVAL);
    m_refreshTimer->start();

    refresh();
}

DownloadListModel::~DownloadListModel() {
    m_refreshTimer->stop();
}

int DownloadListModel::rowCount(const QModelIndex& parent) const {
    if (parent.isValid()) {
        return 0;
    }
    return static_cast<int>(m_snapshots.size());
}

QVariant DownloadListModel::data(const QModelIndex& index, int role) const {
    if (!index.isValid() || index.row() < 0 ||
        index.row() >= static_cast<int>(m_snapshots.size())) {
        return QVariant();
    }

    const TaskSnapshot& snap = m_snapshots.at(static_cast<size_t>(index.row()));

    switch (role) {
        case Qt::DisplayRole:
        case FileNameRole:
            return snap.fileName();
        case IdRole:
            return snap.id();
        case UrlRole:
            return snap.record.url;
        case SavePathRole:
            return snap.record.savePath;
        case FileSizeRole:
            return snap.record.fileSize;
        case FormattedSizeRole:
            return snap.formattedSize();
        case DownloadedBytesRole:
            return snap.record.downloadedBytes;
        case ProgressRole:
            return snap.record.progressPercent;
        case SpeedRole:
            return snap.speedMbps;
        case EtaRole:
            return formatEta(snap.etaSeconds);
        case StatusRole:
            return static_cast<int>(snap.status());
        case StatusTextRole:
            return snap.statusString();
        case ErrorMessageRole:
            return snap.errorMessage;
        default:
            return QVariant();
    }
}

QHash<int, QByteArray> DownloadListModel::roleNames() const {
    return {
        {IdRole, "id"},
        {UrlRole, "url"},
        {FileNameRole, "fileName"},
        {SavePathRole, "savePath"},
        {FileSizeRole, "fileSize"},
        {FormattedSizeRole, "formattedSize"},
        {DownloadedBytesRole, "downloadedBytes"},
        {ProgressRole, "progress"},
        {SpeedRole, "speed"},
        {EtaRole, "eta"},
        {StatusRole, "status"},
        {StatusTextRole, "statusText"},
        {ErrorMessageRole, "errorMessage"}
    };
}

qint64 DownloadListModel::idAt(int row) const {
    if (row >= 0 && row < static_cast<int>(m_snapshots.size())) {
        return m_snapshots.at(static_cast<size_t>(row)).id();
    }
    return 0;
}

int DownloadListModel::indexOf(qint64 id) const {
    auto it = std::find_if(m_snapshots.begin(), m_snapshots.end(),
                           [id](const TaskSnapshot& snap) { return snap.id() == id; });
    return it != m_snapshots.end() ? static_cast<int>(it - m_snapshots.begin()) : -1;
}

void DownloadListModel::refresh() {
    std::vector<TaskSnapshot> latest = m_manager->listTasks();

    const bool sameIds = latest.size() == m_snapshots.size() &&
        std::equal(latest.begin(), latest.end(), m_snapshots.begin(),
                   [](const TaskSnapshot& a, const TaskSnapshot& b) { return a.id() == b.id(); });

    if (!sameIds) {
        const bool countDiffers = latest.size() != m_snapshots.size();
        beginResetModel();
        m_snapshots = std::move(latest);
        endResetModel();
        if (countDiffers) {
            emit countChanged();
        }
        return;
    }

    for (size_t row = 0; row < latest.size(); ++row) {
        if (!sameRow(latest[row], m_snapshots[row])) {
            m_snapshots[row] = latest[row];
            const QModelIndex idx = index(static_cast<int>(row));
            emit dataChanged(idx, idx);
        }
    }
}

QString DownloadListModel::formatEta(qint64 seconds) {
    if (seconds <= 0) {
        return QStringLiteral("-");
    }

    const qint64 hours = seconds / 3600;
    const qint64 minutes = (seconds % 3600) / 60;
    const qint64 secs = seconds % 60;

    if (hours > 0) {
        return QStringLiteral("%1h %2m").arg(hours).arg(minutes);
    }
    if (minutes > 0) {
        return QStringLiteral("%1m %2s").arg(minutes).arg(secs);
    }
    return QStringLiteral("%1s").arg(secs);
}

} // namespace DadaLoader
