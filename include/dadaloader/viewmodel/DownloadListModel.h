/**
 * @file DownloadListModel.h
 * @brief Item model exposing task snapshots to a view
 *
 * @copyright Copyright (c) 2024 DadaLoader Project
 * @license GPL-3.0-or-later
 */

#ifndef DADALOADER_DOWNLOADLISTMODEL_H
#define DADALOADER_DOWNLOADLISTMODEL_H

#include <QAbstractListModel>

#include <vector>

#include "dadaloader/engine/Types.h"

class QTimer;

namespace DadaLoader {

class TaskManager;

/**
 * @brief Polls TaskManager::listTasks() and exposes one row per task
 *
 * The model never mutates tasks; commands go through TaskManager.
 */
class DownloadListModel : public QAbstractListModel {
    Q_OBJECT

    Q_PROPERTY(int count READ rowCount NOTIFY countChanged)

public:
    enum Roles {
        IdRole = Qt::UserRole + 1,
        UrlRole,
        FileNameRole,
        SavePathRole,
        FileSizeRole,
        FormattedSizeRole,
        DownloadedBytesRole,
        ProgressRole,
        SpeedRole,
        EtaRole,
        StatusRole,
        StatusTextRole,
        ErrorMessageRole
    };
    Q_ENUM(Roles)

    explicit DownloadListModel(TaskManager* manager, QObject* parent = nullptr);
    ~DownloadListModel() override;

    // QAbstractListModel interface
    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    QVariant data(const QModelIndex& index, int role) const override;
    QHash<int, QByteArray> roleNames() const override;

    /**
     * @brief Get task ID at row
     * @return 0 when the row is out of range
     */
    Q_INVOKABLE qint64 idAt(int row) const;

    /**
     * @brief Find row by task ID
     */
    Q_INVOKABLE int indexOf(qint64 id) const;

    /**
     * @brief Re-read all snapshots now
     */
    void refresh();

signals:
    void countChanged();

private:
    static QString formatEta(qint64 seconds);

    TaskManager* m_manager = nullptr;
    std::vector<TaskSnapshot> m_snapshots;
    QTimer* m_refreshTimer = nullptr;
};

} // namespace DadaLoader

#endif // DADALOADER_DOWNLOADLISTMODEL_H
