/**
 * @file TaskStore.h
 * @brief Durable storage interface for task records
 *
 * @copyright Copyright (c) 2024 DadaLoader Project
 * @license GPL-3.0-or-later
 */

#ifndef DADALOADER_TASKSTORE_H
#define DADALOADER_TASKSTORE_H

#include <QString>

#include <optional>
#include <vector>

#include "dadaloader/engine/Types.h"

namespace DadaLoader {

/**
 * @brief Persistence contract consumed by TaskManager
 *
 * Implementations must make every write durable before returning, so that
 * a crash right after a successful call leaves the store consistent with it.
 * Writes report failure through their return value; lastError() describes
 * the most recent failure.
 */
class TaskStore {
public:
    virtual ~TaskStore() = default;

    /**
     * @brief Insert a new record
     * @return The id assigned by the store, or std::nullopt on failure
     */
    virtual std::optional<TaskId> create(const TaskRecord& record) = 0;

    /**
     * @brief Update the mutable fields of a record
     */
    virtual bool update(TaskId id, double progressPercent, TaskStatus status,
                        ByteCount downloadedBytes, bool isPaused,
                        ByteCount fileSize) = 0;

    /**
     * @brief Load every record, ordered by id
     */
    virtual std::vector<TaskRecord> listAll() = 0;

    /**
     * @brief Delete a record
     */
    virtual bool remove(TaskId id) = 0;

    [[nodiscard]] virtual QString lastError() const = 0;

    /// Convenience wrapper writing all mutable fields of @p record
    bool updateRecord(const TaskRecord& record) {
        return update(record.id, record.progressPercent, record.status,
                      record.downloadedBytes, record.isPaused, record.fileSize);
    }
};

} // namespace DadaLoader

#endif // DADALOADER_TASKSTORE_H
