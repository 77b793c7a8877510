/**
 * @file ProgressParser.h
 * @brief Parser for the transfer engine's console readout
 *
 * Turns one line of aria2-style output such as
 *
 *     [#2089b0 1.0MiB/2.0MiB(50%) CN:1 DL:100KiB ETA:10s]
 *
 * into a ProgressSample. All functions are stateless and never throw;
 * malformed input is logged and reported as "no event".
 *
 * @copyright Copyright (c) 2024 DadaLoader Project
 * @license GPL-3.0-or-later
 */

#ifndef DADALOADER_PROGRESSPARSER_H
#define DADALOADER_PROGRESSPARSER_H

#include <QMetaType>
#include <QString>

#include <optional>

#include "dadaloader/engine/Types.h"

namespace DadaLoader {

/**
 * @brief Structured progress derived from one readout line
 */
struct ProgressSample {
    ByteCount downloadedBytes = 0;
    ByteCount totalBytes = 0;         ///< 0 when the engine does not know yet
    SpeedBps speedBytesPerSec = 0.0;
    qint64 etaSeconds = 0;

    /// @return Speed in megabits per second (bytes/sec × 8 ÷ 2^20)
    [[nodiscard]] double speedMbps() const noexcept;

    /// @return Completion percentage, 0 when the total is unknown
    [[nodiscard]] double percent() const noexcept {
        if (totalBytes <= 0) return 0.0;
        return (static_cast<double>(downloadedBytes) / totalBytes) * 100.0;
    }
};

namespace ProgressParser {

// Markers of the readout grammar
inline constexpr char CONNECTION_MARKER[] = "CN:";
inline constexpr char SPEED_MARKER[] = "DL:";
inline constexpr char ETA_MARKER[] = "ETA:";

/**
 * @brief Parse a size token ("512KiB", "1.9GiB", "2048")
 *
 * Recognised suffixes are B, KiB, MiB, GiB and TiB. A token without a
 * suffix is a plain decimal byte count. Fractional byte values are
 * truncated.
 *
 * @return Byte count, or std::nullopt (logged) for a malformed token
 */
[[nodiscard]] std::optional<ByteCount> parseSize(const QString& token);

/**
 * @brief Parse an ETA token ("15s", "1h38m7", "38m", "ETA:10s]")
 *
 * Accepts a bare integer number of seconds or the compound form
 * <H>h<M>m<S> where every segment is optional.
 *
 * @return Seconds; 0 (logged) for a malformed token
 */
[[nodiscard]] qint64 parseEta(const QString& token);

/**
 * @brief Check whether a line carries progress information
 */
[[nodiscard]] bool isProgressLine(const QString& line);

/**
 * @brief Parse a full readout line
 * @return The sample, or std::nullopt when the line carries no progress
 */
[[nodiscard]] std::optional<ProgressSample> parseLine(const QString& line);

/**
 * @brief Convert bytes/sec to megabits/sec for display
 */
[[nodiscard]] double toMegabits(SpeedBps bytesPerSecond) noexcept;

} // namespace ProgressParser

inline double ProgressSample::speedMbps() const noexcept {
    return ProgressParser::toMegabits(speedBytesPerSec);
}

} // namespace DadaLoader

Q_DECLARE_METATYPE(DadaLoader::ProgressSample)

#endif // DADALOADER_PROGRESSPARSER_H
