/**
 * @file ProgressParser.cpp
 * @brief Implementation of the readout line parser
 *
 * @copyright Copyright (c) 2024 DadaLoader Project
 * @license GPL-3.0-or-later
 */

#include "dadaloader/engine/ProgressParser.h"

#include <QDebug>
#include <QRegularExpression>
#include <QStringList>

#include <array>
#include <cmath>
#include <limits>
#include <utility>

namespace DadaLoader {
namespace ProgressParser {

namespace {

// Longest suffix first: "KiB" also ends with "B"
constexpr std::array<std::pair<const char*, ByteCount>, 5> UNIT_TABLE = {{
    {"TiB", Config::TiB},
    {"GiB", Config::GiB},
    {"MiB", Config::MiB},
    {"KiB", Config::KiB},
    {"B", 1},
}};

QString stripBrackets(QString token) {
    while (token.startsWith(QLatin1Char('['))) {
        token.remove(0, 1);
    }
    while (token.endsWith(QLatin1Char(']'))) {
        token.chop(1);
    }
    return token;
}

} // namespace

std::optional<ByteCount> parseSize(const QString& token) {
    QString text = token.trimmed();
    ByteCount multiplier = 1;

    for (const auto& [suffix, factor] : UNIT_TABLE) {
        const QLatin1String unit(suffix);
        if (text.endsWith(unit)) {
            text.chop(unit.size());
            multiplier = factor;
            break;
        }
    }

    bool ok = false;
    const double value = text.toDouble(&ok);
    if (!ok || !std::isfinite(value) || value < 0.0) {
        qWarning() << "ProgressParser: Malformed size token" << token;
        return std::nullopt;
    }

    // 2^63 is exactly representable; anything at or above it overflows ByteCount
    const double bytes = value * static_cast<double>(multiplier);
    if (bytes >= static_cast<double>(std::numeric_limits<ByteCount>::max())) {
        qWarning() << "ProgressParser: Size token out of range" << token;
        return std::nullopt;
    }

    return static_cast<ByteCount>(bytes);
}

qint64 parseEta(const QString& token) {
    QString text = token.trimmed();
    const QLatin1String marker(ETA_MARKER);
    if (text.startsWith(marker)) {
        text.remove(0, marker.size());
    }
    while (text.endsWith(QLatin1Char(']'))) {
        text.chop(1);
    }
    if (text.endsWith(QLatin1Char('s'))) {
        text.chop(1);
    }

    static const QRegularExpression pattern(
        QStringLiteral(R"(^(?:(\d*)h)?(?:(\d*)m)?(\d*)$)"));

    const QRegularExpressionMatch match = pattern.match(text);
    if (text.isEmpty() || !match.hasMatch()) {
        qWarning() << "ProgressParser: Failed to parse ETA" << token << "- defaulting to 0 seconds";
        return 0;
    }

    // Each term stays below a third of the range so the sum cannot overflow
    constexpr qint64 TERM_LIMIT = std::numeric_limits<qint64>::max() / 3;

    auto term = [](const QString& digits, qint64 unitSeconds) -> std::optional<qint64> {
        if (digits.isEmpty()) {
            return 0;
        }
        bool ok = false;
        const qint64 value = digits.toLongLong(&ok);
        if (!ok || value > TERM_LIMIT / unitSeconds) {
            return std::nullopt;
        }
        return value * unitSeconds;
    };

    const auto hours = term(match.captured(1), 3600);
    const auto minutes = term(match.captured(2), 60);
    const auto seconds = term(match.captured(3), 1);
    if (!hours || !minutes || !seconds) {
        qWarning() << "ProgressParser: ETA out of range" << token << "- defaulting to 0 seconds";
        return 0;
    }

    return *hours + *minutes + *seconds;
}

bool isProgressLine(const QString& line) {
    return line.contains(QLatin1String(CONNECTION_MARKER)) &&
           line.contains(QLatin1String(ETA_MARKER));
}

std::optional<ProgressSample> parseLine(const QString& line) {
    if (!isProgressLine(line)) {
        return std::nullopt;
    }

    ProgressSample sample;
    bool haveBytes = false;

    static const QRegularExpression whitespace(QStringLiteral(R"(\s+)"));
    const QStringList tokens = line.split(whitespace, Qt::SkipEmptyParts);

    for (const QString& raw : tokens) {
        const QString token = stripBrackets(raw);

        if (token.startsWith(QLatin1String(SPEED_MARKER))) {
            auto speed = parseSize(token.mid(static_cast<qsizetype>(qstrlen(SPEED_MARKER))));
            if (!speed) {
                return std::nullopt;
            }
            sample.speedBytesPerSec = static_cast<SpeedBps>(*speed);
        } else if (token.startsWith(QLatin1String(ETA_MARKER))) {
            sample.etaSeconds = parseEta(token);
        } else if (token.contains(QLatin1Char('/')) && token.contains(QLatin1Char('('))) {
            // downloaded/total(percent%)
            const qsizetype slash = token.indexOf(QLatin1Char('/'));
            const qsizetype paren = token.indexOf(QLatin1Char('('), slash);
            if (paren < 0) {
                qWarning() << "ProgressParser: Malformed byte count token" << token;
                return std::nullopt;
            }

            auto downloaded = parseSize(token.left(slash));
            auto total = parseSize(token.mid(slash + 1, paren - slash - 1));
            if (!downloaded || !total) {
                return std::nullopt;
            }

            sample.downloadedBytes = *downloaded;
            sample.totalBytes = *total;
            haveBytes = true;
        }
    }

    if (!haveBytes) {
        qWarning() << "ProgressParser: Progress line without byte counts:" << line;
        return std::nullopt;
    }

    return sample;
}

double toMegabits(SpeedBps bytesPerSecond) noexcept {
    return (bytesPerSecond * 8.0) / static_cast<double>(Config::MiB);
}

} // namespace ProgressParser
} // namespace DadaLoader
