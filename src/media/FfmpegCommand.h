#pragma once

#include <QString>
#include <QStringList>
#include "ExportSpec.h"

// ExportSpec -> ffmpeg command line. Filter syntax lives here and nowhere else.
namespace FfmpegCommand {

QStringList buildArguments(const ExportSpec& spec);

// -filter_complex value for AudioOutput::Mixed; empty otherwise.
QString buildAudioFilterGraph(const ExportSpec& spec);

// Output label of the audio filter graph.
inline constexpr const char* AudioOutLabel = "aout";

// Reads the "time=HH:MM:SS.xx" field of an ffmpeg status line.
bool parseProgressTime(const QString& line, double& seconds);

} // namespace FfmpegCommand
