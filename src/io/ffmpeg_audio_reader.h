// FFmpeg decode path for containers libsndfile cannot open (MP4/M4A, raw
// AAC). Used by SndfileAubioFeatureProvider as its second reader.

#ifndef TRACKKEY_IO_FFMPEG_AUDIO_READER_H
#define TRACKKEY_IO_FFMPEG_AUDIO_READER_H

#include <optional>
#include <string>

#include "io/audio_signal.h"

namespace trackkey {

class RunLog;

/// @brief Decode the best audio stream of a file to mono float samples.
/// @param path File path.
/// @param max_seconds Longest accepted signal; longer files are rejected.
/// @param log Receives the reason of a failure.
/// @return Decoded signal at the stream's native rate, or std::nullopt.
std::optional<AudioSignal> readAudioWithFfmpeg(const std::string& path, double max_seconds,
                                               RunLog& log);

/// @brief Container duration in seconds from the demuxer, without decoding.
std::optional<double> readDurationWithFfmpeg(const std::string& path);

}  // namespace trackkey

#endif  // TRACKKEY_IO_FFMPEG_AUDIO_READER_H
