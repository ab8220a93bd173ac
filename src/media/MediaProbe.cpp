#include "MediaProbe.h"
#include "Logging.h"
#include <algorithm>
#include <cmath>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
#include <libavutil/dict.h>
}

namespace {

struct ProbeContext {
    AVFormatContext* fmtCtx = nullptr;
    AVPacket* packet = nullptr;

    ~ProbeContext() {
        if (packet) av_packet_free(&packet);
        if (fmtCtx) avformat_close_input(&fmtCtx);
    }
};

QString avErrorToString(int errnum) {
    char errBuf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(errnum, errBuf, sizeof(errBuf));
    return QString::fromUtf8(errBuf);
}

QString codecName(AVCodecID id) {
    const AVCodecDescriptor* desc = avcodec_descriptor_get(id);
    return desc ? QString(desc->name) : QStringLiteral("unknown");
}

QString metadataValue(AVDictionary* dict, const char* key) {
    AVDictionaryEntry* tag = av_dict_get(dict, key, nullptr, 0);
    return tag ? QString::fromUtf8(tag->value) : QString();
}

double streamDuration(const AVStream* stream, double containerDuration) {
    if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0) {
        return static_cast<double>(stream->duration) * av_q2d(stream->time_base);
    }
    return containerDuration;
}

} // namespace

MediaProbe::MediaProbe(QObject* parent) : QObject(parent) {}
MediaProbe::~MediaProbe() = default;

bool MediaProbe::probe(const QString& filePath) {
    m_info = MediaInfo{};
    m_info.filePath = filePath;
    m_error.clear();

    ProbeContext ctx;
    int ret = avformat_open_input(&ctx.fmtCtx, filePath.toUtf8().constData(), nullptr, nullptr);
    if (ret < 0) {
        m_error = QString("Cannot open file: %1 (%2)").arg(filePath, avErrorToString(ret));
        return false;
    }

    ret = avformat_find_stream_info(ctx.fmtCtx, nullptr);
    if (ret < 0) {
        m_error = QString("Cannot find stream info (%1)").arg(avErrorToString(ret));
        return false;
    }

    AVFormatContext* fmtCtx = ctx.fmtCtx;
    m_info.containerFormat = QString(fmtCtx->iformat->name);
    m_info.durationSeconds = (fmtCtx->duration > 0)
        ? static_cast<double>(fmtCtx->duration) / AV_TIME_BASE
        : 0.0;

    int bestVideo = av_find_best_stream(fmtCtx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    int audioOrdinal = 0;

    for (unsigned i = 0; i < fmtCtx->nb_streams; ++i) {
        AVStream* stream = fmtCtx->streams[i];
        AVCodecParameters* par = stream->codecpar;

        StreamInfo si;
        si.streamIndex = static_cast<int>(i);
        si.codecName = codecName(par->codec_id);
        si.durationSeconds = streamDuration(stream, m_info.durationSeconds);

        if (par->codec_type == AVMEDIA_TYPE_VIDEO) {
            // Cover art is exposed as a one-packet video stream
            if (stream->disposition & AV_DISPOSITION_ATTACHED_PIC) {
                si.kind = StreamKind::Other;
            } else {
                si.kind = StreamKind::Video;
                si.width = par->width;
                si.height = par->height;
                if (stream->avg_frame_rate.den > 0 && stream->avg_frame_rate.num > 0) {
                    si.frameRate = Rational{stream->avg_frame_rate.num, stream->avg_frame_rate.den};
                } else if (stream->r_frame_rate.den > 0 && stream->r_frame_rate.num > 0) {
                    si.frameRate = Rational{stream->r_frame_rate.num, stream->r_frame_rate.den};
                }
            }
        }
        else if (par->codec_type == AVMEDIA_TYPE_AUDIO) {
            si.kind = StreamKind::Audio;
            si.audioOrdinal = audioOrdinal++;
            si.channelCount = par->ch_layout.nb_channels;
            si.sampleRate = par->sample_rate;
            si.language = metadataValue(stream->metadata, "language");
            si.title = metadataValue(stream->metadata, "title");
        }

        m_info.streams.push_back(si);
    }

    if (bestVideo >= 0 && m_info.streams[bestVideo].kind == StreamKind::Video) {
        m_info.videoStreamIndex = bestVideo;
    } else {
        for (const auto& s : m_info.streams) {
            if (s.kind == StreamKind::Video) {
                m_info.videoStreamIndex = s.streamIndex;
                break;
            }
        }
    }

    qCInfo(mixcutProbe, "%s: %s, %.3f s, %d streams, video stream %d",
           qPrintable(filePath), qPrintable(m_info.containerFormat),
           m_info.durationSeconds, static_cast<int>(m_info.streams.size()),
           m_info.videoStreamIndex);

    if (!m_scanKeyframes || m_info.videoStreamIndex < 0) {
        return true;
    }

    // Keyframe scan: demux only, timestamps relative to the container start
    // so they line up with ffmpeg's input-side -ss.
    AVStream* video = fmtCtx->streams[m_info.videoStreamIndex];
    const double timeBase = av_q2d(video->time_base);
    const double containerStart = (fmtCtx->start_time != AV_NOPTS_VALUE)
        ? static_cast<double>(fmtCtx->start_time) / AV_TIME_BASE
        : 0.0;

    ctx.packet = av_packet_alloc();
    if (!ctx.packet) {
        m_error = "Could not allocate packet";
        return false;
    }

    int lastPercent = -1;
    std::vector<double>& keyframes = m_info.keyframeTimestamps;
    while ((ret = av_read_frame(fmtCtx, ctx.packet)) >= 0) {
        if (ctx.packet->stream_index == m_info.videoStreamIndex
            && (ctx.packet->flags & AV_PKT_FLAG_KEY)) {
            int64_t ts = ctx.packet->pts != AV_NOPTS_VALUE ? ctx.packet->pts : ctx.packet->dts;
            if (ts != AV_NOPTS_VALUE) {
                double seconds = static_cast<double>(ts) * timeBase - containerStart;
                keyframes.push_back(std::max(0.0, seconds));

                if (m_info.durationSeconds > 0.0) {
                    int percent = static_cast<int>(100.0 * keyframes.back() / m_info.durationSeconds);
                    if (percent != lastPercent && percent <= 100) {
                        lastPercent = percent;
                        emit keyframeScanProgress(percent / 100.0);
                    }
                }
            }
        }
        av_packet_unref(ctx.packet);
    }

    if (ret != AVERROR_EOF) {
        m_error = QString("Keyframe scan aborted: %1").arg(avErrorToString(ret));
        return false;
    }

    // B-frame reordering can deliver keyframes out of presentation order
    std::sort(keyframes.begin(), keyframes.end());
    keyframes.erase(std::unique(keyframes.begin(), keyframes.end()), keyframes.end());

    qCDebug(mixcutProbe, "%d keyframes in video stream %d",
            static_cast<int>(keyframes.size()), m_info.videoStreamIndex);
    return true;
}
