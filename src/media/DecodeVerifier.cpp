#include "DecodeVerifier.h"

#include <vector>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
}

namespace {

QString avErrorText(int err) {
    char errBuf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(err, errBuf, sizeof(errBuf));
    return QString::fromUtf8(errBuf);
}

QString versionText(unsigned v) {
    return QString("%1.%2.%3").arg(v >> 16).arg((v >> 8) & 0xff).arg(v & 0xff);
}

} // namespace

struct DecodeVerifier::FFmpegContext {
    AVFormatContext* fmtCtx = nullptr;
    std::vector<AVCodecContext*> codecs;   // indexed by stream, null when skipped
    AVFrame* frame = nullptr;
    AVPacket* packet = nullptr;

    ~FFmpegContext() {
        if (packet) av_packet_free(&packet);
        if (frame) av_frame_free(&frame);
        for (auto& c : codecs) {
            if (c) avcodec_free_context(&c);
        }
        if (fmtCtx) avformat_close_input(&fmtCtx);
    }
};

DecodeVerifier::DecodeVerifier(QObject* parent) : QObject(parent) {}
DecodeVerifier::~DecodeVerifier() = default;

bool DecodeVerifier::verify(const QString& filePath) {
    m_report = DecodeReport{};
    m_error.clear();

    FFmpegContext ctx;

    int ret = avformat_open_input(&ctx.fmtCtx, filePath.toUtf8().constData(), nullptr, nullptr);
    if (ret < 0) {
        m_error = QString("Cannot open file: %1 (%2)").arg(filePath, avErrorText(ret));
        return false;
    }

    ret = avformat_find_stream_info(ctx.fmtCtx, nullptr);
    if (ret < 0) {
        m_error = QString("Cannot find stream info (%1)").arg(avErrorText(ret));
        return false;
    }

    bool hasVideo = false;
    ctx.codecs.assign(ctx.fmtCtx->nb_streams, nullptr);
    for (unsigned i = 0; i < ctx.fmtCtx->nb_streams; ++i) {
        AVCodecParameters* par = ctx.fmtCtx->streams[i]->codecpar;
        if (par->codec_type != AVMEDIA_TYPE_VIDEO && par->codec_type != AVMEDIA_TYPE_AUDIO)
            continue;

        const AVCodec* codec = avcodec_find_decoder(par->codec_id);
        if (!codec) {
            m_error = QString("No decoder for stream %1 (%2)")
                          .arg(i).arg(avcodec_get_name(par->codec_id));
            return false;
        }

        AVCodecContext* codecCtx = avcodec_alloc_context3(codec);
        ctx.codecs[i] = codecCtx;
        if (!codecCtx || avcodec_parameters_to_context(codecCtx, par) < 0) {
            m_error = QString("Cannot set up decoder for stream %1").arg(i);
            return false;
        }

        ret = avcodec_open2(codecCtx, codec, nullptr);
        if (ret < 0) {
            m_error = QString("Cannot open decoder for stream %1 (%2)").arg(i).arg(avErrorText(ret));
            return false;
        }

        if (par->codec_type == AVMEDIA_TYPE_VIDEO) hasVideo = true;
    }

    if (!hasVideo) {
        m_error = "No video stream";
        return false;
    }

    ctx.frame = av_frame_alloc();
    ctx.packet = av_packet_alloc();
    if (!ctx.frame || !ctx.packet) {
        m_error = "Cannot allocate frame/packet";
        return false;
    }

    // Pull every frame the decoder has ready
    auto drain = [&](AVCodecContext* codecCtx) {
        while (true) {
            int r = avcodec_receive_frame(codecCtx, ctx.frame);
            if (r == AVERROR(EAGAIN) || r == AVERROR_EOF) return;
            if (r < 0) {
                ++m_report.decodeErrors;
                return;
            }
            if (codecCtx->codec_type == AVMEDIA_TYPE_VIDEO)
                ++m_report.videoFrames;
            else
                ++m_report.audioFrames;
            av_frame_unref(ctx.frame);
        }
    };

    while (true) {
        ret = av_read_frame(ctx.fmtCtx, ctx.packet);
        if (ret == AVERROR_EOF) break;
        if (ret < 0) {
            m_error = QString("Read error (%1)").arg(avErrorText(ret));
            return false;
        }

        const int idx = ctx.packet->stream_index;
        AVCodecContext* codecCtx = (idx >= 0 && idx < static_cast<int>(ctx.codecs.size()))
            ? ctx.codecs[idx] : nullptr;
        if (codecCtx) {
            int r = avcodec_send_packet(codecCtx, ctx.packet);
            if (r == AVERROR(EAGAIN)) {
                drain(codecCtx);
                r = avcodec_send_packet(codecCtx, ctx.packet);
            }
            if (r < 0)
                ++m_report.decodeErrors;
            drain(codecCtx);
        }
        av_packet_unref(ctx.packet);
    }

    // Flush buffered frames (B-frames, audio priming)
    for (AVCodecContext* codecCtx : ctx.codecs) {
        if (!codecCtx) continue;
        avcodec_send_packet(codecCtx, nullptr);
        drain(codecCtx);
    }

    if (m_report.decodeErrors > 0) {
        m_error = QString("%1 decode error(s)").arg(m_report.decodeErrors);
        return false;
    }
    if (m_report.videoFrames == 0) {
        m_error = "No video frames decoded";
        return false;
    }
    return true;
}

QString DecodeVerifier::libraryVersions() {
    return QString("libavformat %1, libavcodec %2, libavutil %3")
        .arg(versionText(avformat_version()),
             versionText(avcodec_version()),
             versionText(avutil_version()));
}
