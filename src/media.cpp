#include "media.hpp"

#include <random>

namespace roomlink {

StaticMediaSource::StaticMediaSource(bool audio, bool video)
    : Audio_(audio)
    , Video_(video)
{ }

std::shared_ptr<MediaStream> StaticMediaSource::Acquire() {
    if (Stream_) {
        return Stream_;
    }
    if (!Audio_ && !Video_) {
        throw MediaAcquisitionError("no audio or video track enabled");
    }

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<uint32_t> dist(1, 0xFFFFFFFE);

    auto stream = std::make_shared<MediaStream>();
    stream->id = "stream-" + std::to_string(dist(gen));
    if (Audio_) {
        stream->tracks.push_back(MediaTrack{"audio", "audio", dist(gen)});
    }
    if (Video_) {
        stream->tracks.push_back(MediaTrack{"video", "video", dist(gen)});
    }

    Stream_ = stream;
    return Stream_;
}

} // namespace roomlink
