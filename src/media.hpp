#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace roomlink {

class MediaAcquisitionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct MediaTrack {
    std::string kind;  // "audio" or "video"
    std::string mid;
    uint32_t ssrc = 0;
};

struct MediaStream {
    std::string id;
    std::vector<MediaTrack> tracks;
};

class LocalMediaSource {
public:
    virtual ~LocalMediaSource() = default;

    // Throws MediaAcquisitionError when no media can be produced.
    virtual std::shared_ptr<MediaStream> Acquire() = 0;
};

// Declares a fixed set of outgoing tracks. Samples are pushed into the
// transport's tracks by whatever capture pipeline the host application
// runs.
class StaticMediaSource : public LocalMediaSource {
public:
    StaticMediaSource(bool audio, bool video);

    std::shared_ptr<MediaStream> Acquire() override;

private:
    bool Audio_;
    bool Video_;
    std::shared_ptr<MediaStream> Stream_;
};

} // namespace roomlink
