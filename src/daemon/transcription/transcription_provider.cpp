#include "daemon/transcription/transcription_provider.h"

#include "audio/wav_io.h"
#include "core/error_codes.h"

namespace daemon_transcription {

std::string TranscriptionProvider::transcribe(const std::vector<float>& /*samples*/,
                                              int /*sampleRate*/, const std::string& /*model*/,
                                              const std::string& /*language*/,
                                              const daemon_core::StopSignal* /*cancel*/) {
    throw voxd::ProviderError(voxd::ErrorCode::PROVIDER_UNAVAILABLE,
                              name() + " requires an audio file");
}

std::string TranscriptionProvider::transcribeFile(const std::string& path,
                                                  const std::string& model,
                                                  const std::string& language,
                                                  const daemon_core::StopSignal* cancel) {
    AudioIO::WavReader reader;
    AudioIO::AudioFile file;
    if (!reader.open(path) || !reader.readAll(file)) {
        throw voxd::ProviderError(voxd::ErrorCode::PROVIDER_FAILED,
                                  "cannot read audio file '" + path + "'");
    }
    if (file.channels > 1) {
        std::vector<float> mono(static_cast<size_t>(file.frames));
        AudioIO::Utils::downmixToMono(file.data.data(), mono.data(), mono.size(), file.channels);
        file.data.swap(mono);
    }
    return transcribe(file.data, file.sampleRate, model, language, cancel);
}

std::unique_ptr<StreamingSession> TranscriptionProvider::openStream(
    int /*sampleRate*/, const std::string& /*model*/, const std::string& /*language*/) {
    throw voxd::ProviderError(voxd::ErrorCode::PROVIDER_UNAVAILABLE,
                              name() + " does not support streaming");
}

}  // namespace daemon_transcription
