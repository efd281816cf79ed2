#include "stt_engine.h"
#include "logger.h"
#include "utils.h"
#include <whisper.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <sstream>
#include <thread>

namespace parley {

class STTEngine::Impl {
public:
    Impl(const RecognitionConfig& config)
        : config_(config), language_(whisper_language(config.language)), ctx_(nullptr), ready_(false) {
        // Load whisper model
        if (config_.model_path.empty()) {
            LOG_STT("No model path specified");
            return;
        }

        // Metal/CUDA when whisper.cpp was built with a GPU backend
        struct whisper_context_params cparams = whisper_context_default_params();
        cparams.use_gpu = config_.use_gpu;

        ctx_ = whisper_init_from_file_with_params(config_.model_path.c_str(), cparams);
        if (!ctx_) {
            LOG_STT("Failed to load whisper model: " + config_.model_path);
            return;
        }

        ready_ = true;
        LOG_STT("Model loaded: " + config_.model_path + " (language " + language_ + ")");
    }

    ~Impl() {
        if (ctx_) {
            whisper_free(ctx_);
        }
    }

    Result<Transcript> transcribe(const AudioBuffer& segment, const std::atomic<bool>* cancel) {
        Transcript result;

        if (!ctx_) {
            return make_recognition_error("whisper model not loaded");
        }
        if (segment.empty()) {
            return result;
        }

        auto start = std::chrono::steady_clock::now();

        // Prepare whisper parameters
        struct whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        params.print_progress = false;
        params.print_special = false;
        params.print_realtime = false;
        params.print_timestamps = false;
        params.translate = false;
        params.language = language_.c_str();
        params.n_threads = std::max(1, std::min(4, static_cast<int>(std::thread::hardware_concurrency())));
        params.offset_ms = 0;
        params.no_context = true;
        params.single_segment = true;

        // whisper polls this between encoder/decoder steps
        if (cancel) {
            params.abort_callback = [](void* data) {
                return static_cast<const std::atomic<bool>*>(data)->load();
            };
            params.abort_callback_user_data = const_cast<std::atomic<bool>*>(cancel);
        }

        // Convert audio buffer to float
        std::vector<float> pcmf32(segment.size());
        for (size_t i = 0; i < segment.size(); i++) {
            pcmf32[i] = static_cast<float>(segment[i]) / 32768.0f;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (cancel && cancel->load()) {
            return make_recognition_error("transcription cancelled");
        }

        // Run inference
        int ret = whisper_full(ctx_, params, pcmf32.data(), static_cast<int>(pcmf32.size()));
        if (cancel && cancel->load()) {
            return make_recognition_error("transcription cancelled");
        }
        if (ret != 0) {
            std::ostringstream oss;
            oss << "whisper_full failed: " << ret;
            LOG_STT(oss.str());
            return make_recognition_error(oss.str());
        }

        // Get result
        int n_segments = whisper_full_n_segments(ctx_);
        int total_tokens = 0;
        if (n_segments > 0) {
            std::string text;
            float total_prob = 0.0f;

            for (int i = 0; i < n_segments; i++) {
                const char* seg_text = whisper_full_get_segment_text(ctx_, i);
                text += seg_text;

                int n_tokens = whisper_full_n_tokens(ctx_, i);
                total_tokens += n_tokens;
                for (int j = 0; j < n_tokens; j++) {
                    total_prob += whisper_full_get_token_p(ctx_, i, j);
                }
            }

            result.text = utils::trim_copy(text);
            result.confidence = total_tokens > 0 ? (total_prob / total_tokens) : 0.0f;
            result.token_count = total_tokens;
        }

        auto end = std::chrono::steady_clock::now();
        result.processing_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();

        return result;
    }

    bool is_ready() const {
        return ready_;
    }

private:
    RecognitionConfig config_;
    std::string language_;
    std::mutex mutex_;
    whisper_context* ctx_;
    bool ready_;
};

STTEngine::STTEngine(const RecognitionConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

STTEngine::~STTEngine() = default;

Result<Transcript> STTEngine::transcribe(const AudioBuffer& segment, const std::atomic<bool>* cancel) {
    return pimpl_->transcribe(segment, cancel);
}

bool STTEngine::is_ready() const {
    return pimpl_->is_ready();
}

std::string STTEngine::whisper_language(const std::string& tag) {
    std::string lang = tag.substr(0, tag.find_first_of("-_"));
    lang = utils::normalize_copy(lang);
    return lang.empty() ? "en" : lang;
}

} // namespace parley
