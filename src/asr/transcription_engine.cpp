#include "asr/transcription_engine.hpp"

namespace asr {

const char* to_string(InferenceOutcome::Status status) {
    switch (status) {
    case InferenceOutcome::Status::Ok: return "ok";
    case InferenceOutcome::Status::TimedOut: return "timed_out";
    case InferenceOutcome::Status::Failed: return "failed";
    }
    return "unknown";
}

} // namespace asr
