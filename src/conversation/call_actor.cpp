#include "receptionist/conversation/call_actor.hpp"

#include "receptionist/audio/codec.hpp"
#include "receptionist/logging.hpp"
#include "receptionist/metrics.hpp"
#include "receptionist/transport/media_frames.hpp"
#include "receptionist/utils/async.hpp"

namespace receptionist::conversation {

namespace {

const char* const kMarkPrefix = "utterance-";

}

CallActor::CallActor(CallSession session,
                     CallActorDependencies dependencies,
                     CallActorSettings settings,
                     std::shared_ptr<transport::MediaSocket> socket)
    : call_sid_(session.call_sid),
      stream_sid_(session.stream_sid),
      dependencies_(std::move(dependencies)),
      settings_(std::move(settings)),
      socket_(std::move(socket)),
      mailbox_(std::make_shared<utils::Channel<CallEvent>>()),
      engine_(std::move(session), *this, settings_.engine),
      player_(
          audio::PacedPlayer::Callbacks{
              [this](const std::string& frame) {
                  return socket_->send_text(transport::build_media_frame(stream_sid_, frame));
              },
              [this](uint64_t clip_id) {
                  return socket_->send_text(transport::build_mark_frame(
                      stream_sid_, kMarkPrefix + std::to_string(clip_id)));
              },
              [mailbox = mailbox_](uint64_t clip_id) {
                  mailbox->push(PlaybackFinished{clip_id});
              },
              [this]() {
                  logging::error(
                      "Media write failed; closing call",
                      {kv("call_sid", call_sid_)});
                  socket_->close("media write failed");
              }},
          settings_.frame_duration,
          audio::kTransportSampleRate) {
    auto synthesis = dependencies_.synthesis;
    const auto voice = engine_.session().voice;
    speech_queue_ = std::make_unique<tts::SpeechQueue>(
        settings_.tts_max_inflight,
        [synthesis, voice](const std::string& text,
                           const providers::CancelFlag& cancelled) -> std::optional<std::string> {
            if (!synthesis) {
                return std::nullopt;
            }
            return synthesis->synthesize_for_transport(text, voice, cancelled);
        },
        [this](uint64_t utterance_id, std::optional<std::string> audio) {
            deliver_speech(utterance_id, std::move(audio));
        });
}

CallActor::~CallActor() {
    stop();
}

void CallActor::start() {
    if (started_.exchange(true)) {
        return;
    }
    Metrics::instance().increment_calls_started();
    player_.start();

    if (dependencies_.recognizer) {
        providers::RecognitionOptions options;
        options.sample_rate = settings_.asr_sample_rate;
        options.language = settings_.asr_language;
        options.call_sid = call_sid_;
        try {
            auto stream = dependencies_.recognizer->start(options);
            std::lock_guard<std::mutex> lock(recognition_mutex_);
            recognition_ = std::move(stream);
            reader_ = std::thread([this, raw = recognition_.get()]() { read_transcripts(raw); });
        } catch (const providers::AdapterError& ex) {
            Metrics::instance().record_provider_failure("recognition",
                                                        dependencies_.recognizer->name());
            logging::error(
                "Speech recognition unavailable for call",
                {kv("call_sid", call_sid_),
                 kv("status", ex.status()),
                 kv("error", ex.what())});
        }
    } else {
        logging::warn(
            "No speech recognizer configured; caller audio is ignored",
            {kv("call_sid", call_sid_)});
    }

    forwarding_ = true;
    mailbox_thread_ = std::thread([this]() { run(); });
    logging::info(
        "Call actor started",
        {kv("call_sid", call_sid_),
         kv("stream_sid", stream_sid_)});
}

void CallActor::read_transcripts(providers::RecognitionStream* stream) {
    while (auto event = stream->next_event()) {
        if (!mailbox_->push(TranscriptReceived{std::move(*event)})) {
            break;
        }
    }
    logging::debug(
        "Transcript stream ended",
        {kv("call_sid", call_sid_)});
}

void CallActor::run() {
    engine_.start();
    while (true) {
        auto event = ack_deadline_ ? mailbox_->pop_until(*ack_deadline_) : mailbox_->pop();
        if (event) {
            dispatch(*event);
        } else if (mailbox_->is_closed()) {
            break;
        }
        // A busy mailbox must not hold the acknowledgment back.
        fire_ack_timer_if_due(std::chrono::steady_clock::now());
    }
}

void CallActor::fire_ack_timer_if_due(std::chrono::steady_clock::time_point now) {
    if (ack_deadline_ && now >= *ack_deadline_) {
        ack_deadline_.reset();
        engine_.on_ack_timer();
    }
}

void CallActor::dispatch(CallEvent& event) {
    if (auto* transcript = std::get_if<TranscriptReceived>(&event)) {
        logging::debug(
            "Transcript",
            {kv("call_sid", call_sid_),
             kv("final", transcript->event.kind == providers::TranscriptKind::Final),
             kv("text", transcript->event.text)});
        engine_.on_transcript(transcript->event);
    } else if (auto* generation = std::get_if<GenerationFinished>(&event)) {
        if (generation->result) {
            engine_.on_generation_result(generation->request_id, *generation->result);
        } else {
            engine_.on_generation_failure(generation->request_id, generation->error);
        }
    } else if (auto* playback = std::get_if<PlaybackFinished>(&event)) {
        engine_.on_playback_finished(playback->utterance_id);
    } else if (std::holds_alternative<TransportClosed>(event)) {
        engine_.on_transport_closed();
    }
}

void CallActor::on_media(const std::string& mulaw) {
    if (!forwarding_) {
        return;
    }
    if (!settings_.interruptions_are_allowed && is_speaking()) {
        ++dropped_media_;
        return;
    }
    auto pcm = audio::from_transport(mulaw, settings_.asr_sample_rate);
    if (!pcm) {
        logging::debug(
            "Unsupported recognition sample rate; dropping media",
            {kv("call_sid", call_sid_),
             kv("sample_rate", settings_.asr_sample_rate)});
        return;
    }
    std::lock_guard<std::mutex> lock(recognition_mutex_);
    if (recognition_) {
        recognition_->send_audio(*pcm);
    }
}

void CallActor::on_mark(const std::string& name) {
    logging::trace(
        "Playback mark acknowledged",
        {kv("call_sid", call_sid_),
         kv("mark", name)});
}

bool CallActor::is_speaking() const {
    return speech_queue_->has_pending() || player_.is_active();
}

uint64_t CallActor::speak(const std::string& text) {
    const auto utterance_id = ++next_utterance_id_;
    logging::info(
        "Agent speaking",
        {kv("call_sid", call_sid_),
         kv("utterance_id", utterance_id),
         kv("text", text)});
    speech_queue_->enqueue(utterance_id, text);
    return utterance_id;
}

void CallActor::deliver_speech(uint64_t utterance_id, std::optional<std::string> audio) {
    if (!audio || audio->empty()) {
        logging::warn(
            "No audio for utterance; skipping playback",
            {kv("call_sid", call_sid_),
             kv("utterance_id", utterance_id)});
        mailbox_->push(PlaybackFinished{utterance_id});
        return;
    }
    player_.enqueue(utterance_id, std::move(*audio));
}

void CallActor::stop_speaking() {
    speech_queue_->cancel();
    player_.interrupt();
    if (!socket_->send_text(transport::build_clear_frame(stream_sid_))) {
        logging::warn(
            "Failed to send clear frame",
            {kv("call_sid", call_sid_)});
    }
}

void CallActor::begin_generation(uint64_t request_id,
                                 const providers::GenerationRequest& request) {
    auto cancelled = std::make_shared<std::atomic<bool>>(false);
    generation_cancel_ = cancelled;
    auto mailbox = mailbox_;
    auto generator = dependencies_.generator;
    if (!generator) {
        mailbox->push(GenerationFinished{request_id, std::nullopt, "no text generator configured"});
        return;
    }
    auto call_sid = call_sid_;
    utils::run_async(
        [generator, mailbox, cancelled, request, request_id, call_sid]() {
            GenerationFinished finished;
            finished.request_id = request_id;
            try {
                finished.result = generator->generate(request, cancelled);
            } catch (const providers::AdapterError& ex) {
                finished.error = ex.what();
            } catch (const std::exception& ex) {
                logging::error(
                    "Unexpected generation error",
                    {kv("call_sid", call_sid),
                     kv("error", ex.what())});
                finished.error = ex.what();
            }
            if (providers::is_cancelled(cancelled)) {
                logging::debug(
                    "Generation finished after cancellation",
                    {kv("call_sid", call_sid),
                     kv("request_id", request_id)});
                return;
            }
            mailbox->push(std::move(finished));
        },
        "generation");
}

void CallActor::cancel_generation() {
    if (generation_cancel_) {
        generation_cancel_->store(true);
        generation_cancel_.reset();
    }
}

void CallActor::arm_ack_timer() {
    ack_deadline_ = std::chrono::steady_clock::now() + settings_.ack_delay;
}

void CallActor::disarm_ack_timer() {
    ack_deadline_.reset();
}

void CallActor::close_transport() {
    forwarding_ = false;
    socket_->close("conversation complete");
}

void CallActor::publish_completion(const CompletionEvent& event) {
    if (!dependencies_.completion) {
        logging::warn(
            "No completion sink configured",
            {kv("call_sid", call_sid_)});
        return;
    }
    dependencies_.completion->publish(event);
}

void CallActor::stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    forwarding_ = false;

    mailbox_->push(TransportClosed{});
    mailbox_->close();
    if (mailbox_thread_.joinable()) {
        if (mailbox_thread_.get_id() == std::this_thread::get_id()) {
            mailbox_thread_.detach();
        } else {
            mailbox_thread_.join();
        }
    }

    speech_queue_->shutdown();
    player_.stop();

    std::unique_ptr<providers::RecognitionStream> recognition;
    {
        std::lock_guard<std::mutex> lock(recognition_mutex_);
        recognition = std::move(recognition_);
    }
    if (recognition) {
        recognition->finish();
        recognition->close();
    }
    if (reader_.joinable()) {
        reader_.join();
    }

    logging::info(
        "Call actor stopped",
        {kv("call_sid", call_sid_),
         kv("dropped_media_frames", dropped_media_.load())});
}

}
