#pragma once

#include <atomic>
#include <memory>

#include "receptionist/config.hpp"
#include "receptionist/conversation/completion.hpp"
#include "receptionist/http/client.hpp"
#include "receptionist/providers/registry.hpp"
#include "receptionist/routing/engine.hpp"
#include "receptionist/server/inbound_call.hpp"
#include "receptionist/server/rest_server.hpp"
#include "receptionist/session/parameter_cache.hpp"
#include "receptionist/transport/media_server.hpp"
#include "receptionist/tts/cache.hpp"
#include "receptionist/tts/synthesis_chain.hpp"

namespace receptionist {

class ReceptionistApp {
public:
    explicit ReceptionistApp(Config config);
    ~ReceptionistApp();

    void init();
    // Blocks until stop() or SIGINT/SIGTERM.
    void run();
    void stop();

    static void install_signal_handlers();

private:
    std::shared_ptr<transport::MediaCall> create_call(
        const session::SessionParameters& parameters,
        const transport::StartFrame& start,
        std::shared_ptr<transport::MediaSocket> socket);

    Config config_;
    std::shared_ptr<HttpClient> backend_client_;
    providers::SpeechProviders providers_;
    std::shared_ptr<tts::TtsCache> tts_cache_;
    std::shared_ptr<tts::SynthesisChain> synthesis_;
    std::shared_ptr<session::SessionParameterCache> sessions_;
    std::shared_ptr<routing::AccountDirectory> directory_;
    std::shared_ptr<routing::RoutingEngine> routing_;
    std::shared_ptr<conversation::CompletionSink> completion_;
    std::unique_ptr<transport::MediaServer> media_server_;
    std::unique_ptr<server::RestServer> rest_server_;
    std::atomic<bool> quitting_{false};
};

}
