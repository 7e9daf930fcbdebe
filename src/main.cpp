#include "receptionist/app.hpp"
#include "receptionist/config.hpp"
#include "receptionist/logging.hpp"

#include <string>

int main() {
    try {
        const auto config = receptionist::Config::load();
        config.validate();
        receptionist::logging::init(config);
        receptionist::info(
            "Starting receptionist-server",
            {receptionist::kv("backend_url", config.backend_url),
             receptionist::kv("http_port", config.http_port),
             receptionist::kv("media_port", config.media_port),
             receptionist::kv("media_stream_url", config.media_stream_url),
             receptionist::kv("tts_provider", config.tts_provider),
             receptionist::kv("interruptions_allowed", config.interruptions_are_allowed)});
        receptionist::ReceptionistApp::install_signal_handlers();
        receptionist::ReceptionistApp app(config);
        app.init();
        app.run();
    } catch (const std::exception& ex) {
        receptionist::error(
            "Startup failed",
            {receptionist::kv("error", ex.what())});
        return 1;
    }
    return 0;
}
