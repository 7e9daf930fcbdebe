#include "receptionist/providers/openai_generator.hpp"

#include <chrono>

#include "receptionist/logging.hpp"
#include "receptionist/metrics.hpp"

namespace receptionist::providers {

namespace {

constexpr const char* kExtractionTool = "extract_booking_details";

nlohmann::json booking_tool() {
    auto text_field = [](const char* description) {
        return nlohmann::json{{"type", "string"}, {"description", description}};
    };
    nlohmann::json properties = {
        {"caller_name", text_field("Caller full name")},
        {"phone_number", text_field("Best callback number")},
        {"service_type", text_field("Service or job the caller needs")},
        {"preferred_date", text_field("Preferred date if mentioned")},
        {"preferred_time", text_field("Preferred time if mentioned")},
        {"location", text_field("Service address or suburb")},
        {"urgency",
         {{"type", "string"},
          {"enum", {"urgent", "normal", "flexible"}},
          {"description", "How soon the work is needed"}}},
        {"notes", text_field("Anything else relevant to the job")},
    };
    return {
        {"type", "function"},
        {"function",
         {{"name", kExtractionTool},
          {"description", "Record booking details the caller has provided so far"},
          {"parameters",
           {{"type", "object"},
            {"properties", properties},
            {"required", {"caller_name", "phone_number", "service_type"}}}}}},
    };
}

}

OpenAiGenerator::OpenAiGenerator(OpenAiSettings settings)
    : settings_(std::move(settings)) {
    if (settings_.api_key.empty()) {
        throw GenerationFailure("LLM API key is not configured");
    }
    client_ = std::make_unique<HttpClient>(
        settings_.base_url,
        httplib::Headers{{"Authorization", "Bearer " + settings_.api_key}},
        settings_.http);
}

nlohmann::json OpenAiGenerator::build_payload(const OpenAiSettings& settings,
                                              const GenerationRequest& request) {
    nlohmann::json messages = nlohmann::json::array();
    if (!request.system_prompt.empty()) {
        messages.push_back({{"role", "system"}, {"content", request.system_prompt}});
    }
    for (const auto& message : request.messages) {
        messages.push_back({{"role", message.role}, {"content", message.content}});
    }
    nlohmann::json payload = {
        {"model", settings.model},
        {"messages", messages},
        {"temperature", settings.temperature},
        {"max_tokens", settings.max_tokens},
    };
    if (request.allow_function_calls) {
        payload["tools"] = nlohmann::json::array({booking_tool()});
        payload["tool_choice"] = "auto";
    }
    return payload;
}

GenerationResult OpenAiGenerator::parse_response(const nlohmann::json& response) {
    const auto choices = response.find("choices");
    if (choices == response.end() || !choices->is_array() || choices->empty()) {
        throw GenerationFailure("Completion response has no choices");
    }
    const auto& message = (*choices)[0].value("message", nlohmann::json::object());
    std::string text;
    if (message.contains("content") && message["content"].is_string()) {
        text = message["content"].get<std::string>();
    }

    const auto tool_calls = message.find("tool_calls");
    if (tool_calls != message.end() && tool_calls->is_array()) {
        for (const auto& call : *tool_calls) {
            const auto function = call.value("function", nlohmann::json::object());
            if (function.value("name", "") != kExtractionTool) {
                continue;
            }
            FunctionCall result;
            result.name = kExtractionTool;
            result.spoken_text = text;
            const auto arguments = function.find("arguments");
            if (arguments != function.end() && arguments->is_object()) {
                result.arguments = *arguments;
            } else if (arguments != function.end() && arguments->is_string()) {
                try {
                    auto parsed = nlohmann::json::parse(arguments->get<std::string>());
                    if (parsed.is_object()) {
                        result.arguments = std::move(parsed);
                    }
                } catch (const nlohmann::json::exception& ex) {
                    logging::warn(
                        "Tool call arguments are not valid JSON",
                        {kv("error", ex.what())});
                }
            }
            return result;
        }
    }

    if (text.empty()) {
        throw GenerationFailure("Completion response has no content");
    }
    return AssistantUtterance{text};
}

GenerationResult OpenAiGenerator::generate(const GenerationRequest& request,
                                           const CancelFlag& cancelled) {
    if (is_cancelled(cancelled)) {
        throw GenerationFailure("Generation cancelled before start");
    }
    const auto payload = build_payload(settings_, request);
    const auto start = std::chrono::steady_clock::now();
    nlohmann::json response;
    try {
        response = client_->post_json("/chat/completions", payload);
    } catch (const HttpError& ex) {
        Metrics::instance().record_provider_failure("generation", name());
        throw GenerationFailure(ex.what(), ex.status());
    }
    const auto elapsed = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();
    Metrics::instance().observe_latency("generation", elapsed);
    logging::debug(
        "Completion received",
        {kv("model", settings_.model),
         kv("elapsed_sec", elapsed),
         kv("messages", request.messages.size())});
    return parse_response(response);
}

}
