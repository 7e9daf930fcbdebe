#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "receptionist/http/client.hpp"
#include "receptionist/providers/speech.hpp"

namespace receptionist::providers {

struct OpenAiSettings {
    std::string base_url = "https://api.openai.com/v1";
    std::string api_key;
    std::string model = "gpt-4o-mini";
    double temperature = 0.7;
    int max_tokens = 80;
    HttpRequestOptions http;
};

// Chat completions with a single booking-details extraction tool.
class OpenAiGenerator : public TextGenerator {
public:
    explicit OpenAiGenerator(OpenAiSettings settings);

    std::string name() const override { return "openai"; }
    GenerationResult generate(const GenerationRequest& request,
                              const CancelFlag& cancelled) override;

    static nlohmann::json build_payload(const OpenAiSettings& settings,
                                        const GenerationRequest& request);
    static GenerationResult parse_response(const nlohmann::json& response);

private:
    OpenAiSettings settings_;
    std::unique_ptr<HttpClient> client_;
};

}
