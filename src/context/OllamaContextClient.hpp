#pragma once

#include "IContextClient.hpp"
#include "../utils/HttpCommon.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace context
{

struct ContextClientConfig
{
    std::string base_url = "http://localhost:11434";
    std::string model = "gemma2:9b";
    int connect_timeout_ms = 3000;
    int timeout_ms = 30000;
};

/**
 * @brief Context detector backed by a local Ollama server.
 *
 * Availability is probed with GET /api/tags; analysis posts a single
 * non-streaming request to /api/chat in JSON mode and parses
 * message.content as {"detected": [{"type": ..., "value": ...}]}.
 */
class OllamaContextClient : public IContextClient
{
public:
    explicit OllamaContextClient(ContextClientConfig cfg);

    const char* clientName() const override { return "Ollama"; }

    bool isAvailable() const override;
    std::vector<ContextFinding> analyze(const std::string& text) const override;

    const ContextClientConfig& config() const { return cfg_; }

    nlohmann::json buildRequestBody(const std::string& text) const;

    // Parse a raw /api/chat reply body. Throws ContextError when malformed.
    static std::vector<ContextFinding> parseChatResponse(const std::string& body);

    static const char* systemPrompt();

private:
    ContextClientConfig cfg_;
    utils::HttpEndpoint endpoint_;
};

} // namespace context
