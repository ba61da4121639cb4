#include "OllamaContextClient.hpp"
#include "../detection/Diagnostics.hpp"
#include "../utils/HttpCommon.hpp"

#include <plog/Log.h>

#include <utility>

namespace context
{

namespace
{

constexpr int kProbeConnectTimeoutMs = 1000;
constexpr int kProbeTimeoutMs = 2000;

} // namespace

OllamaContextClient::OllamaContextClient(ContextClientConfig cfg)
    : cfg_(std::move(cfg))
    , endpoint_(cfg_.base_url)
{
}

const char* OllamaContextClient::systemPrompt()
{
    return R"(あなたは機密情報検出AIです。
与えられたテキストから機密情報を検出してください。

検出対象:
- 個人名（顧客名、担当者名）
- 企業名（取引先、競合他社）
- プロジェクト名（社外秘のコードネーム）
- その他、外部に出すべきでない情報

注意:
- メールアドレス、電話番号、住所、金額などは別システムで検出するため、ここでは検出不要
- 一般名詞や公開情報は検出しない

必ずJSON形式で回答:
{
  "detected": [
    {"type": "個人名", "value": "検出した文字列"},
    {"type": "会社名", "value": "検出した文字列"}
  ]
}

検出なしの場合:
{"detected": []}
)";
}

bool OllamaContextClient::isAvailable() const
{
    if (endpoint_.empty())
        return false;

    const auto resp = endpoint_.get("/api/tags", { kProbeConnectTimeoutMs, kProbeTimeoutMs });
    if (!resp.ok())
    {
        PLOG_DEBUG_(detection::Diagnostics::kLogInstance) << "[Ollama] probe failed: " << resp.describe();
        return false;
    }
    return true;
}

nlohmann::json OllamaContextClient::buildRequestBody(const std::string& text) const
{
    nlohmann::json body = nlohmann::json::object();
    body["model"] = cfg_.model;
    body["messages"] = nlohmann::json::array({
        { { "role", "system" }, { "content", systemPrompt() } },
        { { "role", "user" }, { "content", "以下のテキストを分析:\n\n" + text } },
    });
    body["format"] = "json";
    body["stream"] = false;
    body["options"] = { { "temperature", 0.1 }, { "num_predict", 500 } };
    return body;
}

std::vector<ContextFinding> OllamaContextClient::analyze(const std::string& text) const
{
    const std::string body = buildRequestBody(text).dump();
    const auto resp = endpoint_.postJson("/api/chat", body, { cfg_.connect_timeout_ms, cfg_.timeout_ms });

    if (!resp.error.empty())
        throw ContextError("request failed: " + resp.error);
    if (!resp.ok())
        throw ContextError(resp.describe() + ": " + detection::Diagnostics::Preview(resp.text));

    auto findings = parseChatResponse(resp.text);
    PLOG_DEBUG_(detection::Diagnostics::kLogInstance) << "[Ollama] " << findings.size() << " findings";
    return findings;
}

std::vector<ContextFinding> OllamaContextClient::parseChatResponse(const std::string& body)
{
    std::string content;
    nlohmann::json result;
    try
    {
        auto json = nlohmann::json::parse(body);
        if (!json.contains("message") || !json["message"].is_object() || !json["message"].contains("content") ||
            !json["message"]["content"].is_string())
        {
            throw ContextError("missing message content");
        }
        content = json["message"]["content"].get<std::string>();
        result = nlohmann::json::parse(content);
    }
    catch (const nlohmann::json::exception& ex)
    {
        throw ContextError(std::string("parse error: ") + ex.what());
    }

    if (!result.is_object())
        throw ContextError("expected a JSON object in message content");

    std::vector<ContextFinding> findings;
    auto it = result.find("detected");
    if (it == result.end())
        return findings;
    if (!it->is_array())
        throw ContextError("\"detected\" is not an array");

    for (const auto& item : *it)
    {
        if (!item.is_object())
            continue;
        auto value = item.find("value");
        if (value == item.end() || !value->is_string())
            continue;

        ContextFinding finding;
        finding.value = value->get<std::string>();
        auto type = item.find("type");
        finding.type_label = (type != item.end() && type->is_string()) ? type->get<std::string>() : "機密情報";
        findings.push_back(std::move(finding));
    }
    return findings;
}

} // namespace context
