#include <mcp_agent/completion/anthropic_client.hpp>
#include <mcp_agent/completion/anthropic_codec.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <utility>

namespace mcp_agent {

namespace {

constexpr const char* kMessagesPath = "/v1/messages";

ErrorCategory CategoryFromHttpTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Timeout:
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::Connection;
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl: pimpl body holding the httplib::Client.
// ---------------------------------------------------------------------------
struct AnthropicClient::Impl {
    std::unique_ptr<httplib::Client> client;
    std::string api_key;
    Logger& logger;

    Impl(std::string key, Logger& log, const AnthropicClientOptions& opts)
        : api_key(std::move(key)), logger(log) {
        client = std::make_unique<httplib::Client>(opts.base_url);
        client->set_connection_timeout(opts.connect_timeout);
        client->set_read_timeout(opts.read_timeout);
        client->set_write_timeout(opts.connect_timeout);
    }

    httplib::Headers BuildHeaders() const {
        return {
            {"x-api-key", api_key},
            {"anthropic-version", kAnthropicVersion},
            {"accept", "application/json"},
        };
    }
};

AnthropicClient::AnthropicClient(std::string api_key,
                                 Logger& logger,
                                 const AnthropicClientOptions& options)
    : impl_(std::make_unique<Impl>(std::move(api_key), logger, options)) {}

AnthropicClient::~AnthropicClient() = default;

Result<CompletionResponse, Error> AnthropicClient::CreateCompletion(
    const CompletionRequest& request) {
    const auto body = EncodeRequest(request).dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);

    impl_->logger.Debug("http", "POST " + std::string(kMessagesPath) + " (" +
                                    std::to_string(request.messages.size()) +
                                    " messages, " +
                                    std::to_string(request.tools ? request.tools->size() : 0) +
                                    " tools)");

    auto res = impl_->client->Post(kMessagesPath, impl_->BuildHeaders(), body,
                                   "application/json");
    if (!res) {
        const auto http_error = res.error();
        return Result<CompletionResponse, Error>::Err(Error{
            "CreateCompletion", kMessagesPath, std::nullopt,
            "HTTP request failed: " + httplib::to_string(http_error),
            std::nullopt, CategoryFromHttpTransportError(http_error)});
    }

    impl_->logger.Debug("http", "<- " + std::to_string(res->status) + " (" +
                                    std::to_string(res->body.size()) + " bytes)");

    if (res->status < 200 || res->status >= 300) {
        return Result<CompletionResponse, Error>::Err(Error::FromHttpStatus(
            "CreateCompletion", kMessagesPath, res->status, res->body));
    }

    auto json = nlohmann::json::parse(res->body, nullptr, false);
    if (json.is_discarded()) {
        return Result<CompletionResponse, Error>::Err(Error{
            "CreateCompletion", kMessagesPath, res->status,
            "Response body is not valid JSON", std::nullopt,
            ErrorCategory::Completion});
    }

    auto decoded = DecodeResponse(json);
    if (decoded.IsErr()) {
        auto err = std::move(decoded).Error();
        err.operation = "CreateCompletion";
        err.http_status = res->status;
        return Result<CompletionResponse, Error>::Err(std::move(err));
    }

    const auto& response = decoded.Value();
    impl_->logger.Info("completion",
                       "stop_reason=" + response.stop_reason +
                           " input_tokens=" + std::to_string(response.usage.input_tokens) +
                           " output_tokens=" + std::to_string(response.usage.output_tokens));
    return decoded;
}

} // namespace mcp_agent
