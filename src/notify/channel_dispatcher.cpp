#include "notify/channel_dispatcher.hpp"
#include "notify/payloads.hpp"
#include "core/http_url.hpp"
#include "core/utils.hpp"

// https:// endpoints need the OpenSSL-backed client
#define CPPHTTPLIB_OPENSSL_SUPPORT
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>
#include <mutex>

namespace errorengine {

ChannelDispatcher::ChannelDispatcher(const std::vector<ChannelConfig>& channels) {
    set_channels(channels);
}

void ChannelDispatcher::set_channels(const std::vector<ChannelConfig>& channels) {
    std::unordered_map<std::string, ChannelConfig> table;
    for (const auto& ch : channels) {
        table[ch.name] = ch;
    }
    std::unique_lock lock(mutex_);
    channels_ = std::move(table);
}

ChannelDispatcher::HttpRequest ChannelDispatcher::build_request(
    const ChannelConfig& channel,
    NotificationKind kind,
    const std::vector<ErrorContext>& errors,
    const QueryMetadata& query) {

    HttpRequest req;
    switch (channel.type) {
        case ChannelType::WEBHOOK: {
            req.url = channel.url;
            req.body = payloads::webhook_payload(kind, errors, query).dump();
            req.headers = channel.headers;
            if (!channel.secret.empty()) {
                req.headers["X-ErrorEngine-Signature"] = payloads::hmac_signature(channel.secret, req.body);
            }
            break;
        }
        case ChannelType::TEAMS:
            req.url = channel.url;
            req.body = payloads::teams_payload(kind, errors, query).dump();
            req.headers = channel.headers;
            break;
        case ChannelType::TELEGRAM: {
            req.url = std::format("{}/bot{}/sendMessage", channel.api_base, channel.bot_token);
            nlohmann::ordered_json j;
            j["chat_id"] = channel.chat_id;
            j["text"] = payloads::telegram_text(kind, errors, query);
            j["disable_web_page_preview"] = true;
            req.body = j.dump();
            break;
        }
    }
    return req;
}

DeliveryResult ChannelDispatcher::send(
    const Destination& destination,
    NotificationKind kind,
    const std::vector<ErrorContext>& errors,
    const QueryMetadata& query) {

    ChannelConfig channel;
    {
        std::shared_lock lock(mutex_);
        const auto it = channels_.find(destination.id);
        if (it == channels_.end()) {
            ++send_failures_;
            return DeliveryResult::failed(std::format("unknown channel '{}'", destination.id));
        }
        channel = it->second;
    }

    if (!channel.enabled) {
        ++send_failures_;
        return DeliveryResult::failed(std::format("channel '{}' is disabled", channel.name));
    }

    HttpRequest req;
    try {
        req = build_request(channel, kind, errors, query);
    } catch (const nlohmann::json::exception& e) {
        ++send_failures_;
        return DeliveryResult::failed(std::format("payload encoding failed: {}", e.what()));
    }

    auto result = post(req, channel.timeout);
    if (!result.success) {
        ++send_failures_;
        utils::log::warn(std::format("Channel '{}' ({}) delivery failed: {}",
            channel.name, channel_type_to_string(channel.type), result.message));
    }
    return result;
}

DeliveryResult ChannelDispatcher::post(const HttpRequest& request, std::chrono::milliseconds timeout) {
    const auto url = parse_http_url(request.url);
    if (!url) {
        return DeliveryResult::failed(std::format("invalid URL '{}'", request.url));
    }

    try {
        httplib::Client client(url->scheme_host_port());
        client.set_connection_timeout(timeout);
        client.set_read_timeout(timeout);
        client.set_write_timeout(timeout);

        httplib::Headers headers;
        for (const auto& [k, v] : request.headers) {
            headers.emplace(k, v);
        }

        auto res = client.Post(url->path, headers, request.body, request.content_type);
        if (!res) {
            return DeliveryResult::failed(std::format("HTTP error: {}", httplib::to_string(res.error())));
        }
        if (res->status < 200 || res->status >= 300) {
            return DeliveryResult::failed(std::format("HTTP {}", res->status));
        }
        return DeliveryResult::ok(std::format("HTTP {}", res->status));
    } catch (const std::exception& e) {
        return DeliveryResult::failed(e.what());
    }
}

} // namespace errorengine
