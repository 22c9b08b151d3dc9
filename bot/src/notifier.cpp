#include "notifier.hpp"
#include "logger.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

WebhookNotifier::WebhookNotifier(const std::string& webhook_url, HttpTransport& transport)
    : webhook_url_(webhook_url)
    , transport_(transport) {
}

std::vector<std::string> WebhookNotifier::chunk(const std::string& text, size_t max_length) {
    std::vector<std::string> chunks;
    if (max_length == 0) {
        return chunks;
    }
    std::string current;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t nl = text.find('\n', pos);
        std::string line = text.substr(pos, nl == std::string::npos ? std::string::npos : nl - pos);
        pos = nl == std::string::npos ? text.size() + 1 : nl + 1;

        while (line.size() > max_length) {
            if (!current.empty()) {
                chunks.push_back(current);
                current.clear();
            }
            chunks.push_back(line.substr(0, max_length));
            line = line.substr(max_length);
        }

        size_t needed = current.empty() ? line.size() : current.size() + 1 + line.size();
        if (needed > max_length) {
            chunks.push_back(current);
            current = line;
        } else {
            current = current.empty() ? line : current + "\n" + line;
        }
    }
    if (!current.empty()) {
        chunks.push_back(current);
    }
    return chunks;
}

bool WebhookNotifier::send(const std::string& text) {
    if (webhook_url_.empty()) {
        LOG_WARNING("Webhook URL not configured, dropping notification");
        return false;
    }

    bool all_sent = true;
    for (const auto& part : chunk(text)) {
        json payload = json::object();
        payload["content"] = part;

        HttpHeaders headers;
        HttpResponse resp = transport_.post(webhook_url_, payload.dump(), headers);
        if (!resp.ok || resp.status_code < 200 || resp.status_code >= 300) {
            LOG_ERROR("Notification failed: " + (resp.ok ? "HTTP " + std::to_string(resp.status_code) : resp.error));
            all_sent = false;
        }
    }

    if (all_sent) {
        LOG_INFO("Notification sent: " + text.substr(0, 100));
    }
    return all_sent;
}

bool LogNotifier::send(const std::string& text) {
    LOG_INFO("[notify] " + text);
    return true;
}
