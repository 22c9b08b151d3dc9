#ifndef NOTIFIER_HPP
#define NOTIFIER_HPP

#include "http_transport.hpp"
#include <string>
#include <vector>

// Outbound operator channel
class Notifier {
public:
    virtual ~Notifier() = default;

    // Returns true if every chunk was delivered
    virtual bool send(const std::string& text) = 0;
};

// Posts {"content": ...} to a chat webhook
class WebhookNotifier : public Notifier {
public:
    static constexpr size_t MAX_MESSAGE_LENGTH = 2000;

    WebhookNotifier(const std::string& webhook_url, HttpTransport& transport);

    bool send(const std::string& text) override;

    // Splits on line boundaries where possible, hard-splits over-long lines
    static std::vector<std::string> chunk(const std::string& text, size_t max_length = MAX_MESSAGE_LENGTH);

private:
    std::string webhook_url_;
    HttpTransport& transport_;
};

// Logs instead of sending; used when no webhook is configured
class LogNotifier : public Notifier {
public:
    bool send(const std::string& text) override;
};

#endif // NOTIFIER_HPP
