#ifndef HTTP_TRANSPORT_HPP
#define HTTP_TRANSPORT_HPP

#include <string>
#include <map>

using HttpHeaders = std::map<std::string, std::string>;

struct HttpResponse {
    bool ok = false;            // Transport-level success (a status line was received)
    long status_code = 0;
    std::string body;
    std::string error;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse get(const std::string& url, const HttpHeaders& headers) = 0;
    virtual HttpResponse post(const std::string& url, const std::string& body,
                              const HttpHeaders& headers) = 0;
};

// Blocking libcurl transport, one easy handle per request
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(long timeout_seconds = 15, long connect_timeout_seconds = 10);

    HttpResponse get(const std::string& url, const HttpHeaders& headers) override;
    HttpResponse post(const std::string& url, const std::string& body,
                      const HttpHeaders& headers) override;

private:
    HttpResponse perform(const std::string& url, const std::string* body, const HttpHeaders& headers);

    long timeout_seconds_;
    long connect_timeout_seconds_;
};

#endif // HTTP_TRANSPORT_HPP
