#ifndef MATEBRIDGE_CORE_HTTP_CLIENT_HPP
#define MATEBRIDGE_CORE_HTTP_CLIENT_HPP

#include "json.hpp"
#include <string>
#include <map>
#include <mutex>
#include <curl/curl.h>

namespace matebridge {

// HTTP response structure
struct HttpResponse {
    long status_code;
    std::string body;
    std::string error;
    
    HttpResponse() : status_code(0) {}
    
    bool ok() const { return status_code >= 200 && status_code < 300; }
    
    // Null Json when the body is not valid JSON
    Json json() const {
        try {
            return Json::parse(body);
        } catch (const std::exception&) {
            return Json();
        }
    }
};

// HTTP client using libcurl. One easy handle per client; requests on the
// same client are serialized.
class HttpClient {
public:
    HttpClient();
    ~HttpClient();
    
    void set_timeout(long ms);
    long timeout() const { return timeout_ms_; }
    
    HttpResponse get(const std::string& url);
    
    // POST request with JSON body
    HttpResponse post_json(const std::string& url, const Json& body);
    HttpResponse post_json(const std::string& url, const std::string& body);

private:
    CURL* curl_;
    long timeout_ms_;
    std::mutex mutex_;
    
    HttpResponse perform_request(const std::string& url,
                                 const std::string* body,
                                 const std::map<std::string, std::string>& headers);
    
    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata);

    HttpClient(const HttpClient&);
    HttpClient& operator=(const HttpClient&);
};

} // namespace matebridge

#endif // MATEBRIDGE_CORE_HTTP_CLIENT_HPP
