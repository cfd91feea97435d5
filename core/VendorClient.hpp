#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <openssl/ssl.h>

namespace lan_watch::core
{
    inline constexpr const char *DEFAULT_VENDOR_HOST = "api.macvendors.com";

    class VendorResolver
    {
    public:
        virtual ~VendorResolver() = default;

        // Manufacturer name for a hardware address, or nullopt when unavailable.
        virtual std::optional<std::string> Resolve(const std::string &hardware_address) = 0;
    };

    struct HttpResponse
    {
        int status;
        std::string body;
    };

    std::optional<HttpResponse> ParseHttpResponse(const std::string &raw);

    // HTTPS GET /<mac> against a macvendors-style endpoint.
    class MacVendorsClient : public VendorResolver
    {
    public:
        explicit MacVendorsClient(std::string host = DEFAULT_VENDOR_HOST, int port = 443,
                                  std::chrono::milliseconds io_timeout = std::chrono::milliseconds(5000));
        ~MacVendorsClient();

        MacVendorsClient(const MacVendorsClient &) = delete;
        MacVendorsClient &operator=(const MacVendorsClient &) = delete;

        std::optional<std::string> Resolve(const std::string &hardware_address) override;

    private:
        int OpenSocket();
        std::optional<std::string> Exchange(const std::string &request);

        std::string m_host;
        int m_port;
        std::chrono::milliseconds m_io_timeout;
        SSL_CTX *m_ssl_ctx;
    };

    // Enforces a minimum spacing between calls to the wrapped resolver.
    class RateLimitedVendorResolver : public VendorResolver
    {
    public:
        RateLimitedVendorResolver(VendorResolver &inner, std::chrono::milliseconds spacing);

        std::optional<std::string> Resolve(const std::string &hardware_address) override;

    private:
        VendorResolver &m_inner;
        std::chrono::milliseconds m_spacing;
        std::mutex m_mutex;
        std::optional<std::chrono::steady_clock::time_point> m_last_call;
    };
}
