#include "VendorClient.hpp"
#include <openssl/err.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cstring>
#include <iostream>
#include <sstream>
#include <thread>

namespace lan_watch::core
{
    namespace
    {
        bool wait_fd(int fd, short events, int timeout_ms)
        {
            pollfd pfd{};
            pfd.fd = fd;
            pfd.events = events;

            int r = poll(&pfd, 1, timeout_ms);
            return r > 0;
        }

        bool ssl_write_all(SSL *ssl, int fd, const char *data, size_t len, int timeout_ms)
        {
            size_t off = 0;
            while (off < len)
            {
                int n = SSL_write(ssl, data + off, static_cast<int>(len - off));
                if (n > 0)
                {
                    off += static_cast<size_t>(n);
                    continue;
                }

                int err = SSL_get_error(ssl, n);
                if (err == SSL_ERROR_WANT_READ)
                {
                    if (!wait_fd(fd, POLLIN, timeout_ms))
                        return false;
                    continue;
                }
                if (err == SSL_ERROR_WANT_WRITE)
                {
                    if (!wait_fd(fd, POLLOUT, timeout_ms))
                        return false;
                    continue;
                }
                return false;
            }
            return true;
        }

        // Owns one TLS connection for the duration of a request.
        struct TlsSession
        {
            int fd = -1;
            SSL *ssl = nullptr;

            ~TlsSession()
            {
                if (ssl)
                {
                    SSL_shutdown(ssl);
                    SSL_free(ssl);
                }
                if (fd != -1)
                    close(fd);
            }
        };

        std::string Trim(const std::string &s)
        {
            const char *ws = " \t\r\n";
            size_t first = s.find_first_not_of(ws);
            if (first == std::string::npos)
                return "";
            size_t last = s.find_last_not_of(ws);
            return s.substr(first, last - first + 1);
        }
    }

    std::optional<HttpResponse> ParseHttpResponse(const std::string &raw)
    {
        size_t header_end = raw.find("\r\n\r\n");
        size_t body_start = header_end == std::string::npos ? std::string::npos : header_end + 4;
        if (header_end == std::string::npos)
        {
            header_end = raw.find("\n\n");
            if (header_end != std::string::npos)
                body_start = header_end + 2;
        }

        std::string status_line = raw.substr(0, raw.find_first_of("\r\n"));
        std::stringstream ss(status_line);
        std::string version;
        int status = 0;
        if (!(ss >> version >> status) || version.rfind("HTTP/", 0) != 0)
            return std::nullopt;

        HttpResponse response;
        response.status = status;
        if (body_start != std::string::npos && body_start <= raw.size())
            response.body = Trim(raw.substr(body_start));
        return response;
    }

    MacVendorsClient::MacVendorsClient(std::string host, int port, std::chrono::milliseconds io_timeout)
        : m_host(std::move(host)), m_port(port), m_io_timeout(io_timeout), m_ssl_ctx(nullptr)
    {
        m_ssl_ctx = SSL_CTX_new(TLS_client_method());
        if (!m_ssl_ctx)
        {
            ERR_print_errors_fp(stderr);
            std::cerr << "[Vendor] Unable to create SSL context, lookups disabled\n";
            return;
        }

        SSL_CTX_set_default_verify_paths(m_ssl_ctx);
        SSL_CTX_set_verify(m_ssl_ctx, SSL_VERIFY_PEER, nullptr);
    }

    MacVendorsClient::~MacVendorsClient()
    {
        if (m_ssl_ctx)
        {
            SSL_CTX_free(m_ssl_ctx);
            m_ssl_ctx = nullptr;
        }
    }

    int MacVendorsClient::OpenSocket()
    {
        addrinfo hints{};
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;

        addrinfo *result = nullptr;
        std::string port = std::to_string(m_port);
        int rc = getaddrinfo(m_host.c_str(), port.c_str(), &hints, &result);
        if (rc != 0)
        {
            std::cerr << "[Vendor] Cannot resolve " << m_host << ": " << gai_strerror(rc) << "\n";
            return -1;
        }

        timeval tv{};
        tv.tv_sec = static_cast<time_t>(m_io_timeout.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((m_io_timeout.count() % 1000) * 1000);

        int fd = -1;
        for (addrinfo *ai = result; ai != nullptr; ai = ai->ai_next)
        {
            fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0)
                continue;

            setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof tv);
            setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof tv);

            if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0)
                break;

            close(fd);
            fd = -1;
        }
        freeaddrinfo(result);

        if (fd < 0)
            std::cerr << "[Vendor] Connection to " << m_host << ":" << m_port << " failed\n";
        return fd;
    }

    std::optional<std::string> MacVendorsClient::Exchange(const std::string &request)
    {
        if (!m_ssl_ctx)
            return std::nullopt;

        TlsSession session;
        session.fd = OpenSocket();
        if (session.fd < 0)
            return std::nullopt;

        session.ssl = SSL_new(m_ssl_ctx);
        if (!session.ssl)
            return std::nullopt;

        SSL_set_fd(session.ssl, session.fd);
        SSL_set_tlsext_host_name(session.ssl, m_host.c_str());
        SSL_set1_host(session.ssl, m_host.c_str());

        if (SSL_connect(session.ssl) <= 0)
        {
            std::cerr << "[Vendor] TLS handshake with " << m_host << " failed\n";
            ERR_clear_error();
            return std::nullopt;
        }

        const int timeout_ms = static_cast<int>(m_io_timeout.count());
        if (!ssl_write_all(session.ssl, session.fd, request.data(), request.size(), timeout_ms))
        {
            std::cerr << "[Vendor] Request write failed\n";
            return std::nullopt;
        }

        std::string raw;
        char buffer[4096];
        while (true)
        {
            int n = SSL_read(session.ssl, buffer, sizeof(buffer));
            if (n > 0)
            {
                raw.append(buffer, static_cast<size_t>(n));
                continue;
            }

            int err = SSL_get_error(session.ssl, n);
            if (err == SSL_ERROR_ZERO_RETURN || (err == SSL_ERROR_SYSCALL && !raw.empty()))
                break;
            if (err == SSL_ERROR_WANT_READ)
            {
                if (!wait_fd(session.fd, POLLIN, timeout_ms))
                    break;
                continue;
            }

            std::cerr << "[Vendor] SSL_read error: " << err << "\n";
            ERR_clear_error();
            if (raw.empty())
                return std::nullopt;
            break;
        }
        return raw;
    }

    std::optional<std::string> MacVendorsClient::Resolve(const std::string &hardware_address)
    {
        std::stringstream request;
        request << "GET /" << hardware_address << " HTTP/1.0\r\n"
                << "Host: " << m_host << "\r\n"
                << "User-Agent: lanwatch\r\n"
                << "Connection: close\r\n\r\n";

        auto raw = Exchange(request.str());
        if (!raw)
            return std::nullopt;

        auto response = ParseHttpResponse(*raw);
        if (!response)
        {
            std::cerr << "[Vendor] Malformed response for " << hardware_address << "\n";
            return std::nullopt;
        }
        if (response->status != 200 || response->body.empty())
        {
            std::cerr << "[Vendor] Lookup for " << hardware_address << " returned HTTP " << response->status << "\n";
            return std::nullopt;
        }

        std::cout << "[Vendor] Manufacturer of " << hardware_address << ": " << response->body << "\n";
        return response->body;
    }

    RateLimitedVendorResolver::RateLimitedVendorResolver(VendorResolver &inner, std::chrono::milliseconds spacing)
        : m_inner(inner), m_spacing(spacing)
    {
    }

    std::optional<std::string> RateLimitedVendorResolver::Resolve(const std::string &hardware_address)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_last_call)
        {
            auto ready = *m_last_call + m_spacing;
            auto now = std::chrono::steady_clock::now();
            if (now < ready)
                std::this_thread::sleep_for(ready - now);
        }
        m_last_call = std::chrono::steady_clock::now();
        return m_inner.Resolve(hardware_address);
    }
}
