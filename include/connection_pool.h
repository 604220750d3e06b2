#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>

#include "common.h"

namespace httplib {
class Client;
}

struct server_address {
    std::string origin;      // scheme://host[:port]
    std::string path_prefix; // "" or "/v1" style, never with a trailing slash
};

server_address parse_base_url(const std::string & base_url);

/**
 * A bounded pool of HTTP clients for one OpenAI compatible server. Each client owns at most one keep-alive
 * connection, so a leased client is used by exactly one request at a time. The pool never retries requests.
 */
class connection_pool {
public:
    class lease {
    public:
        lease(connection_pool & pool, unique_ptr<httplib::Client> client);
        ~lease();
        lease(lease && other) noexcept;
        lease & operator=(lease &&) = delete;

        httplib::Client & client() { return *cli; }
        // The connection is closed instead of being kept for reuse once released.
        void discard() { reusable = false; }

    private:
        connection_pool * pool;
        unique_ptr<httplib::Client> cli;
        bool reusable = true;
    };

    connection_pool(const std::string & base_url, const std::string & api_key, const http_client_options & options = {});
    ~connection_pool();

    connection_pool(const connection_pool &) = delete;
    connection_pool & operator=(const connection_pool &) = delete;

    // Waits up to the pool timeout for a free slot, throws api_timeout_error when none frees up.
    lease acquire();
    lease acquire(std::chrono::duration<double> timeout);

    const server_address & address() const { return _address; }
    const std::string & api_key() const { return _api_key; }
    const http_client_options & options() const { return _options; }

    size_t active_connections();
    size_t idle_connections();

private:
    struct idle_client {
        unique_ptr<httplib::Client> client;
        std::chrono::steady_clock::time_point since;
    };

    unique_ptr<httplib::Client> open_client() const;
    void release(unique_ptr<httplib::Client> client, bool reusable);
    void evict_expired();

    const server_address _address;
    const std::string _api_key;
    const http_client_options _options;

    std::mutex rw_mutex;
    std::condition_variable available;
    std::deque<idle_client> idle;
    size_t active = 0;
};
