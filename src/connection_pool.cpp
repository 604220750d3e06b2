#include "connection_pool.h"

#include <httplib.h>

#include "api_error.h"
#include "util.h"

server_address parse_base_url(const std::string & base_url) {
    std::string url = strip(base_url, " \t");
    if (url.find("://") == std::string::npos) {
        url = "http://" + url;
    }
    const size_t host_start = url.find("://") + 3;
    const size_t path_start = url.find('/', host_start);
    server_address address;
    if (path_start == std::string::npos) {
        address.origin = url;
        return address;
    }
    address.origin = url.substr(0, path_start);
    const std::string path = strip(url.substr(path_start), "/");
    if (!path.empty()) {
        address.path_prefix = "/" + path;
    }
    return address;
}

connection_pool::lease::lease(connection_pool & pool, unique_ptr<httplib::Client> client): pool(&pool), cli(std::move(client)) {}

connection_pool::lease::lease(lease && other) noexcept: pool(other.pool), cli(std::move(other.cli)), reusable(other.reusable) {
    other.pool = nullptr;
}

connection_pool::lease::~lease() {
    if (pool && cli) {
        pool->release(std::move(cli), reusable);
    }
}

connection_pool::connection_pool(const std::string & base_url, const std::string & api_key, const http_client_options & options):
    _address(parse_base_url(base_url)), _api_key(api_key), _options(options) {
    KOKORO_ASSERT(options.max_connections > 0);
}

connection_pool::~connection_pool() = default;

unique_ptr<httplib::Client> connection_pool::open_client() const {
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (_address.origin.rfind("https://", 0) == 0) {
        throw api_connection_error("'" + _address.origin + "' needs https, kokoro.cpp is built without OpenSSL.", false);
    }
#endif
    auto client = make_unique<httplib::Client>(_address.origin);
    if (!client->is_valid()) {
        throw api_connection_error("Invalid server address '" + _address.origin + "'.", false);
    }
    const auto [connect_sec, connect_usec] = to_sec_usec(_options.connect_timeout);
    const auto [read_sec, read_usec] = to_sec_usec(_options.read_timeout);
    const auto [write_sec, write_usec] = to_sec_usec(_options.write_timeout);
    client->set_connection_timeout(connect_sec, connect_usec);
    client->set_read_timeout(read_sec, read_usec);
    client->set_write_timeout(write_sec, write_usec);
    client->set_follow_location(_options.follow_redirects);
    client->set_keep_alive(true);
    return client;
}

void connection_pool::evict_expired() {
    const auto now = std::chrono::steady_clock::now();
    while (!idle.empty() && now - idle.front().since >= _options.keepalive_expiry) {
        idle.pop_front();
    }
}

connection_pool::lease connection_pool::acquire() {
    return acquire(_options.pool_timeout);
}

connection_pool::lease connection_pool::acquire(std::chrono::duration<double> timeout) {
    std::unique_lock<std::mutex> lock(rw_mutex);
    const bool freed = available.wait_for(lock, timeout, [&]{
        return active < _options.max_connections;
    });
    if (!freed) {
        throw api_timeout_error("Timed out waiting for a free connection (" + std::to_string(_options.max_connections) + " in use).");
    }
    active++;
    evict_expired();
    if (!idle.empty()) {
        // the most recently used connection is the least likely to have been closed by the server.
        unique_ptr<httplib::Client> client = std::move(idle.back().client);
        idle.pop_back();
        return lease(*this, std::move(client));
    }
    lock.unlock();
    try {
        return lease(*this, open_client());
    } catch (...) {
        std::lock_guard<std::mutex> guard(rw_mutex);
        active--;
        available.notify_one();
        throw;
    }
}

void connection_pool::release(unique_ptr<httplib::Client> client, bool reusable) {
    std::unique_lock<std::mutex> lock(rw_mutex);
    active--;
    evict_expired();
    if (reusable && _options.max_keepalive_connections > 0) {
        if (idle.size() >= _options.max_keepalive_connections) {
            idle.pop_front();
        }
        idle.push_back({std::move(client), std::chrono::steady_clock::now()});
    }
    lock.unlock();
    available.notify_one();
    // a discarded client closes its socket here, outside of the lock.
}

size_t connection_pool::active_connections() {
    std::lock_guard<std::mutex> lock(rw_mutex);
    return active;
}

size_t connection_pool::idle_connections() {
    std::lock_guard<std::mutex> lock(rw_mutex);
    evict_expired();
    return idle.size();
}
