//
// Created by gregorian-rayne on 10/08/26.
//

#ifndef ARS_SERVER_HPP
#define ARS_SERVER_HPP

#include "ars/config/config.hpp"
#include "ars/result.hpp"
#include "ars/service/scan_api.hpp"
#include "ars/utils/parallel.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace ars::service {

    /**
     * HTTP/1.1 front end for ScanApi.
     *
     * One request per connection. The accept loop runs on the thread that
     * calls start(); each connection is handled on the worker pool.
     */
    class Server {
    public:
        Server(config::ServerConfig options, const ScanApi& api, bool verbose_logging = false);
        ~Server();

        Server(const Server&) = delete;
        Server& operator=(const Server&) = delete;
        Server(Server&&) = delete;
        Server& operator=(Server&&) = delete;

        /**
         * Binds, listens and serves until stop() or request_stop().
         */
        Result<void> start();

        /**
         * Binds and listens on the calling thread, then serves on a
         * background thread.
         */
        Result<void> start_async();

        /**
         * Stops the accept loop and joins the background thread, if any.
         */
        void stop();

        /**
         * Asks the accept loop to exit at its next wakeup.
         * Only touches an atomic flag, so it is safe from a signal handler.
         */
        void request_stop() noexcept;

        [[nodiscard]] bool is_running() const;
        /**
         * Listening port. After a successful start with port 0 this is the
         * port the kernel assigned.
         */
        [[nodiscard]] int port() const;
        [[nodiscard]] std::string get_url() const;

    private:
        class Impl;

        void accept_loop();
        void handle_client(int client_socket) const;

        std::unique_ptr<Impl> impl_;
        config::ServerConfig options_;
        const ScanApi& api_;
        bool verbose_logging_;
        std::unique_ptr<parallel::ThreadPool> thread_pool_;
        std::atomic<bool> running_{false};
        std::unique_ptr<std::thread> server_thread_;
    };

} // namespace ars::service

#endif //ARS_SERVER_HPP
