#pragma once

#include <chrono>
#include <map>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio.hpp>
#include <boost/optional.hpp>

#include "outline.hpp"

#ifndef OUTLINE_HTTP_BODY_LIMIT
#define OUTLINE_HTTP_BODY_LIMIT 64*1024
#endif

#ifndef OUTLINE_HTTP_REQUEST_TIMEOUT_SECONDS
#define OUTLINE_HTTP_REQUEST_TIMEOUT_SECONDS 60
#endif

/*
 * One connection at a time per worker, all workers share the acceptor and a single
 * threaded io_context. PDF extraction runs on `extraction_pool`, the response is posted
 * back to the io_context, so the request deadline keeps running while a document is read.
 *
 *   GET /outline?path=<url encoded pdf path>[&sections=1]
 */
class http_worker {
  public:
    // disable copy constructor and copy assignment (non-copyable)
    http_worker(http_worker const&) = delete;
    http_worker& operator=(http_worker const&) = delete;

    http_worker(boost::asio::ip::tcp::acceptor& acceptor,
                boost::asio::thread_pool& extraction_pool,
                const Outline_Config& outline_config);

    void start();

    static bool url_decode(const std::string& in, std::string& out);

    static std::map<std::string, std::string> parse(const std::string &query);

  private:
    using request_body_t = boost::beast::http::string_body;

    // The acceptor used to listen for incoming connections.
    boost::asio::ip::tcp::acceptor& acceptor_;

    // Where documents are parsed, off the io_context thread.
    boost::asio::thread_pool& extraction_pool_;

    // Heuristics used for every request handled by this worker.
    Outline_Config outline_config_;

    // The socket for the currently connected client.
    boost::asio::ip::tcp::socket socket_{acceptor_.get_executor()};

    // The buffer for performing reads
    boost::beast::flat_buffer buffer_;

    // The parser for reading the requests
    boost::optional<boost::beast::http::request_parser<request_body_t>> parser_;

    // The timer putting a time limit on requests.
    boost::asio::steady_timer request_deadline_{acceptor_.get_executor(), (std::chrono::steady_clock::time_point::max)()};

    // The string-based response message.
    boost::optional<boost::beast::http::response<boost::beast::http::string_body>> string_response_;

    // The string-based response serializer.
    boost::optional<boost::beast::http::response_serializer<boost::beast::http::string_body>> string_serializer_;

    void accept();

    void read_request();

    void process_request(boost::beast::http::request<request_body_t> const& req);

    void extract_and_respond(std::string pdf_path, Outline_Config config);

    void send_response(boost::beast::http::status status, std::string const& content_type, std::string body);

    void send_bad_response(boost::beast::http::status status, std::string const& error);

    void check_deadline();
};

// Blocks until the io_context stops.
void run_http_server(const std::string& address, unsigned short port, unsigned int num_workers, const Outline_Config& outline_config);
