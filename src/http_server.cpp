#include "http_server.hpp"
#include "logging.hpp"
#include "pdf_utils.hpp"
#include "string_utils.hpp"
#include <boost/beast/core.hpp>
#include <cctype>
#include <chrono>
#include <list>
#include <regex>
#include <sstream>
#include <string>

namespace {

std::string describe_remote(boost::asio::ip::tcp::socket& socket) {
    boost::beast::error_code ec;
    boost::asio::ip::tcp::endpoint endpoint = socket.remote_endpoint(ec);
    if (ec) {
        return "<unknown>";
    }
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

}

http_worker::http_worker(boost::asio::ip::tcp::acceptor& acceptor,
                         boost::asio::thread_pool& extraction_pool,
                         const Outline_Config& outline_config) :
    acceptor_(acceptor),
    extraction_pool_(extraction_pool),
    outline_config_(outline_config) {
}

void http_worker::start() {
    accept();
    check_deadline();
}

void http_worker::accept() {
    // Clean up any previous connection.
    boost::beast::error_code ec;
    socket_.close(ec);
    buffer_.consume(buffer_.size());

    acceptor_.async_accept(
        socket_,
    [this](boost::beast::error_code ec) {
        if (ec) {
            LOG_CHANNEL_ERROR("http") << "Error code: " << ec.value() << " " << ec.message();
            accept();
        } else {
            LOG_CHANNEL_DEBUG("http") << "Accepted request from " << describe_remote(socket_);

            // Request must be fully processed within the deadline.
            request_deadline_.expires_after(std::chrono::seconds(OUTLINE_HTTP_REQUEST_TIMEOUT_SECONDS));

            read_request();
        }
    });
}

void http_worker::read_request() {
    // On each read the parser needs to be destroyed and
    // recreated. We store it in a boost::optional to
    // achieve that.
    parser_.emplace();
    parser_->body_limit(OUTLINE_HTTP_BODY_LIMIT);

    boost::beast::http::async_read(socket_,
                                   buffer_,
                                   *parser_,
    [this](boost::beast::error_code ec, std::size_t) {
        if (ec) {
            LOG_CHANNEL_ERROR("http") << "Error code: " << ec.value() << " " << ec.message();
            accept();
        } else {
            process_request(parser_->get());
        }
    });
}

bool http_worker::url_decode(const std::string& in, std::string& out)
{
  out.clear();
  out.reserve(in.size());
  for (std::size_t i = 0; i < in.size(); ++i)
  {
    if (in[i] == '%')
    {
      if (i + 3 <= in.size() &&
          std::isxdigit(static_cast<unsigned char>(in[i + 1])) &&
          std::isxdigit(static_cast<unsigned char>(in[i + 2])))
      {
        int value = 0;
        std::istringstream is(in.substr(i + 1, 2));
        if (is >> std::hex >> value)
        {
          out += static_cast<char>(value);
          i += 2;
        }
        else
        {
          return false;
        }
      }
      else
      {
        return false;
      }
    }
    else if (in[i] == '+')
    {
      out += ' ';
    }
    else
    {
      out += in[i];
    }
  }
  return true;
}

std::map<std::string, std::string> http_worker::parse(const std::string& query) {
    std::map<std::string, std::string> data;
    std::regex pattern("([\\w+%]+)=([^&]*)");
    auto words_begin = std::sregex_iterator(query.begin(), query.end(), pattern);
    auto words_end = std::sregex_iterator();

    for (std::sregex_iterator i = words_begin; i != words_end; i++)
    {
        std::string key = (*i)[1].str();
        std::string value = (*i)[2].str();
        data[key] = value;
    }

    return data;
}

void http_worker::process_request(boost::beast::http::request<request_body_t> const& req) {
    switch (req.method()) {
        case boost::beast::http::verb::get: {
            /* request parameters:
             *   - required: path     : pdf file path
             *   - optional: sections : 1 to add the text grouped under each heading
             */
            std::string target(req.target().data(), req.target().size());
            size_t query_pos = target.find('?');
            std::string endpoint = target.substr(0, query_pos);
            std::string query = query_pos == std::string::npos ? std::string() : target.substr(query_pos + 1);

            if (endpoint != "/outline") {
                send_bad_response(boost::beast::http::status::not_found, "Unknown target '" + endpoint + "'\r\n");
                break;
            }

            std::map<std::string, std::string> params = parse(query);
            std::string request_path;
            auto path_param = params.find("path");
            if (path_param == params.end() || !url_decode(path_param->second, request_path) || request_path.empty()) {
                send_bad_response(boost::beast::http::status::bad_request, "Missing or malformed 'path' parameter\r\n");
                break;
            }

            Outline_Config config = outline_config_;
            auto sections_param = params.find("sections");
            if (sections_param != params.end() && sections_param->second == "1") {
                config.group_sections = true;
            }

            LOG_CHANNEL_INFO("http") << "Processing request from " << describe_remote(socket_) << " PDF file: " << request_path;

            extract_and_respond(std::move(request_path), std::move(config));
            break;
        }

        default:
            // We return responses indicating an error if
            // we do not recognize the request method.
            send_bad_response(
                boost::beast::http::status::bad_request,
                "Invalid request-method '" + std::string(req.method_string().data(), req.method_string().size()) + "'\r\n");
            break;
    }
}

void http_worker::extract_and_respond(std::string pdf_path, Outline_Config config) {
    boost::asio::post(extraction_pool_, [this, pdf_path = std::move(pdf_path), config = std::move(config)]() {
        PDF_Outline_Result result = extract_pdf_outline(pdf_path, config);
        nlohmann::ordered_json json_response = outline_to_json(result, config.include_telemetry);
        if (config.group_sections && !result.failed()) {
            json_response["sections"] = sections_to_json(result.sections);
        }
        std::string body = json_response.dump(4, ' ', false, nlohmann::ordered_json::error_handler_t::replace);

        // back on the io_context thread, the socket is only touched from there
        boost::asio::post(acceptor_.get_executor(), [this, body = std::move(body)]() mutable {
            send_response(boost::beast::http::status::ok, "application/json", std::move(body));
        });
    });
}

void http_worker::send_response(
    boost::beast::http::status status,
    std::string const& content_type,
    std::string body) {
    string_response_.emplace();

    string_response_->result(status);
    string_response_->keep_alive(false);
    string_response_->set(boost::beast::http::field::server, "pdf_outline");
    string_response_->set(boost::beast::http::field::content_type, content_type);
    string_response_->body() = std::move(body);
    string_response_->prepare_payload();

    string_serializer_.emplace(*string_response_);

    boost::beast::http::async_write(
        socket_,
        *string_serializer_,
    [this](boost::beast::error_code ec, std::size_t) {
        socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
        string_serializer_.reset();
        string_response_.reset();
        accept();
    });
}

void http_worker::send_bad_response(
    boost::beast::http::status status,
    std::string const& error) {
    LOG_CHANNEL_WARNING("http") << "Rejected request from " << describe_remote(socket_) << ": " << static_cast<unsigned int>(status);
    send_response(status, "text/plain", error);
}

void http_worker::check_deadline() {
    // The deadline may have moved, so check it has really passed.
    if (request_deadline_.expiry() <= std::chrono::steady_clock::now()) {
        // Close socket to cancel any outstanding operation.
        boost::beast::error_code ec;
        socket_.close(ec);

        // Sleep indefinitely until we're given a new deadline.
        request_deadline_.expires_at(
            std::chrono::steady_clock::time_point::max());
    }

    request_deadline_.async_wait(
    [this](boost::beast::error_code) {
        check_deadline();
    });
}

void run_http_server(const std::string& address, unsigned short port, unsigned int num_workers, const Outline_Config& outline_config) {
    auto const listen_address = boost::asio::ip::make_address(address);

    // assume that ioc is accessed from single thread
    boost::asio::io_context ioc{1};
    boost::asio::ip::tcp::acceptor acceptor{ioc, {listen_address, port}};

    std::list<http_worker> workers;
    // declared after the workers: its destructor joins before they go away
    boost::asio::thread_pool extraction_pool(num_workers);
    for (unsigned int i = 0; i < num_workers; ++i) {
        workers.emplace_back(acceptor, extraction_pool, outline_config);
        workers.back().start();
    }

    LOG_CHANNEL_INFO("http") << "Listening on " << address << ":" << port << " with " << num_workers << " worker(s)";
    ioc.run();
}
