#include "MockUploadServer.hpp"
#include <iostream>
#include <sstream>
#include <cctype>

namespace asio = boost::asio;
using asio::ip::tcp;

namespace uppy {
namespace test {

namespace {

void trim(std::string& s) {
    size_t a = 0, b = s.size();
    while (a < b && (s[a] == ' ' || s[a] == '\t')) ++a;
    while (b > a && (s[b - 1] == ' ' || s[b - 1] == '\t' || s[b - 1] == '\r' || s[b - 1] == '\n')) --b;
    s = s.substr(a, b - a);
}

const char* statusText(int s) {
    switch (s) {
        case 200: return "OK";
        case 201: return "Created";
        case 302: return "Found";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 404: return "Not Found";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default:  return "Status";
    }
}

}

MockUploadServer::MockUploadServer(int status, const std::string& responseBody,
                                   const std::vector<std::string>& extraHeaders)
    : acceptor_(io_context_, tcp::endpoint(asio::ip::address_v4::loopback(), 0)),
      status_(status), responseBody_(responseBody), extraHeaders_(extraHeaders)
{
    port_ = acceptor_.local_endpoint().port();
    worker_ = std::thread([this] { serveOne(); });
}

MockUploadServer::~MockUploadServer()
{
    finish();
}

RecordedRequest MockUploadServer::takeRequest()
{
    finish();
    return recorded_;
}

void MockUploadServer::finish()
{
    if (!worker_.joinable()) return;

    // Nobody connected: poke the acceptor so the worker can leave accept()
    if (!accepted_) {
        try {
            asio::io_context ctx;
            tcp::socket poke(ctx);
            poke.connect(tcp::endpoint(asio::ip::address_v4::loopback(), port_));
        } catch (const boost::system::system_error& e) {
            std::cerr << "MockUploadServer: wake-up connect failed: " << e.what() << std::endl;
        }
    }
    worker_.join();
}

uint16_t MockUploadServer::closedPort()
{
    asio::io_context ctx;
    tcp::acceptor scratch(ctx, tcp::endpoint(asio::ip::address_v4::loopback(), 0));
    uint16_t port = scratch.local_endpoint().port();
    scratch.close();
    return port;
}

void MockUploadServer::serveOne()
{
    try {
        tcp::socket socket(io_context_);
        acceptor_.accept(socket);
        accepted_ = true;

        asio::streambuf buf;
        asio::read_until(socket, buf, "\r\n\r\n");
        std::istream request_stream(&buf);

        std::string version;
        request_stream >> recorded_.method >> recorded_.path >> version;

        std::string dummy;
        std::getline(request_stream, dummy);

        std::string header_line;
        size_t content_length = 0;
        while (std::getline(request_stream, header_line) && header_line != "\r")
        {
            if (!header_line.empty() && header_line.back() == '\r') header_line.pop_back();
            if (header_line.empty()) break;

            auto colon = header_line.find(':');
            if (colon == std::string::npos) continue;

            std::string name = header_line.substr(0, colon);
            std::string value = header_line.substr(colon + 1);
            trim(name); trim(value);
            for (char& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

            if (name == "content-length") {
                content_length = static_cast<size_t>(std::stoull(value));
            }
            recorded_.headers[name] = value;
        }

        if (recorded_.header("expect") == "100-continue") {
            asio::write(socket, asio::buffer(std::string("HTTP/1.1 100 Continue\r\n\r\n")));
        }

        std::string body(std::istreambuf_iterator<char>(request_stream), {});
        if (body.size() < content_length) {
            std::string rest;
            rest.resize(content_length - body.size());
            asio::read(socket, asio::buffer(&rest[0], rest.size()));
            body += rest;
        }
        recorded_.body = body;

        std::ostringstream response;
        response << "HTTP/1.1 " << status_ << " " << statusText(status_) << "\r\n";
        response << "Content-Length: " << responseBody_.size() << "\r\n";
        response << "Content-Type: application/json\r\n";
        for (const auto& line : extraHeaders_) {
            response << line << "\r\n";
        }
        response << "Connection: close\r\n\r\n";
        response << responseBody_;

        asio::write(socket, asio::buffer(response.str()));
        socket.close();
    } catch (const std::exception& e) {
        // Expected after a wake-up connect that sends nothing
        if (accepted_ && !recorded_.method.empty()) {
            std::cerr << "MockUploadServer: " << e.what() << std::endl;
        }
    }
}

} // namespace test
} // namespace uppy
