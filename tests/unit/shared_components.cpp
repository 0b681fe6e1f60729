#include <cassert>
#include <cctype>
#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "filegate/crypto.hpp"
#include "filegate/error_codes.hpp"
#include "filegate/http.hpp"
#include "filegate/mime_types.hpp"
#include "filegate/multipart.hpp"
#include "filegate/protocol.hpp"
#include "filegate/version.hpp"

using namespace filegate;

void run_server_component_tests();

namespace
{

    void test_error_codes()
    {
        assert(http_status(ErrorCode::Ok) == 200);
        assert(http_status(ErrorCode::BadRequest) == 400);
        assert(http_status(ErrorCode::Unauthorized) == 401);
        assert(http_status(ErrorCode::Forbidden) == 403);
        assert(http_status(ErrorCode::NotFound) == 404);
        assert(http_status(ErrorCode::MethodNotAllowed) == 405);
        assert(http_status(ErrorCode::Conflict) == 409);
        assert(http_status(ErrorCode::PayloadTooLarge) == 413);
        assert(http_status(ErrorCode::Internal) == 500);

        assert(to_string(ErrorCode::Ok) == "ok");
        assert(to_string(ErrorCode::Internal) == "internal_error");
        static_assert(is_ok(ErrorCode::Ok));
        static_assert(!is_ok(ErrorCode::Conflict));
        assert(!version().empty());
    }

    void test_crypto()
    {
        const auto token = crypto::random_token();
        assert(token.size() == 64);
        for (const char ch : token)
        {
            assert(std::isxdigit(static_cast<unsigned char>(ch)));
        }
        assert(crypto::random_token() != token);
        assert(crypto::random_token(4).size() == 8);

        bool rejected = false;
        try
        {
            (void)crypto::random_token(0);
        }
        catch (const std::invalid_argument &)
        {
            rejected = true;
        }
        assert(rejected);

        const auto hash = crypto::hash_password("hunter2");
        assert(hash != "hunter2");
        assert(crypto::verify_password("hunter2", hash));
        assert(!crypto::verify_password("hunter3", hash));
    }

    void test_http_request_parsing()
    {
        const std::string head = "POST /api/files/list?path=docs%2Freports&flag=a+b HTTP/1.1\r\n"
                                 "Host: localhost\r\n"
                                 "Content-Length: 12\r\n"
                                 "Authorization: Bearer abc123\r\n"
                                 "\r\n";
        const auto request = http::parse_request_head(head);
        assert(request);
        assert(request->method == "POST");
        assert(request->path == "/api/files/list");
        assert(request->version == "HTTP/1.1");
        assert(request->query_param("path") == std::optional<std::string>("docs/reports"));
        assert(request->query_param("flag") == std::optional<std::string>("a+b"));
        assert(!request->query_param("missing"));
        assert(request->header("content-length") == std::optional<std::string>("12"));
        assert(request->header("CONTENT-LENGTH") == std::optional<std::string>("12"));
        assert(http::content_length(*request) == std::optional<std::uint64_t>(12));
        assert(http::bearer_token(*request) == std::optional<std::string>("abc123"));

        const auto lf_only = http::parse_request_head("GET /%20space HTTP/1.0\nX-Test: yes\n\n");
        assert(lf_only);
        assert(lf_only->path == "/ space");
        assert(lf_only->header("x-test") == std::optional<std::string>("yes"));
        assert(http::content_length(*lf_only) == std::optional<std::uint64_t>(0));
        assert(!http::bearer_token(*lf_only));
    }

    void test_http_rejects_malformed_heads()
    {
        assert(!http::parse_request_head(""));
        assert(!http::parse_request_head("GET\r\n\r\n"));
        assert(!http::parse_request_head("GET / SPDY/3\r\n\r\n"));
        assert(!http::parse_request_head("GET relative HTTP/1.1\r\n\r\n"));
        assert(!http::parse_request_head("G(T / HTTP/1.1\r\n\r\n"));
        assert(!http::parse_request_head("GET / HTTP/1.1\r\nNoColon\r\n\r\n"));
        assert(!http::parse_request_head("GET / HTTP/1.1\r\nX-A: 1\r\n continued\r\n\r\n"));

        const auto bad_length = http::parse_request_head("POST / HTTP/1.1\r\nContent-Length: 12x\r\n\r\n");
        assert(bad_length);
        assert(!http::content_length(*bad_length));

        const auto basic_auth = http::parse_request_head("GET / HTTP/1.1\r\nAuthorization: Basic Zm9v\r\n\r\n");
        assert(basic_auth);
        assert(!http::bearer_token(*basic_auth));
    }

    void test_http_helpers()
    {
        assert(http::url_decode("a%2Fb%2fc") == "a/b/c");
        assert(http::url_decode("100%") == "100%");
        assert(http::url_decode("%zz") == "%zz");
        assert(http::url_decode("a+b") == "a+b");

        const auto query = http::parse_query("path=%2F&isDir=true&novalue");
        assert(query.size() == 2);
        assert(query.at("path") == "/");
        assert(query.at("isDir") == "true");

        assert(http::reason_phrase(404) == "Not Found");
        assert(http::reason_phrase(100) == "Continue");

        http::Response response;
        response.status = 409;
        response.set_header("Content-Type", "application/json");
        response.set_header("content-type", "text/plain");
        assert(response.headers.size() == 1);
        assert(response.header("CONTENT-TYPE") == std::optional<std::string>("text/plain"));

        const auto head = http::serialize_head(response, 5);
        assert(head.starts_with("HTTP/1.1 409 Conflict\r\n"));
        assert(head.find("Content-Length: 5\r\n") != std::string::npos);
        assert(head.find("Connection: close\r\n") != std::string::npos);
        assert(head.ends_with("\r\n\r\n"));
    }

    void test_multipart_parsing()
    {
        const std::string body = "--XyZ\r\n"
                                 "Content-Disposition: form-data; name=\"file\"; filename=\"notes.txt\"\r\n"
                                 "Content-Type: text/plain\r\n"
                                 "\r\n"
                                 "line one\r\nline two\r\n"
                                 "--XyZ--\r\n";
        const auto file = multipart::parse_multipart("multipart/form-data; boundary=XyZ", body);
        assert(file);
        assert(file->filename == "notes.txt");
        assert(file->content == "line one\r\nline two");

        const auto quoted = multipart::parse_multipart("Multipart/Form-Data; BOUNDARY=\"XyZ\"", body);
        assert(quoted);
        assert(quoted->filename == "notes.txt");

        assert(multipart::extract_boundary("multipart/form-data; charset=utf-8; boundary=abc") ==
               std::optional<std::string>("abc"));
        assert(!multipart::extract_boundary("multipart/form-data"));
        assert(!multipart::extract_boundary("multipart/form-data; boundary=\"\""));
    }

    void test_multipart_edge_cases()
    {
        std::string binary("\x00\x01\r\n\xff--X", 8);
        const std::string body = "--B\r\nContent-Disposition: form-data; name=\"f\"; filename=\"blob.bin\"\r\n\r\n" +
                                 binary + "\r\n--B--\r\n";
        const auto file = multipart::parse_multipart("multipart/form-data; boundary=B", body);
        assert(file);
        assert(file->content == binary);

        // No trailing CRLF before the closing delimiter: nothing to trim.
        const std::string tight = "--B\r\nContent-Disposition: form-data; filename=\"a\"\r\n\r\nabc--B--";
        const auto tight_file = multipart::parse_multipart("multipart/form-data; boundary=B", tight);
        assert(tight_file);
        assert(tight_file->content == "abc");

        const std::string unnamed = "--B\r\nContent-Disposition: form-data; name=\"file\"\r\n\r\nabc\r\n--B--\r\n";
        assert(!multipart::parse_multipart("multipart/form-data; boundary=B", unnamed));

        const std::string empty_name = "--B\r\nContent-Disposition: form-data; filename=\"\"\r\n\r\nabc\r\n--B--\r\n";
        assert(!multipart::parse_multipart("multipart/form-data; boundary=B", empty_name));

        assert(!multipart::parse_multipart("multipart/form-data", body));
        assert(!multipart::parse_multipart("multipart/form-data; boundary=Other", body));

        const std::string unterminated = "--B\r\nContent-Disposition: form-data; filename=\"a\"\r\n\r\nabc";
        assert(!multipart::parse_multipart("multipart/form-data; boundary=B", unterminated));
    }

    void test_mime_types()
    {
        assert(mime_type_for("photo.PNG") == "image/png");
        assert(mime_type_for("dir/report.pdf") == "application/pdf");
        assert(mime_type_for("archive.tar.gz") == "application/gzip");
        assert(mime_type_for("README") == "application/octet-stream");
        assert(mime_type_for("data.unknown") == "application/octet-stream");
    }

    void test_protocol_bodies()
    {
        const auto login = nlohmann::json::parse(R"({"Username":"alice","Password":"pw"})").get<protocol::LoginRequest>();
        assert(login.username == "alice");
        assert(login.password == "pw");

        bool rejected = false;
        try
        {
            (void)nlohmann::json::parse(R"({"username":"alice"})").get<protocol::LoginRequest>();
        }
        catch (const protocol::ProtocolError &ex)
        {
            rejected = std::string(ex.what()) == "Invalid request format";
        }
        assert(rejected);

        const nlohmann::json reply = protocol::LoginResponse{"tok", "alice"};
        assert(reply.at("success") == true);
        assert(reply.at("token") == "tok");

        const protocol::FileItem item{"a.txt", false, 42, 1700000000};
        const nlohmann::json item_json = item;
        assert(item_json.at("isDirectory") == false);
        assert(item_json.at("lastModified") == 1700000000);
        const auto decoded = item_json.get<protocol::FileItem>();
        assert(decoded.name == "a.txt" && decoded.size == 42);

        const auto create = nlohmann::json::parse(R"({"path":"docs","isDirectory":"true"})").get<protocol::CreateRequest>();
        assert(create.path == "docs" && create.is_directory);
        const auto create_file = nlohmann::json::parse(R"({"path":"a.txt"})").get<protocol::CreateRequest>();
        assert(!create_file.is_directory);

        rejected = false;
        try
        {
            (void)nlohmann::json::parse(R"({"path":"a","newName":"b"})").get<protocol::RenameRequest>();
        }
        catch (const protocol::ProtocolError &ex)
        {
            rejected = std::string(ex.what()) == "Path, newName, and isDirectory are required.";
        }
        assert(rejected);

        const auto rename = nlohmann::json::parse(R"({"path":"a","newName":"b","isDirectory":0})").get<protocol::RenameRequest>();
        assert(rename.new_name == "b" && !rename.is_directory);

        assert(protocol::parse_flag("TRUE") == std::optional<bool>(true));
        assert(protocol::parse_flag("0") == std::optional<bool>(false));
        assert(!protocol::parse_flag("yes"));
    }

} // namespace

int main()
{
    try
    {
        test_error_codes();
        test_crypto();
        test_http_request_parsing();
        test_http_rejects_malformed_heads();
        test_http_helpers();
        test_multipart_parsing();
        test_multipart_edge_cases();
        test_mime_types();
        test_protocol_bodies();
        run_server_component_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
