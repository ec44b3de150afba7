#include <cassert>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "snapvault/archive.hpp"
#include "snapvault/crypto.hpp"
#include "snapvault/error_codes.hpp"
#include "snapvault/form_data.hpp"
#include "snapvault/protocol.hpp"
#include "snapvault/range.hpp"

using namespace snapvault;

void run_server_component_tests();
void run_client_component_tests();
void run_http_roundtrip_tests();

namespace
{

    void write_file(const std::filesystem::path &path, const std::string &contents)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    }

    std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    template <typename Fn>
    ErrorCode error_of(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const TransferError &ex)
        {
            return ex.code();
        }
        return ErrorCode::Ok;
    }

    void test_crypto()
    {
        const std::vector<std::byte> bytes = {std::byte{0xDE}, std::byte{0xAD}, std::byte{0xBE}, std::byte{0xEF}};
        const auto chunk_hash = crypto::hash_bytes(bytes);
        assert(chunk_hash.size() == 64);
        assert(chunk_hash == crypto::hash_bytes(bytes));

        std::istringstream stream(std::string("\xDE\xAD\xBE\xEF", 4));
        assert(crypto::hash_stream(stream, 3) == chunk_hash);

        const auto file_path = std::filesystem::temp_directory_path() / "snapvault_crypto_test.bin";
        write_file(file_path, std::string("\xDE\xAD\xBE\xEF", 4));
        assert(crypto::hash_file(file_path) == chunk_hash);
        std::filesystem::remove(file_path);

        assert(error_of([&]
                        { (void)crypto::hash_file(file_path); }) == ErrorCode::IOFailure);

        const auto first = crypto::random_identifier();
        const auto second = crypto::random_identifier();
        assert(first.size() == 32);
        assert(first != second);
    }

    void test_range_parsing()
    {
        auto range = range::parse_range_header("bytes=500-");
        assert(range.start == 500u);
        assert(!range.end);

        range = range::parse_range_header("Bytes=0-99");
        assert(range.start == 0u);
        assert(range.end == 99u);

        range = range::parse_range_header("bytes=-500");
        assert(!range.start);
        assert(range.end == 500u);

        assert(error_of([]
                        { (void)range::parse_range_header("items=0-1"); }) == ErrorCode::InvalidRange);
        assert(error_of([]
                        { (void)range::parse_range_header("bytes=0-1,5-6"); }) == ErrorCode::InvalidRange);
        assert(error_of([]
                        { (void)range::parse_range_header("bytes=abc-"); }) == ErrorCode::InvalidRange);
        assert(error_of([]
                        { (void)range::parse_range_header("bytes=12"); }) == ErrorCode::InvalidRange);
    }

    void test_range_resolution()
    {
        auto window = range::resolve(std::nullopt, 1000);
        assert(!window.partial);
        assert(window.start == 0 && window.end == 999 && window.length() == 1000);

        window = range::resolve_header(std::string_view("bytes=500-"), 1000);
        assert(window.partial);
        assert(window.start == 500 && window.end == 999 && window.length() == 500);
        assert(window.content_range() == "bytes 500-999/1000");

        window = range::resolve_header(std::string_view("bytes=900-5000"), 1000);
        assert(window.end == 999);

        window = range::resolve_header(std::string_view("bytes=-500"), 1000);
        assert(window.start == 0 && window.end == 500);

        window = range::resolve(std::nullopt, 0);
        assert(window.length() == 0);

        assert(error_of([]
                        { (void)range::resolve_header(std::string_view("bytes=1000-"), 1000); }) ==
               ErrorCode::RangeNotSatisfiable);
        assert(error_of([]
                        { (void)range::resolve_header(std::string_view("bytes=600-100"), 1000); }) ==
               ErrorCode::RangeNotSatisfiable);
    }

    void test_byte_stream()
    {
        const auto path = std::filesystem::temp_directory_path() / "snapvault_stream_test.bin";
        std::string contents;
        for (int i = 0; i < 1000; ++i)
        {
            contents.push_back(static_cast<char>(i % 251));
        }
        write_file(path, contents);

        const auto window = range::resolve_header(std::string_view("bytes=100-"), contents.size());
        range::ByteStream stream(path, window, 64);
        std::string collected;
        std::vector<char> block;
        std::size_t blocks = 0;
        while (stream.next(block))
        {
            assert(block.size() <= 64);
            collected.append(block.data(), block.size());
            ++blocks;
        }
        assert(stream.done());
        assert(collected == contents.substr(100));
        assert(stream.bytes_sent() == 900);
        assert(blocks == 15);

        // Resumed download: prefix plus remainder equals the whole file.
        const auto head = contents.substr(0, 100);
        assert(head + collected == contents);

        std::filesystem::remove(path);
        assert(error_of([&]
                        { range::ByteStream missing(path, window); }) == ErrorCode::IOFailure);
    }

    void test_form_data()
    {
        const auto boundary = protocol::make_boundary();
        const auto content_type = protocol::form_content_type(boundary);
        assert(protocol::boundary_from_content_type(content_type) == boundary);
        assert(!protocol::boundary_from_content_type("application/json"));

        std::string payload = "PK\x03\x04";
        payload += std::string("\r\n--not-the-boundary\r\n\0binary", 29);
        const std::vector<protocol::FormPart> parts{
            {.name = "backup_file", .filename = "backup.zip", .content_type = "application/zip", .data = payload},
            {.name = "upload_id", .data = "abc-123"},
            {.name = "chunk", .data = "0"},
        };
        const auto body = protocol::encode_form_data(boundary, parts);
        const auto form = protocol::decode_form_data(content_type, body);

        const auto *file = form.find("backup_file");
        assert(file != nullptr);
        assert(file->filename == std::string("backup.zip"));
        assert(file->data == payload);
        assert(form.field("upload_id") == std::string("abc-123"));
        assert(form.field("chunk") == std::string("0"));
        assert(!form.field("total_chunks"));

        assert(error_of([&]
                        { (void)protocol::decode_form_data("text/plain", body); }) == ErrorCode::InvalidRequest);
        assert(error_of([&]
                        { (void)protocol::decode_form_data(content_type, "garbage"); }) == ErrorCode::InvalidRequest);
    }

    void test_protocol_json()
    {
        assert(protocol::format_size(0) == "0 B");
        assert(protocol::format_size(512) == "512.00 B");
        assert(protocol::format_size(1536) == "1.50 KB");
        assert(protocol::format_size(1024ULL * 1024 * 1024) == "1.00 GB");

        protocol::BackupStatus status;
        status.databases.push_back({.path = "database/books_data.db", .exists = true, .size_bytes = 100,
                                    .size_formatted = protocol::format_size(100)});
        status.total_size_bytes = 100;
        status.total_size_formatted = protocol::format_size(100);
        const nlohmann::json json = status;
        assert(json["databases"][0]["path"] == "database/books_data.db");
        assert(json["all_files_exist"] == true);
        const auto decoded = json.get<protocol::BackupStatus>();
        assert(decoded.databases.size() == 1);
        assert(decoded.total_size_bytes == 100);

        protocol::OperationRecord record;
        record.status = protocol::OperationStatus::Failed;
        record.started_at = 1700000000.5;
        record.completed_at = 1700000010.0;
        record.total_chunks = 3;
        record.chunks_received = 2;
        record.error = "Missing chunk 2";
        const nlohmann::json record_json = record;
        assert(record_json["status"] == "failed");
        assert(record_json["type"] == "restore");
        const auto parsed = record_json.get<protocol::OperationRecord>();
        assert(parsed.status == protocol::OperationStatus::Failed);
        assert(parsed.error == std::string("Missing chunk 2"));
        assert(parsed.completed_at.has_value());

        assert(protocol::operation_status_from_string("restoring") == protocol::OperationStatus::Restoring);
        assert(!protocol::operation_status_from_string("paused"));
        assert(protocol::is_terminal(protocol::OperationStatus::Completed));
        assert(!protocol::is_terminal(protocol::OperationStatus::Uploading));

        const auto stamp = protocol::file_stamp();
        assert(stamp.size() == 15);
        assert(stamp[8] == '_');
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::RangeNotSatisfiable) == "range_not_satisfiable");
        assert(to_string(ErrorCode::MissingChunk) == "missing_chunk");
    }

    void test_archive()
    {
        const auto root = std::filesystem::temp_directory_path() / "snapvault_archive_test";
        std::filesystem::remove_all(root);
        const auto data = root / "db" / "books_data.db";
        const auto statics = root / "db" / "books_static.db";
        write_file(data, std::string(100, 'a'));
        write_file(statics, std::string(50, 'b'));

        const auto built = archive::build({data, statics}, root / "out" / "backup.zip");
        assert(std::filesystem::exists(built.path));
        assert(built.size == std::filesystem::file_size(built.path));
        assert(built.checksum == crypto::hash_file(built.path));

        const auto entries = archive::list_entries(built.path);
        assert(entries == (std::set<std::string>{"books_data.db", "books_static.db"}));

        // Unchanged sources give the same bytes.
        const auto again = archive::build({data, statics}, root / "out" / "again.zip");
        assert(again.checksum == built.checksum);

        const std::map<std::string, std::filesystem::path> destinations{
            {"books_data.db", root / "restored" / "books_data.db"},
            {"books_static.db", root / "restored" / "books_static.db"},
        };
        std::filesystem::create_directories(root / "restored");
        const auto written = archive::extract(built.path, {"books_data.db"}, destinations);
        assert(written.size() == 1);
        assert(read_file(root / "restored" / "books_data.db") == std::string(100, 'a'));
        assert(!std::filesystem::exists(root / "restored" / "books_static.db"));

        assert(error_of([&]
                        { (void)archive::build({data, root / "db" / "absent.db"}, root / "out" / "bad.zip"); }) ==
               ErrorCode::SourceMissing);
        assert(!std::filesystem::exists(root / "out" / "bad.zip"));

        const auto corrupt = root / "corrupt.zip";
        write_file(corrupt, "this is not a zip file");
        assert(error_of([&]
                        { (void)archive::list_entries(corrupt); }) == ErrorCode::CorruptArchive);

        std::filesystem::remove_all(root);
    }

} // namespace

int main()
{
    try
    {
        test_crypto();
        test_range_parsing();
        test_range_resolution();
        test_byte_stream();
        test_form_data();
        test_protocol_json();
        test_error_codes();
        test_archive();
        run_server_component_tests();
        run_client_component_tests();
        run_http_roundtrip_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All tests passed\n";
    return 0;
}
