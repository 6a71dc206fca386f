//
// Reading and writing single chunks through iostreams
//

#include <doctest/doctest.h>
#include <pngchunk/chunk_stream.hh>
#include <pngchunk/exceptions.hh>

#include <sstream>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <utility>
#include <vector>

#include "test_utils.hh"

using namespace pngchunk;

namespace {
    // Serves the first fail_after bytes of data, then reports a device error
    class failing_streambuf : public std::streambuf {
    public:
        failing_streambuf(const std::string& data, std::size_t fail_after)
            : m_data(data)
            , m_fail_after(fail_after) {
            setg(nullptr, nullptr, nullptr);
        }

    protected:
        int_type underflow() override {
            if (m_pos >= m_fail_after) {
                throw std::runtime_error("simulated device error");
            }
            if (m_pos >= m_data.size()) {
                return traits_type::eof();
            }
            m_buffer = m_data[m_pos++];
            setg(&m_buffer, &m_buffer, &m_buffer + 1);
            return traits_type::to_int_type(m_buffer);
        }

    private:
        std::string m_data;
        std::size_t m_fail_after;
        std::size_t m_pos = 0;
        char m_buffer = 0;
    };

    // Accepts nothing
    class full_streambuf : public std::streambuf {
    protected:
        int_type overflow(int_type) override {
            return traits_type::eof();
        }
    };

    std::string serialized(const chunk& c) {
        return as_string(c.serialize());
    }
}

TEST_SUITE("CHUNK_STREAM") {
    TEST_CASE("write then read") {
        std::stringstream stream;
        auto original = make_chunk("RuSt", secret_message);
        write_chunk(stream, original);
        CHECK(stream.str() == as_string(secret_frame()));

        auto c = read_chunk(stream);
        REQUIRE(c.has_value());
        CHECK(*c == original);
        CHECK(c->data_as_text().value() == secret_message);
    }

    TEST_CASE("consecutive chunks") {
        std::stringstream stream;
        write_chunk(stream, make_chunk("IHDR", std::string(13, '\x01')));
        write_chunk(stream, make_chunk("tEXt", std::string("Title\0Test", 10)));
        write_chunk(stream, make_chunk("IEND", ""));

        std::vector<std::string> types;
        for (int i = 0; i < 3; i++) {
            auto c = read_chunk(stream);
            REQUIRE(c.has_value());
            types.push_back(c->type().to_string());
        }
        const std::vector<std::string> expected = {"IHDR", "tEXt", "IEND"};
        CHECK(types == expected);

        // Nothing left
        auto end = read_chunk(stream);
        REQUIRE(end.failed_with<too_short>());
        CHECK(std::get<too_short>(end.error()).available == 0);
    }

    TEST_CASE("length field is read big-endian") {
        std::stringstream stream;
        auto original = make_chunk("IDAT", std::string(300, 'z'));
        write_chunk(stream, original);

        auto c = read_chunk(stream);
        REQUIRE(c.has_value());
        CHECK(c->length() == 300);
        CHECK(*c == original);
    }

    TEST_CASE("short and malformed input") {
        SUBCASE("header cut short") {
            std::istringstream stream(as_string(secret_frame()).substr(0, 6));
            auto c = read_chunk(stream);
            REQUIRE(c.failed_with<too_short>());
            CHECK(std::get<too_short>(c.error()).available == 6);
        }

        SUBCASE("length field cut short") {
            std::istringstream stream(std::string("\0\0", 2));
            auto c = read_chunk(stream);
            REQUIRE(c.failed_with<too_short>());
            CHECK(std::get<too_short>(c.error()).available == 2);
        }

        SUBCASE("payload cut short") {
            std::istringstream stream(as_string(secret_frame()).substr(0, 40));
            auto c = read_chunk(stream);
            REQUIRE(c.failed_with<truncated>());
            CHECK(std::get<truncated>(c.error()).declared == 42);
            CHECK(std::get<truncated>(c.error()).available == 32);
        }

        SUBCASE("bad type") {
            std::istringstream stream(as_string(frame(5, "a1b2", "hello", 0)));
            CHECK(read_chunk(stream).failed_with<not_alphabetic>());
        }

        SUBCASE("bad checksum") {
            std::istringstream stream(as_string(frame(42, "RuSt", secret_message, secret_crc_type_first)));
            CHECK(read_chunk(stream).failed_with<checksum_mismatch>());
        }

        SUBCASE("forged length is refused before reading the payload") {
            std::istringstream stream(as_string(frame(0x7FFFFFFFu, "IDAT", "", 0)));
            parse_options opts;
            opts.max_chunk_size = 1024 * 1024;
            auto c = read_chunk(stream, opts);
            REQUIRE(c.failed_with<size_limit>());
            CHECK(std::get<size_limit>(c.error()).declared == 0x7FFFFFFFu);
        }

        SUBCASE("forged length without a limit") {
            // Only the bytes actually present are buffered
            std::istringstream stream(as_string(frame(0xFFFFFFF0u, "IDAT", "abc", 0)));
            auto c = read_chunk(stream);
            REQUIRE(c.failed_with<truncated>());
            CHECK(std::get<truncated>(c.error()).available == 7);
        }
    }

    TEST_CASE("warning offsets are stream positions") {
        const std::string signature = "\x89PNG\r\n\x1a\n";
        std::istringstream stream(signature + serialized(make_chunk("Rust", "x")));
        stream.seekg(static_cast<std::streamoff>(signature.size()));

        std::vector<std::pair<std::uint64_t, std::string>> warnings;
        parse_options opts;
        opts.on_warning = [&warnings](std::uint64_t offset, std::string_view category, std::string_view) {
            warnings.emplace_back(offset, std::string(category));
        };

        auto c = read_chunk(stream, opts);
        REQUIRE(c.has_value());
        REQUIRE(warnings.size() == 1);
        CHECK(warnings[0].first == 12);
        CHECK(warnings[0].second == "reserved_bit");
    }

    TEST_CASE("stream failures") {
        SUBCASE("reading from a stream in a bad state") {
            std::istringstream stream(as_string(secret_frame()));
            stream.setstate(std::ios::badbit);
            CHECK_THROWS_AS(read_chunk(stream), io_error);
        }

        SUBCASE("device error while reading the payload") {
            failing_streambuf buf(as_string(secret_frame()), 20);
            std::istream stream(&buf);
            try {
                (void)read_chunk(stream);
                FAIL("Should have thrown exception");
            } catch (const io_error& e) {
                std::string msg = e.what();
                CHECK(msg.find("read failed") != std::string::npos);
                INFO("Error message: " << msg);
            }
        }

        SUBCASE("writing to a stream in a bad state") {
            std::ostringstream stream;
            stream.setstate(std::ios::failbit);
            CHECK_THROWS_AS(write_chunk(stream, make_chunk("IEND", "")), io_error);
        }

        SUBCASE("writing to a full device") {
            full_streambuf buf;
            std::ostream stream(&buf);
            try {
                write_chunk(stream, make_chunk("IEND", ""));
                FAIL("Should have thrown exception");
            } catch (const io_error& e) {
                std::string msg = e.what();
                CHECK(msg.find("IEND") != std::string::npos);
                CHECK(msg.find("12 bytes") != std::string::npos);
            }
        }
    }
}
