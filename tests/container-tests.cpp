#include <pico/container.hpp>
#include "boost-unit-test.hpp"

#include <filesystem>
#include <string_view>
#include <vector>

#include <pico/crypt.hpp>
#include <pico/utils/binary_codec.hpp>

#include "test-utils.hpp"

using namespace std::string_view_literals;
using pico_tests::bytes;

namespace
{

auto const default_key = bytes({0x55, 0x21, 0xE4, 0x9A});

void write_raw(pico::llfio::file_handle &file,
               std::uint64_t offset,
               std::vector<std::byte> const &data)
{
    pico::llfio::file_handle::const_buffer_type buffers[]
            = {{data.data(), data.size()}};
    file.write({buffers, offset}).value();
}

auto read_raw(pico::llfio::file_handle &file,
              std::uint64_t offset,
              std::size_t size) -> std::vector<std::byte>
{
    std::vector<std::byte> data(size);
    pico::llfio::file_handle::buffer_type buffers[]
            = {{data.data(), data.size()}};
    auto readRx = file.read({buffers, offset});
    data.resize(readRx.bytes_transferred());
    return data;
}

auto craft_header(std::uint16_t magic,
                  std::uint16_t major,
                  std::uint32_t offset,
                  std::uint16_t keyLength,
                  std::size_t numKeyBytes) -> std::vector<std::byte>
{
    std::vector<std::byte> header(pico::header_fixed_size + numKeyBytes,
                                  std::byte{0x01});
    pico::utils::binary_codec<> codec{pico::rw_dynblob(header)};
    codec.write(magic, pico::magic_position);
    codec.write(major, pico::major_position);
    codec.write(std::uint16_t{0}, pico::minor_position);
    codec.write(offset, pico::offset_position);
    codec.write(keyLength, pico::key_length_position);
    return header;
}

auto to_vector(pico::content_digest const &digest) -> std::vector<std::byte>
{
    return std::vector<std::byte>(digest.begin(), digest.end());
}

} // namespace

struct container_test_fixture
{
    pico::llfio::file_handle testFile;

    container_test_fixture()
        : testFile(pico::llfio::temp_inode().value())
    {
    }

    auto create(std::uint32_t metadataLength,
                pico::crypto::crypto_provider *provider
                = pico::crypto::openssl_md5_crypto_provider())
            -> pico::container
    {
        return pico::container::create(testFile.reopen().value(),
                                       default_key, metadataLength, provider)
                .value();
    }
    auto reopen(pico::crypto::crypto_provider *provider
                = pico::crypto::openssl_md5_crypto_provider())
            -> pico::result<pico::container>
    {
        return pico::container::open(testFile.reopen().value(), provider);
    }
};

BOOST_FIXTURE_TEST_SUITE(container_tests, container_test_fixture)

BOOST_AUTO_TEST_CASE(create_computes_the_layout)
{
    auto subject = create(10);

    BOOST_TEST(subject.version() == pico::supported_version);
    BOOST_TEST(subject.offset() == 42U);
    BOOST_TEST(subject.metadata_start() == 32U);
    BOOST_TEST(subject.metadata_length() == 10U);
    BOOST_TEST((subject.hash_state() == pico::content_hash::state::invalid));
    BOOST_TEST(std::vector<std::byte>(subject.key().begin(), subject.key().end())
                       == default_key,
               boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(create_writes_the_header_immediately)
{
    auto subject = create(10);

    auto const header = read_raw(testFile, 0, 32);
    auto const expected = bytes({0x91, 0xC0, 0x00, 0x01, 0x00, 0x00, 0x00,
                                 0x00, 0x00, 0x2A});
    BOOST_TEST(std::vector<std::byte>(header.begin(), header.begin() + 10)
                       == expected,
               boost::test_tools::per_element());
    BOOST_TEST(std::vector<std::byte>(header.begin() + 28, header.end())
                       == default_key,
               boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(create_rejects_invalid_keys)
{
    auto emptyRx = pico::container::create(testFile.reopen().value(),
                                           pico::ro_dynblob{}, 0);
    BOOST_TEST_REQUIRE(emptyRx.has_error());
    BOOST_TEST(emptyRx.assume_error() == pico::pico_errc::key_error);

    std::vector<std::byte> const oversizedKey(pico::max_key_size + 1);
    auto oversizedRx = pico::container::create(testFile.reopen().value(),
                                               oversizedKey, 0);
    BOOST_TEST_REQUIRE(oversizedRx.has_error());
    BOOST_TEST(oversizedRx.assume_error() == pico::pico_errc::key_error);
}

BOOST_AUTO_TEST_CASE(create_rejects_offsets_beyond_32_bits)
{
    auto rx = pico::container::create(testFile.reopen().value(), default_key,
                                      0xFFFF'FFF0U);
    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(rx.assume_error() == pico::pico_errc::bad_offset);
}

BOOST_AUTO_TEST_CASE(metadata_round_trip)
{
    auto subject = create(10);
    auto const martindale = pico::as_ro_blob("Martindale"sv);

    auto putRx = subject.put_metadata(0, martindale);
    TEST_RESULT_REQUIRE(putRx);
    BOOST_TEST(putRx.assume_value() == 10U);

    std::vector<std::byte> buffer(10);
    auto getRx = subject.get_metadata(0, buffer);
    TEST_RESULT_REQUIRE(getRx);
    BOOST_TEST(getRx.assume_value() == 10U);
    BOOST_TEST(buffer == std::vector<std::byte>(martindale.begin(),
                                                martindale.end()),
               boost::test_tools::per_element());

    std::vector<std::byte> tail(10);
    auto tailRx = subject.get_metadata(5, tail);
    TEST_RESULT_REQUIRE(tailRx);
    BOOST_TEST(tailRx.assume_value() == 5U);
    auto const ndale = pico::as_ro_blob("ndale"sv);
    BOOST_TEST(std::vector<std::byte>(tail.begin(), tail.begin() + 5)
                       == std::vector<std::byte>(ndale.begin(), ndale.end()),
               boost::test_tools::per_element());
    BOOST_TEST(std::vector<std::byte>(tail.begin() + 5, tail.end())
                       == std::vector<std::byte>(5),
               boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(metadata_writes_are_clamped)
{
    auto subject = create(10);
    auto const payload = bytes({1, 2, 3, 4, 5});

    auto clampedRx = subject.put_metadata(8, payload);
    TEST_RESULT_REQUIRE(clampedRx);
    BOOST_TEST(clampedRx.assume_value() == 2U);

    auto pastEndRx = subject.put_metadata(10, payload);
    TEST_RESULT_REQUIRE(pastEndRx);
    BOOST_TEST(pastEndRx.assume_value() == 0U);

    std::vector<std::byte> buffer(10);
    auto getRx = subject.get_metadata(0, buffer);
    TEST_RESULT_REQUIRE(getRx);
    BOOST_TEST(getRx.assume_value() == 10U);
    auto const expected = bytes({0, 0, 0, 0, 0, 0, 0, 0, 1, 2});
    BOOST_TEST(buffer == expected, boost::test_tools::per_element());

    auto pastEndReadRx = subject.get_metadata(10, buffer);
    TEST_RESULT_REQUIRE(pastEndReadRx);
    BOOST_TEST(pastEndReadRx.assume_value() == 0U);
}

BOOST_AUTO_TEST_CASE(metadata_is_empty_without_reservation)
{
    auto subject = create(0);
    auto const payload = bytes({1, 2, 3});
    std::vector<std::byte> buffer(3);

    auto putRx = subject.put_metadata(0, payload);
    TEST_RESULT_REQUIRE(putRx);
    BOOST_TEST(putRx.assume_value() == 0U);
    auto getRx = subject.get_metadata(0, buffer);
    TEST_RESULT_REQUIRE(getRx);
    BOOST_TEST(getRx.assume_value() == 0U);
}

BOOST_AUTO_TEST_CASE(metadata_is_neither_encrypted_nor_hashed)
{
    auto subject = create(10);
    TEST_RESULT_REQUIRE(subject.flush());

    TEST_RESULT_REQUIRE(
            subject.put_metadata(0, pico::as_ro_blob("Martindale"sv)));

    BOOST_TEST((subject.hash_state() == pico::content_hash::state::valid));
    auto const raw = read_raw(testFile, 32, 10);
    auto const martindale = pico::as_ro_blob("Martindale"sv);
    BOOST_TEST(raw == std::vector<std::byte>(martindale.begin(),
                                             martindale.end()),
               boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(flush_of_empty_data_stores_md5_of_nothing)
{
    auto subject = create(10);

    TEST_RESULT_REQUIRE(subject.flush());

    BOOST_TEST((subject.hash_state() == pico::content_hash::state::valid));
    BOOST_TEST(to_vector(subject.hash()) == pico_tests::empty_md5,
               boost::test_tools::per_element());
    auto const raw = read_raw(testFile, pico::hash_position, pico::digest_size);
    BOOST_TEST(raw == pico_tests::empty_md5, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(data_round_trip)
{
    auto subject = create(3);
    std::vector<std::byte> original(2 * pico::chunk_size + 123);
    for (std::size_t i = 0; i < original.size(); ++i)
    {
        original[i] = static_cast<std::byte>(i % 251);
    }

    auto written = original;
    auto putRx = subject.put(0, written);
    TEST_RESULT_REQUIRE(putRx);
    BOOST_TEST(putRx.assume_value() == original.size());

    std::vector<std::byte> readBack(original.size());
    auto getRx = subject.get(0, readBack);
    TEST_RESULT_REQUIRE(getRx);
    BOOST_TEST(getRx.assume_value() == original.size());
    BOOST_TEST(readBack == original, boost::test_tools::per_element());

    std::vector<std::byte> middle(10);
    auto middleRx = subject.get(4097, middle);
    TEST_RESULT_REQUIRE(middleRx);
    BOOST_TEST(middleRx.assume_value() == 10U);
    BOOST_TEST(middle
                       == std::vector<std::byte>(original.begin() + 4097,
                                                 original.begin() + 4107),
               boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(data_is_stored_encrypted)
{
    auto subject = create(0);
    auto data = bytes({0x09, 0x20, 0x00, 0xE0, 0x11});
    auto const plain = data;

    TEST_RESULT_REQUIRE(subject.put(0, data));

    auto raw = read_raw(testFile, subject.offset(), plain.size());
    BOOST_TEST(raw == data, boost::test_tools::per_element());
    pico::crypt(0, raw, default_key);
    BOOST_TEST(raw == plain, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(keystream_is_keyed_by_the_data_position)
{
    // offset 33 isn't a multiple of the key length
    auto subject = create(1);
    BOOST_TEST_REQUIRE(subject.offset() == 33U);

    auto head = bytes({0x00, 0x00, 0x00, 0x00, 0x00});
    TEST_RESULT_REQUIRE(subject.put(0, head));
    auto tail = bytes({0x00, 0x00, 0x00});
    TEST_RESULT_REQUIRE(subject.put(6, tail));

    BOOST_TEST(read_raw(testFile, 33, 5)
                       == bytes({0x55, 0x21, 0xE4, 0x9A, 0x55}),
               boost::test_tools::per_element());
    BOOST_TEST(read_raw(testFile, 39, 3) == bytes({0xE4, 0x9A, 0x55}),
               boost::test_tools::per_element());

    auto plain = bytes({0x09, 0x20, 0x00, 0xE0});
    auto expected = plain;
    pico::crypt(3, expected, default_key);
    TEST_RESULT_REQUIRE(subject.put(3, plain));
    BOOST_TEST(read_raw(testFile, 36, 4) == expected,
               boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(get_keeps_the_hash_valid)
{
    auto subject = create(0);
    auto data = bytes({'a', 'b', 'c'});
    TEST_RESULT_REQUIRE(subject.put(0, data));
    TEST_RESULT_REQUIRE(subject.flush());
    BOOST_TEST_REQUIRE(
            (subject.hash_state() == pico::content_hash::state::valid));

    std::vector<std::byte> buffer(8);
    auto getRx = subject.get(1, buffer);
    TEST_RESULT_REQUIRE(getRx);
    BOOST_TEST(getRx.assume_value() == 2U);
    BOOST_TEST((subject.hash_state() == pico::content_hash::state::valid));
}

BOOST_AUTO_TEST_CASE(reads_stop_at_the_end_of_data)
{
    auto subject = create(10);
    auto data = bytes({1, 2, 3, 4, 5, 6});
    TEST_RESULT_REQUIRE(subject.put(0, data));

    std::vector<std::byte> buffer(16);
    auto partialRx = subject.get(4, buffer);
    TEST_RESULT_REQUIRE(partialRx);
    BOOST_TEST(partialRx.assume_value() == 2U);
    BOOST_TEST(buffer[0] == std::byte{5});
    BOOST_TEST(buffer[1] == std::byte{6});

    auto endRx = subject.get(6, buffer);
    TEST_RESULT_REQUIRE(endRx);
    BOOST_TEST(endRx.assume_value() == 0U);
}

BOOST_AUTO_TEST_CASE(put_invalidates_the_hash)
{
    auto subject = create(0);
    TEST_RESULT_REQUIRE(subject.flush());
    BOOST_TEST_REQUIRE(
            (subject.hash_state() == pico::content_hash::state::valid));

    auto data = bytes({'a', 'b', 'c'});
    TEST_RESULT_REQUIRE(subject.put(0, data));
    BOOST_TEST((subject.hash_state() == pico::content_hash::state::invalid));

    TEST_RESULT_REQUIRE(subject.flush());
    BOOST_TEST((subject.hash_state() == pico::content_hash::state::valid));
    auto const abcMd5 = bytes({0x90, 0x01, 0x50, 0x98, 0x3C, 0xD2, 0x4F, 0xB0,
                               0xD6, 0x96, 0x3F, 0x7D, 0x28, 0xE1, 0x7F, 0x72});
    BOOST_TEST(to_vector(subject.hash()) == abcMd5,
               boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(flush_only_recomputes_after_mutation)
{
    pico_tests::counting_crypto_provider provider;
    auto subject = create(0, &provider);
    auto data = bytes({1, 2, 3});

    TEST_RESULT_REQUIRE(subject.put(0, data));
    TEST_RESULT_REQUIRE(subject.flush());
    TEST_RESULT_REQUIRE(subject.flush());
    BOOST_TEST(provider.digests_created == 1);

    TEST_RESULT_REQUIRE(subject.put(1, data));
    TEST_RESULT_REQUIRE(subject.flush());
    BOOST_TEST(provider.digests_created == 2);
}

BOOST_AUTO_TEST_CASE(hash_is_stable_across_reopen)
{
    pico::content_digest hashBefore{};
    {
        auto subject = create(4);
        auto data = bytes({0xDE, 0xAD, 0xBE, 0xEF});
        TEST_RESULT_REQUIRE(subject.put(0, data));
        TEST_RESULT_REQUIRE(subject.flush());
        hashBefore = subject.hash();
    }

    pico_tests::counting_crypto_provider provider;
    auto reopenRx = reopen(&provider);
    TEST_RESULT_REQUIRE(reopenRx);
    auto subject = std::move(reopenRx).assume_value();

    BOOST_TEST((subject.hash_state() == pico::content_hash::state::valid));
    BOOST_TEST(to_vector(subject.hash()) == to_vector(hashBefore),
               boost::test_tools::per_element());
    BOOST_TEST(subject.offset() == 36U);
    BOOST_TEST(subject.metadata_length() == 4U);

    TEST_RESULT_REQUIRE(subject.flush());
    BOOST_TEST(provider.digests_created == 0);
    BOOST_TEST(to_vector(subject.hash()) == to_vector(hashBefore),
               boost::test_tools::per_element());

    std::vector<std::byte> readBack(4);
    auto getRx = subject.get(0, readBack);
    TEST_RESULT_REQUIRE(getRx);
    BOOST_TEST(readBack == bytes({0xDE, 0xAD, 0xBE, 0xEF}),
               boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(flush_reports_digest_failures)
{
    pico_tests::failing_digest_crypto_provider provider;
    auto subject = create(0, &provider);
    auto data = bytes({1});
    TEST_RESULT_REQUIRE(subject.put(0, data));

    auto rx = subject.flush();
    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(rx.assume_error() == pico::pico_errc::hash_error);
}

BOOST_AUTO_TEST_CASE(open_rejects_empty_files)
{
    auto rx = reopen();
    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(rx.assume_error() == pico::pico_errc::not_pico);
    BOOST_TEST(rx.assume_error().value().observed == 0U);
}

BOOST_AUTO_TEST_CASE(open_rejects_foreign_files)
{
    write_raw(testFile, 0, craft_header(0x504B, 1, 32, 4, 4));

    auto rx = reopen();
    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(rx.assume_error() == pico::pico_errc::not_pico);
    BOOST_TEST(rx.assume_error().value().observed == 0x504BU);
}

BOOST_AUTO_TEST_CASE(open_rejects_truncated_headers)
{
    auto const header = craft_header(0x91C0, 1, 32, 4, 4);
    write_raw(testFile, 0,
              std::vector<std::byte>(header.begin(), header.begin() + 12));

    auto rx = reopen();
    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(rx.assume_error() == pico::pico_errc::read_failed);
    BOOST_TEST((rx.assume_error().value().site
                == pico::io_site::header_prefix_read));
}

BOOST_AUTO_TEST_CASE(open_rejects_truncated_keys)
{
    write_raw(testFile, 0, craft_header(0x91C0, 1, 32, 4, 2));

    auto rx = reopen();
    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(rx.assume_error() == pico::pico_errc::read_failed);
    BOOST_TEST((rx.assume_error().value().site
                == pico::io_site::header_key_read));
}

BOOST_AUTO_TEST_CASE(open_rejects_newer_versions)
{
    write_raw(testFile, 0, craft_header(0x91C0, 2, 32, 4, 4));

    auto rx = reopen();
    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(rx.assume_error() == pico::pico_errc::bad_version);
}

BOOST_AUTO_TEST_CASE(open_rejects_empty_keys)
{
    write_raw(testFile, 0, craft_header(0x91C0, 1, 28, 0, 0));

    auto rx = reopen();
    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(rx.assume_error() == pico::pico_errc::key_error);
}

BOOST_AUTO_TEST_CASE(open_rejects_offsets_inside_the_header)
{
    write_raw(testFile, 0, craft_header(0x91C0, 1, 30, 4, 4));

    auto rx = reopen();
    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(rx.assume_error() == pico::pico_errc::bad_offset);
    BOOST_TEST(rx.assume_error().value().observed == 30U);
    BOOST_TEST(rx.assume_error().value().limit == 32U);
}

BOOST_AUTO_TEST_CASE(open_trusts_the_stored_hash)
{
    auto header = craft_header(0x91C0, 1, 32, 4, 4);
    write_raw(testFile, 0, header);

    auto rx = reopen();
    TEST_RESULT_REQUIRE(rx);
    auto &subject = rx.assume_value();
    BOOST_TEST((subject.hash_state() == pico::content_hash::state::valid));
    BOOST_TEST(to_vector(subject.hash())
                       == std::vector<std::byte>(pico::digest_size,
                                                 std::byte{0x01}),
               boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(open_reports_missing_files)
{
    auto rx = pico::container::open(pico_tests::current_path,
                                    "pico-tests-missing.pico");
    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(rx.assume_error() == pico::pico_errc::store_not_found);
    BOOST_TEST(rx.assume_error()
               == pico::system_error::errc::no_such_file_or_directory);
}

BOOST_AUTO_TEST_CASE(create_refuses_to_overwrite_files)
{
    constexpr char const *fileName = "pico-tests-create.pico";
    std::filesystem::remove(fileName);
    {
        auto firstRx = pico::container::create(pico_tests::current_path,
                                               fileName, default_key, 0);
        TEST_RESULT_REQUIRE(firstRx);
    }

    auto secondRx = pico::container::create(pico_tests::current_path, fileName,
                                            default_key, 0);
    std::filesystem::remove(fileName);

    BOOST_TEST_REQUIRE(secondRx.has_error());
    BOOST_TEST(secondRx.assume_error()
               == pico::pico_errc::store_already_exists);
}

BOOST_AUTO_TEST_SUITE_END()
