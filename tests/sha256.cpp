#include "meshstore/crypto/Sha256.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <cassert>
#include <span>
#include <string>
#include <string_view>

using meshstore::crypto::Sha256;

namespace {

std::span<const std::uint8_t> bytes_of(std::string_view text) {
    return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

}  // namespace

int main() {
    assert(Sha256::hex_digest(bytes_of("")) ==
           "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    assert(Sha256::hex_digest(bytes_of("abc")) ==
           "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    assert(Sha256::hex_digest(bytes_of("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq")) ==
           "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");

    const std::string million(1'000'000, 'a');
    Sha256 streaming;
    for (std::size_t offset = 0; offset < million.size(); offset += 997) {
        const auto length = std::min<std::size_t>(997, million.size() - offset);
        streaming.update(bytes_of(std::string_view(million).substr(offset, length)));
    }
    assert(meshstore::digest_to_string(streaming.finalize()) ==
           "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");

    // finalize() leaves the hasher ready for a new message.
    streaming.update(bytes_of("abc"));
    assert(meshstore::digest_to_string(streaming.finalize()) == Sha256::hex_digest(bytes_of("abc")));

    meshstore::test::TempDirectory scratch("sha256");
    const auto data = meshstore::test::make_pattern(70'000, 11);
    const auto path = scratch / "input.bin";
    meshstore::test::write_file(path, data);

    const auto file_digest = meshstore::crypto::digest_file(path);
    assert(file_digest.has_value());
    assert(*file_digest == Sha256::digest(data));
    assert(!meshstore::crypto::digest_file(scratch / "missing.bin").has_value());

    return 0;
}
