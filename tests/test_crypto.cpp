#include "test_common.h"
#include "codemode/crypto.h"

#include <set>

using namespace codemode;

int main() {
    // Test 1: FIPS 180-2 vectors
    expect_true(sha256_hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", "empty");
    expect_true(sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", "abc");
    expect_true(sha256_hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq") ==
                    "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1",
                "two-block message");

    // Test 2: incremental updates match one-shot hashing across block boundaries
    {
        std::string msg(1000, 'a');
        Sha256 h;
        for (size_t i = 0; i < msg.size(); i += 37) h.update(msg.substr(i, 37));
        expect_true(h.finish_hex() == sha256_hex(msg), "chunked == one-shot");
    }

    // Test 3: UUIDs are v4, well formed and distinct
    {
        std::set<std::string> seen;
        for (int i = 0; i < 64; i++) {
            std::string u = uuid_v4();
            expect_eq_ll((long long)u.size(), 36, "uuid length");
            expect_true(u[8] == '-' && u[13] == '-' && u[18] == '-' && u[23] == '-', "uuid dashes");
            expect_true(u[14] == '4', "version nibble");
            expect_true(u[19] == '8' || u[19] == '9' || u[19] == 'a' || u[19] == 'b', "variant nibble");
            seen.insert(u);
        }
        expect_eq_ll((long long)seen.size(), 64, "uuids should not repeat");
    }

    std::cerr << "test_crypto: ALL PASSED" << std::endl;
    return 0;
}
