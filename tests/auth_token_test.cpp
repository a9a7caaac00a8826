#include <cassert>
#include <chrono>
#include <set>
#include <string>

#include "auth_token.hpp"

using meshlink::AuthCredentials;
using meshlink::AuthTokenGenerator;

namespace {

const char* const NONCE = "11111111-2222-4333-8444-555555555555";

// 2024-01-02 15:30:42 UTC
std::chrono::system_clock::time_point fixed_time() {
    return std::chrono::system_clock::time_point(std::chrono::seconds(1704209442));
}

}

int main() {
    // Known digests for fixed inputs
    {
        AuthTokenGenerator gen(AuthCredentials{"BackBone", "alice", "password"}, NONCE);
        assert(gen.counter() == 0u);
        assert(gen.generate(fixed_time()) ==
               "NHSMESH alice:11111111-2222-4333-8444-555555555555:0:202401021530:"
               "150e1fe3b395b852e929b6378f8575fae4cfc2afb8fabb733e38752795049758");
        assert(gen.generate(fixed_time()) ==
               "NHSMESH alice:11111111-2222-4333-8444-555555555555:1:202401021530:"
               "ada2fec2d105c4968353b974573536d0a7ba196d5ced0101756f3bb571a05551");
        assert(gen.counter() == 2u);
    }

    // The shared key feeds the digest
    {
        AuthTokenGenerator gen(AuthCredentials{"OtherKey", "alice", "password"}, NONCE);
        assert(gen.generate(fixed_time()) ==
               "NHSMESH alice:11111111-2222-4333-8444-555555555555:0:202401021530:"
               "27b7260d26d1eb6fe32eea43ae17e53334668cdbdc3b6b06f662511fea58367f");
    }

    // The password feeds the digest but never appears in the token
    {
        AuthTokenGenerator a(AuthCredentials{"BackBone", "alice", "password"}, NONCE);
        AuthTokenGenerator b(AuthCredentials{"BackBone", "alice", "different"}, NONCE);
        std::string ta = a.generate(fixed_time());
        std::string tb = b.generate(fixed_time());
        assert(ta != tb);
        assert(ta.substr(0, ta.rfind(':')) == tb.substr(0, tb.rfind(':')));
        assert(tb.find("different") == std::string::npos);
    }

    // Many tokens within one minute never repeat
    {
        AuthTokenGenerator gen(AuthCredentials{"BackBone", "alice", "password"});
        std::set<std::string> seen;
        for (int i = 0; i < 100; ++i) {
            assert(seen.insert(gen.generate(fixed_time())).second);
        }
        assert(gen.counter() == 100u);
    }

    // Nonces are random version 4 UUIDs
    {
        std::string n1 = AuthTokenGenerator::make_nonce();
        std::string n2 = AuthTokenGenerator::make_nonce();
        assert(n1 != n2);
        assert(n1.size() == 36);
        assert(n1[8] == '-' && n1[13] == '-' && n1[18] == '-' && n1[23] == '-');
        assert(n1[14] == '4');
        assert(std::string("89ab").find(n1[19]) != std::string::npos);

        AuthTokenGenerator gen(AuthCredentials{"BackBone", "alice", "password"});
        assert(gen.nonce().size() == 36);
        assert(gen.generate().find(gen.nonce()) != std::string::npos);
    }

    // Custom scheme prefix and timestamp format
    {
        AuthTokenGenerator gen(AuthCredentials{"BackBone", "alice", "password"}, NONCE, "CUSTOM");
        assert(gen.generate(fixed_time()).rfind("CUSTOM alice:", 0) == 0);
        assert(AuthTokenGenerator::format_timestamp(fixed_time()) == "202401021530");
    }

    return 0;
}
