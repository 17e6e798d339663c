#include <catch2/catch.hpp>
#include "oauth2_types.hpp"

#include <algorithm>
#include <cctype>
#include <set>

using namespace spotycli;

namespace {

bool IsUnreserved(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '.' || c == '_' || c == '~';
}

bool IsBase64Url(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
}

} // namespace

TEST_CASE("PKCE code verifier", "[oauth2][pkce]") {
    auto verifier = OAuth2Utils::GenerateCodeVerifier();

    REQUIRE(verifier.length() == OAuth2Utils::CODE_VERIFIER_LENGTH);
    REQUIRE(verifier.length() >= 43);
    REQUIRE(verifier.length() <= 128);
    REQUIRE(std::all_of(verifier.begin(), verifier.end(), IsUnreserved));
}

TEST_CASE("PKCE code challenge", "[oauth2][pkce]") {
    SECTION("RFC 7636 appendix B example") {
        auto challenge = OAuth2Utils::GenerateCodeChallenge("dBjftJeZ4CVP-mB92K27uhbUJU1p1r_wW1gFWFOEjXk");
        REQUIRE(challenge == "E9Melhoa2OwvFrEMTJguCHaoeK1t8URWbuGJSstw-cM");
    }

    SECTION("Challenge is the unpadded base64url SHA-256 of the verifier") {
        auto pkce = OAuth2Utils::GeneratePkce();
        REQUIRE(pkce.challenge == OAuth2Utils::Base64UrlEncodeNoPadding(OAuth2Utils::Sha256(pkce.verifier)));
        REQUIRE(pkce.challenge.length() == 43);
        REQUIRE(std::all_of(pkce.challenge.begin(), pkce.challenge.end(), IsBase64Url));
    }

    SECTION("SHA-256 digest size") {
        REQUIRE(OAuth2Utils::Sha256("").size() == 32);
        REQUIRE(OAuth2Utils::Base64UrlEncodeNoPadding(OAuth2Utils::Sha256("")) ==
                "47DEQpj8HBSa-_TImW-5JCeuQeRkm5NMpJWZG3hSuFU");
    }
}

TEST_CASE("State parameter", "[oauth2][pkce]") {
    auto state = OAuth2Utils::GenerateState();
    REQUIRE(state.length() == OAuth2Utils::STATE_LENGTH);
    REQUIRE(state.length() >= 16);
    REQUIRE(std::all_of(state.begin(), state.end(), [](char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; }));

    SECTION("Validation") {
        REQUIRE(OAuth2Utils::ValidateState(state, state));
        REQUIRE_FALSE(OAuth2Utils::ValidateState(state + "x", state));
        REQUIRE_FALSE(OAuth2Utils::ValidateState("", state));
        REQUIRE_FALSE(OAuth2Utils::ValidateState("", ""));

        auto tampered = state;
        tampered[0] = tampered[0] == 'a' ? 'b' : 'a';
        REQUIRE_FALSE(OAuth2Utils::ValidateState(tampered, state));
    }
}

TEST_CASE("Successive generations differ", "[oauth2][pkce]") {
    std::set<std::string> verifiers;
    std::set<std::string> states;

    for (int i = 0; i < 50; ++i) {
        auto pkce = OAuth2Utils::GeneratePkce();
        verifiers.insert(pkce.verifier);
        states.insert(pkce.state);
    }

    REQUIRE(verifiers.size() == 50);
    REQUIRE(states.size() == 50);
}

TEST_CASE("Base64url and URL encoding", "[oauth2]") {
    REQUIRE(OAuth2Utils::Base64UrlEncodeNoPadding("\xfb\xff") == "-_8");
    REQUIRE(OAuth2Utils::Base64UrlEncodeNoPadding("f") == "Zg");

    REQUIRE(OAuth2Utils::UrlEncode("http://127.0.0.1:8888/callback") == "http%3A%2F%2F127.0.0.1%3A8888%2Fcallback");
    REQUIRE(OAuth2Utils::UrlEncode("user-read-playback-state streaming") == "user-read-playback-state%20streaming");
}

TEST_CASE("OAuth2Config", "[oauth2][config]") {
    OAuth2Config config;

    SECTION("Defaults point at the accounts service") {
        REQUIRE(config.GetAuthorizationUrl() == "https://accounts.spotify.com/authorize");
        REQUIRE(config.GetTokenUrl() == "https://accounts.spotify.com/api/token");
        REQUIRE(config.scope.find("user-modify-playback-state") != std::string::npos);
    }

    SECTION("Callback endpoint comes from the redirect URI") {
        REQUIRE(config.GetCallbackHost() == "127.0.0.1");
        REQUIRE(config.GetCallbackPort() == 8888);
        REQUIRE(config.GetCallbackPath() == "/callback");

        config.redirect_uri = "http://localhost:9000/auth/done";
        REQUIRE(config.GetCallbackHost() == "localhost");
        REQUIRE(config.GetCallbackPort() == 9000);
        REQUIRE(config.GetCallbackPath() == "/auth/done");
    }

    SECTION("Validation") {
        REQUIRE_THROWS_AS(config.Validate(), std::invalid_argument);

        config.client_id = "id";
        REQUIRE_THROWS_WITH(config.Validate(), "SPOTIFY_CLIENT_SECRET must be set");

        config.client_secret = "secret";
        REQUIRE_NOTHROW(config.Validate());

        config.redirect_uri = "https://127.0.0.1:8888/callback";
        REQUIRE_THROWS_AS(config.Validate(), std::invalid_argument);
    }
}
