#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <thread>
#include "swarmfetch/net/http_client.h"
#include "swarmfetch/origin/fetcher.h"
#include "swarmfetch/swarm/descriptor.h"
#include "swarmfetch/tracker/client.h"
#include "test_support.h"

using namespace swarmfetch;
using namespace swarmfetch::test;
using namespace std::chrono_literals;

namespace {

const std::string ARTIFACT_PATH = "/acme/tiny-model/resolve/main/model.safetensors";

OriginConfig loopback_origin(const LoopbackHttpServer& server) {
    OriginConfig config;
    config.endpoint = server.base_url();
    config.range_size = 4096;
    return config;
}

std::string sha256_of(const TempDir& dir, const std::string& payload) {
    write_file(dir.file("reference.bin"), payload);
    return sha256_file(dir.file("reference.bin")).value_or("");
}

} // anonymous namespace

TEST_CASE("URL Parsing", "[http][url]") {
    auto u = Url::parse("https://huggingface.co/gpt2/resolve/main/config.json");
    REQUIRE(u.has_value());
    REQUIRE(u->is_https());
    REQUIRE(u->host == "huggingface.co");
    REQUIRE(u->port == 443);
    REQUIRE(u->target == "/gpt2/resolve/main/config.json");

    auto v = Url::parse("http://127.0.0.1:8080?x=1");
    REQUIRE(v.has_value());
    REQUIRE(v->port == 8080);
    REQUIRE(v->target == "/?x=1");

    REQUIRE_FALSE(Url::parse("ftp://example.com/").has_value());
    REQUIRE_FALSE(Url::parse("http://:80/").has_value());
    REQUIRE_FALSE(Url::parse("http://host:99999/").has_value());
    REQUIRE_FALSE(Url::parse("no-scheme").has_value());
}

TEST_CASE("Redirect Location Resolution", "[http][url]") {
    auto base = Url::parse("https://hub.example/org/repo/resolve/main/a/b.bin?download=1");
    REQUIRE(base.has_value());

    auto abs = base->resolve("https://cdn.example/blobs/abc");
    REQUIRE(abs.has_value());
    REQUIRE(abs->host == "cdn.example");

    auto rooted = base->resolve("/api/resolve-cache/xyz");
    REQUIRE(rooted.has_value());
    REQUIRE(rooted->host == "hub.example");
    REQUIRE(rooted->target == "/api/resolve-cache/xyz");

    auto relative = base->resolve("c.bin");
    REQUIRE(relative.has_value());
    REQUIRE(relative->target == "/org/repo/resolve/main/a/c.bin");

    auto scheme_relative = base->resolve("//mirror.example/x");
    REQUIRE(scheme_relative.has_value());
    REQUIRE(scheme_relative->host == "mirror.example");
    REQUIRE(scheme_relative->is_https());

    REQUIRE_FALSE(base->resolve("").has_value());
}

TEST_CASE("URL Encoding", "[http][url]") {
    REQUIRE(url_encode("acme/tiny-model") == "acme%2Ftiny-model");
    REQUIRE(url_encode("a b~c_d.e") == "a%20b~c_d.e");
}

TEST_CASE("Origin Resolve URL Per Repository Type", "[origin][url]") {
    OriginConfig config;
    config.endpoint = "https://hub.example/";
    HttpOriginFetcher fetcher(config);

    auto fp = make_fingerprint("sub dir/model.safetensors");
    REQUIRE(fetcher.resolve_url(fp) ==
            "https://hub.example/acme/tiny-model/resolve/main/sub%20dir/model.safetensors");

    fp.repo_type = "dataset";
    REQUIRE(fetcher.resolve_url(fp).rfind("https://hub.example/datasets/acme/tiny-model/resolve/", 0) == 0);

    fp.repo_type = "space";
    REQUIRE(fetcher.resolve_url(fp).rfind("https://hub.example/spaces/acme/", 0) == 0);
}

TEST_CASE("Origin Fetch Against A Closed Port Fails", "[origin][errors]") {
    TempDir dir;
    OriginConfig config;
    config.endpoint = "http://127.0.0.1:1";
    HttpOriginFetcher fetcher(config);

    auto result = fetcher.fetch(make_fingerprint(), dir.file("out.part"), nullptr,
                                std::make_shared<CancellationToken>());
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error == ErrorCode::OriginFailed);
    REQUIRE_FALSE(std::filesystem::exists(dir.file("out.part")));
}

TEST_CASE("Plain HTTP Client Bounds The Whole Exchange", "[http][timeout]") {
    // One byte every 300 ms keeps the socket busy but never finishes in time
    LoopbackHttpServer server([](const LoopbackHttpServer::Request&) {
        return raw_response(200, "[]");
    }, 300ms);

    auto started = std::chrono::steady_clock::now();
    auto result = SimpleHttpClient::request("GET", server.base_url() + "/api/v1/torrents", "", {}, 1000);
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE_FALSE(result.ok());
    REQUIRE(result.code == ErrorCode::Timeout);
    REQUIRE(elapsed < 2s);
}

TEST_CASE("Slow Tracker Query Returns Within Its Timeout", "[http][timeout][tracker]") {
    LoopbackHttpServer server([](const LoopbackHttpServer::Request&) {
        return raw_response(200, "[]");
    }, 300ms);

    TrackerConfig config;
    config.url = server.base_url();
    config.query_timeout_ms = 1000;
    TrackingClient client(config);

    ErrorCode reason = ErrorCode::Success;
    auto started = std::chrono::steady_clock::now();
    REQUIRE_FALSE(client.query(make_fingerprint(), 0, &reason).has_value());
    REQUIRE(std::chrono::steady_clock::now() - started < 2s);
    REQUIRE(reason == ErrorCode::TrackerUnavailable);
}

TEST_CASE("Plain HTTP Client Error Kinds", "[http][errors]") {
    SECTION("Exchange succeeds") {
        LoopbackHttpServer server([](const LoopbackHttpServer::Request& request) {
            return raw_response(200, request.method + " " + request.target);
        });
        auto result = SimpleHttpClient::request("POST", server.base_url() + "/api/v1/announce", "{}", {}, 2000);
        REQUIRE(result.ok());
        REQUIRE(result.code == ErrorCode::Success);
        REQUIRE(result.body == "POST /api/v1/announce");
        REQUIRE(server.requests()[0].header("content-type") == "application/json");
    }

    SECTION("Refused connection") {
        auto result = SimpleHttpClient::request("GET", "http://127.0.0.1:1/", "", {}, 1000);
        REQUIRE(result.code == ErrorCode::ConnectionFailed);
    }

    SECTION("TLS endpoints are rejected") {
        auto result = SimpleHttpClient::request("GET", "https://tracker.example/", "", {}, 1000);
        REQUIRE(result.code == ErrorCode::InvalidArgument);
    }

    SECTION("Short body") {
        LoopbackHttpServer server([](const LoopbackHttpServer::Request&) {
            return raw_response(200, "[1,2", {}, 100);
        });
        auto result = SimpleHttpClient::request("GET", server.base_url() + "/", "", {}, 2000);
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.code == ErrorCode::NetworkError);
    }

    SECTION("Garbage instead of a status line") {
        LoopbackHttpServer server([](const LoopbackHttpServer::Request&) {
            return std::string("SSH-2.0-OpenSSH\r\n\r\n");
        });
        auto result = SimpleHttpClient::request("GET", server.base_url() + "/", "", {}, 2000);
        REQUIRE(result.code == ErrorCode::ProtocolError);
    }
}

TEST_CASE("Origin Ranged Download Delivers The Body", "[origin][fetch]") {
    TempDir dir;
    auto payload = make_payload(10000, 21);
    LoopbackHttpServer server([&payload](const LoopbackHttpServer::Request& request) {
        return ranged_response(request, payload);
    });

    auto config = loopback_origin(server);
    config.token = "hf_test";
    HttpOriginFetcher fetcher(config);

    uint64_t last_done = 0;
    uint64_t last_total = 0;
    auto result = fetcher.fetch(make_fingerprint(), dir.file("out.part"),
                                [&](uint64_t done, uint64_t total) {
                                    last_done = done;
                                    last_total = total;
                                },
                                std::make_shared<CancellationToken>());

    REQUIRE(result.ok());
    REQUIRE(result.bytes == payload.size());
    REQUIRE(read_file(dir.file("out.part")) == payload);
    REQUIRE(last_done == payload.size());
    REQUIRE(last_total == payload.size());

    auto requests = server.requests();
    REQUIRE(requests.size() == 3);
    REQUIRE(requests[0].target == ARTIFACT_PATH);
    REQUIRE(requests[0].header("range") == "bytes=0-4095");
    REQUIRE(requests[1].header("range") == "bytes=4096-8191");
    REQUIRE(requests[2].header("range") == "bytes=8192-9999");
    REQUIRE(requests[0].header("authorization") == "Bearer hf_test");
}

TEST_CASE("Origin Without Range Support Sends The Whole Body", "[origin][fetch]") {
    TempDir dir;
    auto payload = make_payload(6000, 22);
    LoopbackHttpServer server([&payload](const LoopbackHttpServer::Request&) {
        return raw_response(200, payload);
    });

    HttpOriginFetcher fetcher(loopback_origin(server));
    auto result = fetcher.fetch(make_fingerprint(), dir.file("out.part"), nullptr,
                                std::make_shared<CancellationToken>());
    REQUIRE(result.ok());
    REQUIRE(read_file(dir.file("out.part")) == payload);
    REQUIRE(server.requests().size() == 1);
}

TEST_CASE("Origin Empty File", "[origin][fetch]") {
    TempDir dir;
    LoopbackHttpServer server([](const LoopbackHttpServer::Request& request) {
        return ranged_response(request, "");
    });

    HttpOriginFetcher fetcher(loopback_origin(server));
    auto result = fetcher.fetch(make_fingerprint(), dir.file("out.part"), nullptr,
                                std::make_shared<CancellationToken>());
    REQUIRE(result.ok());
    REQUIRE(result.bytes == 0);
    REQUIRE(std::filesystem::exists(dir.file("out.part")));
    REQUIRE(std::filesystem::file_size(dir.file("out.part")) == 0);
}

TEST_CASE("Origin Short Read Fails", "[origin][errors]") {
    TempDir dir;
    // Advertises 1000 bytes, sends 500 and closes
    LoopbackHttpServer server([](const LoopbackHttpServer::Request&) {
        return raw_response(206, make_payload(500, 23), {{"Content-Range", "bytes 0-999/1000"}}, 1000);
    });

    HttpOriginFetcher fetcher(loopback_origin(server));
    auto result = fetcher.fetch(make_fingerprint(), dir.file("out.part"), nullptr,
                                std::make_shared<CancellationToken>());
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error == ErrorCode::OriginFailed);
    REQUIRE_FALSE(std::filesystem::exists(dir.file("out.part")));
}

TEST_CASE("Origin Follows Redirects", "[origin][redirect]") {
    TempDir dir;
    auto payload = make_payload(5000, 24);
    LoopbackHttpServer server([&payload](const LoopbackHttpServer::Request& request) {
        if (request.target.rfind("/blobs/", 0) == 0) {
            return ranged_response(request, payload);
        }
        return raw_response(302, "", {{"Location", "/blobs/abc123"}});
    });

    auto config = loopback_origin(server);
    config.token = "hf_test";
    HttpOriginFetcher fetcher(config);
    auto result = fetcher.fetch(make_fingerprint(), dir.file("out.part"), nullptr,
                                std::make_shared<CancellationToken>());
    REQUIRE(result.ok());
    REQUIRE(read_file(dir.file("out.part")) == payload);

    auto requests = server.requests();
    REQUIRE(requests.back().target == "/blobs/abc123");
    // Same host keeps the credentials
    REQUIRE(requests.back().header("authorization") == "Bearer hf_test");

    SECTION("Redirect loops are bounded") {
        LoopbackHttpServer looping([](const LoopbackHttpServer::Request&) {
            return raw_response(302, "", {{"Location", "/again"}});
        });
        auto loop_config = loopback_origin(looping);
        loop_config.max_redirects = 2;
        HttpOriginFetcher loop_fetcher(loop_config);
        auto loop_result = loop_fetcher.fetch(make_fingerprint(), dir.file("loop.part"), nullptr,
                                              std::make_shared<CancellationToken>());
        REQUIRE(loop_result.error == ErrorCode::OriginFailed);
    }
}

TEST_CASE("Credentials Stay With The Configured Endpoint", "[origin][redirect]") {
    auto hub = Url::parse("https://hub.example/acme/model/resolve/main/a.bin");
    REQUIRE(hub.has_value());

    REQUIRE(HttpOriginFetcher::forward_credentials(*hub, *hub->resolve("/api/resolve-cache/a.bin")));
    REQUIRE_FALSE(HttpOriginFetcher::forward_credentials(*hub, *hub->resolve("https://cdn.example/blob")));
    REQUIRE_FALSE(HttpOriginFetcher::forward_credentials(*hub, *hub->resolve("https://hub.example:8443/a.bin")));
    REQUIRE_FALSE(HttpOriginFetcher::forward_credentials(*hub, *hub->resolve("http://hub.example/a.bin")));
}

TEST_CASE("Origin ETag Verification", "[origin][checksum]") {
    TempDir dir;
    auto payload = make_payload(3000, 25);
    std::string digest = sha256_of(dir, payload);
    std::string etag_value;
    LoopbackHttpServer server([&](const LoopbackHttpServer::Request& request) {
        return ranged_response(request, payload, {{"X-Linked-Etag", etag_value}});
    });
    auto config = loopback_origin(server);

    SECTION("Matching digest") {
        etag_value = "\"" + digest + "\"";
        HttpOriginFetcher fetcher(config);
        auto result = fetcher.fetch(make_fingerprint(), dir.file("out.part"), nullptr,
                                    std::make_shared<CancellationToken>());
        REQUIRE(result.ok());
    }

    SECTION("Mismatching digest") {
        etag_value = "\"" + std::string(64, 'a') + "\"";
        HttpOriginFetcher fetcher(config);
        auto result = fetcher.fetch(make_fingerprint(), dir.file("out.part"), nullptr,
                                    std::make_shared<CancellationToken>());
        REQUIRE(result.error == ErrorCode::IntegrityFailure);
    }

    SECTION("Mismatch ignored when verification is off") {
        etag_value = std::string(64, 'a');
        config.verify_checksum = false;
        HttpOriginFetcher fetcher(config);
        auto result = fetcher.fetch(make_fingerprint(), dir.file("out.part"), nullptr,
                                    std::make_shared<CancellationToken>());
        REQUIRE(result.ok());
    }

    SECTION("Non-digest ETag is not a checksum") {
        etag_value = "W/\"abc-123\"";
        HttpOriginFetcher fetcher(config);
        auto result = fetcher.fetch(make_fingerprint(), dir.file("out.part"), nullptr,
                                    std::make_shared<CancellationToken>());
        REQUIRE(result.ok());
    }
}

TEST_CASE("Origin Fetch Stops Between Ranges When Cancelled", "[origin][cancel]") {
    TempDir dir;
    auto payload = make_payload(64 * 1024, 26);
    LoopbackHttpServer server([&payload](const LoopbackHttpServer::Request& request) {
        std::this_thread::sleep_for(50ms);
        return ranged_response(request, payload);
    });

    auto config = loopback_origin(server);
    config.range_size = 1024;
    HttpOriginFetcher fetcher(config);

    auto cancel = std::make_shared<CancellationToken>();
    std::thread canceller([cancel]() {
        std::this_thread::sleep_for(300ms);
        cancel->cancel();
    });
    auto result = fetcher.fetch(make_fingerprint(), dir.file("out.part"), nullptr, cancel);
    canceller.join();

    REQUIRE(result.error == ErrorCode::Cancelled);
    REQUIRE(server.requests().size() < 64);
}
