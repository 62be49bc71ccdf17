#include <catch2/catch_all.hpp>
#include <stdexcept>
#include <string>
#include <utility>
#include "codec/DefaultDocumentCodec.hpp"
#include "core/RequestPipeline.hpp"
#include "errors/ClientError.hpp"
#include "Fakes.hpp"

using namespace HonestMark;

namespace {

const char* kUrl = "https://example.test/api/v3/lk/documents/create";

DocumentBuilder ShoesBuilder() {
    DocumentBuilder builder;
    builder.ProductDocument("x").Group(ProductGroup::Shoes).Format(DocumentFormat::Manual).Type(DocumentType::LpIntroduceGoods);
    return builder;
}

}

TEST_CASE("RequestPipeline rejects incomplete documents") {
    DocumentBuilder no_format;
    no_format.ProductDocument("x").Group(ProductGroup::Shoes).Type(DocumentType::LpIntroduceGoods);
    CHECK_THROWS_WITH(RequestPipeline::Validate(no_format.Build(), "sig"), "Document format is required");

    DocumentBuilder no_type;
    no_type.ProductDocument("x").Group(ProductGroup::Shoes).Format(DocumentFormat::Csv);
    CHECK_THROWS_WITH(RequestPipeline::Validate(no_type.Build(), "sig"), "Document type is required");

    DocumentBuilder no_group;
    no_group.ProductDocument("x").Format(DocumentFormat::Xml).Type(DocumentType::LpIntroduceGoods);
    CHECK_THROWS_AS(RequestPipeline::Validate(no_group.Build(), "sig"), ValidationError);

    // Stricter than a null check: an empty signature is never sent
    CHECK_THROWS_WITH(RequestPipeline::Validate(ShoesBuilder().Build(), ""), "Signature is required");
    CHECK_NOTHROW(RequestPipeline::Validate(ShoesBuilder().Build(), "sig"));
}

TEST_CASE("RequestPipeline prepares an authorized JSON POST") {
    Testing::FakeTransport transport;
    DefaultDocumentCodec codec;
    RequestPipeline pipeline(transport, codec, kUrl, "secret-token");

    HttpRequest request = pipeline.Prepare(ShoesBuilder().Build(), "sig");
    CHECK(request.method == "POST");
    CHECK(request.url == kUrl);
    REQUIRE(request.headers.size() == 2);
    CHECK(request.headers[0] == std::make_pair(std::string("Authorization"), std::string("Bearer secret-token")));
    CHECK(request.headers[1] == std::make_pair(std::string("Content-Type"), std::string("application/json")));
    CHECK(request.body.find(R"("productGroup":"SHOES")") != std::string::npos);
    CHECK(transport.Calls() == 0);
}

TEST_CASE("RequestPipeline classifies transport responses") {
    Testing::FakeTransport transport;
    DefaultDocumentCodec codec;
    RequestPipeline pipeline(transport, codec, kUrl, "secret-token");

    SECTION("200 with a value succeeds") {
        DocumentResponse r = pipeline.Classify({200, R"({"value":"ok"})"});
        CHECK(r.value == "ok");
    }

    SECTION("200 with an upstream error is an ApiError carrying the message") {
        try {
            pipeline.Classify({200, R"({"errorCode":"E1","errorMessage":"bad"})"});
            FAIL("expected ApiError");
        } catch (const ApiError& e) {
            CHECK(std::string(e.what()) == "bad");
            CHECK(e.error_code() == "E1");
            CHECK(e.status_code() == 200);
        }
    }

    SECTION("200 with only an error code falls back to the code") {
        CHECK_THROWS_WITH(pipeline.Classify({200, R"({"errorCode":"E2"})"}), "Upstream error code: E2");
    }

    SECTION("non-200 keeps the status and raw body") {
        try {
            pipeline.Classify({500, "boom"});
            FAIL("expected ApiError");
        } catch (const ApiError& e) {
            CHECK(e.status_code() == 500);
            CHECK(e.body() == "boom");
            CHECK_THAT(std::string(e.what()), Catch::Matchers::ContainsSubstring("500") && Catch::Matchers::ContainsSubstring("boom"));
        }
    }

    SECTION("200 with an unparsable body wraps the parse failure") {
        try {
            pipeline.Classify({200, "<html>oops</html>"});
            FAIL("expected ApiError");
        } catch (const ApiError& e) {
            CHECK_THAT(std::string(e.what()), Catch::Matchers::StartsWith("Failed to parse response"));
            CHECK(e.body() == "<html>oops</html>");
        }
    }
}

TEST_CASE("RequestPipeline dispatch makes exactly one transport call") {
    Testing::FakeTransport transport({500, "boom"});
    DefaultDocumentCodec codec;
    RequestPipeline pipeline(transport, codec, kUrl, "secret-token");

    HttpRequest request = pipeline.Prepare(ShoesBuilder().Build(), "sig");
    CHECK_THROWS_AS(pipeline.Dispatch(request), ApiError);
    CHECK(transport.Calls() == 1);
}

TEST_CASE("RequestPipeline surfaces transport failures as TransportError") {
    Testing::FakeTransport transport;
    transport.SetHandler([](const HttpRequest&) -> HttpResponse { throw std::runtime_error("connection reset"); });
    DefaultDocumentCodec codec;
    RequestPipeline pipeline(transport, codec, kUrl, "secret-token");

    HttpRequest request = pipeline.Prepare(ShoesBuilder().Build(), "sig");
    CHECK_THROWS_AS(pipeline.Dispatch(request), TransportError);
    CHECK_THROWS_WITH(pipeline.Dispatch(request), "connection reset");
    CHECK(transport.Calls() == 2);
}

TEST_CASE("ApiError keeps the status, body and upstream code") {
    ApiError error("Upstream rejected the document", 200, R"({"errorCode":"E1"})", "E1");
    CHECK(std::string(error.what()) == "Upstream rejected the document");
    CHECK(error.status_code() == 200);
    CHECK(error.body() == R"({"errorCode":"E1"})");
    CHECK(error.error_code() == "E1");

    ApiError bare("Bad gateway", 502, "");
    CHECK(bare.error_code().empty());
}
