#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>
#include "codec/DocumentCodec.hpp"
#include "core/RequestPipeline.hpp"
#include "errors/ClientError.hpp"

using namespace HonestMark;

namespace {

Document ShoesDocument(std::string content = "x") {
    return DocumentBuilder()
        .ProductDocument(std::move(content))
        .Group(ProductGroup::Shoes)
        .Format(DocumentFormat::Manual)
        .Type(DocumentType::LpIntroduceGoods)
        .Build();
}

}

TEST_CASE("Outbound request carries wire names for group, format and type") {
    DocumentRequest request = RequestPipeline::Build(ShoesDocument(), "sig");
    auto body = nlohmann::json::parse(DocumentCodec::Encode(request));

    CHECK(body["productDocument"] == "x");
    CHECK(body["productGroup"] == "SHOES");
    CHECK(body["documentFormat"] == "MANUAL");
    CHECK(body["type"] == "LP_INTRODUCE_GOODS");
    CHECK(body["signature"] == "sig");
    CHECK(body.size() == 5);
}

TEST_CASE("Encoding rejects a payload that is not valid UTF-8") {
    DocumentRequest request = RequestPipeline::Build(ShoesDocument("bad \xff\xfe bytes"), "sig");
    CHECK_THROWS_AS(DocumentCodec::Encode(request), EncodingError);
}

TEST_CASE("Decoding reads the optional response fields") {
    DocumentResponse ok = DocumentCodec::Decode(R"({"value":"ok"})");
    CHECK(ok.value == "ok");
    CHECK_FALSE(ok.HasError());

    DocumentResponse failed = DocumentCodec::Decode(
        R"({"errorCode":"E1","errorMessage":"bad","errorDescription":"details","value":null,"traceId":"t-1"})");
    CHECK(failed.value.empty());
    CHECK(failed.error_code == "E1");
    CHECK(failed.error_message == "bad");
    CHECK(failed.error_description == "details");
    CHECK(failed.HasError());
}

TEST_CASE("Decoding fails on bodies that do not match the response shape") {
    CHECK_THROWS_AS(DocumentCodec::Decode("boom"), EncodingError);
    CHECK_THROWS_AS(DocumentCodec::Decode(R"(["ok"])"), EncodingError);
    CHECK_THROWS_AS(DocumentCodec::Decode(R"({"value":42})"), EncodingError);
    CHECK_THROWS_AS(DocumentCodec::Decode(""), EncodingError);
}

TEST_CASE("DocumentResponse error state wins over a value") {
    DocumentResponse r;
    CHECK_FALSE(r.HasError());

    r.value = "ok";
    r.error_description = "only a description";
    CHECK_FALSE(r.HasError());

    r.error_code = "E9";
    CHECK(r.HasError());

    r.error_code.clear();
    r.error_message = "m";
    CHECK(r.HasError());
}

TEST_CASE("Product group names parse case-insensitively") {
    CHECK(ProductGroupFromString("shoes") == ProductGroup::Shoes);
    CHECK(ProductGroupFromString("DAIRY") == ProductGroup::Dairy);
    CHECK_FALSE(ProductGroupFromString("boats").has_value());
    CHECK(ToString(ProductGroup::Electronics) == "ELECTRONICS");
    CHECK(ToString(DocumentFormat::Csv) == "CSV");
    CHECK(ToString(DocumentFormat::Xml) == "XML");
}
