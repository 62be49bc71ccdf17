#include "Document.hpp"
#include <array>
#include <utility>

namespace HonestMark {

namespace {

constexpr std::array<std::pair<ProductGroup, const char*>, 7> kProductGroups{{
    {ProductGroup::Clothes, "CLOTHES"},
    {ProductGroup::Shoes, "SHOES"},
    {ProductGroup::Tobacco, "TOBACCO"},
    {ProductGroup::Perfumes, "PERFUMES"},
    {ProductGroup::Tires, "TIRES"},
    {ProductGroup::Electronics, "ELECTRONICS"},
    {ProductGroup::Dairy, "DAIRY"},
}};

std::string ToUpper(const std::string& s) {
    std::string t;
    t.reserve(s.size());
    for (unsigned char c : s) t.push_back((c >= 'a' && c <= 'z') ? char(c - 32) : char(c));
    return t;
}

} // anonymous namespace

std::string ToString(ProductGroup group) {
    for (const auto& entry : kProductGroups) {
        if (entry.first == group) return entry.second;
    }
    return "";
}

std::string ToString(DocumentFormat format) {
    switch (format) {
        case DocumentFormat::Manual: return "MANUAL";
        case DocumentFormat::Csv:    return "CSV";
        case DocumentFormat::Xml:    return "XML";
    }
    return "";
}

std::string ToString(DocumentType type) {
    switch (type) {
        case DocumentType::LpIntroduceGoods: return "LP_INTRODUCE_GOODS";
    }
    return "";
}

std::optional<ProductGroup> ProductGroupFromString(const std::string& name) {
    const std::string upper = ToUpper(name);
    for (const auto& entry : kProductGroups) {
        if (upper == entry.second) return entry.first;
    }
    return std::nullopt;
}

DocumentBuilder& DocumentBuilder::ProductDocument(std::string content) {
    document_.product_document_ = std::move(content);
    return *this;
}

DocumentBuilder& DocumentBuilder::Group(ProductGroup group) {
    document_.product_group_ = group;
    return *this;
}

DocumentBuilder& DocumentBuilder::Format(DocumentFormat format) {
    document_.document_format_ = format;
    return *this;
}

DocumentBuilder& DocumentBuilder::Type(DocumentType type) {
    document_.type_ = type;
    return *this;
}

Document DocumentBuilder::Build() const {
    return document_;
}

}
